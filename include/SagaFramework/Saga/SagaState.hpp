#ifndef SAGA_FRAMEWORK_SAGA_SAGASTATE_HPP
#define SAGA_FRAMEWORK_SAGA_SAGASTATE_HPP
//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <cstdint>
#include <string_view>

namespace SagaFramework
{
  /// @brief Lifecycle of a Saga. Transitions only move forward; Compensated is terminal.
  enum class SagaState : uint8_t
  {
    /// @brief Accepting AddCompensation calls.
    Building,
    /// @brief The unwind is running.
    Compensating,
    /// @brief The unwind finished, the result is kept for later calls.
    Compensated
  };

  constexpr std::string_view ToString(const SagaState state) noexcept
  {
    switch (state)
    {
    case SagaState::Building:
      return "Building";
    case SagaState::Compensating:
      return "Compensating";
    case SagaState::Compensated:
      return "Compensated";
    }
    return "Unknown";
  }
}

#endif
