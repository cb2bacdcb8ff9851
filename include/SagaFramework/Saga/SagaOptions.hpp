#ifndef SAGA_FRAMEWORK_SAGA_SAGAOPTIONS_HPP
#define SAGA_FRAMEWORK_SAGA_SAGAOPTIONS_HPP
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

namespace SagaFramework
{
  /// @brief Immutable configuration of a Saga.
  ///
  /// The defaults match the workflow SDK the saga pattern is usually paired with: compensations run in
  /// parallel, and a sequential unwind stops at the first compensation failure.
  struct SagaOptions
  {
    /// @brief Run every compensation concurrently instead of strictly in reverse registration order.
    bool ParallelCompensation{true};
    /// @brief Sequential mode only: keep unwinding older steps after a compensation failed.
    bool ContinueWithError{false};

    constexpr SagaOptions() noexcept = default;

    constexpr SagaOptions(const bool parallelCompensation, const bool continueWithError) noexcept
      : ParallelCompensation(parallelCompensation)
      , ContinueWithError(continueWithError)
    {
    }

    /// @brief Reverse registration order unwind.
    static constexpr SagaOptions Sequential(const bool continueWithError = false) noexcept
    {
      return SagaOptions(false, continueWithError);
    }

    /// @brief Concurrent unwind, every compensation is attempted.
    static constexpr SagaOptions Parallel() noexcept
    {
      return SagaOptions(true, false);
    }

    constexpr bool operator==(const SagaOptions& other) const noexcept = default;
  };
}

#endif
