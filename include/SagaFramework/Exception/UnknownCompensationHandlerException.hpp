#ifndef SAGA_FRAMEWORK_EXCEPTION_UNKNOWNCOMPENSATIONHANDLEREXCEPTION_HPP
#define SAGA_FRAMEWORK_EXCEPTION_UNKNOWNCOMPENSATIONHANDLEREXCEPTION_HPP
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

#include <fmt/format.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace SagaFramework
{
  /// @brief Exception thrown when a compensation descriptor names a handler that was never registered.
  class UnknownCompensationHandlerException : public std::runtime_error
  {
    std::string m_handlerId;

  public:
    explicit UnknownCompensationHandlerException(std::string_view handlerId)
      : std::runtime_error(fmt::format("No compensation handler registered for '{}'", handlerId))
      , m_handlerId(handlerId)
    {
    }

    const std::string& GetHandlerId() const noexcept
    {
      return m_handlerId;
    }
  };
}

#endif
