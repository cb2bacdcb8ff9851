#ifndef SAGA_FRAMEWORK_EXCEPTION_INVALIDSAGASTATEEXCEPTION_HPP
#define SAGA_FRAMEWORK_EXCEPTION_INVALIDSAGASTATEEXCEPTION_HPP
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

#include <stdexcept>
#include <string>

namespace SagaFramework
{
  /// @brief Exception thrown when a saga operation is not allowed in the saga's current state.
  ///
  /// Raised when a compensation is registered after the unwind has started, or when a second unwind is
  /// requested while the first one is still running.
  class InvalidSagaStateException : public std::logic_error
  {
  public:
    explicit InvalidSagaStateException(const std::string& message)
      : std::logic_error(message)
    {
    }
  };
}

#endif
