#ifndef SAGA_FRAMEWORK_EXCEPTION_DUPLICATECOMPENSATIONHANDLEREXCEPTION_HPP
#define SAGA_FRAMEWORK_EXCEPTION_DUPLICATECOMPENSATIONHANDLEREXCEPTION_HPP
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
#include <string_view>

namespace SagaFramework
{
  /// @brief Exception thrown when a compensation handler id is registered twice.
  class DuplicateCompensationHandlerException : public std::logic_error
  {
  public:
    explicit DuplicateCompensationHandlerException(std::string_view handlerId)
      : std::logic_error(fmt::format("Compensation handler '{}' is already registered", handlerId))
    {
    }
  };
}

#endif
