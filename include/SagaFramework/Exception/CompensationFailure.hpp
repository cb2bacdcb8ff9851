#ifndef SAGA_FRAMEWORK_EXCEPTION_COMPENSATIONFAILURE_HPP
#define SAGA_FRAMEWORK_EXCEPTION_COMPENSATIONFAILURE_HPP
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

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

namespace SagaFramework
{
  /// @brief A single compensation action that terminated with an exception.
  struct CompensationFailure
  {
    /// @brief 1-based registration position of the failed action.
    std::size_t Index{0};
    /// @brief The exception thrown by the action.
    std::exception_ptr Cause;

    CompensationFailure() = default;

    CompensationFailure(const std::size_t index, std::exception_ptr cause)
      : Index(index)
      , Cause(std::move(cause))
    {
    }

    /// @brief Extracts the message of the captured cause.
    /// @return what() of the cause, or a placeholder for non std::exception causes.
    std::string GetMessage() const
    {
      if (!Cause)
      {
        return "(null exception)";
      }
      try
      {
        std::rethrow_exception(Cause);
      }
      catch (const std::exception& ex)
      {
        return ex.what();
      }
      catch (...)
      {
        return "(unknown exception type)";
      }
    }
  };
}

#endif
