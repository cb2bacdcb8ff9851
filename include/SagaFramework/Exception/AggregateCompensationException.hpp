#ifndef SAGA_FRAMEWORK_EXCEPTION_AGGREGATECOMPENSATIONEXCEPTION_HPP
#define SAGA_FRAMEWORK_EXCEPTION_AGGREGATECOMPENSATIONEXCEPTION_HPP
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

#include <SagaFramework/Exception/CompensationFailure.hpp>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace SagaFramework
{
  /// @brief Thrown when one or more compensation actions of a saga failed.
  ///
  /// Carries every CompensationFailure of the unwind in the order it was reported, each tagged with the
  /// registration position of the action that failed. Once constructed the exception is immutable and
  /// safe to read from multiple threads.
  class AggregateCompensationException : public std::runtime_error
  {
    std::vector<CompensationFailure> m_failures;

  public:
    /// @brief Creates the exception with the default message.
    /// @param failures The failed compensations.
    /// @throws std::invalid_argument if failures is empty.
    explicit AggregateCompensationException(std::vector<CompensationFailure> failures);

    /// @brief Creates the exception with a custom message.
    /// @param message The error message, empty selects the default message.
    /// @param failures The failed compensations.
    /// @throws std::invalid_argument if failures is empty.
    AggregateCompensationException(const std::string& message, std::vector<CompensationFailure> failures);

    AggregateCompensationException(const AggregateCompensationException&) = default;
    AggregateCompensationException(AggregateCompensationException&&) = default;
    AggregateCompensationException& operator=(const AggregateCompensationException&) = delete;
    AggregateCompensationException& operator=(AggregateCompensationException&&) = delete;

    const std::vector<CompensationFailure>& GetFailures() const noexcept
    {
      return m_failures;
    }

    size_t FailureCount() const noexcept
    {
      return m_failures.size();
    }

    /// @brief Gets the causes of all failures, in failure order.
    std::vector<std::exception_ptr> GetInnerExceptions() const;

    /// @brief Gets the cause of the first reported failure.
    std::exception_ptr GetBaseException() const noexcept;

    /// @brief Unwraps causes that are themselves AggregateCompensationExceptions (a compensation that unwound a nested saga).
    ///
    /// Leaf failures keep the registration index of the outermost action they were reported through.
    /// @return A new exception containing only leaf failures.
    AggregateCompensationException Flatten() const;

    /// @brief Returns the message followed by one line per failure with its index, exception type and message.
    std::string ToString() const;

    std::vector<CompensationFailure>::const_iterator begin() const noexcept
    {
      return m_failures.begin();
    }

    std::vector<CompensationFailure>::const_iterator end() const noexcept
    {
      return m_failures.end();
    }
  };
}

#endif
