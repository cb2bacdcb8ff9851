#ifndef SAGA_FRAMEWORK_EXCEPTION_SAGAFAILEDEXCEPTION_HPP
#define SAGA_FRAMEWORK_EXCEPTION_SAGAFAILEDEXCEPTION_HPP
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
#include <SagaFramework/Saga/CompensationResult.hpp>
#include <fmt/format.h>
#include <exception>
#include <stdexcept>
#include <string>

namespace SagaFramework
{
  /// @brief A forward step failed and the unwind that followed also reported failures.
  ///
  /// When the unwind succeeds the forward failure is rethrown unchanged instead, so catching this type means
  /// some side effects were left in place and need manual remediation.
  class SagaFailedException : public std::runtime_error
  {
    std::exception_ptr m_forwardFailure;
    CompensationResult m_compensationResult;

    static std::string GenerateMessage(const std::exception_ptr& forwardFailure, const CompensationResult& result)
    {
      return fmt::format("Saga step failed ({}) and {} of {} compensations failed", CompensationFailure(0, forwardFailure).GetMessage(),
                         result.Failures.size(), result.InvokedCount);
    }

  public:
    SagaFailedException(std::exception_ptr forwardFailure, CompensationResult compensationResult)
      : std::runtime_error(GenerateMessage(forwardFailure, compensationResult))
      , m_forwardFailure(std::move(forwardFailure))
      , m_compensationResult(std::move(compensationResult))
    {
    }

    /// @brief The exception thrown by the forward step.
    const std::exception_ptr& GetForwardFailure() const noexcept
    {
      return m_forwardFailure;
    }

    const CompensationResult& GetCompensationResult() const noexcept
    {
      return m_compensationResult;
    }

    /// @brief The compensation failures as an aggregate, for callers that want ToString() or Flatten().
    AggregateCompensationException GetCompensationException() const
    {
      return AggregateCompensationException(m_compensationResult.Failures);
    }
  };
}

#endif
