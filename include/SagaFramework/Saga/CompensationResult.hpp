#ifndef SAGA_FRAMEWORK_SAGA_COMPENSATIONRESULT_HPP
#define SAGA_FRAMEWORK_SAGA_COMPENSATIONRESULT_HPP
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

#include <SagaFramework/Exception/AggregateCompensationException.hpp>
#include <SagaFramework/Exception/CompensationFailure.hpp>
#include <cstddef>
#include <utility>
#include <vector>

namespace SagaFramework
{
  /// @brief Outcome of one saga unwind.
  ///
  /// An empty Failures list means every invoked compensation completed. InvokedCount is the number of
  /// actions that were started, which is lower than the ledger size when a sequential unwind stopped early.
  struct CompensationResult
  {
    std::vector<CompensationFailure> Failures;
    std::size_t InvokedCount{0};

    CompensationResult() = default;

    CompensationResult(std::vector<CompensationFailure> failures, const std::size_t invokedCount)
      : Failures(std::move(failures))
      , InvokedCount(invokedCount)
    {
    }

    bool Succeeded() const noexcept
    {
      return Failures.empty();
    }

    /// @brief Throws an AggregateCompensationException holding every failure, if there are any.
    void ThrowIfFailed() const
    {
      if (!Failures.empty())
      {
        throw AggregateCompensationException(Failures);
      }
    }
  };
}

#endif
