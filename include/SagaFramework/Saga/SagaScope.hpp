#ifndef SAGA_FRAMEWORK_SAGA_SAGASCOPE_HPP
#define SAGA_FRAMEWORK_SAGA_SAGASCOPE_HPP
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

#include <SagaFramework/Exception/SagaFailedException.hpp>
#include <SagaFramework/Saga/CompensationAction.hpp>
#include <SagaFramework/Saga/CompensationResult.hpp>
#include <SagaFramework/Saga/Saga.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <exception>
#include <type_traits>

namespace SagaFramework::SagaScope
{
  /// @brief Reports a forward failure after the saga has been unwound.
  ///
  /// Rethrows the forward failure unchanged when every compensation succeeded, otherwise throws
  /// SagaFailedException carrying both the forward failure and the compensation failures.
  [[noreturn]] inline void ThrowForwardFailure(std::exception_ptr forwardFailure, CompensationResult compensationResult)
  {
    if (compensationResult.Succeeded())
    {
      std::rethrow_exception(forwardFailure);
    }
    throw SagaFailedException(std::move(forwardFailure), std::move(compensationResult));
  }

  /// @brief Runs the forward steps of a saga and unwinds it if any of them throws.
  ///
  /// The body registers compensations on the saga as its steps succeed. If the body completes, its result
  /// is returned and nothing is compensated. If it throws, the saga is compensated on the current executor
  /// and the failure is reported through ThrowForwardFailure.
  ///
  /// A body with captures must be bound to a named local and moved in, never written as a lambda temporary
  /// inside the co_await operand. GCC 12 destroys such a temporary against the caller's coroutine frame:
  /// @code
  /// auto body = [name](Saga& saga) -> boost::asio::awaitable<int> { ... };
  /// auto result = co_await SagaScope::RunAsync(saga, std::move(body));
  /// @endcode
  ///
  /// @param saga The saga the body registers compensations with.
  /// @param body Callable taking Saga& and returning boost::asio::awaitable<T>.
  /// @return awaitable with the body's result.
  template <typename TBody>
  auto RunAsync(Saga& saga, TBody body) -> boost::asio::awaitable<Detail::awaitable_value_t<std::invoke_result_t<TBody&, Saga&>>>
  {
    using ResultType = Detail::awaitable_value_t<std::invoke_result_t<TBody&, Saga&>>;

    std::exception_ptr forwardFailure;
    if constexpr (std::is_void_v<ResultType>)
    {
      try
      {
        co_await body(saga);
        co_return;
      }
      catch (...)
      {
        forwardFailure = std::current_exception();
      }
    }
    else
    {
      try
      {
        co_return co_await body(saga);
      }
      catch (...)
      {
        forwardFailure = std::current_exception();
      }
    }

    // co_await is not allowed inside a catch block
    auto compensationResult = co_await saga.TryCompensateAsync();
    ThrowForwardFailure(std::move(forwardFailure), std::move(compensationResult));
  }

  /// @brief Synchronous variant of RunAsync for bodies that do not suspend.
  /// @param saga The saga the body registers compensations with.
  /// @param body Callable taking Saga& and returning T.
  /// @return The body's result.
  template <typename TBody>
  auto Run(Saga& saga, TBody body) -> std::invoke_result_t<TBody&, Saga&>
  {
    std::exception_ptr forwardFailure;
    try
    {
      return body(saga);
    }
    catch (...)
    {
      forwardFailure = std::current_exception();
    }

    ThrowForwardFailure(std::move(forwardFailure), saga.TryCompensate());
  }
}

#endif
