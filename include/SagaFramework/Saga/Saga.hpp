#ifndef SAGA_FRAMEWORK_SAGA_SAGA_HPP
#define SAGA_FRAMEWORK_SAGA_SAGA_HPP
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

#include <SagaFramework/Saga/CompensationAction.hpp>
#include <SagaFramework/Saga/CompensationDescriptor.hpp>
#include <SagaFramework/Saga/CompensationResult.hpp>
#include <SagaFramework/Saga/SagaOptions.hpp>
#include <SagaFramework/Saga/SagaState.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace SagaFramework
{
  /// @brief Records reversible side effects and unwinds them when a business transaction fails.
  ///
  /// Usage:
  /// 1. Create a Saga at the start of the transaction.
  /// 2. After each forward step succeeds, register its compensation with AddCompensation().
  /// 3. If a later step fails, call CompensateAsync() (or use SagaScope::RunAsync to do 2-3 for you).
  ///
  /// Sequential sagas invoke compensations in exact reverse registration order. With ContinueWithError=false
  /// the unwind stops at the first failure, otherwise every compensation is attempted and every failure is
  /// reported. Parallel sagas start every compensation concurrently and wait for all of them.
  ///
  /// The saga runs compensations exactly once. The first unwind moves the saga to Compensated; later calls
  /// return the stored result without invoking anything. AddCompensation is internally synchronized so forward
  /// steps that complete on different threads may register concurrently.
  class Saga
  {
    const SagaOptions m_options;

    mutable std::mutex m_mutex;
    SagaState m_state{SagaState::Building};
    std::vector<CompensationAction> m_ledger;
    CompensationResult m_result;
    std::exception_ptr m_unexpectedFailure;

  public:
    explicit Saga(SagaOptions options = SagaOptions());
    ~Saga();

    Saga(const Saga&) = delete;
    Saga& operator=(const Saga&) = delete;
    Saga(Saga&&) = delete;
    Saga& operator=(Saga&&) = delete;

    /// @brief Appends a compensation to the ledger.
    /// @throws InvalidSagaStateException if the unwind has already started.
    void AddCompensation(CompensationAction action);

    /// @brief Binds a callable with its arguments and appends it to the ledger.
    ///
    /// Equivalent to AddCompensation(CompensationAction::Bind(func, args...)).
    /// @throws InvalidSagaStateException if the unwind has already started.
    template <typename TFunc, typename... TArgs,
              typename = std::enable_if_t<!std::is_same_v<std::remove_cv_t<std::remove_reference_t<TFunc>>, CompensationAction>>>
    void AddCompensation(TFunc&& func, TArgs&&... args)
    {
      AddCompensation(CompensationAction::Bind(std::forward<TFunc>(func), std::forward<TArgs>(args)...));
    }

    /// @brief Runs the unwind on the current coroutine's executor and reports every failure.
    /// @return The unwind result; on repeated calls the result of the first unwind.
    /// @throws InvalidSagaStateException if another unwind is in progress.
    boost::asio::awaitable<CompensationResult> TryCompensateAsync();

    /// @brief Runs the unwind, dispatching parallel compensations to the given executor.
    ///
    /// Sequential compensations always run on the current coroutine's executor.
    /// @param compensationExecutor Executor that parallel compensations are spawned on, e.g. a thread_pool.
    boost::asio::awaitable<CompensationResult> TryCompensateAsync(boost::asio::any_io_executor compensationExecutor);

    /// @brief Runs the unwind on the current coroutine's executor.
    /// @throws AggregateCompensationException if any compensation failed.
    boost::asio::awaitable<void> CompensateAsync();

    /// @brief Runs the unwind, dispatching parallel compensations to the given executor.
    /// @throws AggregateCompensationException if any compensation failed.
    boost::asio::awaitable<void> CompensateAsync(boost::asio::any_io_executor compensationExecutor);

    /// @brief Runs the unwind to completion on the calling thread.
    ///
    /// Uses a private io_context, so parallel compensations interleave cooperatively at their suspension points.
    /// Must not be called from a coroutine running on an executor that a compensation depends on.
    CompensationResult TryCompensate();

    /// @brief Runs the unwind to completion on the calling thread.
    /// @throws AggregateCompensationException if any compensation failed.
    void Compensate();

    SagaState GetState() const;

    std::size_t GetCompensationCount() const;

    const SagaOptions& GetOptions() const noexcept
    {
      return m_options;
    }

    /// @brief Gets the descriptors of described compensations, in registration order.
    ///
    /// Compensations registered without a descriptor are skipped.
    std::vector<CompensationDescriptor> GetDescriptors() const;

  private:
    /// @brief Moves the saga to Compensating.
    /// @return The stored result when the saga has already been compensated.
    std::optional<CompensationResult> BeginCompensation();
    void EndCompensation(const CompensationResult& result, std::exception_ptr unexpectedFailure);

    boost::asio::awaitable<CompensationResult> RunSequentialAsync();
    boost::asio::awaitable<CompensationResult> RunParallelAsync(boost::asio::any_io_executor compensationExecutor);
  };
}

#endif
