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

#include <SagaFramework/Exception/InvalidSagaStateException.hpp>
#include <SagaFramework/Log/LogHelper.hpp>
#include <SagaFramework/Saga/Saga.hpp>
#include <SagaFramework/Util/CompletionLatch.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace SagaFramework
{
  namespace
  {
    SAGA_FRAMEWORK_LOGGER_NAME(Saga, "SagaFramework.Saga");

    std::shared_ptr<spdlog::logger> Logger()
    {
      return Log::GetLogger<LoggerName_Saga>();
    }

    // Wraps the action so an exception thrown while starting the coroutine is delivered to the completion handler
    boost::asio::awaitable<void> InvokeActionAsync(const CompensationAction& action)
    {
      co_await action.InvokeAsync();
    }

    /// @brief Collects failures reported by concurrently running compensations.
    class FailureCollector
    {
      std::mutex m_mutex;
      std::vector<CompensationFailure> m_failures;

    public:
      void Add(CompensationFailure failure)
      {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures.push_back(std::move(failure));
      }

      /// @brief Returns the failures ordered by registration index.
      std::vector<CompensationFailure> Take()
      {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::sort(m_failures.begin(), m_failures.end(), [](const CompensationFailure& lhs, const CompensationFailure& rhs) { return lhs.Index < rhs.Index; });
        return std::move(m_failures);
      }
    };
  }

  Saga::Saga(SagaOptions options)
    : m_options(options)
  {
  }

  Saga::~Saga()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == SagaState::Compensating)
    {
      Logger()->warn("Saga destroyed while compensation is in progress");
    }
    else if (m_state == SagaState::Building && !m_ledger.empty())
    {
      Logger()->debug("Saga destroyed without compensating, {} compensations discarded", m_ledger.size());
    }
  }

  void Saga::AddCompensation(CompensationAction action)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != SagaState::Building)
    {
      Logger()->warn("Rejected compensation registration in state {}", ToString(m_state));
      throw InvalidSagaStateException(fmt::format("Cannot add a compensation to a saga in state {}", ToString(m_state)));
    }

    m_ledger.push_back(std::move(action));
    Logger()->debug("Registered compensation {}", m_ledger.size());
  }

  boost::asio::awaitable<CompensationResult> Saga::TryCompensateAsync()
  {
    auto executor = co_await boost::asio::this_coro::executor;
    co_return co_await TryCompensateAsync(std::move(executor));
  }

  boost::asio::awaitable<CompensationResult> Saga::TryCompensateAsync(boost::asio::any_io_executor compensationExecutor)
  {
    if (auto previousResult = BeginCompensation())
    {
      co_return *previousResult;
    }

    // The ledger is only read from here on; AddCompensation is rejected while Compensating
    Logger()->info("Compensating {} steps ({})", m_ledger.size(), m_options.ParallelCompensation ? "parallel" : "sequential");

    CompensationResult result;
    std::exception_ptr unexpectedFailure;
    try
    {
      if (m_options.ParallelCompensation)
      {
        result = co_await RunParallelAsync(std::move(compensationExecutor));
      }
      else
      {
        result = co_await RunSequentialAsync();
      }
    }
    catch (...)
    {
      unexpectedFailure = std::current_exception();
      Logger()->error("Compensation aborted by an unexpected error");
    }

    EndCompensation(result, unexpectedFailure);
    if (unexpectedFailure)
    {
      std::rethrow_exception(unexpectedFailure);
    }

    if (result.Succeeded())
    {
      Logger()->info("Compensation completed, {} compensations invoked", result.InvokedCount);
    }
    else
    {
      Logger()->error("Compensation completed with {} failures, {} of {} compensations invoked", result.Failures.size(), result.InvokedCount,
                      m_ledger.size());
    }
    co_return result;
  }

  boost::asio::awaitable<void> Saga::CompensateAsync()
  {
    auto result = co_await TryCompensateAsync();
    result.ThrowIfFailed();
  }

  boost::asio::awaitable<void> Saga::CompensateAsync(boost::asio::any_io_executor compensationExecutor)
  {
    auto result = co_await TryCompensateAsync(std::move(compensationExecutor));
    result.ThrowIfFailed();
  }

  CompensationResult Saga::TryCompensate()
  {
    boost::asio::io_context ioContext;
    auto future = boost::asio::co_spawn(ioContext, TryCompensateAsync(), boost::asio::use_future);
    ioContext.run();
    return future.get();
  }

  void Saga::Compensate()
  {
    TryCompensate().ThrowIfFailed();
  }

  SagaState Saga::GetState() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
  }

  std::size_t Saga::GetCompensationCount() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ledger.size();
  }

  std::vector<CompensationDescriptor> Saga::GetDescriptors() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CompensationDescriptor> descriptors;
    for (const auto& action : m_ledger)
    {
      if (action.GetDescriptor().has_value())
      {
        descriptors.push_back(*action.GetDescriptor());
      }
    }
    return descriptors;
  }

  std::optional<CompensationResult> Saga::BeginCompensation()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (m_state)
    {
    case SagaState::Building:
      m_state = SagaState::Compensating;
      return std::nullopt;
    case SagaState::Compensating:
      throw InvalidSagaStateException("Saga compensation is already in progress");
    case SagaState::Compensated:
      Logger()->warn("Saga has already been compensated, returning the first result");
      if (m_unexpectedFailure)
      {
        std::rethrow_exception(m_unexpectedFailure);
      }
      return m_result;
    }
    throw std::logic_error("Unknown saga state");
  }

  void Saga::EndCompensation(const CompensationResult& result, std::exception_ptr unexpectedFailure)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_result = result;
    m_unexpectedFailure = std::move(unexpectedFailure);
    m_state = SagaState::Compensated;
  }

  boost::asio::awaitable<CompensationResult> Saga::RunSequentialAsync()
  {
    std::vector<CompensationFailure> failures;
    std::size_t invokedCount = 0;

    // Reverse registration order
    for (std::size_t index = m_ledger.size(); index > 0; --index)
    {
      ++invokedCount;
      std::exception_ptr failure;
      try
      {
        co_await m_ledger[index - 1].InvokeAsync();
      }
      catch (...)
      {
        failure = std::current_exception();
      }

      if (failure)
      {
        failures.emplace_back(index, failure);
        Logger()->error("Compensation {} failed: {}", index, failures.back().GetMessage());
        if (!m_options.ContinueWithError)
        {
          Logger()->warn("Stopping unwind at compensation {}, {} older compensations skipped", index, index - 1);
          break;
        }
      }
    }

    co_return CompensationResult(std::move(failures), invokedCount);
  }

  boost::asio::awaitable<CompensationResult> Saga::RunParallelAsync(boost::asio::any_io_executor compensationExecutor)
  {
    const std::size_t count = m_ledger.size();
    if (count == 0)
    {
      co_return CompensationResult();
    }

    auto latch = std::make_shared<Util::CompletionLatch>(count);
    auto collector = std::make_shared<FailureCollector>();

    for (std::size_t i = 0; i < count; ++i)
    {
      const std::size_t index = i + 1;
      boost::asio::co_spawn(compensationExecutor, InvokeActionAsync(m_ledger[i]),
                            [latch, collector, index](std::exception_ptr failure)
                            {
                              if (failure)
                              {
                                CompensationFailure compensationFailure(index, failure);
                                Logger()->error("Compensation {} failed: {}", index, compensationFailure.GetMessage());
                                collector->Add(std::move(compensationFailure));
                              }
                              latch->CountDown();
                            });
    }

    // Started compensations are never cancelled, wait for every one of them
    co_await latch->AsyncWait(boost::asio::use_awaitable);
    co_return CompensationResult(collector->Take(), count);
  }
}
