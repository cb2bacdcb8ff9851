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

#include <Demo/TripBooking/SimulatedTripBookingActivities.hpp>
#include <Demo/TripBooking/TripBookingConfig.hpp>
#include <Demo/TripBooking/TripBookingWorkflow.hpp>
#include <SagaFramework/Exception/SagaFailedException.hpp>
#include <SagaFramework/Saga/Saga.hpp>
#include <SagaFramework/Saga/SagaScope.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <memory>
#include <stdexcept>

namespace
{
  // A counter that the forward steps add to and the compensations subtract from
  class Counter
  {
    int m_value{0};

  public:
    void Add(const int value)
    {
      m_value += value;
      spdlog::info("Counter += {} -> {}", value, m_value);
    }

    boost::asio::awaitable<void> AddAsync(const int value)
    {
      Add(value);
      co_return;
    }

    int GetValue() const
    {
      return m_value;
    }
  };

  boost::asio::awaitable<void> RunHelloSagaAsync()
  {
    spdlog::info("=== Hello saga ===");

    auto counter = std::make_shared<Counter>();
    SagaFramework::Saga saga(SagaFramework::SagaOptions::Sequential());

    auto body = [counter](SagaFramework::Saga& saga) -> boost::asio::awaitable<void>
    {
      counter->Add(10);
      saga.AddCompensation(&Counter::Add, counter, -10);

      // Register the compensation before awaiting the step so it is reverted even if the await throws
      saga.AddCompensation(&Counter::AddAsync, counter, -20);
      co_await counter->AddAsync(20);

      saga.AddCompensation([]() { spdlog::info("Other compensation logic in the main workflow"); });

      throw std::runtime_error("Workflow failed after three steps");
    };

    try
    {
      co_await SagaFramework::SagaScope::RunAsync(saga, std::move(body));
    }
    catch (const SagaFramework::SagaFailedException& ex)
    {
      spdlog::error("Hello saga failed and could not be reverted: {}", ex.what());
    }
    catch (const std::exception& ex)
    {
      spdlog::info("Hello saga reverted after: {}", ex.what());
    }

    spdlog::info("Counter after compensation: {}", counter->GetValue());
  }

  void RunTripBooking()
  {
    using namespace Demo::TripBooking;

    spdlog::info("=== Trip booking saga ===");

    boost::asio::thread_pool pool(Config::COMPENSATION_THREAD_COUNT);
    auto activities = std::make_shared<SimulatedTripBookingActivities>();
    TripBookingWorkflow workflow(activities);

    auto future = boost::asio::co_spawn(pool, workflow.BookTripAsync("trip1"), boost::asio::use_future);
    try
    {
      future.get();
    }
    catch (const SagaFramework::SagaFailedException& ex)
    {
      spdlog::error("Trip booking failed and could not be fully cancelled: {}", ex.what());
    }
    catch (const std::exception& ex)
    {
      spdlog::info("Trip booking cancelled after: {}", ex.what());
    }
    pool.join();
  }
}

int main()
{
  spdlog::init_thread_pool(8192, 1);
  auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto async_logger =
    std::make_shared<spdlog::async_logger>("async_logger", stdout_sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  async_logger->set_pattern("[thread %t] %v");
  spdlog::set_default_logger(async_logger);
  spdlog::set_level(spdlog::level::info);
  spdlog::flush_on(spdlog::level::info);

  int exitCode = 0;
  try
  {
    {
      boost::asio::io_context ioContext;
      auto future = boost::asio::co_spawn(ioContext, RunHelloSagaAsync(), boost::asio::use_future);
      ioContext.run();
      future.get();
    }
    RunTripBooking();
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("Demo failed: {}", ex.what());
    exitCode = 1;
  }

  spdlog::shutdown();
  return exitCode;
}
