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
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <gtest/gtest.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace SagaFramework
{
  // ============================================================================
  // Test Fixtures and Helper Classes
  // ============================================================================

  /// @brief Service with synchronous and coroutine reversal methods
  class BookingService
  {
  public:
    std::vector<std::string> Cancelled;

    void Cancel(const std::string& id)
    {
      Cancelled.push_back(id);
    }

    boost::asio::awaitable<std::string> CancelAsync(std::string id)
    {
      co_await boost::asio::post(co_await boost::asio::this_coro::executor, boost::asio::use_awaitable);
      Cancelled.push_back(id);
      co_return "cancelled " + id;
    }
  };

  class CompensationActionTest : public ::testing::Test
  {
  protected:
    boost::asio::io_context m_ioContext;

    void Invoke(const CompensationAction& action)
    {
      auto future = boost::asio::co_spawn(m_ioContext, action.InvokeAsync(), boost::asio::use_future);
      m_ioContext.run();
      m_ioContext.restart();
      future.get();
    }
  };

  // ============================================================================
  // Construction Tests
  // ============================================================================

  TEST_F(CompensationActionTest, Constructor_WithEmptyFunction_Throws)
  {
    EXPECT_THROW(CompensationAction{CompensationAction::AsyncFunction{}}, std::invalid_argument);
  }

  TEST_F(CompensationActionTest, Constructor_KeepsDescriptor)
  {
    CompensationAction action([]() -> boost::asio::awaitable<void> { co_return; }, CompensationDescriptor{"cancelHotel", {"H1", "trip1"}});

    ASSERT_TRUE(action.GetDescriptor().has_value());
    EXPECT_EQ(action.GetDescriptor()->HandlerId, "cancelHotel");
    EXPECT_EQ(action.GetDescriptor()->Arguments, (std::vector<std::string>{"H1", "trip1"}));
  }

  TEST_F(CompensationActionTest, Bind_HasNoDescriptor)
  {
    auto action = CompensationAction::Bind([]() {});

    EXPECT_FALSE(action.GetDescriptor().has_value());
  }

  // ============================================================================
  // Bind Tests
  // ============================================================================

  TEST_F(CompensationActionTest, Bind_SynchronousCallable_RunsOnInvoke)
  {
    // Arrange
    int value = 30;
    auto action = CompensationAction::Bind([&value](int delta) { value += delta; }, -10);

    // Act
    EXPECT_EQ(value, 30);
    Invoke(action);

    // Assert
    EXPECT_EQ(value, 20);
  }

  TEST_F(CompensationActionTest, Bind_ArgumentsAreCapturedAtRegistration)
  {
    std::vector<std::string> seen;
    std::string id = "first";
    auto action = CompensationAction::Bind([&seen](const std::string& value) { seen.push_back(value); }, id);
    id = "changed";

    Invoke(action);

    EXPECT_EQ(seen, (std::vector<std::string>{"first"}));
  }

  TEST_F(CompensationActionTest, Bind_CallableReturningValue_DiscardsValue)
  {
    int calls = 0;
    auto action = CompensationAction::Bind(
      [&calls]()
      {
        ++calls;
        return 42;
      });

    Invoke(action);

    EXPECT_EQ(calls, 1);
  }

  TEST_F(CompensationActionTest, Bind_MemberFunctionWithSharedPtr)
  {
    auto service = std::make_shared<BookingService>();
    auto action = CompensationAction::Bind(&BookingService::Cancel, service, std::string("CAR-1"));

    Invoke(action);

    EXPECT_EQ(service->Cancelled, (std::vector<std::string>{"CAR-1"}));
  }

  TEST_F(CompensationActionTest, Bind_AwaitableMemberFunction_CompletesAfterSuspension)
  {
    auto service = std::make_shared<BookingService>();
    auto action = CompensationAction::Bind(&BookingService::CancelAsync, service, std::string("HOTEL-1"));

    Invoke(action);

    EXPECT_EQ(service->Cancelled, (std::vector<std::string>{"HOTEL-1"}));
  }

  TEST_F(CompensationActionTest, Bind_AwaitableVoidLambda)
  {
    int calls = 0;
    auto action = CompensationAction::Bind(
      [&calls]() -> boost::asio::awaitable<void>
      {
        co_await boost::asio::post(co_await boost::asio::this_coro::executor, boost::asio::use_awaitable);
        ++calls;
      });

    Invoke(action);

    EXPECT_EQ(calls, 1);
  }

  TEST_F(CompensationActionTest, Bind_SharedPtrHeldResource_ReleasedWithAction)
  {
    // Arrange
    auto ticket = std::make_shared<std::string>("TICKET-1");
    std::weak_ptr<std::string> observer = ticket;
    std::vector<std::string> refunded;
    {
      auto action = CompensationAction::Bind([&refunded](const std::shared_ptr<std::string>& held) { refunded.push_back(*held); }, std::move(ticket));

      // Act
      Invoke(action);
      EXPECT_FALSE(observer.expired());
    }

    // Assert
    EXPECT_EQ(refunded, (std::vector<std::string>{"TICKET-1"}));
    EXPECT_TRUE(observer.expired());
  }

  TEST_F(CompensationActionTest, Bind_WithReferenceWrapper)
  {
    BookingService service;
    auto action = CompensationAction::Bind(&BookingService::Cancel, std::ref(service), std::string("FLIGHT-1"));

    Invoke(action);

    EXPECT_EQ(service.Cancelled, (std::vector<std::string>{"FLIGHT-1"}));
  }

  TEST_F(CompensationActionTest, Invoke_PropagatesException)
  {
    auto action = CompensationAction::Bind([]() { throw std::runtime_error("refund rejected"); });

    EXPECT_THROW(Invoke(action), std::runtime_error);
  }

  TEST_F(CompensationActionTest, Invoke_CanRunMoreThanOnce)
  {
    int calls = 0;
    auto action = CompensationAction::Bind([&calls]() { ++calls; });

    Invoke(action);
    Invoke(action);

    EXPECT_EQ(calls, 2);
  }
}
