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

#include <SagaFramework/Util/CompletionLatch.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

namespace SagaFramework::Util
{
  class CompletionLatchTest : public ::testing::Test
  {
  protected:
    boost::asio::io_context m_ioContext;
  };

  TEST_F(CompletionLatchTest, CountDown_ReachesZero)
  {
    CompletionLatch latch(2);

    EXPECT_EQ(latch.GetRemaining(), 2u);
    latch.CountDown();
    EXPECT_FALSE(latch.IsReady());
    latch.CountDown();
    EXPECT_TRUE(latch.IsReady());
  }

  TEST_F(CompletionLatchTest, CountDown_PastZero_Throws)
  {
    CompletionLatch latch(1);
    latch.CountDown();

    EXPECT_THROW(latch.CountDown(), std::logic_error);
  }

  TEST_F(CompletionLatchTest, AsyncWait_AlreadyReady_CompletesThroughPost)
  {
    // Arrange
    CompletionLatch latch(0);
    bool completed = false;

    // Act
    latch.AsyncWait(boost::asio::bind_executor(m_ioContext, [&completed]() { completed = true; }));

    // Assert
    EXPECT_FALSE(completed);
    m_ioContext.run();
    EXPECT_TRUE(completed);
  }

  TEST_F(CompletionLatchTest, AsyncWait_ResumesCoroutineAfterLastCountDown)
  {
    // Arrange
    auto latch = std::make_shared<CompletionLatch>(3);
    bool resumed = false;
    auto future = boost::asio::co_spawn(
      m_ioContext,
      [latch, &resumed]() -> boost::asio::awaitable<void>
      {
        co_await latch->AsyncWait(boost::asio::use_awaitable);
        resumed = true;
      },
      boost::asio::use_future);

    // Act
    m_ioContext.poll();
    latch->CountDown();
    latch->CountDown();
    m_ioContext.poll();
    const bool resumedEarly = resumed;
    latch->CountDown();
    m_ioContext.run();

    // Assert
    EXPECT_FALSE(resumedEarly);
    EXPECT_TRUE(resumed);
    future.get();
  }

  TEST_F(CompletionLatchTest, AsyncWait_CountDownFromThreadPool)
  {
    // Arrange
    constexpr std::size_t Count = 100;
    auto latch = std::make_shared<CompletionLatch>(Count);
    boost::asio::thread_pool pool(4);
    auto future = boost::asio::co_spawn(
      m_ioContext, [latch]() -> boost::asio::awaitable<void> { co_await latch->AsyncWait(boost::asio::use_awaitable); }, boost::asio::use_future);
    m_ioContext.poll();

    // Act
    for (std::size_t i = 0; i < Count; ++i)
    {
      boost::asio::post(pool, [latch]() { latch->CountDown(); });
    }
    pool.join();
    m_ioContext.run();

    // Assert
    EXPECT_NO_THROW(future.get());
    EXPECT_TRUE(latch->IsReady());
  }

  TEST_F(CompletionLatchTest, AsyncWait_MultipleWaiters_AllResume)
  {
    // Arrange
    auto latch = std::make_shared<CompletionLatch>(1);
    int resumed = 0;
    for (int i = 0; i < 3; ++i)
    {
      latch->AsyncWait(boost::asio::bind_executor(m_ioContext, [&resumed]() { ++resumed; }));
    }
    m_ioContext.poll();
    m_ioContext.restart();

    // Act
    latch->CountDown();
    m_ioContext.run();

    // Assert
    EXPECT_EQ(resumed, 3);
  }
}
