#ifndef SAGA_FRAMEWORK_UTIL_COMPLETIONLATCH_HPP
#define SAGA_FRAMEWORK_UTIL_COMPLETIONLATCH_HPP
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

#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace SagaFramework::Util
{
  /// @brief Single-use countdown that lets asynchronous waiters resume once N operations have completed.
  ///
  /// CountDown may be called from any thread. Waiters are always resumed through a post to the executor
  /// associated with their completion handler, never inline from CountDown or AsyncWait.
  class CompletionLatch
  {
    mutable std::mutex m_mutex;
    std::size_t m_remaining;
    std::vector<std::function<void()>> m_waiters;

  public:
    explicit CompletionLatch(const std::size_t count)
      : m_remaining(count)
    {
    }

    CompletionLatch(const CompletionLatch&) = delete;
    CompletionLatch& operator=(const CompletionLatch&) = delete;
    CompletionLatch(CompletionLatch&&) = delete;
    CompletionLatch& operator=(CompletionLatch&&) = delete;

    /// @brief Marks one operation as completed.
    /// @throws std::logic_error if called more times than the initial count.
    void CountDown()
    {
      std::vector<std::function<void()>> waiters;
      {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_remaining == 0)
        {
          throw std::logic_error("CompletionLatch counted down more times than its initial count");
        }
        --m_remaining;
        if (m_remaining == 0)
        {
          waiters.swap(m_waiters);
        }
      }

      for (auto& resume : waiters)
      {
        resume();
      }
    }

    std::size_t GetRemaining() const
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      return m_remaining;
    }

    bool IsReady() const
    {
      return GetRemaining() == 0;
    }

    /// @brief Waits until the count reaches zero.
    ///
    /// The latch must outlive the wait. The initiation never throws, as use_awaitable runs it from a noexcept context.
    /// @param token Completion token with signature void(), e.g. boost::asio::use_awaitable.
    template <typename CompletionToken>
    auto AsyncWait(CompletionToken&& token)
    {
      return boost::asio::async_initiate<CompletionToken, void()>(
        [this](auto handler)
        {
          using HandlerType = std::decay_t<decltype(handler)>;
          // std::function needs a copyable target; the completion handler may be move-only
          auto sharedHandler = std::make_shared<HandlerType>(std::move(handler));
          std::function<void()> resume = [sharedHandler]() { boost::asio::post(std::move(*sharedHandler)); };

          {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_remaining != 0)
            {
              m_waiters.push_back(std::move(resume));
              return;
            }
          }
          resume();
        },
        token);
    }
  };
}

#endif
