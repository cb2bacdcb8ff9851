#ifndef SAGA_FRAMEWORK_SAGA_COMPENSATIONACTION_HPP
#define SAGA_FRAMEWORK_SAGA_COMPENSATIONACTION_HPP
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

#include <SagaFramework/Saga/CompensationDescriptor.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace SagaFramework
{
  namespace Detail
  {
    // Helper to detect if a type is boost::asio::awaitable<T>
    template <typename>
    struct is_awaitable : std::false_type
    {
    };

    template <typename T, typename Executor>
    struct is_awaitable<boost::asio::awaitable<T, Executor>> : std::true_type
    {
      using value_type = T;
    };

    template <typename T>
    inline constexpr bool is_awaitable_v = is_awaitable<T>::value;

    template <typename T>
    using awaitable_value_t = typename is_awaitable<T>::value_type;

    /// @brief Runs a synchronous callable as a coroutine. The callable is owned by the coroutine frame.
    inline boost::asio::awaitable<void> RunSynchronous(std::function<void()> func)
    {
      func();
      co_return;
    }

    /// @brief Awaits an awaitable producing a value and drops the value.
    template <typename T>
    boost::asio::awaitable<void> AwaitDiscardingResult(std::function<boost::asio::awaitable<T>()> start)
    {
      co_await start();
    }
  }

  /// @brief A deferred unit of reversing work, bound with its arguments at registration time.
  ///
  /// Wraps either a synchronous callable or a coroutine returning boost::asio::awaitable. The bound callable
  /// and its arguments are owned by the action, so a coroutine that takes its arguments by reference stays
  /// valid for as long as the action is alive. An action may carry a CompensationDescriptor for hosts that
  /// persist the saga ledger.
  class CompensationAction
  {
  public:
    using AsyncFunction = std::function<boost::asio::awaitable<void>()>;

  private:
    AsyncFunction m_function;
    std::optional<CompensationDescriptor> m_descriptor;

  public:
    /// @brief Creates an action from a coroutine factory.
    /// @param function Called once per invocation to start the compensation coroutine.
    /// @param descriptor Optional durable description of the action.
    /// @throws std::invalid_argument if function is empty.
    explicit CompensationAction(AsyncFunction function, std::optional<CompensationDescriptor> descriptor = std::nullopt)
      : m_function(std::move(function))
      , m_descriptor(std::move(descriptor))
    {
      if (!m_function)
      {
        throw std::invalid_argument("CompensationAction requires a callable");
      }
    }

    /// @brief Binds a callable and its arguments into an action.
    ///
    /// The callable may return void, any value (ignored), or boost::asio::awaitable<T>. Member function
    /// pointers are supported with the object (pointer, reference_wrapper or smart pointer) as first argument.
    ///
    /// The callable and every bound argument are stored in a std::function, so they must be copy constructible.
    /// Move-only state such as std::unique_ptr does not compile; hold it in a std::shared_ptr instead.
    template <typename TFunc, typename... TArgs>
    static CompensationAction Bind(TFunc&& func, TArgs&&... args)
    {
      using ResultType = std::invoke_result_t<std::decay_t<TFunc>&, std::decay_t<TArgs>&...>;

      if constexpr (Detail::is_awaitable_v<ResultType>)
      {
        using ValueType = Detail::awaitable_value_t<ResultType>;
        if constexpr (std::is_void_v<ValueType>)
        {
          return CompensationAction(AsyncFunction([func = std::forward<TFunc>(func), ... args = std::forward<TArgs>(args)]() mutable
                                                  { return std::invoke(func, args...); }));
        }
        else
        {
          std::function<ResultType()> start = [func = std::forward<TFunc>(func), ... args = std::forward<TArgs>(args)]() mutable
          { return std::invoke(func, args...); };
          return CompensationAction(AsyncFunction([start = std::move(start)]() { return Detail::AwaitDiscardingResult<ValueType>(start); }));
        }
      }
      else
      {
        std::function<void()> run = [func = std::forward<TFunc>(func), ... args = std::forward<TArgs>(args)]() mutable
        { std::invoke(func, args...); };
        return CompensationAction(AsyncFunction([run = std::move(run)]() { return Detail::RunSynchronous(run); }));
      }
    }

    /// @brief Starts the compensation.
    /// @return The compensation coroutine; it throws whatever the bound callable throws.
    boost::asio::awaitable<void> InvokeAsync() const
    {
      return m_function();
    }

    const std::optional<CompensationDescriptor>& GetDescriptor() const noexcept
    {
      return m_descriptor;
    }
  };
}

#endif
