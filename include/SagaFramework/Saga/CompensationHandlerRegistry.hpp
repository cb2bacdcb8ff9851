#ifndef SAGA_FRAMEWORK_SAGA_COMPENSATIONHANDLERREGISTRY_HPP
#define SAGA_FRAMEWORK_SAGA_COMPENSATIONHANDLERREGISTRY_HPP
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
#include <SagaFramework/Saga/Saga.hpp>
#include <SagaFramework/Saga/SagaOptions.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace SagaFramework
{
  /// @brief Maps handler ids to compensation handlers so described compensations can be rebuilt.
  ///
  /// A host that persists the saga ledger stores CompensationDescriptors instead of callables. After a
  /// restart it registers the same handler ids and calls Restore() to get a saga with the original ledger.
  class CompensationHandlerRegistry
  {
  public:
    using Handler = std::function<void(std::span<const std::string>)>;
    using AsyncHandler = std::function<boost::asio::awaitable<void>(std::vector<std::string>)>;

  private:
    mutable std::mutex m_mutex;
    std::map<std::string, AsyncHandler, std::less<>> m_handlers;

  public:
    CompensationHandlerRegistry() = default;
    CompensationHandlerRegistry(const CompensationHandlerRegistry&) = delete;
    CompensationHandlerRegistry& operator=(const CompensationHandlerRegistry&) = delete;

    /// @brief Registers a synchronous handler.
    /// @throws DuplicateCompensationHandlerException if the id is already registered.
    /// @throws std::invalid_argument if the id or handler is empty.
    void Register(const std::string& handlerId, Handler handler);

    /// @brief Registers a coroutine handler.
    /// @throws DuplicateCompensationHandlerException if the id is already registered.
    /// @throws std::invalid_argument if the id or handler is empty.
    void RegisterAsync(const std::string& handlerId, AsyncHandler handler);

    bool Contains(const std::string& handlerId) const;

    /// @brief Creates an action that runs the descriptor's handler with its arguments.
    ///
    /// The returned action carries a copy of the descriptor.
    /// @throws UnknownCompensationHandlerException if the handler id is not registered.
    CompensationAction CreateAction(const CompensationDescriptor& descriptor) const;

    /// @brief Creates a Building saga whose ledger holds the described compensations in the given order.
    /// @param options Options of the restored saga.
    /// @param descriptors Descriptors in original registration order, as returned by Saga::GetDescriptors().
    /// @throws UnknownCompensationHandlerException if any handler id is not registered; nothing is restored then.
    std::unique_ptr<Saga> Restore(SagaOptions options, const std::vector<CompensationDescriptor>& descriptors) const;
  };
}

#endif
