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

#include <SagaFramework/Exception/DuplicateCompensationHandlerException.hpp>
#include <SagaFramework/Exception/UnknownCompensationHandlerException.hpp>
#include <SagaFramework/Log/LogHelper.hpp>
#include <SagaFramework/Saga/CompensationHandlerRegistry.hpp>
#include <stdexcept>
#include <utility>

namespace SagaFramework
{
  namespace
  {
    SAGA_FRAMEWORK_LOGGER_NAME(CompensationHandlerRegistry, "SagaFramework.CompensationHandlerRegistry");

    std::shared_ptr<spdlog::logger> Logger()
    {
      return Log::GetLogger<LoggerName_CompensationHandlerRegistry>();
    }
  }

  void CompensationHandlerRegistry::Register(const std::string& handlerId, Handler handler)
  {
    if (!handler)
    {
      throw std::invalid_argument("Compensation handler must not be empty");
    }

    RegisterAsync(handlerId,
                  [handler = std::move(handler)](std::vector<std::string> arguments)
                  {
                    return Detail::RunSynchronous([handler, arguments = std::move(arguments)]()
                                                  { handler(std::span<const std::string>(arguments.data(), arguments.size())); });
                  });
  }

  void CompensationHandlerRegistry::RegisterAsync(const std::string& handlerId, AsyncHandler handler)
  {
    if (handlerId.empty())
    {
      throw std::invalid_argument("Compensation handler id must not be empty");
    }
    if (!handler)
    {
      throw std::invalid_argument("Compensation handler must not be empty");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_handlers.emplace(handlerId, std::move(handler)).second)
    {
      throw DuplicateCompensationHandlerException(handlerId);
    }
    Logger()->debug("Registered compensation handler '{}'", handlerId);
  }

  bool CompensationHandlerRegistry::Contains(const std::string& handlerId) const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handlers.find(handlerId) != m_handlers.end();
  }

  CompensationAction CompensationHandlerRegistry::CreateAction(const CompensationDescriptor& descriptor) const
  {
    AsyncHandler handler;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      auto it = m_handlers.find(descriptor.HandlerId);
      if (it == m_handlers.end())
      {
        throw UnknownCompensationHandlerException(descriptor.HandlerId);
      }
      handler = it->second;
    }

    return CompensationAction([handler = std::move(handler), arguments = descriptor.Arguments]() { return handler(arguments); }, descriptor);
  }

  std::unique_ptr<Saga> CompensationHandlerRegistry::Restore(SagaOptions options, const std::vector<CompensationDescriptor>& descriptors) const
  {
    // Build every action first so an unknown handler leaves nothing half restored
    std::vector<CompensationAction> actions;
    actions.reserve(descriptors.size());
    for (const auto& descriptor : descriptors)
    {
      actions.push_back(CreateAction(descriptor));
    }

    auto saga = std::make_unique<Saga>(options);
    for (auto& action : actions)
    {
      saga->AddCompensation(std::move(action));
    }

    Logger()->info("Restored saga ledger with {} compensations", descriptors.size());
    return saga;
  }
}
