#ifndef SAGA_FRAMEWORK_LOG_LOGHELPER_HPP
#define SAGA_FRAMEWORK_LOG_LOGHELPER_HPP
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

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace SagaFramework::Log
{
  /// @brief Gets the named logger, creating it on first use with the default logger's sinks and level.
  ///
  /// Safe to call concurrently: if another thread registers the same name first, its logger is returned.
  /// @param name The logger name.
  /// @return Shared pointer to the logger.
  inline std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
  {
    if (auto existing = spdlog::get(name))
    {
      return existing;
    }

    auto defaultLogger = spdlog::default_logger();
    std::shared_ptr<spdlog::logger> log;
    auto threadPool = spdlog::thread_pool();
    if (std::dynamic_pointer_cast<spdlog::async_logger>(defaultLogger) && threadPool)
    {
      // Queue through the same thread pool so lines keep their order relative to the default logger
      log = std::make_shared<spdlog::async_logger>(name, defaultLogger->sinks().begin(), defaultLogger->sinks().end(), threadPool,
                                                   spdlog::async_overflow_policy::block);
    }
    else
    {
      log = std::make_shared<spdlog::logger>(name, defaultLogger->sinks().begin(), defaultLogger->sinks().end());
    }
    log->set_level(defaultLogger->level());
    log->flush_on(defaultLogger->flush_level());
    try
    {
      spdlog::register_logger(log);
    }
    catch (const spdlog::spdlog_ex&)
    {
      // Lost the registration race
      if (auto existing = spdlog::get(name))
      {
        return existing;
      }
      throw;
    }
    return log;
  }

  /// @brief Gets the logger named by a LoggerName type, caching it for the lifetime of the process.
  /// @tparam Name Type declared with SAGA_FRAMEWORK_LOGGER_NAME.
  template <typename Name>
  inline std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = GetLogger(std::string(Name::value));
    return logger;
  }
}

// Declares a compile-time logger name type, e.g. SAGA_FRAMEWORK_LOGGER_NAME(Saga, "SagaFramework.Saga")
#define SAGA_FRAMEWORK_LOGGER_NAME(identifier, displayName)   \
  struct LoggerName_##identifier                              \
  {                                                           \
    static constexpr std::string_view value = displayName;    \
  }

#endif
