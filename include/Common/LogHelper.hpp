#ifndef APP_LIFECYCLE_COMMON_LOGHELPER_HPP
#define APP_LIFECYCLE_COMMON_LOGHELPER_HPP
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

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace Common::LogHelper
{
  /// @brief Gets or creates a named logger that writes to the default logger's sinks.
  /// @param name The logger name.
  inline std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
  {
    auto log = spdlog::get(name);
    if (!log)
    {
      auto defaultLogger = spdlog::default_logger();
      const auto& sinks = defaultLogger->sinks();
      log = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
      try
      {
        // Registers the logger and applies the level configured for its name (see ConfigureFromEnvironment).
        spdlog::initialize_logger(log);
      }
      catch (const spdlog::spdlog_ex&)
      {
        // Another thread registered the name first.
        auto registered = spdlog::get(name);
        if (!registered)
        {
          throw;
        }
        log = std::move(registered);
      }
    }
    return log;
  }

  /// @brief Cached variant of GetLogger for a compile time name (see APP_LIFECYCLE_LOGGER_NAME).
  template <typename Name>
  inline std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = GetLogger(std::string(Name::value));
    return logger;
  }

  /// @brief Applies SPDLOG_LEVEL (for example "info" or "info,LifecycleRunner=debug") to all registered loggers.
  ///
  /// Loggers created later by GetLogger pick up the level configured for their name.
  inline void ConfigureFromEnvironment()
  {
    spdlog::cfg::load_env_levels();
  }
}

#define APP_LIFECYCLE_LOGGER_NAME(name)              \
  struct LoggerName_##name                           \
  {                                                  \
    static constexpr std::string_view value = #name; \
  }

#endif
