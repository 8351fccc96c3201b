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

#include <AppLifecycle/Config/RunnerOptions.hpp>
#include <AppLifecycle/Exception/InvalidConfigurationException.hpp>
#include <AppLifecycle/Runner/RunnerHandle.hpp>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>

namespace AppLifecycle
{
  namespace
  {
    std::optional<std::chrono::milliseconds> ReadMilliseconds(std::string_view variableName)
    {
      const char* raw = std::getenv(std::string(variableName).c_str());
      if (raw == nullptr)
      {
        return std::nullopt;
      }

      const std::string_view value(raw);
      std::chrono::milliseconds::rep milliseconds = 0;
      const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), milliseconds);
      if (value.empty() || ec != std::errc() || end != value.data() + value.size() || milliseconds < 0)
      {
        throw InvalidConfigurationException(variableName, value, "a non-negative integer number of milliseconds");
      }
      return std::chrono::milliseconds(milliseconds);
    }
  }

  void DefaultSignalHandler(RunnerHandle& handle, const SignalKind kind)
  {
    if (IsTerminationSignal(kind))
    {
      handle.RequestStop();
    }
  }

  RunnerOptions RunnerOptions::FromEnvironment()
  {
    RunnerOptions options;
    options.Info = AppInfo::FromEnvironment();
    if (auto timeout = ReadMilliseconds(StartTimeoutVariable))
    {
      options.StartTimeout = *timeout;
    }
    if (auto timeout = ReadMilliseconds(StopTimeoutVariable))
    {
      options.StopTimeout = *timeout;
    }
    return options;
  }
}
