#ifndef APP_LIFECYCLE_CONFIG_RUNNEROPTIONS_HPP
#define APP_LIFECYCLE_CONFIG_RUNNEROPTIONS_HPP
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

#include <AppLifecycle/Config/AppInfo.hpp>
#include <AppLifecycle/Config/SignalKind.hpp>
#include <chrono>
#include <functional>
#include <set>
#include <string_view>

namespace AppLifecycle
{
  class RunnerHandle;

  /// @brief Invoked on the runner's executor for every received signal.
  using SignalHandler = std::function<void(RunnerHandle&, SignalKind)>;

  /// @brief Requests a stop for Interrupt, Quit and Terminate and ignores every other kind.
  void DefaultSignalHandler(RunnerHandle& handle, SignalKind kind);

  /// @brief How LifecycleRunner::Run reports failures.
  enum class ErrorAggregation
  {
    /// @brief Rethrow the first observed error unchanged. Later errors are only logged.
    FirstError = 0,

    /// @brief Throw a Common::AggregateException holding every distinct error, first observed first.
    AllErrors = 1
  };

  /// @brief Configuration for LifecycleRunner.
  struct RunnerOptions
  {
    /// @brief Deadline of the context handed to each start callback.
    std::chrono::steady_clock::duration StartTimeout{std::chrono::seconds(30)};

    /// @brief Deadline of the context handed to each stop callback, counted from the shutdown trigger.
    std::chrono::steady_clock::duration StopTimeout{std::chrono::seconds(30)};

    /// @brief Signals to listen for while running. Empty disables the signal listener.
    std::set<SignalKind> Signals{SignalKind::Interrupt, SignalKind::Quit, SignalKind::Terminate};

    /// @brief Reaction to a received signal. An empty handler ignores signals.
    SignalHandler OnSignal{DefaultSignalHandler};

    ErrorAggregation Aggregation{ErrorAggregation::FirstError};

    AppInfo Info;

    static constexpr std::string_view StartTimeoutVariable = "APP_START_TIMEOUT_MS";
    static constexpr std::string_view StopTimeoutVariable = "APP_STOP_TIMEOUT_MS";

    /// @brief Default options with AppInfo::FromEnvironment() and the optional APP_START_TIMEOUT_MS / APP_STOP_TIMEOUT_MS overrides.
    /// @throws InvalidConfigurationException if a timeout variable is not a non-negative integer.
    static RunnerOptions FromEnvironment();
  };
}

#endif
