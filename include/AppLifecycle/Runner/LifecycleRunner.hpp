#ifndef APP_LIFECYCLE_RUNNER_LIFECYCLERUNNER_HPP
#define APP_LIFECYCLE_RUNNER_LIFECYCLERUNNER_HPP
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
#include <AppLifecycle/Context/Context.hpp>
#include <AppLifecycle/Hook/HookRegistry.hpp>
#include <AppLifecycle/Runner/RunnerState.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <atomic>
#include <mutex>
#include <optional>

namespace AppLifecycle
{
  /// @brief Starts every registered hook concurrently, waits for a shutdown trigger and then stops every hook concurrently.
  ///
  /// A shutdown is triggered by the first of:
  /// - a start or stop callback throwing (a callback that gives up on an expired Context included)
  /// - Stop(), or RunnerHandle::RequestStop() from a signal handler
  ///
  /// Awaitable callbacks of one Run() share a single io_context driven by the calling thread. Blocking
  /// callbacks (Hook::OnStartBlocking, Hook::OnStopBlocking) each get a dedicated pool thread and are awaited
  /// from that io_context. Each callback receives its own Context (a deadline snapshot for blocking ones):
  /// start callbacks are bounded by RunnerOptions::StartTimeout, stop callbacks by RunnerOptions::StopTimeout
  /// counted from the trigger. A blocking callback cannot be interrupted, so Run() waits for it to return.
  class LifecycleRunner
  {
    RunnerOptions m_options;
    HookRegistry m_registry;

    std::atomic<RunnerState> m_state{RunnerState::Idle};

    mutable std::mutex m_mutex;
    std::optional<boost::asio::any_io_executor> m_executor;
    std::optional<Context> m_rootContext;

  public:
    LifecycleRunner(RunnerOptions options, HookRegistry registry);

    LifecycleRunner(const LifecycleRunner&) = delete;
    LifecycleRunner& operator=(const LifecycleRunner&) = delete;
    LifecycleRunner(LifecycleRunner&&) = delete;
    LifecycleRunner& operator=(LifecycleRunner&&) = delete;

    /// @brief Runs the lifecycle on the calling thread and returns once every task has completed.
    ///
    /// Never returns without a shutdown trigger, even when the registry is empty and no signals are configured.
    /// The runner can be run again once a previous Run() returned.
    ///
    /// @throws std::runtime_error if another Run() of this runner is active.
    /// @throws The first error observed (ErrorAggregation::FirstError) or a Common::AggregateException holding
    ///         every distinct error (ErrorAggregation::AllErrors).
    void Run();

    /// @brief Requests a graceful shutdown of the active run. Thread-safe and idempotent.
    ///
    /// The root context is cancelled with an OperationCanceledException. Does nothing when no run is active.
    void Stop() noexcept;

    [[nodiscard]] RunnerState GetState() const noexcept
    {
      return m_state.load();
    }

    [[nodiscard]] const RunnerOptions& GetOptions() const noexcept
    {
      return m_options;
    }

    [[nodiscard]] const HookRegistry& GetRegistry() const noexcept
    {
      return m_registry;
    }

  private:
    class ActiveRunScope;

    void CancelRootContext();
  };
}

#endif
