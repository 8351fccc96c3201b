#ifndef APP_LIFECYCLE_RUNNER_RUNNERHANDLE_HPP
#define APP_LIFECYCLE_RUNNER_RUNNERHANDLE_HPP
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

namespace AppLifecycle
{
  class LifecycleRunner;

  /// @brief The view of a running LifecycleRunner handed to signal handlers.
  ///
  /// One handle exists per Run() invocation and is destroyed when Run() returns.
  class RunnerHandle
  {
    LifecycleRunner& m_runner;

  public:
    explicit RunnerHandle(LifecycleRunner& runner) noexcept
      : m_runner(runner)
    {
    }

    RunnerHandle(const RunnerHandle&) = delete;
    RunnerHandle& operator=(const RunnerHandle&) = delete;
    RunnerHandle(RunnerHandle&&) = delete;
    RunnerHandle& operator=(RunnerHandle&&) = delete;

    /// @brief Starts the graceful shutdown of the run. Same as LifecycleRunner::Stop().
    void RequestStop() noexcept;
  };
}

#endif
