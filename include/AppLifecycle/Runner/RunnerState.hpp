#ifndef APP_LIFECYCLE_RUNNER_RUNNERSTATE_HPP
#define APP_LIFECYCLE_RUNNER_RUNNERSTATE_HPP
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
  /// @brief Phase of a LifecycleRunner.
  enum class RunnerState
  {
    /// @brief Run() has not been called yet.
    Idle = 0,

    /// @brief All tasks are spawned and the runner waits for a shutdown trigger.
    Running = 1,

    /// @brief The root context was cancelled; stop callbacks are executing.
    ShuttingDown = 2,

    /// @brief Every task has finished and Run() has returned (or is about to).
    Terminated = 3
  };
}

#endif
