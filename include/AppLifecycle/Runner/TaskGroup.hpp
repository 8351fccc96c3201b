#ifndef APP_LIFECYCLE_RUNNER_TASKGROUP_HPP
#define APP_LIFECYCLE_RUNNER_TASKGROUP_HPP
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

#include <AppLifecycle/Context/Context.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <exception>
#include <string>
#include <vector>

namespace AppLifecycle
{
  /// @brief Spawns coroutines on one executor and records how they fail.
  ///
  /// The first failure cancels the group's context with that failure as the cause, which is how one
  /// failing task starts the shutdown of all the others. Later failures are recorded as well; a failure
  /// that is the same exception object as an already recorded one (a task rethrowing the context's
  /// cause) is not recorded twice.
  ///
  /// The group must outlive every task it spawned, so it is normally joined by running the executor's
  /// io_context to completion before it goes out of scope. All methods must be called on the executor.
  class TaskGroup
  {
    boost::asio::any_io_executor m_executor;
    Context m_context;
    std::vector<std::exception_ptr> m_errors;
    std::size_t m_pendingCount{0};

  public:
    TaskGroup(boost::asio::any_io_executor executor, Context context);

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    TaskGroup(TaskGroup&&) = delete;
    TaskGroup& operator=(TaskGroup&&) = delete;

    /// @brief Schedules the task. It starts running once the executor gets to it.
    /// @param name Used in log messages.
    void Spawn(std::string name, boost::asio::awaitable<void> task);

    [[nodiscard]] const Context& GetContext() const noexcept
    {
      return m_context;
    }

    /// @brief Number of spawned tasks that have not completed.
    [[nodiscard]] std::size_t GetPendingCount() const noexcept
    {
      return m_pendingCount;
    }

    /// @brief All distinct failures in the order they were observed.
    [[nodiscard]] const std::vector<std::exception_ptr>& GetErrors() const noexcept
    {
      return m_errors;
    }

    /// @brief The failure that cancelled the context, or null.
    [[nodiscard]] std::exception_ptr GetFirstError() const noexcept
    {
      return m_errors.empty() ? nullptr : m_errors.front();
    }

  private:
    void OnTaskCompleted(const std::string& name, std::exception_ptr error);
  };
}

#endif
