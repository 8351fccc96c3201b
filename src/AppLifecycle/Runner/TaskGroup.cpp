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

#include <AppLifecycle/Runner/TaskGroup.hpp>
#include <Common/AggregateException.hpp>
#include <Common/LogHelper.hpp>
#include <boost/asio/co_spawn.hpp>
#include <algorithm>
#include <utility>

namespace AppLifecycle
{
  namespace
  {
    APP_LIFECYCLE_LOGGER_NAME(TaskGroup);
  }

  TaskGroup::TaskGroup(boost::asio::any_io_executor executor, Context context)
    : m_executor(std::move(executor))
    , m_context(std::move(context))
  {
  }

  void TaskGroup::Spawn(std::string name, boost::asio::awaitable<void> task)
  {
    ++m_pendingCount;
    boost::asio::co_spawn(m_executor, std::move(task),
                          [this, name = std::move(name)](std::exception_ptr error) { OnTaskCompleted(name, std::move(error)); });
  }

  void TaskGroup::OnTaskCompleted(const std::string& name, std::exception_ptr error)
  {
    --m_pendingCount;

    auto logger = Common::LogHelper::GetLogger<LoggerName_TaskGroup>();
    if (!error)
    {
      logger->trace("TaskGroup: '{}' completed ({} pending)", name, m_pendingCount);
      return;
    }

    if (std::find(m_errors.begin(), m_errors.end(), error) != m_errors.end())
    {
      logger->debug("TaskGroup: '{}' reported the group's cancellation cause ({} pending)", name, m_pendingCount);
      return;
    }

    m_errors.push_back(error);
    if (m_errors.size() == 1)
    {
      logger->error("TaskGroup: '{}' failed, cancelling the group: {}", name, Common::AggregateException::Describe(error));
      m_context.Cancel(std::move(error));
    }
    else
    {
      logger->warn("TaskGroup: '{}' also failed: {}", name, Common::AggregateException::Describe(error));
    }
  }
}
