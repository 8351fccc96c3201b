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
#include <AppLifecycle/Exception/DeadlineExceededException.hpp>
#include <AppLifecycle/Exception/OperationCanceledException.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <algorithm>
#include <utility>
#include <vector>

namespace AppLifecycle::Detail
{
  struct ContextState
  {
    boost::asio::any_io_executor Executor;
    std::optional<Context::Clock::time_point> Deadline;

    /// @brief Waiters park on this timer. It expires at the deadline and is cancelled on completion.
    boost::asio::steady_timer Timer;

    std::exception_ptr Error;
    std::vector<std::weak_ptr<ContextState>> Children;

    ContextState(boost::asio::any_io_executor executor, std::optional<Context::Clock::time_point> deadline)
      : Executor(std::move(executor))
      , Deadline(deadline)
      , Timer(Executor, deadline.value_or(Context::Clock::time_point::max()))
    {
    }

    ContextState(const ContextState&) = delete;
    ContextState& operator=(const ContextState&) = delete;

    /// @brief Latches the deadline error once the deadline has passed.
    /// @return true if the context is done.
    bool Refresh()
    {
      if (!Error && Deadline.has_value() && Context::Clock::now() >= *Deadline)
      {
        Error = std::make_exception_ptr(DeadlineExceededException());
        Release();
      }
      return static_cast<bool>(Error);
    }

    void Complete(std::exception_ptr cause)
    {
      if (Refresh())
      {
        return;
      }
      Error = std::move(cause);
      Release();
    }

    void AddChild(const std::shared_ptr<ContextState>& child)
    {
      std::erase_if(Children, [](const std::weak_ptr<ContextState>& entry) { return entry.expired(); });
      Children.push_back(child);
    }

  private:
    void Release()
    {
      Timer.cancel();

      auto children = std::move(Children);
      Children.clear();
      for (const auto& weakChild : children)
      {
        if (auto child = weakChild.lock())
        {
          child->Complete(Error);
        }
      }
    }
  };
}

namespace AppLifecycle
{
  namespace
  {
    Context::Clock::time_point SaturatingAdd(Context::Clock::time_point now, Context::Clock::duration timeout)
    {
      if (timeout <= Context::Clock::duration::zero())
      {
        return now;
      }
      if (timeout > Context::Clock::time_point::max() - now)
      {
        return Context::Clock::time_point::max();
      }
      return now + timeout;
    }

    std::shared_ptr<Detail::ContextState> AttachChild(Detail::ContextState& parent, std::optional<Context::Clock::time_point> deadline)
    {
      auto child = std::make_shared<Detail::ContextState>(parent.Executor, deadline);
      if (parent.Refresh())
      {
        child->Complete(parent.Error);
      }
      else
      {
        parent.AddChild(child);
      }
      return child;
    }

    boost::asio::awaitable<void> WaitUntilDoneAsync(std::shared_ptr<Detail::ContextState> state)
    {
      while (!state->Refresh())
      {
        // Wakes on expiry or on Timer.cancel() from Complete(); either way the loop re-checks the state.
        boost::system::error_code ignored;
        co_await state->Timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ignored));
      }
    }
  }

  Context::Context(std::shared_ptr<Detail::ContextState> state) noexcept
    : m_state(std::move(state))
  {
  }

  Context Context::Background(const boost::asio::any_io_executor& executor)
  {
    return Context(std::make_shared<Detail::ContextState>(executor, std::nullopt));
  }

  Context Context::WithCancel(const Context& parent)
  {
    return Context(AttachChild(*parent.m_state, parent.m_state->Deadline));
  }

  Context Context::WithDeadline(const Context& parent, Clock::time_point deadline)
  {
    const auto& parentDeadline = parent.m_state->Deadline;
    if (parentDeadline.has_value() && *parentDeadline < deadline)
    {
      deadline = *parentDeadline;
    }
    return Context(AttachChild(*parent.m_state, deadline));
  }

  Context Context::WithTimeout(const Context& parent, Clock::duration timeout)
  {
    return WithDeadline(parent, SaturatingAdd(Clock::now(), timeout));
  }

  const boost::asio::any_io_executor& Context::GetExecutor() const noexcept
  {
    return m_state->Executor;
  }

  std::optional<Context::Clock::time_point> Context::GetDeadline() const noexcept
  {
    return m_state->Deadline;
  }

  bool Context::IsDone() const
  {
    return m_state->Refresh();
  }

  std::exception_ptr Context::GetError() const
  {
    m_state->Refresh();
    return m_state->Error;
  }

  void Context::ThrowIfDone() const
  {
    if (auto error = GetError())
    {
      std::rethrow_exception(error);
    }
  }

  void Context::Cancel()
  {
    m_state->Complete(std::make_exception_ptr(OperationCanceledException()));
  }

  void Context::Cancel(std::exception_ptr cause)
  {
    if (!cause)
    {
      Cancel();
      return;
    }
    m_state->Complete(std::move(cause));
  }

  boost::asio::awaitable<void> Context::Done() const
  {
    return WaitUntilDoneAsync(m_state);
  }
}
