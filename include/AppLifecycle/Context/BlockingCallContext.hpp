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

#ifndef APP_LIFECYCLE_CONTEXT_BLOCKINGCALLCONTEXT_HPP
#define APP_LIFECYCLE_CONTEXT_BLOCKINGCALLCONTEXT_HPP

#include <AppLifecycle/Context/Context.hpp>
#include <optional>

namespace AppLifecycle
{
  /// @brief What a blocking callback knows about its Context: the deadline, captured when the call started.
  ///
  /// Blocking callbacks run on a pool thread and must not touch the Context itself. This snapshot is
  /// immutable and safe to read from any thread. Cancellation is not visible through it; a blocking
  /// start callback learns about shutdown from its own stop callback.
  class BlockingCallContext
  {
    std::optional<Context::Clock::time_point> m_deadline;

  public:
    explicit BlockingCallContext(std::optional<Context::Clock::time_point> deadline) noexcept;

    [[nodiscard]] std::optional<Context::Clock::time_point> GetDeadline() const noexcept
    {
      return m_deadline;
    }

    /// @brief True once the captured deadline has passed.
    [[nodiscard]] bool IsExpired() const noexcept;

    /// @brief Throws DeadlineExceededException if the captured deadline has passed.
    void ThrowIfExpired() const;
  };
}

#endif
