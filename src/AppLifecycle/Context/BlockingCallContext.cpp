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

#include <AppLifecycle/Context/BlockingCallContext.hpp>
#include <AppLifecycle/Exception/DeadlineExceededException.hpp>

namespace AppLifecycle
{
  BlockingCallContext::BlockingCallContext(std::optional<Context::Clock::time_point> deadline) noexcept
    : m_deadline(deadline)
  {
  }


  bool BlockingCallContext::IsExpired() const noexcept
  {
    return m_deadline.has_value() && Context::Clock::now() >= *m_deadline;
  }


  void BlockingCallContext::ThrowIfExpired() const
  {
    if (IsExpired())
    {
      throw DeadlineExceededException();
    }
  }
}
