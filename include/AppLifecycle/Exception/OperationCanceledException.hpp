#ifndef APP_LIFECYCLE_EXCEPTION_OPERATIONCANCELEDEXCEPTION_HPP
#define APP_LIFECYCLE_EXCEPTION_OPERATIONCANCELEDEXCEPTION_HPP
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

#include <stdexcept>
#include <string>

namespace AppLifecycle
{
  /// @brief Reported by a Context that was cancelled without a more specific cause.
  ///
  /// LifecycleRunner::Stop() cancels the root context with this exception, so it is also what a run
  /// with a signal listener reports after a requested stop.
  class OperationCanceledException : public std::runtime_error
  {
  public:
    OperationCanceledException()
      : std::runtime_error("Operation canceled")
    {
    }

    explicit OperationCanceledException(const std::string& message)
      : std::runtime_error(message)
    {
    }
  };
}

#endif
