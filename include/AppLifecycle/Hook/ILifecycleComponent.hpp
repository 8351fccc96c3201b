#ifndef APP_LIFECYCLE_HOOK_ILIFECYCLECOMPONENT_HPP
#define APP_LIFECYCLE_HOOK_ILIFECYCLECOMPONENT_HPP
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
#include <boost/asio/awaitable.hpp>

namespace AppLifecycle
{
  /// @brief A component that can be started and stopped by the LifecycleRunner.
  ///
  /// Both operations fail by throwing. The context carries the operation's deadline; implementations are
  /// expected to await it cooperatively and give up (typically via Context::ThrowIfDone) once it is done.
  class ILifecycleComponent
  {
  public:
    virtual ~ILifecycleComponent() = default;

    virtual boost::asio::awaitable<void> StartAsync(Context context) = 0;
    virtual boost::asio::awaitable<void> StopAsync(Context context) = 0;
  };
}

#endif
