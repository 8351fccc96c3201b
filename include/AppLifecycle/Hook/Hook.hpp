#ifndef APP_LIFECYCLE_HOOK_HOOK_HPP
#define APP_LIFECYCLE_HOOK_HOOK_HPP
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
#include <AppLifecycle/Context/Context.hpp>
#include <boost/asio/awaitable.hpp>
#include <functional>
#include <string>

namespace AppLifecycle
{
  /// @brief A start or stop callback. Failure is reported by throwing from the coroutine.
  using HookCallback = std::function<boost::asio::awaitable<void>(Context)>;

  /// @brief A start or stop callback that does synchronous work. Runs on a dedicated pool thread, never on the runner's event loop.
  using BlockingHookCallback = std::function<void(const BlockingCallContext&)>;

  /// @brief A pair of optional start and stop callbacks representing one managed component.
  ///
  /// An empty callback is treated as absent and no task is spawned for it. Each phase takes either the
  /// awaitable callback or the blocking one, never both. A blocking start callback may block until the
  /// matching stop callback tells it to return.
  struct Hook
  {
    /// @brief Diagnostic name. HookRegistry assigns "hook#<index>" when left empty.
    std::string Name;
    HookCallback OnStart;
    HookCallback OnStop;
    BlockingHookCallback OnStartBlocking;
    BlockingHookCallback OnStopBlocking;
  };
}

#endif
