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

#include <AppLifecycle/Exception/InvalidComponentException.hpp>
#include <AppLifecycle/Hook/HookRegistry.hpp>
#include <Common/LogHelper.hpp>
#include <fmt/format.h>
#include <stdexcept>

namespace AppLifecycle
{
  namespace
  {
    APP_LIFECYCLE_LOGGER_NAME(HookRegistry);
  }

  void HookRegistry::Register(Hook hook)
  {
    if (hook.Name.empty())
    {
      hook.Name = fmt::format("hook#{}", m_hooks.size());
    }

    if ((hook.OnStart && hook.OnStartBlocking) || (hook.OnStop && hook.OnStopBlocking))
    {
      Common::LogHelper::GetLogger<LoggerName_HookRegistry>()->error("HookRegistry::Register: '{}' mixes callback kinds", hook.Name);
      throw std::invalid_argument(fmt::format("Hook '{}' has both an awaitable and a blocking callback for the same phase", hook.Name));
    }

    Common::LogHelper::GetLogger<LoggerName_HookRegistry>()->debug(
      "HookRegistry::Register: '{}' (start: {}, stop: {}, blocking start: {}, blocking stop: {})", hook.Name, static_cast<bool>(hook.OnStart),
      static_cast<bool>(hook.OnStop), static_cast<bool>(hook.OnStartBlocking), static_cast<bool>(hook.OnStopBlocking));
    m_hooks.push_back(std::move(hook));
  }

  void HookRegistry::Register(std::shared_ptr<ILifecycleComponent> component, std::string name)
  {
    if (!component)
    {
      Common::LogHelper::GetLogger<LoggerName_HookRegistry>()->error("HookRegistry::Register: component is null");
      throw InvalidComponentException(name);
    }

    Hook hook;
    hook.Name = std::move(name);
    hook.OnStart = [component](Context context) { return component->StartAsync(std::move(context)); };
    hook.OnStop = [component](Context context) { return component->StopAsync(std::move(context)); };
    Register(std::move(hook));
  }
}
