#ifndef APP_LIFECYCLE_HOOK_HOOKREGISTRY_HPP
#define APP_LIFECYCLE_HOOK_HOOKREGISTRY_HPP
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

#include <AppLifecycle/Hook/Hook.hpp>
#include <AppLifecycle/Hook/ILifecycleComponent.hpp>
#include <memory>
#include <string>
#include <vector>

namespace AppLifecycle
{
  /// @brief Append-only, ordered collection of lifecycle hooks.
  ///
  /// Registration order is preserved but implies no execution order: the runner starts every hook
  /// concurrently and stops every hook concurrently. The registry is filled once and then moved into
  /// a LifecycleRunner, which only reads it.
  class HookRegistry
  {
    std::vector<Hook> m_hooks;

  public:
    HookRegistry() = default;

    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;
    HookRegistry(HookRegistry&&) noexcept = default;
    HookRegistry& operator=(HookRegistry&&) noexcept = default;

    /// @brief Appends a hook. Any combination of present and absent callbacks is accepted.
    /// @throws std::invalid_argument if a phase has both an awaitable and a blocking callback.
    void Register(Hook hook);

    /// @brief Wraps component->StartAsync / component->StopAsync into a hook and appends it.
    ///
    /// The hook shares ownership of the component.
    ///
    /// @param component The component to manage.
    /// @param name Optional diagnostic name.
    /// @throws InvalidComponentException if component is null.
    void Register(std::shared_ptr<ILifecycleComponent> component, std::string name = {});

    [[nodiscard]] const std::vector<Hook>& GetHooks() const noexcept
    {
      return m_hooks;
    }

    [[nodiscard]] std::size_t Size() const noexcept
    {
      return m_hooks.size();
    }

    [[nodiscard]] bool Empty() const noexcept
    {
      return m_hooks.empty();
    }
  };
}

#endif
