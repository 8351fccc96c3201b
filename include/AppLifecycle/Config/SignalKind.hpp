#ifndef APP_LIFECYCLE_CONFIG_SIGNALKIND_HPP
#define APP_LIFECYCLE_CONFIG_SIGNALKIND_HPP
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

#include <optional>
#include <string_view>

namespace AppLifecycle
{
  /// @brief The OS notifications the runner can listen for.
  enum class SignalKind
  {
    /// @brief SIGINT
    Interrupt = 0,

    /// @brief SIGQUIT
    Quit = 1,

    /// @brief SIGTERM
    Terminate = 2,

    /// @brief SIGHUP
    Hangup = 3,

    /// @brief SIGUSR1
    User1 = 4,

    /// @brief SIGUSR2
    User2 = 5
  };

  /// @brief The native signal number for the kind.
  [[nodiscard]] int ToNativeSignal(SignalKind kind);

  /// @brief Maps a native signal number back to its kind, or nullopt if the number is not a known kind.
  [[nodiscard]] std::optional<SignalKind> TryFromNativeSignal(int signalNumber) noexcept;

  /// @brief The conventional name, for example "SIGTERM".
  [[nodiscard]] std::string_view ToString(SignalKind kind) noexcept;

  /// @brief True for the kinds that request a shutdown by convention (Interrupt, Quit and Terminate).
  [[nodiscard]] constexpr bool IsTerminationSignal(SignalKind kind) noexcept
  {
    return kind == SignalKind::Interrupt || kind == SignalKind::Quit || kind == SignalKind::Terminate;
  }
}

#endif
