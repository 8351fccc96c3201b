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

#include <AppLifecycle/Config/SignalKind.hpp>
#include <csignal>
#include <stdexcept>

namespace AppLifecycle
{
  int ToNativeSignal(const SignalKind kind)
  {
    switch (kind)
    {
    case SignalKind::Interrupt:
      return SIGINT;
    case SignalKind::Quit:
      return SIGQUIT;
    case SignalKind::Terminate:
      return SIGTERM;
    case SignalKind::Hangup:
      return SIGHUP;
    case SignalKind::User1:
      return SIGUSR1;
    case SignalKind::User2:
      return SIGUSR2;
    default:
      throw std::invalid_argument("Unknown SignalKind");
    }
  }

  std::optional<SignalKind> TryFromNativeSignal(const int signalNumber) noexcept
  {
    switch (signalNumber)
    {
    case SIGINT:
      return SignalKind::Interrupt;
    case SIGQUIT:
      return SignalKind::Quit;
    case SIGTERM:
      return SignalKind::Terminate;
    case SIGHUP:
      return SignalKind::Hangup;
    case SIGUSR1:
      return SignalKind::User1;
    case SIGUSR2:
      return SignalKind::User2;
    default:
      return std::nullopt;
    }
  }

  std::string_view ToString(const SignalKind kind) noexcept
  {
    switch (kind)
    {
    case SignalKind::Interrupt:
      return "SIGINT";
    case SignalKind::Quit:
      return "SIGQUIT";
    case SignalKind::Terminate:
      return "SIGTERM";
    case SignalKind::Hangup:
      return "SIGHUP";
    case SignalKind::User1:
      return "SIGUSR1";
    case SignalKind::User2:
      return "SIGUSR2";
    default:
      return "UNKNOWN";
    }
  }
}
