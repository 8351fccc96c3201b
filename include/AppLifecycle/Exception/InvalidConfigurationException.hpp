#ifndef APP_LIFECYCLE_EXCEPTION_INVALIDCONFIGURATIONEXCEPTION_HPP
#define APP_LIFECYCLE_EXCEPTION_INVALIDCONFIGURATIONEXCEPTION_HPP
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

#include <fmt/format.h>
#include <stdexcept>
#include <string_view>

namespace AppLifecycle
{
  /// @brief Thrown when an environment variable holds a value that cannot be used.
  class InvalidConfigurationException : public std::runtime_error
  {
  public:
    InvalidConfigurationException(std::string_view variableName, std::string_view value, std::string_view expected)
      : std::runtime_error(fmt::format("Invalid value '{}' for {}: expected {}", value, variableName, expected))
    {
    }
  };
}

#endif
