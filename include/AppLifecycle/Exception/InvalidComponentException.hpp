#ifndef APP_LIFECYCLE_EXCEPTION_INVALIDCOMPONENTEXCEPTION_HPP
#define APP_LIFECYCLE_EXCEPTION_INVALIDCOMPONENTEXCEPTION_HPP
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
#include <string>
#include <string_view>

namespace AppLifecycle
{
  /// @brief Thrown when a null lifecycle component is registered.
  class InvalidComponentException : public std::runtime_error
  {
  public:
    explicit InvalidComponentException(std::string_view hookName)
      : std::runtime_error(hookName.empty() ? std::string("Cannot register a null lifecycle component")
                                            : fmt::format("Cannot register a null lifecycle component as '{}'", hookName))
    {
    }
  };
}

#endif
