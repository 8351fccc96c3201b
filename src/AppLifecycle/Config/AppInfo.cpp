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

#include <AppLifecycle/Config/AppInfo.hpp>
#include <cstdlib>

namespace AppLifecycle
{
  namespace
  {
    std::string ReadVariable(std::string_view name)
    {
      const char* value = std::getenv(std::string(name).c_str());
      return value != nullptr ? std::string(value) : std::string();
    }

    std::string_view Trim(std::string_view value)
    {
      constexpr std::string_view whitespace = " \t\r\n";
      const auto first = value.find_first_not_of(whitespace);
      if (first == std::string_view::npos)
      {
        return {};
      }
      const auto last = value.find_last_not_of(whitespace);
      return value.substr(first, last - first + 1);
    }
  }

  AppInfo AppInfo::FromEnvironment()
  {
    AppInfo info;
    info.Id = ReadVariable(IdVariable);
    info.Name = ReadVariable(NameVariable);
    info.Version = ReadVariable(VersionVariable);
    info.Endpoints = ParseEndpoints(ReadVariable(EndpointsVariable));
    return info;
  }

  std::vector<std::string> AppInfo::ParseEndpoints(std::string_view value)
  {
    std::vector<std::string> endpoints;
    while (!value.empty())
    {
      const auto separator = value.find(',');
      const auto entry = Trim(value.substr(0, separator));
      if (!entry.empty())
      {
        endpoints.emplace_back(entry);
      }
      if (separator == std::string_view::npos)
      {
        break;
      }
      value.remove_prefix(separator + 1);
    }
    return endpoints;
  }
}
