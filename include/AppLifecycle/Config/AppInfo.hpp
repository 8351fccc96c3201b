#ifndef APP_LIFECYCLE_CONFIG_APPINFO_HPP
#define APP_LIFECYCLE_CONFIG_APPINFO_HPP
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

#include <string>
#include <string_view>
#include <vector>

namespace AppLifecycle
{
  /// @brief Identity of the running service. The runner only logs it.
  struct AppInfo
  {
    std::string Id;
    std::string Name;
    std::string Version;
    std::vector<std::string> Endpoints;

    static constexpr std::string_view IdVariable = "APP_SERVICE_ID";
    static constexpr std::string_view NameVariable = "APP_SERVICE_NAME";
    static constexpr std::string_view VersionVariable = "APP_SERVICE_VERSION";
    static constexpr std::string_view EndpointsVariable = "APP_SERVICE_ENDPOINTS";

    /// @brief Reads the APP_SERVICE_* variables. Missing variables leave the field empty.
    ///
    /// APP_SERVICE_ENDPOINTS is a comma separated list; whitespace around entries and empty entries are dropped.
    static AppInfo FromEnvironment();

    /// @brief Splits a comma separated endpoint list as FromEnvironment does.
    static std::vector<std::string> ParseEndpoints(std::string_view value);

    bool operator==(const AppInfo& other) const = default;
  };
}

#endif
