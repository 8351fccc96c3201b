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

#include <Common/LogHelper.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace
{
  APP_LIFECYCLE_LOGGER_NAME(LogHelperTestCached);
}

TEST(LogHelperTest, ReturnsTheRegisteredLogger)
{
  const auto first = Common::LogHelper::GetLogger(std::string("LogHelperTest.Registered"));
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->name(), "LogHelperTest.Registered");
  EXPECT_EQ(spdlog::get("LogHelperTest.Registered"), first);
  EXPECT_EQ(Common::LogHelper::GetLogger(std::string("LogHelperTest.Registered")), first);
}

TEST(LogHelperTest, ConcurrentCallersShareOneLogger)
{
  const std::string name = "LogHelperTest.Concurrent";
  constexpr std::size_t ThreadCount = 8;
  std::vector<std::shared_ptr<spdlog::logger>> loggers(ThreadCount);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < ThreadCount; ++i)
  {
    threads.emplace_back([&loggers, &name, i]() { loggers[i] = Common::LogHelper::GetLogger(name); });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  const auto registered = spdlog::get(name);
  ASSERT_NE(registered, nullptr);
  for (const auto& logger : loggers)
  {
    EXPECT_EQ(logger, registered);
  }
}

TEST(LogHelperTest, CompileTimeNameIsCached)
{
  const auto logger = Common::LogHelper::GetLogger<LoggerName_LogHelperTestCached>();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "LogHelperTestCached");
  EXPECT_EQ(Common::LogHelper::GetLogger<LoggerName_LogHelperTestCached>(), logger);
}
