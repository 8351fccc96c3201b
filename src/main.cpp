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

#include <AppLifecycle/Exception/OperationCanceledException.hpp>
#include <AppLifecycle/Runner/LifecycleRunner.hpp>
#include <Common/AggregateException.hpp>
#include <Common/LogHelper.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/version.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <memory>

namespace
{
  using namespace std::chrono_literals;

  boost::asio::awaitable<void> DelayAsync(const AppLifecycle::Context& context, const std::chrono::milliseconds duration)
  {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, duration);
    co_await timer.async_wait(boost::asio::use_awaitable);
    context.ThrowIfDone();
  }

  // Pretends to open and drain a connection pool.
  class ConnectionPoolComponent : public AppLifecycle::ILifecycleComponent
  {
  public:
    boost::asio::awaitable<void> StartAsync(AppLifecycle::Context context) override
    {
      spdlog::info("ConnectionPool: connecting");
      co_await DelayAsync(context, 50ms);
      spdlog::info("ConnectionPool: ready");
    }

    boost::asio::awaitable<void> StopAsync(AppLifecycle::Context context) override
    {
      spdlog::info("ConnectionPool: draining");
      co_await DelayAsync(context, 100ms);
      spdlog::info("ConnectionPool: closed");
    }
  };
}


int main()
{
  Common::LogHelper::ConfigureFromEnvironment();
  try
  {
    AppLifecycle::RunnerOptions options = AppLifecycle::RunnerOptions::FromEnvironment();

    AppLifecycle::HookRegistry registry;
    registry.Register(std::make_shared<ConnectionPoolComponent>(), "connection-pool");
    registry.Register(AppLifecycle::Hook{"banner",
                                         [](AppLifecycle::Context) -> boost::asio::awaitable<void>
                                         {
                                           spdlog::info("Using Boost version: {}.{}.{}", BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000,
                                                        BOOST_VERSION % 100);
                                           spdlog::info("Press Ctrl+C to stop");
                                           co_return;
                                         },
                                         [](AppLifecycle::Context) -> boost::asio::awaitable<void>
                                         {
                                           spdlog::info("Goodbye");
                                           co_return;
                                         }});

    AppLifecycle::LifecycleRunner runner(std::move(options), std::move(registry));
    runner.Run();
  }
  catch (const AppLifecycle::OperationCanceledException& ex)
  {
    // A signal or Stop() ended the run.
    spdlog::info("Stopped: {}", ex.what());
  }
  catch (const Common::AggregateException& ex)
  {
    spdlog::error("{}", ex.ToString());
    return 1;
  }
  catch (const std::exception& ex)
  {
    spdlog::error("Failed: {}", ex.what());
    return 1;
  }
  return 0;
}
