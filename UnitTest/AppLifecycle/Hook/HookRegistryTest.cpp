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
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

using namespace AppLifecycle;

namespace
{
  class CountingComponent : public ILifecycleComponent
  {
  public:
    int StartCount{0};
    int StopCount{0};

    boost::asio::awaitable<void> StartAsync(Context /*context*/) override
    {
      ++StartCount;
      co_return;
    }

    boost::asio::awaitable<void> StopAsync(Context /*context*/) override
    {
      ++StopCount;
      co_return;
    }
  };

  boost::asio::awaitable<void> Noop(Context /*context*/)
  {
    co_return;
  }

  void BlockingNoop(const BlockingCallContext& /*context*/)
  {
  }
}

TEST(HookRegistryTest, StartsEmpty)
{
  HookRegistry registry;
  EXPECT_TRUE(registry.Empty());
  EXPECT_EQ(registry.Size(), 0u);
}

TEST(HookRegistryTest, PreservesRegistrationOrder)
{
  HookRegistry registry;
  registry.Register(Hook{"database", Noop, Noop});
  registry.Register(Hook{"http", Noop, {}});
  registry.Register(Hook{"metrics", {}, Noop});

  ASSERT_EQ(registry.Size(), 3u);
  EXPECT_EQ(registry.GetHooks()[0].Name, "database");
  EXPECT_EQ(registry.GetHooks()[1].Name, "http");
  EXPECT_EQ(registry.GetHooks()[2].Name, "metrics");
}

TEST(HookRegistryTest, AcceptsAbsentCallbacks)
{
  HookRegistry registry;
  registry.Register(Hook{"start-only", Noop, {}});
  registry.Register(Hook{"stop-only", {}, Noop});
  registry.Register(Hook{"neither", {}, {}});

  ASSERT_EQ(registry.Size(), 3u);
  EXPECT_TRUE(registry.GetHooks()[0].OnStart);
  EXPECT_FALSE(registry.GetHooks()[0].OnStop);
  EXPECT_FALSE(registry.GetHooks()[1].OnStart);
  EXPECT_TRUE(registry.GetHooks()[1].OnStop);
  EXPECT_FALSE(registry.GetHooks()[2].OnStart);
  EXPECT_FALSE(registry.GetHooks()[2].OnStop);
}

TEST(HookRegistryTest, AssignsIndexBasedDefaultNames)
{
  HookRegistry registry;
  registry.Register(Hook{"", Noop, Noop});
  registry.Register(Hook{"named", Noop, Noop});
  registry.Register(std::make_shared<CountingComponent>());

  EXPECT_EQ(registry.GetHooks()[0].Name, "hook#0");
  EXPECT_EQ(registry.GetHooks()[1].Name, "named");
  EXPECT_EQ(registry.GetHooks()[2].Name, "hook#2");
}

TEST(HookRegistryTest, ComponentIsWrappedIntoBothCallbacks)
{
  auto component = std::make_shared<CountingComponent>();
  HookRegistry registry;
  registry.Register(component, "counting");

  ASSERT_EQ(registry.Size(), 1u);
  const Hook& hook = registry.GetHooks().front();
  EXPECT_EQ(hook.Name, "counting");
  ASSERT_TRUE(hook.OnStart);
  ASSERT_TRUE(hook.OnStop);

  boost::asio::io_context ioContext;
  const Context context = Context::Background(ioContext.get_executor());
  boost::asio::co_spawn(ioContext, hook.OnStart(context), boost::asio::detached);
  boost::asio::co_spawn(ioContext, hook.OnStop(context), boost::asio::detached);
  ioContext.run();

  EXPECT_EQ(component->StartCount, 1);
  EXPECT_EQ(component->StopCount, 1);
}

TEST(HookRegistryTest, HookKeepsTheComponentAlive)
{
  auto component = std::make_shared<CountingComponent>();
  std::weak_ptr<CountingComponent> observer = component;

  HookRegistry registry;
  registry.Register(std::move(component));
  EXPECT_FALSE(observer.expired());

  registry = HookRegistry();
  EXPECT_TRUE(observer.expired());
}

TEST(HookRegistryTest, NullComponentThrows)
{
  HookRegistry registry;
  EXPECT_THROW(registry.Register(std::shared_ptr<ILifecycleComponent>(), "broken"), InvalidComponentException);
  EXPECT_TRUE(registry.Empty());
}

TEST(HookRegistryTest, MovedRegistryKeepsHooks)
{
  HookRegistry source;
  source.Register(Hook{"a", Noop, Noop});

  HookRegistry target(std::move(source));
  ASSERT_EQ(target.Size(), 1u);
  EXPECT_EQ(target.GetHooks().front().Name, "a");
}

TEST(HookRegistryTest, AcceptsBlockingCallbacks)
{
  HookRegistry registry;
  Hook hook;
  hook.Name = "listener";
  hook.OnStartBlocking = BlockingNoop;
  hook.OnStop = Noop;
  registry.Register(std::move(hook));

  ASSERT_EQ(registry.Size(), 1u);
  EXPECT_FALSE(registry.GetHooks()[0].OnStart);
  EXPECT_TRUE(registry.GetHooks()[0].OnStartBlocking);
  EXPECT_TRUE(registry.GetHooks()[0].OnStop);
  EXPECT_FALSE(registry.GetHooks()[0].OnStopBlocking);
}

TEST(HookRegistryTest, MixedCallbackKindsForOnePhaseThrow)
{
  HookRegistry registry;
  Hook start;
  start.OnStart = Noop;
  start.OnStartBlocking = BlockingNoop;
  EXPECT_THROW(registry.Register(std::move(start)), std::invalid_argument);

  Hook stop;
  stop.OnStop = Noop;
  stop.OnStopBlocking = BlockingNoop;
  EXPECT_THROW(registry.Register(std::move(stop)), std::invalid_argument);

  EXPECT_TRUE(registry.Empty());
}
