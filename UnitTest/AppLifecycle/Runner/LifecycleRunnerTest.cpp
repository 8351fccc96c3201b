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

#include <AppLifecycle/Exception/DeadlineExceededException.hpp>
#include <AppLifecycle/Exception/OperationCanceledException.hpp>
#include <AppLifecycle/Runner/LifecycleRunner.hpp>
#include <AppLifecycle/Runner/RunnerHandle.hpp>
#include <Common/AggregateException.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace AppLifecycle;
using namespace std::chrono_literals;

namespace
{
  class StartFailedException : public std::runtime_error
  {
  public:
    explicit StartFailedException(const std::string& msg)
      : std::runtime_error(msg)
    {
    }
  };

  struct CallRecord
  {
    int Starts{0};
    int Stops{0};
  };

  class RecordingComponent : public ILifecycleComponent
  {
    CallRecord& m_record;

  public:
    explicit RecordingComponent(CallRecord& record)
      : m_record(record)
    {
    }

    boost::asio::awaitable<void> StartAsync(Context /*context*/) override
    {
      ++m_record.Starts;
      co_return;
    }

    boost::asio::awaitable<void> StopAsync(Context /*context*/) override
    {
      ++m_record.Stops;
      co_return;
    }
  };

  boost::asio::awaitable<void> SleepAsync(const std::chrono::milliseconds duration)
  {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor, duration);
    co_await timer.async_wait(boost::asio::use_awaitable);
  }

  Hook RecordingHook(std::string name, CallRecord& record)
  {
    return Hook{std::move(name),
                [&record](Context) -> boost::asio::awaitable<void>
                {
                  ++record.Starts;
                  co_return;
                },
                [&record](Context) -> boost::asio::awaitable<void>
                {
                  ++record.Stops;
                  co_return;
                }};
  }

  RunnerOptions WithoutSignals()
  {
    RunnerOptions options;
    options.Signals.clear();
    return options;
  }

  bool WaitForState(const LifecycleRunner& runner, const RunnerState state, const std::chrono::milliseconds timeout = 5s)
  {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (runner.GetState() != state)
    {
      if (std::chrono::steady_clock::now() > deadline)
      {
        return false;
      }
      std::this_thread::sleep_for(1ms);
    }
    return true;
  }

  std::future<void> RunInBackground(LifecycleRunner& runner)
  {
    return std::async(std::launch::async, [&runner]() { runner.Run(); });
  }
}

TEST(LifecycleRunnerTest, CleanRunReturnsNormallyAfterStop)
{
  CallRecord hookRecord;
  CallRecord componentRecord;
  HookRegistry registry;
  registry.Register(RecordingHook("hook", hookRecord));
  registry.Register(std::make_shared<RecordingComponent>(componentRecord), "component");

  LifecycleRunner runner(WithoutSignals(), std::move(registry));
  EXPECT_EQ(runner.GetState(), RunnerState::Idle);

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  runner.Stop();

  EXPECT_NO_THROW(result.get());
  EXPECT_EQ(hookRecord.Starts, 1);
  EXPECT_EQ(hookRecord.Stops, 1);
  EXPECT_EQ(componentRecord.Starts, 1);
  EXPECT_EQ(componentRecord.Stops, 1);
  EXPECT_EQ(runner.GetState(), RunnerState::Terminated);
}

TEST(LifecycleRunnerTest, StopWithSignalListenerReportsCancellation)
{
  CallRecord record;
  HookRegistry registry;
  registry.Register(RecordingHook("hook", record));

  RunnerOptions options;
  options.Signals = {SignalKind::User1};
  LifecycleRunner runner(std::move(options), std::move(registry));

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  runner.Stop();

  EXPECT_THROW(result.get(), OperationCanceledException);
  EXPECT_EQ(record.Stops, 1);
}

TEST(LifecycleRunnerTest, StartFailureTriggersEveryStop)
{
  CallRecord healthy;
  int failingStops = 0;
  HookRegistry registry;
  registry.Register(RecordingHook("healthy", healthy));
  registry.Register(Hook{"failing",
                         [](Context) -> boost::asio::awaitable<void>
                         {
                           throw StartFailedException("cannot bind");
                           co_return;
                         },
                         [&failingStops](Context) -> boost::asio::awaitable<void>
                         {
                           ++failingStops;
                           co_return;
                         }});

  LifecycleRunner runner(WithoutSignals(), std::move(registry));

  EXPECT_THROW(runner.Run(), StartFailedException);
  EXPECT_EQ(healthy.Starts, 1);
  EXPECT_EQ(healthy.Stops, 1);
  EXPECT_EQ(failingStops, 1);
  EXPECT_EQ(runner.GetState(), RunnerState::Terminated);
}

TEST(LifecycleRunnerTest, StartFailureIsReportedOverListenerCancellation)
{
  HookRegistry registry;
  registry.Register(Hook{"failing",
                         [](Context) -> boost::asio::awaitable<void>
                         {
                           throw StartFailedException("cannot bind");
                           co_return;
                         },
                         {}});

  RunnerOptions options;
  options.Signals = {SignalKind::User2};
  options.Aggregation = ErrorAggregation::AllErrors;
  LifecycleRunner runner(std::move(options), std::move(registry));

  try
  {
    runner.Run();
    FAIL() << "Expected an AggregateException";
  }
  catch (const Common::AggregateException& ex)
  {
    ASSERT_EQ(ex.InnerExceptionCount(), 1u);
    EXPECT_THROW(std::rethrow_exception(ex.GetFirstException()), StartFailedException);
  }
}

TEST(LifecycleRunnerTest, AllErrorsCollectsEveryDistinctError)
{
  HookRegistry registry;
  registry.Register(Hook{"failing-start",
                         [](Context) -> boost::asio::awaitable<void>
                         {
                           throw StartFailedException("start failed");
                           co_return;
                         },
                         {}});
  registry.Register(Hook{"failing-stop", {},
                         [](Context) -> boost::asio::awaitable<void>
                         {
                           throw std::logic_error("stop failed");
                           co_return;
                         }});

  RunnerOptions options = WithoutSignals();
  options.Aggregation = ErrorAggregation::AllErrors;
  LifecycleRunner runner(std::move(options), std::move(registry));

  try
  {
    runner.Run();
    FAIL() << "Expected an AggregateException";
  }
  catch (const Common::AggregateException& ex)
  {
    EXPECT_STREQ(ex.what(), "Lifecycle run failed");
    ASSERT_EQ(ex.InnerExceptionCount(), 2u);
    EXPECT_THROW(std::rethrow_exception(ex.GetInnerExceptions()[0]), StartFailedException);
    EXPECT_THROW(std::rethrow_exception(ex.GetInnerExceptions()[1]), std::logic_error);
  }
}

TEST(LifecycleRunnerTest, FirstErrorModeRethrowsOnlyTheTrigger)
{
  HookRegistry registry;
  registry.Register(Hook{"failing-start",
                         [](Context) -> boost::asio::awaitable<void>
                         {
                           throw StartFailedException("start failed");
                           co_return;
                         },
                         {}});
  registry.Register(Hook{"failing-stop", {},
                         [](Context) -> boost::asio::awaitable<void>
                         {
                           throw std::logic_error("stop failed");
                           co_return;
                         }});

  LifecycleRunner runner(WithoutSignals(), std::move(registry));

  EXPECT_THROW(runner.Run(), StartFailedException);
}

TEST(LifecycleRunnerTest, StopIsIdempotentAndThreadSafe)
{
  CallRecord record;
  HookRegistry registry;
  registry.Register(RecordingHook("hook", record));
  LifecycleRunner runner(WithoutSignals(), std::move(registry));

  // Before Run(): no-op.
  runner.Stop();
  runner.Stop();
  EXPECT_EQ(runner.GetState(), RunnerState::Idle);

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));

  std::vector<std::thread> stoppers;
  for (int i = 0; i < 4; ++i)
  {
    stoppers.emplace_back(
      [&runner]()
      {
        for (int j = 0; j < 10; ++j)
        {
          runner.Stop();
        }
      });
  }
  for (auto& thread : stoppers)
  {
    thread.join();
  }

  EXPECT_NO_THROW(result.get());
  EXPECT_EQ(record.Stops, 1);

  // After Run(): no-op.
  runner.Stop();
  EXPECT_EQ(runner.GetState(), RunnerState::Terminated);
}

TEST(LifecycleRunnerTest, StopTimeoutIsPerHook)
{
  bool slowSawExpiredContext = false;
  bool fastCompleted = false;
  bool fastContextLive = false;

  HookRegistry registry;
  registry.Register(Hook{"slow", {},
                         [&slowSawExpiredContext](Context context) -> boost::asio::awaitable<void>
                         {
                           co_await SleepAsync(300ms);
                           try
                           {
                             context.ThrowIfDone();
                           }
                           catch (const DeadlineExceededException&)
                           {
                             slowSawExpiredContext = true;
                           }
                         }});
  registry.Register(Hook{"fast", {},
                         [&fastCompleted, &fastContextLive](Context context) -> boost::asio::awaitable<void>
                         {
                           co_await SleepAsync(10ms);
                           fastContextLive = !context.IsDone();
                           fastCompleted = true;
                         }});

  RunnerOptions options = WithoutSignals();
  options.StopTimeout = 100ms;
  LifecycleRunner runner(std::move(options), std::move(registry));

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  runner.Stop();

  EXPECT_NO_THROW(result.get());
  EXPECT_TRUE(slowSawExpiredContext);
  EXPECT_TRUE(fastCompleted);
  EXPECT_TRUE(fastContextLive);
}

TEST(LifecycleRunnerTest, ExpiredStopContextSurfacesWhenTheHookGivesUp)
{
  HookRegistry registry;
  registry.Register(Hook{"slow", {},
                         [](Context context) -> boost::asio::awaitable<void>
                         {
                           co_await context.Done();
                           context.ThrowIfDone();
                         }});

  RunnerOptions options = WithoutSignals();
  options.StopTimeout = 20ms;
  LifecycleRunner runner(std::move(options), std::move(registry));

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  runner.Stop();

  EXPECT_THROW(result.get(), DeadlineExceededException);
}

TEST(LifecycleRunnerTest, StartContextIsBoundedByStartTimeout)
{
  int stops = 0;
  HookRegistry registry;
  registry.Register(Hook{"hanging",
                         [](Context context) -> boost::asio::awaitable<void>
                         {
                           co_await context.Done();
                           context.ThrowIfDone();
                         },
                         [&stops](Context) -> boost::asio::awaitable<void>
                         {
                           ++stops;
                           co_return;
                         }});

  RunnerOptions options = WithoutSignals();
  options.StartTimeout = 20ms;
  LifecycleRunner runner(std::move(options), std::move(registry));

  EXPECT_THROW(runner.Run(), DeadlineExceededException);
  EXPECT_EQ(stops, 1);
}

TEST(LifecycleRunnerTest, StopContextIsLiveAndStateIsShuttingDown)
{
  bool contextLive = false;
  std::optional<std::chrono::steady_clock::time_point> deadline;
  RunnerState observedState = RunnerState::Idle;
  LifecycleRunner* runnerPtr = nullptr;

  HookRegistry registry;
  registry.Register(Hook{"observer", {},
                         [&](Context context) -> boost::asio::awaitable<void>
                         {
                           contextLive = !context.IsDone();
                           deadline = context.GetDeadline();
                           observedState = runnerPtr->GetState();
                           co_return;
                         }});

  LifecycleRunner runner(WithoutSignals(), std::move(registry));
  runnerPtr = &runner;

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  runner.Stop();

  EXPECT_NO_THROW(result.get());
  EXPECT_TRUE(contextLive);
  EXPECT_TRUE(deadline.has_value());
  EXPECT_EQ(observedState, RunnerState::ShuttingDown);
}

TEST(LifecycleRunnerTest, StopFromWithinACallback)
{
  CallRecord record;
  LifecycleRunner* runnerPtr = nullptr;

  HookRegistry registry;
  registry.Register(RecordingHook("hook", record));
  registry.Register(Hook{"self-stopping",
                         [&runnerPtr](Context) -> boost::asio::awaitable<void>
                         {
                           runnerPtr->Stop();
                           co_return;
                         },
                         {}});

  LifecycleRunner runner(WithoutSignals(), std::move(registry));
  runnerPtr = &runner;

  EXPECT_NO_THROW(runner.Run());
  EXPECT_EQ(record.Stops, 1);
}

TEST(LifecycleRunnerTest, SigtermStopsRunWithDefaultOptions)
{
  LifecycleRunner runner(RunnerOptions{}, HookRegistry{});

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  std::raise(SIGTERM);

  ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
  EXPECT_THROW(result.get(), OperationCanceledException);
}

TEST(LifecycleRunnerTest, CustomSignalHandlerReceivesTheKind)
{
  std::vector<SignalKind> received;

  RunnerOptions options;
  options.Signals = {SignalKind::User1};
  options.OnSignal = [&received](RunnerHandle& handle, SignalKind kind)
  {
    received.push_back(kind);
    handle.RequestStop();
  };
  LifecycleRunner runner(std::move(options), HookRegistry{});

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  std::raise(SIGUSR1);

  ASSERT_EQ(result.wait_for(5s), std::future_status::ready);
  EXPECT_THROW(result.get(), OperationCanceledException);
  EXPECT_EQ(received, std::vector<SignalKind>{SignalKind::User1});
}

TEST(LifecycleRunnerTest, DefaultHandlerIgnoresNonTerminationSignals)
{
  RunnerOptions options;
  options.Signals = {SignalKind::User2, SignalKind::Terminate};
  LifecycleRunner runner(std::move(options), HookRegistry{});

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  std::raise(SIGUSR2);

  EXPECT_EQ(result.wait_for(100ms), std::future_status::timeout);
  EXPECT_EQ(runner.GetState(), RunnerState::Running);

  runner.Stop();
  EXPECT_THROW(result.get(), OperationCanceledException);
}

TEST(LifecycleRunnerTest, NoSignalsAndNoHooksWaitsForStop)
{
  LifecycleRunner runner(WithoutSignals(), HookRegistry{});

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  EXPECT_EQ(result.wait_for(100ms), std::future_status::timeout);

  runner.Stop();
  EXPECT_NO_THROW(result.get());
}

TEST(LifecycleRunnerTest, ConcurrentRunThrows)
{
  LifecycleRunner runner(WithoutSignals(), HookRegistry{});

  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));

  EXPECT_THROW(runner.Run(), std::runtime_error);
  EXPECT_EQ(runner.GetState(), RunnerState::Running);

  runner.Stop();
  EXPECT_NO_THROW(result.get());
}

TEST(LifecycleRunnerTest, RunnerCanBeRunAgain)
{
  CallRecord record;
  HookRegistry registry;
  registry.Register(RecordingHook("hook", record));
  LifecycleRunner runner(WithoutSignals(), std::move(registry));

  for (int i = 0; i < 2; ++i)
  {
    auto result = RunInBackground(runner);
    ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
    runner.Stop();
    EXPECT_NO_THROW(result.get());
  }

  EXPECT_EQ(record.Starts, 2);
  EXPECT_EQ(record.Stops, 2);
  EXPECT_EQ(runner.GetRegistry().Size(), 1u);
}

TEST(LifecycleRunnerTest, OptionsAreKeptAsGiven)
{
  RunnerOptions options = WithoutSignals();
  options.StopTimeout = 250ms;
  options.Aggregation = ErrorAggregation::AllErrors;
  options.Info.Name = "orders";
  LifecycleRunner runner(std::move(options), HookRegistry());

  EXPECT_EQ(runner.GetOptions().StopTimeout, std::chrono::milliseconds(250));
  EXPECT_EQ(runner.GetOptions().StartTimeout, RunnerOptions().StartTimeout);
  EXPECT_EQ(runner.GetOptions().Aggregation, ErrorAggregation::AllErrors);
  EXPECT_TRUE(runner.GetOptions().Signals.empty());
  EXPECT_EQ(runner.GetOptions().Info.Name, "orders");

  // Stop() with no active run does not throw and leaves the runner idle.
  runner.Stop();
  EXPECT_EQ(runner.GetState(), RunnerState::Idle);
}

TEST(LifecycleRunnerTest, BlockingStartReturnsAfterItsStopRuns)
{
  std::atomic<bool> stopped{false};
  std::atomic<bool> startReturned{false};
  CallRecord asyncRecord;
  HookRegistry registry;
  registry.Register(RecordingHook("async", asyncRecord));

  Hook server;
  server.Name = "server";
  server.OnStartBlocking = [&stopped, &startReturned](const BlockingCallContext&)
  {
    while (!stopped.load())
    {
      std::this_thread::sleep_for(1ms);
    }
    startReturned.store(true);
  };
  server.OnStopBlocking = [&stopped](const BlockingCallContext&) { stopped.store(true); };
  registry.Register(std::move(server));

  LifecycleRunner runner(WithoutSignals(), std::move(registry));
  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  std::this_thread::sleep_for(100ms);
  EXPECT_FALSE(startReturned.load());

  runner.Stop();

  ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
  EXPECT_NO_THROW(result.get());
  EXPECT_TRUE(stopped.load());
  EXPECT_TRUE(startReturned.load());
  EXPECT_EQ(asyncRecord.Stops, 1);
  EXPECT_EQ(runner.GetState(), RunnerState::Terminated);
}

TEST(LifecycleRunnerTest, BlockingStartFailureTriggersShutdown)
{
  CallRecord record;
  HookRegistry registry;
  registry.Register(RecordingHook("async", record));

  Hook failing;
  failing.Name = "failing";
  failing.OnStartBlocking = [](const BlockingCallContext&) { throw StartFailedException("port in use"); };
  registry.Register(std::move(failing));

  LifecycleRunner runner(WithoutSignals(), std::move(registry));
  auto result = RunInBackground(runner);

  ASSERT_EQ(result.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(result.get(), StartFailedException);
  EXPECT_EQ(record.Stops, 1);
}

TEST(LifecycleRunnerTest, BlockingStopReceivesTheStopDeadline)
{
  std::optional<Context::Clock::time_point> stopDeadline;
  bool expiredAtStart = true;
  Context::Clock::time_point stopRequestedAt;

  HookRegistry registry;
  Hook hook;
  hook.Name = "blocking-stop";
  hook.OnStopBlocking = [&](const BlockingCallContext& context)
  {
    stopDeadline = context.GetDeadline();
    expiredAtStart = context.IsExpired();
  };
  registry.Register(std::move(hook));

  RunnerOptions options = WithoutSignals();
  options.StopTimeout = 5s;
  LifecycleRunner runner(std::move(options), std::move(registry));
  auto result = RunInBackground(runner);
  ASSERT_TRUE(WaitForState(runner, RunnerState::Running));
  stopRequestedAt = Context::Clock::now();
  runner.Stop();

  EXPECT_NO_THROW(result.get());
  ASSERT_TRUE(stopDeadline.has_value());
  EXPECT_FALSE(expiredAtStart);
  EXPECT_GT(*stopDeadline, stopRequestedAt);
  EXPECT_LE(*stopDeadline, Context::Clock::now() + 5s);
}
