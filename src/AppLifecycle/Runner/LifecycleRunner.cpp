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
#include <AppLifecycle/Runner/RunnerHandle.hpp>
#include <AppLifecycle/Runner/TaskGroup.hpp>
#include <Common/AggregateException.hpp>
#include <Common/LogHelper.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace AppLifecycle
{
  namespace
  {
    APP_LIFECYCLE_LOGGER_NAME(LifecycleRunner);

    std::shared_ptr<spdlog::logger> Logger()
    {
      return Common::LogHelper::GetLogger<LoggerName_LifecycleRunner>();
    }

    struct HookTask
    {
      std::size_t Index{0};
      std::string Name;
      HookCallback Callback;
      BlockingHookCallback BlockingCallback;
    };

    std::vector<HookTask> BuildTasks(const std::vector<Hook>& hooks, HookCallback Hook::*callback, BlockingHookCallback Hook::*blockingCallback)
    {
      std::vector<HookTask> tasks;
      for (std::size_t i = 0; i < hooks.size(); ++i)
      {
        if (hooks[i].*callback || hooks[i].*blockingCallback)
        {
          tasks.push_back(HookTask{i, hooks[i].Name, hooks[i].*callback, hooks[i].*blockingCallback});
        }
      }
      return tasks;
    }

    std::size_t CountBlockingCallbacks(const std::vector<Hook>& hooks)
    {
      std::size_t count = 0;
      for (const Hook& hook : hooks)
      {
        count += (hook.OnStartBlocking ? 1u : 0u) + (hook.OnStopBlocking ? 1u : 0u);
      }
      return count;
    }

    // Runs the callback on a pool thread and resumes the awaiting coroutine on its own executor.
    // The awaiting executor is kept busy until the completion is delivered, so its io_context does not run dry meanwhile.
    boost::asio::awaitable<void> RunBlockingAsync(boost::asio::thread_pool& pool, BlockingHookCallback callback, BlockingCallContext callContext)
    {
      auto initiation = [poolPtr = &pool, callback = std::move(callback), callContext](auto handler) mutable
      {
        auto completionExecutor =
          boost::asio::prefer(boost::asio::get_associated_executor(handler), boost::asio::execution::outstanding_work.tracked);
        boost::asio::post(*poolPtr,
                          [handler = std::move(handler), completionExecutor = std::move(completionExecutor), callback = std::move(callback),
                           callContext]() mutable
                          {
                            std::exception_ptr error;
                            try
                            {
                              callback(callContext);
                            }
                            catch (...)
                            {
                              error = std::current_exception();
                            }
                            boost::asio::post(completionExecutor, [handler = std::move(handler), error]() mutable { std::move(handler)(error); });
                          });
      };
      return boost::asio::async_initiate<decltype(boost::asio::use_awaitable), void(std::exception_ptr)>(std::move(initiation),
                                                                                                         boost::asio::use_awaitable);
    }

    // The callback's context is released once the callback returns, whatever the outcome.
    // Blocking callbacks only see a snapshot of the deadline; the context itself stays on the runner's executor.
    boost::asio::awaitable<void> InvokeHookAsync(HookTask task, Context context, boost::asio::thread_pool* const blockingPool, const char* const phase)
    {
      std::exception_ptr error;
      try
      {
        if (task.Callback)
        {
          co_await task.Callback(context);
        }
        else
        {
          co_await RunBlockingAsync(*blockingPool, task.BlockingCallback, BlockingCallContext(context.GetDeadline()));
        }
      }
      catch (...)
      {
        error = std::current_exception();
      }
      context.Cancel();

      if (error)
      {
        Logger()->debug("LifecycleRunner: {} of '{}' (#{}) failed: {}", phase, task.Name, task.Index, Common::AggregateException::Describe(error));
        std::rethrow_exception(error);
      }
      Logger()->debug("LifecycleRunner: {} of '{}' (#{}) completed", phase, task.Name, task.Index);
    }

    boost::asio::awaitable<void> StartHookAsync(HookTask task, const Context::Clock::duration timeout, boost::asio::thread_pool* const blockingPool)
    {
      auto executor = co_await boost::asio::this_coro::executor;
      Logger()->debug("LifecycleRunner: starting '{}' (#{}){}", task.Name, task.Index, task.Callback ? "" : " on a pool thread");
      co_await InvokeHookAsync(std::move(task), Context::WithTimeout(Context::Background(executor), timeout), blockingPool, "start");
    }

    boost::asio::awaitable<void> StopHookAsync(HookTask task, Context root, const Context::Clock::duration timeout,
                                               boost::asio::thread_pool* const blockingPool)
    {
      co_await root.Done();

      // The stop deadline is counted from the trigger and does not inherit the root's cancellation.
      Logger()->debug("LifecycleRunner: stopping '{}' (#{}){}", task.Name, task.Index, task.Callback ? "" : " on a pool thread");
      co_await InvokeHookAsync(std::move(task), Context::WithTimeout(Context::Background(root.GetExecutor()), timeout), blockingPool, "stop");
    }

    boost::asio::awaitable<void> WatchShutdownAsync(Context root, std::atomic<RunnerState>& state)
    {
      co_await root.Done();
      state.store(RunnerState::ShuttingDown);
      Logger()->info("LifecycleRunner: shutting down ({})", Common::AggregateException::Describe(root.GetError()));
    }

    boost::asio::awaitable<void> ListenForSignalsAsync(boost::asio::signal_set& signals, Context root, const SignalHandler& onSignal,
                                                       RunnerHandle& handle)
    {
      while (!root.IsDone())
      {
        boost::system::error_code error;
        const int signalNumber = co_await signals.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
        if (root.IsDone())
        {
          break;
        }
        if (error)
        {
          throw boost::system::system_error(error, "LifecycleRunner: waiting for signals failed");
        }

        const auto kind = TryFromNativeSignal(signalNumber);
        if (!kind.has_value())
        {
          Logger()->warn("LifecycleRunner: ignoring unexpected signal {}", signalNumber);
          continue;
        }

        Logger()->info("LifecycleRunner: received {}", ToString(*kind));
        if (onSignal)
        {
          onSignal(handle, *kind);
        }
      }
      std::rethrow_exception(root.GetError());
    }

    // signal_set::async_wait is not bound to the root context, so its pending wait is aborted explicitly.
    boost::asio::awaitable<void> AbortSignalWaitAsync(boost::asio::signal_set& signals, Context root)
    {
      co_await root.Done();
      boost::system::error_code ignored;
      signals.cancel(ignored);
    }
  }


  class LifecycleRunner::ActiveRunScope
  {
    LifecycleRunner& m_runner;

  public:
    ActiveRunScope(LifecycleRunner& runner, const boost::asio::any_io_executor& executor, const Context& rootContext)
      : m_runner(runner)
    {
      std::lock_guard lock(runner.m_mutex);
      if (runner.m_executor.has_value())
      {
        throw std::runtime_error("LifecycleRunner::Run: the runner is already running");
      }
      runner.m_executor = executor;
      runner.m_rootContext = rootContext;
    }

    ~ActiveRunScope()
    {
      {
        std::lock_guard lock(m_runner.m_mutex);
        m_runner.m_executor.reset();
        m_runner.m_rootContext.reset();
      }
      m_runner.m_state.store(RunnerState::Terminated);
    }

    ActiveRunScope(const ActiveRunScope&) = delete;
    ActiveRunScope& operator=(const ActiveRunScope&) = delete;
  };


  LifecycleRunner::LifecycleRunner(RunnerOptions options, HookRegistry registry)
    : m_options(std::move(options))
    , m_registry(std::move(registry))
  {
  }


  void LifecycleRunner::Run()
  {
    boost::asio::io_context ioContext(1);
    // One dedicated thread per blocking callback, so a blocking start never delays its own stop.
    std::optional<boost::asio::thread_pool> blockingPool;
    const std::size_t blockingCount = CountBlockingCallbacks(m_registry.GetHooks());
    if (blockingCount > 0)
    {
      blockingPool.emplace(blockingCount);
    }
    boost::asio::thread_pool* const blockingPoolPtr = blockingPool.has_value() ? &*blockingPool : nullptr;
    const boost::asio::any_io_executor executor = ioContext.get_executor();
    const Context root = Context::WithCancel(Context::Background(executor));
    TaskGroup group(executor, root);
    boost::asio::signal_set signals(ioContext);
    RunnerHandle handle(*this);
    ActiveRunScope scope(*this, executor, root);

    const AppInfo& info = m_options.Info;
    Logger()->info("LifecycleRunner: running '{}' (id: '{}', version: '{}', endpoints: {}) with {} hooks", info.Name, info.Id, info.Version,
                   info.Endpoints.size(), m_registry.Size());

    // Signals are registered before any task exists so a registration failure leaves nothing behind.
    for (const SignalKind kind : m_options.Signals)
    {
      signals.add(ToNativeSignal(kind));
    }

    // Spawned first so the state is ShuttingDown before any stop callback resumes.
    group.Spawn("shutdown-watch", WatchShutdownAsync(group.GetContext(), m_state));
    for (HookTask& task : BuildTasks(m_registry.GetHooks(), &Hook::OnStop, &Hook::OnStopBlocking))
    {
      std::string name = "stop:" + task.Name;
      group.Spawn(std::move(name), StopHookAsync(std::move(task), group.GetContext(), m_options.StopTimeout, blockingPoolPtr));
    }
    for (HookTask& task : BuildTasks(m_registry.GetHooks(), &Hook::OnStart, &Hook::OnStartBlocking))
    {
      std::string name = "start:" + task.Name;
      group.Spawn(std::move(name), StartHookAsync(std::move(task), m_options.StartTimeout, blockingPoolPtr));
    }

    if (!m_options.Signals.empty())
    {
      group.Spawn("signal-listener", ListenForSignalsAsync(signals, group.GetContext(), m_options.OnSignal, handle));
      group.Spawn("signal-abort", AbortSignalWaitAsync(signals, group.GetContext()));
    }
    Logger()->debug("LifecycleRunner: {} tasks spawned, {} blocking callbacks", group.GetPendingCount(), blockingCount);

    m_state.store(RunnerState::Running);
    ioContext.run();
    if (blockingPool.has_value())
    {
      blockingPool->join();
    }

    const std::vector<std::exception_ptr>& errors = group.GetErrors();
    if (errors.empty())
    {
      Logger()->info("LifecycleRunner: '{}' stopped cleanly", info.Name);
      return;
    }

    Logger()->error("LifecycleRunner: '{}' stopped with {} error(s)", info.Name, errors.size());
    if (m_options.Aggregation == ErrorAggregation::AllErrors)
    {
      throw Common::AggregateException("Lifecycle run failed", errors);
    }
    std::rethrow_exception(group.GetFirstError());
  }


  void LifecycleRunner::Stop() noexcept
  {
    try
    {
      const auto logger = Logger();
      std::lock_guard lock(m_mutex);
      if (!m_executor.has_value())
      {
        logger->debug("LifecycleRunner::Stop: no active run");
        return;
      }
      boost::asio::post(*m_executor, [this]() { CancelRootContext(); });
    }
    catch (const std::exception& ex)
    {
      // spdlog reports its own failures through its error handler instead of throwing.
      spdlog::error("LifecycleRunner::Stop: failed to request a stop: {}", ex.what());
    }
  }


  void LifecycleRunner::CancelRootContext()
  {
    std::optional<Context> root;
    {
      std::lock_guard lock(m_mutex);
      root = m_rootContext;
    }
    if (root.has_value() && !root->IsDone())
    {
      Logger()->info("LifecycleRunner: stop requested");
      root->Cancel(std::make_exception_ptr(OperationCanceledException("Lifecycle stop requested")));
    }
  }
}
