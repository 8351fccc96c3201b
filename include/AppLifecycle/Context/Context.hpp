#ifndef APP_LIFECYCLE_CONTEXT_CONTEXT_HPP
#define APP_LIFECYCLE_CONTEXT_CONTEXT_HPP
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

#include <utility>  // boost/asio/awaitable.hpp (Boost 1.74) uses std::exchange without including it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>

namespace AppLifecycle
{
  namespace Detail
  {
    struct ContextState;
  }

  /// @brief A cancellation signal with an optional deadline, shared by the operations of one lifecycle phase.
  ///
  /// A Context is a cheap handle; copies observe and control the same state. Derived contexts are done
  /// when their parent is done, and inherit the parent's deadline when it is earlier than their own.
  /// The first completion wins: once done, the reported error never changes.
  ///
  /// Contexts are not thread-safe. Use them from the executor they were created with.
  class Context
  {
    std::shared_ptr<Detail::ContextState> m_state;

    explicit Context(std::shared_ptr<Detail::ContextState> state) noexcept;

  public:
    using Clock = std::chrono::steady_clock;

    /// @brief A root context with no deadline. It is only done once Cancel() is called on it.
    static Context Background(const boost::asio::any_io_executor& executor);

    /// @brief A child that can be cancelled independently of its parent.
    static Context WithCancel(const Context& parent);

    /// @brief A child that expires at the given deadline (or the parent's, if earlier).
    static Context WithDeadline(const Context& parent, Clock::time_point deadline);

    /// @brief A child that expires after the given timeout (or at the parent's deadline, if earlier).
    static Context WithTimeout(const Context& parent, Clock::duration timeout);

    [[nodiscard]] const boost::asio::any_io_executor& GetExecutor() const noexcept;

    [[nodiscard]] std::optional<Clock::time_point> GetDeadline() const noexcept;

    /// @brief True once the context was cancelled or its deadline passed.
    [[nodiscard]] bool IsDone() const;

    /// @brief Null while the context is live, otherwise the cancellation cause or a DeadlineExceededException.
    [[nodiscard]] std::exception_ptr GetError() const;

    /// @brief Rethrows GetError() if the context is done.
    void ThrowIfDone() const;

    /// @brief Cancels the context and its children with an OperationCanceledException. No-op when already done.
    void Cancel();

    /// @brief Cancels the context and its children with the given cause. No-op when already done.
    /// A null cause behaves like Cancel().
    void Cancel(std::exception_ptr cause);

    /// @brief Completes once the context is done. Never throws.
    [[nodiscard]] boost::asio::awaitable<void> Done() const;
  };
}

#endif
