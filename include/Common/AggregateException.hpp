#ifndef APP_LIFECYCLE_COMMON_AGGREGATEEXCEPTION_HPP
#define APP_LIFECYCLE_COMMON_AGGREGATEEXCEPTION_HPP
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

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace Common
{
  /// @brief Carries every error collected while a group of concurrent operations ran.
  ///
  /// The inner errors are kept in the order they were observed, so GetFirstException() is the one
  /// that triggered the failure. The object is immutable once constructed.
  class AggregateException : public std::runtime_error
  {
    std::vector<std::exception_ptr> m_innerExceptions;

  public:
    /// @brief Creates an AggregateException with the default message.
    /// @throws std::invalid_argument if innerExceptions is empty or contains a null entry.
    explicit AggregateException(std::vector<std::exception_ptr> innerExceptions);

    /// @brief Creates an AggregateException with a custom message (empty selects the default message).
    /// @throws std::invalid_argument if innerExceptions is empty or contains a null entry.
    AggregateException(const std::string& message, std::vector<std::exception_ptr> innerExceptions);

    AggregateException(const AggregateException&) = default;
    AggregateException(AggregateException&&) = default;
    AggregateException& operator=(const AggregateException&) = delete;
    AggregateException& operator=(AggregateException&&) = delete;

    [[nodiscard]] const std::vector<std::exception_ptr>& GetInnerExceptions() const noexcept
    {
      return m_innerExceptions;
    }

    [[nodiscard]] std::size_t InnerExceptionCount() const noexcept
    {
      return m_innerExceptions.size();
    }

    /// @brief The first observed error.
    [[nodiscard]] std::exception_ptr GetFirstException() const noexcept
    {
      return m_innerExceptions.front();
    }

    /// @brief Recursively unwraps nested AggregateExceptions into a single level.
    [[nodiscard]] AggregateException Flatten() const;

    /// @brief Returns the message followed by one line per inner exception.
    [[nodiscard]] std::string ToString() const;

    std::vector<std::exception_ptr>::const_iterator begin() const noexcept
    {
      return m_innerExceptions.begin();
    }

    std::vector<std::exception_ptr>::const_iterator end() const noexcept
    {
      return m_innerExceptions.end();
    }

    /// @brief Describes a single exception_ptr as "<type>: <what>" for logging.
    static std::string Describe(const std::exception_ptr& exception);
  };
}

#endif
