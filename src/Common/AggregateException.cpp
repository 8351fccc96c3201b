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

#include <Common/AggregateException.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <typeinfo>

namespace Common
{
  namespace
  {
    constexpr const char* DefaultMessage = "One or more errors occurred.";

    std::vector<std::exception_ptr> Validate(std::vector<std::exception_ptr> exceptions)
    {
      if (exceptions.empty())
      {
        throw std::invalid_argument("AggregateException requires at least one inner exception");
      }
      if (std::any_of(exceptions.begin(), exceptions.end(), [](const std::exception_ptr& ex) { return !ex; }))
      {
        throw std::invalid_argument("AggregateException does not accept null inner exceptions");
      }
      return exceptions;
    }

    void FlattenInto(const std::vector<std::exception_ptr>& exceptions, std::vector<std::exception_ptr>& result)
    {
      for (const auto& exPtr : exceptions)
      {
        try
        {
          std::rethrow_exception(exPtr);
        }
        catch (const AggregateException& nested)
        {
          FlattenInto(nested.GetInnerExceptions(), result);
        }
        catch (...)
        {
          result.push_back(exPtr);
        }
      }
    }
  }

  AggregateException::AggregateException(std::vector<std::exception_ptr> innerExceptions)
    : AggregateException(std::string(), std::move(innerExceptions))
  {
  }

  AggregateException::AggregateException(const std::string& message, std::vector<std::exception_ptr> innerExceptions)
    : std::runtime_error(message.empty() ? DefaultMessage : message)
    , m_innerExceptions(Validate(std::move(innerExceptions)))
  {
  }

  AggregateException AggregateException::Flatten() const
  {
    std::vector<std::exception_ptr> flattened;
    FlattenInto(m_innerExceptions, flattened);
    return AggregateException(what(), std::move(flattened));
  }

  std::string AggregateException::ToString() const
  {
    std::string result(what());
    for (std::size_t i = 0; i < m_innerExceptions.size(); ++i)
    {
      result += fmt::format("\n  [{}] {}", i, Describe(m_innerExceptions[i]));
    }
    return result;
  }

  std::string AggregateException::Describe(const std::exception_ptr& exception)
  {
    if (!exception)
    {
      return "(null exception)";
    }
    try
    {
      std::rethrow_exception(exception);
    }
    catch (const std::exception& ex)
    {
      return fmt::format("{}: {}", typeid(ex).name(), ex.what());
    }
    catch (...)
    {
      return "(unknown exception type)";
    }
  }
}
