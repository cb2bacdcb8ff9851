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

#include <SagaFramework/Exception/AggregateCompensationException.hpp>
#include <sstream>
#include <typeinfo>

namespace SagaFramework
{
  namespace
  {
    constexpr const char* DefaultMessage = "One or more compensations failed.";

    std::string GenerateMessage(const std::string& message)
    {
      return message.empty() ? std::string(DefaultMessage) : message;
    }

    void ValidateNonEmpty(const std::vector<CompensationFailure>& failures)
    {
      if (failures.empty())
      {
        throw std::invalid_argument("The failures argument must contain at least one compensation failure.");
      }
    }

    void FlattenHelper(const std::vector<CompensationFailure>& failures, const std::size_t outerIndex, std::vector<CompensationFailure>& result)
    {
      for (const auto& failure : failures)
      {
        const std::size_t index = outerIndex != 0 ? outerIndex : failure.Index;
        try
        {
          if (failure.Cause)
          {
            std::rethrow_exception(failure.Cause);
          }
          result.emplace_back(index, failure.Cause);
        }
        catch (const AggregateCompensationException& nested)
        {
          FlattenHelper(nested.GetFailures(), index, result);
        }
        catch (...)
        {
          result.emplace_back(index, failure.Cause);
        }
      }
    }
  }

  AggregateCompensationException::AggregateCompensationException(std::vector<CompensationFailure> failures)
    : AggregateCompensationException(std::string(), std::move(failures))
  {
  }

  AggregateCompensationException::AggregateCompensationException(const std::string& message, std::vector<CompensationFailure> failures)
    : std::runtime_error(GenerateMessage(message))
    , m_failures(std::move(failures))
  {
    ValidateNonEmpty(m_failures);
  }

  std::vector<std::exception_ptr> AggregateCompensationException::GetInnerExceptions() const
  {
    std::vector<std::exception_ptr> result;
    result.reserve(m_failures.size());
    for (const auto& failure : m_failures)
    {
      result.push_back(failure.Cause);
    }
    return result;
  }

  std::exception_ptr AggregateCompensationException::GetBaseException() const noexcept
  {
    return m_failures.empty() ? nullptr : m_failures.front().Cause;
  }

  AggregateCompensationException AggregateCompensationException::Flatten() const
  {
    std::vector<CompensationFailure> flattened;
    FlattenHelper(m_failures, 0, flattened);
    return AggregateCompensationException(what(), std::move(flattened));
  }

  std::string AggregateCompensationException::ToString() const
  {
    std::ostringstream oss;
    oss << what() << "\n";

    for (size_t i = 0; i < m_failures.size(); ++i)
    {
      const auto& failure = m_failures[i];
      oss << "  [compensation " << failure.Index << "] ";
      try
      {
        if (failure.Cause)
        {
          std::rethrow_exception(failure.Cause);
        }
        else
        {
          oss << "(null exception)";
        }
      }
      catch (const std::exception& ex)
      {
        oss << typeid(ex).name() << ": " << ex.what();
      }
      catch (...)
      {
        oss << "(unknown exception type)";
      }
      if (i < m_failures.size() - 1)
      {
        oss << "\n";
      }
    }

    return oss.str();
  }
}
