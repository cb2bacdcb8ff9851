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
#include <SagaFramework/Exception/DuplicateCompensationHandlerException.hpp>
#include <SagaFramework/Exception/SagaFailedException.hpp>
#include <SagaFramework/Exception/UnknownCompensationHandlerException.hpp>
#include <SagaFramework/Saga/CompensationResult.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace SagaFramework
{
  // Custom exception for testing
  class RefundException : public std::runtime_error
  {
  public:
    explicit RefundException(const std::string& msg)
      : std::runtime_error(msg)
    {
    }
  };
}

using namespace SagaFramework;

TEST(AggregateCompensationExceptionTest, BasicConstruction_UsesDefaultMessage)
{
  std::vector<CompensationFailure> failures;
  failures.emplace_back(3, std::make_exception_ptr(std::runtime_error("Error 1")));
  failures.emplace_back(1, std::make_exception_ptr(std::logic_error("Error 2")));

  AggregateCompensationException aggEx(std::move(failures));
  EXPECT_EQ(aggEx.FailureCount(), 2u);
  EXPECT_EQ(std::string(aggEx.what()), "One or more compensations failed.");
}

TEST(AggregateCompensationExceptionTest, ConstructionWithCustomMessage)
{
  AggregateCompensationException aggEx("Refunds failed", {CompensationFailure(1, std::make_exception_ptr(std::runtime_error("Error 1")))});

  EXPECT_EQ(aggEx.FailureCount(), 1u);
  EXPECT_EQ(std::string(aggEx.what()), "Refunds failed");
}

TEST(AggregateCompensationExceptionTest, EmptyFailures_Throws)
{
  EXPECT_THROW(AggregateCompensationException(std::vector<CompensationFailure>{}), std::invalid_argument);
}

TEST(AggregateCompensationExceptionTest, FailuresKeepIndexAndCause)
{
  AggregateCompensationException aggEx({CompensationFailure(2, std::make_exception_ptr(RefundException("refund rejected")))});

  const auto& failure = aggEx.GetFailures().front();
  EXPECT_EQ(failure.Index, 2u);
  EXPECT_EQ(failure.GetMessage(), "refund rejected");
  EXPECT_THROW(std::rethrow_exception(failure.Cause), RefundException);
}

TEST(AggregateCompensationExceptionTest, GetInnerExceptions_PreservesOrder)
{
  AggregateCompensationException aggEx({CompensationFailure(3, std::make_exception_ptr(std::runtime_error("first"))),
                                        CompensationFailure(1, std::make_exception_ptr(std::runtime_error("second")))});

  auto inner = aggEx.GetInnerExceptions();
  ASSERT_EQ(inner.size(), 2u);
  try
  {
    std::rethrow_exception(inner[1]);
  }
  catch (const std::runtime_error& ex)
  {
    EXPECT_EQ(std::string(ex.what()), "second");
  }
}

TEST(AggregateCompensationExceptionTest, GetBaseException_ReturnsFirstCause)
{
  AggregateCompensationException aggEx({CompensationFailure(1, std::make_exception_ptr(RefundException("base"))),
                                        CompensationFailure(2, std::make_exception_ptr(std::runtime_error("other")))});

  EXPECT_THROW(std::rethrow_exception(aggEx.GetBaseException()), RefundException);
}

TEST(AggregateCompensationExceptionTest, Flatten_UnwrapsNestedSagaFailures)
{
  AggregateCompensationException nested({CompensationFailure(1, std::make_exception_ptr(std::runtime_error("inner 1"))),
                                         CompensationFailure(2, std::make_exception_ptr(std::runtime_error("inner 2")))});
  AggregateCompensationException outer({CompensationFailure(4, std::make_exception_ptr(nested)),
                                        CompensationFailure(5, std::make_exception_ptr(std::logic_error("leaf")))});

  auto flattened = outer.Flatten();
  ASSERT_EQ(flattened.FailureCount(), 3u);
  EXPECT_EQ(flattened.GetFailures()[0].Index, 4u);
  EXPECT_EQ(flattened.GetFailures()[0].GetMessage(), "inner 1");
  EXPECT_EQ(flattened.GetFailures()[1].Index, 4u);
  EXPECT_EQ(flattened.GetFailures()[1].GetMessage(), "inner 2");
  EXPECT_EQ(flattened.GetFailures()[2].Index, 5u);
  EXPECT_EQ(std::string(flattened.what()), std::string(outer.what()));
}

TEST(AggregateCompensationExceptionTest, ToString_ListsEveryFailure)
{
  AggregateCompensationException aggEx({CompensationFailure(2, std::make_exception_ptr(std::runtime_error("hotel refund failed"))),
                                        CompensationFailure(1, std::make_exception_ptr(std::runtime_error("car refund failed")))});

  const std::string text = aggEx.ToString();
  EXPECT_NE(text.find("One or more compensations failed."), std::string::npos);
  EXPECT_NE(text.find("[compensation 2]"), std::string::npos);
  EXPECT_NE(text.find("hotel refund failed"), std::string::npos);
  EXPECT_NE(text.find("[compensation 1]"), std::string::npos);
  EXPECT_NE(text.find("car refund failed"), std::string::npos);
}

TEST(AggregateCompensationExceptionTest, RangeForIteratesFailures)
{
  AggregateCompensationException aggEx({CompensationFailure(1, std::make_exception_ptr(std::runtime_error("a"))),
                                        CompensationFailure(2, std::make_exception_ptr(std::runtime_error("b")))});

  std::size_t sum = 0;
  for (const auto& failure : aggEx)
  {
    sum += failure.Index;
  }
  EXPECT_EQ(sum, 3u);
}

TEST(AggregateCompensationExceptionTest, CompensationResult_ThrowIfFailed)
{
  CompensationResult success({}, 3);
  EXPECT_TRUE(success.Succeeded());
  EXPECT_NO_THROW(success.ThrowIfFailed());

  CompensationResult failed({CompensationFailure(1, std::make_exception_ptr(std::runtime_error("x")))}, 3);
  EXPECT_FALSE(failed.Succeeded());
  EXPECT_THROW(failed.ThrowIfFailed(), AggregateCompensationException);
}

TEST(AggregateCompensationExceptionTest, SagaFailedException_CarriesBothFailures)
{
  CompensationResult result({CompensationFailure(1, std::make_exception_ptr(std::runtime_error("refund failed")))}, 2);
  SagaFailedException ex(std::make_exception_ptr(std::runtime_error("booking failed")), result);

  EXPECT_THROW(std::rethrow_exception(ex.GetForwardFailure()), std::runtime_error);
  EXPECT_EQ(ex.GetCompensationResult().Failures.size(), 1u);
  EXPECT_EQ(ex.GetCompensationResult().InvokedCount, 2u);
  EXPECT_NE(std::string(ex.what()).find("booking failed"), std::string::npos);
}

TEST(AggregateCompensationExceptionTest, HandlerExceptions_NameTheHandler)
{
  DuplicateCompensationHandlerException duplicate("cancelHotel");
  UnknownCompensationHandlerException unknown("cancelCar");

  EXPECT_EQ(std::string(duplicate.what()), "Compensation handler 'cancelHotel' is already registered");
  EXPECT_EQ(std::string(unknown.what()), "No compensation handler registered for 'cancelCar'");
  EXPECT_EQ(unknown.GetHandlerId(), "cancelCar");
}
