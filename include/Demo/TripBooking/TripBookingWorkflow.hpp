#ifndef SAGA_FRAMEWORK_DEMO_TRIPBOOKING_TRIPBOOKINGWORKFLOW_HPP
#define SAGA_FRAMEWORK_DEMO_TRIPBOOKING_TRIPBOOKINGWORKFLOW_HPP
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

#include <Demo/TripBooking/ITripBookingActivities.hpp>
#include <Demo/TripBooking/TripConfirmation.hpp>
#include <SagaFramework/Saga/SagaOptions.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <string>

namespace Demo::TripBooking
{
  /// @brief Books a car, a hotel and a flight; if any booking fails the earlier ones are cancelled.
  ///
  /// Each cancellation is registered with the saga only after its booking returned a reservation id.
  /// A failed booking is rethrown unchanged once the saga has been unwound; if a cancellation also fails
  /// SagaFramework::SagaFailedException is thrown instead.
  class TripBookingWorkflow
  {
    std::shared_ptr<ITripBookingActivities> m_activities;
    SagaFramework::SagaOptions m_sagaOptions;

  public:
    explicit TripBookingWorkflow(std::shared_ptr<ITripBookingActivities> activities,
                                 SagaFramework::SagaOptions sagaOptions = SagaFramework::SagaOptions::Parallel());

    boost::asio::awaitable<TripConfirmation> BookTripAsync(std::string name);
  };
}

#endif
