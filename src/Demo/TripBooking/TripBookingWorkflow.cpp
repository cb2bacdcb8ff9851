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

#include <Demo/TripBooking/TripBookingWorkflow.hpp>
#include <SagaFramework/Saga/Saga.hpp>
#include <SagaFramework/Saga/SagaScope.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace Demo::TripBooking
{
  TripBookingWorkflow::TripBookingWorkflow(std::shared_ptr<ITripBookingActivities> activities, SagaFramework::SagaOptions sagaOptions)
    : m_activities(std::move(activities))
    , m_sagaOptions(sagaOptions)
  {
    if (!m_activities)
    {
      throw std::invalid_argument("TripBookingWorkflow requires activities");
    }
  }

  boost::asio::awaitable<TripConfirmation> TripBookingWorkflow::BookTripAsync(std::string name)
  {
    SagaFramework::Saga saga(m_sagaOptions);

    auto body = [activities = m_activities, name](SagaFramework::Saga& saga) -> boost::asio::awaitable<TripConfirmation>
    {
      TripConfirmation result;

      result.CarReservationId = co_await activities->ReserveCarAsync(name);
      saga.AddCompensation(&ITripBookingActivities::CancelCarAsync, activities, result.CarReservationId, name);

      result.HotelReservationId = co_await activities->BookHotelAsync(name);
      saga.AddCompensation(&ITripBookingActivities::CancelHotelAsync, activities, result.HotelReservationId, name);

      result.FlightReservationId = co_await activities->BookFlightAsync(name);
      saga.AddCompensation(&ITripBookingActivities::CancelFlightAsync, activities, result.FlightReservationId, name);

      co_return result;
    };

    // The body must not be a temporary inside the co_await operand
    auto confirmation = co_await SagaFramework::SagaScope::RunAsync(saga, std::move(body));

    spdlog::info("Trip booked for '{}': car {}, hotel {}, flight {}", name, confirmation.CarReservationId, confirmation.HotelReservationId,
                 confirmation.FlightReservationId);
    co_return confirmation;
  }
}
