#ifndef SAGA_FRAMEWORK_DEMO_TRIPBOOKING_TRIPBOOKINGCONFIG_HPP
#define SAGA_FRAMEWORK_DEMO_TRIPBOOKING_TRIPBOOKINGCONFIG_HPP
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

#include <chrono>

namespace Demo::TripBooking
{
  namespace Config
  {
    // Simulated activity latencies
    constexpr std::chrono::milliseconds CAR_RESERVATION_DELAY{10};
    constexpr std::chrono::milliseconds HOTEL_BOOKING_DELAY{20};
    constexpr std::chrono::milliseconds FLIGHT_BOOKING_DELAY{15};
    constexpr std::chrono::milliseconds CANCELLATION_DELAY{5};

    // Threads used for parallel compensation in the demo
    constexpr int COMPENSATION_THREAD_COUNT = 2;
  }

  /// @brief Behaviour of SimulatedTripBookingActivities.
  struct SimulatedTripBookingConfig
  {
    /// @brief When set, BookFlightAsync throws instead of returning a reservation.
    bool FailFlightBooking{true};
    /// @brief Scales every simulated latency, zero disables the delays.
    int DelayScale{1};

    constexpr SimulatedTripBookingConfig() noexcept = default;

    constexpr SimulatedTripBookingConfig(const bool failFlightBooking, const int delayScale) noexcept
      : FailFlightBooking(failFlightBooking)
      , DelayScale(delayScale)
    {
    }
  };
}

#endif
