#ifndef SAGA_FRAMEWORK_DEMO_TRIPBOOKING_ITRIPBOOKINGACTIVITIES_HPP
#define SAGA_FRAMEWORK_DEMO_TRIPBOOKING_ITRIPBOOKINGACTIVITIES_HPP
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

#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/awaitable.hpp>
#include <string>

namespace Demo::TripBooking
{
  /// @brief The side-effecting steps of booking a trip, each paired with its cancellation.
  ///
  /// Book/reserve calls return a reservation id; the matching cancel call takes that id and the traveller name.
  class ITripBookingActivities
  {
  public:
    virtual ~ITripBookingActivities() = default;

    virtual boost::asio::awaitable<std::string> ReserveCarAsync(std::string name) = 0;
    virtual boost::asio::awaitable<std::string> BookHotelAsync(std::string name) = 0;
    virtual boost::asio::awaitable<std::string> BookFlightAsync(std::string name) = 0;

    virtual boost::asio::awaitable<std::string> CancelCarAsync(std::string reservationId, std::string name) = 0;
    virtual boost::asio::awaitable<std::string> CancelHotelAsync(std::string reservationId, std::string name) = 0;
    virtual boost::asio::awaitable<std::string> CancelFlightAsync(std::string reservationId, std::string name) = 0;
  };
}

#endif
