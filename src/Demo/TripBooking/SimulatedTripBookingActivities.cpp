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

#include <Demo/TripBooking/SimulatedTripBookingActivities.hpp>
#include <utility>  // must precede Boost.Asio 1.74 awaitable.hpp (uses std::exchange)
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace Demo::TripBooking
{
  SimulatedTripBookingActivities::SimulatedTripBookingActivities(SimulatedTripBookingConfig config)
    : m_config(config)
  {
  }

  boost::asio::awaitable<std::string> SimulatedTripBookingActivities::ReserveCarAsync(std::string name)
  {
    spdlog::info("Reserving car for '{}'", name);
    co_await SimulateLatencyAsync(Config::CAR_RESERVATION_DELAY);
    co_return NextReservationId("car");
  }

  boost::asio::awaitable<std::string> SimulatedTripBookingActivities::BookHotelAsync(std::string name)
  {
    spdlog::info("Booking hotel for '{}'", name);
    co_await SimulateLatencyAsync(Config::HOTEL_BOOKING_DELAY);
    co_return NextReservationId("hotel");
  }

  boost::asio::awaitable<std::string> SimulatedTripBookingActivities::BookFlightAsync(std::string name)
  {
    spdlog::info("Booking flight for '{}'", name);
    co_await SimulateLatencyAsync(Config::FLIGHT_BOOKING_DELAY);
    if (m_config.FailFlightBooking)
    {
      throw std::runtime_error("Flight booking did not work");
    }
    co_return NextReservationId("flight");
  }

  boost::asio::awaitable<std::string> SimulatedTripBookingActivities::CancelCarAsync(std::string reservationId, std::string name)
  {
    co_await SimulateLatencyAsync(Config::CANCELLATION_DELAY);
    spdlog::info("Cancelled car reservation '{}' for '{}'", reservationId, name);
    co_return fmt::format("cancelled {}", reservationId);
  }

  boost::asio::awaitable<std::string> SimulatedTripBookingActivities::CancelHotelAsync(std::string reservationId, std::string name)
  {
    co_await SimulateLatencyAsync(Config::CANCELLATION_DELAY);
    spdlog::info("Cancelled hotel booking '{}' for '{}'", reservationId, name);
    co_return fmt::format("cancelled {}", reservationId);
  }

  boost::asio::awaitable<std::string> SimulatedTripBookingActivities::CancelFlightAsync(std::string reservationId, std::string name)
  {
    co_await SimulateLatencyAsync(Config::CANCELLATION_DELAY);
    spdlog::info("Cancelled flight booking '{}' for '{}'", reservationId, name);
    co_return fmt::format("cancelled {}", reservationId);
  }

  boost::asio::awaitable<void> SimulatedTripBookingActivities::SimulateLatencyAsync(const std::chrono::milliseconds delay) const
  {
    if (m_config.DelayScale <= 0)
    {
      co_return;
    }
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    timer.expires_after(delay * m_config.DelayScale);
    co_await timer.async_wait(boost::asio::use_awaitable);
  }

  std::string SimulatedTripBookingActivities::NextReservationId(const char* prefix)
  {
    return fmt::format("{}-{}", prefix, m_nextReservation.fetch_add(1));
  }
}
