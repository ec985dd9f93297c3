/*
 * Copyright (C) 2021 Open Source Robotics Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
*/

#include <rmf_utils/catch.hpp>

#include <lodging/reservations/Reservation.hpp>

#include <stdexcept>

using namespace lodging;
using namespace lodging::reservations;

namespace {
Date june(unsigned int day)
{
  return Date::from_ymd(2024, 6, day);
}
} // anonymous namespace

SCENARIO("Reservation totals")
{
  const auto room = std::make_shared<Room>("101", RoomCategory::Standard);

  GIVEN("A three night stay at the category rate")
  {
    const auto reservation = Reservation::make(
      "BK-1", "G-1", room, DateRange(june(1), june(4)));

    CHECK(reservation.booking_id() == "BK-1");
    CHECK(reservation.guest_id() == "G-1");
    CHECK(reservation.room() == room);
    CHECK(reservation.nights() == 3);
    CHECK(reservation.check_in() == june(1));
    CHECK(reservation.check_out() == june(4));
    CHECK(reservation.total_amount().to_string() == "300.00");
    CHECK(reservation.status() == Reservation::Status::PendingPayment);
    CHECK(reservation.is_active());

    WHEN("The room price changes afterwards")
    {
      room->price_per_night(Money::from_units(500));
      THEN("The total stays the same")
      {
        CHECK(reservation.total_amount() == Money::from_units(300));
      }
    }
  }

  GIVEN("An explicit nightly price")
  {
    const auto reservation = Reservation::make(
      "BK-2", "G-1", room, DateRange(june(1), june(3)),
      Money::from_units(99, 99));

    CHECK(reservation.total_amount() == Money::from_units(199, 98));
  }

  GIVEN("Invalid arguments")
  {
    CHECK_THROWS_AS(
      Reservation::make("BK-3", "G-1", room, DateRange(june(4), june(4))),
      std::invalid_argument);

    CHECK_THROWS_AS(
      Reservation::make("BK-4", "G-1", room, DateRange(june(4), june(1))),
      std::invalid_argument);

    CHECK_THROWS_AS(
      Reservation::make("BK-5", "G-1", nullptr, DateRange(june(1), june(4))),
      std::invalid_argument);

    CHECK_THROWS_AS(
      Reservation::make(
        "BK-6", "G-1", room, DateRange(june(1), june(4)),
        Money::from_cents(4000000000000000000)),
      std::overflow_error);
  }
}

SCENARIO("Test reservation conflicts_with")
{
  const auto room_101 = std::make_shared<Room>("101", RoomCategory::Standard);
  const auto room_102 = std::make_shared<Room>("102", RoomCategory::Standard);

  const auto first = Reservation::make(
    "BK-1", "G-1", room_101, DateRange(june(1), june(4)));

  GIVEN("Two overlapping reservations for the same room")
  {
    const auto second = Reservation::make(
      "BK-2", "G-2", room_101, DateRange(june(3), june(6)));
    THEN("reservations conflict with each other")
    {
      CHECK(first.conflicts_with(second));
      CHECK(second.conflicts_with(first));
    }
  }

  GIVEN("Back to back reservations for the same room")
  {
    const auto second = Reservation::make(
      "BK-2", "G-2", room_101, DateRange(june(4), june(6)));
    THEN("reservations do not conflict with each other")
    {
      CHECK_FALSE(first.conflicts_with(second));
      CHECK_FALSE(second.conflicts_with(first));
    }
  }

  GIVEN("Two overlapping reservations for different rooms")
  {
    const auto second = Reservation::make(
      "BK-2", "G-2", room_102, DateRange(june(1), june(4)));
    THEN("reservations do not conflict with each other")
    {
      CHECK_FALSE(first.conflicts_with(second));
      CHECK_FALSE(second.conflicts_with(first));
    }
  }
}

SCENARIO("Reservation status names")
{
  CHECK(to_string(Reservation::Status::PendingPayment) == "PENDING_PAYMENT");
  CHECK(to_string(Reservation::Status::Confirmed) == "CONFIRMED");
  CHECK(to_string(Reservation::Status::Cancelled) == "CANCELLED");
  CHECK(to_string(Reservation::Status::CheckedIn) == "CHECKED_IN");
  CHECK(to_string(Reservation::Status::CheckedOut) == "CHECKED_OUT");
}
