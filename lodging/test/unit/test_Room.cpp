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

#include <lodging/Room.hpp>

using namespace lodging;

namespace {
Date june(unsigned int day)
{
  return Date::from_ymd(2024, 6, day);
}
} // anonymous namespace

SCENARIO("A room starts from its category")
{
  Room room("201", RoomCategory::Deluxe);
  CHECK(room.number() == "201");
  CHECK(room.category() == RoomCategory::Deluxe);
  CHECK(room.price_per_night() == Money::from_units(150));
  CHECK(room.capacity() == 3);
  CHECK(room.booked_dates().empty());

  WHEN("The price is changed")
  {
    room.price_per_night(Money::from_units(175));
    THEN("Only this room is affected")
    {
      CHECK(room.price_per_night() == Money::from_units(175));
      CHECK(describe(RoomCategory::Deluxe).base_price
        == Money::from_units(150));
      CHECK(Room("202", RoomCategory::Deluxe).price_per_night()
        == Money::from_units(150));
    }
  }
}

SCENARIO("Booking nights on a room")
{
  Room room("101", RoomCategory::Standard);

  GIVEN("Two stays that do not overlap")
  {
    room.book_dates(june(1), june(4));
    room.book_dates(june(10), june(12));

    THEN("Every night of either stay is unavailable")
    {
      for (unsigned int day : {1u, 2u, 3u, 10u, 11u})
      {
        CHECK(room.is_booked(june(day)));
        CHECK_FALSE(room.is_available(june(day), june(day + 1)));
      }
    }

    THEN("Ranges clear of both stays are available")
    {
      CHECK(room.is_available(june(4), june(10)));
      CHECK(room.is_available(june(12), june(20)));
      CHECK(room.is_available(june(1) - 5, june(1)));
    }

    THEN("A range that touches one night of a stay is not available")
    {
      CHECK_FALSE(room.is_available(june(3), june(5)));
      CHECK_FALSE(room.is_available(june(5), june(11)));
    }

    THEN("Only the nights are booked, not the check-out days")
    {
      CHECK(room.booked_dates().size() == 5);
      CHECK_FALSE(room.is_booked(june(4)));
      CHECK_FALSE(room.is_booked(june(12)));
    }
  }

  GIVEN("A range without nights")
  {
    room.book_dates(june(1), june(4));
    THEN("It is reported as available")
    {
      CHECK(room.is_available(june(2), june(2)));
      CHECK(room.is_available(june(3), june(1)));
    }
  }

  GIVEN("Nights that are booked twice")
  {
    room.book_dates(june(1), june(4));
    room.book_dates(june(2), june(3));
    THEN("They are only recorded once")
    {
      CHECK(room.booked_dates().size() == 3);
    }
  }

  GIVEN("Nights that were never booked")
  {
    room.book_dates(june(1), june(4));
    room.unbook_dates(june(10), june(15));
    THEN("Releasing them changes nothing")
    {
      CHECK(room.booked_dates().size() == 3);
    }
  }
}

SCENARIO("Booking then releasing the same nights restores the room")
{
  Room room("102", RoomCategory::Standard);
  room.book_dates(june(1), june(3));
  room.book_dates(june(20), june(25));
  const auto before = room.booked_dates();

  room.book_dates(june(5), june(15));
  CHECK(room.booked_dates().size() == before.size() + 10);

  room.unbook_dates(june(5), june(15));
  CHECK(room.booked_dates() == before);
}

SCENARIO("Holding nights on a room")
{
  Room room("301", RoomCategory::Suite);

  WHEN("The nights are free")
  {
    const auto price = room.hold_if_available(june(1), june(4));
    THEN("They are booked and the nightly price is reported")
    {
      REQUIRE(price.has_value());
      CHECK(*price == Money::from_units(250));
      CHECK(room.booked_dates().size() == 3);
    }

    AND_WHEN("An overlapping hold is attempted")
    {
      const auto before = room.booked_dates();
      const auto second = room.hold_if_available(june(3), june(6));
      THEN("It is refused and nothing changes")
      {
        CHECK_FALSE(second.has_value());
        CHECK(room.booked_dates() == before);
      }
    }
  }
}
