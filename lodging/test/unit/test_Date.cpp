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

#include <lodging/Date.hpp>

#include <ctime>
#include <unordered_set>
#include <vector>

using namespace lodging;

SCENARIO("Calendar dates")
{
  GIVEN("The epoch")
  {
    const Date epoch = Date::from_ymd(1970, 1, 1);
    CHECK(epoch == Date());
    CHECK(epoch.days_since_epoch() == 0);
    CHECK(to_string(epoch) == "1970-01-01");
    CHECK(to_string(epoch - 1) == "1969-12-31");
  }

  GIVEN("A leap year")
  {
    const Date feb28 = Date::from_ymd(2024, 2, 28);
    THEN("February has a 29th")
    {
      CHECK(to_string(feb28 + 1) == "2024-02-29");
      CHECK(to_string(feb28 + 2) == "2024-03-01");
      CHECK(nights_between(feb28, Date::from_ymd(2025, 2, 28)) == 366);
    }
  }

  GIVEN("Days that do not exist")
  {
    CHECK_THROWS_AS(Date::from_ymd(2023, 2, 29), std::invalid_argument);
    CHECK_THROWS_AS(Date::from_ymd(2100, 2, 29), std::invalid_argument);
    CHECK_THROWS_AS(Date::from_ymd(2024, 13, 1), std::invalid_argument);
    CHECK_THROWS_AS(Date::from_ymd(2024, 4, 31), std::invalid_argument);
    CHECK_NOTHROW(Date::from_ymd(2000, 2, 29));
  }

  GIVEN("A date that is incremented")
  {
    Date date = Date::from_ymd(2024, 12, 31);
    ++date;
    CHECK(date.year() == 2025);
    CHECK(date.month() == 1);
    CHECK(date.day() == 1);

    date += 31;
    CHECK(to_string(date) == "2025-02-01");
  }

  GIVEN("Dates used as hash keys")
  {
    std::unordered_set<Date> dates;
    dates.insert(Date::from_ymd(2024, 6, 1));
    dates.insert(Date::from_days_since_epoch(
      Date::from_ymd(2024, 6, 1).days_since_epoch()));
    CHECK(dates.size() == 1);
  }
}

SCENARIO("Parsing dates")
{
  WHEN("The text is a well formed date")
  {
    const auto date = parse_date("2024-06-01");
    REQUIRE(date.has_value());
    CHECK(*date == Date::from_ymd(2024, 6, 1));
  }

  WHEN("The text is malformed")
  {
    CHECK_FALSE(parse_date("").has_value());
    CHECK_FALSE(parse_date("2024-6-1").has_value());
    CHECK_FALSE(parse_date("2024/06/01").has_value());
    CHECK_FALSE(parse_date("2024-06-01 ").has_value());
    CHECK_FALSE(parse_date("20a4-06-01").has_value());
  }

  WHEN("The text names a day that does not exist")
  {
    CHECK_FALSE(parse_date("2024-02-30").has_value());
    CHECK_FALSE(parse_date("2024-00-10").has_value());
    CHECK_FALSE(parse_date("2024-06-00").has_value());
  }
}

SCENARIO("Date ranges")
{
  const Date june1 = Date::from_ymd(2024, 6, 1);
  const Date june4 = Date::from_ymd(2024, 6, 4);

  GIVEN("A three night stay")
  {
    const DateRange stay(june1, june4);
    CHECK(stay.valid());
    CHECK(stay.nights() == 3);

    THEN("The check-out day is not one of the nights")
    {
      CHECK(stay.contains(june1));
      CHECK(stay.contains(june1 + 2));
      CHECK_FALSE(stay.contains(june4));
      CHECK_FALSE(stay.contains(june1 - 1));
    }

    THEN("Iterating visits each night once, in order")
    {
      const std::vector<Date> nights(stay.begin(), stay.end());
      REQUIRE(nights.size() == 3);
      CHECK(nights[0] == june1);
      CHECK(nights[1] == june1 + 1);
      CHECK(nights[2] == june1 + 2);
    }

    THEN("Back to back stays do not overlap")
    {
      CHECK_FALSE(stay.overlaps(DateRange(june4, june4 + 2)));
      CHECK_FALSE(stay.overlaps(DateRange(june1 - 2, june1)));
      CHECK(stay.overlaps(DateRange(june4 - 1, june4 + 1)));
      CHECK(stay.overlaps(DateRange(june1 + 1, june1 + 2)));
      CHECK(DateRange(june1 - 5, june4 + 5).overlaps(stay));
    }
  }

  GIVEN("Ranges without nights")
  {
    const DateRange same_day(june1, june1);
    const DateRange backwards(june4, june1);

    CHECK_FALSE(same_day.valid());
    CHECK_FALSE(backwards.valid());
    CHECK(same_day.nights() == 0);
    CHECK(backwards.nights() == 0);
    CHECK(same_day.begin() == same_day.end());
    CHECK(backwards.begin() == backwards.end());
    CHECK_FALSE(backwards.overlaps(DateRange(june1, june4)));
  }
}

namespace {
std::time_t local_time(int year, int month, int day, int hour, int minute)
{
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_isdst = -1;
  return std::mktime(&tm);
}
} // anonymous namespace

SCENARIO("Today's date follows the local calendar")
{
  const Date june_first = Date::from_ymd(2024, 6, 1);

  CHECK(local_date(local_time(2024, 6, 1, 0, 30)) == june_first);
  CHECK(local_date(local_time(2024, 6, 1, 12, 0)) == june_first);
  CHECK(local_date(local_time(2024, 6, 1, 23, 30)) == june_first);
  CHECK(local_date(local_time(2024, 6, 2, 0, 30)) == june_first + 1);
  CHECK(local_date(local_time(2024, 12, 31, 23, 59))
    == Date::from_ymd(2024, 12, 31));
}
