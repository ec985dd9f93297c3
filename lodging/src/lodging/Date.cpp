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

#include <lodging/Date.hpp>

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace lodging {

namespace {
//==============================================================================
struct CivilDate
{
  int64_t year;
  unsigned int month;
  unsigned int day;
};

//==============================================================================
bool is_leap_year(const int64_t y)
{
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

//==============================================================================
unsigned int days_in_month(const int64_t y, const unsigned int m)
{
  static const unsigned int table[12] =
  {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

  if (m == 2 && is_leap_year(y))
    return 29;

  return table[m-1];
}

//==============================================================================
// The two conversions below work in 400 year eras, each of which holds exactly
// 146097 days, with the year starting on March 1st so that the leap day falls
// at the end of the year.
Date::Days days_from_civil(
  int64_t y,
  const unsigned int m,
  const unsigned int d)
{
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y-399) / 400;
  const int64_t yoe = y - era * 400;
  const int64_t doy = (153*(m > 2 ? m-3 : m+9) + 2)/5 + d - 1;
  const int64_t doe = yoe * 365 + yoe/4 - yoe/100 + doy;
  return era * 146097 + doe - 719468;
}

//==============================================================================
CivilDate civil_from_days(Date::Days z)
{
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const int64_t doe = z - era * 146097;
  const int64_t yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
  const int64_t doy = doe - (365*yoe + yoe/4 - yoe/100);
  const int64_t mp = (5*doy + 2)/153;
  const auto d = static_cast<unsigned int>(doy - (153*mp + 2)/5 + 1);
  const auto m = static_cast<unsigned int>(mp < 10 ? mp+3 : mp-9);
  return CivilDate{yoe + era * 400 + (m <= 2), m, d};
}

//==============================================================================
bool read_digits(
  const std::string& text,
  const std::size_t begin,
  const std::size_t count,
  int& output)
{
  output = 0;
  for (std::size_t i = begin; i < begin + count; ++i)
  {
    const unsigned char c = static_cast<unsigned char>(text[i]);
    if (!std::isdigit(c))
      return false;

    output = output*10 + (c - '0');
  }

  return true;
}
} // anonymous namespace

//==============================================================================
Date Date::from_ymd(
  const int year,
  const unsigned int month,
  const unsigned int day)
{
  if (month < 1 || 12 < month)
  {
    throw std::invalid_argument(
      "[lodging::Date::from_ymd] Month [" + std::to_string(month)
      + "] is outside the range [1, 12]");
  }

  if (day < 1 || days_in_month(year, month) < day)
  {
    throw std::invalid_argument(
      "[lodging::Date::from_ymd] Day [" + std::to_string(day)
      + "] does not exist in month [" + std::to_string(month)
      + "] of year [" + std::to_string(year) + "]");
  }

  return Date(days_from_civil(year, month, day));
}

//==============================================================================
Date Date::from_days_since_epoch(const Days days)
{
  return Date(days);
}

//==============================================================================
auto Date::days_since_epoch() const -> Days
{
  return _days;
}

//==============================================================================
int Date::year() const
{
  return static_cast<int>(civil_from_days(_days).year);
}

//==============================================================================
unsigned int Date::month() const
{
  return civil_from_days(_days).month;
}

//==============================================================================
unsigned int Date::day() const
{
  return civil_from_days(_days).day;
}

//==============================================================================
Date Date::operator+(const Days days) const
{
  return Date(_days + days);
}

//==============================================================================
Date Date::operator-(const Days days) const
{
  return Date(_days - days);
}

//==============================================================================
Date& Date::operator+=(const Days days)
{
  _days += days;
  return *this;
}

//==============================================================================
Date& Date::operator++()
{
  ++_days;
  return *this;
}

//==============================================================================
bool Date::operator==(const Date& other) const
{
  return _days == other._days;
}

//==============================================================================
bool Date::operator!=(const Date& other) const
{
  return _days != other._days;
}

//==============================================================================
bool Date::operator<(const Date& other) const
{
  return _days < other._days;
}

//==============================================================================
bool Date::operator<=(const Date& other) const
{
  return _days <= other._days;
}

//==============================================================================
bool Date::operator>(const Date& other) const
{
  return _days > other._days;
}

//==============================================================================
bool Date::operator>=(const Date& other) const
{
  return _days >= other._days;
}

//==============================================================================
Date::Date()
: _days(0)
{
  // Do nothing
}

//==============================================================================
Date::Date(const Days days)
: _days(days)
{
  // Do nothing
}

//==============================================================================
Date::Days nights_between(const Date& check_in, const Date& check_out)
{
  return check_out.days_since_epoch() - check_in.days_since_epoch();
}

//==============================================================================
Date local_date(const std::time_t time)
{
  std::tm local;
  if (!localtime_r(&time, &local))
  {
    throw std::runtime_error(
      "[lodging::local_date] Unable to convert time ["
      + std::to_string(static_cast<long long>(time)) + "] to local time");
  }

  return Date::from_ymd(
    local.tm_year + 1900,
    static_cast<unsigned int>(local.tm_mon + 1),
    static_cast<unsigned int>(local.tm_mday));
}

//==============================================================================
std::optional<Date> parse_date(const std::string& text)
{
  if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    return std::nullopt;

  int year = 0;
  int month = 0;
  int day = 0;
  if (!read_digits(text, 0, 4, year)
    || !read_digits(text, 5, 2, month)
    || !read_digits(text, 8, 2, day))
  {
    return std::nullopt;
  }

  if (month < 1 || 12 < month)
    return std::nullopt;

  if (day < 1 || static_cast<int>(days_in_month(year, month)) < day)
    return std::nullopt;

  return Date::from_ymd(
    year, static_cast<unsigned int>(month), static_cast<unsigned int>(day));
}

//==============================================================================
std::string to_string(const Date& date)
{
  char buffer[32];
  std::snprintf(
    buffer, sizeof(buffer), "%04d-%02u-%02u",
    date.year(), date.month(), date.day());

  return buffer;
}

//==============================================================================
const Date& DateRange::const_iterator::operator*() const
{
  return _current;
}

//==============================================================================
const Date* DateRange::const_iterator::operator->() const
{
  return &_current;
}

//==============================================================================
auto DateRange::const_iterator::operator++() -> const_iterator&
{
  ++_current;
  return *this;
}

//==============================================================================
auto DateRange::const_iterator::operator++(int) -> const_iterator
{
  const_iterator copy(*this);
  ++_current;
  return copy;
}

//==============================================================================
bool DateRange::const_iterator::operator==(const const_iterator& other) const
{
  return _current == other._current;
}

//==============================================================================
bool DateRange::const_iterator::operator!=(const const_iterator& other) const
{
  return _current != other._current;
}

//==============================================================================
DateRange::const_iterator::const_iterator(Date current)
: _current(current)
{
  // Do nothing
}

//==============================================================================
DateRange::DateRange(Date check_in, Date check_out)
: _check_in(check_in),
  _check_out(check_out)
{
  // Do nothing
}

//==============================================================================
const Date& DateRange::check_in() const
{
  return _check_in;
}

//==============================================================================
const Date& DateRange::check_out() const
{
  return _check_out;
}

//==============================================================================
bool DateRange::valid() const
{
  return _check_in < _check_out;
}

//==============================================================================
Date::Days DateRange::nights() const
{
  if (!valid())
    return 0;

  return nights_between(_check_in, _check_out);
}

//==============================================================================
bool DateRange::contains(const Date& date) const
{
  return _check_in <= date && date < _check_out;
}

//==============================================================================
bool DateRange::overlaps(const DateRange& other) const
{
  if (!valid() || !other.valid())
    return false;

  return _check_in < other._check_out && other._check_in < _check_out;
}

//==============================================================================
auto DateRange::begin() const -> const_iterator
{
  return const_iterator(_check_in);
}

//==============================================================================
auto DateRange::end() const -> const_iterator
{
  // An invalid range must not be walked, so it ends where it begins
  return const_iterator(valid() ? _check_out : _check_in);
}

} // namespace lodging
