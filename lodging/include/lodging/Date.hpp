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

#ifndef LODGING__DATE_HPP
#define LODGING__DATE_HPP

#include <cstdint>
#include <ctime>
#include <functional>
#include <iterator>
#include <optional>
#include <string>

namespace lodging {

//==============================================================================
/// A calendar day in the proleptic Gregorian calendar. Internally this is a
/// count of days since 1970-01-01, so arithmetic and ordering are cheap.
class Date
{
public:

  using Days = int64_t;

  /// Create a date from its calendar fields.
  ///
  /// \warning This will throw a std::invalid_argument if the fields do not
  /// describe a real day, e.g. 2023-02-29.
  static Date from_ymd(int year, unsigned int month, unsigned int day);

  /// Create a date from a count of days since 1970-01-01.
  static Date from_days_since_epoch(Days days);

  /// Days since 1970-01-01. Dates before the epoch are negative.
  Days days_since_epoch() const;

  int year() const;
  unsigned int month() const;
  unsigned int day() const;

  Date operator+(Days days) const;
  Date operator-(Days days) const;
  Date& operator+=(Days days);
  Date& operator++();

  bool operator==(const Date& other) const;
  bool operator!=(const Date& other) const;
  bool operator<(const Date& other) const;
  bool operator<=(const Date& other) const;
  bool operator>(const Date& other) const;
  bool operator>=(const Date& other) const;

  /// Default constructor gives 1970-01-01
  Date();

private:
  explicit Date(Days days);
  Days _days;
};

//==============================================================================
/// The signed number of whole days from check_in to check_out.
Date::Days nights_between(const Date& check_in, const Date& check_out);

//==============================================================================
/// The calendar day that time falls on in the local time zone.
///
/// \warning This will throw a std::runtime_error if the time cannot be
/// converted to local time.
Date local_date(std::time_t time);

//==============================================================================
/// Parse a date written as YYYY-MM-DD. Returns a std::nullopt if the text is
/// not in that exact format or does not describe a real day.
std::optional<Date> parse_date(const std::string& text);

//==============================================================================
/// Render a date as YYYY-MM-DD.
std::string to_string(const Date& date);

//==============================================================================
/// A stay, expressed as the half-open range of nights [check_in, check_out).
/// Iterating over a DateRange visits every night of the stay.
class DateRange
{
public:

  class const_iterator
  {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Date;
    using difference_type = Date::Days;
    using pointer = const Date*;
    using reference = const Date&;

    const Date& operator*() const;
    const Date* operator->() const;
    const_iterator& operator++();
    const_iterator operator++(int);
    bool operator==(const const_iterator& other) const;
    bool operator!=(const const_iterator& other) const;

    explicit const_iterator(Date current);

  private:
    Date _current;
  };

  DateRange(Date check_in, Date check_out);

  const Date& check_in() const;
  const Date& check_out() const;

  /// True if check_out is strictly after check_in.
  bool valid() const;

  /// The number of nights in the range, or 0 if the range is not valid.
  Date::Days nights() const;

  /// True if the given day is one of the nights of this range.
  bool contains(const Date& date) const;

  /// True if the two ranges share at least one night.
  bool overlaps(const DateRange& other) const;

  /// An empty iteration is produced for a range that is not valid.
  const_iterator begin() const;
  const_iterator end() const;

private:
  Date _check_in;
  Date _check_out;
};

} // namespace lodging

namespace std {
//==============================================================================
template<>
struct hash<lodging::Date>
{
  std::size_t operator()(const lodging::Date& date) const noexcept
  {
    return std::hash<lodging::Date::Days>()(date.days_since_epoch());
  }
};
} // namespace std

#endif // LODGING__DATE_HPP
