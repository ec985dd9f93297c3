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

#ifndef LODGING__ROOM_HPP
#define LODGING__ROOM_HPP

#include <lodging/Date.hpp>
#include <lodging/Money.hpp>
#include <lodging/RoomCategory.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>
#include <optional>
#include <set>
#include <string>

namespace lodging {

//==============================================================================
/// One physical room. A room keeps track of which nights it is booked for, one
/// entry per night. The nights are changed only through book_dates(),
/// unbook_dates() and hold_if_available().
///
/// Every member function may be called from several threads at once. Each call
/// is atomic with respect to the others, but a sequence of calls is not, so
/// is_available() followed by book_dates() can race with another booking. Use
/// hold_if_available() when the check and the booking must happen together.
class Room
{
public:

  /// Create a room. The nightly price and the capacity are copied from the
  /// category.
  Room(std::string number, RoomCategory category);

  /// The room number, unique within a Hotel.
  const std::string& number() const;

  RoomCategory category() const;

  /// The current nightly price.
  Money price_per_night() const;

  /// Change the nightly price. This has no effect on the totals of
  /// reservations that were already made.
  Room& price_per_night(Money price);

  uint32_t capacity() const;

  /// Returns false if any night in [check_in, check_out) is booked. A range
  /// where check_out is not after check_in has no nights, so it is reported as
  /// available. Validating the range is the caller's job.
  bool is_available(const Date& check_in, const Date& check_out) const;

  /// Mark every night in [check_in, check_out) as booked. This does not check
  /// availability first, and booking a night twice has no extra effect.
  void book_dates(const Date& check_in, const Date& check_out);

  /// Release every night in [check_in, check_out). Nights that were not booked
  /// are ignored.
  void unbook_dates(const Date& check_in, const Date& check_out);

  /// Check availability and book the nights in one step. If any night is
  /// already booked, nothing changes and a std::nullopt is returned. Otherwise
  /// the nights are booked and the nightly price at that instant is returned.
  std::optional<Money> hold_if_available(
    const Date& check_in,
    const Date& check_out);

  /// True if this particular night is booked.
  bool is_booked(const Date& night) const;

  /// A copy of every booked night, in calendar order.
  std::set<Date> booked_dates() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

using RoomPtr = std::shared_ptr<Room>;
using ConstRoomPtr = std::shared_ptr<const Room>;

} // namespace lodging

#endif // LODGING__ROOM_HPP
