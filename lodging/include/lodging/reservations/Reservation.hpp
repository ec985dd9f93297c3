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

#ifndef LODGING__RESERVATIONS__RESERVATION_HPP
#define LODGING__RESERVATIONS__RESERVATION_HPP

#include <lodging/Date.hpp>
#include <lodging/Guest.hpp>
#include <lodging/Money.hpp>
#include <lodging/Room.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <string>

namespace lodging {
namespace reservations {

using BookingId = std::string;

//==============================================================================
/// \brief A guest's claim on one room for a range of nights.
///
/// Everything except the status is fixed when the reservation is made. In
/// particular the total is computed once from the nightly price given at
/// creation, so later price changes on the room do not touch it.
class Reservation
{
public:

  enum class Status : uint8_t
  {
    /// Created but not yet paid for. A reservation in this state is never
    /// stored by a Hotel.
    PendingPayment = 0,

    /// Paid for. The room's nights are booked.
    Confirmed,

    /// Cancelled. The room's nights have been released. This is final.
    Cancelled,

    /// The guest has arrived. Nothing moves a reservation here yet.
    CheckedIn,

    /// The guest has left. Nothing moves a reservation here yet.
    CheckedOut
  };

  ///===========================================================================
  /// \brief The unique id of this reservation.
  const BookingId& booking_id() const;

  ///===========================================================================
  /// \brief The id of the guest who holds the reservation.
  const GuestId& guest_id() const;

  ///===========================================================================
  /// \brief The room that is reserved.
  const ConstRoomPtr& room() const;

  ///===========================================================================
  /// \brief The nights of the stay, [check_in, check_out).
  const DateRange& stay() const;

  const Date& check_in() const;

  const Date& check_out() const;

  Date::Days nights() const;

  ///===========================================================================
  /// \brief nights() multiplied by the nightly price at creation time.
  Money total_amount() const;

  Status status() const;

  ///===========================================================================
  /// \brief True unless the reservation has been cancelled. The nights of an
  /// active reservation are booked on its room.
  bool is_active() const;

  ///===========================================================================
  /// \brief Returns true if both reservations are active, refer to the same
  /// room, and share at least one night.
  bool conflicts_with(const Reservation& other) const;

  ///===========================================================================
  /// \brief Creates a reservation in the PendingPayment state.
  ///
  /// \warning This will throw a std::invalid_argument if room is a nullptr or
  /// if the stay has no nights, and a std::overflow_error if the total does
  /// not fit in Money.
  ///
  /// \param[in] booking_id
  ///   A unique id for the reservation
  ///
  /// \param[in] guest_id
  ///   The guest making the reservation
  ///
  /// \param[in] room
  ///   The room being reserved
  ///
  /// \param[in] stay
  ///   The nights being reserved
  ///
  /// \param[in] nightly_price
  ///   The price of one night. The room's current price is not consulted.
  static Reservation make(
    BookingId booking_id,
    GuestId guest_id,
    ConstRoomPtr room,
    DateRange stay,
    Money nightly_price);

  ///===========================================================================
  /// \brief Creates a reservation priced at the room's current nightly price.
  static Reservation make(
    BookingId booking_id,
    GuestId guest_id,
    ConstRoomPtr room,
    DateRange stay);

  class Implementation;
private:
  Reservation(Implementation implementation);
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

//==============================================================================
/// e.g. "CONFIRMED"
std::string to_string(Reservation::Status status);

} // namespace reservations
} // namespace lodging

#endif // LODGING__RESERVATIONS__RESERVATION_HPP
