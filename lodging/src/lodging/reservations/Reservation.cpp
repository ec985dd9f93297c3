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

#include "internal_Reservation.hpp"

#include <stdexcept>

namespace lodging {
namespace reservations {

//==============================================================================
const BookingId& Reservation::booking_id() const
{
  return _pimpl->booking_id;
}

//==============================================================================
const GuestId& Reservation::guest_id() const
{
  return _pimpl->guest_id;
}

//==============================================================================
const ConstRoomPtr& Reservation::room() const
{
  return _pimpl->room;
}

//==============================================================================
const DateRange& Reservation::stay() const
{
  return _pimpl->stay;
}

//==============================================================================
const Date& Reservation::check_in() const
{
  return _pimpl->stay.check_in();
}

//==============================================================================
const Date& Reservation::check_out() const
{
  return _pimpl->stay.check_out();
}

//==============================================================================
Date::Days Reservation::nights() const
{
  return _pimpl->stay.nights();
}

//==============================================================================
Money Reservation::total_amount() const
{
  return _pimpl->total;
}

//==============================================================================
auto Reservation::status() const -> Status
{
  return _pimpl->status;
}

//==============================================================================
bool Reservation::is_active() const
{
  return _pimpl->status != Status::Cancelled;
}

//==============================================================================
bool Reservation::conflicts_with(const Reservation& other) const
{
  if (!is_active() || !other.is_active())
    return false;

  if (room()->number() != other.room()->number())
    return false;

  return stay().overlaps(other.stay());
}

//==============================================================================
Reservation Reservation::make(
  BookingId booking_id,
  GuestId guest_id,
  ConstRoomPtr room,
  DateRange stay,
  Money nightly_price)
{
  if (!room)
  {
    throw std::invalid_argument(
      "[lodging::reservations::Reservation::make] nullptr given for the room "
      "of booking [" + booking_id + "]");
  }

  if (!stay.valid())
  {
    throw std::invalid_argument(
      "[lodging::reservations::Reservation::make] Check-out ["
      + lodging::to_string(stay.check_out()) + "] is not after check-in ["
      + lodging::to_string(stay.check_in()) + "] for booking ["
      + booking_id + "]");
  }

  const Money total = nightly_price * stay.nights();
  return Reservation(
    Implementation{
      std::move(booking_id),
      std::move(guest_id),
      std::move(room),
      stay,
      total,
      Status::PendingPayment
    });
}

//==============================================================================
Reservation Reservation::make(
  BookingId booking_id,
  GuestId guest_id,
  ConstRoomPtr room,
  DateRange stay)
{
  const Money price = room ? room->price_per_night() : Money();
  return make(
    std::move(booking_id), std::move(guest_id), std::move(room), stay, price);
}

//==============================================================================
Reservation::Reservation(Implementation implementation)
: _pimpl(rmf_utils::make_impl<Implementation>(std::move(implementation)))
{
  // Do nothing
}

//==============================================================================
std::string to_string(const Reservation::Status status)
{
  using Status = Reservation::Status;
  switch (status)
  {
    case Status::PendingPayment:
      return "PENDING_PAYMENT";
    case Status::Confirmed:
      return "CONFIRMED";
    case Status::Cancelled:
      return "CANCELLED";
    case Status::CheckedIn:
      return "CHECKED_IN";
    case Status::CheckedOut:
      return "CHECKED_OUT";
  }

  return "UNKNOWN";
}

} // namespace reservations
} // namespace lodging
