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

#ifndef SRC__LODGING__RESERVATIONS__INTERNAL_RESERVATION_HPP
#define SRC__LODGING__RESERVATIONS__INTERNAL_RESERVATION_HPP

#include <lodging/reservations/Reservation.hpp>

namespace lodging {
namespace reservations {

//==============================================================================
class Reservation::Implementation
{
public:

  BookingId booking_id;
  GuestId guest_id;
  ConstRoomPtr room;
  DateRange stay;
  Money total;
  Status status;

  /// PendingPayment -> Confirmed. Returns false for any other starting state.
  static bool confirm(Reservation& reservation)
  {
    auto& status = reservation._pimpl->status;
    if (status != Status::PendingPayment)
      return false;

    status = Status::Confirmed;
    return true;
  }

  /// Confirmed -> Cancelled. Returns false for any other starting state.
  static bool cancel(Reservation& reservation)
  {
    auto& status = reservation._pimpl->status;
    if (status != Status::Confirmed)
      return false;

    status = Status::Cancelled;
    return true;
  }
};

} // namespace reservations
} // namespace lodging

#endif // SRC__LODGING__RESERVATIONS__INTERNAL_RESERVATION_HPP
