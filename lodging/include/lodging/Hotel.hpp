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

#ifndef LODGING__HOTEL_HPP
#define LODGING__HOTEL_HPP

#include <lodging/Date.hpp>
#include <lodging/Guest.hpp>
#include <lodging/Result.hpp>
#include <lodging/Room.hpp>
#include <lodging/reservations/PaymentGateway.hpp>
#include <lodging/reservations/Reservation.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <chrono>
#include <optional>
#include <vector>

namespace lodging {

//==============================================================================
/// The Hotel owns the room inventory and every reservation made against it.
/// It is the only place where rooms get booked or released, which keeps each
/// room's booked nights equal to the nights of its active reservations.
///
/// All member functions are safe to call from several threads at once. Two
/// reservations that share a night on the same room can never both succeed.
class Hotel
{
public:

  using Reservation = reservations::Reservation;
  using BookingId = reservations::BookingId;
  using Duration = std::chrono::steady_clock::duration;

  //============================================================================
  /// Parameters that govern how requests are validated and how long payment
  /// may take.
  class Configuration
  {
  public:

    /// Default configuration.
    ///
    /// \param[in] payment_timeout
    ///   How long to wait for the payment gateway. Pass a std::nullopt to wait
    ///   as long as the gateway takes.
    ///
    /// \param[in] max_nights
    ///   The longest stay that can be searched for or reserved.
    Configuration(
      std::optional<Duration> payment_timeout = std::chrono::seconds(5),
      Date::Days max_nights = 365);

    /// Set the payment timeout.
    Configuration& payment_timeout(std::optional<Duration> timeout);

    /// Get the payment timeout.
    std::optional<Duration> payment_timeout() const;

    /// Set the longest stay allowed.
    Configuration& max_nights(Date::Days nights);

    /// Get the longest stay allowed.
    Date::Days max_nights() const;

    /// Refuse any check-in before this date, typically today. By default any
    /// check-in date is accepted.
    Configuration& earliest_check_in(std::optional<Date> date);

    /// Get the earliest accepted check-in.
    std::optional<Date> earliest_check_in() const;

    class Implementation;
  private:
    rmf_utils::impl_ptr<Implementation> _pimpl;
  };

  /// What a call to cancel() did
  enum class Cancellation : uint8_t
  {
    /// The reservation was confirmed and is now cancelled
    Cancelled = 0,

    /// The reservation had been cancelled before, so nothing changed
    AlreadyCancelled
  };

  /// Constructor
  ///
  /// \warning This will throw a std::invalid_argument if payment_gateway is a
  /// nullptr.
  ///
  /// \param[in] payment_gateway
  ///   Charged once for every reservation attempt that finds its room free.
  ///
  /// \param[in] config
  ///   Validation and timeout parameters.
  Hotel(
    reservations::PaymentGatewayPtr payment_gateway,
    Configuration config = Configuration());

  /// Get the configuration of this hotel.
  const Configuration& configuration() const;

  /// Add a room to the inventory.
  ///
  /// \warning This will throw a std::invalid_argument if the number is empty
  /// or already used by another room.
  ConstRoomPtr add_room(std::string number, RoomCategory category);

  /// Every room, in the order they were added.
  std::vector<ConstRoomPtr> rooms() const;

  /// Find a room by number. Returns a nullptr if there is no such room.
  ConstRoomPtr find_room(const std::string& number) const;

  /// Change the nightly price of a room. Reservations that already exist keep
  /// their totals.
  ///
  /// Fails with Error::Code::NotFound for an unknown room and with
  /// Error::Code::Validation for a negative price, or for a price whose total
  /// over the longest allowed stay would not fit in Money.
  Result<Money> set_price(const std::string& room_number, Money price);

  /// Find the rooms of a category that are free for every night of
  /// [check_in, check_out), in inventory order.
  ///
  /// The rooms are a snapshot. Another thread may book them before the caller
  /// acts, which reserve() will detect.
  ///
  /// Fails with Error::Code::Validation for a malformed range.
  Result<std::vector<ConstRoomPtr>> search(
    RoomCategory category,
    const Date& check_in,
    const Date& check_out) const;

  /// Reserve a room for a guest.
  ///
  /// The nights are held on the room first, then the payment gateway is
  /// charged for nights x the nightly price at the moment of the hold. If the
  /// payment does not go through, the held nights are released again and
  /// nothing is recorded.
  ///
  /// Fails with
  /// - Error::Code::Validation for a malformed range, or a total too large
  ///   for Money
  /// - Error::Code::NotFound if the room is not part of this hotel
  /// - Error::Code::Conflict if any night is already booked
  /// - Error::Code::Payment if the charge is declined, fails, or times out
  ///
  /// \return A snapshot of the confirmed reservation.
  Result<Reservation> reserve(
    const Guest& guest,
    const std::string& room_number,
    const Date& check_in,
    const Date& check_out);

  /// Same as above, for a room obtained from search() or rooms().
  Result<Reservation> reserve(
    const Guest& guest,
    const ConstRoomPtr& room,
    const Date& check_in,
    const Date& check_out);

  /// Cancel a reservation and release the nights it holds. The nights that
  /// are released are the ones stored in the reservation.
  ///
  /// Fails with Error::Code::NotFound for an unknown booking id, and with
  /// Error::Code::Validation if the reservation is in a state that cannot be
  /// cancelled.
  Result<Cancellation> cancel(const BookingId& booking_id);

  /// Look up a reservation. Fails with Error::Code::NotFound if there is no
  /// such booking.
  Result<Reservation> get(const BookingId& booking_id) const;

  /// Every reservation made by this guest, cancelled ones included, in the
  /// order they were made.
  std::vector<Reservation> list_by_guest(const GuestId& guest_id) const;

  /// Every reservation, cancelled ones included, in the order they were made.
  std::vector<Reservation> reservations() const;

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

//==============================================================================
/// Fill a hotel with the standard inventory: rooms 101 and 102 (Standard),
/// 201 and 202 (Deluxe), and 301 (Suite).
void make_default_inventory(Hotel& hotel);

} // namespace lodging

#endif // LODGING__HOTEL_HPP
