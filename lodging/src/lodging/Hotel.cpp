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

#include <lodging/Hotel.hpp>

#include "internal_Identifiers.hpp"
#include "reservations/internal_Reservation.hpp"
#include "reservations/internal_TimedCharge.hpp"

#include <iostream>
#include <limits>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

namespace lodging {

//==============================================================================
class Hotel::Configuration::Implementation
{
public:

  std::optional<Duration> payment_timeout;
  Date::Days max_nights;
  std::optional<Date> earliest_check_in;

};

//==============================================================================
Hotel::Configuration::Configuration(
  std::optional<Duration> payment_timeout,
  Date::Days max_nights)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{payment_timeout, max_nights, std::nullopt}))
{
  // Do nothing
}

//==============================================================================
auto Hotel::Configuration::payment_timeout(std::optional<Duration> timeout)
-> Configuration&
{
  _pimpl->payment_timeout = timeout;
  return *this;
}

//==============================================================================
auto Hotel::Configuration::payment_timeout() const -> std::optional<Duration>
{
  return _pimpl->payment_timeout;
}

//==============================================================================
auto Hotel::Configuration::max_nights(Date::Days nights) -> Configuration&
{
  _pimpl->max_nights = nights;
  return *this;
}

//==============================================================================
Date::Days Hotel::Configuration::max_nights() const
{
  return _pimpl->max_nights;
}

//==============================================================================
auto Hotel::Configuration::earliest_check_in(std::optional<Date> date)
-> Configuration&
{
  _pimpl->earliest_check_in = date;
  return *this;
}

//==============================================================================
std::optional<Date> Hotel::Configuration::earliest_check_in() const
{
  return _pimpl->earliest_check_in;
}

namespace {
//==============================================================================
/// Releases the nights of a hold unless the reservation that owns them gets
/// committed.
class DateHold
{
public:

  DateHold(RoomPtr room, DateRange stay)
  : _room(std::move(room)),
    _stay(stay)
  {
    // Do nothing
  }

  DateHold(const DateHold&) = delete;
  DateHold& operator=(const DateHold&) = delete;

  void commit()
  {
    _committed = true;
  }

  ~DateHold()
  {
    if (!_committed)
      _room->unbook_dates(_stay.check_in(), _stay.check_out());
  }

private:
  RoomPtr _room;
  DateRange _stay;
  bool _committed = false;
};

//==============================================================================
std::string describe_stay(const DateRange& stay)
{
  return "[" + to_string(stay.check_in()) + ", "
    + to_string(stay.check_out()) + ")";
}

//==============================================================================
/// True if nights x price can be represented.
bool fits_total(const Money& price, const Date::Days nights)
{
  if (nights <= 0 || price.cents() <= 0)
    return true;

  return price.cents() <= std::numeric_limits<Money::Cents>::max() / nights;
}

//==============================================================================
reservations::PaymentGatewayPtr require_gateway(
  reservations::PaymentGatewayPtr gateway)
{
  if (!gateway)
  {
    throw std::invalid_argument(
      "[lodging::Hotel::Hotel] nullptr given for the payment gateway");
  }

  return gateway;
}

} // anonymous namespace

//==============================================================================
class Hotel::Implementation
{
public:

  struct Entry
  {
    Reservation reservation;

    // The same room as reservation.room(), kept mutable so that cancelling
    // can release its nights.
    RoomPtr room;
  };

  Implementation(
    reservations::PaymentGatewayPtr gateway_,
    Configuration config_)
  : gateway(std::move(gateway_)),
    config(std::move(config_)),
    booking_ids("BK")
  {
    // Do nothing
  }

  reservations::PaymentGatewayPtr gateway;
  Configuration config;

  IdentifierSequence booking_ids;

  std::vector<RoomPtr> rooms;
  std::unordered_map<std::string, RoomPtr> rooms_by_number;
  mutable std::shared_mutex inventory_mutex;

  // Booking ids sort in the order they were assigned, so iterating this map
  // visits reservations in creation order.
  std::map<BookingId, Entry> bookings;
  mutable std::mutex reservation_mutex;

  std::optional<Error> validate(const DateRange& stay) const
  {
    if (!stay.valid())
    {
      return Error(
        Error::Code::Validation,
        "Check-out date [" + to_string(stay.check_out())
        + "] must be after check-in date [" + to_string(stay.check_in())
        + "]");
    }

    if (stay.nights() > config.max_nights())
    {
      return Error(
        Error::Code::Validation,
        "A stay of " + std::to_string(stay.nights()) + " nights exceeds the "
        "limit of " + std::to_string(config.max_nights()) + " nights");
    }

    const auto earliest = config.earliest_check_in();
    if (earliest.has_value() && stay.check_in() < *earliest)
    {
      return Error(
        Error::Code::Validation,
        "Check-in date [" + to_string(stay.check_in())
        + "] cannot be before [" + to_string(*earliest) + "]");
    }

    return std::nullopt;
  }

  RoomPtr find(const std::string& number) const
  {
    std::shared_lock<std::shared_mutex> lock(inventory_mutex);
    const auto it = rooms_by_number.find(number);
    if (it == rooms_by_number.end())
      return nullptr;

    return it->second;
  }

  Result<Reservation> reserve(
    const Guest& guest,
    const RoomPtr& room,
    const DateRange& stay)
  {
    if (auto error = validate(stay))
      return *error;

    const auto price = room->hold_if_available(
      stay.check_in(), stay.check_out());

    if (!price.has_value())
    {
      return Error(
        Error::Code::Conflict,
        "Room " + room->number() + " is not available for the selected dates "
        + describe_stay(stay));
    }

    DateHold hold(room, stay);

    if (!fits_total(*price, stay.nights()))
    {
      return Error(
        Error::Code::Validation,
        "The total for " + std::to_string(stay.nights()) + " nights at ["
        + price->to_string() + "] per night is too large");
    }

    auto reservation = Reservation::make(
      booking_ids.next(), guest.id(), room, stay, *price);

    const Money total = reservation.total_amount();
    const auto outcome = reservations::charge_within(
      gateway, total, config.payment_timeout(), reservation.booking_id());

    using Outcome = reservations::ChargeOutcome::Type;
    switch (outcome.type)
    {
      case Outcome::Approved:
        break;
      case Outcome::Declined:
      {
        return Error(
          Error::Code::Payment,
          "Payment of [" + total.to_string() + "] was declined. "
          "Reservation could not be completed.");
      }
      case Outcome::TimedOut:
      {
        return Error(
          Error::Code::Payment,
          "Payment of [" + total.to_string() + "] did not complete in time. "
          "Reservation could not be completed.");
      }
      case Outcome::Failed:
      {
        std::cerr << "[lodging::Hotel::reserve] Payment gateway failed while "
                  << "charging [" << total.to_string() << "] for booking ["
                  << reservation.booking_id() << "]: " << outcome.reason
                  << std::endl;

        return Error(
          Error::Code::Payment,
          "Payment of [" + total.to_string() + "] failed: " + outcome.reason);
      }
    }

    Reservation::Implementation::confirm(reservation);

    std::lock_guard<std::mutex> lock(reservation_mutex);
    bookings.insert(
      {reservation.booking_id(), Entry{reservation, room}});
    hold.commit();

    return reservation;
  }
};

//==============================================================================
Hotel::Hotel(
  reservations::PaymentGatewayPtr payment_gateway,
  Configuration config)
: _pimpl(rmf_utils::make_unique_impl<Implementation>(
      require_gateway(std::move(payment_gateway)), std::move(config)))
{
  // Do nothing
}

//==============================================================================
auto Hotel::configuration() const -> const Configuration&
{
  return _pimpl->config;
}

//==============================================================================
ConstRoomPtr Hotel::add_room(std::string number, RoomCategory category)
{
  if (number.empty())
  {
    throw std::invalid_argument(
      "[lodging::Hotel::add_room] Room number must not be empty");
  }

  std::unique_lock<std::shared_mutex> lock(_pimpl->inventory_mutex);
  if (_pimpl->rooms_by_number.count(number) > 0)
  {
    throw std::invalid_argument(
      "[lodging::Hotel::add_room] Room number [" + number
      + "] is already in the inventory");
  }

  auto room = std::make_shared<Room>(number, category);
  _pimpl->rooms.push_back(room);
  _pimpl->rooms_by_number.insert({std::move(number), room});
  return room;
}

//==============================================================================
std::vector<ConstRoomPtr> Hotel::rooms() const
{
  std::shared_lock<std::shared_mutex> lock(_pimpl->inventory_mutex);
  return std::vector<ConstRoomPtr>(
    _pimpl->rooms.begin(), _pimpl->rooms.end());
}

//==============================================================================
ConstRoomPtr Hotel::find_room(const std::string& number) const
{
  return _pimpl->find(number);
}

//==============================================================================
Result<Money> Hotel::set_price(const std::string& room_number, Money price)
{
  if (price < Money())
  {
    return Error(
      Error::Code::Validation,
      "Price [" + price.to_string() + "] must not be negative");
  }

  if (!fits_total(price, _pimpl->config.max_nights()))
  {
    return Error(
      Error::Code::Validation,
      "Price [" + price.to_string() + "] is too large for a stay of "
      + std::to_string(_pimpl->config.max_nights()) + " nights");
  }

  const auto room = _pimpl->find(room_number);
  if (!room)
  {
    return Error(
      Error::Code::NotFound,
      "Room [" + room_number + "] not found");
  }

  room->price_per_night(price);
  return price;
}

//==============================================================================
Result<std::vector<ConstRoomPtr>> Hotel::search(
  const RoomCategory category,
  const Date& check_in,
  const Date& check_out) const
{
  const DateRange stay(check_in, check_out);
  if (auto error = _pimpl->validate(stay))
    return *error;

  std::vector<ConstRoomPtr> available;
  std::shared_lock<std::shared_mutex> lock(_pimpl->inventory_mutex);
  for (const auto& room : _pimpl->rooms)
  {
    if (room->category() != category)
      continue;

    if (room->is_available(check_in, check_out))
      available.push_back(room);
  }

  return available;
}

//==============================================================================
auto Hotel::reserve(
  const Guest& guest,
  const std::string& room_number,
  const Date& check_in,
  const Date& check_out) -> Result<Reservation>
{
  const auto room = _pimpl->find(room_number);
  if (!room)
  {
    return Error(
      Error::Code::NotFound,
      "Room [" + room_number + "] not found");
  }

  return _pimpl->reserve(guest, room, DateRange(check_in, check_out));
}

//==============================================================================
auto Hotel::reserve(
  const Guest& guest,
  const ConstRoomPtr& room,
  const Date& check_in,
  const Date& check_out) -> Result<Reservation>
{
  if (!room)
  {
    return Error(
      Error::Code::NotFound,
      "No room was given for the reservation");
  }

  const auto owned = _pimpl->find(room->number());
  if (owned != room)
  {
    return Error(
      Error::Code::NotFound,
      "Room [" + room->number() + "] does not belong to this hotel");
  }

  return _pimpl->reserve(guest, owned, DateRange(check_in, check_out));
}

//==============================================================================
auto Hotel::cancel(const BookingId& booking_id) -> Result<Cancellation>
{
  std::lock_guard<std::mutex> lock(_pimpl->reservation_mutex);
  const auto it = _pimpl->bookings.find(booking_id);
  if (it == _pimpl->bookings.end())
  {
    return Error(
      Error::Code::NotFound,
      "Booking with ID " + booking_id + " not found");
  }

  auto& entry = it->second;
  const auto status = entry.reservation.status();
  if (status == Reservation::Status::Cancelled)
    return Cancellation::AlreadyCancelled;

  if (!Reservation::Implementation::cancel(entry.reservation))
  {
    return Error(
      Error::Code::Validation,
      "Booking " + booking_id + " cannot be cancelled while its status is "
      + reservations::to_string(status));
  }

  const auto& stay = entry.reservation.stay();
  entry.room->unbook_dates(stay.check_in(), stay.check_out());
  return Cancellation::Cancelled;
}

//==============================================================================
auto Hotel::get(const BookingId& booking_id) const -> Result<Reservation>
{
  std::lock_guard<std::mutex> lock(_pimpl->reservation_mutex);
  const auto it = _pimpl->bookings.find(booking_id);
  if (it == _pimpl->bookings.end())
  {
    return Error(
      Error::Code::NotFound,
      "Booking with ID " + booking_id + " not found");
  }

  return it->second.reservation;
}

//==============================================================================
auto Hotel::list_by_guest(const GuestId& guest_id) const
-> std::vector<Reservation>
{
  std::vector<Reservation> found;
  std::lock_guard<std::mutex> lock(_pimpl->reservation_mutex);
  for (const auto& element : _pimpl->bookings)
  {
    const auto& reservation = element.second.reservation;
    if (reservation.guest_id() == guest_id)
      found.push_back(reservation);
  }

  return found;
}

//==============================================================================
auto Hotel::reservations() const -> std::vector<Reservation>
{
  std::vector<Reservation> all;
  std::lock_guard<std::mutex> lock(_pimpl->reservation_mutex);
  all.reserve(_pimpl->bookings.size());
  for (const auto& element : _pimpl->bookings)
    all.push_back(element.second.reservation);

  return all;
}

//==============================================================================
void make_default_inventory(Hotel& hotel)
{
  hotel.add_room("101", RoomCategory::Standard);
  hotel.add_room("102", RoomCategory::Standard);
  hotel.add_room("201", RoomCategory::Deluxe);
  hotel.add_room("202", RoomCategory::Deluxe);
  hotel.add_room("301", RoomCategory::Suite);
}

} // namespace lodging
