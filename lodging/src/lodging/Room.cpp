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

#include <lodging/Room.hpp>

#include <mutex>

namespace lodging {

//==============================================================================
class Room::Implementation
{
public:

  Implementation(std::string number_, RoomCategory category_)
  : number(std::move(number_)),
    category(category_),
    price(describe(category_).base_price),
    capacity(describe(category_).capacity)
  {
    // Do nothing
  }

  // The caller must hold the mutex
  bool available(const DateRange& range) const
  {
    for (const auto& night : range)
    {
      if (booked.count(night) > 0)
        return false;
    }

    return true;
  }

  // The caller must hold the mutex
  void book(const DateRange& range)
  {
    for (const auto& night : range)
      booked.insert(night);
  }

  const std::string number;
  const RoomCategory category;
  Money price;
  const uint32_t capacity;
  std::set<Date> booked;

  mutable std::mutex mutex;
};

//==============================================================================
Room::Room(std::string number, RoomCategory category)
: _pimpl(rmf_utils::make_unique_impl<Implementation>(
      std::move(number), category))
{
  // Do nothing
}

//==============================================================================
const std::string& Room::number() const
{
  return _pimpl->number;
}

//==============================================================================
RoomCategory Room::category() const
{
  return _pimpl->category;
}

//==============================================================================
Money Room::price_per_night() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->price;
}

//==============================================================================
Room& Room::price_per_night(Money price)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->price = price;
  return *this;
}

//==============================================================================
uint32_t Room::capacity() const
{
  return _pimpl->capacity;
}

//==============================================================================
bool Room::is_available(const Date& check_in, const Date& check_out) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->available(DateRange(check_in, check_out));
}

//==============================================================================
void Room::book_dates(const Date& check_in, const Date& check_out)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->book(DateRange(check_in, check_out));
}

//==============================================================================
void Room::unbook_dates(const Date& check_in, const Date& check_out)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  for (const auto& night : DateRange(check_in, check_out))
    _pimpl->booked.erase(night);
}

//==============================================================================
std::optional<Money> Room::hold_if_available(
  const Date& check_in,
  const Date& check_out)
{
  const DateRange range(check_in, check_out);

  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  if (!_pimpl->available(range))
    return std::nullopt;

  _pimpl->book(range);
  return _pimpl->price;
}

//==============================================================================
bool Room::is_booked(const Date& night) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->booked.count(night) > 0;
}

//==============================================================================
std::set<Date> Room::booked_dates() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->booked;
}

} // namespace lodging
