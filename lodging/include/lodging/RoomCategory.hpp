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

#ifndef LODGING__ROOMCATEGORY_HPP
#define LODGING__ROOMCATEGORY_HPP

#include <lodging/Money.hpp>

#include <array>
#include <optional>
#include <string>

namespace lodging {

//==============================================================================
enum class RoomCategory : uint8_t
{
  Standard = 0,
  Deluxe,
  Suite
};

//==============================================================================
/// Read-only metadata that every room of a category starts from.
struct CategoryInfo
{
  /// Name shown to guests, e.g. "Deluxe Room"
  std::string display_name;

  /// Nightly rate that new rooms of this category are given
  Money base_price;

  /// How many occupants a room of this category sleeps
  uint32_t capacity;
};

//==============================================================================
/// Look up the metadata of a category.
const CategoryInfo& describe(RoomCategory category);

//==============================================================================
/// Every category, in declaration order.
const std::array<RoomCategory, 3>& all_categories();

//==============================================================================
/// The upper case key of a category, e.g. "DELUXE".
std::string to_string(RoomCategory category);

//==============================================================================
/// Parse a category key, ignoring case. Returns a std::nullopt if the text does
/// not name a category.
std::optional<RoomCategory> parse_category(const std::string& text);

} // namespace lodging

#endif // LODGING__ROOMCATEGORY_HPP
