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

#include <lodging/RoomCategory.hpp>

#include <algorithm>
#include <cctype>

namespace lodging {

namespace {
//==============================================================================
struct CatalogEntry
{
  const char* key;
  CategoryInfo info;
};

//==============================================================================
const std::array<CatalogEntry, 3>& catalog()
{
  // Indexed by the value of RoomCategory
  static const std::array<CatalogEntry, 3> entries =
  {
    CatalogEntry{"STANDARD", {"Standard Room", Money::from_units(100), 2}},
    CatalogEntry{"DELUXE", {"Deluxe Room", Money::from_units(150), 3}},
    CatalogEntry{"SUITE", {"Suite", Money::from_units(250), 4}}
  };

  return entries;
}
} // anonymous namespace

//==============================================================================
const CategoryInfo& describe(const RoomCategory category)
{
  return catalog().at(static_cast<std::size_t>(category)).info;
}

//==============================================================================
const std::array<RoomCategory, 3>& all_categories()
{
  static const std::array<RoomCategory, 3> categories =
  {
    RoomCategory::Standard,
    RoomCategory::Deluxe,
    RoomCategory::Suite
  };

  return categories;
}

//==============================================================================
std::string to_string(const RoomCategory category)
{
  return catalog().at(static_cast<std::size_t>(category)).key;
}

//==============================================================================
std::optional<RoomCategory> parse_category(const std::string& text)
{
  std::string key = text;
  std::transform(key.begin(), key.end(), key.begin(),
    [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  for (const auto category : all_categories())
  {
    if (key == catalog()[static_cast<std::size_t>(category)].key)
      return category;
  }

  return std::nullopt;
}

} // namespace lodging
