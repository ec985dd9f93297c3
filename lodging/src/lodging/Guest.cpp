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

#include <lodging/Guest.hpp>

namespace lodging {

//==============================================================================
class Guest::Implementation
{
public:
  GuestId id;
  std::string username;
};

//==============================================================================
Guest::Guest(GuestId id, std::string username)
: _pimpl(rmf_utils::make_impl<Implementation>(
      Implementation{std::move(id), std::move(username)}))
{
  // Do nothing
}

//==============================================================================
const GuestId& Guest::id() const
{
  return _pimpl->id;
}

//==============================================================================
const std::string& Guest::username() const
{
  return _pimpl->username;
}

} // namespace lodging
