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

#ifndef LODGING__GUEST_HPP
#define LODGING__GUEST_HPP

#include <rmf_utils/impl_ptr.hpp>

#include <string>

namespace lodging {

using GuestId = std::string;

//==============================================================================
/// The person a reservation is made for. Reservations refer to a guest only by
/// id, so a Guest is a plain value that can be copied freely.
class Guest
{
public:

  /// \param[in] id
  ///   An opaque id, unique among all guests
  ///
  /// \param[in] username
  ///   The name the guest logs in with
  Guest(GuestId id, std::string username);

  const GuestId& id() const;

  const std::string& username() const;

  class Implementation;
private:
  rmf_utils::impl_ptr<Implementation> _pimpl;
};

} // namespace lodging

#endif // LODGING__GUEST_HPP
