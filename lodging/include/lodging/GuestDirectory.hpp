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

#ifndef LODGING__GUESTDIRECTORY_HPP
#define LODGING__GUESTDIRECTORY_HPP

#include <lodging/Guest.hpp>
#include <lodging/Result.hpp>

#include <optional>

namespace lodging {

//==============================================================================
/// Registers guests and checks their credentials. Passwords are stored and
/// compared exactly as they are given.
class GuestDirectory
{
public:

  /// Register a new guest.
  ///
  /// Fails with Error::Code::Duplicate if the username is already registered,
  /// or with Error::Code::Validation if the username or password is empty.
  Result<Guest> register_guest(
    const std::string& username,
    const std::string& password);

  /// Look up a guest by their credentials. An unknown username and a wrong
  /// password both fail with Error::Code::NotFound.
  Result<Guest> login(
    const std::string& username,
    const std::string& password) const;

  /// Look up a guest by username.
  std::optional<Guest> find(const std::string& username) const;

  /// Number of registered guests.
  std::size_t size() const;

  GuestDirectory();

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace lodging

#endif // LODGING__GUESTDIRECTORY_HPP
