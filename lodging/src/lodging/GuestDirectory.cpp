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

#include <lodging/GuestDirectory.hpp>

#include "internal_Identifiers.hpp"

#include <mutex>
#include <unordered_map>

namespace lodging {

//==============================================================================
class GuestDirectory::Implementation
{
public:

  struct Account
  {
    Guest guest;
    std::string password;
  };

  Implementation()
  : ids("G")
  {
    // Do nothing
  }

  IdentifierSequence ids;
  std::unordered_map<std::string, Account> accounts;
  mutable std::mutex mutex;
};

//==============================================================================
Result<Guest> GuestDirectory::register_guest(
  const std::string& username,
  const std::string& password)
{
  if (username.empty() || password.empty())
  {
    return Error(
      Error::Code::Validation,
      "A username and a password are both required");
  }

  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  if (_pimpl->accounts.count(username) > 0)
  {
    return Error(
      Error::Code::Duplicate,
      "Username [" + username + "] is already registered");
  }

  Guest guest(_pimpl->ids.next(), username);
  _pimpl->accounts.insert({username, Implementation::Account{guest, password}});
  return guest;
}

//==============================================================================
Result<Guest> GuestDirectory::login(
  const std::string& username,
  const std::string& password) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->accounts.find(username);
  if (it == _pimpl->accounts.end() || it->second.password != password)
    return Error(Error::Code::NotFound, "Invalid username or password");

  return it->second.guest;
}

//==============================================================================
std::optional<Guest> GuestDirectory::find(const std::string& username) const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  const auto it = _pimpl->accounts.find(username);
  if (it == _pimpl->accounts.end())
    return std::nullopt;

  return it->second.guest;
}

//==============================================================================
std::size_t GuestDirectory::size() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->accounts.size();
}

//==============================================================================
GuestDirectory::GuestDirectory()
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  // Do nothing
}

} // namespace lodging
