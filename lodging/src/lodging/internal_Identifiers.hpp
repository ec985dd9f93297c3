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

#ifndef SRC__LODGING__INTERNAL_IDENTIFIERS_HPP
#define SRC__LODGING__INTERNAL_IDENTIFIERS_HPP

#include <rmf_utils/AssignID.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace lodging {

//==============================================================================
/// Hands out identifiers such as "BK-00000000000000000001". The sequence
/// number is zero padded to the width of the largest uint64_t, so identifiers
/// always sort in the order they were assigned, and the underlying counter
/// never repeats a value.
class IdentifierSequence
{
public:

  using Counter = rmf_utils::AssignID<uint64_t>;

  IdentifierSequence(std::string prefix, uint64_t first = 1)
  : _prefix(std::move(prefix)),
    _counter(std::make_shared<Counter>(first))
  {
    // Do nothing
  }

  std::string next() const
  {
    char digits[32];
    std::snprintf(
      digits, sizeof(digits), "%020llu",
      static_cast<unsigned long long>(_counter->assign()));

    return _prefix + "-" + digits;
  }

private:
  std::string _prefix;
  std::shared_ptr<const Counter> _counter;
};

} // namespace lodging

#endif // SRC__LODGING__INTERNAL_IDENTIFIERS_HPP
