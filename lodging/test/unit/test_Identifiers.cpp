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

#include <rmf_utils/catch.hpp>

#include <src/lodging/internal_Identifiers.hpp>

#include <vector>

using namespace lodging;

SCENARIO("Identifiers sort in the order they were assigned")
{
  GIVEN("A fresh sequence")
  {
    const IdentifierSequence ids("BK");
    CHECK(ids.next() == "BK-00000000000000000001");
    CHECK(ids.next() == "BK-00000000000000000002");
  }

  GIVEN("A sequence that passes a power of ten")
  {
    const IdentifierSequence ids("BK", 99999998);

    std::vector<std::string> assigned;
    for (std::size_t i = 0; i < 4; ++i)
      assigned.push_back(ids.next());

    CHECK(assigned.front() == "BK-00000000000099999998");
    CHECK(assigned.back() == "BK-00000000000100000001");
    for (std::size_t i = 1; i < assigned.size(); ++i)
      CHECK(assigned[i-1] < assigned[i]);
  }

  GIVEN("A sequence near the end of its range")
  {
    const IdentifierSequence ids("G", 18446744073709551614ull);
    const auto first = ids.next();
    const auto second = ids.next();
    CHECK(first == "G-18446744073709551614");
    CHECK(first < second);
  }
}
