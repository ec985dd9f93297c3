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

#include <lodging/GuestDirectory.hpp>

#include <set>

using namespace lodging;

SCENARIO("Registering and logging in guests")
{
  GuestDirectory directory;
  CHECK(directory.size() == 0);

  GIVEN("A registered guest")
  {
    const auto alice = directory.register_guest("alice", "wonderland");
    REQUIRE(alice.success());
    CHECK(alice->username() == "alice");
    CHECK_FALSE(alice->id().empty());
    CHECK(directory.size() == 1);

    THEN("The right password logs in as the same guest")
    {
      const auto login = directory.login("alice", "wonderland");
      REQUIRE(login.success());
      CHECK(login->id() == alice->id());
    }

    THEN("A wrong password is reported like an unknown user")
    {
      const auto wrong_password = directory.login("alice", "WONDERLAND");
      const auto unknown_user = directory.login("bob", "wonderland");
      REQUIRE_FALSE(wrong_password.success());
      REQUIRE_FALSE(unknown_user.success());
      CHECK(wrong_password.error().code() == Error::Code::NotFound);
      CHECK(unknown_user.error().code() == Error::Code::NotFound);
      CHECK(wrong_password.error().message()
        == unknown_user.error().message());
    }

    THEN("The username cannot be registered again")
    {
      const auto again = directory.register_guest("alice", "other");
      REQUIRE_FALSE(again.success());
      CHECK(again.error().code() == Error::Code::Duplicate);
      CHECK(directory.size() == 1);
    }

    THEN("The guest can be found by username")
    {
      const auto found = directory.find("alice");
      REQUIRE(found.has_value());
      CHECK(found->id() == alice->id());
      CHECK_FALSE(directory.find("bob").has_value());
    }
  }

  WHEN("A username or password is missing")
  {
    const auto no_name = directory.register_guest("", "secret");
    const auto no_password = directory.register_guest("carol", "");
    REQUIRE_FALSE(no_name.success());
    REQUIRE_FALSE(no_password.success());
    CHECK(no_name.error().code() == Error::Code::Validation);
    CHECK(no_password.error().code() == Error::Code::Validation);
    CHECK(directory.size() == 0);
  }

  WHEN("Many guests are registered")
  {
    std::set<GuestId> ids;
    for (int i = 0; i < 20; ++i)
    {
      const auto guest = directory.register_guest(
        "guest_" + std::to_string(i), "password");
      REQUIRE(guest.success());
      ids.insert(guest->id());
    }

    THEN("Every guest has a different id")
    {
      CHECK(ids.size() == 20);
    }
  }
}

SCENARIO("Outcomes")
{
  const Result<int> good = 5;
  const Result<int> bad = Error(Error::Code::Conflict, "taken");

  CHECK(good.success());
  CHECK(static_cast<bool>(good));
  CHECK(*good == 5);
  CHECK_THROWS_AS(good.error(), std::runtime_error);

  CHECK_FALSE(bad.success());
  CHECK(bad.error().message() == "taken");
  CHECK(to_string(bad.error().code()) == "ConflictError");
  CHECK_THROWS_AS(bad.value(), std::runtime_error);
}
