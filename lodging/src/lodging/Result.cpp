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

#include <lodging/Result.hpp>

namespace lodging {

//==============================================================================
Error::Error(Code code, std::string message)
: _code(code),
  _message(std::move(message))
{
  // Do nothing
}

//==============================================================================
auto Error::code() const -> Code
{
  return _code;
}

//==============================================================================
const std::string& Error::message() const
{
  return _message;
}

//==============================================================================
std::string to_string(const Error::Code code)
{
  switch (code)
  {
    case Error::Code::Validation:
      return "ValidationError";
    case Error::Code::Conflict:
      return "ConflictError";
    case Error::Code::Payment:
      return "PaymentError";
    case Error::Code::NotFound:
      return "NotFoundError";
    case Error::Code::Duplicate:
      return "DuplicateError";
  }

  return "UnknownError";
}

} // namespace lodging
