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

#ifndef LODGING__RESULT_HPP
#define LODGING__RESULT_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace lodging {

//==============================================================================
/// Describes why an operation could not be carried out. These are ordinary
/// outcomes that a caller is expected to handle.
class Error
{
public:

  enum class Code : uint8_t
  {
    /// The request itself was malformed, e.g. check-out is not after check-in
    Validation = 0,

    /// The room is already booked for at least one of the requested nights
    Conflict,

    /// The payment collaborator declined the charge or did not answer in time
    Payment,

    /// A lookup by id or username found nothing
    NotFound,

    /// The name being registered is already taken
    Duplicate
  };

  Error(Code code, std::string message);

  Code code() const;

  const std::string& message() const;

private:
  Code _code;
  std::string _message;
};

//==============================================================================
/// e.g. "ConflictError"
std::string to_string(Error::Code code);

//==============================================================================
/// Either the value produced by an operation or the Error that prevented it.
template<typename T>
class Result
{
public:

  Result(T value)
  : _storage(std::in_place_index<0>, std::move(value))
  {
    // Do nothing
  }

  Result(Error error)
  : _storage(std::in_place_index<1>, std::move(error))
  {
    // Do nothing
  }

  bool success() const
  {
    return _storage.index() == 0;
  }

  explicit operator bool() const
  {
    return success();
  }

  /// \warning This will throw a std::runtime_error if the operation failed.
  const T& value() const
  {
    if (!success())
    {
      throw std::runtime_error(
        "[lodging::Result::value] Accessing the value of a failed result: "
        + std::get<1>(_storage).message());
    }

    return std::get<0>(_storage);
  }

  T& value()
  {
    return const_cast<T&>(static_cast<const Result&>(*this).value());
  }

  const T& operator*() const
  {
    return value();
  }

  T& operator*()
  {
    return value();
  }

  const T* operator->() const
  {
    return &value();
  }

  T* operator->()
  {
    return &value();
  }

  /// \warning This will throw a std::runtime_error if the operation succeeded.
  const Error& error() const
  {
    if (success())
    {
      throw std::runtime_error(
        "[lodging::Result::error] Accessing the error of a successful result");
    }

    return std::get<1>(_storage);
  }

private:
  std::variant<T, Error> _storage;
};

} // namespace lodging

#endif // LODGING__RESULT_HPP
