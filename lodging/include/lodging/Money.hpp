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

#ifndef LODGING__MONEY_HPP
#define LODGING__MONEY_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace lodging {

//==============================================================================
/// An amount of money in the hotel's single currency, kept as a whole number
/// of cents so that multiplying a nightly rate by a number of nights is exact.
class Money
{
public:

  using Cents = int64_t;

  static Money from_cents(Cents cents);

  /// e.g. from_units(150, 50) is 150.50
  ///
  /// \warning This will throw a std::invalid_argument if cents is 100 or more.
  static Money from_units(int64_t whole, unsigned int cents = 0);

  Cents cents() const;

  /// Render the amount with two decimal places, e.g. "300.00"
  std::string to_string() const;

  Money operator+(const Money& other) const;
  Money operator-(const Money& other) const;
  /// \warning This will throw a std::overflow_error if the product does not
  /// fit.
  Money operator*(int64_t factor) const;

  bool operator==(const Money& other) const;
  bool operator!=(const Money& other) const;
  bool operator<(const Money& other) const;
  bool operator<=(const Money& other) const;
  bool operator>(const Money& other) const;
  bool operator>=(const Money& other) const;

  /// Zero
  Money();

private:
  explicit Money(Cents cents);
  Cents _cents;
};

//==============================================================================
/// Parse a non-negative amount such as "150", "150.5" or "150.50". Returns a
/// std::nullopt for malformed text, a negative amount, or more than two
/// decimal places.
std::optional<Money> parse_money(const std::string& text);

} // namespace lodging

#endif // LODGING__MONEY_HPP
