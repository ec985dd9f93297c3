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

#include <lodging/Money.hpp>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace lodging {

//==============================================================================
Money Money::from_cents(const Cents cents)
{
  return Money(cents);
}

//==============================================================================
Money Money::from_units(const int64_t whole, const unsigned int cents)
{
  if (cents >= 100)
  {
    throw std::invalid_argument(
      "[lodging::Money::from_units] Cents [" + std::to_string(cents)
      + "] must be less than 100");
  }

  return Money(whole * 100 + static_cast<Cents>(cents));
}

//==============================================================================
auto Money::cents() const -> Cents
{
  return _cents;
}

//==============================================================================
std::string Money::to_string() const
{
  const Cents magnitude = _cents < 0 ? -_cents : _cents;
  const Cents fraction = magnitude % 100;

  std::string output = _cents < 0 ? "-" : "";
  output += std::to_string(magnitude / 100);
  output += fraction < 10 ? ".0" : ".";
  output += std::to_string(fraction);
  return output;
}

//==============================================================================
Money Money::operator+(const Money& other) const
{
  return Money(_cents + other._cents);
}

//==============================================================================
Money Money::operator-(const Money& other) const
{
  return Money(_cents - other._cents);
}

//==============================================================================
Money Money::operator*(const int64_t factor) const
{
  Cents product = 0;
  if (__builtin_mul_overflow(_cents, factor, &product))
  {
    throw std::overflow_error(
      "[lodging::Money::operator*] " + to_string() + " x "
      + std::to_string(factor) + " does not fit in the range of Money");
  }

  return Money(product);
}

//==============================================================================
bool Money::operator==(const Money& other) const
{
  return _cents == other._cents;
}

//==============================================================================
bool Money::operator!=(const Money& other) const
{
  return _cents != other._cents;
}

//==============================================================================
bool Money::operator<(const Money& other) const
{
  return _cents < other._cents;
}

//==============================================================================
bool Money::operator<=(const Money& other) const
{
  return _cents <= other._cents;
}

//==============================================================================
bool Money::operator>(const Money& other) const
{
  return _cents > other._cents;
}

//==============================================================================
bool Money::operator>=(const Money& other) const
{
  return _cents >= other._cents;
}

//==============================================================================
Money::Money()
: _cents(0)
{
  // Do nothing
}

//==============================================================================
Money::Money(const Cents cents)
: _cents(cents)
{
  // Do nothing
}

//==============================================================================
std::optional<Money> parse_money(const std::string& text)
{
  const auto dot = text.find('.');
  const std::string whole = text.substr(0, dot);
  const std::string fraction =
    dot == std::string::npos ? std::string() : text.substr(dot + 1);

  // Leave room for the cents without overflowing
  if (whole.empty() || whole.size() > 15 || fraction.size() > 2)
    return std::nullopt;

  if (dot != std::string::npos && fraction.empty())
    return std::nullopt;

  const auto all_digits = [](const std::string& s)
    {
      for (const char c : s)
      {
        if (!std::isdigit(static_cast<unsigned char>(c)))
          return false;
      }
      return true;
    };

  if (!all_digits(whole) || !all_digits(fraction))
    return std::nullopt;

  Money::Cents cents = std::strtoll(whole.c_str(), nullptr, 10) * 100;
  if (fraction.size() == 1)
    cents += (fraction[0] - '0') * 10;
  else if (fraction.size() == 2)
    cents += (fraction[0] - '0') * 10 + (fraction[1] - '0');

  return Money::from_cents(cents);
}

} // namespace lodging
