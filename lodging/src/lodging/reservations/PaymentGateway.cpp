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

#include <lodging/reservations/PaymentGateway.hpp>

#include <mutex>

namespace lodging {
namespace reservations {

//==============================================================================
class SimulatedPaymentGateway::Implementation
{
public:
  bool decline = false;
  std::size_t attempts = 0;
  Money collected;
  mutable std::mutex mutex;
};

//==============================================================================
SimulatedPaymentGateway& SimulatedPaymentGateway::decline_all(bool decline)
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  _pimpl->decline = decline;
  return *this;
}

//==============================================================================
bool SimulatedPaymentGateway::decline_all() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->decline;
}

//==============================================================================
std::size_t SimulatedPaymentGateway::attempts() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->attempts;
}

//==============================================================================
Money SimulatedPaymentGateway::collected() const
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  return _pimpl->collected;
}

//==============================================================================
auto SimulatedPaymentGateway::charge(const Money& amount) -> Charge
{
  std::lock_guard<std::mutex> lock(_pimpl->mutex);
  ++_pimpl->attempts;
  if (_pimpl->decline)
    return Charge::Declined;

  _pimpl->collected = _pimpl->collected + amount;
  return Charge::Approved;
}

//==============================================================================
SimulatedPaymentGateway::SimulatedPaymentGateway()
: _pimpl(rmf_utils::make_unique_impl<Implementation>())
{
  // Do nothing
}

} // namespace reservations
} // namespace lodging
