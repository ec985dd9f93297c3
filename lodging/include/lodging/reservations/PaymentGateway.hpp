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

#ifndef LODGING__RESERVATIONS__PAYMENTGATEWAY_HPP
#define LODGING__RESERVATIONS__PAYMENTGATEWAY_HPP

#include <lodging/Money.hpp>

#include <rmf_utils/impl_ptr.hpp>

#include <memory>

namespace lodging {
namespace reservations {

//==============================================================================
/// \brief Takes payment for a reservation. Inherit this class to connect the
/// Hotel to a payment provider.
///
/// A Hotel calls charge() once for every reservation attempt, on a thread of
/// its own, and stops waiting for the answer once its payment timeout runs
/// out. No idempotency key is passed, so an implementation cannot tell a retry
/// apart from a new charge.
class PaymentGateway
{
public:

  enum class Charge : uint8_t
  {
    Approved = 0,
    Declined
  };

  ///===========================================================================
  /// \brief Charge the given amount.
  ///
  /// \return Approved if the money was taken, Declined otherwise. Throwing an
  /// exception is treated the same as Declined.
  virtual Charge charge(const Money& amount) = 0;

  virtual ~PaymentGateway() = default;
};

using PaymentGatewayPtr = std::shared_ptr<PaymentGateway>;

//==============================================================================
/// \brief A stand-in for a payment provider that approves every charge unless
/// it is told to decline. It also keeps a tally of what it was asked to charge.
class SimulatedPaymentGateway : public PaymentGateway
{
public:

  /// Decline every charge from now on, or go back to approving them.
  SimulatedPaymentGateway& decline_all(bool decline);

  /// True if charges are currently being declined.
  bool decline_all() const;

  /// Number of charges that were attempted, approved or not.
  std::size_t attempts() const;

  /// Sum of every approved charge.
  Money collected() const;

  Charge charge(const Money& amount) final;

  SimulatedPaymentGateway();

  class Implementation;
private:
  rmf_utils::unique_impl_ptr<Implementation> _pimpl;
};

} // namespace reservations
} // namespace lodging

#endif // LODGING__RESERVATIONS__PAYMENTGATEWAY_HPP
