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

#ifndef SRC__LODGING__RESERVATIONS__INTERNAL_TIMEDCHARGE_HPP
#define SRC__LODGING__RESERVATIONS__INTERNAL_TIMEDCHARGE_HPP

#include <lodging/reservations/PaymentGateway.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace lodging {
namespace reservations {

//==============================================================================
/// The answer to one charge attempt, as far as the caller is concerned.
struct ChargeOutcome
{
  enum class Type : uint8_t
  {
    Approved = 0,
    Declined,
    TimedOut,
    Failed
  };

  Type type;

  /// Details for a Failed outcome
  std::string reason;
};

//==============================================================================
/// Run gateway->charge(amount), waiting no longer than the timeout. Without a
/// timeout the charge is made on the calling thread.
///
/// With a timeout the charge runs on a detached thread that keeps the gateway
/// alive. If the gateway answers after the caller has given up, the answer is
/// discarded and, if it was an approval, reported on std::cerr because money
/// was taken for a booking that was never made.
inline ChargeOutcome charge_within(
  const PaymentGatewayPtr& gateway,
  const Money& amount,
  const std::optional<std::chrono::steady_clock::duration>& timeout,
  const std::string& booking_id)
{
  const auto translate = [](const PaymentGateway::Charge charge)
    {
      if (charge == PaymentGateway::Charge::Approved)
        return ChargeOutcome{ChargeOutcome::Type::Approved, ""};

      return ChargeOutcome{ChargeOutcome::Type::Declined, ""};
    };

  if (!timeout.has_value())
  {
    try
    {
      return translate(gateway->charge(amount));
    }
    catch (const std::exception& e)
    {
      return ChargeOutcome{ChargeOutcome::Type::Failed, e.what()};
    }
    catch (...)
    {
      return ChargeOutcome{ChargeOutcome::Type::Failed, "unknown exception"};
    }
  }

  enum Handoff : int
  {
    Waiting = 0,
    Answered,
    Abandoned
  };

  auto promise = std::make_shared<std::promise<PaymentGateway::Charge>>();
  auto handoff = std::make_shared<std::atomic_int>(Waiting);
  std::future<PaymentGateway::Charge> answer = promise->get_future();

  std::thread worker(
    [gateway, amount, promise, handoff, booking_id]()
    {
      try
      {
        const auto charge = gateway->charge(amount);
        promise->set_value(charge);

        if (handoff->exchange(Answered) == Abandoned
          && charge == PaymentGateway::Charge::Approved)
        {
          std::cerr << "[lodging::Hotel::reserve] Payment of ["
                    << amount.to_string() << "] for booking [" << booking_id
                    << "] was approved after the payment timeout expired. "
                    << "The booking was not made, so this charge needs to be "
                    << "refunded." << std::endl;
        }
      }
      catch (...)
      {
        // Hand the exception over to whoever is waiting on the future
        promise->set_exception(std::current_exception());
        handoff->exchange(Answered);
      }
    });
  worker.detach();

  if (answer.wait_for(*timeout) != std::future_status::ready)
  {
    // The worker may have answered between the wait and this exchange, in
    // which case the answer is already in the future and can still be used.
    if (handoff->exchange(Abandoned) != Answered)
      return ChargeOutcome{ChargeOutcome::Type::TimedOut, ""};
  }

  try
  {
    return translate(answer.get());
  }
  catch (const std::exception& e)
  {
    return ChargeOutcome{ChargeOutcome::Type::Failed, e.what()};
  }
  catch (...)
  {
    return ChargeOutcome{ChargeOutcome::Type::Failed, "unknown exception"};
  }
}

} // namespace reservations
} // namespace lodging

#endif // SRC__LODGING__RESERVATIONS__INTERNAL_TIMEDCHARGE_HPP
