/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2017-2024, Regents of the University of California.
 *
 * This file is part of qrvault, an optical one-time-token guard for a secret vault.
 *
 * qrvault is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * qrvault is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
 * PARTICULAR PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received copies of the GNU General Public License along with
 * qrvault, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 *
 * See AUTHORS.md for complete list of qrvault authors and contributors.
 */

#ifndef QRVAULT_UNLOCK_GATE_HPP
#define QRVAULT_UNLOCK_GATE_HPP

#include "detail/gate-state.hpp"
#include "unlock-port/unlock-port.hpp"

namespace qrvault {

struct GatePolicy
{
  /**
   * @brief Minimum forward time between two unlock requests.
   */
  time::nanoseconds cooldown = DEFAULT_COOLDOWN;
  /**
   * @brief Payload handed to the unlock port.
   */
  uint32_t pin = DEFAULT_UNLOCK_PIN;
  /**
   * @brief Stop for good after the first successful unlock.
   */
  bool isSingleShot = false;
};

enum class GateAction : uint8_t {
  NONE = 0,          ///< nothing happened
  UNLOCKED = 1,      ///< an unlock request was issued and succeeded
  UNLOCK_FAILED = 2, ///< an unlock request was issued and failed
  SUPPRESSED = 3     ///< a valid verdict arrived while the gate was not armed
};

std::ostream&
operator<<(std::ostream& os, GateAction action);

struct GateOutcome
{
  GateAction action = GateAction::NONE;
  UnlockError error = UnlockError::NO_ERROR;
  std::string errorInfo;
};

/**
 * @brief Turns per-frame validation verdicts into bounded unlock requests.
 *
 * States:
 *   IDLE: a valid verdict issues exactly one unlock request and passes through TRIGGERED.
 *   TRIGGERED: left immediately for COOLDOWN, whether the request succeeded or failed.
 *   COOLDOWN: verdicts cause no request until the cooldown has elapsed, then IDLE.
 *
 * A failed request is reported once through the returned outcome and is not retried
 * before the cooldown ends. In single-shot mode a successful request finishes the gate.
 */
class UnlockGate : boost::noncopyable
{
public:
  explicit
  UnlockGate(UnlockPort& port, GatePolicy policy = {});

  GateOutcome
  handleVerdict(bool isValid, GateState& state, const time::steady_clock::time_point& now);

  const GatePolicy&
  getPolicy() const
  {
    return m_policy;
  }

private:
  /**
   * @return true if the cooldown is over and the gate is IDLE again
   */
  bool
  advanceCooldown(GateState& state, const time::steady_clock::time_point& now) const;

  /**
   * @brief Issue one unlock request and enter COOLDOWN, even when the port throws.
   */
  GateOutcome
  trigger(GateState& state, const time::steady_clock::time_point& now);

  void
  enterCooldown(GateState& state, const time::steady_clock::time_point& now) const;

private:
  UnlockPort& m_port;
  const GatePolicy m_policy;
};

} // namespace qrvault

#endif // QRVAULT_UNLOCK_GATE_HPP
