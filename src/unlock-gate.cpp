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

#include "unlock-gate.hpp"

#include <ndn-cxx/util/backports.hpp>

namespace qrvault {

NDN_LOG_INIT(qrvault.gate);

std::ostream&
operator<<(std::ostream& os, GateAction action)
{
  switch (action) {
    case GateAction::NONE: return os << "None";
    case GateAction::UNLOCKED: return os << "Unlocked";
    case GateAction::UNLOCK_FAILED: return os << "Unlock Failed";
    case GateAction::SUPPRESSED: return os << "Suppressed";
  }
  return os << "<Unknown Gate Action " << static_cast<int>(ndn::to_underlying(action)) << ">";
}

UnlockGate::UnlockGate(UnlockPort& port, GatePolicy policy)
  : m_port(port)
  , m_policy(std::move(policy))
{
  if (m_policy.cooldown < time::nanoseconds::zero()) {
    NDN_THROW(std::invalid_argument("Cooldown period cannot be negative"));
  }
}

GateOutcome
UnlockGate::handleVerdict(bool isValid, GateState& state, const time::steady_clock::time_point& now)
{
  if (state.status == GateStatus::COOLDOWN && !advanceCooldown(state, now)) {
    GateOutcome outcome;
    if (isValid) {
      outcome.action = GateAction::SUPPRESSED;
    }
    return outcome;
  }

  BOOST_ASSERT(state.status == GateStatus::IDLE);
  if (!isValid) {
    return {};
  }
  return trigger(state, now);
}

bool
UnlockGate::advanceCooldown(GateState& state, const time::steady_clock::time_point& now) const
{
  if (state.isFinished) {
    return false;
  }

  if (now > state.lastObserved) {
    state.cooldownElapsed += now - state.lastObserved;
  }
  else if (now < state.lastObserved) {
    NDN_LOG_WARN("Clock stepped back by "
                 << time::duration_cast<time::milliseconds>(state.lastObserved - now).count() << " ms"
                 << " during cooldown");
  }
  state.lastObserved = now;

  if (state.cooldownElapsed < m_policy.cooldown) {
    return false;
  }

  NDN_LOG_DEBUG("Cooldown over, gate re-armed");
  state.status = GateStatus::IDLE;
  state.cooldownDeadline = std::nullopt;
  state.cooldownElapsed = time::nanoseconds::zero();
  return true;
}

GateOutcome
UnlockGate::trigger(GateState& state, const time::steady_clock::time_point& now)
{
  state.status = GateStatus::TRIGGERED;
  state.triggerCount++;
  NDN_LOG_TRACE("Requesting unlock #" << state.triggerCount);

  GateOutcome outcome;
  try {
    std::tie(outcome.error, outcome.errorInfo) = m_port.requestUnlock(m_policy.pin);
  }
  catch (const std::exception& e) {
    outcome.error = UnlockError::OTHER;
    outcome.errorInfo = e.what();
  }
  catch (...) {
    NDN_LOG_ERROR("Unlock request #" << state.triggerCount << " failed with a non-standard exception");
    enterCooldown(state, now);
    throw;
  }

  if (outcome.error == UnlockError::NO_ERROR) {
    outcome.action = GateAction::UNLOCKED;
    NDN_LOG_INFO("Unlock request #" << state.triggerCount << " succeeded");
  }
  else {
    outcome.action = GateAction::UNLOCK_FAILED;
    NDN_LOG_ERROR("Unlock request #" << state.triggerCount << " failed: "
                  << outcome.error << " (" << outcome.errorInfo << ")");
  }

  enterCooldown(state, now);
  if (m_policy.isSingleShot && outcome.action == GateAction::UNLOCKED) {
    state.isFinished = true;
  }
  return outcome;
}

void
UnlockGate::enterCooldown(GateState& state, const time::steady_clock::time_point& now) const
{
  state.status = GateStatus::COOLDOWN;
  state.cooldownDeadline = now + m_policy.cooldown;
  state.cooldownElapsed = time::nanoseconds::zero();
  state.lastObserved = now;
}

} // namespace qrvault
