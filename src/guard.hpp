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

#ifndef QRVAULT_GUARD_HPP
#define QRVAULT_GUARD_HPP

#include "token-validator.hpp"
#include "unlock-gate.hpp"
#include "detail/guard-configuration.hpp"
#include "detail/log-throttle.hpp"

namespace qrvault {

enum class GuardEvent : uint8_t {
  REJECTED = 0,      ///< a candidate was not a valid proof (rate limited)
  ACCEPTED = 1,      ///< a valid proof armed an unlock request
  UNLOCKED = 2,      ///< the unlock request succeeded
  UNLOCK_FAILED = 3, ///< the unlock request failed
  SUPPRESSED = 4     ///< a valid proof arrived during cooldown
};

std::ostream&
operator<<(std::ostream& os, GuardEvent event);

/**
 * @brief The function would be invoked whenever the guard has something to report.
 *
 * @param GuardEvent What happened.
 * @param std::string For REJECTED and ACCEPTED the sanitized candidate, for UNLOCK_FAILED
 *                    the failure class and description, otherwise empty.
 */
using EventCallback = std::function<void(GuardEvent, const std::string&)>;

/**
 * @brief Evaluates decoded candidates and unlocks the vault for valid proofs.
 *
 * Candidates are validated against the system clock; the unlock gate runs on the steady
 * clock. The guard is a single-writer object: calls to onCandidate() must be serialized.
 */
class Guard : boost::noncopyable
{
public:
  /**
   * @throw GuardConfig::Error the configuration cannot be loaded
   */
  explicit
  Guard(const std::string& configPath);

  Guard(GuardConfig config, std::unique_ptr<UnlockPort> port);

  GateOutcome
  onCandidate(const std::string& candidate);

  /**
   * @brief Whether the guard has nothing left to do (single-shot mode after success).
   */
  bool
  isFinished() const
  {
    return m_gateState.isFinished;
  }

  const GuardConfig&
  getConfig() const
  {
    return m_config;
  }

  const GateState&
  getGateState() const
  {
    return m_gateState;
  }

  const TokenValidator&
  getValidator() const
  {
    return m_validator;
  }

  void
  setEventCallback(EventCallback cb)
  {
    m_eventCallback = std::move(cb);
  }

private:
  static GuardConfig
  loadConfig(const std::string& configPath);

  static std::unique_ptr<UnlockPort>
  makeUnlockPort(const GuardConfig& config);

  void
  notify(GuardEvent event, const std::string& detail);

QRVAULT_PUBLIC_WITH_TESTS_ELSE_PRIVATE:
  GuardConfig m_config;
  std::unique_ptr<UnlockPort> m_port;
  TokenValidator m_validator;
  UnlockGate m_gate;
  GateState m_gateState;
  LogThrottle m_rejectionThrottle;
  EventCallback m_eventCallback;
};

} // namespace qrvault

#endif // QRVAULT_GUARD_HPP
