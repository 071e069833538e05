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

#include "guard.hpp"

#include <ndn-cxx/util/backports.hpp>

#include <sstream>

namespace qrvault {

NDN_LOG_INIT(qrvault.guard);

std::ostream&
operator<<(std::ostream& os, GuardEvent event)
{
  switch (event) {
    case GuardEvent::REJECTED: return os << "Rejected";
    case GuardEvent::ACCEPTED: return os << "Accepted";
    case GuardEvent::UNLOCKED: return os << "Unlocked";
    case GuardEvent::UNLOCK_FAILED: return os << "Unlock Failed";
    case GuardEvent::SUPPRESSED: return os << "Suppressed";
  }
  return os << "<Unknown Guard Event " << static_cast<int>(ndn::to_underlying(event)) << ">";
}

Guard::Guard(const std::string& configPath)
  : Guard(loadConfig(configPath), nullptr)
{
}

Guard::Guard(GuardConfig config, std::unique_ptr<UnlockPort> port)
  : m_config(std::move(config))
  , m_port(port != nullptr ? std::move(port) : makeUnlockPort(m_config))
  , m_validator(m_config.makeTokenGenerator(), m_config.windowSize)
  , m_gate(*m_port, m_config.makeGatePolicy())
  , m_rejectionThrottle(m_config.rejectionLogInterval)
{
  NDN_LOG_INFO("Guard started in " << m_config.mode << " mode, window of " << m_config.windowSize
               << " blocks, cooldown " << m_config.cooldown.count() << " s");
}

GuardConfig
Guard::loadConfig(const std::string& configPath)
{
  GuardConfig config;
  config.load(configPath);
  return config;
}

std::unique_ptr<UnlockPort>
Guard::makeUnlockPort(const GuardConfig& config)
{
  std::unique_ptr<UnlockPort> port;
  try {
    port = UnlockPort::createUnlockPort(config.unlockPortType, config.unlockPortParams);
  }
  catch (const std::invalid_argument& e) {
    NDN_THROW_NESTED(GuardConfig::Error("Cannot create unlock port " + config.unlockPortType +
                                        ": " + e.what()));
  }
  if (port == nullptr) {
    NDN_THROW(GuardConfig::Error("Unlock port " + config.unlockPortType + " is not supported."));
  }
  return port;
}

GateOutcome
Guard::onCandidate(const std::string& candidate)
{
  bool isValid = m_validator.isValid(candidate, time::system_clock::now());
  auto now = time::steady_clock::now();
  auto outcome = m_gate.handleVerdict(isValid, m_gateState, now);

  switch (outcome.action) {
    case GateAction::NONE: {
      if (!isValid && m_rejectionThrottle.allow(now)) {
        auto printable = sanitizeForLog(candidate);
        NDN_LOG_INFO("Invalid or expired token: " << printable << " ("
                     << m_rejectionThrottle.getSuppressedBeforeLast() << " more suppressed)");
        notify(GuardEvent::REJECTED, printable);
      }
      break;
    }
    case GateAction::UNLOCKED:
      NDN_LOG_INFO("Valid token accepted, vault unlocked");
      notify(GuardEvent::ACCEPTED, sanitizeForLog(candidate));
      notify(GuardEvent::UNLOCKED, "");
      break;
    case GateAction::UNLOCK_FAILED: {
      NDN_LOG_WARN("Valid token accepted, but unlock failed: " << outcome.error);
      notify(GuardEvent::ACCEPTED, sanitizeForLog(candidate));
      std::ostringstream os;
      os << outcome.error << " (" << outcome.errorInfo << ")";
      notify(GuardEvent::UNLOCK_FAILED, os.str());
      break;
    }
    case GateAction::SUPPRESSED:
      NDN_LOG_TRACE("Valid token ignored, gate is cooling down");
      notify(GuardEvent::SUPPRESSED, "");
      break;
  }
  return outcome;
}

void
Guard::notify(GuardEvent event, const std::string& detail)
{
  if (m_eventCallback) {
    m_eventCallback(event, detail);
  }
}

} // namespace qrvault
