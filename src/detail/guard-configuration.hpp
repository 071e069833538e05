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

#ifndef QRVAULT_DETAIL_GUARD_CONFIGURATION_HPP
#define QRVAULT_DETAIL_GUARD_CONFIGURATION_HPP

#include "token-generator.hpp"
#include "unlock-gate.hpp"

namespace qrvault {

// used in parsing the guard configuration file
const std::string CONFIG_MODE = "mode";
const std::string CONFIG_SHARED_SECRET = "shared-secret";
const std::string CONFIG_STATIC_TOKEN = "static-token";
const std::string CONFIG_PERIOD = "period";
const std::string CONFIG_WINDOW_SIZE = "window-size";
const std::string CONFIG_COOLDOWN = "cooldown";
const std::string CONFIG_SINGLE_SHOT = "single-shot";
const std::string CONFIG_PIN = "pin";
const std::string CONFIG_REJECTION_LOG_INTERVAL = "rejection-log-interval";
const std::string CONFIG_UNLOCK_PORT = "unlock-port";
const std::string CONFIG_UNLOCK_PORT_TYPE = "type";

const std::string MODE_TOTP = "totp";
const std::string MODE_STATIC = "static";

/**
 * @brief Guard's configuration.
 *
 * The format of the configuration in JSON
 * {
 *  "mode": "totp",
 *  "shared-secret": "",
 *  "static-token": "",
 *  "period": 30,
 *  "window-size": 2,
 *  "cooldown": 5,
 *  "single-shot": false,
 *  "pin": 1337,
 *  "rejection-log-interval": 1,
 *  "unlock-port":
 *  {
 *    "type": "vault-device",
 *    ...port specific parameters
 *  }
 * }
 *
 * In "static" mode only "static-token" is used to produce proofs.
 */
class GuardConfig
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /**
   * @brief Load the configuration from the file.
   * @throw Error when config file cannot be correctly parsed or holds an unusable policy.
   */
  void
  load(const std::string& fileName);

  /**
   * @throw Error
   */
  static GuardConfig
  fromJson(const JsonSection& json);

  /**
   * @brief Build the proof generator described by this configuration.
   */
  TokenGenerator
  makeTokenGenerator() const;

  GatePolicy
  makeGatePolicy() const;

public:
  std::string mode = MODE_TOTP;
  /**
   * @brief The shared secret, taken byte for byte from the configured string.
   */
  SharedSecret sharedSecret;
  std::string staticToken;
  time::seconds period = DEFAULT_PERIOD;
  /**
   * @brief Number of time blocks, current one included, whose proofs are accepted.
   */
  size_t windowSize = DEFAULT_WINDOW_SIZE;
  time::seconds cooldown = DEFAULT_COOLDOWN;
  bool isSingleShot = false;
  uint32_t pin = DEFAULT_UNLOCK_PIN;
  time::milliseconds rejectionLogInterval = 1_s;
  std::string unlockPortType;
  JsonSection unlockPortParams;
};

/**
 * @brief Print the configuration with the secret and the static token redacted.
 */
std::ostream&
operator<<(std::ostream& os, const GuardConfig& config);

} // namespace qrvault

#endif // QRVAULT_DETAIL_GUARD_CONFIGURATION_HPP
