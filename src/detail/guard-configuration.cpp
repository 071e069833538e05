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

#include "detail/guard-configuration.hpp"
#include "unlock-port/vault-device-port.hpp"

#include <boost/property_tree/json_parser.hpp>

#include <limits>

namespace qrvault {

NDN_LOG_INIT(qrvault.config);

// durations end up in nanoseconds; anything longer would overflow
static const int64_t MAX_DURATION_SECONDS =
  time::duration_cast<time::seconds>(time::nanoseconds::max()).count();

void
GuardConfig::load(const std::string& fileName)
{
  JsonSection configJson;
  try {
    boost::property_tree::read_json(fileName, configJson);
  }
  catch (const std::exception& error) {
    NDN_THROW(Error("Failed to parse configuration file " + fileName + ", " + error.what()));
  }

  if (configJson.begin() == configJson.end()) {
    NDN_THROW(Error("No JSON configuration found in file: " + fileName));
  }
  *this = fromJson(configJson);
  NDN_LOG_DEBUG("Loaded configuration from " << fileName);
}

GuardConfig
GuardConfig::fromJson(const JsonSection& json)
{
  GuardConfig config;
  try {
    config.mode = boost::algorithm::to_lower_copy(json.get(CONFIG_MODE, MODE_TOTP));
    if (config.mode != MODE_TOTP && config.mode != MODE_STATIC) {
      NDN_THROW(Error("Unknown mode '" + config.mode + "', expecting '" + MODE_TOTP +
                      "' or '" + MODE_STATIC + "'"));
    }

    if (config.mode == MODE_TOTP) {
      auto secret = json.get(CONFIG_SHARED_SECRET, "");
      if (secret.empty()) {
        NDN_THROW(Error("Cannot parse " + CONFIG_SHARED_SECRET + " from the config file"));
      }
      config.sharedSecret.assign(secret.begin(), secret.end());

      auto period = json.get<int64_t>(CONFIG_PERIOD, DEFAULT_PERIOD.count());
      if (period <= 0) {
        NDN_THROW(Error(CONFIG_PERIOD + " must be positive"));
      }
      config.period = time::seconds(period);
    }
    else {
      config.staticToken = json.get(CONFIG_STATIC_TOKEN, "");
      if (config.staticToken.empty()) {
        NDN_THROW(Error("Cannot parse " + CONFIG_STATIC_TOKEN + " from the config file"));
      }
    }

    auto windowSize = json.get<int64_t>(CONFIG_WINDOW_SIZE, static_cast<int64_t>(DEFAULT_WINDOW_SIZE));
    if (windowSize < 1 || windowSize > static_cast<int64_t>(MAX_WINDOW_SIZE)) {
      NDN_THROW(Error(CONFIG_WINDOW_SIZE + " must be between 1 and " + std::to_string(MAX_WINDOW_SIZE)));
    }
    config.windowSize = static_cast<size_t>(windowSize);

    auto cooldown = json.get<int64_t>(CONFIG_COOLDOWN, DEFAULT_COOLDOWN.count());
    if (cooldown < 0) {
      NDN_THROW(Error(CONFIG_COOLDOWN + " cannot be negative"));
    }
    if (cooldown > MAX_DURATION_SECONDS) {
      NDN_THROW(Error(CONFIG_COOLDOWN + " is too large"));
    }
    config.cooldown = time::seconds(cooldown);

    config.isSingleShot = json.get(CONFIG_SINGLE_SHOT, false);

    auto pin = json.get<int64_t>(CONFIG_PIN, DEFAULT_UNLOCK_PIN);
    if (pin < 0 || pin > std::numeric_limits<uint32_t>::max()) {
      NDN_THROW(Error(CONFIG_PIN + " must fit in an unsigned 32-bit integer"));
    }
    config.pin = static_cast<uint32_t>(pin);

    auto logInterval = json.get<double>(CONFIG_REJECTION_LOG_INTERVAL, 1.0);
    if (!(logInterval >= 0)) {
      NDN_THROW(Error(CONFIG_REJECTION_LOG_INTERVAL + " cannot be negative"));
    }
    if (logInterval > MAX_DURATION_SECONDS) {
      NDN_THROW(Error(CONFIG_REJECTION_LOG_INTERVAL + " is too large"));
    }
    config.rejectionLogInterval = time::milliseconds(static_cast<int64_t>(logInterval * 1000));

    auto portJson = json.get_child_optional(CONFIG_UNLOCK_PORT);
    if (portJson) {
      config.unlockPortParams = *portJson;
    }
    config.unlockPortType = config.unlockPortParams.get(CONFIG_UNLOCK_PORT_TYPE, VaultDevicePort::PORT_TYPE);
    if (!UnlockPort::isUnlockPortSupported(config.unlockPortType)) {
      NDN_THROW(Error("Unlock port " + config.unlockPortType + " is not supported."));
    }
  }
  catch (const boost::property_tree::ptree_error& error) {
    NDN_THROW(Error("Malformed configuration value: "s + error.what()));
  }
  return config;
}

TokenGenerator
GuardConfig::makeTokenGenerator() const
{
  if (mode == MODE_STATIC) {
    return TokenGenerator::makeStatic(staticToken);
  }
  return TokenGenerator(sharedSecret, period);
}

GatePolicy
GuardConfig::makeGatePolicy() const
{
  GatePolicy policy;
  policy.cooldown = cooldown;
  policy.pin = pin;
  policy.isSingleShot = isSingleShot;
  return policy;
}

std::ostream&
operator<<(std::ostream& os, const GuardConfig& config)
{
  os << "Mode: " << config.mode << "\n";
  if (config.mode == MODE_STATIC) {
    os << "Static token: <redacted>\n";
  }
  else {
    os << "Shared secret: <redacted, " << config.sharedSecret.size() << " bytes>\n"
       << "Period: " << config.period.count() << " s\n";
  }
  os << "Window size: " << config.windowSize << " blocks\n"
     << "Cooldown: " << config.cooldown.count() << " s\n"
     << "Single shot: " << std::boolalpha << config.isSingleShot << "\n"
     << "Unlock port: " << config.unlockPortType << "\n";
  return os;
}

} // namespace qrvault
