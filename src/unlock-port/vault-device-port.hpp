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

#ifndef QRVAULT_UNLOCK_PORT_VAULT_DEVICE_PORT_HPP
#define QRVAULT_UNLOCK_PORT_VAULT_DEVICE_PORT_HPP

#include "unlock-port/unlock-port.hpp"

namespace qrvault {

/**
 * @brief Unlocks the secret vault character device through its ioctl keyhole.
 *
 * Every request opens the device node read-write, issues one ioctl whose argument points
 * to the PIN as a 4-byte unsigned integer in host byte order (the driver copies it into a
 * native int on the same machine), and closes the node again.
 *
 * Parameters in the "unlock-port" configuration section:
 *   "device-path": path of the device node, default /dev/secret_vault
 *   "ioctl-command": command number, decimal or 0x-prefixed hex, default 0x40047601
 *                    (_IOW('v', 1, int))
 */
class VaultDevicePort : public UnlockPort
{
public:
  explicit
  VaultDevicePort(const JsonSection& params);

  VaultDevicePort(const std::string& devicePath, unsigned long ioctlCommand);

  std::tuple<UnlockError, std::string>
  requestUnlock(uint32_t pin) override;

  const std::string&
  getDevicePath() const
  {
    return m_devicePath;
  }

  unsigned long
  getIoctlCommand() const
  {
    return m_ioctlCommand;
  }

  /**
   * @brief Map an errno value reported by open() or ioctl() to a failure class.
   */
  static UnlockError
  classifyErrno(int errorNumber);

public:
  static const std::string PORT_TYPE;
  static const std::string DEFAULT_DEVICE_PATH;
  static const unsigned long DEFAULT_IOCTL_COMMAND;
  // parameters
  static const std::string PARAMETER_KEY_DEVICE_PATH;
  static const std::string PARAMETER_KEY_IOCTL_COMMAND;

private:
  std::string m_devicePath;
  unsigned long m_ioctlCommand;
};

} // namespace qrvault

#endif // QRVAULT_UNLOCK_PORT_VAULT_DEVICE_PORT_HPP
