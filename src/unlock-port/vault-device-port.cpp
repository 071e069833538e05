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

#include "unlock-port/vault-device-port.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace qrvault {

NDN_LOG_INIT(qrvault.port.vault);

const std::string VaultDevicePort::PORT_TYPE = "vault-device";
const std::string VaultDevicePort::DEFAULT_DEVICE_PATH = "/dev/secret_vault";
const unsigned long VaultDevicePort::DEFAULT_IOCTL_COMMAND = 0x40047601;
const std::string VaultDevicePort::PARAMETER_KEY_DEVICE_PATH = "device-path";
const std::string VaultDevicePort::PARAMETER_KEY_IOCTL_COMMAND = "ioctl-command";
QRVAULT_REGISTER_UNLOCK_PORT(VaultDevicePort);

static unsigned long
parseIoctlCommand(const std::string& str)
{
  // std::stoul would skip whitespace and wrap a negative value around
  if (str.empty() || !std::isdigit(static_cast<unsigned char>(str.front()))) {
    NDN_THROW(std::invalid_argument("Cannot parse ioctl command '" + str + "'"));
  }

  size_t pos = 0;
  unsigned long command = 0;
  try {
    command = std::stoul(str, &pos, 0);
  }
  catch (const std::exception&) {
    NDN_THROW(std::invalid_argument("Cannot parse ioctl command '" + str + "'"));
  }
  if (pos != str.size()) {
    NDN_THROW(std::invalid_argument("Trailing characters in ioctl command '" + str + "'"));
  }
  return command;
}

VaultDevicePort::VaultDevicePort(const JsonSection& params)
  : VaultDevicePort(params.get(PARAMETER_KEY_DEVICE_PATH, DEFAULT_DEVICE_PATH),
                    parseIoctlCommand(params.get(PARAMETER_KEY_IOCTL_COMMAND,
                                                 std::to_string(DEFAULT_IOCTL_COMMAND))))
{
}

VaultDevicePort::VaultDevicePort(const std::string& devicePath, unsigned long ioctlCommand)
  : m_devicePath(devicePath)
  , m_ioctlCommand(ioctlCommand)
{
  if (m_devicePath.empty()) {
    NDN_THROW(std::invalid_argument("Vault device path cannot be empty"));
  }
}

std::tuple<UnlockError, std::string>
VaultDevicePort::requestUnlock(uint32_t pin)
{
  int fd = ::open(m_devicePath.data(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    int errorNumber = errno;
    NDN_LOG_DEBUG("open(" << m_devicePath << ") failed: " << std::strerror(errorNumber));
    return {classifyErrno(errorNumber), "Cannot open " + m_devicePath + ": " + std::strerror(errorNumber)};
  }

  uint32_t payload = pin;
  int ret = ::ioctl(fd, m_ioctlCommand, &payload);
  int errorNumber = errno;
  ::close(fd);

  if (ret < 0) {
    NDN_LOG_DEBUG("ioctl(" << m_devicePath << ") failed: " << std::strerror(errorNumber));
    return {classifyErrno(errorNumber), "Unlock rejected by " + m_devicePath + ": " + std::strerror(errorNumber)};
  }
  NDN_LOG_TRACE("Unlock command accepted by " << m_devicePath);
  return {UnlockError::NO_ERROR, ""};
}

UnlockError
VaultDevicePort::classifyErrno(int errorNumber)
{
  switch (errorNumber) {
    case EACCES:
    case EPERM:
      return UnlockError::PERMISSION_DENIED;
    case ENOENT:
    case ENODEV:
    case ENXIO:
      return UnlockError::DEVICE_ABSENT;
    default:
      return UnlockError::OTHER;
  }
}

} // namespace qrvault
