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

#include "tests/boost-test.hpp"

#include <cerrno>

namespace qrvault::tests {

BOOST_AUTO_TEST_SUITE(TestVaultDevicePort)

BOOST_AUTO_TEST_CASE(Parameters)
{
  VaultDevicePort defaultPort(JsonSection{});
  BOOST_CHECK_EQUAL(defaultPort.getDevicePath(), "/dev/secret_vault");
  BOOST_CHECK_EQUAL(defaultPort.getIoctlCommand(), 0x40047601UL);

  JsonSection params;
  params.put("device-path", "/dev/other_vault");
  params.put("ioctl-command", "0x40047602");
  VaultDevicePort port(params);
  BOOST_CHECK_EQUAL(port.getDevicePath(), "/dev/other_vault");
  BOOST_CHECK_EQUAL(port.getIoctlCommand(), 0x40047602UL);

  params.put("ioctl-command", "1074034177");
  BOOST_CHECK_EQUAL(VaultDevicePort(params).getIoctlCommand(), 0x40047601UL);

  params.put("ioctl-command", "abc");
  BOOST_CHECK_THROW(VaultDevicePort{params}, std::invalid_argument);
  params.put("ioctl-command", "0x12zz");
  BOOST_CHECK_THROW(VaultDevicePort{params}, std::invalid_argument);
  params.put("ioctl-command", "-1");
  BOOST_CHECK_THROW(VaultDevicePort{params}, std::invalid_argument);
  params.put("ioctl-command", "+1074034177");
  BOOST_CHECK_THROW(VaultDevicePort{params}, std::invalid_argument);
  params.put("ioctl-command", " 1074034177");
  BOOST_CHECK_THROW(VaultDevicePort{params}, std::invalid_argument);
  params.put("ioctl-command", "");
  BOOST_CHECK_THROW(VaultDevicePort{params}, std::invalid_argument);

  BOOST_CHECK_THROW(VaultDevicePort("", 0x40047601), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(ClassifyErrno)
{
  BOOST_CHECK_EQUAL(VaultDevicePort::classifyErrno(EACCES), UnlockError::PERMISSION_DENIED);
  BOOST_CHECK_EQUAL(VaultDevicePort::classifyErrno(EPERM), UnlockError::PERMISSION_DENIED);
  BOOST_CHECK_EQUAL(VaultDevicePort::classifyErrno(ENOENT), UnlockError::DEVICE_ABSENT);
  BOOST_CHECK_EQUAL(VaultDevicePort::classifyErrno(ENODEV), UnlockError::DEVICE_ABSENT);
  BOOST_CHECK_EQUAL(VaultDevicePort::classifyErrno(ENXIO), UnlockError::DEVICE_ABSENT);
  BOOST_CHECK_EQUAL(VaultDevicePort::classifyErrno(ENOTTY), UnlockError::OTHER);
  BOOST_CHECK_EQUAL(VaultDevicePort::classifyErrno(EIO), UnlockError::OTHER);
}

BOOST_AUTO_TEST_CASE(MissingDevice)
{
  VaultDevicePort port(UNIT_TESTS_TMPDIR "/no-such-vault", VaultDevicePort::DEFAULT_IOCTL_COMMAND);
  UnlockError error;
  std::string info;
  std::tie(error, info) = port.requestUnlock(1337);
  BOOST_CHECK_EQUAL(error, UnlockError::DEVICE_ABSENT);
  BOOST_CHECK(info.find("no-such-vault") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(NotAVault)
{
  // /dev/null opens fine but knows nothing about the unlock command
  VaultDevicePort port("/dev/null", VaultDevicePort::DEFAULT_IOCTL_COMMAND);
  UnlockError error;
  std::string info;
  std::tie(error, info) = port.requestUnlock(1337);
  BOOST_CHECK_EQUAL(error, UnlockError::OTHER);
  BOOST_CHECK(!info.empty());
}

BOOST_AUTO_TEST_SUITE_END() // TestVaultDevicePort

} // namespace qrvault::tests
