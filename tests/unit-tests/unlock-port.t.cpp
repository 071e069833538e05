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

#include "unlock-port/unlock-port.hpp"
#include "unlock-port/vault-device-port.hpp"

#include "tests/boost-test.hpp"
#include "tests/dummy-unlock-port.hpp"

namespace qrvault::tests {

const std::string DummyUnlockPort::PORT_TYPE = "dummy";
QRVAULT_REGISTER_UNLOCK_PORT(DummyUnlockPort);

BOOST_AUTO_TEST_SUITE(TestUnlockPort)

BOOST_AUTO_TEST_CASE(IsSupported)
{
  BOOST_CHECK_EQUAL(UnlockPort::isUnlockPortSupported("vault-device"), true);
  BOOST_CHECK_EQUAL(UnlockPort::isUnlockPortSupported("dummy"), true);
  BOOST_CHECK_EQUAL(UnlockPort::isUnlockPortSupported("serial-relay"), false);
}

BOOST_AUTO_TEST_CASE(Create)
{
  JsonSection params;
  params.put("device-path", "/dev/test_vault");
  auto port = UnlockPort::createUnlockPort("vault-device", params);
  BOOST_REQUIRE(port != nullptr);
  auto vaultPort = dynamic_cast<VaultDevicePort*>(port.get());
  BOOST_REQUIRE(vaultPort != nullptr);
  BOOST_CHECK_EQUAL(vaultPort->getDevicePath(), "/dev/test_vault");

  port = UnlockPort::createUnlockPort("dummy", JsonSection{});
  BOOST_REQUIRE(port != nullptr);
  BOOST_CHECK(dynamic_cast<DummyUnlockPort*>(port.get()) != nullptr);

  BOOST_CHECK(UnlockPort::createUnlockPort("serial-relay", JsonSection{}) == nullptr);

  params.put("ioctl-command", "not-a-number");
  BOOST_CHECK_THROW(UnlockPort::createUnlockPort("vault-device", params), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END() // TestUnlockPort

} // namespace qrvault::tests
