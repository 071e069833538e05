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

#include "detail/crypto-helpers.hpp"

#include "tests/boost-test.hpp"

#include <ndn-cxx/util/string-helper.hpp>

#include <array>

namespace qrvault::tests {

BOOST_AUTO_TEST_SUITE(TestCryptoHelpers)

BOOST_AUTO_TEST_CASE(HmacSha256)
{
  // RFC 4231, test case 2
  const std::string key = "Jefe";
  const std::string data = "what do ya want for nothing?";
  std::array<uint8_t, HMAC_SHA256_LENGTH> result{};
  hmacSha256(reinterpret_cast<const uint8_t*>(data.data()), data.size(),
             reinterpret_cast<const uint8_t*>(key.data()), key.size(), result.data());
  BOOST_CHECK_EQUAL(ndn::toHex(result, false),
                    "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

BOOST_AUTO_TEST_CASE(HmacSha256EmptyData)
{
  const uint8_t key[] = {0x01, 0x02, 0x03};
  const uint8_t data[] = {0x00};
  std::array<uint8_t, HMAC_SHA256_LENGTH> result{};
  hmacSha256(data, 0, key, sizeof(key), result.data());
  BOOST_CHECK_EQUAL(ndn::toHex(result, false),
                    "368ac05cd81d972174a46fd54daa74ed0e808c09b0cc86f0c3fc342bef66f405");
}

BOOST_AUTO_TEST_CASE(ConstantTimeEquals)
{
  BOOST_CHECK(constantTimeEquals("0B612864", "0B612864"));
  BOOST_CHECK(constantTimeEquals("", ""));
  BOOST_CHECK(!constantTimeEquals("0B612864", "0B612865"));
  BOOST_CHECK(!constantTimeEquals("0B612864", "0b612864"));
  BOOST_CHECK(!constantTimeEquals("0B612864", "0B61286"));
  BOOST_CHECK(!constantTimeEquals("0B612864", "0B6128640"));
  BOOST_CHECK(!constantTimeEquals("", "0B612864"));
  BOOST_CHECK(!constantTimeEquals("0B61\0" "864"s, "0B61\0" "865"s));
}

BOOST_AUTO_TEST_SUITE_END() // TestCryptoHelpers

} // namespace qrvault::tests
