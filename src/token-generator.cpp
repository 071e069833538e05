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

#include "token-generator.hpp"
#include "detail/crypto-helpers.hpp"

#include <ndn-cxx/util/string-helper.hpp>

#include <boost/endian/conversion.hpp>

#include <array>

namespace qrvault {

NDN_LOG_INIT(qrvault.token);

uint64_t
computeTimeBlock(const time::system_clock::time_point& now, time::seconds period)
{
  BOOST_ASSERT(period > time::seconds::zero());
  auto sinceEpoch = time::duration_cast<time::seconds>(now.time_since_epoch());
  if (sinceEpoch < time::seconds::zero()) {
    return 0;
  }
  return static_cast<uint64_t>(sinceEpoch.count() / period.count());
}

std::string
computeProof(const SharedSecret& secret, uint64_t timeBlock)
{
  uint64_t message = boost::endian::native_to_big(timeBlock);
  std::array<uint8_t, HMAC_SHA256_LENGTH> digest{};
  hmacSha256(reinterpret_cast<const uint8_t*>(&message), sizeof(message),
             secret.data(), secret.size(), digest.data());
  return ndn::toHex(digest).substr(0, PROOF_LENGTH);
}

std::string
computeCurrentProof(const SharedSecret& secret, const time::system_clock::time_point& now,
                    time::seconds period)
{
  return computeProof(secret, computeTimeBlock(now, period));
}

time::seconds
computeTimeUntilRotation(const time::system_clock::time_point& now, time::seconds period)
{
  BOOST_ASSERT(period > time::seconds::zero());
  auto sinceEpoch = time::duration_cast<time::seconds>(now.time_since_epoch());
  if (sinceEpoch < time::seconds::zero()) {
    sinceEpoch = time::seconds::zero();
  }
  return period - time::seconds(sinceEpoch.count() % period.count());
}

TokenGenerator::TokenGenerator(SharedSecret secret, time::seconds period)
  : m_secret(std::move(secret))
  , m_period(period)
{
  if (m_secret.empty()) {
    NDN_THROW(Error("Shared secret cannot be empty"));
  }
  if (m_period <= time::seconds::zero()) {
    NDN_THROW(Error("Rotation period must be positive"));
  }
}

TokenGenerator
TokenGenerator::makeStatic(const std::string& token)
{
  if (token.empty()) {
    NDN_THROW(Error("Static token cannot be empty"));
  }
  TokenGenerator generator;
  generator.m_staticProof = token;
  return generator;
}

uint64_t
TokenGenerator::getTimeBlock(const time::system_clock::time_point& now) const
{
  if (isStatic()) {
    return 0;
  }
  return computeTimeBlock(now, m_period);
}

std::string
TokenGenerator::getProof(uint64_t timeBlock) const
{
  if (isStatic()) {
    return m_staticProof;
  }
  return computeProof(m_secret, timeBlock);
}

time::seconds
TokenGenerator::getTimeUntilRotation(const time::system_clock::time_point& now) const
{
  if (isStatic()) {
    return time::seconds::max();
  }
  return computeTimeUntilRotation(now, m_period);
}

std::optional<std::string>
TokenGenerator::pollRotation(const time::system_clock::time_point& now)
{
  auto block = getTimeBlock(now);
  if (m_lastEmittedBlock && *m_lastEmittedBlock == block) {
    return std::nullopt;
  }
  NDN_LOG_DEBUG("Rotated to time block " << block);
  m_lastEmittedBlock = block;
  return getProof(block);
}

} // namespace qrvault
