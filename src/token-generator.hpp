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

#ifndef QRVAULT_TOKEN_GENERATOR_HPP
#define QRVAULT_TOKEN_GENERATOR_HPP

#include "detail/qrvault-common.hpp"

namespace qrvault {

/**
 * @brief Compute the time block of @p now, i.e. floor(unix time / period).
 *
 * Instants before the Unix epoch map to block 0.
 */
uint64_t
computeTimeBlock(const time::system_clock::time_point& now, time::seconds period);

/**
 * @brief Derive the proof of one time block.
 *
 * The proof is the first 8 hex digits (uppercase) of HMAC-SHA256(secret, block), where the
 * block is encoded as an 8-byte big-endian unsigned integer.
 */
std::string
computeProof(const SharedSecret& secret, uint64_t timeBlock);

/**
 * @brief Derive the proof valid at @p now.
 */
std::string
computeCurrentProof(const SharedSecret& secret, const time::system_clock::time_point& now,
                    time::seconds period = DEFAULT_PERIOD);

/**
 * @brief Time left until the proof rotates, in whole seconds (1 to period).
 */
time::seconds
computeTimeUntilRotation(const time::system_clock::time_point& now,
                         time::seconds period = DEFAULT_PERIOD);

/**
 * @brief Produces the proof shown by the token holder.
 *
 * A generator either derives rotating proofs from a shared secret, or, when created with
 * makeStatic(), always yields one literal token (a rotation period of infinity).
 */
class TokenGenerator
{
public:
  class Error : public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /**
   * @throw Error the secret is empty or the period is not positive
   */
  explicit
  TokenGenerator(SharedSecret secret, time::seconds period = DEFAULT_PERIOD);

  /**
   * @throw Error the token is empty
   */
  static TokenGenerator
  makeStatic(const std::string& token);

  bool
  isStatic() const
  {
    return !m_staticProof.empty();
  }

  time::seconds
  getPeriod() const
  {
    return m_period;
  }

  uint64_t
  getTimeBlock(const time::system_clock::time_point& now) const;

  std::string
  getProof(uint64_t timeBlock) const;

  std::string
  getCurrentProof(const time::system_clock::time_point& now) const
  {
    return getProof(getTimeBlock(now));
  }

  /**
   * @return time until the next rotation, or time::seconds::max() for a static token
   */
  time::seconds
  getTimeUntilRotation(const time::system_clock::time_point& now) const;

  /**
   * @brief Return the current proof only if its block differs from the last one returned.
   *
   * Used by displays to avoid re-rendering an unchanged code. Has no effect on the value
   * of getCurrentProof().
   */
  std::optional<std::string>
  pollRotation(const time::system_clock::time_point& now);

private:
  TokenGenerator() = default;

private:
  SharedSecret m_secret;
  time::seconds m_period = time::seconds::max();
  std::string m_staticProof;
  std::optional<uint64_t> m_lastEmittedBlock;
};

} // namespace qrvault

#endif // QRVAULT_TOKEN_GENERATOR_HPP
