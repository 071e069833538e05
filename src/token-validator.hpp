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

#ifndef QRVAULT_TOKEN_VALIDATOR_HPP
#define QRVAULT_TOKEN_VALIDATOR_HPP

#include "token-generator.hpp"

namespace qrvault {

/**
 * @brief Decides whether a decoded candidate is a proof accepted right now.
 *
 * The valid window holds the proofs of the current time block and of the windowSize - 1
 * blocks before it. With the default width of 2, a proof is accepted from the moment its
 * block starts until one full period after its block ended, which is the total replay
 * tolerance of the scheme. Proofs of future blocks are never accepted.
 *
 * The window is recomputed on every call and never cached.
 */
class TokenValidator
{
public:
  class Error : public std::invalid_argument
  {
  public:
    using std::invalid_argument::invalid_argument;
  };

  /**
   * @throw Error @p windowSize is zero or larger than MAX_WINDOW_SIZE
   */
  explicit
  TokenValidator(TokenGenerator generator, size_t windowSize = DEFAULT_WINDOW_SIZE);

  /**
   * @return accepted proofs at @p now, newest block first, without duplicates
   */
  std::vector<std::string>
  getValidWindow(const time::system_clock::time_point& now) const;

  /**
   * @brief Test @p candidate for exact membership in the valid window.
   *
   * Any string is a legal input; strings that are not a window element are rejected.
   * Every window element is compared in constant time.
   */
  bool
  isValid(const std::string& candidate, const time::system_clock::time_point& now) const;

  size_t
  getWindowSize() const
  {
    return m_windowSize;
  }

  const TokenGenerator&
  getGenerator() const
  {
    return m_generator;
  }

private:
  TokenGenerator m_generator;
  size_t m_windowSize;
};

/**
 * @brief Stateless form of TokenValidator::isValid() for a rotating secret.
 */
bool
isValidProof(const std::string& candidate, const SharedSecret& secret,
             const time::system_clock::time_point& now,
             time::seconds period = DEFAULT_PERIOD, size_t windowSize = DEFAULT_WINDOW_SIZE);

} // namespace qrvault

#endif // QRVAULT_TOKEN_VALIDATOR_HPP
