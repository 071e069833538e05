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

#include "token-validator.hpp"
#include "detail/crypto-helpers.hpp"

namespace qrvault {

NDN_LOG_INIT(qrvault.validator);

TokenValidator::TokenValidator(TokenGenerator generator, size_t windowSize)
  : m_generator(std::move(generator))
  , m_windowSize(windowSize)
{
  if (m_windowSize == 0) {
    NDN_THROW(Error("Validation window must contain at least one time block"));
  }
  if (m_windowSize > MAX_WINDOW_SIZE) {
    NDN_THROW(Error("Validation window cannot exceed " + std::to_string(MAX_WINDOW_SIZE) + " time blocks"));
  }
}

std::vector<std::string>
TokenValidator::getValidWindow(const time::system_clock::time_point& now) const
{
  std::vector<std::string> window;
  if (m_generator.isStatic()) {
    window.push_back(m_generator.getProof(0));
    return window;
  }

  auto currentBlock = m_generator.getTimeBlock(now);
  for (uint64_t i = 0; i < m_windowSize && i <= currentBlock; i++) {
    window.push_back(m_generator.getProof(currentBlock - i));
  }
  return window;
}

bool
TokenValidator::isValid(const std::string& candidate, const time::system_clock::time_point& now) const
{
  bool isMatched = false;
  for (const auto& proof : getValidWindow(now)) {
    isMatched |= constantTimeEquals(candidate, proof);
  }
  NDN_LOG_TRACE("Candidate of length " << candidate.size() << (isMatched ? " accepted" : " rejected"));
  return isMatched;
}

bool
isValidProof(const std::string& candidate, const SharedSecret& secret,
             const time::system_clock::time_point& now,
             time::seconds period, size_t windowSize)
{
  TokenValidator validator(TokenGenerator(secret, period), windowSize);
  return validator.isValid(candidate, now);
}

} // namespace qrvault
