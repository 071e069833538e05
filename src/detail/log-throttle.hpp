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

#ifndef QRVAULT_DETAIL_LOG_THROTTLE_HPP
#define QRVAULT_DETAIL_LOG_THROTTLE_HPP

#include "detail/qrvault-common.hpp"

namespace qrvault {

/**
 * @brief Lets at most one message through per interval.
 *
 * Purely cosmetic; never consulted for an access decision.
 */
class LogThrottle
{
public:
  explicit
  LogThrottle(time::nanoseconds interval = 1_s);

  /**
   * @return true if a message may be emitted at @p now
   */
  bool
  allow(const time::steady_clock::time_point& now);

  /**
   * @brief Number of messages held back since the last one that was let through.
   */
  size_t
  getSuppressedCount() const
  {
    return m_nSuppressed;
  }

  /**
   * @brief Number of messages held back before the one most recently let through.
   */
  size_t
  getSuppressedBeforeLast() const
  {
    return m_nSuppressedReported;
  }

private:
  time::nanoseconds m_interval;
  std::optional<time::steady_clock::time_point> m_lastAllowed;
  size_t m_nSuppressed = 0;
  size_t m_nSuppressedReported = 0;
};

} // namespace qrvault

#endif // QRVAULT_DETAIL_LOG_THROTTLE_HPP
