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

#include "detail/log-throttle.hpp"

namespace qrvault {

LogThrottle::LogThrottle(time::nanoseconds interval)
  : m_interval(interval)
{
}

bool
LogThrottle::allow(const time::steady_clock::time_point& now)
{
  // a backward step re-opens the throttle instead of muting it
  if (!m_lastAllowed || now < *m_lastAllowed || now - *m_lastAllowed >= m_interval) {
    m_lastAllowed = now;
    m_nSuppressedReported = m_nSuppressed;
    m_nSuppressed = 0;
    return true;
  }
  m_nSuppressed++;
  return false;
}

} // namespace qrvault
