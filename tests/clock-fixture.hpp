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

#ifndef QRVAULT_TESTS_CLOCK_FIXTURE_HPP
#define QRVAULT_TESTS_CLOCK_FIXTURE_HPP

#include "detail/qrvault-common.hpp"

#include <ndn-cxx/util/time-unit-test-clock.hpp>

namespace qrvault::tests {

/** \brief A test fixture that overrides steady clock and system clock.
 */
class ClockFixture
{
public:
  ClockFixture()
    : m_steadyClock(std::make_shared<time::UnitTestSteadyClock>())
    , m_systemClock(std::make_shared<time::UnitTestSystemClock>())
  {
    time::setCustomClocks(m_steadyClock, m_systemClock);
  }

  ~ClockFixture()
  {
    time::setCustomClocks(nullptr, nullptr);
  }

  /** \brief Set the system clock to \p sinceEpoch after the Unix epoch.
   *
   *  The steady clock is left alone.
   */
  void
  setSystemTime(time::nanoseconds sinceEpoch)
  {
    m_systemClock->setNow(sinceEpoch);
  }

  /** \brief Advance steady and system clocks.
   *
   *  Clocks are advanced in increments of \p tick for \p nTicks ticks.
   */
  void
  advanceClocks(time::nanoseconds tick, size_t nTicks = 1)
  {
    BOOST_ASSERT(tick > time::nanoseconds::zero());
    for (size_t i = 0; i < nTicks; ++i) {
      m_steadyClock->advance(tick);
      m_systemClock->advance(tick);
    }
  }

protected:
  std::shared_ptr<time::UnitTestSteadyClock> m_steadyClock;
  std::shared_ptr<time::UnitTestSystemClock> m_systemClock;
};

} // namespace qrvault::tests

#endif // QRVAULT_TESTS_CLOCK_FIXTURE_HPP
