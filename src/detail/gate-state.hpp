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

#ifndef QRVAULT_DETAIL_GATE_STATE_HPP
#define QRVAULT_DETAIL_GATE_STATE_HPP

#include "detail/qrvault-common.hpp"

namespace qrvault {

/**
 * @brief The state of one guard's unlock gate.
 *
 * Owned by the caller and handed to UnlockGate by reference; only UnlockGate changes it.
 * Independent guards keep independent states.
 */
struct GateState
{
  /**
   * @brief The current gate status.
   */
  GateStatus status = GateStatus::IDLE;
  /**
   * @brief The instant the gate expects to re-arm, present only during COOLDOWN.
   *
   * Informational; re-arming is decided by cooldownElapsed.
   */
  std::optional<time::steady_clock::time_point> cooldownDeadline;
  /**
   * @brief Forward clock progress observed since COOLDOWN was entered.
   *
   * Backward clock steps add nothing, so a clock adjustment can neither extend
   * nor wedge the cooldown.
   */
  time::nanoseconds cooldownElapsed = time::nanoseconds::zero();
  /**
   * @brief The last instant the gate observed while cooling down.
   */
  time::steady_clock::time_point lastObserved;
  /**
   * @brief Number of unlock requests issued so far.
   */
  size_t triggerCount = 0;
  /**
   * @brief Set after a successful unlock in single-shot mode; the gate never re-arms.
   */
  bool isFinished = false;
};

std::ostream&
operator<<(std::ostream& os, const GateState& state);

} // namespace qrvault

#endif // QRVAULT_DETAIL_GATE_STATE_HPP
