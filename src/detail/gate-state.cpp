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

#include "detail/gate-state.hpp"

namespace qrvault {

std::ostream&
operator<<(std::ostream& os, const GateState& state)
{
  os << "Gate status: " << state.status << "\n";
  if (state.cooldownDeadline) {
    os << "Cooldown elapsed: "
       << time::duration_cast<time::milliseconds>(state.cooldownElapsed).count() << " ms\n";
  }
  os << "Unlock requests: " << state.triggerCount << "\n";
  if (state.isFinished) {
    os << "Finished\n";
  }
  return os;
}

} // namespace qrvault
