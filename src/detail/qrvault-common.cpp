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

#include "detail/qrvault-common.hpp"

#include <ndn-cxx/util/backports.hpp>

#include <cctype>
#include <cstdio>

namespace qrvault {

std::ostream&
operator<<(std::ostream& out, UnlockError error)
{
  switch (error) {
    case UnlockError::NO_ERROR: return out << "NO_ERROR";
    case UnlockError::PERMISSION_DENIED: return out << "PERMISSION_DENIED";
    case UnlockError::DEVICE_ABSENT: return out << "DEVICE_ABSENT";
    case UnlockError::OTHER: return out << "OTHER";
  }
  return out << "<Unknown Unlock Error " << static_cast<int>(ndn::to_underlying(error)) << ">";
}

std::ostream&
operator<<(std::ostream& out, GateStatus status)
{
  switch (status) {
    case GateStatus::IDLE: return out << "Idle";
    case GateStatus::TRIGGERED: return out << "Triggered";
    case GateStatus::COOLDOWN: return out << "Cooldown";
  }
  return out << "<Unknown Gate Status " << static_cast<int>(ndn::to_underlying(status)) << ">";
}

std::string
sanitizeForLog(const std::string& untrusted, size_t maxLength)
{
  std::string result;
  size_t count = 0;
  for (char c : untrusted) {
    if (count++ == maxLength) {
      result += "...";
      break;
    }
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80 && std::isprint(byte)) {
      result.push_back(c);
    }
    else {
      char escaped[5];
      std::snprintf(escaped, sizeof(escaped), "\\x%02X", byte);
      result += escaped;
    }
  }
  return result;
}

} // namespace qrvault
