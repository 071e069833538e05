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

#include "unlock-port/unlock-port.hpp"

namespace qrvault {

bool
UnlockPort::isUnlockPortSupported(const std::string& portType)
{
  auto& factory = getFactory();
  return factory.find(portType) != factory.end();
}

std::unique_ptr<UnlockPort>
UnlockPort::createUnlockPort(const std::string& portType, const JsonSection& params)
{
  auto& factory = getFactory();
  auto i = factory.find(portType);
  return i == factory.end() ? nullptr : i->second(params);
}

UnlockPort::UnlockPortFactory&
UnlockPort::getFactory()
{
  static UnlockPort::UnlockPortFactory factory;
  return factory;
}

} // namespace qrvault
