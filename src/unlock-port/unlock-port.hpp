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

#ifndef QRVAULT_UNLOCK_PORT_UNLOCK_PORT_HPP
#define QRVAULT_UNLOCK_PORT_UNLOCK_PORT_HPP

#include "detail/qrvault-common.hpp"

#include <map>

namespace qrvault {

/**
 * @brief Capability that performs the privileged unlock on an external device.
 */
class UnlockPort : boost::noncopyable
{
public:
  virtual
  ~UnlockPort() = default;

  /**
   * @brief Deliver @p pin to the device.
   *
   * @return UnlockError::NO_ERROR on success, otherwise the failure class and a
   *         human-readable description.
   */
  virtual std::tuple<UnlockError, std::string>
  requestUnlock(uint32_t pin) = 0;

public: // factory
  template<class UnlockPortType>
  static void
  registerUnlockPort(const std::string& type = UnlockPortType::PORT_TYPE)
  {
    auto& factory = getFactory();
    BOOST_ASSERT(factory.count(type) == 0);
    factory[type] = [] (const JsonSection& params) {
      return std::make_unique<UnlockPortType>(params);
    };
  }

  static bool
  isUnlockPortSupported(const std::string& portType);

  /**
   * @return the port, or nullptr if @p portType is not registered
   * @throw std::invalid_argument @p params are not acceptable to the port
   */
  static std::unique_ptr<UnlockPort>
  createUnlockPort(const std::string& portType, const JsonSection& params);

private:
  using CreateFunc = std::function<std::unique_ptr<UnlockPort>(const JsonSection&)>;
  using UnlockPortFactory = std::map<std::string, CreateFunc>;

  static UnlockPortFactory&
  getFactory();
};

} // namespace qrvault

#define QRVAULT_REGISTER_UNLOCK_PORT(C)                       \
static class Qrvault##C##UnlockPortRegistrationClass          \
{                                                             \
public:                                                       \
  Qrvault##C##UnlockPortRegistrationClass()                   \
  {                                                           \
    ::qrvault::UnlockPort::registerUnlockPort<C>();           \
  }                                                           \
} g_Qrvault##C##UnlockPortRegistrationVariable

#endif // QRVAULT_UNLOCK_PORT_UNLOCK_PORT_HPP
