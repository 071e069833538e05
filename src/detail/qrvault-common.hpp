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

#ifndef QRVAULT_DETAIL_QRVAULT_COMMON_HPP
#define QRVAULT_DETAIL_QRVAULT_COMMON_HPP

#include "detail/qrvault-config.hpp"

#ifdef QRVAULT_HAVE_TESTS
#define QRVAULT_PUBLIC_WITH_TESTS_ELSE_PRIVATE public
#else
#define QRVAULT_PUBLIC_WITH_TESTS_ELSE_PRIVATE private
#endif

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <vector>

#include <ndn-cxx/util/exception.hpp>
#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/time.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/assert.hpp>
#include <boost/noncopyable.hpp>
#include <boost/property_tree/ptree.hpp>

namespace qrvault {

namespace time = ndn::time;
using namespace ndn::time_literals;
using namespace std::string_literals;

using JsonSection = boost::property_tree::ptree;

/**
 * @brief Opaque key shared by the token holder and the guard.
 *
 * Never transmitted and never logged.
 */
using SharedSecret = std::vector<uint8_t>;

/**
 * @brief Length of the proof string shown in the optical code.
 */
constexpr size_t PROOF_LENGTH = 8;

constexpr time::seconds DEFAULT_PERIOD = 30_s;
constexpr size_t DEFAULT_WINDOW_SIZE = 2;
/**
 * @brief Largest accepted window; every candidate costs one HMAC per block in the window.
 */
constexpr size_t MAX_WINDOW_SIZE = 16;
constexpr time::seconds DEFAULT_COOLDOWN = 5_s;
constexpr uint32_t DEFAULT_UNLOCK_PIN = 1337;

// Classified failure of an unlock request
enum class UnlockError : uint8_t {
  NO_ERROR = 0,
  PERMISSION_DENIED = 1,
  DEVICE_ABSENT = 2,
  OTHER = 3
};

// Convert unlock error to string
std::ostream&
operator<<(std::ostream& os, UnlockError error);

// Unlock gate status
enum class GateStatus : uint8_t {
  IDLE = 0,
  TRIGGERED = 1,
  COOLDOWN = 2
};

// Convert gate status to string
std::ostream&
operator<<(std::ostream& os, GateStatus status);

/**
 * @brief Make an untrusted string safe to print.
 *
 * Non-printable bytes are escaped as \\xHH and the result is cut after @p maxLength
 * input bytes, with "..." appended when truncated.
 */
std::string
sanitizeForLog(const std::string& untrusted, size_t maxLength = 32);

} // namespace qrvault

#endif // QRVAULT_DETAIL_QRVAULT_COMMON_HPP
