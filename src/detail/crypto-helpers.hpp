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

#ifndef QRVAULT_DETAIL_CRYPTO_HELPERS_HPP
#define QRVAULT_DETAIL_CRYPTO_HELPERS_HPP

#include "detail/qrvault-common.hpp"

namespace qrvault {

constexpr size_t HMAC_SHA256_LENGTH = 32;

/**
 * @brief HMAC based on SHA-256.
 *
 * @param data The intput array to hmac.
 * @param dataLen The length of the input array.
 * @param key The HMAC key.
 * @param keyLen The length of the HMAC key.
 * @param result The result of the HMAC. Enough memory (32 Bytes) must be allocated beforehands.
 * @throw runtime_error when an error occurred in the underlying HMAC.
 */
void
hmacSha256(const uint8_t* data, size_t dataLen,
           const uint8_t* key, size_t keyLen,
           uint8_t* result);

/**
 * @brief Compare two strings without exiting early on the first differing byte.
 *
 * Strings of different length compare unequal immediately; only the contents are
 * protected, the length of a proof is public.
 */
bool
constantTimeEquals(const std::string& lhs, const std::string& rhs);

} // namespace qrvault

#endif // QRVAULT_DETAIL_CRYPTO_HELPERS_HPP
