/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "common/hexutil.hpp"

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return rampart::common::unhex(std::string_view{c, s}).value();
}

inline rampart::common::Buffer operator""_hex2buf(const char *c, size_t s) {
  return rampart::common::Buffer{
      rampart::common::unhex(std::string_view{c, s}).value()};
}

inline rampart::common::Hash256 operator""_hash256(const char *c, size_t s) {
  return rampart::common::Hash256::fromHex(std::string_view{c, s}).value();
}
