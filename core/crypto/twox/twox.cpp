/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/twox/twox.hpp"

#include <cstring>

#include <xxhash.h>

namespace rampart::crypto {

  void make_twox256(const uint8_t *in, size_t len, uint8_t *out) {
    // Ensure the buffer is aligned to the boundary required for uint64_t
    // (required for happy UBSAN)
    std::array<uint64_t, 4> aligned_out{};
    aligned_out[0] = XXH64(in, len, 0);
    aligned_out[1] = XXH64(in, len, 1);
    aligned_out[2] = XXH64(in, len, 2);
    aligned_out[3] = XXH64(in, len, 3);
    std::memcpy(out, aligned_out.data(), 4 * sizeof(uint64_t));
  }

  common::Hash256 make_twox256(common::BufferView buf) {
    common::Hash256 hash{};
    make_twox256(buf.data(), buf.size(), hash.data());
    return hash;
  }

}  // namespace rampart::crypto
