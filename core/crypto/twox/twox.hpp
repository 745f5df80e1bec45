/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace rampart::crypto {

  /**
   * 256-bit twox: four XXH64 lanes seeded 0..3, concatenated
   */
  common::Hash256 make_twox256(common::BufferView buf);

}  // namespace rampart::crypto
