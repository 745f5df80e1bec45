/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <system_error>

#include "outcome/outcome.hpp"

namespace rampart::blocks {

  enum class BlockError {
    // block body has bytes past its last extrinsic
    BODY_HAS_TRAILING_BYTES = 1,
  };

  /// The only extrinsic format version that can be decoded
  inline constexpr uint8_t kSupportedExtrinsicVersion = 4;

  /**
   * Category of errors telling that an extrinsic has a format version other
   * than kSupportedExtrinsicVersion. Use unsupportedVersion() to get the
   * version back from such an error.
   */
  const std::error_category &unsupportedVersionCategory();

  std::error_code makeUnsupportedVersionError(uint8_t version);

  /// Rejected version if {@param ec} is an unsupported version error
  std::optional<uint8_t> unsupportedVersion(const std::error_code &ec);

}  // namespace rampart::blocks

OUTCOME_HPP_DECLARE_ERROR(rampart::blocks, BlockError)
