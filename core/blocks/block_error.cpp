/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blocks/block_error.hpp"

#include <fmt/format.h>

OUTCOME_CPP_DEFINE_CATEGORY(rampart::blocks, BlockError, e) {
  using E = rampart::blocks::BlockError;
  switch (e) {
    case E::BODY_HAS_TRAILING_BYTES:
      return "block body has unexpected bytes after the last extrinsic";
  }
  return "unknown BlockError";
}

namespace rampart::blocks {

  namespace {
    class UnsupportedVersionCategory final : public std::error_category {
     public:
      const char *name() const noexcept override {
        return "UnsupportedVersion";
      }

      std::string message(int value) const override {
        return fmt::format(
            "extrinsic version {} is not supported, only version {} is",
            value - 1,
            kSupportedExtrinsicVersion);
      }
    };
  }  // namespace

  const std::error_category &unsupportedVersionCategory() {
    static const UnsupportedVersionCategory category;
    return category;
  }

  // value is shifted by one, so version 0 still gives a failing error_code
  std::error_code makeUnsupportedVersionError(uint8_t version) {
    return {version + 1, unsupportedVersionCategory()};
  }

  std::optional<uint8_t> unsupportedVersion(const std::error_code &ec) {
    if (ec.category() != unsupportedVersionCategory()) {
      return std::nullopt;
    }
    return static_cast<uint8_t>(ec.value() - 1);
  }

}  // namespace rampart::blocks
