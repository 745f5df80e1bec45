/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metadata/metadata.hpp"

namespace rampart::blocks {

  /**
   * Type ids of the generic parts of an extrinsic, taken once per metadata
   */
  struct ExtrinsicPartTypeIds {
    metadata::TypeId address{};
    /// not used for decoding, calls are located by the pallet and call index
    metadata::TypeId call{};
    metadata::TypeId signature{};
    metadata::TypeId extra{};

    static ExtrinsicPartTypeIds fromMetadata(
        const metadata::Metadata &metadata);

    bool operator==(const ExtrinsicPartTypeIds &) const = default;
  };

}  // namespace rampart::blocks
