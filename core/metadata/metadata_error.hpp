/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace rampart::metadata {

  /**
   * Lookups into a metadata snapshot. These signal that data was produced by
   * a runtime other than the one the snapshot describes.
   */
  enum class MetadataError {
    PALLET_INDEX_NOT_FOUND = 1,
    PALLET_NAME_NOT_FOUND,
    VARIANT_INDEX_NOT_FOUND,
    VARIANT_NAME_NOT_FOUND,
    // pallet has no calls
    CALL_TYPE_NOT_FOUND,
    // id is referenced by the snapshot, but is absent in its registry
    TYPE_NOT_FOUND,
    NOT_A_VARIANT_TYPE,
  };

}  // namespace rampart::metadata

OUTCOME_HPP_DECLARE_ERROR(rampart::metadata, MetadataError)
