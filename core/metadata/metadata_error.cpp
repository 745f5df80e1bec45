/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metadata/metadata_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rampart::metadata, MetadataError, e) {
  using E = rampart::metadata::MetadataError;
  switch (e) {
    case E::PALLET_INDEX_NOT_FOUND:
      return "pallet with the given index is not found in metadata";
    case E::PALLET_NAME_NOT_FOUND:
      return "pallet with the given name is not found in metadata";
    case E::VARIANT_INDEX_NOT_FOUND:
      return "variant with the given index is not found in the call enum";
    case E::VARIANT_NAME_NOT_FOUND:
      return "variant with the given name is not found in the call enum";
    case E::CALL_TYPE_NOT_FOUND:
      return "pallet has no calls";
    case E::TYPE_NOT_FOUND:
      return "type id is not found in the type registry";
    case E::NOT_A_VARIANT_TYPE:
      return "type is expected to be an enum";
  }
  return "unknown MetadataError";
}
