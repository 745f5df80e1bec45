/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blocks/extrinsic_part_type_ids.hpp"

namespace rampart::blocks {

  ExtrinsicPartTypeIds ExtrinsicPartTypeIds::fromMetadata(
      const metadata::Metadata &metadata) {
    auto &extrinsic = metadata.extrinsic();
    return {
        .address = extrinsic.address_ty,
        .call = extrinsic.call_ty,
        .signature = extrinsic.signature_ty,
        .extra = extrinsic.extra_ty,
    };
  }

}  // namespace rampart::blocks
