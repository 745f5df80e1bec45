/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rampart::common, BlobError, e) {
  using rampart::common::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Provided data have unexpected length";
  }
  return "Unknown BlobError";
}

namespace rampart::common {
  template class Blob<32ul>;
}  // namespace rampart::common
