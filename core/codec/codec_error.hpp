/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace rampart::codec {

  /**
   * Errors of decoding bytes against a type registry. Shortfall of input is
   * reported with scale::DecodeError::NOT_ENOUGH_DATA.
   */
  enum class CodecError {
    TYPE_NOT_FOUND = 1,
    VARIANT_NOT_FOUND,
    INVALID_BOOL,
    INVALID_CHAR,
    INVALID_STRING,
    INVALID_BIT_STORE_TYPE,
    INVALID_BIT_ORDER_TYPE,
    UNSUPPORTED_COMPACT_TYPE,
    COMPACT_OUT_OF_RANGE,
    DEPTH_LIMIT_EXCEEDED,
  };

}  // namespace rampart::codec

OUTCOME_HPP_DECLARE_ERROR(rampart::codec, CodecError)
