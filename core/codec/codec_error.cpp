/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/codec_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rampart::codec, CodecError, e) {
  using E = rampart::codec::CodecError;
  switch (e) {
    case E::TYPE_NOT_FOUND:
      return "type id is not found in the type registry";
    case E::VARIANT_NOT_FOUND:
      return "enum has no variant with the decoded index";
    case E::INVALID_BOOL:
      return "bool is encoded with a byte other than 0 or 1";
    case E::INVALID_CHAR:
      return "char is not a valid unicode scalar value";
    case E::INVALID_STRING:
      return "string is not valid utf-8";
    case E::INVALID_BIT_STORE_TYPE:
      return "bit store type of a bit sequence must be u8, u16, u32 or u64";
    case E::INVALID_BIT_ORDER_TYPE:
      return "bit order type of a bit sequence must be Lsb0 or Msb0";
    case E::UNSUPPORTED_COMPACT_TYPE:
      return "compact encoding is not supported for the inner type";
    case E::COMPACT_OUT_OF_RANGE:
      return "compact value does not fit into the inner type";
    case E::DEPTH_LIMIT_EXCEEDED:
      return "type nesting is too deep";
  }
  return "unknown CodecError";
}
