/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/type_walk.hpp"

#include <limits>

#include "codec/codec_error.hpp"
#include "common/outcome_throw.hpp"

namespace rampart::codec::detail {

  const metadata::Type &resolve(const TypeRegistry &registry, TypeId id) {
    auto type = registry.resolve(id);
    if (not type) {
      common::raise(CodecError::TYPE_NOT_FOUND);
    }
    return *type;
  }

  void checkDepth(size_t depth) {
    if (depth > kMaxDepth) {
      common::raise(CodecError::DEPTH_LIMIT_EXCEEDED);
    }
  }

  size_t primitiveWidth(TypeDefPrimitive primitive) {
    switch (primitive) {
      case TypeDefPrimitive::Bool:
      case TypeDefPrimitive::U8:
      case TypeDefPrimitive::I8:
        return 1;
      case TypeDefPrimitive::U16:
      case TypeDefPrimitive::I16:
        return 2;
      case TypeDefPrimitive::Char:
      case TypeDefPrimitive::U32:
      case TypeDefPrimitive::I32:
        return 4;
      case TypeDefPrimitive::U64:
      case TypeDefPrimitive::I64:
        return 8;
      case TypeDefPrimitive::U128:
      case TypeDefPrimitive::I128:
        return 16;
      case TypeDefPrimitive::U256:
      case TypeDefPrimitive::I256:
        return 32;
      case TypeDefPrimitive::Str:
        return 0;
    }
    return 0;
  }

  size_t bitStoreBits(const TypeRegistry &registry, TypeId id) {
    auto &type = resolve(registry, id);
    auto primitive = std::get_if<TypeDefPrimitive>(&type.def);
    if (primitive) {
      switch (*primitive) {
        case TypeDefPrimitive::U8:
        case TypeDefPrimitive::U16:
        case TypeDefPrimitive::U32:
        case TypeDefPrimitive::U64:
          return primitiveWidth(*primitive) * 8;
        default:
          break;
      }
    }
    common::raise(CodecError::INVALID_BIT_STORE_TYPE);
  }

  BitOrder bitOrder(const TypeRegistry &registry, TypeId id) {
    auto &type = resolve(registry, id);
    if (not type.path.empty()) {
      if (type.path.back() == "Lsb0") {
        return BitOrder::Lsb0;
      }
      if (type.path.back() == "Msb0") {
        return BitOrder::Msb0;
      }
    }
    common::raise(CodecError::INVALID_BIT_ORDER_TYPE);
  }

  size_t readLength(::scale::ScaleDecoderStream &stream) {
    ::scale::CompactInteger length;
    stream >> length;
    if (length > std::numeric_limits<uint32_t>::max()) {
      common::raise(::scale::DecodeError::TOO_MANY_ITEMS);
    }
    return length.convert_to<size_t>();
  }

  size_t readByteLength(::scale::ScaleDecoderStream &stream) {
    auto length = readLength(stream);
    if (not stream.hasMore(length)) {
      common::raise(::scale::DecodeError::TOO_MANY_ITEMS);
    }
    return length;
  }

  bool isByte(const TypeRegistry &registry, TypeId id) {
    auto primitive = std::get_if<TypeDefPrimitive>(&resolve(registry, id).def);
    return primitive
       and (*primitive == TypeDefPrimitive::U8
            or *primitive == TypeDefPrimitive::I8);
  }

  void skipBytes(::scale::ScaleDecoderStream &stream, size_t count) {
    if (not stream.hasMore(count)) {
      common::raise(::scale::DecodeError::NOT_ENOUGH_DATA);
    }
    for (size_t i = 0; i < count; ++i) {
      stream.nextByte();
    }
  }

}  // namespace rampart::codec::detail
