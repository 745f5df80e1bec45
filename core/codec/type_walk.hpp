/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "metadata/type_registry.hpp"

/**
 * Helpers shared by the skipping and the value decoding walks. All of them
 * report failures by raising std::system_error.
 */
namespace rampart::codec::detail {

  using metadata::TypeDefPrimitive;
  using metadata::TypeId;
  using metadata::TypeRegistry;

  /// Nesting of types a single walk may descend into
  inline constexpr size_t kMaxDepth = 256;

  enum class BitOrder : uint8_t { Lsb0, Msb0 };

  /// Type with the given id, raises CodecError::TYPE_NOT_FOUND if absent
  const metadata::Type &resolve(const TypeRegistry &registry, TypeId id);

  void checkDepth(size_t depth);

  /// Encoded width of a fixed-width primitive, 0 for str
  size_t primitiveWidth(TypeDefPrimitive primitive);

  /// Bits in one word of the bit store type: 8, 16, 32 or 64
  size_t bitStoreBits(const TypeRegistry &registry, TypeId id);

  BitOrder bitOrder(const TypeRegistry &registry, TypeId id);

  /**
   * Reads a compact element count. Elements may be zero-sized, so the count
   * is not checked against the bytes left.
   */
  size_t readLength(::scale::ScaleDecoderStream &stream);

  /// Reads a compact count of single-byte elements, which must all be present
  size_t readByteLength(::scale::ScaleDecoderStream &stream);

  /// Whether the type is u8 or i8
  bool isByte(const TypeRegistry &registry, TypeId id);

  void skipBytes(::scale::ScaleDecoderStream &stream, size_t count);

}  // namespace rampart::codec::detail
