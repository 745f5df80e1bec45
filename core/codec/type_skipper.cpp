/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/type_skipper.hpp"

#include <limits>

#include "codec/codec_error.hpp"
#include "codec/type_walk.hpp"
#include "common/outcome_throw.hpp"

namespace rampart::codec {

  namespace {
    using namespace metadata;

    void skipCompact(::scale::ScaleDecoderStream &stream) {
      ::scale::CompactInteger ignored;
      stream >> ignored;
    }

    void skip(::scale::ScaleDecoderStream &stream,
              TypeId id,
              const TypeRegistry &registry,
              size_t depth);

    void skipFields(::scale::ScaleDecoderStream &stream,
                    const std::vector<Field> &fields,
                    const TypeRegistry &registry,
                    size_t depth) {
      for (auto &field : fields) {
        skip(stream, field.type, registry, depth);
      }
    }

    void skip(::scale::ScaleDecoderStream &stream,
              TypeId id,
              const TypeRegistry &registry,
              size_t depth) {
      detail::checkDepth(depth);
      auto &type = detail::resolve(registry, id);
      ++depth;

      if (auto composite = std::get_if<TypeDefComposite>(&type.def)) {
        skipFields(stream, composite->fields, registry, depth);

      } else if (auto variants = std::get_if<TypeDefVariant>(&type.def)) {
        auto index = stream.nextByte();
        auto variant = variants->variantByIndex(index);
        if (not variant) {
          common::raise(CodecError::VARIANT_NOT_FOUND);
        }
        skipFields(stream, variant->fields, registry, depth);

      } else if (auto sequence = std::get_if<TypeDefSequence>(&type.def)) {
        if (detail::isByte(registry, sequence->type)) {
          detail::skipBytes(stream, detail::readByteLength(stream));
        } else {
          auto length = detail::readLength(stream);
          for (size_t i = 0; i < length; ++i) {
            skip(stream, sequence->type, registry, depth);
          }
        }

      } else if (auto array = std::get_if<TypeDefArray>(&type.def)) {
        for (uint32_t i = 0; i < array->len; ++i) {
          skip(stream, array->type, registry, depth);
        }

      } else if (auto tuple = std::get_if<TypeDefTuple>(&type.def)) {
        for (auto element : tuple->fields) {
          skip(stream, element, registry, depth);
        }

      } else if (auto primitive = std::get_if<TypeDefPrimitive>(&type.def)) {
        if (*primitive == TypeDefPrimitive::Str) {
          detail::skipBytes(stream, detail::readByteLength(stream));
        } else {
          detail::skipBytes(stream, detail::primitiveWidth(*primitive));
        }

      } else if (std::holds_alternative<TypeDefCompact>(type.def)) {
        skipCompact(stream);

      } else if (auto bits = std::get_if<TypeDefBitSequence>(&type.def)) {
        auto store_bits = detail::bitStoreBits(registry, bits->bit_store_type);
        detail::bitOrder(registry, bits->bit_order_type);
        ::scale::CompactInteger bit_count;
        stream >> bit_count;
        ::scale::CompactInteger words =
            (bit_count + store_bits - 1) / store_bits;
        if (words > std::numeric_limits<uint32_t>::max()) {
          common::raise(::scale::DecodeError::NOT_ENOUGH_DATA);
        }
        detail::skipBytes(stream,
                          words.convert_to<size_t>() * (store_bits / 8));
      }
    }
  }  // namespace

  void skipType(::scale::ScaleDecoderStream &stream,
                metadata::TypeId id,
                const metadata::TypeRegistry &registry) {
    skip(stream, id, registry, 0);
  }

  outcome::result<size_t> encodedSize(
      common::BufferView bytes,
      metadata::TypeId id,
      const metadata::TypeRegistry &registry) {
    ::scale::ScaleDecoderStream stream{bytes};
    try {
      skipType(stream, id, registry);
    } catch (const std::system_error &e) {
      return e.code();
    }
    return stream.currentIndex();
  }

}  // namespace rampart::codec
