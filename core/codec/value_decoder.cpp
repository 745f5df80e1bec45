/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/value_decoder.hpp"

#include <algorithm>
#include <limits>

#include <scale/scale.hpp>
#include <utf8.h>

#include "codec/codec_error.hpp"
#include "codec/type_walk.hpp"
#include "common/outcome_throw.hpp"
#include "log/logger.hpp"

namespace rampart::codec {

  namespace {
    using namespace metadata;
    using Stream = ::scale::ScaleDecoderStream;

    log::Logger &logger() {
      static auto instance = log::createLogger("ValueDecoder", "codec");
      return instance;
    }

    /// Little-endian unsigned integer of the given width
    U256 readUnsigned(Stream &stream, size_t width) {
      U256 value = 0;
      for (size_t i = 0; i < width; ++i) {
        value |= U256{stream.nextByte()} << (8 * i);
      }
      return value;
    }

    /// Two's complement signed integer of the given width
    I256 readSigned(Stream &stream, size_t width) {
      auto raw = readUnsigned(stream, width);
      boost::multiprecision::cpp_int value{raw};
      if (bit_test(raw, width * 8 - 1)) {
        value -= boost::multiprecision::cpp_int{1} << (width * 8);
      }
      return I256{value};
    }

    Value decodePrimitive(Stream &stream, TypeDefPrimitive primitive) {
      auto width = detail::primitiveWidth(primitive);
      switch (primitive) {
        case TypeDefPrimitive::Bool: {
          auto byte = stream.nextByte();
          if (byte > 1) {
            common::raise(CodecError::INVALID_BOOL);
          }
          return Value::boolean(byte == 1);
        }
        case TypeDefPrimitive::Char: {
          auto cp = readUnsigned(stream, width).convert_to<uint32_t>();
          if (cp > 0x10FFFF or (cp >= 0xD800 and cp <= 0xDFFF)) {
            common::raise(CodecError::INVALID_CHAR);
          }
          return Value::character(static_cast<char32_t>(cp));
        }
        case TypeDefPrimitive::Str: {
          auto length = detail::readByteLength(stream);
          std::string str;
          str.reserve(length);
          for (size_t i = 0; i < length; ++i) {
            str.push_back(static_cast<char>(stream.nextByte()));
          }
          if (utf8::find_invalid(str.begin(), str.end()) != str.end()) {
            common::raise(CodecError::INVALID_STRING);
          }
          return Value::string(std::move(str));
        }
        case TypeDefPrimitive::U8:
        case TypeDefPrimitive::U16:
        case TypeDefPrimitive::U32:
        case TypeDefPrimitive::U64:
        case TypeDefPrimitive::U128:
          return Value::u128(
              readUnsigned(stream, width).convert_to<U128>());
        case TypeDefPrimitive::U256:
          return Value::u256(readUnsigned(stream, width));
        case TypeDefPrimitive::I8:
        case TypeDefPrimitive::I16:
        case TypeDefPrimitive::I32:
        case TypeDefPrimitive::I64:
        case TypeDefPrimitive::I128:
          return Value::i128(readSigned(stream, width).convert_to<I128>());
        case TypeDefPrimitive::I256:
          return Value::i256(readSigned(stream, width));
      }
      common::raise(CodecError::TYPE_NOT_FOUND);
    }

    Value decode(Stream &stream,
                 TypeId id,
                 const TypeRegistry &registry,
                 size_t depth);

    Composite decodeFields(Stream &stream,
                           const std::vector<Field> &fields,
                           const TypeRegistry &registry,
                           size_t depth) {
      Composite composite;
      auto named = not fields.empty()
               and std::all_of(fields.begin(), fields.end(), [](auto &f) {
                     return f.name.has_value();
                   });
      composite.values.reserve(fields.size());
      for (auto &field : fields) {
        composite.values.emplace_back(
            decode(stream, field.type, registry, depth));
        if (named) {
          composite.names.emplace_back(*field.name);
        }
      }
      return composite;
    }

    /// Compact of an unsigned primitive or of a struct wrapping one
    Value decodeCompact(Stream &stream,
                        TypeId inner,
                        const TypeRegistry &registry,
                        size_t depth) {
      detail::checkDepth(depth);
      auto &type = detail::resolve(registry, inner);

      if (auto composite = std::get_if<TypeDefComposite>(&type.def)) {
        if (composite->fields.size() != 1) {
          common::raise(CodecError::UNSUPPORTED_COMPACT_TYPE);
        }
        auto &field = composite->fields.front();
        auto value = decodeCompact(stream, field.type, registry, depth + 1);
        if (field.name) {
          return Value::named({{*field.name, std::move(value)}});
        }
        return Value::unnamed({std::move(value)});
      }

      auto primitive = std::get_if<TypeDefPrimitive>(&type.def);
      if (not primitive) {
        common::raise(CodecError::UNSUPPORTED_COMPACT_TYPE);
      }
      size_t bits = 0;
      switch (*primitive) {
        case TypeDefPrimitive::U8:
        case TypeDefPrimitive::U16:
        case TypeDefPrimitive::U32:
        case TypeDefPrimitive::U64:
        case TypeDefPrimitive::U128:
        case TypeDefPrimitive::U256:
          bits = detail::primitiveWidth(*primitive) * 8;
          break;
        default:
          common::raise(CodecError::UNSUPPORTED_COMPACT_TYPE);
      }

      ::scale::CompactInteger value;
      stream >> value;
      if (value != 0 and msb(value) >= bits) {
        common::raise(CodecError::COMPACT_OUT_OF_RANGE);
      }
      if (*primitive == TypeDefPrimitive::U256) {
        return Value::u256(value.convert_to<U256>());
      }
      return Value::u128(value.convert_to<U128>());
    }

    BitSequence decodeBits(Stream &stream,
                           const TypeDefBitSequence &def,
                           const TypeRegistry &registry) {
      auto store_bits = detail::bitStoreBits(registry, def.bit_store_type);
      auto order = detail::bitOrder(registry, def.bit_order_type);

      ::scale::CompactInteger bit_count;
      stream >> bit_count;
      if (bit_count > std::numeric_limits<uint32_t>::max()) {
        common::raise(::scale::DecodeError::NOT_ENOUGH_DATA);
      }
      auto count = bit_count.convert_to<size_t>();
      auto words = (count + store_bits - 1) / store_bits;
      if (not stream.hasMore(words * (store_bits / 8))) {
        common::raise(::scale::DecodeError::NOT_ENOUGH_DATA);
      }

      BitSequence bits;
      bits.reserve(count);
      for (size_t w = 0; w < words; ++w) {
        auto word = readUnsigned(stream, store_bits / 8);
        for (size_t b = 0; b < store_bits and bits.size() < count; ++b) {
          auto pos = order == detail::BitOrder::Lsb0 ? b : store_bits - 1 - b;
          bits.push_back(bit_test(word, pos));
        }
      }
      return bits;
    }

    Value decode(Stream &stream,
                 TypeId id,
                 const TypeRegistry &registry,
                 size_t depth) {
      detail::checkDepth(depth);
      auto &type = detail::resolve(registry, id);
      ++depth;

      if (auto composite = std::get_if<TypeDefComposite>(&type.def)) {
        return {decodeFields(stream, composite->fields, registry, depth)};
      }
      if (auto variants = std::get_if<TypeDefVariant>(&type.def)) {
        auto index = stream.nextByte();
        auto variant = variants->variantByIndex(index);
        if (not variant) {
          common::raise(CodecError::VARIANT_NOT_FOUND);
        }
        return Value::variant(
            variant->name,
            decodeFields(stream, variant->fields, registry, depth));
      }
      if (auto sequence = std::get_if<TypeDefSequence>(&type.def)) {
        auto length = detail::isByte(registry, sequence->type)
                        ? detail::readByteLength(stream)
                        : detail::readLength(stream);
        std::vector<Value> values;
        values.reserve(std::min(
            length, stream.span().size_bytes() - stream.currentIndex()));
        for (size_t i = 0; i < length; ++i) {
          values.emplace_back(decode(stream, sequence->type, registry, depth));
        }
        return Value::unnamed(std::move(values));
      }
      if (auto array = std::get_if<TypeDefArray>(&type.def)) {
        std::vector<Value> values;
        values.reserve(array->len);
        for (uint32_t i = 0; i < array->len; ++i) {
          values.emplace_back(decode(stream, array->type, registry, depth));
        }
        return Value::unnamed(std::move(values));
      }
      if (auto tuple = std::get_if<TypeDefTuple>(&type.def)) {
        std::vector<Value> values;
        values.reserve(tuple->fields.size());
        for (auto element : tuple->fields) {
          values.emplace_back(decode(stream, element, registry, depth));
        }
        return Value::unnamed(std::move(values));
      }
      if (auto primitive = std::get_if<TypeDefPrimitive>(&type.def)) {
        return decodePrimitive(stream, *primitive);
      }
      if (auto compact = std::get_if<TypeDefCompact>(&type.def)) {
        return decodeCompact(stream, compact->type, registry, depth);
      }
      auto &bits = std::get<TypeDefBitSequence>(type.def);
      return Value::bits(decodeBits(stream, bits, registry));
    }

    template <typename T, typename F>
    outcome::result<T> consuming(common::BufferView &bytes, F &&f) {
      Stream stream{bytes};
      try {
        auto value = std::forward<F>(f)(stream);
        bytes.dropFirst(stream.currentIndex());
        return value;
      } catch (const std::system_error &e) {
        SL_TRACE(logger(),
                 "Failed to decode at offset {} of {}: {}",
                 stream.currentIndex(),
                 bytes,
                 e.code().message());
        return e.code();
      }
    }
  }  // namespace

  outcome::result<Value> decodeAsType(common::BufferView &bytes,
                                      metadata::TypeId id,
                                      const metadata::TypeRegistry &registry) {
    return consuming<Value>(
        bytes, [&](Stream &stream) { return decode(stream, id, registry, 0); });
  }

  outcome::result<Composite> decodeAsFields(
      common::BufferView &bytes,
      const std::vector<metadata::Field> &fields,
      const metadata::TypeRegistry &registry) {
    return consuming<Composite>(bytes, [&](Stream &stream) {
      return decodeFields(stream, fields, registry, 0);
    });
  }

}  // namespace rampart::codec
