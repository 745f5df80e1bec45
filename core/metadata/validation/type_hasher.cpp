/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metadata/validation/type_hasher.hpp"

#include <boost/endian/conversion.hpp>

#include "common/outcome_throw.hpp"
#include "metadata/metadata_error.hpp"

namespace rampart::metadata::validation {

  namespace {
    Hash256 arraySlot(uint32_t len) {
      Hash256 slot;
      slot[0] = static_cast<uint8_t>(TypeBeingHashed::Array);
      boost::endian::store_big_u32(slot.data() + 1, len);
      return slot;
    }

    template <class... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };
  }  // namespace

  TypeHasher::TypeHasher(const TypeRegistry &registry)
      : registry_{registry}, cache_(registry.size()) {}

  Hash256 TypeHasher::typeHash(TypeId id) {
    auto type = registry_.resolve(id);
    if (not type) {
      common::raise(MetadataError::TYPE_NOT_FOUND);
    }
    auto &entry = cache_[id];
    switch (entry.state) {
      case CacheEntry::State::Finished:
        return entry.hash;
      case CacheEntry::State::InProgress:
        return cycleSentinel();
      case CacheEntry::State::NotVisited:
        break;
    }
    entry.state = CacheEntry::State::InProgress;
    auto hash = typeDefHash(type->def);
    // cache_ is never resized, the reference stays valid
    entry.state = CacheEntry::State::Finished;
    entry.hash = hash;
    return hash;
  }

  Hash256 TypeHasher::fieldHash(const Field &field) {
    auto name_hash = field.name ? hashString(*field.name) : Hash256{};
    return concatAndHash(name_hash, typeHash(field.type));
  }

  Hash256 TypeHasher::variantHash(const Variant &variant) {
    Hash256 fields;
    for (auto &field : variant.fields) {
      fields = xorHashes(fields, fieldHash(field));
    }
    return concatAndHash(hashString(variant.name), fields);
  }

  Hash256 TypeHasher::variantTypeHash(const TypeDefVariant &def,
                                      const NameFilter &filter) {
    Hash256 variants;
    for (auto &variant : def.variants) {
      if (passesFilter(filter, variant.name)) {
        variants = xorHashes(variants, variantHash(variant));
      }
    }
    return concatAndHash(tagSlot(TypeBeingHashed::Variant), variants);
  }

  const TypeHasher::CacheEntry &TypeHasher::cacheEntry(TypeId id) const {
    static const CacheEntry kNotVisited{};
    if (id >= cache_.size()) {
      return kNotVisited;
    }
    return cache_[id];
  }

  Hash256 TypeHasher::typeDefHash(const TypeDef &def) {
    return std::visit(
        overloaded{
            [&](const TypeDefComposite &composite) {
              Hash256 fields;
              for (auto &field : composite.fields) {
                fields = xorHashes(fields, fieldHash(field));
              }
              return concatAndHash(tagSlot(TypeBeingHashed::Composite),
                                   fields);
            },
            [&](const TypeDefVariant &variant) {
              return variantTypeHash(variant);
            },
            [&](const TypeDefSequence &sequence) {
              return concatAndHash(tagSlot(TypeBeingHashed::Sequence),
                                   typeHash(sequence.type));
            },
            [&](const TypeDefArray &array) {
              return concatAndHash(arraySlot(array.len), typeHash(array.type));
            },
            [&](const TypeDefTuple &tuple) {
              std::array<uint8_t, 1> tag{
                  static_cast<uint8_t>(TypeBeingHashed::Tuple)};
              auto acc = hashBytes(tag);
              for (auto id : tuple.fields) {
                acc = concatAndHash(acc, typeHash(id));
              }
              return acc;
            },
            [&](const TypeDefPrimitive &primitive) {
              std::array<uint8_t, 2> bytes{
                  static_cast<uint8_t>(TypeBeingHashed::Primitive),
                  static_cast<uint8_t>(primitive)};
              return hashBytes(bytes);
            },
            [&](const TypeDefCompact &compact) {
              return concatAndHash(tagSlot(TypeBeingHashed::Compact),
                                   typeHash(compact.type));
            },
            [&](const TypeDefBitSequence &bits) {
              // order type first, the digest depends on the call sequence
              auto order = typeHash(bits.bit_order_type);
              auto store = typeHash(bits.bit_store_type);
              return concatAndHash(
                  tagSlot(TypeBeingHashed::BitSequence), order, store);
            },
        },
        def);
  }

}  // namespace rampart::metadata::validation
