/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "metadata/type_registry.hpp"
#include "metadata/validation/hash_utils.hpp"

namespace rampart::metadata::validation {

  /**
   * Computes digests of type subgraphs of one registry.
   *
   * A digest does not depend on type ids, on the order of fields within a
   * composite or variant, and on the order of variants within an enum. Types
   * referencing themselves through a cycle are hashed with a placeholder at
   * the point where the cycle closes.
   *
   * Results are memoized, so one instance may be reused to hash several
   * entities of the same registry. An instance is not thread-safe.
   */
  class TypeHasher {
   public:
    struct CacheEntry {
      enum class State : uint8_t { NotVisited, InProgress, Finished };

      State state = State::NotVisited;
      /// meaningful only when state is Finished
      Hash256 hash;
    };

    explicit TypeHasher(const TypeRegistry &registry);

    /**
     * Digest of the type with the given id.
     * @throws std::system_error with MetadataError::TYPE_NOT_FOUND if the id,
     * or any id reachable from it, is absent in the registry
     */
    Hash256 typeHash(TypeId id);

    /// combine(name hash or zeros, type hash)
    Hash256 fieldHash(const Field &field);

    /// combine(name hash, xor of field hashes), index is not included
    Hash256 variantHash(const Variant &variant);

    /**
     * Digest of an enum definition, counting only the variants whose names
     * pass {@param filter}
     */
    Hash256 variantTypeHash(const TypeDefVariant &def,
                            const NameFilter &filter = std::nullopt);

    const CacheEntry &cacheEntry(TypeId id) const;

    const TypeRegistry &registry() const {
      return registry_;
    }

   private:
    Hash256 typeDefHash(const TypeDef &def);

    const TypeRegistry &registry_;
    std::vector<CacheEntry> cache_;
  };

}  // namespace rampart::metadata::validation
