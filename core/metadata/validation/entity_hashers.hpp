/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include "metadata/metadata.hpp"
#include "metadata/validation/type_hasher.hpp"

/**
 * Digests of individual metadata entities. Each is computed with its own
 * TypeHasher unless one is passed in, so results never depend on what was
 * hashed before.
 */
namespace rampart::metadata::validation {

  Hash256 storageEntryHash(TypeHasher &hasher,
                           const StorageEntryMetadata &entry);

  Hash256 palletHash(const TypeRegistry &types, const PalletMetadata &pallet);

  std::optional<Hash256> storageHash(const TypeRegistry &types,
                                     const PalletMetadata &pallet,
                                     std::string_view entry_name);

  /// Only the type of a constant is hashed, its value is not
  std::optional<Hash256> constantHash(const TypeRegistry &types,
                                      const PalletMetadata &pallet,
                                      std::string_view constant_name);

  std::optional<Hash256> callHash(const Metadata &metadata,
                                  const PalletMetadata &pallet,
                                  std::string_view call_name);

  /**
   * Inputs are hashed in the declared order, as they are positional
   */
  Hash256 runtimeApiMethodHash(TypeHasher &hasher,
                               std::string_view trait_name,
                               const RuntimeApiMethodMetadata &method);

  std::optional<Hash256> runtimeApiHash(const TypeRegistry &types,
                                        const RuntimeApiMetadata &api,
                                        std::string_view method_name);

  Hash256 runtimeApiTraitHash(const TypeRegistry &types,
                              const RuntimeApiMetadata &api);

  /// Call type is not included, it is covered by the outer enums
  Hash256 extrinsicHash(const TypeRegistry &types,
                        const ExtrinsicMetadata &extrinsic);

  /**
   * Digest of the outer call, event and error enums, counting only the
   * variants named in {@param pallets} if given
   */
  Hash256 outerEnumsHash(const TypeRegistry &types,
                         const OuterEnums &enums,
                         const NameFilter &pallets = std::nullopt);

}  // namespace rampart::metadata::validation
