/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/buffer.hpp"
#include "common/optref.hpp"
#include "metadata/type_registry.hpp"
#include "outcome/outcome.hpp"

namespace rampart::metadata {

  enum class StorageEntryModifier : uint8_t {
    Optional,
    Default,
  };

  /// Order of values is a part of the digest format, do not reorder
  enum class StorageHasher : uint8_t {
    Blake2_128,
    Blake2_256,
    Blake2_128Concat,
    Twox128,
    Twox256,
    Twox64Concat,
    Identity,
  };

  struct StorageEntryTypePlain {
    TypeId value_ty{};
  };

  struct StorageEntryTypeMap {
    std::vector<StorageHasher> hashers;
    TypeId key_ty{};
    TypeId value_ty{};
  };

  using StorageEntryType =
      std::variant<StorageEntryTypePlain, StorageEntryTypeMap>;

  struct StorageEntryMetadata {
    std::string name;
    StorageEntryModifier modifier{StorageEntryModifier::Optional};
    StorageEntryType type;
    common::Buffer default_value;
  };

  struct PalletStorageMetadata {
    std::string prefix;
    std::vector<StorageEntryMetadata> entries;

    OptRef<const StorageEntryMetadata> entryByName(
        std::string_view name) const;
  };

  struct PalletConstantMetadata {
    std::string name;
    TypeId type{};
    common::Buffer value;
  };

  struct PalletMetadata {
    std::string name;
    uint8_t index{};
    std::optional<TypeId> call_ty;
    std::optional<TypeId> event_ty;
    std::optional<TypeId> error_ty;
    std::optional<PalletStorageMetadata> storage;
    std::vector<PalletConstantMetadata> constants;

    OptRef<const PalletConstantMetadata> constantByName(
        std::string_view name) const;
  };

  struct SignedExtensionMetadata {
    std::string identifier;
    TypeId extra_ty{};
    TypeId additional_ty{};
  };

  /**
   * Format of extrinsics accepted by the runtime
   */
  struct ExtrinsicMetadata {
    uint8_t version{};
    TypeId address_ty{};
    TypeId call_ty{};
    TypeId signature_ty{};
    TypeId extra_ty{};
    /// in the order they are encoded within the extra bytes
    std::vector<SignedExtensionMetadata> signed_extensions;
  };

  struct RuntimeApiMethodParamMetadata {
    std::string name;
    TypeId type{};
  };

  struct RuntimeApiMethodMetadata {
    std::string name;
    std::vector<RuntimeApiMethodParamMetadata> inputs;
    TypeId output_ty{};
  };

  /**
   * One runtime API trait, e.g. "Core" or "Metadata"
   */
  struct RuntimeApiMetadata {
    std::string name;
    std::vector<RuntimeApiMethodMetadata> methods;

    OptRef<const RuntimeApiMethodMetadata> methodByName(
        std::string_view name) const;
  };

  /**
   * Chain-wide enums aggregating calls, events and errors of every pallet
   */
  struct OuterEnums {
    TypeId call_enum_ty{};
    TypeId event_enum_ty{};
    TypeId error_enum_ty{};
  };

  /**
   * Immutable description of a runtime. Type ids stored within are only
   * meaningful together with its own registry.
   */
  class Metadata {
   public:
    Metadata(TypeRegistry types,
             std::vector<PalletMetadata> pallets,
             ExtrinsicMetadata extrinsic,
             TypeId runtime_ty,
             std::vector<RuntimeApiMetadata> apis,
             OuterEnums outer_enums);

    const TypeRegistry &types() const {
      return types_;
    }

    const std::vector<PalletMetadata> &pallets() const {
      return pallets_;
    }

    const ExtrinsicMetadata &extrinsic() const {
      return extrinsic_;
    }

    TypeId runtimeTy() const {
      return runtime_ty_;
    }

    const std::vector<RuntimeApiMetadata> &runtimeApis() const {
      return apis_;
    }

    const OuterEnums &outerEnums() const {
      return outer_enums_;
    }

    OptRef<const PalletMetadata> palletByIndex(uint8_t index) const;
    OptRef<const PalletMetadata> palletByName(std::string_view name) const;
    OptRef<const RuntimeApiMetadata> runtimeApiByName(
        std::string_view name) const;

    /**
     * Variant of the pallet's call enum with the given wire index.
     * Empty if the pallet has no calls or no such variant.
     */
    OptRef<const Variant> callVariantByIndex(const PalletMetadata &pallet,
                                             uint8_t index) const;
    OptRef<const Variant> callVariantByName(const PalletMetadata &pallet,
                                            std::string_view name) const;

    outcome::result<std::reference_wrapper<const PalletMetadata>>
    palletByIndexOrError(uint8_t index) const;

    outcome::result<std::reference_wrapper<const PalletMetadata>>
    palletByNameOrError(std::string_view name) const;

    /**
     * Same as callVariantByIndex, but tells why nothing is found: the pallet
     * has no calls, its call type is absent or not an enum, or the enum has
     * no such variant
     */
    outcome::result<std::reference_wrapper<const Variant>>
    callVariantByIndexOrError(const PalletMetadata &pallet,
                              uint8_t index) const;

    outcome::result<std::reference_wrapper<const Variant>>
    callVariantByNameOrError(const PalletMetadata &pallet,
                             std::string_view name) const;

   private:
    outcome::result<std::reference_wrapper<const TypeDefVariant>> callEnum(
        const PalletMetadata &pallet) const;

    TypeRegistry types_;
    std::vector<PalletMetadata> pallets_;
    ExtrinsicMetadata extrinsic_;
    TypeId runtime_ty_;
    std::vector<RuntimeApiMetadata> apis_;
    OuterEnums outer_enums_;
  };

  using MetadataPtr = std::shared_ptr<const Metadata>;

}  // namespace rampart::metadata
