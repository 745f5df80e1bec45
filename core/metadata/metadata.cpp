/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metadata/metadata.hpp"

#include <algorithm>

#include "metadata/metadata_error.hpp"

namespace rampart::metadata {

  namespace {
    template <typename Container, typename Pred>
    auto findIn(const Container &c, Pred &&pred)
        -> OptRef<const typename Container::value_type> {
      auto it = std::find_if(c.begin(), c.end(), std::forward<Pred>(pred));
      if (it == c.end()) {
        return std::nullopt;
      }
      return *it;
    }
  }  // namespace

  OptRef<const StorageEntryMetadata> PalletStorageMetadata::entryByName(
      std::string_view name) const {
    return findIn(entries, [&](const auto &e) { return e.name == name; });
  }

  OptRef<const PalletConstantMetadata> PalletMetadata::constantByName(
      std::string_view name) const {
    return findIn(constants, [&](const auto &c) { return c.name == name; });
  }

  OptRef<const RuntimeApiMethodMetadata> RuntimeApiMetadata::methodByName(
      std::string_view name) const {
    return findIn(methods, [&](const auto &m) { return m.name == name; });
  }

  Metadata::Metadata(TypeRegistry types,
                     std::vector<PalletMetadata> pallets,
                     ExtrinsicMetadata extrinsic,
                     TypeId runtime_ty,
                     std::vector<RuntimeApiMetadata> apis,
                     OuterEnums outer_enums)
      : types_{std::move(types)},
        pallets_{std::move(pallets)},
        extrinsic_{std::move(extrinsic)},
        runtime_ty_{runtime_ty},
        apis_{std::move(apis)},
        outer_enums_{outer_enums} {}

  OptRef<const PalletMetadata> Metadata::palletByIndex(uint8_t index) const {
    return findIn(pallets_, [&](const auto &p) { return p.index == index; });
  }

  OptRef<const PalletMetadata> Metadata::palletByName(
      std::string_view name) const {
    return findIn(pallets_, [&](const auto &p) { return p.name == name; });
  }

  OptRef<const RuntimeApiMetadata> Metadata::runtimeApiByName(
      std::string_view name) const {
    return findIn(apis_, [&](const auto &a) { return a.name == name; });
  }

  outcome::result<std::reference_wrapper<const TypeDefVariant>>
  Metadata::callEnum(const PalletMetadata &pallet) const {
    if (not pallet.call_ty) {
      return MetadataError::CALL_TYPE_NOT_FOUND;
    }
    auto type = types_.resolve(*pallet.call_ty);
    if (not type) {
      return MetadataError::TYPE_NOT_FOUND;
    }
    auto variant = std::get_if<TypeDefVariant>(&type->def);
    if (not variant) {
      return MetadataError::NOT_A_VARIANT_TYPE;
    }
    return std::cref(*variant);
  }

  OptRef<const Variant> Metadata::callVariantByIndex(
      const PalletMetadata &pallet, uint8_t index) const {
    auto calls = callEnum(pallet);
    if (not calls) {
      return std::nullopt;
    }
    return calls.value().get().variantByIndex(index);
  }

  OptRef<const Variant> Metadata::callVariantByName(
      const PalletMetadata &pallet, std::string_view name) const {
    auto calls = callEnum(pallet);
    if (not calls) {
      return std::nullopt;
    }
    return calls.value().get().variantByName(name);
  }

  outcome::result<std::reference_wrapper<const PalletMetadata>>
  Metadata::palletByIndexOrError(uint8_t index) const {
    auto pallet = palletByIndex(index);
    if (not pallet) {
      return MetadataError::PALLET_INDEX_NOT_FOUND;
    }
    return std::cref(*pallet);
  }

  outcome::result<std::reference_wrapper<const PalletMetadata>>
  Metadata::palletByNameOrError(std::string_view name) const {
    auto pallet = palletByName(name);
    if (not pallet) {
      return MetadataError::PALLET_NAME_NOT_FOUND;
    }
    return std::cref(*pallet);
  }

  outcome::result<std::reference_wrapper<const Variant>>
  Metadata::callVariantByIndexOrError(const PalletMetadata &pallet,
                                      uint8_t index) const {
    OUTCOME_TRY(calls, callEnum(pallet));
    auto variant = calls.get().variantByIndex(index);
    if (not variant) {
      return MetadataError::VARIANT_INDEX_NOT_FOUND;
    }
    return std::cref(*variant);
  }

  outcome::result<std::reference_wrapper<const Variant>>
  Metadata::callVariantByNameOrError(const PalletMetadata &pallet,
                                     std::string_view name) const {
    OUTCOME_TRY(calls, callEnum(pallet));
    auto variant = calls.get().variantByName(name);
    if (not variant) {
      return MetadataError::VARIANT_NAME_NOT_FOUND;
    }
    return std::cref(*variant);
  }

}  // namespace rampart::metadata
