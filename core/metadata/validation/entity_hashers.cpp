/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metadata/validation/entity_hashers.hpp"

#include "common/outcome_throw.hpp"
#include "metadata/metadata_error.hpp"

namespace rampart::metadata::validation {

  namespace {
    Hash256 optionalTypeHash(TypeHasher &hasher, std::optional<TypeId> id) {
      return id ? hasher.typeHash(*id) : Hash256{};
    }

    Hash256 enumHash(const TypeRegistry &types,
                     TypeId id,
                     const NameFilter &filter) {
      auto type = types.resolve(id);
      if (not type) {
        common::raise(MetadataError::TYPE_NOT_FOUND);
      }
      TypeHasher hasher{types};
      if (auto variant = std::get_if<TypeDefVariant>(&type->def)) {
        return hasher.variantTypeHash(*variant, filter);
      }
      return hasher.typeHash(id);
    }
  }  // namespace

  Hash256 storageEntryHash(TypeHasher &hasher,
                           const StorageEntryMetadata &entry) {
    auto acc = concatAndHash(
        hashString(entry.name),
        Hash256::filled(static_cast<uint8_t>(entry.modifier)),
        hashBytes(entry.default_value));

    if (auto plain = std::get_if<StorageEntryTypePlain>(&entry.type)) {
      return concatAndHash(acc, hasher.typeHash(plain->value_ty));
    }
    auto &map = std::get<StorageEntryTypeMap>(entry.type);
    for (auto hasher_kind : map.hashers) {
      acc = concatAndHash(acc,
                          Hash256::filled(static_cast<uint8_t>(hasher_kind)));
    }
    auto key = hasher.typeHash(map.key_ty);
    auto value = hasher.typeHash(map.value_ty);
    return concatAndHash(acc, key, value);
  }

  Hash256 palletHash(const TypeRegistry &types, const PalletMetadata &pallet) {
    TypeHasher hasher{types};

    auto call = optionalTypeHash(hasher, pallet.call_ty);
    auto event = optionalTypeHash(hasher, pallet.event_ty);
    auto error = optionalTypeHash(hasher, pallet.error_ty);

    Hash256 constants;
    for (auto &constant : pallet.constants) {
      constants = xorHashes(constants,
                            concatAndHash(hashString(constant.name),
                                          hasher.typeHash(constant.type)));
    }

    Hash256 storage;
    if (pallet.storage) {
      Hash256 entries;
      for (auto &entry : pallet.storage->entries) {
        entries = xorHashes(entries, storageEntryHash(hasher, entry));
      }
      storage = concatAndHash(hashString(pallet.storage->prefix), entries);
    }

    return concatAndHash(call, event, error, constants, storage);
  }

  std::optional<Hash256> storageHash(const TypeRegistry &types,
                                     const PalletMetadata &pallet,
                                     std::string_view entry_name) {
    if (not pallet.storage) {
      return std::nullopt;
    }
    auto entry = pallet.storage->entryByName(entry_name);
    if (not entry) {
      return std::nullopt;
    }
    TypeHasher hasher{types};
    return storageEntryHash(hasher, *entry);
  }

  std::optional<Hash256> constantHash(const TypeRegistry &types,
                                      const PalletMetadata &pallet,
                                      std::string_view constant_name) {
    auto constant = pallet.constantByName(constant_name);
    if (not constant) {
      return std::nullopt;
    }
    return TypeHasher{types}.typeHash(constant->type);
  }

  std::optional<Hash256> callHash(const Metadata &metadata,
                                  const PalletMetadata &pallet,
                                  std::string_view call_name) {
    auto variant = metadata.callVariantByName(pallet, call_name);
    if (not variant) {
      return std::nullopt;
    }
    return TypeHasher{metadata.types()}.variantHash(*variant);
  }

  Hash256 runtimeApiMethodHash(TypeHasher &hasher,
                               std::string_view trait_name,
                               const RuntimeApiMethodMetadata &method) {
    auto acc = concatAndHash(hashString(trait_name), hashString(method.name));
    for (auto &input : method.inputs) {
      acc = concatAndHash(
          acc, hashString(input.name), hasher.typeHash(input.type));
    }
    return concatAndHash(acc, hasher.typeHash(method.output_ty));
  }

  std::optional<Hash256> runtimeApiHash(const TypeRegistry &types,
                                        const RuntimeApiMetadata &api,
                                        std::string_view method_name) {
    auto method = api.methodByName(method_name);
    if (not method) {
      return std::nullopt;
    }
    TypeHasher hasher{types};
    return runtimeApiMethodHash(hasher, api.name, *method);
  }

  Hash256 runtimeApiTraitHash(const TypeRegistry &types,
                              const RuntimeApiMetadata &api) {
    TypeHasher hasher{types};
    Hash256 methods;
    for (auto &method : api.methods) {
      methods =
          xorHashes(methods, runtimeApiMethodHash(hasher, api.name, method));
    }
    return concatAndHash(hashString(api.name), methods);
  }

  Hash256 extrinsicHash(const TypeRegistry &types,
                        const ExtrinsicMetadata &extrinsic) {
    TypeHasher hasher{types};

    auto address = hasher.typeHash(extrinsic.address_ty);
    auto signature = hasher.typeHash(extrinsic.signature_ty);
    auto extra = hasher.typeHash(extrinsic.extra_ty);

    auto acc = concatAndHash(
        address, signature, extra, Hash256::filled(extrinsic.version));

    for (auto &ext : extrinsic.signed_extensions) {
      auto ext_extra = hasher.typeHash(ext.extra_ty);
      auto ext_additional = hasher.typeHash(ext.additional_ty);
      acc = concatAndHash(
          acc, hashString(ext.identifier), ext_extra, ext_additional);
    }
    return acc;
  }

  Hash256 outerEnumsHash(const TypeRegistry &types,
                         const OuterEnums &enums,
                         const NameFilter &pallets) {
    return concatAndHash(enumHash(types, enums.call_enum_ty, pallets),
                         enumHash(types, enums.event_enum_ty, pallets),
                         enumHash(types, enums.error_enum_ty, pallets));
  }

}  // namespace rampart::metadata::validation
