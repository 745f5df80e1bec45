/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metadata/validation/metadata_hasher.hpp"

#include <boost/assert.hpp>

#include "metadata/validation/entity_hashers.hpp"

namespace rampart::metadata::validation {

  MetadataHasher::MetadataHasher(MetadataPtr metadata)
      : metadata_{std::move(metadata)},
        logger_{log::createLogger("MetadataHasher", "metadata")} {
    BOOST_ASSERT(metadata_);
  }

  MetadataHasher &MetadataHasher::onlyThesePallets(
      std::vector<std::string> pallets) {
    pallets_ = std::move(pallets);
    return *this;
  }

  MetadataHasher &MetadataHasher::onlyTheseRuntimeApis(
      std::vector<std::string> apis) {
    apis_ = std::move(apis);
    return *this;
  }

  Hash256 MetadataHasher::hash() const {
    auto &types = metadata_->types();

    Hash256 pallets;
    for (auto &pallet : metadata_->pallets()) {
      if (not passesFilter(pallets_, pallet.name)) {
        continue;
      }
      auto pallet_hash = palletHash(types, pallet);
      SL_TRACE(logger_, "Pallet {}: {}", pallet.name, pallet_hash);
      pallets = xorHashes(pallets, pallet_hash);
    }

    Hash256 apis;
    for (auto &api : metadata_->runtimeApis()) {
      if (not passesFilter(apis_, api.name)) {
        continue;
      }
      auto api_hash = runtimeApiTraitHash(types, api);
      SL_TRACE(logger_, "Runtime API {}: {}", api.name, api_hash);
      apis = xorHashes(apis, api_hash);
    }

    auto extrinsic = extrinsicHash(types, metadata_->extrinsic());
    auto runtime = TypeHasher{types}.typeHash(metadata_->runtimeTy());
    auto outer_enums =
        outerEnumsHash(types, metadata_->outerEnums(), pallets_);

    auto hash = concatAndHash(pallets, apis, extrinsic, runtime, outer_enums);
    SL_TRACE(logger_,
             "Metadata hash {} (pallets {}, runtime apis {}, extrinsic {}, "
             "runtime type {}, outer enums {})",
             hash,
             pallets,
             apis,
             extrinsic,
             runtime,
             outer_enums);
    return hash;
  }

}  // namespace rampart::metadata::validation
