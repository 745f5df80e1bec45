/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "log/logger.hpp"
#include "metadata/metadata.hpp"
#include "metadata/validation/hash_utils.hpp"

namespace rampart::metadata::validation {

  /**
   * Digest of a whole metadata snapshot or of its part, used to check that
   * code generated against one runtime is compatible with another.
   *
   * The digest does not depend on the order of pallets and runtime API
   * traits. Names in the allow-lists that are absent in the snapshot are
   * ignored.
   */
  class MetadataHasher {
   public:
    explicit MetadataHasher(MetadataPtr metadata);

    /// Hash only the given pallets, and only their variants of outer enums
    MetadataHasher &onlyThesePallets(std::vector<std::string> pallets);

    MetadataHasher &onlyTheseRuntimeApis(std::vector<std::string> apis);

    Hash256 hash() const;

   private:
    MetadataPtr metadata_;
    NameFilter pallets_;
    NameFilter apis_;
    log::Logger logger_;
  };

}  // namespace rampart::metadata::validation
