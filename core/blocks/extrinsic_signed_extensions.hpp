/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include "codec/value.hpp"
#include "common/buffer.hpp"
#include "common/buffer_view.hpp"
#include "metadata/metadata.hpp"
#include "outcome/outcome.hpp"

namespace rampart::blocks {

  /**
   * Extra data of a single signed extension of an extrinsic
   */
  class ExtrinsicSignedExtension {
   public:
    ExtrinsicSignedExtension(const metadata::SignedExtensionMetadata &ext,
                             std::shared_ptr<const common::Buffer> owner,
                             common::BufferView bytes,
                             metadata::MetadataPtr metadata);

    std::string_view identifier() const {
      return identifier_;
    }

    metadata::TypeId extraTy() const {
      return extra_ty_;
    }

    common::BufferView bytes() const {
      return bytes_;
    }

    /// Extra data decoded with the extension's extra type
    outcome::result<codec::Value> value() const;

   private:
    std::string_view identifier_;
    metadata::TypeId extra_ty_;
    std::shared_ptr<const common::Buffer> owner_;
    common::BufferView bytes_;
    metadata::MetadataPtr metadata_;
  };

  /**
   * Signed extensions of an extrinsic, in the order declared by metadata.
   * Shares ownership of the extrinsic bytes, so the view and every extension
   * taken from it stay valid on their own.
   */
  class ExtrinsicSignedExtensions {
   public:
    /// {@param bytes} is the extra data, a part of {@param owner}
    ExtrinsicSignedExtensions(std::shared_ptr<const common::Buffer> owner,
                              common::BufferView bytes,
                              metadata::MetadataPtr metadata);

    /**
     * Lazy walk over the extensions. Stops after the first error.
     */
    class Iterator {
     public:
      std::optional<outcome::result<ExtrinsicSignedExtension>> next();

     private:
      friend class ExtrinsicSignedExtensions;

      Iterator(std::shared_ptr<const common::Buffer> owner,
               common::BufferView bytes,
               metadata::MetadataPtr metadata)
          : owner_{std::move(owner)},
            bytes_{bytes},
            metadata_{std::move(metadata)} {}

      std::shared_ptr<const common::Buffer> owner_;
      common::BufferView bytes_;
      metadata::MetadataPtr metadata_;
      size_t index_ = 0;
      bool done_ = false;
    };

    Iterator iter() const;

    /// First extension with the given identifier
    outcome::result<std::optional<ExtrinsicSignedExtension>> find(
        std::string_view identifier) const;

    /// Tip paid to the block author, if the extrinsic carries one
    std::optional<codec::U128> tip() const;

    /// Nonce of the signer, if the extrinsic carries one
    std::optional<uint64_t> nonce() const;

    common::BufferView bytes() const {
      return bytes_;
    }

   private:
    std::shared_ptr<const common::Buffer> owner_;
    common::BufferView bytes_;
    metadata::MetadataPtr metadata_;
  };

}  // namespace rampart::blocks
