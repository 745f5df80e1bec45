/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include "blocks/extrinsic_part_type_ids.hpp"
#include "blocks/extrinsic_signed_extensions.hpp"
#include "blocks/static_extrinsic.hpp"
#include "codec/value.hpp"
#include "codec/value_decoder.hpp"
#include "common/buffer.hpp"
#include "metadata/metadata.hpp"
#include "outcome/outcome.hpp"

namespace rampart::blocks {

  /**
   * Pallet and call an extrinsic belongs to
   */
  struct ExtrinsicMetadataDetails {
    std::reference_wrapper<const metadata::PalletMetadata> pallet;
    std::reference_wrapper<const metadata::Variant> variant;
  };

  /**
   * Single extrinsic of a block, with its parts located but not decoded.
   *
   * Layout of the bytes:
   *   [control byte: bit 7 is the signed flag, bits 0-6 are the version]
   *   [if signed: address | signature | extra]
   *   [pallet index][call index][call fields]
   */
  class ExtrinsicDetails {
   public:
    /**
     * Locates parts of an extrinsic.
     * @param index position of the extrinsic in its block
     * @param bytes extrinsic without its length prefix
     * @return error with unsupportedVersionCategory() if the version is not
     * supported, decode error if the bytes are malformed
     */
    static outcome::result<ExtrinsicDetails> decodeFrom(
        uint32_t index,
        std::shared_ptr<const common::Buffer> bytes,
        metadata::MetadataPtr metadata,
        const ExtrinsicPartTypeIds &ids);

    static outcome::result<ExtrinsicDetails> decodeFrom(
        uint32_t index,
        common::BufferView bytes,
        metadata::MetadataPtr metadata,
        const ExtrinsicPartTypeIds &ids);

    bool isSigned() const {
      return signed_details_.has_value();
    }

    uint32_t index() const {
      return index_;
    }

    /// The whole extrinsic without the length prefix
    common::BufferView bytes() const {
      return *bytes_;
    }

    /// Pallet index, call index and call fields
    common::BufferView callBytes() const;

    /// Call fields only
    common::BufferView fieldBytes() const;

    std::optional<common::BufferView> addressBytes() const;
    std::optional<common::BufferView> signatureBytes() const;
    std::optional<common::BufferView> signedExtensionsBytes() const;

    /// Signed extensions, valid while this object is alive
    std::optional<ExtrinsicSignedExtensions> signedExtensions() const;

    uint8_t palletIndex() const {
      return pallet_index_;
    }

    uint8_t variantIndex() const {
      return variant_index_;
    }

    /**
     * Pallet and call of the extrinsic. Error means the extrinsic was made
     * for a runtime other than the one described by the metadata.
     */
    outcome::result<ExtrinsicMetadataDetails> extrinsicMetadata() const;

    outcome::result<std::string_view> palletName() const;
    outcome::result<std::string_view> variantName() const;

    /// Call fields decoded with the types declared by the call
    outcome::result<codec::Composite> fieldValues() const;

    /**
     * Decodes call fields into E.
     * @return empty optional if the extrinsic is not an E
     */
    template <StaticExtrinsic E>
    outcome::result<std::optional<E>> asExtrinsic() const {
      OUTCOME_TRY(details, extrinsicMetadata());
      auto &variant = details.variant.get();
      if (details.pallet.get().name != E::kPallet or variant.name != E::kCall) {
        return std::nullopt;
      }
      auto bytes = fieldBytes();
      OUTCOME_TRY(decoded,
                  E::decodeAsFields(bytes, variant.fields, metadata_->types()));
      return std::optional<E>{std::move(decoded)};
    }

    /**
     * Decodes the call as the outer call enum of the runtime
     */
    template <typename E>
      requires DecodeAsType<E> or std::same_as<E, codec::Value>
    outcome::result<E> asRootExtrinsic() const {
      auto bytes = callBytes();
      auto call_enum = metadata_->outerEnums().call_enum_ty;
      if constexpr (std::same_as<E, codec::Value>) {
        return codec::decodeAsType(bytes, call_enum, metadata_->types());
      } else {
        return E::decodeAsType(bytes, call_enum, metadata_->types());
      }
    }

    const metadata::MetadataPtr &metadata() const {
      return metadata_;
    }

   private:
    /// Absolute offsets of the signed parts
    struct SignedDetails {
      size_t address_start;
      size_t address_end;
      size_t signature_end;
      size_t extra_end;
    };

    ExtrinsicDetails() = default;

    uint32_t index_{};
    std::shared_ptr<const common::Buffer> bytes_;
    std::optional<SignedDetails> signed_details_;
    size_t call_start_{};
    uint8_t pallet_index_{};
    uint8_t variant_index_{};
    metadata::MetadataPtr metadata_;
  };

}  // namespace rampart::blocks
