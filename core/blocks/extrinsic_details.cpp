/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blocks/extrinsic_details.hpp"

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "blocks/block_error.hpp"
#include "codec/type_skipper.hpp"

namespace rampart::blocks {

  namespace {
    constexpr uint8_t kSignedMask = 0b1000'0000;
    constexpr uint8_t kVersionMask = 0b0111'1111;
  }  // namespace

  outcome::result<ExtrinsicDetails> ExtrinsicDetails::decodeFrom(
      uint32_t index,
      common::BufferView bytes,
      metadata::MetadataPtr metadata,
      const ExtrinsicPartTypeIds &ids) {
    return decodeFrom(index,
                      std::make_shared<const common::Buffer>(bytes),
                      std::move(metadata),
                      ids);
  }

  outcome::result<ExtrinsicDetails> ExtrinsicDetails::decodeFrom(
      uint32_t index,
      std::shared_ptr<const common::Buffer> bytes,
      metadata::MetadataPtr metadata,
      const ExtrinsicPartTypeIds &ids) {
    BOOST_ASSERT(bytes);
    BOOST_ASSERT(metadata);

    ExtrinsicDetails details;
    details.index_ = index;

    ::scale::ScaleDecoderStream stream{common::BufferView{*bytes}};
    try {
      auto control = stream.nextByte();
      auto version = static_cast<uint8_t>(control & kVersionMask);
      if (version != kSupportedExtrinsicVersion) {
        return makeUnsupportedVersionError(version);
      }

      if ((control & kSignedMask) != 0) {
        auto &types = metadata->types();
        SignedDetails signed_details{};
        signed_details.address_start = stream.currentIndex();
        codec::skipType(stream, ids.address, types);
        signed_details.address_end = stream.currentIndex();
        codec::skipType(stream, ids.signature, types);
        signed_details.signature_end = stream.currentIndex();
        codec::skipType(stream, ids.extra, types);
        signed_details.extra_end = stream.currentIndex();
        details.signed_details_ = signed_details;
      }

      details.call_start_ = stream.currentIndex();
      details.pallet_index_ = stream.nextByte();
      details.variant_index_ = stream.nextByte();
    } catch (const std::system_error &e) {
      return e.code();
    }

    details.bytes_ = std::move(bytes);
    details.metadata_ = std::move(metadata);
    return details;
  }

  common::BufferView ExtrinsicDetails::callBytes() const {
    return bytes().subspan(call_start_);
  }

  common::BufferView ExtrinsicDetails::fieldBytes() const {
    // pallet and call indices are known to be present
    return callBytes().subspan(2);
  }

  std::optional<common::BufferView> ExtrinsicDetails::addressBytes() const {
    if (not signed_details_) {
      return std::nullopt;
    }
    return bytes().subspan(
        signed_details_->address_start,
        signed_details_->address_end - signed_details_->address_start);
  }

  std::optional<common::BufferView> ExtrinsicDetails::signatureBytes() const {
    if (not signed_details_) {
      return std::nullopt;
    }
    return bytes().subspan(
        signed_details_->address_end,
        signed_details_->signature_end - signed_details_->address_end);
  }

  std::optional<common::BufferView> ExtrinsicDetails::signedExtensionsBytes()
      const {
    if (not signed_details_) {
      return std::nullopt;
    }
    return bytes().subspan(
        signed_details_->signature_end,
        signed_details_->extra_end - signed_details_->signature_end);
  }

  std::optional<ExtrinsicSignedExtensions> ExtrinsicDetails::signedExtensions()
      const {
    auto extra = signedExtensionsBytes();
    if (not extra) {
      return std::nullopt;
    }
    return ExtrinsicSignedExtensions{bytes_, *extra, metadata_};
  }

  outcome::result<ExtrinsicMetadataDetails>
  ExtrinsicDetails::extrinsicMetadata() const {
    OUTCOME_TRY(pallet, metadata_->palletByIndexOrError(pallet_index_));
    OUTCOME_TRY(variant,
                metadata_->callVariantByIndexOrError(pallet, variant_index_));
    return ExtrinsicMetadataDetails{pallet, variant};
  }

  outcome::result<std::string_view> ExtrinsicDetails::palletName() const {
    OUTCOME_TRY(details, extrinsicMetadata());
    return std::string_view{details.pallet.get().name};
  }

  outcome::result<std::string_view> ExtrinsicDetails::variantName() const {
    OUTCOME_TRY(details, extrinsicMetadata());
    return std::string_view{details.variant.get().name};
  }

  outcome::result<codec::Composite> ExtrinsicDetails::fieldValues() const {
    OUTCOME_TRY(details, extrinsicMetadata());
    auto bytes = fieldBytes();
    return codec::decodeAsFields(
        bytes, details.variant.get().fields, metadata_->types());
  }

}  // namespace rampart::blocks
