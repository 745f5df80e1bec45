/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blocks/extrinsic_signed_extensions.hpp"

#include <limits>

#include <scale/scale.hpp>

#include "codec/type_skipper.hpp"
#include "codec/value_decoder.hpp"

namespace rampart::blocks {

  namespace {
    constexpr std::string_view kChargeTransactionPayment =
        "ChargeTransactionPayment";
    constexpr std::string_view kChargeAssetTxPayment = "ChargeAssetTxPayment";
    constexpr std::string_view kCheckNonce = "CheckNonce";

    /// Leading compact integer of {@param bytes} if it fits into T
    template <typename T>
    std::optional<T> leadingCompact(common::BufferView bytes) {
      ::scale::ScaleDecoderStream stream{bytes};
      ::scale::CompactInteger value;
      try {
        stream >> value;
      } catch (const std::system_error &) {
        return std::nullopt;
      }
      if (value > std::numeric_limits<T>::max()) {
        return std::nullopt;
      }
      return value.convert_to<T>();
    }
  }  // namespace

  ExtrinsicSignedExtension::ExtrinsicSignedExtension(
      const metadata::SignedExtensionMetadata &ext,
      std::shared_ptr<const common::Buffer> owner,
      common::BufferView bytes,
      metadata::MetadataPtr metadata)
      : identifier_{ext.identifier},
        extra_ty_{ext.extra_ty},
        owner_{std::move(owner)},
        bytes_{bytes},
        metadata_{std::move(metadata)} {}

  outcome::result<codec::Value> ExtrinsicSignedExtension::value() const {
    auto bytes = bytes_;
    return codec::decodeAsType(bytes, extra_ty_, metadata_->types());
  }

  ExtrinsicSignedExtensions::ExtrinsicSignedExtensions(
      std::shared_ptr<const common::Buffer> owner,
      common::BufferView bytes,
      metadata::MetadataPtr metadata)
      : owner_{std::move(owner)},
        bytes_{bytes},
        metadata_{std::move(metadata)} {}

  std::optional<outcome::result<ExtrinsicSignedExtension>>
  ExtrinsicSignedExtensions::Iterator::next() {
    auto &extensions = metadata_->extrinsic().signed_extensions;
    if (done_ or index_ >= extensions.size()) {
      return std::nullopt;
    }
    auto &ext = extensions[index_++];
    auto size = codec::encodedSize(bytes_, ext.extra_ty, metadata_->types());
    if (size.has_error()) {
      done_ = true;
      return size.as_failure();
    }
    auto ext_bytes = bytes_.first(size.value());
    bytes_.dropFirst(size.value());
    return ExtrinsicSignedExtension{ext, owner_, ext_bytes, metadata_};
  }

  ExtrinsicSignedExtensions::Iterator ExtrinsicSignedExtensions::iter() const {
    return Iterator{owner_, bytes_, metadata_};
  }

  outcome::result<std::optional<ExtrinsicSignedExtension>>
  ExtrinsicSignedExtensions::find(std::string_view identifier) const {
    auto it = iter();
    while (auto ext = it.next()) {
      OUTCOME_TRY(found, std::move(*ext));
      if (found.identifier() == identifier) {
        return found;
      }
    }
    return std::nullopt;
  }

  std::optional<codec::U128> ExtrinsicSignedExtensions::tip() const {
    auto it = iter();
    while (auto ext = it.next()) {
      if (ext->has_error()) {
        return std::nullopt;
      }
      auto &found = ext->value();
      if (found.identifier() == kChargeTransactionPayment
          or found.identifier() == kChargeAssetTxPayment) {
        return leadingCompact<codec::U128>(found.bytes());
      }
    }
    return std::nullopt;
  }

  std::optional<uint64_t> ExtrinsicSignedExtensions::nonce() const {
    auto ext = find(kCheckNonce);
    if (ext.has_error() or not ext.value()) {
      return std::nullopt;
    }
    return leadingCompact<uint64_t>(ext.value()->bytes());
  }

}  // namespace rampart::blocks
