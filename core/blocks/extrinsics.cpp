/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blocks/extrinsics.hpp"

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "blocks/block_error.hpp"

namespace rampart::blocks {

  std::optional<outcome::result<ExtrinsicDetails>> ExtrinsicsIterator::next() {
    auto &all = extrinsics_.extrinsics_;
    if (done_ or index_ >= all.size()) {
      return std::nullopt;
    }
    auto index = index_++;
    auto details = ExtrinsicDetails::decodeFrom(
        index, all[index], extrinsics_.metadata_, extrinsics_.ids_);
    if (details.has_error()) {
      done_ = true;
      SL_DEBUG(extrinsics_.logger_,
               "Extrinsic #{} of {} is not decoded, {} left unvisited: {}",
               index,
               all.size(),
               all.size() - index_,
               details.error().message());
    }
    return details;
  }

  Extrinsics::Extrinsics(std::vector<common::Buffer> extrinsics,
                         metadata::MetadataPtr metadata)
      : metadata_{std::move(metadata)},
        logger_{log::createLogger("Extrinsics", "blocks")} {
    BOOST_ASSERT(metadata_);
    ids_ = ExtrinsicPartTypeIds::fromMetadata(*metadata_);
    extrinsics_.reserve(extrinsics.size());
    for (auto &extrinsic : extrinsics) {
      extrinsics_.emplace_back(
          std::make_shared<const common::Buffer>(std::move(extrinsic)));
    }
  }

  outcome::result<Extrinsics> Extrinsics::fromOpaqueBody(
      common::BufferView body, metadata::MetadataPtr metadata) {
    ::scale::ScaleDecoderStream stream{body};
    std::vector<std::vector<uint8_t>> raw;
    try {
      stream >> raw;
    } catch (const std::system_error &e) {
      return e.code();
    }
    if (stream.hasMore(1)) {
      return BlockError::BODY_HAS_TRAILING_BYTES;
    }

    std::vector<common::Buffer> extrinsics;
    extrinsics.reserve(raw.size());
    for (auto &extrinsic : raw) {
      extrinsics.emplace_back(std::move(extrinsic));
    }
    return Extrinsics{std::move(extrinsics), std::move(metadata)};
  }

}  // namespace rampart::blocks
