/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "blocks/extrinsic_details.hpp"
#include "blocks/extrinsic_part_type_ids.hpp"
#include "blocks/static_extrinsic.hpp"
#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "metadata/metadata.hpp"
#include "outcome/outcome.hpp"

namespace rampart::blocks {

  class Extrinsics;

  /**
   * Extrinsic decoded into a statically known call
   */
  template <typename E>
  struct FoundExtrinsic {
    ExtrinsicDetails details;
    E value;
  };

  /**
   * Decodes extrinsics of a block one by one, in block order.
   *
   * The first decoding error is returned once and ends the walk: offsets of
   * later extrinsics are not trusted after that.
   * Must not outlive the Extrinsics it was taken from.
   */
  class ExtrinsicsIterator {
   public:
    std::optional<outcome::result<ExtrinsicDetails>> next();

   private:
    friend class Extrinsics;

    explicit ExtrinsicsIterator(const Extrinsics &extrinsics)
        : extrinsics_{extrinsics} {}

    const Extrinsics &extrinsics_;
    uint32_t index_ = 0;
    bool done_ = false;
  };

  /**
   * Extrinsics of a block which are calls E. Others are skipped, errors of
   * the underlying walk and of decoding an E are returned.
   */
  template <StaticExtrinsic E>
  class FoundExtrinsicsIterator {
   public:
    explicit FoundExtrinsicsIterator(ExtrinsicsIterator inner)
        : inner_{std::move(inner)} {}

    std::optional<outcome::result<FoundExtrinsic<E>>> next() {
      while (auto item = inner_.next()) {
        if (item->has_error()) {
          return item->as_failure();
        }
        auto &details = item->value();
        auto found = details.template asExtrinsic<E>();
        if (found.has_error()) {
          return found.as_failure();
        }
        if (found.value()) {
          return FoundExtrinsic<E>{std::move(details),
                                   std::move(*found.value())};
        }
      }
      return std::nullopt;
    }

   private:
    ExtrinsicsIterator inner_;
  };

  /**
   * Extrinsics of one block together with the metadata of its runtime
   */
  class Extrinsics {
   public:
    /**
     * @param extrinsics extrinsics without their length prefixes
     */
    Extrinsics(std::vector<common::Buffer> extrinsics,
               metadata::MetadataPtr metadata);

    /**
     * Splits a SCALE encoded block body, a vector of length-prefixed
     * extrinsics
     */
    static outcome::result<Extrinsics> fromOpaqueBody(
        common::BufferView body, metadata::MetadataPtr metadata);

    size_t size() const {
      return extrinsics_.size();
    }

    bool empty() const {
      return extrinsics_.empty();
    }

    ExtrinsicsIterator iter() const {
      return ExtrinsicsIterator{*this};
    }

    template <StaticExtrinsic E>
    FoundExtrinsicsIterator<E> find() const {
      return FoundExtrinsicsIterator<E>{iter()};
    }

    template <StaticExtrinsic E>
    outcome::result<std::optional<FoundExtrinsic<E>>> findFirst() const {
      auto it = find<E>();
      auto first = it.next();
      if (not first) {
        return std::nullopt;
      }
      OUTCOME_TRY(found, std::move(*first));
      return std::optional<FoundExtrinsic<E>>{std::move(found)};
    }

    /// Walks the whole block, as there is no index of extrinsics
    template <StaticExtrinsic E>
    outcome::result<std::optional<FoundExtrinsic<E>>> findLast() const {
      std::optional<FoundExtrinsic<E>> last;
      auto it = find<E>();
      while (auto item = it.next()) {
        OUTCOME_TRY(found, std::move(*item));
        last.emplace(std::move(found));
      }
      return last;
    }

    template <StaticExtrinsic E>
    outcome::result<bool> has() const {
      OUTCOME_TRY(first, findFirst<E>());
      return first.has_value();
    }

    const metadata::MetadataPtr &metadata() const {
      return metadata_;
    }

   private:
    friend class ExtrinsicsIterator;

    std::vector<std::shared_ptr<const common::Buffer>> extrinsics_;
    metadata::MetadataPtr metadata_;
    ExtrinsicPartTypeIds ids_;
    log::Logger logger_;
  };

}  // namespace rampart::blocks
