/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/blob.hpp"
#include "crypto/twox/twox.hpp"

namespace rampart::metadata::validation {

  /**
   * Tag of the shape being hashed. Values are a part of the digest format.
   */
  enum class TypeBeingHashed : uint8_t {
    Composite,
    Variant,
    Sequence,
    Array,
    Tuple,
    Primitive,
    Compact,
    BitSequence,
  };

  /// Placeholder returned for a type whose hash is still being computed
  inline constexpr uint8_t kCycleSentinelByte = 123;

  inline Hash256 hashBytes(common::BufferView bytes) {
    return crypto::make_twox256(bytes);
  }

  inline Hash256 hashString(std::string_view str) {
    return hashBytes(common::BufferView{
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        reinterpret_cast<const uint8_t *>(str.data()),
        str.size()});
  }

  /// Hash of the concatenation of the given digests, order-sensitive
  template <typename... Hashes>
    requires(std::same_as<Hashes, Hash256> && ...)
  Hash256 concatAndHash(const Hashes &...hashes) {
    std::array<uint8_t, Hash256::size() * sizeof...(Hashes)> out{};
    auto it = out.begin();
    ((it = std::copy(hashes.begin(), hashes.end(), it)), ...);
    return hashBytes(out);
  }

  /// Order-insensitive combination of two digests
  inline Hash256 xorHashes(const Hash256 &a, const Hash256 &b) {
    Hash256 out;
    for (size_t i = 0; i < Hash256::size(); ++i) {
      out[i] = a[i] ^ b[i];
    }
    return out;
  }

  /// Tag byte repeated over the whole digest width
  inline Hash256 tagSlot(TypeBeingHashed tag) {
    return Hash256::filled(static_cast<uint8_t>(tag));
  }

  inline Hash256 cycleSentinel() {
    return Hash256::filled(kCycleSentinelByte);
  }

  /// Allow-list of names, empty optional lets everything through
  using NameFilter = std::optional<std::vector<std::string>>;

  inline bool passesFilter(const NameFilter &filter, std::string_view name) {
    return not filter
        or std::find(filter->begin(), filter->end(), name) != filter->end();
  }

}  // namespace rampart::metadata::validation
