/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace rampart::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    /**
     * @brief lvalue construct buffer from a byte vector
     */
    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    using Base::Base;
    using Base::operator=;

    Buffer &operator+=(const BufferView &view) {
      return put(view);
    }

    /**
     * @brief Put a 8-bit {@param n} in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint8(uint8_t n) {
      push_back(n);
      return *this;
    }

    /**
     * @brief Put a string into byte buffer
     * @param view arbitrary string
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(std::string_view view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    /**
     * @brief Put bytes into byte buffer
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      insert(end(), view.begin(), view.end());
      return *this;
    }

    BufferView view() const {
      return *this;
    }

    BufferView view(size_t offset, size_t length) const {
      return view().subspan(offset, length);
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(*this);
    }

    /**
     * @brief Construct Buffer from hex string
     * @param hex hex-encoded string
     * @return result containing constructed buffer if input string is
     * hex-encoded string.
     */
    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return Buffer{std::move(bytes)};
    }
  };

}  // namespace rampart::common

namespace rampart {
  using common::Buffer;
}  // namespace rampart

template <>
struct fmt::formatter<rampart::common::Buffer>
    : fmt::formatter<rampart::common::BufferView> {};
