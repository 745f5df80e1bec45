/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace rampart::common {

  /**
   * Non-owning view over a contiguous range of bytes
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <size_t count>
    void dropFirst() {
      *this = subspan<count>();
    }

    void dropFirst(size_t count) {
      *this = subspan(count);
    }

    void dropLast(size_t count) {
      *this = first(size() - count);
    }

    std::string toHex() const {
      return hex_lower(*this);
    }

    std::string_view toStringView() const {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(data()), size()};
    }

    bool operator==(const BufferView &other) const {
      return std::equal(begin(), end(), other.begin(), other.end());
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << view.toHex();
  }

}  // namespace rampart::common

namespace rampart {
  using common::BufferView;
}  // namespace rampart

template <>
struct fmt::formatter<rampart::common::BufferView> {
  // Presentation format: 's' - short, 'l' - long.
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const rampart::common::BufferView &view, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    if (view.empty()) {
      static constexpr string_view message("<empty>");
      return std::copy(std::begin(message), std::end(message), ctx.out());
    }

    if (presentation == 's' && view.size() > 5) {
      return fmt::format_to(ctx.out(),
                            "0x{}…{}",
                            rampart::common::hex_lower(view.first(2)),
                            rampart::common::hex_lower(view.last(2)));
    }

    return fmt::format_to(ctx.out(), "0x{}", view.toHex());
  }
};
