/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

namespace rampart::codec {

  using U128 = boost::multiprecision::uint128_t;
  using I128 = boost::multiprecision::int128_t;
  using U256 = boost::multiprecision::uint256_t;
  using I256 = boost::multiprecision::int256_t;

  /// Unsigned and signed integers narrower than 256 bits widen to 128 bits
  using Primitive =
      std::variant<bool, char32_t, std::string, U128, I128, U256, I256>;

  using BitSequence = std::vector<bool>;

  struct Value;

  /**
   * Values of a struct, a tuple or of variant fields. Names are either given
   * for every value or for none of them.
   */
  struct Composite {
    std::vector<std::string> names;
    std::vector<Value> values;

    bool isNamed() const {
      return not names.empty();
    }

    size_t size() const {
      return values.size();
    }

    /// Value of the field with the given name, if the composite is named
    const Value *field(std::string_view name) const;

    bool operator==(const Composite &) const = default;
  };

  struct VariantValue {
    std::string name;
    Composite values;

    bool operator==(const VariantValue &) const = default;
  };

  /**
   * Generic value decoded with a type from the registry
   */
  struct Value {
    std::variant<Composite, VariantValue, BitSequence, Primitive> value;

    static Value boolean(bool v) {
      return {Primitive{v}};
    }

    static Value character(char32_t v) {
      return {Primitive{v}};
    }

    static Value string(std::string v) {
      return {Primitive{std::move(v)}};
    }

    static Value u128(U128 v) {
      return {Primitive{std::move(v)}};
    }

    static Value i128(I128 v) {
      return {Primitive{std::move(v)}};
    }

    static Value u256(U256 v) {
      return {Primitive{std::move(v)}};
    }

    static Value i256(I256 v) {
      return {Primitive{std::move(v)}};
    }

    static Value bits(BitSequence v) {
      return {std::move(v)};
    }

    static Value named(std::vector<std::pair<std::string, Value>> fields);

    static Value unnamed(std::vector<Value> values);

    static Value variant(std::string name, Composite values);

    template <typename T>
    const T *as() const {
      if constexpr (std::is_same_v<T, Composite>
                    or std::is_same_v<T, VariantValue>
                    or std::is_same_v<T, BitSequence>
                    or std::is_same_v<T, Primitive>) {
        return std::get_if<T>(&value);
      } else {
        auto primitive = std::get_if<Primitive>(&value);
        return primitive ? std::get_if<T>(primitive) : nullptr;
      }
    }

    bool operator==(const Value &) const = default;
  };

  /// Composite of named values, in the given order
  Composite namedComposite(std::vector<std::pair<std::string, Value>> fields);

  std::ostream &operator<<(std::ostream &os, const Value &value);

}  // namespace rampart::codec
