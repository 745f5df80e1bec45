/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/optref.hpp"

namespace rampart::metadata {

  /**
   * Id of a type within one registry. Ids of different registries are
   * unrelated and must never be compared.
   */
  using TypeId = uint32_t;

  /**
   * Field of a composite or of an enum variant
   */
  struct Field {
    std::optional<std::string> name;
    TypeId type{};
    /// name of the type as written in the runtime source, informational
    std::optional<std::string> type_name;

    bool operator==(const Field &) const = default;
  };

  /**
   * Variant of an enum
   */
  struct Variant {
    std::string name;
    std::vector<Field> fields;
    /// discriminant as encoded on the wire
    uint8_t index{};

    bool operator==(const Variant &) const = default;
  };

  struct TypeDefComposite {
    std::vector<Field> fields;

    bool operator==(const TypeDefComposite &) const = default;
  };

  struct TypeDefVariant {
    std::vector<Variant> variants;

    OptRef<const Variant> variantByIndex(uint8_t index) const;
    OptRef<const Variant> variantByName(std::string_view name) const;

    bool operator==(const TypeDefVariant &) const = default;
  };

  struct TypeDefSequence {
    TypeId type{};

    bool operator==(const TypeDefSequence &) const = default;
  };

  struct TypeDefArray {
    uint32_t len{};
    TypeId type{};

    bool operator==(const TypeDefArray &) const = default;
  };

  struct TypeDefTuple {
    std::vector<TypeId> fields;

    bool operator==(const TypeDefTuple &) const = default;
  };

  /// Order of values is a part of the digest format, do not reorder
  enum class TypeDefPrimitive : uint8_t {
    Bool,
    Char,
    Str,
    U8,
    U16,
    U32,
    U64,
    U128,
    U256,
    I8,
    I16,
    I32,
    I64,
    I128,
    I256,
  };

  struct TypeDefCompact {
    TypeId type{};

    bool operator==(const TypeDefCompact &) const = default;
  };

  struct TypeDefBitSequence {
    TypeId bit_store_type{};
    TypeId bit_order_type{};

    bool operator==(const TypeDefBitSequence &) const = default;
  };

  using TypeDef = std::variant<TypeDefComposite,
                               TypeDefVariant,
                               TypeDefSequence,
                               TypeDefArray,
                               TypeDefTuple,
                               TypeDefPrimitive,
                               TypeDefCompact,
                               TypeDefBitSequence>;

  /**
   * Node of the type registry
   */
  struct Type {
    /// path of the type in the runtime source, e.g. {"bitvec", "order", "Lsb0"}
    std::vector<std::string> path;
    TypeDef def;
  };

  /**
   * Arena of types. The id of a type is its position in the arena.
   */
  class TypeRegistry {
   public:
    TypeRegistry() = default;
    explicit TypeRegistry(std::vector<Type> types);

    OptRef<const Type> resolve(TypeId id) const;

    size_t size() const {
      return types_.size();
    }

    const std::vector<Type> &types() const {
      return types_;
    }

   private:
    std::vector<Type> types_;
  };

}  // namespace rampart::metadata
