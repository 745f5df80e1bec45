/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metadata/type_registry.hpp"

#include <algorithm>

namespace rampart::metadata {

  OptRef<const Variant> TypeDefVariant::variantByIndex(uint8_t index) const {
    auto it = std::find_if(variants.begin(),
                           variants.end(),
                           [&](const Variant &v) { return v.index == index; });
    if (it == variants.end()) {
      return std::nullopt;
    }
    return *it;
  }

  OptRef<const Variant> TypeDefVariant::variantByName(
      std::string_view name) const {
    auto it = std::find_if(variants.begin(),
                           variants.end(),
                           [&](const Variant &v) { return v.name == name; });
    if (it == variants.end()) {
      return std::nullopt;
    }
    return *it;
  }

  TypeRegistry::TypeRegistry(std::vector<Type> types)
      : types_{std::move(types)} {}

  OptRef<const Type> TypeRegistry::resolve(TypeId id) const {
    if (id >= types_.size()) {
      return std::nullopt;
    }
    return types_[id];
  }

}  // namespace rampart::metadata
