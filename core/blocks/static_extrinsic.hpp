/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <string_view>
#include <vector>

#include "common/buffer_view.hpp"
#include "metadata/type_registry.hpp"
#include "outcome/outcome.hpp"

namespace rampart::blocks {

  /**
   * Statically known call of a pallet. An extrinsic is decoded into it only
   * when the names of its pallet and call match kPallet and kCall.
   */
  template <typename E>
  concept StaticExtrinsic =
      requires(common::BufferView &bytes,
               const std::vector<metadata::Field> &fields,
               const metadata::TypeRegistry &registry) {
        { E::kPallet } -> std::convertible_to<std::string_view>;
        { E::kCall } -> std::convertible_to<std::string_view>;
        {
          E::decodeAsFields(bytes, fields, registry)
        } -> std::same_as<outcome::result<E>>;
      };

  /**
   * Type decodable from bytes of any registry type, e.g. an outer call enum
   */
  template <typename E>
  concept DecodeAsType = requires(common::BufferView &bytes,
                                  metadata::TypeId id,
                                  const metadata::TypeRegistry &registry) {
    {
      E::decodeAsType(bytes, id, registry)
    } -> std::same_as<outcome::result<E>>;
  };

}  // namespace rampart::blocks
