/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "codec/value.hpp"
#include "common/buffer_view.hpp"
#include "metadata/type_registry.hpp"
#include "outcome/outcome.hpp"

namespace rampart::codec {

  /**
   * Decodes one value of type {@param id} from the front of {@param bytes}.
   * On success {@param bytes} is advanced past the decoded value, on failure
   * it is left untouched.
   */
  outcome::result<Value> decodeAsType(common::BufferView &bytes,
                                      metadata::TypeId id,
                                      const metadata::TypeRegistry &registry);

  /**
   * Decodes the given fields one after another. The composite is named only
   * if every field has a name.
   */
  outcome::result<Composite> decodeAsFields(
      common::BufferView &bytes,
      const std::vector<metadata::Field> &fields,
      const metadata::TypeRegistry &registry);

}  // namespace rampart::codec
