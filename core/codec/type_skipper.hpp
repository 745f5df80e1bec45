/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "common/buffer_view.hpp"
#include "metadata/type_registry.hpp"
#include "outcome/outcome.hpp"

namespace rampart::codec {

  /**
   * Moves {@param stream} past exactly one encoded value of type {@param id}
   * without materializing it.
   * @throws std::system_error with scale::DecodeError if input is short, or
   * with CodecError if the value does not match the type
   */
  void skipType(::scale::ScaleDecoderStream &stream,
                metadata::TypeId id,
                const metadata::TypeRegistry &registry);

  /**
   * Number of leading bytes of {@param bytes} occupied by one value of type
   * {@param id}
   */
  outcome::result<size_t> encodedSize(common::BufferView bytes,
                                      metadata::TypeId id,
                                      const metadata::TypeRegistry &registry);

}  // namespace rampart::codec
