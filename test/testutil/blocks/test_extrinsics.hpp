/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "codec/codec_error.hpp"
#include "codec/value_decoder.hpp"
#include "common/buffer.hpp"
#include "testutil/metadata/test_metadata.hpp"

/**
 * Extrinsics of the runtime built by testutil::makeTestRuntime()
 */
namespace testutil {

  /// Call Test::TestCall { value, signed, name }
  struct TestCall {
    static constexpr std::string_view kPallet = "Test";
    static constexpr std::string_view kCall = "TestCall";

    rampart::codec::U128 value;
    bool is_signed{};
    std::string name;

    static rampart::outcome::result<TestCall> decodeAsFields(
        rampart::common::BufferView &bytes,
        const std::vector<rampart::metadata::Field> &fields,
        const rampart::metadata::TypeRegistry &registry) {
      OUTCOME_TRY(composite,
                  rampart::codec::decodeAsFields(bytes, fields, registry));
      auto value = composite.field("value");
      auto is_signed = composite.field("signed");
      auto name = composite.field("name");
      if (not value or not is_signed or not name
          or not value->as<rampart::codec::U128>()
          or not is_signed->as<bool>() or not name->as<std::string>()) {
        return rampart::codec::CodecError::TYPE_NOT_FOUND;
      }
      return TestCall{*value->as<rampart::codec::U128>(),
                      *is_signed->as<bool>(),
                      *name->as<std::string>()};
    }
  };

  /// Call Test::remark { remark: Vec<u8> }
  struct Remark {
    static constexpr std::string_view kPallet = "Test";
    static constexpr std::string_view kCall = "remark";

    std::vector<uint8_t> remark;

    static rampart::outcome::result<Remark> decodeAsFields(
        rampart::common::BufferView &bytes,
        const std::vector<rampart::metadata::Field> &fields,
        const rampart::metadata::TypeRegistry &registry) {
      OUTCOME_TRY(composite,
                  rampart::codec::decodeAsFields(bytes, fields, registry));
      auto remark = composite.field("remark");
      if (not remark or not remark->as<rampart::codec::Composite>()) {
        return rampart::codec::CodecError::TYPE_NOT_FOUND;
      }
      Remark result;
      for (auto &byte : remark->as<rampart::codec::Composite>()->values) {
        auto value = byte.as<rampart::codec::U128>();
        if (not value) {
          return rampart::codec::CodecError::TYPE_NOT_FOUND;
        }
        result.remark.push_back(value->convert_to<uint8_t>());
      }
      return result;
    }
  };

  /// Encodes an unsigned Test::TestCall, value is at most 255
  inline rampart::common::Buffer unsignedTestCall(uint8_t value,
                                                  bool is_signed,
                                                  std::string_view name) {
    rampart::common::Buffer out;
    out.putUint8(0x04)
        .putUint8(test_runtime::kTestPalletIndex)
        .putUint8(test_runtime::kTestCallIndex)
        .putUint8(value);
    out.insert(out.end(), 15, 0);
    out.putUint8(is_signed ? 1 : 0)
        .putUint8(static_cast<uint8_t>(name.size() << 2))
        .put(name);
    return out;
  }

  /// Encodes Test::remark call with remark shorter than 64 bytes
  inline rampart::common::Buffer remarkCall(
      const std::vector<uint8_t> &remark) {
    rampart::common::Buffer out;
    out.putUint8(test_runtime::kTestPalletIndex)
        .putUint8(test_runtime::kRemarkCallIndex)
        .putUint8(static_cast<uint8_t>(remark.size() << 2));
    out.insert(out.end(), remark.begin(), remark.end());
    return out;
  }

  inline rampart::common::Buffer unsignedRemark(
      const std::vector<uint8_t> &remark) {
    rampart::common::Buffer out;
    out.putUint8(0x04).put(remarkCall(remark));
    return out;
  }

  /**
   * Encodes a signed Test::remark with an Sr25519 signature.
   * @param extra encoded CheckNonce and ChargeTransactionPayment
   */
  inline rampart::common::Buffer signedRemark(
      const std::vector<uint8_t> &extra, const std::vector<uint8_t> &remark) {
    rampart::common::Buffer out;
    out.putUint8(0x84);
    out.insert(out.end(), 32, 0x11);
    out.putUint8(1);
    out.insert(out.end(), 64, 0x22);
    out.insert(out.end(), extra.begin(), extra.end());
    out.put(remarkCall(remark));
    return out;
  }

}  // namespace testutil
