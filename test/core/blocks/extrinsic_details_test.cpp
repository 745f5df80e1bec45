/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blocks/extrinsic_details.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <scale/scale.hpp>

#include "blocks/block_error.hpp"
#include "metadata/metadata_error.hpp"
#include "testutil/blocks/test_extrinsics.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using rampart::BufferView;
using rampart::blocks::ExtrinsicDetails;
using rampart::blocks::ExtrinsicPartTypeIds;
using rampart::blocks::unsupportedVersion;
using rampart::codec::Composite;
using rampart::codec::Value;
using rampart::common::Buffer;
using rampart::metadata::MetadataError;
using rampart::metadata::MetadataPtr;
using testutil::Remark;
using testutil::TestCall;
using namespace testutil::test_runtime;

/**
 * Outer call enum of the test runtime, decoded into the pallet and call names
 */
struct RootCall {
  std::string pallet;
  std::string call;

  static rampart::outcome::result<RootCall> decodeAsType(
      BufferView &bytes,
      rampart::metadata::TypeId id,
      const rampart::metadata::TypeRegistry &registry) {
    OUTCOME_TRY(value, rampart::codec::decodeAsType(bytes, id, registry));
    auto pallet = value.as<rampart::codec::VariantValue>();
    if (not pallet or pallet->values.size() != 1) {
      return rampart::codec::CodecError::VARIANT_NOT_FOUND;
    }
    auto call = pallet->values.values[0].as<rampart::codec::VariantValue>();
    if (not call) {
      return rampart::codec::CodecError::VARIANT_NOT_FOUND;
    }
    return RootCall{pallet->name, call->name};
  }
};

class ExtrinsicDetailsTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  rampart::outcome::result<ExtrinsicDetails> decode(const Buffer &bytes) {
    return ExtrinsicDetails::decodeFrom(0, BufferView{bytes}, metadata_, ids_);
  }

 protected:
  MetadataPtr metadata_ = testutil::makeTestRuntime();
  ExtrinsicPartTypeIds ids_ = ExtrinsicPartTypeIds::fromMetadata(*metadata_);
};

/**
 * @given the test runtime
 * @when type ids of extrinsic parts are taken from it
 * @then they are the ids declared by its extrinsic metadata
 */
TEST_F(ExtrinsicDetailsTest, PartTypeIds) {
  EXPECT_EQ(ids_,
            (ExtrinsicPartTypeIds{.address = kAccountId,
                                  .call = kRuntimeCall,
                                  .signature = kSignature,
                                  .extra = kExtra}));
}

/**
 * @given an unsigned Test::TestCall
 * @when it is decoded
 * @then its parts are located and its fields are decoded
 */
TEST_F(ExtrinsicDetailsTest, UnsignedCall) {
  auto bytes = testutil::unsignedTestCall(100, true, "hi");
  EXPECT_OUTCOME_TRUE(details, decode(bytes));

  EXPECT_FALSE(details.isSigned());
  EXPECT_EQ(details.index(), 0);
  EXPECT_EQ(details.bytes(), BufferView{bytes});
  EXPECT_EQ(details.callBytes(), BufferView{bytes}.subspan(1));
  EXPECT_EQ(details.fieldBytes(), BufferView{bytes}.subspan(3));
  EXPECT_EQ(details.palletIndex(), kTestPalletIndex);
  EXPECT_EQ(details.variantIndex(), kTestCallIndex);
  EXPECT_FALSE(details.addressBytes());
  EXPECT_FALSE(details.signatureBytes());
  EXPECT_FALSE(details.signedExtensionsBytes());
  EXPECT_FALSE(details.signedExtensions());

  EXPECT_OUTCOME_TRUE(pallet_name, details.palletName());
  EXPECT_EQ(pallet_name, "Test");
  EXPECT_OUTCOME_TRUE(variant_name, details.variantName());
  EXPECT_EQ(variant_name, "TestCall");

  EXPECT_OUTCOME_TRUE(fields, details.fieldValues());
  EXPECT_EQ(fields,
            rampart::codec::namedComposite({{"value", Value::u128(100)},
                                            {"signed", Value::boolean(true)},
                                            {"name", Value::string("hi")}}));
}

/**
 * @given an unsigned Test::TestCall
 * @when it is decoded as TestCall and as remark
 * @then the first gives the call, the second gives nothing
 */
TEST_F(ExtrinsicDetailsTest, AsExtrinsic) {
  EXPECT_OUTCOME_TRUE(details,
                      decode(testutil::unsignedTestCall(7, false, "abc")));

  EXPECT_OUTCOME_TRUE(call, details.asExtrinsic<TestCall>());
  ASSERT_TRUE(call.has_value());
  EXPECT_EQ(call->value, 7);
  EXPECT_FALSE(call->is_signed);
  EXPECT_EQ(call->name, "abc");

  EXPECT_OUTCOME_TRUE(remark, details.asExtrinsic<Remark>());
  EXPECT_FALSE(remark.has_value());
}

/**
 * @given an unsigned Test::TestCall
 * @when it is decoded as the outer call enum
 * @then the pallet variant wraps the call variant
 */
TEST_F(ExtrinsicDetailsTest, AsRootExtrinsic) {
  EXPECT_OUTCOME_TRUE(details,
                      decode(testutil::unsignedTestCall(1, true, "")));

  EXPECT_OUTCOME_TRUE(value, details.asRootExtrinsic<Value>());
  auto call = Value::variant(
      "TestCall",
      rampart::codec::namedComposite({{"value", Value::u128(1)},
                                      {"signed", Value::boolean(true)},
                                      {"name", Value::string("")}}));
  EXPECT_EQ(value, Value::variant("Test", Composite{{}, {call}}));

  EXPECT_OUTCOME_TRUE(root, details.asRootExtrinsic<RootCall>());
  EXPECT_EQ(root.pallet, "Test");
  EXPECT_EQ(root.call, "TestCall");
}

/**
 * @given a signed Test::remark with nonce 5 and tip 1000
 * @when it is decoded
 * @then address, signature and signed extensions are located
 */
TEST_F(ExtrinsicDetailsTest, SignedCall) {
  auto bytes = testutil::signedRemark("14a10f"_unhex, "010203"_unhex);
  EXPECT_OUTCOME_TRUE(details, decode(bytes));

  EXPECT_TRUE(details.isSigned());
  ASSERT_TRUE(details.addressBytes());
  EXPECT_EQ(*details.addressBytes(), BufferView{bytes}.subspan(1, 32));
  ASSERT_TRUE(details.signatureBytes());
  EXPECT_EQ(*details.signatureBytes(), BufferView{bytes}.subspan(33, 65));
  ASSERT_TRUE(details.signedExtensionsBytes());
  EXPECT_EQ(details.signedExtensionsBytes()->toHex(), "14a10f");
  EXPECT_EQ(details.callBytes().toHex(), "00000c010203");
  EXPECT_EQ(details.fieldBytes().toHex(), "0c010203");

  EXPECT_OUTCOME_TRUE(remark, details.asExtrinsic<Remark>());
  ASSERT_TRUE(remark.has_value());
  EXPECT_EQ(remark->remark, "010203"_unhex);
}

/**
 * @given a signed extrinsic
 * @when its signed extensions are walked
 * @then every extension is found with its bytes and decoded value
 */
TEST_F(ExtrinsicDetailsTest, SignedExtensions) {
  auto bytes = testutil::signedRemark("14a10f"_unhex, {});
  EXPECT_OUTCOME_TRUE(details, decode(bytes));
  auto extensions = details.signedExtensions();
  ASSERT_TRUE(extensions);

  auto it = extensions->iter();
  auto nonce = it.next();
  ASSERT_TRUE(nonce);
  EXPECT_OUTCOME_TRUE(check_nonce, std::move(*nonce));
  EXPECT_EQ(check_nonce.identifier(), "CheckNonce");
  EXPECT_EQ(check_nonce.bytes().toHex(), "14");
  EXPECT_OUTCOME_TRUE(nonce_value, check_nonce.value());
  EXPECT_EQ(nonce_value, Value::unnamed({Value::u128(5)}));

  auto payment = it.next();
  ASSERT_TRUE(payment);
  EXPECT_OUTCOME_TRUE(charge, std::move(*payment));
  EXPECT_EQ(charge.identifier(), "ChargeTransactionPayment");
  EXPECT_EQ(charge.bytes().toHex(), "a10f");
  EXPECT_FALSE(it.next());

  EXPECT_EQ(extensions->nonce(), 5);
  EXPECT_EQ(extensions->tip(), rampart::codec::U128{1000});

  EXPECT_OUTCOME_TRUE(missing, extensions->find("CheckMortality"));
  EXPECT_FALSE(missing.has_value());
  EXPECT_OUTCOME_TRUE(found, extensions->find("ChargeTransactionPayment"));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->bytes().toHex(), "a10f");
}

/**
 * @given signed extension bytes cut in the middle of the second extension
 * @when extensions are walked
 * @then the first one is returned, then the error, then the walk ends
 */
TEST_F(ExtrinsicDetailsTest, BrokenSignedExtensions) {
  auto extra = std::make_shared<const Buffer>("14a1"_hex2buf);
  rampart::blocks::ExtrinsicSignedExtensions extensions{
      extra, *extra, metadata_};
  auto it = extensions.iter();
  auto first = it.next();
  ASSERT_TRUE(first);
  EXPECT_TRUE(first->has_value());
  auto second = it.next();
  ASSERT_TRUE(second);
  EXPECT_TRUE(second->has_error());
  EXPECT_FALSE(it.next());

  EXPECT_EQ(extensions.nonce(), 5);
  EXPECT_FALSE(extensions.tip());
}

/**
 * @given signed extensions taken from extrinsic details that are then dropped
 * @when the extensions are walked
 * @then their bytes are still readable
 */
TEST_F(ExtrinsicDetailsTest, SignedExtensionsOutliveDetails) {
  auto extensions = [&] {
    auto bytes = testutil::signedRemark("14a10f"_unhex, {});
    auto details = decode(bytes).value();
    return details.signedExtensions();
  }();
  ASSERT_TRUE(extensions);

  EXPECT_EQ(extensions->nonce(), 5);
  EXPECT_EQ(extensions->tip(), rampart::codec::U128{1000});

  EXPECT_OUTCOME_TRUE(charge, extensions->find("ChargeTransactionPayment"));
  ASSERT_TRUE(charge.has_value());
  auto extension = *charge;
  extensions.reset();
  EXPECT_EQ(extension.bytes().toHex(), "a10f");
}

/**
 * @given extrinsics of unsupported versions
 * @when they are decoded
 * @then the version is reported within the error
 */
TEST_F(ExtrinsicDetailsTest, UnsupportedVersion) {
  std::vector<std::pair<uint8_t, uint8_t>> cases{
      {0x00, 0}, {0x80, 0}, {0x03, 3}, {0x83, 3}, {0x05, 5}, {0x7f, 127}};
  for (auto [control, version] : cases) {
    Buffer bytes{std::vector<uint8_t>{control, 0x00, 0x02}};
    EXPECT_OUTCOME_FALSE(error, decode(bytes));
    EXPECT_TRUE(static_cast<bool>(error));
    EXPECT_NE(error.message().find(fmt::format("version {} ", version)),
              std::string::npos);
    EXPECT_EQ(error.category(),
              rampart::blocks::unsupportedVersionCategory());
    EXPECT_EQ(unsupportedVersion(error), version);
  }
  EXPECT_FALSE(unsupportedVersion(make_error_code(
      rampart::blocks::BlockError::BODY_HAS_TRAILING_BYTES)));
}

/**
 * @given truncated extrinsics
 * @when they are decoded
 * @then shortfall of input is reported
 */
TEST_F(ExtrinsicDetailsTest, Truncated) {
  EXPECT_EC(decode(Buffer{}), scale::DecodeError::NOT_ENOUGH_DATA);
  EXPECT_EC(decode("04"_hex2buf), scale::DecodeError::NOT_ENOUGH_DATA);
  EXPECT_EC(decode("0400"_hex2buf), scale::DecodeError::NOT_ENOUGH_DATA);

  auto signed_bytes = testutil::signedRemark("14a10f"_unhex, {});
  signed_bytes.resize(40);
  EXPECT_EC(decode(signed_bytes), scale::DecodeError::NOT_ENOUGH_DATA);
}

/**
 * @given extrinsics calling unknown pallets and calls
 * @when their metadata is looked up
 * @then the kind of the miss is reported, while locating parts succeeds
 */
TEST_F(ExtrinsicDetailsTest, UnknownCall) {
  EXPECT_OUTCOME_TRUE(unknown_pallet, decode("040700"_hex2buf));
  EXPECT_EC(unknown_pallet.extrinsicMetadata(),
            MetadataError::PALLET_INDEX_NOT_FOUND);
  EXPECT_EC(unknown_pallet.asExtrinsic<TestCall>(),
            MetadataError::PALLET_INDEX_NOT_FOUND);

  EXPECT_OUTCOME_TRUE(unknown_call, decode("040005"_hex2buf));
  EXPECT_EC(unknown_call.variantName(),
            MetadataError::VARIANT_INDEX_NOT_FOUND);

  EXPECT_OUTCOME_TRUE(no_calls, decode("040100"_hex2buf));
  EXPECT_EC(no_calls.fieldValues(), MetadataError::CALL_TYPE_NOT_FOUND);
}

/**
 * @given a TestCall whose fields are cut short
 * @when its fields are decoded
 * @then shortfall of input is reported
 */
TEST_F(ExtrinsicDetailsTest, TruncatedFields) {
  auto bytes = testutil::unsignedTestCall(1, true, "abc");
  bytes.resize(bytes.size() - 2);
  EXPECT_OUTCOME_TRUE(details, decode(bytes));
  EXPECT_OUTCOME_FALSE_1(details.fieldValues());
  EXPECT_OUTCOME_FALSE_1(details.asExtrinsic<TestCall>());
}
