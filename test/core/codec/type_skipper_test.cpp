/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/type_skipper.hpp"

#include <gtest/gtest.h>

#include "codec/codec_error.hpp"
#include "codec/value_decoder.hpp"
#include "testutil/literals.hpp"
#include "testutil/metadata/test_metadata.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using rampart::BufferView;
using rampart::codec::CodecError;
using rampart::codec::encodedSize;
using rampart::metadata::TypeDefArray;
using rampart::metadata::TypeDefBitSequence;
using rampart::metadata::TypeDefCompact;
using rampart::metadata::TypeDefPrimitive;
using rampart::metadata::TypeDefSequence;
using rampart::metadata::TypeDefTuple;
using rampart::metadata::TypeRegistry;
using testutil::composite;
using testutil::enumeration;
using testutil::field;
using testutil::RegistryBuilder;
using testutil::unnamed;
using testutil::variant;

class TypeSkipperTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    registry_ = RegistryBuilder{}
                    .set(0, TypeDefPrimitive::U8)
                    .set(1, TypeDefPrimitive::U64)
                    .set(2, TypeDefPrimitive::Str)
                    .set(3, TypeDefSequence{0})
                    .set(4, TypeDefArray{4, 1})
                    .set(5, TypeDefCompact{1})
                    .set(6, composite({field("id", 1), field("name", 2)}))
                    .set(7,
                         enumeration({variant("Empty", 0),
                                      variant("Full", 3, {unnamed(6)})}))
                    .set(8, TypeDefSequence{6})
                    .set(9, TypeDefTuple{{0, 5, 2}})
                    .set(10, composite({}), {"bitvec", "order", "Msb0"})
                    .set(11,
                         TypeDefBitSequence{.bit_store_type = 1,
                                            .bit_order_type = 10})
                    .build();
  }

 protected:
  TypeRegistry registry_;
};

/**
 * @given fixed-width types
 * @when their encoded sizes are measured over longer input
 * @then sizes equal the widths of the types
 */
TEST_F(TypeSkipperTest, FixedWidth) {
  auto data = std::vector<uint8_t>(64, 0);
  EXPECT_OUTCOME_TRUE(u8, encodedSize(data, 0, registry_));
  EXPECT_EQ(u8, 1);
  EXPECT_OUTCOME_TRUE(u64, encodedSize(data, 1, registry_));
  EXPECT_EQ(u64, 8);
  EXPECT_OUTCOME_TRUE(array, encodedSize(data, 4, registry_));
  EXPECT_EQ(array, 32);
}

/**
 * @given length-prefixed types
 * @when their encoded sizes are measured
 * @then sizes include the prefix and the payload
 */
TEST_F(TypeSkipperTest, LengthPrefixed) {
  EXPECT_OUTCOME_TRUE(str, encodedSize("0c616263ffff"_unhex, 2, registry_));
  EXPECT_EQ(str, 4);
  EXPECT_OUTCOME_TRUE(bytes, encodedSize("08aabbcc"_unhex, 3, registry_));
  EXPECT_EQ(bytes, 3);
  EXPECT_OUTCOME_TRUE(compact, encodedSize("a10f00"_unhex, 5, registry_));
  EXPECT_EQ(compact, 2);
}

/**
 * @given nested composite, enum, sequence and tuple types
 * @when their encoded sizes are measured
 * @then sizes equal the bytes consumed by the value decoder
 */
TEST_F(TypeSkipperTest, MatchesDecoder) {
  // Full({id: 1, name: "a"}) followed by a trailer
  auto data = "03" "0100000000000000" "0461" "ffff"_unhex;
  EXPECT_OUTCOME_TRUE(size, encodedSize(data, 7, registry_));
  EXPECT_EQ(size, 11);

  BufferView bytes{data};
  EXPECT_OUTCOME_TRUE_1(rampart::codec::decodeAsType(bytes, 7, registry_));
  EXPECT_EQ(data.size() - bytes.size(), size);

  // (42, Compact(255), "x") followed by a trailer
  auto tuple = "2a" "fd03" "0478" "7978"_unhex;
  EXPECT_OUTCOME_TRUE(tuple_size, encodedSize(tuple, 9, registry_));
  EXPECT_EQ(tuple_size, 5);

  auto items = "08" "0100000000000000" "0461"
               "0200000000000000" "00"_unhex;
  EXPECT_OUTCOME_TRUE(items_size, encodedSize(items, 8, registry_));
  EXPECT_EQ(items_size, items.size());
}

/**
 * @given a bit sequence stored in u64 words
 * @when its encoded size is measured
 * @then whole words are counted
 */
TEST_F(TypeSkipperTest, BitSequence) {
  // 65 bits take two words
  auto data = std::vector<uint8_t>(2 + 16, 0);
  data[0] = 0x05;
  data[1] = 0x01;
  EXPECT_OUTCOME_TRUE(size, encodedSize(data, 11, registry_));
  EXPECT_EQ(size, 18);

  data.resize(10);
  EXPECT_EC(encodedSize(data, 11, registry_),
            scale::DecodeError::NOT_ENOUGH_DATA);
}

/**
 * @given malformed or short input
 * @when its encoded size is measured
 * @then the failure is reported with its reason
 */
TEST_F(TypeSkipperTest, Failures) {
  EXPECT_EC(encodedSize("02"_unhex, 7, registry_),
            CodecError::VARIANT_NOT_FOUND);
  EXPECT_EC(encodedSize("010203"_unhex, 1, registry_),
            scale::DecodeError::NOT_ENOUGH_DATA);
  EXPECT_EC(encodedSize("10aabb"_unhex, 3, registry_),
            scale::DecodeError::TOO_MANY_ITEMS);
  EXPECT_EC(encodedSize("00"_unhex, 100, registry_),
            CodecError::TYPE_NOT_FOUND);
}

/**
 * @given a stream over two consecutive values
 * @when the first one is skipped
 * @then the stream is positioned at the second one
 */
TEST_F(TypeSkipperTest, SkipAdvancesStream) {
  auto data = "0c61626307"_unhex;
  scale::ScaleDecoderStream stream{BufferView{data}};
  rampart::codec::skipType(stream, 2, registry_);
  EXPECT_EQ(stream.currentIndex(), 4);
  EXPECT_EQ(stream.nextByte(), 0x07);
  EXPECT_FALSE(stream.hasMore(1));
}

/**
 * @given a sequence of unit values and a sequence of empty arrays
 * @when encodings holding only a compact length are skipped
 * @then exactly the length prefix is consumed
 */
TEST_F(TypeSkipperTest, ZeroSizedElements) {
  auto registry = RegistryBuilder{}
                      .set(0, composite({}))
                      .set(1, TypeDefSequence{0})
                      .set(2, TypeDefArray{0, 3})
                      .set(3, TypeDefPrimitive::U64)
                      .set(4, TypeDefSequence{2})
                      .build();

  EXPECT_OUTCOME_TRUE(units, encodedSize("14"_unhex, 1, registry));
  EXPECT_EQ(units, 1);
  EXPECT_OUTCOME_TRUE(arrays, encodedSize("a10fff"_unhex, 4, registry));
  EXPECT_EQ(arrays, 2);
}
