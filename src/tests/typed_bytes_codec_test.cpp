#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "codec/typed_bytes_codec.hpp"
#include "test_utils.hpp"

using namespace tbstream::codec;

class TypedBytesCodecTest : public ::testing::Test {
protected:
  TypedBytesCodec codec;

  static void SetUpTestSuite() {
    init_logging();
  }

  std::string encode(const TypedValue& value) {
    std::ostringstream output;
    codec.encode_value(value, output);
    return output.str();
  }

  TypedValue decode(const std::string& bytes) {
    std::istringstream input(bytes);
    return codec.decode_value(input);
  }

  static std::string raw(std::initializer_list<int> bytes) {
    std::string result;
    for (int byte : bytes) {
      result.push_back(static_cast<char>(byte));
    }
    return result;
  }
};

TEST_F(TypedBytesCodecTest, IntegersAreBigEndian) {
  EXPECT_EQ(encode(TypedValue::int32(42)), raw({3, 0, 0, 0, 42}));
  EXPECT_EQ(encode(TypedValue::int64(-2)), raw({4, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe}));
  EXPECT_EQ(encode(TypedValue::boolean(true)), raw({2, 1}));
}

TEST_F(TypedBytesCodecTest, StringsCarryLengthPrefix) {
  EXPECT_EQ(encode(TypedValue::string("abc")), raw({7, 0, 0, 0, 3, 'a', 'b', 'c'}));
  EXPECT_EQ(encode(TypedValue::bytes("")), raw({0, 0, 0, 0, 0}));
}

TEST_F(TypedBytesCodecTest, ListIsTerminatedByMarker) {
  auto list = TypedValue::list({TypedValue::byte(5), TypedValue::boolean(false)});
  EXPECT_EQ(encode(list), raw({9, 1, 5, 2, 0, 255}));
  EXPECT_EQ(decode(raw({9, 1, 5, 2, 0, 255})), list);
}

TEST_F(TypedBytesCodecTest, DecodesKnownDoubleBits) {
  // 1.5 as an IEEE 754 double
  TypedValue value = decode(raw({6, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0}));
  EXPECT_EQ(value.type, TypeCode::DOUBLE);
  EXPECT_DOUBLE_EQ(value.real, 1.5);
}

TEST_F(TypedBytesCodecTest, NestedRecordSurvivesEncoding) {
  Record record;
  record.key = TypedValue::string("user-17");
  record.value = TypedValue::map({
    TypedValue::string("scores"), TypedValue::vector({TypedValue::float64(0.25), TypedValue::float32(2.5f)}),
    TypedValue::string("tags"), TypedValue::list({TypedValue::string("a"), TypedValue::bytes(std::string("\0\1", 2))}),
    TypedValue::string("blob"), TypedValue::application(100, "opaque")
  });

  std::stringstream stream;
  std::size_t written = codec.encode(record, stream);
  EXPECT_EQ(written, stream.str().size());

  Record decoded;
  ASSERT_TRUE(codec.decode(stream, decoded));
  EXPECT_EQ(decoded, record);
  EXPECT_FALSE(codec.decode(stream, decoded));
}

TEST_F(TypedBytesCodecTest, ConsecutiveRecordsDecodeInOrder) {
  std::stringstream stream;
  for (int i = 0; i < 3; ++i) {
    codec.encode(Record{TypedValue::int32(i), TypedValue::string(std::to_string(i))}, stream);
  }

  Record record;
  for (int i = 0; i < 3; ++i) {
    ASSERT_TRUE(codec.decode(stream, record));
    EXPECT_EQ(record.key.integer, i);
    EXPECT_EQ(record.value.data, std::to_string(i));
  }
  EXPECT_FALSE(codec.decode(stream, record));
}

TEST_F(TypedBytesCodecTest, EmptyStreamIsCleanEnd) {
  std::istringstream empty;
  Record record;
  EXPECT_FALSE(codec.decode(empty, record));
}

TEST_F(TypedBytesCodecTest, TruncatedRecordThrows) {
  // Key complete, value cut off inside its length
  std::istringstream input(raw({3, 0, 0, 0, 1, 7, 0, 0}));
  Record record;
  EXPECT_THROW(codec.decode(input, record), DecodeError);
}

TEST_F(TypedBytesCodecTest, MissingValueThrows) {
  std::istringstream input(raw({3, 0, 0, 0, 1}));
  Record record;
  EXPECT_THROW(codec.decode(input, record), DecodeError);
}

TEST_F(TypedBytesCodecTest, UnknownTypeCodeThrows) {
  EXPECT_THROW(decode(raw({11, 0})), DecodeError);
  EXPECT_THROW(decode(raw({255})), DecodeError);
}

TEST_F(TypedBytesCodecTest, NegativeLengthThrows) {
  EXPECT_THROW(decode(raw({7, 0xff, 0xff, 0xff, 0xff})), DecodeError);
}

TEST_F(TypedBytesCodecTest, ApplicationCodeKeepsRawBytes) {
  TypedValue value = decode(raw({120, 0, 0, 0, 2, 'h', 'i'}));
  EXPECT_EQ(static_cast<int>(value.type), 120);
  EXPECT_EQ(value.data, "hi");
  EXPECT_EQ(encode(value), raw({120, 0, 0, 0, 2, 'h', 'i'}));
}

TEST_F(TypedBytesCodecTest, OddMapRejected) {
  TypedValue broken;
  broken.type = TypeCode::MAP;
  broken.items.push_back(TypedValue::string("lonely"));
  std::ostringstream output;
  EXPECT_THROW(codec.encode_value(broken, output), EncodeError);
}

TEST_F(TypedBytesCodecTest, RendersReadableText) {
  auto value = TypedValue::vector({TypedValue::int32(1), TypedValue::string("x"), TypedValue::boolean(true)});
  EXPECT_EQ(value.to_string(), "[1, \"x\", true]");
  EXPECT_EQ(TypedValue::map({TypedValue::string("k"), TypedValue::int64(2)}).to_string(), "{\"k\": 2}");
}

TEST_F(TypedBytesCodecTest, DeeplyNestedInputThrows) {
  // Nothing but list openers
  std::istringstream input(std::string(5000000, '\x09'));
  Record record;
  EXPECT_THROW(codec.decode(input, record), DecodeError);
}

TEST_F(TypedBytesCodecTest, NestingUpToLimitIsAccepted) {
  TypedValue value = TypedValue::int32(7);
  for (std::size_t i = 0; i < TypedBytesCodec::MAX_NESTING_DEPTH; ++i) {
    value = TypedValue::vector({value});
  }
  std::stringstream stream;
  codec.encode(Record{TypedValue::string("deep"), value}, stream);

  Record decoded;
  ASSERT_TRUE(codec.decode(stream, decoded));
  EXPECT_EQ(decoded.value, value);
}

TEST_F(TypedBytesCodecTest, OversizedLengthThrowsWithoutPayload) {
  // Declares 2 GiB - 1 bytes of string, supplies one
  EXPECT_THROW(decode(raw({7, 0x7f, 0xff, 0xff, 0xff, 'a'})), DecodeError);
}

TEST_F(TypedBytesCodecTest, PayloadsLargerThanOneChunkDecode) {
  std::string big(TypedBytesCodec::READ_CHUNK_SIZE * 2 + 17, 'z');
  EXPECT_EQ(decode(encode(TypedValue::bytes(big))).data, big);
}
