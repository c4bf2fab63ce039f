#include <gtest/gtest.h>
#include "landledger/core/serializer.hpp"

using namespace landledger::core;

TEST(Serializer, WriteRaw_NoLengthPrefix) {
  ByteWriter writer;
  writer.write_u32(0x01020304u);
  std::vector<uint8_t> raw{0xAA, 0xBB, 0xCC};
  writer.write_raw(std::span<const uint8_t>(raw.data(), raw.size()));
  std::vector<uint8_t> pref{0x10, 0x20};
  writer.write_bytes(std::span<const uint8_t>(pref.data(), pref.size()));

  auto out = writer.buffer();
  // Expect: [04 03 02 01] + [AA BB CC] + [02 00 00 00] + [10 20]
  std::vector<uint8_t> expected{
    0x04, 0x03, 0x02, 0x01,
    0xAA, 0xBB, 0xCC,
    0x02, 0x00, 0x00, 0x00,
    0x10, 0x20
  };
  ASSERT_EQ(out.size(), expected.size());
  EXPECT_TRUE(std::equal(out.begin(), out.end(), expected.begin(), expected.end()));
}

TEST(Serializer, OptionalStringPresenceByte) {
  ByteWriter writer;
  writer.write_optional_string(std::nullopt);
  writer.write_optional_string(std::string("ab"));
  writer.write_u16(0xBEEF);

  auto out = writer.take();
  std::vector<uint8_t> expected{0x00, 0x01, 0x02, 0x00, 0x00, 0x00, 'a', 'b', 0xEF, 0xBE};
  EXPECT_EQ(out, expected);

  ByteReader reader(std::span<const uint8_t>(out.data(), out.size()));
  EXPECT_FALSE(reader.read_optional_string().has_value());
  EXPECT_EQ(reader.read_optional_string().value(), "ab");
  EXPECT_EQ(reader.read_u16(), 0xBEEF);
  EXPECT_NO_THROW(reader.expect_end());
}

TEST(Serializer, TruncatedInputThrows) {
  ByteWriter writer;
  writer.write_string("hello");
  auto out = writer.take();
  out.pop_back();

  ByteReader reader(std::span<const uint8_t>(out.data(), out.size()));
  EXPECT_THROW(reader.read_string(), SerializeError);
}

TEST(Serializer, BadPresenceByteThrows) {
  std::vector<uint8_t> bytes{0x02};
  ByteReader reader(std::span<const uint8_t>(bytes.data(), bytes.size()));
  EXPECT_THROW(reader.read_optional_string(), SerializeError);
}

TEST(Serializer, TrailingBytesFailExpectEnd) {
  std::vector<uint8_t> bytes{0x01, 0x00, 0xFF};
  ByteReader reader(std::span<const uint8_t>(bytes.data(), bytes.size()));
  EXPECT_EQ(reader.read_u16(), 1u);
  EXPECT_THROW(reader.expect_end(), SerializeError);
}
