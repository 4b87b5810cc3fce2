#include <folly/portability/GTest.h>
#include <migration/codec/BinaryEncoder.h>
#include <migration/codec/MessageCodec.h>

using namespace testing;

namespace migration {
namespace test {

class MessageCodecTest : public Test {
 public:
  static std::vector<uint8_t> toVector(const folly::IOBuf& buf) {
    auto range = buf.coalesce();
    return std::vector<uint8_t>(range.begin(), range.end());
  }

  MigrationPacket roundTrip(
      const MigrationPacket& packet,
      UuidEncoding encoding = UuidEncoding::COMPACT) {
    auto encoded = encodePacket(packet, encoding);
    auto decoded = decodePacket(*encoded, encoding);
    EXPECT_TRUE(decoded.hasValue());
    return std::move(decoded.value());
  }
};

TEST_F(MessageCodecTest, TestSchemaIdentifiers) {
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::QueryStatsMessage).schemaId),
      "4b201b06-7952-43a4-8157-96b9aeffa667");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::OnQueryStatsMessage)
              .schemaId),
      "0906f883-6adf-4d90-9252-9ab401fbe531");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::StartMessage).schemaId),
      "8a26fefe-6bd5-45e2-9098-3d736d8a1c4e");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::ListFilesMessage).schemaId),
      "5964dbf0-5620-4c78-963b-c6e08665fc33");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::OnListFilesMessage)
              .schemaId),
      "e74fea73-abc7-42ca-ad37-b636f6c4df2b");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::PutFileMessage).schemaId),
      "ccc791c2-3a5c-4d83-ab06-48137a4ad262");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::OnPutFileMessage).schemaId),
      "ef7b3c03-33d5-49c2-8644-79ea2688403e");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::SettingsMessage).schemaId),
      "09557d03-3af7-4151-aa60-c6a4b992e18b");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::AccountMessage).schemaId),
      "11161f66-68e9-4cb4-8c12-241f4e071af4");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::TerminateMigrationMessage)
              .schemaId),
      "a35089f8-326f-4f25-b160-e0f9f2c9795c");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::ShutdownMessage).schemaId),
      "05c90756-d56c-4e2f-92bf-36b2d3f31b76");
  EXPECT_EQ(
      uuidToString(
          schemaKeyForType(MigrationMessage::Type::ErrorMessage).schemaId),
      "42705574-8e05-47fd-9742-ffd86a923cea");
}

TEST_F(MessageCodecTest, TestCompactQueryStatsLayout) {
  MigrationPacket packet(1, QueryStatsMessage{-1});
  auto encoded = toVector(*encodePacket(packet, UuidEncoding::COMPACT));

  // 16 bytes of uuid, LSB little endian first.
  ASSERT_EQ(encoded.size(), 16 + 1 + 1 + 1);
  EXPECT_EQ(encoded[0], 0x67);
  EXPECT_EQ(encoded[7], 0x81);
  EXPECT_EQ(encoded[8], 0xa4);
  EXPECT_EQ(encoded[15], 0x4b);
  // Schema version 1, request id 1, max file size -1.
  EXPECT_EQ(encoded[16], 0x02);
  EXPECT_EQ(encoded[17], 0x02);
  EXPECT_EQ(encoded[18], 0x01);
}

TEST_F(MessageCodecTest, TestLegacyEncodingWithPadding) {
  MigrationPacket packet(300, ShutdownMessage{true});
  auto encoded = encodePacket(packet, UuidEncoding::LEGACY, 1);
  auto bytes = toVector(*encoded);
  ASSERT_FALSE(bytes.empty());
  EXPECT_EQ(bytes[0], 0);
  EXPECT_EQ(bytes.back(), 1);

  encoded->trimStart(1);
  auto decoded = decodePacket(*encoded, UuidEncoding::LEGACY);
  ASSERT_TRUE(decoded.hasValue());
  EXPECT_EQ(decoded.value(), packet);

  // The same bytes are not a valid compact packet.
  auto wrongEncoding = decodePacket(*encoded, UuidEncoding::COMPACT);
  EXPECT_TRUE(wrongEncoding.hasError());
}

TEST_F(MessageCodecTest, TestVarintBoundaries) {
  folly::IOBufQueue queue{folly::IOBufQueue::cacheChainLength()};
  BinaryEncoder encoder(queue, UuidEncoding::COMPACT);
  encoder.writeInt(63);
  encoder.writeInt(64);
  encoder.writeInt(-65);
  encoder.writeLong(std::numeric_limits<int64_t>::min());
  auto bytes = toVector(*queue.move());
  std::vector<uint8_t> expectedPrefix{0x7e, 0x80, 0x01, 0x81, 0x01};
  ASSERT_EQ(bytes.size(), expectedPrefix.size() + 10);
  EXPECT_TRUE(std::equal(
      expectedPrefix.begin(), expectedPrefix.end(), bytes.begin()));
  EXPECT_EQ(bytes.back(), 0x01);
}

TEST_F(MessageCodecTest, TestListFilesPacket) {
  ListFilesMessage message;
  message.files.push_back({10, "conversations/a/b.jpg", 1234, 1700000000123});
  message.files.push_back({11, "pictures/p.png", 0, 0});
  MigrationPacket packet(kRequestIdOffsetInitiator + 7, message);

  auto decoded = roundTrip(packet);
  EXPECT_EQ(decoded, packet);
  ASSERT_NE(decoded.message.asListFilesMessage(), nullptr);
  EXPECT_EQ(decoded.message.asListFilesMessage()->files.size(), 2);
  EXPECT_EQ(decoded.message.asPutFileMessage(), nullptr);
}

TEST_F(MessageCodecTest, TestPutFileOptionalFields) {
  PutFileMessage dataChunk;
  dataChunk.fileId = 12;
  dataChunk.offset = 65536;
  dataChunk.data = Bytes{1, 2, 3};
  EXPECT_EQ(roundTrip(MigrationPacket(5, dataChunk)).message, dataChunk);

  PutFileMessage finalChunk;
  finalChunk.fileId = 12;
  finalChunk.offset = 65539;
  finalChunk.sha256 = Bytes(32, 0xab);
  auto decoded = roundTrip(MigrationPacket(6, finalChunk));
  auto putFile = decoded.message.asPutFileMessage();
  ASSERT_NE(putFile, nullptr);
  EXPECT_FALSE(putFile->data.hasValue());
  EXPECT_EQ(putFile->dataSize(), 0);
  ASSERT_TRUE(putFile->sha256.hasValue());
  EXPECT_EQ(putFile->sha256->size(), 32);
}

TEST_F(MessageCodecTest, TestSettingsAndAccountPackets) {
  SettingsMessage settings;
  settings.hasPeerSettings = true;
  settings.settings[Uuid(1, 2)] = "true";
  settings.settings[Uuid(3, 4)] = "";
  EXPECT_EQ(
      roundTrip(MigrationPacket(9, settings), UuidEncoding::LEGACY).message,
      settings);

  AccountMessage account;
  account.securedConfiguration = Bytes{9, 8, 7};
  account.hasPeerAccount = true;
  EXPECT_EQ(roundTrip(MigrationPacket(10, account)).message, account);
}

TEST_F(MessageCodecTest, TestUnknownErrorCodeDecodesAsInternalError) {
  MigrationPacket packet(3, ErrorMessage{ErrorCode::NO_SPACE_LEFT});
  auto encoded = encodePacket(packet, UuidEncoding::COMPACT);
  auto bytes = toVector(*encoded);
  // Error code is the last byte: replace 2 (zig-zag 4) by 42 (zig-zag 84).
  bytes.back() = 84;
  auto decoded = decodePacket(
      *folly::IOBuf::copyBuffer(bytes.data(), bytes.size()),
      UuidEncoding::COMPACT);
  ASSERT_TRUE(decoded.hasValue());
  EXPECT_EQ(
      decoded->message.asErrorMessage()->errorCode, ErrorCode::INTERNAL_ERROR);
}

TEST_F(MessageCodecTest, TestUnknownSchema) {
  MigrationPacket packet(3, StartMessage{100});
  auto bytes = toVector(*encodePacket(packet, UuidEncoding::COMPACT));
  bytes[0] ^= 0xff;
  auto decoded = decodePacket(
      *folly::IOBuf::copyBuffer(bytes.data(), bytes.size()),
      UuidEncoding::COMPACT);
  ASSERT_TRUE(decoded.hasError());
  EXPECT_EQ(decoded.error(), CodecError::UNKNOWN_SCHEMA);
}

TEST_F(MessageCodecTest, TestTruncatedPacket) {
  AccountMessage account;
  account.securedConfiguration = Bytes(100, 1);
  account.accountConfiguration = Bytes(100, 2);
  auto bytes = toVector(
      *encodePacket(MigrationPacket(4, account), UuidEncoding::COMPACT));
  bytes.resize(bytes.size() - 50);
  auto decoded = decodePacket(
      *folly::IOBuf::copyBuffer(bytes.data(), bytes.size()),
      UuidEncoding::COMPACT);
  ASSERT_TRUE(decoded.hasError());
  EXPECT_EQ(decoded.error(), CodecError::TRUNCATED);
}

TEST_F(MessageCodecTest, TestNegativeCountIsMalformed) {
  folly::IOBufQueue queue{folly::IOBufQueue::cacheChainLength()};
  BinaryEncoder encoder(queue, UuidEncoding::COMPACT);
  auto schemaKey = schemaKeyForType(MigrationMessage::Type::OnListFilesMessage);
  encoder.writeUuid(schemaKey.schemaId);
  encoder.writeInt(schemaKey.schemaVersion);
  encoder.writeLong(1);
  encoder.writeInt(-3);
  auto decoded = decodePacket(*queue.move(), UuidEncoding::COMPACT);
  ASSERT_TRUE(decoded.hasError());
  EXPECT_EQ(decoded.error(), CodecError::MALFORMED);
}

} // namespace test
} // namespace migration
