#include <migration/codec/MessageCodec.h>

#include <glog/logging.h>
#include <migration/codec/BinaryDecoder.h>
#include <migration/codec/BinaryEncoder.h>

namespace {

using namespace migration;

void encodeBody(BinaryEncoder& encoder, const QueryStatsMessage& message) {
  encoder.writeLong(message.maxFileSize);
}

void encodeBody(BinaryEncoder& encoder, const OnQueryStatsMessage& message) {
  const auto& info = message.queryInfo;
  encoder.writeLong(info.directoryCount);
  encoder.writeLong(info.fileCount);
  encoder.writeLong(info.maxFileSize);
  encoder.writeLong(info.totalFileSize);
  encoder.writeLong(info.databaseFileSize);
  encoder.writeLong(info.filesystemAvailableSpace);
  encoder.writeLong(info.databaseAvailableSpace);
}

void encodeBody(BinaryEncoder& encoder, const StartMessage& message) {
  encoder.writeLong(message.maxFileSize);
}

void encodeBody(BinaryEncoder& encoder, const ListFilesMessage& message) {
  encoder.writeInt(static_cast<int32_t>(message.files.size()));
  for (const auto& file : message.files) {
    encoder.writeString(file.path);
    encoder.writeInt(file.fileId);
    encoder.writeLong(file.size);
    encoder.writeLong(file.modificationDate);
  }
}

void encodeBody(BinaryEncoder& encoder, const OnListFilesMessage& message) {
  encoder.writeInt(static_cast<int32_t>(message.files.size()));
  for (const auto& state : message.files) {
    encoder.writeInt(state.fileId);
    encoder.writeLong(state.offset);
  }
}

void encodeBody(BinaryEncoder& encoder, const PutFileMessage& message) {
  encoder.writeInt(message.fileId);
  encoder.writeLong(message.offset);
  encoder.writeOptionalBytes(message.data);
  encoder.writeOptionalBytes(message.sha256);
}

void encodeBody(BinaryEncoder& encoder, const OnPutFileMessage& message) {
  encoder.writeInt(message.fileId);
  encoder.writeLong(message.offset);
}

void encodeBody(BinaryEncoder& encoder, const SettingsMessage& message) {
  encoder.writeBoolean(message.hasPeerSettings);
  encoder.writeInt(static_cast<int32_t>(message.settings.size()));
  for (const auto& setting : message.settings) {
    encoder.writeUuid(setting.first);
    encoder.writeString(setting.second);
  }
}

void encodeBody(BinaryEncoder& encoder, const AccountMessage& message) {
  encoder.writeBytes(folly::ByteRange(
      message.securedConfiguration.data(),
      message.securedConfiguration.size()));
  encoder.writeBytes(folly::ByteRange(
      message.accountConfiguration.data(),
      message.accountConfiguration.size()));
  encoder.writeBoolean(message.hasPeerAccount);
}

void encodeBody(
    BinaryEncoder& encoder,
    const TerminateMigrationMessage& message) {
  encoder.writeBoolean(message.commit);
  encoder.writeBoolean(message.done);
}

void encodeBody(BinaryEncoder& encoder, const ShutdownMessage& message) {
  encoder.writeBoolean(message.close);
}

void encodeBody(BinaryEncoder& encoder, const ErrorMessage& message) {
  encoder.writeEnum(static_cast<int32_t>(message.errorCode));
}

#define ENCODE_BODY_CASES(X, encoder, message) \
  case MigrationMessage::Type::X:              \
    encodeBody(encoder, *message.as##X());     \
    break;

QueryStatsMessage decodeQueryStats(BinaryDecoder& decoder) {
  QueryStatsMessage message;
  message.maxFileSize = decoder.readLong();
  return message;
}

OnQueryStatsMessage decodeOnQueryStats(BinaryDecoder& decoder) {
  OnQueryStatsMessage message;
  auto& info = message.queryInfo;
  info.directoryCount = decoder.readLong();
  info.fileCount = decoder.readLong();
  info.maxFileSize = decoder.readLong();
  info.totalFileSize = decoder.readLong();
  info.databaseFileSize = decoder.readLong();
  info.filesystemAvailableSpace = decoder.readLong();
  info.databaseAvailableSpace = decoder.readLong();
  return message;
}

StartMessage decodeStart(BinaryDecoder& decoder) {
  StartMessage message;
  message.maxFileSize = decoder.readLong();
  return message;
}

ListFilesMessage decodeListFiles(BinaryDecoder& decoder) {
  ListFilesMessage message;
  auto count = decoder.readCount();
  message.files.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    FileInfo file;
    file.path = decoder.readString();
    file.fileId = decoder.readInt();
    file.size = decoder.readLong();
    file.modificationDate = decoder.readLong();
    message.files.push_back(std::move(file));
  }
  return message;
}

OnListFilesMessage decodeOnListFiles(BinaryDecoder& decoder) {
  OnListFilesMessage message;
  auto count = decoder.readCount();
  message.files.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    FileState state;
    state.fileId = decoder.readInt();
    state.offset = decoder.readLong();
    message.files.push_back(state);
  }
  return message;
}

PutFileMessage decodePutFile(BinaryDecoder& decoder) {
  PutFileMessage message;
  message.fileId = decoder.readInt();
  message.offset = decoder.readLong();
  message.data = decoder.readOptionalBytes();
  message.sha256 = decoder.readOptionalBytes();
  return message;
}

OnPutFileMessage decodeOnPutFile(BinaryDecoder& decoder) {
  OnPutFileMessage message;
  message.fileId = decoder.readInt();
  message.offset = decoder.readLong();
  return message;
}

SettingsMessage decodeSettings(BinaryDecoder& decoder) {
  SettingsMessage message;
  message.hasPeerSettings = decoder.readBoolean();
  auto count = decoder.readCount();
  for (size_t i = 0; i < count; ++i) {
    auto settingId = decoder.readUuid();
    message.settings[settingId] = decoder.readString();
  }
  return message;
}

AccountMessage decodeAccount(BinaryDecoder& decoder) {
  AccountMessage message;
  message.securedConfiguration = decoder.readBytes();
  message.accountConfiguration = decoder.readBytes();
  message.hasPeerAccount = decoder.readBoolean();
  return message;
}

TerminateMigrationMessage decodeTerminateMigration(BinaryDecoder& decoder) {
  TerminateMigrationMessage message;
  message.commit = decoder.readBoolean();
  message.done = decoder.readBoolean();
  return message;
}

ShutdownMessage decodeShutdown(BinaryDecoder& decoder) {
  ShutdownMessage message;
  message.close = decoder.readBoolean();
  return message;
}

ErrorMessage decodeError(BinaryDecoder& decoder) {
  ErrorMessage message;
  auto value = decoder.readEnum();
  if (value >= static_cast<int32_t>(ErrorCode::INTERNAL_ERROR) &&
      value <= static_cast<int32_t>(ErrorCode::SECURE_STORE_ERROR)) {
    message.errorCode = static_cast<ErrorCode>(value);
  } else {
    message.errorCode = ErrorCode::INTERNAL_ERROR;
  }
  return message;
}

MigrationMessage decodeBody(
    BinaryDecoder& decoder,
    MigrationMessage::Type type) {
  switch (type) {
    case MigrationMessage::Type::QueryStatsMessage:
      return decodeQueryStats(decoder);
    case MigrationMessage::Type::OnQueryStatsMessage:
      return decodeOnQueryStats(decoder);
    case MigrationMessage::Type::StartMessage:
      return decodeStart(decoder);
    case MigrationMessage::Type::ListFilesMessage:
      return decodeListFiles(decoder);
    case MigrationMessage::Type::OnListFilesMessage:
      return decodeOnListFiles(decoder);
    case MigrationMessage::Type::PutFileMessage:
      return decodePutFile(decoder);
    case MigrationMessage::Type::OnPutFileMessage:
      return decodeOnPutFile(decoder);
    case MigrationMessage::Type::SettingsMessage:
      return decodeSettings(decoder);
    case MigrationMessage::Type::AccountMessage:
      return decodeAccount(decoder);
    case MigrationMessage::Type::TerminateMigrationMessage:
      return decodeTerminateMigration(decoder);
    case MigrationMessage::Type::ShutdownMessage:
      return decodeShutdown(decoder);
    case MigrationMessage::Type::ErrorMessage:
      return decodeError(decoder);
  }
  folly::assume_unreachable();
}

} // namespace

namespace migration {

Buf encodePacket(
    const MigrationPacket& packet,
    UuidEncoding uuidEncoding,
    size_t padding) {
  folly::IOBufQueue queue{folly::IOBufQueue::cacheChainLength()};
  BinaryEncoder encoder(queue, uuidEncoding);
  for (size_t i = 0; i < padding; ++i) {
    encoder.writeZero();
  }

  const auto& message = packet.message;
  auto schemaKey = schemaKeyForType(message.type());
  encoder.writeUuid(schemaKey.schemaId);
  encoder.writeInt(schemaKey.schemaVersion);
  encoder.writeLong(packet.requestId);
  switch (message.type()) {
    MIGRATION_MESSAGE(ENCODE_BODY_CASES, encoder, message)
  }
  return queue.move();
}

folly::Expected<MigrationPacket, CodecError> decodePacket(
    const folly::IOBuf& data,
    UuidEncoding uuidEncoding) {
  BinaryDecoder decoder(folly::io::Cursor(&data), uuidEncoding);
  try {
    SchemaKey schemaKey;
    schemaKey.schemaId = decoder.readUuid();
    schemaKey.schemaVersion = decoder.readInt();
    auto type = messageTypeForSchema(schemaKey);
    if (!type) {
      VLOG(2) << "Unknown schema " << uuidToString(schemaKey.schemaId) << "."
              << schemaKey.schemaVersion;
      return folly::makeUnexpected(CodecError::UNKNOWN_SCHEMA);
    }
    auto requestId = decoder.readLong();
    return MigrationPacket(requestId, decodeBody(decoder, *type));
  } catch (const CodecException& ex) {
    VLOG(2) << "Cannot decode packet: " << ex.what();
    return folly::makeUnexpected(ex.codecError());
  }
}

folly::StringPiece codecErrorToString(CodecError error) {
  switch (error) {
    case CodecError::TRUNCATED:
      return "TRUNCATED";
    case CodecError::MALFORMED:
      return "MALFORMED";
    case CodecError::UNKNOWN_SCHEMA:
      return "UNKNOWN_SCHEMA";
  }
  return "UNKNOWN";
}

} // namespace migration
