#include <migration/codec/Messages.h>

namespace {

constexpr int32_t kSchemaVersion = 1;

#define MESSAGE_TYPE_CASES(X, ...)   \
  case migration::MigrationMessage::Type::X: \
    return #X;

#define MESSAGE_TYPE_LIST(X, ...) migration::MigrationMessage::Type::X,

constexpr migration::MigrationMessage::Type kAllMessageTypes[] = {
    MIGRATION_MESSAGE(MESSAGE_TYPE_LIST)};

} // namespace

namespace migration {

bool QueryInfo::operator==(const QueryInfo& rhs) const {
  return directoryCount == rhs.directoryCount && fileCount == rhs.fileCount &&
      maxFileSize == rhs.maxFileSize && totalFileSize == rhs.totalFileSize &&
      databaseFileSize == rhs.databaseFileSize &&
      databaseAvailableSpace == rhs.databaseAvailableSpace &&
      filesystemAvailableSpace == rhs.filesystemAvailableSpace;
}

bool FileInfo::operator==(const FileInfo& rhs) const {
  return fileId == rhs.fileId && path == rhs.path && size == rhs.size &&
      modificationDate == rhs.modificationDate;
}

bool FileState::operator==(const FileState& rhs) const {
  return fileId == rhs.fileId && offset == rhs.offset;
}

bool QueryStatsMessage::operator==(const QueryStatsMessage& rhs) const {
  return maxFileSize == rhs.maxFileSize;
}

bool OnQueryStatsMessage::operator==(const OnQueryStatsMessage& rhs) const {
  return queryInfo == rhs.queryInfo;
}

bool StartMessage::operator==(const StartMessage& rhs) const {
  return maxFileSize == rhs.maxFileSize;
}

bool ListFilesMessage::operator==(const ListFilesMessage& rhs) const {
  return files == rhs.files;
}

bool OnListFilesMessage::operator==(const OnListFilesMessage& rhs) const {
  return files == rhs.files;
}

bool PutFileMessage::operator==(const PutFileMessage& rhs) const {
  return fileId == rhs.fileId && offset == rhs.offset && data == rhs.data &&
      sha256 == rhs.sha256;
}

bool OnPutFileMessage::operator==(const OnPutFileMessage& rhs) const {
  return fileId == rhs.fileId && offset == rhs.offset;
}

bool SettingsMessage::operator==(const SettingsMessage& rhs) const {
  return hasPeerSettings == rhs.hasPeerSettings && settings == rhs.settings;
}

bool AccountMessage::operator==(const AccountMessage& rhs) const {
  return securedConfiguration == rhs.securedConfiguration &&
      accountConfiguration == rhs.accountConfiguration &&
      hasPeerAccount == rhs.hasPeerAccount;
}

bool TerminateMigrationMessage::operator==(
    const TerminateMigrationMessage& rhs) const {
  return commit == rhs.commit && done == rhs.done;
}

bool ShutdownMessage::operator==(const ShutdownMessage& rhs) const {
  return close == rhs.close;
}

bool ErrorMessage::operator==(const ErrorMessage& rhs) const {
  return errorCode == rhs.errorCode;
}

MigrationPacket::MigrationPacket(int64_t requestId, MigrationMessage message)
    : requestId(requestId), message(std::move(message)) {}

bool MigrationPacket::operator==(const MigrationPacket& rhs) const {
  return requestId == rhs.requestId && message == rhs.message;
}

bool SchemaKey::operator==(const SchemaKey& rhs) const {
  return schemaId == rhs.schemaId && schemaVersion == rhs.schemaVersion;
}

bool SchemaKey::operator!=(const SchemaKey& rhs) const {
  return !(rhs == *this);
}

SchemaKey schemaKeyForType(MigrationMessage::Type type) {
  switch (type) {
    case MigrationMessage::Type::QueryStatsMessage:
      return {Uuid(0x4b201b06795243a4, 0x815796b9aeffa667), kSchemaVersion};
    case MigrationMessage::Type::OnQueryStatsMessage:
      return {Uuid(0x0906f8836adf4d90, 0x92529ab401fbe531), kSchemaVersion};
    case MigrationMessage::Type::StartMessage:
      return {Uuid(0x8a26fefe6bd545e2, 0x90983d736d8a1c4e), kSchemaVersion};
    case MigrationMessage::Type::ListFilesMessage:
      return {Uuid(0x5964dbf056204c78, 0x963bc6e08665fc33), kSchemaVersion};
    case MigrationMessage::Type::OnListFilesMessage:
      return {Uuid(0xe74fea73abc742ca, 0xad37b636f6c4df2b), kSchemaVersion};
    case MigrationMessage::Type::PutFileMessage:
      return {Uuid(0xccc791c23a5c4d83, 0xab0648137a4ad262), kSchemaVersion};
    case MigrationMessage::Type::OnPutFileMessage:
      return {Uuid(0xef7b3c0333d549c2, 0x864479ea2688403e), kSchemaVersion};
    case MigrationMessage::Type::SettingsMessage:
      return {Uuid(0x09557d033af74151, 0xaa60c6a4b992e18b), kSchemaVersion};
    case MigrationMessage::Type::AccountMessage:
      return {Uuid(0x11161f6668e94cb4, 0x8c12241f4e071af4), kSchemaVersion};
    case MigrationMessage::Type::TerminateMigrationMessage:
      return {Uuid(0xa35089f8326f4f25, 0xb160e0f9f2c9795c), kSchemaVersion};
    case MigrationMessage::Type::ShutdownMessage:
      return {Uuid(0x05c90756d56c4e2f, 0x92bf36b2d3f31b76), kSchemaVersion};
    case MigrationMessage::Type::ErrorMessage:
      return {Uuid(0x427055748e0547fd, 0x9742ffd86a923cea), kSchemaVersion};
  }
  folly::assume_unreachable();
}

folly::Optional<MigrationMessage::Type> messageTypeForSchema(
    const SchemaKey& key) {
  for (auto type : kAllMessageTypes) {
    if (schemaKeyForType(type) == key) {
      return type;
    }
  }
  return folly::none;
}

folly::StringPiece messageTypeToString(MigrationMessage::Type type) {
  switch (type) { MIGRATION_MESSAGE(MESSAGE_TYPE_CASES) }
  folly::assume_unreachable();
}

} // namespace migration
