#include <migration/MigrationException.h>

namespace migration {

MigrationException::MigrationException(
    const std::string& errorMsg,
    ErrorCode errorCode)
    : std::runtime_error(errorMsg), errorCode_(errorCode) {}

MigrationInternalException::MigrationInternalException(
    const std::string& errorMsg,
    LocalErrorCode errorCode)
    : std::runtime_error(errorMsg), errorCode_(errorCode) {}

} // namespace migration
