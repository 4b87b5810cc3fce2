#pragma once

#include <folly/Optional.h>
#include <migration/codec/CodecTypes.h>

namespace migration {

/**
 * Operations on the live account provided by the host application.
 * They are invoked on the session worker and must not block for long.
 */
class AccountHost {
 public:
  virtual ~AccountHost() = default;

  /**
   * Exports the account credentials in the given schema version.
   * @param schemaVersion  the account schema version understood by the peer.
   * @return               the exported blob, or none if there is no account.
   */
  virtual folly::Optional<Bytes> exportAccount(int32_t schemaVersion) = 0;

  /**
   * Signs out of the current account before the migrated one is installed.
   */
  virtual void signOut() = 0;

  virtual void clearPushNotificationToken() = 0;

  /**
   * Flushes the live database so that its file can be copied.
   */
  virtual void syncDatabase() = 0;
};

} // namespace migration
