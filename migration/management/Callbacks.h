#pragma once

#include <folly/Optional.h>
#include <migration/codec/Messages.h>
#include <migration/codec/Uuid.h>
#include <migration/state/MigrationSession.h>

namespace migration {

/**
 * Callbacks invoked when a migration session makes progress or needs a
 * decision from the application.
 * The callbacks are executed synchronously on the worker EventBase of the
 * session, thus their operations must not be blocking or heavyweight to
 * avoid freezing the transfer: if such operations are required, they must
 * be delegated to a separate dedicated thread. The callbacks must not
 * destroy the session.
 */
class MigrationObserver {
 public:
  virtual ~MigrationObserver() = default;

  /**
   * Called when the state of the session changes, and periodically while
   * files are transferred.
   * @param migrationId  the id of the session.
   * @param status       the progress of the session.
   */
  virtual void onStatusChange(
      const Uuid& /* migrationId */,
      const MigrationStatus& /* status */) noexcept {}

  /**
   * Called once the statistics of both endpoints are known, so that the
   * application can check the sizes before starting the migration.
   * @param requestId  the request that delivered the last statistics.
   * @param peerInfo   the statistics of the peer.
   * @param localInfo  the statistics of this endpoint, if they were
   *                   computed.
   */
  virtual void onQueryStats(
      int64_t /* requestId */,
      const QueryInfo& /* peerInfo */,
      const folly::Optional<QueryInfo>& /* localInfo */) noexcept {}

  /**
   * Called when the peer asks to terminate the migration with a commit.
   * It is only invoked once the account was exchanged in both directions.
   * @param requestId    the id of the request sent by the peer.
   * @param migrationId  the id of the session.
   * @param commit       always true: a rollback cancels the session.
   * @param done         true if the peer completed its side of the
   *                     termination.
   */
  virtual void onTerminateMigration(
      int64_t /* requestId */,
      const Uuid& /* migrationId */,
      bool /* commit */,
      bool /* done */) noexcept {}
};

} // namespace migration
