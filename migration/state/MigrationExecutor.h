#pragma once

#include <folly/io/async/EventBase.h>
#include <migration/MigrationException.h>
#include <migration/MigrationSettings.h>
#include <migration/commit/CommitCoordinator.h>
#include <migration/management/AccountHost.h>
#include <migration/management/Callbacks.h>
#include <migration/state/MigrationSession.h>
#include <migration/storage/FileSystem.h>
#include <migration/storage/SecureStore.h>
#include <migration/storage/SettingsStore.h>
#include <migration/storage/StagingArea.h>
#include <migration/transfer/FileTransferEngine.h>
#include <migration/transport/MigrationTransport.h>
#include <memory>

namespace migration {

/**
 * Services of the host application used by a session. They must outlive
 * the executor.
 */
struct MigrationEnvironment {
  FileSystem& fileSystem;
  SecureStore& secureStore;
  SettingsStore& settingsStore;
  AccountHost& accountHost;
  CommitCoordinator& committer;
};

/**
 * Drives one migration session between two devices.
 *
 * After the negotiation (queryStats and startMigration), both endpoints
 * run the same sequence: list and send the application files, exchange
 * the settings, send the database, wait for the peer files, then exchange
 * the account. The session then waits for the application to terminate
 * it with terminateMigration() and shutdownMigration(); the staged data is
 * committed when the channel is closed in the TERMINATED state.
 *
 * Everything runs on the worker EventBase. The public methods can be
 * called from any thread: they run on the worker and wait for the result.
 * The executor must be destroyed on the worker thread, or once its
 * EventBase stopped looping.
 */
class MigrationExecutor : public MigrationTransportCallback {
 public:
  /**
   * @param evb          the worker EventBase.
   * @param channel      the channel to the peer.
   * @param migrationId  the id of the session.
   * @param settings     the protocol settings.
   * @param staging      the on-disk layout of the account.
   * @param environment  the services of the host application.
   * @param observer     the observer of the session, can be null.
   */
  MigrationExecutor(
      folly::EventBase* evb,
      std::unique_ptr<DataChannel> channel,
      const Uuid& migrationId,
      MigrationSettings settings,
      StagingArea staging,
      MigrationEnvironment environment,
      MigrationObserver* observer);

  ~MigrationExecutor() override;

  MigrationExecutor(const MigrationExecutor&) = delete;
  MigrationExecutor& operator=(const MigrationExecutor&) = delete;

  /**
   * Writes the migration-id marker, scans the local files and connects
   * to the peer. This endpoint reconnects after a disconnection.
   */
  void startOutgoingConnection();

  /**
   * Same as startOutgoingConnection() but waits for the peer to connect.
   */
  void startIncomingConnection();

  /**
   * Asks the peer for its statistics. The peer answers and asks for ours;
   * the observer is notified once both are known.
   * @param maxFileSize  the size above which files are not transferred.
   * @return             false if the channel is not open.
   */
  bool queryStats(int64_t maxFileSize);

  /**
   * Starts the transfer as initiator, after checking that the peer can
   * hold the data. A failed check moves the session to ERROR.
   * @param maxFileSize  the size above which files are not transferred.
   * @return             false if the check failed or the channel is not
   *                     open.
   */
  bool startMigration(int64_t maxFileSize);

  /**
   * Asks the peer to terminate the migration. A rollback also cancels the
   * local session.
   * @param commit  true to commit, false to roll back.
   * @param done    true if this endpoint completed its side.
   * @return        false if a commit is requested before the account was
   *                exchanged in both directions, or if the channel is not
   *                open.
   */
  bool terminateMigration(bool commit, bool done);

  /**
   * Starts the shutdown handshake: the peer answers with the final
   * shutdown, then both endpoints close the channel and commit.
   * @return  false if the migration cannot be terminated yet.
   */
  bool shutdownMigration();

  /**
   * Cancels the session and discards the staged data. It has no effect
   * once the session is stopped.
   */
  void cancel();

  void setOnline(bool online);

  MigrationState getState() const;

  MigrationStatus getStatus() const;

  const Uuid& getMigrationId() const;

  bool canTerminate() const;

  // MigrationTransportCallback
  void onTransportOpen() noexcept override;

  void onTransportPacket(MigrationPacket packet) noexcept override;

  void onTransportClosed(TerminateReason reason) noexcept override;

  void onTransportTimeout() noexcept override;

 private:
  void initialize();

  void processPacket(MigrationPacket& packet);

  void processQueryStats(int64_t requestId, const QueryStatsMessage& message);

  void processOnQueryStats(
      int64_t requestId,
      const OnQueryStatsMessage& message);

  void processStart(int64_t requestId, const StartMessage& message);

  void processListFiles(int64_t requestId, const ListFilesMessage& message);

  void processOnListFiles(
      int64_t requestId,
      const OnListFilesMessage& message);

  void processPutFile(int64_t requestId, const PutFileMessage& message);

  void processOnPutFile(int64_t requestId, const OnPutFileMessage& message);

  void processSettings(int64_t requestId, const SettingsMessage& message);

  void processAccount(int64_t requestId, const AccountMessage& message);

  void processTerminateMigration(
      int64_t requestId,
      const TerminateMigrationMessage& message);

  void processShutdown(int64_t requestId, const ShutdownMessage& message);

  void processError(const ErrorMessage& message);

  /**
   * Sends as many requests as the window allows for the current state,
   * and moves to the next state when a step is complete.
   */
  void processMigration();

  void sendSettings();

  /**
   * Builds the account sent to the peer. Throws a MigrationException with
   * SECURE_STORE_ERROR if the account cannot be exported.
   */
  AccountMessage buildAccount();

  bool sendReply(int64_t requestId, MigrationMessage message);

  void sendError(int64_t requestId, ErrorCode errorCode);

  /**
   * Reports a protocol failure to the peer and moves the session to ERROR.
   * @param ex         the failure.
   * @param requestId  the request that failed, if any.
   */
  void failSession(
      const MigrationException& ex,
      folly::Optional<int64_t> requestId);

  /**
   * Runs a handler on the worker, turning the exceptions it raises into
   * a session failure or a dropped event.
   */
  template <typename F>
  void runProtected(folly::Optional<int64_t> requestId, F&& func);

  template <typename F>
  void runOnWorker(F&& func) const;

  void setState(MigrationState state);

  void reportProgress();

  void reportProgressThrottled();

  void stop(TerminateReason reason);

  void cancelSession();

  void cleanup();

  folly::EventBase* evb_;
  MigrationSettings settings_;
  StagingArea staging_;
  MigrationEnvironment environment_;
  MigrationObserver* observer_;

  MigrationSession session_;
  FileTransferEngine engine_;
  std::unique_ptr<MigrationTransport> transport_;

  folly::Optional<int64_t> accountRequestId_;
  bool initialized_{false};
};

} // namespace migration
