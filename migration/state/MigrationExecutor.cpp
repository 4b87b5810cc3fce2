#include <migration/state/MigrationExecutor.h>

#include <glog/logging.h>
#include <migration/codec/MessageCodec.h>
#include <migration/state/MigrationStateFunctions.h>
#include <migration/storage/MarkerFile.h>
#include <system_error>

namespace migration {

MigrationExecutor::MigrationExecutor(
    folly::EventBase* evb,
    std::unique_ptr<DataChannel> channel,
    const Uuid& migrationId,
    MigrationSettings settings,
    StagingArea staging,
    MigrationEnvironment environment,
    MigrationObserver* observer)
    : evb_(evb),
      settings_(std::move(settings)),
      staging_(std::move(staging)),
      environment_(environment),
      observer_(observer),
      session_(migrationId),
      engine_(environment_.fileSystem, staging_, settings_, session_.counters) {
  validateMigrationSettings(settings_);
  transport_ =
      std::make_unique<MigrationTransport>(evb_, std::move(channel), settings_);
  transport_->setCallback(this);
}

MigrationExecutor::~MigrationExecutor() {
  transport_->setCallback(nullptr);
}

template <typename F>
void MigrationExecutor::runProtected(
    folly::Optional<int64_t> requestId,
    F&& func) {
  try {
    func();
  } catch (const MigrationException& ex) {
    failSession(ex, requestId);
  } catch (const MigrationInternalException& ex) {
    LOG(ERROR) << "Migration " << uuidToString(session_.migrationId) << " in "
               << migrationStateToString(session_.state) << ": " << ex.what();
  }
}

template <typename F>
void MigrationExecutor::runOnWorker(F&& func) const {
  evb_->runImmediatelyOrRunInEventBaseThreadAndWait(std::forward<F>(func));
}

void MigrationExecutor::initialize() {
  if (initialized_) {
    return;
  }
  initialized_ = true;
  auto& fileSystem = environment_.fileSystem;
  if (!fileSystem.createDirectories(staging_.stagingDirectory())) {
    LOG(ERROR) << "Cannot create " << staging_.stagingDirectory();
  }
  try {
    writeMigrationIdMarker(
        fileSystem, staging_.migrationIdMarkerPath(), session_.migrationId);
  } catch (const MigrationInternalException& ex) {
    LOG(ERROR) << "Cannot write the migration id: " << ex.what();
    session_.counters.receiveErrorCount++;
  }
  engine_.scanFiles();
}

void MigrationExecutor::startOutgoingConnection() {
  runOnWorker([this] {
    initialize();
    transport_->startOutgoing();
  });
}

void MigrationExecutor::startIncomingConnection() {
  runOnWorker([this] {
    initialize();
    transport_->startIncoming();
  });
}

bool MigrationExecutor::queryStats(int64_t maxFileSize) {
  bool result = false;
  runOnWorker([&] {
    result = transport_->sendPacket(MigrationPacket(
        transport_->newRequestId(), QueryStatsMessage{maxFileSize}));
  });
  return result;
}

bool MigrationExecutor::startMigration(int64_t maxFileSize) {
  bool result = false;
  runOnWorker([&] {
    if (session_.state != MigrationState::NEGOTIATE ||
        !transport_->isConnected()) {
      LOG(WARNING) << "Cannot start the migration in state "
                   << migrationStateToString(session_.state);
      return;
    }
    transport_->assignRole(MigrationRole::INITIATOR);
    runProtected(folly::none, [&] {
      checkPeerCapacity(session_.peerInfo);
      initializeTransferTotals(session_);
      engine_.setMaxFileSize(maxFileSize);
      result = transport_->sendPacket(MigrationPacket(
          transport_->newRequestId(), StartMessage{maxFileSize}));
    });
  });
  return result;
}

bool MigrationExecutor::terminateMigration(bool commit, bool done) {
  bool result = false;
  runOnWorker([&] {
    if (commit && !migration::canTerminate(session_)) {
      LOG(WARNING) << "Cannot terminate the migration in state "
                   << migrationStateToString(session_.state);
      return;
    }
    result = transport_->sendPacket(MigrationPacket(
        transport_->newRequestId(), TerminateMigrationMessage{commit, done}));
    if (!commit) {
      runProtected(folly::none, [&] { cancelSession(); });
    }
  });
  return result;
}

bool MigrationExecutor::shutdownMigration() {
  bool result = false;
  runOnWorker([&] {
    if (!migration::canTerminate(session_) &&
        session_.state != MigrationState::TERMINATED) {
      LOG(WARNING) << "Cannot shut down the migration in state "
                   << migrationStateToString(session_.state);
      return;
    }
    result = transport_->sendPacket(
        MigrationPacket(transport_->newRequestId(), ShutdownMessage{false}));
  });
  return result;
}

void MigrationExecutor::cancel() {
  runOnWorker([this] { runProtected(folly::none, [this] { cancelSession(); }); });
}

void MigrationExecutor::setOnline(bool online) {
  runOnWorker([this, online] { transport_->setOnline(online); });
}

MigrationState MigrationExecutor::getState() const {
  MigrationState state;
  runOnWorker([&] { state = session_.state; });
  return state;
}

MigrationStatus MigrationExecutor::getStatus() const {
  MigrationStatus status;
  runOnWorker([&] {
    status = computeMigrationStatus(session_, transport_->isConnected());
  });
  return status;
}

const Uuid& MigrationExecutor::getMigrationId() const {
  return session_.migrationId;
}

bool MigrationExecutor::canTerminate() const {
  bool result = false;
  runOnWorker([&] { result = migration::canTerminate(session_); });
  return result;
}

void MigrationExecutor::onTransportOpen() noexcept {
  runProtected(folly::none, [this] {
    auto state = session_.state;
    if (state == MigrationState::STARTING) {
      setState(MigrationState::NEGOTIATE);
    } else if (
        session_.needRestart && !isFinalState(state) &&
        state != MigrationState::NEGOTIATE) {
      VLOG(3) << "Restarting the transfer from "
              << migrationStateToString(state);
      resetSessionForRestart(session_);
      if (state == MigrationState::LIST_FILES) {
        reportProgress();
      } else {
        setState(MigrationState::LIST_FILES);
      }
    } else {
      reportProgress();
    }
    processMigration();
  });
}

void MigrationExecutor::onTransportPacket(MigrationPacket packet) noexcept {
  auto type = packet.message.type();
  if (!acceptsMessage(session_.state, type)) {
    LOG(WARNING) << "Dropping " << messageTypeToString(type) << " in state "
                 << migrationStateToString(session_.state);
    return;
  }
  runProtected(packet.requestId, [&] {
    processPacket(packet);
    processMigration();
  });
}

void MigrationExecutor::onTransportClosed(TerminateReason reason) noexcept {
  runProtected(folly::none, [this, reason] {
    if (reason == TerminateReason::REVOKED) {
      session_.currentError = ErrorCode::REVOKED;
    } else if (reason == TerminateReason::NOT_AUTHORIZED) {
      session_.currentError = ErrorCode::BAD_PEER_VERSION;
    }
    if (session_.state == MigrationState::STOPPED) {
      return;
    }
    reportProgress();
    if (session_.state == MigrationState::TERMINATED) {
      stop(reason);
      return;
    }
    switch (reason) {
      case TerminateReason::REVOKED:
      case TerminateReason::DECLINE:
      case TerminateReason::CANCEL:
      case TerminateReason::NOT_AUTHORIZED:
        cancelSession();
        return;
      default:
        break;
    }
    if (session_.state == MigrationState::CANCELED) {
      cancelSession();
      return;
    }
    // Keep the session: the transfer resumes from the files on disk when
    // the channel is opened again.
    cleanup();
    engine_.scanFiles();
  });
}

void MigrationExecutor::onTransportTimeout() noexcept {
  reportProgress();
}

void MigrationExecutor::processPacket(MigrationPacket& packet) {
  auto requestId = packet.requestId;
  auto& message = packet.message;
  switch (message.type()) {
    case MigrationMessage::Type::QueryStatsMessage:
      processQueryStats(requestId, *message.asQueryStatsMessage());
      break;
    case MigrationMessage::Type::OnQueryStatsMessage:
      processOnQueryStats(requestId, *message.asOnQueryStatsMessage());
      break;
    case MigrationMessage::Type::StartMessage:
      processStart(requestId, *message.asStartMessage());
      break;
    case MigrationMessage::Type::ListFilesMessage:
      processListFiles(requestId, *message.asListFilesMessage());
      break;
    case MigrationMessage::Type::OnListFilesMessage:
      processOnListFiles(requestId, *message.asOnListFilesMessage());
      break;
    case MigrationMessage::Type::PutFileMessage:
      processPutFile(requestId, *message.asPutFileMessage());
      break;
    case MigrationMessage::Type::OnPutFileMessage:
      processOnPutFile(requestId, *message.asOnPutFileMessage());
      break;
    case MigrationMessage::Type::SettingsMessage:
      processSettings(requestId, *message.asSettingsMessage());
      break;
    case MigrationMessage::Type::AccountMessage:
      processAccount(requestId, *message.asAccountMessage());
      break;
    case MigrationMessage::Type::TerminateMigrationMessage:
      processTerminateMigration(
          requestId, *message.asTerminateMigrationMessage());
      break;
    case MigrationMessage::Type::ShutdownMessage:
      processShutdown(requestId, *message.asShutdownMessage());
      break;
    case MigrationMessage::Type::ErrorMessage:
      processError(*message.asErrorMessage());
      break;
  }
}

void MigrationExecutor::processQueryStats(
    int64_t requestId,
    const QueryStatsMessage& message) {
  session_.localInfo = engine_.computeQueryInfo(message.maxFileSize);
  sendReply(requestId, OnQueryStatsMessage{*session_.localInfo});
  if (!session_.peerInfo) {
    transport_->sendPacket(MigrationPacket(
        transport_->newRequestId(), QueryStatsMessage{message.maxFileSize}));
  } else if (observer_) {
    observer_->onQueryStats(requestId, *session_.peerInfo, session_.localInfo);
  }
}

void MigrationExecutor::processOnQueryStats(
    int64_t requestId,
    const OnQueryStatsMessage& message) {
  session_.peerInfo = message.queryInfo;
  if (observer_) {
    observer_->onQueryStats(requestId, *session_.peerInfo, session_.localInfo);
  }
}

void MigrationExecutor::processStart(
    int64_t requestId,
    const StartMessage& message) {
  if (message.maxFileSize < 0) {
    throw MigrationException(
        "Invalid maximum file size", ErrorCode::INTERNAL_ERROR);
  }
  transport_->assignRole(MigrationRole::RESPONDER);
  if (session_.state == MigrationState::NEGOTIATE &&
      transport_->getRole() == MigrationRole::RESPONDER) {
    checkPeerCapacity(session_.peerInfo);
    sendReply(requestId, StartMessage{message.maxFileSize});
  }
  initializeTransferTotals(session_);
  setState(MigrationState::LIST_FILES);
  engine_.setMaxFileSize(message.maxFileSize);
}

void MigrationExecutor::processListFiles(
    int64_t requestId,
    const ListFilesMessage& message) {
  if (session_.state == MigrationState::NEGOTIATE) {
    setState(MigrationState::LIST_FILES);
  }
  sendReply(
      requestId, OnListFilesMessage{engine_.onFileListReceived(message.files)});
}

void MigrationExecutor::processOnListFiles(
    int64_t requestId,
    const OnListFilesMessage& message) {
  transport_->completeRequest(requestId);
  engine_.onFileListAcknowledged(message.files);
}

void MigrationExecutor::processPutFile(
    int64_t requestId,
    const PutFileMessage& message) {
  auto result = engine_.onChunkReceived(message);
  if (result.ioError) {
    sendError(requestId, ErrorCode::IO_ERROR);
  }
  sendReply(requestId, OnPutFileMessage{message.fileId, result.offset});
  reportProgressThrottled();
}

void MigrationExecutor::processOnPutFile(
    int64_t requestId,
    const OnPutFileMessage& message) {
  transport_->completeRequest(requestId);
  engine_.onChunkAcknowledged(message.fileId, message.offset);
  reportProgressThrottled();
}

void MigrationExecutor::processSettings(
    int64_t requestId,
    const SettingsMessage& message) {
  auto& fileSystem = environment_.fileSystem;
  auto path = staging_.stagedSettingsPath();
  bool stored = fileSystem.createDirectories(staging_.stagingDirectory());
  if (stored) {
    try {
      auto data = encodePacket(
          MigrationPacket(requestId, message), UuidEncoding::COMPACT);
      fileSystem.writeFileAtomic(path, data->coalesce());
    } catch (const std::system_error& ex) {
      LOG(ERROR) << "Cannot store the settings: " << ex.what();
      stored = false;
    }
  }
  if (!stored) {
    fileSystem.removeFile(path);
    session_.counters.receiveErrorCount++;
    sendError(requestId, ErrorCode::IO_ERROR);
    return;
  }

  if (transport_->completeRequest(requestId)) {
    session_.settingsSent = true;
  }
  session_.settingsReceived = true;
  if (!message.hasPeerSettings) {
    sendReply(
        requestId,
        SettingsMessage{true, environment_.settingsStore.exportSettings()});
    session_.settingsSent = true;
  }
}

void MigrationExecutor::processAccount(
    int64_t requestId,
    const AccountMessage& message) {
  bool answersRequest = transport_->completeRequest(requestId);
  auto& secureStore = environment_.secureStore;
  if (!secureStore.set(
          StagingArea::stagingKey(kSecuredConfigurationKey),
          message.securedConfiguration) ||
      !secureStore.set(
          StagingArea::stagingKey(kAccountConfigurationKey),
          message.accountConfiguration)) {
    LOG(ERROR) << "Cannot stage the peer account";
    session_.counters.receiveErrorCount++;
    sendError(requestId, ErrorCode::SECURE_STORE_ERROR);
    return;
  }
  if (message.hasPeerAccount && accountRequestId_) {
    transport_->completeRequest(*accountRequestId_);
  }
  if (!answersRequest && session_.state == MigrationState::WAIT_ACCOUNT) {
    auto account = buildAccount();
    account.hasPeerAccount = true;
    sendReply(requestId, std::move(account));
  }
  if (onAccountExchanged(session_, answersRequest, message.hasPeerAccount)) {
    reportProgress();
  }
}

void MigrationExecutor::processTerminateMigration(
    int64_t requestId,
    const TerminateMigrationMessage& message) {
  if (!message.commit) {
    VLOG(3) << "Peer rolled back the migration";
    cancelSession();
    return;
  }
  if (!migration::canTerminate(session_)) {
    LOG(WARNING) << "Ignoring terminate in state "
                 << migrationStateToString(session_.state);
    return;
  }
  if (observer_) {
    observer_->onTerminateMigration(
        requestId, session_.migrationId, true, message.done);
  }
}

void MigrationExecutor::processShutdown(
    int64_t requestId,
    const ShutdownMessage& message) {
  if (!migration::canTerminate(session_) &&
      session_.state != MigrationState::TERMINATED) {
    LOG(WARNING) << "Ignoring shutdown in state "
                 << migrationStateToString(session_.state);
    return;
  }
  if (!message.close) {
    sendReply(requestId, ShutdownMessage{true});
  }
  if (session_.state != MigrationState::TERMINATED) {
    environment_.accountHost.clearPushNotificationToken();
    setState(MigrationState::TERMINATED);
  }
  if (message.close) {
    transport_->closeConnection();
  }
}

void MigrationExecutor::processError(const ErrorMessage& message) {
  if (message.errorCode == ErrorCode::IO_ERROR) {
    LOG(WARNING) << "Peer failed to write a file";
    return;
  }
  LOG(ERROR) << "Peer reported " << errorCodeToString(message.errorCode);
  session_.currentError = message.errorCode;
  if (isValidTransition(session_.state, MigrationState::ERROR)) {
    setState(MigrationState::ERROR);
  }
}

void MigrationExecutor::processMigration() {
  while (transport_->isConnected() &&
         transport_->pendingRequestCount() < settings_.maxPendingRequests) {
    switch (session_.state) {
      case MigrationState::LIST_FILES: {
        auto files = engine_.nextFileList();
        if (files) {
          transport_->sendRequest(ListFilesMessage{std::move(*files)});
        } else {
          setState(MigrationState::SEND_FILES);
        }
        break;
      }

      case MigrationState::SEND_FILES: {
        auto chunk = engine_.nextChunk();
        if (chunk) {
          transport_->sendRequest(std::move(*chunk));
        } else if (
            engine_.hasFilesWaitingList() || engine_.hasFilesToSend() ||
            engine_.hasFilesWaitingAck()) {
          return;
        } else {
          setState(MigrationState::SEND_SETTINGS);
        }
        break;
      }

      case MigrationState::SEND_SETTINGS: {
        sendSettings();
        setState(MigrationState::SEND_DATABASE);
        // Flush the database before its size is announced.
        environment_.accountHost.syncDatabase();
        engine_.addDatabaseRecord();
        auto files = engine_.nextFileList();
        if (files) {
          transport_->sendRequest(ListFilesMessage{std::move(*files)});
        }
        break;
      }

      case MigrationState::SEND_DATABASE: {
        auto chunk = engine_.nextChunk();
        if (chunk) {
          transport_->sendRequest(std::move(*chunk));
        } else {
          setState(MigrationState::WAIT_FILES);
        }
        break;
      }

      case MigrationState::WAIT_FILES: {
        if (engine_.hasFilesWaitingList()) {
          return;
        } else if (engine_.hasFilesToSend()) {
          setState(MigrationState::SEND_DATABASE);
        } else if (
            engine_.hasFilesWaitingAck() || engine_.hasFilesToReceive()) {
          return;
        } else {
          setState(MigrationState::SEND_ACCOUNT);
        }
        break;
      }

      case MigrationState::SEND_ACCOUNT: {
        accountRequestId_ = transport_->sendRequest(buildAccount());
        setState(MigrationState::WAIT_ACCOUNT);
        return;
      }

      default:
        return;
    }
  }
}

void MigrationExecutor::sendSettings() {
  if (session_.settingsSent) {
    return;
  }
  SettingsMessage message{
      session_.settingsReceived, environment_.settingsStore.exportSettings()};
  if (session_.settingsReceived) {
    // The peer does not answer once it sent its own settings.
    transport_->sendPacket(
        MigrationPacket(transport_->newRequestId(), std::move(message)));
    session_.settingsSent = true;
  } else {
    transport_->sendRequest(std::move(message));
  }
}

AccountMessage MigrationExecutor::buildAccount() {
  auto secured = environment_.secureStore.get(kSecuredConfigurationKey);
  if (!secured) {
    throw MigrationException(
        "No secured configuration", ErrorCode::SECURE_STORE_ERROR);
  }
  auto account = environment_.accountHost.exportAccount(
      transport_->getNegotiator().accountSchemaVersion());
  if (!account) {
    throw MigrationException(
        "Account cannot be exported", ErrorCode::SECURE_STORE_ERROR);
  }
  AccountMessage message;
  message.securedConfiguration = std::move(*secured);
  message.accountConfiguration = std::move(*account);
  message.hasPeerAccount = session_.accountReceived;
  return message;
}

bool MigrationExecutor::sendReply(int64_t requestId, MigrationMessage message) {
  return transport_->sendPacket(MigrationPacket(requestId, std::move(message)));
}

void MigrationExecutor::sendError(int64_t requestId, ErrorCode errorCode) {
  session_.currentError = errorCode;
  sendReply(requestId, ErrorMessage{errorCode});
}

void MigrationExecutor::failSession(
    const MigrationException& ex,
    folly::Optional<int64_t> requestId) {
  LOG(ERROR) << "Migration " << uuidToString(session_.migrationId)
             << " failed: " << ex.what();
  sendError(
      requestId ? *requestId : transport_->newRequestId(), ex.errorCode());
  if (isValidTransition(session_.state, MigrationState::ERROR)) {
    setState(MigrationState::ERROR);
  }
}

void MigrationExecutor::setState(MigrationState state) {
  if (!updateSessionState(session_, state)) {
    return;
  }
  if (isFinalState(state)) {
    transport_->stopReconnecting();
  }
  if (state == MigrationState::TERMINATED) {
    try {
      writeMigrationDoneMarker(
          environment_.fileSystem, staging_.migrationDoneMarkerPath());
    } catch (const MigrationInternalException& ex) {
      LOG(ERROR) << "Cannot write the migration done marker: " << ex.what();
    }
  }
  reportProgress();
}

void MigrationExecutor::reportProgress() {
  session_.lastReport = std::chrono::steady_clock::now();
  if (observer_) {
    observer_->onStatusChange(
        session_.migrationId,
        computeMigrationStatus(session_, transport_->isConnected()));
  }
}

void MigrationExecutor::reportProgressThrottled() {
  auto now = std::chrono::steady_clock::now();
  if (now - session_.lastReport >= settings_.progressReportInterval) {
    reportProgress();
  }
}

void MigrationExecutor::stop(TerminateReason reason) {
  if (session_.state == MigrationState::STOPPED) {
    return;
  }
  bool commit = reason != TerminateReason::CANCEL &&
      session_.state == MigrationState::TERMINATED;
  if (commit) {
    if (environment_.committer.commit()) {
      LOG(INFO) << "Migration " << uuidToString(session_.migrationId)
                << " committed";
    } else {
      LOG(ERROR) << "Migration " << uuidToString(session_.migrationId)
                 << " could not be committed";
      session_.currentError = ErrorCode::INTERNAL_ERROR;
    }
  }
  transport_->finish();
  setState(MigrationState::STOPPED);
  cleanup();
}

void MigrationExecutor::cancelSession() {
  if (session_.state == MigrationState::STOPPED) {
    return;
  }
  setState(MigrationState::CANCELED);
  environment_.committer.cancel();
  stop(TerminateReason::CANCEL);
}

void MigrationExecutor::cleanup() {
  engine_.clear();
  session_.needRestart = true;
}

} // namespace migration
