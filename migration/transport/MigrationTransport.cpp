#include <migration/transport/MigrationTransport.h>

#include <glog/logging.h>
#include <migration/MigrationException.h>
#include <migration/codec/MessageCodec.h>

namespace migration {

MigrationTransport::MigrationTransport(
    folly::EventBase* evb,
    std::unique_ptr<DataChannel> channel,
    const MigrationSettings& settings)
    : evb_(evb),
      channel_(std::move(channel)),
      settings_(settings),
      negotiator_(settings.protocolVersion),
      livenessTimeout_(this, &MigrationTransport::onLivenessTimeout),
      connectTimeout_(this, &MigrationTransport::onConnectTimeout),
      reconnectTimeout_(this, &MigrationTransport::onReconnectTimeout),
      closeTimeout_(this, &MigrationTransport::onCloseTimeout),
      aliveToken_(std::make_shared<bool>(true)) {
  if (!evb_ || !channel_) {
    throw MigrationInternalException(
        "Migration transport requires an EventBase and a channel",
        LocalErrorCode::INVALID_ARGUMENT);
  }
  channel_->setCallback(this);
}

MigrationTransport::~MigrationTransport() {
  aliveToken_.reset();
  channel_->setCallback(nullptr);
}

template <typename F>
void MigrationTransport::runInWorker(F&& func) {
  std::weak_ptr<bool> token = aliveToken_;
  evb_->runInEventBaseThread(
      [this, token, func = std::forward<F>(func)]() mutable {
        if (token.expired()) {
          return;
        }
        func();
      });
}

void MigrationTransport::setCallback(MigrationTransportCallback* callback) {
  callback_ = callback;
}

folly::EventBase* MigrationTransport::getEventBase() const {
  return evb_;
}

void MigrationTransport::startOutgoing() {
  outgoing_ = true;
  if (!role_) {
    requestIdOffset_ = kRequestIdOffsetOutgoing;
  }
  connectNow();
}

void MigrationTransport::startIncoming() {
  if (finished_) {
    return;
  }
  if (!role_) {
    requestIdOffset_ = kRequestIdOffsetIncoming;
  }
  VLOG(3) << "Accepting incoming connection";
  channel_->accept(negotiator_.getLocalVersionString());
}

void MigrationTransport::connectNow() {
  reconnectTimeout_.cancelTimeout();
  connectTimeout_.cancelTimeout();
  if (finished_ || !online_ || !reconnect_) {
    VLOG(3) << "Not connecting: finished=" << finished_
            << " online=" << online_ << " reconnect=" << reconnect_;
    return;
  }
  VLOG(3) << "Starting outgoing connection";
  evb_->timer().scheduleTimeout(&connectTimeout_, settings_.connectTimeout);
  channel_->connect(negotiator_.getLocalVersionString());
}

void MigrationTransport::assignRole(MigrationRole role) {
  if (role_) {
    return;
  }
  role_ = role;
  requestIdOffset_ = role == MigrationRole::INITIATOR
      ? kRequestIdOffsetInitiator
      : kRequestIdOffsetResponder;
  VLOG(3) << "Endpoint is " << migrationRoleToString(role);
}

const folly::Optional<MigrationRole>& MigrationTransport::getRole() const {
  return role_;
}

int64_t MigrationTransport::newRequestId() {
  return requestIdOffset_ + nextRequestId_++;
}

int64_t MigrationTransport::sendRequest(MigrationMessage message) {
  auto requestId = newRequestId();
  pendingRequests_.insert(requestId);
  if (!livenessTimeout_.isScheduled()) {
    evb_->timer().scheduleTimeout(&livenessTimeout_, settings_.requestTimeout);
  }
  livenessExpired_ = false;
  sendPacket(MigrationPacket(requestId, std::move(message)));
  return requestId;
}

bool MigrationTransport::sendPacket(const MigrationPacket& packet) {
  if (!connected_) {
    LOG(WARNING) << "Cannot send "
                 << messageTypeToString(packet.message.type())
                 << ": no connection";
    return false;
  }
  VLOG(4) << "Sending " << messageTypeToString(packet.message.type())
          << " requestId=" << packet.requestId;
  if (!leadingPadding_) {
    return channel_->send(encodePacket(packet, UuidEncoding::COMPACT));
  }
  auto frames = segmentMessage(
      encodePacket(packet, UuidEncoding::LEGACY, 1), settings_.maxFrameSize);
  for (auto& frame : frames) {
    if (!channel_->send(std::move(frame))) {
      return false;
    }
  }
  return true;
}

bool MigrationTransport::completeRequest(int64_t requestId) {
  return pendingRequests_.erase(requestId) > 0;
}

bool MigrationTransport::isPendingRequest(int64_t requestId) const {
  return pendingRequests_.count(requestId) > 0;
}

size_t MigrationTransport::pendingRequestCount() const {
  return pendingRequests_.size();
}

bool MigrationTransport::isConnected() const {
  return connected_;
}

bool MigrationTransport::usesSegmentedFraming() const {
  return leadingPadding_;
}

void MigrationTransport::setOnline(bool online) {
  online_ = online;
  if (!online_) {
    reconnectTimeout_.cancelTimeout();
    return;
  }
  if (outgoing_ && !connected_ && !connectTimeout_.isScheduled()) {
    connectNow();
  }
}

bool MigrationTransport::isOnline() const {
  return online_;
}

void MigrationTransport::stopReconnecting() {
  reconnect_ = false;
  reconnectTimeout_.cancelTimeout();
}

void MigrationTransport::closeConnection() {
  if (finished_ || closeTimeout_.isScheduled()) {
    return;
  }
  evb_->timer().scheduleTimeout(&closeTimeout_, settings_.closeDelay);
}

void MigrationTransport::finish() {
  if (finished_) {
    return;
  }
  finished_ = true;
  livenessTimeout_.cancelTimeout();
  connectTimeout_.cancelTimeout();
  reconnectTimeout_.cancelTimeout();
  closeTimeout_.cancelTimeout();
  pendingRequests_.clear();
  connected_ = false;
  reassembler_.reset();
  channel_->terminate(TerminateReason::CANCEL);
}

const ProtocolVersionNegotiator& MigrationTransport::getNegotiator() const {
  return negotiator_;
}

void MigrationTransport::onChannelOpen(
    std::string peerVersion,
    bool leadingPadding) noexcept {
  runInWorker([this, peerVersion = std::move(peerVersion), leadingPadding] {
    handleOpen(peerVersion, leadingPadding);
  });
}

void MigrationTransport::onChannelMessage(Buf frame) noexcept {
  runInWorker([this, frame = std::move(frame)]() mutable {
    handleMessage(std::move(frame));
  });
}

void MigrationTransport::onChannelClosed(TerminateReason reason) noexcept {
  runInWorker([this, reason] { handleClosed(reason); });
}

void MigrationTransport::handleOpen(
    const std::string& peerVersion,
    bool leadingPadding) {
  if (finished_) {
    return;
  }
  connectTimeout_.cancelTimeout();
  if (!negotiator_.onPeerVersionReceived(peerVersion)) {
    channel_->terminate(TerminateReason::NOT_AUTHORIZED);
    handleClosed(TerminateReason::NOT_AUTHORIZED);
    return;
  }
  VLOG(3) << "Channel open with peer version "
          << negotiator_.peerVersionToString()
          << " leadingPadding=" << leadingPadding;
  connected_ = true;
  leadingPadding_ = leadingPadding;
  reassembler_.reset();
  reconnectTimeout_.cancelTimeout();
  if (callback_) {
    callback_->onTransportOpen();
  }
}

void MigrationTransport::handleMessage(Buf frame) {
  if (finished_ || !connected_ || !frame) {
    VLOG(4) << "Dropping message received without connection";
    return;
  }

  folly::Expected<MigrationPacket, CodecError> packet =
      folly::makeUnexpected(CodecError::TRUNCATED);
  if (leadingPadding_) {
    auto result = reassembler_.onFrame(std::move(frame));
    switch (result.outcome) {
      case FrameReassembler::Outcome::INCOMPLETE:
        return;
      case FrameReassembler::Outcome::MALFORMED:
        LOG(WARNING) << "Dropping malformed frame";
        return;
      case FrameReassembler::Outcome::COMPLETE:
        packet = decodePacket(*result.message, UuidEncoding::LEGACY);
        break;
    }
  } else {
    packet = decodePacket(*frame, UuidEncoding::COMPACT);
  }

  if (packet.hasError()) {
    LOG(WARNING) << "Dropping packet: " << codecErrorToString(packet.error());
    return;
  }
  livenessExpired_ = false;
  VLOG(4) << "Received " << messageTypeToString(packet->message.type())
          << " requestId=" << packet->requestId;
  if (callback_) {
    callback_->onTransportPacket(std::move(packet.value()));
  }
}

void MigrationTransport::handleClosed(TerminateReason reason) {
  VLOG(3) << "Channel closed: " << terminateReasonToString(reason);
  connected_ = false;
  leadingPadding_ = false;
  reassembler_.reset();
  pendingRequests_.clear();
  livenessExpired_ = false;
  livenessTimeout_.cancelTimeout();
  connectTimeout_.cancelTimeout();
  reconnectTimeout_.cancelTimeout();
  closeTimeout_.cancelTimeout();
  negotiator_.reset();
  if (finished_) {
    return;
  }
  if (online_ && outgoing_ && reconnect_) {
    evb_->timer().scheduleTimeout(
        &reconnectTimeout_, settings_.reconnectDelay);
  }
  if (callback_) {
    callback_->onTransportClosed(reason);
  }
}

void MigrationTransport::onLivenessTimeout() {
  if (pendingRequests_.empty()) {
    livenessExpired_ = false;
    return;
  }
  if (livenessExpired_) {
    LOG(ERROR) << "Timeout on " << pendingRequests_.size()
               << " pending requests";
    closeConnection();
    return;
  }
  livenessExpired_ = true;
  evb_->timer().scheduleTimeout(&livenessTimeout_, settings_.requestTimeout);
}

void MigrationTransport::onConnectTimeout() {
  if (connected_ || finished_) {
    return;
  }
  LOG(WARNING) << "Timeout opening the channel";
  channel_->terminate(TerminateReason::TIMEOUT);
  handleClosed(TerminateReason::TIMEOUT);
  if (!finished_ && callback_) {
    callback_->onTransportTimeout();
  }
}

void MigrationTransport::onReconnectTimeout() {
  VLOG(3) << "Reconnecting";
  connectNow();
}

void MigrationTransport::onCloseTimeout() {
  if (!connected_) {
    return;
  }
  VLOG(3) << "Closing the channel";
  channel_->terminate(TerminateReason::SUCCESS);
  handleClosed(TerminateReason::SUCCESS);
}

} // namespace migration
