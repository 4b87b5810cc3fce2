#pragma once

#include <folly/Optional.h>
#include <folly/io/async/EventBase.h>
#include <folly/io/async/HHWheelTimer.h>
#include <migration/MigrationSettings.h>
#include <migration/codec/FrameAssembler.h>
#include <migration/codec/Messages.h>
#include <migration/transport/DataChannel.h>
#include <migration/transport/ProtocolVersion.h>
#include <memory>
#include <set>

namespace migration {

/**
 * Events delivered by a MigrationTransport. They are always invoked on the
 * worker EventBase of the transport.
 */
class MigrationTransportCallback {
 public:
  virtual ~MigrationTransportCallback() = default;

  /**
   * Called when the channel is open and the peer version was accepted.
   */
  virtual void onTransportOpen() noexcept = 0;

  /**
   * Called for every packet decoded from the channel.
   * @param packet  the packet.
   */
  virtual void onTransportPacket(MigrationPacket packet) noexcept = 0;

  /**
   * Called when the channel is closed, either by the peer or locally
   * because the peer version is not supported, the connection attempt
   * timed out or the pending requests were stuck.
   * @param reason  the reason of the closure.
   */
  virtual void onTransportClosed(TerminateReason reason) noexcept = 0;

  /**
   * Called when the channel could not be opened in time.
   */
  virtual void onTransportTimeout() noexcept = 0;
};

/**
 * Adapts a DataChannel to the migration protocol: version handshake,
 * packet framing, request identifiers, liveness of the pending requests
 * and reconnection.
 *
 * Channel events are handed off to the worker EventBase; every other
 * method must be called from that EventBase.
 */
class MigrationTransport : public DataChannelCallback {
 public:
  /**
   * @param evb       the worker EventBase.
   * @param channel   the channel to the peer.
   * @param settings  the timers and framing settings.
   */
  MigrationTransport(
      folly::EventBase* evb,
      std::unique_ptr<DataChannel> channel,
      const MigrationSettings& settings);

  ~MigrationTransport() override;

  MigrationTransport(const MigrationTransport&) = delete;
  MigrationTransport& operator=(const MigrationTransport&) = delete;

  void setCallback(MigrationTransportCallback* callback);

  folly::EventBase* getEventBase() const;

  /**
   * Starts an outgoing connection. The endpoint that calls this method
   * reconnects automatically after a disconnection while online.
   */
  void startOutgoing();

  /**
   * Accepts the connection offered by the peer.
   */
  void startIncoming();

  /**
   * Selects the request identifier range of this endpoint. Only the first
   * call has an effect. Until then, the range depends on the direction of
   * the connection.
   * @param role  the role of the endpoint in the migration.
   */
  void assignRole(MigrationRole role);

  const folly::Optional<MigrationRole>& getRole() const;

  /**
   * Returns a new request identifier in the range of the role.
   */
  int64_t newRequestId();

  /**
   * Sends a request that expects an answer. The request stays pending
   * until completeRequest() is called with its identifier.
   * @param message  the message to send.
   * @return         the request identifier.
   */
  int64_t sendRequest(MigrationMessage message);

  /**
   * Sends a packet that is not tracked, such as a reply.
   * @return  false if the channel is not open.
   */
  bool sendPacket(const MigrationPacket& packet);

  /**
   * Marks a request as answered.
   * @return  true if the request was pending.
   */
  bool completeRequest(int64_t requestId);

  bool isPendingRequest(int64_t requestId) const;

  size_t pendingRequestCount() const;

  bool isConnected() const;

  bool usesSegmentedFraming() const;

  /**
   * Changes the connectivity of the device. Going offline cancels a
   * pending reconnection, going online reconnects the initiator.
   */
  void setOnline(bool online);

  bool isOnline() const;

  /**
   * Keeps the current channel but never opens a new one after it closes.
   */
  void stopReconnecting();

  /**
   * Closes the channel gracefully after the close delay, so that the
   * packets already sent can be flushed.
   */
  void closeConnection();

  /**
   * Releases the channel. No event is delivered after this call and the
   * transport never reconnects.
   */
  void finish();

  const ProtocolVersionNegotiator& getNegotiator() const;

  // DataChannelCallback
  void onChannelOpen(std::string peerVersion, bool leadingPadding) noexcept
      override;

  void onChannelMessage(Buf frame) noexcept override;

  void onChannelClosed(TerminateReason reason) noexcept override;

 private:
  class TransportTimeout : public folly::HHWheelTimer::Callback {
   public:
    using Handler = void (MigrationTransport::*)();

    TransportTimeout(MigrationTransport* transport, Handler handler)
        : transport_(transport), handler_(handler) {}

    ~TransportTimeout() override = default;

    void timeoutExpired() noexcept override {
      (transport_->*handler_)();
    }

    void callbackCanceled() noexcept override {}

   private:
    MigrationTransport* transport_;
    Handler handler_;
  };

  template <typename F>
  void runInWorker(F&& func);

  void connectNow();

  void handleOpen(const std::string& peerVersion, bool leadingPadding);

  void handleMessage(Buf frame);

  void handleClosed(TerminateReason reason);

  void onLivenessTimeout();

  void onConnectTimeout();

  void onReconnectTimeout();

  void onCloseTimeout();

  folly::EventBase* evb_;
  std::unique_ptr<DataChannel> channel_;
  const MigrationSettings& settings_;
  MigrationTransportCallback* callback_{nullptr};
  ProtocolVersionNegotiator negotiator_;

  folly::Optional<MigrationRole> role_;
  int64_t requestIdOffset_{0};
  int64_t nextRequestId_{1};
  std::set<int64_t> pendingRequests_;
  bool livenessExpired_{false};

  bool connected_{false};
  bool outgoing_{false};
  bool online_{true};
  bool reconnect_{true};
  bool finished_{false};
  bool leadingPadding_{false};
  FrameReassembler reassembler_;

  TransportTimeout livenessTimeout_;
  TransportTimeout connectTimeout_;
  TransportTimeout reconnectTimeout_;
  TransportTimeout closeTimeout_;

  // Expires with the transport, so that late channel events are dropped.
  std::shared_ptr<bool> aliveToken_;
};

} // namespace migration
