#pragma once

#include <migration/MigrationConstants.h>
#include <migration/codec/CodecTypes.h>
#include <string>

namespace migration {

/**
 * Callbacks invoked by a DataChannel. They can be invoked by any thread:
 * implementations must hand the events off to their own worker and must
 * not block.
 */
class DataChannelCallback {
 public:
  virtual ~DataChannelCallback() = default;

  /**
   * Called when the channel is open and messages can be sent.
   * @param peerVersion     the version string advertised by the peer.
   * @param leadingPadding  true if the peer expects each message to be
   *                        framed with a leading control byte.
   */
  virtual void onChannelOpen(
      std::string peerVersion,
      bool leadingPadding) noexcept = 0;

  /**
   * Called for every message received on the channel, in order.
   * @param frame  the message.
   */
  virtual void onChannelMessage(Buf frame) noexcept = 0;

  /**
   * Called when the channel is closed by the peer or by the network.
   * It is not called when the channel is closed with terminate().
   * @param reason  the reason of the closure.
   */
  virtual void onChannelClosed(TerminateReason reason) noexcept = 0;
};

/**
 * Ordered point-to-point message channel between the two devices,
 * reliable while connected. A channel can be connected again after it has
 * been closed.
 */
class DataChannel {
 public:
  virtual ~DataChannel() = default;

  virtual void setCallback(DataChannelCallback* callback) = 0;

  /**
   * Starts an outgoing connection to the peer.
   * @param localVersion  the version string advertised to the peer.
   */
  virtual void connect(const std::string& localVersion) = 0;

  /**
   * Accepts the incoming connection offered by the peer.
   * @param localVersion  the version string advertised to the peer.
   */
  virtual void accept(const std::string& localVersion) = 0;

  /**
   * Sends one message.
   * @param frame  the message.
   * @return       false if the channel is not open.
   */
  virtual bool send(Buf frame) = 0;

  /**
   * Closes the current connection, if any.
   * @param reason  the reason reported to the peer.
   */
  virtual void terminate(TerminateReason reason) = 0;
};

} // namespace migration
