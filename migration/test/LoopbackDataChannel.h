#pragma once

#include <migration/transport/DataChannel.h>
#include <array>
#include <functional>
#include <memory>
#include <string>

namespace migration {
namespace test {

class LoopbackLink;

/**
 * One end of a LoopbackLink.
 */
class LoopbackEndpoint : public DataChannel {
 public:
  LoopbackEndpoint(std::shared_ptr<LoopbackLink> link, size_t index);

  ~LoopbackEndpoint() override;

  void setCallback(DataChannelCallback* callback) override {
    callback_ = callback;
  }

  void connect(const std::string& localVersion) override;

  void accept(const std::string& localVersion) override;

  bool send(Buf frame) override;

  void terminate(TerminateReason reason) override;

 private:
  friend class LoopbackLink;

  std::shared_ptr<LoopbackLink> link_;
  size_t index_;
  DataChannelCallback* callback_{nullptr};
  std::string version_;
  bool connecting_{false};
  bool accepting_{false};
};

/**
 * In-process link between two DataChannels. Messages sent on one end are
 * delivered synchronously to the callback of the other end. The link opens
 * as soon as one end connects while the other one connects or accepts; an
 * end that accepted keeps accepting after a disconnection, until it is
 * terminated with CANCEL.
 */
class LoopbackLink {
 public:
  struct Ends {
    std::shared_ptr<LoopbackLink> link;
    std::unique_ptr<LoopbackEndpoint> first;
    std::unique_ptr<LoopbackEndpoint> second;
  };

  static Ends create(bool leadingPadding = false) {
    Ends ends;
    ends.link = std::shared_ptr<LoopbackLink>(new LoopbackLink());
    ends.link->leadingPadding_ = leadingPadding;
    ends.first = std::make_unique<LoopbackEndpoint>(ends.link, 0);
    ends.second = std::make_unique<LoopbackEndpoint>(ends.link, 1);
    return ends;
  }

  bool isOpen() const {
    return open_;
  }

  void setDropMessages(bool dropMessages) {
    dropMessages_ = dropMessages;
  }

  /**
   * Disconnects the link with CONNECTIVITY_ERROR when a frame is sent after
   * the given number of frames went through, in both directions. The frame
   * is lost. 0 disables the limit; it is cleared once it triggers.
   */
  void setFrameLimit(size_t frameLimit) {
    frameLimit_ = frameLimit;
  }

  size_t getSentFrames(size_t index) const {
    return sentFrames_[index];
  }

  size_t getConnectCount(size_t index) const {
    return connectCount_[index];
  }

  /**
   * Called with the index of the sending end for every frame delivered to
   * the other end.
   */
  void setFrameObserver(
      std::function<void(size_t, const folly::IOBuf&)> frameObserver) {
    frameObserver_ = std::move(frameObserver);
  }

  /**
   * Delivers a frame to the given end as if its peer had sent it.
   */
  void deliver(size_t index, Buf frame) {
    auto endpoint = endpoints_[index];
    if (open_ && endpoint && endpoint->callback_) {
      endpoint->callback_->onChannelMessage(std::move(frame));
    }
  }

  /**
   * Closes the link as the network would: both ends are notified.
   */
  void disconnect(TerminateReason reason) {
    if (!open_) {
      return;
    }
    open_ = false;
    for (auto endpoint : endpoints_) {
      if (endpoint) {
        endpoint->connecting_ = false;
      }
    }
    for (auto endpoint : endpoints_) {
      if (endpoint && endpoint->callback_) {
        endpoint->callback_->onChannelClosed(reason);
      }
    }
  }

 private:
  friend class LoopbackEndpoint;

  LoopbackLink() = default;

  LoopbackEndpoint* peer(size_t index) {
    return endpoints_[1 - index];
  }

  void tryOpen() {
    auto first = endpoints_[0];
    auto second = endpoints_[1];
    if (open_ || !first || !second) {
      return;
    }
    bool ready =
        (first->connecting_ && (second->connecting_ || second->accepting_)) ||
        (second->connecting_ && first->accepting_);
    if (!ready) {
      return;
    }
    open_ = true;
    if (first->callback_) {
      first->callback_->onChannelOpen(second->version_, leadingPadding_);
    }
    if (second->callback_) {
      second->callback_->onChannelOpen(first->version_, leadingPadding_);
    }
  }

  std::array<LoopbackEndpoint*, 2> endpoints_{{nullptr, nullptr}};
  std::array<size_t, 2> sentFrames_{{0, 0}};
  std::array<size_t, 2> connectCount_{{0, 0}};
  bool open_{false};
  bool leadingPadding_{false};
  bool dropMessages_{false};
  size_t frameLimit_{0};
  std::function<void(size_t, const folly::IOBuf&)> frameObserver_;
};

inline LoopbackEndpoint::LoopbackEndpoint(
    std::shared_ptr<LoopbackLink> link,
    size_t index)
    : link_(std::move(link)), index_(index) {
  link_->endpoints_[index_] = this;
}

inline LoopbackEndpoint::~LoopbackEndpoint() {
  link_->endpoints_[index_] = nullptr;
}

inline void LoopbackEndpoint::connect(const std::string& localVersion) {
  version_ = localVersion;
  connecting_ = true;
  link_->connectCount_[index_]++;
  link_->tryOpen();
}

inline void LoopbackEndpoint::accept(const std::string& localVersion) {
  version_ = localVersion;
  accepting_ = true;
  link_->tryOpen();
}

inline bool LoopbackEndpoint::send(Buf frame) {
  if (!link_->open_) {
    return false;
  }
  if (link_->frameLimit_ > 0 &&
      link_->sentFrames_[0] + link_->sentFrames_[1] >= link_->frameLimit_) {
    link_->frameLimit_ = 0;
    link_->disconnect(TerminateReason::CONNECTIVITY_ERROR);
    return false;
  }
  link_->sentFrames_[index_]++;
  if (link_->dropMessages_) {
    return true;
  }
  if (link_->frameObserver_) {
    link_->frameObserver_(index_, *frame);
  }
  auto peer = link_->peer(index_);
  if (peer && peer->callback_) {
    peer->callback_->onChannelMessage(std::move(frame));
  }
  return true;
}

inline void LoopbackEndpoint::terminate(TerminateReason reason) {
  if (reason == TerminateReason::CANCEL) {
    accepting_ = false;
  }
  connecting_ = false;
  if (!link_->open_) {
    return;
  }
  link_->open_ = false;
  auto peer = link_->peer(index_);
  if (peer) {
    peer->connecting_ = false;
    if (peer->callback_) {
      peer->callback_->onChannelClosed(reason);
    }
  }
}

} // namespace test
} // namespace migration
