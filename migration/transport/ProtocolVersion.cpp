#include <migration/transport/ProtocolVersion.h>

#include <folly/Conv.h>
#include <folly/String.h>
#include <glog/logging.h>
#include <migration/MigrationException.h>
#include <vector>

namespace migration {

ProtocolVersion::ProtocolVersion(
    int32_t majorIn,
    int32_t minorIn,
    int32_t patchIn)
    : majorVersion(majorIn), minorVersion(minorIn), patchVersion(patchIn) {}

folly::Optional<ProtocolVersion> ProtocolVersion::parse(
    folly::StringPiece version) {
  std::vector<folly::StringPiece> parts;
  folly::split('.', version, parts);
  if (parts.empty() || parts.size() > 3) {
    return folly::none;
  }
  int32_t values[3] = {0, 0, 0};
  for (size_t i = 0; i < parts.size(); ++i) {
    auto value = folly::tryTo<int32_t>(parts[i]);
    if (!value.hasValue() || value.value() < 0) {
      return folly::none;
    }
    values[i] = value.value();
  }
  return ProtocolVersion(values[0], values[1], values[2]);
}

std::string ProtocolVersion::toString() const {
  return folly::to<std::string>(
      majorVersion, ".", minorVersion, ".", patchVersion);
}

bool ProtocolVersion::operator==(const ProtocolVersion& rhs) const {
  return majorVersion == rhs.majorVersion &&
      minorVersion == rhs.minorVersion && patchVersion == rhs.patchVersion;
}

bool ProtocolVersion::operator!=(const ProtocolVersion& rhs) const {
  return !operator==(rhs);
}

ProtocolVersionNegotiator::ProtocolVersionNegotiator(
    std::string localVersion,
    int32_t minPeerMajorVersion)
    : localVersionString_(std::move(localVersion)),
      minPeerMajorVersion_(minPeerMajorVersion) {
  folly::StringPiece version(localVersionString_);
  folly::Optional<ProtocolVersion> parsed;
  if (version.removePrefix(kProtocolVersionPrefix)) {
    parsed = ProtocolVersion::parse(version);
  }
  if (!parsed) {
    throw MigrationInternalException(
        folly::to<std::string>(
            "Invalid local protocol version ", localVersionString_),
        LocalErrorCode::INVALID_ARGUMENT);
  }
  localVersion_ = parsed.value();
}

bool ProtocolVersionNegotiator::onPeerVersionReceived(
    folly::StringPiece peerVersion) {
  peerVersion_ = folly::none;
  if (!peerVersion.removePrefix(kProtocolVersionPrefix)) {
    LOG(WARNING) << "Peer is not a migration endpoint: " << peerVersion;
    return false;
  }
  auto parsed = ProtocolVersion::parse(peerVersion);
  if (!parsed) {
    LOG(WARNING) << "Invalid peer protocol version " << peerVersion;
    return false;
  }
  if (parsed->majorVersion < minPeerMajorVersion_) {
    LOG(ERROR) << "Protocol version " << parsed->toString()
               << " is not supported";
    return false;
  }
  peerVersion_ = parsed;
  VLOG(3) << "Negotiated protocol version " << parsed->toString();
  return true;
}

const std::string& ProtocolVersionNegotiator::getLocalVersionString() const {
  return localVersionString_;
}

const ProtocolVersion& ProtocolVersionNegotiator::getLocalVersion() const {
  return localVersion_;
}

const folly::Optional<ProtocolVersion>&
ProtocolVersionNegotiator::getPeerVersion() const {
  return peerVersion_;
}

int32_t ProtocolVersionNegotiator::accountSchemaVersion() const {
  if (peerVersion_ && peerVersion_->majorVersion == 2 &&
      peerVersion_->minorVersion == 0) {
    return kLegacyAccountSchemaVersion;
  }
  return kAccountSchemaVersion;
}

std::string ProtocolVersionNegotiator::peerVersionToString() const {
  if (!peerVersion_) {
    return "none";
  }
  return peerVersion_->toString();
}

void ProtocolVersionNegotiator::reset() {
  peerVersion_ = folly::none;
}

} // namespace migration
