#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <migration/MigrationConstants.h>
#include <cstdint>
#include <string>

namespace migration {

/**
 * Version of the migration protocol, in the "major.minor.patch" form.
 * Missing components are zero.
 */
struct ProtocolVersion {
  int32_t majorVersion{0};
  int32_t minorVersion{0};
  int32_t patchVersion{0};

  ProtocolVersion() = default;

  ProtocolVersion(int32_t majorIn, int32_t minorIn, int32_t patchIn);

  /**
   * Parses a version number, without the protocol prefix.
   * @param version  the version, for example "2.1.0".
   * @return         the version, or none if it is not a version number.
   */
  static folly::Optional<ProtocolVersion> parse(folly::StringPiece version);

  std::string toString() const;

  bool operator==(const ProtocolVersion& rhs) const;
  bool operator!=(const ProtocolVersion& rhs) const;
};

/**
 * Negotiation of the protocol version at channel open. Each side advertises
 * "AccountMigration." followed by its version; the peer is accepted when
 * its major version is not lower than the minimum supported one.
 */
class ProtocolVersionNegotiator {
 public:
  /**
   * Creates a new negotiator.
   * @param localVersion         the version string advertised to the peer.
   *                             It must carry the protocol prefix.
   * @param minPeerMajorVersion  the lowest major version accepted.
   */
  explicit ProtocolVersionNegotiator(
      std::string localVersion,
      int32_t minPeerMajorVersion = int32_t(kMinPeerMajorVersion));

  /**
   * Called when the channel is open with the version string advertised by
   * the peer. A string without the protocol prefix is not a migration peer.
   * @param peerVersion  the string advertised by the peer.
   * @return             true if the peer version is accepted.
   */
  bool onPeerVersionReceived(folly::StringPiece peerVersion);

  const std::string& getLocalVersionString() const;

  const ProtocolVersion& getLocalVersion() const;

  /**
   * Returns the version of the peer. If no version has been accepted yet,
   * it returns a null value.
   */
  const folly::Optional<ProtocolVersion>& getPeerVersion() const;

  /**
   * Returns the schema version used to export the account for the peer:
   * peers running protocol 2.0 only understand the legacy schema.
   */
  int32_t accountSchemaVersion() const;

  std::string peerVersionToString() const;

  void reset();

 private:
  std::string localVersionString_;
  ProtocolVersion localVersion_;
  int32_t minPeerMajorVersion_;
  folly::Optional<ProtocolVersion> peerVersion_;
};

} // namespace migration
