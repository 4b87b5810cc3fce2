#pragma once

#include <folly/Optional.h>
#include <folly/Range.h>
#include <migration/codec/CodecTypes.h>

namespace migration {

/**
 * Secure key/value store of opaque configuration blobs.
 */
class SecureStore {
 public:
  virtual ~SecureStore() = default;

  /**
   * Returns the blob stored under the key, or none if there is no blob.
   */
  virtual folly::Optional<Bytes> get(folly::StringPiece key) const = 0;

  /**
   * Stores a blob under the key, replacing any existing value.
   * @return  false if the blob could not be stored.
   */
  virtual bool set(folly::StringPiece key, const Bytes& value) = 0;

  virtual void erase(folly::StringPiece key) = 0;
};

} // namespace migration
