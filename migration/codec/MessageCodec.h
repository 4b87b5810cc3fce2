#pragma once

#include <folly/Expected.h>
#include <migration/codec/CodecTypes.h>
#include <migration/codec/Messages.h>

namespace migration {

/**
 * Encodes a packet as schemaId || schemaVersion || requestId || fields.
 * @param packet        the packet to encode.
 * @param uuidEncoding  the uuid representation negotiated for the session.
 * @param padding       number of zero bytes written in front of the header,
 *                      reserved for a framing control byte.
 * @return              the encoded packet.
 */
Buf encodePacket(
    const MigrationPacket& packet,
    UuidEncoding uuidEncoding,
    size_t padding = 0);

/**
 * Decodes a packet produced by encodePacket, without its padding. Never
 * throws: truncated input, malformed fields and unknown schema pairs are
 * reported as a CodecError.
 */
folly::Expected<MigrationPacket, CodecError> decodePacket(
    const folly::IOBuf& data,
    UuidEncoding uuidEncoding);

folly::StringPiece codecErrorToString(CodecError error);

} // namespace migration
