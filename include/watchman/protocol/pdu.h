#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <watchman/core/types.h>

namespace watchman::protocol {

// Wire/output encodings. PrettyJson is never sent on the wire; it only
// selects indented rendering on the client's stdout.
enum class PduType { Json, PrettyJson, BserV1 };

inline constexpr std::size_t kDefaultMaxPduBytes = 32 * 1024 * 1024;

std::string_view to_string(PduType type);

// Accepts "json" and "bser" (and "bser-v1"); anything else is InvalidArgument.
Result<PduType> parsePduType(std::string_view name);

// A buffered PDU starting with 0x00 is BSER, anything else JSON.
// Returns std::nullopt while the buffer is empty.
std::optional<PduType> detectPduType(std::string_view buffered);

// Length of the first complete PDU in the buffer, std::nullopt if more bytes
// are needed. A JSON PDU ends at (and includes) the first newline.
Result<std::optional<std::size_t>> pduLength(std::string_view buffered, PduType type);

// Serialize one PDU. Json and PrettyJson PDUs are newline terminated.
Result<std::string> encodePdu(const nlohmann::json& value, PduType type);

// Parse one complete PDU (as delimited by pduLength).
Result<nlohmann::json> decodePdu(std::string_view pdu, PduType type);

/**
 * Incremental splitter for a byte stream carrying PDUs.
 *
 * The encoding is detected from the first byte of every PDU, so a single
 * connection can mix JSON and BSER requests.
 */
class PduReader {
public:
    struct Frame {
        PduType type;
        std::string bytes;
    };

    explicit PduReader(std::size_t maxPduBytes = kDefaultMaxPduBytes) : maxPduBytes_(maxPduBytes) {}

    void append(std::string_view bytes) { buffer_.append(bytes); }

    // Next complete frame, std::nullopt when more input is needed.
    Result<std::optional<Frame>> next();

    std::size_t buffered() const { return buffer_.size(); }

    // Encoding of the partially buffered PDU, if any bytes are pending.
    std::optional<PduType> pendingType() const { return detectPduType(buffer_); }

private:
    std::string buffer_;
    std::size_t maxPduBytes_;
};

} // namespace watchman::protocol
