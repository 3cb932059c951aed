#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <watchman/core/types.h>

namespace watchman::protocol {

/**
 * BSER v1 binary serialization.
 *
 * A PDU is the two magic bytes 0x00 0x01, a BSER integer giving the payload
 * length, then exactly one encoded value. Integers and reals use host byte
 * order, matching every existing BSER peer.
 */
namespace bser {

inline constexpr std::uint8_t kArray = 0x00;
inline constexpr std::uint8_t kObject = 0x01;
inline constexpr std::uint8_t kString = 0x02;
inline constexpr std::uint8_t kInt8 = 0x03;
inline constexpr std::uint8_t kInt16 = 0x04;
inline constexpr std::uint8_t kInt32 = 0x05;
inline constexpr std::uint8_t kInt64 = 0x06;
inline constexpr std::uint8_t kReal = 0x07;
inline constexpr std::uint8_t kTrue = 0x08;
inline constexpr std::uint8_t kFalse = 0x09;
inline constexpr std::uint8_t kNull = 0x0a;
inline constexpr std::uint8_t kTemplate = 0x0b;
inline constexpr std::uint8_t kSkip = 0x0c;

inline constexpr std::string_view kMagic{"\x00\x01", 2};

} // namespace bser

// Encode a complete PDU (header + value).
Result<std::string> bserEncode(const nlohmann::json& value);

// Decode a complete PDU. The header length must match the buffer exactly.
Result<nlohmann::json> bserDecode(std::string_view pdu);

// Total PDU size (header included) if enough bytes are buffered to tell,
// std::nullopt if more bytes are needed, or an error for a bad header.
Result<std::optional<std::size_t>> bserPduLength(std::string_view buffered);

} // namespace watchman::protocol
