#include <watchman/protocol/bser.h>
#include <watchman/protocol/pdu.h>

#include <spdlog/fmt/fmt.h>

namespace watchman::protocol {

namespace {

// "bser: truncated value" -> "invalid bser: truncated value"
Error invalidBser(const Error& e) {
    std::string_view msg = e.message;
    if (msg.starts_with("bser: ")) {
        msg.remove_prefix(6);
    }
    return Error{e.code, fmt::format("invalid bser: {}", msg)};
}

} // namespace

std::string_view to_string(PduType type) {
    switch (type) {
        case PduType::Json:
            return "json";
        case PduType::PrettyJson:
            return "json-pretty";
        case PduType::BserV1:
            return "bser";
    }
    return "json";
}

Result<PduType> parsePduType(std::string_view name) {
    if (name == "json") {
        return PduType::Json;
    }
    if (name == "bser" || name == "bser-v1") {
        return PduType::BserV1;
    }
    return Error{ErrorCode::InvalidArgument,
                 fmt::format("unsupported encoding '{}' (expected json or bser)", name)};
}

std::optional<PduType> detectPduType(std::string_view buffered) {
    if (buffered.empty()) {
        return std::nullopt;
    }
    return buffered.front() == '\0' ? PduType::BserV1 : PduType::Json;
}

Result<std::optional<std::size_t>> pduLength(std::string_view buffered, PduType type) {
    if (type == PduType::BserV1) {
        return bserPduLength(buffered);
    }
    auto nl = buffered.find('\n');
    if (nl == std::string_view::npos) {
        return std::optional<std::size_t>{};
    }
    return std::optional<std::size_t>{nl + 1};
}

Result<std::string> encodePdu(const nlohmann::json& value, PduType type) {
    switch (type) {
        case PduType::BserV1:
            return bserEncode(value);
        case PduType::PrettyJson:
            return value.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
        case PduType::Json:
            break;
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

Result<nlohmann::json> decodePdu(std::string_view pdu, PduType type) {
    if (type == PduType::BserV1) {
        auto v = bserDecode(pdu);
        if (!v) {
            return invalidBser(v.error());
        }
        return v;
    }
    try {
        return nlohmann::json::parse(pdu.begin(), pdu.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::InvalidData, fmt::format("invalid json: {}", e.what())};
    }
}

Result<std::optional<PduReader::Frame>> PduReader::next() {
    auto type = detectPduType(buffer_);
    if (!type) {
        return std::optional<Frame>{};
    }
    auto len = pduLength(buffer_, *type);
    if (!len) {
        return *type == PduType::BserV1 ? invalidBser(len.error()) : len.error();
    }
    if (!len.value()) {
        if (buffer_.size() > maxPduBytes_) {
            return Error{ErrorCode::ResourceExhausted,
                         fmt::format("PDU exceeds {} byte limit", maxPduBytes_)};
        }
        return std::optional<Frame>{};
    }
    const std::size_t total = *len.value();
    if (total > maxPduBytes_) {
        return Error{ErrorCode::ResourceExhausted,
                     fmt::format("PDU of {} bytes exceeds {} byte limit", total, maxPduBytes_)};
    }
    if (buffer_.size() < total) {
        return std::optional<Frame>{};
    }
    Frame frame{*type, buffer_.substr(0, total)};
    buffer_.erase(0, total);
    return std::optional<Frame>{std::move(frame)};
}

} // namespace watchman::protocol
