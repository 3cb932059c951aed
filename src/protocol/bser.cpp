#include <watchman/protocol/bser.h>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstring>
#include <limits>
#include <vector>

namespace watchman::protocol {

namespace {

constexpr int kMaxDepth = 256;

void appendInt(std::string& out, std::int64_t v) {
    if (v >= std::numeric_limits<std::int8_t>::min() &&
        v <= std::numeric_limits<std::int8_t>::max()) {
        auto n = static_cast<std::int8_t>(v);
        out.push_back(static_cast<char>(bser::kInt8));
        out.append(reinterpret_cast<const char*>(&n), sizeof(n));
    } else if (v >= std::numeric_limits<std::int16_t>::min() &&
               v <= std::numeric_limits<std::int16_t>::max()) {
        auto n = static_cast<std::int16_t>(v);
        out.push_back(static_cast<char>(bser::kInt16));
        out.append(reinterpret_cast<const char*>(&n), sizeof(n));
    } else if (v >= std::numeric_limits<std::int32_t>::min() &&
               v <= std::numeric_limits<std::int32_t>::max()) {
        auto n = static_cast<std::int32_t>(v);
        out.push_back(static_cast<char>(bser::kInt32));
        out.append(reinterpret_cast<const char*>(&n), sizeof(n));
    } else {
        out.push_back(static_cast<char>(bser::kInt64));
        out.append(reinterpret_cast<const char*>(&v), sizeof(v));
    }
}

void appendString(std::string& out, std::string_view s) {
    out.push_back(static_cast<char>(bser::kString));
    appendInt(out, static_cast<std::int64_t>(s.size()));
    out.append(s);
}

Result<void> encodeValue(std::string& out, const nlohmann::json& v, int depth) {
    if (depth > kMaxDepth) {
        return Error{ErrorCode::InvalidData, "bser: value nested too deeply"};
    }
    switch (v.type()) {
        case nlohmann::json::value_t::null:
            out.push_back(static_cast<char>(bser::kNull));
            return Result<void>();
        case nlohmann::json::value_t::boolean:
            out.push_back(static_cast<char>(v.get<bool>() ? bser::kTrue : bser::kFalse));
            return Result<void>();
        case nlohmann::json::value_t::number_integer:
            appendInt(out, v.get<std::int64_t>());
            return Result<void>();
        case nlohmann::json::value_t::number_unsigned: {
            auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("bser: integer {} does not fit in int64", u)};
            }
            appendInt(out, static_cast<std::int64_t>(u));
            return Result<void>();
        }
        case nlohmann::json::value_t::number_float: {
            double d = v.get<double>();
            out.push_back(static_cast<char>(bser::kReal));
            out.append(reinterpret_cast<const char*>(&d), sizeof(d));
            return Result<void>();
        }
        case nlohmann::json::value_t::string:
            appendString(out, v.get_ref<const std::string&>());
            return Result<void>();
        case nlohmann::json::value_t::binary: {
            const auto& bin = v.get_binary();
            appendString(out, std::string_view(reinterpret_cast<const char*>(bin.data()),
                                               bin.size()));
            return Result<void>();
        }
        case nlohmann::json::value_t::array:
            out.push_back(static_cast<char>(bser::kArray));
            appendInt(out, static_cast<std::int64_t>(v.size()));
            for (const auto& item : v) {
                if (auto r = encodeValue(out, item, depth + 1); !r) {
                    return r;
                }
            }
            return Result<void>();
        case nlohmann::json::value_t::object:
            out.push_back(static_cast<char>(bser::kObject));
            appendInt(out, static_cast<std::int64_t>(v.size()));
            for (auto it = v.begin(); it != v.end(); ++it) {
                appendString(out, it.key());
                if (auto r = encodeValue(out, it.value(), depth + 1); !r) {
                    return r;
                }
            }
            return Result<void>();
        case nlohmann::json::value_t::discarded:
            break;
    }
    return Error{ErrorCode::InvalidData, "bser: cannot encode discarded value"};
}

// Reads values from a bounded buffer; every accessor checks the remaining size.
class Reader {
public:
    explicit Reader(std::string_view buf) : buf_(buf) {}

    std::size_t position() const { return pos_; }
    bool atEnd() const { return pos_ >= buf_.size(); }

    Result<std::uint8_t> peek() const {
        if (atEnd()) {
            return truncated("tag");
        }
        return static_cast<std::uint8_t>(buf_[pos_]);
    }

    Result<std::int64_t> readInt() {
        auto tag = peek();
        if (!tag) {
            return tag.error();
        }
        std::size_t width = 0;
        switch (tag.value()) {
            case bser::kInt8: width = 1; break;
            case bser::kInt16: width = 2; break;
            case bser::kInt32: width = 4; break;
            case bser::kInt64: width = 8; break;
            default:
                return Error{ErrorCode::InvalidData,
                             fmt::format("bser: invalid integer encoding 0x{:02x} at offset {}",
                                         tag.value(), pos_)};
        }
        if (buf_.size() - pos_ < width + 1) {
            return truncated("integer");
        }
        const char* p = buf_.data() + pos_ + 1;
        std::int64_t v = 0;
        switch (width) {
            case 1: {
                std::int8_t n;
                std::memcpy(&n, p, sizeof(n));
                v = n;
                break;
            }
            case 2: {
                std::int16_t n;
                std::memcpy(&n, p, sizeof(n));
                v = n;
                break;
            }
            case 4: {
                std::int32_t n;
                std::memcpy(&n, p, sizeof(n));
                v = n;
                break;
            }
            default:
                std::memcpy(&v, p, sizeof(v));
                break;
        }
        pos_ += width + 1;
        return v;
    }

    Result<std::size_t> readLength(const char* what) {
        auto n = readInt();
        if (!n) {
            return n.error();
        }
        if (n.value() < 0) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("bser: negative {} length {}", what, n.value())};
        }
        return static_cast<std::size_t>(n.value());
    }

    Result<std::string> readString() {
        auto tag = peek();
        if (!tag) {
            return tag.error();
        }
        if (tag.value() != bser::kString) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("bser: expected string at offset {}", pos_)};
        }
        ++pos_;
        auto len = readLength("string");
        if (!len) {
            return len.error();
        }
        if (buf_.size() - pos_ < len.value()) {
            return truncated("string");
        }
        std::string s(buf_.substr(pos_, len.value()));
        pos_ += len.value();
        return s;
    }

    Result<nlohmann::json> readValue(int depth) {
        if (depth > kMaxDepth) {
            return Error{ErrorCode::InvalidData, "bser: value nested too deeply"};
        }
        auto tag = peek();
        if (!tag) {
            return tag.error();
        }
        switch (tag.value()) {
            case bser::kInt8:
            case bser::kInt16:
            case bser::kInt32:
            case bser::kInt64: {
                auto n = readInt();
                if (!n) {
                    return n.error();
                }
                return nlohmann::json(n.value());
            }
            case bser::kReal: {
                if (buf_.size() - pos_ < sizeof(double) + 1) {
                    return truncated("real");
                }
                double d;
                std::memcpy(&d, buf_.data() + pos_ + 1, sizeof(d));
                pos_ += sizeof(double) + 1;
                return nlohmann::json(d);
            }
            case bser::kTrue:
                ++pos_;
                return nlohmann::json(true);
            case bser::kFalse:
                ++pos_;
                return nlohmann::json(false);
            case bser::kNull:
                ++pos_;
                return nlohmann::json(nullptr);
            case bser::kString: {
                auto s = readString();
                if (!s) {
                    return s.error();
                }
                return nlohmann::json(std::move(s).value());
            }
            case bser::kArray:
                return readArray(depth);
            case bser::kObject:
                return readObject(depth);
            case bser::kTemplate:
                return readTemplate(depth);
            default:
                break;
        }
        return Error{ErrorCode::InvalidData,
                     fmt::format("bser: unhandled opcode 0x{:02x} at offset {}", tag.value(),
                                 pos_)};
    }

private:
    Result<nlohmann::json> readArray(int depth) {
        ++pos_;
        auto count = readLength("array");
        if (!count) {
            return count.error();
        }
        auto arr = nlohmann::json::array();
        for (std::size_t i = 0; i < count.value(); ++i) {
            auto item = readValue(depth + 1);
            if (!item) {
                return item.error();
            }
            arr.push_back(std::move(item).value());
        }
        return arr;
    }

    Result<nlohmann::json> readObject(int depth) {
        ++pos_;
        auto count = readLength("object");
        if (!count) {
            return count.error();
        }
        auto obj = nlohmann::json::object();
        for (std::size_t i = 0; i < count.value(); ++i) {
            auto key = readString();
            if (!key) {
                return key.error();
            }
            auto item = readValue(depth + 1);
            if (!item) {
                return item.error();
            }
            obj[key.value()] = std::move(item).value();
        }
        return obj;
    }

    Result<nlohmann::json> readTemplate(int depth) {
        ++pos_;
        auto next = peek();
        if (!next) {
            return next.error();
        }
        if (next.value() != bser::kArray) {
            return Error{ErrorCode::InvalidData, "bser: expected array to follow template"};
        }
        auto keys = readArray(depth);
        if (!keys) {
            return keys.error();
        }
        std::vector<std::string> names;
        names.reserve(keys.value().size());
        for (const auto& k : keys.value()) {
            if (!k.is_string()) {
                return Error{ErrorCode::InvalidData, "bser: template keys must be strings"};
            }
            names.push_back(k.get<std::string>());
        }
        auto rows = readLength("template");
        if (!rows) {
            return rows.error();
        }
        // Every row consumes at least one byte per key; keyless rows consume nothing
        if (names.empty() ? rows.value() != 0
                          : rows.value() > (buf_.size() - pos_) / names.size()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("bser: template row count {} exceeds remaining data",
                                     rows.value())};
        }
        auto arr = nlohmann::json::array();
        for (std::size_t row = 0; row < rows.value(); ++row) {
            auto obj = nlohmann::json::object();
            for (const auto& name : names) {
                auto tag = peek();
                if (!tag) {
                    return tag.error();
                }
                if (tag.value() == bser::kSkip) {
                    ++pos_;
                    continue;
                }
                auto item = readValue(depth + 1);
                if (!item) {
                    return item.error();
                }
                obj[name] = std::move(item).value();
            }
            arr.push_back(std::move(obj));
        }
        return arr;
    }

    Error truncated(const char* what) const {
        return Error{ErrorCode::InvalidData,
                     fmt::format("bser: buffer too small for {} at offset {}", what, pos_)};
    }

    std::string_view buf_;
    std::size_t pos_{0};
};

} // namespace

Result<std::string> bserEncode(const nlohmann::json& value) {
    std::string out;
    out.reserve(256);
    // Fixed int32 length slot, patched once the payload size is known
    out.append(bser::kMagic);
    out.push_back(static_cast<char>(bser::kInt32));
    out.append(sizeof(std::int32_t), '\0');
    const std::size_t headerSize = out.size();

    if (auto r = encodeValue(out, value, 0); !r) {
        return r.error();
    }

    const std::size_t payload = out.size() - headerSize;
    if (payload > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        return Error{ErrorCode::ResourceExhausted,
                     fmt::format("bser: payload of {} bytes exceeds PDU limit", payload)};
    }
    auto len = static_cast<std::int32_t>(payload);
    std::memcpy(out.data() + bser::kMagic.size() + 1, &len, sizeof(len));
    return out;
}

Result<std::optional<std::size_t>> bserPduLength(std::string_view buffered) {
    const std::size_t probe = std::min(buffered.size(), bser::kMagic.size());
    if (buffered.substr(0, probe) != bser::kMagic.substr(0, probe)) {
        return Error{ErrorCode::InvalidData, "bser: invalid header"};
    }
    if (buffered.size() <= bser::kMagic.size()) {
        return std::optional<std::size_t>{};
    }
    Reader reader(buffered.substr(bser::kMagic.size()));
    auto tag = reader.peek();
    if (!tag) {
        return tag.error();
    }
    switch (tag.value()) {
        case bser::kInt8:
        case bser::kInt16:
        case bser::kInt32:
        case bser::kInt64:
            break;
        default:
            return Error{ErrorCode::InvalidData, "bser: invalid length encoding in header"};
    }
    auto len = reader.readInt();
    if (!len) {
        // Not enough bytes for the length integer yet
        return std::optional<std::size_t>{};
    }
    if (len.value() < 0) {
        return Error{ErrorCode::InvalidData, "bser: negative PDU length"};
    }
    return std::optional<std::size_t>{bser::kMagic.size() + reader.position() +
                                      static_cast<std::size_t>(len.value())};
}

Result<nlohmann::json> bserDecode(std::string_view pdu) {
    auto total = bserPduLength(pdu);
    if (!total) {
        return total.error();
    }
    if (!total.value()) {
        return Error{ErrorCode::InvalidData, "bser: truncated header"};
    }
    if (*total.value() != pdu.size()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("bser: data length {} != header length {}", pdu.size(),
                                 *total.value())};
    }

    // Skip magic and length integer
    Reader header(pdu.substr(bser::kMagic.size()));
    (void)header.readInt();
    const std::size_t bodyOffset = bser::kMagic.size() + header.position();

    Reader body(pdu.substr(bodyOffset));
    auto value = body.readValue(0);
    if (!value) {
        return value.error();
    }
    if (!body.atEnd()) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("bser: {} trailing bytes after value",
                                 pdu.size() - bodyOffset - body.position())};
    }
    return value;
}

} // namespace watchman::protocol
