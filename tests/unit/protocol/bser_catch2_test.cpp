// BSER v1 codec tests

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

#include <watchman/protocol/bser.h>

using namespace watchman;
using namespace watchman::protocol;
using namespace std::string_literals;

namespace {

// PDU with a one-byte length header, as produced by other BSER peers.
std::string pduInt8(const std::string& payload) {
    REQUIRE(payload.size() < 128);
    return "\x00\x01\x03"s + static_cast<char>(payload.size()) + payload;
}

std::string hostInt32(std::int32_t v) {
    std::string out(sizeof(v), '\0');
    std::memcpy(out.data(), &v, sizeof(v));
    return out;
}

} // namespace

TEST_CASE("bserEncode writes magic, int32 length and the value", "[protocol][bser][unit]") {
    auto encoded = bserEncode(nlohmann::json::array({"hello"}));
    REQUIRE(encoded);

    const std::string payload = "\x00\x03\x01"s + "\x02\x03\x05"s + "hello";
    const std::string expected = "\x00\x01\x05"s + hostInt32(11) + payload;
    CHECK(encoded.value() == expected);
}

TEST_CASE("bserEncode picks the smallest integer width", "[protocol][bser][unit]") {
    struct Case {
        std::int64_t value;
        std::uint8_t tag;
    };
    for (auto c : {Case{1, bser::kInt8}, Case{-100, bser::kInt8}, Case{300, bser::kInt16},
                   Case{70000, bser::kInt32}, Case{5000000000LL, bser::kInt64}}) {
        auto encoded = bserEncode(nlohmann::json(c.value));
        REQUIRE(encoded);
        // magic(2) + int32 header(5) then the value tag
        CHECK(static_cast<std::uint8_t>(encoded.value()[7]) == c.tag);

        auto decoded = bserDecode(encoded.value());
        REQUIRE(decoded);
        CHECK(decoded.value().get<std::int64_t>() == c.value);
    }
}

TEST_CASE("bserEncode rejects unsigned values above INT64_MAX", "[protocol][bser][unit]") {
    nlohmann::json big = std::numeric_limits<std::uint64_t>::max();
    auto encoded = bserEncode(nlohmann::json::array({big}));
    REQUIRE_FALSE(encoded);
    CHECK(encoded.error().code == ErrorCode::InvalidData);
}

TEST_CASE("bserDecode reads a peer-produced array", "[protocol][bser][unit]") {
    // ["hello", 42, true, null]
    const std::string payload = "\x00\x03\x04"s + "\x02\x03\x05"s + "hello" + "\x03\x2a"s +
                                "\x08"s + "\x0a"s;
    auto decoded = bserDecode(pduInt8(payload));
    REQUIRE(decoded);
    CHECK(decoded.value() == nlohmann::json::parse(R"(["hello", 42, true, null])"));
}

TEST_CASE("bserDecode expands templates and honors skip markers", "[protocol][bser][unit]") {
    const std::string payload = "\x0b"s +                                     // template
                                "\x00\x03\x02"s +                             // keys: 2
                                "\x02\x03\x04"s + "name" +                    //
                                "\x02\x03\x03"s + "age" +                     //
                                "\x03\x03"s +                                 // rows: 3
                                "\x02\x03\x04"s + "fred" + "\x03\x14"s +      // fred, 20
                                "\x02\x03\x04"s + "pete" + "\x03\x1e"s +      // pete, 30
                                "\x0c"s + "\x03\x19"s;                        // skip, 25
    auto decoded = bserDecode(pduInt8(payload));
    REQUIRE(decoded);
    CHECK(decoded.value() == nlohmann::json::parse(R"([
        {"name": "fred", "age": 20},
        {"name": "pete", "age": 30},
        {"age": 25}
    ])"));
}

TEST_CASE("bserDecode rejects malformed input", "[protocol][bser][unit]") {
    SECTION("bad magic") {
        auto r = bserDecode("\x00\x02\x03\x01\x0a"s);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidData);
    }
    SECTION("truncated value") {
        // string claims 5 bytes but carries 2
        auto r = bserDecode(pduInt8("\x02\x03\x05"s + "he"));
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("too small") != std::string::npos);
    }
    SECTION("header length does not match data") {
        auto pdu = pduInt8("\x0a"s);
        pdu.push_back('\x0a');
        REQUIRE_FALSE(bserDecode(pdu));
    }
    SECTION("trailing bytes inside the declared payload") {
        REQUIRE_FALSE(bserDecode(pduInt8("\x0a\x0a"s)));
    }
    SECTION("unknown opcode") {
        auto r = bserDecode(pduInt8("\x42"s));
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("opcode") != std::string::npos);
    }
    SECTION("negative length") {
        REQUIRE_FALSE(bserDecode(pduInt8("\x00\x03\xff"s)));
    }
    SECTION("keyless template with a huge row count") {
        // 16-byte PDU claiming 2^26 rows of nothing
        auto r = bserDecode(pduInt8("\x0b\x00\x03\x00"s + "\x05"s + hostInt32(1 << 26)));
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidData);
        CHECK(r.error().message.find("row count") != std::string::npos);
    }
    SECTION("template row count larger than the payload") {
        auto r = bserDecode(pduInt8("\x0b\x00\x03\x01\x02\x03\x01"s + "a" + "\x03\x64"s +
                                    "\x0c\x0c"s));
        REQUIRE_FALSE(r);
        CHECK(r.error().message.find("row count") != std::string::npos);
    }
}

TEST_CASE("bserDecode accepts an empty keyless template", "[protocol][bser][unit]") {
    auto r = bserDecode(pduInt8("\x0b\x00\x03\x00\x03\x00"s));
    REQUIRE(r);
    CHECK(r.value() == nlohmann::json::array());
}

TEST_CASE("bserPduLength waits for the full header", "[protocol][bser][unit]") {
    auto full = pduInt8("\x0a"s);

    auto partial = bserPduLength(std::string_view(full).substr(0, 2));
    REQUIRE(partial);
    CHECK_FALSE(partial.value().has_value());

    auto complete = bserPduLength(full);
    REQUIRE(complete);
    REQUIRE(complete.value().has_value());
    CHECK(*complete.value() == full.size());

    CHECK_FALSE(bserPduLength("{\"a\":1}"s));
}

TEST_CASE("BSER preserves nested values", "[protocol][bser][unit]") {
    auto value = nlohmann::json::parse(R"({
        "version": "1.0",
        "capabilities": {"cmd-version": true, "bser-v1": false},
        "list": [1, -2, 3.5, null, "x", []],
        "empty": {}
    })");
    auto encoded = bserEncode(value);
    REQUIRE(encoded);
    auto decoded = bserDecode(encoded.value());
    REQUIRE(decoded);
    CHECK(decoded.value() == value);
}
