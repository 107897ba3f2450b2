#include <catch2/catch_all.hpp>
#include <msgpack.hpp>                   // for hand-built maps
#include <nlohmann/json.hpp>
#include "cmdrelay/core/interfaces/ipayload_codec.hpp"
#include "cmdrelay/core/protocol/json_payload_codec.hpp"
#include "cmdrelay/core/protocol/msgpack_payload_codec.hpp"

using namespace cmdrelay;

namespace {
    std::vector<uint8_t> bytes(std::string_view s) { return { s.begin(), s.end() }; }

    Command toggleCmd(bool on) {
        Command c;
        c.deviceId = "lamp-1";
        c.opcode = Opcode::Toggle;
        c.desiredState = on;
        c.msgId = "0123456789abcdef0123456789abcdef";
        return c;
    }

    template<typename F>
    std::vector<uint8_t> packMap(uint32_t n, F&& body) {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(&buf);
        pk.pack_map(n);
        body(pk);
        return { reinterpret_cast<const uint8_t*>(buf.data()),
                 reinterpret_cast<const uint8_t*>(buf.data()) + buf.size() };
    }
}

TEST_CASE("PayloadCodec: request keeps opcode, device, msg_id and state", "[codec][payload]") {
    auto format = GENERATE(PayloadFormat::Json, PayloadFormat::MsgPack);
    auto codec = makePayloadCodec(format);
    INFO("format " << codec->name());

    auto cmd = toggleCmd(true);
    auto req = codec->decodeRequest(codec->encodeRequest(cmd));

    REQUIRE(req);
    REQUIRE(req->opcode == Opcode::Toggle);
    REQUIRE(req->deviceId == "lamp-1");
    REQUIRE(req->msgId == cmd.msgId);
    REQUIRE(req->state == true);
}

TEST_CASE("PayloadCodec: ACK with state and NACK with error", "[codec][payload]") {
    auto format = GENERATE(PayloadFormat::Json, PayloadFormat::MsgPack);
    auto codec = makePayloadCodec(format);
    INFO("format " << codec->name());

    DeviceResponse ack{ Opcode::Toggle, "lamp-1", "aa", true, false, "" };
    auto a = codec->decodeResponse(codec->encodeResponse(ack));
    REQUIRE(a);
    REQUIRE(a->ack);
    REQUIRE(a->state == std::optional<bool>(false));
    REQUIRE(a->error.empty());

    DeviceResponse nack{ Opcode::Query, "lamp-1", "bb", false, std::nullopt, "busy" };
    auto n = codec->decodeResponse(codec->encodeResponse(nack));
    REQUIRE(n);
    REQUIRE(n->opcode == Opcode::Query);
    REQUIRE_FALSE(n->ack);
    REQUIRE_FALSE(n->state.has_value());
    REQUIRE(n->error == "busy");
}

TEST_CASE("PayloadCodec: garbage never throws", "[codec][payload]") {
    auto format = GENERATE(PayloadFormat::Json, PayloadFormat::MsgPack);
    auto codec = makePayloadCodec(format);
    INFO("format " << codec->name());

    std::vector<std::vector<uint8_t>> junk{
        {}, bytes("not json"), bytes("[1,2,3]"), { 0xC1 }, { 0x92, 0x01 }, bytes("{\"opcode\":")
    };
    for (const auto& j : junk) {
        REQUIRE_NOTHROW(codec->decodeRequest(j));
        REQUIRE_NOTHROW(codec->decodeResponse(j));
        REQUIRE_FALSE(codec->decodeResponse(j).has_value());
    }
}

TEST_CASE("JsonPayloadCodec: wire layout uses snake_case keys", "[codec][payload][json]") {
    JsonPayloadCodec c;
    auto raw = c.encodeRequest(toggleCmd(false));
    auto j = nlohmann::json::parse(raw.begin(), raw.end());

    REQUIRE(j["opcode"] == "toggle");
    REQUIRE(j["device_id"] == "lamp-1");
    REQUIRE(j["msg_id"] == "0123456789abcdef0123456789abcdef");
    REQUIRE(j["state"] == false);
    REQUIRE(std::string(c.name()) == "json");
}

TEST_CASE("JsonPayloadCodec: missing or mistyped fields are rejected", "[codec][payload][json]") {
    JsonPayloadCodec c;

    // response without ack
    REQUIRE_FALSE(c.decodeResponse(bytes(R"({"opcode":"toggle","msg_id":"x"})")));
    // ack must be a boolean
    REQUIRE_FALSE(c.decodeResponse(bytes(R"({"opcode":"toggle","msg_id":"x","ack":1})")));
    // unknown opcode
    REQUIRE_FALSE(c.decodeResponse(bytes(R"({"opcode":"dim","msg_id":"x","ack":true})")));
    // device_id is optional on responses
    REQUIRE(c.decodeResponse(bytes(R"({"opcode":"query","msg_id":"x","ack":true})")));

    // toggle needs a boolean state, query does not
    REQUIRE_FALSE(c.decodeRequest(bytes(R"({"opcode":"toggle","device_id":"d","msg_id":"x"})")));
    REQUIRE_FALSE(c.decodeRequest(bytes(R"({"opcode":"toggle","device_id":"d","msg_id":"x","state":"on"})")));
    REQUIRE(c.decodeRequest(bytes(R"({"opcode":"query","device_id":"d","msg_id":"x"})")));
}

TEST_CASE("MsgPackPayloadCodec: extra keys are ignored", "[codec][payload][msgpack]") {
    MsgPackPayloadCodec c;
    auto raw = packMap(5, [](auto& pk) {
        pk.pack(std::string("opcode"));  pk.pack(std::string("toggle"));
        pk.pack(std::string("msg_id"));  pk.pack(std::string("m1"));
        pk.pack(std::string("ack"));     pk.pack(true);
        pk.pack(std::string("rssi"));    pk.pack(-61);
        pk.pack(std::string("state"));   pk.pack(true);
    });

    auto r = c.decodeResponse(raw);
    REQUIRE(r);
    REQUIRE(r->msgId == "m1");
    REQUIRE(r->ack);
    REQUIRE(r->state == std::optional<bool>(true));
    REQUIRE(r->deviceId.empty());
}

TEST_CASE("MsgPackPayloadCodec: top level must be a map", "[codec][payload][msgpack]") {
    MsgPackPayloadCodec c;
    msgpack::sbuffer buf;
    msgpack::pack(buf, std::vector<int>{ 1, 2, 3 });
    std::vector<uint8_t> arr(reinterpret_cast<const uint8_t*>(buf.data()),
                             reinterpret_cast<const uint8_t*>(buf.data()) + buf.size());

    REQUIRE_FALSE(c.decodeResponse(arr));
    REQUIRE_FALSE(c.decodeRequest(arr));
    REQUIRE(std::string(c.name()) == "msgpack");
}

TEST_CASE("JsonPayloadCodec: invalid UTF-8 is replaced, not thrown", "[codec][payload][json]") {
    JsonPayloadCodec codec;
    auto cmd = toggleCmd(true);
    cmd.deviceId = "lamp\xff";

    std::vector<uint8_t> payload;
    REQUIRE_NOTHROW(payload = codec.encodeRequest(cmd));
    auto req = codec.decodeRequest(payload);
    REQUIRE(req);
    REQUIRE(req->deviceId == "lamp\xEF\xBF\xBD");
    REQUIRE(req->msgId == cmd.msgId);

    DeviceResponse rsp{ Opcode::Toggle, "lamp", cmd.msgId, false, std::nullopt, "bad \xfe byte" };
    REQUIRE_NOTHROW(codec.encodeResponse(rsp));
}
