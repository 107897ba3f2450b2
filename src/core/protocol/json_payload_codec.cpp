#include "cmdrelay/core/protocol/json_payload_codec.hpp"
#include "cmdrelay/core/protocol/msgpack_payload_codec.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace cmdrelay {

    using nlohmann::json;

    namespace {
        // invalid UTF-8 in an id becomes U+FFFD instead of throwing type_error 316
        std::vector<uint8_t> toBytes(const json& j) {
            const std::string s = j.dump(-1, ' ', false, json::error_handler_t::replace);
            return { s.begin(), s.end() };
        }

        std::optional<json> parseObject(const std::vector<uint8_t>& payload) {
            json j = json::parse(payload.begin(), payload.end(), nullptr, /*allow_exceptions=*/false);
            if (j.is_discarded() || !j.is_object()) return std::nullopt;
            return j;
        }

        bool readString(const json& j, const char* key, std::string& out) {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string()) return false;
            out = it->get<std::string>();
            return true;
        }

        bool readOpcode(const json& j, Opcode& out) {
            std::string s;
            if (!readString(j, "opcode", s)) return false;
            auto op = opcodeFromString(s);
            if (!op) return false;
            out = *op;
            return true;
        }
    }

    std::vector<uint8_t> JsonPayloadCodec::encodeRequest(const Command& cmd) const {
        return toBytes(json{
            { "opcode",    toString(cmd.opcode) },
            { "device_id", cmd.deviceId },
            { "msg_id",    cmd.msgId },
            { "state",     cmd.desiredState }
        });
    }

    std::optional<DeviceRequest> JsonPayloadCodec::decodeRequest(const std::vector<uint8_t>& payload) const {
        auto j = parseObject(payload);
        if (!j) return std::nullopt;

        DeviceRequest req;
        if (!readOpcode(*j, req.opcode)) return std::nullopt;
        if (!readString(*j, "device_id", req.deviceId)) return std::nullopt;
        if (!readString(*j, "msg_id", req.msgId)) return std::nullopt;

        auto st = j->find("state");
        if (st != j->end()) {
            if (!st->is_boolean()) return std::nullopt;
            req.state = st->get<bool>();
        }
        else if (req.opcode == Opcode::Toggle) {
            return std::nullopt;
        }
        return req;
    }

    std::vector<uint8_t> JsonPayloadCodec::encodeResponse(const DeviceResponse& rsp) const {
        json j{
            { "opcode",    toString(rsp.opcode) },
            { "device_id", rsp.deviceId },
            { "msg_id",    rsp.msgId },
            { "ack",       rsp.ack }
        };
        if (rsp.state) j["state"] = *rsp.state;
        if (!rsp.error.empty()) j["error"] = rsp.error;
        return toBytes(j);
    }

    std::optional<DeviceResponse> JsonPayloadCodec::decodeResponse(const std::vector<uint8_t>& payload) const {
        auto j = parseObject(payload);
        if (!j) return std::nullopt;

        DeviceResponse rsp;
        if (!readOpcode(*j, rsp.opcode)) return std::nullopt;
        if (!readString(*j, "msg_id", rsp.msgId)) return std::nullopt;
        readString(*j, "device_id", rsp.deviceId);

        auto ack = j->find("ack");
        if (ack == j->end() || !ack->is_boolean()) return std::nullopt;
        rsp.ack = ack->get<bool>();

        auto st = j->find("state");
        if (st != j->end() && st->is_boolean()) rsp.state = st->get<bool>();
        readString(*j, "error", rsp.error);
        return rsp;
    }

    std::shared_ptr<IPayloadCodec> makePayloadCodec(PayloadFormat format) {
        switch (format) {
            case PayloadFormat::Json:    return std::make_shared<JsonPayloadCodec>();
            case PayloadFormat::MsgPack: return std::make_shared<MsgPackPayloadCodec>();
        }
        throw std::invalid_argument("makePayloadCodec: unknown format");
    }

}
