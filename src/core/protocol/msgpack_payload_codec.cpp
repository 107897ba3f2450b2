#include "cmdrelay/core/protocol/msgpack_payload_codec.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <msgpack.hpp>
#include <string>

namespace cmdrelay {

    namespace {
        std::vector<uint8_t> toBytes(const msgpack::sbuffer& buf) {
            return { reinterpret_cast<const uint8_t*>(buf.data()),
                     reinterpret_cast<const uint8_t*>(buf.data()) + buf.size() };
        }

        void packKey(msgpack::packer<msgpack::sbuffer>& pk, const char* key) {
            pk.pack(std::string(key));
        }

        /// Flat view over the top-level map; values keep pointing into the object_handle.
        struct MapView {
            const msgpack::object* opcode{ nullptr };
            const msgpack::object* deviceId{ nullptr };
            const msgpack::object* msgId{ nullptr };
            const msgpack::object* state{ nullptr };
            const msgpack::object* ack{ nullptr };
            const msgpack::object* error{ nullptr };
        };

        bool viewMap(const msgpack::object& obj, MapView& v) {
            if (obj.type != msgpack::type::MAP) return false;
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const auto& kv = obj.via.map.ptr[i];
                if (kv.key.type != msgpack::type::STR) continue;
                std::string key(kv.key.via.str.ptr, kv.key.via.str.size);

                if (key == "opcode")         v.opcode = &kv.val;
                else if (key == "device_id") v.deviceId = &kv.val;
                else if (key == "msg_id")    v.msgId = &kv.val;
                else if (key == "state")     v.state = &kv.val;
                else if (key == "ack")       v.ack = &kv.val;
                else if (key == "error")     v.error = &kv.val;
            }
            return true;
        }

        bool readString(const msgpack::object* o, std::string& out) {
            if (!o) return false;
            if (o->type == msgpack::type::STR) {
                out.assign(o->via.str.ptr, o->via.str.size);
                return true;
            }
            if (o->type == msgpack::type::BIN) {
                out.assign(o->via.bin.ptr, o->via.bin.size);
                return true;
            }
            return false;
        }

        bool readBool(const msgpack::object* o, bool& out) {
            if (!o || o->type != msgpack::type::BOOLEAN) return false;
            out = o->via.boolean;
            return true;
        }

        bool readOpcode(const msgpack::object* o, Opcode& out) {
            std::string s;
            if (!readString(o, s)) return false;
            auto op = opcodeFromString(s);
            if (!op) return false;
            out = *op;
            return true;
        }

        std::optional<msgpack::object_handle> unpack(const std::vector<uint8_t>& payload) {
            if (payload.empty()) return std::nullopt;
            try {
                return msgpack::unpack(reinterpret_cast<const char*>(payload.data()), payload.size());
            }
            catch (const std::exception& e) {
                LOG_DEBUG(std::string("msgpack unpack failed: ") + e.what());
                return std::nullopt;
            }
        }
    }

    std::vector<uint8_t> MsgPackPayloadCodec::encodeRequest(const Command& cmd) const {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(&buf);

        pk.pack_map(4);
        packKey(pk, "opcode");    pk.pack(std::string(toString(cmd.opcode)));
        packKey(pk, "device_id"); pk.pack(cmd.deviceId);
        packKey(pk, "msg_id");    pk.pack(cmd.msgId);
        packKey(pk, "state");     pk.pack(cmd.desiredState);
        return toBytes(buf);
    }

    std::optional<DeviceRequest> MsgPackPayloadCodec::decodeRequest(const std::vector<uint8_t>& payload) const {
        auto oh = unpack(payload);
        if (!oh) return std::nullopt;

        MapView v;
        if (!viewMap(oh->get(), v)) return std::nullopt;

        DeviceRequest req;
        if (!readOpcode(v.opcode, req.opcode)) return std::nullopt;
        if (!readString(v.deviceId, req.deviceId)) return std::nullopt;
        if (!readString(v.msgId, req.msgId)) return std::nullopt;
        if (!readBool(v.state, req.state) && req.opcode == Opcode::Toggle) return std::nullopt;
        return req;
    }

    std::vector<uint8_t> MsgPackPayloadCodec::encodeResponse(const DeviceResponse& rsp) const {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(&buf);

        uint32_t n = 4;
        if (rsp.state) ++n;
        if (!rsp.error.empty()) ++n;

        pk.pack_map(n);
        packKey(pk, "opcode");    pk.pack(std::string(toString(rsp.opcode)));
        packKey(pk, "device_id"); pk.pack(rsp.deviceId);
        packKey(pk, "msg_id");    pk.pack(rsp.msgId);
        packKey(pk, "ack");       pk.pack(rsp.ack);
        if (rsp.state) {
            packKey(pk, "state"); pk.pack(*rsp.state);
        }
        if (!rsp.error.empty()) {
            packKey(pk, "error"); pk.pack(rsp.error);
        }
        return toBytes(buf);
    }

    std::optional<DeviceResponse> MsgPackPayloadCodec::decodeResponse(const std::vector<uint8_t>& payload) const {
        auto oh = unpack(payload);
        if (!oh) return std::nullopt;

        MapView v;
        if (!viewMap(oh->get(), v)) return std::nullopt;

        DeviceResponse rsp;
        if (!readOpcode(v.opcode, rsp.opcode)) return std::nullopt;
        if (!readString(v.msgId, rsp.msgId)) return std::nullopt;
        if (!readBool(v.ack, rsp.ack)) return std::nullopt;
        readString(v.deviceId, rsp.deviceId);
        readString(v.error, rsp.error);

        bool st = false;
        if (readBool(v.state, st)) rsp.state = st;
        return rsp;
    }

}
