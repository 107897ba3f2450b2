/**
 * @file json_payload_codec.hpp
 * @brief JSON payload codec.
 *
 * Request:  {"opcode":"toggle","device_id":"...","msg_id":"<hex>","state":true}
 * Response: {"opcode":"toggle","device_id":"...","msg_id":"<hex>","ack":true,"state":true,"error":"..."}
 *
 * "state" and "error" are optional in responses.
 *
 * @date 2025
 */
#pragma once
#include "cmdrelay/core/interfaces/ipayload_codec.hpp"

namespace cmdrelay {

    /**
     * @class JsonPayloadCodec
     * @brief IPayloadCodec backed by nlohmann::json.
     */
    class JsonPayloadCodec : public IPayloadCodec {
    public:
        std::vector<uint8_t> encodeRequest(const Command& cmd) const override;
        std::optional<DeviceRequest> decodeRequest(const std::vector<uint8_t>& payload) const override;
        std::vector<uint8_t> encodeResponse(const DeviceResponse& rsp) const override;
        std::optional<DeviceResponse> decodeResponse(const std::vector<uint8_t>& payload) const override;
        const char* name() const override { return "json"; }
    };

}
