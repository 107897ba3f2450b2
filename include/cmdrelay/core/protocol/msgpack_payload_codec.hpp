/**
 * @file msgpack_payload_codec.hpp
 * @brief MessagePack payload codec.
 *
 * Same keys as the JSON codec, packed as a MessagePack map. Useful for
 * devices with tight payload budgets.
 *
 * @date 2025
 */
#pragma once
#include "cmdrelay/core/interfaces/ipayload_codec.hpp"

namespace cmdrelay {

    /**
     * @class MsgPackPayloadCodec
     * @brief IPayloadCodec backed by msgpack-c.
     */
    class MsgPackPayloadCodec : public IPayloadCodec {
    public:
        /**
         * @brief Pack the request as a 4 entry map.
         */
        std::vector<uint8_t> encodeRequest(const Command& cmd) const override;

        /**
         * @brief Unpack a request map. Unknown keys are ignored.
         */
        std::optional<DeviceRequest> decodeRequest(const std::vector<uint8_t>& payload) const override;

        std::vector<uint8_t> encodeResponse(const DeviceResponse& rsp) const override;
        std::optional<DeviceResponse> decodeResponse(const std::vector<uint8_t>& payload) const override;
        const char* name() const override { return "msgpack"; }
    };

}
