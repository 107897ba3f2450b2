/**
 * @file ipayload_codec.hpp
 * @brief Interface for the payload encoding carried inside a frame.
 *
 * The frame envelope is fixed; what sits inside it is a pluggable codec so a
 * vendor specific layout can be swapped in without touching the transport.
 *
 * @date 2025
 */
#pragma once
#include <memory>
#include <optional>
#include <vector>
#include <cstdint>
#include "cmdrelay/core/types.hpp"
#include "cmdrelay/core/options.hpp"

namespace cmdrelay {

    /**
     * @class IPayloadCodec
     * @brief Converts requests and responses to and from payload bytes.
     *
     * Decoders never throw on malformed input: they return std::nullopt and the
     * caller treats the payload as uncorrelatable.
     */
    class IPayloadCodec {
    public:
        virtual ~IPayloadCodec() = default;

        /**
         * @brief Serialize the request for @p cmd.
         * @param cmd Command to encode (opcode, device_id, msg_id, desired state)
         * @return Payload bytes
         */
        virtual std::vector<uint8_t> encodeRequest(const Command& cmd) const = 0;

        virtual std::optional<DeviceRequest> decodeRequest(const std::vector<uint8_t>& payload) const = 0;

        virtual std::vector<uint8_t> encodeResponse(const DeviceResponse& rsp) const = 0;

        /**
         * @brief Parse a response payload.
         * @return nullopt if the payload is not a well-formed response
         */
        virtual std::optional<DeviceResponse> decodeResponse(const std::vector<uint8_t>& payload) const = 0;

        /**
         * @brief Short format name used in logs ("json", "msgpack").
         */
        virtual const char* name() const = 0;
    };

    /**
     * @brief Create the built-in codec for @p format.
     */
    std::shared_ptr<IPayloadCodec> makePayloadCodec(PayloadFormat format);

}
