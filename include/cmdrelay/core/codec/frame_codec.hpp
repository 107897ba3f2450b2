/**
 * @file frame_codec.hpp
 * @brief Wire framing for device traffic.
 *
 * Every frame is
 *
 *     [0xF0 0x0D][0x01][len:u32 big-endian][payload: len bytes]
 *
 * The codec is stateless. Callers accumulate bytes from the socket and call
 * tryDecode() again after every read; a nullopt result means "truncated, read
 * more". Wrong magic, unknown version and oversized length are rejected from
 * the header alone, before any payload is buffered.
 *
 * @date 2025
 */
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "cmdrelay/core/util/error_types.hpp"

namespace cmdrelay {

    namespace frame {
        constexpr std::array<uint8_t, 2> MAGIC{ 0xF0, 0x0D };
        constexpr uint8_t     VERSION      = 0x01;
        constexpr std::size_t HEADER_SIZE  = 2 + 1 + 4;
        constexpr std::size_t DEFAULT_MAX_PAYLOAD = 64 * 1024;
    }

    /**
     * @struct DecodedFrame
     * @brief One decoded frame and how many input bytes it used.
     */
    struct DecodedFrame {
        std::vector<uint8_t> payload;
        std::size_t          consumed{ 0 };
        uint8_t              version{ frame::VERSION };
    };

    /**
     * @class FrameCodec
     * @brief Encodes payloads into frames and decodes frames from a byte stream.
     */
    class FrameCodec {
    public:
        /**
         * @param maxPayload Largest payload accepted by encode() and by decode()
         */
        explicit FrameCodec(std::size_t maxPayload = frame::DEFAULT_MAX_PAYLOAD);

        /**
         * @brief Wrap @p payload into a frame.
         * @throws FrameError(FrameTooLarge) if payload.size() > maxPayload()
         */
        std::vector<uint8_t> encode(const std::vector<uint8_t>& payload) const;

        /**
         * @brief Decode the first frame in [data, data+len).
         * @return nullopt when more bytes are needed (TruncatedFrame)
         * @throws FrameError(BadMagic | UnsupportedVersion | FrameTooLarge)
         */
        std::optional<DecodedFrame> tryDecode(const uint8_t* data, std::size_t len) const;

        std::optional<DecodedFrame> tryDecode(const std::vector<uint8_t>& buf) const {
            return tryDecode(buf.data(), buf.size());
        }

        /**
         * @brief Like tryDecode() but a short buffer is an error too.
         * @throws FrameError, including FrameErr::TruncatedFrame
         */
        DecodedFrame decode(const std::vector<uint8_t>& buf) const;

        /**
         * @brief Total frame size announced by a complete header, or nullopt if the header is incomplete.
         *
         * Validates magic, version and length the same way tryDecode() does.
         */
        std::optional<std::size_t> frameSize(const uint8_t* data, std::size_t len) const;

        std::size_t maxPayload() const { return maxPayload_; }
        std::size_t maxFrameSize() const { return maxPayload_ + frame::HEADER_SIZE; }

    private:
        std::size_t maxPayload_;
    };

}
