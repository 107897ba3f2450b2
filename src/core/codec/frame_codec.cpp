#include "cmdrelay/core/codec/frame_codec.hpp"
#include "cmdrelay/core/util/byteorder.hpp"
#include "cmdrelay/core/util/logger.hpp"
#include <format>
#include <limits>

namespace cmdrelay {

    FrameCodec::FrameCodec(std::size_t maxPayload)
        : maxPayload_(maxPayload)
    {
        if (maxPayload_ == 0 || maxPayload_ > std::numeric_limits<uint32_t>::max())
            throw std::invalid_argument("FrameCodec: maxPayload out of range");
    }

    std::vector<uint8_t> FrameCodec::encode(const std::vector<uint8_t>& payload) const {
        if (payload.size() > maxPayload_) {
            throw FrameError(FrameErr::FrameTooLarge,
                std::format("payload of {} bytes exceeds limit of {}", payload.size(), maxPayload_));
        }

        std::vector<uint8_t> buf(frame::HEADER_SIZE + payload.size());
        buf[0] = frame::MAGIC[0];
        buf[1] = frame::MAGIC[1];
        buf[2] = frame::VERSION;
        writeBe32(buf.data() + 3, static_cast<uint32_t>(payload.size()));
        std::copy(payload.begin(), payload.end(), buf.begin() + frame::HEADER_SIZE);
        return buf;
    }

    std::optional<std::size_t> FrameCodec::frameSize(const uint8_t* data, std::size_t len) const {
        // magic is checked byte by byte, before the header is complete
        for (std::size_t i = 0; i < frame::MAGIC.size() && i < len; ++i) {
            if (data[i] != frame::MAGIC[i]) {
                throw FrameError(FrameErr::BadMagic,
                    std::format("bad magic byte {:#04x} at offset {}", data[i], i));
            }
        }
        if (len < 3) return std::nullopt;

        if (data[2] != frame::VERSION) {
            throw FrameError(FrameErr::UnsupportedVersion,
                std::format("unsupported frame version {:#04x}", data[2]));
        }
        if (len < frame::HEADER_SIZE) return std::nullopt;

        const uint32_t payloadLen = readBe32(data + 3);
        if (payloadLen > maxPayload_) {
            throw FrameError(FrameErr::FrameTooLarge,
                std::format("announced payload of {} bytes exceeds limit of {}", payloadLen, maxPayload_));
        }
        return frame::HEADER_SIZE + static_cast<std::size_t>(payloadLen);
    }

    std::optional<DecodedFrame> FrameCodec::tryDecode(const uint8_t* data, std::size_t len) const {
        auto total = frameSize(data, len);
        if (!total || len < *total) return std::nullopt;

        DecodedFrame out;
        out.version = data[2];
        out.payload.assign(data + frame::HEADER_SIZE, data + *total);
        out.consumed = *total;
        return out;
    }

    DecodedFrame FrameCodec::decode(const std::vector<uint8_t>& buf) const {
        auto f = tryDecode(buf.data(), buf.size());
        if (!f) {
            throw FrameError(FrameErr::TruncatedFrame,
                std::format("need more bytes (have {})", buf.size()));
        }
        return std::move(*f);
    }

}
