/**
 * @file hex.hpp
 * @brief Hex rendering for msg_ids and for raw frame dumps in logs.
 *
 * @date 2025
 */
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace cmdrelay {

    namespace detail {
        inline void appendHexByte(std::string& out, uint8_t b) {
            constexpr char digits[] = "0123456789abcdef";
            out += digits[b >> 4];
            out += digits[b & 0x0F];
        }
    }

    /**
     * @brief 16 bytes as 32 lowercase hex characters (the msg_id format).
     */
    inline std::string toHex(const std::array<uint8_t, 16>& buf) {
        std::string out;
        out.reserve(buf.size() * 2);
        for (uint8_t b : buf)
            detail::appendHexByte(out, b);
        return out;
    }

    /**
     * @brief Space separated dump ("f0 0d 01 ..."), cut after @p limit bytes.
     */
    inline std::string hexDump(const std::vector<uint8_t>& buf, std::size_t limit = 64) {
        const std::size_t n = buf.size() < limit ? buf.size() : limit;
        std::string out;
        out.reserve(n * 3 + 4);
        for (std::size_t i = 0; i < n; ++i) {
            if (i) out += ' ';
            detail::appendHexByte(out, buf[i]);
        }
        if (n < buf.size()) out += " ...";
        return out;
    }

}
