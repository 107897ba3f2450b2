/**
 * @file byteorder.hpp
 * @brief Big-endian helpers for the frame length field.
 *
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <cstring>
#ifdef _WIN32
#include <intrin.h>
#else
#include <endian.h>
#endif

namespace cmdrelay {
    /**
     * @brief Converts a 32-bit integer from host to network byte order (big endian).
     * @param value The value to convert.
     * @return The value in network byte order.
     */
    inline uint32_t hostToNetwork32(uint32_t value) {
#ifdef _WIN32
        return _byteswap_ulong(value);
#else
        return htobe32(value);
#endif
    }

    /**
     * @brief Converts a 32-bit integer from network byte order (big endian) to host byte order.
     * @param value The value to convert.
     * @return The value in host byte order.
     */
    inline uint32_t networkToHost32(uint32_t value) {
#ifdef _WIN32
        return _byteswap_ulong(value);
#else
        return be32toh(value);
#endif
    }

    /**
     * @brief Read a big-endian u32 from an unaligned buffer.
     */
    inline uint32_t readBe32(const uint8_t* p) {
        uint32_t raw;
        std::memcpy(&raw, p, sizeof(raw));
        return networkToHost32(raw);
    }

    /**
     * @brief Write a u32 as big-endian into an unaligned buffer.
     */
    inline void writeBe32(uint8_t* p, uint32_t value) {
        uint32_t raw = hostToNetwork32(value);
        std::memcpy(p, &raw, sizeof(raw));
    }
}
