#pragma once
#include <cstdint>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"

// Every multi-byte field on the disc and in a DOL header is big-endian.
namespace gcdisc::bytes {

inline void requireAvailable(const std::vector<uint8_t>& data, size_t offset, size_t count, const char* what) {
    if (offset > data.size() || count > data.size() - offset) {
        throw FormatError(std::string("Truncated ") + what + ": need " + std::to_string(offset + count)
                          + " bytes, have " + std::to_string(data.size()));
    }
}

inline uint32_t readU32(const std::vector<uint8_t>& data, size_t offset) {
    requireAvailable(data, offset, 4, "u32 field");
    return (static_cast<uint32_t>(data[offset]) << 24) |
           (static_cast<uint32_t>(data[offset + 1]) << 16) |
           (static_cast<uint32_t>(data[offset + 2]) << 8) |
           static_cast<uint32_t>(data[offset + 3]);
}

// 3-byte field, zero-extended (FST name offsets).
inline uint32_t readU24(const std::vector<uint8_t>& data, size_t offset) {
    requireAvailable(data, offset, 3, "u24 field");
    return (static_cast<uint32_t>(data[offset]) << 16) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           static_cast<uint32_t>(data[offset + 2]);
}

inline void writeU32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
    if (data.size() < offset + 4) {
        data.resize(offset + 4);
    }
    data[offset] = static_cast<uint8_t>((value >> 24) & 0xFF);
    data[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[offset + 3] = static_cast<uint8_t>(value & 0xFF);
}

/**
 * @brief Read a zero-terminated string starting at @p offset, looking at most
 * @p maxLength bytes ahead. Without a terminator the whole window is returned.
 */
inline std::string readCString(const std::vector<uint8_t>& data, size_t offset, size_t maxLength) {
    std::string result;
    for (size_t i = offset; i < data.size() && i - offset < maxLength; ++i) {
        if (data[i] == 0) break;
        result.push_back(static_cast<char>(data[i]));
    }
    return result;
}

inline std::string hex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

} // namespace gcdisc::bytes
