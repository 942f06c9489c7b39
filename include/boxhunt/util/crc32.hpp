#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace boxhunt {

/**
 * CRC32 (IEEE 802.3), used to derive short stable tokens from URLs for
 * image filenames. The lookup table is built once, thread-safely.
 */
class CRC32 {
public:
    static uint32_t compute(const uint8_t* data, size_t len);
    static uint32_t compute(const std::string& data);

    // Eight lower-case hex digits, zero padded
    static std::string hex(const std::string& data);
};

}  // namespace boxhunt
