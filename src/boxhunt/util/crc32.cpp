#include <boxhunt/util/crc32.hpp>

#include <array>
#include <cstdio>

namespace boxhunt {

namespace {

const std::array<uint32_t, 256>& crc_table() {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t crc = i;
            for (int j = 0; j < 8; ++j) {
                crc = (crc >> 1) ^ ((crc & 1) ? 0xEDB88320u : 0u);
            }
            t[i] = crc;
        }
        return t;
    }();
    return table;
}

}  // namespace

uint32_t CRC32::compute(const uint8_t* data, size_t len) {
    const auto& table = crc_table();
    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

uint32_t CRC32::compute(const std::string& data) {
    return compute(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string CRC32::hex(const std::string& data) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", compute(data));
    return buf;
}

}  // namespace boxhunt
