#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

// CRC-32 (IEEE 802.3), fed incrementally as part bytes arrive.
class Crc32 {
public:
    void update(const char* data, std::size_t size);
    std::uint32_t value() const { return crc ^ 0xFFFFFFFFu; }

    // CRC of a whole file; false if it cannot be read.
    static bool ofFile(const std::string& path, std::uint32_t& out);

private:
    std::uint32_t crc = 0xFFFFFFFFu;
};
