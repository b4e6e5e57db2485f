#include "Checksum.h"

#include <array>
#include <fstream>
#include <vector>

namespace {
constexpr std::uint32_t kPolynomial = 0xEDB88320u;

std::array<std::uint32_t, 256> makeTable() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t value = i;
        for (int bit = 0; bit < 8; ++bit)
            value = (value & 1u) ? (value >> 1) ^ kPolynomial : value >> 1;
        table[i] = value;
    }
    return table;
}

const std::array<std::uint32_t, 256>& table() {
    static const auto t = makeTable();
    return t;
}
}

void Crc32::update(const char* data, std::size_t size) {
    if (!data || size == 0)
        return;

    const auto& t = table();
    for (std::size_t i = 0; i < size; ++i) {
        auto byte = static_cast<unsigned char>(data[i]);
        crc = (crc >> 8) ^ t[(crc ^ byte) & 0xFFu];
    }
}

bool Crc32::ofFile(const std::string& path, std::uint32_t& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return false;

    Crc32 acc;
    std::vector<char> buffer(1 << 20);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got <= 0)
            break;
        acc.update(buffer.data(), static_cast<std::size_t>(got));
    }

    if (in.bad())
        return false;

    out = acc.value();
    return true;
}
