#include "PartPlanner.h"

#include <algorithm>
#include <stdexcept>

PartPlanner::PartPlanner(std::uint64_t partSize)
    : size(partSize) {
    if (size == 0)
        throw std::invalid_argument("part size must be > 0");
}

std::vector<Part> PartPlanner::plan(std::uint64_t totalSize) const {
    std::vector<Part> parts;
    parts.reserve(static_cast<std::size_t>(totalSize / size + 1));

    std::uint64_t offset = 0;
    std::uint64_t index = 0;

    while (offset < totalSize) {
        Part part;
        part.index = index++;
        part.offset = offset;
        part.length = std::min<std::uint64_t>(size, totalSize - offset);
        part.state = PartState::Pending;

        parts.push_back(part);
        offset += part.length;
    }

    return parts;
}
