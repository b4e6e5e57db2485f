#pragma once
#include <vector>
#include <cstdint>
#include "utils.h"

class PartPlanner {
public:
    explicit PartPlanner(std::uint64_t partSize);

    // ceil(totalSize / partSize) contiguous parts, all Pending; none for an empty file.
    std::vector<Part> plan(std::uint64_t totalSize) const;

    std::uint64_t partSize() const { return size; }

private:
    std::uint64_t size;
};
