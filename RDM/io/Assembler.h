#pragma once
#include <string>
#include <vector>
#include <optional>
#include "ScratchArea.h"
#include "../core/utils.h"

struct AssemblyResult {
    bool ok = false;
    std::string path;
    std::string error;
    std::optional<std::uint64_t> corruptPart; // re-fetch this one and retry
};

// Concatenates a job's part files, in index order, into one file on the
// scratch volume and checks the result against the plan.
class Assembler {
public:
    Assembler(const ScratchArea& scratch, bool verifyContent);

    AssemblyResult assemble(const Job& job, const std::vector<Part>& parts) const;
    void removeParts(const std::string& jobId, const std::vector<Part>& parts) const;

private:
    const ScratchArea& scratch;
    bool verify;
};
