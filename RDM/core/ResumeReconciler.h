#pragma once
#include <string>
#include <vector>
#include "utils.h"
#include "../io/ScratchArea.h"

struct ReconcileSummary {
    std::size_t kept = 0;     // Done and backed by matching bytes
    std::size_t reset = 0;    // not Done in the manifest
    std::size_t corrupt = 0;  // Done in the manifest, bytes missing or different
    std::vector<std::uint64_t> corruptParts;
};

// Cross-checks manifest part states against the part files on scratch.
// Only persisted state and physical bytes count; a part stays Done only if
// its file has exactly the part's length (and CRC, when verifying).
class ResumeReconciler {
public:
    ResumeReconciler(const ScratchArea& scratch, bool verifyContent);

    ReconcileSummary reconcile(const std::string& jobId, std::vector<Part>& parts) const;

private:
    bool partIntact(const std::string& jobId, const Part& part) const;

private:
    const ScratchArea& scratch;
    bool verify;
};
