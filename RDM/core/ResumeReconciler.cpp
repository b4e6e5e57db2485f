#include "ResumeReconciler.h"
#include "../io/Checksum.h"

ResumeReconciler::ResumeReconciler(const ScratchArea& s, bool verifyContent)
    : scratch(s), verify(verifyContent) {
}

bool ResumeReconciler::partIntact(const std::string& jobId, const Part& part) const {
    auto onDisk = scratch.partLength(jobId, part.index);
    if (!onDisk || *onDisk != part.length)
        return false;

    if (verify && part.hasCrc) {
        std::uint32_t crc = 0;
        if (!Crc32::ofFile(scratch.partPath(jobId, part.index), crc) || crc != part.crc)
            return false;
    }
    return true;
}

ReconcileSummary ResumeReconciler::reconcile(const std::string& jobId, std::vector<Part>& parts) const {
    ReconcileSummary summary;

    for (auto& part : parts) {
        part.nextEligible = {};
        part.bytesReceived = 0;

        if (part.state == PartState::Done) {
            if (partIntact(jobId, part)) {
                part.lengthOnDisk = part.length;
                part.bytesReceived = part.length;
                ++summary.kept;
                continue;
            }

            part.state = PartState::Pending;
            part.lengthOnDisk = 0;
            part.hasCrc = false;
            ++summary.corrupt;
            summary.corruptParts.push_back(part.index);
            continue;
        }

        // InFlight, Failed, Pending and anything unknown: fetch again.
        part.state = PartState::Pending;
        part.lengthOnDisk = 0;
        part.hasCrc = false;
        ++summary.reset;
    }

    return summary;
}
