#include "Assembler.h"
#include "Checksum.h"
#include "FileOps.h"
#include "PartFile.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

Assembler::Assembler(const ScratchArea& s, bool verifyContent)
    : scratch(s), verify(verifyContent) {
}

AssemblyResult Assembler::assemble(const Job& job, const std::vector<Part>& parts) const {
    AssemblyResult result;
    result.path = scratch.assembledPath(job.id, job.targetName);

    std::string err;
    if (!scratch.ensureJobDir(job.id, err)) {
        result.error = err;
        return result;
    }

    PartFile out(result.path);
    if (!out.open()) {
        result.error = "cannot create assembled file: " + std::string(std::strerror(out.lastErrno()));
        return result;
    }

    std::vector<char> buffer(8 * 1024 * 1024);
    std::uint64_t expectedOffset = 0;

    for (const auto& part : parts) {
        if (part.offset != expectedOffset) {
            result.error = "part " + std::to_string(part.index) + " is not contiguous";
            return result;
        }

        std::ifstream in(scratch.partPath(job.id, part.index), std::ios::binary);
        if (!in.is_open()) {
            result.corruptPart = part.index;
            result.error = "missing part file " + std::to_string(part.index);
            return result;
        }

        Crc32 crc;
        std::uint64_t copied = 0;
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = in.gcount();
            if (got <= 0)
                break;
            if (!out.write(buffer.data(), static_cast<std::size_t>(got))) {
                result.error = "write failed: " + std::string(std::strerror(out.lastErrno()));
                return result;
            }
            crc.update(buffer.data(), static_cast<std::size_t>(got));
            copied += static_cast<std::uint64_t>(got);
        }

        if (in.bad() || copied != part.length || (verify && part.hasCrc && crc.value() != part.crc)) {
            result.corruptPart = part.index;
            result.error = "part " + std::to_string(part.index) + " does not match its manifest entry";
            return result;
        }

        expectedOffset += part.length;
    }

    if (!out.sync()) {
        result.error = "sync failed: " + std::string(std::strerror(out.lastErrno()));
        return result;
    }
    out.close();

    const std::uint64_t total = job.totalSize.value_or(0);
    auto size = regularFileSize(result.path);
    if (!size || *size != total || expectedOffset != total) {
        result.error = "assembled size mismatch: " + std::to_string(size.value_or(0))
            + " of " + std::to_string(total) + " bytes";
        return result;
    }

    if (!syncDirectory(scratch.outputDir(job.id))) {
        result.error = "cannot sync " + scratch.outputDir(job.id) + ": " + std::strerror(errno);
        return result;
    }
    result.ok = true;
    return result;
}

void Assembler::removeParts(const std::string& jobId, const std::vector<Part>& parts) const {
    for (const auto& part : parts)
        scratch.removePart(jobId, part.index);
}
