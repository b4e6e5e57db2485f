#include "StorageTiering.h"
#include "Checksum.h"
#include "FileOps.h"
#include "PartFile.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

TierResult StorageTiering::relocate(const std::string& scratchPath, const std::string& archivePath) {
    TierResult result;

    std::error_code ec;
    const auto parent = fs::path(archivePath).parent_path();
    if (!parent.empty())
        fs::create_directories(parent, ec);
    if (ec) {
        result.error = "cannot create archive dir: " + ec.message();
        return result;
    }

    fs::rename(scratchPath, archivePath, ec);
    if (!ec) {
        if (!syncDirectory(parent.empty() ? "." : parent.string()))
            result.warning = "archive directory sync failed: " + std::string(std::strerror(errno));
        result.ok = true;
        result.renamed = true;
        return result;
    }

    if (ec != std::errc::cross_device_link) {
        result.error = "rename failed: " + ec.message();
        return result;
    }

    return copyVerifyDelete(scratchPath, archivePath);
}

TierResult StorageTiering::copyVerifyDelete(const std::string& scratchPath, const std::string& archivePath) {
    TierResult result;
    const std::string partialPath = archivePath + ".partial";

    std::ifstream in(scratchPath, std::ios::binary);
    if (!in.is_open()) {
        result.error = "cannot open " + scratchPath;
        return result;
    }

    PartFile out(partialPath);
    if (!out.open()) {
        result.error = "cannot create " + partialPath + ": " + std::strerror(out.lastErrno());
        return result;
    }

    Crc32 sourceCrc;
    std::uint64_t copied = 0;
    std::vector<char> buffer(8 * 1024 * 1024);

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if (got <= 0)
            break;
        if (!out.write(buffer.data(), static_cast<std::size_t>(got))) {
            result.error = "copy failed: " + std::string(std::strerror(out.lastErrno()));
            out.close();
            std::error_code ec;
            fs::remove(partialPath, ec);
            return result;
        }
        sourceCrc.update(buffer.data(), static_cast<std::size_t>(got));
        copied += static_cast<std::uint64_t>(got);
    }

    const bool readFailed = in.bad();
    const bool synced = !readFailed && out.sync();
    out.close();

    std::error_code ec;
    if (readFailed || !synced) {
        result.error = readFailed ? "read failed on " + scratchPath : "sync failed on " + partialPath;
        fs::remove(partialPath, ec);
        return result;
    }

    auto sourceSize = regularFileSize(scratchPath);
    auto copySize = regularFileSize(partialPath);
    std::uint32_t copyCrc = 0;

    if (!sourceSize || !copySize || *sourceSize != copied || *copySize != copied
        || !Crc32::ofFile(partialPath, copyCrc) || copyCrc != sourceCrc.value()) {
        result.error = "archive copy verification failed";
        fs::remove(partialPath, ec);
        return result;
    }

    fs::rename(partialPath, archivePath, ec);
    if (ec) {
        result.error = "cannot move archive copy into place: " + ec.message();
        fs::remove(partialPath, ec);
        return result;
    }

    const auto parent = fs::path(archivePath).parent_path();
    if (!syncDirectory(parent.empty() ? "." : parent.string()))
        result.warning = "archive directory sync failed: " + std::string(std::strerror(errno));

    if (!fs::remove(scratchPath, ec) && ec)
        result.warning = "scratch copy left behind: " + ec.message();
    result.ok = true;
    return result;
}

std::string StorageTiering::uniqueArchivePath(const std::string& dir, const std::string& name) {
    fs::path candidate = fs::path(dir) / name;
    std::error_code ec;
    if (!fs::exists(candidate, ec))
        return candidate.string();

    const fs::path base(name);
    const std::string stem = base.stem().string();
    const std::string ext = base.extension().string();

    for (unsigned n = 1;; ++n) {
        candidate = fs::path(dir) / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate, ec))
            return candidate.string();
    }
}
