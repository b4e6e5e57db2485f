#pragma once
#include <string>

struct TierResult {
    bool ok = false;
    bool renamed = false; // atomic rename, no copy
    std::string error;
    std::string warning; // set when the move succeeded but a cleanup step did not
};

// Moves a finished file from the scratch volume to the archive volume.
// The scratch source is never deleted before the archive copy is verified.
class StorageTiering {
public:
    virtual ~StorageTiering() = default;

    virtual TierResult relocate(const std::string& scratchPath, const std::string& archivePath);

    // Cross-volume path: copy to <archive>.partial, fsync, compare length
    // and CRC with the source, rename into place, then delete the source.
    TierResult copyVerifyDelete(const std::string& scratchPath, const std::string& archivePath);

    // <dir>/<name>, or <dir>/<stem> (n)<ext> if that is taken.
    static std::string uniqueArchivePath(const std::string& dir, const std::string& name);
};
