#include "FileOps.h"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <unistd.h>
#include <fcntl.h>

namespace fs = std::filesystem;

namespace {
std::string describe(const std::string& what, const std::string& path, int err) {
    return what + " '" + path + "': " + std::strerror(err);
}
}

bool writeFileDurably(const std::string& path, const std::string& content, std::string& error) {
    const std::string tmpPath = path + ".tmp";

    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        error = describe("cannot create", tmpPath, errno);
        return false;
    }

    const char* data = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            error = describe("cannot write", tmpPath, errno);
            ::close(fd);
            ::unlink(tmpPath.c_str());
            return false;
        }
        data += n;
        left -= static_cast<std::size_t>(n);
    }

    if (fsync(fd) != 0) {
        error = describe("cannot sync", tmpPath, errno);
        ::close(fd);
        ::unlink(tmpPath.c_str());
        return false;
    }
    ::close(fd);

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        error = "cannot rename '" + tmpPath + "': " + ec.message();
        fs::remove(tmpPath, ec);
        return false;
    }

    const auto parent = fs::path(path).parent_path();
    if (!syncDirectory(parent.empty() ? "." : parent.string())) {
        error = describe("cannot sync directory", parent.string(), errno);
        return false;
    }

    return true;
}

bool syncDirectory(const std::string& dirPath) {
    int fd = ::open(dirPath.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0)
        return false;

    int rc = fsync(fd);
    ::close(fd);
    return rc == 0;
}

std::optional<std::uint64_t> regularFileSize(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return std::nullopt;

    auto size = fs::file_size(path, ec);
    if (ec)
        return std::nullopt;
    return static_cast<std::uint64_t>(size);
}
