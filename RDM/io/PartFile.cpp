#include "PartFile.h"

#include <cerrno>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <unistd.h>
#include <fcntl.h>
#endif

PartFile::PartFile(const std::string& path)
    : filePath(path) {
}

PartFile::~PartFile() {
    close();
}

bool PartFile::open() {
#ifdef _WIN32
    int flags = _O_BINARY | _O_WRONLY | _O_CREAT | _O_TRUNC;
    int mode = _S_IREAD | _S_IWRITE;
    fileHandle = _open(filePath.c_str(), flags, mode);
#else
    int flags = O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    fileHandle = ::open(filePath.c_str(), flags, 0644);
#endif

    if (fileHandle < 0) {
        lastError = errno;
        return false;
    }

    bytesWritten = 0;
    return true;
}

bool PartFile::write(const char* data, std::size_t size) {
    if (fileHandle < 0)
        return false;

    while (size > 0) {
#ifdef _WIN32
        int n = _write(fileHandle, data, static_cast<unsigned int>(size));
#else
        ssize_t n = ::write(fileHandle, data, size);
#endif
        if (n < 0) {
            if (errno == EINTR)
                continue;
            lastError = errno;
            return false;
        }

        data += n;
        size -= static_cast<std::size_t>(n);
        bytesWritten += static_cast<std::uint64_t>(n);
    }

    return true;
}

bool PartFile::sync() {
    if (fileHandle < 0)
        return false;

#ifdef _WIN32
    int rc = _commit(fileHandle);
#else
    int rc = fsync(fileHandle);
#endif
    if (rc != 0) {
        lastError = errno;
        return false;
    }
    return true;
}

void PartFile::close() {
    if (fileHandle >= 0) {
#ifdef _WIN32
        _close(fileHandle);
#else
        ::close(fileHandle);
#endif
        fileHandle = -1;
    }
}
