#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

// Sequential writer for one part's scratch file. Not shared between threads:
// every part has its own file and exactly one owning worker.
class PartFile
{
public:
    explicit PartFile(const std::string& path);
    ~PartFile();

    PartFile(const PartFile&) = delete;
    PartFile& operator=(const PartFile&) = delete;

    // Creates or truncates the file.
    bool open();
    bool write(const char* data, std::size_t size);
    bool sync();
    void close();

    std::uint64_t written() const { return bytesWritten; }
    int lastErrno() const { return lastError; }

private:
    std::string filePath;
    std::uint64_t bytesWritten = 0;
    int fileHandle = -1;
    int lastError = 0;
};
