#pragma once
#include <string>
#include <cstdint>
#include <optional>

// Writes content to path + ".tmp", fsyncs it, renames over path and fsyncs
// the parent directory. A crash leaves either the old or the new content.
bool writeFileDurably(const std::string& path, const std::string& content, std::string& error);

bool syncDirectory(const std::string& dirPath);

std::optional<std::uint64_t> regularFileSize(const std::string& path);
