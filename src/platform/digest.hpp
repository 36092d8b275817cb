#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Lowercase hex MD5 of a file's bytes, the same token `md5sum` prints.
// Throws std::runtime_error if the file cannot be read.
std::string md5_file(const std::filesystem::path& path);

// Lowercase hex MD5 of an in-memory buffer.
std::string md5_hex(const std::string& data);

// True if the OpenSSL build in use provides MD5.
bool md5_available();

} // namespace platform
