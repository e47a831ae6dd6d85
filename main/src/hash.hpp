#pragma once

#include <string>
#include <filesystem>

// Hex SHA-256 digest of a file's content.
// Throws LtarException(IoFailure) if the file cannot be read.
std::string calculate_sha256(const std::filesystem::path& file_path);
