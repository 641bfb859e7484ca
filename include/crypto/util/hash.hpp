#pragma once

#include <string>
#include <string_view>
#include <filesystem>

namespace osync::crypto::hash {

// Initializes libsodium once per process. Throws if the library cannot start.
void init();

// Lowercase hex SHA-256 of the file's content, read in chunks.
std::string sha256(const std::filesystem::path& filepath);

std::string sha256(std::string_view data);

}
