#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace optiraid::storage::common {

// Lowercase hex SHA-256.
std::string Sha256Hex(std::string_view data);
std::string Sha256HexOfFile(const std::filesystem::path& path);

} // namespace optiraid::storage::common
