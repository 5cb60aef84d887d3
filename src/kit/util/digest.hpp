#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

// Lowercase hex SHA-1, as published in the whisper.cpp model table.
namespace digest {

std::string sha1_hex(std::string_view data);
std::expected<std::string, std::string> sha1_file(const std::filesystem::path& path);

} // namespace digest
