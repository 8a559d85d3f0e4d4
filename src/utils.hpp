#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace docsync {

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string& data);
std::string sha256_hex(const std::string& data);
// Streams the file through SHA-256; empty string if it cannot be read.
std::string sha256_file_hex(const std::filesystem::path& path);

// Trims whitespace, leading "/" and "./". A trailing "/" is kept because it
// marks a directory.
std::string normalize_relative_path(const std::string& input);
std::string strip_trailing_slash(std::string path);

// Relative path of `absolute` under `root`, or empty if it is outside.
std::string relative_to(const std::filesystem::path& root, const std::filesystem::path& absolute);

// "60,90,180" -> {60s, 90s, 180s}; fractional seconds allowed. Empty on error.
std::vector<std::chrono::milliseconds> parse_schedule(const std::string& text, std::string& error);
std::string format_schedule(const std::vector<std::chrono::milliseconds>& schedule);

} // namespace docsync
