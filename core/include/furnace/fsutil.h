#pragma once
#include <filesystem>
#include <string>

namespace furnace {

// Whole-file read. Returns error string (empty on success).
std::string read_file(const std::filesystem::path& p, std::string* out);

// Write to <dst>.tmp then rename over dst. Creates parent dirs.
std::string write_atomic(const std::filesystem::path& dst, const std::string& body);

// Recursively copy a flat or nested directory (regular files and dirs only).
std::string copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace furnace
