#pragma once

#include "stagehand/core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace stagehand::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
int64_t now_unix_ns();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void append_text(const fs::path& path, const std::string& text);

// Writes via a temporary sibling, fsync, rename and fsync of the parent
// directory. The file is durable when this returns.
void write_text_durable(const fs::path& path, const std::string& text);
void fsync_directory(const fs::path& dir);

// Hash utilities
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Stage/step names are lowercased with spaces replaced by '-'.
std::string translate_name(const std::string& name);

// Single-quotes a word for /bin/sh if it contains anything outside the
// portable safe set.
std::string shell_quote(const std::string& word);

// Glob pattern matching
bool has_glob_chars(const std::string& pattern);
bool glob_match(const std::string& pattern, const std::string& str);
std::vector<fs::path> glob(const fs::path& dir, const std::string& pattern);

// Expands wildcards in the final path component only.
std::vector<fs::path> expand_path_pattern(const fs::path& pattern);

} // namespace stagehand::core
