#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace eegpad {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Many CSV exporters (notably some Windows tools) emit a BOM, which can break
// header parsing if not removed.
std::string strip_utf8_bom(std::string s);

// Split one physical CSV line into fields.
//
// Supports quoted fields with "" escaping. Throws std::runtime_error on an
// unterminated quoted field.
std::vector<std::string> split_csv_row(const std::string& row, char delim);

std::string to_lower(std::string s);

// Return the first whitespace-separated word of s (empty if s is blank).
std::string first_word(const std::string& s);

bool directory_exists(const std::string& path);
void ensure_directory(const std::string& path);

// Random lowercase hex string of 2*n_bytes characters.
std::string random_hex_token(size_t n_bytes = 16);

// Write bytes to a temporary file in the destination directory, then rename it
// into place. Returns false on failure (the temporary file is removed).
bool write_file_atomic(const std::string& path, const std::string& content);

// Minimal JSON string escape (no surrounding quotes).
std::string json_escape(const std::string& s);

} // namespace eegpad
