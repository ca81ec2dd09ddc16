#include "eegpad/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

namespace eegpad {

namespace fs = std::filesystem;

namespace {

const char kHexDigits[] = "0123456789abcdef";

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void remove_quietly(const fs::path& p) {
  std::error_code ec;
  fs::remove(p, ec);
}

} // namespace

std::string trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), is_space);
  const auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  return (first < last) ? std::string(first, last) : std::string();
}

std::string strip_utf8_bom(std::string s) {
  static const std::string kBom = "\xEF\xBB\xBF";
  if (s.compare(0, kBom.size(), kBom) == 0) s.erase(0, kBom.size());
  return s;
}

std::vector<std::string> split_csv_row(const std::string& row, char delim) {
  std::vector<std::string> fields(1);
  bool quoted = false;

  for (size_t i = 0; i < row.size(); ++i) {
    const char c = row[i];
    std::string& cur = fields.back();

    if (quoted) {
      if (c != '"') {
        cur.push_back(c);
      } else if (i + 1 < row.size() && row[i + 1] == '"') {
        cur.push_back('"');
        ++i;
      } else {
        quoted = false;
      }
    } else if (c == delim) {
      fields.emplace_back();
    } else if (c == '"' && cur.empty()) {
      quoted = true;
    } else if (c != '\r') {
      // getline() leaves a trailing '\r' on CRLF input.
      cur.push_back(c);
    }
  }

  if (quoted) throw std::runtime_error("split_csv_row: unterminated quoted field");
  return fields;
}

std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string first_word(const std::string& s) {
  const std::string t = trim(s);
  return t.substr(0, static_cast<size_t>(std::find_if(t.begin(), t.end(), is_space) - t.begin()));
}

bool directory_exists(const std::string& path) {
  std::error_code ec;
  return fs::is_directory(fs::u8path(path), ec);
}

void ensure_directory(const std::string& path) {
  fs::create_directories(fs::u8path(path));
}

std::string random_hex_token(size_t n_bytes) {
  std::random_device rd;
  std::mt19937_64 rng((static_cast<uint64_t>(rd()) << 32) | rd());

  std::string out;
  out.reserve(n_bytes * 2);
  uint64_t bits = 0;
  for (size_t i = 0; i < n_bytes; ++i) {
    if (i % 8 == 0) bits = rng();
    const unsigned b = static_cast<unsigned>(bits & 0xFF);
    bits >>= 8;
    out.push_back(kHexDigits[b >> 4]);
    out.push_back(kHexDigits[b & 0x0F]);
  }
  return out;
}

bool write_file_atomic(const std::string& path, const std::string& content) {
  const fs::path target = fs::u8path(path);
  std::error_code ec;
  if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

  // Temporary sibling, so the final rename never crosses a filesystem.
  fs::path tmp;
  do {
    tmp = target;
    tmp += fs::u8path(".tmp." + random_hex_token(8));
  } while (fs::exists(tmp, ec));

  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out) {
    remove_quietly(tmp);
    return false;
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    // Windows refuses to rename onto an existing file.
    remove_quietly(target);
    ec.clear();
    fs::rename(tmp, target, ec);
  }
  if (ec) {
    remove_quietly(tmp);
    return false;
  }
  return true;
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20) {
          out += "\\u00";
          out.push_back(kHexDigits[uc >> 4]);
          out.push_back(kHexDigits[uc & 0x0F]);
        } else {
          out.push_back(c);
        }
      }
    }
  }
  return out;
}

} // namespace eegpad
