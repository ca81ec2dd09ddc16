#pragma once

// Always-on assert() for tests.
//
// Release builds usually define NDEBUG, which would compile the standard
// assert() away. Tests include this header after <cassert> and get an assert
// that is active in every build type and fails with a message on stderr.

#include <cassert>  // bring in the standard macro (and its header guard)

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace eegpad_test {

inline void fail(const char* expr, const char* file, int line) {
  std::cerr << "Test assertion failed: " << expr << " (" << file << ":" << line << ")\n";
  std::exit(1);
}

// Write text to path, creating parent directories.
inline void write_text(const std::filesystem::path& path, const std::string& text) {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::binary);
  out << text;
}

inline std::string read_bytes(const std::filesystem::path& path) {
  std::ifstream f(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

// Removes a scratch directory on entry and on scope exit.
struct ScratchDir {
  std::filesystem::path path;

  explicit ScratchDir(const std::string& name) : path(std::filesystem::u8path(name)) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path, ec);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

} // namespace eegpad_test

#ifndef EEGPAD_TEST_ASSERT
#define EEGPAD_TEST_ASSERT(expr) \
  (static_cast<bool>(expr) ? (void)0 : ::eegpad_test::fail(#expr, __FILE__, __LINE__))
#endif

#ifdef assert
#undef assert
#endif
#define assert(expr) EEGPAD_TEST_ASSERT(expr)
