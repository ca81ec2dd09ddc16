#pragma once

#include "eegpad/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace eegpad {

// NumPy .npy (format version 1.0) support for float64 arrays.
//
// Layout written:
//   "\x93NUMPY" 0x01 0x00 <uint16 LE header_len>
//   "{'descr': '<f8', 'fortran_order': False, 'shape': (N, R, C), }"
//   padded with spaces and a trailing '\n' so the data starts at a multiple of 64,
//   followed by N*R*C little-endian IEEE-754 doubles in C (row-major) order.

// Header dict text (without padding) for a C-ordered '<f8' array of this shape.
std::string npy_header_dict(const std::vector<size_t>& shape);

// Serialize a block to .npy bytes.
std::string encode_npy(const DatasetBlock& block);

// Write a block to path (temporary file + rename).
//
// Throws std::runtime_error if the file cannot be written.
void write_npy(const std::string& path, const DatasetBlock& block);

struct NpyArray {
  std::vector<size_t> shape;
  std::vector<double> data;  // C order
};

// Read a C-ordered little-endian float64 .npy file (version 1.x or 2.x).
//
// Throws std::runtime_error on any other dtype/layout or on malformed input.
NpyArray read_npy(const std::string& path);

} // namespace eegpad
