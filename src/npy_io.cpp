#include "eegpad/npy_io.hpp"

#include "eegpad/utils.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace eegpad {

namespace {

const char kMagic[] = "\x93NUMPY";
const size_t kMagicLen = 6;
const size_t kAlign = 64;

void append_u16_le(std::string* out, uint16_t v) {
  out->push_back(static_cast<char>(v & 0xFF));
  out->push_back(static_cast<char>((v >> 8) & 0xFF));
}

void append_f64_le(std::string* out, double d) {
  uint64_t u = 0;
  static_assert(sizeof(u) == sizeof(d), "double must be 64-bit");
  std::memcpy(&u, &d, sizeof(u));
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<char>((u >> (8 * i)) & 0xFF));
  }
}

uint32_t read_u32_le(const unsigned char* p) {
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

double read_f64_le(const unsigned char* p) {
  uint64_t u = 0;
  for (int i = 0; i < 8; ++i) {
    u |= static_cast<uint64_t>(p[i]) << (8 * i);
  }
  double d = 0.0;
  std::memcpy(&d, &u, sizeof(d));
  return d;
}

// Value text following "'key':" in a header dict, up to the next top-level ','
// or '}' (parentheses are kept together).
std::string dict_value(const std::string& dict, const std::string& key) {
  const std::string k = "'" + key + "'";
  size_t pos = dict.find(k);
  if (pos == std::string::npos) throw std::runtime_error("npy: header missing key " + k);
  pos = dict.find(':', pos + k.size());
  if (pos == std::string::npos) throw std::runtime_error("npy: malformed header near " + k);
  ++pos;

  int depth = 0;
  size_t end = pos;
  for (; end < dict.size(); ++end) {
    const char c = dict[end];
    if (c == '(') ++depth;
    else if (c == ')') --depth;
    else if ((c == ',' || c == '}') && depth == 0) break;
  }
  return trim(dict.substr(pos, end - pos));
}

std::vector<size_t> parse_shape_tuple(const std::string& v) {
  if (v.size() < 2 || v.front() != '(' || v.back() != ')') {
    throw std::runtime_error("npy: malformed shape '" + v + "'");
  }
  std::vector<size_t> shape;
  const std::string inner = v.substr(1, v.size() - 2);
  std::string tok;
  std::istringstream iss(inner);
  while (std::getline(iss, tok, ',')) {
    tok = trim(tok);
    if (tok.empty()) continue;
    for (char c : tok) {
      if (c < '0' || c > '9') throw std::runtime_error("npy: malformed shape '" + v + "'");
    }
    shape.push_back(static_cast<size_t>(std::stoull(tok)));
  }
  return shape;
}

} // namespace

std::string npy_header_dict(const std::vector<size_t>& shape) {
  std::ostringstream oss;
  oss << "{'descr': '<f8', 'fortran_order': False, 'shape': (";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << shape[i];
  }
  if (shape.size() == 1) oss << ",";
  oss << "), }";
  return oss.str();
}

std::string encode_npy(const DatasetBlock& block) {
  const size_t n = block.n_trials * block.n_rows * block.n_cols;
  if (block.data.size() != n) {
    throw std::runtime_error("encode_npy: data size does not match block shape");
  }

  std::string dict = npy_header_dict({block.n_trials, block.n_rows, block.n_cols});

  // magic + version + header_len, then dict + padding + '\n'.
  const size_t prefix = kMagicLen + 2 + 2;
  const size_t total = prefix + dict.size() + 1;
  const size_t padded = ((total + kAlign - 1) / kAlign) * kAlign;
  dict.append(padded - total, ' ');
  dict.push_back('\n');

  const size_t header_len = dict.size();
  if (header_len > 0xFFFFu) throw std::runtime_error("encode_npy: header too large");

  std::string out;
  out.reserve(prefix + header_len + n * 8);
  out.append(kMagic, kMagicLen);
  out.push_back(static_cast<char>(1));  // major
  out.push_back(static_cast<char>(0));  // minor
  append_u16_le(&out, static_cast<uint16_t>(header_len));
  out += dict;
  for (double v : block.data) append_f64_le(&out, v);
  return out;
}

void write_npy(const std::string& path, const DatasetBlock& block) {
  const std::string bytes = encode_npy(block);
  if (!write_file_atomic(path, bytes)) {
    throw std::runtime_error("Failed to write NPY: " + path);
  }
}

NpyArray read_npy(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open NPY: " + path);
  const std::string bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  const unsigned char* p = reinterpret_cast<const unsigned char*>(bytes.data());

  if (bytes.size() < kMagicLen + 4 || bytes.compare(0, kMagicLen, kMagic, kMagicLen) != 0) {
    throw std::runtime_error("npy: bad magic in " + path);
  }

  const unsigned ver_major = p[kMagicLen];
  size_t header_len = 0;
  size_t data_off = 0;
  if (ver_major == 1) {
    header_len = static_cast<size_t>(p[kMagicLen + 2]) |
                 (static_cast<size_t>(p[kMagicLen + 3]) << 8);
    data_off = kMagicLen + 4 + header_len;
  } else if (ver_major == 2 || ver_major == 3) {
    if (bytes.size() < kMagicLen + 6) throw std::runtime_error("npy: truncated header in " + path);
    header_len = read_u32_le(p + kMagicLen + 2);
    data_off = kMagicLen + 6 + header_len;
  } else {
    throw std::runtime_error("npy: unsupported format version " + std::to_string(ver_major));
  }
  if (data_off > bytes.size()) throw std::runtime_error("npy: truncated header in " + path);

  const std::string dict = bytes.substr(data_off - header_len, header_len);
  const std::string descr = dict_value(dict, "descr");
  if (descr != "'<f8'") throw std::runtime_error("npy: unsupported dtype " + descr);
  if (dict_value(dict, "fortran_order") != "False") {
    throw std::runtime_error("npy: Fortran-ordered arrays are not supported");
  }

  NpyArray a;
  a.shape = parse_shape_tuple(dict_value(dict, "shape"));
  size_t n = 1;
  for (size_t s : a.shape) n *= s;

  if (bytes.size() - data_off != n * 8) {
    throw std::runtime_error("npy: payload size does not match shape in " + path);
  }
  a.data.resize(n);
  for (size_t i = 0; i < n; ++i) {
    a.data[i] = read_f64_le(p + data_off + i * 8);
  }
  return a;
}

} // namespace eegpad
