#include "eegpad/csv_reader.hpp"

#include "eegpad/utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace eegpad {

namespace {

size_t count_delim_outside_quotes(const std::string& s, char delim) {
  bool in_quotes = false;
  size_t n = 0;

  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      if (in_quotes && (i + 1) < s.size() && s[i + 1] == '"') {
        // Escaped quote
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

char detect_delim(const std::string& header_line) {
  // Comma is the default, but some exports use ';' or tab depending on
  // locale/software. Delimiters inside quoted channel labels are ignored.
  const size_t n_comma = count_delim_outside_quotes(header_line, ',');
  const size_t n_semi  = count_delim_outside_quotes(header_line, ';');
  const size_t n_tab   = count_delim_outside_quotes(header_line, '\t');

  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) {
    best = '\t';
    best_n = n_tab;
  }
  return best;
}

bool is_nan_like(const std::string& t) {
  const std::string low = to_lower(t);
  return low == "nan" || low == "na" || low == "n/a" || low == "none" || low == "null";
}

bool is_index_column_name(const std::string& name) {
  const std::string t = trim(name);
  if (t.empty()) return true;
  return t == "Unnamed: 0";
}

double parse_double_strict(const std::string& s) {
  // NOTE: Avoid std::stod here: it relies on the current C locale (LC_NUMERIC),
  // which can cause "0.004" to mis-parse in decimal-comma locales.
  const std::string t = trim(s);
  if (t.empty()) throw std::runtime_error("CSV: empty numeric cell");

  const std::string low = to_lower(t);
  if (low == "inf" || low == "+inf" || low == "infinity" || low == "+infinity") {
    return std::numeric_limits<double>::infinity();
  }
  if (low == "-inf" || low == "-infinity") {
    return -std::numeric_limits<double>::infinity();
  }

  std::istringstream iss(t);
  iss.imbue(std::locale::classic());
  double v = 0.0;
  iss >> v;
  if (!iss) {
    throw std::runtime_error(std::string("CSV: failed to parse double '") + t + "'");
  }

  // Allow trailing whitespace, but reject any other trailing characters.
  iss >> std::ws;
  if (!iss.eof()) {
    std::string rest;
    std::getline(iss, rest);
    if (rest.size() > 64) rest = rest.substr(0, 64) + "...";
    std::ostringstream oss;
    oss << "CSV: failed to strictly parse double '" << t << "' (trailing '" << rest << "')";
    throw std::runtime_error(oss.str());
  }
  return v;
}

} // namespace

TrialTable CSVReader::read(const std::string& path) const {
  std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
  if (!f) throw std::runtime_error("Failed to open CSV: " + path);

  std::string line;
  size_t lineno = 0;

  // Header: first non-blank line.
  std::string header;
  bool have_header = false;
  while (std::getline(f, line)) {
    ++lineno;
    if (lineno == 1) line = strip_utf8_bom(line);
    if (trim(line).empty()) continue;
    header = line;
    have_header = true;
    break;
  }
  if (!have_header) throw std::runtime_error("CSV: missing header row");

  const char delim = detect_delim(header);
  std::vector<std::string> cols = split_csv_row(header, delim);
  for (auto& c : cols) c = trim(c);

  size_t first_data_col = 0;
  if (cols.size() > 1 && is_index_column_name(cols[0])) {
    first_data_col = 1;
  }

  // A delimiter at the end of the header leaves unnamed trailing columns; they
  // carry no channel and the matching empty data cells are dropped below.
  while (cols.size() > first_data_col + 1 && cols.back().empty()) {
    cols.pop_back();
  }

  TrialTable t;
  for (size_t i = first_data_col; i < cols.size(); ++i) {
    if (cols[i].empty()) {
      throw std::runtime_error("CSV: empty column name at index " + std::to_string(i));
    }
    t.channel_names.push_back(cols[i]);
  }
  if (t.channel_names.empty()) throw std::runtime_error("CSV: no data columns");
  t.n_cols = t.channel_names.size();

  const double nan = std::numeric_limits<double>::quiet_NaN();

  while (std::getline(f, line)) {
    ++lineno;
    if (trim(line).empty()) continue;

    auto vals = split_csv_row(line, delim);

    // Missing trailing fields are implicitly empty; extra trailing delimiters
    // are tolerated as long as the extra fields are empty.
    if (vals.size() < cols.size()) {
      vals.resize(cols.size());
    } else if (vals.size() > cols.size()) {
      while (vals.size() > cols.size() && trim(vals.back()).empty()) {
        vals.pop_back();
      }
    }

    if (vals.size() != cols.size()) {
      throw std::runtime_error("CSV: column count mismatch at line " + std::to_string(lineno) +
                               " (expected " + std::to_string(cols.size()) + ", got " +
                               std::to_string(vals.size()) + ")");
    }

    for (size_t i = first_data_col; i < vals.size(); ++i) {
      const std::string cell = trim(vals[i]);
      if (cell.empty() || is_nan_like(cell)) {
        t.data.push_back(nan);
        continue;
      }
      try {
        t.data.push_back(parse_double_strict(cell));
      } catch (const std::exception& e) {
        throw std::runtime_error(std::string(e.what()) + " at line " + std::to_string(lineno) +
                                 ", column '" + cols[i] + "'");
      }
    }
    ++t.n_rows;
  }

  if (f.bad()) throw std::runtime_error("CSV: read error: " + path);
  return t;
}

LoadResult load_trial_table(const std::string& path) {
  LoadResult r;
  try {
    CSVReader reader;
    r.table = reader.read(path);
  } catch (const std::exception& e) {
    r.reason = SkipReason::FileParseError;
    r.message = e.what();
    std::cerr << "Error loading CSV file " << path << ": " << e.what() << "\n";
  }
  return r;
}

} // namespace eegpad
