#pragma once

#include <string>
#include <vector>

namespace eegpad {

// Frequency decompositions present in the input layout, in catalog order.
const std::vector<std::string>& band_names();

// Fatigue-level labels present in the input layout, in catalog order.
const std::vector<std::string>& intensity_names();

// Lower-cased first word of a band/intensity label, e.g. "Raw EEG" -> "raw",
// "Low Intensity" -> "low".
std::string label_abbreviation(const std::string& label);

// One (band, intensity) combination.
struct Group {
  std::string band;         // e.g. "Raw EEG"
  std::string intensity;    // e.g. "Low Intensity"
  std::string source_dir;   // <base>/<band> samples/<intensity>
  std::string output_name;  // array_3D_<band_abbr>_<intensity_abbr>.npy

  std::string label() const { return band + " / " + intensity; }
};

// "<band> samples/<intensity>" joined onto base_path.
std::string group_source_dir(const std::string& base_path,
                             const std::string& band,
                             const std::string& intensity);

// "array_3D_<band_abbr>_<intensity_abbr>" + ext.
std::string group_output_name(const std::string& band,
                              const std::string& intensity,
                              const std::string& ext = ".npy");

// All 18 groups: bands outer, intensities inner.
std::vector<Group> build_catalog(const std::string& base_path);

} // namespace eegpad
