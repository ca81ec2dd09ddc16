#include "eegpad/catalog.hpp"

#include "eegpad/utils.hpp"

#include <filesystem>
#include <utility>

namespace eegpad {

const std::vector<std::string>& band_names() {
  static const std::vector<std::string> kBands = {
      "Raw EEG", "Alpha EEG", "Beta EEG", "Gamma EEG", "Delta EEG", "Theta EEG",
  };
  return kBands;
}

const std::vector<std::string>& intensity_names() {
  static const std::vector<std::string> kIntensities = {
      "Low Intensity", "Medium Intensity", "High Intensity",
  };
  return kIntensities;
}

std::string label_abbreviation(const std::string& label) {
  return to_lower(first_word(label));
}

std::string group_source_dir(const std::string& base_path,
                             const std::string& band,
                             const std::string& intensity) {
  // Directory names are an external contract: literal spaces and casing.
  const std::filesystem::path p = std::filesystem::u8path(base_path) /
                                  std::filesystem::u8path(band + " samples") /
                                  std::filesystem::u8path(intensity);
  return p.u8string();
}

std::string group_output_name(const std::string& band,
                              const std::string& intensity,
                              const std::string& ext) {
  return "array_3D_" + label_abbreviation(band) + "_" + label_abbreviation(intensity) + ext;
}

std::vector<Group> build_catalog(const std::string& base_path) {
  std::vector<Group> out;
  out.reserve(band_names().size() * intensity_names().size());
  for (const auto& band : band_names()) {
    for (const auto& intensity : intensity_names()) {
      Group g;
      g.band = band;
      g.intensity = intensity;
      g.source_dir = group_source_dir(base_path, band, intensity);
      g.output_name = group_output_name(band, intensity);
      out.push_back(std::move(g));
    }
  }
  return out;
}

} // namespace eegpad
