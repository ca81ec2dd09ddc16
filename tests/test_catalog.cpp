#include "eegpad/catalog.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <iostream>
#include <set>
#include <string>

using namespace eegpad;

int main() {
  assert(label_abbreviation("Raw EEG") == "raw");
  assert(label_abbreviation("Theta EEG") == "theta");
  assert(label_abbreviation("Low Intensity") == "low");
  assert(label_abbreviation("Medium Intensity") == "medium");
  assert(label_abbreviation("  High   Intensity ") == "high");
  assert(label_abbreviation("Single") == "single");
  assert(label_abbreviation("") == "");

  assert(group_output_name("Gamma EEG", "High Intensity") == "array_3D_gamma_high.npy");
  assert(group_output_name("Delta EEG", "Low Intensity", "") == "array_3D_delta_low");

  {
    const std::filesystem::path expect =
        std::filesystem::u8path("data/fatigueset") / "Alpha EEG samples" / "Medium Intensity";
    assert(group_source_dir("data/fatigueset", "Alpha EEG", "Medium Intensity") == expect.u8string());
  }

  const auto groups = build_catalog("base");
  assert(groups.size() == 18);

  // Bands outer, intensities inner.
  assert(groups[0].band == "Raw EEG");
  assert(groups[0].intensity == "Low Intensity");
  assert(groups[0].output_name == "array_3D_raw_low.npy");
  assert(groups[2].output_name == "array_3D_raw_high.npy");
  assert(groups[3].output_name == "array_3D_alpha_low.npy");
  assert(groups[17].band == "Theta EEG");
  assert(groups[17].intensity == "High Intensity");
  assert(groups[17].output_name == "array_3D_theta_high.npy");
  assert(groups[17].label() == "Theta EEG / High Intensity");

  std::set<std::string> names;
  std::set<std::string> dirs;
  for (const auto& g : groups) {
    names.insert(g.output_name);
    dirs.insert(g.source_dir);
    const std::filesystem::path p = std::filesystem::u8path(g.source_dir);
    assert(p.filename().u8string() == g.intensity);
    assert(p.parent_path().filename().u8string() == g.band + " samples");
    assert(p.parent_path().parent_path().u8string() == "base");
  }
  assert(names.size() == 18);
  assert(dirs.size() == 18);

  const std::set<std::string> bands = {"raw", "alpha", "beta", "gamma", "delta", "theta"};
  const std::set<std::string> levels = {"low", "medium", "high"};
  for (const auto& b : bands) {
    for (const auto& l : levels) {
      assert(names.count("array_3D_" + b + "_" + l + ".npy") == 1);
    }
  }

  std::cout << "test_catalog: OK\n";
  return 0;
}
