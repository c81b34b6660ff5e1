#pragma once

#include <optional>
#include <string>

#include "finite/config/model_file.hpp"

namespace fnt::driver {

struct CompileInput {
  std::string model_path;
  std::optional<std::string> output_path;
  config::ValueOverrides overrides;
  int verbose = 0;
  bool stats = false;
};

// Loads, freezes, overlays and exports. Writes the snapshot bytes to
// `output_path`, or stdout.
auto Compile(const CompileInput& input) -> int;

// Same pipeline as Compile without writing anything.
auto Check(const CompileInput& input) -> int;

// Prints a readable rendering of a snapshot file.
auto Dump(const std::string& snapshot_path) -> int;

}  // namespace fnt::driver
