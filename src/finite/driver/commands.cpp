#include "commands.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/diagnostic/diagnostic_sink.hpp"
#include "finite/config/model_file.hpp"
#include "finite/model/dumper.hpp"
#include "finite/model/model.hpp"
#include "finite/model/snapshot.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace fnt::driver {

namespace {

// Runs load -> freeze -> overlay -> export. Prints diagnostics on failure.
auto CompileToSnapshot(const CompileInput& input, VerboseLogger& vlog)
    -> std::optional<model::Snapshot> {
  DiagnosticSink sink;
  std::optional<model::Model> model;
  {
    PhaseTimer timer(vlog, "load");
    model = config::LoadModel(input.model_path, input.overrides, sink);
  }
  if (!model) {
    PrintDiagnostics(sink);
    return std::nullopt;
  }
  // Warnings only at this point.
  PrintDiagnostics(sink);

  {
    PhaseTimer timer(vlog, "freeze");
    if (auto frozen = model->Freeze(); !frozen) {
      PrintDiagnostic(frozen.error());
      return std::nullopt;
    }
  }

  {
    PhaseTimer timer(vlog, "overlay");
    if (auto overlaid = model->ApplyOverlay(); !overlaid) {
      PrintDiagnostic(overlaid.error());
      return std::nullopt;
    }
  }

  PhaseTimer timer(vlog, "export");
  auto snapshot = model->Export();
  if (!snapshot) {
    PrintDiagnostic(snapshot.error());
    return std::nullopt;
  }
  return std::move(*snapshot);
}

}  // namespace

auto Compile(const CompileInput& input) -> int {
  VerboseLogger vlog(input.verbose);

  auto snapshot = CompileToSnapshot(input, vlog);
  if (!snapshot) {
    return 1;
  }
  if (input.stats) {
    vlog.PrintPhaseSummary();
  }

  std::string bytes = snapshot->ToBytes();
  if (!input.output_path) {
    std::cout << bytes << "\n";
    return 0;
  }

  std::ofstream out(*input.output_path, std::ios::binary);
  if (!out) {
    PrintError(fmt::format("cannot open '{}' for writing", *input.output_path));
    return 1;
  }
  out << bytes;
  if (!out) {
    PrintError(fmt::format("failed to write '{}'", *input.output_path));
    return 1;
  }
  spdlog::debug("wrote {} bytes to {}", bytes.size(), *input.output_path);
  return 0;
}

auto Check(const CompileInput& input) -> int {
  VerboseLogger vlog(input.verbose);

  auto snapshot = CompileToSnapshot(input, vlog);
  if (!snapshot) {
    return 1;
  }
  if (input.stats) {
    vlog.PrintPhaseSummary();
  }
  return 0;
}

auto Dump(const std::string& snapshot_path) -> int {
  std::ifstream in(snapshot_path, std::ios::binary);
  if (!in) {
    PrintError(fmt::format("cannot open snapshot '{}'", snapshot_path));
    return 1;
  }
  std::ostringstream bytes;
  bytes << in.rdbuf();

  auto snapshot = model::Snapshot::FromBytes(bytes.str());
  if (!snapshot) {
    PrintDiagnostic(snapshot.error());
    return 1;
  }

  model::Dumper dumper(&std::cout);
  dumper.Dump(*snapshot);
  return 0;
}

}  // namespace fnt::driver
