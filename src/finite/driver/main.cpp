#include <argparse/argparse.hpp>
#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "finite/config/model_file.hpp"
#include "print.hpp"

namespace {

// Split attached flag forms: -Dlimit=5 -> -D limit=5
auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string> {
  std::vector<std::string> result;
  for (char* raw_arg : argv) {
    std::string_view arg = raw_arg;
    if (arg.size() > 2 && arg.starts_with("-D") && arg[1] != '-') {
      result.emplace_back(arg.substr(0, 2));
      result.emplace_back(arg.substr(2));
    } else {
      result.emplace_back(arg);
    }
  }
  return result;
}

void AddCompileFlags(argparse::ArgumentParser& cmd, int& verbose) {
  cmd.add_argument("model").help("Model description (.toml)");
  cmd.add_argument("-D", "--define")
      .append()
      .help("Variable value NAME=VALUE (repeatable)");
  cmd.add_argument("-v", "--verbose")
      .action([&verbose](const auto&) { ++verbose; })
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Print phase progress (-vv also enables debug logging)");
  cmd.add_argument("--stats")
      .default_value(false)
      .implicit_value(true)
      .help("Print phase timings");
}

auto BuildInput(const argparse::ArgumentParser& cmd, int verbose)
    -> std::optional<fnt::driver::CompileInput> {
  fnt::driver::CompileInput input;
  input.model_path = cmd.get<std::string>("model");
  input.verbose = verbose;
  input.stats = cmd.get<bool>("--stats");

  if (auto defines = cmd.present<std::vector<std::string>>("-D")) {
    for (const auto& define : *defines) {
      auto parsed = fnt::config::ParseOverride(define);
      if (!parsed) {
        fnt::driver::PrintDiagnostic(parsed.error());
        return std::nullopt;
      }
      input.overrides[parsed->first] = parsed->second;
    }
  }
  return input;
}

void ConfigureLogging(int verbose) {
  auto logger = spdlog::stderr_color_mt("finite");
  spdlog::set_default_logger(logger);
  spdlog::set_level(
      verbose >= 2 ? spdlog::level::debug : spdlog::level::warn);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  auto args = PreprocessArgs(std::span<char*>(argv, static_cast<size_t>(argc)));
  int verbose = 0;

  argparse::ArgumentParser program("finite", "0.1.0");
  program.add_description("Compiler for bounded token-flow models");

  argparse::ArgumentParser compile_cmd("compile");
  compile_cmd.add_description("Compile a model to a snapshot");
  AddCompileFlags(compile_cmd, verbose);
  compile_cmd.add_argument("-o", "--output")
      .help("Write the snapshot here instead of stdout");

  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Check a model for errors");
  AddCompileFlags(check_cmd, verbose);

  argparse::ArgumentParser dump_cmd("dump");
  dump_cmd.add_description("Print a compiled snapshot");
  dump_cmd.add_argument("snapshot").help("Snapshot file (.json)");

  program.add_subparser(compile_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(dump_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    fnt::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  ConfigureLogging(verbose);

  if (program.is_subcommand_used("compile")) {
    auto input = BuildInput(compile_cmd, verbose);
    if (!input) {
      return 1;
    }
    if (auto output = compile_cmd.present<std::string>("-o")) {
      input->output_path = *output;
    }
    return fnt::driver::Compile(*input);
  }

  if (program.is_subcommand_used("check")) {
    auto input = BuildInput(check_cmd, verbose);
    if (!input) {
      return 1;
    }
    return fnt::driver::Check(*input);
  }

  if (program.is_subcommand_used("dump")) {
    return fnt::driver::Dump(dump_cmd.get<std::string>("snapshot"));
  }

  std::cout << program;
  return 0;
}
