#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "finite/common/diagnostic/diagnostic_sink.hpp"
#include "finite/model/model.hpp"

namespace fnt::config {

// Values injected into named variables, e.g. from `-D max=5`.
using ValueOverrides = std::map<std::string, uint64_t>;

// Model description file (TOML):
//
//   schema = "Counter"
//
//   [[place]]
//   name = "p0"
//   initial = 0
//   capacity = 0        # 0 = unbounded
//
//   [[transition]]
//   name = "INC0"
//   role = "default"
//
//   [[arc]]
//   source = "INC0"
//   target = "p0"
//   weight = 1          # optional, default 1
//   inhibitor = false   # optional
//
//   [[var]]
//   name = "limit"      # optional, lets [values] and -D supply the value
//   capacity = "p0"     # or initial = "p0", weight = ["INC0", "p0"],
//                       #    consume = ["p0", "DEC0"], produce = ["INC0", "p0"]
//   value = 5           # optional default
//
//   [values]
//   limit = 7
//
// A var's value comes from the overrides, then [values], then its own
// `value`. A var with none of these stays unbound.
//
// Returns nullopt if any error was reported to `sink`. The model is not
// frozen.
auto ParseModel(
    std::string_view text, std::string_view source_name,
    const ValueOverrides& overrides, DiagnosticSink& sink)
    -> std::optional<model::Model>;

auto LoadModel(
    const std::filesystem::path& path, const ValueOverrides& overrides,
    DiagnosticSink& sink) -> std::optional<model::Model>;

// Parses "name=value" as used by -D.
auto ParseOverride(std::string_view text)
    -> Result<std::pair<std::string, uint64_t>>;

}  // namespace fnt::config
