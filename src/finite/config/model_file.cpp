#include "finite/config/model_file.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/diagnostic/diagnostic_sink.hpp"
#include "finite/model/model.hpp"

namespace fnt::config {

namespace fs = std::filesystem;

namespace {

// Loader state for one file. Reports problems to the sink and keeps going so
// that a single run shows every broken entry.
class ModelFileReader {
 public:
  ModelFileReader(
      std::string_view source_name, const ValueOverrides& overrides,
      DiagnosticSink& sink)
      : source_name_(source_name), overrides_(overrides), sink_(sink) {
  }

  auto Read(const toml::table& root) -> std::optional<model::Model>;

 private:
  void ReadPlaces(const toml::table& root, model::Model& model);
  void ReadTransitions(const toml::table& root, model::Model& model);
  void ReadArcs(const toml::table& root, model::Model& model);
  void ReadVars(const toml::table& root, model::Model& model);
  void ReadValues(const toml::table& root);

  auto ResolveNode(
      const model::Model& model, const std::string& name,
      const toml::node& where) -> std::optional<model::NodeHandle>;
  auto ReadCount(
      const toml::table& entry, std::string_view key, uint64_t fallback)
      -> std::optional<uint64_t>;
  auto ReadCoords(const toml::table& entry)
      -> std::optional<model::Coords>;
  auto ReadPair(const toml::table& entry, std::string_view key)
      -> std::optional<std::pair<std::string, std::string>>;

  void CheckKeys(
      const toml::table& entry, std::initializer_list<std::string_view> allowed,
      std::string_view context);

  void HostError(const toml::node& where, std::string_view message);
  void Error(
      ErrorCode code, const toml::node& where,
      std::string_view message);
  auto Where(const toml::node& node) const -> std::string;

  std::string_view source_name_;
  const ValueOverrides& overrides_;
  DiagnosticSink& sink_;
  std::map<std::string, uint64_t> file_values_;
  std::set<std::string> var_names_;
};

auto ModelFileReader::Where(const toml::node& node) const -> std::string {
  const auto& begin = node.source().begin;
  if (begin.line == 0) {
    return std::string(source_name_);
  }
  return fmt::format("{}:{}:{}", source_name_, begin.line, begin.column);
}

void ModelFileReader::HostError(
    const toml::node& where, std::string_view message) {
  sink_.HostError(fmt::format("{}: {}", Where(where), message));
}

void ModelFileReader::Error(
    ErrorCode code, const toml::node& where, std::string_view message) {
  sink_.Error(code, fmt::format("{}: {}", Where(where), message));
}

void ModelFileReader::CheckKeys(
    const toml::table& entry, std::initializer_list<std::string_view> allowed,
    std::string_view context) {
  for (auto&& [key, value] : entry) {
    bool found = false;
    for (std::string_view name : allowed) {
      if (key.str() == name) {
        found = true;
        break;
      }
    }
    if (!found) {
      sink_.Warning(
          fmt::format(
              "{}: unknown field '{}' in {}", Where(value), key.str(),
              context));
    }
  }
}

auto ModelFileReader::ReadCount(
    const toml::table& entry, std::string_view key, uint64_t fallback)
    -> std::optional<uint64_t> {
  const toml::node* node = entry.get(key);
  if (node == nullptr) {
    return fallback;
  }
  const auto* integer = node->as_integer();
  if (integer == nullptr || integer->get() < 0) {
    HostError(*node, fmt::format("'{}' must be a non-negative integer", key));
    return std::nullopt;
  }
  return static_cast<uint64_t>(integer->get());
}

auto ModelFileReader::ReadCoords(const toml::table& entry)
    -> std::optional<model::Coords> {
  const toml::array* coords = entry["coords"].as_array();
  if (coords == nullptr) {
    return std::nullopt;
  }
  if (coords->size() != 2 || !coords->is_homogeneous<int64_t>()) {
    sink_.Warning(
        fmt::format("{}: 'coords' ignored, expected [x, y]", Where(*coords)));
    return std::nullopt;
  }
  const int64_t x = coords->get(0)->as_integer()->get();
  const int64_t y = coords->get(1)->as_integer()->get();
  auto fits = [](int64_t v) { return v >= INT32_MIN && v <= INT32_MAX; };
  if (!fits(x) || !fits(y)) {
    sink_.Warning(
        fmt::format(
            "{}: 'coords' ignored, [{}, {}] is outside the 32-bit grid",
            Where(*coords), x, y));
    return std::nullopt;
  }
  return model::Coords{
      .x = static_cast<int32_t>(x),
      .y = static_cast<int32_t>(y),
  };
}

auto ModelFileReader::ReadPair(const toml::table& entry, std::string_view key)
    -> std::optional<std::pair<std::string, std::string>> {
  const toml::node* node = entry.get(key);
  const toml::array* pair = node != nullptr ? node->as_array() : nullptr;
  if (pair == nullptr || pair->size() != 2 ||
      !pair->is_homogeneous<std::string>()) {
    HostError(
        node != nullptr ? *node : static_cast<const toml::node&>(entry),
        fmt::format("'{}' must be a pair of names", key));
    return std::nullopt;
  }
  return std::pair{
      pair->get(0)->as_string()->get(), pair->get(1)->as_string()->get()};
}

auto ModelFileReader::ResolveNode(
    const model::Model& model, const std::string& name,
    const toml::node& where) -> std::optional<model::NodeHandle> {
  auto place = model.FindPlace(name);
  auto transition = model.FindTransition(name);
  if (place && transition) {
    Error(
        ErrorCode::kUnresolvedReference, where,
        fmt::format("'{}' names both a place and a transition", name));
    return std::nullopt;
  }
  if (place) {
    return model::PlaceHandle{.model = model.Id(), .id = *place};
  }
  if (transition) {
    return model::TransitionHandle{.model = model.Id(), .id = *transition};
  }
  Error(
      ErrorCode::kUnresolvedReference, where,
      fmt::format("unknown place or transition '{}'", name));
  return std::nullopt;
}

void ModelFileReader::ReadPlaces(
    const toml::table& root, model::Model& model) {
  const toml::array* places = root["place"].as_array();
  if (places == nullptr) {
    return;
  }
  for (const toml::node& node : *places) {
    const toml::table* entry = node.as_table();
    if (entry == nullptr) {
      HostError(node, "[[place]] entries must be tables");
      continue;
    }
    CheckKeys(*entry, {"name", "initial", "capacity", "coords"}, "[[place]]");

    auto name = (*entry)["name"].value<std::string>();
    if (!name) {
      HostError(node, "[[place]] is missing 'name'");
      continue;
    }
    auto initial = ReadCount(*entry, "initial", 0);
    auto capacity = ReadCount(*entry, "capacity", 0);
    if (!initial || !capacity) {
      continue;
    }

    auto declared = model.DeclarePlace(
        *name,
        model::PlaceSpec{
            .initial = *initial,
            .capacity = *capacity,
            .coords = ReadCoords(*entry),
        });
    if (!declared) {
      sink_.Report(std::move(declared.error()));
    }
  }
}

void ModelFileReader::ReadTransitions(
    const toml::table& root, model::Model& model) {
  const toml::array* transitions = root["transition"].as_array();
  if (transitions == nullptr) {
    return;
  }
  for (const toml::node& node : *transitions) {
    const toml::table* entry = node.as_table();
    if (entry == nullptr) {
      HostError(node, "[[transition]] entries must be tables");
      continue;
    }
    CheckKeys(*entry, {"name", "role", "coords"}, "[[transition]]");

    auto name = (*entry)["name"].value<std::string>();
    if (!name) {
      HostError(node, "[[transition]] is missing 'name'");
      continue;
    }

    model::TransitionSpec spec{.role = {}, .coords = ReadCoords(*entry)};
    if (auto role_name = (*entry)["role"].value<std::string>()) {
      auto role = model.DeclareRole(*role_name);
      if (!role) {
        sink_.Report(std::move(role.error()));
        continue;
      }
      spec.role = *role;
    }

    auto declared = model.DeclareTransition(*name, spec);
    if (!declared) {
      sink_.Report(std::move(declared.error()));
    }
  }
}

void ModelFileReader::ReadArcs(const toml::table& root, model::Model& model) {
  const toml::array* arcs = root["arc"].as_array();
  if (arcs == nullptr) {
    return;
  }
  for (const toml::node& node : *arcs) {
    const toml::table* entry = node.as_table();
    if (entry == nullptr) {
      HostError(node, "[[arc]] entries must be tables");
      continue;
    }
    CheckKeys(
        *entry, {"source", "target", "weight", "inhibitor"}, "[[arc]]");

    auto source_name = (*entry)["source"].value<std::string>();
    auto target_name = (*entry)["target"].value<std::string>();
    if (!source_name || !target_name) {
      HostError(node, "[[arc]] needs both 'source' and 'target'");
      continue;
    }
    auto weight = ReadCount(*entry, "weight", 1);
    auto source = ResolveNode(model, *source_name, node);
    auto target = ResolveNode(model, *target_name, node);

    bool inhibitor = false;
    bool inhibitor_ok = true;
    if (const toml::node* flag = entry->get("inhibitor")) {
      if (const auto* boolean = flag->as_boolean()) {
        inhibitor = boolean->get();
      } else {
        HostError(*flag, "'inhibitor' must be true or false");
        inhibitor_ok = false;
      }
    }
    if (!weight || !source || !target || !inhibitor_ok) {
      continue;
    }

    auto added = model.AddArc(
        *source, *target, *weight,
        inhibitor ? model::ArcKind::kInhibitor : model::ArcKind::kNormal);
    if (!added) {
      sink_.Report(std::move(added.error()));
    }
  }
}

void ModelFileReader::ReadValues(const toml::table& root) {
  const toml::table* values = root["values"].as_table();
  if (values == nullptr) {
    return;
  }
  for (auto&& [key, value] : *values) {
    const auto* integer = value.as_integer();
    if (integer == nullptr || integer->get() < 0) {
      HostError(
          value,
          fmt::format("value '{}' must be a non-negative integer", key.str()));
      continue;
    }
    file_values_[std::string(key.str())] =
        static_cast<uint64_t>(integer->get());
  }
}

void ModelFileReader::ReadVars(const toml::table& root, model::Model& model) {
  const toml::array* vars = root["var"].as_array();
  if (vars == nullptr) {
    return;
  }
  for (const toml::node& node : *vars) {
    const toml::table* entry = node.as_table();
    if (entry == nullptr) {
      HostError(node, "[[var]] entries must be tables");
      continue;
    }
    CheckKeys(
        *entry,
        {"name", "description", "value", "capacity", "initial", "weight",
         "consume", "produce"},
        "[[var]]");

    auto builder = model.NewVar();
    if (!builder) {
      sink_.Report(std::move(builder.error()));
      return;
    }

    int targets = 0;
    if (auto place = (*entry)["capacity"].value<std::string>()) {
      builder->Capacity(*place);
      ++targets;
    }
    if (auto place = (*entry)["initial"].value<std::string>()) {
      builder->Initial(*place);
      ++targets;
    }
    for (std::string_view key : {"weight", "consume", "produce"}) {
      if (!entry->contains(key)) {
        continue;
      }
      ++targets;
      auto pair = ReadPair(*entry, key);
      if (!pair) {
        continue;
      }
      if (key == "weight") {
        builder->Weight(pair->first, pair->second);
      } else if (key == "consume") {
        builder->Consume(pair->first, pair->second);
      } else {
        builder->Produce(pair->first, pair->second);
      }
    }
    if (targets != 1) {
      HostError(
          node,
          "[[var]] needs exactly one of 'capacity', 'initial', 'weight', "
          "'consume' or 'produce'");
      continue;
    }

    auto name = (*entry)["name"].value<std::string>();
    if (name) {
      builder->Label(*name);
      var_names_.insert(*name);
    }
    if (auto description = (*entry)["description"].value<std::string>()) {
      builder->Describe(*description);
    }

    std::optional<uint64_t> value;
    if (name && overrides_.contains(*name)) {
      value = overrides_.at(*name);
    } else if (name && file_values_.contains(*name)) {
      value = file_values_.at(*name);
    } else if (entry->contains("value")) {
      value = ReadCount(*entry, "value", 0);
      if (!value) {
        continue;
      }
    }

    if (value) {
      builder->Bind([v = *value] { return v; });
    } else {
      spdlog::debug(
          "{}: variable '{}' left unbound", Where(node), name.value_or(""));
    }
  }
}

auto ModelFileReader::Read(const toml::table& root)
    -> std::optional<model::Model> {
  CheckKeys(
      root, {"schema", "place", "transition", "arc", "var", "values"},
      "model file");

  auto schema = root["schema"].value<std::string>();
  if (!schema) {
    sink_.HostError(
        fmt::format("{}: missing required field 'schema'", source_name_));
    return std::nullopt;
  }

  model::Model model(*schema);
  ReadPlaces(root, model);
  ReadTransitions(root, model);
  ReadArcs(root, model);
  ReadValues(root);
  ReadVars(root, model);

  for (const auto& [name, value] : file_values_) {
    if (!var_names_.contains(name)) {
      sink_.Warning(
          fmt::format(
              "{}: [values] entry '{}' does not name a variable",
              source_name_, name));
    }
  }
  for (const auto& [name, value] : overrides_) {
    if (!var_names_.contains(name)) {
      sink_.Warning(
          fmt::format("override '{}' does not name a variable", name));
    }
  }

  if (sink_.HasErrors()) {
    return std::nullopt;
  }
  spdlog::debug(
      "loaded model '{}' from {}: {} places, {} transitions, {} arcs",
      model.Schema(), source_name_, model.PlaceCount(),
      model.TransitionCount(), model.PendingArcs().size());
  return model;
}

}  // namespace

auto ParseModel(
    std::string_view text, std::string_view source_name,
    const ValueOverrides& overrides, DiagnosticSink& sink)
    -> std::optional<model::Model> {
  toml::table root;
  try {
    root = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    sink.HostError(
        fmt::format(
            "failed to parse {}:{}:{}: {}", source_name,
            e.source().begin.line, e.source().begin.column, e.description()));
    return std::nullopt;
  }

  ModelFileReader reader(source_name, overrides, sink);
  return reader.Read(root);
}

auto LoadModel(
    const fs::path& path, const ValueOverrides& overrides,
    DiagnosticSink& sink) -> std::optional<model::Model> {
  std::ifstream in(path);
  if (!in) {
    sink.HostError(fmt::format("cannot open model file '{}'", path.string()));
    return std::nullopt;
  }
  std::ostringstream text;
  text << in.rdbuf();
  return ParseModel(text.str(), path.string(), overrides, sink);
}

auto ParseOverride(std::string_view text)
    -> Result<std::pair<std::string, uint64_t>> {
  auto eq = text.find('=');
  if (eq == std::string_view::npos || eq == 0) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("expected NAME=VALUE, got '{}'", text)));
  }
  std::string_view digits = text.substr(eq + 1);
  if (digits.empty()) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("missing value in '{}'", text)));
  }
  uint64_t value = 0;
  auto [ptr, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec == std::errc::result_out_of_range) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "value in '{}' does not fit in 64 bits (maximum {})", text,
                UINT64_MAX)));
  }
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "value in '{}' must be a non-negative integer", text)));
  }
  return std::pair{std::string(text.substr(0, eq)), value};
}

}  // namespace fnt::config
