#include "finite/model/snapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/internal_error.hpp"
#include "finite/model/model.hpp"

namespace fnt::model {

namespace {

using nlohmann::json;

auto Malformed(std::string detail) -> Diagnostic {
  return Diagnostic::HostError(
      fmt::format("malformed snapshot: {}", std::move(detail)));
}

auto ReadUnsigned(const json& obj, const char* key, std::string_view context)
    -> Result<uint64_t> {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_unsigned()) {
    return std::unexpected(Malformed(
        fmt::format("{}: '{}' must be a non-negative integer", context, key)));
  }
  return it->get<uint64_t>();
}

auto ReadPlace(const std::string& name, const json& obj)
    -> Result<PlaceEntry> {
  const std::string context = fmt::format("place '{}'", name);
  if (!obj.is_object()) {
    return std::unexpected(Malformed(context + " must be an object"));
  }
  auto offset = ReadUnsigned(obj, "offset", context);
  if (!offset) {
    return std::unexpected(offset.error());
  }
  if (*offset > UINT32_MAX) {
    return std::unexpected(Malformed(context + ": offset out of range"));
  }
  auto initial = ReadUnsigned(obj, "initial", context);
  if (!initial) {
    return std::unexpected(initial.error());
  }
  auto capacity = ReadUnsigned(obj, "capacity", context);
  if (!capacity) {
    return std::unexpected(capacity.error());
  }
  return PlaceEntry{
      .offset = static_cast<uint32_t>(*offset),
      .initial = *initial,
      .capacity = *capacity,
  };
}

auto ReadTransition(const std::string& name, const json& obj)
    -> Result<TransitionEntry> {
  const std::string context = fmt::format("transition '{}'", name);
  if (!obj.is_object()) {
    return std::unexpected(Malformed(context + " must be an object"));
  }

  TransitionEntry entry;
  auto delta = obj.find("delta");
  if (delta == obj.end() || !delta->is_array()) {
    return std::unexpected(Malformed(context + ": 'delta' must be an array"));
  }
  for (const auto& value : *delta) {
    if (!value.is_number_integer()) {
      return std::unexpected(
          Malformed(context + ": 'delta' must hold integers"));
    }
    entry.delta.push_back(value.get<int64_t>());
  }

  auto role = obj.find("role");
  if (role == obj.end() || !role->is_string()) {
    return std::unexpected(Malformed(context + ": 'role' must be a string"));
  }
  entry.role = role->get<std::string>();

  if (auto guards = obj.find("guards"); guards != obj.end()) {
    if (!guards->is_array()) {
      return std::unexpected(
          Malformed(context + ": 'guards' must be an array"));
    }
    for (const auto& guard : *guards) {
      if (!guard.is_object()) {
        return std::unexpected(
            Malformed(context + ": guard must be an object"));
      }
      auto offset = ReadUnsigned(guard, "offset", context);
      if (!offset) {
        return std::unexpected(offset.error());
      }
      if (*offset > UINT32_MAX) {
        return std::unexpected(
            Malformed(context + ": guard offset out of range"));
      }
      auto weight = ReadUnsigned(guard, "weight", context);
      if (!weight) {
        return std::unexpected(weight.error());
      }
      entry.guards.push_back(
          Guard{.offset = static_cast<uint32_t>(*offset), .weight = *weight});
    }
  }
  return entry;
}

}  // namespace

auto Snapshot::InitialState() const -> std::vector<int64_t> {
  std::vector<int64_t> state(places.size(), 0);
  for (const auto& [name, place] : places) {
    state.at(place.offset) = static_cast<int64_t>(place.initial);
  }
  return state;
}

auto Snapshot::Capacities() const -> std::vector<uint64_t> {
  std::vector<uint64_t> capacities(places.size(), 0);
  for (const auto& [name, place] : places) {
    capacities.at(place.offset) = place.capacity;
  }
  return capacities;
}

auto Snapshot::OrderedPlaceNames() const -> std::vector<std::string> {
  std::vector<std::string> names(places.size());
  for (const auto& [name, place] : places) {
    names.at(place.offset) = name;
  }
  return names;
}

auto Snapshot::Validate() const -> Result<void> {
  std::vector<bool> seen(places.size(), false);
  for (const auto& [name, place] : places) {
    if (place.offset >= places.size()) {
      return std::unexpected(Malformed(
          fmt::format(
              "place '{}' has offset {} but there are {} places", name,
              place.offset, places.size())));
    }
    if (seen[place.offset]) {
      return std::unexpected(Malformed(
          fmt::format(
              "place '{}' reuses offset {}", name, place.offset)));
    }
    seen[place.offset] = true;
  }

  for (const auto& [name, transition] : transitions) {
    if (transition.delta.size() != places.size()) {
      return std::unexpected(Malformed(
          fmt::format(
              "transition '{}' has {} delta slots, expected {}", name,
              transition.delta.size(), places.size())));
    }
    for (const Guard& guard : transition.guards) {
      if (guard.offset >= places.size()) {
        return std::unexpected(Malformed(
            fmt::format(
                "transition '{}' guards unknown offset {}", name,
                guard.offset)));
      }
    }
  }
  return {};
}

auto Snapshot::ToBytes() const -> std::string {
  json places_obj = json::object();
  for (const auto& [name, place] : places) {
    places_obj[name] = {
        {"capacity", place.capacity},
        {"initial", place.initial},
        {"offset", place.offset},
    };
  }

  json transitions_obj = json::object();
  for (const auto& [name, transition] : transitions) {
    json entry = {
        {"delta", transition.delta},
        {"role", transition.role},
    };
    // Guards appear only for transitions with inhibitor arcs.
    if (!transition.guards.empty()) {
      json guards = json::array();
      for (const Guard& guard : transition.guards) {
        guards.push_back({{"offset", guard.offset}, {"weight", guard.weight}});
      }
      entry["guards"] = std::move(guards);
    }
    transitions_obj[name] = std::move(entry);
  }

  json root = {
      {"places", std::move(places_obj)},
      {"schema", schema},
      {"transitions", std::move(transitions_obj)},
  };
  return root.dump();
}

auto Snapshot::FromBytes(std::string_view bytes) -> Result<Snapshot> {
  json root;
  try {
    root = json::parse(bytes);
  } catch (const json::parse_error& e) {
    return std::unexpected(Malformed(e.what()));
  }

  if (!root.is_object()) {
    return std::unexpected(Malformed("top level must be an object"));
  }

  Snapshot snapshot;
  auto schema = root.find("schema");
  if (schema == root.end() || !schema->is_string()) {
    return std::unexpected(Malformed("'schema' must be a string"));
  }
  snapshot.schema = schema->get<std::string>();

  auto places = root.find("places");
  if (places == root.end() || !places->is_object()) {
    return std::unexpected(Malformed("'places' must be an object"));
  }
  for (const auto& [name, value] : places->items()) {
    auto entry = ReadPlace(name, value);
    if (!entry) {
      return std::unexpected(entry.error());
    }
    snapshot.places.emplace(name, *entry);
  }

  auto transitions = root.find("transitions");
  if (transitions == root.end() || !transitions->is_object()) {
    return std::unexpected(Malformed("'transitions' must be an object"));
  }
  for (const auto& [name, value] : transitions->items()) {
    auto entry = ReadTransition(name, value);
    if (!entry) {
      return std::unexpected(entry.error());
    }
    snapshot.transitions.emplace(name, std::move(*entry));
  }

  if (auto valid = snapshot.Validate(); !valid) {
    return std::unexpected(valid.error());
  }
  return snapshot;
}

auto Model::Export() const -> Result<Snapshot> {
  if (auto ok = AssertFrozen(); !ok) {
    return std::unexpected(ok.error());
  }

  Snapshot snapshot;
  snapshot.schema = schema_;
  for (const Place& place : places_) {
    snapshot.places.emplace(
        place.name,
        PlaceEntry{
            .offset = place.offset,
            .initial = place.initial,
            .capacity = place.capacity,
        });
  }
  for (const Transition& transition : transitions_) {
    if (!transition.delta || transition.delta->size() != places_.size()) {
      common::ThrowInternalError(
          "Model::Export",
          fmt::format(
              "transition '{}' delta does not match {} places",
              transition.name, places_.size()));
    }
    snapshot.transitions.emplace(
        transition.name,
        TransitionEntry{
            .delta = *transition.delta,
            .role = RoleName(transition.role),
            .guards = transition.guards,
        });
  }
  return snapshot;
}

}  // namespace fnt::model
