#include "finite/model/model.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/overloaded.hpp"

namespace fnt::model {

namespace {

auto NextModelId() -> ModelId {
  // 0 is reserved for default-constructed handles.
  static std::atomic<uint32_t> next{1};
  return ModelId{next.fetch_add(1, std::memory_order_relaxed)};
}

template <typename Id>
auto Lookup(
    const std::unordered_map<std::string, Id>& index, std::string_view name)
    -> std::optional<Id> {
  auto it = index.find(std::string(name));
  if (it == index.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

Model::Model(std::string schema)
    : schema_(std::move(schema)), id_(NextModelId()) {
}

auto Model::Import(const Snapshot& snapshot) -> Result<Model> {
  if (auto valid = snapshot.Validate(); !valid) {
    return std::unexpected(valid.error());
  }

  Model model(snapshot.schema);
  model.places_.resize(snapshot.places.size());
  for (const auto& [name, entry] : snapshot.places) {
    Place& place = model.places_[entry.offset];
    place.name = name;
    place.offset = entry.offset;
    place.initial = entry.initial;
    place.capacity = entry.capacity;
    model.place_index_.emplace(name, PlaceId{entry.offset});
  }

  for (const auto& [name, entry] : snapshot.transitions) {
    RoleId role = kInvalidRoleId;
    if (!entry.role.empty()) {
      if (auto existing = model.FindRole(entry.role)) {
        role = *existing;
      } else {
        role = RoleId{static_cast<uint32_t>(model.roles_.size())};
        model.roles_.push_back(entry.role);
        model.role_index_.emplace(entry.role, role);
      }
    }

    TransitionId id{static_cast<uint32_t>(model.transitions_.size())};
    model.transitions_.push_back(
        Transition{
            .name = name,
            .role = role,
            .delta = entry.delta,
            .guards = entry.guards,
            .coords = std::nullopt,
        });
    model.transition_index_.emplace(name, id);
  }

  model.frozen_ = true;
  model.imported_ = true;
  spdlog::debug(
      "imported model '{}': {} places, {} transitions", model.schema_,
      model.places_.size(), model.transitions_.size());
  return model;
}

auto Model::FromBytes(std::string_view bytes) -> Result<Model> {
  auto snapshot = Snapshot::FromBytes(bytes);
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }
  return Import(*snapshot);
}

auto Model::DeclareRole(std::string name) -> Result<RoleHandle> {
  if (auto ok = CheckNotFrozen("declare role"); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto existing = FindRole(name)) {
    return RoleHandle{.model = id_, .id = *existing};
  }
  RoleId id{static_cast<uint32_t>(roles_.size())};
  role_index_.emplace(name, id);
  roles_.push_back(std::move(name));
  return RoleHandle{.model = id_, .id = id};
}

auto Model::DeclarePlace(std::string name, PlaceSpec spec)
    -> Result<PlaceHandle> {
  if (auto ok = CheckNotFrozen("declare place"); !ok) {
    return std::unexpected(ok.error());
  }

  if (auto existing = FindPlace(name)) {
    Place& place = places_[existing->value];
    place.initial = spec.initial;
    place.capacity = spec.capacity;
    place.coords = spec.coords;
    return PlaceHandle{.model = id_, .id = *existing};
  }

  PlaceId id{static_cast<uint32_t>(places_.size())};
  place_index_.emplace(name, id);
  places_.push_back(
      Place{
          .name = std::move(name),
          .offset = id.value,
          .initial = spec.initial,
          .capacity = spec.capacity,
          .coords = spec.coords,
      });
  return PlaceHandle{.model = id_, .id = id};
}

auto Model::DeclareTransition(std::string name, TransitionSpec spec)
    -> Result<TransitionHandle> {
  if (auto ok = CheckNotFrozen("declare transition"); !ok) {
    return std::unexpected(ok.error());
  }

  if (spec.role.id) {
    if (spec.role.model != id_ || spec.role.id.value >= roles_.size()) {
      return std::unexpected(
          Diagnostic::Error(
              ErrorCode::kUnresolvedReference,
              fmt::format(
                  "transition '{}' uses a role that was not declared in "
                  "model '{}'",
                  name, schema_)));
    }
  }

  if (auto existing = FindTransition(name)) {
    Transition& transition = transitions_[existing->value];
    transition.role = spec.role.id;
    transition.coords = spec.coords;
    return TransitionHandle{.model = id_, .id = *existing};
  }

  TransitionId id{static_cast<uint32_t>(transitions_.size())};
  transition_index_.emplace(name, id);
  transitions_.push_back(
      Transition{
          .name = std::move(name),
          .role = spec.role.id,
          .delta = std::nullopt,
          .guards = {},
          .coords = spec.coords,
      });
  return TransitionHandle{.model = id_, .id = id};
}

auto Model::AddArc(
    NodeHandle source, NodeHandle target, uint64_t weight, ArcKind kind)
    -> Result<void> {
  if (auto ok = CheckNotFrozen("add arc"); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto ok = CheckOwned(source); !ok) {
    return std::unexpected(ok.error());
  }
  if (auto ok = CheckOwned(target); !ok) {
    return std::unexpected(ok.error());
  }

  // Deltas are signed, so a weight must fit in int64_t.
  if (weight > static_cast<uint64_t>(INT64_MAX)) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kMalformedArc,
            fmt::format(
                "arc from {} to {} has weight {}, the maximum is {}",
                Describe(source), Describe(target), weight, INT64_MAX)));
  }

  if (kind == ArcKind::kInhibitor &&
      !(std::holds_alternative<PlaceHandle>(source) &&
        std::holds_alternative<TransitionHandle>(target))) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kMalformedArc,
            fmt::format(
                "inhibitor arc from {} to {} must target a transition",
                Describe(source), Describe(target)))
            .WithNote("inhibitor arcs run from a place to a transition"));
  }

  arcs_.push_back(
      Arc{.source = source, .target = target, .weight = weight, .kind = kind});
  return {};
}

auto Model::NewVar() -> Result<VarBuilder> {
  if (imported_) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kOverlayUnavailable,
            fmt::format(
                "model '{}' was imported from a snapshot and cannot take "
                "variables",
                schema_)));
  }
  vars_.emplace_back();
  return VarBuilder(vars_.back());
}

auto Model::AssertFrozen() const -> Result<void> {
  if (!frozen_) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kNotFrozen,
            fmt::format("expected model '{}' to be frozen", schema_)));
  }
  return {};
}

auto Model::FindPlace(std::string_view name) const -> std::optional<PlaceId> {
  return Lookup(place_index_, name);
}

auto Model::FindTransition(std::string_view name) const
    -> std::optional<TransitionId> {
  return Lookup(transition_index_, name);
}

auto Model::FindRole(std::string_view name) const -> std::optional<RoleId> {
  return Lookup(role_index_, name);
}

auto Model::RoleName(RoleId id) const -> const std::string& {
  static const std::string kNoRole;
  if (!id || id.value >= roles_.size()) {
    return kNoRole;
  }
  return roles_[id.value];
}

auto Model::Describe(const NodeHandle& node) const -> std::string {
  return std::visit(
      Overloaded{
          [&](const PlaceHandle& p) -> std::string {
            if (p.model != id_ || p.id.value >= places_.size()) {
              return "unknown place";
            }
            return fmt::format("place '{}'", places_[p.id.value].name);
          },
          [&](const TransitionHandle& t) -> std::string {
            if (t.model != id_ || t.id.value >= transitions_.size()) {
              return "unknown transition";
            }
            return fmt::format(
                "transition '{}'", transitions_[t.id.value].name);
          },
      },
      node);
}

auto Model::CheckNotFrozen(std::string_view operation) const -> Result<void> {
  if (frozen_) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kAlreadyFrozen,
            fmt::format(
                "cannot {}: model '{}' is frozen", operation, schema_)));
  }
  return {};
}

auto Model::CheckOwned(const NodeHandle& node) const -> Result<void> {
  bool owned = std::visit(
      Overloaded{
          [&](const PlaceHandle& p) {
            return p.model == id_ && p.id.value < places_.size();
          },
          [&](const TransitionHandle& t) {
            return t.model == id_ && t.id.value < transitions_.size();
          },
      },
      node);
  if (!owned) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kUnresolvedReference,
            fmt::format(
                "arc endpoint was not declared in model '{}'", schema_)));
  }
  return {};
}

}  // namespace fnt::model
