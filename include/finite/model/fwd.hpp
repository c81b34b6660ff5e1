#pragma once

#include <cstdint>
#include <variant>

namespace fnt::model {

// Identity of the model that issued a handle. Handles from one model are
// rejected by every other model.
struct ModelId {
  uint32_t value = 0;

  auto operator==(const ModelId&) const -> bool = default;
  auto operator<=>(const ModelId&) const = default;
};

// Index into the place arena. Equal to the place's offset.
struct PlaceId {
  uint32_t value = 0;

  auto operator==(const PlaceId&) const -> bool = default;
  auto operator<=>(const PlaceId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

constexpr PlaceId kInvalidPlaceId{UINT32_MAX};

struct TransitionId {
  uint32_t value = 0;

  auto operator==(const TransitionId&) const -> bool = default;
  auto operator<=>(const TransitionId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

constexpr TransitionId kInvalidTransitionId{UINT32_MAX};

struct RoleId {
  uint32_t value = 0;

  auto operator==(const RoleId&) const -> bool = default;
  auto operator<=>(const RoleId&) const = default;
  explicit operator bool() const {
    return value != UINT32_MAX;
  }
};

constexpr RoleId kInvalidRoleId{UINT32_MAX};

// Tagged handles: an arena index plus the owning model's identity.
struct PlaceHandle {
  ModelId model;
  PlaceId id = kInvalidPlaceId;

  auto operator==(const PlaceHandle&) const -> bool = default;
};

struct TransitionHandle {
  ModelId model;
  TransitionId id = kInvalidTransitionId;

  auto operator==(const TransitionHandle&) const -> bool = default;
};

// A default-constructed RoleHandle means "no role" and exports as "".
struct RoleHandle {
  ModelId model;
  RoleId id = kInvalidRoleId;

  auto operator==(const RoleHandle&) const -> bool = default;
};

using NodeHandle = std::variant<PlaceHandle, TransitionHandle>;

struct Place;
struct Transition;
struct Arc;
struct VarBinding;
struct Snapshot;
class Model;

}  // namespace fnt::model
