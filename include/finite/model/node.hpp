#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "finite/model/fwd.hpp"

namespace fnt::model {

// Position on the x/y grid of a visual editor. Never compiled or exported.
struct Coords {
  int32_t x = 0;
  int32_t y = 0;

  auto operator==(const Coords&) const -> bool = default;
};

// Capacity 0 means unbounded.
struct PlaceSpec {
  uint64_t initial = 0;
  uint64_t capacity = 0;
  std::optional<Coords> coords;
};

struct TransitionSpec {
  RoleHandle role;
  std::optional<Coords> coords;
};

struct Place {
  std::string name;
  uint32_t offset = 0;
  uint64_t initial = 0;
  uint64_t capacity = 0;
  std::optional<Coords> coords;
};

// Compiled inhibitor arc: the transition is disabled while the place holds
// at least `weight` tokens. Contributes nothing to the delta.
struct Guard {
  uint32_t offset = 0;
  uint64_t weight = 0;

  auto operator==(const Guard&) const -> bool = default;
};

struct Transition {
  std::string name;
  RoleId role = kInvalidRoleId;
  // Absent until freeze; afterwards sized to the place count.
  std::optional<std::vector<int64_t>> delta;
  std::vector<Guard> guards;
  std::optional<Coords> coords;
};

enum class ArcKind : uint8_t {
  kNormal,
  kInhibitor,
};

// Ledger entry. Orientation is classified at freeze.
struct Arc {
  NodeHandle source;
  NodeHandle target;
  uint64_t weight = 0;
  ArcKind kind = ArcKind::kNormal;
};

}  // namespace fnt::model
