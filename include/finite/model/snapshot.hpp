#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/model/node.hpp"

namespace fnt::model {

struct PlaceEntry {
  uint32_t offset = 0;
  uint64_t initial = 0;
  uint64_t capacity = 0;

  auto operator==(const PlaceEntry&) const -> bool = default;
};

struct TransitionEntry {
  std::vector<int64_t> delta;
  std::string role;
  std::vector<Guard> guards;

  auto operator==(const TransitionEntry&) const -> bool = default;
};

// Plain, compiled projection of a frozen model. This is what an evaluator
// consumes: offsets are contiguous from zero and every delta has one slot per
// place, in offset order. Immutable once produced, so it may be shared
// read-only between evaluators.
struct Snapshot {
  std::string schema;
  std::map<std::string, PlaceEntry> places;
  std::map<std::string, TransitionEntry> transitions;

  auto operator==(const Snapshot&) const -> bool = default;

  [[nodiscard]] auto PlaceCount() const -> size_t {
    return places.size();
  }

  // Initial token counts indexed by offset.
  [[nodiscard]] auto InitialState() const -> std::vector<int64_t>;

  // Capacities indexed by offset (0 = unbounded).
  [[nodiscard]] auto Capacities() const -> std::vector<uint64_t>;

  // Place names indexed by offset.
  [[nodiscard]] auto OrderedPlaceNames() const -> std::vector<std::string>;

  // Checks the evaluator contract: offsets are unique and contiguous from
  // zero, every delta has PlaceCount() slots, guard offsets are in range.
  [[nodiscard]] auto Validate() const -> Result<void>;

  // Compact JSON with sorted keys. Equal snapshots give equal bytes.
  [[nodiscard]] auto ToBytes() const -> std::string;

  // Parses and validates. Violations are host errors.
  static auto FromBytes(std::string_view bytes) -> Result<Snapshot>;
};

}  // namespace fnt::model
