#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/model/fwd.hpp"
#include "finite/model/node.hpp"
#include "finite/model/snapshot.hpp"
#include "finite/model/var.hpp"

namespace fnt::model {

// Scaffolding for a bounded token-flow graph.
//
// Lifecycle:
//   1. Declare roles, places, transitions and arcs in any order.
//   2. Freeze(): fold the arc ledger into per-transition delta vectors and
//      lock the shape.
//   3. ApplyOverlay(): resolve every pending variable once and patch
//      capacity, initial or delta values in place.
//   4. Export(): project into a Snapshot for the evaluator.
//
// Single-threaded. Freeze needs exclusive access.
class Model final {
 public:
  explicit Model(std::string schema);
  ~Model() = default;

  Model(const Model&) = delete;
  auto operator=(const Model&) -> Model& = delete;

  Model(Model&&) = default;
  auto operator=(Model&&) -> Model& = default;

  // Rebuilds a frozen model from a snapshot. The result has no pending arcs
  // or vars and cannot be overlaid or extended.
  static auto Import(const Snapshot& snapshot) -> Result<Model>;
  static auto FromBytes(std::string_view bytes) -> Result<Model>;

  [[nodiscard]] auto Schema() const -> const std::string& {
    return schema_;
  }
  [[nodiscard]] auto Id() const -> ModelId {
    return id_;
  }

  // ---------------------------------------------------------------------
  // Node registry
  // ---------------------------------------------------------------------

  auto DeclareRole(std::string name) -> Result<RoleHandle>;

  // Assigns the next offset. Redeclaring a name overwrites the entry's
  // initial, capacity and coords but keeps its offset.
  auto DeclarePlace(std::string name, PlaceSpec spec) -> Result<PlaceHandle>;

  // Redeclaring a name overwrites its role and coords.
  auto DeclareTransition(std::string name, TransitionSpec spec)
      -> Result<TransitionHandle>;

  // ---------------------------------------------------------------------
  // Arc ledger
  // ---------------------------------------------------------------------

  // Appends to the ledger. Normal arcs are not orientation-checked until
  // Freeze; inhibitor arcs must be place -> transition here.
  auto AddArc(
      NodeHandle source, NodeHandle target, uint64_t weight,
      ArcKind kind = ArcKind::kNormal) -> Result<void>;

  // ---------------------------------------------------------------------
  // Compile and overlay
  // ---------------------------------------------------------------------

  // Idempotent: a frozen model is returned unchanged. On a malformed arc
  // nothing is committed and the model stays unfrozen.
  auto Freeze() -> Result<void>;

  // Starts a pending variable. Allowed before or after Freeze, never on an
  // imported model.
  auto NewVar() -> Result<VarBuilder>;

  // Resolves and applies every pending variable in declaration order, then
  // clears the list. Requires a frozen model. All-or-nothing.
  auto ApplyOverlay() -> Result<void>;

  // Requires a frozen model.
  [[nodiscard]] auto Export() const -> Result<Snapshot>;

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  [[nodiscard]] auto IsFrozen() const -> bool {
    return frozen_;
  }
  [[nodiscard]] auto IsImported() const -> bool {
    return imported_;
  }
  [[nodiscard]] auto AssertFrozen() const -> Result<void>;

  [[nodiscard]] auto PlaceCount() const -> size_t {
    return places_.size();
  }
  [[nodiscard]] auto TransitionCount() const -> size_t {
    return transitions_.size();
  }

  [[nodiscard]] auto Places() const -> std::span<const Place> {
    return places_;
  }
  [[nodiscard]] auto Transitions() const -> std::span<const Transition> {
    return transitions_;
  }
  [[nodiscard]] auto Roles() const -> std::span<const std::string> {
    return roles_;
  }
  [[nodiscard]] auto PendingArcs() const -> std::span<const Arc> {
    return arcs_;
  }
  [[nodiscard]] auto Vars() const -> const std::deque<VarBinding>& {
    return vars_;
  }

  [[nodiscard]] auto FindPlace(std::string_view name) const
      -> std::optional<PlaceId>;
  [[nodiscard]] auto FindTransition(std::string_view name) const
      -> std::optional<TransitionId>;
  [[nodiscard]] auto FindRole(std::string_view name) const
      -> std::optional<RoleId>;

  [[nodiscard]] auto operator[](PlaceId id) const -> const Place& {
    return places_[id.value];
  }
  [[nodiscard]] auto operator[](TransitionId id) const -> const Transition& {
    return transitions_[id.value];
  }

  // Empty string for kInvalidRoleId.
  [[nodiscard]] auto RoleName(RoleId id) const -> const std::string&;

  // "place 'p0'" / "transition 'INC0'", for diagnostics.
  [[nodiscard]] auto Describe(const NodeHandle& node) const -> std::string;

 private:
  auto CheckNotFrozen(std::string_view operation) const -> Result<void>;
  auto CheckOwned(const NodeHandle& node) const -> Result<void>;

  std::string schema_;
  ModelId id_;

  std::vector<Place> places_;
  std::vector<Transition> transitions_;
  std::vector<std::string> roles_;
  std::unordered_map<std::string, PlaceId> place_index_;
  std::unordered_map<std::string, TransitionId> transition_index_;
  std::unordered_map<std::string, RoleId> role_index_;

  std::vector<Arc> arcs_;
  std::deque<VarBinding> vars_;

  bool frozen_ = false;
  bool imported_ = false;
};

}  // namespace fnt::model
