#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "finite/model/fwd.hpp"

namespace fnt::model {

enum class VarKind : uint8_t {
  kInitial,
  kCapacity,
  kWeight,
};

// Direction of a weight variable. kInferred probes which side names a
// transition; the explicit forms skip the probe.
enum class ArcDirection : uint8_t {
  kInferred,
  kPlaceToTransition,
  kTransitionToPlace,
};

using ValueFn = std::function<uint64_t()>;

// Capacity/Initial use `target` only; Weight uses both.
struct VarRef {
  std::string source;
  std::string target;

  auto operator==(const VarRef&) const -> bool = default;
};

// A pending overlay patch. Resolved exactly once by Model::ApplyOverlay.
struct VarBinding {
  std::string label;
  std::string description;
  VarKind kind = VarKind::kInitial;
  VarRef ref;
  ArcDirection direction = ArcDirection::kInferred;
  ValueFn value;

  [[nodiscard]] auto IsBound() const -> bool {
    return static_cast<bool>(value);
  }
};

// Fluent editor for one pending binding, returned by Model::NewVar. The
// binding it edits lives in the model's var list; the builder is valid until
// the next ApplyOverlay on that model.
class VarBuilder {
 public:
  explicit VarBuilder(VarBinding& binding) : binding_(&binding) {
  }

  auto Capacity(std::string place) -> VarBuilder&;
  auto Initial(std::string place) -> VarBuilder&;

  // Weight of the arc between two names; direction is inferred at overlay.
  auto Weight(std::string source, std::string target) -> VarBuilder&;

  // Weight of a place -> transition arc (stored negated).
  auto Consume(std::string place, std::string transition) -> VarBuilder&;

  // Weight of a transition -> place arc.
  auto Produce(std::string transition, std::string place) -> VarBuilder&;

  auto Label(std::string label) -> VarBuilder&;
  auto Describe(std::string description) -> VarBuilder&;

  // Rebinding replaces the previous function.
  void Bind(ValueFn fn);

 private:
  VarBinding* binding_;
};

}  // namespace fnt::model
