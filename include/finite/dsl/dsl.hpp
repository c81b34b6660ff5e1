#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/model/model.hpp"

// User-facing declaration API over model::Model.
//
// Usage:
//   auto model = dsl::NewModel("Counter", [](dsl::Declaration& d) {
//     auto user = d.Role("default");
//     auto dec0 = d.Fn("DEC0", {.role = user});
//     auto p0 = d.Arc(d.Cell("p0", {.initial = 0}), 1, dec0);
//     d.Arc(d.Fn("INC0", {.role = user}), 1, p0);
//   });
//
// Declaration methods throw DiagnosticException; NewModel turns that back
// into a Result.
namespace fnt::dsl {

using Cell = model::PlaceSpec;
using Defun = model::TransitionSpec;
using Role = model::RoleHandle;
using PlaceNode = model::PlaceHandle;
using FnNode = model::TransitionHandle;
using Node = model::NodeHandle;
using Var = model::VarBuilder;

class Declaration {
 public:
  explicit Declaration(model::Model& model) : model_(model) {
  }

  auto Role(std::string name) -> dsl::Role;
  auto Cell(std::string name, dsl::Cell cell = {}) -> PlaceNode;
  auto Fn(std::string name, Defun defun = {}) -> FnNode;

  // Records an arc from `node` to `other` and returns `node` for chaining.
  // Direction is taken from the endpoint kinds when the model is frozen.
  template <typename N>
  auto Arc(N node, uint64_t weight, Node other) -> N {
    AddArc(Node{node}, other, weight, model::ArcKind::kNormal);
    return node;
  }

  // Alias of Arc, matching the transaction-style reading `p.Tx(1, fn)`.
  template <typename N>
  auto Tx(N node, uint64_t weight, Node other) -> N {
    return Arc(node, weight, other);
  }

  // Inhibitor arcs must run from a place to a transition; anything else
  // throws a malformed-arc diagnostic immediately.
  template <typename N>
  auto Inhibitor(N node, uint64_t weight, Node other) -> N {
    AddArc(Node{node}, other, weight, model::ArcKind::kInhibitor);
    return node;
  }

  auto NewVar() -> Var;

 private:
  void AddArc(Node source, Node target, uint64_t weight, model::ArcKind kind);

  model::Model& model_;
};

using ModelDeclaration = std::function<void(Declaration&)>;

// Creates a model and runs `declare` against it.
auto NewModel(std::string schema, const ModelDeclaration& declare)
    -> Result<model::Model>;

// Starts a variable on an existing model (before or after freeze).
auto NewVar(model::Model& model) -> Result<Var>;

// Freezes, resolves every pending variable and exports the compiled
// snapshot the evaluator runs on.
auto StateMachine(model::Model& model) -> Result<model::Snapshot>;

// Freezes if needed and serializes. Pending variables are not applied.
auto Marshal(model::Model& model) -> Result<std::string>;

// Loads a frozen model from Marshal output.
auto Unmarshal(std::string_view bytes) -> Result<model::Model>;

}  // namespace fnt::dsl
