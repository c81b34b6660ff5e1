#include "finite/dsl/dsl.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/model/model.hpp"

namespace fnt::dsl {

namespace {

template <typename T>
auto Unwrap(Result<T> result) -> T {
  if (!result) {
    throw DiagnosticException(std::move(result.error()));
  }
  return std::move(*result);
}

void Unwrap(Result<void> result) {
  if (!result) {
    throw DiagnosticException(std::move(result.error()));
  }
}

}  // namespace

auto Declaration::Role(std::string name) -> dsl::Role {
  return Unwrap(model_.DeclareRole(std::move(name)));
}

auto Declaration::Cell(std::string name, dsl::Cell cell) -> PlaceNode {
  return Unwrap(model_.DeclarePlace(std::move(name), cell));
}

auto Declaration::Fn(std::string name, Defun defun) -> FnNode {
  return Unwrap(model_.DeclareTransition(std::move(name), defun));
}

auto Declaration::NewVar() -> Var {
  return Unwrap(model_.NewVar());
}

void Declaration::AddArc(
    Node source, Node target, uint64_t weight, model::ArcKind kind) {
  Unwrap(model_.AddArc(source, target, weight, kind));
}

auto NewModel(std::string schema, const ModelDeclaration& declare)
    -> Result<model::Model> {
  model::Model model(std::move(schema));
  Declaration declaration(model);
  try {
    declare(declaration);
  } catch (const DiagnosticException& e) {
    return std::unexpected(e.GetDiagnostic());
  }
  return model;
}

auto NewVar(model::Model& model) -> Result<Var> {
  return model.NewVar();
}

auto StateMachine(model::Model& model) -> Result<model::Snapshot> {
  if (auto frozen = model.Freeze(); !frozen) {
    return std::unexpected(frozen.error());
  }
  if (!model.IsImported()) {
    if (auto overlaid = model.ApplyOverlay(); !overlaid) {
      return std::unexpected(overlaid.error());
    }
  }
  return model.Export();
}

auto Marshal(model::Model& model) -> Result<std::string> {
  if (auto frozen = model.Freeze(); !frozen) {
    return std::unexpected(frozen.error());
  }
  auto snapshot = model.Export();
  if (!snapshot) {
    return std::unexpected(snapshot.error());
  }
  return snapshot->ToBytes();
}

auto Unmarshal(std::string_view bytes) -> Result<model::Model> {
  return model::Model::FromBytes(bytes);
}

}  // namespace fnt::dsl
