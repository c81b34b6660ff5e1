#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/internal_error.hpp"
#include "finite/model/model.hpp"
#include "finite/model/var.hpp"

namespace fnt::model {

// ---------------------------------------------------------------------------
// VarBuilder
// ---------------------------------------------------------------------------

auto VarBuilder::Capacity(std::string place) -> VarBuilder& {
  binding_->kind = VarKind::kCapacity;
  binding_->ref = VarRef{.source = {}, .target = std::move(place)};
  binding_->direction = ArcDirection::kInferred;
  return *this;
}

auto VarBuilder::Initial(std::string place) -> VarBuilder& {
  binding_->kind = VarKind::kInitial;
  binding_->ref = VarRef{.source = {}, .target = std::move(place)};
  binding_->direction = ArcDirection::kInferred;
  return *this;
}

auto VarBuilder::Weight(std::string source, std::string target)
    -> VarBuilder& {
  binding_->kind = VarKind::kWeight;
  binding_->ref =
      VarRef{.source = std::move(source), .target = std::move(target)};
  binding_->direction = ArcDirection::kInferred;
  return *this;
}

auto VarBuilder::Consume(std::string place, std::string transition)
    -> VarBuilder& {
  Weight(std::move(place), std::move(transition));
  binding_->direction = ArcDirection::kPlaceToTransition;
  return *this;
}

auto VarBuilder::Produce(std::string transition, std::string place)
    -> VarBuilder& {
  Weight(std::move(transition), std::move(place));
  binding_->direction = ArcDirection::kTransitionToPlace;
  return *this;
}

auto VarBuilder::Label(std::string label) -> VarBuilder& {
  binding_->label = std::move(label);
  return *this;
}

auto VarBuilder::Describe(std::string description) -> VarBuilder& {
  binding_->description = std::move(description);
  return *this;
}

void VarBuilder::Bind(ValueFn fn) {
  binding_->value = std::move(fn);
}

// ---------------------------------------------------------------------------
// Overlay application
// ---------------------------------------------------------------------------

namespace {

auto VarName(const VarBinding& var, size_t index) -> std::string {
  if (var.label.empty()) {
    return fmt::format("variable #{}", index);
  }
  return fmt::format("variable #{} '{}'", index, var.label);
}

auto Unresolved(const VarBinding& var, size_t index, std::string detail)
    -> Diagnostic {
  return Diagnostic::Error(
      ErrorCode::kUnresolvedReference,
      fmt::format("{}: {}", VarName(var, index), detail));
}

}  // namespace

auto Model::ApplyOverlay() -> Result<void> {
  if (imported_) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kOverlayUnavailable,
            fmt::format(
                "model '{}' was imported from a snapshot and cannot be "
                "overlaid",
                schema_)));
  }
  if (!frozen_) {
    return std::unexpected(
        Diagnostic::Error(
            ErrorCode::kNotFrozen,
            fmt::format(
                "cannot apply variables: model '{}' is not frozen", schema_))
            .WithNote("call Freeze() before ApplyOverlay()"));
  }
  if (vars_.empty()) {
    return {};
  }

  // Patch copies and commit only once every variable resolved.
  std::vector<Place> places = places_;
  std::vector<Transition> transitions = transitions_;

  auto place_of = [&](const std::string& name) -> Place* {
    auto id = FindPlace(name);
    return id ? &places[id->value] : nullptr;
  };
  auto transition_of = [&](const std::string& name) -> Transition* {
    auto id = FindTransition(name);
    return id ? &transitions[id->value] : nullptr;
  };

  for (size_t i = 0; i < vars_.size(); ++i) {
    const VarBinding& var = vars_[i];
    if (!var.IsBound()) {
      return std::unexpected(
          Diagnostic::Error(
              ErrorCode::kUnboundVariable,
              fmt::format("unbound variable: {}", VarName(var, i))));
    }

    switch (var.kind) {
      case VarKind::kCapacity:
      case VarKind::kInitial: {
        Place* place = place_of(var.ref.target);
        if (place == nullptr) {
          return std::unexpected(Unresolved(
              var, i, fmt::format("unknown place '{}'", var.ref.target)));
        }
        const uint64_t value = var.value();
        if (var.kind == VarKind::kCapacity) {
          place->capacity = value;
        } else {
          place->initial = value;
        }
        spdlog::debug(
            "overlay: {}.{} = {}", place->name,
            var.kind == VarKind::kCapacity ? "capacity" : "initial", value);
        break;
      }

      case VarKind::kWeight: {
        ArcDirection direction = var.direction;
        if (direction == ArcDirection::kInferred) {
          if (transition_of(var.ref.source) != nullptr) {
            direction = ArcDirection::kTransitionToPlace;
          } else if (transition_of(var.ref.target) != nullptr) {
            direction = ArcDirection::kPlaceToTransition;
          } else {
            return std::unexpected(Unresolved(
                var, i,
                fmt::format(
                    "neither '{}' nor '{}' names a transition",
                    var.ref.source, var.ref.target)));
          }
        }

        const bool produces = direction == ArcDirection::kTransitionToPlace;
        const std::string& transition_name =
            produces ? var.ref.source : var.ref.target;
        const std::string& place_name =
            produces ? var.ref.target : var.ref.source;

        Transition* transition = transition_of(transition_name);
        if (transition == nullptr) {
          return std::unexpected(Unresolved(
              var, i, fmt::format("unknown transition '{}'", transition_name)));
        }
        Place* place = place_of(place_name);
        if (place == nullptr) {
          return std::unexpected(Unresolved(
              var, i, fmt::format("unknown place '{}'", place_name)));
        }

        if (!transition->delta) {
          common::ThrowInternalError(
              "ApplyOverlay",
              fmt::format(
                  "frozen transition '{}' has no delta", transition->name));
        }
        const uint64_t raw = var.value();
        if (raw > static_cast<uint64_t>(INT64_MAX)) {
          return std::unexpected(
              Diagnostic::Error(
                  ErrorCode::kMalformedArc,
                  fmt::format(
                      "{}: weight {} between '{}' and '{}' exceeds {}",
                      VarName(var, i), raw, transition->name, place->name,
                      INT64_MAX)));
        }
        const auto value = static_cast<int64_t>(raw);
        (*transition->delta)[place->offset] = produces ? value : -value;
        spdlog::debug(
            "overlay: {}[{}] = {}", transition->name, place->name,
            (*transition->delta)[place->offset]);
        break;
      }
    }
  }

  places_ = std::move(places);
  transitions_ = std::move(transitions);
  vars_.clear();
  return {};
}

}  // namespace fnt::model
