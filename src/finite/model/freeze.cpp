#include <cstddef>
#include <cstdint>
#include <expected>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "finite/common/diagnostic/diagnostic.hpp"
#include "finite/common/overloaded.hpp"
#include "finite/model/model.hpp"

namespace fnt::model {

namespace {

// Inhibitors on the same pair overwrite like deltas do.
void SetGuard(std::vector<Guard>& guards, uint32_t offset, uint64_t weight) {
  for (Guard& guard : guards) {
    if (guard.offset == offset) {
      guard.weight = weight;
      return;
    }
  }
  guards.push_back(Guard{.offset = offset, .weight = weight});
}

}  // namespace

auto Model::Freeze() -> Result<void> {
  if (frozen_) {
    return {};
  }

  const size_t place_count = places_.size();
  std::vector<std::vector<int64_t>> deltas(
      transitions_.size(), std::vector<int64_t>(place_count, 0));
  std::vector<std::vector<Guard>> guards(transitions_.size());

  for (size_t i = 0; i < arcs_.size(); ++i) {
    const Arc& arc = arcs_[i];
    const auto weight = static_cast<int64_t>(arc.weight);

    // Each arc assigns its slot; a later arc on the same pair wins.
    bool folded = std::visit(
        Overloaded{
            [&](const PlaceHandle& p, const TransitionHandle& t) {
              const uint32_t offset = places_[p.id.value].offset;
              if (arc.kind == ArcKind::kInhibitor) {
                SetGuard(guards[t.id.value], offset, arc.weight);
              } else {
                deltas[t.id.value][offset] = -weight;
              }
              return true;
            },
            [&](const TransitionHandle& t, const PlaceHandle& p) {
              if (arc.kind == ArcKind::kInhibitor) {
                return false;
              }
              deltas[t.id.value][places_[p.id.value].offset] = weight;
              return true;
            },
            [](const auto&, const auto&) { return false; },
        },
        arc.source, arc.target);

    if (!folded) {
      return std::unexpected(
          Diagnostic::Error(
              ErrorCode::kMalformedArc,
              fmt::format(
                  "bad arc declaration: arc #{} from {} to {} does not "
                  "connect a place and a transition",
                  i, Describe(arc.source), Describe(arc.target)))
              .WithNote(
                  fmt::format("model '{}' was left unfrozen", schema_)));
    }
  }

  for (size_t t = 0; t < transitions_.size(); ++t) {
    transitions_[t].delta = std::move(deltas[t]);
    transitions_[t].guards = std::move(guards[t]);
  }
  spdlog::debug(
      "froze model '{}': {} places, {} transitions, {} arcs", schema_,
      place_count, transitions_.size(), arcs_.size());
  arcs_.clear();
  frozen_ = true;
  return {};
}

}  // namespace fnt::model
