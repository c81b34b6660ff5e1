#include "finite/model/dumper.hpp"

#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace fnt::model {

Dumper::Dumper(std::ostream* out) : out_(out) {
}

void Dumper::PrintIndent() {
  for (int i = 0; i < indent_; ++i) {
    *out_ << "  ";
  }
}

void Dumper::Indent() {
  ++indent_;
}

void Dumper::Dedent() {
  assert(indent_ > 0);
  --indent_;
}

auto Dumper::CapacityString(uint64_t capacity) -> std::string {
  if (capacity == 0) {
    return "unbounded";
  }
  return fmt::format("{}", capacity);
}

void Dumper::Dump(const Snapshot& snapshot) {
  *out_ << fmt::format("Model {} {{\n", snapshot.schema);
  Indent();
  DumpPlaces(snapshot);
  DumpTransitions(snapshot);
  Dedent();
  *out_ << "}\n";
}

void Dumper::DumpPlaces(const Snapshot& snapshot) {
  PrintIndent();
  *out_ << fmt::format("places ({}) {{\n", snapshot.PlaceCount());
  Indent();
  const std::vector<std::string> names = snapshot.OrderedPlaceNames();
  for (const std::string& name : names) {
    const PlaceEntry& place = snapshot.places.at(name);
    PrintIndent();
    *out_ << fmt::format(
        "[{}] {} initial={} capacity={}\n", place.offset, name, place.initial,
        CapacityString(place.capacity));
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

void Dumper::DumpTransitions(const Snapshot& snapshot) {
  PrintIndent();
  *out_ << fmt::format("transitions ({}) {{\n", snapshot.transitions.size());
  Indent();
  const std::vector<std::string> names = snapshot.OrderedPlaceNames();
  for (const auto& [name, transition] : snapshot.transitions) {
    PrintIndent();
    *out_ << fmt::format(
        "{} role=\"{}\" delta=[{}]\n", name, transition.role,
        fmt::join(transition.delta, ", "));
    Indent();
    for (const Guard& guard : transition.guards) {
      PrintIndent();
      *out_ << fmt::format(
          "inhibited by {} >= {}\n", names.at(guard.offset), guard.weight);
    }
    Dedent();
  }
  Dedent();
  PrintIndent();
  *out_ << "}\n";
}

}  // namespace fnt::model
