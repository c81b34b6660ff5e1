#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include "finite/model/snapshot.hpp"

namespace fnt::model {

// Human-readable rendering of a compiled snapshot. Places are listed in
// offset order, so delta columns line up with them.
class Dumper {
 public:
  explicit Dumper(std::ostream* out);

  void Dump(const Snapshot& snapshot);

 private:
  void DumpPlaces(const Snapshot& snapshot);
  void DumpTransitions(const Snapshot& snapshot);
  void PrintIndent();
  void Indent();
  void Dedent();

  [[nodiscard]] static auto CapacityString(uint64_t capacity) -> std::string;

  std::ostream* out_;
  int indent_ = 0;
};

}  // namespace fnt::model
