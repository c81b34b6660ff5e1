#pragma once

#include <array>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fnt::driver {

// Phase-level progress for `-v`. All output goes to stderr so that stdout
// carries only the compiled snapshot.
class VerboseLogger {
 public:
  explicit VerboseLogger(int level, FILE* sink = stderr)
      : level_(level), sink_(sink) {
  }

  auto Enabled(int required_level) const -> bool {
    return level_ >= required_level;
  }

  void PhaseBegin(std::string_view phase_name);
  void PhaseDone(std::string_view phase_name, double seconds);

  // Called by PhaseTimer regardless of level.
  void RecordPhaseDuration(std::string_view name, double seconds);

  // One "[finite][stats][phase] load=0.00s freeze=..." line.
  void PrintPhaseSummary(FILE* sink = stderr) const;

 private:
  static constexpr std::array<std::string_view, 4> kPhaseOrder = {
      "load", "freeze", "overlay", "export"};

  int level_;
  FILE* sink_;
  std::unordered_map<std::string, double> phase_durations_;
};

// Logs begin on construction and done on destruction.
class PhaseTimer {
 public:
  PhaseTimer(VerboseLogger& logger, std::string phase_name);
  ~PhaseTimer();

  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  VerboseLogger& logger_;
  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
  bool enabled_;
};

}  // namespace fnt::driver
