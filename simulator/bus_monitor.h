#pragma once

#include <cstdint>
#include <ostream>
#include <vector>

#include "bus.h"

// In-memory record of every committed bus snapshot.
class BusMonitor {
 public:
  struct Sample {
    uint64_t tick;
    BusState state;
  };

  // Span of consecutive snapshots with select asserted.
  struct SelectSpan {
    size_t first;  // index into samples() of the first selected snapshot
    size_t last;   // index of the last selected snapshot
    bool closed;   // select was seen deasserting again
    int clock_transitions;
  };

  BusMonitor() = default;

  void Dump(uint64_t tick, const BusState& state);

  void Clear() { samples_.clear(); }

  const std::vector<Sample>& samples() const { return samples_; }

  // Clock transitions are counted from the first selected snapshot up to and
  // including the one committed together with the select release.
  std::vector<SelectSpan> SelectSpans() const;

  // Value of `w` in each snapshot that carries a rising sclk edge while
  // select is asserted.
  std::vector<bool> AtRisingEdges(Wire w) const;

  // One line per snapshot.
  void Print(std::ostream& os) const;

 private:
  std::vector<Sample> samples_;
};
