#include "bus_monitor.h"

void BusMonitor::Dump(uint64_t tick, const BusState& state) {
  samples_.push_back({tick, state});
}

std::vector<BusMonitor::SelectSpan> BusMonitor::SelectSpans() const {
  std::vector<SelectSpan> spans;
  for (size_t i = 0; i < samples_.size(); i++) {
    const BusState& cur = samples_[i].state;
    const bool prev_selected = i > 0 && samples_[i - 1].state.selected();

    if (cur.selected() && !prev_selected) {
      spans.push_back({i, i, false, 0});
      continue;
    }
    if (!prev_selected)
      continue;

    SelectSpan& span = spans.back();
    if (cur.sclk != samples_[i - 1].state.sclk)
      span.clock_transitions++;
    if (cur.selected()) {
      span.last = i;
    } else {
      span.closed = true;
    }
  }
  return spans;
}

std::vector<bool> BusMonitor::AtRisingEdges(Wire w) const {
  std::vector<bool> values;
  for (size_t i = 1; i < samples_.size(); i++) {
    const BusState& prev = samples_[i - 1].state;
    const BusState& cur = samples_[i].state;
    if (cur.selected() && !prev.sclk && cur.sclk)
      values.push_back(cur.Get(w));
  }
  return values;
}

void BusMonitor::Print(std::ostream& os) const {
  for (const Sample& s : samples_) {
    os << s.tick << ": " << s.state << "\n";
  }
}
