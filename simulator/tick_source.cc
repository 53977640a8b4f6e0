#include "tick_source.h"

#include <glog/logging.h>

#include "bus.h"
#include "bus_monitor.h"

void TickSource::Attach(Clocked* component) {
  CHECK(component != nullptr);
  components_.push_back(component);
}

void TickSource::Step(BusMonitor* monitor) {
  const bool sclk_before = bus_->snapshot().sclk;

  for (Clocked* c : components_) {
    c->Tick();
  }
  bus_->Commit();

  if (!sclk_before && bus_->snapshot().sclk) {
    cycle_++;
  }

  VLOG(2) << "tick " << step_ << ": " << bus_->snapshot();
  if (monitor) {
    monitor->Dump(step_, bus_->snapshot());
  }
  step_++;
}
