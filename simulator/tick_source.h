#pragma once

#include <cstdint>
#include <vector>

class Bus;
class BusMonitor;

// Anything that updates once per tick. Tick() must read only the bus
// snapshot and its own state, and must write only wires it owns.
class Clocked {
 public:
  virtual ~Clocked() = default;

  virtual void Tick() = 0;
};

class TickSource {
 public:
  explicit TickSource(Bus* bus) : bus_(bus) {}

  TickSource(TickSource&) = delete;

  void Attach(Clocked* component);

  // Runs every attached component against the current snapshot, then
  // commits the bus.
  void Step(BusMonitor* monitor = nullptr);

  uint64_t step() const { return step_; }

  // Number of rising sclk edges committed so far.
  uint64_t cycles() const { return cycle_; }

 private:
  Bus* bus_;
  std::vector<Clocked*> components_;

  uint64_t step_ = 0;
  uint64_t cycle_ = 0;
};
