#pragma once

#include <ostream>

// The four wires of the link. Select is active-low.
enum class Wire {
  WIRE_SELECT_N = 0,
  WIRE_SCLK = 1,
  WIRE_CTRL_OUT = 2,
  WIRE_RESP_OUT = 3,
};

enum class Driver {
  DRIVER_CONTROLLER = 0,
  DRIVER_RESPONDER = 1,
};

// Every wire has exactly one party allowed to drive it.
Driver OwnerOf(Wire w);

const char* WireName(Wire w);

struct BusState {
  bool select_n = true;
  bool sclk = false;
  bool ctrl_out = false;
  bool resp_out = false;

  bool Get(Wire w) const;
  bool selected() const { return !select_n; }

  bool operator==(const BusState& o) const {
    return select_n == o.select_n && sclk == o.sclk &&
           ctrl_out == o.ctrl_out && resp_out == o.resp_out;
  }
  bool operator!=(const BusState& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const BusState& s);

// Double-buffered wires. Readers only ever see the snapshot committed at the
// end of the previous tick; Drive() writes go to the pending copy and become
// visible on Commit(). A wire nobody drives during a tick keeps its value.
class Bus {
 public:
  Bus() = default;
  Bus(Bus&) = delete;

  const BusState& snapshot() const { return committed_; }

  void Drive(Driver driver, Wire w, bool value);

  void Commit();

 private:
  BusState committed_;
  BusState pending_;
};
