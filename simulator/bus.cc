#include "bus.h"

#include <glog/logging.h>

Driver OwnerOf(Wire w) {
  switch (w) {
    case Wire::WIRE_SELECT_N:
    case Wire::WIRE_SCLK:
    case Wire::WIRE_CTRL_OUT:
      return Driver::DRIVER_CONTROLLER;
    case Wire::WIRE_RESP_OUT:
      return Driver::DRIVER_RESPONDER;
  }
  LOG(FATAL) << "Unknown wire " << static_cast<int>(w);
  return Driver::DRIVER_CONTROLLER;
}

const char* WireName(Wire w) {
  switch (w) {
    case Wire::WIRE_SELECT_N:
      return "select_n";
    case Wire::WIRE_SCLK:
      return "sclk";
    case Wire::WIRE_CTRL_OUT:
      return "ctrl_out";
    case Wire::WIRE_RESP_OUT:
      return "resp_out";
  }
  return "?";
}

bool BusState::Get(Wire w) const {
  switch (w) {
    case Wire::WIRE_SELECT_N:
      return select_n;
    case Wire::WIRE_SCLK:
      return sclk;
    case Wire::WIRE_CTRL_OUT:
      return ctrl_out;
    case Wire::WIRE_RESP_OUT:
      return resp_out;
  }
  LOG(FATAL) << "Unknown wire " << static_cast<int>(w);
  return false;
}

std::ostream& operator<<(std::ostream& os, const BusState& s) {
  return os << "select_n=" << s.select_n << " sclk=" << s.sclk
            << " ctrl_out=" << s.ctrl_out << " resp_out=" << s.resp_out;
}

void Bus::Drive(Driver driver, Wire w, bool value) {
  CHECK(driver == OwnerOf(w)) << "Wire " << WireName(w)
                              << " driven by a party that does not own it";
  switch (w) {
    case Wire::WIRE_SELECT_N:
      pending_.select_n = value;
      break;
    case Wire::WIRE_SCLK:
      pending_.sclk = value;
      break;
    case Wire::WIRE_CTRL_OUT:
      pending_.ctrl_out = value;
      break;
    case Wire::WIRE_RESP_OUT:
      pending_.resp_out = value;
      break;
  }
}

void Bus::Commit() {
  committed_ = pending_;
}
