#include "responder.h"

#include <glog/logging.h>

void Responder::Tick() {
  const BusState s = bus_->snapshot();

  Event events[3];
  int n = 0;
  if (seen_.select_n && !s.select_n) {
    events[n++] = SELECT_ASSERTED;
    // sclk idles low in mode 0, so bit 7 has to be on the wire before the
    // first rising edge: the select assertion stands in for that edge.
    if (!s.sclk)
      events[n++] = SCLK_FALLING;
  } else if (!seen_.select_n && s.select_n) {
    events[n++] = SELECT_DEASSERTED;
  }
  if (seen_.sclk && !s.sclk) {
    events[n++] = SCLK_FALLING;
  } else if (!seen_.sclk && s.sclk) {
    events[n++] = SCLK_RISING;
  }
  seen_ = s;

  for (int i = 0; i < n; i++) {
    Handle(events[i], s);
  }
}

void Responder::Handle(Event e, const BusState& s) {
  switch (e) {
    case SELECT_ASSERTED:
      if (state_ == ACTIVE)
        VLOG(1) << "Responder reselected with " << count_ << " bits pending";
      tx_.Load(kReply);
      count_ = ShiftRegister::kWidth;
      drives_ = 0;
      samples_ = 0;
      state_ = ACTIVE;
      break;
    case SELECT_DEASSERTED:
      if (state_ == ACTIVE && count_ > 0) {
        VLOG(1) << "Responder deselected with " << count_
                << " bits not sent";
        abandoned_++;
      }
      state_ = IDLE;
      break;
    case SCLK_FALLING:
      if (state_ == ACTIVE && count_ > 0) {
        bus_->Drive(Driver::DRIVER_RESPONDER, Wire::WIRE_RESP_OUT,
                    tx_.ShiftOut());
        drives_++;
        count_--;
      }
      break;
    case SCLK_RISING:
      if (state_ == ACTIVE) {
        // Incoming data is clocked but never kept.
        samples_++;
        VLOG(2) << "Responder discarding " << s.ctrl_out;
      }
      break;
  }
}
