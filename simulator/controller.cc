#include "controller.h"

#include <glog/logging.h>

#include "bus.h"

void Controller::BeginTransfer() {
  if (state_ == ACTIVE) {
    VLOG(1) << "Controller busy, start request dropped";
    return;
  }
  start_requested_ = true;
}

void Controller::Abort() {
  start_requested_ = false;
  if (state_ == ACTIVE)
    abort_requested_ = true;
}

void Controller::Tick() {
  done_ = false;

  if (abort_requested_) {
    abort_requested_ = false;
    VLOG(1) << "Controller abandoning transfer with " << count_
            << " bits remaining";
    state_ = IDLE;
    count_ = 0;
    sclk_ = false;
    bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SELECT_N, true);
    bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SCLK, false);
    bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_CTRL_OUT, false);
    return;
  }

  switch (state_) {
    case IDLE:
      if (start_requested_) {
        start_requested_ = false;
        Activate();
      }
      break;
    case ACTIVE:
      if (first_phase_) {
        // sclk idles low, so the first phase is a falling one with no edge.
        first_phase_ = false;
        DriveBit();
      } else if (!sclk_) {
        sclk_ = true;
        bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SCLK, true);
      } else {
        SampleBit();
        sclk_ = false;
        bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SCLK, false);
        if (count_ == 0) {
          Complete();
        } else {
          DriveBit();
        }
      }
      break;
  }
}

void Controller::Activate() {
  tx_.Load(kPayload);
  rx_.Clear();
  count_ = ShiftRegister::kWidth;
  sclk_ = false;
  first_phase_ = true;
  drives_ = 0;
  samples_ = 0;
  state_ = ACTIVE;

  VLOG(1) << "Controller asserting select";
  bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SELECT_N, false);
  bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SCLK, false);
}

void Controller::DriveBit() {
  const bool b = tx_.ShiftOut();
  drives_++;
  bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_CTRL_OUT, b);
}

void Controller::SampleBit() {
  // The snapshot read here is the one committed with the rising edge.
  const bool b = bus_->snapshot().resp_out;
  rx_.ShiftIn(b);
  samples_++;
  count_--;
  DCHECK_GE(count_, 0);
  VLOG(2) << "Controller sampled " << b << ", " << count_ << " to go";
}

void Controller::Complete() {
  DCHECK_EQ(drives_, ShiftRegister::kWidth);
  DCHECK_EQ(samples_, ShiftRegister::kWidth);

  bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SELECT_N, true);
  bus_->Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_CTRL_OUT, false);
  result_ = rx_.value();
  done_ = true;
  state_ = IDLE;
  VLOG(1) << "Controller done, received 0x" << std::hex
          << static_cast<int>(result_);
}
