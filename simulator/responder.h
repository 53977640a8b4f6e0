#pragma once

#include <cstdint>

#include "bus.h"
#include "shift_register.h"
#include "tick_source.h"

// Mode-0 responder with a fixed reply. Owns resp_out only.
//
// Edges are found by comparing the committed snapshot with the one seen on
// the previous tick. Select edges are handled before clock edges. While
// idle resp_out is left holding whatever was last driven.
class Responder : public Clocked {
 public:
  static constexpr uint8_t kReply = 0x3C;

  explicit Responder(Bus* bus) : bus_(bus) {}

  Responder(Responder&) = delete;

  void Tick() override;

  bool active() const { return state_ == ACTIVE; }
  int bits_remaining() const { return count_; }

  // Counted since the last select assertion.
  int drive_events() const { return drives_; }
  int sample_events() const { return samples_; }

  // Transfers where select went away before all eight bits were out.
  int abandoned() const { return abandoned_; }

 private:
  enum State { IDLE, ACTIVE };
  enum Event { SELECT_ASSERTED, SELECT_DEASSERTED, SCLK_FALLING, SCLK_RISING };

  void Handle(Event e, const BusState& s);

  Bus* bus_;
  BusState seen_;

  State state_ = IDLE;
  ShiftRegister tx_;
  int count_ = 0;

  int drives_ = 0;
  int samples_ = 0;
  int abandoned_ = 0;
};
