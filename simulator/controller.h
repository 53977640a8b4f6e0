#pragma once

#include <cstdint>

#include "shift_register.h"
#include "tick_source.h"

class Bus;

// Mode-0 bus controller. Owns select, sclk and ctrl_out.
//
// A transfer takes one tick to assert select, then one clock phase per tick:
// a first falling phase that puts bit 7 on ctrl_out with sclk still low,
// then alternating rising and falling phases. The bus value committed with
// each rising edge is shifted into the receive register on the following
// falling phase. After the eighth bit the controller releases select, leaves
// sclk low, latches the received byte and raises done() for one tick.
class Controller : public Clocked {
 public:
  static constexpr uint8_t kPayload = 0xA5;

  explicit Controller(Bus* bus) : bus_(bus) {}

  Controller(Controller&) = delete;

  // Taken on the next tick. Ignored while a transfer is in flight.
  void BeginTransfer();

  // Drops select and sclk on the next tick and goes idle without latching a
  // result. No effect when idle.
  void Abort();

  void Tick() override;

  bool active() const { return state_ == ACTIVE; }
  bool done() const { return done_; }
  uint8_t received_byte() const { return result_; }
  int bits_remaining() const { return count_; }

  // Counted since the last activation.
  int drive_events() const { return drives_; }
  int sample_events() const { return samples_; }

 private:
  enum State { IDLE, ACTIVE };

  void Activate();
  void DriveBit();
  void SampleBit();
  void Complete();

  Bus* bus_;

  State state_ = IDLE;
  bool start_requested_ = false;
  bool abort_requested_ = false;

  bool sclk_ = false;
  bool first_phase_ = false;
  ShiftRegister tx_;
  ShiftRegister rx_;
  int count_ = 0;

  bool done_ = false;
  uint8_t result_ = 0;

  int drives_ = 0;
  int samples_ = 0;
};
