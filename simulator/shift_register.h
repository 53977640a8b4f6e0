#pragma once

#include <array>
#include <cstdint>

// Eight-bit shift register, index 0 is the MSB. Bytes always go over the
// wire MSB-first.
class ShiftRegister {
 public:
  static constexpr int kWidth = 8;

  ShiftRegister() { bits_.fill(false); }
  explicit ShiftRegister(uint8_t value) { Load(value); }

  void Load(uint8_t value);
  void Clear() { bits_.fill(false); }

  // Removes and returns the MSB. A zero is shifted in at the LSB.
  bool ShiftOut();

  // Shifts everything one place toward the MSB, dropping the oldest bit, and
  // puts `b` in the LSB.
  void ShiftIn(bool b);

  bool msb() const { return bits_[0]; }
  bool bit(int index) const;
  uint8_t value() const;

 private:
  std::array<bool, kWidth> bits_;
};
