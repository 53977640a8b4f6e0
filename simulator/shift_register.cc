#include "shift_register.h"

#include <glog/logging.h>

#include <algorithm>

void ShiftRegister::Load(uint8_t value) {
  for (int i = 0; i < kWidth; i++) {
    bits_[i] = (value >> (kWidth - 1 - i)) & 1;
  }
  DCHECK_EQ(this->value(), value);
}

bool ShiftRegister::ShiftOut() {
  const bool out = bits_[0];
  std::rotate(bits_.begin(), bits_.begin() + 1, bits_.end());
  bits_[kWidth - 1] = false;
  return out;
}

void ShiftRegister::ShiftIn(bool b) {
  std::rotate(bits_.begin(), bits_.begin() + 1, bits_.end());
  bits_[kWidth - 1] = b;
}

bool ShiftRegister::bit(int index) const {
  CHECK_GE(index, 0);
  CHECK_LT(index, kWidth);
  return bits_[index];
}

uint8_t ShiftRegister::value() const {
  uint8_t v = 0;
  for (bool b : bits_) {
    v = (v << 1) | (b ? 1 : 0);
  }
  return v;
}
