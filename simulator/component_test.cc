#include <glog/logging.h>
#include <gtest/gtest.h>

#include <vector>

#include "bus.h"
#include "controller.h"
#include "responder.h"
#include "shift_register.h"

// Unit tests which run against the individual pieces rather than the whole
// link.

TEST(ShiftRegisterTest, LoadIsMsbFirst) {
  ShiftRegister r(0xA5);
  EXPECT_EQ(r.value(), 0xA5);
  EXPECT_TRUE(r.msb());
  EXPECT_TRUE(r.bit(0));
  EXPECT_FALSE(r.bit(1));
  EXPECT_TRUE(r.bit(7));
}

TEST(ShiftRegisterTest, ShiftOutDrainsAndFillsWithZero) {
  ShiftRegister r(0x3C);
  const bool expected[] = {false, false, true, true, true, true, false, false};
  for (int i = 0; i < 8; i++) {
    EXPECT_EQ(r.ShiftOut(), expected[i]) << "bit " << i;
  }
  EXPECT_EQ(r.value(), 0);
  EXPECT_FALSE(r.ShiftOut());
}

TEST(ShiftRegisterTest, ShiftInDropsOldestBit) {
  ShiftRegister r;
  for (bool b : {1, 1, 1, 1, 0, 0, 1, 1, 1, 1, 0, 0}) {
    r.ShiftIn(b);
  }
  EXPECT_EQ(r.value(), 0x3C);
}

TEST(ShiftRegisterTest, ClearZeroes) {
  ShiftRegister r(0xFF);
  r.Clear();
  EXPECT_EQ(r.value(), 0);
}

TEST(ShiftRegisterDeathTest, BitOutOfRange) {
  ShiftRegister r(0x01);
  EXPECT_DEATH(r.bit(8), "Check failed");
  EXPECT_DEATH(r.bit(-1), "Check failed");
}

TEST(BusTest, IdleValues) {
  Bus bus;
  EXPECT_TRUE(bus.snapshot().select_n);
  EXPECT_FALSE(bus.snapshot().selected());
  EXPECT_FALSE(bus.snapshot().sclk);
  EXPECT_FALSE(bus.snapshot().ctrl_out);
}

TEST(BusTest, WritesInvisibleUntilCommit) {
  Bus bus;
  bus.Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_SCLK, true);
  bus.Drive(Driver::DRIVER_RESPONDER, Wire::WIRE_RESP_OUT, true);
  EXPECT_FALSE(bus.snapshot().sclk);
  EXPECT_FALSE(bus.snapshot().resp_out);

  bus.Commit();
  EXPECT_TRUE(bus.snapshot().sclk);
  EXPECT_TRUE(bus.snapshot().resp_out);
  EXPECT_TRUE(bus.snapshot().Get(Wire::WIRE_SCLK));
}

TEST(BusTest, UndrivenWiresHold) {
  Bus bus;
  bus.Drive(Driver::DRIVER_RESPONDER, Wire::WIRE_RESP_OUT, true);
  bus.Commit();
  bus.Commit();
  bus.Commit();
  EXPECT_TRUE(bus.snapshot().resp_out);
}

TEST(BusTest, Owners) {
  EXPECT_EQ(OwnerOf(Wire::WIRE_SELECT_N), Driver::DRIVER_CONTROLLER);
  EXPECT_EQ(OwnerOf(Wire::WIRE_SCLK), Driver::DRIVER_CONTROLLER);
  EXPECT_EQ(OwnerOf(Wire::WIRE_CTRL_OUT), Driver::DRIVER_CONTROLLER);
  EXPECT_EQ(OwnerOf(Wire::WIRE_RESP_OUT), Driver::DRIVER_RESPONDER);
}

TEST(BusDeathTest, DriveByNonOwner) {
  Bus bus;
  EXPECT_DEATH(bus.Drive(Driver::DRIVER_RESPONDER, Wire::WIRE_SCLK, true),
               "does not own");
  EXPECT_DEATH(
      bus.Drive(Driver::DRIVER_CONTROLLER, Wire::WIRE_RESP_OUT, true),
      "does not own");
}

// Controller with nothing on the other end: resp_out stays low.
class ControllerTest : public ::testing::Test {
 public:
  ControllerTest() : controller_(&bus_) {}

  void Step() {
    controller_.Tick();
    bus_.Commit();
  }

 protected:
  Bus bus_;
  Controller controller_;
};

TEST_F(ControllerTest, StartTakenOnNextTick) {
  controller_.BeginTransfer();
  EXPECT_FALSE(controller_.active());
  EXPECT_TRUE(bus_.snapshot().select_n);

  Step();
  EXPECT_TRUE(controller_.active());
  EXPECT_FALSE(bus_.snapshot().select_n);
  EXPECT_FALSE(bus_.snapshot().sclk);
  EXPECT_EQ(controller_.bits_remaining(), 8);
}

TEST_F(ControllerTest, ClockTogglesOncePerTick) {
  controller_.BeginTransfer();
  Step();
  Step();  // first falling phase, bit 7 out, clock still low
  EXPECT_FALSE(bus_.snapshot().sclk);
  EXPECT_TRUE(bus_.snapshot().ctrl_out);
  EXPECT_EQ(controller_.drive_events(), 1);

  bool level = false;
  for (int i = 0; i < 15; i++) {
    Step();
    level = !level;
    EXPECT_EQ(bus_.snapshot().sclk, level) << "phase " << i;
    EXPECT_FALSE(bus_.snapshot().select_n);
  }
  Step();
  EXPECT_TRUE(controller_.done());
  EXPECT_FALSE(bus_.snapshot().sclk);
  EXPECT_TRUE(bus_.snapshot().select_n);
  EXPECT_EQ(controller_.received_byte(), 0x00);
}

TEST_F(ControllerTest, SamplesFloatingLineAsIs) {
  bus_.Drive(Driver::DRIVER_RESPONDER, Wire::WIRE_RESP_OUT, true);
  bus_.Commit();

  controller_.BeginTransfer();
  for (int i = 0; i < 18; i++)
    Step();
  EXPECT_TRUE(controller_.done());
  EXPECT_EQ(controller_.received_byte(), 0xFF);
}

TEST_F(ControllerTest, StartWhileActiveDropped) {
  controller_.BeginTransfer();
  for (int i = 0; i < 6; i++)
    Step();
  const int remaining = controller_.bits_remaining();
  const int drives = controller_.drive_events();
  controller_.BeginTransfer();
  EXPECT_EQ(controller_.bits_remaining(), remaining);
  EXPECT_EQ(controller_.drive_events(), drives);

  for (int i = 0; i < 12; i++)
    Step();
  EXPECT_TRUE(controller_.done());
  Step();
  EXPECT_FALSE(controller_.active());
}

TEST_F(ControllerTest, AbortWhenIdleIsNoop) {
  controller_.Abort();
  Step();
  EXPECT_FALSE(controller_.active());
  EXPECT_TRUE(bus_.snapshot().select_n);
}

TEST_F(ControllerTest, AbortCancelsPendingStart) {
  controller_.BeginTransfer();
  controller_.Abort();
  Step();
  EXPECT_FALSE(controller_.active());
}

// Responder driven by hand from the controller's side of the bus.
class ResponderTest : public ::testing::Test {
 public:
  ResponderTest() : responder_(&bus_) {}

  void Set(Wire w, bool v) {
    bus_.Drive(Driver::DRIVER_CONTROLLER, w, v);
    bus_.Commit();
    responder_.Tick();
    bus_.Commit();
  }

  void Select(bool on) { Set(Wire::WIRE_SELECT_N, !on); }
  void Clock(bool level) { Set(Wire::WIRE_SCLK, level); }

 protected:
  Bus bus_;
  Responder responder_;
};

TEST_F(ResponderTest, IdleUntilSelected) {
  Clock(true);
  Clock(false);
  EXPECT_FALSE(responder_.active());
  EXPECT_EQ(responder_.drive_events(), 0);
}

TEST_F(ResponderTest, SelectPutsMsbOnWire) {
  Select(true);
  EXPECT_TRUE(responder_.active());
  EXPECT_EQ(responder_.drive_events(), 1);
  EXPECT_EQ(responder_.bits_remaining(), 7);
  EXPECT_FALSE(bus_.snapshot().resp_out);
}

TEST_F(ResponderTest, ShiftsOnFallingEdgesOnly) {
  Select(true);
  std::vector<bool> out{bus_.snapshot().resp_out};
  for (int i = 0; i < 7; i++) {
    Clock(true);
    EXPECT_EQ(responder_.drive_events(), i + 1);
    Clock(false);
    out.push_back(bus_.snapshot().resp_out);
  }
  EXPECT_EQ(out, std::vector<bool>({false, false, true, true, true, true,
                                    false, false}));
  EXPECT_EQ(responder_.bits_remaining(), 0);
  EXPECT_EQ(responder_.sample_events(), 7);

  // Nothing left to send.
  Clock(true);
  Clock(false);
  EXPECT_EQ(responder_.drive_events(), 8);

  Select(false);
  EXPECT_FALSE(responder_.active());
  EXPECT_EQ(responder_.abandoned(), 0);
}

TEST_F(ResponderTest, DeselectMidTransferIsSilent) {
  Select(true);
  Clock(true);
  Clock(false);
  Clock(true);
  Clock(false);
  EXPECT_EQ(responder_.bits_remaining(), 5);
  EXPECT_TRUE(bus_.snapshot().resp_out);

  Select(false);
  EXPECT_FALSE(responder_.active());
  EXPECT_EQ(responder_.abandoned(), 1);
  EXPECT_TRUE(bus_.snapshot().resp_out);

  // Clock activity while deselected is ignored.
  Clock(true);
  Clock(false);
  EXPECT_EQ(responder_.bits_remaining(), 5);

  Select(true);
  EXPECT_EQ(responder_.bits_remaining(), 7);
  EXPECT_EQ(responder_.drive_events(), 1);
  EXPECT_FALSE(bus_.snapshot().resp_out);
}
