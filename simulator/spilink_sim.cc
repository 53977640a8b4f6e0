#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <glog/logging.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "bus.h"
#include "bus_monitor.h"
#include "controller.h"
#include "responder.h"
#include "tick_source.h"

ABSL_FLAG(int, transfers, 1, "Number of back-to-back transfers to run");
ABSL_FLAG(int, max_ticks, 64, "Tick budget for each transfer");
ABSL_FLAG(int, abort_at, -1,
          "If 1..7, abandon a first transfer once the responder has this many "
          "bits left to send");
ABSL_FLAG(bool, dump_bus, false, "Print every committed bus snapshot");

namespace {

// Steps until the controller reports completion. False on timeout.
bool RunUntilDone(TickSource* ticks,
                  const Controller& controller,
                  BusMonitor* monitor,
                  int max_ticks) {
  for (int i = 0; i < max_ticks; i++) {
    ticks->Step(monitor);
    if (controller.done())
      return true;
  }
  return false;
}

}  // namespace

int main(int argc, char** argv) {
  FLAGS_logtostderr = true;
  google::InitGoogleLogging(argv[0]);
  absl::ParseCommandLine(argc, argv);

  Bus bus;
  Controller controller(&bus);
  Responder responder(&bus);
  TickSource ticks(&bus);
  ticks.Attach(&controller);
  ticks.Attach(&responder);

  BusMonitor monitor;
  BusMonitor* mon = absl::GetFlag(FLAGS_dump_bus) ? &monitor : nullptr;

  // One idle tick so the bus starts from a committed deselected state.
  ticks.Step(mon);

  const int abort_at = absl::GetFlag(FLAGS_abort_at);
  const int max_ticks = absl::GetFlag(FLAGS_max_ticks);
  if (abort_at > 0 && abort_at < 8) {
    controller.BeginTransfer();
    int i = 0;
    while (!(responder.active() && responder.bits_remaining() == abort_at)) {
      if (i++ >= max_ticks) {
        LOG(ERROR) << "Responder never reached " << abort_at
                   << " bits remaining";
        return EXIT_FAILURE;
      }
      ticks.Step(mon);
    }
    LOG(INFO) << "Abandoning transfer at tick " << ticks.step() << " with "
              << abort_at << " bits left";
    controller.Abort();
    ticks.Step(mon);
    ticks.Step(mon);
    LOG(INFO) << "Responder " << (responder.active() ? "still active" : "idle")
              << ", abandoned transfers: " << responder.abandoned();
  }

  int failures = 0;
  for (int n = 0; n < absl::GetFlag(FLAGS_transfers); n++) {
    const uint64_t start = ticks.step();
    controller.BeginTransfer();
    if (!RunUntilDone(&ticks, controller, mon, max_ticks)) {
      LOG(ERROR) << "Transfer " << n << " timed out after " << max_ticks
                 << " ticks";
      failures++;
      continue;
    }
    const int got = controller.received_byte();
    if (got != Responder::kReply) {
      LOG(ERROR) << "Transfer " << n << ": expected 0x" << std::hex
                 << static_cast<int>(Responder::kReply) << ", got 0x" << got;
      failures++;
      continue;
    }
    LOG(INFO) << "Transfer " << n << " received 0x" << std::hex << got
              << std::dec << " in " << (ticks.step() - start) << " ticks";
  }

  if (mon)
    monitor.Print(std::cout);

  LOG(INFO) << "Ran " << ticks.step() << " ticks, " << ticks.cycles()
            << " clock cycles";
  exit(failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE);
}
