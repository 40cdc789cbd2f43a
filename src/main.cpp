/*
  Lane Signal Controller (host side)

  Purpose:
  Turns per-lane vehicle counts into signal phases and drives the signal
  board over serial.

  Per loop pass (see control/ControlLoop.h):
  - Transition tick: finish a yellow clearance whose hold has elapsed
  - Control tick (CONTROL_UPDATE_HZ): reconnect if needed, take a count
    frame if one is ready, schedule, advance
  - Status tick (STATUS_UPDATE_HZ): one JSON status line on stdout

  Counts arrive on stdin, one frame per line ("5 0 3 1"). The process ends
  on SIGINT/SIGTERM or when stdin closes.

  Usage:
    lane_signal_controller [config.json]
*/

#include <signal.h>
#include <unistd.h>

#include <iostream>

#include "Params.h"

#include "comms/SerialLink.h"
#include "comms/SerialPort.h"
#include "config/Config.h"
#include "control/ControlLoop.h"
#include "control/LaneScheduler.h"
#include "control/TransitionController.h"
#include "utils/Clock.h"
#include "utils/Log.h"
#include "vision/StreamCountSource.h"

#define LOG_TAG "main"


/*=============================================================================
  EXIT SIGNAL
=============================================================================*/

static volatile sig_atomic_t g_exit_requested = 0;

static void onExitSignal(int) {
  g_exit_requested = 1;
}

static void installSignalHandlers() {
  struct sigaction sa;
  sa.sa_handler = onExitSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}


/*=============================================================================
  MAIN
=============================================================================*/

int main(int argc, char** argv) {
  RuntimeConfig cfg;

  if (argc > 2) {
    LOG_ERROR("usage: %s [config.json]", argv[0]);
    return 2;
  }
  if (argc == 2 && !config::loadFile(argv[1], cfg)) {
    return 1;
  }
  if (!config::validate(cfg)) {
    return 1;
  }
  logging::setLevel(cfg.log_level);

  SerialPort port;
  SerialLink link(port, config::linkParams(cfg));
  LaneScheduler scheduler(config::durationParams(cfg));
  TransitionController controller(link, config::transitionParams(cfg));
  StreamCountSource source(STDIN_FILENO, cfg.num_lanes);
  ControlLoop loop(link, scheduler, controller, source, std::cout, config::loopParams(cfg));

  installSignalHandlers();

  LOG_INFO("%u lanes, clearance %lu ms, green %u..%u s%s",
           (unsigned)cfg.num_lanes,
           (unsigned long)cfg.yellow_clearance_ms,
           (unsigned)cfg.green_min_s,
           (unsigned)cfg.green_max_s,
           cfg.honor_green_duration ? ", honoring green duration" : "");

  if (link.begin(millis()) == LinkResult::RECONNECT_FAILED) {
    LOG_WARN("signal board not reachable yet; commands are logged until it is");
  }

  while (!g_exit_requested && loop.step(millis())) {
    delay(LOOP_IDLE_MS);
  }

  loop.shutdown();
  return 0;
}
