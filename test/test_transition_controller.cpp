#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "FakeTransport.h"
#include "LogCapture.h"
#include "TestCounts.h"
#include "comms/SerialLink.h"
#include "control/LaneScheduler.h"
#include "control/TransitionController.h"

namespace {

SerialLink::Params instantLink() {
  SerialLink::Params p;
  p.device = "/dev/ttyFAKE0";
  p.settle_ms = 0;
  return p;
}

TransitionController::Params fourLanes(uint32_t clearance_ms = 2000) {
  TransitionController::Params p;
  p.num_lanes = 4;
  p.clearance_ms = clearance_ms;
  return p;
}

typedef std::vector<std::string> Lines;

}  // namespace

TEST_CASE("Scenario A: first advance only sends the green", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes());

  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));
  REQUIRE(cycleOf(s) == std::vector<int>{0, 2, 3});

  REQUIRE(controller.advance(s, 0) == AdvanceResult::GREEN_ISSUED);
  REQUIRE(fake.lines == Lines{"P1T8\n"});

  const PhaseState& ps = controller.phase();
  REQUIRE(ps.has_last_green);
  REQUIRE(ps.last_green_lane == 0);
  REQUIRE(ps.lane_phase[0] == LightPhase::GREEN);
  REQUIRE(ps.green_duration_s == 8);
  REQUIRE_FALSE(controller.clearancePending());
}

TEST_CASE("Scenario B: second advance clears lane 1 and greens lane 3", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(2000));
  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));

  REQUIRE(controller.advance(s, 0) == AdvanceResult::GREEN_ISSUED);
  REQUIRE(controller.nextIndex(s) == 1);

  REQUIRE(controller.advance(s, 100) == AdvanceResult::CLEARANCE_STARTED);
  REQUIRE(fake.lines == Lines{"P1T8\n", "YELLOW1\n"});
  REQUIRE(controller.clearancePending());
  REQUIRE(controller.phase().lane_phase[0] == LightPhase::YELLOW);

  // Hold not over yet
  REQUIRE_FALSE(controller.tick(2099));
  REQUIRE(fake.lines.size() == 2);

  REQUIRE(controller.tick(2100));
  REQUIRE(fake.lines == Lines{"P1T8\n", "YELLOW1\n", "RED1\n", "P3T6\n"});

  const PhaseState& ps = controller.phase();
  REQUIRE(ps.last_green_lane == 2);
  REQUIRE(ps.lane_phase[0] == LightPhase::RED);
  REQUIRE(ps.lane_phase[2] == LightPhase::GREEN);
  REQUIRE(ps.green_duration_s == 6);
  REQUIRE_FALSE(controller.clearancePending());
}

TEST_CASE("Scenario C: empty cycle emits nothing and keeps state", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(0));

  REQUIRE(controller.advance(scheduler.schedule(makeCounts({0, 3, 0, 0})), 0) == AdvanceResult::GREEN_ISSUED);
  fake.lines.clear();

  const PhaseState before = controller.phase();
  REQUIRE(controller.advance(scheduler.schedule(makeCounts({0, 0, 0, 0})), 500) == AdvanceResult::EMPTY_CYCLE);

  REQUIRE(fake.lines.empty());
  const PhaseState& after = controller.phase();
  REQUIRE(after.has_last_green == before.has_last_green);
  REQUIRE(after.last_green_lane == before.last_green_lane);
  REQUIRE(after.green_since_ms == before.green_since_ms);
  REQUIRE(after.lane_phase[1] == LightPhase::GREEN);
}

TEST_CASE("Empty cycle before any green leaves the controller untouched", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  TransitionController controller(link, fourLanes());
  Schedule empty;

  REQUIRE(controller.advance(empty, 0) == AdvanceResult::EMPTY_CYCLE);
  REQUIRE(fake.lines.empty());
  REQUIRE_FALSE(controller.phase().has_last_green);
  REQUIRE(controller.transitions() == 0);
}

TEST_CASE("Scenario D: link down still advances and logs the dropped command", "[transition]") {
  LogCapture log;

  FakeTransport fake;
  fake.open_ok = false;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::RECONNECT_FAILED);
  REQUIRE_FALSE(link.isConnected());

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes());
  const Schedule s = scheduler.schedule(makeCounts({1, 0, 0, 0}));
  REQUIRE(cycleOf(s) == std::vector<int>{0});

  REQUIRE(controller.advance(s, 0) == AdvanceResult::GREEN_ISSUED);

  REQUIRE(fake.lines.empty());
  REQUIRE(log.contains("would send P1T8"));
  REQUIRE(controller.commandsDropped() == 1);
  REQUIRE(link.txDropped() == 1);
  REQUIRE(controller.phase().has_last_green);
  REQUIRE(controller.phase().last_green_lane == 0);
}

TEST_CASE("Round robin picks the lane after the last green, not the busiest", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(0));

  // Make lane 2 the last green
  REQUIRE(controller.advance(scheduler.schedule(makeCounts({0, 0, 9, 0})), 0) == AdvanceResult::GREEN_ISSUED);
  REQUIRE(controller.phase().last_green_lane == 2);

  // Cycle [2, 0, 1] by priority
  const Schedule s = scheduler.schedule(makeCounts({5, 3, 9, 0}));
  REQUIRE(cycleOf(s) == std::vector<int>{2, 0, 1});
  REQUIRE(controller.nextIndex(s) == 1);

  REQUIRE(controller.advance(s, 10) == AdvanceResult::CLEARANCE_STARTED);
  REQUIRE(controller.phase().last_green_lane == 0);
  REQUIRE(fake.lines == Lines{"P3T8\n", "YELLOW3\n", "RED3\n", "P1T6\n"});
}

TEST_CASE("Round robin wraps to the head of the cycle", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(0));
  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));   // [0, 2, 3]

  std::vector<int> greens;
  for (uint32_t t = 0; t < 5; ++t) {
    controller.advance(s, t * 100);
    greens.push_back(controller.phase().last_green_lane);
  }

  REQUIRE(greens == std::vector<int>{0, 2, 3, 0, 2});
}

TEST_CASE("Last green lane missing from the cycle restarts at index 0", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(0));

  REQUIRE(controller.advance(scheduler.schedule(makeCounts({0, 4, 0, 0})), 0) == AdvanceResult::GREEN_ISSUED);

  const Schedule s = scheduler.schedule(makeCounts({2, 0, 7, 0}));   // [2, 0], lane 1 gone
  REQUIRE(controller.nextIndex(s) == 0);

  fake.lines.clear();
  controller.advance(s, 100);
  REQUIRE(fake.lines == Lines{"YELLOW2\n", "RED2\n", "P3T8\n"});
}

TEST_CASE("Single-lane cycle clears and re-greens the same lane", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(0));
  const Schedule s = scheduler.schedule(makeCounts({0, 0, 0, 2}));

  controller.advance(s, 0);
  controller.advance(s, 100);

  REQUIRE(fake.lines == Lines{"P4T8\n", "YELLOW4\n", "RED4\n", "P4T8\n"});
}

TEST_CASE("Advance during the yellow hold is refused", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(2000));
  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));

  controller.advance(s, 0);
  REQUIRE(controller.advance(s, 1000) == AdvanceResult::CLEARANCE_STARTED);

  const size_t sent = fake.lines.size();
  REQUIRE(controller.advance(s, 1500) == AdvanceResult::CLEARANCE_PENDING);
  REQUIRE(controller.advance(scheduler.schedule(makeCounts({0, 9, 0, 0})), 2000) == AdvanceResult::CLEARANCE_PENDING);
  REQUIRE(fake.lines.size() == sent);
  REQUIRE(controller.phase().last_green_lane == 0);

  REQUIRE(controller.tick(3000));
  REQUIRE(controller.phase().last_green_lane == 2);
}

TEST_CASE("Cancel abandons the pending red and green", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(2000));
  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));

  controller.advance(s, 0);
  controller.advance(s, 100);
  REQUIRE(controller.clearancePending());

  controller.cancel();
  REQUIRE_FALSE(controller.clearancePending());
  REQUIRE_FALSE(controller.tick(10000));

  REQUIRE(fake.lines == Lines{"P1T8\n", "YELLOW1\n"});
  REQUIRE(controller.phase().last_green_lane == 0);
  REQUIRE(controller.transitions() == 1);
}

TEST_CASE("Sequence is always yellow, red, green and never two lanes lit", "[transition][property]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(2000));

  const LaneCounts frames[] = {
    makeCounts({5, 0, 3, 1}), makeCounts({0, 2, 0, 0}), makeCounts({1, 1, 1, 1}),
    makeCounts({0, 0, 0, 0}), makeCounts({9, 8, 0, 7}), makeCounts({0, 0, 4, 0}),
  };

  uint32_t now = 0;
  for (int round = 0; round < 4; ++round) {
    for (size_t f = 0; f < sizeof(frames) / sizeof(frames[0]); ++f) {
      const Schedule s = scheduler.schedule(frames[f]);
      const bool had_green = controller.phase().has_last_green;
      const uint8_t last = controller.phase().last_green_lane;
      const size_t before = fake.lines.size();

      const AdvanceResult r = controller.advance(s, now);
      REQUIRE(controller.phase().nonRedCount() <= 1);

      if (r == AdvanceResult::CLEARANCE_STARTED) {
        REQUIRE(had_green);
        REQUIRE(fake.lines.size() == before + 1);
        REQUIRE(fake.lines.back() == "YELLOW" + std::to_string(last + 1) + "\n");

        now += 2000;
        REQUIRE(controller.tick(now));
        REQUIRE(fake.lines.size() == before + 3);
        REQUIRE(fake.lines[before + 1] == "RED" + std::to_string(last + 1) + "\n");
        REQUIRE(fake.lines[before + 2][0] == 'P');
      }

      if (r == AdvanceResult::CLEARANCE_STARTED || r == AdvanceResult::GREEN_ISSUED) {
        const PhaseState& ps = controller.phase();
        REQUIRE(s.contains(ps.last_green_lane));
        REQUIRE(ps.green_duration_s >= GREEN_FLOOR_S);
        REQUIRE(ps.lane_phase[ps.last_green_lane] == LightPhase::GREEN);
      }

      REQUIRE(controller.phase().nonRedCount() <= 1);
      now += 50;
    }
  }
}

TEST_CASE("Granted green respects the controller bounds", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  TransitionController::Params p = fourLanes(0);
  p.max_green_s = 5;
  TransitionController controller(link, p);

  Schedule s;
  s.size = 2;
  s.lanes[0] = 1;
  s.lanes[1] = 3;
  s.duration_s[1] = 8;
  s.duration_s[3] = 1;   // below the floor

  controller.advance(s, 0);
  controller.advance(s, 100);

  REQUIRE(fake.lines == Lines{"P2T5\n", "YELLOW2\n", "RED2\n", "P4T4\n"});
}

TEST_CASE("Write failure mid-transition still moves the bookkeeping", "[transition]") {
  LogCapture log;

  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(2000));
  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));

  controller.advance(s, 0);
  controller.advance(s, 100);

  fake.write_ok = false;   // cable pulled during the hold
  REQUIRE(controller.tick(2100));

  REQUIRE(fake.lines == Lines{"P1T8\n", "YELLOW1\n"});
  REQUIRE_FALSE(link.isConnected());
  REQUIRE(log.contains("would send RED1"));
  REQUIRE(log.contains("would send P3T6"));
  REQUIRE(controller.commandsDropped() == 2);
  REQUIRE(controller.phase().last_green_lane == 2);
  REQUIRE(controller.phase().lane_phase[0] == LightPhase::RED);
}

TEST_CASE("Reconnect while connected does not disturb the phase state", "[transition][link]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(0));
  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));

  controller.advance(s, 0);
  REQUIRE(link.tryReconnect(50) == LinkResult::OK);
  REQUIRE(link.tryReconnect(60) == LinkResult::OK);

  REQUIRE(fake.opens == 1);
  REQUIRE(controller.phase().last_green_lane == 0);

  controller.advance(s, 100);
  REQUIRE(controller.phase().last_green_lane == 2);
}

TEST_CASE("Dwell gate opens after the granted green duration", "[transition]") {
  FakeTransport fake;
  SerialLink link(fake, instantLink());
  REQUIRE(link.begin(0) == LinkResult::OK);

  LaneScheduler scheduler;
  TransitionController controller(link, fourLanes(2000));
  const Schedule s = scheduler.schedule(makeCounts({5, 0, 3, 1}));

  REQUIRE(controller.dwellElapsed(0));   // nothing green yet

  controller.advance(s, 1000);           // lane 0 green for 8 s
  REQUIRE_FALSE(controller.dwellElapsed(8999));
  REQUIRE(controller.dwellElapsed(9000));

  controller.advance(s, 9000);           // yellow hold
  REQUIRE_FALSE(controller.dwellElapsed(10000));

  controller.tick(11000);                // lane 2 green for 6 s
  REQUIRE_FALSE(controller.dwellElapsed(16999));
  REQUIRE(controller.dwellElapsed(17000));
}

TEST_CASE("Advance result names", "[transition]") {
  REQUIRE(std::string(advanceResultName(AdvanceResult::EMPTY_CYCLE)) == "EMPTY_CYCLE");
  REQUIRE(std::string(advanceResultName(AdvanceResult::CLEARANCE_STARTED)) == "CLEARANCE_STARTED");
}
