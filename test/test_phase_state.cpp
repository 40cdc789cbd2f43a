#include <catch2/catch.hpp>

#include <string>

#include "control/PhaseState.h"

TEST_CASE("Fresh phase state has nothing lit", "[phase]") {
  PhaseState ps;
  ps.reset(4);

  REQUIRE(ps.num_lanes == 4);
  REQUIRE_FALSE(ps.has_last_green);
  REQUIRE(ps.nonRedCount() == 0);

  uint8_t lane = 99;
  REQUIRE_FALSE(ps.activeLane(lane));
  REQUIRE(lane == 99);
}

TEST_CASE("setPhase records the phase and its start", "[phase]") {
  PhaseState ps;
  ps.reset(4);

  ps.setPhase(2, LightPhase::GREEN, 1000);
  REQUIRE(ps.lane_phase[2] == LightPhase::GREEN);
  REQUIRE(ps.phase_since_ms[2] == 1000);

  uint8_t lane = 0;
  REQUIRE(ps.activeLane(lane));
  REQUIRE(lane == 2);
  REQUIRE(ps.nonRedCount() == 1);

  ps.setPhase(2, LightPhase::YELLOW, 2000);
  REQUIRE(ps.activeLane(lane));
  REQUIRE(lane == 2);

  ps.setPhase(2, LightPhase::RED, 4000);
  REQUIRE_FALSE(ps.activeLane(lane));
  REQUIRE(ps.nonRedCount() == 0);
}

TEST_CASE("Out-of-range lanes are ignored", "[phase]") {
  PhaseState ps;
  ps.reset(2);

  ps.setPhase(2, LightPhase::GREEN, 10);
  ps.setPhase(MAX_LANES, LightPhase::GREEN, 10);
  REQUIRE(ps.nonRedCount() == 0);
}

TEST_CASE("reset clamps to MAX_LANES and clears history", "[phase]") {
  PhaseState ps;
  ps.reset(3);
  ps.setPhase(0, LightPhase::GREEN, 5);
  ps.has_last_green = true;

  ps.reset(50);
  REQUIRE(ps.num_lanes == MAX_LANES);
  REQUIRE_FALSE(ps.has_last_green);
  REQUIRE(ps.lane_phase[0] == LightPhase::NONE);
}

TEST_CASE("Light phase names", "[phase]") {
  REQUIRE(std::string(lightPhaseName(LightPhase::NONE)) == "NONE");
  REQUIRE(std::string(lightPhaseName(LightPhase::YELLOW)) == "YELLOW");
}
