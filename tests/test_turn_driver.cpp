#include <catch2/catch.hpp>
#include <turnbt/turn_driver.hpp>

struct Robot {
  int energy = 10;
  int moves = 0;
};

struct RobotStats {
  int energy = 0;
};

using RobotState = turnbt::TurnState<Robot, RobotStats>;
using RobotDriver = turnbt::TurnDriver<Robot, RobotStats>;

static RobotStats initial_stats(Robot&) {
  RobotStats stats;
  stats.energy = 100;
  return stats;
}

static RobotStats save_stats(Robot& robot) {
  RobotStats stats;
  stats.energy = robot.energy;
  return stats;
}

TEST_CASE("TurnDriver uses the initial snapshot on the first turn",
          "[driver]") {
  int seen = -1;
  RobotDriver::Builder b;
  turnbt::NodeId root = b.AddLeaf("Observe", [&seen](RobotState& s) {
    seen = s.old_stats.energy;
    return turnbt::Status::kSuccess;
  });
  RobotDriver driver(b, root, initial_stats, save_stats);
  REQUIRE_FALSE(driver.has_stats());

  Robot robot;
  REQUIRE(driver.PlayTurn(robot) == turnbt::Status::kSuccess);
  REQUIRE(seen == 100);
  REQUIRE(driver.has_stats());
}

TEST_CASE("TurnDriver carries the previous turn's snapshot", "[driver]") {
  int seen = -1;
  RobotDriver::Builder b;
  turnbt::NodeId root = b.AddLeaf("Spend", [&seen](RobotState& s) {
    seen = s.old_stats.energy;
    s.world->energy -= 3;
    return turnbt::Status::kSuccess;
  });
  RobotDriver driver(b, root, initial_stats, save_stats);

  Robot robot;
  driver.PlayTurn(robot);
  REQUIRE(driver.stats().energy == 7);

  robot.energy = 20;  // changed between turns by the world
  driver.PlayTurn(robot);
  REQUIRE(seen == 7);
  REQUIRE(driver.stats().energy == 17);
}

TEST_CASE("TurnDriver returns the root status each turn", "[driver]") {
  RobotDriver::Builder b;
  turnbt::NodeId root =
      b.AddSequence("Travel", true)
          .AddChild(b.AddLeaf("Move", [](RobotState& s) {
            ++s.world->moves;
            return (s.world->moves < 3) ? turnbt::Status::kRunning
                                        : turnbt::Status::kSuccess;
          }))
          .AddChild(b.AddLeaf("Arrive", [](RobotState&) {
            return turnbt::Status::kSuccess;
          }));
  RobotDriver driver(b, root, initial_stats, save_stats);
  REQUIRE(driver.tree().ValidateTree() == turnbt::ValidateError::kNone);

  Robot robot;
  REQUIRE(driver.PlayTurn(robot) == turnbt::Status::kRunning);
  REQUIRE(driver.PlayTurn(robot) == turnbt::Status::kRunning);
  REQUIRE(driver.PlayTurn(robot) == turnbt::Status::kSuccess);
  REQUIRE(driver.tree().tick_count() == 3);
}

TEST_CASE("Damage check against the previous snapshot", "[driver]") {
  RobotDriver::Builder b;
  turnbt::NodeId root = b.AddLeaf("TookDamage", [](RobotState& s) {
    return (s.world->energy < s.old_stats.energy) ? turnbt::Status::kSuccess
                                                  : turnbt::Status::kFailure;
  });
  RobotDriver driver(b, root, save_stats, save_stats);

  Robot robot;
  REQUIRE(driver.PlayTurn(robot) == turnbt::Status::kFailure);
  robot.energy -= 4;
  REQUIRE(driver.PlayTurn(robot) == turnbt::Status::kSuccess);
  REQUIRE(driver.PlayTurn(robot) == turnbt::Status::kFailure);
}
