#include <catch2/catch.hpp>
#include "warrior/warrior_tree.hpp"

namespace {

struct Game {
  explicit Game(const char* layout)
      : world(layout), root(warrior::BuildWarriorTree(builder)),
        driver(builder, root, warrior::InitStats, warrior::SaveStats) {}

  turnbt::Status Turn() {
    turnbt::Status result = driver.PlayTurn(world);
    world.EndTurn();
    return result;
  }

  warrior::World world;
  warrior::Builder builder;
  turnbt::NodeId root;
  warrior::Driver driver;
};

}  // namespace

TEST_CASE("Warrior tree is valid", "[warrior]") {
  Game game("@ >");
  REQUIRE(game.driver.tree().ValidateTree() == turnbt::ValidateError::kNone);
  REQUIRE(game.driver.tree().node(game.root).keep_state());
  REQUIRE(game.driver.tree().node(game.root).children_count() == 8);
}

TEST_CASE("Warrior walks to the stairs", "[warrior]") {
  Game game("@ >");
  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.position() == 1);
  REQUIRE_FALSE(game.world.won());

  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.won());
}

TEST_CASE("Warrior fights an adjacent sludge", "[warrior]") {
  Game game("@s >");
  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.unit_health_at(1) == 7);
  REQUIRE(game.world.position() == 0);
  REQUIRE(game.world.Health() == 17);
}

TEST_CASE("Warrior rescues a captive ahead", "[warrior]") {
  Game game("@C>");
  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.rescued() == 1);
  REQUIRE(game.world.unit_at(1) == warrior::Unit::kNone);
}

TEST_CASE("Warrior turns for a captive behind", "[warrior]") {
  Game game(" C@ >");
  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE_FALSE(game.world.facing_forward());
  REQUIRE(game.world.rescued() == 0);

  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.rescued() == 1);
}

TEST_CASE("Warrior retreats when hurt, then rests until healed",
          "[warrior]") {
  Game game("@ >");
  game.world.set_health(6);

  // Below the first-turn snapshot and low: step back (into the wall).
  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.position() == 0);
  REQUIRE(game.world.Health() == 6);

  // Rests over several turns; the root resumes inside heal_if_low.
  for (int health = 8; health <= 20; health += 2) {
    REQUIRE(game.Turn() == turnbt::Status::kRunning);
    REQUIRE(game.world.Health() == health);
  }
  REQUIRE(game.driver.tree().node(game.root).current_child_index() == 6);

  // Full health seen: the until decorator releases.
  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.Health() == 20);
  REQUIRE(game.world.position() == 0);
  REQUIRE(game.driver.tree().node(game.root).current_child_index() == 0);
}

TEST_CASE("Warrior shoots a distant archer with a delayed result",
          "[warrior]") {
  Game game("@  a>");
  REQUIRE(game.Turn() == turnbt::Status::kRunning);
  REQUIRE(game.world.unit_health_at(3) == 4);
  REQUIRE(game.world.Health() == 17);
  REQUIRE(game.driver.tree().node(game.root).current_child_index() == 2);

  // Resumes at the delayed shot: shoots again, then the walk is refused.
  REQUIRE(game.Turn() == turnbt::Status::kSuccess);
  REQUIRE(game.world.unit_health_at(3) == 1);
  REQUIRE(game.world.position() == 0);
  REQUIRE(game.world.rejected_actions() == 1);
}

TEST_CASE("Warrior clears a corridor", "[warrior]") {
  Game game("@  s   >");
  int turns = 0;
  while (!game.world.won() && !game.world.dead() && turns < 30) {
    game.Turn();
    ++turns;
  }
  REQUIRE(game.world.won());
  REQUIRE(game.world.unit_at(3) == warrior::Unit::kNone);
}
