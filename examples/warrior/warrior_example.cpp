/**
 * @file warrior_example.cpp
 * @brief Play the warrior tree through a few corridor levels.
 *
 * Demonstrates:
 * - Assembling a real tree from reusable subtrees
 * - TurnDriver carrying the previous turn's stats into the leaves
 * - RUNNING subtrees (heal until full, delayed shot) resuming across turns
 *
 * Usage: warrior_example [level]   (level 1..4, default: all)
 */

#include <cstdio>
#include <cstdlib>

#include "warrior/warrior_tree.hpp"

namespace {

constexpr int kMaxTurns = 60;

struct Level {
  const char* name;
  const char* layout;
};

constexpr Level kLevels[] = {
    {"stairs", "@      >"},
    {"sludge", "@  s   >"},
    {"captive behind", " C@  s  >"},
    {"archer", "@ C   a  s >"},
};

constexpr int kLevelCount =
    static_cast<int>(sizeof(kLevels) / sizeof(kLevels[0]));

void TraceNode(const char* name, turnbt::NodeType type, turnbt::Status status,
               const warrior::State&) {
  if (type == turnbt::NodeType::kLeaf) {
    std::printf("    %-18s %s\n", name, turnbt::StatusToString(status));
  }
}

bool PlayLevel(const Level& level, bool trace) {
  warrior::Builder b;
  turnbt::NodeId root = warrior::BuildWarriorTree(b);

  warrior::Driver driver(b, root, warrior::InitStats, warrior::SaveStats);
  turnbt::ValidateError err = driver.tree().ValidateTree();
  if (err != turnbt::ValidateError::kNone) {
    std::printf("Tree invalid: %s\n", turnbt::ValidateErrorToString(err));
    return false;
  }
  if (trace) {
    driver.tree().set_trace(TraceNode);
  }

  warrior::World world(level.layout);
  std::printf("=== Level \"%s\" ===\n", level.name);
  std::printf("  start    %s  hp %d\n", world.Render().c_str(),
              world.Health());

  for (int turn = 1; turn <= kMaxTurns; ++turn) {
    turnbt::Status result = driver.PlayTurn(world);
    world.EndTurn();
    std::printf("  turn %2d  %s  hp %2d  %s\n", turn, world.Render().c_str(),
                world.Health(), turnbt::StatusToString(result));
    if (world.won()) {
      std::printf("  Reached the stairs in %d turns, rescued %d\n\n", turn,
                  world.rescued());
      return true;
    }
    if (world.dead()) {
      std::printf("  Warrior died on turn %d\n\n", turn);
      return false;
    }
  }
  std::printf("  Gave up after %d turns\n\n", kMaxTurns);
  return false;
}

}  // namespace

int main(int argc, char* argv[]) {
  int first = 0;
  int last = kLevelCount - 1;
  bool trace = false;

  if (argc > 1) {
    int choice = std::atoi(argv[1]);
    if (choice < 1 || choice > kLevelCount) {
      std::printf("Usage: %s [level 1..%d]\n", argv[0], kLevelCount);
      return 1;
    }
    first = choice - 1;
    last = choice - 1;
    trace = true;
  }

  int won = 0;
  for (int i = first; i <= last; ++i) {
    if (PlayLevel(kLevels[i], trace)) {
      ++won;
    }
  }

  std::printf("Levels cleared: %d/%d\n", won, last - first + 1);
  return 0;
}
