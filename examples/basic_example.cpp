/**
 * @file basic_example.cpp
 * @brief Minimal turn-based tree: Leaf, Sequence, Selector, keep_state.
 *
 * Demonstrates:
 * - Creating leaves with captureless lambda tick functions
 * - Assembling composites with TreeBuilder
 * - A RUNNING child resuming on the next turn (keep_state on)
 * - The same tree re-walking from the first child (keep_state off)
 */

#include <turnbt/behavior_tree.hpp>
#include <cstdio>

struct AppContext {
  int turn = 0;
  int checks = 0;
  int charge = 0;
  bool door_open = false;
};

static turnbt::NodeId BuildTree(turnbt::TreeBuilder<AppContext>& b,
                                bool keep_state) {
  turnbt::NodeId check = b.AddLeaf("CheckDoor", [](AppContext& c) {
    ++c.checks;
    std::printf("    [Leaf] CheckDoor (#%d): %s\n", c.checks,
                c.door_open ? "open" : "closed");
    return c.door_open ? turnbt::Status::kSuccess : turnbt::Status::kFailure;
  });

  // Needs three turns of charging before it succeeds.
  turnbt::NodeId charge = b.AddLeaf("ChargeDrill", [](AppContext& c) {
    ++c.charge;
    std::printf("    [Leaf] ChargeDrill %d/3\n", c.charge);
    return (c.charge >= 3) ? turnbt::Status::kSuccess
                           : turnbt::Status::kRunning;
  });

  turnbt::NodeId drill = b.AddLeaf("DrillDoor", [](AppContext& c) {
    c.door_open = true;
    c.charge = 0;
    std::printf("    [Leaf] DrillDoor\n");
    return turnbt::Status::kSuccess;
  });

  turnbt::NodeId walk = b.AddLeaf("WalkThrough", [](AppContext&) {
    std::printf("    [Leaf] WalkThrough\n");
    return turnbt::Status::kSuccess;
  });

  // Selector: walk through an open door, else break it open
  turnbt::NodeId go =
      b.AddSequence("GoThrough").AddChild(check).AddChild(walk);
  turnbt::NodeId force =
      b.AddSequence("ForceDoor", keep_state).AddChild(charge).AddChild(drill);
  return b.AddSelector("Root", keep_state).AddChild(go).AddChild(force);
}

static void Play(bool keep_state) {
  std::printf("=== keep_state %s ===\n", keep_state ? "on" : "off");

  turnbt::TreeBuilder<AppContext> b;
  turnbt::NodeId root = BuildTree(b, keep_state);
  turnbt::BehaviorTree<AppContext> tree(b, root);

  turnbt::ValidateError err = tree.ValidateTree();
  if (err != turnbt::ValidateError::kNone) {
    std::printf("Tree invalid: %s\n", turnbt::ValidateErrorToString(err));
    return;
  }

  AppContext ctx;
  turnbt::Status result = turnbt::Status::kRunning;
  while (result == turnbt::Status::kRunning && ctx.turn < 10) {
    ++ctx.turn;
    std::printf("  Turn %d\n", ctx.turn);
    result = tree.Tick(ctx);
    std::printf("  Result: %s\n", turnbt::StatusToString(result));
  }

  std::printf("  Door checked %d times in %u turns\n\n", ctx.checks,
              tree.tick_count());
  tree.Dump(stdout);
  std::printf("\n");
}

int main() {
  // Resumes inside ForceDoor: CheckDoor runs once.
  Play(true);
  // Re-walks from Root every turn: CheckDoor runs every turn.
  Play(false);
  return 0;
}
