#include <catch2/catch.hpp>
#include <turnbt/behavior_tree.hpp>

struct SelCtx {
  int ticks = 0;
  int running_turns = 0;
  int slow_ticks = 0;
};

static turnbt::Status sel_success(SelCtx& c) {
  ++c.ticks;
  return turnbt::Status::kSuccess;
}
static turnbt::Status sel_failure(SelCtx& c) {
  ++c.ticks;
  return turnbt::Status::kFailure;
}

// RUNNING for `running_turns` reaches, then SUCCESS.
static turnbt::Status sel_slow(SelCtx& c) {
  ++c.slow_ticks;
  return (c.slow_ticks > c.running_turns) ? turnbt::Status::kSuccess
                                          : turnbt::Status::kRunning;
}

TEST_CASE("Selector first child succeeds", "[selector]") {
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::NodeId sel = b.AddSelector("Sel")
                           .AddChild(b.AddLeaf("A1", sel_success))
                           .AddChild(b.AddLeaf("A2", sel_failure));
  turnbt::BehaviorTree<SelCtx> tree(b, sel);

  SelCtx ctx;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kSuccess);
  REQUIRE(ctx.ticks == 1);  // A2 should not be ticked
  REQUIRE(tree.node(sel).current_child_index() == 0);
}

TEST_CASE("Selector all children fail", "[selector]") {
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::NodeId sel = b.AddSelector("Sel")
                           .AddChild(b.AddLeaf("A1", sel_failure))
                           .AddChild(b.AddLeaf("A2", sel_failure))
                           .AddChild(b.AddLeaf("A3", sel_failure));
  turnbt::BehaviorTree<SelCtx> tree(b, sel);

  SelCtx ctx;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kFailure);
  REQUIRE(ctx.ticks == 3);  // every child reached exactly once
  REQUIRE(tree.node(sel).current_child_index() == 0);
}

TEST_CASE("Selector second child succeeds", "[selector]") {
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::NodeId sel = b.AddSelector("Sel")
                           .AddChild(b.AddLeaf("A1", sel_failure))
                           .AddChild(b.AddLeaf("A2", sel_success));
  turnbt::BehaviorTree<SelCtx> tree(b, sel);

  SelCtx ctx;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kSuccess);
  REQUIRE(ctx.ticks == 2);
}

TEST_CASE("Selector with keep_state resumes at the running child",
          "[selector]") {
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::NodeId sel = b.AddSelector("Sel", true)
                           .AddChild(b.AddLeaf("Fail", sel_failure))
                           .AddChild(b.AddLeaf("Slow", sel_slow))
                           .AddChild(b.AddLeaf("Ok", sel_success));
  turnbt::BehaviorTree<SelCtx> tree(b, sel);

  SelCtx ctx;
  ctx.running_turns = 1;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kRunning);
  REQUIRE(tree.node(sel).current_child_index() == 1);

  REQUIRE(tree.Tick(ctx) == turnbt::Status::kSuccess);
  REQUIRE(ctx.ticks == 1);  // Fail is not replayed, Ok never reached
  REQUIRE(ctx.slow_ticks == 2);
  REQUIRE(tree.node(sel).current_child_index() == 0);
}

TEST_CASE("Selector without keep_state restarts from the first child",
          "[selector]") {
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::NodeId sel = b.AddSelector("Sel")
                           .AddChild(b.AddLeaf("Fail", sel_failure))
                           .AddChild(b.AddLeaf("Slow", sel_slow));
  turnbt::BehaviorTree<SelCtx> tree(b, sel);

  SelCtx ctx;
  ctx.running_turns = 1;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kRunning);
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kSuccess);
  REQUIRE(ctx.ticks == 2);  // Fail replayed on the second turn
  REQUIRE(ctx.slow_ticks == 2);
}

TEST_CASE("Selector resumed child failing moves on", "[selector]") {
  int turn = 0;
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::NodeId sel =
      b.AddSelector("Sel", true)
          .AddChild(b.AddLeaf("RunThenFail", [&turn](SelCtx&) {
            ++turn;
            return (turn == 1) ? turnbt::Status::kRunning
                               : turnbt::Status::kFailure;
          }))
          .AddChild(b.AddLeaf("Ok", sel_success));
  turnbt::BehaviorTree<SelCtx> tree(b, sel);

  SelCtx ctx;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kRunning);
  REQUIRE(ctx.ticks == 0);
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kSuccess);
  REQUIRE(ctx.ticks == 1);
}

TEST_CASE("Selector of N failing children does N ticks", "[selector]") {
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::TreeBuilder<SelCtx>::CompositeRef sel = b.AddSelector("Sel");
  const int kChildren = turnbt::Node<SelCtx>::kMaxChildren;
  for (int i = 0; i < kChildren; ++i) {
    sel.AddChild(b.AddLeaf("Fail", sel_failure));
  }
  turnbt::BehaviorTree<SelCtx> tree(b, sel);
  REQUIRE(tree.ValidateTree() == turnbt::ValidateError::kNone);

  SelCtx ctx;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kFailure);
  REQUIRE(ctx.ticks == kChildren);
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kFailure);
  REQUIRE(ctx.ticks == 2 * kChildren);
}

TEST_CASE("Selector last child succeeds after N ticks", "[selector]") {
  turnbt::TreeBuilder<SelCtx> b;
  turnbt::TreeBuilder<SelCtx>::CompositeRef sel = b.AddSelector("Sel");
  for (int i = 0; i < 4; ++i) {
    sel.AddChild(b.AddLeaf("Fail", sel_failure));
  }
  sel.AddChild(b.AddLeaf("Ok", sel_success));
  turnbt::BehaviorTree<SelCtx> tree(b, sel);

  SelCtx ctx;
  REQUIRE(tree.Tick(ctx) == turnbt::Status::kSuccess);
  REQUIRE(ctx.ticks == 5);
  REQUIRE(tree.node(sel).current_child_index() == 0);
}
