/**
 * @file warrior_tree.hpp
 * @brief Leaf catalog and the assembled "walk or fight" tree for the warrior.
 *
 * Leaves are plain functions over the turn state. Parameterized leaves
 * (look N spaces ahead, low-health threshold, walk direction) are function
 * templates so they stay raw function pointers in the default build.
 *
 *   walk_or_fight (Selector, keep_state)
 *   +-- turn for the captive     captive behind? -> pivot
 *   +-- if enemy fight           enemy ahead? -> attack
 *   +-- shoot the bad guys       (keep_state) no captive at 1, 2; enemy at 3;
 *   |                            delay(shoot); enemy at 3; walk
 *   +-- if wall turn around      wall ahead? -> pivot
 *   +-- retreat if taking damage took damage & low health -> walk backward
 *   +-- if captive rescue        captive ahead? -> rescue
 *   +-- heal if low              (keep_state) low health -> until(rest, full)
 *   +-- move forward             space empty? -> walk
 */

#ifndef TURNBT_EXAMPLES_WARRIOR_TREE_HPP_
#define TURNBT_EXAMPLES_WARRIOR_TREE_HPP_

#include <turnbt/behavior_tree.hpp>
#include <turnbt/turn_driver.hpp>

#include "warrior_world.hpp"

namespace warrior {

/** @brief Snapshot carried from one turn to the next. */
struct Stats {
  int health = 0;
};

using State = turnbt::TurnState<World, Stats>;
using Builder = turnbt::TreeBuilder<State>;
using Driver = turnbt::TurnDriver<World, Stats>;
using turnbt::NodeId;
using turnbt::Status;

inline Status FromBool(bool ok) noexcept {
  return ok ? Status::kSuccess : Status::kFailure;
}

// ============================================================================
// Stats snapshots
// ============================================================================

inline Stats InitStats(World& world) {
  Stats stats;
  stats.health = world.MaxHealth();
  return stats;
}

inline Stats SaveStats(World& world) {
  Stats stats;
  stats.health = world.Health();
  return stats;
}

// ============================================================================
// Conditions
// ============================================================================

inline Status IsSpaceEmpty(State& s) {
  return FromBool(s.world->Feel().IsEmpty());
}

inline Status CheckForEnemy(State& s) {
  return FromBool(s.world->Feel().IsEnemy());
}

inline Status CheckForCaptive(State& s) {
  return FromBool(s.world->Feel().IsBound());
}

inline Status CheckForWall(State& s) {
  return FromBool(s.world->Feel().IsWall());
}

/** @brief Captive exactly N spaces away in `Dir`. */
template <int N, Direction Dir = Direction::kForward>
Status LookForCaptiveAhead(State& s) {
  static_assert(N >= 1 && N <= World::kLookDistance, "look distance");
  return FromBool(s.world->Look(Dir)[N - 1].IsBound());
}

/** @brief Enemy exactly N spaces ahead. */
template <int N>
Status LookForEnemyAhead(State& s) {
  static_assert(N >= 1 && N <= World::kLookDistance, "look distance");
  return FromBool(s.world->Look()[N - 1].IsEnemy());
}

inline Status CheckForDamage(State& s) {
  return FromBool(s.world->Health() < s.old_stats.health);
}

/** @brief Health at or below `Percent` of the maximum. */
template <int Percent>
Status HasLowHealth(State& s) {
  return FromBool(s.world->Health() * 100 <= s.world->MaxHealth() * Percent);
}

inline bool IsFullyHealed(State& s) {
  return s.world->Health() == s.world->MaxHealth();
}

// ============================================================================
// Actions
// ============================================================================

template <Direction Dir = Direction::kForward>
Status Walk(State& s) {
  s.world->Walk(Dir);
  return Status::kSuccess;
}

inline Status Fight(State& s) {
  s.world->Attack();
  return Status::kSuccess;
}

inline Status Shoot(State& s) {
  s.world->Shoot();
  return Status::kSuccess;
}

inline Status TurnAround(State& s) {
  s.world->Pivot();
  return Status::kSuccess;
}

inline Status Rest(State& s) {
  s.world->Rest();
  return Status::kSuccess;
}

inline Status Rescue(State& s) {
  s.world->Rescue();
  return Status::kSuccess;
}

// ============================================================================
// Subtrees
// ============================================================================

constexpr int kLowHealthPercent = 40;

inline NodeId MoveForward(Builder& b) {
  return b.AddSequence("move_forward")
      .AddChild(b.AddLeaf("is_space_empty", IsSpaceEmpty))
      .AddChild(b.AddLeaf("walk", &Walk<Direction::kForward>));
}

inline NodeId HealIfLow(Builder& b) {
  NodeId rest = b.AddLeaf("rest", Rest);
  return b.AddSequence("heal_if_low", true)
      .AddChild(b.AddLeaf("low_health", &HasLowHealth<kLowHealthPercent>))
      .AddChild(turnbt::factory::MakeUntil(b, rest, IsFullyHealed));
}

inline NodeId IfEnemyFight(Builder& b) {
  return b.AddSequence("if_enemy_fight")
      .AddChild(b.AddLeaf("check_for_enemy", CheckForEnemy))
      .AddChild(b.AddLeaf("fight", Fight));
}

inline NodeId IfCaptiveRescue(Builder& b) {
  return b.AddSequence("if_captive_rescue")
      .AddChild(b.AddLeaf("check_for_captive", CheckForCaptive))
      .AddChild(b.AddLeaf("rescue", Rescue));
}

inline NodeId TurnForCaptive(Builder& b) {
  NodeId behind =
      b.AddSelector("is_captive_behind")
          .AddChild(b.AddLeaf("captive_behind_1",
                              &LookForCaptiveAhead<1, Direction::kBackward>))
          .AddChild(b.AddLeaf("captive_behind_2",
                              &LookForCaptiveAhead<2, Direction::kBackward>))
          .AddChild(b.AddLeaf("captive_behind_3",
                              &LookForCaptiveAhead<3, Direction::kBackward>));
  return b.AddSequence("turn_for_captive")
      .AddChild(behind)
      .AddChild(b.AddLeaf("turn_around", TurnAround));
}

inline NodeId ShootIfBadGuy(Builder& b) {
  using turnbt::factory::MakeDelay;
  using turnbt::factory::MakeNegate;
  NodeId no_captive_1 = MakeNegate(
      b, b.AddLeaf("captive_ahead_1",
                   &LookForCaptiveAhead<1, Direction::kForward>));
  NodeId no_captive_2 = MakeNegate(
      b, b.AddLeaf("captive_ahead_2",
                   &LookForCaptiveAhead<2, Direction::kForward>));
  NodeId enemy_3 = b.AddLeaf("enemy_ahead_3", &LookForEnemyAhead<3>);
  NodeId shoot = MakeDelay(b, b.AddLeaf("shoot", Shoot));
  NodeId still_enemy_3 = b.AddLeaf("enemy_ahead_3", &LookForEnemyAhead<3>);
  NodeId walk = b.AddLeaf("walk", &Walk<Direction::kForward>);
  return b.AddSequence("shoot_the_bad_guys", true)
      .AddChild(no_captive_1)
      .AddChild(no_captive_2)
      .AddChild(enemy_3)
      .AddChild(shoot)
      .AddChild(still_enemy_3)
      .AddChild(walk);
}

inline NodeId RetreatIfTakingTooMuchDamage(Builder& b) {
  return b.AddSequence("retreat_if_taking_damage")
      .AddChild(b.AddLeaf("check_for_damage", CheckForDamage))
      .AddChild(b.AddLeaf("low_health", &HasLowHealth<kLowHealthPercent>))
      .AddChild(b.AddLeaf("walk_backward", &Walk<Direction::kBackward>));
}

inline NodeId IfWallTurnAround(Builder& b) {
  return b.AddSequence("if_wall_turn_around")
      .AddChild(b.AddLeaf("check_for_wall", CheckForWall))
      .AddChild(b.AddLeaf("turn_around", TurnAround));
}

/**
 * @brief Assemble the whole warrior tree.
 * @return Root handle.
 */
inline NodeId BuildWarriorTree(Builder& b) {
  return b.AddSelector("walk_or_fight", true)
      .AddChild(TurnForCaptive(b))
      .AddChild(IfEnemyFight(b))
      .AddChild(ShootIfBadGuy(b))
      .AddChild(IfWallTurnAround(b))
      .AddChild(RetreatIfTakingTooMuchDamage(b))
      .AddChild(IfCaptiveRescue(b))
      .AddChild(HealIfLow(b))
      .AddChild(MoveForward(b));
}

}  // namespace warrior

#endif  // TURNBT_EXAMPLES_WARRIOR_TREE_HPP_
