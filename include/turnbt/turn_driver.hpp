/**
 * @file turn_driver.hpp
 * @brief Per-turn glue between a game loop and a BehaviorTree.
 *
 * Keeps the "stats at the start of the previous turn" snapshot outside the
 * tree and hands it to the leaves through the turn state:
 *
 *   1. take the previous snapshot (or the initial one on the first turn)
 *   2. tick the tree once with {world, snapshot}
 *   3. capture the snapshot for the next turn
 */

#ifndef TURNBT_TURN_DRIVER_HPP_
#define TURNBT_TURN_DRIVER_HPP_

#include <turnbt/behavior_tree.hpp>

namespace turnbt {

/**
 * @brief Turn-state bag handed to the tree by TurnDriver.
 * @tparam World Type of the world handle leaves act on.
 * @tparam Stats Snapshot type (copyable, default-constructible).
 */
template <typename World, typename Stats>
struct TurnState {
  World* world;     ///< Non-owning world handle, valid for one tick
  Stats old_stats;  ///< Snapshot taken at the end of the previous turn
};

/**
 * @brief Owns a tree and the previous-turn snapshot.
 *
 * Typical usage:
 *   TreeBuilder<TurnState<Warrior, Stats>> b;
 *   NodeId root = BuildTree(b);
 *   TurnDriver<Warrior, Stats> driver(b, root, InitStats, SaveStats);
 *   driver.PlayTurn(warrior);   // once per turn
 */
template <typename World, typename Stats,
          uint32_t MaxNodes = TURNBT_MAX_NODES>
class TurnDriver final {
 public:
  using State = TurnState<World, Stats>;
  using Tree = BehaviorTree<State, MaxNodes>;
  using Builder = TreeBuilder<State, MaxNodes>;

#if defined(TURNBT_USE_STD_FUNCTION)
  using StatsFn = std::function<Stats(World&)>;
#else
  using StatsFn = Stats (*)(World&);
#endif

  /**
   * @param builder Assembled tree (copied).
   * @param root Root handle in `builder`.
   * @param init_stats Snapshot used for the very first turn.
   * @param save_stats Snapshot captured after every turn.
   */
  TurnDriver(const Builder& builder, NodeId root, StatsFn init_stats,
             StatsFn save_stats)
      : tree_(builder, root),
        init_stats_(std::move(init_stats)),
        save_stats_(std::move(save_stats)),
        stats_(),
        has_stats_(false) {
    TURNBT_ASSERT(init_stats_ != nullptr);
    TURNBT_ASSERT(save_stats_ != nullptr);
  }

  TurnDriver(const TurnDriver&) = delete;
  TurnDriver& operator=(const TurnDriver&) = delete;

  /**
   * @brief Play one turn against `world`.
   * @return Status of the tree's root for this turn.
   */
  Status PlayTurn(World& world) {
    if (!has_stats_) {
      stats_ = init_stats_(world);
      has_stats_ = true;
    }
    State state{&world, stats_};
    Status result = tree_.Tick(state);
    stats_ = save_stats_(world);
    return result;
  }

  Tree& tree() noexcept { return tree_; }
  const Tree& tree() const noexcept { return tree_; }

  /** @brief True once the first turn has been played. */
  bool has_stats() const noexcept { return has_stats_; }

  /** @brief Snapshot the next turn will see as `old_stats`. */
  const Stats& stats() const noexcept { return stats_; }

 private:
  Tree tree_;
  StatsFn init_stats_;
  StatsFn save_stats_;
  Stats stats_;
  bool has_stats_;
};

}  // namespace turnbt

#endif  // TURNBT_TURN_DRIVER_HPP_
