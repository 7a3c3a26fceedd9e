/**
 * @file warrior_world.hpp
 * @brief Tiny corridor simulation the warrior tree plays against.
 *
 * A level is a single row of cells written as a string:
 *
 *   '@' warrior (facing right)   's' sludge (melee enemy)
 *   'a' archer (ranged enemy)    'C' bound captive
 *   '>' stairs (goal)            ' ' floor
 *
 * Everything outside the string is wall. The warrior may perform one action
 * per turn; further actions in the same turn are rejected and counted.
 * EndTurn() lets the enemies strike back.
 */

#ifndef TURNBT_EXAMPLES_WARRIOR_WORLD_HPP_
#define TURNBT_EXAMPLES_WARRIOR_WORLD_HPP_

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace warrior {

enum class Direction : uint8_t { kForward = 0, kBackward };

enum class Unit : uint8_t { kNone = 0, kSludge, kArcher, kCaptive };

/** @brief What the warrior senses in one cell. */
struct Space {
  bool wall = false;
  bool stairs = false;
  Unit unit = Unit::kNone;

  bool IsEmpty() const noexcept { return !wall && unit == Unit::kNone; }
  bool IsWall() const noexcept { return wall; }
  bool IsEnemy() const noexcept {
    return unit == Unit::kSludge || unit == Unit::kArcher;
  }
  bool IsBound() const noexcept { return unit == Unit::kCaptive; }
};

class World final {
 public:
  static constexpr int kMaxHealth = 20;
  static constexpr int kAttackPower = 5;
  static constexpr int kShootPower = 3;
  static constexpr int kRestHealing = 2;
  static constexpr int kSludgeHealth = 12;
  static constexpr int kArcherHealth = 7;
  static constexpr int kEnemyPower = 3;
  static constexpr int kArcherRange = 3;
  static constexpr int kLookDistance = 3;

  explicit World(const std::string& layout)
      : position_(0),
        facing_(1),
        health_(kMaxHealth),
        rescued_(0),
        won_(false),
        acted_(false),
        rejected_actions_(0) {
    cells_.reserve(layout.size());
    for (size_t i = 0; i < layout.size(); ++i) {
      Cell cell;
      switch (layout[i]) {
        case '@':
          position_ = static_cast<int>(i);
          break;
        case 's':
          cell.unit = Unit::kSludge;
          cell.unit_health = kSludgeHealth;
          break;
        case 'a':
          cell.unit = Unit::kArcher;
          cell.unit_health = kArcherHealth;
          break;
        case 'C':
          cell.unit = Unit::kCaptive;
          cell.unit_health = 1;
          break;
        case '>':
          cell.stairs = true;
          break;
        default:
          break;
      }
      cells_.push_back(cell);
    }
  }

  // --- Senses (free, any number per turn) ---

  Space Feel(Direction dir = Direction::kForward) const {
    return SpaceAt(position_ + Step(dir));
  }

  /** @brief The next kLookDistance spaces in `dir`, nearest first. */
  std::array<Space, kLookDistance> Look(
      Direction dir = Direction::kForward) const {
    std::array<Space, kLookDistance> spaces;
    for (int i = 0; i < kLookDistance; ++i) {
      spaces[i] = SpaceAt(position_ + Step(dir) * (i + 1));
    }
    return spaces;
  }

  int Health() const noexcept { return health_; }
  int MaxHealth() const noexcept { return kMaxHealth; }

  // --- Actions (one per turn) ---

  void Walk(Direction dir = Direction::kForward) {
    if (!BeginAction()) {
      return;
    }
    const int target = position_ + Step(dir);
    if (!SpaceAt(target).IsEmpty()) {
      return;
    }
    position_ = target;
    if (cells_[target].stairs) {
      won_ = true;
    }
  }

  void Attack(Direction dir = Direction::kForward) {
    if (!BeginAction()) {
      return;
    }
    Damage(position_ + Step(dir), kAttackPower);
  }

  /** @brief Hit the first unit within kLookDistance ahead. */
  void Shoot(Direction dir = Direction::kForward) {
    if (!BeginAction()) {
      return;
    }
    for (int i = 1; i <= kLookDistance; ++i) {
      const int index = position_ + Step(dir) * i;
      if (!InBounds(index)) {
        return;
      }
      if (cells_[index].unit != Unit::kNone) {
        Damage(index, kShootPower);
        return;
      }
    }
  }

  void Pivot() {
    if (!BeginAction()) {
      return;
    }
    facing_ = -facing_;
  }

  void Rest() {
    if (!BeginAction()) {
      return;
    }
    health_ += kRestHealing;
    if (health_ > kMaxHealth) {
      health_ = kMaxHealth;
    }
  }

  void Rescue(Direction dir = Direction::kForward) {
    if (!BeginAction()) {
      return;
    }
    const int index = position_ + Step(dir);
    if (InBounds(index) && cells_[index].unit == Unit::kCaptive) {
      cells_[index].unit = Unit::kNone;
      cells_[index].unit_health = 0;
      ++rescued_;
    }
  }

  // --- Simulation ---

  /** @brief Enemies in reach strike the warrior; a new turn begins. */
  void EndTurn() {
    for (int i = 0; i < static_cast<int>(cells_.size()); ++i) {
      const int distance = (i > position_) ? i - position_ : position_ - i;
      if (cells_[i].unit == Unit::kSludge && distance == 1) {
        health_ -= kEnemyPower;
      } else if (cells_[i].unit == Unit::kArcher && distance <= kArcherRange &&
                 ClearLine(i)) {
        health_ -= kEnemyPower;
      }
    }
    acted_ = false;
  }

  // --- Inspection ---

  bool won() const noexcept { return won_; }
  bool dead() const noexcept { return health_ <= 0; }
  int position() const noexcept { return position_; }
  bool facing_forward() const noexcept { return facing_ > 0; }
  int rescued() const noexcept { return rescued_; }
  int rejected_actions() const noexcept { return rejected_actions_; }

  Unit unit_at(int index) const {
    return InBounds(index) ? cells_[index].unit : Unit::kNone;
  }

  int unit_health_at(int index) const {
    return InBounds(index) ? cells_[index].unit_health : 0;
  }

  void set_health(int health) noexcept { health_ = health; }

  /** @brief Current layout in level notation. */
  std::string Render() const {
    std::string out(cells_.size(), ' ');
    for (size_t i = 0; i < cells_.size(); ++i) {
      const Cell& cell = cells_[i];
      if (static_cast<int>(i) == position_) {
        out[i] = facing_ > 0 ? '@' : '&';
      } else if (cell.unit == Unit::kSludge) {
        out[i] = 's';
      } else if (cell.unit == Unit::kArcher) {
        out[i] = 'a';
      } else if (cell.unit == Unit::kCaptive) {
        out[i] = 'C';
      } else if (cell.stairs) {
        out[i] = '>';
      }
    }
    return "|" + out + "|";
  }

 private:
  struct Cell {
    bool stairs = false;
    Unit unit = Unit::kNone;
    int unit_health = 0;
  };

  bool InBounds(int index) const noexcept {
    return index >= 0 && index < static_cast<int>(cells_.size());
  }

  int Step(Direction dir) const noexcept {
    return dir == Direction::kForward ? facing_ : -facing_;
  }

  Space SpaceAt(int index) const {
    Space space;
    if (!InBounds(index)) {
      space.wall = true;
      return space;
    }
    space.stairs = cells_[index].stairs;
    space.unit = cells_[index].unit;
    return space;
  }

  bool BeginAction() noexcept {
    if (acted_) {
      ++rejected_actions_;
      return false;
    }
    acted_ = true;
    return true;
  }

  void Damage(int index, int amount) {
    if (!InBounds(index) || cells_[index].unit == Unit::kNone) {
      return;
    }
    cells_[index].unit_health -= amount;
    if (cells_[index].unit_health <= 0) {
      cells_[index].unit = Unit::kNone;
      cells_[index].unit_health = 0;
    }
  }

  /** @brief No unit between the warrior and cell `index`. */
  bool ClearLine(int index) const noexcept {
    const int step = (index > position_) ? 1 : -1;
    for (int i = position_ + step; i != index; i += step) {
      if (cells_[i].unit != Unit::kNone) {
        return false;
      }
    }
    return true;
  }

  std::vector<Cell> cells_;
  int position_;
  int facing_;
  int health_;
  int rescued_;
  bool won_;
  bool acted_;
  int rejected_actions_;
};

}  // namespace warrior

#endif  // TURNBT_EXAMPLES_WARRIOR_WORLD_HPP_
