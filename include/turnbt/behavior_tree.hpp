/**
 * @file behavior_tree.hpp
 * @brief Header-only C++14 resumable behavior tree engine.
 * @version 1.0.0
 *
 * The tree is evaluated once per external turn. A RUNNING result is a plain
 * data value: the "where was I" information lives in per-composite cursors
 * and per-decorator state, so the next turn resumes at the node that was
 * still running instead of restarting the whole tree.
 *
 * Design principles:
 * - Template for type-safe turn state (no void* casting)
 * - Flat node arena addressed by NodeId handles (no ownership pointers)
 * - Two phases: TreeBuilder assembles, BehaviorTree plays (frozen structure)
 * - Tagged node and decorator kinds, dispatched by switch
 * - const char* for node names (zero heap allocation)
 * - -fno-exceptions, -fno-rtti compatible
 *
 * Configuration macros (define BEFORE including this header):
 * - TURNBT_MAX_CHILDREN: Max children per composite (default 8)
 * - TURNBT_MAX_NODES: Default arena capacity of a tree (default 64)
 * - TURNBT_USE_STD_FUNCTION: Use std::function for callbacks (allows lambda
 *   captures). Default: raw function pointers (zero heap, deterministic
 *   latency). When using function pointers, put per-node state in the turn
 *   state or bake it in with a function template.
 *
 * Naming convention (Google C++ Style Guide):
 * - Accessors: lowercase (e.g., name(), type(), keep_state())
 * - Mutators: set_xxx() (e.g., set_trace())
 * - Regular functions: PascalCase (e.g., Tick(), Reset(), AddChild())
 */

#ifndef TURNBT_BEHAVIOR_TREE_HPP_
#define TURNBT_BEHAVIOR_TREE_HPP_

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <type_traits>
#include <utility>

#if defined(TURNBT_USE_STD_FUNCTION)
#include <functional>
#endif

// ============================================================================
// Configuration
// ============================================================================

/** @brief Maximum children per composite (fixed-capacity inline array). */
#ifndef TURNBT_MAX_CHILDREN
#define TURNBT_MAX_CHILDREN 8
#endif

/** @brief Default node arena capacity. */
#ifndef TURNBT_MAX_NODES
#define TURNBT_MAX_NODES 64
#endif

// ============================================================================
// Compiler hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define TURNBT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define TURNBT_HOT __attribute__((hot))
#else
#define TURNBT_UNLIKELY(x) (x)
#define TURNBT_HOT
#endif

/**
 * @brief Fail-fast check for programmer errors.
 *
 * Active in every build type: a malformed tree must never silently produce
 * a Status.
 */
#define TURNBT_ASSERT(cond)                                        \
  do {                                                             \
    if (TURNBT_UNLIKELY(!(cond))) {                                \
      ::turnbt::detail::Fault(#cond, __FILE__, __LINE__);          \
    }                                                              \
  } while (0)

namespace turnbt {

namespace detail {

/** @brief Report a broken invariant and terminate. */
[[noreturn]] inline void Fault(const char* expr, const char* file,
                               int line) noexcept {
  std::fprintf(stderr, "turnbt: fault: %s (%s:%d)\n", expr, file, line);
  std::abort();
}

}  // namespace detail

// ============================================================================
// Status
// ============================================================================

/**
 * @brief Result of one node tick.
 *
 * kRunning means "not finished, resume here next turn".
 */
enum class Status : uint8_t {
  kSuccess = 0,  ///< Node completed successfully
  kFailure = 1,  ///< Node failed (or its precondition was false)
  kRunning = 2   ///< Node needs more turns
};

/**
 * @brief Convert Status to human-readable string.
 */
inline constexpr const char* StatusToString(Status s) noexcept {
  return (s == Status::kSuccess) ? "SUCCESS"
       : (s == Status::kFailure) ? "FAILURE"
       : (s == Status::kRunning) ? "RUNNING"
       : "UNKNOWN";
}

/** @brief Swap SUCCESS and FAILURE; RUNNING passes through. */
inline constexpr Status NegateStatus(Status s) noexcept {
  return (s == Status::kSuccess) ? Status::kFailure
       : (s == Status::kFailure) ? Status::kSuccess
       : s;
}

// ============================================================================
// Node Type
// ============================================================================

/**
 * @brief Behavior tree node type enumeration.
 *
 * - LEAF:      Calls out to the world through a tick callback
 * - SEQUENCE:  Composite: all children must succeed (AND logic)
 * - SELECTOR:  Composite: first successful child wins (OR logic)
 * - DECORATOR: Wraps one child, see DecoratorKind
 */
enum class NodeType : uint8_t {
  kLeaf = 0,
  kSequence,
  kSelector,
  kDecorator
};

/**
 * @brief Convert NodeType to human-readable string.
 */
inline constexpr const char* NodeTypeToString(NodeType t) noexcept {
  return (t == NodeType::kLeaf)      ? "LEAF"
       : (t == NodeType::kSequence)  ? "SEQUENCE"
       : (t == NodeType::kSelector)  ? "SELECTOR"
       : (t == NodeType::kDecorator) ? "DECORATOR"
       : "UNKNOWN";
}

/** @brief Check if a node type owns a cursor over several children. */
inline constexpr bool IsCompositeType(NodeType t) noexcept {
  return (t == NodeType::kSequence) || (t == NodeType::kSelector);
}

// ============================================================================
// Decorator Kind
// ============================================================================

/**
 * @brief Stock decorator behaviors.
 *
 * - NEGATE: SUCCESS <-> FAILURE, RUNNING unchanged
 * - DELAY:  report the child's result one reach later
 * - UNTIL:  RUNNING until a predicate holds, abort on child FAILURE
 * - CUSTOM: user before/after hooks
 */
enum class DecoratorKind : uint8_t {
  kNegate = 0,
  kDelay,
  kUntil,
  kCustom
};

/** @brief Convert DecoratorKind to human-readable string. */
inline constexpr const char* DecoratorKindToString(DecoratorKind k) noexcept {
  return (k == DecoratorKind::kNegate) ? "NEGATE"
       : (k == DecoratorKind::kDelay)  ? "DELAY"
       : (k == DecoratorKind::kUntil)  ? "UNTIL"
       : (k == DecoratorKind::kCustom) ? "CUSTOM"
       : "UNKNOWN";
}

// ============================================================================
// Validation Error
// ============================================================================

/**
 * @brief Tree structure validation error codes.
 *
 * Reported by TreeBuilder::Validate() and BehaviorTree::ValidateTree().
 * Wiring mistakes made while building are sticky: the first one is kept
 * and reported by every later Validate() call.
 */
enum class ValidateError : uint8_t {
  kNone = 0,               ///< No error
  kArenaFull,              ///< More nodes than the arena capacity
  kInvalidHandle,          ///< NodeId does not name a node
  kWrongNodeType,          ///< AddChild on a non-composite, Bind on a non-decorator
  kLeafMissingTick,        ///< Leaf node has no tick callback
  kCompositeNoChildren,    ///< Sequence/Selector without children
  kChildrenExceedMax,      ///< Children count exceeds TURNBT_MAX_CHILDREN
  kDecoratorUnbound,       ///< Decorator without a child
  kDecoratorRebound,       ///< Decorator bound twice
  kUntilMissingPredicate,  ///< Until decorator without predicate
  kMultipleParents,        ///< Node attached under two parents
  kRootHasParent           ///< Root is also some node's child
};

/** @brief Convert ValidateError to human-readable string. */
inline constexpr const char* ValidateErrorToString(ValidateError e) noexcept {
  return (e == ValidateError::kNone)                  ? "NONE"
       : (e == ValidateError::kArenaFull)             ? "ARENA_FULL"
       : (e == ValidateError::kInvalidHandle)         ? "INVALID_HANDLE"
       : (e == ValidateError::kWrongNodeType)         ? "WRONG_NODE_TYPE"
       : (e == ValidateError::kLeafMissingTick)       ? "LEAF_MISSING_TICK"
       : (e == ValidateError::kCompositeNoChildren)   ? "COMPOSITE_NO_CHILDREN"
       : (e == ValidateError::kChildrenExceedMax)     ? "CHILDREN_EXCEED_MAX"
       : (e == ValidateError::kDecoratorUnbound)      ? "DECORATOR_UNBOUND"
       : (e == ValidateError::kDecoratorRebound)      ? "DECORATOR_REBOUND"
       : (e == ValidateError::kUntilMissingPredicate) ? "UNTIL_MISSING_PREDICATE"
       : (e == ValidateError::kMultipleParents)       ? "MULTIPLE_PARENTS"
       : (e == ValidateError::kRootHasParent)         ? "ROOT_HAS_PARENT"
       : "UNKNOWN";
}

// ============================================================================
// Handles
// ============================================================================

/** @brief Stable index of a node in its arena. */
using NodeId = int32_t;

/** @brief "No node" handle. */
constexpr NodeId kInvalidNode = -1;

// ============================================================================
// Cursor
// ============================================================================

/**
 * @brief Child-iteration state of one composite.
 *
 * Views the composite's fixed child list; only the index moves. A fresh
 * cursor is created whenever the composite restarts its traversal.
 */
class Cursor final {
 public:
  Cursor() noexcept : children_(nullptr), count_(0), index_(0) {}

  Cursor(const NodeId* children, uint16_t count) noexcept
      : children_(children), count_(count), index_(0) {}

  /** @brief Child handle at the current index. */
  NodeId current() const noexcept {
    TURNBT_ASSERT(count_ > 0);
    return children_[index_];
  }

  /** @brief True iff the index is not at the last child. */
  bool HasNext() const noexcept {
    return static_cast<uint32_t>(index_) + 1U < count_;
  }

  /**
   * @brief Move to the next child.
   * @return false (index unchanged) when already at the last child.
   */
  bool Advance() noexcept {
    if (HasNext()) {
      ++index_;
      return true;
    }
    return false;
  }

  void Reset() noexcept { index_ = 0; }

  uint16_t index() const noexcept { return index_; }
  uint16_t size() const noexcept { return count_; }

 private:
  const NodeId* children_;
  uint16_t count_;
  uint16_t index_;
};

// ============================================================================
// Decorator State
// ============================================================================

/**
 * @brief Private per-instance decorator state.
 *
 * Lives as long as the tree; never cleared between ticks (only by
 * BehaviorTree::Reset()). Custom hooks receive it as their `self`.
 */
struct DecoratorState {
  Status pending_result = Status::kFailure;  ///< DELAY: stored result
  bool has_pending = false;                  ///< DELAY: slot occupied
  bool done = false;                         ///< UNTIL: predicate held
  int32_t counter = 0;                       ///< Free for custom hooks
};

// ============================================================================
// Callback types
// ============================================================================

/**
 * @brief Callback signatures for a given turn-state type.
 *
 * - TickFn:      leaf body
 * - PredicateFn: UNTIL predicate
 * - BeforeFn:    CUSTOM decorator, derives the subtree's turn state
 * - AfterFn:     CUSTOM decorator, maps the child's result
 * - TraceFn:     tree-level observer, called after every node tick
 */
template <typename Context>
struct Callbacks {
#if defined(TURNBT_USE_STD_FUNCTION)
  using TickFn = std::function<Status(Context&)>;
  using PredicateFn = std::function<bool(Context&)>;
  using BeforeFn = std::function<Context(const Context&, DecoratorState&)>;
  using AfterFn =
      std::function<Status(Status, DecoratorState&, const Context&)>;
  using TraceFn =
      std::function<void(const char*, NodeType, Status, const Context&)>;
#else
  using TickFn = Status (*)(Context&);
  using PredicateFn = bool (*)(Context&);
  using BeforeFn = Context (*)(const Context&, DecoratorState&);
  using AfterFn = Status (*)(Status, DecoratorState&, const Context&);
  using TraceFn = void (*)(const char*, NodeType, Status, const Context&);
#endif
};

// ============================================================================
// Forward declarations
// ============================================================================

template <typename Context, uint32_t MaxNodes>
class TreeBuilder;

template <typename Context, uint32_t MaxNodes>
class BehaviorTree;

// ============================================================================
// Node
// ============================================================================

/**
 * @brief One arena slot.
 * @tparam Context User-defined turn-state type.
 *
 * Nodes are created and wired only through TreeBuilder; a BehaviorTree
 * exposes them read-only. The type tag selects which fields are meaningful.
 */
template <typename Context>
class Node final {
 public:
  /// Maximum children per composite (compile-time configurable).
  static constexpr uint16_t kMaxChildren =
      static_cast<uint16_t>(TURNBT_MAX_CHILDREN);

  static_assert(kMaxChildren <= 256U,
                "TURNBT_MAX_CHILDREN too large (max 256)");

  using TickFn = typename Callbacks<Context>::TickFn;
  using PredicateFn = typename Callbacks<Context>::PredicateFn;
  using BeforeFn = typename Callbacks<Context>::BeforeFn;
  using AfterFn = typename Callbacks<Context>::AfterFn;

  Node() noexcept
      : type_(NodeType::kLeaf),
        kind_(DecoratorKind::kNegate),
        keep_state_(false),
        cursor_live_(false),
        children_count_(0),
        parent_(kInvalidNode),
        cursor_(),
        state_(),
        tick_(nullptr),
        predicate_(nullptr),
        before_(nullptr),
        after_(nullptr),
        children_{},
        name_("") {}

  // --- Query API (Accessors: lowercase) ---

  const char* name() const noexcept { return name_; }
  NodeType type() const noexcept { return type_; }

  /** @brief Handle of the parent, kInvalidNode for unattached nodes. */
  NodeId parent() const noexcept { return parent_; }

  uint16_t children_count() const noexcept { return children_count_; }

  /** @brief Child handle by position, kInvalidNode when out of range. */
  NodeId child(uint16_t index) const noexcept {
    return (index < children_count_) ? children_[index] : kInvalidNode;
  }

  /** @brief Composite replay policy: resume the cursor across ticks. */
  bool keep_state() const noexcept { return keep_state_; }

  /** @brief True once the composite has created its cursor. */
  bool cursor_started() const noexcept { return cursor_live_; }

  /** @brief Cursor position (0 before the first tick). */
  uint16_t current_child_index() const noexcept {
    return cursor_live_ ? cursor_.index() : static_cast<uint16_t>(0);
  }

  DecoratorKind decorator_kind() const noexcept { return kind_; }
  const DecoratorState& decorator_state() const noexcept { return state_; }

  bool has_tick() const noexcept { return tick_ != nullptr; }
  bool has_predicate() const noexcept { return predicate_ != nullptr; }

 private:
  template <typename C, uint32_t N>
  friend class TreeBuilder;
  template <typename C, uint32_t N>
  friend class BehaviorTree;

  /** @brief Start a fresh traversal at child 0. */
  void RestartCursor() noexcept {
    cursor_ = Cursor(children_, children_count_);
    cursor_live_ = true;
  }

  // Hot data (accessed every tick)
  NodeType type_;
  DecoratorKind kind_;
  bool keep_state_;
  bool cursor_live_;
  uint16_t children_count_;
  NodeId parent_;
  Cursor cursor_;
  DecoratorState state_;

  // Callbacks
  TickFn tick_;
  PredicateFn predicate_;
  BeforeFn before_;
  AfterFn after_;

  // Children (fixed-capacity inline array)
  NodeId children_[kMaxChildren];

  // Cold data (rarely accessed)
  const char* name_;
};

// ============================================================================
// TreeBuilder
// ============================================================================

/**
 * @brief Assembly phase: allocates nodes and wires them together.
 * @tparam Context User-defined turn-state type.
 * @tparam MaxNodes Arena capacity.
 *
 * Add*() returns a handle; composites and decorators return a small
 * reference object so children can be chained:
 *
 *   TreeBuilder<Ctx> b;
 *   NodeId move = b.AddSequence("move_forward")
 *                     .AddChild(b.AddLeaf("is_space_empty", IsSpaceEmpty))
 *                     .AddChild(b.AddLeaf("walk", Walk));
 *   BehaviorTree<Ctx> tree(b, move);
 */
template <typename Context, uint32_t MaxNodes = TURNBT_MAX_NODES>
class TreeBuilder final {
  static_assert(!std::is_pointer<Context>::value,
                "Context must not be a pointer type; use the pointed-to type");
  static_assert(MaxNodes > 0U, "MaxNodes must be positive");

 public:
  using NodeT = Node<Context>;
  using TickFn = typename NodeT::TickFn;
  using PredicateFn = typename NodeT::PredicateFn;
  using BeforeFn = typename NodeT::BeforeFn;
  using AfterFn = typename NodeT::AfterFn;

  /** @brief Chainable handle to a Sequence/Selector under construction. */
  class CompositeRef {
   public:
    CompositeRef(TreeBuilder* owner, NodeId id) noexcept
        : owner_(owner), id_(id) {}

    /** @brief Append a child; returns *this for chaining. */
    CompositeRef& AddChild(NodeId child) {
      owner_->AddChild(id_, child);
      return *this;
    }

    NodeId id() const noexcept { return id_; }
    operator NodeId() const noexcept { return id_; }

   private:
    TreeBuilder* owner_;
    NodeId id_;
  };

  /** @brief Chainable handle to a decorator under construction. */
  class DecoratorRef {
   public:
    DecoratorRef(TreeBuilder* owner, NodeId id) noexcept
        : owner_(owner), id_(id) {}

    /** @brief Attach the single child; returns *this. */
    DecoratorRef& Bind(NodeId child) {
      owner_->Bind(id_, child);
      return *this;
    }

    NodeId id() const noexcept { return id_; }
    operator NodeId() const noexcept { return id_; }

   private:
    TreeBuilder* owner_;
    NodeId id_;
  };

  TreeBuilder() noexcept : node_count_(0), error_(ValidateError::kNone) {}

  // --- Build API ---

  /** @brief Add a leaf wrapping a world-facing function. */
  NodeId AddLeaf(const char* name, TickFn fn) {
    NodeId id = AddNode(NodeType::kLeaf, name);
    if (id != kInvalidNode) {
      nodes_[id].tick_ = std::move(fn);
    }
    return id;
  }

  /**
   * @brief Add a sequence (AND) composite.
   * @param keep_state Resume at a RUNNING child on the next tick instead of
   *        re-walking from the first child.
   */
  CompositeRef AddSequence(const char* name, bool keep_state = false) {
    return CompositeRef(this, AddComposite(NodeType::kSequence, name,
                                           keep_state));
  }

  /** @brief Add a selector (OR) composite. Same keep_state policy. */
  CompositeRef AddSelector(const char* name, bool keep_state = false) {
    return CompositeRef(this, AddComposite(NodeType::kSelector, name,
                                           keep_state));
  }

  DecoratorRef AddNegate(const char* name = "not") {
    return DecoratorRef(this, AddDecoratorNode(name, DecoratorKind::kNegate));
  }

  /** @brief Delay: report each child result one reach later. */
  DecoratorRef AddDelay(const char* name = "delay") {
    return DecoratorRef(this, AddDecoratorNode(name, DecoratorKind::kDelay));
  }

  /**
   * @brief Until: keep the child going until `pred` holds.
   *
   * RUNNING while waiting, SUCCESS on the reach where the predicate was
   * seen, FAILURE as soon as the child fails.
   */
  DecoratorRef AddUntil(const char* name, PredicateFn pred) {
    NodeId id = AddDecoratorNode(name, DecoratorKind::kUntil);
    if (id != kInvalidNode) {
      nodes_[id].predicate_ = std::move(pred);
    }
    return DecoratorRef(this, id);
  }

  /**
   * @brief Add a decorator with user hooks.
   * @param before Derives the turn state handed to the child; null keeps
   *        the caller's turn state.
   * @param after Maps the child's result; null passes it through.
   */
  DecoratorRef AddDecorator(const char* name, BeforeFn before, AfterFn after) {
    NodeId id = AddDecoratorNode(name, DecoratorKind::kCustom);
    if (id != kInvalidNode) {
      nodes_[id].before_ = std::move(before);
      nodes_[id].after_ = std::move(after);
    }
    return DecoratorRef(this, id);
  }

  /**
   * @brief Append `child` to a Sequence/Selector.
   *
   * Errors are recorded (first one wins) and reported by Validate().
   */
  TreeBuilder& AddChild(NodeId composite, NodeId child) {
    if (!IsValid(composite) || !IsValid(child)) {
      Record(ValidateError::kInvalidHandle);
      return *this;
    }
    NodeT& parent = nodes_[composite];
    if (!IsCompositeType(parent.type_)) {
      Record(ValidateError::kWrongNodeType);
      return *this;
    }
    if (parent.children_count_ >= NodeT::kMaxChildren) {
      Record(ValidateError::kChildrenExceedMax);
      return *this;
    }
    if (!Adopt(composite, child)) {
      return *this;
    }
    parent.children_[parent.children_count_] = child;
    ++parent.children_count_;
    return *this;
  }

  /** @brief Attach the single child of a decorator. */
  TreeBuilder& Bind(NodeId decorator, NodeId child) {
    if (!IsValid(decorator) || !IsValid(child)) {
      Record(ValidateError::kInvalidHandle);
      return *this;
    }
    NodeT& deco = nodes_[decorator];
    if (deco.type_ != NodeType::kDecorator) {
      Record(ValidateError::kWrongNodeType);
      return *this;
    }
    if (deco.children_count_ != 0) {
      Record(ValidateError::kDecoratorRebound);
      return *this;
    }
    if (!Adopt(decorator, child)) {
      return *this;
    }
    deco.children_[0] = child;
    deco.children_count_ = 1;
    return *this;
  }

  // --- Validation API ---

  /**
   * @brief Validate the subtree reachable from `root`.
   * @return ValidateError::kNone if the tree can be played.
   *
   * Reports the first recorded wiring error, otherwise checks every
   * reachable node. Single-parent wiring plus a parentless root guarantees
   * the reachable part is a tree (no sharing, no cycles).
   */
  ValidateError Validate(NodeId root) const noexcept {
    if (error_ != ValidateError::kNone) {
      return error_;
    }
    if (!IsValid(root)) {
      return ValidateError::kInvalidHandle;
    }
    if (nodes_[root].parent_ != kInvalidNode) {
      return ValidateError::kRootHasParent;
    }
    return ValidateSubtree(root);
  }

  // --- Query API ---

  uint32_t node_count() const noexcept { return node_count_; }
  static constexpr uint32_t capacity() noexcept { return MaxNodes; }

  /** @brief First wiring error recorded so far. */
  ValidateError error() const noexcept { return error_; }

  const NodeT& node(NodeId id) const noexcept {
    TURNBT_ASSERT(IsValid(id));
    return nodes_[id];
  }

  bool IsValid(NodeId id) const noexcept {
    return id >= 0 && static_cast<uint32_t>(id) < node_count_;
  }

 private:
  friend class BehaviorTree<Context, MaxNodes>;

  NodeId AddNode(NodeType type, const char* name) {
    if (TURNBT_UNLIKELY(node_count_ >= MaxNodes)) {
      Record(ValidateError::kArenaFull);
      return kInvalidNode;
    }
    NodeId id = static_cast<NodeId>(node_count_);
    ++node_count_;
    NodeT& node = nodes_[id];
    node = NodeT();
    node.type_ = type;
    node.name_ = (name != nullptr) ? name : "";
    return id;
  }

  NodeId AddComposite(NodeType type, const char* name, bool keep_state) {
    NodeId id = AddNode(type, name);
    if (id != kInvalidNode) {
      nodes_[id].keep_state_ = keep_state;
    }
    return id;
  }

  NodeId AddDecoratorNode(const char* name, DecoratorKind kind) {
    NodeId id = AddNode(NodeType::kDecorator, name);
    if (id != kInvalidNode) {
      nodes_[id].kind_ = kind;
    }
    return id;
  }

  /** @brief Record `parent` as the only parent of `child`. */
  bool Adopt(NodeId parent, NodeId child) noexcept {
    NodeT& node = nodes_[child];
    if (node.parent_ != kInvalidNode || child == parent) {
      Record(ValidateError::kMultipleParents);
      return false;
    }
    node.parent_ = parent;
    return true;
  }

  void Record(ValidateError err) noexcept {
    if (error_ == ValidateError::kNone) {
      error_ = err;
    }
  }

  /** @brief Check one node's configuration (non-recursive). */
  ValidateError ValidateNode(const NodeT& node) const noexcept {
    switch (node.type_) {
      case NodeType::kLeaf:
        if (!node.has_tick()) {
          return ValidateError::kLeafMissingTick;
        }
        return ValidateError::kNone;
      case NodeType::kSequence:
      case NodeType::kSelector:
        if (node.children_count_ == 0) {
          return ValidateError::kCompositeNoChildren;
        }
        return ValidateError::kNone;
      case NodeType::kDecorator:
        if (node.children_count_ != 1) {
          return ValidateError::kDecoratorUnbound;
        }
        if (node.kind_ == DecoratorKind::kUntil && !node.has_predicate()) {
          return ValidateError::kUntilMissingPredicate;
        }
        return ValidateError::kNone;
      default:
        return ValidateError::kWrongNodeType;
    }
  }

  ValidateError ValidateSubtree(NodeId id) const noexcept {
    const NodeT& node = nodes_[id];
    ValidateError err = ValidateNode(node);
    if (err != ValidateError::kNone) {
      return err;
    }
    for (uint16_t i = 0; i < node.children_count_; ++i) {
      err = ValidateSubtree(node.children_[i]);
      if (err != ValidateError::kNone) {
        return err;
      }
    }
    return ValidateError::kNone;
  }

  NodeT nodes_[MaxNodes];
  uint32_t node_count_;
  ValidateError error_;
};

// ============================================================================
// BehaviorTree
// ============================================================================

/**
 * @brief Play phase: the frozen tree and its per-turn entry point.
 * @tparam Context User-defined turn-state type.
 * @tparam MaxNodes Arena capacity (must match the builder).
 *
 * Copies the builder's arena; structure cannot change afterwards. Only
 * cursor positions and decorator state move while playing.
 *
 * Recommended usage:
 * 1. Assemble nodes with a TreeBuilder
 * 2. Construct BehaviorTree from the builder and the root handle
 * 3. Check ValidateTree() once
 * 4. Call Tick(turn_state) once per turn
 */
template <typename Context, uint32_t MaxNodes = TURNBT_MAX_NODES>
class BehaviorTree final {
  static_assert(!std::is_pointer<Context>::value,
                "Context must not be a pointer type; use the pointed-to type");

 public:
  using NodeT = Node<Context>;
  using TraceFn = typename Callbacks<Context>::TraceFn;

  /**
   * @brief Freeze a builder's arena into a playable tree.
   * @param builder Assembled nodes (copied; the builder may be discarded).
   * @param root Handle of the root node.
   */
  BehaviorTree(const TreeBuilder<Context, MaxNodes>& builder, NodeId root)
      : node_count_(builder.node_count_),
        root_(root),
        validate_error_(builder.Validate(root)),
        last_status_(Status::kFailure),
        tick_count_(0),
        trace_(nullptr) {
    for (uint32_t i = 0; i < node_count_; ++i) {
      nodes_[i] = builder.nodes_[i];
      nodes_[i].cursor_live_ = false;
    }
  }

  // Non-copyable, non-movable (cursors point into the arena)
  BehaviorTree(const BehaviorTree&) = delete;
  BehaviorTree& operator=(const BehaviorTree&) = delete;
  BehaviorTree(BehaviorTree&&) = delete;
  BehaviorTree& operator=(BehaviorTree&&) = delete;

  // --- Public API (Regular functions: PascalCase) ---

  /**
   * @brief Validation result computed at construction.
   * @return ValidateError::kNone if the tree can be ticked.
   */
  ValidateError ValidateTree() const noexcept { return validate_error_; }

  /**
   * @brief Play one turn.
   * @param turn_state The turn's state bag, passed down the active path.
   * @return Status of the root after this turn.
   *
   * Ticking a tree that failed validation is a fault.
   */
  TURNBT_HOT Status Tick(Context& turn_state) {
    TURNBT_ASSERT(validate_error_ == ValidateError::kNone);
    ++tick_count_;
    last_status_ = TickNode(root_, turn_state);
    return last_status_;
  }

  /**
   * @brief Forget all progress: cursors restart, decorator state clears.
   *
   * Statistics are preserved.
   */
  void Reset() noexcept {
    for (uint32_t i = 0; i < node_count_; ++i) {
      nodes_[i].cursor_live_ = false;
      nodes_[i].cursor_ = Cursor();
      nodes_[i].state_ = DecoratorState();
    }
    last_status_ = Status::kFailure;
  }

  /**
   * @brief Write an indented listing of the tree with cursor positions.
   *
   * A tree that failed validation is not walked; only its error is written.
   */
  void Dump(std::FILE* out) const {
    if (validate_error_ != ValidateError::kNone) {
      std::fprintf(out, "invalid tree: %s\n",
                   ValidateErrorToString(validate_error_));
      return;
    }
    DumpNode(out, root_, 0);
  }

  // --- Mutators ---

  /** @brief Observe every node tick (nullptr disables tracing). */
  void set_trace(TraceFn fn) { trace_ = std::move(fn); }

  // --- Accessors (lowercase) ---

  NodeId root() const noexcept { return root_; }
  uint32_t node_count() const noexcept { return node_count_; }

  const NodeT& node(NodeId id) const noexcept {
    TURNBT_ASSERT(id >= 0 && static_cast<uint32_t>(id) < node_count_);
    return nodes_[id];
  }

  /** @brief Get the status from the last Tick() call. */
  Status last_status() const noexcept { return last_status_; }

  /** @brief Get total number of Tick() calls. */
  uint32_t tick_count() const noexcept { return tick_count_; }

 private:
  // --- Tick dispatch ---

  TURNBT_HOT Status TickNode(NodeId id, Context& ctx) {
    NodeT& node = nodes_[id];
    Status result;

    switch (node.type_) {
      case NodeType::kLeaf:
        TURNBT_ASSERT(node.tick_ != nullptr);
        result = node.tick_(ctx);
        break;
      case NodeType::kSequence:
        result = TickSequence(node, ctx);
        break;
      case NodeType::kSelector:
        result = TickSelector(node, ctx);
        break;
      case NodeType::kDecorator:
        result = TickDecorator(node, ctx);
        break;
      default:
        detail::Fault("unknown node type", __FILE__, __LINE__);
    }

    if (TURNBT_UNLIKELY(trace_ != nullptr)) {
      trace_(node.name_, node.type_, result, ctx);
    }
    return result;
  }

  /** @brief Fresh cursor on the first tick or when not keeping state. */
  static void PrepareCursor(NodeT& node) noexcept {
    TURNBT_ASSERT(node.children_count_ > 0);
    if (!node.cursor_live_ || !node.keep_state_) {
      node.RestartCursor();
    }
  }

  /**
   * @brief Tick a sequence node.
   *
   * SUCCESS advances to the next child within the same tick. FAILURE
   * rewinds the cursor. RUNNING leaves it on the running child.
   */
  TURNBT_HOT Status TickSequence(NodeT& node, Context& ctx) {
    PrepareCursor(node);
    Cursor& cursor = node.cursor_;

    do {
      Status child_status = TickNode(cursor.current(), ctx);
      if (child_status != Status::kSuccess) {
        if (child_status == Status::kFailure) {
          cursor.Reset();
        }
        return child_status;
      }
    } while (cursor.Advance());

    cursor.Reset();
    return Status::kSuccess;
  }

  /**
   * @brief Tick a selector node.
   *
   * FAILURE advances to the next child within the same tick. SUCCESS
   * rewinds the cursor. RUNNING leaves it on the running child. All
   * children failing yields FAILURE.
   */
  TURNBT_HOT Status TickSelector(NodeT& node, Context& ctx) {
    PrepareCursor(node);
    Cursor& cursor = node.cursor_;

    do {
      Status child_status = TickNode(cursor.current(), ctx);
      if (child_status == Status::kRunning) {
        return Status::kRunning;
      }
      if (child_status == Status::kSuccess) {
        cursor.Reset();
        return Status::kSuccess;
      }
    } while (cursor.Advance());

    cursor.Reset();
    return Status::kFailure;
  }

  /**
   * @brief Tick a decorator: before hook, child, after hook.
   *
   * The child is ticked on every call.
   */
  Status TickDecorator(NodeT& node, Context& ctx) {
    TURNBT_ASSERT(node.children_count_ == 1);
    const NodeId child = node.children_[0];
    DecoratorState& self = node.state_;

    switch (node.kind_) {
      case DecoratorKind::kNegate:
        return NegateStatus(TickNode(child, ctx));

      case DecoratorKind::kDelay:
        return AfterDelay(TickNode(child, ctx), self);

      case DecoratorKind::kUntil:
        // Once seen, the predicate is not re-evaluated until released.
        if (!self.done && node.predicate_(ctx)) {
          self.done = true;
        }
        return AfterUntil(TickNode(child, ctx), self);

      case DecoratorKind::kCustom:
        return TickCustom(node, child, ctx);

      default:
        detail::Fault("unknown decorator kind", __FILE__, __LINE__);
    }
  }

  Status TickCustom(NodeT& node, NodeId child, Context& ctx) {
    DecoratorState& self = node.state_;
    Status raw;
    if (node.before_ != nullptr) {
      Context derived = node.before_(ctx, self);
      raw = TickNode(child, derived);
    } else {
      raw = TickNode(child, ctx);
    }
    if (node.after_ != nullptr) {
      return node.after_(raw, self, ctx);
    }
    return raw;
  }

  /** @brief Release a stored result, or store this one and report RUNNING. */
  static Status AfterDelay(Status raw, DecoratorState& self) noexcept {
    if (self.has_pending) {
      self.has_pending = false;
      return self.pending_result;
    }
    self.pending_result = raw;
    self.has_pending = true;
    return Status::kRunning;
  }

  static Status AfterUntil(Status raw, DecoratorState& self) noexcept {
    if (raw == Status::kFailure) {
      return Status::kFailure;
    }
    if (self.done) {
      self.done = false;
      return Status::kSuccess;
    }
    return Status::kRunning;
  }

  void DumpNode(std::FILE* out, NodeId id, int depth) const {
    const NodeT& node = nodes_[id];
    std::fprintf(out, "%*s%s \"%s\"", depth * 2, "",
                 NodeTypeToString(node.type_), node.name_);
    if (IsCompositeType(node.type_)) {
      std::fprintf(out, " [cursor %u/%u%s]",
                   static_cast<unsigned>(node.current_child_index()),
                   static_cast<unsigned>(node.children_count_),
                   node.keep_state_ ? ", keep_state" : "");
    } else if (node.type_ == NodeType::kDecorator) {
      std::fprintf(out, " [%s", DecoratorKindToString(node.kind_));
      if (node.state_.has_pending) {
        std::fprintf(out, ", pending %s",
                     StatusToString(node.state_.pending_result));
      }
      if (node.state_.done) {
        std::fprintf(out, ", done");
      }
      std::fprintf(out, "]");
    }
    std::fprintf(out, "\n");
    for (uint16_t i = 0; i < node.children_count_; ++i) {
      DumpNode(out, node.children_[i], depth + 1);
    }
  }

  // --- Data members ---

  NodeT nodes_[MaxNodes];
  uint32_t node_count_;
  NodeId root_;
  ValidateError validate_error_;
  Status last_status_;
  uint32_t tick_count_;
  TraceFn trace_;
};

// ============================================================================
// Factory helpers (one-call wrap-and-bind for the stock decorators)
// ============================================================================

namespace factory {

/** @brief not(child): wrap `child` in a negate decorator. */
template <typename Context, uint32_t MaxNodes>
NodeId MakeNegate(TreeBuilder<Context, MaxNodes>& builder, NodeId child) {
  return builder.AddNegate().Bind(child);
}

/** @brief delay(child): wrap `child` in a delay decorator. */
template <typename Context, uint32_t MaxNodes>
NodeId MakeDelay(TreeBuilder<Context, MaxNodes>& builder, NodeId child) {
  return builder.AddDelay().Bind(child);
}

/** @brief until(child, pred): wrap `child` in an until decorator. */
template <typename Context, uint32_t MaxNodes>
NodeId MakeUntil(TreeBuilder<Context, MaxNodes>& builder, NodeId child,
                 typename TreeBuilder<Context, MaxNodes>::PredicateFn pred) {
  return builder.AddUntil("until", std::move(pred)).Bind(child);
}

/**
 * @brief Wrap every handle of `nodes` in its own delay decorator, in place.
 */
template <typename Context, uint32_t MaxNodes>
void MakeDelayAll(TreeBuilder<Context, MaxNodes>& builder, NodeId* nodes,
                  uint16_t count) {
  for (uint16_t i = 0; i < count; ++i) {
    nodes[i] = MakeDelay(builder, nodes[i]);
  }
}

}  // namespace factory

}  // namespace turnbt

#endif  // TURNBT_BEHAVIOR_TREE_HPP_
