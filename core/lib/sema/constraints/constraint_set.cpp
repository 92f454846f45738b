// rsema/sema/constraints/constraint_set.cpp - Constraint store and propagator
//
#include "rsema/sema/constraints/constraint_set.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <utility>

#include "rsema/basic/name_interner.hpp"
#include "rsema/sema/types/type.hpp"

namespace rsema
{

// ============================================================================
// EqualityAnalysis
// ============================================================================

const std::vector<std::string> * EqualityAnalysis::class_of(std::string_view name) const
{
  for (const auto & members : classes) {
    if (std::find(members.begin(), members.end(), name) != members.end()) {
      return &members;
    }
  }
  return nullptr;
}

bool EqualityAnalysis::same_class(std::string_view a, std::string_view b) const
{
  if (a == b) return true;
  const auto * members = class_of(a);
  return members && std::find(members->begin(), members->end(), b) != members->end();
}

namespace
{

// Equality edges over interned names. `out` keeps the written direction for
// cycle detection; `adjacent` is symmetric and drives class membership.
struct EqualityGraph
{
  NameInterner names;
  std::vector<std::vector<NameId>> out;
  std::vector<std::vector<NameId>> adjacent;

  NameId node(std::string_view name)
  {
    const NameId id = names.intern(name);
    if (id >= out.size()) {
      out.resize(id + 1);
      adjacent.resize(id + 1);
    }
    return id;
  }

  void add_edge(std::string_view lhs, std::string_view rhs)
  {
    const NameId a = node(lhs);
    const NameId b = node(rhs);
    out[a].push_back(b);
    adjacent[a].push_back(b);
    adjacent[b].push_back(a);
  }

  [[nodiscard]] size_t size() const noexcept { return out.size(); }
};

/// Count back-edges to nodes on the current DFS path.
size_t count_cycles(const EqualityGraph & g)
{
  enum : uint8_t { k_unvisited, k_on_path, k_done };

  struct Frame
  {
    NameId node;
    size_t next;
  };

  std::vector<uint8_t> state(g.size(), k_unvisited);
  std::vector<Frame> stack;
  size_t cycles = 0;

  for (NameId root = 0; root < g.size(); ++root) {
    if (state[root] != k_unvisited) continue;

    state[root] = k_on_path;
    stack.push_back(Frame{root, 0});

    while (!stack.empty()) {
      const NameId current = stack.back().node;
      const auto & succs = g.out[current];

      if (stack.back().next == succs.size()) {
        state[current] = k_done;
        stack.pop_back();
        continue;
      }

      const NameId succ = succs[stack.back().next++];
      if (succ == current) continue;  // T == T

      if (state[succ] == k_on_path) {
        ++cycles;
      } else if (state[succ] == k_unvisited) {
        state[succ] = k_on_path;
        stack.push_back(Frame{succ, 0});
      }
    }
  }
  return cycles;
}

/// Shortest equality chain between two members of one class.
std::vector<std::string> equality_path(const EqualityGraph & g, NameId from, NameId to)
{
  constexpr NameId k_none = static_cast<NameId>(-1);
  std::vector<NameId> parent(g.size(), k_none);
  std::deque<NameId> queue{from};
  parent[from] = from;

  while (!queue.empty() && parent[to] == k_none) {
    const NameId current = queue.front();
    queue.pop_front();
    for (NameId next : g.adjacent[current]) {
      if (parent[next] != k_none) continue;
      parent[next] = current;
      queue.push_back(next);
    }
  }

  std::vector<std::string> path;
  for (NameId at = to; parent[at] != k_none; at = parent[at]) {
    path.push_back(g.names.name(at));
    if (at == from) break;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

}  // namespace

// ============================================================================
// ConstraintSet
// ============================================================================

bool ConstraintSet::add_constraint(Constraint c)
{
  if (seen_.count(c) != 0) {
    return false;
  }
  seen_.insert(c);
  items_.push_back(std::move(c));
  if (resolved_) {
    index(items_.back());
  }
  return true;
}

void ConstraintSet::index(const Constraint & c)
{
  for (std::string_view key : c.keys()) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      it = index_.emplace(std::string(key), std::vector<const Constraint *>{}).first;
    }
    it->second.push_back(&c);
  }
}

void ConstraintSet::resolve()
{
  index_.clear();
  for (const auto & c : items_) {
    index(c);
  }
  resolved_ = true;
}

std::vector<const Constraint *> ConstraintSet::get_constraints(std::string_view key) const
{
  auto it = index_.find(key);
  if (it == index_.end()) return {};
  return it->second;
}

Result<EqualityAnalysis, ConstraintError> ConstraintSet::check_satisfiable() const
{
  using R = Result<EqualityAnalysis, ConstraintError>;

  EqualityGraph graph;
  for (const auto & c : items_) {
    if (c.kind == ConstraintKind::TypeEquality) {
      graph.add_edge(c.subject, c.object);
    }
  }

  EqualityAnalysis analysis;
  std::vector<bool> assigned(graph.size(), false);

  for (NameId root = 0; root < graph.size(); ++root) {
    if (assigned[root]) continue;

    // Collect the class in first-seen order
    std::vector<NameId> members{root};
    assigned[root] = true;
    for (size_t i = 0; i < members.size(); ++i) {
      for (NameId next : graph.adjacent[members[i]]) {
        if (assigned[next]) continue;
        assigned[next] = true;
        members.push_back(next);
      }
    }
    std::sort(members.begin(), members.end());

    std::optional<NameId> concrete;
    for (NameId m : members) {
      const auto kind = lookup_primitive_kind(graph.names.name(m));
      if (!kind) continue;
      if (!concrete) {
        concrete = m;
        continue;
      }
      if (*lookup_primitive_kind(graph.names.name(*concrete)) != *kind) {
        return R::fail(ConstraintError::conflicting_equality(
          graph.names.name(*concrete), graph.names.name(m), equality_path(graph, *concrete, m)));
      }
    }

    if (members.size() < 2) continue;
    std::vector<std::string> names;
    names.reserve(members.size());
    for (NameId m : members) {
      names.push_back(graph.names.name(m));
    }
    analysis.classes.push_back(std::move(names));
  }

  analysis.cycle_count = count_cycles(graph);
  return R::ok(std::move(analysis));
}

Result<size_t, ConstraintError> ConstraintSet::propagate_constraints()
{
  using R = Result<size_t, ConstraintError>;

  if (!resolved_) {
    resolve();
  }

  std::deque<const Constraint *> queue;
  for (const auto & c : items_) {
    queue.push_back(&c);
  }

  size_t derived = 0;
  size_t steps = 0;
  std::vector<Constraint> produced;

  while (!queue.empty()) {
    if (++steps > max_propagation_steps_) {
      return R::fail(ConstraintError::propagation_limit(max_propagation_steps_));
    }

    const Constraint & c = *queue.front();
    queue.pop_front();
    produced.clear();

    if (c.kind == ConstraintKind::TraitBound) {
      for (const Constraint * eq : get_constraints(c.subject)) {
        if (eq->kind == ConstraintKind::TypeEquality && eq->subject == c.subject) {
          produced.push_back(Constraint::trait_bound(eq->object, c.object));
        }
      }
    } else if (c.kind == ConstraintKind::TypeEquality && c.subject != c.object) {
      for (const Constraint * bound : get_constraints(c.subject)) {
        if (bound->kind == ConstraintKind::TraitBound && bound->subject == c.subject) {
          produced.push_back(Constraint::trait_bound(c.object, bound->object));
        }
      }
    }

    for (auto & p : produced) {
      if (add_constraint(std::move(p))) {
        ++derived;
        queue.push_back(&items_.back());
      }
    }
  }

  return R::ok(derived);
}

void ConstraintSet::merge(const ConstraintSet & other)
{
  for (const auto & c : other.items_) {
    add_constraint(c);
  }
}

std::vector<std::string> ConstraintSet::trait_bounds_of(std::string_view type) const
{
  std::vector<std::string> traits;
  for (const auto & c : items_) {
    if (c.kind == ConstraintKind::TraitBound && c.subject == type) {
      traits.push_back(c.object);
    }
  }
  std::sort(traits.begin(), traits.end());
  return traits;
}

bool ConstraintSet::has_trait_bound(std::string_view type, std::string_view trait) const
{
  return std::any_of(items_.begin(), items_.end(), [&](const Constraint & c) {
    return c.kind == ConstraintKind::TraitBound && c.subject == type && c.object == trait;
  });
}

void ConstraintSet::clear()
{
  items_.clear();
  seen_.clear();
  index_.clear();
  resolved_ = false;
}

}  // namespace rsema
