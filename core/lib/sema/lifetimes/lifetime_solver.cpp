// rsema/sema/lifetimes/lifetime_solver.cpp - Outlives closure and cycle detection
//
#include "rsema/sema/lifetimes/lifetime_solver.hpp"

#include <algorithm>
#include <deque>

namespace rsema
{

LifetimeSolver::LifetimeSolver(const LifetimeContext & ctx, size_t max_closure_iterations)
: max_iterations_(max_closure_iterations)
{
  static_id_ = node(Lifetime::static_lifetime());
  for (const auto & lt : ctx.registered()) {
    node(lt);
  }

  std::vector<std::pair<NameId, NameId>> pending;
  for (const auto & c : ctx.constraints()) {
    const NameId longer = node(c.longer);
    const NameId shorter = node(c.shorter);
    if (longer == shorter) continue;  // 'a: 'a
    pending.emplace_back(longer, shorter);
    reasons_.emplace(std::make_pair(longer, shorter), c.reason);
  }

  edges_.resize(names_.size());
  for (const auto & [longer, shorter] : pending) {
    edges_[longer].push_back(shorter);
  }
}

NameId LifetimeSolver::node(const Lifetime & lt)
{
  const NameId id = names_.intern(lt.key());
  if (id == displays_.size()) {
    displays_.push_back(lt.display());
  }
  return id;
}

// ============================================================================
// Closure
// ============================================================================

Result<std::vector<std::vector<bool>>, LifetimeError> LifetimeSolver::close(
  const std::vector<std::vector<NameId>> & adjacency) const
{
  using R = Result<std::vector<std::vector<bool>>, LifetimeError>;

  const size_t n = adjacency.size();
  std::vector<std::vector<bool>> reach(n, std::vector<bool>(n, false));
  for (NameId from = 0; from < n; ++from) {
    for (NameId to : adjacency[from]) {
      reach[from][to] = true;
    }
  }

  std::deque<NameId> worklist;
  std::vector<bool> queued(n, true);
  for (NameId id = 0; id < n; ++id) {
    worklist.push_back(id);
  }

  size_t iterations = 0;
  while (!worklist.empty()) {
    if (++iterations > max_iterations_) {
      return R::fail(LifetimeError::closure_limit(max_iterations_));
    }

    const NameId from = worklist.front();
    worklist.pop_front();
    queued[from] = false;

    bool changed = false;
    for (NameId via = 0; via < n; ++via) {
      if (!reach[from][via] || via == from) continue;
      for (NameId next = 0; next < n; ++next) {
        if (reach[via][next] && !reach[from][next]) {
          reach[from][next] = true;
          changed = true;
        }
      }
    }
    if (!changed) continue;

    // Everything reaching `from` may now reach more
    for (NameId pred = 0; pred < n; ++pred) {
      if ((reach[pred][from] || pred == from) && !queued[pred]) {
        queued[pred] = true;
        worklist.push_back(pred);
      }
    }
  }

  return R::ok(std::move(reach));
}

Result<void, LifetimeError> LifetimeSolver::solve()
{
  if (solved_) return Result<void, LifetimeError>::ok();

  std::vector<std::vector<NameId>> with_static = edges_;
  for (NameId id = 0; id < names_.size(); ++id) {
    if (id != static_id_) with_static[static_id_].push_back(id);
  }

  std::vector<std::vector<NameId>> without_static = edges_;
  without_static[static_id_].clear();

  auto full = close(with_static);
  if (!full) return Result<void, LifetimeError>::fail(std::move(full).error());
  auto cyc = close(without_static);
  if (!cyc) return Result<void, LifetimeError>::fail(std::move(cyc).error());

  closure_ = std::move(full).value();
  cyclic_ = std::move(cyc).value();
  solved_ = true;
  return Result<void, LifetimeError>::ok();
}

// ============================================================================
// Violations
// ============================================================================

LifetimeViolation LifetimeSolver::cycle_through(NameId start) const
{
  constexpr NameId k_none = static_cast<NameId>(-1);
  const size_t n = edges_.size();

  // parent[] over the walk start -> ... -> start; the start node itself is
  // only marked once it is reached again
  std::vector<NameId> parent(n, k_none);
  std::deque<NameId> queue;
  for (NameId next : edges_[start]) {
    if (parent[next] == k_none) {
      parent[next] = start;
      queue.push_back(next);
    }
  }

  while (!queue.empty() && parent[start] == k_none) {
    const NameId current = queue.front();
    queue.pop_front();
    if (current == static_id_) continue;
    for (NameId next : edges_[current]) {
      if (parent[next] != k_none) continue;
      parent[next] = current;
      queue.push_back(next);
    }
  }

  std::vector<NameId> ids{start};
  for (NameId at = parent[start]; at != start && at != k_none; at = parent[at]) {
    ids.push_back(at);
  }
  ids.push_back(start);
  std::reverse(ids.begin(), ids.end());

  LifetimeViolation v;
  v.lifetime = displays_.at(start);
  for (size_t i = 0; i < ids.size(); ++i) {
    v.path.push_back(displays_.at(ids[i]));
    if (i + 1 < ids.size()) {
      auto it = reasons_.find(std::make_pair(ids[i], ids[i + 1]));
      v.reasons.push_back(it == reasons_.end() ? std::string() : it->second);
    }
  }
  return v;
}

Result<std::vector<LifetimeViolation>, LifetimeError> LifetimeSolver::violations()
{
  using R = Result<std::vector<LifetimeViolation>, LifetimeError>;

  if (auto r = solve(); !r) return R::fail(std::move(r).error());

  std::vector<LifetimeViolation> out;
  for (NameId id = 0; id < names_.size(); ++id) {
    if (id == static_id_ || !cyclic_[id][id]) continue;
    out.push_back(cycle_through(id));
  }
  return R::ok(std::move(out));
}

Result<void, LifetimeError> LifetimeSolver::is_satisfiable()
{
  auto found = violations();
  if (!found) return Result<void, LifetimeError>::fail(std::move(found).error());
  if (found.value().empty()) return Result<void, LifetimeError>::ok();

  LifetimeViolation & first = found.value().front();
  return Result<void, LifetimeError>::fail(LifetimeError::cyclic(
    std::move(first.lifetime), std::move(first.path), std::move(first.reasons)));
}

// ============================================================================
// Queries
// ============================================================================

std::string LifetimeSolver::display_key(std::string_view name) const
{
  if (is_static_lifetime_name(name)) return Lifetime::static_lifetime().display();
  return lifetime_display_name(name);
}

Result<std::set<std::string>, LifetimeError> LifetimeSolver::get_outlives(std::string_view name)
{
  using R = Result<std::set<std::string>, LifetimeError>;

  if (auto r = solve(); !r) return R::fail(std::move(r).error());

  NameId id = 0;
  if (!names_.find(display_key(name), id)) {
    return R::fail(LifetimeError::unregistered(bare_lifetime_name(name)));
  }

  std::set<std::string> out;
  for (NameId other = 0; other < names_.size(); ++other) {
    if (other != id && closure_[id][other]) out.insert(displays_.at(other));
  }
  return R::ok(std::move(out));
}

Result<std::set<std::string>, LifetimeError> LifetimeSolver::get_outlived_by(std::string_view name)
{
  using R = Result<std::set<std::string>, LifetimeError>;

  if (auto r = solve(); !r) return R::fail(std::move(r).error());

  NameId id = 0;
  if (!names_.find(display_key(name), id)) {
    return R::fail(LifetimeError::unregistered(bare_lifetime_name(name)));
  }

  std::set<std::string> out;
  for (NameId other = 0; other < names_.size(); ++other) {
    if (other != id && closure_[other][id]) out.insert(displays_.at(other));
  }
  return R::ok(std::move(out));
}

}  // namespace rsema
