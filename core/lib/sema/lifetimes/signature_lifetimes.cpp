// rsema/sema/lifetimes/signature_lifetimes.cpp - Lifetimes of a function signature
//
#include "rsema/sema/lifetimes/signature_lifetimes.hpp"

#include <set>
#include <string_view>
#include <utility>

#include "rsema/basic/casting.hpp"

namespace rsema
{

namespace
{

using VoidResult = Result<void, LifetimeError>;
using LifetimeResult = Result<Lifetime, LifetimeError>;

class SignatureWalker
{
public:
  SignatureWalker(const FnItem & fn, LifetimeContext & ctx) : fn_(fn), ctx_(ctx) {}

  LifetimeResult resolve_explicit(std::string_view name)
  {
    used_.insert(lifetime_display_name(name));
    if (auto lt = ctx_.lookup_named(name)) return LifetimeResult::ok(*lt);
    return LifetimeResult::fail(LifetimeError::unregistered(bare_lifetime_name(name)));
  }

  /// Visit references below an outer reference (or below a non-reference
  /// root when `enclosing` is empty).
  VoidResult walk(const TypeNode * type, const std::optional<Lifetime> & enclosing)
  {
    if (!type) return VoidResult::ok();

    if (const auto * ref = dyn_cast<RefTypeNode>(type)) {
      Lifetime lt;
      if (ref->has_explicit_lifetime()) {
        auto r = resolve_explicit(ref->lifetime);
        if (!r) return VoidResult::fail(std::move(r).error());
        lt = std::move(r).value();
      } else {
        lt = ctx_.fresh_lifetime();
      }
      if (enclosing) {
        if (auto r = ctx_.add_outlives_constraint(lt, *enclosing, k_wellformed_reason); !r) {
          return r;
        }
      }
      return walk(ref->inner, lt);
    }
    if (const auto * vec = dyn_cast<VecTypeNode>(type)) {
      return walk(vec->element, enclosing);
    }
    if (const auto * ptr = dyn_cast<PtrTypeNode>(type)) {
      return walk(ptr->inner, std::nullopt);
    }
    return VoidResult::ok();
  }

  void note_where_clause_uses()
  {
    for (const WhereClause * wc : fn_.where_clauses) {
      if (wc->is_lifetime_param) used_.insert(lifetime_display_name(wc->param));
      for (const WhereBound * b : wc->bounds) {
        if (b->bound_kind == BoundKind::Lifetime) used_.insert(lifetime_display_name(b->name));
      }
    }
  }

  [[nodiscard]] std::vector<std::string> unused() const
  {
    std::vector<std::string> out;
    for (std::string_view lp : fn_.lifetime_params) {
      if (is_static_lifetime_name(lp)) continue;
      std::string display = lifetime_display_name(lp);
      if (used_.count(display) == 0) out.push_back(std::move(display));
    }
    return out;
  }

private:
  const FnItem & fn_;
  LifetimeContext & ctx_;
  std::set<std::string> used_;
};

}  // namespace

Result<SignatureLifetimes, LifetimeError> extract_signature_lifetimes(
  const FnItem & fn, LifetimeContext & ctx)
{
  using R = Result<SignatureLifetimes, LifetimeError>;

  for (std::string_view lp : fn.lifetime_params) {
    ctx.register_named_lifetime(lp);
  }

  SignatureWalker walker(fn, ctx);
  SignatureLifetimes sig;
  sig.params.resize(fn.params.size());

  // Outermost references: explicit lifetimes first
  std::vector<bool> input_is_ref(fn.params.size(), false);
  bool any_elided = false;
  for (size_t i = 0; i < fn.params.size(); ++i) {
    const auto * ref = dyn_cast<RefTypeNode>(fn.params[i]->type);
    if (!ref) continue;
    input_is_ref[i] = true;
    if (!ref->has_explicit_lifetime()) {
      any_elided = true;
      continue;
    }
    auto lt = walker.resolve_explicit(ref->lifetime);
    if (!lt) return R::fail(std::move(lt).error());
    sig.params[i] = std::move(lt).value();
  }

  const auto * ret_ref = dyn_cast<RefTypeNode>(fn.return_type);
  const bool elided_return = ret_ref && !ret_ref->has_explicit_lifetime();
  if (ret_ref && ret_ref->has_explicit_lifetime()) {
    auto lt = walker.resolve_explicit(ret_ref->lifetime);
    if (!lt) return R::fail(std::move(lt).error());
    sig.output = std::move(lt).value();
  }

  if (any_elided || elided_return) {
    ElisionResult elision =
      LifetimeElision::elide_function_lifetimes(input_is_ref, elided_return, ctx, sig.params);

    for (size_t i = 0; i < sig.params.size(); ++i) {
      if (!sig.params[i]) sig.params[i] = elision.inputs[i];
    }
    if (elided_return) {
      // Borrowing from a parameter that names its lifetime
      if (auto source = elision.output_source()) {
        sig.output = sig.params[*source];
      }
    }
    sig.elision = std::move(elision);
  }

  // Nested references
  for (size_t i = 0; i < fn.params.size(); ++i) {
    const TypeNode * type = fn.params[i]->type;
    VoidResult r = input_is_ref[i] ? walker.walk(cast<RefTypeNode>(type)->inner, sig.params[i])
                                   : walker.walk(type, std::nullopt);
    if (!r) return R::fail(std::move(r).error());
  }
  {
    VoidResult r = ret_ref ? walker.walk(ret_ref->inner, sig.output)
                           : walker.walk(fn.return_type, std::nullopt);
    if (!r) return R::fail(std::move(r).error());
  }

  walker.note_where_clause_uses();
  sig.unused_lifetime_params = walker.unused();
  return R::ok(std::move(sig));
}

}  // namespace rsema
