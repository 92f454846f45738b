// rsema/driver/analyzer.cpp - Analysis driver implementation
//
#include "rsema/driver/analyzer.hpp"

#include <fmt/core.h>

#include <map>
#include <utility>

#include "rsema/basic/casting.hpp"
#include "rsema/driver/error_reporting.hpp"
#include "rsema/sema/binding/associated_types.hpp"
#include "rsema/sema/binding/where_clause.hpp"
#include "rsema/sema/constraints/constraint_set.hpp"
#include "rsema/sema/lifetimes/lifetime_context.hpp"
#include "rsema/sema/lifetimes/lifetime_solver.hpp"
#include "rsema/sema/lifetimes/signature_lifetimes.hpp"
#include "rsema/sema/types/type_lowering.hpp"
#include "rsema/sema/types/type_utils.hpp"

namespace rsema
{

AnalysisOptions AnalysisOptions::from_config(const AnalysisConfig & config)
{
  AnalysisOptions o;
  o.max_propagation_steps = config.max_propagation_steps;
  o.max_closure_iterations = config.max_closure_iterations;
  o.max_bounds_per_param = config.max_bounds_per_param;
  o.reject_ambiguous_elision = config.reject_ambiguous_elision;
  o.warn_unused_lifetimes = config.warn_unused_lifetimes;
  return o;
}

const ItemReport * AnalysisResult::find(std::string_view name) const
{
  for (const auto & item : items) {
    if (item.name == name) return &item;
  }
  return nullptr;
}

size_t AnalysisResult::failed_count() const
{
  size_t n = 0;
  for (const auto & item : items) {
    if (!item.success) ++n;
  }
  return n;
}

namespace
{

/// Pipeline state shared by all items of one program.
class ProgramAnalyzer
{
public:
  ProgramAnalyzer(TypeContext & types, const AnalysisOptions & options, DiagnosticBag & diags)
  : types_(types), options_(options), diags_(diags), lowering_(types, &assoc_)
  {
  }

  AnalysisResult run(const Program & program)
  {
    AnalysisResult result;

    std::vector<const FnItem *> functions;
    for (const Item * item : program.items) {
      if (const auto * impl = dyn_cast<ImplItem>(item)) {
        bind_impl(*impl);
        for (const FnItem * method : impl->methods) {
          functions.push_back(method);
        }
      } else if (const auto * fn = dyn_cast<FnItem>(item)) {
        functions.push_back(fn);
      }
    }

    for (const FnItem * fn : functions) {
      collect_signature(*fn);
    }

    for (const FnItem * fn : functions) {
      result.items.push_back(analyze_item(*fn));
    }

    result.success = !diags_.has_errors();
    return result;
  }

private:
  // ===========================================================================
  // Program-level passes
  // ===========================================================================

  void bind_impl(const ImplItem & impl)
  {
    const std::string location = fmt::format("impl {}", impl.name);

    auto self_type = lowering_.lower(impl.self_type);
    if (!self_type) {
      diags_.add(to_diagnostic(self_type.error(), location));
      return;
    }
    if (!impl.trait_name.empty()) {
      assoc_.register_impl(impl.name, impl.trait_name, to_string(self_type.value()));
    }

    for (const AssocBinding * binding : impl.assoc_bindings) {
      const std::string at = fmt::format("{}, type {}", location, binding->name);
      auto type = lowering_.lower(binding->type);
      if (!type) {
        diags_.add(to_diagnostic(type.error(), at));
        continue;
      }
      if (auto r = assoc_.bind(impl.name, binding->name, type.value()); !r) {
        diags_.add(to_diagnostic(r.error(), at));
      }
    }
  }

  void collect_signature(const FnItem & fn)
  {
    const std::string name = fn.qualified_name();
    const std::string location = fmt::format("fn {}", name);

    FunctionSignature sig;
    sig.name = name;
    for (std::string_view g : fn.generic_params) {
      sig.generic_params.emplace_back(g);
    }

    for (size_t i = 0; i < fn.params.size(); ++i) {
      auto t = lowering_.lower(fn.params[i]->type);
      if (!t) {
        signature_errors_.emplace(&fn, to_diagnostic(
                                         t.error(), fmt::format("{}, parameter `{}`", location,
                                                                fn.params[i]->name)));
        return;
      }
      sig.params.push_back(t.value());
    }

    auto ret = lowering_.lower(fn.return_type);
    if (!ret) {
      signature_errors_.emplace(&fn, to_diagnostic(ret.error(), fmt::format("{}, return type", location)));
      return;
    }
    sig.return_type = ret.value();

    signatures_.emplace(&fn, sig);
  }

  // ===========================================================================
  // Per-item pipeline
  // ===========================================================================

  ItemReport analyze_item(const FnItem & fn)
  {
    ItemReport report;
    report.name = fn.qualified_name();
    location_ = fmt::format("fn {}", report.name);

    if (auto it = signature_errors_.find(&fn); it != signature_errors_.end()) {
      diags_.add(it->second);
      return report;
    }

    LifetimeScope scope(lifetimes_);

    if (!solve_generics(fn, report)) return report;
    if (!solve_lifetimes(fn, report)) return report;
    if (!solve_body(fn, report)) return report;

    report.success = true;
    return report;
  }

  bool solve_generics(const FnItem & fn, ItemReport & report)
  {
    ConstraintSet constraints(options_.max_propagation_steps);

    for (std::string_view lp : fn.lifetime_params) {
      lifetimes_.register_named_lifetime(lp);
    }

    WhereClauseLowering where(constraints, lifetimes_, lowering_, options_.max_bounds_per_param);
    if (auto r = where.lower_all(fn.where_clauses); !r) {
      diags_.add(to_diagnostic(r.error(), fmt::format("{}, where clause", location_)));
      return false;
    }

    for (const EqualityFact & eq : fn.equalities) {
      constraints.add_constraint(Constraint::type_equality(std::string(eq.lhs), std::string(eq.rhs)));
    }

    auto derived = constraints.propagate_constraints();
    if (!derived) {
      diags_.add(to_diagnostic(derived.error(), location_));
      return false;
    }
    report.derived_constraints = derived.value();

    auto analysis = constraints.check_satisfiable();
    if (!analysis) {
      diags_.add(to_diagnostic(analysis.error(), location_));
      return false;
    }
    report.equality_cycles = analysis.value().cycle_count;

    for (const Constraint & c : constraints.constraints()) {
      report.constraints.push_back(to_string(c));
    }
    return true;
  }

  bool solve_lifetimes(const FnItem & fn, ItemReport & report)
  {
    auto sig = extract_signature_lifetimes(fn, lifetimes_);
    if (!sig) {
      diags_.add(to_diagnostic(sig.error(), fmt::format("{}, signature", location_)));
      return false;
    }

    if (const auto & elision = sig.value().elision) {
      report.elision_rule = elision->rule;
      if (auto r = LifetimeElision::check_elision(*elision, report.name); !r) {
        Diagnostic d = to_diagnostic(r.error(), fmt::format("{}, return type", location_));
        if (!options_.reject_ambiguous_elision) {
          d.severity = Severity::Warning;
          d.code = codes::k_ambiguous_elision_warning;
          diags_.add(std::move(d));
        } else {
          diags_.add(std::move(d));
          return false;
        }
      }
    }

    if (options_.warn_unused_lifetimes) {
      for (const std::string & unused : sig.value().unused_lifetime_params) {
        diags_.report_warning(location_, fmt::format("lifetime parameter `{}` is never used", unused),
                              "declared here")
          .with_code(codes::k_unused_lifetime)
          .with_help(fmt::format("remove `{}`", unused));
      }
    }

    for (const OutlivesFact & fact : fn.outlives) {
      std::string reason = fact.reason.empty() ? std::string("upstream constraint")
                                               : std::string(fact.reason);
      if (auto r = lifetimes_.add_outlives_constraint(fact.longer, fact.shorter, std::move(reason));
          !r) {
        diags_.add(to_diagnostic(r.error(), location_));
        return false;
      }
    }

    LifetimeSolver solver(lifetimes_, options_.max_closure_iterations);
    if (auto r = solver.is_satisfiable(); !r) {
      diags_.add(to_diagnostic(r.error(), location_));
      return false;
    }

    for (const OutlivesConstraint & c : lifetimes_.constraints()) {
      report.outlives.push_back(fmt::format("{}: {}", c.longer.display(), c.shorter.display()));
    }
    return true;
  }

  bool solve_body(const FnItem & fn, ItemReport & report)
  {
    const FunctionSignature & sig = signatures_.at(&fn);

    TypeConstraintSolver solver(types_);
    for (const auto & [fn_ptr, other] : signatures_) {
      solver.register_function(other);
    }
    for (size_t i = 0; i < fn.params.size(); ++i) {
      solver.register_variable(fn.params[i]->name, sig.params[i]);
    }

    std::vector<const Type *> statement_types;
    for (size_t i = 0; i < fn.body.size(); ++i) {
      const std::string at = fmt::format("{}, statement {}", location_, i + 1);

      if (const auto * let = dyn_cast<LetStmt>(fn.body[i])) {
        const Type * annotation = nullptr;
        if (let->annotation) {
          auto lowered = lowering_.lower(let->annotation);
          if (!lowered) {
            diags_.add(to_diagnostic(lowered.error(), at));
            return false;
          }
          annotation = lowered.value();
        }
        if (auto r = solver.solve_let(let->name, *let->init, annotation); !r) {
          diags_.add(to_diagnostic(r.error(), at));
          return false;
        }
        continue;
      }

      const auto * stmt = cast<ExprStmt>(fn.body[i]);
      auto r = solver.solve_expr(*stmt->expr);
      if (!r) {
        diags_.add(to_diagnostic(r.error(), at));
        return false;
      }
      statement_types.push_back(r.value());
    }

    const Type * tail = types_.unit_type();
    if (fn.tail) {
      auto r = solver.solve_expr(*fn.tail);
      if (!r) {
        diags_.add(to_diagnostic(r.error(), fmt::format("{}, tail expression", location_)));
        return false;
      }
      tail = r.value();
    }

    if (auto r = solver.expect_type(sig.return_type, tail); !r) {
      diags_.add(to_diagnostic(r.error(), fmt::format("{}, return value", location_)));
      return false;
    }

    for (const Type * t : statement_types) {
      report.statement_types.push_back(solver.apply(t));
    }
    report.tail_type = fn.tail ? solver.apply(tail) : nullptr;
    report.solution = solver.get_solution();
    return true;
  }

  TypeContext & types_;
  const AnalysisOptions & options_;
  DiagnosticBag & diags_;

  AssociatedTypeResolver assoc_;
  TypeLowering lowering_;
  LifetimeContext lifetimes_;

  std::map<const FnItem *, FunctionSignature> signatures_;
  std::map<const FnItem *, Diagnostic> signature_errors_;
  std::string location_;
};

}  // namespace

AnalysisResult Analyzer::analyze(
  const Program & program, TypeContext & types, const AnalysisOptions & options,
  DiagnosticBag & diags)
{
  ProgramAnalyzer analyzer(types, options, diags);
  return analyzer.run(program);
}

}  // namespace rsema
