// rsema/sema/constraints/constraint.cpp - Generic constraint values
//
#include "rsema/sema/constraints/constraint.hpp"

#include <fmt/core.h>

#include <functional>
#include <utility>

#include "rsema/sema/types/type_utils.hpp"

namespace rsema
{

Constraint Constraint::type_equality(std::string lhs, std::string rhs)
{
  return Constraint{ConstraintKind::TypeEquality, std::move(lhs), std::move(rhs)};
}

Constraint Constraint::trait_bound(std::string type, std::string trait)
{
  return Constraint{ConstraintKind::TraitBound, std::move(type), std::move(trait)};
}

Constraint Constraint::lifetime_bound(std::string type, std::string_view lifetime)
{
  return Constraint{ConstraintKind::LifetimeBound, std::move(type), normalize_lifetime_name(lifetime)};
}

Constraint Constraint::sized_bound(std::string type)
{
  return Constraint{ConstraintKind::SizedBound, std::move(type), std::string()};
}

std::vector<std::string_view> Constraint::keys() const
{
  switch (kind) {
    case ConstraintKind::TypeEquality:
      if (subject == object) return {subject};
      return {subject, object};
    case ConstraintKind::LifetimeBound:
      return {subject, object};
    case ConstraintKind::TraitBound:
    case ConstraintKind::SizedBound:
      return {subject};
  }
  return {};
}

size_t ConstraintHash::operator()(const Constraint & c) const noexcept
{
  const size_t h1 = std::hash<std::string>{}(c.subject);
  const size_t h2 = std::hash<std::string>{}(c.object);
  size_t seed = static_cast<size_t>(c.kind);
  seed ^= h1 + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  seed ^= h2 + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  return seed;
}

std::string to_string(const Constraint & c)
{
  switch (c.kind) {
    case ConstraintKind::TypeEquality:
      return fmt::format("{} == {}", c.subject, c.object);
    case ConstraintKind::TraitBound:
    case ConstraintKind::LifetimeBound:
      return fmt::format("{}: {}", c.subject, c.object);
    case ConstraintKind::SizedBound:
      return fmt::format("{}: Sized", c.subject);
  }
  return {};
}

}  // namespace rsema
