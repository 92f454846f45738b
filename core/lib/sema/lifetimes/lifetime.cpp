// rsema/sema/lifetimes/lifetime.cpp - Lifetime identities
//
#include "rsema/sema/lifetimes/lifetime.hpp"

#include <fmt/core.h>

namespace rsema
{

std::string Lifetime::display() const
{
  switch (kind) {
    case LifetimeKind::Named:
      return fmt::format("'{}", name);
    case LifetimeKind::Inferred:
      return fmt::format("'l{}", id);
    case LifetimeKind::Static:
      return "'static";
  }
  return {};
}

std::string Lifetime::key() const
{
  if (kind == LifetimeKind::Inferred) {
    return fmt::format("?{}", id);
  }
  return display();
}

std::string lifetime_display_name(std::string_view name)
{
  return fmt::format("'{}", bare_lifetime_name(name));
}

}  // namespace rsema
