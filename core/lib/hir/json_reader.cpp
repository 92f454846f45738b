// rsema/hir/json_reader.cpp - Build HIR from its JSON interchange form
//
#include "rsema/hir/json_reader.hpp"

#include <fmt/core.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>
#include <vector>

namespace rsema
{

namespace
{

using json = nlohmann::json;

template <typename T>
using ReadResult = Result<T, std::string>;

/**
 * Recursive reader. Every failure carries the JSON path of the offending
 * value, e.g. `items[2].params[0].type.inner: unknown type kind 'tuple'`.
 */
class JsonHirReader
{
public:
  explicit JsonHirReader(HirContext & ctx) : ctx_(ctx) {}

  ReadResult<Program *> read_program(const json & root)
  {
    using R = ReadResult<Program *>;

    if (!root.is_object()) return R::fail(error_at("", "program must be an object"));
    const auto it = root.find("items");
    if (it == root.end() || !it->is_array()) {
      return R::fail(error_at("items", "expected an array of items"));
    }

    std::vector<Item *> items;
    for (size_t i = 0; i < it->size(); ++i) {
      auto item = read_item((*it)[i], fmt::format("items[{}]", i));
      if (!item) return R::fail(std::move(item).error());
      items.push_back(item.value());
    }
    return R::ok(ctx_.create<Program>(ctx_.copy_to_arena(items)));
  }

private:
  // ===========================================================================
  // Helpers
  // ===========================================================================

  static std::string error_at(const std::string & path, std::string_view message)
  {
    if (path.empty()) return std::string(message);
    return fmt::format("{}: {}", path, message);
  }

  static std::string child(const std::string & path, std::string_view key)
  {
    return path.empty() ? std::string(key) : fmt::format("{}.{}", path, key);
  }

  /// Required string member, interned.
  ReadResult<std::string_view> string_field(
    const json & obj, std::string_view key, const std::string & path)
  {
    using R = ReadResult<std::string_view>;
    const auto it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string()) {
      return R::fail(error_at(child(path, key), "expected a string"));
    }
    return R::ok(ctx_.intern(it->get<std::string>()));
  }

  /// Optional string member, interned; empty when absent.
  ReadResult<std::string_view> optional_string_field(
    const json & obj, std::string_view key, const std::string & path)
  {
    if (obj.find(std::string(key)) == obj.end()) {
      return ReadResult<std::string_view>::ok(std::string_view());
    }
    return string_field(obj, key, path);
  }

  static bool bool_field(const json & obj, std::string_view key)
  {
    const auto it = obj.find(std::string(key));
    return it != obj.end() && it->is_boolean() && it->get<bool>();
  }

  /// Optional array of interned strings.
  ReadResult<gsl::span<std::string_view>> string_list(
    const json & obj, std::string_view key, const std::string & path)
  {
    using R = ReadResult<gsl::span<std::string_view>>;
    const auto it = obj.find(std::string(key));
    if (it == obj.end()) return R::ok({});
    if (!it->is_array()) return R::fail(error_at(child(path, key), "expected an array"));

    std::vector<std::string_view> out;
    for (size_t i = 0; i < it->size(); ++i) {
      const json & v = (*it)[i];
      if (!v.is_string()) {
        return R::fail(error_at(fmt::format("{}[{}]", child(path, key), i), "expected a string"));
      }
      out.push_back(ctx_.intern(v.get<std::string>()));
    }
    return R::ok(ctx_.copy_to_arena(out));
  }

  /// Apply `read` to each element of an optional array member.
  template <typename T, typename Fn>
  ReadResult<gsl::span<T>> read_list(
    const json & obj, std::string_view key, const std::string & path, Fn && read)
  {
    using R = ReadResult<gsl::span<T>>;
    const auto it = obj.find(std::string(key));
    if (it == obj.end()) return R::ok({});
    if (!it->is_array()) return R::fail(error_at(child(path, key), "expected an array"));

    std::vector<T> out;
    for (size_t i = 0; i < it->size(); ++i) {
      auto r = read((*it)[i], fmt::format("{}[{}]", child(path, key), i));
      if (!r) return R::fail(std::move(r).error());
      out.push_back(std::move(r).value());
    }
    return R::ok(ctx_.copy_to_arena(out));
  }

  // ===========================================================================
  // Types
  // ===========================================================================

  ReadResult<TypeNode *> read_type(const json & j, const std::string & path)
  {
    using R = ReadResult<TypeNode *>;

    if (j.is_string()) {
      return R::ok(ctx_.create<NamedTypeNode>(ctx_.intern(j.get<std::string>())));
    }
    if (!j.is_object()) return R::fail(error_at(path, "expected a type"));

    auto kind = string_field(j, "kind", path);
    if (!kind) return R::fail(std::move(kind).error());
    const std::string_view k = kind.value();

    if (k == "named" || k == "primitive") {
      auto name = string_field(j, "name", path);
      if (!name) return R::fail(std::move(name).error());
      return R::ok(ctx_.create<NamedTypeNode>(name.value()));
    }
    if (k == "vec") {
      auto element = read_type_field(j, "element", path);
      if (!element) return element;
      return R::ok(ctx_.create<VecTypeNode>(element.value()));
    }
    if (k == "ref") {
      auto lifetime = optional_string_field(j, "lifetime", path);
      if (!lifetime) return R::fail(std::move(lifetime).error());
      auto inner = read_type_field(j, "inner", path);
      if (!inner) return inner;
      return R::ok(ctx_.create<RefTypeNode>(lifetime.value(), bool_field(j, "mut"), inner.value()));
    }
    if (k == "ptr") {
      auto inner = read_type_field(j, "inner", path);
      if (!inner) return inner;
      return R::ok(ctx_.create<PtrTypeNode>(bool_field(j, "mut"), inner.value()));
    }
    if (k == "dyn") {
      auto trait = string_field(j, "trait", path);
      if (!trait) return R::fail(std::move(trait).error());
      return R::ok(ctx_.create<DynTypeNode>(trait.value()));
    }
    if (k == "assoc") {
      auto impl = string_field(j, "impl", path);
      if (!impl) return R::fail(std::move(impl).error());
      auto name = string_field(j, "name", path);
      if (!name) return R::fail(std::move(name).error());
      return R::ok(ctx_.create<AssocTypeNode>(impl.value(), name.value()));
    }
    return R::fail(error_at(child(path, "kind"), fmt::format("unknown type kind '{}'", k)));
  }

  ReadResult<TypeNode *> read_type_field(
    const json & obj, std::string_view key, const std::string & path)
  {
    const auto it = obj.find(std::string(key));
    if (it == obj.end()) {
      return ReadResult<TypeNode *>::fail(error_at(child(path, key), "missing type"));
    }
    return read_type(*it, child(path, key));
  }

  /// Optional type member; nullptr when absent or null.
  ReadResult<TypeNode *> optional_type_field(
    const json & obj, std::string_view key, const std::string & path)
  {
    const auto it = obj.find(std::string(key));
    if (it == obj.end() || it->is_null()) return ReadResult<TypeNode *>::ok(nullptr);
    return read_type(*it, child(path, key));
  }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  ReadResult<Expr *> read_expr(const json & j, const std::string & path)
  {
    using R = ReadResult<Expr *>;

    if (j.is_number_integer()) return R::ok(ctx_.create<IntLiteralExpr>(j.get<int64_t>()));
    if (j.is_number_float()) return R::ok(ctx_.create<FloatLiteralExpr>(j.get<double>()));
    if (j.is_boolean()) return R::ok(ctx_.create<BoolLiteralExpr>(j.get<bool>()));
    if (!j.is_object()) return R::fail(error_at(path, "expected an expression"));

    auto kind = string_field(j, "kind", path);
    if (!kind) return R::fail(std::move(kind).error());
    const std::string_view k = kind.value();

    if (k == "int" || k == "float" || k == "bool") {
      const auto v = j.find("value");
      const bool ok = v != j.end() && (k == "int"     ? v->is_number_integer()
                                       : k == "float" ? v->is_number()
                                                      : v->is_boolean());
      if (!ok) return R::fail(error_at(child(path, "value"), fmt::format("expected a {} value", k)));
      if (k == "int") return R::ok(ctx_.create<IntLiteralExpr>(v->get<int64_t>()));
      if (k == "float") return R::ok(ctx_.create<FloatLiteralExpr>(v->get<double>()));
      return R::ok(ctx_.create<BoolLiteralExpr>(v->get<bool>()));
    }
    if (k == "string") {
      auto value = string_field(j, "value", path);
      if (!value) return R::fail(std::move(value).error());
      return R::ok(ctx_.create<StringLiteralExpr>(value.value()));
    }
    if (k == "var") {
      auto name = string_field(j, "name", path);
      if (!name) return R::fail(std::move(name).error());
      return R::ok(ctx_.create<VarRefExpr>(name.value()));
    }
    if (k == "binary") {
      auto op_text = string_field(j, "op", path);
      if (!op_text) return R::fail(std::move(op_text).error());
      const auto op = parse_binary_op(op_text.value());
      if (!op) {
        return R::fail(
          error_at(child(path, "op"), fmt::format("unknown binary operator '{}'", op_text.value())));
      }
      auto lhs = read_expr_field(j, "lhs", path);
      if (!lhs) return lhs;
      auto rhs = read_expr_field(j, "rhs", path);
      if (!rhs) return rhs;
      return R::ok(ctx_.create<BinaryExpr>(lhs.value(), *op, rhs.value()));
    }
    if (k == "unary") {
      auto op_text = string_field(j, "op", path);
      if (!op_text) return R::fail(std::move(op_text).error());
      const auto op = parse_unary_op(op_text.value());
      if (!op) {
        return R::fail(
          error_at(child(path, "op"), fmt::format("unknown unary operator '{}'", op_text.value())));
      }
      auto operand = read_expr_field(j, "operand", path);
      if (!operand) return operand;
      return R::ok(ctx_.create<UnaryExpr>(*op, operand.value()));
    }
    if (k == "call") {
      auto callee = string_field(j, "callee", path);
      if (!callee) return R::fail(std::move(callee).error());
      auto args = read_list<Expr *>(
        j, "args", path, [this](const json & a, const std::string & p) { return read_expr(a, p); });
      if (!args) return R::fail(std::move(args).error());
      return R::ok(ctx_.create<CallExpr>(callee.value(), args.value()));
    }
    return R::fail(error_at(child(path, "kind"), fmt::format("unknown expression kind '{}'", k)));
  }

  ReadResult<Expr *> read_expr_field(
    const json & obj, std::string_view key, const std::string & path)
  {
    const auto it = obj.find(std::string(key));
    if (it == obj.end()) {
      return ReadResult<Expr *>::fail(error_at(child(path, key), "missing expression"));
    }
    return read_expr(*it, child(path, key));
  }

  ReadResult<Stmt *> read_stmt(const json & j, const std::string & path)
  {
    using R = ReadResult<Stmt *>;

    if (!j.is_object()) return R::fail(error_at(path, "expected a statement"));

    if (j.find("let") != j.end()) {
      auto name = string_field(j, "let", path);
      if (!name) return R::fail(std::move(name).error());
      auto annotation = optional_type_field(j, "type", path);
      if (!annotation) return R::fail(std::move(annotation).error());
      auto init = read_expr_field(j, "init", path);
      if (!init) return R::fail(std::move(init).error());
      return R::ok(ctx_.create<LetStmt>(name.value(), annotation.value(), init.value()));
    }
    if (j.find("expr") != j.end()) {
      auto e = read_expr_field(j, "expr", path);
      if (!e) return R::fail(std::move(e).error());
      return R::ok(ctx_.create<ExprStmt>(e.value()));
    }
    return R::fail(error_at(path, "statement must have a 'let' or 'expr' member"));
  }

  // ===========================================================================
  // Where Clauses
  // ===========================================================================

  ReadResult<AssocEquality> read_assoc_equality(const json & j, const std::string & path)
  {
    using R = ReadResult<AssocEquality>;
    if (!j.is_object()) return R::fail(error_at(path, "expected an associated type equality"));
    auto name = string_field(j, "name", path);
    if (!name) return R::fail(std::move(name).error());
    auto type = read_type_field(j, "type", path);
    if (!type) return R::fail(std::move(type).error());
    return R::ok(AssocEquality{name.value(), type.value()});
  }

  ReadResult<WhereBound *> read_bound(
    const json & j, const std::string & path, bool on_lifetime_param)
  {
    using R = ReadResult<WhereBound *>;
    if (!j.is_object()) return R::fail(error_at(path, "expected a bound"));

    if (j.find("lifetime") != j.end()) {
      auto name = string_field(j, "lifetime", path);
      if (!name) return R::fail(std::move(name).error());
      return R::ok(ctx_.create<WhereBound>(BoundKind::Lifetime, name.value()));
    }
    if (on_lifetime_param) {
      return R::fail(error_at(path, "a lifetime parameter can only be bounded by lifetimes"));
    }

    auto trait = string_field(j, "trait", path);
    if (!trait) return R::fail(std::move(trait).error());
    auto eqs = read_list<AssocEquality>(
      j, "assoc", path,
      [this](const json & a, const std::string & p) { return read_assoc_equality(a, p); });
    if (!eqs) return R::fail(std::move(eqs).error());
    return R::ok(ctx_.create<WhereBound>(BoundKind::Trait, trait.value(), eqs.value()));
  }

  ReadResult<WhereClause *> read_where(const json & j, const std::string & path)
  {
    using R = ReadResult<WhereClause *>;
    if (!j.is_object()) return R::fail(error_at(path, "expected a where clause"));

    const bool lifetime_param = j.find("lifetime_param") != j.end();
    auto param = string_field(j, lifetime_param ? "lifetime_param" : "param", path);
    if (!param) return R::fail(std::move(param).error());

    auto bounds = read_list<WhereBound *>(
      j, "bounds", path, [this, lifetime_param](const json & b, const std::string & p) {
        return read_bound(b, p, lifetime_param);
      });
    if (!bounds) return R::fail(std::move(bounds).error());
    return R::ok(ctx_.create<WhereClause>(param.value(), lifetime_param, bounds.value()));
  }

  // ===========================================================================
  // Items
  // ===========================================================================

  ReadResult<Item *> read_item(const json & j, const std::string & path)
  {
    using R = ReadResult<Item *>;
    if (!j.is_object()) return R::fail(error_at(path, "expected an item"));

    auto kind = string_field(j, "kind", path);
    if (!kind) return R::fail(std::move(kind).error());

    if (kind.value() == "fn") {
      auto fn = read_fn(j, path, std::string_view());
      if (!fn) return R::fail(std::move(fn).error());
      return R::ok(fn.value());
    }
    if (kind.value() == "impl") {
      auto impl = read_impl(j, path);
      if (!impl) return R::fail(std::move(impl).error());
      return R::ok(impl.value());
    }
    return R::fail(
      error_at(child(path, "kind"), fmt::format("unknown item kind '{}'", kind.value())));
  }

  ReadResult<FnItem *> read_fn(const json & j, const std::string & path, std::string_view impl_id)
  {
    using R = ReadResult<FnItem *>;
    if (!j.is_object()) return R::fail(error_at(path, "expected a function"));

    auto name = string_field(j, "name", path);
    if (!name) return R::fail(std::move(name).error());
    FnItem * fn = ctx_.create<FnItem>(name.value());
    fn->impl_id = impl_id;

    auto lifetimes = string_list(j, "lifetime_params", path);
    if (!lifetimes) return R::fail(std::move(lifetimes).error());
    fn->lifetime_params = lifetimes.value();

    auto generics = string_list(j, "generic_params", path);
    if (!generics) return R::fail(std::move(generics).error());
    fn->generic_params = generics.value();

    auto wheres = read_list<WhereClause *>(
      j, "where", path, [this](const json & w, const std::string & p) { return read_where(w, p); });
    if (!wheres) return R::fail(std::move(wheres).error());
    fn->where_clauses = wheres.value();

    auto params = read_list<ParamDecl *>(
      j, "params", path, [this](const json & p, const std::string & at) -> ReadResult<ParamDecl *> {
        if (!p.is_object()) return ReadResult<ParamDecl *>::fail(error_at(at, "expected a parameter"));
        auto pname = string_field(p, "name", at);
        if (!pname) return ReadResult<ParamDecl *>::fail(std::move(pname).error());
        auto ptype = read_type_field(p, "type", at);
        if (!ptype) return ReadResult<ParamDecl *>::fail(std::move(ptype).error());
        return ReadResult<ParamDecl *>::ok(ctx_.create<ParamDecl>(pname.value(), ptype.value()));
      });
    if (!params) return R::fail(std::move(params).error());
    fn->params = params.value();

    auto ret = optional_type_field(j, "return", path);
    if (!ret) return R::fail(std::move(ret).error());
    fn->return_type = ret.value();

    auto body = read_list<Stmt *>(
      j, "body", path, [this](const json & s, const std::string & p) { return read_stmt(s, p); });
    if (!body) return R::fail(std::move(body).error());
    fn->body = body.value();

    if (const auto t = j.find("tail"); t != j.end() && !t->is_null()) {
      auto tail = read_expr(*t, child(path, "tail"));
      if (!tail) return R::fail(std::move(tail).error());
      fn->tail = tail.value();
    }

    auto eqs = read_list<EqualityFact>(
      j, "equalities", path,
      [this](const json & e, const std::string & p) -> ReadResult<EqualityFact> {
        if (!e.is_array() || e.size() != 2 || !e[0].is_string() || !e[1].is_string()) {
          return ReadResult<EqualityFact>::fail(error_at(p, "expected a [lhs, rhs] pair"));
        }
        return ReadResult<EqualityFact>::ok(EqualityFact{
          ctx_.intern(e[0].get<std::string>()), ctx_.intern(e[1].get<std::string>())});
      });
    if (!eqs) return R::fail(std::move(eqs).error());
    fn->equalities = eqs.value();

    auto outlives = read_list<OutlivesFact>(
      j, "outlives", path,
      [this](const json & o, const std::string & p) -> ReadResult<OutlivesFact> {
        if (!o.is_object()) return ReadResult<OutlivesFact>::fail(error_at(p, "expected an object"));
        auto longer = string_field(o, "longer", p);
        if (!longer) return ReadResult<OutlivesFact>::fail(std::move(longer).error());
        auto shorter = string_field(o, "shorter", p);
        if (!shorter) return ReadResult<OutlivesFact>::fail(std::move(shorter).error());
        auto reason = optional_string_field(o, "reason", p);
        if (!reason) return ReadResult<OutlivesFact>::fail(std::move(reason).error());
        return ReadResult<OutlivesFact>::ok(
          OutlivesFact{longer.value(), shorter.value(), reason.value()});
      });
    if (!outlives) return R::fail(std::move(outlives).error());
    fn->outlives = outlives.value();

    return R::ok(fn);
  }

  ReadResult<ImplItem *> read_impl(const json & j, const std::string & path)
  {
    using R = ReadResult<ImplItem *>;

    auto id = string_field(j, "id", path);
    if (!id) return R::fail(std::move(id).error());
    ImplItem * impl = ctx_.create<ImplItem>(id.value());

    auto trait = optional_string_field(j, "trait", path);
    if (!trait) return R::fail(std::move(trait).error());
    impl->trait_name = trait.value();

    auto self_type = read_type_field(j, "self", path);
    if (!self_type) return R::fail(std::move(self_type).error());
    impl->self_type = self_type.value();

    auto bindings = read_list<AssocBinding *>(
      j, "assoc", path,
      [this](const json & b, const std::string & p) -> ReadResult<AssocBinding *> {
        if (!b.is_object()) return ReadResult<AssocBinding *>::fail(error_at(p, "expected an object"));
        auto bname = string_field(b, "name", p);
        if (!bname) return ReadResult<AssocBinding *>::fail(std::move(bname).error());
        auto btype = read_type_field(b, "type", p);
        if (!btype) return ReadResult<AssocBinding *>::fail(std::move(btype).error());
        return ReadResult<AssocBinding *>::ok(ctx_.create<AssocBinding>(bname.value(), btype.value()));
      });
    if (!bindings) return R::fail(std::move(bindings).error());
    impl->assoc_bindings = bindings.value();

    const std::string_view impl_id = impl->name;
    auto methods = read_list<FnItem *>(
      j, "methods", path,
      [this, impl_id](const json & m, const std::string & p) { return read_fn(m, p, impl_id); });
    if (!methods) return R::fail(std::move(methods).error());
    impl->methods = methods.value();

    return R::ok(impl);
  }

  HirContext & ctx_;
};

}  // namespace

Result<Program *, std::string> read_program_json(std::string_view text, HirContext & ctx)
{
  const json root = json::parse(text.begin(), text.end(), nullptr, false);
  if (root.is_discarded()) {
    return Result<Program *, std::string>::fail("invalid JSON");
  }
  JsonHirReader reader(ctx);
  return reader.read_program(root);
}

Result<Program *, std::string> read_program_file(
  const std::filesystem::path & path, HirContext & ctx)
{
  std::ifstream in(path);
  if (!in) {
    return Result<Program *, std::string>::fail(
      fmt::format("cannot open '{}'", path.string()));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  auto r = read_program_json(buffer.str(), ctx);
  if (!r) {
    return Result<Program *, std::string>::fail(
      fmt::format("{}: {}", path.string(), r.error()));
  }
  return r;
}

}  // namespace rsema
