#pragma once
#include <cmath>
#include <functional>
#include <optional>
#include <vector>

#include "symx/ast.hpp"
#include "symx/config.hpp"
#include "symx/log.hpp"
#include "symx/term.hpp"

namespace symx { namespace trig {

// k * f(angle) in some matched shape
struct Match {
  double coefficient;
  Expr angle;
};

// Postorder rebuild: children first, then `at_node` may replace the rebuilt node.
inline Expr rewrite_postorder(const Expr& e, const std::function<Expr(const Expr&)>& at_node) {
  switch (e->kind) {
    case NodeKind::Const:
    case NodeKind::Var:
      return e;
    case NodeKind::Func:
      return func(e->name, rewrite_postorder(e->lhs, at_node));
    default: {
      Expr rebuilt = binary(e->kind, rewrite_postorder(e->lhs, at_node), rewrite_postorder(e->rhs, at_node));
      return at_node(rebuilt);
    }
  }
}

// k * sin(t) * cos(t): numeric factors, exactly one sin and one cos with the same angle.
inline std::optional<Match> match_sin_cos_product(const Expr& product) {
  double k = 1.0;
  Expr s, c;
  for (const auto& f : collect_factors(product)) {
    if (is_const(f)) { k *= f->cval; continue; }
    if (is_func(f, "sin")) { if (s) return std::nullopt; s = f; continue; }
    if (is_func(f, "cos")) { if (c) return std::nullopt; c = f; continue; }
    return std::nullopt;
  }
  if (!s || !c || !equal(s->lhs, c->lhs)) return std::nullopt;
  return Match{ k, s->lhs };
}

// k * fname(t)^2, numeric factors allowed around it.
inline std::optional<Match> match_squared(const Expr& e, const char* fname) {
  double k = 1.0;
  Expr fn;
  double power = 0.0;
  for (const auto& f : collect_factors(e)) {
    if (is_const(f)) { k *= f->cval; continue; }
    if (f->kind == NodeKind::Pow && is_func(f->lhs, fname) && is_const(f->rhs)) {
      if (fn) return std::nullopt;
      fn = f->lhs; power = f->rhs->cval;
      continue;
    }
    if (is_func(f, fname)) {
      if (fn) return std::nullopt;
      fn = f; power = 1.0;
      continue;
    }
    return std::nullopt;
  }
  if (!fn || !near(power, 2.0)) return std::nullopt;
  return Match{ k, fn->lhs };
}

inline Expr scaled(double k, Expr e) {
  return near(k, 1.0) ? e : mul(num(k), std::move(e));
}

inline Expr double_angle(const Expr& angle) { return mul(num(2.0), angle); }

// k*sin(t)*cos(t) -> (k/2)*sin(2t);  k*cos(t)^2 - k*sin(t)^2 -> k*cos(2t)
inline Expr apply_double_angle(const Expr& e) {
  return rewrite_postorder(e, [](const Expr& n) -> Expr {
    if (n->kind == NodeKind::Mul) {
      if (auto m = match_sin_cos_product(n))
        return scaled(m->coefficient / 2.0, func("sin", double_angle(m->angle)));
    } else if (n->kind == NodeKind::Sub) {
      auto c = match_squared(n->lhs, "cos");
      auto s = match_squared(n->rhs, "sin");
      if (c && s && equal(c->angle, s->angle) && near(c->coefficient, s->coefficient))
        return scaled(c->coefficient, func("cos", double_angle(c->angle)));
    }
    return n;
  });
}

// k*sin(t)^2 + k*cos(t)^2 -> k, either order
inline Expr apply_pythagorean(const Expr& e) {
  return rewrite_postorder(e, [](const Expr& n) -> Expr {
    if (n->kind != NodeKind::Add) return n;
    for (auto names : { std::make_pair("sin", "cos"), std::make_pair("cos", "sin") }) {
      auto a = match_squared(n->lhs, names.first);
      auto b = match_squared(n->rhs, names.second);
      if (a && b && equal(a->angle, b->angle) && near(a->coefficient, b->coefficient))
        return num(a->coefficient);
    }
    return n;
  });
}

// sin/cos -> tan, cos/sin -> cot, 1/cos -> sec, 1/sin -> csc
inline Expr apply_basic_identities(const Expr& e) {
  return rewrite_postorder(e, [](const Expr& n) -> Expr {
    if (n->kind != NodeKind::Div) return n;
    const Expr& a = n->lhs;
    const Expr& b = n->rhs;
    if (is_func(a) && is_func(b) && equal(a->lhs, b->lhs)) {
      if (a->name == "sin" && b->name == "cos") return func("tan", a->lhs);
      if (a->name == "cos" && b->name == "sin") return func("cot", a->lhs);
    }
    if (is_const_value(a, 1.0)) {
      if (is_func(b, "cos")) return func("sec", b->lhs);
      if (is_func(b, "sin")) return func("csc", b->lhs);
    }
    return n;
  });
}

// Collapse runs of adjacent Number factors in each MULTIPLY chain to one product;
// a product of 1 is dropped.
inline Expr fold_numeric_coefficients(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const:
    case NodeKind::Var:
      return e;
    case NodeKind::Func:
      return func(e->name, fold_numeric_coefficients(e->lhs));
    case NodeKind::Mul: {
      std::vector<Expr> out;
      std::optional<double> run;
      int run_len = 0;
      bool changed = false;
      auto flush = [&]{
        if (run) {
          if (run_len > 1 || near(*run, 1.0)) changed = true;
          if (!near(*run, 1.0)) out.push_back(num(*run));
        }
        run.reset();
        run_len = 0;
      };
      for (const auto& f : collect_factors(e)) {
        if (is_const(f)) { run = run.value_or(1.0) * f->cval; ++run_len; continue; }
        flush();
        out.push_back(fold_numeric_coefficients(f));
      }
      flush();
      // nothing folded: keep the original grouping
      if (!changed)
        return binary(NodeKind::Mul, fold_numeric_coefficients(e->lhs), fold_numeric_coefficients(e->rhs));
      return build_product(out);
    }
    default:
      return binary(e->kind, fold_numeric_coefficients(e->lhs), fold_numeric_coefficients(e->rhs));
  }
}

// Double-angle, Pythagorean and quotient identities to a fixed point,
// then numeric coefficient folding.
inline Expr simplify(const Expr& e) {
  Expr cur = e;
  for (int i = 0; i < kMaxIterations; ++i) {
    Expr next = apply_basic_identities(apply_pythagorean(apply_double_angle(cur)));
    if (equal(next, cur)) { cur = next; break; }
    cur = next;
  }
  Expr out = fold_numeric_coefficients(cur);
  if (log_enabled(LogLevel::Debug))
    log_debug("trig", "{} -> {}", to_string(e), to_string(out));
  return out;
}

} } // namespace symx::trig
