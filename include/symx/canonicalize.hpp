#pragma once
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

#include "symx/ast.hpp"
#include "symx/config.hpp"
#include "symx/log.hpp"
#include "symx/term.hpp"

namespace symx {

// Product of two already-expanded, sum-free factors, as one Term rendered back to a node.
inline Expr multiply_simple(const Expr& l, const Expr& r) {
  if (is_const(l) && is_const(r)) return num(l->cval * r->cval);
  if (is_const_value(l, 0.0) || is_const_value(r, 0.0)) return num(0.0);
  if (is_const_value(l, 1.0)) return r;
  if (is_const_value(r, 1.0)) return l;
  return multiply(Term::from_node(l), Term::from_node(r)).to_node();
}

// Distribute a product over ADD/SUBTRACT on either side.
inline Expr expand_product(const Expr& l, const Expr& r) {
  bool lsum = is_sum_kind(l->kind);
  bool rsum = is_sum_kind(r->kind);
  if (!lsum && !rsum) return multiply_simple(l, r);

  std::vector<Expr> lt = lsum ? collect_addends(l) : std::vector<Expr>{ l };
  std::vector<Expr> rt = rsum ? collect_addends(r) : std::vector<Expr>{ r };
  std::vector<Expr> products;
  products.reserve(lt.size() * rt.size());
  for (const auto& a : lt)
    for (const auto& b : rt) products.push_back(multiply_simple(a, b));
  return build_sum(products);
}

inline Expr expand_power(const Expr& base, const Expr& exponent) {
  // (b^m)^n -> b^(m*n)
  if (base->kind == NodeKind::Pow && is_const(base->rhs) && is_const(exponent))
    return expand_power(base->lhs, num(base->rhs->cval * exponent->cval));

  if (!is_const(exponent)) return pow(base, exponent);
  double n = exponent->cval;

  if (base->kind == NodeKind::Var) return pow(base, exponent);
  if (base->kind == NodeKind::Const) {
    double v = std::pow(base->cval, n);
    // not a real number: stays an opaque power
    if (!std::isfinite(v)) return pow(base, exponent);
    return num(v);
  }

  if (n != std::floor(n) || n < 0.0 || n > kMaxExpandPower) return pow(base, exponent);

  int k = static_cast<int>(n);
  if (k == 0) return num(1.0);
  if (k == 1) return base;
  if (is_sum_kind(base->kind)) {
    Expr acc = base;
    for (int i = 1; i < k; ++i) acc = expand_product(acc, base);
    return acc;
  }
  return pow(base, exponent);
}

// Multiply out every product and small integer power of a sum.
// Function arguments are expanded in place; a division is never crossed.
inline Expr fully_expand(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const:
    case NodeKind::Var:
      return e;
    case NodeKind::Func:
      return func(e->name, fully_expand(e->lhs));
    case NodeKind::Add:
    case NodeKind::Sub:
    case NodeKind::Div:
      return binary(e->kind, fully_expand(e->lhs), fully_expand(e->rhs));
    case NodeKind::Mul:
      return expand_product(fully_expand(e->lhs), fully_expand(e->rhs));
    case NodeKind::Pow:
      return expand_power(fully_expand(e->lhs), fully_expand(e->rhs));
  }
  return e;
}

inline std::vector<Term> extract_terms(const Expr& expanded) {
  std::vector<Term> terms;
  for (const auto& a : collect_addends(expanded)) terms.push_back(Term::from_node(a));
  return terms;
}

// Group by base key (first-appearance order), sum each group, drop vanishing groups.
inline std::vector<Term> merge_terms(const std::vector<Term>& terms) {
  std::vector<Term> groups;
  std::unordered_map<std::string, std::vector<std::size_t>> by_key;
  for (const auto& t : terms) {
    auto& slots = by_key[t.base_key()];
    bool merged = false;
    for (std::size_t idx : slots) {
      if (auto m = groups[idx].merge_with(t)) { groups[idx] = std::move(*m); merged = true; break; }
    }
    if (!merged) {
      slots.push_back(groups.size());
      groups.push_back(t);
    }
  }
  std::vector<Term> out;
  out.reserve(groups.size());
  for (auto& g : groups) if (!g.is_zero()) out.push_back(std::move(g));
  return out;
}

// Highest total degree first, constants last, then base key; coefficient breaks the rest.
inline bool term_less(const Term& a, const Term& b) {
  bool ca = a.is_constant(), cb = b.is_constant();
  if (ca != cb) return cb;
  double da = a.total_degree(), db = b.total_degree();
  if (std::fabs(da - db) >= kEpsilon) return da > db;
  std::string ka = a.base_key(), kb = b.base_key();
  if (ka != kb) return ka < kb;
  return a.coefficient < b.coefficient;
}

inline std::vector<Term> sort_terms(std::vector<Term> terms) {
  std::stable_sort(terms.begin(), terms.end(), term_less);
  return terms;
}

inline Expr build_expression(const std::vector<Term>& terms) {
  std::vector<Expr> nodes;
  nodes.reserve(terms.size());
  for (const auto& t : terms) nodes.push_back(t.to_node());
  return build_sum(nodes);
}

inline Expr canonicalize_polynomial(const Expr& e) {
  Expr expanded = fully_expand(e);
  std::vector<Term> terms = sort_terms(merge_terms(extract_terms(expanded)));
  return build_expression(terms);
}

// Canonical polynomial form. A top-level division keeps its bar: numerator
// and denominator are canonicalized independently.
inline Expr canonicalize(const Expr& e) {
  Expr out = e->kind == NodeKind::Div
    ? div(canonicalize_polynomial(e->lhs), canonicalize_polynomial(e->rhs))
    : canonicalize_polynomial(e);
  if (log_enabled(LogLevel::Debug))
    log_debug("canonicalize", "{} -> {}", to_string(e), to_string(out));
  return out;
}

} // namespace symx
