#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "symx/ast.hpp"
#include "symx/config.hpp"
#include "symx/log.hpp"
#include "symx/term.hpp"

namespace symx {

enum class FormKind : uint8_t { Expanded, Factored, Grouped, Structural };

inline const char* form_kind_name(FormKind k) {
  switch (k) {
    case FormKind::Expanded:   return "EXPANDED";
    case FormKind::Factored:   return "FACTORED";
    case FormKind::Grouped:    return "GROUPED";
    case FormKind::Structural: return "STRUCTURAL";
  }
  return "?";
}

struct SimplifiedForm {
  Expr expression;
  FormKind kind;
  std::string label;
};

struct SimplificationForms {
  std::vector<SimplifiedForm> forms;

  bool contains(const Expr& e) const {
    for (const auto& f : forms) if (equal(f.expression, e)) return true;
    return false;
  }
  // Appends unless a structurally equal expression is already present.
  bool add_unique(Expr e, FormKind kind, std::string label) {
    if (contains(e)) return false;
    forms.push_back(SimplifiedForm{ std::move(e), kind, std::move(label) });
    return true;
  }
  // Forms with structural duplicates removed, first occurrence kept
  std::vector<SimplifiedForm> display_forms() const {
    SimplificationForms seen;
    for (const auto& f : forms) seen.add_unique(f.expression, f.kind, f.label);
    return seen.forms;
  }
  std::vector<Expr> expressions() const {
    std::vector<Expr> out;
    for (const auto& f : forms) out.push_back(f.expression);
    return out;
  }
  std::size_t size() const { return forms.size(); }
  bool empty() const { return forms.empty(); }
};

namespace form_label {
inline constexpr const char* kStandard = "standard form";
inline constexpr const char* kNumeratorFactored = "numerator factored";
inline constexpr const char* kExpCancelled = "exp cancelled";
inline constexpr const char* kFactored = "factored";
} // namespace form_label

//===========================
// Common factor extraction
//===========================

// Iterative Euclid on magnitudes. Returns 1 when the values share no
// representable common divisor within kMaxGcdSteps.
inline double coefficient_gcd(double a, double b) {
  a = std::fabs(a); b = std::fabs(b);
  for (int i = 0; i < kMaxGcdSteps; ++i) {
    if (b < kEpsilon) return a;
    double r = std::fmod(a, b);
    a = b; b = r;
  }
  return 1.0;
}

// f(u) * f(u)^2 -> f(u)^3 inside one product. Divisions are left alone.
inline Expr normalize_function_powers(const Expr& e) {
  if (e->kind == NodeKind::Div) return e;
  std::vector<Expr> factors = collect_factors(e);
  if (factors.size() <= 1) return e;

  FunctionPowers groups;
  std::vector<Expr> others;
  for (const auto& f : factors) {
    if (f->kind == NodeKind::Pow && is_func(f->lhs) && is_const(f->rhs)) {
      groups.accumulate(FunctionKey::of(f->lhs), f->rhs->cval);
    } else if (is_func(f)) {
      groups.accumulate(FunctionKey::of(f), 1.0);
    } else {
      others.push_back(f);
      continue;
    }
  }
  // Keys whose exponents cancelled entirely are gone from `groups`; they contribute 1.
  std::vector<Expr> merged = others;
  for (const auto& g : groups) {
    Expr base = g.first.to_node();
    merged.push_back(near(g.second, 1.0) ? base : pow(base, num(g.second)));
  }
  if (merged.size() == factors.size()) return e;
  return build_product(merged);
}

// Greatest common Term of a list: coefficient gcd, and for every variable or
// function present in all terms the smallest positive exponent.
inline Term common_factor(const std::vector<Term>& terms) {
  Term g;
  if (terms.empty()) return g;

  double c = std::fabs(terms[0].coefficient);
  for (std::size_t i = 1; i < terms.size(); ++i) c = coefficient_gcd(c, terms[i].coefficient);
  g.coefficient = c < kEpsilon ? 1.0 : c;

  for (const auto& v : terms[0].variables) {
    double lo = v.second;
    bool everywhere = true;
    for (std::size_t i = 1; i < terms.size() && everywhere; ++i) {
      auto it = terms[i].variables.find(v.first);
      if (it == terms[i].variables.end()) everywhere = false;
      else lo = std::min(lo, it->second);
    }
    if (everywhere && lo > kEpsilon) g.variables[v.first] = lo;
  }
  for (const auto& f : terms[0].functions) {
    double lo = f.second;
    bool everywhere = true;
    for (std::size_t i = 1; i < terms.size() && everywhere; ++i) {
      const auto* o = terms[i].functions.find(f.first);
      if (!o) everywhere = false;
      else lo = std::min(lo, o->second);
    }
    if (everywhere && lo > kEpsilon) g.functions.set(f.first, lo);
  }
  return g;
}

// gcd * (t1/gcd + t2/gcd + ...), or the bare sum when gcd is trivial.
inline Expr build_factored(const std::vector<Term>& terms, const Term& gcd) {
  std::vector<Expr> rest;
  rest.reserve(terms.size());
  for (const auto& t : terms) rest.push_back(divide(t, gcd).to_node());
  Expr sum = build_sum(rest);
  if (gcd.is_unit()) return sum;
  return mul(gcd.to_node(), sum);
}

inline Expr extract_common_factor(const Expr& e) {
  if (!is_sum_kind(e->kind)) return e;

  std::vector<Term> terms;
  for (const auto& a : collect_addends(e)) terms.push_back(Term::from_node(normalize_function_powers(a)));
  if (terms.size() < 2) return e;

  Term gcd = common_factor(terms);
  if (gcd.is_unit()) return e;

  // Every addend has to carry at least the common exponent; otherwise factor
  // the coefficient only.
  bool covered = true;
  for (const auto& t : terms) {
    for (const auto& v : gcd.variables) {
      auto it = t.variables.find(v.first);
      double have = it == t.variables.end() ? 0.0 : it->second;
      if (have < v.second - kEpsilon) covered = false;
    }
    for (const auto& f : gcd.functions)
      if (t.functions.get(f.first) < f.second - kEpsilon) covered = false;
  }
  if (!covered) {
    if (log_enabled(LogLevel::Debug))
      log_debug("factor", "exponent check failed for {}, coefficient only", to_string(e));
    gcd = Term::constant(gcd.coefficient);
  }
  return build_factored(terms, gcd);
}

//===========================
// exp() cancellation in a fraction
//===========================

// exp(u) -> (u, 1); exp(u)^n -> (u, n) for numeric n
inline bool exp_power(const Expr& f, FunctionKey& key, double& exponent) {
  if (is_func(f, "exp")) { key = FunctionKey::of(f); exponent = 1.0; return true; }
  if (f->kind == NodeKind::Pow && is_func(f->lhs, "exp") && is_const(f->rhs)) {
    key = FunctionKey::of(f->lhs); exponent = f->rhs->cval; return true;
  }
  return false;
}

inline void split_exp_factors(const Expr& side, FunctionPowers& exps, std::vector<Expr>& others) {
  for (const auto& f : collect_factors(side)) {
    FunctionKey k; double n = 0.0;
    if (exp_power(f, k, n)) exps.accumulate(k, n);
    else others.push_back(f);
  }
}

inline Expr cancel_exp_once(const Expr& e) {
  if (e->kind != NodeKind::Div) return e;

  FunctionPowers top, bottom;
  std::vector<Expr> top_rest, bottom_rest;
  split_exp_factors(e->lhs, top, top_rest);
  split_exp_factors(e->rhs, bottom, bottom_rest);

  std::vector<FunctionKey> common;
  for (const auto& t : top) if (bottom.contains(t.first)) common.push_back(t.first);
  if (common.empty()) return e;

  for (const auto& k : common) {
    double diff = top.get(k) - bottom.get(k);
    top.erase(k);
    bottom.erase(k);
    if (diff > kEpsilon) top.set(k, diff);
    else if (diff < -kEpsilon) bottom.set(k, -diff);
  }

  auto rebuild = [](std::vector<Expr> factors, const FunctionPowers& exps) {
    for (const auto& x : exps) {
      Expr f = x.first.to_node();
      factors.push_back(near(x.second, 1.0) ? f : pow(f, num(x.second)));
    }
    return build_product(factors);
  };
  return div(rebuild(std::move(top_rest), top), rebuild(std::move(bottom_rest), bottom));
}

// Cancel exp(u)^a / exp(u)^b repeatedly; one cancellation can expose another.
inline Expr simplify_exp_in_fraction(const Expr& e) {
  Expr cur = e;
  for (int i = 0; i < kMaxExpCancelPasses; ++i) {
    Expr next = cancel_exp_once(cur);
    if (equal(next, cur)) break;
    cur = next;
  }
  return cur;
}

//===========================
// Entry point
//===========================
inline SimplificationForms generate_all_forms(const Expr& e) {
  SimplificationForms out;
  out.forms.push_back(SimplifiedForm{ e, FormKind::Expanded, form_label::kStandard });

  if (e->kind == NodeKind::Div) {
    Expr top = e->lhs;
    try {
      top = extract_common_factor(e->lhs);
    } catch (const std::exception& ex) {
      log_warn("forms", "numerator factoring failed: {}", ex.what());
    }
    Expr factored = equal(top, e->lhs) ? e : div(top, e->rhs);
    Expr cancelled = simplify_exp_in_fraction(factored);

    if (!equal(factored, e)) out.add_unique(factored, FormKind::Factored, form_label::kNumeratorFactored);
    if (!equal(cancelled, e)) out.add_unique(cancelled, FormKind::Factored, form_label::kExpCancelled);
  } else {
    try {
      Expr factored = extract_common_factor(e);
      if (!equal(factored, e)) out.add_unique(factored, FormKind::Factored, form_label::kFactored);
    } catch (const std::exception& ex) {
      log_warn("forms", "factoring failed: {}", ex.what());
    }
  }
  if (log_enabled(LogLevel::Debug))
    log_debug("forms", "{} form(s) for {}", out.size(), to_string(e));
  return out;
}

} // namespace symx
