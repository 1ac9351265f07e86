#pragma once
#include <cmath>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "symx/ast.hpp"
#include "symx/canonicalize.hpp"
#include "symx/config.hpp"
#include "symx/form_generator.hpp"
#include "symx/form_selector.hpp"
#include "symx/log.hpp"
#include "symx/trig.hpp"

namespace symx {

//===========================
// Cleanup passes
//===========================

// Fold binary nodes whose operands are both numbers. Division by ~0 is left alone.
inline Expr fold_constants(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const:
    case NodeKind::Var:
      return e;
    case NodeKind::Func:
      return func(e->name, fold_constants(e->lhs));
    default: break;
  }
  Expr l = fold_constants(e->lhs);
  Expr r = fold_constants(e->rhs);
  if (!is_const(l) || !is_const(r)) return binary(e->kind, l, r);
  double a = l->cval, b = r->cval;
  switch (e->kind) {
    case NodeKind::Add: return num(a + b);
    case NodeKind::Sub: return num(a - b);
    case NodeKind::Mul: return num(a * b);
    case NodeKind::Div:
      if (std::fabs(b) <= kEpsilon) return binary(e->kind, l, r);
      return num(a / b);
    case NodeKind::Pow: {
      double v = std::pow(a, b);
      if (!std::isfinite(v)) return binary(e->kind, l, r);
      return num(v);
    }
    default: return binary(e->kind, l, r);
  }
}

// 0 + x -> x, x + 0 -> x, 0 * x -> 0
inline Expr remove_zero_terms(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const:
    case NodeKind::Var:
      return e;
    case NodeKind::Func:
      return func(e->name, remove_zero_terms(e->lhs));
    default: break;
  }
  Expr l = remove_zero_terms(e->lhs);
  Expr r = remove_zero_terms(e->rhs);
  if (e->kind == NodeKind::Add) {
    if (is_const_value(l, 0.0)) return r;
    if (is_const_value(r, 0.0)) return l;
  } else if (e->kind == NodeKind::Mul) {
    if (is_const_value(l, 0.0) || is_const_value(r, 0.0)) return num(0.0);
  }
  return binary(e->kind, l, r);
}

// 1 * x -> x, x * 1 -> x
inline Expr remove_one_factors(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const:
    case NodeKind::Var:
      return e;
    case NodeKind::Func:
      return func(e->name, remove_one_factors(e->lhs));
    default: break;
  }
  Expr l = remove_one_factors(e->lhs);
  Expr r = remove_one_factors(e->rhs);
  if (e->kind == NodeKind::Mul) {
    if (is_const_value(l, 1.0)) return r;
    if (is_const_value(r, 1.0)) return l;
  }
  return binary(e->kind, l, r);
}

// b^0 -> 1, b^1 -> b
inline Expr simplify_powers(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const:
    case NodeKind::Var:
      return e;
    case NodeKind::Func:
      return func(e->name, simplify_powers(e->lhs));
    default: break;
  }
  Expr l = simplify_powers(e->lhs);
  Expr r = simplify_powers(e->rhs);
  if (e->kind == NodeKind::Pow && is_const(r)) {
    if (is_const_value(r, 0.0)) return num(1.0);
    if (is_const_value(r, 1.0)) return l;
  }
  return binary(e->kind, l, r);
}

//===========================
// Strategies
//===========================

// Run one pipeline step; a step that throws leaves the value as it was.
template <class F>
Expr try_apply(const char* step, const Expr& e, F&& fn) {
  try {
    Expr out = fn(e);
    if (log_enabled(LogLevel::Debug))
      log_debug("engine", "{} {}", step, equal(out, e) ? "unchanged" : "-> " + to_string(out));
    return out;
  } catch (const std::exception& ex) {
    log_warn("engine", "{} failed on {}: {}", step, to_string(e), ex.what());
    return e;
  }
}

// Iterate `round` until the tree stops changing or kMaxIterations is reached.
template <class F>
Expr to_fixed_point(const Expr& e, F&& round) {
  Expr cur = e;
  for (int i = 0; i < kMaxIterations; ++i) {
    Expr next = round(cur);
    if (equal(next, cur)) return next;
    cur = next;
  }
  return cur;
}

inline Expr cleanup_round(const Expr& e, bool with_trig) {
  Expr cur = try_apply("canonicalize", e, [](const Expr& x) { return canonicalize(x); });
  cur = try_apply("fold constants", cur, fold_constants);
  cur = try_apply("remove zeros", cur, remove_zero_terms);
  cur = try_apply("remove ones", cur, remove_one_factors);
  if (with_trig) cur = try_apply("trig", cur, [](const Expr& x) { return trig::simplify(x); });
  return try_apply("simplify powers", cur, simplify_powers);
}

// Full pipeline to a fixed point
inline Expr iterative_simplify(const Expr& e) {
  Expr out = to_fixed_point(e, [](const Expr& x) { return cleanup_round(x, true); });
  if (log_enabled(LogLevel::Debug))
    log_debug("engine", "iterative_simplify {} -> {}", to_string(e), to_string(out));
  return out;
}

namespace strategy {

inline Expr expand(const Expr& e) {
  return to_fixed_point(e, [](const Expr& x) { return cleanup_round(x, false); });
}

inline Expr expand_trig(const Expr& e) {
  return to_fixed_point(e, [](const Expr& x) { return cleanup_round(x, true); });
}

inline Expr prepared(const Expr& e) {
  Expr cur = try_apply("canonicalize", e, [](const Expr& x) { return canonicalize(x); });
  return try_apply("trig", cur, [](const Expr& x) { return trig::simplify(x); });
}

inline Expr factor(const Expr& e) {
  Expr cur = prepared(e);
  if (cur->kind != NodeKind::Div) return cur;
  SimplificationForms forms = generate_all_forms(cur);
  for (const auto& f : forms.forms) {
    if (f.label == form_label::kNumeratorFactored) return f.expression;
  }
  return cur;
}

inline Expr fraction(const Expr& e) {
  Expr cur = prepared(e);
  if (cur->kind != NodeKind::Div) return cur;
  SimplificationForms forms = generate_all_forms(cur);
  for (const auto& f : forms.forms) {
    if (f.label == form_label::kExpCancelled) return f.expression;
  }
  return forms.forms.back().expression;
}

inline Expr full(const Expr& e) { return iterative_simplify(e); }

// Padding strategies for inputs that produced too few distinct forms
inline Expr partial(const Expr& e) {
  Expr cur = try_apply("canonicalize", e, [](const Expr& x) { return canonicalize(x); });
  cur = try_apply("fold constants", cur, fold_constants);
  return try_apply("trig", cur, [](const Expr& x) { return trig::simplify(x); });
}

inline Expr alternative(const Expr& e) {
  Expr cur = try_apply("canonicalize", e, [](const Expr& x) { return canonicalize(x); });
  cur = try_apply("remove zeros", cur, remove_zero_terms);
  return try_apply("remove ones", cur, remove_one_factors);
}

} // namespace strategy

namespace engine_label {
inline constexpr const char* kExpanded = "expanded";
inline constexpr const char* kTrig = "trig simplified";
inline constexpr const char* kFactored = "factored";
inline constexpr const char* kFraction = "fraction reduced";
inline constexpr const char* kFull = "fully simplified";
inline constexpr const char* kIntermediate = "intermediate";
inline constexpr const char* kAlternative = "alternative";
inline constexpr const char* kOriginal = "original";
} // namespace engine_label

inline SimplificationForms structural_only(const Expr& e) {
  SimplificationForms out;
  out.forms.push_back(SimplifiedForm{ e, FormKind::Structural, engine_label::kOriginal });
  return out;
}

// Five strategies over the same input, deduplicated structurally, padded to
// kMinDistinctForms where the padding strategies produce something new.
inline SimplificationForms generate_multiple_forms(const Expr& e) {
  try {
    SimplificationForms out;
    out.add_unique(strategy::expand(e), FormKind::Expanded, engine_label::kExpanded);
    out.add_unique(strategy::expand_trig(e), FormKind::Structural, engine_label::kTrig);
    out.add_unique(strategy::factor(e), FormKind::Factored, engine_label::kFactored);
    out.add_unique(strategy::fraction(e), FormKind::Factored, engine_label::kFraction);
    out.add_unique(strategy::full(e), FormKind::Factored, engine_label::kFull);

    if (out.size() < kMinDistinctForms)
      out.add_unique(strategy::partial(e), FormKind::Structural, engine_label::kIntermediate);
    if (out.size() < kMinDistinctForms)
      out.add_unique(strategy::alternative(e), FormKind::Structural, engine_label::kAlternative);

    if (log_enabled(LogLevel::Info)) {
      log_info("engine", "{} distinct form(s) for {}", out.size(), to_string(e));
      if (log_enabled(LogLevel::Debug))
        for (const auto& f : out.forms) log_debug("engine", "  {}: {}", f.label, to_string(f.expression));
    }
    return out;
  } catch (const std::exception& ex) {
    log_error("engine", "form generation failed for {}: {}", to_string(e), ex.what());
    return structural_only(e);
  }
}

// Best candidate among the generated forms, ready for differentiation.
inline Expr prepare_for_differentiation(const Expr& e) {
  return select_best_for_differentiation(generate_multiple_forms(e)).expression;
}

//===========================
// Facade
//===========================
class Simplifier {
public:
  // Form Generator alternatives of `e`; the unmodified input if that fails.
  SimplificationForms simplify_to_multiple_forms(const Expr& e) const {
    try {
      return generate_all_forms(e);
    } catch (const std::exception& ex) {
      log_error("simplifier", "form generation failed for {}: {}", to_string(e), ex.what());
      return structural_only(e);
    }
  }

  Expr select_best_for_differentiation(const std::vector<Expr>& forms) const {
    return symx::select_best_for_differentiation(forms);
  }

  Expr simplify(const Expr& e) const { return canonicalize(e); }
};

} // namespace symx
