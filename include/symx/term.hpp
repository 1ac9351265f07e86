#pragma once
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "symx/ast.hpp"
#include "symx/config.hpp"

namespace symx {

// Canonical identity of a Function node: its name plus the argument tree.
struct FunctionKey {
  std::string name;
  Expr argument;

  static FunctionKey of(const Expr& f) { return FunctionKey{ f->name, f->lhs }; }
  Expr to_node() const { return func(name, argument); }
  std::string key() const { return name + "(" + canonical_string(argument) + ")"; }
};

inline bool operator==(const FunctionKey& a, const FunctionKey& b) {
  return a.name == b.name && equal(a.argument, b.argument);
}
inline bool operator!=(const FunctionKey& a, const FunctionKey& b) { return !(a == b); }

// Insertion-ordered FunctionKey -> exponent map. Near-zero exponents are never stored.
class FunctionPowers {
public:
  using Entry = std::pair<FunctionKey, double>;

  const Entry* find(const FunctionKey& k) const {
    for (const auto& e : entries_) if (e.first == k) return &e;
    return nullptr;
  }
  bool contains(const FunctionKey& k) const { return find(k) != nullptr; }
  double get(const FunctionKey& k, double fallback = 0.0) const {
    const Entry* e = find(k); return e ? e->second : fallback;
  }

  // Add `exponent` to the entry for `k`, dropping it if the total vanishes.
  void accumulate(const FunctionKey& k, double exponent) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if (it->first == k) {
        it->second += exponent;
        if (std::fabs(it->second) < kEpsilon) entries_.erase(it);
        return;
      }
    }
    if (std::fabs(exponent) >= kEpsilon) entries_.emplace_back(k, exponent);
  }
  void set(const FunctionKey& k, double exponent) {
    erase(k);
    if (std::fabs(exponent) >= kEpsilon) entries_.emplace_back(k, exponent);
  }
  void erase(const FunctionKey& k) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const Entry& e){ return e.first == k; }),
                   entries_.end());
  }

  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }
  auto begin() const { return entries_.begin(); }
  auto end() const { return entries_.end(); }

  // Entries ordered by FunctionKey::key()
  std::vector<Entry> sorted() const {
    std::vector<std::pair<std::string, const Entry*>> keyed;
    keyed.reserve(entries_.size());
    for (const auto& e : entries_) keyed.emplace_back(e.first.key(), &e);
    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b){ return a.first < b.first; });
    std::vector<Entry> out; out.reserve(keyed.size());
    for (const auto& k : keyed) out.push_back(*k.second);
    return out;
  }

private:
  std::vector<Entry> entries_;
};

// Same keys and the same exponents, independent of insertion order.
inline bool operator==(const FunctionPowers& a, const FunctionPowers& b) {
  if (a.size() != b.size()) return false;
  for (const auto& e : a) {
    const auto* o = b.find(e.first);
    if (!o || std::fabs(o->second - e.second) >= kEpsilon) return false;
  }
  return true;
}

using VariablePowers = std::map<std::string, double>;

inline void accumulate_power(VariablePowers& m, const std::string& name, double exponent) {
  double total = m[name] + exponent;
  if (std::fabs(total) < kEpsilon) m.erase(name);
  else m[name] = total;
}

inline bool same_powers(const VariablePowers& a, const VariablePowers& b) {
  if (a.size() != b.size()) return false;
  auto ib = b.begin();
  for (auto ia = a.begin(); ia != a.end(); ++ia, ++ib) {
    if (ia->first != ib->first) return false;
    if (std::fabs(ia->second - ib->second) >= kEpsilon) return false;
  }
  return true;
}

inline std::string format_exponent(double e) {
  return format_number(e);
}

// Flatten a MULTIPLY chain into its factors (never crosses other operators).
inline void collect_factors(const Expr& e, std::vector<Expr>& out) {
  if (e->kind == NodeKind::Mul) {
    collect_factors(e->lhs, out);
    collect_factors(e->rhs, out);
  } else {
    out.push_back(e);
  }
}
inline std::vector<Expr> collect_factors(const Expr& e) {
  std::vector<Expr> out; collect_factors(e, out); return out;
}

// Left-associative product; Number(1) when empty.
inline Expr build_product(const std::vector<Expr>& factors) {
  if (factors.empty()) return num(1.0);
  Expr acc = factors[0];
  for (std::size_t i = 1; i < factors.size(); ++i) acc = mul(acc, factors[i]);
  return acc;
}

// Left-associative sum; Number(0) when empty.
inline Expr build_sum(const std::vector<Expr>& addends) {
  if (addends.empty()) return num(0.0);
  Expr acc = addends[0];
  for (std::size_t i = 1; i < addends.size(); ++i) acc = add(acc, addends[i]);
  return acc;
}

// Negate one addend: numbers flip sign, a leading numeric factor flips sign,
// anything else gets a (-1) multiplier.
inline Expr negate_addend(const Expr& e) {
  if (e->kind == NodeKind::Const) return num(-e->cval);
  if (e->kind == NodeKind::Mul && is_const(e->lhs)) return mul(num(-e->lhs->cval), e->rhs);
  return mul(num(-1.0), e);
}

// Flatten the top-level ADD/SUBTRACT chain into signed addends.
inline void collect_addends(const Expr& e, std::vector<Expr>& out) {
  if (e->kind == NodeKind::Add) {
    collect_addends(e->lhs, out);
    collect_addends(e->rhs, out);
  } else if (e->kind == NodeKind::Sub) {
    collect_addends(e->lhs, out);
    std::vector<Expr> right;
    collect_addends(e->rhs, right);
    for (const auto& r : right) out.push_back(negate_addend(r));
  } else {
    out.push_back(e);
  }
}
inline std::vector<Expr> collect_addends(const Expr& e) {
  std::vector<Expr> out; collect_addends(e, out); return out;
}

//===========================
// Term
//===========================
struct Term {
  double coefficient = 1.0;
  VariablePowers variables;
  FunctionPowers functions;
  std::vector<Expr> nested;

  static Term constant(double c) { Term t; t.coefficient = c; return t; }
  static Term opaque(const Expr& e) { Term t; t.nested.push_back(e); return t; }

  static Term from_node(const Expr& e);

  bool is_zero() const { return std::fabs(coefficient) < kEpsilon; }
  bool is_constant() const { return variables.empty() && functions.empty() && nested.empty(); }
  // Trivial as a common factor: coefficient 1, no variable or function entries
  bool is_unit() const { return near(coefficient, 1.0) && variables.empty() && functions.empty(); }

  double total_degree() const {
    double d = 0.0;
    for (const auto& v : variables) d += v.second;
    return d;
  }

  // Like terms: identical variable powers, identical function powers
  // (keys and exponents) and structurally equal nested factors in order.
  bool is_similar_to(const Term& o) const {
    if (!same_powers(variables, o.variables)) return false;
    if (!(functions == o.functions)) return false;
    if (nested.size() != o.nested.size()) return false;
    for (std::size_t i = 0; i < nested.size(); ++i)
      if (!equal(nested[i], o.nested[i])) return false;
    return true;
  }

  std::optional<Term> merge_with(const Term& o) const {
    if (!is_similar_to(o)) return std::nullopt;
    Term m = *this;
    m.coefficient += o.coefficient;
    return m;
  }

  std::string base_key() const;
  Expr to_node() const;
};

inline Term multiply(const Term& a, const Term& b) {
  Term r = a;
  r.coefficient *= b.coefficient;
  for (const auto& v : b.variables) accumulate_power(r.variables, v.first, v.second);
  for (const auto& f : b.functions) r.functions.accumulate(f.first, f.second);
  r.nested.insert(r.nested.end(), b.nested.begin(), b.nested.end());
  return r;
}

// a / d on coefficients and exponents; nested factors of `a` are kept.
inline Term divide(const Term& a, const Term& d) {
  Term r;
  r.coefficient = a.coefficient / d.coefficient;
  r.variables = a.variables;
  for (const auto& v : d.variables) accumulate_power(r.variables, v.first, -v.second);
  r.functions = a.functions;
  for (const auto& f : d.functions) r.functions.accumulate(f.first, -f.second);
  r.nested = a.nested;
  return r;
}

inline Term Term::from_node(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const: return constant(e->cval);
    case NodeKind::Var: {
      Term t; t.variables[e->name] = 1.0; return t;
    }
    case NodeKind::Func: {
      Term t; t.functions.accumulate(FunctionKey::of(e), 1.0); return t;
    }
    case NodeKind::Mul: {
      Term t;
      for (const auto& f : collect_factors(e)) t = multiply(t, from_node(f));
      return t;
    }
    case NodeKind::Pow: {
      if (!is_const(e->rhs)) return opaque(e);
      double n = e->rhs->cval;
      const Expr& base = e->lhs;
      if (base->kind == NodeKind::Var) {
        Term t; accumulate_power(t.variables, base->name, n); return t;
      }
      if (base->kind == NodeKind::Const) {
        double v = std::pow(base->cval, n);
        // not a real number (negative base, fractional exponent): keep it opaque
        if (!std::isfinite(v)) return opaque(e);
        return constant(v);
      }
      if (base->kind == NodeKind::Func) {
        Term t; t.functions.accumulate(FunctionKey::of(base), n); return t;
      }
      return opaque(e);
    }
    default:
      return opaque(e);
  }
}

inline std::string Term::base_key() const {
  std::string out;
  auto append = [&](const std::string& s) {
    if (!out.empty()) out += "*";
    out += s;
  };
  for (const auto& v : variables) {
    append(near(v.second, 1.0) ? v.first : v.first + "^" + format_exponent(v.second));
  }
  for (const auto& f : functions.sorted()) {
    std::string k = f.first.key();
    append(near(f.second, 1.0) ? k : k + "^" + format_exponent(f.second));
  }
  for (const auto& n : nested) append(canonical_string(n));
  return out.empty() ? "1" : out;
}

inline Expr Term::to_node() const {
  if (is_zero()) return num(0.0);

  std::vector<Expr> parts;
  for (const auto& v : variables) {
    if (std::fabs(v.second) < kEpsilon) continue;
    Expr x = var(v.first);
    parts.push_back(near(v.second, 1.0) ? x : pow(x, num(v.second)));
  }
  for (const auto& f : functions.sorted()) {
    if (std::fabs(f.second) < kEpsilon) continue;
    Expr fn = f.first.to_node();
    parts.push_back(near(f.second, 1.0) ? fn : pow(fn, num(f.second)));
  }
  parts.insert(parts.end(), nested.begin(), nested.end());

  if (parts.empty()) return num(coefficient);

  Expr product = build_product(parts);
  if (near(coefficient, 1.0)) return product;
  if (near(coefficient, -1.0)) return mul(num(-1.0), product);
  return mul(num(coefficient), product);
}

} // namespace symx
