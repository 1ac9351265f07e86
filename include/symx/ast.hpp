#pragma once
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "symx/config.hpp"
#include "symx/error.hpp"

namespace symx {

// Closed set of node kinds. Add..Pow are the binary operators.
enum class NodeKind : uint8_t {
  Const, Var, Func,
  Add, Sub, Mul, Div, Pow
};

inline bool is_binary(NodeKind k) { return k >= NodeKind::Add; }
inline bool is_sum_kind(NodeKind k) { return k == NodeKind::Add || k == NodeKind::Sub; }

struct Node;
using Expr = std::shared_ptr<const Node>;

// Immutable tree node. Func uses `name` and `lhs` (the argument);
// binary kinds use `lhs` and `rhs`.
struct Node {
  NodeKind kind{};
  double cval = 0.0;   // for Const
  std::string name;    // for Var, Func
  Expr lhs;
  Expr rhs;
};

//===========================
// Builders
//===========================
inline Expr num(double v) {
  auto n = std::make_shared<Node>(); n->kind = NodeKind::Const; n->cval = v; return n;
}
inline Expr var(std::string name) {
  auto n = std::make_shared<Node>(); n->kind = NodeKind::Var; n->name = std::move(name); return n;
}
inline Expr func(std::string name, Expr arg) {
  auto n = std::make_shared<Node>();
  n->kind = NodeKind::Func; n->name = std::move(name); n->lhs = std::move(arg);
  return n;
}
inline Expr binary(NodeKind k, Expr a, Expr b) {
  auto n = std::make_shared<Node>();
  n->kind = k; n->lhs = std::move(a); n->rhs = std::move(b);
  return n;
}
inline Expr add(Expr a, Expr b) { return binary(NodeKind::Add, std::move(a), std::move(b)); }
inline Expr sub(Expr a, Expr b) { return binary(NodeKind::Sub, std::move(a), std::move(b)); }
inline Expr mul(Expr a, Expr b) { return binary(NodeKind::Mul, std::move(a), std::move(b)); }
inline Expr div(Expr a, Expr b) { return binary(NodeKind::Div, std::move(a), std::move(b)); }
inline Expr pow(Expr a, Expr b) { return binary(NodeKind::Pow, std::move(a), std::move(b)); }

// Kind tests
inline bool is_const(const Expr& e) { return e->kind == NodeKind::Const; }
inline bool is_var(const Expr& e)   { return e->kind == NodeKind::Var; }
inline bool is_func(const Expr& e)  { return e->kind == NodeKind::Func; }
inline bool is_func(const Expr& e, const char* name) { return e->kind == NodeKind::Func && e->name == name; }
inline bool is_kind(const Expr& e, NodeKind k) { return e->kind == k; }
inline bool is_const_value(const Expr& e, double v) {
  return e->kind == NodeKind::Const && std::fabs(e->cval - v) < kEpsilon;
}
inline bool near(double a, double b) { return std::fabs(a - b) < kEpsilon; }

//===========================
// Structural equality
//===========================
inline bool equal(const Expr& a, const Expr& b) {
  if (a == b) return true;
  if (!a || !b) return false;
  if (a->kind != b->kind) return false;
  switch (a->kind) {
    case NodeKind::Const: return near(a->cval, b->cval);
    case NodeKind::Var:   return a->name == b->name;
    case NodeKind::Func:  return a->name == b->name && equal(a->lhs, b->lhs);
    default:              return equal(a->lhs, b->lhs) && equal(a->rhs, b->rhs);
  }
}

//===========================
// Text
//===========================
inline std::string format_number(double v) {
  if (std::fabs(v - std::round(v)) < kEpsilon && std::fabs(v) < 1e15) {
    long long iv = static_cast<long long>(std::llround(v));
    return fmt::format("{}", iv);
  }
  return fmt::format("{}", v);
}

inline const char* op_symbol(NodeKind k) {
  switch (k) {
    case NodeKind::Add: return "+";
    case NodeKind::Sub: return "-";
    case NodeKind::Mul: return "*";
    case NodeKind::Div: return "/";
    case NodeKind::Pow: return "^";
    default:            return "";
  }
}

inline int precedence(NodeKind k) {
  switch (k) {
    case NodeKind::Add: case NodeKind::Sub: return 1;
    case NodeKind::Mul: case NodeKind::Div: return 2;
    case NodeKind::Pow: return 3;
    default:            return 4;
  }
}

// Presentation rendering with minimal parentheses.
inline std::string to_string(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const: return format_number(e->cval);
    case NodeKind::Var:   return e->name;
    case NodeKind::Func:  return e->name + "(" + to_string(e->lhs) + ")";
    default: break;
  }
  auto child = [&](const Expr& c, bool is_left) {
    std::string s = to_string(c);
    bool paren = false;
    if (is_binary(c->kind)) {
      int pp = precedence(e->kind), cp = precedence(c->kind);
      if (cp < pp) paren = true;
      else if (!is_left && e->kind == NodeKind::Sub && cp == 1) paren = true;
      else if (!is_left && e->kind == NodeKind::Div && cp == 2) paren = true;
      else if (e->kind == NodeKind::Pow && cp == 3) paren = true;
    }
    // keep a leading sign from gluing onto the operator
    if (!paren && !s.empty() && s[0] == '-' && (!is_left || e->kind == NodeKind::Pow)) paren = true;
    return paren ? "(" + s + ")" : s;
  };
  // a + (-k)*b prints as a - k*b
  if (e->kind == NodeKind::Add) {
    const Expr& r = e->rhs;
    if (is_const(r) && r->cval < 0.0) return to_string(sub(e->lhs, num(-r->cval)));
    if (r->kind == NodeKind::Mul && is_const(r->lhs) && r->lhs->cval < 0.0) {
      double k = -r->lhs->cval;
      return to_string(sub(e->lhs, near(k, 1.0) ? r->rhs : mul(num(k), r->rhs)));
    }
  }
  if (e->kind == NodeKind::Mul && is_const(e->lhs)) {
    if (near(e->lhs->cval, -1.0)) return "-" + child(e->rhs, true);
    if (near(e->lhs->cval, 1.0))  return child(e->rhs, true);
  }
  return child(e->lhs, true) + op_symbol(e->kind) + child(e->rhs, false);
}

// Fully parenthesized, layout-independent key. Grouping and ordering only.
inline std::string canonical_string(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const: return format_number(e->cval);
    case NodeKind::Var:   return e->name;
    case NodeKind::Func:  return e->name + "(" + canonical_string(e->lhs) + ")";
    default:
      return "(" + canonical_string(e->lhs) + op_symbol(e->kind) + canonical_string(e->rhs) + ")";
  }
}

//===========================
// Statistics
//===========================
inline int count_nodes(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const: case NodeKind::Var: return 1;
    case NodeKind::Func: return 1 + count_nodes(e->lhs);
    default: return 1 + count_nodes(e->lhs) + count_nodes(e->rhs);
  }
}
inline int count_kind(const Expr& e, NodeKind k) {
  switch (e->kind) {
    case NodeKind::Const: case NodeKind::Var: return 0;
    case NodeKind::Func: return (k == NodeKind::Func ? 1 : 0) + count_kind(e->lhs, k);
    default: return (e->kind == k ? 1 : 0) + count_kind(e->lhs, k) + count_kind(e->rhs, k);
  }
}
inline int count_divisions(const Expr& e) { return count_kind(e, NodeKind::Div); }
inline int count_powers(const Expr& e)    { return count_kind(e, NodeKind::Pow); }
inline int count_functions(const Expr& e) { return count_kind(e, NodeKind::Func); }

//===========================
// Numeric evaluation
//===========================
using Bindings = std::unordered_map<std::string, double>;

inline double apply_function(const std::string& name, double a) {
  if (name == "sin")  return std::sin(a);
  if (name == "cos")  return std::cos(a);
  if (name == "tan")  return std::tan(a);
  if (name == "cot")  return 1.0 / std::tan(a);
  if (name == "sec")  return 1.0 / std::cos(a);
  if (name == "csc")  return 1.0 / std::sin(a);
  if (name == "exp")  return std::exp(a);
  if (name == "ln")   return std::log(a);
  if (name == "log")  return std::log10(a);
  if (name == "sqrt") return std::sqrt(a);
  if (name == "abs")  return std::fabs(a);
  if (name == "sinh") return std::sinh(a);
  if (name == "cosh") return std::cosh(a);
  if (name == "tanh") return std::tanh(a);
  if (name == "asin" || name == "arcsin") return std::asin(a);
  if (name == "acos" || name == "arccos") return std::acos(a);
  if (name == "atan" || name == "arctan") return std::atan(a);
  throw EvalError("unknown function '" + name + "'");
}

inline double evaluate(const Expr& e, const Bindings& vars) {
  switch (e->kind) {
    case NodeKind::Const: return e->cval;
    case NodeKind::Var: {
      auto it = vars.find(e->name);
      if (it == vars.end()) throw EvalError("unbound variable '" + e->name + "'");
      return it->second;
    }
    case NodeKind::Func: return apply_function(e->name, evaluate(e->lhs, vars));
    case NodeKind::Add:  return evaluate(e->lhs, vars) + evaluate(e->rhs, vars);
    case NodeKind::Sub:  return evaluate(e->lhs, vars) - evaluate(e->rhs, vars);
    case NodeKind::Mul:  return evaluate(e->lhs, vars) * evaluate(e->rhs, vars);
    case NodeKind::Div:  return evaluate(e->lhs, vars) / evaluate(e->rhs, vars);
    case NodeKind::Pow:  return std::pow(evaluate(e->lhs, vars), evaluate(e->rhs, vars));
  }
  return 0.0;
}

//===========================
// Operator sugar (opt in with `using namespace symx::ops;`)
//===========================
namespace ops {
inline Expr operator+(Expr a, Expr b) { return add(std::move(a), std::move(b)); }
inline Expr operator-(Expr a, Expr b) { return sub(std::move(a), std::move(b)); }
inline Expr operator*(Expr a, Expr b) { return mul(std::move(a), std::move(b)); }
inline Expr operator/(Expr a, Expr b) { return div(std::move(a), std::move(b)); }
inline Expr operator+(double a, Expr b) { return add(num(a), std::move(b)); }
inline Expr operator+(Expr a, double b) { return add(std::move(a), num(b)); }
inline Expr operator-(double a, Expr b) { return sub(num(a), std::move(b)); }
inline Expr operator-(Expr a, double b) { return sub(std::move(a), num(b)); }
inline Expr operator*(double a, Expr b) { return mul(num(a), std::move(b)); }
inline Expr operator*(Expr a, double b) { return mul(std::move(a), num(b)); }
inline Expr operator/(double a, Expr b) { return div(num(a), std::move(b)); }
inline Expr operator/(Expr a, double b) { return div(std::move(a), num(b)); }

inline Expr sin(Expr a)  { return func("sin", std::move(a)); }
inline Expr cos(Expr a)  { return func("cos", std::move(a)); }
inline Expr tan(Expr a)  { return func("tan", std::move(a)); }
inline Expr exp(Expr a)  { return func("exp", std::move(a)); }
inline Expr ln(Expr a)   { return func("ln", std::move(a)); }
inline Expr sqrt(Expr a) { return func("sqrt", std::move(a)); }
} // namespace ops

} // namespace symx
