#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "symx/ast.hpp"
#include "symx/error.hpp"
#include "symx/form_generator.hpp"
#include "symx/log.hpp"

namespace symx {

// Estimated work for a differentiation pass over `e`. Products, quotients and
// non-constant powers weigh more than sums because their rules fan out.
inline double differentiation_cost(const Expr& e) {
  switch (e->kind) {
    case NodeKind::Const: return 0.0;
    case NodeKind::Var:   return 1.0;
    case NodeKind::Func:  return 3.0 + differentiation_cost(e->lhs);
    case NodeKind::Add:
    case NodeKind::Sub:
      return differentiation_cost(e->lhs) + differentiation_cost(e->rhs) + 1.0;
    case NodeKind::Mul:
      return (differentiation_cost(e->lhs) + differentiation_cost(e->rhs)) * 2.0;
    case NodeKind::Div:
      return (differentiation_cost(e->lhs) + differentiation_cost(e->rhs)) * 3.0;
    case NodeKind::Pow:
      if (is_const(e->rhs)) return 2.0 * differentiation_cost(e->lhs) + 2.0;
      return (differentiation_cost(e->lhs) + differentiation_cost(e->rhs)) * 4.0;
  }
  return 0.0;
}

inline std::string form_statistics(const Expr& e) {
  return fmt::format("nodes={} divisions={} powers={} functions={} cost={}",
                     count_nodes(e), count_divisions(e), count_powers(e),
                     count_functions(e), differentiation_cost(e));
}

namespace detail {
template <class T, class Get>
std::size_t cheapest_index(const std::vector<T>& items, Get get) {
  std::size_t best = 0;
  double best_cost = differentiation_cost(get(items[0]));
  for (std::size_t i = 1; i < items.size(); ++i) {
    double c = differentiation_cost(get(items[i]));
    if (c < best_cost) { best = i; best_cost = c; }
  }
  if (log_enabled(LogLevel::Debug)) {
    for (std::size_t i = 0; i < items.size(); ++i)
      log_debug("select", "{}{} [{}]", i == best ? "* " : "  ",
                to_string(get(items[i])), form_statistics(get(items[i])));
  }
  return best;
}
} // namespace detail

// Lowest-cost candidate; the first one wins a tie.
inline Expr select_best_for_differentiation(const std::vector<Expr>& candidates) {
  if (candidates.empty()) throw EmptyInputError("no candidate forms to select from");
  if (candidates.size() == 1) return candidates.front();
  return candidates[detail::cheapest_index(candidates, [](const Expr& e) -> const Expr& { return e; })];
}

inline SimplifiedForm select_best_for_differentiation(const SimplificationForms& forms) {
  if (forms.empty()) throw EmptyInputError("no candidate forms to select from");
  if (forms.size() == 1) return forms.forms.front();
  return forms.forms[detail::cheapest_index(forms.forms,
                                            [](const SimplifiedForm& f) -> const Expr& { return f.expression; })];
}

} // namespace symx
