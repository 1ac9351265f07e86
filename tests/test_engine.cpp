#include <algorithm>
#include <cassert>
#include <cmath>
#include <string>
#include <vector>

#include "symx/ast.hpp"
#include "symx/canonicalize.hpp"
#include "symx/engine.hpp"
#include "symx/log.hpp"

using namespace symx;

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps * (1.0 + std::max(std::fabs(a), std::fabs(b)));
}

static void check_forms(const SimplificationForms& forms, const Expr& input) {
  assert(!forms.empty());
  for (std::size_t i = 0; i < forms.size(); ++i) {
    for (std::size_t j = i + 1; j < forms.size(); ++j)
      assert(!equal(forms.forms[i].expression, forms.forms[j].expression));
    for (double xv : { 0.4, 1.3, 2.2 }) {
      Bindings b{ {"x", xv}, {"y", 0.9} };
      assert(approx(evaluate(forms.forms[i].expression, b), evaluate(input, b)));
    }
  }
}

static bool has_rendering(const SimplificationForms& forms, const std::string& s) {
  for (const auto& f : forms.forms) if (to_string(f.expression) == s) return true;
  return false;
}

int main() {
  set_log_level(LogLevel::Off);
  Expr x = var("x"), y = var("y");
  Expr sx = func("sin", x), cx = func("cos", x), ex = func("exp", x);

  // Cleanup passes
  {
    assert(equal(fold_constants(add(num(2), num(3))), num(5)));
    assert(equal(fold_constants(mul(x, add(num(1), num(1)))), mul(x, num(2))));
    assert(equal(fold_constants(div(num(1), num(0))), div(num(1), num(0))));
    assert(equal(fold_constants(pow(num(-8), num(0.5))), pow(num(-8), num(0.5))));
    assert(equal(fold_constants(pow(num(0), num(-1))), pow(num(0), num(-1))));
    assert(equal(fold_constants(func("sqrt", pow(num(2), num(2)))), func("sqrt", num(4))));

    assert(equal(remove_zero_terms(add(num(0), x)), x));
    assert(equal(remove_zero_terms(add(x, num(0))), x));
    assert(equal(remove_zero_terms(mul(x, num(0))), num(0)));
    assert(equal(remove_zero_terms(add(y, mul(num(0), x))), y));

    assert(equal(remove_one_factors(mul(num(1), x)), x));
    assert(equal(remove_one_factors(mul(x, num(1))), x));
    assert(equal(remove_one_factors(div(x, num(1))), div(x, num(1))));

    assert(equal(simplify_powers(pow(x, num(1))), x));
    assert(equal(simplify_powers(pow(sx, num(0))), num(1)));
    assert(equal(simplify_powers(pow(x, num(2))), pow(x, num(2))));
  }

  // A failing step keeps the value it was given
  {
    Expr kept = try_apply("boom", x, [](const Expr&) -> Expr { throw Error("boom"); });
    assert(kept == x);
  }

  // Full pipeline reaches a fixed point
  {
    Expr e = add(mul(add(x, num(1)), add(x, num(1))), mul(num(0), y));
    Expr s = iterative_simplify(e);
    assert(to_string(s) == "x^2+2*x+1");
    assert(equal(iterative_simplify(s), s));
  }

  // Pythagorean input: expanded and trig forms differ
  {
    Expr e = add(pow(sx, num(2)), pow(cx, num(2)));
    SimplificationForms forms = generate_multiple_forms(e);
    check_forms(forms, e);
    assert(forms.size() == 2);
    assert(forms.forms[0].label == "expanded");
    assert(forms.forms[0].kind == FormKind::Expanded);
    assert(forms.forms[1].label == "trig simplified");
    assert(equal(forms.forms[1].expression, num(1)));
    assert(equal(prepare_for_differentiation(e), num(1)));
  }

  // exp cancellation survives the orchestrator
  {
    Expr e = div(mul(ex, sub(cx, sx)), pow(ex, num(2)));
    SimplificationForms forms = generate_multiple_forms(e);
    check_forms(forms, e);
    assert(has_rendering(forms, "(cos(x)-sin(x))/exp(x)"));
    Expr best = prepare_for_differentiation(e);
    assert(to_string(best) == "(cos(x)-sin(x))/exp(x)");
  }

  // Whole-expression factoring is not an orchestrator strategy
  {
    Expr e = add(mul(num(6), pow(x, num(3))), mul(num(9), pow(x, num(2))));
    SimplificationForms forms = generate_multiple_forms(e);
    check_forms(forms, e);
    assert(forms.size() == 1);
    assert(!has_rendering(forms, "3*x^2*(2*x+3)"));

    Expr linear = add(mul(num(2), x), num(4));
    assert(equal(strategy::factor(linear), canonicalize(linear)));
  }

  // The factor strategy takes the factored numerator of a fraction
  {
    Expr e = div(add(mul(x, ex), ex), ex);
    Expr f = strategy::factor(e);
    assert(f->kind == NodeKind::Div);
    assert(f->lhs->kind == NodeKind::Mul);
    assert(equal(f->lhs->lhs, ex));
    check_forms(generate_multiple_forms(e), e);
  }

  // Constant powers with no real value still deduplicate
  {
    SimplificationForms root = generate_multiple_forms(add(x, pow(num(-8), num(0.5))));
    assert(root.size() == 1);
    assert(to_string(root.forms[0].expression) == "x+(-8)^0.5");

    SimplificationForms pole = generate_multiple_forms(add(x, pow(num(0), num(-1))));
    assert(pole.size() == 1);
    assert(count_powers(pole.forms[0].expression) == 1);
  }

  // Debug output is skipped above the debug threshold
  {
    set_log_level(LogLevel::Info);
    assert(!log_enabled(LogLevel::Debug));
    Expr e = div(add(mul(x, ex), ex), ex);
    assert(equal(iterative_simplify(iterative_simplify(e)), iterative_simplify(e)));
    assert(!generate_all_forms(canonicalize(e)).empty());
    assert(!generate_multiple_forms(e).empty());
    set_log_level(LogLevel::Off);
  }

  // Mixed input
  {
    Expr e = add(mul(mul(num(2), sx), cx), mul(y, add(x, y)));
    check_forms(generate_multiple_forms(e), e);
  }

  // Facade
  {
    Simplifier s;
    Expr e = add(mul(num(2), x), mul(num(4), y));
    SimplificationForms forms = s.simplify_to_multiple_forms(e);
    assert(forms.forms[0].label == "standard form");
    assert(forms.size() == 2);
    assert(equal(s.simplify(mul(add(x, num(1)), add(x, num(1)))),
                 canonicalize(add(add(pow(x, num(2)), mul(num(2), x)), num(1)))));
    assert(s.select_best_for_differentiation(forms.expressions()) == e);
  }

  return 0;
}
