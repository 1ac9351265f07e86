#include <algorithm>
#include <cassert>
#include <cmath>
#include <string>

#include "symx/ast.hpp"

using namespace symx;

static bool approx(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps * (1.0 + std::max(std::fabs(a), std::fabs(b)));
}

int main() {
  Expr x = var("x"), y = var("y"), z = var("z");

  // Structural equality with tolerance on numbers
  {
    assert(equal(num(1.0), num(1.0 + 1e-12)));
    assert(!equal(num(1.0), num(1.001)));
    assert(!equal(x, y));
    assert(equal(add(x, mul(num(2), y)), add(var("x"), mul(num(2), var("y")))));
    assert(!equal(add(x, y), add(y, x)));
    assert(!equal(func("sin", x), func("cos", x)));
  }

  // Rendering
  {
    assert(to_string(add(x, mul(num(2), y))) == "x+2*y");
    assert(to_string(sub(x, add(y, num(1)))) == "x-(y+1)");
    assert(to_string(div(x, mul(y, z))) == "x/(y*z)");
    assert(to_string(mul(add(x, num(1)), y)) == "(x+1)*y");
    assert(to_string(pow(x, num(2))) == "x^2");
    assert(to_string(pow(pow(x, num(2)), num(3))) == "(x^2)^3");
    assert(to_string(mul(num(-1), x)) == "-x");
    assert(to_string(mul(num(2.5), x)) == "2.5*x");
    assert(to_string(add(x, mul(num(-1), y))) == "x-y");
    assert(to_string(add(x, mul(num(-3), y))) == "x-3*y");
    assert(to_string(add(x, num(-4))) == "x-4");
    assert(to_string(func("sin", mul(num(2), x))) == "sin(2*x)");
    assert(canonical_string(add(x, mul(num(2), y))) == "(x+(2*y))");
  }

  // Statistics
  {
    Expr e = div(add(x, func("exp", x)), pow(y, num(2)));
    assert(count_nodes(e) == 8);
    assert(count_divisions(e) == 1);
    assert(count_powers(e) == 1);
    assert(count_functions(e) == 1);
  }

  // Evaluation
  {
    Bindings b{ {"x", 3.0}, {"y", 0.5} };
    assert(approx(evaluate(add(x, num(2)), b), 5.0));
    assert(approx(evaluate(div(x, y), b), 6.0));
    assert(approx(evaluate(pow(x, num(2)), b), 9.0));
    assert(approx(evaluate(func("sin", y), b), std::sin(0.5)));
    assert(approx(evaluate(func("sec", y), b), 1.0 / std::cos(0.5)));

    bool threw = false;
    try { evaluate(var("q"), b); } catch (const EvalError&) { threw = true; }
    assert(threw);

    threw = false;
    try { evaluate(func("foo", x), b); } catch (const Error&) { threw = true; }
    assert(threw);
  }

  // Operator sugar
  {
    using namespace symx::ops;
    Expr e = 2.0 * x + sin(y) / x;
    assert(equal(e, add(mul(num(2), x), div(func("sin", y), x))));
  }

  return 0;
}
