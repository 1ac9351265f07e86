#include <iostream>

#include "symx/ast.hpp"
#include "symx/canonicalize.hpp"
#include "symx/trig.hpp"

int main() {
  using namespace symx;
  using namespace symx::ops;
  Expr x = var("x"), y = var("y");

  // (x+1)^2 - 2*x*y + 3*x*y
  Expr e = pow(x + 1.0, num(2)) - 2.0 * x * y + 3.0 * x * y;
  std::cout << "input:     " << to_string(e) << "\n";
  std::cout << "canonical: " << to_string(canonicalize(e)) << "\n";

  Expr t = 2.0 * sin(x) * cos(x) + pow(sin(y), num(2)) + pow(cos(y), num(2));
  std::cout << "trig:      " << to_string(t) << " -> " << to_string(trig::simplify(t)) << "\n";
  return 0;
}
