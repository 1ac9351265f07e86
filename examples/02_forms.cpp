#include <iostream>

#include "symx/ast.hpp"
#include "symx/engine.hpp"

int main() {
  using namespace symx;
  using namespace symx::ops;
  Expr x = var("x");

  // d/dx of exp(x)*... often arrives like this
  Expr e = (exp(x) * (cos(x) - sin(x))) / pow(exp(x), num(2));

  SimplificationForms forms = generate_multiple_forms(e);
  std::cout << to_string(e) << "\n";
  for (const auto& f : forms.display_forms())
    std::cout << "  [" << form_kind_name(f.kind) << "] " << f.label << ": "
              << to_string(f.expression) << "\n";
  return 0;
}
