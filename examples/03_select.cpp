#include <iostream>

#include "symx/ast.hpp"
#include "symx/engine.hpp"
#include "symx/form_selector.hpp"
#ifdef SYMX_WITH_TORCH
#include "symx/torch_jit_backend.hpp"
#endif

int main() {
  using namespace symx;
  using namespace symx::ops;
  Expr x = var("x");

  Expr e = 6.0 * pow(x, num(3)) + 9.0 * pow(x, num(2));
  SimplificationForms forms = generate_multiple_forms(e);
  for (const auto& f : forms.forms)
    std::cout << f.label << ": " << to_string(f.expression)
              << "  [" << form_statistics(f.expression) << "]\n";

  Expr best = prepare_for_differentiation(e);
  std::cout << "best for differentiation: " << to_string(best) << "\n";
  std::cout << "value at x=1.5: " << evaluate(best, Bindings{ {"x", 1.5} }) << "\n";

#ifdef SYMX_WITH_TORCH
  TorchJITBackend tb(best);
  std::cout << "torch graph:\n" << tb.g.toString() << "\n";
#endif
  return 0;
}
