#include <cassert>

#include "symx/ast.hpp"
#include "symx/torch_jit_backend.hpp"

using namespace symx;

int main() {
#ifdef SYMX_WITH_TORCH
  // sin(x) + y lowers to a graph with two inputs and at least one node
  Expr e = add(func("sin", var("x")), var("y"));
  TorchJITBackend tb(e);
  assert(tb.variables.size() == 2);
  assert(tb.variables[0] == "x" && tb.variables[1] == "y");
  auto begin = tb.g.nodes().begin();
  auto end = tb.g.nodes().end();
  assert(begin != end);
#endif
  return 0;
}
