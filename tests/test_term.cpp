#include <cassert>
#include <cmath>

#include "symx/ast.hpp"
#include "symx/term.hpp"

using namespace symx;

int main() {
  Expr x = var("x"), y = var("y");
  Expr sx = func("sin", x);

  // Decomposition
  {
    Term t = Term::from_node(mul(num(3), pow(x, num(2))));
    assert(t.coefficient == 3.0);
    assert(t.variables.size() == 1 && t.variables.at("x") == 2.0);
    assert(t.functions.empty() && t.nested.empty());
    assert(t.total_degree() == 2.0);
  }
  {
    Term t = Term::from_node(mul(sx, pow(sx, num(2))));
    assert(t.functions.size() == 1);
    assert(t.functions.get(FunctionKey::of(sx)) == 3.0);
  }
  {
    // x * x^-1 leaves no variable entry
    Term t = Term::from_node(mul(x, pow(x, num(-1))));
    assert(t.is_constant());
  }
  {
    Term sum = Term::from_node(add(x, y));
    assert(sum.nested.size() == 1);
    Term odd_root = Term::from_node(pow(num(-8), num(0.5)));
    assert(odd_root.nested.size() == 1);
    Term folded = Term::from_node(pow(num(2), num(3)));
    assert(folded.is_constant() && folded.coefficient == 8.0);
  }

  // Base keys
  {
    assert(Term::from_node(mul(num(3), mul(pow(x, num(2)), y))).base_key() == "x^2*y");
    assert(Term::from_node(mul(sx, x)).base_key() == "x*sin(x)");
    assert(Term::constant(7).base_key() == "1");
    assert(Term::from_node(mul(y, x)).base_key() == Term::from_node(mul(x, y)).base_key());
  }

  // Like terms need identical function exponents
  {
    Term a = Term::from_node(mul(pow(sx, num(2)), y));
    Term b = Term::from_node(mul(pow(sx, num(3)), y));
    Term c = Term::from_node(mul(num(4), mul(y, pow(sx, num(2)))));
    assert(!a.is_similar_to(b));
    assert(!a.merge_with(b).has_value());
    assert(a.is_similar_to(c));
    auto m = a.merge_with(c);
    assert(m.has_value() && m->coefficient == 5.0);
  }

  // Rendering back to a node
  {
    assert(equal(Term::from_node(mul(num(2), x)).to_node(), mul(num(2), x)));
    assert(equal(Term::from_node(mul(num(-1), x)).to_node(), mul(num(-1), x)));
    assert(equal(Term::from_node(x).to_node(), x));
    assert(equal(Term::from_node(mul(y, x)).to_node(), mul(x, y)));
    assert(equal(Term::from_node(mul(pow(sx, num(2)), x)).to_node(), mul(x, pow(sx, num(2)))));
    assert(equal(Term::constant(0).to_node(), num(0)));
    assert(equal(Term::constant(4).to_node(), num(4)));
  }

  // Arithmetic on terms
  {
    Term q = divide(Term::from_node(mul(num(6), pow(x, num(3)))), Term::from_node(mul(num(2), x)));
    assert(q.coefficient == 3.0);
    assert(q.variables.at("x") == 2.0);

    Term p = multiply(Term::from_node(mul(num(2), sx)), Term::from_node(mul(num(3), x)));
    assert(p.coefficient == 6.0);
    assert(p.functions.get(FunctionKey::of(sx)) == 1.0);
    assert(p.variables.at("x") == 1.0);
  }

  // Addend flattening
  {
    auto parts = collect_addends(sub(add(x, y), num(2)));
    assert(parts.size() == 3);
    assert(equal(parts[2], num(-2)));
    assert(equal(build_sum({}), num(0)));
    assert(equal(build_product({}), num(1)));
  }

  return 0;
}
