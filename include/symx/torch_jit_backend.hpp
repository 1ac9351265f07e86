#pragma once

#include "symx/ast.hpp"

#ifdef SYMX_WITH_TORCH
  #include <torch/script.h>
  #include <string>
  #include <unordered_map>
  #include <vector>
  #include "symx/error.hpp"
#endif

namespace symx {

#ifdef SYMX_WITH_TORCH
// Lowers an expression tree into a TorchScript graph. One graph input per
// distinct variable, in order of first appearance.
struct TorchJITBackend {
  using result_type = torch::jit::Value*;

  torch::jit::Graph g;
  std::vector<std::string> variables;
  std::vector<torch::jit::Value*> inputs;

  explicit TorchJITBackend(const Expr& e) {
    collect_variables(e);
    for (std::size_t i = 0; i < variables.size(); ++i)
      inputs.push_back(g.addInput(variables[i]));
    g.registerOutput(emit(e));
  }

  result_type emitConst(double v) {
    auto n = g.create(torch::jit::prim::Constant);
    n->output()->setType(c10::TensorType::get());
    n->t_(c10::Symbol::attr("value"), torch::tensor(v));
    g.insertNode(n);
    return n->output();
  }

  result_type emitVar(const std::string& name) {
    for (std::size_t i = 0; i < variables.size(); ++i)
      if (variables[i] == name) return inputs[i];
    throw Error("variable '" + name + "' has no graph input");
  }

  result_type emit(const Expr& e) {
    auto mk = [&](const char* q, std::initializer_list<result_type> xs) {
      auto n = g.create(c10::Symbol::fromQualString(q), xs);
      g.insertNode(n); return n->output();
    };
    switch (e->kind) {
      case NodeKind::Const: return emitConst(e->cval);
      case NodeKind::Var:   return emitVar(e->name);
      case NodeKind::Func: {
        result_type a = emit(e->lhs);
        if (e->name == "sin")  return mk("aten::sin", {a});
        if (e->name == "cos")  return mk("aten::cos", {a});
        if (e->name == "tan")  return mk("aten::tan", {a});
        if (e->name == "exp")  return mk("aten::exp", {a});
        if (e->name == "ln")   return mk("aten::log", {a});
        if (e->name == "sqrt") return mk("aten::sqrt", {a});
        if (e->name == "tanh") return mk("aten::tanh", {a});
        throw Error("function '" + e->name + "' not mapped to Torch JIT");
      }
      default: break;
    }
    result_type a = emit(e->lhs);
    result_type b = emit(e->rhs);
    switch (e->kind) {
      case NodeKind::Add: return mk("aten::add", {a, b});
      case NodeKind::Sub: return mk("aten::sub", {a, b});
      case NodeKind::Mul: return mk("aten::mul", {a, b});
      case NodeKind::Div: return mk("aten::div", {a, b});
      case NodeKind::Pow: return mk("aten::pow", {a, b});
      default: break;
    }
    throw Error("node kind not mapped to Torch JIT");
  }

private:
  void collect_variables(const Expr& e) {
    switch (e->kind) {
      case NodeKind::Const: return;
      case NodeKind::Var:
        for (const auto& v : variables) if (v == e->name) return;
        variables.push_back(e->name);
        return;
      case NodeKind::Func: collect_variables(e->lhs); return;
      default:
        collect_variables(e->lhs);
        collect_variables(e->rhs);
    }
  }
};
#else
struct TorchJITBackend; // stub
#endif

} // namespace symx
