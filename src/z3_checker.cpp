// ============================================================================
// z3_checker.cpp — Z3-backed equivalence checking
// ============================================================================

#include "normform/z3_checker.hpp"

#include <stdexcept>

namespace normform {

const char* equivalence_name(Equivalence e) noexcept {
    switch (e) {
        case Equivalence::Equivalent:    return "equivalent";
        case Equivalence::NotEquivalent: return "NOT equivalent";
        case Equivalence::Unknown:       return "unknown";
    }
    return "?";
}

// ── EquivalenceChecker ──────────────────────────────────────────────────────

EquivalenceChecker::EquivalenceChecker(const FormulaFactory& factory)
    : factory_(factory), ctx_() {}

z3::expr EquivalenceChecker::get_bool_var(const std::string& name) {
    auto it = bool_vars_.find(name);
    if (it != bool_vars_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(name.c_str()));
    z3::expr result = *var;
    bool_vars_[name] = std::move(var);
    return result;
}

z3::expr EquivalenceChecker::to_z3_bool(FormulaId id) {
    const FormulaNode& n = factory_.node(id);

    switch (n.kind) {
        case NodeKind::True:
            return ctx_.bool_val(true);
        case NodeKind::False:
            return ctx_.bool_val(false);

        case NodeKind::Term:
            return get_bool_var(n.term_name);

        case NodeKind::Not:
            return !to_z3_bool(n.children[0]);

        case NodeKind::And: {
            z3::expr lhs = to_z3_bool(n.children[0]);
            z3::expr rhs = to_z3_bool(n.children[1]);
            return lhs && rhs;
        }

        case NodeKind::Or: {
            z3::expr lhs = to_z3_bool(n.children[0]);
            z3::expr rhs = to_z3_bool(n.children[1]);
            return lhs || rhs;
        }

        case NodeKind::Implies: {
            z3::expr lhs = to_z3_bool(n.children[0]);
            z3::expr rhs = to_z3_bool(n.children[1]);
            return z3::implies(lhs, rhs);
        }
    }

    throw std::runtime_error("to_z3_bool: unsupported node kind " +
                             std::string(node_kind_name(n.kind)));
}

std::string EquivalenceChecker::model_to_string(const z3::model& model) {
    std::string result = "{";
    bool first = true;

    for (const auto& entry : bool_vars_) {
        if (!first) {
            result += ", ";
        }
        first = false;

        z3::expr value = model.eval(*entry.second, true);
        result += entry.first + " = " + value.to_string();
    }

    result += "}";
    return result;
}

EquivalenceResult EquivalenceChecker::check(FormulaId lhs, FormulaId rhs) {
    z3::expr a = to_z3_bool(lhs);
    z3::expr b = to_z3_bool(rhs);

    z3::solver solver(ctx_);
    solver.add(a != b);

    EquivalenceResult result;
    switch (solver.check()) {
        case z3::unsat:
            result.verdict = Equivalence::Equivalent;
            break;
        case z3::sat:
            result.verdict = Equivalence::NotEquivalent;
            result.counterexample = model_to_string(solver.get_model());
            break;
        case z3::unknown:
            result.verdict = Equivalence::Unknown;
            break;
    }
    return result;
}

bool EquivalenceChecker::is_valid(FormulaId id) {
    z3::solver solver(ctx_);
    solver.add(!to_z3_bool(id));
    return solver.check() == z3::unsat;
}

}  // namespace normform
