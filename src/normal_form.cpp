// ============================================================================
// normal_form.cpp — CNF / DNF distribution
// ============================================================================

#include "normform/normal_form.hpp"

#include <stdexcept>

namespace normform {

const char* normal_form_name(NormalForm form) noexcept {
    switch (form) {
        case NormalForm::Cnf: return "CNF";
        case NormalForm::Dnf: return "DNF";
    }
    return "?";
}

NodeKind outer_kind(NormalForm form) noexcept {
    return form == NormalForm::Cnf ? NodeKind::And : NodeKind::Or;
}

NodeKind inner_kind(NormalForm form) noexcept {
    return form == NormalForm::Cnf ? NodeKind::Or : NodeKind::And;
}

namespace {

FormulaId make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs,
                      FormulaFactory& f) {
    return kind == NodeKind::And ? f.make_and(lhs, rhs) : f.make_or(lhs, rhs);
}

// Join two formulas that are already in normal form with the inner
// connective, pushing it below any outer connective on either side.
FormulaId join_inner(FormulaId lhs, FormulaId rhs, NodeKind outer,
                     NodeKind inner, FormulaFactory& f) {
    FormulaId l0 = f.node(lhs).children[0];
    FormulaId l1 = f.node(lhs).children[1];
    if (f.node(lhs).kind == outer) {
        auto c0 = join_inner(l0, rhs, outer, inner, f);
        auto c1 = join_inner(l1, rhs, outer, inner, f);
        return make_binary(outer, c0, c1, f);
    }

    FormulaId r0 = f.node(rhs).children[0];
    FormulaId r1 = f.node(rhs).children[1];
    if (f.node(rhs).kind == outer) {
        auto c0 = join_inner(lhs, r0, outer, inner, f);
        auto c1 = join_inner(lhs, r1, outer, inner, f);
        return make_binary(outer, c0, c1, f);
    }

    return make_binary(inner, lhs, rhs, f);
}

FormulaId distribute_rec(FormulaId id, NodeKind outer, NodeKind inner,
                         FormulaFactory& f) {
    NodeKind kind = f.node(id).kind;
    FormulaId child0 = f.node(id).children[0];
    FormulaId child1 = f.node(id).children[1];

    switch (kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Term:
        case NodeKind::Not:
            return id;

        case NodeKind::And:
        case NodeKind::Or: {
            auto c0 = distribute_rec(child0, outer, inner, f);
            auto c1 = distribute_rec(child1, outer, inner, f);
            if (kind == outer) {
                return make_binary(outer, c0, c1, f);
            }
            return join_inner(c0, c1, outer, inner, f);
        }

        case NodeKind::Implies:
            break;
    }

    throw std::invalid_argument("distribute: formula is not in NNF: " +
                                f.to_string(id));
}

// Clause level: only inner connectives and literals below.
bool is_clause(FormulaId id, NodeKind inner, const FormulaFactory& f) {
    const FormulaNode& n = f.node(id);
    if (n.kind == inner) {
        return is_clause(n.children[0], inner, f) &&
               is_clause(n.children[1], inner, f);
    }
    switch (n.kind) {
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Term:
            return true;
        case NodeKind::Not:
            return f.node(n.children[0]).kind == NodeKind::Term;
        default:
            return false;
    }
}

}  // namespace

FormulaId distribute(FormulaId nnf, NormalForm form, FormulaFactory& f) {
    return distribute_rec(nnf, outer_kind(form), inner_kind(form), f);
}

FormulaId to_cnf(FormulaId nnf, FormulaFactory& f) {
    return distribute(nnf, NormalForm::Cnf, f);
}

FormulaId to_dnf(FormulaId nnf, FormulaFactory& f) {
    return distribute(nnf, NormalForm::Dnf, f);
}

bool is_normal_form(FormulaId id, NormalForm form, const FormulaFactory& f) {
    const FormulaNode& n = f.node(id);
    if (n.kind == outer_kind(form)) {
        return is_normal_form(n.children[0], form, f) &&
               is_normal_form(n.children[1], form, f);
    }
    return is_clause(id, inner_kind(form), f);
}

}  // namespace normform
