// ============================================================================
// simplify.cpp — Clause-level simplification of CNF / DNF
// ============================================================================

#include "normform/simplify.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace normform {

namespace {

void collect_literals(FormulaId id, NodeKind inner, const FormulaFactory& f,
                      FormulaSet& out) {
    const FormulaNode& n = f.node(id);
    if (n.kind == inner) {
        collect_literals(n.children[0], inner, f, out);
        collect_literals(n.children[1], inner, f, out);
        return;
    }
    if (n.kind == NodeKind::True || n.kind == NodeKind::False || f.is_literal(id)) {
        out.insert(id);
        return;
    }
    throw std::invalid_argument("collect_clauses: not a literal: " + f.to_string(id));
}

void collect_outer(FormulaId id, NodeKind outer, NodeKind inner,
                   const FormulaFactory& f, std::vector<FormulaSet>& out) {
    const FormulaNode& n = f.node(id);
    if (n.kind == outer) {
        collect_outer(n.children[0], outer, inner, f, out);
        collect_outer(n.children[1], outer, inner, f, out);
        return;
    }
    FormulaSet clause;
    collect_literals(id, inner, f, clause);
    out.push_back(std::move(clause));
}

// Sort key of a literal: term name, positive before negated.
using LiteralKey = std::pair<std::string, bool>;

LiteralKey literal_key(FormulaId id, const FormulaFactory& f) {
    return {f.literal_name(id), !f.literal_positive(id)};
}

struct SortedClause {
    std::vector<LiteralKey> keys;
    std::vector<FormulaId>  literals;
};

SortedClause sort_clause(const FormulaSet& clause, const FormulaFactory& f) {
    std::vector<std::pair<LiteralKey, FormulaId>> tagged;
    tagged.reserve(clause.size());
    for (FormulaId lit : clause.elements()) {
        tagged.emplace_back(literal_key(lit, f), lit);
    }
    std::sort(tagged.begin(), tagged.end());

    SortedClause out;
    for (auto& [key, lit] : tagged) {
        out.keys.push_back(std::move(key));
        out.literals.push_back(lit);
    }
    return out;
}

FormulaId make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs,
                      FormulaFactory& f) {
    return kind == NodeKind::And ? f.make_and(lhs, rhs) : f.make_or(lhs, rhs);
}

// Left-associated chain:  ((x0 op x1) op x2) ...
FormulaId build_chain(const std::vector<FormulaId>& items, NodeKind kind,
                      FormulaFactory& f) {
    FormulaId acc = items.front();
    for (std::size_t i = 1; i < items.size(); ++i) {
        acc = make_binary(kind, acc, items[i], f);
    }
    return acc;
}

}  // namespace

// ── collect_clauses ─────────────────────────────────────────────────────────

std::vector<FormulaSet> collect_clauses(FormulaId id, NormalForm form,
                                        const FormulaFactory& f) {
    std::vector<FormulaSet> clauses;
    collect_outer(id, outer_kind(form), inner_kind(form), f, clauses);
    return clauses;
}

// ── simplify ────────────────────────────────────────────────────────────────

FormulaId simplify(FormulaId id, NormalForm form, FormulaFactory& f) {
    const NodeKind outer = outer_kind(form);
    const NodeKind inner = inner_kind(form);

    // CNF: true absorbs an ||-clause, false is its identity.  DNF: dual.
    const FormulaId clause_absorber = form == NormalForm::Cnf ? f.make_true() : f.make_false();
    const FormulaId clause_identity = form == NormalForm::Cnf ? f.make_false() : f.make_true();

    std::vector<FormulaSet> clauses;
    for (const FormulaSet& raw : collect_clauses(id, form, f)) {
        if (raw.contains(clause_absorber)) continue;

        FormulaSet clause;
        bool complementary = false;
        for (FormulaId lit : raw.elements()) {
            if (lit == clause_identity) continue;
            // Interning: the positive literal of ~t is t's own id.
            if (!f.literal_positive(lit) && raw.contains(f.node(lit).children[0])) {
                complementary = true;
                break;
            }
            clause.insert(lit);
        }
        if (complementary) continue;

        // An empty clause is the inner identity, which absorbs the outer
        // connective: the whole formula collapses.
        if (clause.empty()) return clause_identity;

        clauses.push_back(std::move(clause));
    }

    // Merge identical clauses.
    std::sort(clauses.begin(), clauses.end());
    clauses.erase(std::unique(clauses.begin(), clauses.end()), clauses.end());

    // Complementary unit clauses contradict each other (CNF: a && ~a) or
    // cover every case (DNF: a || ~a).
    FormulaSet units;
    for (const FormulaSet& clause : clauses) {
        if (clause.size() == 1) units.insert(clause.elements().front());
    }
    for (FormulaId lit : units.elements()) {
        if (f.node(lit).kind == NodeKind::Not && units.contains(f.node(lit).children[0])) {
            return clause_identity;
        }
    }

    // Drop clauses that strictly contain another clause.
    std::vector<FormulaSet> kept;
    for (std::size_t i = 0; i < clauses.size(); ++i) {
        bool subsumed = false;
        for (std::size_t j = 0; j < clauses.size() && !subsumed; ++j) {
            subsumed = i != j &&
                       clauses[j].size() < clauses[i].size() &&
                       clauses[j].is_subset_of(clauses[i]);
        }
        if (!subsumed) kept.push_back(clauses[i]);
    }

    if (kept.empty()) return clause_absorber;

    // Canonical order: by size, then by the literal keys.
    std::vector<SortedClause> sorted;
    sorted.reserve(kept.size());
    for (const FormulaSet& clause : kept) {
        sorted.push_back(sort_clause(clause, f));
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const SortedClause& a, const SortedClause& b) {
                  if (a.keys.size() != b.keys.size()) return a.keys.size() < b.keys.size();
                  return a.keys < b.keys;
              });

    std::vector<FormulaId> clause_ids;
    clause_ids.reserve(sorted.size());
    for (const SortedClause& clause : sorted) {
        clause_ids.push_back(build_chain(clause.literals, inner, f));
    }
    return build_chain(clause_ids, outer, f);
}

}  // namespace normform
