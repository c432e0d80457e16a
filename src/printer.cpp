// ============================================================================
// printer.cpp — Minimal-parenthesis rendering
// ============================================================================

#include "normform/printer.hpp"

namespace normform {

int precedence(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Implies: return 1;
        case NodeKind::Or:      return 2;
        case NodeKind::And:     return 3;
        case NodeKind::Not:     return 4;
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Term:    return 5;
    }
    return 5;
}

namespace {

void render_into(FormulaId id, const FormulaFactory& f, int context,
                 std::string& out) {
    const FormulaNode& n = f.node(id);
    const int level = precedence(n.kind);
    const bool parens = level < context;

    if (parens) out += '(';

    switch (n.kind) {
        case NodeKind::True:
            out += "true";
            break;
        case NodeKind::False:
            out += "false";
            break;
        case NodeKind::Term:
            out += n.term_name;
            break;
        case NodeKind::Not:
            out += '~';
            render_into(n.children[0], f, level, out);
            break;
        case NodeKind::And:
        case NodeKind::Or:
            // Left-associative: a || b || c is ((a || b) || c).
            render_into(n.children[0], f, level, out);
            out += n.kind == NodeKind::And ? " && " : " || ";
            render_into(n.children[1], f, level + 1, out);
            break;
        case NodeKind::Implies:
            // Right-associative: a => b => c is (a => (b => c)).
            render_into(n.children[0], f, level + 1, out);
            out += " => ";
            render_into(n.children[1], f, level, out);
            break;
    }

    if (parens) out += ')';
}

}  // namespace

std::string render(FormulaId id, const FormulaFactory& f) {
    std::string out;
    render_into(id, f, 0, out);
    return out;
}

}  // namespace normform
