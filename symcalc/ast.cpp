// ast.cpp - Expression syntax tree

#include "ast.hpp"
#include <cctype>
#include <utility>

namespace symcalc {

const char* ast_node_type_name(AstNodeType type) {
    switch (type) {
    case AstNodeType::LITERAL: return "LITERAL";
    case AstNodeType::VARIABLE: return "VARIABLE";
    case AstNodeType::UNARY: return "UNARY";
    case AstNodeType::BINARY: return "BINARY";
    case AstNodeType::CALL: return "CALL";
    case AstNodeType::FUNCTION_DEF: return "FUNCTION_DEF";
    case AstNodeType::MATRIX: return "MATRIX";
    case AstNodeType::VECTOR: return "VECTOR";
    case AstNodeType::SPACE: return "SPACE";
    }
    return "UNKNOWN";
}

// ============================================================================
// Construction
// ============================================================================

AstPtr make_literal(const Decimal& value) {
    AstPtr node(new AstNode(AstNodeType::LITERAL));
    node->value = value;
    return node;
}

AstPtr make_literal_int(int64_t value) {
    return make_literal(Decimal::from_int(value));
}

AstPtr make_variable(const std::string& name) {
    AstPtr node(new AstNode(AstNodeType::VARIABLE));
    node->name = name;
    return node;
}

AstPtr make_unary(UnarySign sign, AstPtr body) {
    AstPtr node(new AstNode(AstNodeType::UNARY));
    node->sign = sign;
    node->body = std::move(body);
    return node;
}

AstPtr make_binary(Operator op, AstPtr left, AstPtr right, bool attached) {
    AstPtr node(new AstNode(AstNodeType::BINARY));
    node->op = op;
    node->left = std::move(left);
    node->right = std::move(right);
    node->attached = attached && op == Operator::MULT;
    return node;
}

AstPtr make_call(const std::string& name, std::vector<AstPtr> args) {
    AstPtr node(new AstNode(AstNodeType::CALL));
    node->name = name;
    node->items = std::move(args);
    return node;
}

AstPtr make_function_def(const std::string& name, std::vector<std::string> params, AstPtr body) {
    AstPtr node(new AstNode(AstNodeType::FUNCTION_DEF));
    node->name = name;
    node->params = std::move(params);
    node->body = std::move(body);
    return node;
}

AstPtr make_vector(std::vector<AstPtr> elements) {
    AstPtr node(new AstNode(AstNodeType::VECTOR));
    node->items = std::move(elements);
    return node;
}

AstPtr make_matrix(std::vector<AstPtr> rows) {
    AstPtr node(new AstNode(AstNodeType::MATRIX));
    node->items = std::move(rows);
    return node;
}

AstPtr make_space() {
    return AstPtr(new AstNode(AstNodeType::SPACE));
}

// ============================================================================
// Clone / Substitute
// ============================================================================

AstPtr ast_clone(const AstNode* node) {
    if (!node) return nullptr;
    AstPtr copy(new AstNode(node->type));
    copy->column = node->column;
    copy->value = node->value;
    copy->name = node->name;
    copy->op = node->op;
    copy->sign = node->sign;
    copy->attached = node->attached;
    copy->left = ast_clone(node->left.get());
    copy->right = ast_clone(node->right.get());
    copy->body = ast_clone(node->body.get());
    copy->items.reserve(node->items.size());
    for (const AstPtr& item : node->items) copy->items.push_back(ast_clone(item.get()));
    copy->params = node->params;
    return copy;
}

AstPtr ast_substitute(const AstNode* node, const AstBindings& bindings) {
    if (!node) return nullptr;
    if (node->type == AstNodeType::VARIABLE) {
        auto it = bindings.find(node->name);
        if (it != bindings.end() && it->second) return ast_clone(it->second);
        return ast_clone(node);
    }
    if (node->type == AstNodeType::FUNCTION_DEF) {
        // parameters shadow outer bindings inside the body
        AstBindings inner = bindings;
        for (const std::string& p : node->params) inner.erase(p);
        AstPtr copy = make_function_def(node->name, node->params, ast_substitute(node->body.get(), inner));
        copy->column = node->column;
        return copy;
    }
    AstPtr copy(new AstNode(node->type));
    copy->column = node->column;
    copy->value = node->value;
    copy->name = node->name;
    copy->op = node->op;
    copy->sign = node->sign;
    copy->attached = node->attached;
    copy->left = ast_substitute(node->left.get(), bindings);
    copy->right = ast_substitute(node->right.get(), bindings);
    copy->body = ast_substitute(node->body.get(), bindings);
    copy->items.reserve(node->items.size());
    for (const AstPtr& item : node->items) copy->items.push_back(ast_substitute(item.get(), bindings));
    copy->params = node->params;
    return copy;
}

bool ast_contains_variable(const AstNode* node, const std::string& name) {
    if (!node) return false;
    switch (node->type) {
    case AstNodeType::VARIABLE:
        return name.empty() || node->name == name;
    case AstNodeType::LITERAL:
    case AstNodeType::SPACE:
        return false;
    case AstNodeType::FUNCTION_DEF:
        for (const std::string& p : node->params) {
            if (p == name) return false;
        }
        return ast_contains_variable(node->body.get(), name);
    case AstNodeType::UNARY:
        return ast_contains_variable(node->body.get(), name);
    case AstNodeType::BINARY:
        return ast_contains_variable(node->left.get(), name) ||
               ast_contains_variable(node->right.get(), name);
    case AstNodeType::CALL:
    case AstNodeType::VECTOR:
    case AstNodeType::MATRIX:
        for (const AstPtr& item : node->items) {
            if (ast_contains_variable(item.get(), name)) return true;
        }
        return false;
    }
    return false;
}

bool ast_equals(const AstNode* a, const AstNode* b) {
    if (a == b) return true;
    if (!a || !b || a->type != b->type) return false;
    switch (a->type) {
    case AstNodeType::LITERAL:
        return a->value == b->value;
    case AstNodeType::VARIABLE:
        return a->name == b->name;
    case AstNodeType::UNARY:
        return a->sign == b->sign && ast_equals(a->body.get(), b->body.get());
    case AstNodeType::BINARY:
        return a->op == b->op && ast_equals(a->left.get(), b->left.get()) &&
               ast_equals(a->right.get(), b->right.get());
    case AstNodeType::FUNCTION_DEF:
        if (a->params != b->params) return false;
        if (a->name != b->name) return false;
        return ast_equals(a->body.get(), b->body.get());
    case AstNodeType::CALL:
    case AstNodeType::VECTOR:
    case AstNodeType::MATRIX:
        if (a->name != b->name || a->items.size() != b->items.size()) return false;
        for (size_t i = 0; i < a->items.size(); i++) {
            if (!ast_equals(a->items[i].get(), b->items[i].get())) return false;
        }
        return true;
    case AstNodeType::SPACE:
        return true;
    }
    return false;
}

// ============================================================================
// Rendering
// ============================================================================

std::string ast_value(const AstNode* node) {
    if (!node) return "";
    switch (node->type) {
    case AstNodeType::LITERAL: return node->value.to_string();
    case AstNodeType::VARIABLE:
    case AstNodeType::CALL:
    case AstNodeType::FUNCTION_DEF: return node->name;
    case AstNodeType::UNARY: return node->sign == UnarySign::NEGATIVE ? "-" : "+";
    case AstNodeType::BINARY: return operator_symbol(node->op);
    case AstNodeType::MATRIX:
    case AstNodeType::VECTOR:
    case AstNodeType::SPACE: return ast_node_type_name(node->type);
    }
    return "";
}

#define RENDER_PREC_ATOM 6

static int render_precedence(const AstNode* node) {
    switch (node->type) {
    case AstNodeType::BINARY: return operator_precedence(node->op);
    case AstNodeType::UNARY: return SYMCALC_PREC_UNARY;
    case AstNodeType::LITERAL:
        return node->value.is_negative() ? SYMCALC_PREC_UNARY : RENDER_PREC_ATOM;
    case AstNodeType::FUNCTION_DEF: return 0;
    default: return RENDER_PREC_ATOM;
    }
}

static std::string wrap(const std::string& s) { return "(" + s + ")"; }

static std::string render_child(const AstNode* child, bool needs_parens) {
    std::string text = ast_render(child);
    return needs_parens ? wrap(text) : text;
}

// `*` can be dropped when the left side ends in a digit or `)` and the right
// side starts with a letter or `(`, e.g. 2x, 3(x+1), (a)(b).
static bool can_omit_star(const std::string& left, const std::string& right) {
    if (left.empty() || right.empty()) return false;
    char l = left.back(), r = right.front();
    bool left_ok = isdigit((unsigned char)l) || l == ')';
    bool right_ok = isalpha((unsigned char)r) || r == '_' || r == '(';
    return left_ok && right_ok;
}

static std::string render_binary(const AstNode* node) {
    int prec = operator_precedence(node->op);
    bool right_assoc = operator_is_right_assoc(node->op);
    int lp = render_precedence(node->left.get());
    int rp = render_precedence(node->right.get());
    bool left_parens = lp < prec || (lp == prec && right_assoc);
    bool right_parens = rp < prec || (rp == prec && !right_assoc);
    // unary on the right of a power keeps its parentheses for readability
    if (node->op == Operator::EXP && rp == SYMCALC_PREC_UNARY) right_parens = true;

    std::string left = render_child(node->left.get(), left_parens);
    std::string right = render_child(node->right.get(), right_parens);
    if (node->op == Operator::MULT && node->attached && can_omit_star(left, right)) {
        return left + right;
    }
    return left + operator_symbol(node->op) + right;
}

static std::string render_items(const AstNode* node, const char* sep) {
    std::string out;
    for (size_t i = 0; i < node->items.size(); i++) {
        if (i > 0) out += sep;
        out += ast_render(node->items[i].get());
    }
    return out;
}

std::string ast_render(const AstNode* node) {
    if (!node) return "";
    switch (node->type) {
    case AstNodeType::LITERAL:
        return node->value.to_string();
    case AstNodeType::VARIABLE:
        return node->name;
    case AstNodeType::UNARY: {
        bool parens = render_precedence(node->body.get()) <= SYMCALC_PREC_UNARY;
        return std::string(node->sign == UnarySign::NEGATIVE ? "-" : "+") +
               render_child(node->body.get(), parens);
    }
    case AstNodeType::BINARY:
        return render_binary(node);
    case AstNodeType::CALL:
        return node->name + "(" + render_items(node, ",") + ")";
    case AstNodeType::FUNCTION_DEF: {
        std::string out = node->name + "(";
        for (size_t i = 0; i < node->params.size(); i++) {
            if (i > 0) out += ",";
            out += node->params[i];
        }
        return out + ")=" + ast_render(node->body.get());
    }
    case AstNodeType::VECTOR:
        return "[" + render_items(node, " ") + "]";
    case AstNodeType::MATRIX:
        return render_items(node, "");
    case AstNodeType::SPACE:
        return "";
    }
    return "";
}

} // namespace symcalc
