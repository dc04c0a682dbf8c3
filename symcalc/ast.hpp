// ast.hpp - Expression syntax tree
//
// Every parsed expression is a tree of AstNode. A node owns its children
// through unique_ptr, so a subtree has exactly one parent slot; code that
// needs the same subtree twice clones it.
//
// Fields in use per node type:
//
//   LITERAL       value (exact decimal)
//   VARIABLE      name
//   UNARY         sign, body
//   BINARY        op, left, right, attached
//   CALL          name, items (arguments)
//   FUNCTION_DEF  name, params, body
//   VECTOR        items (elements)
//   MATRIX        items (row vectors)
//   SPACE         -
//
// `attached` marks a MULT that was written without `*` (3x, 2(x+1)); the
// renderer then omits the `*` again where the result still reparses.

#ifndef SYMCALC_AST_HPP
#define SYMCALC_AST_HPP

#include "decimal.hpp"
#include "operator.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace symcalc {

// ============================================================================
// Node Types
// ============================================================================

enum class AstNodeType : uint8_t {
    LITERAL,
    VARIABLE,
    UNARY,
    BINARY,
    CALL,
    FUNCTION_DEF,
    MATRIX,
    VECTOR,
    SPACE,          // formatting gap, evaluates to zero
};

const char* ast_node_type_name(AstNodeType type);

// ============================================================================
// AstNode
// ============================================================================

struct AstNode;
typedef std::unique_ptr<AstNode> AstPtr;

struct AstNode {
    AstNodeType type;
    uint32_t column = 0;            // source column, 0 for synthesized nodes

    Decimal value;
    std::string name;
    Operator op = Operator::PLUS;
    UnarySign sign = UnarySign::POSITIVE;
    bool attached = false;

    AstPtr left;
    AstPtr right;
    AstPtr body;
    std::vector<AstPtr> items;
    std::vector<std::string> params;

    explicit AstNode(AstNodeType t) : type(t) {}

    bool is_literal() const { return type == AstNodeType::LITERAL; }
    bool is_variable() const { return type == AstNodeType::VARIABLE; }
    bool is_binary() const { return type == AstNodeType::BINARY; }
    bool is_binary(Operator o) const { return type == AstNodeType::BINARY && op == o; }
    bool is_unary() const { return type == AstNodeType::UNARY; }
    bool is_call() const { return type == AstNodeType::CALL; }
};

// ============================================================================
// Construction
// ============================================================================

AstPtr make_literal(const Decimal& value);
AstPtr make_literal_int(int64_t value);
AstPtr make_variable(const std::string& name);
AstPtr make_unary(UnarySign sign, AstPtr body);
AstPtr make_binary(Operator op, AstPtr left, AstPtr right, bool attached = false);
AstPtr make_call(const std::string& name, std::vector<AstPtr> args);
AstPtr make_function_def(const std::string& name, std::vector<std::string> params, AstPtr body);
AstPtr make_vector(std::vector<AstPtr> elements);
AstPtr make_matrix(std::vector<AstPtr> rows);
AstPtr make_space();

// ============================================================================
// Tree utilities
// ============================================================================

// Deep copy
AstPtr ast_clone(const AstNode* node);

// Generic value of a node: literal digits, variable/function name,
// operator symbol, sign symbol, or the node type name for containers.
std::string ast_value(const AstNode* node);

// Render as expression text that parses back to an equivalent tree
std::string ast_render(const AstNode* node);

// Copy of node with every VARIABLE whose name is a key replaced by a clone
// of the mapped tree. Function names and definition parameters are left alone.
typedef std::unordered_map<std::string, const AstNode*> AstBindings;
AstPtr ast_substitute(const AstNode* node, const AstBindings& bindings);

// True when the tree references the variable name (any variable if name is empty)
bool ast_contains_variable(const AstNode* node, const std::string& name);

// Structural equality (literals compare by value)
bool ast_equals(const AstNode* a, const AstNode* b);

} // namespace symcalc

#endif // SYMCALC_AST_HPP
