#include <gtest/gtest.h>
#include <string>

#include "../symcalc/parser.hpp"

using namespace symcalc;

class ParserTest : public ::testing::Test {
protected:
    CalcError error;

    AstPtr parse(const char* text) {
        err_clear(&error);
        return parse_expression(text, &error);
    }

    // parse and render back, "" on failure
    std::string reparse(const char* text) {
        AstPtr tree = parse(text);
        if (!tree) return "";
        return ast_render(tree.get());
    }
};

// ============================================================================
// Precedence and associativity
// ============================================================================

TEST_F(ParserTest, MultiplicationBindsTighter) {
    AstPtr tree = parse("2+3*4");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_binary(Operator::PLUS));
    EXPECT_TRUE(tree->left->is_literal());
    EXPECT_TRUE(tree->right->is_binary(Operator::MULT));
}

TEST_F(ParserTest, ParenthesesOverride) {
    AstPtr tree = parse("(2+3)*4");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_binary(Operator::MULT));
    EXPECT_TRUE(tree->left->is_binary(Operator::PLUS));
}

TEST_F(ParserTest, SubtractionIsLeftAssociative) {
    AstPtr tree = parse("8-3-2");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_binary(Operator::MINUS));
    EXPECT_TRUE(tree->left->is_binary(Operator::MINUS));
    EXPECT_TRUE(tree->right->is_literal());
}

TEST_F(ParserTest, PowerIsRightAssociative) {
    AstPtr tree = parse("2^3^2");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_binary(Operator::EXP));
    EXPECT_TRUE(tree->left->is_literal());
    EXPECT_TRUE(tree->right->is_binary(Operator::EXP));
}

TEST_F(ParserTest, UnaryMinusBelowPower) {
    AstPtr tree = parse("-x^2");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_unary());
    EXPECT_EQ(tree->sign, UnarySign::NEGATIVE);
    EXPECT_TRUE(tree->body->is_binary(Operator::EXP));
}

TEST_F(ParserTest, ComparisonIsLowest) {
    AstPtr tree = parse("1+2>=3");
    ASSERT_NE(tree, nullptr);
    EXPECT_TRUE(tree->is_binary(Operator::GTE));
    EXPECT_TRUE(tree->left->is_binary(Operator::PLUS));
}

TEST_F(ParserTest, WhitespaceIgnoredOutsideBrackets) {
    EXPECT_EQ(reparse("  2 +  3 * x "), "2+3*x");
}

// ============================================================================
// Implicit multiplication
// ============================================================================

TEST_F(ParserTest, ImplicitProducts) {
    AstPtr tree = parse("3x");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_binary(Operator::MULT));
    EXPECT_TRUE(tree->attached);

    tree = parse("2(x+1)");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_binary(Operator::MULT));
    EXPECT_TRUE(tree->right->is_binary(Operator::PLUS));
}

TEST_F(ParserTest, ImplicitProductTakesPower) {
    // 2x^2 is 2*(x^2)
    AstPtr tree = parse("2x^2");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_binary(Operator::MULT));
    EXPECT_TRUE(tree->right->is_binary(Operator::EXP));
}

// ============================================================================
// Calls and definitions
// ============================================================================

TEST_F(ParserTest, CallArguments) {
    AstPtr tree = parse("log(8, 2)");
    ASSERT_NE(tree, nullptr);
    ASSERT_TRUE(tree->is_call());
    EXPECT_EQ(tree->name, "log");
    EXPECT_EQ(tree->items.size(), 2u);
}

TEST_F(ParserTest, Definition) {
    AstPtr tree = parse("f(x, y) = x^2 + y");
    ASSERT_NE(tree, nullptr) << error.message;
    ASSERT_EQ(tree->type, AstNodeType::FUNCTION_DEF);
    EXPECT_EQ(tree->name, "f");
    ASSERT_EQ(tree->params.size(), 2u);
    EXPECT_EQ(tree->params[0], "x");
    EXPECT_EQ(tree->params[1], "y");
    EXPECT_EQ(ast_render(tree.get()), "f(x,y)=x^2+y");
}

TEST_F(ParserTest, DefinitionWithoutParameters) {
    AstPtr tree = parse("k() = 5");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree->type, AstNodeType::FUNCTION_DEF);
    EXPECT_TRUE(tree->params.empty());
}

TEST_F(ParserTest, DuplicateParameterRejected) {
    EXPECT_EQ(parse("f(x,x)=x"), nullptr);
    EXPECT_EQ(error.code, ERR_INVALID_DEFINITION);
}

TEST_F(ParserTest, ParameterMustBeName) {
    EXPECT_EQ(parse("f(2)=x"), nullptr);
    EXPECT_EQ(error.code, ERR_INVALID_DEFINITION);
}

TEST_F(ParserTest, DefinitionNeedsBody) {
    EXPECT_EQ(parse("f(x)="), nullptr);
    EXPECT_EQ(error.code, ERR_MISSING_OPERAND);
}

TEST_F(ParserTest, ParseDefinitionRequiresDefinition) {
    EXPECT_EQ(parse_definition("x+1", &error), nullptr);
    EXPECT_EQ(error.code, ERR_INVALID_DEFINITION);
    AstPtr def = parse_definition("g(t)=2t", &error);
    ASSERT_NE(def, nullptr);
    EXPECT_EQ(def->name, "g");
}

// ============================================================================
// Vectors and matrices
// ============================================================================

TEST_F(ParserTest, VectorWithSpaces) {
    AstPtr tree = parse("[1 -2 3]");
    ASSERT_NE(tree, nullptr) << error.message;
    ASSERT_EQ(tree->type, AstNodeType::VECTOR);
    ASSERT_EQ(tree->items.size(), 3u);
    EXPECT_TRUE(tree->items[1]->is_unary());
}

TEST_F(ParserTest, VectorWithCommas) {
    AstPtr tree = parse("[1, 2*x, 3]");
    ASSERT_NE(tree, nullptr) << error.message;
    ASSERT_EQ(tree->type, AstNodeType::VECTOR);
    EXPECT_EQ(tree->items.size(), 3u);
}

TEST_F(ParserTest, AdjacentGroupsFormMatrix) {
    AstPtr tree = parse("[1 3 5][8 30 2][1 89 2]");
    ASSERT_NE(tree, nullptr) << error.message;
    ASSERT_EQ(tree->type, AstNodeType::MATRIX);
    ASSERT_EQ(tree->items.size(), 3u);
    EXPECT_EQ(tree->items[2]->items.size(), 3u);
    EXPECT_EQ(ast_render(tree.get()), "[1 3 5][8 30 2][1 89 2]");
}

TEST_F(ParserTest, NestedGroupsFormMatrix) {
    AstPtr tree = parse("[[1,2],[3,4]]");
    ASSERT_NE(tree, nullptr) << error.message;
    ASSERT_EQ(tree->type, AstNodeType::MATRIX);
    EXPECT_EQ(tree->items.size(), 2u);
}

TEST_F(ParserTest, EmptyBracketsRejected) {
    EXPECT_EQ(parse("[]"), nullptr);
    EXPECT_EQ(error.code, ERR_INVALID_MATRIX_SYNTAX);
}

// ============================================================================
// Edge cases and errors
// ============================================================================

TEST_F(ParserTest, BlankInputIsSpace) {
    AstPtr tree = parse("   ");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree->type, AstNodeType::SPACE);
    tree = parse("");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree->type, AstNodeType::SPACE);
}

TEST_F(ParserTest, MissingOperand) {
    EXPECT_EQ(parse("2+"), nullptr);
    EXPECT_EQ(error.code, ERR_MISSING_OPERAND);
    EXPECT_STREQ(err_kind_name(error.code), "ParseError");
}

TEST_F(ParserTest, UnbalancedParentheses) {
    EXPECT_EQ(parse("(1+2"), nullptr);
    EXPECT_EQ(error.code, ERR_UNBALANCED_BRACKETS);
    EXPECT_EQ(error.column, 1u);

    EXPECT_EQ(parse("1+2)"), nullptr);
    EXPECT_EQ(error.code, ERR_UNBALANCED_BRACKETS);
    EXPECT_EQ(error.column, 4u);
}

TEST_F(ParserTest, LexicalErrorPropagates) {
    EXPECT_EQ(parse("1 # 2"), nullptr);
    EXPECT_EQ(error.code, ERR_UNEXPECTED_CHARACTER);
}

TEST_F(ParserTest, DeepNestingRejected) {
    std::string text(SYMCALC_MAX_PARSE_DEPTH + 10, '(');
    text += "1";
    text += std::string(SYMCALC_MAX_PARSE_DEPTH + 10, ')');
    EXPECT_EQ(parse(text.c_str()), nullptr);
    EXPECT_EQ(error.code, ERR_SYNTAX_ERROR);
}

TEST_F(ParserTest, LiteralColumnsRecorded) {
    AstPtr tree = parse("1 + 25");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree->left->column, 1u);
    EXPECT_EQ(tree->right->column, 5u);
}
