#include <gtest/gtest.h>
#include <string>

#include "../symcalc/ast.hpp"
#include "../symcalc/parser.hpp"

using namespace symcalc;

class AstTest : public ::testing::Test {
protected:
    CalcError error;

    AstPtr parse(const char* text) {
        AstPtr tree = parse_expression(text, &error);
        EXPECT_NE(tree, nullptr) << text << ": " << error.message;
        return tree;
    }

    std::string render(const char* text) {
        AstPtr tree = parse(text);
        return tree ? ast_render(tree.get()) : "";
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(AstTest, MakeHelpers) {
    AstPtr sum = make_binary(Operator::PLUS, make_literal_int(2), make_variable("x"));
    EXPECT_EQ(ast_render(sum.get()), "2+x");
    EXPECT_EQ(sum->column, 0u);

    std::vector<AstPtr> args;
    args.push_back(make_variable("y"));
    AstPtr call = make_call("sin", std::move(args));
    EXPECT_EQ(ast_render(call.get()), "sin(y)");
}

TEST_F(AstTest, NodeTypeNames) {
    EXPECT_STREQ(ast_node_type_name(AstNodeType::LITERAL), "LITERAL");
    EXPECT_STREQ(ast_node_type_name(AstNodeType::FUNCTION_DEF), "FUNCTION_DEF");
}

TEST_F(AstTest, ValueAccessor) {
    AstPtr tree = parse("2.5*x-sin(y)");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(ast_value(tree.get()), "-");
    EXPECT_EQ(ast_value(tree->left.get()), "*");
    EXPECT_EQ(ast_value(tree->left->left.get()), "2.5");
    EXPECT_EQ(ast_value(tree->left->right.get()), "x");
    EXPECT_EQ(ast_value(tree->right.get()), "sin");
}

// ============================================================================
// Rendering
// ============================================================================

TEST_F(AstTest, RenderKeepsNeededParentheses) {
    EXPECT_EQ(render("(2+3)*4"), "(2+3)*4");
    EXPECT_EQ(render("a-(b-c)"), "a-(b-c)");
    EXPECT_EQ(render("(a-b)-c"), "a-b-c");
    EXPECT_EQ(render("(2^3)^2"), "(2^3)^2");
    EXPECT_EQ(render("2^3^2"), "2^3^2");
}

TEST_F(AstTest, RenderDropsRedundantParentheses) {
    EXPECT_EQ(render("((x))"), "x");
    EXPECT_EQ(render("(x*y)+1"), "x*y+1");
}

TEST_F(AstTest, RenderHonorsAttachedProducts) {
    EXPECT_EQ(render("3x"), "3x");
    EXPECT_EQ(render("3*x"), "3*x");
    EXPECT_EQ(render("2(x+1)"), "2(x+1)");
}

TEST_F(AstTest, RenderNegativeExponent) {
    EXPECT_EQ(render("x^-1"), "x^(-1)");
}

TEST_F(AstTest, RenderedTextReparsesToSameTree) {
    const char* inputs[] = {"2+3*4", "-(x+1)^2", "f(x,y)", "3x^2-2x+1", "a/(b*c)", "x>=2"};
    for (const char* input : inputs) {
        AstPtr tree = parse(input);
        ASSERT_NE(tree, nullptr);
        std::string text = ast_render(tree.get());
        AstPtr again = parse(text.c_str());
        ASSERT_NE(again, nullptr) << text;
        EXPECT_TRUE(ast_equals(tree.get(), again.get())) << input << " -> " << text;
    }
}

// ============================================================================
// Tree utilities
// ============================================================================

TEST_F(AstTest, CloneIsDeepAndEqual) {
    AstPtr tree = parse("x^2+sin(x)");
    AstPtr copy = ast_clone(tree.get());
    EXPECT_TRUE(ast_equals(tree.get(), copy.get()));
    copy->left->left->name = "y";
    EXPECT_FALSE(ast_equals(tree.get(), copy.get()));
    EXPECT_EQ(ast_render(tree.get()), "x^2+sin(x)");
}

TEST_F(AstTest, EqualityComparesLiteralValues) {
    AstPtr a = parse("2.50+x");
    AstPtr b = parse("2.5+x");
    EXPECT_TRUE(ast_equals(a.get(), b.get()));
    AstPtr c = parse("x+2.5");
    EXPECT_FALSE(ast_equals(a.get(), c.get()));
}

TEST_F(AstTest, SubstituteIsStructural) {
    // xy is a different variable than x and must not be touched
    AstPtr tree = parse("x*xy+x");
    AstPtr arg = parse("t+1");
    AstBindings bindings;
    bindings["x"] = arg.get();
    AstPtr result = ast_substitute(tree.get(), bindings);
    EXPECT_EQ(ast_render(result.get()), "(t+1)*xy+(t+1)");
}

TEST_F(AstTest, SubstituteLeavesFunctionNames) {
    AstPtr tree = parse("f(f)");
    AstPtr arg = parse("2");
    AstBindings bindings;
    bindings["f"] = arg.get();
    AstPtr result = ast_substitute(tree.get(), bindings);
    EXPECT_EQ(ast_render(result.get()), "f(2)");
}

TEST_F(AstTest, DefinitionParametersShadow) {
    AstPtr def = parse("g(e)=e+pi");
    AstPtr value = parse("3");
    AstBindings bindings;
    bindings["e"] = value.get();
    bindings["pi"] = value.get();
    AstPtr result = ast_substitute(def.get(), bindings);
    EXPECT_EQ(ast_render(result.get()), "g(e)=e+3");
}

TEST_F(AstTest, ContainsVariable) {
    AstPtr tree = parse("2*sin(y)+3");
    EXPECT_TRUE(ast_contains_variable(tree.get(), "y"));
    EXPECT_FALSE(ast_contains_variable(tree.get(), "x"));
    EXPECT_TRUE(ast_contains_variable(tree.get(), ""));
    AstPtr constant = parse("2+3");
    EXPECT_FALSE(ast_contains_variable(constant.get(), ""));
}
