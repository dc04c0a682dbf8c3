#include <gtest/gtest.h>
#include <cstring>

#include "../symcalc/tokenizer.hpp"

using namespace symcalc;

class TokenizerTest : public ::testing::Test {
protected:
    TokenList tokens;
    CalcError error;

    bool scan(const char* text) {
        tokens.clear();
        err_clear(&error);
        return tokenize(text, &tokens, &error);
    }
};

// ============================================================================
// Token kinds
// ============================================================================

TEST_F(TokenizerTest, SimpleExpression) {
    ASSERT_TRUE(scan("3.5+x"));
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(tokens[0].is_number());
    EXPECT_EQ(tokens[0].text, "3.5");
    EXPECT_TRUE(tokens[1].is_operator(Operator::PLUS));
    EXPECT_TRUE(tokens[2].is_identifier());
    EXPECT_EQ(tokens[2].text, "x");
    EXPECT_TRUE(tokens[3].is_end());
}

TEST_F(TokenizerTest, ColumnsAreOneBased) {
    ASSERT_TRUE(scan("ab + 12"));
    EXPECT_EQ(tokens[0].column, 1u);
    EXPECT_EQ(tokens[1].column, 3u);   // space
    EXPECT_EQ(tokens[2].column, 4u);
    EXPECT_EQ(tokens[4].column, 6u);
}

TEST_F(TokenizerTest, EmptyInputHasOnlyEnd) {
    ASSERT_TRUE(scan(""));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokens[0].is_end());
}

TEST_F(TokenizerTest, WhitespaceRunsCollapse) {
    ASSERT_TRUE(scan("1   \t 2"));
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_TRUE(tokens[1].is_space());
}

TEST_F(TokenizerTest, NumberForms) {
    ASSERT_TRUE(scan(".5"));
    EXPECT_EQ(tokens[0].text, ".5");
    ASSERT_TRUE(scan("3."));
    EXPECT_EQ(tokens[0].text, "3.");
}

TEST_F(TokenizerTest, ImplicitProductSplits) {
    ASSERT_TRUE(scan("3x"));
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_TRUE(tokens[0].is_number());
    EXPECT_TRUE(tokens[1].is_identifier());
}

TEST_F(TokenizerTest, IdentifiersTakeDigitsAndUnderscore) {
    ASSERT_TRUE(scan("_f1 x2y"));
    EXPECT_EQ(tokens[0].text, "_f1");
    EXPECT_EQ(tokens[2].text, "x2y");
}

// ============================================================================
// Operators and punctuation
// ============================================================================

TEST_F(TokenizerTest, LongestMatchOperators) {
    ASSERT_TRUE(scan("a>=b<=c!=d==e+=f"));
    EXPECT_TRUE(tokens[1].is_operator(Operator::GTE));
    EXPECT_TRUE(tokens[3].is_operator(Operator::LTE));
    EXPECT_TRUE(tokens[5].is_operator(Operator::NEQ));
    EXPECT_TRUE(tokens[7].is_operator(Operator::EQUAL));
    EXPECT_TRUE(tokens[9].is_operator(Operator::PEQUAL));
}

TEST_F(TokenizerTest, SingleEqualsIsPunct) {
    ASSERT_TRUE(scan("f(x)=x"));
    EXPECT_TRUE(tokens[0].is_identifier());
    EXPECT_TRUE(tokens[1].is_punct('('));
    EXPECT_TRUE(tokens[3].is_punct(')'));
    EXPECT_TRUE(tokens[4].is_punct('='));
}

TEST_F(TokenizerTest, BracketsAndCommas) {
    ASSERT_TRUE(scan("[1,2]"));
    EXPECT_TRUE(tokens[0].is_punct('['));
    EXPECT_TRUE(tokens[2].is_punct(','));
    EXPECT_TRUE(tokens[4].is_punct(']'));
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(TokenizerTest, UnknownCharacter) {
    EXPECT_FALSE(scan("2 $ 3"));
    EXPECT_EQ(error.code, ERR_UNEXPECTED_CHARACTER);
    EXPECT_EQ(error.column, 3u);
    EXPECT_STREQ(err_kind_name(error.code), "LexicalError");
}

TEST_F(TokenizerTest, SecondDecimalPoint) {
    EXPECT_FALSE(scan("1.2.3"));
    EXPECT_EQ(error.code, ERR_INVALID_NUMBER);
}

TEST_F(TokenizerTest, LoneDecimalPoint) {
    EXPECT_FALSE(scan("1 + ."));
    EXPECT_EQ(error.code, ERR_INVALID_NUMBER);
    EXPECT_EQ(error.column, 5u);
}

TEST_F(TokenizerTest, OperatorTable) {
    EXPECT_STREQ(operator_symbol(Operator::EXP), "^");
    EXPECT_EQ(operator_precedence(Operator::PLUS), SYMCALC_PREC_ADDITIVE);
    EXPECT_EQ(operator_precedence(Operator::DIV), SYMCALC_PREC_MULTIPLY);
    EXPECT_EQ(operator_precedence(Operator::EXP), SYMCALC_PREC_POWER);
    EXPECT_TRUE(operator_is_right_assoc(Operator::EXP));
    EXPECT_FALSE(operator_is_right_assoc(Operator::MINUS));
    EXPECT_TRUE(operator_is_comparison(Operator::GT));
    Operator op;
    EXPECT_EQ(operator_from_text(">=1", 3, &op), 2u);
    EXPECT_EQ(op, Operator::GTE);
    EXPECT_EQ(operator_from_text("x", 1, &op), 0u);
}
