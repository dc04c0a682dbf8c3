#include <gtest/gtest.h>
#include <string>

#include "../symcalc/calc_error.hpp"

using namespace symcalc;

class CalcErrorTest : public ::testing::Test {
protected:
    CalcError error;

    void SetUp() override {
        err_clear(&error);
    }
};

// ============================================================================
// Code ranges
// ============================================================================

TEST_F(CalcErrorTest, CategoryMacros) {
    EXPECT_TRUE(ERR_IS_SYNTAX(ERR_UNEXPECTED_CHARACTER));
    EXPECT_TRUE(ERR_IS_SYNTAX(ERR_INVALID_MATRIX_SYNTAX));
    EXPECT_TRUE(ERR_IS_SEMANTIC(ERR_DUPLICATE_DEFINITION));
    EXPECT_TRUE(ERR_IS_RUNTIME(ERR_DIVISION_BY_ZERO));
    EXPECT_TRUE(ERR_IS_INTERNAL(ERR_NOT_IMPLEMENTED));
    EXPECT_FALSE(ERR_IS_RUNTIME(ERR_OK));
}

TEST_F(CalcErrorTest, CategoryNames) {
    EXPECT_STREQ(err_category_name(ERR_MISSING_TOKEN), "Syntax");
    EXPECT_STREQ(err_category_name(ERR_TYPE_MISMATCH), "Semantic");
    EXPECT_STREQ(err_category_name(ERR_SINGULAR_MATRIX), "Runtime");
    EXPECT_STREQ(err_category_name(ERR_DECIMAL_FAILURE), "Internal");
}

// ============================================================================
// Taxonomy
// ============================================================================

TEST_F(CalcErrorTest, KindNames) {
    EXPECT_STREQ(err_kind_name(ERR_UNEXPECTED_CHARACTER), "LexicalError");
    EXPECT_STREQ(err_kind_name(ERR_UNBALANCED_BRACKETS), "ParseError");
    EXPECT_STREQ(err_kind_name(ERR_INVALID_DEFINITION), "ParseError");
    EXPECT_STREQ(err_kind_name(ERR_DUPLICATE_DEFINITION), "DefinitionError");
    EXPECT_STREQ(err_kind_name(ERR_ARGUMENT_COUNT_MISMATCH), "ArityError");
    EXPECT_STREQ(err_kind_name(ERR_UNDEFINED_FUNCTION), "UnknownIdentifierError");
    EXPECT_STREQ(err_kind_name(ERR_UNDEFINED_VARIABLE), "UnknownIdentifierError");
    EXPECT_STREQ(err_kind_name(ERR_DIVISION_BY_ZERO), "DivisionError");
    EXPECT_STREQ(err_kind_name(ERR_SINGULAR_MATRIX), "SingularMatrixError");
    EXPECT_STREQ(err_kind_name(ERR_NOT_CONVERGED), "ConvergenceError");
    EXPECT_STREQ(err_kind_name(ERR_DOMAIN_ERROR), "EvalError");
}

// ============================================================================
// Filling errors
// ============================================================================

TEST_F(CalcErrorTest, SetReturnsFalse) {
    EXPECT_FALSE(err_set(&error, ERR_DIVISION_BY_ZERO, 4, "division by zero"));
    EXPECT_EQ(error.code, ERR_DIVISION_BY_ZERO);
    EXPECT_EQ(error.column, 4u);
    EXPECT_EQ(error.message, "division by zero");
    EXPECT_FALSE(error.ok());
}

TEST_F(CalcErrorTest, NullErrorIsAccepted) {
    EXPECT_FALSE(err_set(nullptr, ERR_OVERFLOW, 0, "ignored"));
    EXPECT_FALSE(err_setf(nullptr, ERR_OVERFLOW, 0, "ignored %d", 1));
    err_clear(nullptr);
}

TEST_F(CalcErrorTest, FormattedMessage) {
    err_setf(&error, ERR_ARGUMENT_COUNT_MISMATCH, 2, "%s expects %d arguments, got %d", "f", 2, 3);
    EXPECT_EQ(error.message, "f expects 2 arguments, got 3");
}

TEST_F(CalcErrorTest, ClearResets) {
    err_set(&error, ERR_OVERFLOW, 7, "big");
    err_clear(&error);
    EXPECT_TRUE(error.ok());
    EXPECT_EQ(error.column, 0u);
    EXPECT_TRUE(error.message.empty());
}

TEST_F(CalcErrorTest, FormatWithColumn) {
    err_set(&error, ERR_UNEXPECTED_CHARACTER, 3, "unexpected '$'");
    std::string text = err_format(error);
    EXPECT_EQ(text.find("LexicalError ["), 0u) << text;
    EXPECT_NE(text.find("101"), std::string::npos) << text;
    EXPECT_NE(text.find("at column 3: unexpected '$'"), std::string::npos) << text;
}

TEST_F(CalcErrorTest, FormatWithoutColumn) {
    err_set(&error, ERR_SINGULAR_MATRIX, 0, "matrix is singular");
    std::string text = err_format(error);
    EXPECT_EQ(text.find("at column"), std::string::npos) << text;
    EXPECT_NE(text.find("matrix is singular"), std::string::npos) << text;
}
