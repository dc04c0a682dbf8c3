#include <gtest/gtest.h>
#include <string>

#include "../symcalc/term.hpp"

using namespace symcalc;

class TermTest : public ::testing::Test {
protected:
    EvalConfig config;
    CalcError error;

    Term num(const char* text) {
        Decimal d;
        EXPECT_TRUE(Decimal::parse(text, &d)) << text;
        return Term::numeric(d);
    }

    std::string combine(const Term& a, Operator op, const Term& b) {
        Term out;
        EXPECT_TRUE(a.operation(b, op, config, &out, &error)) << error.message;
        return out.to_string();
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(TermTest, DefaultIsZero) {
    Term t;
    EXPECT_TRUE(t.is_numeric());
    EXPECT_TRUE(t.is_exact_zero());
    EXPECT_EQ(t.to_string(), "0");
}

TEST_F(TermTest, FromTextDetectsNumbers) {
    Term n = Term::from_text("(-2.5)");
    EXPECT_TRUE(n.is_numeric());
    EXPECT_EQ(n.to_string(), "-2.5");

    Term s = Term::from_text("((x+1))");
    EXPECT_TRUE(s.is_symbolic());
    EXPECT_EQ(s.to_string(), "x+1");
}

TEST_F(TermTest, RenderNormalized) {
    EXPECT_EQ(num("3.14159265").render_normalized(3), "3.14");
    EXPECT_EQ(Term::symbolic("2x").render_normalized(3), "2x");
    EXPECT_EQ(Term::symbolic("x/3+0.142857142857143").render_normalized(10), "x/3+0.1428571429");
}

// ============================================================================
// Inspection
// ============================================================================

TEST_F(TermTest, Sign) {
    EXPECT_EQ(num("-3").sign(), UnarySign::NEGATIVE);
    EXPECT_EQ(Term::symbolic("-x").sign(), UnarySign::NEGATIVE);
    EXPECT_EQ(Term::symbolic("2-x").sign(), UnarySign::POSITIVE);
}

TEST_F(TermTest, FindVariable) {
    EXPECT_EQ(Term::symbolic("2*(3+y)").find_variable(), "y");
    EXPECT_EQ(num("5").find_variable(), "");
    EXPECT_TRUE(Term::symbolic("x^2").has_variable());
}

TEST_F(TermTest, FindExponent) {
    EXPECT_EQ(Term::symbolic("x^3").find_exponent(), "3");
    EXPECT_EQ(Term::symbolic("x^(n+1)").find_exponent(), "(n+1)");
    EXPECT_EQ(Term::symbolic("2x").find_exponent(), "1");
}

TEST_F(TermTest, Parentheses) {
    EXPECT_EQ(Term::symbolic("x+1").parenthesized().to_string(), "(x+1)");
    EXPECT_EQ(Term::symbolic("(x+1)").parenthesized().to_string(), "(x+1)");
    EXPECT_EQ(Term::symbolic("(x+1)").force_parenthesized().to_string(), "((x+1))");
    EXPECT_EQ(Term::symbolic("((x))").strip_parentheses().to_string(), "x");
    EXPECT_EQ(Term::symbolic("(x)+(y)").strip_parentheses().to_string(), "(x)+(y)");
}

TEST_F(TermTest, Negated) {
    EXPECT_EQ(num("4").negated().to_string(), "-4");
    EXPECT_EQ(Term::symbolic("x").negated().to_string(), "-x");
    EXPECT_EQ(Term::symbolic("-x").negated().to_string(), "x");
    EXPECT_EQ(Term::symbolic("x+1").negated().to_string(), "-(x+1)");
}

// ============================================================================
// Operations
// ============================================================================

TEST_F(TermTest, NumericArithmeticIsExact) {
    EXPECT_EQ(combine(num("0.1"), Operator::PLUS, num("0.2")), "0.3");
    EXPECT_EQ(combine(num("7"), Operator::MINUS, num("10")), "-3");
    EXPECT_EQ(combine(num("1.5"), Operator::MULT, num("4")), "6");
    EXPECT_EQ(combine(num("1"), Operator::DIV, num("8")), "0.125");
}

TEST_F(TermTest, IntegerPowers) {
    EXPECT_EQ(combine(num("2"), Operator::EXP, num("10")), "1024");
    EXPECT_EQ(combine(num("2"), Operator::EXP, num("-2")), "0.25");
    EXPECT_EQ(combine(num("5"), Operator::EXP, num("0")), "1");
}

TEST_F(TermTest, FractionalPower) {
    Term out;
    ASSERT_TRUE(num("9").operation(num("0.5"), Operator::EXP, config, &out, &error));
    EXPECT_NEAR(out.value().to_double(), 3.0, 1e-12);
}

TEST_F(TermTest, ComparisonsGiveOneOrZero) {
    EXPECT_EQ(combine(num("3"), Operator::GT, num("2")), "1");
    EXPECT_EQ(combine(num("3"), Operator::LT, num("2")), "0");
    EXPECT_EQ(combine(num("2"), Operator::GTE, num("2")), "1");
    EXPECT_EQ(combine(num("2"), Operator::LTE, num("1")), "0");
    EXPECT_EQ(combine(num("2"), Operator::NEQ, num("2")), "0");
    EXPECT_EQ(combine(num("2.0"), Operator::EQUAL, num("2")), "1");
}

TEST_F(TermTest, AccumulateAdds) {
    EXPECT_EQ(combine(num("2"), Operator::PEQUAL, num("5")), "7");
}

TEST_F(TermTest, DivisionByZero) {
    Term out;
    EXPECT_FALSE(num("1").operation(num("0"), Operator::DIV, config, &out, &error));
    EXPECT_EQ(error.code, ERR_DIVISION_BY_ZERO);
    EXPECT_STREQ(err_kind_name(error.code), "DivisionError");
}

TEST_F(TermTest, SymbolicOperandsBuildText) {
    EXPECT_EQ(combine(Term::symbolic("x"), Operator::PLUS, num("1")), "x+1");
    EXPECT_EQ(combine(Term::symbolic("x+1"), Operator::MULT, Term::symbolic("y")), "(x+1)*y");
    EXPECT_EQ(combine(Term::symbolic("a"), Operator::MINUS, Term::symbolic("b-c")), "a-(b-c)");
    EXPECT_EQ(combine(Term::symbolic("x"), Operator::EXP, num("2")), "x^2");
    EXPECT_EQ(combine(Term::symbolic("x^2"), Operator::EXP, num("3")), "(x^2)^3");
}

// ============================================================================
// Text helpers
// ============================================================================

TEST_F(TermTest, TextPrecedence) {
    EXPECT_EQ(text_precedence("x+1"), SYMCALC_PREC_ADDITIVE);
    EXPECT_EQ(text_precedence("2x"), SYMCALC_PREC_MULTIPLY);
    EXPECT_EQ(text_precedence("-x"), SYMCALC_PREC_UNARY);
    EXPECT_EQ(text_precedence("x^2"), SYMCALC_PREC_POWER);
    EXPECT_EQ(text_precedence("(x+1)"), 6);
    EXPECT_EQ(text_precedence("sin(x)"), 6);
}

TEST_F(TermTest, TextProduct) {
    EXPECT_EQ(text_product("2", "x"), "2x");
    EXPECT_EQ(text_product("3", "x+1"), "3(x+1)");
    EXPECT_EQ(text_product("x", "y"), "x*y");
    EXPECT_EQ(text_product("2", "3"), "2*3");
}

TEST_F(TermTest, SplitCoefficient) {
    Decimal coef;
    std::string rest;
    ASSERT_TRUE(text_split_coefficient("2x^2", &coef, &rest));
    EXPECT_EQ(coef.to_string(), "2");
    EXPECT_EQ(rest, "x^2");
    ASSERT_TRUE(text_split_coefficient("3*sin(x)", &coef, &rest));
    EXPECT_EQ(coef.to_string(), "3");
    EXPECT_EQ(rest, "sin(x)");
    EXPECT_FALSE(text_split_coefficient("2+x", &coef, &rest));
    EXPECT_FALSE(text_split_coefficient("x", &coef, &rest));
    EXPECT_FALSE(text_split_coefficient("2^x", &coef, &rest));
}

TEST_F(TermTest, IsNumber) {
    Decimal d;
    EXPECT_TRUE(text_is_number("12", &d));
    EXPECT_TRUE(text_is_number("(-0.5)", &d));
    EXPECT_EQ(d.to_string(), "-0.5");
    EXPECT_FALSE(text_is_number("1e5", nullptr));
    EXPECT_FALSE(text_is_number("x", nullptr));
    EXPECT_FALSE(text_is_number("-", nullptr));
}

TEST_F(TermTest, Wrapping) {
    EXPECT_TRUE(text_is_wrapped("(x+1)"));
    EXPECT_FALSE(text_is_wrapped("(x)+(y)"));
    EXPECT_EQ(text_strip_parens("(((2)))"), "2");
}

TEST_F(TermTest, RoundNumbersInText) {
    EXPECT_EQ(text_round_numbers("0.693147180559945*2^x", 10), "0.6931471806*2^x");
    EXPECT_EQ(text_round_numbers("1.23456x+_f12345678901", 3), "1.23x+_f12345678901");
    EXPECT_EQ(text_round_numbers("x2+2.5", 10), "x2+2.5");
}
