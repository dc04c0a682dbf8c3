#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../symcalc/calculus.hpp"
#include "../symcalc/parser.hpp"

using namespace symcalc;

class CalculusTest : public ::testing::Test {
protected:
    Context context;
    EvalConfig config;
    CalcError error;

    AstPtr parse(const char* text) {
        AstPtr tree = parse_expression(text, &error);
        EXPECT_NE(tree, nullptr) << text << ": " << error.message;
        return tree;
    }

    // derivative text, "" on failure
    std::string derive(const char* text, const char* wrt = "x") {
        AstPtr tree = parse(text);
        if (!tree) return "";
        Calculus calculus(&context, config);
        Term out;
        err_clear(&error);
        if (!calculus.derivative(tree.get(), wrt, &out, &error)) return "";
        return out.to_string();
    }

    std::string integral(const char* text, const char* wrt = "x") {
        AstPtr tree = parse(text);
        if (!tree) return "";
        Calculus calculus(&context, config);
        Term out;
        err_clear(&error);
        if (!calculus.integrate(tree.get(), wrt, &out, &error)) return "";
        return out.to_string();
    }

    bool roots(const char* text, const std::vector<std::string>& vars, std::vector<std::string>* out) {
        AstPtr tree = parse(text);
        if (!tree) return false;
        Calculus calculus(&context, config);
        std::vector<Decimal> values;
        err_clear(&error);
        if (!calculus.find_roots(tree.get(), vars, &values, &error)) return false;
        out->clear();
        for (const Decimal& v : values) out->push_back(v.to_string());
        return true;
    }
};

// ============================================================================
// Derivative
// ============================================================================

TEST_F(CalculusTest, PowerRule) {
    EXPECT_EQ(derive("x^2"), "2x");
    EXPECT_EQ(derive("3x^2+2x+1"), "6x+2");
    EXPECT_EQ(derive("x"), "1");
}

TEST_F(CalculusTest, ConstantsVanish) {
    EXPECT_EQ(derive("5"), "0");
    EXPECT_EQ(derive("y^2"), "0");
}

TEST_F(CalculusTest, OtherVariablesAreConstants) {
    EXPECT_EQ(derive("x*y"), "y");
    EXPECT_EQ(derive("x*y", "y"), "x");
}

TEST_F(CalculusTest, TrigChainRule) {
    EXPECT_EQ(derive("sin(x)"), "cos(x)");
    EXPECT_EQ(derive("sin(2x)"), "2cos(2x)");
    EXPECT_EQ(derive("cos(x)"), "-sin(x)");
}

TEST_F(CalculusTest, UserFunctionInlined) {
    ASSERT_NE(context.add_function("f(t)=t^3", &error), nullptr);
    EXPECT_EQ(derive("f(x)"), "3x^2");
}

TEST_F(CalculusTest, NumericDerivativeOfExponent) {
    // d/dx 2^x at a bound x is a plain number
    context.bind("x", Term::numeric(Decimal::from_int(0)));
    std::string value = derive("2^x");
    ASSERT_FALSE(value.empty()) << error.message;
    Decimal d;
    ASSERT_TRUE(Decimal::parse(value.c_str(), &d));
    EXPECT_NEAR(d.to_double(), 0.693147180559945, 1e-12);
}

TEST_F(CalculusTest, TrigDerivativeInDegrees) {
    config.angle_mode = AngleMode::DEGREES;
    context.bind("x", Term::numeric(Decimal::from_int(0)));
    Decimal d;
    std::string slope = derive("sin(x)");
    ASSERT_TRUE(Decimal::parse(slope.c_str(), &d)) << slope << " " << error.message;
    EXPECT_NEAR(d.to_double(), 0.0174532925199433, 1e-12);

    slope = derive("arcsin(x)");
    ASSERT_TRUE(Decimal::parse(slope.c_str(), &d)) << slope << " " << error.message;
    EXPECT_NEAR(d.to_double(), 57.2957795130823, 1e-9);

    // hyperbolic functions take no angle
    slope = derive("sinh(x)");
    ASSERT_TRUE(Decimal::parse(slope.c_str(), &d)) << slope << " " << error.message;
    EXPECT_NEAR(d.to_double(), 1.0, 1e-12);
}

TEST_F(CalculusTest, VariableInBaseAndExponent) {
    EXPECT_EQ(derive("x^x"), "");
    EXPECT_EQ(error.code, ERR_NOT_IMPLEMENTED);
}

TEST_F(CalculusTest, NativeWithoutRule) {
    EXPECT_EQ(derive("sqrt(x)"), "");
    EXPECT_EQ(error.code, ERR_NOT_IMPLEMENTED);
}

TEST_F(CalculusTest, UnknownFunction) {
    EXPECT_EQ(derive("q(x)"), "");
    EXPECT_EQ(error.code, ERR_UNDEFINED_FUNCTION);
}

// ============================================================================
// Integral
// ============================================================================

TEST_F(CalculusTest, IntegratePowers) {
    EXPECT_EQ(integral("x"), "x^2/2");
    EXPECT_EQ(integral("x^2"), "x^3/3");
    EXPECT_EQ(integral("3"), "3x");
    EXPECT_EQ(integral("x+1"), "x^2/2+x");
}

TEST_F(CalculusTest, IntegrateReciprocal) {
    EXPECT_EQ(integral("x^-1"), "ln(abs(x))");
    EXPECT_EQ(integral("1/x"), "ln(abs(x))");
}

TEST_F(CalculusTest, IntegrateUnsupported) {
    EXPECT_EQ(integral("sin(x)"), "");
    EXPECT_EQ(error.code, ERR_NOT_IMPLEMENTED);
}

// ============================================================================
// Roots
// ============================================================================

TEST_F(CalculusTest, QuadraticRoots) {
    std::vector<std::string> found;
    ASSERT_TRUE(roots("x^2-5x+6", {}, &found)) << error.message;
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0], "2");
    EXPECT_EQ(found[1], "3");
}

TEST_F(CalculusTest, LinearRootInsideBracket) {
    std::vector<std::string> found;
    ASSERT_TRUE(roots("x-2.5", {"x"}, &found)) << error.message;
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], "2.5");
}

TEST_F(CalculusTest, NoRealRoot) {
    std::vector<std::string> found;
    EXPECT_FALSE(roots("x^2+1", {}, &found));
    EXPECT_EQ(error.code, ERR_NOT_CONVERGED);
    EXPECT_STREQ(err_kind_name(error.code), "ConvergenceError");
}

TEST_F(CalculusTest, RootsTakeOneVariable) {
    std::vector<std::string> found;
    EXPECT_FALSE(roots("x+y", {"x", "y"}, &found));
    EXPECT_EQ(error.code, ERR_INVALID_OPERATION);
    EXPECT_FALSE(roots("x+y", {"x"}, &found));
    EXPECT_EQ(error.code, ERR_UNDEFINED_VARIABLE);
    EXPECT_FALSE(roots("5", {}, &found));
    EXPECT_EQ(error.code, ERR_UNDEFINED_VARIABLE);
}

// ============================================================================
// Series
// ============================================================================

TEST_F(CalculusTest, GeometricSeries) {
    Calculus calculus(&context, config);
    Term out;
    ASSERT_TRUE(calculus.series_sum(Term::symbolic("1/2^n"), &out, &error)) << error.message;
    ASSERT_TRUE(out.is_numeric());
    EXPECT_NEAR(out.value().to_double(), 2.0, 1e-6);
}

TEST_F(CalculusTest, ConstantSeries) {
    Calculus calculus(&context, config);
    Term out;
    ASSERT_TRUE(calculus.series_sum(Term::zero(), &out, &error));
    EXPECT_TRUE(out.is_exact_zero());
    EXPECT_FALSE(calculus.series_sum(Term::numeric(Decimal::from_int(3)), &out, &error));
    EXPECT_EQ(error.code, ERR_NOT_CONVERGED);
}

TEST_F(CalculusTest, DivergentSeriesStops) {
    config.series_max_terms = 50;
    Calculus calculus(&context, config);
    Term out;
    EXPECT_FALSE(calculus.series_sum(Term::symbolic("n"), &out, &error));
    EXPECT_EQ(error.code, ERR_NOT_CONVERGED);
}

// ============================================================================
// Tree queries
// ============================================================================

TEST_F(CalculusTest, TreeQueries) {
    AstPtr tree = parse("2*y^3+x");
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(first_variable(tree.get()), "y");
    EXPECT_EQ(polynomial_degree(tree.get()), 3);
    AstPtr linear = parse("x+1");
    EXPECT_EQ(polynomial_degree(linear.get()), 1);
    AstPtr constant = parse("2+3");
    EXPECT_EQ(first_variable(constant.get()), "");
}
