#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "../symcalc/context.hpp"

using namespace symcalc;

class ContextTest : public ::testing::Test {
protected:
    Context root;
    EvalConfig config;
    CalcError error;

    Term num(int64_t v) { return Term::numeric(Decimal::from_int(v)); }

    Term dec(const char* text) {
        Decimal d;
        EXPECT_TRUE(Decimal::parse(text, &d)) << text;
        return Term::numeric(d);
    }

    // run a native on the given arguments, "" on failure
    std::string call(const char* name, const std::vector<Term>& args) {
        Term out;
        err_clear(&error);
        if (!root.call_native(name, args, config, &out, &error)) return "";
        return out.render_normalized(config.precision);
    }
};

// ============================================================================
// Constants
// ============================================================================

TEST_F(ContextTest, BuiltinConstants) {
    Decimal pi, e;
    ASSERT_TRUE(root.lookup_constant("pi", &pi));
    ASSERT_TRUE(root.lookup_constant("e", &e));
    EXPECT_EQ(pi.round(10).to_string(), "3.141592654");
    EXPECT_EQ(e.round(10).to_string(), "2.718281828");
    EXPECT_TRUE(root.lookup_constant("PI", nullptr));
    EXPECT_TRUE(root.lookup_constant("E", nullptr));
    EXPECT_FALSE(root.lookup_constant("tau", nullptr));
}

// ============================================================================
// User functions
// ============================================================================

TEST_F(ContextTest, AddAndLookupFunction) {
    FunctionRef fn = root.add_function("f(x,y)=x^2+y", &error);
    ASSERT_NE(fn, nullptr) << error.message;
    EXPECT_EQ(fn->name, "f");
    ASSERT_EQ(fn->params.size(), 2u);
    EXPECT_EQ(ast_render(fn->body.get()), "x^2+y");
    EXPECT_EQ(fn->source, "f(x,y)=x^2+y");
    EXPECT_EQ(root.lookup_function("f"), fn);
    EXPECT_EQ(root.lookup_function("g"), nullptr);
}

TEST_F(ContextTest, DuplicateFunctionRejected) {
    ASSERT_NE(root.add_function("f(x)=x", &error), nullptr);
    EXPECT_EQ(root.add_function("f(y)=2y", &error), nullptr);
    EXPECT_EQ(error.code, ERR_DUPLICATE_DEFINITION);
    EXPECT_STREQ(err_kind_name(error.code), "DefinitionError");
}

TEST_F(ContextTest, NativeNameCannotBeRedefined) {
    EXPECT_EQ(root.add_function("sin(x)=x", &error), nullptr);
    EXPECT_EQ(error.code, ERR_DUPLICATE_DEFINITION);
}

TEST_F(ContextTest, NonDefinitionRejected) {
    EXPECT_EQ(root.add_function("x+1", &error), nullptr);
    EXPECT_EQ(error.code, ERR_INVALID_DEFINITION);
}

TEST_F(ContextTest, FunctionsListedByName) {
    ASSERT_NE(root.add_function("b(x)=x", &error), nullptr);
    ASSERT_NE(root.add_function("a(x)=x", &error), nullptr);
    std::vector<FunctionRef> list = root.functions();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]->name, "a");
    EXPECT_EQ(list[1]->name, "b");
    EXPECT_TRUE(root.remove_function("a"));
    EXPECT_FALSE(root.remove_function("a"));
    EXPECT_EQ(root.functions().size(), 1u);
}

TEST_F(ContextTest, ChildSeesFunctionsWithoutChangingParent) {
    ASSERT_NE(root.add_function("f(x)=x", &error), nullptr);
    Context child(&root);
    EXPECT_EQ(child.depth(), 1);
    EXPECT_EQ(child.parent(), &root);
    EXPECT_NE(child.lookup_function("f"), nullptr);
    ASSERT_NE(child.add_function("g(x)=x", &error), nullptr);
    EXPECT_EQ(root.lookup_function("g"), nullptr);
}

// ============================================================================
// Bindings and names
// ============================================================================

TEST_F(ContextTest, BindingsFollowParentChain) {
    root.bind("x", num(3));
    Context child(&root);
    child.bind("y", Term::symbolic("t+1"));

    Term value;
    ASSERT_TRUE(child.lookup_binding("x", &value));
    EXPECT_EQ(value.to_string(), "3");
    ASSERT_TRUE(child.lookup_binding("y", &value));
    EXPECT_EQ(value.to_string(), "t+1");
    EXPECT_FALSE(root.lookup_binding("y", nullptr));

    child.bind("x", num(4));
    ASSERT_TRUE(child.lookup_binding("x", &value));
    EXPECT_EQ(value.to_string(), "4");
    ASSERT_TRUE(root.lookup_binding("x", &value));
    EXPECT_EQ(value.to_string(), "3");
}

TEST_F(ContextTest, SynthesizedNamesAreShared) {
    EXPECT_EQ(root.synthesize_name(), "_f1");
    Context child(&root);
    EXPECT_EQ(child.synthesize_name(), "_f2");
    EXPECT_EQ(root.synthesize_name(), "_f3");
}

TEST_F(ContextTest, SynthesizedNameSkipsDefinedFunctions) {
    ASSERT_NE(root.add_function("_f1(x)=x", &error), nullptr);
    EXPECT_EQ(root.synthesize_name(), "_f2");
}

// ============================================================================
// Natives
// ============================================================================

TEST_F(ContextTest, NativeRegistry) {
    EXPECT_TRUE(Context::is_native("sin"));
    EXPECT_TRUE(Context::is_native("gcf"));
    EXPECT_FALSE(Context::is_native("f"));
    const NativeFunction* sin_fn = native_lookup("sin");
    ASSERT_NE(sin_fn, nullptr);
    EXPECT_EQ(sin_fn->kind, NativeKind::TRIG);
    EXPECT_STREQ(sin_fn->derivative, "cos(x)");
    EXPECT_EQ(native_lookup("sqrt")->derivative, nullptr);
    EXPECT_EQ(native_lookup("arcsin")->kind, NativeKind::INVERSE_TRIG);
    EXPECT_EQ(native_lookup("tanh")->kind, NativeKind::HYPERBOLIC);
    EXPECT_GT(native_count(), 30u);
    EXPECT_EQ(native_at(native_count()), nullptr);
}

TEST_F(ContextTest, SymbolicArgumentKeepsCall) {
    EXPECT_EQ(call("fac", {Term::symbolic("x")}), "fac(x)");
    EXPECT_EQ(call("log", {Term::symbolic("y"), num(2)}), "log(y,2)");
}

TEST_F(ContextTest, ArityChecked) {
    EXPECT_EQ(call("sin", {num(1), num(2)}), "");
    EXPECT_EQ(error.code, ERR_ARGUMENT_COUNT_MISMATCH);
    EXPECT_STREQ(err_kind_name(error.code), "ArityError");
    EXPECT_EQ(call("log", {}), "");
    EXPECT_EQ(error.code, ERR_ARGUMENT_COUNT_MISMATCH);
}

TEST_F(ContextTest, UnknownNative) {
    EXPECT_EQ(call("nosuch", {num(1)}), "");
    EXPECT_EQ(error.code, ERR_UNDEFINED_FUNCTION);
}

TEST_F(ContextTest, Trigonometry) {
    EXPECT_EQ(call("sin", {num(0)}), "0");
    EXPECT_EQ(call("cos", {num(0)}), "1");
    config.angle_mode = AngleMode::DEGREES;
    EXPECT_EQ(call("sin", {num(30)}), "0.5");
    EXPECT_EQ(call("cos", {num(90)}), "0");
    EXPECT_EQ(call("tan", {num(45)}), "1");
}

TEST_F(ContextTest, InverseTrigDomain) {
    EXPECT_EQ(call("arcsin", {num(2)}), "");
    EXPECT_EQ(error.code, ERR_DOMAIN_ERROR);
}

TEST_F(ContextTest, Algebraic) {
    EXPECT_EQ(call("sqrt", {num(16)}), "4");
    EXPECT_EQ(call("abs", {num(-7)}), "7");
    EXPECT_EQ(call("cbrt", {num(27)}), "3");
    EXPECT_EQ(call("log", {num(1000)}), "3");
    EXPECT_EQ(call("log", {num(8), num(2)}), "3");
    EXPECT_EQ(call("ln", {num(1)}), "0");
    EXPECT_EQ(call("exp", {num(0)}), "1");
}

TEST_F(ContextTest, LogBaseOne) {
    EXPECT_EQ(call("log", {num(8), num(1)}), "");
    EXPECT_EQ(error.code, ERR_DIVISION_BY_ZERO);
}

TEST_F(ContextTest, SqrtOfNegative) {
    EXPECT_EQ(call("sqrt", {num(-4)}), "");
    EXPECT_EQ(error.code, ERR_DOMAIN_ERROR);
}

TEST_F(ContextTest, Combinatorics) {
    EXPECT_EQ(call("fac", {num(5)}), "120");
    EXPECT_EQ(call("fac", {num(0)}), "1");
    EXPECT_EQ(call("perm", {num(5), num(2)}), "20");
    EXPECT_EQ(call("comb", {num(5), num(2)}), "10");
    EXPECT_EQ(call("fac", {dec("2.5")}), "");
    EXPECT_EQ(error.code, ERR_DOMAIN_ERROR);
    EXPECT_EQ(call("fac", {num(-1)}), "");
    EXPECT_EQ(error.code, ERR_DOMAIN_ERROR);
}

TEST_F(ContextTest, IntegerDivision) {
    EXPECT_EQ(call("mod", {num(7), num(3)}), "1");
    EXPECT_EQ(call("div", {num(7), num(2)}), "3");
    EXPECT_EQ(call("div", {num(-7), num(2)}), "-3");
    EXPECT_EQ(call("gcf", {num(12), num(18)}), "6");
    EXPECT_EQ(call("gcf", {num(-4), num(6)}), "2");
    EXPECT_EQ(call("mod", {num(7), num(0)}), "");
    EXPECT_EQ(error.code, ERR_DIVISION_BY_ZERO);
    EXPECT_EQ(call("gcf", {num(0), num(0)}), "");
    EXPECT_EQ(error.code, ERR_DIVISION_BY_ZERO);
}

TEST_F(ContextTest, GcfOfWideIntegers) {
    EXPECT_EQ(call("gcf", {dec("-9223372036854775808"), num(1)}), "1");
    EXPECT_EQ(call("gcf", {dec("-9223372036854775808"), num(6)}), "2");
    EXPECT_EQ(call("gcf", {dec("100000000000000000000"), num(30)}), "10");
    EXPECT_EQ(call("gcf", {dec("1.5"), num(3)}), "");
    EXPECT_EQ(error.code, ERR_DOMAIN_ERROR);
}
