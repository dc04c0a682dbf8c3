// context.hpp - Evaluation scope: constants, user functions, bindings, natives
//
// A root Context is created per session. Calling a user function creates a
// child Context that copies the function table (definitions are shared and
// immutable) and holds its own parameter bindings, so the caller's scope is
// never modified. Synthesized helper names come from a counter shared by the
// whole chain.

#ifndef SYMCALC_CONTEXT_HPP
#define SYMCALC_CONTEXT_HPP

#include "ast.hpp"
#include "calc_error.hpp"
#include "config.hpp"
#include "term.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace symcalc {

class Context;

// ============================================================================
// User functions
// ============================================================================

struct FunctionDefinition {
    std::string name;
    std::vector<std::string> params;
    AstPtr body;
    std::string source;         // text the definition was created from
};

typedef std::shared_ptr<const FunctionDefinition> FunctionRef;

// ============================================================================
// Native functions
// ============================================================================

enum class NativeKind : uint8_t {
    TRIG,           // argument is an angle
    INVERSE_TRIG,   // result is an angle
    HYPERBOLIC,
    ALGEBRAIC,
};

// Arguments are already evaluated and numeric, except for `sum`
typedef bool (*NativeImpl)(Context* context, const std::vector<Term>& args,
                           const EvalConfig& config, Term* out, CalcError* error);

struct NativeFunction {
    const char* name;
    int min_args;
    int max_args;
    NativeKind kind;
    const char* derivative;     // d/dx of name(x), written in x; NULL if none
    NativeImpl impl;
};

// NULL when name is not a native function
const NativeFunction* native_lookup(const std::string& name);
size_t native_count();
const NativeFunction* native_at(size_t index);

// ============================================================================
// Context
// ============================================================================

#define SYMCALC_SYNTH_PREFIX "_f"

class Context {
public:
    Context();                                  // root scope with e, pi, E, PI
    explicit Context(Context* parent);          // child scope

    Context* parent() const { return parent_; }
    int depth() const { return depth_; }

    // ─── Constants ───
    bool lookup_constant(const std::string& name, Decimal* out) const;
    const std::map<std::string, Decimal>& constants() const { return constants_; }

    // ─── User functions ───
    // Parse `name(params) = body` and store it. Duplicate names, including
    // native function names, are rejected.
    FunctionRef add_function(const std::string& text, CalcError* error);
    // Store an already parsed FUNCTION_DEF node
    FunctionRef define_function(AstPtr def, const std::string& source, CalcError* error);
    FunctionRef lookup_function(const std::string& name) const;
    bool remove_function(const std::string& name);
    // Sorted by name
    std::vector<FunctionRef> functions() const;

    // ─── Natives ───
    static bool is_native(const std::string& name) { return native_lookup(name) != nullptr; }
    // Check arity and run the native. Symbolic arguments give the call text
    // `name(args)` for every native except `sum`.
    bool call_native(const std::string& name, const std::vector<Term>& args,
                     const EvalConfig& config, Term* out, CalcError* error);

    // ─── Bindings ───
    void bind(const std::string& name, const Term& value);
    // Searches this scope, then the parent chain
    bool lookup_binding(const std::string& name, Term* out) const;

    // Fresh `_fN` name not used by any function in this scope
    std::string synthesize_name();

private:
    Context* parent_;
    int depth_;
    std::map<std::string, Decimal> constants_;
    std::map<std::string, FunctionRef> functions_;
    std::map<std::string, Term> bindings_;
    std::shared_ptr<unsigned> synth_counter_;
};

} // namespace symcalc

#endif // SYMCALC_CONTEXT_HPP
