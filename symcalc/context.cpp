// context.cpp - Evaluation scope

#include "context.hpp"
#include "parser.hpp"
#include "../lib/log.h"

namespace symcalc {

static const char* PI_TEXT = "3.14159265358979323846264338327950288419716939937511";
static const char* E_TEXT = "2.71828182845904523536028747135266249775724709369996";

Context::Context() : parent_(nullptr), depth_(0), synth_counter_(std::make_shared<unsigned>(0)) {
    Decimal pi, e;
    Decimal::parse(PI_TEXT, &pi);
    Decimal::parse(E_TEXT, &e);
    constants_["pi"] = pi;
    constants_["PI"] = pi;
    constants_["e"] = e;
    constants_["E"] = e;
}

Context::Context(Context* parent)
    : parent_(parent), depth_(parent->depth_ + 1), constants_(parent->constants_),
      functions_(parent->functions_), synth_counter_(parent->synth_counter_) {}

bool Context::lookup_constant(const std::string& name, Decimal* out) const {
    auto it = constants_.find(name);
    if (it == constants_.end()) return false;
    if (out) *out = it->second;
    return true;
}

// ============================================================================
// User functions
// ============================================================================

FunctionRef Context::add_function(const std::string& text, CalcError* error) {
    AstPtr def = parse_definition(text.c_str(), error);
    if (!def) return nullptr;
    return define_function(std::move(def), text, error);
}

FunctionRef Context::define_function(AstPtr def, const std::string& source, CalcError* error) {
    if (!def || def->type != AstNodeType::FUNCTION_DEF) {
        err_set(error, ERR_INVALID_DEFINITION, 0, "expected a function definition");
        return nullptr;
    }
    if (is_native(def->name)) {
        err_setf(error, ERR_DUPLICATE_DEFINITION, def->column, "'%s' is a built-in function",
                 def->name.c_str());
        return nullptr;
    }
    if (functions_.count(def->name)) {
        err_setf(error, ERR_DUPLICATE_DEFINITION, def->column, "function '%s' is already defined",
                 def->name.c_str());
        return nullptr;
    }

    std::shared_ptr<FunctionDefinition> fn = std::make_shared<FunctionDefinition>();
    fn->name = def->name;
    fn->params = def->params;
    fn->body = std::move(def->body);
    fn->source = source;
    functions_[fn->name] = fn;
    log_debug("context: defined %s/%zu at depth %d", fn->name.c_str(), fn->params.size(), depth_);
    return fn;
}

FunctionRef Context::lookup_function(const std::string& name) const {
    auto it = functions_.find(name);
    if (it == functions_.end()) return nullptr;
    return it->second;
}

bool Context::remove_function(const std::string& name) {
    return functions_.erase(name) > 0;
}

std::vector<FunctionRef> Context::functions() const {
    std::vector<FunctionRef> list;
    list.reserve(functions_.size());
    for (const auto& entry : functions_) list.push_back(entry.second);
    return list;
}

// ============================================================================
// Natives
// ============================================================================

bool Context::call_native(const std::string& name, const std::vector<Term>& args,
                          const EvalConfig& config, Term* out, CalcError* error) {
    const NativeFunction* native = native_lookup(name);
    if (!native) {
        return err_setf(error, ERR_UNDEFINED_FUNCTION, 0, "Function not found: %s", name.c_str());
    }
    int count = (int)args.size();
    if (count < native->min_args || count > native->max_args) {
        if (native->min_args == native->max_args) {
            return err_setf(error, ERR_ARGUMENT_COUNT_MISMATCH, 0, "%s expects %d argument%s, got %d",
                            name.c_str(), native->min_args, native->min_args == 1 ? "" : "s", count);
        }
        return err_setf(error, ERR_ARGUMENT_COUNT_MISMATCH, 0, "%s expects %d to %d arguments, got %d",
                        name.c_str(), native->min_args, native->max_args, count);
    }

    if (name != "sum") {
        bool symbolic = false;
        for (const Term& arg : args) {
            if (arg.is_symbolic()) symbolic = true;
        }
        if (symbolic) {
            std::string text = name + "(";
            for (size_t i = 0; i < args.size(); i++) {
                if (i) text += ",";
                text += args[i].to_string();
            }
            text += ")";
            *out = Term::symbolic(text);
            return true;
        }
    }
    return native->impl(this, args, config, out, error);
}

// ============================================================================
// Bindings
// ============================================================================

void Context::bind(const std::string& name, const Term& value) {
    bindings_[name] = value;
}

bool Context::lookup_binding(const std::string& name, Term* out) const {
    for (const Context* scope = this; scope; scope = scope->parent_) {
        auto it = scope->bindings_.find(name);
        if (it != scope->bindings_.end()) {
            if (out) *out = it->second;
            return true;
        }
    }
    return false;
}

std::string Context::synthesize_name() {
    std::string name;
    do {
        (*synth_counter_)++;
        name = SYMCALC_SYNTH_PREFIX + std::to_string(*synth_counter_);
    } while (functions_.count(name) || is_native(name));
    return name;
}

} // namespace symcalc
