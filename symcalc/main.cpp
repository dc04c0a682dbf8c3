// main.cpp - symcalc interactive shell

#include "symcalc.hpp"
#include "../lib/log.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>  // for isatty()

#include <editline/readline.h>

using namespace symcalc;

static void print_help() {
    printf("symcalc - symbolic calculator\n");
    printf("Usage:\n");
    printf("  symcalc                      - Start REPL mode (default)\n");
    printf("  symcalc -e <expr>            - Evaluate one expression and exit\n");
    printf("  symcalc --log-level <level>  - debug, info, notice, warn, error, fatal\n");
    printf("  symcalc --help               - Show this help message\n");
    printf("\nREPL Commands:\n");
    printf("  :d <expr>, <var>       - Derivative\n");
    printf("  :i <expr>, <var>       - Integral\n");
    printf("  :roots <expr>, <var>   - Real roots\n");
    printf("  :simplify <expr>       - Fold and factor\n");
    printf("  :rref <matrix>         - Reduced row-echelon form, e.g. :rref [1 2][3 4]\n");
    printf("  :echelon <matrix>      - Row-echelon form\n");
    printf("  :det <matrix>          - Determinant\n");
    printf("  :inv <matrix>          - Inverse\n");
    printf("  :charpoly <matrix>     - Characteristic polynomial\n");
    printf("  :config [k=v;...]      - Show or change settings\n");
    printf("  :help, :h              - Show help\n");
    printf("  :quit, :q              - Exit REPL\n");
    printf("\nAnything else is evaluated; f(x)=... defines a function.\n");
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// "<expr>, <var>": the variable is whatever follows the last top-level comma
static void split_expr_var(const std::string& args, std::string* expr, std::string* var) {
    int depth = 0;
    size_t split = std::string::npos;
    for (size_t i = 0; i < args.size(); i++) {
        char c = args[i];
        if (c == '(' || c == '[') depth++;
        else if (c == ')' || c == ']') depth--;
        else if (c == ',' && depth == 0) split = i;
    }
    if (split == std::string::npos) {
        *expr = trim(args);
        var->clear();
    } else {
        *expr = trim(args.substr(0, split));
        *var = trim(args.substr(split + 1));
    }
}

static void print_error(const CalcError& error) {
    fprintf(stderr, "%s\n", err_format(error).c_str());
}

static bool run_matrix_command(Session* session, const std::string& cmd, const std::string& args,
                               CalcError* error) {
    Matrix m;
    if (!session->parse_matrix(args, &m, error)) return false;
    int places = session->config().display_places;
    if (cmd == "rref") {
        printf("%s\n", session->row_reduce(m).to_string(places).c_str());
    } else if (cmd == "echelon") {
        printf("%s\n", session->echelon(m).to_string(places).c_str());
    } else if (cmd == "det") {
        Term det;
        if (!session->determinant(m, &det, error)) return false;
        printf("%s\n", det.to_string().c_str());
    } else if (cmd == "inv") {
        Matrix inv;
        if (!session->inverse(m, &inv, error)) return false;
        printf("%s\n", inv.to_string(places).c_str());
    } else {
        Term poly;
        if (!session->characteristic_polynomial(m, &poly, error)) return false;
        printf("%s\n", poly.to_string().c_str());
    }
    return true;
}

// Runs one input line. Returns false when it failed; *quit is set by :quit.
static bool run_line(Session* session, const std::string& raw, bool* quit) {
    std::string line = trim(raw);
    CalcError error;
    Term result;
    if (line.empty() || line[0] != ':') {
        if (!session->evaluate(line, &result, &error)) {
            print_error(error);
            return false;
        }
        printf("%s\n", result.to_string().c_str());
        return true;
    }

    size_t space = line.find_first_of(" \t");
    std::string cmd = line.substr(1, space == std::string::npos ? std::string::npos : space - 1);
    std::string args = space == std::string::npos ? "" : trim(line.substr(space));
    log_debug("repl: command '%s' args '%s'", cmd.c_str(), args.c_str());

    bool ok = true;
    if (cmd == "quit" || cmd == "q" || cmd == "exit") {
        *quit = true;
    } else if (cmd == "help" || cmd == "h") {
        print_help();
    } else if (cmd == "d" || cmd == "i") {
        std::string expr, var;
        split_expr_var(args, &expr, &var);
        ok = cmd == "d" ? session->differentiate(expr, var, &result, &error)
                        : session->integrate(expr, var, &result, &error);
        if (ok) printf("%s\n", result.to_string().c_str());
    } else if (cmd == "roots") {
        std::string expr, var;
        split_expr_var(args, &expr, &var);
        std::vector<std::string> vars;
        if (!var.empty()) vars.push_back(var);
        std::vector<Decimal> roots;
        ok = session->find_roots(expr, vars, &roots, &error);
        if (ok) {
            std::string out;
            for (size_t i = 0; i < roots.size(); i++) {
                if (i) out += ", ";
                out += roots[i].to_string();
            }
            printf("%s\n", out.c_str());
        }
    } else if (cmd == "simplify") {
        ok = session->simplify(args, &result, &error);
        if (ok) printf("%s\n", result.to_string().c_str());
    } else if (cmd == "rref" || cmd == "echelon" || cmd == "det" || cmd == "inv" || cmd == "charpoly") {
        ok = run_matrix_command(session, cmd, args, &error);
    } else if (cmd == "config") {
        if (!args.empty()) ok = session->configure(args, &error);
        if (ok) printf("%s\n", config_to_string(session->config()).c_str());
    } else {
        err_setf(&error, ERR_SYNTAX_ERROR, 1, "unknown command ':%s' (try :help)", cmd.c_str());
        ok = false;
    }
    if (!ok) print_error(error);
    return ok;
}

static void run_repl(Session* session) {
    bool interactive = isatty(STDIN_FILENO) && isatty(STDOUT_FILENO);
    bool quit = false;
    if (interactive) {
        printf("symcalc - type :help for commands\n");
        while (!quit) {
            char* line = readline("> ");
            if (!line) break;
            if (*line) add_history(line);
            run_line(session, line, &quit);
            free(line);
        }
        return;
    }
    // piped input: plain line reads, no prompt
    char buffer[4096];
    while (!quit && fgets(buffer, sizeof(buffer), stdin)) {
        run_line(session, buffer, &quit);
    }
}

int main(int argc, char* argv[]) {
    log_init("level=warn");
    const char* env_config = getenv("SYMCALC_LOG");
    if (env_config && log_parse_config_string(env_config) != LOG_OK) {
        fprintf(stderr, "Warning: Failed to parse SYMCALC_LOG, using defaults\n");
    }

    const char* one_shot = nullptr;
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            print_help();
            log_fini();
            return 0;
        } else if (strcmp(argv[i], "-e") == 0 && i + 1 < argc) {
            one_shot = argv[++i];
        } else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            std::string config = std::string("level=") + argv[++i];
            if (log_parse_config_string(config.c_str()) != LOG_OK) {
                fprintf(stderr, "Error: unknown log level '%s'\n", argv[i]);
                log_fini();
                return 1;
            }
        } else {
            fprintf(stderr, "Error: unknown argument '%s'\n", argv[i]);
            print_help();
            log_fini();
            return 1;
        }
    }
    log_debug("main() started with %d arguments", argc);

    Session session;
    int exit_code = 0;
    if (one_shot) {
        bool quit = false;
        exit_code = run_line(&session, one_shot, &quit) ? 0 : 1;
    } else {
        run_repl(&session);
    }
    log_fini();
    return exit_code;
}
