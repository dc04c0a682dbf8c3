// matrix.cpp - Dense matrices of doubles

#include "matrix.hpp"
#include "evaluator.hpp"
#include "parser.hpp"
#include "../lib/log.h"
#include <cmath>
#include <cstdio>
#include <utility>

namespace symcalc {

// ============================================================================
// Construction
// ============================================================================

bool Matrix::from_columns(std::vector<std::vector<double>> cols, Matrix* out, CalcError* error) {
    for (size_t i = 1; i < cols.size(); i++) {
        if (cols[i].size() != cols[0].size()) {
            return err_setf(error, ERR_DIMENSION_MISMATCH, 0, "column %zu has %zu entries, expected %zu",
                            i + 1, cols[i].size(), cols[0].size());
        }
    }
    out->columns = std::move(cols);
    return true;
}

bool Matrix::from_rows(const std::vector<std::vector<double>>& rows, Matrix* out, CalcError* error) {
    size_t width = rows.empty() ? 0 : rows[0].size();
    for (size_t r = 1; r < rows.size(); r++) {
        if (rows[r].size() != width) {
            return err_setf(error, ERR_INVALID_MATRIX_SYNTAX, 0, "row %zu has %zu entries, expected %zu",
                            r + 1, rows[r].size(), width);
        }
    }
    std::vector<std::vector<double>> cols(width, std::vector<double>(rows.size()));
    for (size_t r = 0; r < rows.size(); r++) {
        for (size_t c = 0; c < width; c++) cols[c][r] = rows[r][c];
    }
    out->columns = std::move(cols);
    return true;
}

Matrix Matrix::zeros(size_t rows, size_t cols) {
    Matrix m;
    m.columns.assign(cols, std::vector<double>(rows, 0.0));
    return m;
}

Matrix Matrix::identity(size_t n) {
    Matrix m = zeros(n, n);
    for (size_t i = 0; i < n; i++) m.set(i, i, 1.0);
    return m;
}

void Matrix::swap_rows(size_t a, size_t b) {
    if (a == b) return;
    for (std::vector<double>& col : columns) std::swap(col[a], col[b]);
}

void Matrix::subtract_row(size_t target, size_t source, double factor) {
    for (std::vector<double>& col : columns) col[target] -= factor * col[source];
}

void Matrix::scale_row(size_t row, double factor) {
    for (std::vector<double>& col : columns) col[row] *= factor;
}

// fixed decimals, trailing zeros dropped, never "-0"
static std::string format_entry(double v, int places) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.*f", places, v);
    std::string s = buf;
    if (s.find('.') != std::string::npos) {
        while (s.back() == '0') s.pop_back();
        if (s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

std::string Matrix::to_string(int places) const {
    std::string out;
    for (size_t r = 0; r < rows(); r++) {
        if (r) out += "\n";
        out += "[";
        for (size_t c = 0; c < cols(); c++) {
            if (c) out += " ";
            out += format_entry(at(r, c), places);
        }
        out += "]";
    }
    return out;
}

// ============================================================================
// Parsing
// ============================================================================

bool matrix_parse(const std::string& text, Context* context, const EvalConfig& config, Matrix* out,
                  CalcError* error) {
    AstPtr tree = parse_expression(text.c_str(), error);
    if (!tree) return false;

    std::vector<const AstNode*> row_nodes;
    if (tree->type == AstNodeType::VECTOR) {
        row_nodes.push_back(tree.get());
    } else if (tree->type == AstNodeType::MATRIX) {
        for (const AstPtr& item : tree->items) {
            if (item->type != AstNodeType::VECTOR) {
                return err_set(error, ERR_INVALID_MATRIX_SYNTAX, item->column, "matrix row is not a vector");
            }
            row_nodes.push_back(item.get());
        }
    } else {
        return err_set(error, ERR_INVALID_MATRIX_SYNTAX, tree->column, "expected a matrix such as [1 2][3 4]");
    }

    Evaluator evaluator(context, config);
    std::vector<std::vector<double>> rows;
    for (const AstNode* row : row_nodes) {
        std::vector<double> values;
        for (const AstPtr& item : row->items) {
            Term value;
            if (!evaluator.evaluate(item.get(), &value, error)) return false;
            if (value.is_symbolic()) {
                return err_setf(error, ERR_TYPE_MISMATCH, item->column, "matrix entry '%s' is not a number",
                                value.to_string().c_str());
            }
            values.push_back(value.value().to_double());
        }
        rows.push_back(values);
    }
    if (!Matrix::from_rows(rows, out, error)) return false;
    log_debug("matrix: parsed %zux%zu", out->rows(), out->cols());
    return true;
}

// ============================================================================
// Row reduction
// ============================================================================

// row in [from, rows) with the largest |entry| in col, or rows when all are below epsilon
static size_t find_pivot(const Matrix& m, size_t from, size_t col, double epsilon) {
    size_t best = m.rows();
    double best_abs = epsilon;
    for (size_t r = from; r < m.rows(); r++) {
        double v = std::fabs(m.at(r, col));
        if (v >= best_abs) {
            best = r;
            best_abs = v;
        }
    }
    return best;
}

static void snap_zeros(Matrix* m, double epsilon) {
    for (size_t r = 0; r < m->rows(); r++) {
        for (size_t c = 0; c < m->cols(); c++) {
            if (std::fabs(m->at(r, c)) < epsilon) m->set(r, c, 0.0);
        }
    }
}

Matrix matrix_echelon(const Matrix& m, double epsilon) {
    Matrix r = m;
    size_t row = 0;
    for (size_t col = 0; col < r.cols() && row < r.rows(); col++) {
        size_t pivot = find_pivot(r, row, col, epsilon);
        if (pivot == r.rows()) continue;
        r.swap_rows(row, pivot);
        for (size_t i = row + 1; i < r.rows(); i++) {
            r.subtract_row(i, row, r.at(i, col) / r.at(row, col));
            r.set(i, col, 0.0);
        }
        row++;
    }
    snap_zeros(&r, epsilon);
    return r;
}

Matrix matrix_rref(const Matrix& m, double epsilon) {
    Matrix r = m;
    size_t row = 0;
    for (size_t col = 0; col < r.cols() && row < r.rows(); col++) {
        size_t pivot = find_pivot(r, row, col, epsilon);
        if (pivot == r.rows()) continue;
        r.swap_rows(row, pivot);
        r.scale_row(row, 1.0 / r.at(row, col));
        r.set(row, col, 1.0);
        for (size_t i = 0; i < r.rows(); i++) {
            if (i == row) continue;
            r.subtract_row(i, row, r.at(i, col));
            r.set(i, col, 0.0);
        }
        row++;
    }
    snap_zeros(&r, epsilon);
    return r;
}

bool matrix_determinant(const Matrix& m, double epsilon, double* out, CalcError* error) {
    if (!m.is_square()) {
        return err_setf(error, ERR_DIMENSION_MISMATCH, 0, "determinant needs a square matrix, got %zux%zu",
                        m.rows(), m.cols());
    }
    Matrix r = m;
    double det = 1.0;
    for (size_t col = 0; col < r.cols(); col++) {
        size_t pivot = find_pivot(r, col, col, epsilon);
        if (pivot == r.rows()) {
            *out = 0.0;
            return true;
        }
        if (pivot != col) {
            r.swap_rows(col, pivot);
            det = -det;
        }
        for (size_t i = col + 1; i < r.rows(); i++) {
            r.subtract_row(i, col, r.at(i, col) / r.at(col, col));
        }
        det *= r.at(col, col);
    }
    *out = det;
    return true;
}

bool matrix_inverse(const Matrix& m, double epsilon, Matrix* out, CalcError* error) {
    if (!m.is_square()) {
        return err_setf(error, ERR_DIMENSION_MISMATCH, 0, "inverse needs a square matrix, got %zux%zu",
                        m.rows(), m.cols());
    }
    size_t n = m.rows();
    // [M | I]
    Matrix augmented = Matrix::zeros(n, 2 * n);
    for (size_t r = 0; r < n; r++) {
        for (size_t c = 0; c < n; c++) augmented.set(r, c, m.at(r, c));
        augmented.set(r, n + r, 1.0);
    }
    Matrix reduced = matrix_rref(augmented, epsilon);
    for (size_t i = 0; i < n; i++) {
        if (std::fabs(reduced.at(i, i) - 1.0) >= epsilon) {
            return err_set(error, ERR_SINGULAR_MATRIX, 0, "matrix is singular");
        }
    }
    Matrix inv = Matrix::zeros(n, n);
    for (size_t r = 0; r < n; r++) {
        for (size_t c = 0; c < n; c++) inv.set(r, c, reduced.at(r, n + c));
    }
    *out = inv;
    return true;
}

// ============================================================================
// Products
// ============================================================================

bool matrix_multiply(const Matrix& a, const Matrix& b, Matrix* out, CalcError* error) {
    if (a.cols() != b.rows()) {
        return err_setf(error, ERR_DIMENSION_MISMATCH, 0, "cannot multiply %zux%zu by %zux%zu", a.rows(),
                        a.cols(), b.rows(), b.cols());
    }
    Matrix p = Matrix::zeros(a.rows(), b.cols());
    for (size_t r = 0; r < a.rows(); r++) {
        for (size_t c = 0; c < b.cols(); c++) {
            double sum = 0.0;
            for (size_t k = 0; k < a.cols(); k++) sum += a.at(r, k) * b.at(k, c);
            p.set(r, c, sum);
        }
    }
    *out = p;
    return true;
}

Matrix matrix_transpose(const Matrix& m) {
    Matrix t = Matrix::zeros(m.cols(), m.rows());
    for (size_t r = 0; r < m.rows(); r++) {
        for (size_t c = 0; c < m.cols(); c++) t.set(c, r, m.at(r, c));
    }
    return t;
}

// Faddeev-LeVerrier: M_k = A M_{k-1} + c_{n-k+1} I, c_{n-k} = -tr(A M_k) / k
bool matrix_characteristic_polynomial(const Matrix& m, std::vector<double>* coeffs, CalcError* error) {
    if (!m.is_square()) {
        return err_setf(error, ERR_DIMENSION_MISMATCH, 0,
                        "characteristic polynomial needs a square matrix, got %zux%zu", m.rows(), m.cols());
    }
    size_t n = m.rows();
    coeffs->assign(n + 1, 0.0);
    (*coeffs)[0] = 1.0;
    Matrix acc = Matrix::zeros(n, n);
    for (size_t k = 1; k <= n; k++) {
        Matrix product;
        if (!matrix_multiply(m, acc, &product, error)) return false;
        for (size_t i = 0; i < n; i++) product.set(i, i, product.at(i, i) + (*coeffs)[k - 1]);
        acc = product;
        Matrix am;
        if (!matrix_multiply(m, acc, &am, error)) return false;
        double trace = 0.0;
        for (size_t i = 0; i < n; i++) trace += am.at(i, i);
        (*coeffs)[k] = -trace / (double)k;
    }
    return true;
}

std::string polynomial_to_string(const std::vector<double>& coeffs, const std::string& var, int places) {
    std::string out;
    size_t degree = coeffs.empty() ? 0 : coeffs.size() - 1;
    for (size_t i = 0; i < coeffs.size(); i++) {
        size_t power = degree - i;
        std::string magnitude = format_entry(std::fabs(coeffs[i]), places);
        if (magnitude == "0") continue;
        bool negative = coeffs[i] < 0;
        if (out.empty()) {
            if (negative) out += "-";
        } else {
            out += negative ? "-" : "+";
        }
        if (magnitude != "1" || power == 0) out += magnitude;
        if (power > 0) out += var;
        if (power > 1) out += "^" + std::to_string(power);
    }
    return out.empty() ? "0" : out;
}

bool matrix_approx_equal(const Matrix& a, const Matrix& b, double epsilon) {
    if (a.rows() != b.rows() || a.cols() != b.cols()) return false;
    for (size_t r = 0; r < a.rows(); r++) {
        for (size_t c = 0; c < a.cols(); c++) {
            if (std::fabs(a.at(r, c) - b.at(r, c)) >= epsilon) return false;
        }
    }
    return true;
}

} // namespace symcalc
