// matrix.hpp - Dense matrices of doubles
//
// A Matrix is a list of equal-length column vectors. Every operation below
// returns a new matrix and leaves its input untouched. Pivot tests treat
// |v| < epsilon as zero; callers pass EvalConfig::matrix_epsilon.

#ifndef SYMCALC_MATRIX_HPP
#define SYMCALC_MATRIX_HPP

#include "calc_error.hpp"
#include "config.hpp"
#include "context.hpp"
#include <string>
#include <vector>

namespace symcalc {

class Matrix {
public:
    Matrix() {}

    // Fails with ERR_DIMENSION_MISMATCH when columns differ in length
    static bool from_columns(std::vector<std::vector<double>> columns, Matrix* out, CalcError* error);
    // Fails with ERR_INVALID_MATRIX_SYNTAX when rows differ in length
    static bool from_rows(const std::vector<std::vector<double>>& rows, Matrix* out, CalcError* error);
    static Matrix identity(size_t n);
    static Matrix zeros(size_t rows, size_t cols);

    size_t rows() const { return columns.empty() ? 0 : columns[0].size(); }
    size_t cols() const { return columns.size(); }
    bool is_square() const { return rows() == cols(); }
    bool empty() const { return columns.empty(); }

    double at(size_t row, size_t col) const { return columns[col][row]; }
    void set(size_t row, size_t col, double value) { columns[col][row] = value; }

    void swap_rows(size_t a, size_t b);
    // row[target] -= factor * row[source]
    void subtract_row(size_t target, size_t source, double factor);
    void scale_row(size_t row, double factor);

    // One "[a b c]" line per row, entries rounded to places decimals
    std::string to_string(int places) const;

private:
    std::vector<std::vector<double>> columns;
};

// Parse `[1 2][3 4]` or `[[1,2],[3,4]]`; each element may be any scalar
// expression and is evaluated in context.
bool matrix_parse(const std::string& text, Context* context, const EvalConfig& config, Matrix* out,
                  CalcError* error);

Matrix matrix_echelon(const Matrix& m, double epsilon);
Matrix matrix_rref(const Matrix& m, double epsilon);
bool matrix_determinant(const Matrix& m, double epsilon, double* out, CalcError* error);
// ERR_SINGULAR_MATRIX when no inverse exists
bool matrix_inverse(const Matrix& m, double epsilon, Matrix* out, CalcError* error);
bool matrix_multiply(const Matrix& a, const Matrix& b, Matrix* out, CalcError* error);
Matrix matrix_transpose(const Matrix& m);

// Coefficients of det(xI - M), highest power first (leading 1)
bool matrix_characteristic_polynomial(const Matrix& m, std::vector<double>* coeffs, CalcError* error);
// "x^2-5x+6" with coefficients rounded to places decimals
std::string polynomial_to_string(const std::vector<double>& coeffs, const std::string& var, int places);

bool matrix_approx_equal(const Matrix& a, const Matrix& b, double epsilon);

} // namespace symcalc

#endif // SYMCALC_MATRIX_HPP
