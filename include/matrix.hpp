// matrix.hpp
#ifndef MATRIX_HPP_
#define MATRIX_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include <gmpxx.h>

namespace matrix {
    // Dense row-major matrix. Homomorphisms act on row vectors: x -> x * M
    template<class R>
    class Matrix {
    private:
        size_t rows_;
        size_t cols_;
        std::vector<R> entries_;

    public:
        Matrix();
        Matrix(const size_t rows, const size_t cols);
        // The column count is explicit so that an empty list of rows keeps its shape
        Matrix(const std::vector<std::vector<R>> &rows, const size_t cols);

        static Matrix<R> identity(const size_t n);
        // c * identity
        static Matrix<R> scalar(const size_t n, const R &c);

        size_t rows() const;
        size_t cols() const;

        R& operator()(const size_t i, const size_t j);
        const R& operator()(const size_t i, const size_t j) const;

        std::vector<R> row(const size_t i) const;
        void set_row(const size_t i, const std::vector<R> &r);
        void append_row(const std::vector<R> &r);

        // Row vector times matrix
        std::vector<R> left_mul(const std::vector<R> &v) const;

        Matrix<R> operator*(const Matrix<R> &rhs) const;
        Matrix<R> operator+(const Matrix<R> &rhs) const;
        Matrix<R> operator-(const Matrix<R> &rhs) const;
        Matrix<R> operator-() const;

        bool operator==(const Matrix<R> &rhs) const;
        bool operator!=(const Matrix<R> &rhs) const;

        Matrix<R> transpose() const;

        // [this; below]
        Matrix<R> stack(const Matrix<R> &below) const;
        // [this | right]
        Matrix<R> augment(const Matrix<R> &right) const;
        Matrix<R> block(const size_t r0, const size_t c0, const size_t nr, const size_t nc) const;
        // Rows [first, rows)
        Matrix<R> rows_from(const size_t first) const;

        void swap_rows(const size_t i, const size_t j);
        void swap_cols(const size_t i, const size_t j);
        // row dst += c * row src
        void add_row(const size_t dst, const size_t src, const R &c);
        // col dst += c * col src
        void add_col(const size_t dst, const size_t src, const R &c);
        void scale_row(const size_t i, const R &c);
        void negate_row(const size_t i);
        void negate_col(const size_t j);

        bool is_zero() const;
        bool is_zero_row(const size_t i) const;

        std::string to_string() const;
    };

    typedef Matrix<mpz_class> ZMatrix;

    mpz_class floor_div(const mpz_class &a, const mpz_class &b);

    // Representative in [0, m)
    mpz_class mod(const mpz_class &a, const mpz_class &m);

    /*
     * Integer algorithms
     */

    // Row Hermite normal form in place: positive pivots, entries above a pivot
    // reduced into [0, pivot). If U is given, U * M_in == M_out with U unimodular.
    // Returns the rank; the nonzero rows come first.
    size_t hnf(ZMatrix &M, ZMatrix *U = nullptr);

    // Rows form a Z-basis of { x : x * M == 0 }
    ZMatrix left_kernel(const ZMatrix &M);

    // Solve x * M == y over Z. Returns false if there is no integral solution.
    bool solve_left(const ZMatrix &M, const std::vector<mpz_class> &y, std::vector<mpz_class> &x);

    // Smith normal form P * M * V == diag(d_1, ..., d_r, 0, ...) with d_i | d_{i+1}.
    // Returns d_1, ..., d_r. Vinv is the inverse of V.
    std::vector<mpz_class> smith(const ZMatrix &M, ZMatrix *V = nullptr, ZMatrix *Vinv = nullptr);

    /*
     * Algorithms over F_p, p prime
     */

    // Reduced row echelon form mod p in place, U * M_in == M_out (mod p)
    size_t rref_mod(ZMatrix &M, const mpz_class &p, ZMatrix *U = nullptr);

    ZMatrix left_kernel_mod(const ZMatrix &M, const mpz_class &p);

    bool solve_left_mod(const ZMatrix &M, const std::vector<mpz_class> &y, const mpz_class &p,
            std::vector<mpz_class> &x);
};

#endif
