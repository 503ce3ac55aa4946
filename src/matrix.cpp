#include "../include/matrix.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <gmpxx.h>

/*
 * Matrix
 */

template<class R>
matrix::Matrix<R>::Matrix() : rows_(0), cols_(0) {}

template<class R>
matrix::Matrix<R>::Matrix(const size_t rows, const size_t cols)
    : rows_(rows), cols_(cols), entries_(rows * cols, R(0)) {}

template<class R>
matrix::Matrix<R>::Matrix(const std::vector<std::vector<R>> &rows, const size_t cols)
    : rows_(rows.size()), cols_(cols) {
    entries_.reserve(rows_ * cols_);
    for (const std::vector<R> &r : rows) {
        if (r.size() != cols_) throw std::invalid_argument("Matrix row of length " + std::to_string(r.size())
                + ", expected " + std::to_string(cols_));
        entries_.insert(entries_.end(), r.begin(), r.end());
    }
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::identity(const size_t n) {
    return scalar(n, R(1));
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::scalar(const size_t n, const R &c) {
    Matrix<R> res(n, n);
    for (size_t i = 0; i < n; i++) res(i, i) = c;
    return res;
}

template<class R>
size_t matrix::Matrix<R>::rows() const { return rows_; }

template<class R>
size_t matrix::Matrix<R>::cols() const { return cols_; }

template<class R>
R& matrix::Matrix<R>::operator()(const size_t i, const size_t j) {
    return entries_[i * cols_ + j];
}

template<class R>
const R& matrix::Matrix<R>::operator()(const size_t i, const size_t j) const {
    return entries_[i * cols_ + j];
}

template<class R>
std::vector<R> matrix::Matrix<R>::row(const size_t i) const {
    return std::vector<R>(entries_.begin() + i * cols_, entries_.begin() + (i + 1) * cols_);
}

template<class R>
void matrix::Matrix<R>::set_row(const size_t i, const std::vector<R> &r) {
    if (r.size() != cols_) throw std::invalid_argument("Row length mismatch");
    std::copy(r.begin(), r.end(), entries_.begin() + i * cols_);
}

template<class R>
void matrix::Matrix<R>::append_row(const std::vector<R> &r) {
    if (r.size() != cols_) throw std::invalid_argument("Row length mismatch");
    entries_.insert(entries_.end(), r.begin(), r.end());
    rows_++;
}

template<class R>
std::vector<R> matrix::Matrix<R>::left_mul(const std::vector<R> &v) const {
    if (v.size() != rows_) throw std::invalid_argument("Vector of length " + std::to_string(v.size())
            + " cannot multiply a matrix with " + std::to_string(rows_) + " rows");
    std::vector<R> res(cols_, R(0));
    for (size_t i = 0; i < rows_; i++) {
        if (v[i] == 0) continue;
        for (size_t j = 0; j < cols_; j++) res[j] += v[i] * (*this)(i, j);
    }
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::operator*(const Matrix<R> &rhs) const {
    if (cols_ != rhs.rows_) throw std::invalid_argument("Matrix dimensions do not match for multiplication");
    Matrix<R> res(rows_, rhs.cols_);
    for (size_t i = 0; i < rows_; i++) {
        for (size_t k = 0; k < cols_; k++) {
            const R &a = (*this)(i, k);
            if (a == 0) continue;
            for (size_t j = 0; j < rhs.cols_; j++) res(i, j) += a * rhs(k, j);
        }
    }
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::operator+(const Matrix<R> &rhs) const {
    if (rows_ != rhs.rows_ || cols_ != rhs.cols_) throw std::invalid_argument("Matrix dimensions do not match for addition");
    Matrix<R> res(*this);
    for (size_t i = 0; i < entries_.size(); i++) res.entries_[i] += rhs.entries_[i];
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::operator-(const Matrix<R> &rhs) const {
    if (rows_ != rhs.rows_ || cols_ != rhs.cols_) throw std::invalid_argument("Matrix dimensions do not match for subtraction");
    Matrix<R> res(*this);
    for (size_t i = 0; i < entries_.size(); i++) res.entries_[i] -= rhs.entries_[i];
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::operator-() const {
    Matrix<R> res(*this);
    for (R &e : res.entries_) e = -e;
    return res;
}

template<class R>
bool matrix::Matrix<R>::operator==(const Matrix<R> &rhs) const {
    return rows_ == rhs.rows_ && cols_ == rhs.cols_ && entries_ == rhs.entries_;
}

template<class R>
bool matrix::Matrix<R>::operator!=(const Matrix<R> &rhs) const {
    return !(*this == rhs);
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::transpose() const {
    Matrix<R> res(cols_, rows_);
    for (size_t i = 0; i < rows_; i++) {
        for (size_t j = 0; j < cols_; j++) res(j, i) = (*this)(i, j);
    }
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::stack(const Matrix<R> &below) const {
    if (cols_ != below.cols_) throw std::invalid_argument("Cannot stack matrices with different column counts");
    Matrix<R> res(*this);
    res.entries_.insert(res.entries_.end(), below.entries_.begin(), below.entries_.end());
    res.rows_ += below.rows_;
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::augment(const Matrix<R> &right) const {
    if (rows_ != right.rows_) throw std::invalid_argument("Cannot augment matrices with different row counts");
    Matrix<R> res(rows_, cols_ + right.cols_);
    for (size_t i = 0; i < rows_; i++) {
        for (size_t j = 0; j < cols_; j++) res(i, j) = (*this)(i, j);
        for (size_t j = 0; j < right.cols_; j++) res(i, cols_ + j) = right(i, j);
    }
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::block(const size_t r0, const size_t c0, const size_t nr, const size_t nc) const {
    if (r0 + nr > rows_ || c0 + nc > cols_) throw std::invalid_argument("Block out of range");
    Matrix<R> res(nr, nc);
    for (size_t i = 0; i < nr; i++) {
        for (size_t j = 0; j < nc; j++) res(i, j) = (*this)(r0 + i, c0 + j);
    }
    return res;
}

template<class R>
matrix::Matrix<R> matrix::Matrix<R>::rows_from(const size_t first) const {
    return block(first, 0, rows_ - first, cols_);
}

template<class R>
void matrix::Matrix<R>::swap_rows(const size_t i, const size_t j) {
    if (i == j) return;
    for (size_t k = 0; k < cols_; k++) std::swap(entries_[i * cols_ + k], entries_[j * cols_ + k]);
}

template<class R>
void matrix::Matrix<R>::swap_cols(const size_t i, const size_t j) {
    if (i == j) return;
    for (size_t k = 0; k < rows_; k++) std::swap(entries_[k * cols_ + i], entries_[k * cols_ + j]);
}

template<class R>
void matrix::Matrix<R>::add_row(const size_t dst, const size_t src, const R &c) {
    if (c == 0) return;
    for (size_t k = 0; k < cols_; k++) entries_[dst * cols_ + k] += c * entries_[src * cols_ + k];
}

template<class R>
void matrix::Matrix<R>::add_col(const size_t dst, const size_t src, const R &c) {
    if (c == 0) return;
    for (size_t k = 0; k < rows_; k++) entries_[k * cols_ + dst] += c * entries_[k * cols_ + src];
}

template<class R>
void matrix::Matrix<R>::scale_row(const size_t i, const R &c) {
    for (size_t k = 0; k < cols_; k++) entries_[i * cols_ + k] *= c;
}

template<class R>
void matrix::Matrix<R>::negate_row(const size_t i) {
    for (size_t k = 0; k < cols_; k++) entries_[i * cols_ + k] = -entries_[i * cols_ + k];
}

template<class R>
void matrix::Matrix<R>::negate_col(const size_t j) {
    for (size_t k = 0; k < rows_; k++) entries_[k * cols_ + j] = -entries_[k * cols_ + j];
}

template<class R>
bool matrix::Matrix<R>::is_zero() const {
    for (const R &e : entries_) {
        if (e != 0) return false;
    }
    return true;
}

template<class R>
bool matrix::Matrix<R>::is_zero_row(const size_t i) const {
    for (size_t k = 0; k < cols_; k++) {
        if (entries_[i * cols_ + k] != 0) return false;
    }
    return true;
}

template<class R>
std::string matrix::Matrix<R>::to_string() const {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < rows_; i++) {
        if (i) ss << "; ";
        for (size_t j = 0; j < cols_; j++) {
            if (j) ss << " ";
            ss << (*this)(i, j);
        }
    }
    ss << "]";
    return ss.str();
}

/*
 * Integer algorithms
 */

mpz_class matrix::floor_div(const mpz_class &a, const mpz_class &b) {
    mpz_class q;
    mpz_fdiv_q(q.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
    return q;
}

mpz_class matrix::mod(const mpz_class &a, const mpz_class &m) {
    mpz_class r;
    mpz_mod(r.get_mpz_t(), a.get_mpz_t(), m.get_mpz_t());
    return r;
}

size_t matrix::hnf(ZMatrix &M, ZMatrix *U) {
    const size_t m = M.rows();
    const size_t n = M.cols();
    if (U != nullptr) *U = ZMatrix::identity(m);

    size_t rank = 0;
    for (size_t j = 0; j < n && rank < m; j++) {
        // Euclid on column j among the active rows, smallest entry as pivot
        while (true) {
            size_t piv = m;
            for (size_t i = rank; i < m; i++) {
                if (M(i, j) == 0) continue;
                if (piv == m || abs(M(i, j)) < abs(M(piv, j))) piv = i;
            }
            if (piv == m) break;

            M.swap_rows(piv, rank);
            if (U != nullptr) U->swap_rows(piv, rank);
            if (M(rank, j) < 0) {
                M.negate_row(rank);
                if (U != nullptr) U->negate_row(rank);
            }

            bool done = true;
            for (size_t i = rank + 1; i < m; i++) {
                if (M(i, j) == 0) continue;
                const mpz_class q = floor_div(M(i, j), M(rank, j));
                const mpz_class c = -q;
                M.add_row(i, rank, c);
                if (U != nullptr) U->add_row(i, rank, c);
                if (M(i, j) != 0) done = false;
            }
            if (done) break;
        }

        if (M(rank, j) == 0) continue;

        for (size_t i = 0; i < rank; i++) {
            const mpz_class q = floor_div(M(i, j), M(rank, j));
            if (q == 0) continue;
            const mpz_class c = -q;
            M.add_row(i, rank, c);
            if (U != nullptr) U->add_row(i, rank, c);
        }
        rank++;
    }
    return rank;
}

matrix::ZMatrix matrix::left_kernel(const ZMatrix &M) {
    ZMatrix H(M);
    ZMatrix U;
    const size_t rank = hnf(H, &U);
    return U.rows_from(rank);
}

bool matrix::solve_left(const ZMatrix &M, const std::vector<mpz_class> &y, std::vector<mpz_class> &x) {
    if (y.size() != M.cols()) throw std::invalid_argument("solve_left: right hand side has length "
            + std::to_string(y.size()) + ", expected " + std::to_string(M.cols()));
    ZMatrix H(M);
    ZMatrix U;
    const size_t rank = hnf(H, &U);

    // Forward substitution along the pivots of the echelon form
    std::vector<mpz_class> res(y);
    std::vector<mpz_class> c(M.rows(), 0);
    size_t j = 0;
    for (size_t k = 0; k < rank; k++) {
        while (H(k, j) == 0) j++;
        if (!mpz_divisible_p(res[j].get_mpz_t(), H(k, j).get_mpz_t())) return false;
        mpz_divexact(c[k].get_mpz_t(), res[j].get_mpz_t(), H(k, j).get_mpz_t());
        for (size_t l = j; l < H.cols(); l++) res[l] -= c[k] * H(k, l);
    }
    for (const mpz_class &r : res) {
        if (r != 0) return false;
    }
    x = U.left_mul(c);
    return true;
}

std::vector<mpz_class> matrix::smith(const ZMatrix &M_in, ZMatrix *V, ZMatrix *Vinv) {
    ZMatrix M(M_in);
    const size_t m = M.rows();
    const size_t n = M.cols();
    if (V != nullptr) *V = ZMatrix::identity(n);
    if (Vinv != nullptr) *Vinv = ZMatrix::identity(n);

    // Column operations are recorded in V, their inverses in Vinv
    auto col_swap = [&](const size_t a, const size_t b) {
        M.swap_cols(a, b);
        if (V != nullptr) V->swap_cols(a, b);
        if (Vinv != nullptr) Vinv->swap_rows(a, b);
    };
    auto col_add = [&](const size_t dst, const size_t src, const mpz_class &c) {
        M.add_col(dst, src, c);
        if (V != nullptr) V->add_col(dst, src, c);
        if (Vinv != nullptr) Vinv->add_row(src, dst, -c);
    };

    std::vector<mpz_class> diag;
    size_t t = 0;
    while (t < m && t < n) {
        size_t pi = m, pj = n;
        for (size_t i = t; i < m; i++) {
            for (size_t j = t; j < n; j++) {
                if (M(i, j) == 0) continue;
                if (pi == m || abs(M(i, j)) < abs(M(pi, pj))) {
                    pi = i;
                    pj = j;
                }
            }
        }
        if (pi == m) break;
        M.swap_rows(t, pi);
        col_swap(t, pj);

        while (true) {
            bool clean = true;
            for (size_t i = t + 1; i < m; i++) {
                if (M(i, t) == 0) continue;
                const mpz_class q = floor_div(M(i, t), M(t, t));
                M.add_row(i, t, -q);
                if (M(i, t) != 0) clean = false;
            }
            for (size_t j = t + 1; j < n; j++) {
                if (M(t, j) == 0) continue;
                const mpz_class q = floor_div(M(t, j), M(t, t));
                col_add(j, t, -q);
                if (M(t, j) != 0) clean = false;
            }

            if (!clean) {
                // A remainder is smaller than the pivot, move it into place
                size_t bi = t, bj = t;
                for (size_t i = t + 1; i < m; i++) {
                    if (M(i, t) != 0 && abs(M(i, t)) < abs(M(bi, bj))) {
                        bi = i;
                        bj = t;
                    }
                }
                for (size_t j = t + 1; j < n; j++) {
                    if (M(t, j) != 0 && abs(M(t, j)) < abs(M(bi, bj))) {
                        bi = t;
                        bj = j;
                    }
                }
                M.swap_rows(t, bi);
                col_swap(t, bj);
                continue;
            }

            // The pivot has to divide the rest of the block
            size_t bad = m;
            for (size_t i = t + 1; i < m && bad == m; i++) {
                for (size_t j = t + 1; j < n; j++) {
                    if (!mpz_divisible_p(M(i, j).get_mpz_t(), M(t, t).get_mpz_t())) {
                        bad = i;
                        break;
                    }
                }
            }
            if (bad == m) break;
            M.add_row(t, bad, 1);
        }

        if (M(t, t) < 0) M.negate_row(t);
        diag.push_back(M(t, t));
        t++;
    }
    return diag;
}

/*
 * Algorithms over F_p
 */

void reduce_row_mod(matrix::ZMatrix &M, const size_t i, const mpz_class &p) {
    for (size_t k = 0; k < M.cols(); k++) M(i, k) = matrix::mod(M(i, k), p);
}

size_t matrix::rref_mod(ZMatrix &M, const mpz_class &p, ZMatrix *U) {
    const size_t m = M.rows();
    const size_t n = M.cols();
    if (U != nullptr) *U = ZMatrix::identity(m);
    for (size_t i = 0; i < m; i++) reduce_row_mod(M, i, p);

    size_t rank = 0;
    for (size_t j = 0; j < n && rank < m; j++) {
        size_t piv = m;
        for (size_t i = rank; i < m; i++) {
            if (M(i, j) != 0) {
                piv = i;
                break;
            }
        }
        if (piv == m) continue;

        M.swap_rows(piv, rank);
        if (U != nullptr) U->swap_rows(piv, rank);

        mpz_class inv;
        mpz_invert(inv.get_mpz_t(), M(rank, j).get_mpz_t(), p.get_mpz_t());
        M.scale_row(rank, inv);
        reduce_row_mod(M, rank, p);
        if (U != nullptr) {
            U->scale_row(rank, inv);
            reduce_row_mod(*U, rank, p);
        }

        for (size_t i = 0; i < m; i++) {
            if (i == rank || M(i, j) == 0) continue;
            const mpz_class c = -M(i, j);
            M.add_row(i, rank, c);
            reduce_row_mod(M, i, p);
            if (U != nullptr) {
                U->add_row(i, rank, c);
                reduce_row_mod(*U, i, p);
            }
        }
        rank++;
    }
    return rank;
}

matrix::ZMatrix matrix::left_kernel_mod(const ZMatrix &M, const mpz_class &p) {
    ZMatrix H(M);
    ZMatrix U;
    const size_t rank = rref_mod(H, p, &U);
    return U.rows_from(rank);
}

bool matrix::solve_left_mod(const ZMatrix &M, const std::vector<mpz_class> &y, const mpz_class &p,
        std::vector<mpz_class> &x) {
    if (y.size() != M.cols()) throw std::invalid_argument("solve_left_mod: right hand side has length "
            + std::to_string(y.size()) + ", expected " + std::to_string(M.cols()));
    ZMatrix H(M);
    ZMatrix U;
    const size_t rank = rref_mod(H, p, &U);

    std::vector<mpz_class> res(y.size());
    for (size_t l = 0; l < y.size(); l++) res[l] = mod(y[l], p);
    std::vector<mpz_class> c(M.rows(), 0);
    size_t j = 0;
    for (size_t k = 0; k < rank; k++) {
        while (H(k, j) == 0) j++;
        c[k] = res[j];
        for (size_t l = j; l < H.cols(); l++) res[l] = mod(res[l] - c[k] * H(k, l), p);
    }
    for (const mpz_class &r : res) {
        if (r != 0) return false;
    }
    x = U.left_mul(c);
    for (mpz_class &e : x) e = mod(e, p);
    return true;
}

template class matrix::Matrix<mpz_class>;
