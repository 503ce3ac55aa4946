#include "../include/fpspace.hpp"

#include <climits>
#include <sstream>
#include <stdexcept>

#include <gmpxx.h>

bool same_space(const fpspace::FpSpacePtr &a, const fpspace::FpSpacePtr &b) {
    return a.get() == b.get() || (a != nullptr && b != nullptr && *a == *b);
}

/*
 * FpSpace
 */

fpspace::FpSpace::FpSpace(const mpz_class &p, const size_t dim) : p_(p), dim_(dim) {
    if (p_ < 2 || mpz_probab_prime_p(p_.get_mpz_t(), 25) == 0) {
        throw std::invalid_argument("Characteristic " + p_.get_str() + " is not a prime");
    }
}

fpspace::FpSpacePtr fpspace::FpSpace::create(const mpz_class &p, const size_t dim) {
    return std::make_shared<FpSpace>(p, dim);
}

const mpz_class& fpspace::FpSpace::prime() const { return p_; }

size_t fpspace::FpSpace::dim() const { return dim_; }

size_t fpspace::FpSpace::ngens() const { return dim_; }

matrix::ZMatrix fpspace::FpSpace::relations() const {
    return matrix::ZMatrix::scalar(dim_, p_);
}

fpspace::FpVec fpspace::FpSpace::gen(const size_t i) const {
    if (i >= dim_) throw std::invalid_argument("Basis index " + std::to_string(i) + " out of range");
    std::vector<mpz_class> coeffs(dim_, 0);
    coeffs[i] = 1;
    return FpVec(shared_from_this(), coeffs);
}

fpspace::FpVec fpspace::FpSpace::zero() const {
    return FpVec(shared_from_this(), std::vector<mpz_class>(dim_, 0));
}

fpspace::FpVec fpspace::FpSpace::elem(const std::vector<mpz_class> &coeffs) const {
    return FpVec(shared_from_this(), coeffs);
}

bool fpspace::FpSpace::is_finite() const { return true; }

bool fpspace::FpSpace::is_trivial() const { return dim_ == 0; }

mpz_class fpspace::FpSpace::order() const {
    mpz_class res;
    mpz_pow_ui(res.get_mpz_t(), p_.get_mpz_t(), dim_);
    return res;
}

size_t fpspace::FpSpace::rank() const { return dim_; }

std::vector<mpz_class> fpspace::FpSpace::invariants() const {
    return std::vector<mpz_class>(dim_, p_);
}

void fpspace::FpSpace::set_exponent(const mpz_class &) const {}

fpspace::FpPcSeries fpspace::FpSpace::pc_series() const {
    if (p_ > INT_MAX) throw std::invalid_argument("Characteristic " + p_.get_str() + " is too large for a pc series");
    FpPcSeries res;
    for (size_t i = 0; i < dim_; i++) {
        res.gens.push_back(gen(i));
        res.rel_orders.push_back((int) p_.get_si());
        res.powers.push_back(-1);
    }
    return res;
}

bool fpspace::FpSpace::operator==(const FpSpace &rhs) const {
    return p_ == rhs.p_ && dim_ == rhs.dim_;
}

bool fpspace::FpSpace::operator!=(const FpSpace &rhs) const {
    return !(*this == rhs);
}

std::string fpspace::FpSpace::to_string() const {
    if (dim_ == 0) return "0";
    if (dim_ == 1) return "F_" + p_.get_str();
    return "F_" + p_.get_str() + "^" + std::to_string(dim_);
}

fpspace::FpHom fpspace::FpSpace::identity(const Ptr &A) {
    return FpHom(A, A, matrix::ZMatrix::identity(A->dim()));
}

fpspace::FpHom fpspace::FpSpace::zero_hom(const Ptr &A, const Ptr &B) {
    return FpHom(A, B, matrix::ZMatrix(A->dim(), B->dim()));
}

fpspace::FpHom fpspace::FpSpace::hom(const Ptr &A, const Ptr &B, const std::vector<Elem> &images, const bool check) {
    if (images.size() != A->dim()) throw std::invalid_argument("Need " + std::to_string(A->dim())
            + " images, got " + std::to_string(images.size()));
    matrix::ZMatrix mat(0, B->dim());
    for (const Elem &e : images) {
        if (check && !same_space(e.parent(), B)) throw std::invalid_argument("Image " + e.to_string() + " is not in the codomain");
        mat.append_row(e.coeffs());
    }
    return FpHom(A, B, mat);
}

fpspace::FpHom fpspace::FpSpace::hom(const Ptr &A, const Ptr &B, const matrix::ZMatrix &mat, const bool) {
    return FpHom(A, B, mat);
}

fpspace::FpDirectProduct fpspace::FpSpace::direct_product(const std::vector<Ptr> &parts) {
    if (parts.empty()) throw std::invalid_argument("Direct product of no spaces has no characteristic");
    const mpz_class &p = parts[0]->prime();
    size_t total = 0;
    for (const Ptr &A : parts) {
        if (A->prime() != p) throw std::invalid_argument("Direct product of spaces over different fields");
        total += A->dim();
    }

    FpDirectProduct res;
    res.group = create(p, total);
    size_t offset = 0;
    for (const Ptr &A : parts) {
        const size_t n = A->dim();
        matrix::ZMatrix pro(total, n), inj(n, total);
        for (size_t j = 0; j < n; j++) {
            pro(offset + j, j) = 1;
            inj(j, offset + j) = 1;
        }
        res.projections.push_back(FpHom(res.group, A, pro));
        res.injections.push_back(FpHom(A, res.group, inj));
        offset += n;
    }
    return res;
}

fpspace::FpHom fpspace::FpSpace::sub(const Ptr &A, const std::vector<Elem> &elems) {
    matrix::ZMatrix X(0, A->dim());
    for (const Elem &e : elems) {
        if (!same_space(e.parent(), A)) throw std::invalid_argument("Vector " + e.to_string() + " is not in the space");
        X.append_row(e.coeffs());
    }
    const size_t r = matrix::rref_mod(X, A->prime());
    return FpHom(create(A->prime(), r), A, X.block(0, 0, r, A->dim()));
}

fpspace::FpHom fpspace::FpSpace::quo(const Hom &h) {
    const Ptr &A = h.codomain();
    const mpz_class &p = A->prime();
    const size_t n = A->dim();
    matrix::ZMatrix H(h.mat());
    const size_t r = matrix::rref_mod(H, p);

    std::vector<size_t> pivots;
    std::vector<bool> is_pivot(n, false);
    for (size_t i = 0; i < r; i++) {
        size_t j = 0;
        while (H(i, j) == 0) j++;
        pivots.push_back(j);
        is_pivot[j] = true;
    }
    std::vector<size_t> free_cols;
    for (size_t j = 0; j < n; j++) {
        if (!is_pivot[j]) free_cols.push_back(j);
    }

    // The free coordinates form a complement of the image
    matrix::ZMatrix mat(n, free_cols.size());
    for (size_t k = 0; k < free_cols.size(); k++) {
        mat(free_cols[k], k) = 1;
        for (size_t i = 0; i < r; i++) mat(pivots[i], k) = matrix::mod(-H(i, free_cols[k]), p);
    }
    return FpHom(A, create(p, free_cols.size()), mat);
}

fpspace::FpHom fpspace::FpSpace::snf(const Ptr &A) {
    return identity(A);
}

fpspace::FpHom fpspace::FpSpace::lift(const Hom &h, const Hom &emb) {
    if (!same_space(h.codomain(), emb.codomain())) throw std::invalid_argument("lift: codomains differ");
    matrix::ZMatrix mat(0, emb.domain()->dim());
    for (size_t i = 0; i < h.domain()->dim(); i++) {
        mat.append_row(emb.preimage(h.image(i)).coeffs());
    }
    return FpHom(h.domain(), emb.domain(), mat);
}

bool fpspace::FpSpace::is_subset(const Hom &s, const Hom &t) {
    if (!same_space(s.codomain(), t.codomain())) throw std::invalid_argument("is_subset: codomains differ");
    FpVec x;
    for (size_t i = 0; i < s.domain()->dim(); i++) {
        if (!t.has_preimage(s.image(i), x)) return false;
    }
    return true;
}

/*
 * FpVec
 */

fpspace::FpVec::FpVec() {}

fpspace::FpVec::FpVec(const FpSpacePtr &parent, std::vector<mpz_class> coeffs)
    : parent_(parent), coeffs_(std::move(coeffs)) {
    if (parent_ == nullptr) throw std::invalid_argument("Vector without a space");
    if (coeffs_.size() != parent_->dim()) throw std::invalid_argument("Vector of length " + std::to_string(coeffs_.size())
            + " in a space of dimension " + std::to_string(parent_->dim()));
    for (mpz_class &c : coeffs_) c = matrix::mod(c, parent_->prime());
}

const fpspace::FpSpacePtr& fpspace::FpVec::parent() const { return parent_; }

const std::vector<mpz_class>& fpspace::FpVec::coeffs() const { return coeffs_; }

const mpz_class& fpspace::FpVec::operator[](const size_t i) const { return coeffs_[i]; }

bool fpspace::FpVec::is_zero() const {
    for (const mpz_class &c : coeffs_) {
        if (c != 0) return false;
    }
    return true;
}

fpspace::FpVec fpspace::FpVec::operator+(const FpVec &rhs) const {
    if (!same_space(parent_, rhs.parent_)) throw std::invalid_argument("Cannot add vectors of different spaces");
    std::vector<mpz_class> res(coeffs_);
    for (size_t i = 0; i < res.size(); i++) res[i] += rhs.coeffs_[i];
    return FpVec(parent_, res);
}

fpspace::FpVec fpspace::FpVec::operator-(const FpVec &rhs) const {
    if (!same_space(parent_, rhs.parent_)) throw std::invalid_argument("Cannot subtract vectors of different spaces");
    std::vector<mpz_class> res(coeffs_);
    for (size_t i = 0; i < res.size(); i++) res[i] -= rhs.coeffs_[i];
    return FpVec(parent_, res);
}

fpspace::FpVec fpspace::FpVec::operator-() const {
    std::vector<mpz_class> res(coeffs_);
    for (mpz_class &c : res) c = -c;
    return FpVec(parent_, res);
}

fpspace::FpVec fpspace::FpVec::operator*(const mpz_class &k) const {
    std::vector<mpz_class> res(coeffs_);
    for (mpz_class &c : res) c *= k;
    return FpVec(parent_, res);
}

fpspace::FpVec& fpspace::FpVec::operator+=(const FpVec &rhs) {
    *this = *this + rhs;
    return *this;
}

bool fpspace::FpVec::operator==(const FpVec &rhs) const {
    return same_space(parent_, rhs.parent_) && coeffs_ == rhs.coeffs_;
}

bool fpspace::FpVec::operator!=(const FpVec &rhs) const {
    return !(*this == rhs);
}

bool fpspace::FpVec::operator<(const FpVec &rhs) const {
    return coeffs_ < rhs.coeffs_;
}

std::string fpspace::FpVec::to_string() const {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < coeffs_.size(); i++) {
        if (i) ss << ", ";
        ss << coeffs_[i];
    }
    ss << "]";
    return ss.str();
}

/*
 * FpHom
 */

fpspace::FpHom::FpHom() {}

fpspace::FpHom::FpHom(const FpSpacePtr &domain, const FpSpacePtr &codomain, const matrix::ZMatrix &mat)
    : domain_(domain), codomain_(codomain), mat_(mat) {
    if (domain_->prime() != codomain_->prime()) throw std::invalid_argument("Linear map between spaces over different fields");
    if (mat_.rows() != domain_->dim() || mat_.cols() != codomain_->dim()) {
        throw std::invalid_argument("Matrix of size " + std::to_string(mat_.rows()) + "x" + std::to_string(mat_.cols())
                + " does not fit a map from dimension " + std::to_string(domain_->dim()) + " to "
                + std::to_string(codomain_->dim()));
    }
    for (size_t i = 0; i < mat_.rows(); i++) {
        for (size_t j = 0; j < mat_.cols(); j++) mat_(i, j) = matrix::mod(mat_(i, j), domain_->prime());
    }
}

const fpspace::FpSpacePtr& fpspace::FpHom::domain() const { return domain_; }

const fpspace::FpSpacePtr& fpspace::FpHom::codomain() const { return codomain_; }

const matrix::ZMatrix& fpspace::FpHom::mat() const { return mat_; }

fpspace::FpVec fpspace::FpHom::operator()(const FpVec &x) const {
    if (!same_space(x.parent(), domain_)) throw std::invalid_argument("Vector " + x.to_string() + " is not in the domain");
    return FpVec(codomain_, mat_.left_mul(x.coeffs()));
}

fpspace::FpVec fpspace::FpHom::image(const size_t i) const {
    return FpVec(codomain_, mat_.row(i));
}

fpspace::FpHom fpspace::FpHom::operator*(const FpHom &rhs) const {
    if (!same_space(codomain_, rhs.domain_)) throw std::invalid_argument("Cannot compose maps: codomain "
            + codomain_->to_string() + " differs from domain " + rhs.domain_->to_string());
    return FpHom(domain_, rhs.codomain_, mat_ * rhs.mat_);
}

fpspace::FpHom fpspace::FpHom::operator+(const FpHom &rhs) const {
    if (!same_space(domain_, rhs.domain_) || !same_space(codomain_, rhs.codomain_)) {
        throw std::invalid_argument("Cannot add maps between different spaces");
    }
    return FpHom(domain_, codomain_, mat_ + rhs.mat_);
}

fpspace::FpHom fpspace::FpHom::operator-(const FpHom &rhs) const {
    if (!same_space(domain_, rhs.domain_) || !same_space(codomain_, rhs.codomain_)) {
        throw std::invalid_argument("Cannot subtract maps between different spaces");
    }
    return FpHom(domain_, codomain_, mat_ - rhs.mat_);
}

fpspace::FpHom fpspace::FpHom::operator-() const {
    return FpHom(domain_, codomain_, -mat_);
}

bool fpspace::FpHom::operator==(const FpHom &rhs) const {
    return same_space(domain_, rhs.domain_) && same_space(codomain_, rhs.codomain_) && mat_ == rhs.mat_;
}

bool fpspace::FpHom::operator!=(const FpHom &rhs) const {
    return !(*this == rhs);
}

fpspace::FpHom fpspace::FpHom::kernel() const {
    const matrix::ZMatrix K = matrix::left_kernel_mod(mat_, domain_->prime());
    std::vector<FpVec> elems;
    for (size_t k = 0; k < K.rows(); k++) elems.push_back(FpVec(domain_, K.row(k)));
    return FpSpace::sub(domain_, elems);
}

fpspace::FpHom fpspace::FpHom::image() const {
    std::vector<FpVec> elems;
    for (size_t i = 0; i < domain_->dim(); i++) elems.push_back(image(i));
    return FpSpace::sub(codomain_, elems);
}

bool fpspace::FpHom::has_preimage(const FpVec &y, FpVec &x) const {
    if (!same_space(y.parent(), codomain_)) throw std::invalid_argument("Vector " + y.to_string() + " is not in the codomain");
    std::vector<mpz_class> sol;
    if (!matrix::solve_left_mod(mat_, y.coeffs(), domain_->prime(), sol)) return false;
    x = FpVec(domain_, sol);
    return true;
}

fpspace::FpVec fpspace::FpHom::preimage(const FpVec &y) const {
    FpVec x;
    if (!has_preimage(y, x)) throw std::invalid_argument("Vector " + y.to_string() + " has no preimage");
    return x;
}

fpspace::FpHom fpspace::FpHom::inv() const {
    matrix::ZMatrix mat(0, domain_->dim());
    for (size_t i = 0; i < codomain_->dim(); i++) {
        mat.append_row(preimage(codomain_->gen(i)).coeffs());
    }
    return FpHom(codomain_, domain_, mat);
}

size_t fpspace::FpHom::rank() const {
    matrix::ZMatrix H(mat_);
    return matrix::rref_mod(H, domain_->prime());
}

bool fpspace::FpHom::is_zero() const {
    return mat_.is_zero();
}

bool fpspace::FpHom::is_injective() const {
    return rank() == domain_->dim();
}

bool fpspace::FpHom::is_surjective() const {
    return rank() == codomain_->dim();
}

bool fpspace::FpHom::is_bijective() const {
    return is_injective() && is_surjective();
}

std::string fpspace::FpHom::to_string() const {
    return domain_->to_string() + " -> " + codomain_->to_string() + " " + mat_.to_string();
}

/*
 * FpPcSeries
 */

std::vector<int> fpspace::FpPcSeries::exponents(const FpVec &x) const {
    std::vector<int> res;
    for (const mpz_class &c : x.coeffs()) res.push_back((int) c.get_si());
    return res;
}
