#include "../include/abelian.hpp"
#include "../include/util.hpp"

#include <climits>
#include <sstream>
#include <stdexcept>

#include <gmpxx.h>

bool same_group(const abelian::AbGroupPtr &a, const abelian::AbGroupPtr &b) {
    return a.get() == b.get() || (a != nullptr && b != nullptr && *a == *b);
}

/*
 * AbGroup
 */

abelian::AbGroup::AbGroup(const size_t ngens, const matrix::ZMatrix &rels) : ngens_(ngens), exponent_(0) {
    if (rels.cols() != ngens) throw std::invalid_argument("Relation matrix has " + std::to_string(rels.cols())
            + " columns for " + std::to_string(ngens) + " generators");
    matrix::ZMatrix H(rels);
    const size_t rank = matrix::hnf(H);
    rels_ = H.block(0, 0, rank, ngens);
    for (size_t k = 0; k < rank; k++) {
        size_t j = 0;
        while (rels_(k, j) == 0) j++;
        pivots_.push_back(j);
    }
}

abelian::AbGroupPtr abelian::AbGroup::create(const size_t ngens, const matrix::ZMatrix &rels) {
    return std::make_shared<AbGroup>(ngens, rels);
}

abelian::AbGroupPtr abelian::AbGroup::create(const std::vector<mpz_class> &orders) {
    const size_t n = orders.size();
    matrix::ZMatrix rels(0, n);
    for (size_t i = 0; i < n; i++) {
        if (orders[i] < 0) throw std::invalid_argument("Negative order " + orders[i].get_str());
        if (orders[i] == 0) continue;
        std::vector<mpz_class> row(n, 0);
        row[i] = orders[i];
        rels.append_row(row);
    }
    return create(n, rels);
}

size_t abelian::AbGroup::ngens() const { return ngens_; }

const matrix::ZMatrix& abelian::AbGroup::relations() const { return rels_; }

abelian::AbElem abelian::AbGroup::gen(const size_t i) const {
    if (i >= ngens_) throw std::invalid_argument("Generator index " + std::to_string(i) + " out of range");
    std::vector<mpz_class> coeffs(ngens_, 0);
    coeffs[i] = 1;
    return AbElem(shared_from_this(), coeffs);
}

abelian::AbElem abelian::AbGroup::zero() const {
    return AbElem(shared_from_this(), std::vector<mpz_class>(ngens_, 0));
}

abelian::AbElem abelian::AbGroup::elem(const std::vector<mpz_class> &coeffs) const {
    return AbElem(shared_from_this(), coeffs);
}

void abelian::AbGroup::reduce(std::vector<mpz_class> &coeffs) const {
    if (coeffs.size() != ngens_) throw std::invalid_argument("Coefficient vector of length " + std::to_string(coeffs.size())
            + " for a group with " + std::to_string(ngens_) + " generators");
    for (size_t k = 0; k < rels_.rows(); k++) {
        const size_t p = pivots_[k];
        const mpz_class q = matrix::floor_div(coeffs[p], rels_(k, p));
        if (q == 0) continue;
        for (size_t l = p; l < ngens_; l++) coeffs[l] -= q * rels_(k, l);
    }
}

bool abelian::AbGroup::is_finite() const {
    return rels_.rows() == ngens_;
}

bool abelian::AbGroup::is_trivial() const {
    return order() == 1;
}

mpz_class abelian::AbGroup::order() const {
    if (!is_finite()) return 0;
    mpz_class res = 1;
    for (size_t k = 0; k < rels_.rows(); k++) res *= rels_(k, pivots_[k]);
    return res;
}

size_t abelian::AbGroup::rank() const {
    return ngens_ - rels_.rows();
}

std::vector<mpz_class> abelian::AbGroup::invariants() const {
    std::vector<mpz_class> res;
    for (const mpz_class &d : matrix::smith(rels_)) {
        if (d != 1) res.push_back(d);
    }
    for (size_t i = 0; i < rank(); i++) res.push_back(0);
    return res;
}

void abelian::AbGroup::set_exponent(const mpz_class &e) const {
    exponent_ = e;
}

const mpz_class& abelian::AbGroup::exponent() const {
    return exponent_;
}

abelian::AbPcSeries abelian::AbGroup::pc_series() const {
    if (!is_finite()) throw std::invalid_argument("Group " + to_string() + " is infinite and has no polycyclic series");
    const AbHom iso = snf(shared_from_this());
    const std::vector<mpz_class> d = iso.domain()->invariants();

    AbPcSeries res;
    res.to_snf = iso.inv();
    for (size_t i = 0; i < d.size(); i++) {
        const AbElem a = iso.image(i);
        std::vector<size_t> chain;
        mpz_class m = 1;
        for (const mpz_class &q : util::factor(d[i])) {
            if (q > INT_MAX) throw std::invalid_argument("Relative order " + q.get_str() + " is too large");
            chain.push_back(res.gens.size());
            res.gens.push_back(a * m);
            res.rel_orders.push_back((int) q.get_si());
            m *= q;
        }
        for (size_t k = 0; k < chain.size(); k++) {
            res.powers.push_back(k + 1 < chain.size() ? (long) chain[k + 1] : -1);
        }
        res.chains.push_back(chain);
    }
    return res;
}

bool abelian::AbGroup::operator==(const AbGroup &rhs) const {
    return ngens_ == rhs.ngens_ && rels_ == rhs.rels_;
}

bool abelian::AbGroup::operator!=(const AbGroup &rhs) const {
    return !(*this == rhs);
}

std::string abelian::AbGroup::to_string() const {
    const std::vector<mpz_class> inv = invariants();
    if (inv.empty()) return "0";
    std::stringstream ss;
    for (size_t i = 0; i < inv.size(); i++) {
        if (i) ss << " + ";
        if (inv[i] == 0) ss << "Z";
        else ss << "Z/" << inv[i];
    }
    return ss.str();
}

/*
 * Constructions
 */

abelian::AbHom abelian::AbGroup::identity(const Ptr &A) {
    return AbHom(A, A, matrix::ZMatrix::identity(A->ngens()), false);
}

abelian::AbHom abelian::AbGroup::zero_hom(const Ptr &A, const Ptr &B) {
    return AbHom(A, B, matrix::ZMatrix(A->ngens(), B->ngens()), false);
}

abelian::AbHom abelian::AbGroup::hom(const Ptr &A, const Ptr &B, const std::vector<Elem> &images, const bool check) {
    if (images.size() != A->ngens()) throw std::invalid_argument("Need " + std::to_string(A->ngens())
            + " images, got " + std::to_string(images.size()));
    matrix::ZMatrix mat(0, B->ngens());
    for (const Elem &e : images) {
        if (!same_group(e.parent(), B)) throw std::invalid_argument("Image " + e.to_string() + " is not in the codomain");
        mat.append_row(e.coeffs());
    }
    return AbHom(A, B, mat, check);
}

abelian::AbHom abelian::AbGroup::hom(const Ptr &A, const Ptr &B, const matrix::ZMatrix &mat, const bool check) {
    return AbHom(A, B, mat, check);
}

abelian::AbDirectProduct abelian::AbGroup::direct_product(const std::vector<Ptr> &parts) {
    size_t total = 0;
    for (const Ptr &A : parts) total += A->ngens();

    matrix::ZMatrix rels(0, total);
    size_t offset = 0;
    for (const Ptr &A : parts) {
        const matrix::ZMatrix &R = A->relations();
        for (size_t k = 0; k < R.rows(); k++) {
            std::vector<mpz_class> row(total, 0);
            for (size_t j = 0; j < A->ngens(); j++) row[offset + j] = R(k, j);
            rels.append_row(row);
        }
        offset += A->ngens();
    }

    AbDirectProduct res;
    res.group = create(total, rels);
    offset = 0;
    for (const Ptr &A : parts) {
        const size_t n = A->ngens();
        matrix::ZMatrix pro(total, n), inj(n, total);
        for (size_t j = 0; j < n; j++) {
            pro(offset + j, j) = 1;
            inj(j, offset + j) = 1;
        }
        res.projections.push_back(AbHom(res.group, A, pro, false));
        res.injections.push_back(AbHom(A, res.group, inj, false));
        offset += n;
    }
    return res;
}

abelian::AbHom abelian::AbGroup::sub(const Ptr &A, const std::vector<Elem> &elems) {
    const size_t n = A->ngens();
    matrix::ZMatrix X(0, n);
    for (const Elem &e : elems) {
        if (!same_group(e.parent(), A)) throw std::invalid_argument("Element " + e.to_string() + " is not in the group");
        X.append_row(e.coeffs());
    }

    // Hermite basis of the lattice spanned by elems and the relations of A
    matrix::ZMatrix L = X.stack(A->relations());
    const size_t r = matrix::hnf(L);
    const matrix::ZMatrix B = L.block(0, 0, r, n);

    const matrix::ZMatrix K = matrix::left_kernel(B.stack(A->relations()));
    const Ptr S = create(r, K.block(0, 0, K.rows(), r));
    if (A->exponent() != 0) S->set_exponent(A->exponent());
    return AbHom(S, A, B, false);
}

abelian::AbHom abelian::AbGroup::quo(const Hom &h) {
    const Ptr &A = h.codomain();
    const Ptr Q = create(A->ngens(), A->relations().stack(h.mat()));
    if (A->exponent() != 0) Q->set_exponent(A->exponent());
    return AbHom(A, Q, matrix::ZMatrix::identity(A->ngens()), false);
}

abelian::AbHom abelian::AbGroup::snf(const Ptr &A) {
    const size_t n = A->ngens();
    matrix::ZMatrix R = A->relations();
    if (A->exponent() != 0) R = R.stack(matrix::ZMatrix::scalar(n, A->exponent()));

    matrix::ZMatrix V, Vinv;
    const std::vector<mpz_class> d = matrix::smith(R, &V, &Vinv);

    std::vector<mpz_class> orders;
    matrix::ZMatrix iso(0, n);
    for (size_t i = 0; i < n; i++) {
        if (i < d.size() && d[i] == 1) continue;
        orders.push_back(i < d.size() ? d[i] : mpz_class(0));
        iso.append_row(Vinv.row(i));
    }
    const Ptr S = create(orders);
    if (A->exponent() != 0) S->set_exponent(A->exponent());
    return AbHom(S, A, iso, false);
}

abelian::AbHom abelian::AbGroup::lift(const Hom &h, const Hom &emb) {
    if (!same_group(h.codomain(), emb.codomain())) throw std::invalid_argument("lift: codomains differ");
    matrix::ZMatrix mat(0, emb.domain()->ngens());
    for (size_t i = 0; i < h.domain()->ngens(); i++) {
        mat.append_row(emb.preimage(h.image(i)).coeffs());
    }
    return AbHom(h.domain(), emb.domain(), mat, false);
}

bool abelian::AbGroup::is_subset(const Hom &s, const Hom &t) {
    if (!same_group(s.codomain(), t.codomain())) throw std::invalid_argument("is_subset: codomains differ");
    AbElem x;
    for (size_t i = 0; i < s.domain()->ngens(); i++) {
        if (!t.has_preimage(s.image(i), x)) return false;
    }
    return true;
}

/*
 * AbElem
 */

abelian::AbElem::AbElem() {}

abelian::AbElem::AbElem(const AbGroupPtr &parent, std::vector<mpz_class> coeffs)
    : parent_(parent), coeffs_(std::move(coeffs)) {
    if (parent_ == nullptr) throw std::invalid_argument("Element without a group");
    parent_->reduce(coeffs_);
}

const abelian::AbGroupPtr& abelian::AbElem::parent() const { return parent_; }

const std::vector<mpz_class>& abelian::AbElem::coeffs() const { return coeffs_; }

const mpz_class& abelian::AbElem::operator[](const size_t i) const { return coeffs_[i]; }

bool abelian::AbElem::is_zero() const {
    for (const mpz_class &c : coeffs_) {
        if (c != 0) return false;
    }
    return true;
}

abelian::AbElem abelian::AbElem::operator+(const AbElem &rhs) const {
    if (!same_group(parent_, rhs.parent_)) throw std::invalid_argument("Cannot add elements of different groups");
    std::vector<mpz_class> res(coeffs_);
    for (size_t i = 0; i < res.size(); i++) res[i] += rhs.coeffs_[i];
    return AbElem(parent_, res);
}

abelian::AbElem abelian::AbElem::operator-(const AbElem &rhs) const {
    if (!same_group(parent_, rhs.parent_)) throw std::invalid_argument("Cannot subtract elements of different groups");
    std::vector<mpz_class> res(coeffs_);
    for (size_t i = 0; i < res.size(); i++) res[i] -= rhs.coeffs_[i];
    return AbElem(parent_, res);
}

abelian::AbElem abelian::AbElem::operator-() const {
    std::vector<mpz_class> res(coeffs_);
    for (mpz_class &c : res) c = -c;
    return AbElem(parent_, res);
}

abelian::AbElem abelian::AbElem::operator*(const mpz_class &k) const {
    std::vector<mpz_class> res(coeffs_);
    for (mpz_class &c : res) c *= k;
    return AbElem(parent_, res);
}

abelian::AbElem& abelian::AbElem::operator+=(const AbElem &rhs) {
    *this = *this + rhs;
    return *this;
}

bool abelian::AbElem::operator==(const AbElem &rhs) const {
    return same_group(parent_, rhs.parent_) && coeffs_ == rhs.coeffs_;
}

bool abelian::AbElem::operator!=(const AbElem &rhs) const {
    return !(*this == rhs);
}

bool abelian::AbElem::operator<(const AbElem &rhs) const {
    return coeffs_ < rhs.coeffs_;
}

std::string abelian::AbElem::to_string() const {
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
 * AbHom
 */

abelian::AbHom::AbHom() {}

abelian::AbHom::AbHom(const AbGroupPtr &domain, const AbGroupPtr &codomain, const matrix::ZMatrix &mat, const bool check)
    : domain_(domain), codomain_(codomain), mat_(mat) {
    if (mat_.rows() != domain_->ngens() || mat_.cols() != codomain_->ngens()) {
        throw std::invalid_argument("Matrix of size " + std::to_string(mat_.rows()) + "x" + std::to_string(mat_.cols())
                + " does not fit a map from " + std::to_string(domain_->ngens()) + " to "
                + std::to_string(codomain_->ngens()) + " generators");
    }
    if (!check) return;
    const matrix::ZMatrix &R = domain_->relations();
    for (size_t k = 0; k < R.rows(); k++) {
        if (!AbElem(codomain_, mat_.left_mul(R.row(k))).is_zero()) {
            throw std::invalid_argument("Map does not respect the relations of its domain");
        }
    }
}

const abelian::AbGroupPtr& abelian::AbHom::domain() const { return domain_; }

const abelian::AbGroupPtr& abelian::AbHom::codomain() const { return codomain_; }

const matrix::ZMatrix& abelian::AbHom::mat() const { return mat_; }

abelian::AbElem abelian::AbHom::operator()(const AbElem &x) const {
    if (!same_group(x.parent(), domain_)) throw std::invalid_argument("Element " + x.to_string() + " is not in the domain");
    return AbElem(codomain_, mat_.left_mul(x.coeffs()));
}

abelian::AbElem abelian::AbHom::image(const size_t i) const {
    return AbElem(codomain_, mat_.row(i));
}

abelian::AbHom abelian::AbHom::operator*(const AbHom &rhs) const {
    if (!same_group(codomain_, rhs.domain_)) throw std::invalid_argument("Cannot compose maps: codomain "
            + codomain_->to_string() + " differs from domain " + rhs.domain_->to_string());
    return AbHom(domain_, rhs.codomain_, mat_ * rhs.mat_, false);
}

abelian::AbHom abelian::AbHom::operator+(const AbHom &rhs) const {
    if (!same_group(domain_, rhs.domain_) || !same_group(codomain_, rhs.codomain_)) {
        throw std::invalid_argument("Cannot add maps between different groups");
    }
    return AbHom(domain_, codomain_, mat_ + rhs.mat_, false);
}

abelian::AbHom abelian::AbHom::operator-(const AbHom &rhs) const {
    if (!same_group(domain_, rhs.domain_) || !same_group(codomain_, rhs.codomain_)) {
        throw std::invalid_argument("Cannot subtract maps between different groups");
    }
    return AbHom(domain_, codomain_, mat_ - rhs.mat_, false);
}

abelian::AbHom abelian::AbHom::operator-() const {
    return AbHom(domain_, codomain_, -mat_, false);
}

bool abelian::AbHom::operator==(const AbHom &rhs) const {
    if (!same_group(domain_, rhs.domain_) || !same_group(codomain_, rhs.codomain_)) return false;
    for (size_t i = 0; i < domain_->ngens(); i++) {
        if (image(i) != rhs.image(i)) return false;
    }
    return true;
}

bool abelian::AbHom::operator!=(const AbHom &rhs) const {
    return !(*this == rhs);
}

abelian::AbHom abelian::AbHom::kernel() const {
    const size_t n = domain_->ngens();
    const matrix::ZMatrix K = matrix::left_kernel(mat_.stack(codomain_->relations()));
    const matrix::ZMatrix X = K.block(0, 0, K.rows(), n);
    std::vector<AbElem> elems;
    for (size_t k = 0; k < X.rows(); k++) {
        if (!X.is_zero_row(k)) elems.push_back(AbElem(domain_, X.row(k)));
    }
    return AbGroup::sub(domain_, elems);
}

abelian::AbHom abelian::AbHom::image() const {
    std::vector<AbElem> elems;
    for (size_t i = 0; i < domain_->ngens(); i++) elems.push_back(image(i));
    return AbGroup::sub(codomain_, elems);
}

bool abelian::AbHom::has_preimage(const AbElem &y, AbElem &x) const {
    if (!same_group(y.parent(), codomain_)) throw std::invalid_argument("Element " + y.to_string() + " is not in the codomain");
    std::vector<mpz_class> sol;
    if (!matrix::solve_left(mat_.stack(codomain_->relations()), y.coeffs(), sol)) return false;
    sol.resize(domain_->ngens());
    x = AbElem(domain_, sol);
    return true;
}

abelian::AbElem abelian::AbHom::preimage(const AbElem &y) const {
    AbElem x;
    if (!has_preimage(y, x)) throw std::invalid_argument("Element " + y.to_string() + " has no preimage");
    return x;
}

abelian::AbHom abelian::AbHom::inv() const {
    matrix::ZMatrix mat(0, domain_->ngens());
    for (size_t i = 0; i < codomain_->ngens(); i++) {
        mat.append_row(preimage(codomain_->gen(i)).coeffs());
    }
    return AbHom(codomain_, domain_, mat, false);
}

bool abelian::AbHom::is_zero() const {
    for (size_t i = 0; i < domain_->ngens(); i++) {
        if (!image(i).is_zero()) return false;
    }
    return true;
}

bool abelian::AbHom::is_injective() const {
    return kernel().domain()->is_trivial();
}

bool abelian::AbHom::is_surjective() const {
    AbElem x;
    for (size_t i = 0; i < codomain_->ngens(); i++) {
        if (!has_preimage(codomain_->gen(i), x)) return false;
    }
    return true;
}

bool abelian::AbHom::is_bijective() const {
    return is_injective() && is_surjective();
}

std::string abelian::AbHom::to_string() const {
    return domain_->to_string() + " -> " + codomain_->to_string() + " " + mat_.to_string();
}

/*
 * AbPcSeries
 */

std::vector<int> abelian::AbPcSeries::exponents(const AbElem &x) const {
    const AbElem s = to_snf(x);
    std::vector<int> res(gens.size(), 0);
    for (size_t i = 0; i < chains.size(); i++) {
        mpz_class c = s[i];
        for (const size_t k : chains[i]) {
            const mpz_class q = rel_orders[k];
            res[k] = (int) matrix::mod(c, q).get_si();
            c = matrix::floor_div(c, q);
        }
    }
    return res;
}
