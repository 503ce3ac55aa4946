#include "../include/multgrp.hpp"
#include "../include/util.hpp"

#include <sstream>
#include <stdexcept>

#include <gmpxx.h>

bool same_mult(const multgrp::MultGrpPtr &a, const multgrp::MultGrpPtr &b) {
    return a.get() == b.get() || (a != nullptr && b != nullptr && *a == *b);
}

// The group on emb.domain() inside A, with the residues of A if it has them
multgrp::MultGrpPtr pull(const multgrp::MultGrpPtr &A, const abelian::AbHom &emb) {
    if (!A->has_residues()) return multgrp::MultGrp::create(emb.domain());
    return std::make_shared<multgrp::MultGrp>(emb.domain(), A->prime(), A->root(), emb * A->value());
}

mpz_class powm(const mpz_class &b, const mpz_class &e, const mpz_class &m) {
    mpz_class res;
    mpz_powm(res.get_mpz_t(), b.get_mpz_t(), e.get_mpz_t(), m.get_mpz_t());
    return res;
}

/*
 * MultGrp
 */

multgrp::MultGrp::MultGrp(const abelian::AbGroupPtr &log, const mpz_class &p, const mpz_class &root,
        const abelian::AbHom &value) : log_(log), p_(p), root_(root), value_(value) {
    if (log_ == nullptr) throw std::invalid_argument("Multiplicative group without logarithms");
    if (p_ == 0) return;
    if (value_.domain() == nullptr || *value_.domain() != *log_) {
        throw std::invalid_argument("Residue map does not start at the logarithms");
    }
    if (value_.codomain()->order() != p_ - 1) {
        throw std::invalid_argument("Residue map does not end in Z/" + mpz_class(p_ - 1).get_str());
    }
}

multgrp::MultGrpPtr multgrp::MultGrp::create(const abelian::AbGroupPtr &log) {
    return std::make_shared<MultGrp>(log, 0, 0, abelian::AbHom());
}

multgrp::MultGrpPtr multgrp::MultGrp::units(const mpz_class &p) {
    if (p < 2 || mpz_probab_prime_p(p.get_mpz_t(), 25) == 0) {
        throw std::invalid_argument("Modulus " + p.get_str() + " is not a prime");
    }
    const mpz_class n = p - 1;
    std::vector<mpz_class> primes;
    for (const mpz_class &q : util::factor(n)) {
        if (primes.empty() || primes.back() != q) primes.push_back(q);
    }

    // g is a primitive root iff g^(n/q) != 1 for every prime q dividing n
    mpz_class root = 1;
    for (mpz_class g = 2; g < p; g++) {
        bool primitive = true;
        for (const mpz_class &q : primes) {
            if (powm(g, n / q, p) == 1) {
                primitive = false;
                break;
            }
        }
        if (primitive) {
            root = g;
            break;
        }
    }

    const abelian::AbGroupPtr L = abelian::AbGroup::create(std::vector<mpz_class>{n});
    return std::make_shared<MultGrp>(L, p, root, abelian::AbGroup::identity(L));
}

const abelian::AbGroupPtr& multgrp::MultGrp::log() const { return log_; }

bool multgrp::MultGrp::has_residues() const { return p_ != 0; }

const mpz_class& multgrp::MultGrp::prime() const { return p_; }

const mpz_class& multgrp::MultGrp::root() const { return root_; }

const abelian::AbHom& multgrp::MultGrp::value() const { return value_; }

size_t multgrp::MultGrp::ngens() const { return log_->ngens(); }

const matrix::ZMatrix& multgrp::MultGrp::relations() const { return log_->relations(); }

multgrp::MultElem multgrp::MultGrp::gen(const size_t i) const {
    return MultElem(shared_from_this(), log_->gen(i));
}

multgrp::MultElem multgrp::MultGrp::zero() const {
    return MultElem(shared_from_this(), log_->zero());
}

multgrp::MultElem multgrp::MultGrp::elem(const std::vector<mpz_class> &coeffs) const {
    return MultElem(shared_from_this(), log_->elem(coeffs));
}

multgrp::MultElem multgrp::MultGrp::residue(const mpz_class &a) const {
    if (!has_residues()) throw std::invalid_argument("Group " + to_string() + " has no residues");
    const mpz_class r = matrix::mod(a, p_);
    if (r == 0) throw std::invalid_argument(a.get_str() + " is not a unit mod " + p_.get_str());

    // Discrete logarithm by search, the moduli here are small
    mpz_class e = 0;
    mpz_class x = 1;
    while (x != r) {
        x = x * root_ % p_;
        e++;
    }

    abelian::AbElem y;
    if (!value_.has_preimage(value_.codomain()->elem(std::vector<mpz_class>{e}), y)) {
        throw std::invalid_argument(a.get_str() + " is not in " + to_string());
    }
    return MultElem(shared_from_this(), y);
}

bool multgrp::MultGrp::is_finite() const { return log_->is_finite(); }

bool multgrp::MultGrp::is_trivial() const { return log_->is_trivial(); }

mpz_class multgrp::MultGrp::order() const { return log_->order(); }

size_t multgrp::MultGrp::rank() const { return log_->rank(); }

std::vector<mpz_class> multgrp::MultGrp::invariants() const { return log_->invariants(); }

void multgrp::MultGrp::set_exponent(const mpz_class &e) const { log_->set_exponent(e); }

multgrp::MultPcSeries multgrp::MultGrp::pc_series() const {
    MultPcSeries res;
    res.log = log_->pc_series();
    for (const abelian::AbElem &g : res.log.gens) res.gens.push_back(MultElem(shared_from_this(), g));
    res.rel_orders = res.log.rel_orders;
    res.powers = res.log.powers;
    return res;
}

bool multgrp::MultGrp::operator==(const MultGrp &rhs) const {
    if (*log_ != *rhs.log_ || p_ != rhs.p_ || root_ != rhs.root_) return false;
    return p_ == 0 || value_ == rhs.value_;
}

bool multgrp::MultGrp::operator!=(const MultGrp &rhs) const {
    return !(*this == rhs);
}

std::string multgrp::MultGrp::to_string() const {
    if (!has_residues()) return log_->to_string();
    if (order() == p_ - 1) return "F_" + p_.get_str() + "^*";
    return log_->to_string() + " < F_" + p_.get_str() + "^*";
}

/*
 * Constructions, all carried out on the logarithms
 */

multgrp::MultHom multgrp::MultGrp::identity(const Ptr &A) {
    return MultHom(A, A, abelian::AbGroup::identity(A->log()));
}

multgrp::MultHom multgrp::MultGrp::zero_hom(const Ptr &A, const Ptr &B) {
    return MultHom(A, B, abelian::AbGroup::zero_hom(A->log(), B->log()));
}

multgrp::MultHom multgrp::MultGrp::hom(const Ptr &A, const Ptr &B, const std::vector<Elem> &images, const bool check) {
    std::vector<abelian::AbElem> logs;
    for (const Elem &e : images) {
        if (!same_mult(e.parent(), B)) throw std::invalid_argument("Image " + e.to_string() + " is not in the codomain");
        logs.push_back(e.log());
    }
    return MultHom(A, B, abelian::AbGroup::hom(A->log(), B->log(), logs, check));
}

multgrp::MultHom multgrp::MultGrp::hom(const Ptr &A, const Ptr &B, const matrix::ZMatrix &mat, const bool check) {
    return MultHom(A, B, abelian::AbGroup::hom(A->log(), B->log(), mat, check));
}

multgrp::MultHom multgrp::MultGrp::power(const Ptr &A, const mpz_class &k) {
    return hom(A, A, matrix::ZMatrix::scalar(A->ngens(), k), false);
}

multgrp::MultDirectProduct multgrp::MultGrp::direct_product(const std::vector<Ptr> &parts) {
    std::vector<abelian::AbGroupPtr> logs;
    for (const Ptr &A : parts) logs.push_back(A->log());
    const abelian::AbDirectProduct D = abelian::AbGroup::direct_product(logs);

    MultDirectProduct res;
    res.group = create(D.group);
    for (size_t k = 0; k < parts.size(); k++) {
        res.projections.push_back(MultHom(res.group, parts[k], D.projections[k]));
        res.injections.push_back(MultHom(parts[k], res.group, D.injections[k]));
    }
    return res;
}

multgrp::MultHom multgrp::MultGrp::sub(const Ptr &A, const std::vector<Elem> &elems) {
    std::vector<abelian::AbElem> logs;
    for (const Elem &e : elems) {
        if (!same_mult(e.parent(), A)) throw std::invalid_argument("Element " + e.to_string() + " is not in the group");
        logs.push_back(e.log());
    }
    const abelian::AbHom s = abelian::AbGroup::sub(A->log(), logs);
    return MultHom(pull(A, s), A, s);
}

multgrp::MultHom multgrp::MultGrp::quo(const Hom &h) {
    const abelian::AbHom q = abelian::AbGroup::quo(h.log());
    return MultHom(h.codomain(), create(q.codomain()), q);
}

multgrp::MultHom multgrp::MultGrp::snf(const Ptr &A) {
    const abelian::AbHom s = abelian::AbGroup::snf(A->log());
    return MultHom(pull(A, s), A, s);
}

multgrp::MultHom multgrp::MultGrp::lift(const Hom &h, const Hom &emb) {
    if (!same_mult(h.codomain(), emb.codomain())) throw std::invalid_argument("lift: codomains differ");
    return MultHom(h.domain(), emb.domain(), abelian::AbGroup::lift(h.log(), emb.log()));
}

bool multgrp::MultGrp::is_subset(const Hom &s, const Hom &t) {
    if (!same_mult(s.codomain(), t.codomain())) throw std::invalid_argument("is_subset: codomains differ");
    return abelian::AbGroup::is_subset(s.log(), t.log());
}

/*
 * MultElem
 */

multgrp::MultElem::MultElem() {}

multgrp::MultElem::MultElem(const MultGrpPtr &parent, const abelian::AbElem &log) : parent_(parent), log_(log) {
    if (parent_ == nullptr) throw std::invalid_argument("Element without a group");
    if (*log_.parent() != *parent_->log()) throw std::invalid_argument("Logarithm " + log_.to_string()
            + " is not in " + parent_->log()->to_string());
}

const multgrp::MultGrpPtr& multgrp::MultElem::parent() const { return parent_; }

const abelian::AbElem& multgrp::MultElem::log() const { return log_; }

const std::vector<mpz_class>& multgrp::MultElem::coeffs() const { return log_.coeffs(); }

const mpz_class& multgrp::MultElem::operator[](const size_t i) const { return log_[i]; }

mpz_class multgrp::MultElem::value() const {
    if (!parent_->has_residues()) throw std::invalid_argument("Group " + parent_->to_string() + " has no residues");
    return powm(parent_->root(), parent_->value()(log_)[0], parent_->prime());
}

bool multgrp::MultElem::is_zero() const { return log_.is_zero(); }

multgrp::MultElem multgrp::MultElem::operator+(const MultElem &rhs) const {
    if (!same_mult(parent_, rhs.parent_)) throw std::invalid_argument("Cannot multiply elements of different groups");
    return MultElem(parent_, log_ + rhs.log_);
}

multgrp::MultElem multgrp::MultElem::operator-(const MultElem &rhs) const {
    if (!same_mult(parent_, rhs.parent_)) throw std::invalid_argument("Cannot divide elements of different groups");
    return MultElem(parent_, log_ - rhs.log_);
}

multgrp::MultElem multgrp::MultElem::operator-() const {
    return MultElem(parent_, -log_);
}

multgrp::MultElem multgrp::MultElem::operator*(const mpz_class &k) const {
    return MultElem(parent_, log_ * k);
}

multgrp::MultElem& multgrp::MultElem::operator+=(const MultElem &rhs) {
    *this = *this + rhs;
    return *this;
}

bool multgrp::MultElem::operator==(const MultElem &rhs) const {
    return same_mult(parent_, rhs.parent_) && log_ == rhs.log_;
}

bool multgrp::MultElem::operator!=(const MultElem &rhs) const {
    return !(*this == rhs);
}

bool multgrp::MultElem::operator<(const MultElem &rhs) const {
    return log_ < rhs.log_;
}

std::string multgrp::MultElem::to_string() const {
    if (parent_->has_residues()) return value().get_str();
    return "exp" + log_.to_string();
}

/*
 * MultHom
 */

multgrp::MultHom::MultHom() {}

multgrp::MultHom::MultHom(const MultGrpPtr &domain, const MultGrpPtr &codomain, const abelian::AbHom &log)
    : domain_(domain), codomain_(codomain), log_(log) {
    if (*log_.domain() != *domain_->log() || *log_.codomain() != *codomain_->log()) {
        throw std::invalid_argument("Map " + log_.to_string() + " does not fit " + domain_->to_string()
                + " -> " + codomain_->to_string());
    }
}

const multgrp::MultGrpPtr& multgrp::MultHom::domain() const { return domain_; }

const multgrp::MultGrpPtr& multgrp::MultHom::codomain() const { return codomain_; }

const abelian::AbHom& multgrp::MultHom::log() const { return log_; }

const matrix::ZMatrix& multgrp::MultHom::mat() const { return log_.mat(); }

multgrp::MultElem multgrp::MultHom::operator()(const MultElem &x) const {
    if (!same_mult(x.parent(), domain_)) throw std::invalid_argument("Element " + x.to_string() + " is not in the domain");
    return MultElem(codomain_, log_(x.log()));
}

multgrp::MultElem multgrp::MultHom::image(const size_t i) const {
    return MultElem(codomain_, log_.image(i));
}

multgrp::MultHom multgrp::MultHom::operator*(const MultHom &rhs) const {
    if (!same_mult(codomain_, rhs.domain_)) throw std::invalid_argument("Cannot compose maps: codomain "
            + codomain_->to_string() + " differs from domain " + rhs.domain_->to_string());
    return MultHom(domain_, rhs.codomain_, log_ * rhs.log_);
}

multgrp::MultHom multgrp::MultHom::operator+(const MultHom &rhs) const {
    if (!same_mult(domain_, rhs.domain_) || !same_mult(codomain_, rhs.codomain_)) {
        throw std::invalid_argument("Cannot multiply maps between different groups");
    }
    return MultHom(domain_, codomain_, log_ + rhs.log_);
}

multgrp::MultHom multgrp::MultHom::operator-(const MultHom &rhs) const {
    if (!same_mult(domain_, rhs.domain_) || !same_mult(codomain_, rhs.codomain_)) {
        throw std::invalid_argument("Cannot divide maps between different groups");
    }
    return MultHom(domain_, codomain_, log_ - rhs.log_);
}

multgrp::MultHom multgrp::MultHom::operator-() const {
    return MultHom(domain_, codomain_, -log_);
}

bool multgrp::MultHom::operator==(const MultHom &rhs) const {
    return same_mult(domain_, rhs.domain_) && same_mult(codomain_, rhs.codomain_) && log_ == rhs.log_;
}

bool multgrp::MultHom::operator!=(const MultHom &rhs) const {
    return !(*this == rhs);
}

multgrp::MultHom multgrp::MultHom::kernel() const {
    const abelian::AbHom k = log_.kernel();
    return MultHom(pull(domain_, k), domain_, k);
}

multgrp::MultHom multgrp::MultHom::image() const {
    const abelian::AbHom i = log_.image();
    return MultHom(pull(codomain_, i), codomain_, i);
}

bool multgrp::MultHom::has_preimage(const MultElem &y, MultElem &x) const {
    if (!same_mult(y.parent(), codomain_)) throw std::invalid_argument("Element " + y.to_string() + " is not in the codomain");
    abelian::AbElem z;
    if (!log_.has_preimage(y.log(), z)) return false;
    x = MultElem(domain_, z);
    return true;
}

multgrp::MultElem multgrp::MultHom::preimage(const MultElem &y) const {
    MultElem x;
    if (!has_preimage(y, x)) throw std::invalid_argument("Element " + y.to_string() + " has no preimage");
    return x;
}

multgrp::MultHom multgrp::MultHom::inv() const {
    return MultHom(codomain_, domain_, log_.inv());
}

bool multgrp::MultHom::is_zero() const { return log_.is_zero(); }

bool multgrp::MultHom::is_injective() const { return log_.is_injective(); }

bool multgrp::MultHom::is_surjective() const { return log_.is_surjective(); }

bool multgrp::MultHom::is_bijective() const { return log_.is_bijective(); }

std::string multgrp::MultHom::to_string() const {
    return domain_->to_string() + " -> " + codomain_->to_string() + " " + log_.mat().to_string();
}

/*
 * MultPcSeries
 */

std::vector<int> multgrp::MultPcSeries::exponents(const MultElem &x) const {
    return log.exponents(x.log());
}
