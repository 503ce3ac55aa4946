// abelian.hpp
#ifndef ABELIAN_HPP_
#define ABELIAN_HPP_

#include "matrix.hpp"

#include <memory>
#include <string>
#include <vector>

#include <gmpxx.h>

namespace abelian {
    class AbGroup;
    class AbElem;
    class AbHom;
    struct AbDirectProduct;
    struct AbPcSeries;

    typedef std::shared_ptr<const AbGroup> AbGroupPtr;

    // Finitely generated abelian group Z^n / <rows of the relation matrix>.
    // Always handled through AbGroupPtr; create() is the only way to build one.
    class AbGroup : public std::enable_shared_from_this<AbGroup> {
    private:
        size_t ngens_;
        matrix::ZMatrix rels_;        // Hermite normal form, nonzero rows only
        std::vector<size_t> pivots_;  // pivot column of each relation row
        mutable mpz_class exponent_;  // 0 if not known

    public:
        typedef AbGroupPtr Ptr;
        typedef AbElem Elem;
        typedef AbHom Hom;
        typedef AbDirectProduct DirectProduct;
        typedef AbPcSeries PcSeries;

        AbGroup(const size_t ngens, const matrix::ZMatrix &rels);

        static Ptr create(const size_t ngens, const matrix::ZMatrix &rels);
        // Z/o_1 + ... + Z/o_k, an order of 0 gives a copy of Z
        static Ptr create(const std::vector<mpz_class> &orders);

        size_t ngens() const;
        const matrix::ZMatrix& relations() const;

        Elem gen(const size_t i) const;
        Elem zero() const;
        Elem elem(const std::vector<mpz_class> &coeffs) const;

        // Canonical representative of a coefficient vector
        void reduce(std::vector<mpz_class> &coeffs) const;

        bool is_finite() const;
        bool is_trivial() const;
        // Order of a finite group, 0 if infinite
        mpz_class order() const;
        // Free rank
        size_t rank() const;
        // Elementary divisors d_1 | d_2 | ... followed by a 0 for every copy of Z
        std::vector<mpz_class> invariants() const;

        // Known multiple of the exponent, used to keep Smith forms small
        void set_exponent(const mpz_class &e) const;
        const mpz_class& exponent() const;

        // Polycyclic series with prime relative orders, for finite groups
        PcSeries pc_series() const;

        bool operator==(const AbGroup &rhs) const;
        bool operator!=(const AbGroup &rhs) const;

        std::string to_string() const;

        /*
         * Constructions. Every result refers to its groups through shared pointers.
         */

        static Hom identity(const Ptr &A);
        static Hom zero_hom(const Ptr &A, const Ptr &B);
        // Images of the generators of A
        static Hom hom(const Ptr &A, const Ptr &B, const std::vector<Elem> &images, const bool check = true);
        static Hom hom(const Ptr &A, const Ptr &B, const matrix::ZMatrix &mat, const bool check = true);

        static DirectProduct direct_product(const std::vector<Ptr> &parts);

        // Embedding of the subgroup generated by elems
        static Hom sub(const Ptr &A, const std::vector<Elem> &elems);
        // Projection of the codomain of h onto codomain / image(h)
        static Hom quo(const Hom &h);
        // Isomorphism S -> A with S = Z/d_1 + ... + Z/d_k + Z^r in Smith form
        static Hom snf(const Ptr &A);

        // Factor h: A -> B through the injection emb: T -> B
        static Hom lift(const Hom &h, const Hom &emb);
        // image(s) is contained in image(t)
        static bool is_subset(const Hom &s, const Hom &t);
    };

    class AbElem {
    private:
        AbGroupPtr parent_;
        std::vector<mpz_class> coeffs_;

    public:
        AbElem();
        // Reduces coeffs
        AbElem(const AbGroupPtr &parent, std::vector<mpz_class> coeffs);

        const AbGroupPtr& parent() const;
        const std::vector<mpz_class>& coeffs() const;
        const mpz_class& operator[](const size_t i) const;

        bool is_zero() const;

        AbElem operator+(const AbElem &rhs) const;
        AbElem operator-(const AbElem &rhs) const;
        AbElem operator-() const;
        AbElem operator*(const mpz_class &k) const;
        AbElem& operator+=(const AbElem &rhs);

        bool operator==(const AbElem &rhs) const;
        bool operator!=(const AbElem &rhs) const;
        bool operator<(const AbElem &rhs) const;

        std::string to_string() const;
    };

    // x -> x * matrix on coefficient rows
    class AbHom {
    private:
        AbGroupPtr domain_;
        AbGroupPtr codomain_;
        matrix::ZMatrix mat_;

    public:
        AbHom();
        AbHom(const AbGroupPtr &domain, const AbGroupPtr &codomain, const matrix::ZMatrix &mat, const bool check = true);

        const AbGroupPtr& domain() const;
        const AbGroupPtr& codomain() const;
        const matrix::ZMatrix& mat() const;

        AbElem operator()(const AbElem &x) const;
        // Image of the i-th generator
        AbElem image(const size_t i) const;

        // Apply this, then rhs
        AbHom operator*(const AbHom &rhs) const;
        AbHom operator+(const AbHom &rhs) const;
        AbHom operator-(const AbHom &rhs) const;
        AbHom operator-() const;

        bool operator==(const AbHom &rhs) const;
        bool operator!=(const AbHom &rhs) const;

        // Embedding K -> domain
        AbHom kernel() const;
        // Embedding I -> codomain
        AbHom image() const;

        bool has_preimage(const AbElem &y, AbElem &x) const;
        AbElem preimage(const AbElem &y) const;
        // Inverse of an isomorphism
        AbHom inv() const;

        bool is_zero() const;
        bool is_injective() const;
        bool is_surjective() const;
        bool is_bijective() const;

        std::string to_string() const;
    };

    struct AbDirectProduct {
        AbGroupPtr group;
        std::vector<AbHom> projections;
        std::vector<AbHom> injections;
    };

    // gens[i]^rel_orders[i] == gens[powers[i]], or zero if powers[i] < 0
    struct AbPcSeries {
        std::vector<AbElem> gens;
        std::vector<int> rel_orders;
        std::vector<long> powers;

        AbHom to_snf;                          // A -> S
        std::vector<std::vector<size_t>> chains; // series indices per cyclic summand of S

        // Exponent vector of x with respect to gens
        std::vector<int> exponents(const AbElem &x) const;
    };
};

#endif
