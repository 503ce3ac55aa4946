// multgrp.hpp
#ifndef MULTGRP_HPP_
#define MULTGRP_HPP_

#include "abelian.hpp"
#include "matrix.hpp"

#include <memory>
#include <string>
#include <vector>

#include <gmpxx.h>

namespace multgrp {
    class MultGrp;
    class MultElem;
    class MultHom;
    struct MultDirectProduct;
    struct MultPcSeries;

    typedef std::shared_ptr<const MultGrp> MultGrpPtr;

    /*
     * Abelian group written multiplicatively, with the interface of abelian::AbGroup in
     * additive notation: a + b is the product, -a the inverse and a * k the k-th power.
     * Every element is stored by its discrete logarithm in an AbGroup. Subgroups of the
     * units mod p remember their residues through the logarithm to a primitive root;
     * quotients and direct products are abstract.
     */
    class MultGrp : public std::enable_shared_from_this<MultGrp> {
    private:
        abelian::AbGroupPtr log_;
        mpz_class p_;               // 0 for an abstract group
        mpz_class root_;            // primitive root mod p
        abelian::AbHom value_;      // log_ -> Z/(p - 1), exponent of the root

    public:
        typedef MultGrpPtr Ptr;
        typedef MultElem Elem;
        typedef MultHom Hom;
        typedef MultDirectProduct DirectProduct;
        typedef MultPcSeries PcSeries;

        MultGrp(const abelian::AbGroupPtr &log, const mpz_class &p, const mpz_class &root, const abelian::AbHom &value);

        // Abstract group on the logarithms
        static Ptr create(const abelian::AbGroupPtr &log);
        // (Z/p)^* for a prime p, generated by its smallest primitive root
        static Ptr units(const mpz_class &p);

        const abelian::AbGroupPtr& log() const;
        bool has_residues() const;
        const mpz_class& prime() const;
        const mpz_class& root() const;
        const abelian::AbHom& value() const;

        size_t ngens() const;
        const matrix::ZMatrix& relations() const;

        Elem gen(const size_t i) const;
        Elem zero() const;
        Elem elem(const std::vector<mpz_class> &coeffs) const;
        // The element with residue a, by discrete logarithm
        Elem residue(const mpz_class &a) const;

        bool is_finite() const;
        bool is_trivial() const;
        mpz_class order() const;
        size_t rank() const;
        std::vector<mpz_class> invariants() const;

        void set_exponent(const mpz_class &e) const;

        PcSeries pc_series() const;

        bool operator==(const MultGrp &rhs) const;
        bool operator!=(const MultGrp &rhs) const;

        std::string to_string() const;

        static Hom identity(const Ptr &A);
        static Hom zero_hom(const Ptr &A, const Ptr &B);
        static Hom hom(const Ptr &A, const Ptr &B, const std::vector<Elem> &images, const bool check = true);
        static Hom hom(const Ptr &A, const Ptr &B, const matrix::ZMatrix &mat, const bool check = true);
        // x -> x^k
        static Hom power(const Ptr &A, const mpz_class &k);

        static DirectProduct direct_product(const std::vector<Ptr> &parts);

        static Hom sub(const Ptr &A, const std::vector<Elem> &elems);
        static Hom quo(const Hom &h);
        static Hom snf(const Ptr &A);

        static Hom lift(const Hom &h, const Hom &emb);
        static bool is_subset(const Hom &s, const Hom &t);
    };

    class MultElem {
    private:
        MultGrpPtr parent_;
        abelian::AbElem log_;

    public:
        MultElem();
        MultElem(const MultGrpPtr &parent, const abelian::AbElem &log);

        const MultGrpPtr& parent() const;
        const abelian::AbElem& log() const;
        const std::vector<mpz_class>& coeffs() const;
        const mpz_class& operator[](const size_t i) const;

        // Residue mod p, for groups of units
        mpz_class value() const;

        // The identity
        bool is_zero() const;

        MultElem operator+(const MultElem &rhs) const;
        MultElem operator-(const MultElem &rhs) const;
        MultElem operator-() const;
        MultElem operator*(const mpz_class &k) const;
        MultElem& operator+=(const MultElem &rhs);

        bool operator==(const MultElem &rhs) const;
        bool operator!=(const MultElem &rhs) const;
        bool operator<(const MultElem &rhs) const;

        std::string to_string() const;
    };

    // A homomorphism given on the logarithms
    class MultHom {
    private:
        MultGrpPtr domain_;
        MultGrpPtr codomain_;
        abelian::AbHom log_;

    public:
        MultHom();
        MultHom(const MultGrpPtr &domain, const MultGrpPtr &codomain, const abelian::AbHom &log);

        const MultGrpPtr& domain() const;
        const MultGrpPtr& codomain() const;
        const abelian::AbHom& log() const;
        const matrix::ZMatrix& mat() const;

        MultElem operator()(const MultElem &x) const;
        MultElem image(const size_t i) const;

        MultHom operator*(const MultHom &rhs) const;
        MultHom operator+(const MultHom &rhs) const;
        MultHom operator-(const MultHom &rhs) const;
        MultHom operator-() const;

        bool operator==(const MultHom &rhs) const;
        bool operator!=(const MultHom &rhs) const;

        MultHom kernel() const;
        MultHom image() const;

        bool has_preimage(const MultElem &y, MultElem &x) const;
        MultElem preimage(const MultElem &y) const;
        MultHom inv() const;

        bool is_zero() const;
        bool is_injective() const;
        bool is_surjective() const;
        bool is_bijective() const;

        std::string to_string() const;
    };

    struct MultDirectProduct {
        MultGrpPtr group;
        std::vector<MultHom> projections;
        std::vector<MultHom> injections;
    };

    struct MultPcSeries {
        std::vector<MultElem> gens;
        std::vector<int> rel_orders;
        std::vector<long> powers;

        abelian::AbPcSeries log;

        std::vector<int> exponents(const MultElem &x) const;
    };
};

#endif
