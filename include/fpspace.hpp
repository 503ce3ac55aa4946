// fpspace.hpp
#ifndef FPSPACE_HPP_
#define FPSPACE_HPP_

#include "matrix.hpp"

#include <memory>
#include <string>
#include <vector>

#include <gmpxx.h>

namespace fpspace {
    class FpSpace;
    class FpVec;
    class FpHom;
    struct FpDirectProduct;
    struct FpPcSeries;

    typedef std::shared_ptr<const FpSpace> FpSpacePtr;

    // F_p^dim with p prime. Same interface as abelian::AbGroup.
    class FpSpace : public std::enable_shared_from_this<FpSpace> {
    private:
        mpz_class p_;
        size_t dim_;

    public:
        typedef FpSpacePtr Ptr;
        typedef FpVec Elem;
        typedef FpHom Hom;
        typedef FpDirectProduct DirectProduct;
        typedef FpPcSeries PcSeries;

        FpSpace(const mpz_class &p, const size_t dim);

        static Ptr create(const mpz_class &p, const size_t dim);

        const mpz_class& prime() const;
        size_t dim() const;
        size_t ngens() const;
        // p * identity, the relations of the underlying abelian group
        matrix::ZMatrix relations() const;

        Elem gen(const size_t i) const;
        Elem zero() const;
        Elem elem(const std::vector<mpz_class> &coeffs) const;

        bool is_finite() const;
        bool is_trivial() const;
        mpz_class order() const;
        size_t rank() const;
        std::vector<mpz_class> invariants() const;

        // Spaces have exponent p already
        void set_exponent(const mpz_class &e) const;

        PcSeries pc_series() const;

        bool operator==(const FpSpace &rhs) const;
        bool operator!=(const FpSpace &rhs) const;

        std::string to_string() const;

        static Hom identity(const Ptr &A);
        static Hom zero_hom(const Ptr &A, const Ptr &B);
        static Hom hom(const Ptr &A, const Ptr &B, const std::vector<Elem> &images, const bool check = true);
        static Hom hom(const Ptr &A, const Ptr &B, const matrix::ZMatrix &mat, const bool check = true);

        static DirectProduct direct_product(const std::vector<Ptr> &parts);

        static Hom sub(const Ptr &A, const std::vector<Elem> &elems);
        static Hom quo(const Hom &h);
        static Hom snf(const Ptr &A);

        static Hom lift(const Hom &h, const Hom &emb);
        static bool is_subset(const Hom &s, const Hom &t);
    };

    class FpVec {
    private:
        FpSpacePtr parent_;
        std::vector<mpz_class> coeffs_;

    public:
        FpVec();
        // Reduces coeffs into [0, p)
        FpVec(const FpSpacePtr &parent, std::vector<mpz_class> coeffs);

        const FpSpacePtr& parent() const;
        const std::vector<mpz_class>& coeffs() const;
        const mpz_class& operator[](const size_t i) const;

        bool is_zero() const;

        FpVec operator+(const FpVec &rhs) const;
        FpVec operator-(const FpVec &rhs) const;
        FpVec operator-() const;
        FpVec operator*(const mpz_class &k) const;
        FpVec& operator+=(const FpVec &rhs);

        bool operator==(const FpVec &rhs) const;
        bool operator!=(const FpVec &rhs) const;
        bool operator<(const FpVec &rhs) const;

        std::string to_string() const;
    };

    class FpHom {
    private:
        FpSpacePtr domain_;
        FpSpacePtr codomain_;
        matrix::ZMatrix mat_;

    public:
        FpHom();
        FpHom(const FpSpacePtr &domain, const FpSpacePtr &codomain, const matrix::ZMatrix &mat);

        const FpSpacePtr& domain() const;
        const FpSpacePtr& codomain() const;
        const matrix::ZMatrix& mat() const;

        FpVec operator()(const FpVec &x) const;
        FpVec image(const size_t i) const;

        FpHom operator*(const FpHom &rhs) const;
        FpHom operator+(const FpHom &rhs) const;
        FpHom operator-(const FpHom &rhs) const;
        FpHom operator-() const;

        bool operator==(const FpHom &rhs) const;
        bool operator!=(const FpHom &rhs) const;

        FpHom kernel() const;
        FpHom image() const;

        bool has_preimage(const FpVec &y, FpVec &x) const;
        FpVec preimage(const FpVec &y) const;
        FpHom inv() const;

        size_t rank() const;
        bool is_zero() const;
        bool is_injective() const;
        bool is_surjective() const;
        bool is_bijective() const;

        std::string to_string() const;
    };

    struct FpDirectProduct {
        FpSpacePtr group;
        std::vector<FpHom> projections;
        std::vector<FpHom> injections;
    };

    // The standard basis, every relative order p
    struct FpPcSeries {
        std::vector<FpVec> gens;
        std::vector<int> rel_orders;
        std::vector<long> powers;

        std::vector<int> exponents(const FpVec &x) const;
    };
};

#endif
