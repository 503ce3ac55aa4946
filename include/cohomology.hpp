// cohomology.hpp
#ifndef COHOMOLOGY_HPP_
#define COHOMOLOGY_HPP_

#include "gmodule.hpp"
#include "cochain.hpp"
#include "rewriting.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace coho {
    // H^i(G, M) as an abstract module together with the translation to cochains
    template<class X>
    class CohomologyGroup {
    public:
        typedef typename X::Ptr MPtr;
        typedef typename X::Elem MElem;
        typedef typename X::Hom MHom;

        virtual ~CohomologyGroup() {}

        virtual int degree() const = 0;
        virtual const MPtr& group() const = 0;

        // Representative cocycle of a class
        virtual CoChain<X> to_cochain(const MElem &x) const = 0;
        // Class of a cocycle, throws if c is not one
        virtual MElem from_cochain(const CoChain<X> &c) const = 0;

        std::string to_string() const;
    };

    // Fixed points M^G, or M^G / N M for the Tate version with the norm N = sum of all g
    template<class X>
    class H0 : public CohomologyGroup<X> {
    public:
        typedef typename CohomologyGroup<X>::MPtr MPtr;
        typedef typename CohomologyGroup<X>::MElem MElem;
        typedef typename CohomologyGroup<X>::MHom MHom;

    private:
        const GModule<X> &C_;
        bool tate_;
        MHom fixed_;    // M^G -> M
        MHom quo_;      // M^G -> H

    public:
        H0(const GModule<X> &C, const bool tate);

        int degree() const;
        const MPtr& group() const;
        bool is_tate() const;
        const MHom& fixed() const;

        CoChain<X> to_cochain(const MElem &x) const;
        MElem from_cochain(const CoChain<X> &c) const;
    };

    /*
     * Crossed homomorphisms modulo principal ones. A 1-cocycle is determined by its values
     * on the generators, so Z^1 is the kernel of the map M^n -> M^{#relators} that evaluates
     * every relator of the group by the rule X(g h) = X(g)^h + X(h).
     */
    template<class X>
    class H1 : public CohomologyGroup<X> {
    public:
        typedef typename CohomologyGroup<X>::MPtr MPtr;
        typedef typename CohomologyGroup<X>::MElem MElem;
        typedef typename CohomologyGroup<X>::MHom MHom;
        typedef typename X::DirectProduct DirectProduct;

    private:
        const GModule<X> &C_;
        DirectProduct D_;       // M^n, one summand per generator
        MHom relator_map_;      // D -> M^{#relators}
        MHom coboundary_map_;   // M -> D, m -> (m^g_i - m)_i
        MHom cocycles_;         // Z^1 -> D
        MHom quo_;              // Z^1 -> H^1

    public:
        explicit H1(const GModule<X> &C);

        int degree() const;
        const MPtr& group() const;

        const MHom& relator_map() const;
        const MHom& coboundary_map() const;
        const MHom& cocycles() const;

        CoChain<X> to_cochain(const MElem &x) const;
        MElem from_cochain(const CoChain<X> &c) const;
    };

    /*
     * Second cohomology from a confluent rewriting system for G. Every rule lhs -> rhs other
     * than a one letter rule carries a tail t with lhs = rhs * t in the extension, so a
     * 2-cocycle up to the choice of lifts is a vector of tails in D = M^{#tails}. The tails
     * have to resolve every critical pair; this cuts out the cocycles E inside D. Changing
     * the lifts of the letters by b in B = M^{#letters} changes the tails by the coboundary
     * map B -> D, and H^2 = E / image.
     *
     * The polycyclic presentation of G is used when there is one, and then only overlaps of
     * length 1 and the overlaps of a power rule with itself in all but one letter are needed.
     * Otherwise the shortlex system over the generators of G is used with all overlaps.
     */
    template<class X>
    class H2 : public CohomologyGroup<X> {
    public:
        typedef typename CohomologyGroup<X>::MPtr MPtr;
        typedef typename CohomologyGroup<X>::MElem MElem;
        typedef typename CohomologyGroup<X>::MHom MHom;
        typedef typename X::DirectProduct DirectProduct;

    private:
        const GModule<X> &C_;
        bool use_pc_;
        rewriting::System rws_;
        std::vector<fingroup::Elem> letters_;   // image in G of every letter of rws_
        std::vector<fingroup::Word> words_;     // normal word of every element of G
        std::vector<MHom> ac_;
        std::vector<MHom> iac_;

        std::vector<long> tail_;    // slot of every rule in D, -1 if it has no tail
        size_t ntails_;

        DirectProduct D_;
        DirectProduct B_;
        MHom zero_;                 // D -> M
        MHom consistency_map_;      // D -> M^{#relations}, kernel E
        MHom cocycles_;             // E -> D
        MHom coboundary_map_;       // B -> D
        MHom quo_;                  // E -> H^2

        const MHom& letter_action(const int l) const;
        MHom act(MHom T, fingroup::Word::const_iterator begin, fingroup::Word::const_iterator end) const;

        // Reduces w and adds the tails of the applied rules, as maps D -> M, to T
        fingroup::Word collect(const fingroup::Word &w, MHom &T) const;
        // The same for one tail vector, given by its components
        fingroup::Word collect(const fingroup::Word &w, MElem &t, const std::vector<MElem> &tails) const;

        // Value on w of the 1-cochain on the free monoid given by its values on the letters
        MHom chain(const fingroup::Word &w) const;
        // Module part of the product of the lifts (x, 0) of the letters of w in the extension by c
        MElem value(const CoChain<X> &c, const fingroup::Word &w) const;

        void check_cochain(const CoChain<X> &c) const;

    public:
        H2(const GModule<X> &C, const bool force_rws = false);

        int degree() const;
        const MPtr& group() const;

        bool uses_pc() const;
        const rewriting::System& rws() const;
        const std::vector<fingroup::Elem>& letters() const;
        size_t ntails() const;

        const MHom& consistency_map() const;
        const MHom& coboundary_map() const;
        const MHom& cocycles() const;

        CoChain<X> to_cochain(const MElem &x) const;
        MElem from_cochain(const CoChain<X> &c) const;

        // Tail vector in D of a 2-cocycle
        MElem tail_from_cochain(const CoChain<X> &c) const;
        // 2-cocycle on all pairs of elements from a tail vector in E
        CoChain<X> tail_to_cochain(const MElem &t) const;

        // Whether c = d(X) for a 1-cochain X, which is returned as well
        std::pair<bool, CoChain<X>> is_coboundary(const CoChain<X> &c) const;

        // The value c(g, h) as a map E -> M, with the collected word of g h
        std::pair<MHom, fingroup::Word> symbolic_chain(const fingroup::Elem &g, const fingroup::Elem &h) const;
    };
};

#endif
