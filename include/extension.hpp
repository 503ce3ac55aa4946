// extension.hpp
#ifndef EXTENSION_HPP_
#define EXTENSION_HPP_

#include "cochain.hpp"
#include "fingroup.hpp"
#include "gmodule.hpp"
#include "util.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <gmpxx.h>

namespace coho {
    /*
     * The group of pairs (g, m) with (g, m) (h, n) = (g h, m^h + n + c(g, h)) for a 2-cocycle c.
     * Its identity is (1, -c(1, 1)) and M embeds by m -> (1, m - c(1, 1)).
     */
    template<class X>
    class ExtensionLaw {
    public:
        typedef typename X::Elem MElem;
        typedef std::pair<fingroup::Elem, MElem> Pair;

    private:
        GModulePtr<X> C_;
        CoChain<X> c_;
        std::vector<typename X::Hom> acts_;   // action of every element of G
        MElem c11_;

    public:
        explicit ExtensionLaw(const CoChain<X> &c);

        const CoChain<X>& cocycle() const;

        Pair one() const;
        Pair mul(const Pair &a, const Pair &b) const;
        Pair inv(const Pair &a) const;
        Pair inject(const MElem &m) const;
        // Product of the lifts (x, 0) of the letters, inverse letters give inverses
        Pair evaluate(const std::vector<fingroup::Elem> &letters, const fingroup::Word &w) const;
    };

    // Word in the letters offset + 1, ... for a coefficient vector
    fingroup::Word coeff_word(const std::vector<mpz_class> &coeffs, const int offset);

    /*
     * Extension of G by M for a 2-cocycle, as a finitely presented group on the generators of
     * G followed by those of M. For finite M the group itself is enumerated too.
     */
    template<class X>
    class Extension {
    public:
        typedef typename X::Elem MElem;
        typedef std::pair<size_t, std::vector<mpz_class>> Key;

    private:
        ExtensionLaw<X> law_;
        fingroup::FpGroup presentation_;
        fingroup::GroupPtr Q_;
        fingroup::Hom projection_;
        std::vector<Key> pairs_;
        std::unordered_map<Key, size_t, util::PairHash> index_;

        const GModule<X>& gmodule() const;

    public:
        explicit Extension(const CoChain<X> &c);

        const fingroup::FpGroup& presentation() const;

        bool has_group() const;
        const fingroup::GroupPtr& group() const;
        // Q -> G
        const fingroup::Hom& projection() const;

        fingroup::Elem inject(const MElem &m) const;
        fingroup::Elem element(const fingroup::Elem &g, const MElem &m) const;
        std::pair<fingroup::Elem, MElem> split(const fingroup::Elem &q) const;
    };

    /*
     * Polycyclic extension for G with a pc presentation and finite M: the pc generators of G
     * are followed by a pc series of M, and the tails of the power and conjugate relations
     * of G are read off the cocycle.
     */
    template<class X>
    class PcExtension {
    public:
        typedef typename X::Elem MElem;

    private:
        ExtensionLaw<X> law_;
        typename X::PcSeries series_;
        fingroup::PcPresentation presentation_;
        fingroup::GroupPtr Q_;
        fingroup::Hom projection_;

        const GModule<X>& gmodule() const;
        // Collected word of m in the pc generators of M
        fingroup::Word module_word(const MElem &m) const;

    public:
        explicit PcExtension(const CoChain<X> &c);

        const fingroup::PcPresentation& presentation() const;
        const fingroup::GroupPtr& group() const;
        const fingroup::Hom& projection() const;

        fingroup::Elem inject(const MElem &m) const;
        fingroup::Elem element(const fingroup::Elem &g, const MElem &m) const;
        std::pair<fingroup::Elem, MElem> split(const fingroup::Elem &q) const;
    };
};

#endif
