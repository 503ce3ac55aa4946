// cochain.hpp
#ifndef COCHAIN_HPP_
#define COCHAIN_HPP_

#include "gmodule.hpp"

#include <map>
#include <string>
#include <vector>

namespace coho {
    // Function G^degree -> M for degree 0, 1 or 2. Degree 1 cochains may be given on the
    // generators only; other values then follow the crossed homomorphism rule
    // X(g h) = X(g)^h + X(h) and are cached.
    template<class X>
    class CoChain {
    public:
        typedef typename X::Elem MElem;
        typedef std::vector<fingroup::Elem> Key;

    private:
        GModulePtr<X> C_;
        int degree_;
        mutable std::map<Key, MElem> values_;

        const MElem& lookup(const Key &key) const;

    public:
        CoChain(const GModulePtr<X> &C, const int degree, const std::map<Key, MElem> &values = std::map<Key, MElem>());

        const GModule<X>& gmodule() const;
        int degree() const;
        const std::map<Key, MElem>& values() const;

        MElem operator()() const;
        MElem operator()(const fingroup::Elem &g) const;
        MElem operator()(const fingroup::Elem &g, const fingroup::Elem &h) const;

        bool is_cocycle() const;
        // Degree 0 and 1 only
        CoChain<X> coboundary() const;

        // Compared on every tuple of group elements
        bool operator==(const CoChain<X> &rhs) const;
        bool operator!=(const CoChain<X> &rhs) const;

        std::string to_string() const;
    };
};

#endif
