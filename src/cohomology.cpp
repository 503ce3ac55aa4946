#include "../include/cohomology.hpp"
#include "../include/abelian.hpp"
#include "../include/fpspace.hpp"
#include "../include/multgrp.hpp"

#include <cstdlib>
#include <stdexcept>

template<class X>
std::string coho::CohomologyGroup<X>::to_string() const {
    return group()->to_string();
}

/*
 * H0
 */

template<class X>
coho::H0<X>::H0(const GModule<X> &C, const bool tate) : C_(C), tate_(tate) {
    PhaseTimer timer(C_.config(), tate_ ? "H^0 (Tate)" : "H^0");
    const MPtr &M = C_.module();
    const std::vector<MHom> &ac = C_.action();

    // M^G is the kernel of m -> (m - m^g_i)_i
    const typename X::DirectProduct P = GModule<X>::power(M, ac.size());
    MHom h = X::zero_hom(M, P.group);
    const MHom id = X::identity(M);
    for (size_t i = 0; i < ac.size(); i++) h = h + (id - ac[i]) * P.injections[i];
    fixed_ = h.kernel();

    if (!tate_) {
        quo_ = X::identity(fixed_.domain());
        return;
    }

    MHom N = X::zero_hom(M, M);
    for (const fingroup::Elem &g : C_.group()->elements()) N = N + C_.action(g);
    quo_ = X::quo(X::lift(N, fixed_));
    quo_.codomain()->set_exponent(mpz_class((unsigned long) C_.group()->order()));
    log(C_.config(), 1, "H^0 (Tate): " + quo_.codomain()->to_string());
}

template<class X>
int coho::H0<X>::degree() const { return 0; }

template<class X>
const typename coho::H0<X>::MPtr& coho::H0<X>::group() const { return quo_.codomain(); }

template<class X>
bool coho::H0<X>::is_tate() const { return tate_; }

template<class X>
const typename coho::H0<X>::MHom& coho::H0<X>::fixed() const { return fixed_; }

template<class X>
coho::CoChain<X> coho::H0<X>::to_cochain(const MElem &x) const {
    std::map<typename CoChain<X>::Key, MElem> values;
    values.emplace(typename CoChain<X>::Key(), fixed_(quo_.preimage(x)));
    return CoChain<X>(C_.shared_from_this(), 0, values);
}

template<class X>
typename coho::H0<X>::MElem coho::H0<X>::from_cochain(const CoChain<X> &c) const {
    if (&c.gmodule() != &C_ || c.degree() != 0) throw std::invalid_argument("Not a 0-cochain of this module");
    MElem y;
    if (!fixed_.has_preimage(c(), y)) throw std::invalid_argument(c().to_string() + " is not fixed by the group");
    return quo_(y);
}

/*
 * H1
 */

template<class X>
coho::H1<X>::H1(const GModule<X> &C) : C_(C) {
    PhaseTimer timer(C_.config(), "H^1");
    const MPtr &M = C_.module();
    const std::vector<MHom> &ac = C_.action();
    const std::vector<MHom> &iac = C_.inv_action();
    const size_t n = ac.size();
    const fingroup::FpGroup &F = C_.fp_group();
    if (F.ngens != n) throw std::logic_error("Presentation has " + std::to_string(F.ngens) + " generators for "
            + std::to_string(n) + " actions");

    D_ = GModule<X>::power(M, n);
    const DirectProduct R = GModule<X>::power(M, F.relators.size());
    log(C_.config(), 1, "H^1: " + std::to_string(n) + " generators, " + std::to_string(F.relators.size()) + " relators");

    // X(a^-1) = -X(a)^(a^-1)
    relator_map_ = X::zero_hom(D_.group, R.group);
    for (size_t k = 0; k < F.relators.size(); k++) {
        MHom P = X::zero_hom(D_.group, M);
        for (const int l : F.relators[k]) {
            if (l > 0) P = P * ac[l - 1] + D_.projections[l - 1];
            else P = (P - D_.projections[-l - 1]) * iac[-l - 1];
        }
        relator_map_ = relator_map_ + P * R.injections[k];
    }

    const MHom id = X::identity(M);
    coboundary_map_ = X::zero_hom(M, D_.group);
    for (size_t i = 0; i < n; i++) coboundary_map_ = coboundary_map_ + (ac[i] - id) * D_.injections[i];

    cocycles_ = relator_map_.kernel();
    quo_ = X::quo(X::lift(coboundary_map_, cocycles_));
    quo_.codomain()->set_exponent(mpz_class((unsigned long) C_.group()->order()));
    log(C_.config(), 1, "H^1: " + quo_.codomain()->to_string());
}

template<class X>
int coho::H1<X>::degree() const { return 1; }

template<class X>
const typename coho::H1<X>::MPtr& coho::H1<X>::group() const { return quo_.codomain(); }

template<class X>
const typename coho::H1<X>::MHom& coho::H1<X>::relator_map() const { return relator_map_; }

template<class X>
const typename coho::H1<X>::MHom& coho::H1<X>::coboundary_map() const { return coboundary_map_; }

template<class X>
const typename coho::H1<X>::MHom& coho::H1<X>::cocycles() const { return cocycles_; }

template<class X>
coho::CoChain<X> coho::H1<X>::to_cochain(const MElem &x) const {
    const MElem y = cocycles_(quo_.preimage(x));
    std::map<typename CoChain<X>::Key, MElem> values;
    const std::vector<fingroup::Elem> gens = C_.group()->gens();
    for (size_t i = 0; i < gens.size(); i++) values[typename CoChain<X>::Key{gens[i]}] = D_.projections[i](y);
    return CoChain<X>(C_.shared_from_this(), 1, values);
}

template<class X>
typename coho::H1<X>::MElem coho::H1<X>::from_cochain(const CoChain<X> &c) const {
    if (&c.gmodule() != &C_ || c.degree() != 1) throw std::invalid_argument("Not a 1-cochain of this module");
    MElem y = D_.group->zero();
    const std::vector<fingroup::Elem> gens = C_.group()->gens();
    for (size_t i = 0; i < gens.size(); i++) y += D_.injections[i](c(gens[i]));
    MElem z;
    if (!cocycles_.has_preimage(y, z)) throw std::invalid_argument("1-cochain is not a crossed homomorphism");
    return quo_(z);
}

/*
 * H2
 */

template<class X>
coho::H2<X>::H2(const GModule<X> &C, const bool force_rws) : C_(C) {
    PhaseTimer timer(C_.config(), "H^2");
    const Config &config = C_.config();
    const fingroup::Group &G = *C_.group();
    const MPtr &M = C_.module();

    use_pc_ = !force_rws && G.has_pc();
    if (use_pc_) {
        const fingroup::PcData &pc = G.pc();
        rws_ = pc.rws;
        letters_ = pc.gens;
        words_ = pc.words;
    } else {
        rws_ = G.rws();
        letters_ = G.gens();
        words_ = G.words();
    }
    log(config, 2, use_pc_ ? "H^2: using the pc presentation" : "H^2: using the shortlex rewriting system");

    {
        PhaseTimer t(config, "H^2 action on the letters");
        for (const fingroup::Elem &x : letters_) {
            ac_.push_back(C_.action(x));
            iac_.push_back(ac_.back().inv());
        }
    }

    ntails_ = 0;
    for (size_t i = 0; i < rws_.size(); i++) {
        tail_.push_back(rws_.has_tail(i) ? (long) ntails_++ : -1);
    }
    log(config, 1, "H^2: need " + std::to_string(ntails_) + " tails");

    D_ = GModule<X>::power(M, ntails_);
    zero_ = X::zero_hom(D_.group, M);

    std::vector<MHom> rels;
    {
        PhaseTimer t(config, "H^2 relations");
        for (const rewriting::Overlap &o : rws_.overlaps()) {
            const rewriting::Rule &r = rws_.rule(o.first);
            const rewriting::Rule &s = rws_.rule(o.second);
            if (o.first == o.second && o.length == r.lhs.size()) continue;
            // For a pc presentation the words g_k g_j g_i, g_j^p g_i, g_j g_i^p and g_i^(p+1) suffice
            if (use_pc_ && o.length > 1 && !(o.first == o.second && o.length + 1 == r.lhs.size())) continue;

            // r.lhs = A B and s.lhs = B C: reduce (A B) C and A (B C)
            const fingroup::Word suffix(s.lhs.begin() + o.length, s.lhs.end());
            const fingroup::Word prefix(r.lhs.begin(), r.lhs.end() - o.length);

            MHom T1 = tail_[o.first] < 0 ? zero_ : act(D_.projections[tail_[o.first]], suffix.begin(), suffix.end());
            const fingroup::Word z1 = collect(rewriting::concat(r.rhs, suffix), T1);
            MHom T2 = zero_;
            const fingroup::Word z2 = collect(rewriting::concat(prefix, s.rhs), T2);
            if (tail_[o.second] >= 0) T2 = T2 + D_.projections[tail_[o.second]];

            if (config.assert_level >= 1 && z1 != z2) {
                throw std::logic_error("Critical pair of rules " + std::to_string(o.first) + " and "
                        + std::to_string(o.second) + " does not resolve: " + rewriting::to_string(z1)
                        + " and " + rewriting::to_string(z2));
            }
            const MHom rel = T1 - T2;
            if (!rel.is_zero()) rels.push_back(rel);
        }
    }
    log(config, 1, "H^2: found " + std::to_string(rels.size()) + " relations");

    const DirectProduct Q = GModule<X>::power(M, rels.size());
    consistency_map_ = X::zero_hom(D_.group, Q.group);
    for (size_t k = 0; k < rels.size(); k++) consistency_map_ = consistency_map_ + rels[k] * Q.injections[k];
    {
        PhaseTimer t(config, "H^2 cocycles");
        cocycles_ = consistency_map_.kernel();
    }

    B_ = GModule<X>::power(M, letters_.size());
    coboundary_map_ = X::zero_hom(B_.group, D_.group);
    for (size_t i = 0; i < rws_.size(); i++) {
        if (tail_[i] < 0) continue;
        const rewriting::Rule &r = rws_.rule(i);
        coboundary_map_ = coboundary_map_ + (chain(r.lhs) - chain(r.rhs)) * D_.injections[tail_[i]];
    }

    {
        PhaseTimer t(config, "H^2 quotient");
        quo_ = X::quo(X::lift(coboundary_map_, cocycles_));
    }
    quo_.codomain()->set_exponent(mpz_class((unsigned long) G.order()));
    log(config, 1, "H^2: " + quo_.codomain()->to_string());
}

template<class X>
const typename coho::H2<X>::MHom& coho::H2<X>::letter_action(const int l) const {
    return l > 0 ? ac_[l - 1] : iac_[-l - 1];
}

template<class X>
typename coho::H2<X>::MHom coho::H2<X>::act(MHom T, fingroup::Word::const_iterator begin,
        fingroup::Word::const_iterator end) const {
    for (auto it = begin; it != end; ++it) T = T * letter_action(*it);
    return T;
}

template<class X>
fingroup::Word coho::H2<X>::collect(const fingroup::Word &w, MHom &T) const {
    // A B C -> A rhs t C = A rhs C t^C
    return rws_.reduce(w, [this, &T](const fingroup::Word &u, const size_t rule, const size_t pos) {
        if (tail_[rule] < 0) return;
        const size_t end = pos + rws_.rule(rule).lhs.size();
        T = T + act(D_.projections[tail_[rule]], u.begin() + end, u.end());
    });
}

template<class X>
fingroup::Word coho::H2<X>::collect(const fingroup::Word &w, MElem &t, const std::vector<MElem> &tails) const {
    return rws_.reduce(w, [this, &t, &tails](const fingroup::Word &u, const size_t rule, const size_t pos) {
        if (tail_[rule] < 0) return;
        MElem v = tails[tail_[rule]];
        for (size_t k = pos + rws_.rule(rule).lhs.size(); k < u.size(); k++) v = letter_action(u[k])(v);
        t += v;
    });
}

template<class X>
typename coho::H2<X>::MHom coho::H2<X>::chain(const fingroup::Word &w) const {
    MHom T = X::zero_hom(B_.group, C_.module());
    for (const int l : w) {
        if (l > 0) T = T * ac_[l - 1] + B_.projections[l - 1];
        else T = (T - B_.projections[-l - 1]) * iac_[-l - 1];
    }
    return T;
}

template<class X>
typename coho::H2<X>::MElem coho::H2<X>::value(const CoChain<X> &c, const fingroup::Word &w) const {
    const fingroup::Elem one = C_.group()->one();
    const MElem c11 = c(one, one);
    // (1, -c(1, 1)) is the identity of the extension
    MElem t = -c11;
    fingroup::Elem g = one;
    for (const int l : w) {
        const fingroup::Elem &x = letters_[std::abs(l) - 1];
        if (l > 0) {
            t = ac_[l - 1](t) + c(g, x);
            g = g * x;
        } else {
            // (x, 0)^-1 = (x^-1, -c(x, x^-1) - c(1, 1))
            const fingroup::Elem xi = x.inv();
            t = iac_[-l - 1](t) + c(g, xi) - c(x, xi) - c11;
            g = g * xi;
        }
    }
    return t;
}

template<class X>
void coho::H2<X>::check_cochain(const CoChain<X> &c) const {
    if (&c.gmodule() != &C_ || c.degree() != 2) throw std::invalid_argument("Not a 2-cochain of this module");
    if (C_.config().assert_level >= 2 && !c.is_cocycle()) throw std::invalid_argument("2-cochain is not a cocycle");
}

template<class X>
int coho::H2<X>::degree() const { return 2; }

template<class X>
const typename coho::H2<X>::MPtr& coho::H2<X>::group() const { return quo_.codomain(); }

template<class X>
bool coho::H2<X>::uses_pc() const { return use_pc_; }

template<class X>
const rewriting::System& coho::H2<X>::rws() const { return rws_; }

template<class X>
const std::vector<fingroup::Elem>& coho::H2<X>::letters() const { return letters_; }

template<class X>
size_t coho::H2<X>::ntails() const { return ntails_; }

template<class X>
const typename coho::H2<X>::MHom& coho::H2<X>::consistency_map() const { return consistency_map_; }

template<class X>
const typename coho::H2<X>::MHom& coho::H2<X>::coboundary_map() const { return coboundary_map_; }

template<class X>
const typename coho::H2<X>::MHom& coho::H2<X>::cocycles() const { return cocycles_; }

template<class X>
coho::CoChain<X> coho::H2<X>::to_cochain(const MElem &x) const {
    return tail_to_cochain(cocycles_(quo_.preimage(x)));
}

template<class X>
typename coho::H2<X>::MElem coho::H2<X>::from_cochain(const CoChain<X> &c) const {
    const MElem t = tail_from_cochain(c);
    MElem y;
    if (!cocycles_.has_preimage(t, y)) throw std::invalid_argument("2-cochain is not a cocycle");
    return quo_(y);
}

template<class X>
typename coho::H2<X>::MElem coho::H2<X>::tail_from_cochain(const CoChain<X> &c) const {
    check_cochain(c);
    MElem T = D_.group->zero();
    for (size_t i = 0; i < rws_.size(); i++) {
        if (tail_[i] < 0) continue;
        const rewriting::Rule &r = rws_.rule(i);
        T += D_.injections[tail_[i]](value(c, r.lhs) - value(c, r.rhs));
    }
    return T;
}

template<class X>
coho::CoChain<X> coho::H2<X>::tail_to_cochain(const MElem &t) const {
    if (*t.parent() != *D_.group) throw std::invalid_argument("Tail vector " + t.to_string() + " has the wrong parent");
    PhaseTimer timer(C_.config(), "H^2 tails to cochain");
    std::vector<MElem> tails;
    for (const MHom &p : D_.projections) tails.push_back(p(t));

    const fingroup::Group &G = *C_.group();
    const std::vector<fingroup::Elem> elems = G.elements();
    std::map<typename CoChain<X>::Key, MElem> values;
    for (const fingroup::Elem &g : elems) {
        for (const fingroup::Elem &h : elems) {
            MElem v = C_.module()->zero();
            const fingroup::Word w = collect(rewriting::concat(words_[g.index()], words_[h.index()]), v, tails);
            if (C_.config().assert_level >= 1 && w != words_[(g * h).index()]) {
                throw std::logic_error("Collection of " + g.to_string() + " * " + h.to_string() + " gives "
                        + rewriting::to_string(w));
            }
            values.emplace(typename CoChain<X>::Key{g, h}, v);
        }
    }
    return CoChain<X>(C_.shared_from_this(), 2, values);
}

template<class X>
std::pair<bool, coho::CoChain<X>> coho::H2<X>::is_coboundary(const CoChain<X> &c) const {
    const MElem t = tail_from_cochain(c);
    MElem b;
    if (!coboundary_map_.has_preimage(t, b)) return std::make_pair(false, CoChain<X>(C_.shared_from_this(), 1));

    // d(x) = b_x on the letters and d(h x) = d(h)^x + d(x) - c(h, x) along normal words
    const fingroup::Group &G = *C_.group();
    const fingroup::Elem one = G.one();
    std::vector<MElem> images;
    for (const MHom &p : B_.projections) images.push_back(p(b));

    std::map<typename CoChain<X>::Key, MElem> values;
    for (const fingroup::Elem &g : G.elements()) {
        MElem d = c(one, one);
        fingroup::Elem h = one;
        for (const int l : words_[g.index()]) {
            if (l < 0) throw std::logic_error("Normal word of " + g.to_string() + " has an inverse letter");
            const fingroup::Elem &x = letters_[l - 1];
            d = ac_[l - 1](d) + images[l - 1] - c(h, x);
            h = h * x;
        }
        values.emplace(typename CoChain<X>::Key{g}, d);
    }
    CoChain<X> d(C_.shared_from_this(), 1, values);

    if (C_.config().assert_level >= 1 && d.coboundary() != c) {
        throw std::logic_error("Bounding 1-cochain does not reproduce the 2-cocycle");
    }
    return std::make_pair(true, d);
}

template<class X>
std::pair<typename coho::H2<X>::MHom, fingroup::Word> coho::H2<X>::symbolic_chain(const fingroup::Elem &g,
        const fingroup::Elem &h) const {
    if (g.parent() != C_.group().get() || h.parent() != C_.group().get()) {
        throw std::invalid_argument("Elements are not in the acting group");
    }
    MHom T = zero_;
    const fingroup::Word w = collect(rewriting::concat(words_[g.index()], words_[h.index()]), T);
    return std::make_pair(cocycles_ * T, w);
}

template class coho::CohomologyGroup<abelian::AbGroup>;
template class coho::CohomologyGroup<fpspace::FpSpace>;
template class coho::CohomologyGroup<multgrp::MultGrp>;
template class coho::H0<abelian::AbGroup>;
template class coho::H0<fpspace::FpSpace>;
template class coho::H0<multgrp::MultGrp>;
template class coho::H1<abelian::AbGroup>;
template class coho::H1<fpspace::FpSpace>;
template class coho::H1<multgrp::MultGrp>;
template class coho::H2<abelian::AbGroup>;
template class coho::H2<fpspace::FpSpace>;
template class coho::H2<multgrp::MultGrp>;
