#include "../include/extension.hpp"
#include "../include/abelian.hpp"
#include "../include/fpspace.hpp"
#include "../include/multgrp.hpp"

#include <cstdlib>
#include <stdexcept>

/*
 * ExtensionLaw
 */

template<class X>
coho::ExtensionLaw<X>::ExtensionLaw(const CoChain<X> &c) : C_(c.gmodule().shared_from_this()), c_(c) {
    if (c_.degree() != 2) throw std::invalid_argument("Extensions need a 2-cocycle, got a "
            + std::to_string(c_.degree()) + "-cochain");
    if (C_->config().assert_level >= 1 && !c_.is_cocycle()) throw std::logic_error("2-cochain fails the cocycle identity");
    for (const fingroup::Elem &g : C_->group()->elements()) acts_.push_back(C_->action(g));
    const fingroup::Elem one = C_->group()->one();
    c11_ = c_(one, one);
}

template<class X>
const coho::CoChain<X>& coho::ExtensionLaw<X>::cocycle() const { return c_; }

template<class X>
typename coho::ExtensionLaw<X>::Pair coho::ExtensionLaw<X>::one() const {
    return Pair(C_->group()->one(), -c11_);
}

template<class X>
typename coho::ExtensionLaw<X>::Pair coho::ExtensionLaw<X>::mul(const Pair &a, const Pair &b) const {
    return Pair(a.first * b.first, acts_[b.first.index()](a.second) + b.second + c_(a.first, b.first));
}

template<class X>
typename coho::ExtensionLaw<X>::Pair coho::ExtensionLaw<X>::inv(const Pair &a) const {
    const fingroup::Elem gi = a.first.inv();
    return Pair(gi, -c11_ - c_(a.first, gi) - acts_[gi.index()](a.second));
}

template<class X>
typename coho::ExtensionLaw<X>::Pair coho::ExtensionLaw<X>::inject(const MElem &m) const {
    return Pair(C_->group()->one(), m - c11_);
}

template<class X>
typename coho::ExtensionLaw<X>::Pair coho::ExtensionLaw<X>::evaluate(const std::vector<fingroup::Elem> &letters,
        const fingroup::Word &w) const {
    const MElem zero = C_->module()->zero();
    Pair x = one();
    for (const int l : w) {
        const Pair y(letters.at(std::abs(l) - 1), zero);
        x = mul(x, l > 0 ? y : inv(y));
    }
    return x;
}

fingroup::Word coho::coeff_word(const std::vector<mpz_class> &coeffs, const int offset) {
    fingroup::Word w;
    for (size_t j = 0; j < coeffs.size(); j++) {
        if (!coeffs[j].fits_slong_p()) throw std::invalid_argument("Coefficient " + coeffs[j].get_str() + " is too large for a word");
        const long e = coeffs[j].get_si();
        const int l = offset + (int) j + 1;
        for (long r = 0; r < std::labs(e); r++) w.push_back(e > 0 ? l : -l);
    }
    return w;
}

/*
 * Extension
 */

template<class X>
coho::Extension<X>::Extension(const CoChain<X> &c) : law_(c) {
    const GModule<X> &C = gmodule();
    PhaseTimer timer(C.config(), "Extension");
    const fingroup::Group &G = *C.group();
    const typename X::Ptr &M = C.module();
    const int n = (int) G.ngens();
    const int k = (int) M->ngens();

    presentation_.ngens = n + k;
    // M is abelian with its own relations
    const matrix::ZMatrix R = M->relations();
    for (size_t r = 0; r < R.rows(); r++) {
        const fingroup::Word w = coeff_word(R.row(r), n);
        if (!w.empty()) presentation_.relators.push_back(w);
    }
    for (int i = 1; i <= k; i++) {
        for (int j = i + 1; j <= k; j++) {
            presentation_.relators.push_back(fingroup::Word{-(n + i), -(n + j), n + i, n + j});
        }
    }
    // A relator of G evaluates to (1, t), the image of t + c(1, 1) in M
    const MElem c11 = law_.cocycle()(G.one(), G.one());
    for (const fingroup::Word &r : C.fp_group().relators) {
        const typename ExtensionLaw<X>::Pair p = law_.evaluate(G.gens(), r);
        if (!p.first.is_one()) throw std::logic_error("Relator " + rewriting::to_string(r) + " is not trivial in the group");
        const MElem v = p.second + c11;
        presentation_.relators.push_back(rewriting::concat(r, rewriting::inverse(coeff_word(v.coeffs(), n))));
    }
    // m_j^(g_i) = g_i^-1 m_j g_i
    for (int i = 1; i <= n; i++) {
        for (int j = 1; j <= k; j++) {
            const MElem v = C.action()[i - 1](M->gen(j - 1));
            presentation_.relators.push_back(rewriting::concat(fingroup::Word{-i, n + j, i},
                    rewriting::inverse(coeff_word(v.coeffs(), n))));
        }
    }
    log(C.config(), 1, "Extension: " + presentation_.to_string());

    if (!M->is_finite()) return;

    const fingroup::GroupPtr &GP = C.group();
    const ExtensionLaw<X> &law = law_;
    std::vector<Key> gens;
    for (const fingroup::Elem &g : G.gens()) gens.push_back(Key(g.index(), M->zero().coeffs()));
    for (int j = 0; j < k; j++) gens.push_back(Key(0, law.inject(M->gen(j)).second.coeffs()));
    const Key one(0, law.one().second.coeffs());

    Q_ = fingroup::Group::closure<Key, util::PairHash>(gens, one,
            [&](const Key &a, const Key &b) {
                const typename ExtensionLaw<X>::Pair p = law.mul(
                        typename ExtensionLaw<X>::Pair(GP->elem(a.first), M->elem(a.second)),
                        typename ExtensionLaw<X>::Pair(GP->elem(b.first), M->elem(b.second)));
                return Key(p.first.index(), p.second.coeffs());
            },
            [&](const Key &a) {
                return "(" + GP->label(a.first) + ", " + M->elem(a.second).to_string() + ")";
            },
            &pairs_);
    for (size_t i = 0; i < pairs_.size(); i++) index_.emplace(pairs_[i], i);

    std::vector<fingroup::Elem> images = G.gens();
    for (int j = 0; j < k; j++) images.push_back(G.one());
    projection_ = fingroup::Hom(Q_, GP, images);
    log(C.config(), 1, "Extension: group of order " + std::to_string(Q_->order()));
}

template<class X>
const coho::GModule<X>& coho::Extension<X>::gmodule() const {
    return law_.cocycle().gmodule();
}

template<class X>
const fingroup::FpGroup& coho::Extension<X>::presentation() const { return presentation_; }

template<class X>
bool coho::Extension<X>::has_group() const { return Q_ != nullptr; }

template<class X>
const fingroup::GroupPtr& coho::Extension<X>::group() const {
    if (Q_ == nullptr) throw std::invalid_argument("Extension by the infinite module " + gmodule().module()->to_string()
            + " is only finitely presented");
    return Q_;
}

template<class X>
const fingroup::Hom& coho::Extension<X>::projection() const {
    group();
    return projection_;
}

template<class X>
fingroup::Elem coho::Extension<X>::inject(const MElem &m) const {
    const typename ExtensionLaw<X>::Pair p = law_.inject(m);
    return element(p.first, p.second);
}

template<class X>
fingroup::Elem coho::Extension<X>::element(const fingroup::Elem &g, const MElem &m) const {
    const GModule<X> &C = gmodule();
    if (g.parent() != C.group().get()) throw std::invalid_argument("Element " + g.to_string() + " is not in the group");
    if (*m.parent() != *C.module()) throw std::invalid_argument("Element " + m.to_string() + " is not in the module");
    const fingroup::GroupPtr &Q = group();
    auto it = index_.find(Key(g.index(), m.coeffs()));
    if (it == index_.end()) throw std::logic_error("Pair (" + g.to_string() + ", " + m.to_string() + ") is not in the extension");
    return Q->elem(it->second);
}

template<class X>
std::pair<fingroup::Elem, typename coho::Extension<X>::MElem> coho::Extension<X>::split(const fingroup::Elem &q) const {
    const fingroup::GroupPtr &Q = group();
    if (q.parent() != Q.get()) throw std::invalid_argument("Element " + q.to_string() + " is not in the extension");
    const Key &p = pairs_[q.index()];
    const GModule<X> &C = gmodule();
    return std::make_pair(C.group()->elem(p.first), C.module()->elem(p.second));
}

/*
 * PcExtension
 */

template<class X>
coho::PcExtension<X>::PcExtension(const CoChain<X> &c) : law_(c) {
    const GModule<X> &C = gmodule();
    PhaseTimer timer(C.config(), "Pc extension");
    const fingroup::Group &G = *C.group();
    const typename X::Ptr &M = C.module();
    if (!G.has_pc()) throw std::invalid_argument("Group has no polycyclic presentation");
    if (!M->is_finite()) throw std::invalid_argument("Polycyclic extensions need a finite module, got " + M->to_string());

    const fingroup::PcData &pc = G.pc();
    const int n = (int) pc.gens.size();
    series_ = M->pc_series();
    const int k = (int) series_.gens.size();

    presentation_.rel_orders = pc.presentation.rel_orders;
    presentation_.rel_orders.insert(presentation_.rel_orders.end(), series_.rel_orders.begin(), series_.rel_orders.end());

    const MElem zero = M->zero();
    auto lift = [&](const int i) { return typename ExtensionLaw<X>::Pair(pc.gens[i], zero); };

    // g_i^p = w t with the tail t read off the cocycle
    for (int i = 0; i < n; i++) {
        const typename ExtensionLaw<X>::Pair u = law_.evaluate(pc.gens, fingroup::Word(pc.presentation.rel_orders[i], i + 1));
        const fingroup::Word &w = pc.presentation.powers[i];
        const typename ExtensionLaw<X>::Pair v = law_.evaluate(pc.gens, w);
        if (u.first != v.first) throw std::logic_error("Power relation of pc generator " + std::to_string(i + 1) + " does not hold");
        presentation_.powers.push_back(rewriting::concat(w, module_word(u.second - v.second)));
    }
    for (int j = 0; j < k; j++) {
        presentation_.powers.push_back(module_word(series_.gens[j] * mpz_class(series_.rel_orders[j])));
    }

    const MElem c11 = law_.cocycle()(G.one(), G.one());
    for (int i = 0; i < n; i++) {
        const typename ExtensionLaw<X>::Pair x = lift(i);
        const typename ExtensionLaw<X>::Pair xi = law_.inv(x);
        for (int j = i + 1; j < n; j++) {
            const typename ExtensionLaw<X>::Pair u = law_.mul(law_.mul(xi, lift(j)), x);
            const fingroup::Word &w = pc.words[u.first.index()];
            const typename ExtensionLaw<X>::Pair v = law_.evaluate(pc.gens, w);
            const fingroup::Word conj = rewriting::concat(w, module_word(u.second - v.second));
            if (conj != fingroup::Word{j + 1}) presentation_.conjugates[std::make_pair(j + 1, i + 1)] = conj;
        }
        for (int j = 0; j < k; j++) {
            const typename ExtensionLaw<X>::Pair u = law_.mul(law_.mul(xi, law_.inject(series_.gens[j])), x);
            const fingroup::Word conj = module_word(u.second + c11);
            if (conj != fingroup::Word{n + j + 1}) presentation_.conjugates[std::make_pair(n + j + 1, i + 1)] = conj;
        }
    }

    Q_ = fingroup::Group::from_pc(presentation_);
    std::vector<fingroup::Elem> images(pc.gens);
    for (int j = 0; j < k; j++) images.push_back(G.one());
    projection_ = fingroup::Hom(Q_, C.group(), images);
    log(C.config(), 1, "Pc extension: group of order " + std::to_string(Q_->order()));
}

template<class X>
const coho::GModule<X>& coho::PcExtension<X>::gmodule() const {
    return law_.cocycle().gmodule();
}

template<class X>
fingroup::Word coho::PcExtension<X>::module_word(const MElem &m) const {
    const int n = (int) gmodule().group()->pc().gens.size();
    const std::vector<int> e = series_.exponents(m);
    fingroup::Word w;
    for (size_t j = 0; j < e.size(); j++) {
        for (int r = 0; r < e[j]; r++) w.push_back(n + (int) j + 1);
    }
    return w;
}

template<class X>
const fingroup::PcPresentation& coho::PcExtension<X>::presentation() const { return presentation_; }

template<class X>
const fingroup::GroupPtr& coho::PcExtension<X>::group() const { return Q_; }

template<class X>
const fingroup::Hom& coho::PcExtension<X>::projection() const { return projection_; }

template<class X>
fingroup::Elem coho::PcExtension<X>::inject(const MElem &m) const {
    const typename ExtensionLaw<X>::Pair p = law_.inject(m);
    return element(p.first, p.second);
}

template<class X>
fingroup::Elem coho::PcExtension<X>::element(const fingroup::Elem &g, const MElem &m) const {
    const GModule<X> &C = gmodule();
    if (g.parent() != C.group().get()) throw std::invalid_argument("Element " + g.to_string() + " is not in the group");
    if (*m.parent() != *C.module()) throw std::invalid_argument("Element " + m.to_string() + " is not in the module");
    const fingroup::PcData &pc = C.group()->pc();
    const fingroup::Word &w = pc.words[g.index()];
    const typename ExtensionLaw<X>::Pair b = law_.evaluate(pc.gens, w);
    return Q_->pc_evaluate(rewriting::concat(w, module_word(m - b.second)));
}

template<class X>
std::pair<fingroup::Elem, typename coho::PcExtension<X>::MElem> coho::PcExtension<X>::split(const fingroup::Elem &q) const {
    if (q.parent() != Q_.get()) throw std::invalid_argument("Element " + q.to_string() + " is not in the extension");
    const GModule<X> &C = gmodule();
    const fingroup::PcData &pc = C.group()->pc();
    const int n = (int) pc.gens.size();

    fingroup::Word w;
    MElem m = C.module()->zero();
    for (const int l : Q_->pc().words[q.index()]) {
        if (l <= n) w.push_back(l);
        else m += series_.gens[l - n - 1];
    }
    const typename ExtensionLaw<X>::Pair b = law_.evaluate(pc.gens, w);
    return std::make_pair(b.first, b.second + m);
}

template class coho::ExtensionLaw<abelian::AbGroup>;
template class coho::ExtensionLaw<fpspace::FpSpace>;
template class coho::ExtensionLaw<multgrp::MultGrp>;
template class coho::Extension<abelian::AbGroup>;
template class coho::Extension<fpspace::FpSpace>;
template class coho::Extension<multgrp::MultGrp>;
template class coho::PcExtension<abelian::AbGroup>;
template class coho::PcExtension<fpspace::FpSpace>;
template class coho::PcExtension<multgrp::MultGrp>;
