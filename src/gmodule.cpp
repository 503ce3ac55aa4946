#include "../include/gmodule.hpp"
#include "../include/abelian.hpp"
#include "../include/fpspace.hpp"
#include "../include/multgrp.hpp"
#include "../include/cohomology.hpp"

#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

/*
 * Logging
 */

void coho::log(const Config &config, const int level, const std::string &msg) {
    if (config.verbose < level || config.log == nullptr) return;
    *config.log << msg << std::endl;
}

coho::PhaseTimer::PhaseTimer(const Config &config, const std::string &what)
    : config_(config), what_(what), start_(clock()) {}

coho::PhaseTimer::~PhaseTimer() {
    if (config_.verbose < 2 || config_.log == nullptr) return;
    *config_.log << what_ << ": " << std::fixed << std::setprecision(3)
        << (double) (clock() - start_) / CLOCKS_PER_SEC << "s" << std::endl;
}

/*
 * GModule
 */

template<class X>
coho::GModule<X>::GModule(const fingroup::GroupPtr &G, const MPtr &M, const std::vector<MHom> &ac, const Config &config)
    : G_(G), M_(M), ac_(ac), config_(config) {
    if (ac_.size() != G_->ngens()) throw std::invalid_argument("Need one action per generator: got "
            + std::to_string(ac_.size()) + " for " + std::to_string(G_->ngens()));
    for (size_t i = 0; i < ac_.size(); i++) {
        if (*ac_[i].domain() != *M_ || *ac_[i].codomain() != *M_) {
            throw std::invalid_argument("Action of generator " + std::to_string(i + 1) + " is not an endomorphism of "
                    + M_->to_string());
        }
    }
    if (config_.assert_level >= 1 && !is_consistent()) {
        throw std::invalid_argument("Action does not define a module for the group");
    }
}

template<class X>
coho::GModulePtr<X> coho::GModule<X>::create(const fingroup::GroupPtr &G, const MPtr &M, const std::vector<MHom> &ac,
        const Config &config) {
    return std::make_shared<GModule<X>>(G, M, ac, config);
}

template<class X>
coho::GModulePtr<X> coho::GModule<X>::trivial(const fingroup::GroupPtr &G, const MPtr &M, const Config &config) {
    return create(G, M, std::vector<MHom>(G->ngens(), X::identity(M)), config);
}

template<class X>
typename coho::GModule<X>::DirectProduct coho::GModule<X>::power(const MPtr &M, const size_t n) {
    if (n == 0) {
        DirectProduct res;
        res.group = X::sub(M, std::vector<MElem>()).domain();
        return res;
    }
    return X::direct_product(std::vector<MPtr>(n, M));
}

template<class X>
const fingroup::GroupPtr& coho::GModule<X>::group() const { return G_; }

template<class X>
const typename coho::GModule<X>::MPtr& coho::GModule<X>::module() const { return M_; }

template<class X>
const coho::Config& coho::GModule<X>::config() const { return config_; }

template<class X>
const std::vector<typename coho::GModule<X>::MHom>& coho::GModule<X>::action() const { return ac_; }

template<class X>
const std::vector<typename coho::GModule<X>::MHom>& coho::GModule<X>::inv_action() const {
    if (iac_.size() != ac_.size()) {
        std::vector<MHom> iac;
        for (const MHom &a : ac_) iac.push_back(a.inv());
        iac_ = iac;
    }
    return iac_;
}

template<class X>
const fingroup::FpGroup& coho::GModule<X>::fp_group() const {
    if (F_ == nullptr) F_ = std::make_shared<fingroup::FpGroup>(G_->presentation());
    return *F_;
}

template<class X>
typename coho::GModule<X>::MHom coho::GModule<X>::action(const fingroup::Elem &g) const {
    if (g.parent() != G_.get()) throw std::invalid_argument("Element " + g.to_string() + " is not in the acting group");
    for (size_t i = 0; i < ac_.size(); i++) {
        if (G_->gen(i) == g) return ac_[i];
    }
    for (size_t i = 0; i < ac_.size(); i++) {
        if (G_->gen(i) == g.inv()) return inv_action()[i];
    }
    MHom h = X::identity(M_);
    for (const int l : G_->word(g)) h = h * ac_[l - 1];
    return h;
}

template<class X>
typename coho::GModule<X>::MElem coho::GModule<X>::action(const fingroup::Elem &g, const MElem &v) const {
    return action(g)(v);
}

template<class X>
std::vector<typename coho::GModule<X>::MElem> coho::GModule<X>::action(const fingroup::Elem &g,
        const std::vector<MElem> &v) const {
    const MHom h = action(g);
    std::vector<MElem> res;
    for (const MElem &x : v) res.push_back(h(x));
    return res;
}

template<class X>
bool coho::GModule<X>::is_consistent() const {
    for (const MHom &a : ac_) {
        if (!a.is_bijective()) return false;
    }
    const MHom id = X::identity(M_);
    for (const fingroup::Word &r : fp_group().relators) {
        MHom h = id;
        for (const int l : r) h = h * (l > 0 ? ac_[l - 1] : inv_action()[-l - 1]);
        if (h != id) {
            log(config_, 1, "Relator " + rewriting::to_string(r) + " acts nontrivially");
            return false;
        }
    }
    return true;
}

template<class X>
std::shared_ptr<const coho::H0<X>> coho::GModule<X>::h_zero() const {
    if (h_zero_ == nullptr) h_zero_ = std::make_shared<H0<X>>(*this, false);
    return std::shared_ptr<const H0<X>>(this->shared_from_this(), h_zero_.get());
}

template<class X>
std::shared_ptr<const coho::H0<X>> coho::GModule<X>::h_zero_tate() const {
    if (h_zero_tate_ == nullptr) h_zero_tate_ = std::make_shared<H0<X>>(*this, true);
    return std::shared_ptr<const H0<X>>(this->shared_from_this(), h_zero_tate_.get());
}

template<class X>
std::shared_ptr<const coho::H1<X>> coho::GModule<X>::h_one() const {
    if (h_one_ == nullptr) h_one_ = std::make_shared<H1<X>>(*this);
    return std::shared_ptr<const H1<X>>(this->shared_from_this(), h_one_.get());
}

template<class X>
std::shared_ptr<const coho::H2<X>> coho::GModule<X>::h_two(const bool force_rws) const {
    std::shared_ptr<const H2<X>> &slot = h_two_[force_rws ? 1 : 0];
    if (slot == nullptr) slot = std::make_shared<H2<X>>(*this, force_rws);
    // Shares ownership of the module, which owns the cached group
    return std::shared_ptr<const H2<X>>(this->shared_from_this(), slot.get());
}

template<class X>
std::shared_ptr<const coho::CohomologyGroup<X>> coho::GModule<X>::cohomology_group(const int i, const bool tate) const {
    if (tate) {
        if (i != 0) throw std::invalid_argument("Tate cohomology is only available in degree 0");
        return h_zero_tate();
    }
    switch (i) {
        case 0: return h_zero();
        case 1: return h_one();
        case 2: return h_two();
        default: throw std::invalid_argument("Cohomology in degree " + std::to_string(i) + " is not supported");
    }
}

/*
 * Combinators
 */

template<class X>
coho::ModuleSum<X> coho::GModule<X>::direct_product(const std::vector<GModulePtr<X>> &parts) {
    if (parts.empty()) throw std::invalid_argument("Direct product of no modules");
    const fingroup::GroupPtr &G = parts[0]->group();
    std::vector<MPtr> Ms;
    for (const GModulePtr<X> &C : parts) {
        if (C->group().get() != G.get()) throw std::invalid_argument("Direct product of modules over different groups");
        Ms.push_back(C->module());
    }
    const DirectProduct D = X::direct_product(Ms);

    std::vector<MHom> ac;
    for (size_t i = 0; i < G->ngens(); i++) {
        MHom a = X::zero_hom(D.group, D.group);
        for (size_t k = 0; k < parts.size(); k++) {
            a = a + D.projections[k] * parts[k]->action()[i] * D.injections[k];
        }
        ac.push_back(a);
    }
    return ModuleSum<X>{create(G, D.group, ac, parts[0]->config()), D.projections, D.injections};
}

template<class X>
coho::Induced<X> coho::GModule<X>::induce(const fingroup::Hom &emb) const {
    if (emb.source().get() != G_.get()) throw std::invalid_argument("Module is not over the source of the embedding");
    if (!emb.is_injective()) throw std::invalid_argument("Induction needs an injective map of groups");
    const fingroup::GroupPtr &G = emb.target();
    const fingroup::Transversal T = fingroup::Group::right_transversal(emb);
    const size_t k = T.reps.size();
    const DirectProduct D = power(M_, k);

    // g_i s = u g_j with u in U sends the i-th summand to the j-th one
    std::vector<MHom> ac;
    for (const fingroup::Elem &s : G->gens()) {
        MHom a = X::zero_hom(D.group, D.group);
        for (size_t i = 0; i < k; i++) {
            const fingroup::Elem gs = T.reps[i] * s;
            const size_t j = T.index(gs);
            const fingroup::Elem u = gs * T.reps[j].inv();
            a = a + D.projections[i] * action(emb.preimage(u)) * D.injections[j];
        }
        ac.push_back(a);
    }

    log(config_, 1, "Induced module of rank " + std::to_string(k) + " over " + M_->to_string());
    Induced<X> res;
    res.module = create(G, D.group, ac, config_);
    res.transversal = T.reps;
    res.projections = D.projections;
    res.injections = D.injections;
    return res;
}

template<class X>
coho::Induced<X> coho::GModule<X>::induce(const fingroup::Hom &emb, const GModule<X> &D, const MHom &mDC) const {
    if (D.group().get() != emb.target().get()) throw std::invalid_argument("Module D is not over the target of the embedding");
    if (*mDC.domain() != *D.module() || *mDC.codomain() != *M_) throw std::invalid_argument("Map does not go from D to the module");

    Induced<X> res = induce(emb);
    MHom m = X::zero_hom(D.module(), res.module->module());
    for (size_t i = 0; i < res.transversal.size(); i++) {
        m = m + D.action(res.transversal[i].inv()) * mDC * res.injections[i];
    }
    res.has_map = true;
    res.map = m;
    return res;
}

template<class X>
coho::GModulePtr<X> coho::GModule<X>::pullback(const fingroup::GroupPtr &H, const std::vector<fingroup::Elem> &images) const {
    std::vector<MHom> ac;
    for (const fingroup::Elem &g : images) ac.push_back(action(g));
    return create(H, M_, ac, config_);
}

template<class X>
coho::GModulePtr<X> coho::GModule<X>::restrict(const fingroup::Hom &emb) const {
    if (emb.target().get() != G_.get()) throw std::invalid_argument("Restriction along a map into another group");
    return pullback(emb.source(), emb.images());
}

template<class X>
coho::GModulePtr<X> coho::GModule<X>::inflate(const fingroup::Hom &h) const {
    if (h.target().get() != G_.get()) throw std::invalid_argument("Inflation along a map into another group");
    return pullback(h.source(), h.images());
}

template<class X>
coho::ModuleMap<X> coho::GModule<X>::quo(const MHom &mDC) const {
    if (*mDC.codomain() != *M_) throw std::invalid_argument("Submodule map does not end in the module");
    const MHom q = X::quo(mDC);
    const MPtr &Q = q.codomain();

    // Act on Q through preimages of its generators
    std::vector<MElem> section;
    for (size_t j = 0; j < Q->ngens(); j++) section.push_back(q.preimage(Q->gen(j)));
    std::vector<MHom> ac;
    for (const MHom &a : ac_) {
        std::vector<MElem> images;
        for (const MElem &y : section) images.push_back(q(a(y)));
        ac.push_back(X::hom(Q, Q, images, config_.assert_level >= 1));
    }
    return ModuleMap<X>{create(G_, Q, ac, config_), q};
}

template<class X>
coho::ModuleMap<X> coho::GModule<X>::simplify() const {
    const MHom iso = X::snf(M_);
    const MHom inv = iso.inv();
    std::vector<MHom> ac;
    for (const MHom &a : ac_) ac.push_back(iso * a * inv);
    return ModuleMap<X>{create(G_, iso.domain(), ac, config_), iso};
}

template<class X>
std::vector<typename coho::GModule<X>::MElem> coho::GModule<X>::orbit(const MElem &o) const {
    std::vector<MElem> res{o};
    std::set<MElem> seen{o};
    for (size_t k = 0; k < res.size(); k++) {
        for (const MHom &a : ac_) {
            MElem x = a(res[k]);
            if (seen.insert(x).second) res.push_back(x);
        }
    }
    return res;
}

template<class X>
coho::ModuleMap<X> coho::GModule<X>::shrink() const {
    GModulePtr<X> cur = create(G_, M_, ac_, config_);
    MHom mq = X::identity(M_);

    bool progress = true;
    while (progress) {
        progress = false;
        const MPtr &N = cur->module();
        for (size_t i = 0; i < N->ngens(); i++) {
            const std::vector<MElem> o = cur->orbit(N->gen(i));
            if (o.size() != G_->order()) continue;
            const MHom s = X::sub(N, o);
            if (s.domain()->rank() != o.size()) continue;

            // The orbit spans a free summand Z[G], which has trivial cohomology
            const ModuleMap<X> r = cur->quo(s);
            const ModuleMap<X> t = r.module->simplify();
            mq = mq * r.map * t.map.inv();
            log(config_, 1, "Split off a regular summand, " + t.module->module()->to_string() + " remains");
            cur = t.module;
            progress = true;
            break;
        }
    }
    return ModuleMap<X>{cur, mq};
}

template<class X>
std::string coho::GModule<X>::to_string() const {
    return "G-module " + M_->to_string() + " for a group of order " + std::to_string(G_->order());
}

template class coho::GModule<abelian::AbGroup>;
template class coho::GModule<fpspace::FpSpace>;
template class coho::GModule<multgrp::MultGrp>;
