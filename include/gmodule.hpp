// gmodule.hpp
#ifndef GMODULE_HPP_
#define GMODULE_HPP_

#include "fingroup.hpp"

#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace coho {
    struct Config {
        int verbose = 0;                // 1 prints the phases, 2 adds timings
        int assert_level = 0;           // >= 1 runs consistency checks, >= 2 also the cubic ones
        std::ostream *log = &std::clog;
    };

    void log(const Config &config, const int level, const std::string &msg);

    // Logs "<what>: 0.012s" when it goes out of scope and verbose >= 2
    class PhaseTimer {
    private:
        const Config &config_;
        const std::string what_;
        const clock_t start_;

    public:
        PhaseTimer(const Config &config, const std::string &what);
        ~PhaseTimer();
    };

    template<class X> class GModule;
    template<class X> class CoChain;
    template<class X> class H0;
    template<class X> class H1;
    template<class X> class H2;
    template<class X> class CohomologyGroup;

    template<class X>
    using GModulePtr = std::shared_ptr<const GModule<X>>;

    template<class X>
    struct ModuleSum {
        GModulePtr<X> module;
        std::vector<typename X::Hom> projections;
        std::vector<typename X::Hom> injections;
    };

    template<class X>
    struct Induced {
        GModulePtr<X> module;
        std::vector<fingroup::Elem> transversal;
        std::vector<typename X::Hom> projections;
        std::vector<typename X::Hom> injections;
        bool has_map = false;
        typename X::Hom map;            // D -> induced module, if induced with a map
    };

    // A module together with a map to or from it
    template<class X>
    struct ModuleMap {
        GModulePtr<X> module;
        typename X::Hom map;
    };

    // Module for the finite group G: one automorphism of M per generator, acting on the right.
    // Always handled through GModulePtr; the cohomology groups it hands out keep it alive.
    template<class X>
    class GModule : public std::enable_shared_from_this<GModule<X>> {
    public:
        typedef typename X::Ptr MPtr;
        typedef typename X::Elem MElem;
        typedef typename X::Hom MHom;
        typedef typename X::DirectProduct DirectProduct;

    private:
        fingroup::GroupPtr G_;
        MPtr M_;
        std::vector<MHom> ac_;
        Config config_;

        mutable std::vector<MHom> iac_;
        mutable std::shared_ptr<const fingroup::FpGroup> F_;

        mutable std::shared_ptr<const H0<X>> h_zero_;
        mutable std::shared_ptr<const H0<X>> h_zero_tate_;
        mutable std::shared_ptr<const H1<X>> h_one_;
        mutable std::shared_ptr<const H2<X>> h_two_[2];

        // Module for H acting through images in G
        GModulePtr<X> pullback(const fingroup::GroupPtr &H, const std::vector<fingroup::Elem> &images) const;

    public:
        GModule(const fingroup::GroupPtr &G, const MPtr &M, const std::vector<MHom> &ac, const Config &config = Config());

        GModule(const GModule&) = delete;
        GModule& operator=(const GModule&) = delete;

        static GModulePtr<X> create(const fingroup::GroupPtr &G, const MPtr &M, const std::vector<MHom> &ac,
                const Config &config = Config());
        static GModulePtr<X> trivial(const fingroup::GroupPtr &G, const MPtr &M, const Config &config = Config());

        // M^n with its projections and injections, also for n == 0
        static DirectProduct power(const MPtr &M, const size_t n);

        const fingroup::GroupPtr& group() const;
        const MPtr& module() const;
        const Config& config() const;
        const std::vector<MHom>& action() const;
        const std::vector<MHom>& inv_action() const;
        const fingroup::FpGroup& fp_group() const;

        MHom action(const fingroup::Elem &g) const;
        MElem action(const fingroup::Elem &g, const MElem &v) const;
        std::vector<MElem> action(const fingroup::Elem &g, const std::vector<MElem> &v) const;

        // Every relator of the group acts as the identity
        bool is_consistent() const;

        std::shared_ptr<const H0<X>> h_zero() const;
        std::shared_ptr<const H0<X>> h_zero_tate() const;
        std::shared_ptr<const H1<X>> h_one() const;
        std::shared_ptr<const H2<X>> h_two(const bool force_rws = false) const;
        std::shared_ptr<const CohomologyGroup<X>> cohomology_group(const int i, const bool tate = false) const;

        /*
         * Combinators
         */

        // All parts over the same group
        static ModuleSum<X> direct_product(const std::vector<GModulePtr<X>> &parts);
        // This module is over the source of emb
        Induced<X> induce(const fingroup::Hom &emb) const;
        // With mDC: D|_U -> this, U-linear; the result also carries the G-linear map D -> induced
        Induced<X> induce(const fingroup::Hom &emb, const GModule<X> &D, const MHom &mDC) const;
        // Restriction along emb: U -> G
        GModulePtr<X> restrict(const fingroup::Hom &emb) const;
        // Inflation along the surjection h: H -> G
        GModulePtr<X> inflate(const fingroup::Hom &h) const;
        // Quotient by the image of the G-linear mDC: D -> M
        ModuleMap<X> quo(const MHom &mDC) const;
        // Isomorphic module on a Smith form presentation, map S -> M
        ModuleMap<X> simplify() const;
        std::vector<MElem> orbit(const MElem &o) const;
        // Split off free regular summands, map M -> shrunk module
        ModuleMap<X> shrink() const;

        std::string to_string() const;
    };
};

#endif
