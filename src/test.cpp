#include "../include/abelian.hpp"
#include "../include/cochain.hpp"
#include "../include/cohomology.hpp"
#include "../include/extension.hpp"
#include "../include/fingroup.hpp"
#include "../include/fpspace.hpp"
#include "../include/gmodule.hpp"
#include "../include/input.hpp"
#include "../include/matrix.hpp"
#include "../include/multgrp.hpp"
#include "../include/rewriting.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <iomanip>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <gmpxx.h>

typedef abelian::AbGroup Ab;
typedef fpspace::FpSpace Fp;
typedef multgrp::MultGrp Mult;

template<class X>
std::string coh(const coho::GModulePtr<X> &C, const int i) {
    return C->cohomology_group(i)->to_string();
}

coho::Config checked() {
    coho::Config config;
    config.assert_level = 2;
    config.log = nullptr;
    return config;
}

// Z with the generators of G acting by the given signs
coho::GModulePtr<Ab> sign_module(const fingroup::GroupPtr &G, const std::vector<int> &signs,
        const coho::Config &config = checked()) {
    const abelian::AbGroupPtr Z = Ab::create(std::vector<mpz_class>{0});
    std::vector<abelian::AbHom> ac;
    for (const int s : signs) ac.push_back(Ab::hom(Z, Z, matrix::ZMatrix({{s}}, 1)));
    return coho::GModule<Ab>::create(G, Z, ac, config);
}

template<class X>
typename X::Elem random_nonzero(const typename X::Ptr &M, std::mt19937 &gen) {
    std::uniform_int_distribution<int> coeff(-3, 3);
    while (true) {
        std::vector<mpz_class> v;
        for (size_t j = 0; j < M->ngens(); j++) v.push_back(coeff(gen));
        const typename X::Elem x = M->elem(v);
        if (!x.is_zero()) return x;
    }
}

// Checks every generator of H^2 against both rewriting systems, a random coboundary, and for
// finite M the multiplication of both extension groups on all pairs
template<class X>
void check_h_two(const coho::GModulePtr<X> &C, const std::string &expected, std::mt19937 &gen) {
    const fingroup::GroupPtr &G = C->group();
    const typename X::Ptr &M = C->module();
    const std::shared_ptr<const coho::H2<X>> H = C->h_two();
    const std::shared_ptr<const coho::H2<X>> R = C->h_two(true);
    assert(H->to_string() == expected);
    assert(R->to_string() == expected);

    // d of a 1-cochain given on every element
    std::map<typename coho::CoChain<X>::Key, typename X::Elem> values;
    for (const fingroup::Elem &g : G->elements()) {
        values[typename coho::CoChain<X>::Key{g}] = random_nonzero<X>(M, gen);
    }
    const coho::CoChain<X> b = coho::CoChain<X>(C, 1, values).coboundary();
    const std::pair<bool, coho::CoChain<X>> w = H->is_coboundary(b);
    assert(w.first);
    assert(w.second.coboundary() == b);
    assert(H->from_cochain(b).is_zero());
    assert(R->from_cochain(b).is_zero());

    const typename X::Hom iso = X::snf(H->group());
    for (size_t i = 0; i < iso.domain()->ngens(); i++) {
        const typename X::Elem x = iso.image(i);
        const coho::CoChain<X> c = H->to_cochain(x);
        assert(c.is_cocycle());
        assert(H->from_cochain(c) == x);
        assert(!H->is_coboundary(c).first);
        assert(!R->from_cochain(c).is_zero());
        assert(H->from_cochain(R->to_cochain(R->from_cochain(c))) == x);

        if (!M->is_finite()) continue;
        // Moved by b, so that s(1, 1) = b(1, 1) is not zero
        std::map<typename coho::CoChain<X>::Key, typename X::Elem> shifted;
        for (const fingroup::Elem &g : G->elements()) {
            for (const fingroup::Elem &h : G->elements()) {
                shifted[typename coho::CoChain<X>::Key{g, h}] = c(g, h) + b(g, h);
            }
        }
        const coho::CoChain<X> s(C, 2, shifted);
        assert(s.is_cocycle());
        assert(!s(G->one(), G->one()).is_zero());
        assert(H->from_cochain(s) == x);

        const coho::Extension<X> E(s);
        assert(mpz_class((unsigned long) E.group()->order()) == M->order() * (unsigned long) G->order());
        std::shared_ptr<const coho::PcExtension<X>> P;
        if (G->has_pc()) P = std::make_shared<const coho::PcExtension<X>>(s);

        // (g, m) (h, n) = (g h, m^h + n + s(g, h))
        for (const fingroup::Elem &g : G->elements()) {
            for (const fingroup::Elem &h : G->elements()) {
                const typename X::Elem m = random_nonzero<X>(M, gen);
                const typename X::Elem n = random_nonzero<X>(M, gen);
                const typename X::Elem v = C->action(h, m) + n + s(g, h);
                assert(E.element(g, m) * E.element(h, n) == E.element(g * h, v));
                if (P != nullptr) assert(P->element(g, m) * P->element(h, n) == P->element(g * h, v));
            }
        }
    }
}

void test_matrix() {
    clock_t tStart = clock();

    const matrix::ZMatrix M({{2, 4}, {6, 8}}, 2);
    const std::vector<mpz_class> d = matrix::smith(M);
    assert(d.size() == 2);
    assert(d[0] == 2 && d[1] == 4);

    matrix::ZMatrix H(M);
    matrix::ZMatrix U;
    assert(matrix::hnf(H, &U) == 2);
    assert(U * M == H);

    // x * [[1, 2], [2, 4]] == 0 along (2, -1)
    const matrix::ZMatrix K = matrix::left_kernel(matrix::ZMatrix({{1, 2}, {2, 4}}, 2));
    assert(K.rows() == 1);
    assert(K(0, 0) * 1 + K(0, 1) * 2 == 0);

    std::vector<mpz_class> x;
    assert(matrix::solve_left(M, std::vector<mpz_class>{8, 12}, x));
    assert(M.left_mul(x) == (std::vector<mpz_class>{8, 12}));
    assert(!matrix::solve_left(M, std::vector<mpz_class>{1, 0}, x));

    std::cout << "matrix: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_abelian() {
    clock_t tStart = clock();

    const abelian::AbGroupPtr A = Ab::create(std::vector<mpz_class>{2, 0, 3});
    assert(A->to_string() == "Z/6 + Z");
    assert(!A->is_finite());
    assert(A->rank() == 1);

    // Z^2 / <(2, 2)> is Z/2 + Z
    const abelian::AbGroupPtr B = Ab::create(2, matrix::ZMatrix({{2, 2}}, 2));
    assert(B->to_string() == "Z/2 + Z");
    assert(B->gen(0) * 2 == B->gen(1) * -2);

    const abelian::AbHom iso = Ab::snf(B);
    assert(iso.is_bijective());
    assert(iso.domain()->to_string() == "Z/2 + Z");

    // Multiplication by 2 on Z/4 has kernel and image Z/2
    const abelian::AbGroupPtr C4 = Ab::create(std::vector<mpz_class>{4});
    const abelian::AbHom two = Ab::hom(C4, C4, matrix::ZMatrix({{2}}, 1));
    assert(two.kernel().domain()->to_string() == "Z/2");
    assert(two.image().domain()->to_string() == "Z/2");
    assert(Ab::quo(two).codomain()->to_string() == "Z/2");

    abelian::AbElem y;
    assert(!two.has_preimage(C4->gen(0), y));
    assert(two.has_preimage(C4->gen(0) * 2, y));
    assert(two(y) == C4->gen(0) * 2);

    const fpspace::FpSpacePtr V = Fp::create(3, 2);
    assert(V->to_string() == "F_3^2");
    const fpspace::FpHom p = Fp::hom(V, V, matrix::ZMatrix({{1, 1}, {2, 2}}, 2));
    assert(p.rank() == 1);
    assert(p.kernel().domain()->to_string() == "F_3");
    assert(Fp::quo(p).codomain()->to_string() == "F_3");

    std::cout << "abelian: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_rewriting() {
    clock_t tStart = clock();

    // Free cancellation
    const rewriting::System free_rws(std::vector<rewriting::Rule>{
            {rewriting::Word{1, -1}, rewriting::Word{}},
            {rewriting::Word{-1, 1}, rewriting::Word{}}
        });
    assert(free_rws.reduce(rewriting::Word{1, -1, 1, -1, 1}) == rewriting::Word{1});
    assert(free_rws.is_confluent());
    assert(!free_rws.has_tail(0));

    // a^3 -> 1 with a^-1 -> a a
    const rewriting::System c3(std::vector<rewriting::Rule>{
            {rewriting::Word{1, 1, 1}, rewriting::Word{}},
            {rewriting::Word{-1}, rewriting::Word{1, 1}}
        });
    assert(c3.reduce(rewriting::Word{1, 1, 1, 1}) == rewriting::Word{1});
    assert(c3.reduce(rewriting::Word{-1, -1}) == rewriting::Word{1});
    assert(c3.is_confluent());
    assert(c3.has_tail(0));
    assert(!c3.has_tail(1));

    // The visitor sees every substitution
    int steps = 0;
    c3.reduce(rewriting::Word{1, 1, 1, 1, 1, 1}, [&steps](const rewriting::Word&, const size_t rule, const size_t) {
        assert(rule == 0);
        steps++;
    });
    assert(steps == 2);

    // a b -> 1 and b a -> b disagree on a b a
    const rewriting::System bad(std::vector<rewriting::Rule>{
            {rewriting::Word{1, 2}, rewriting::Word{}},
            {rewriting::Word{2, 1}, rewriting::Word{2}}
        });
    assert(!bad.is_confluent());

    assert(rewriting::inverse(rewriting::Word{1, -2, 3}) == (rewriting::Word{-3, 2, -1}));
    assert(rewriting::to_string(rewriting::Word{1, -2}) == "[1, -2]");

    std::cout << "rewriting: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_group() {
    clock_t tStart = clock();

    const fingroup::GroupPtr S3 = fingroup::Group::symmetric(3);
    assert(S3->order() == 6);
    assert(S3->ngens() == 2);
    assert(!S3->has_pc());
    for (const fingroup::Elem &g : S3->elements()) {
        assert(S3->evaluate(S3->word(g)) == g);
        assert(g * g.inv() == S3->one());
    }
    assert(S3->rws().is_confluent());

    const fingroup::GroupPtr D4 = fingroup::Group::dihedral(4);
    assert(D4->order() == 8);
    assert(D4->has_pc());
    assert(D4->element_order(D4->gen(0)) == 4);
    assert(D4->element_order(D4->gen(1)) == 2);
    const fingroup::PcData &pc = D4->pc();
    assert(pc.presentation.rel_orders == (std::vector<int>{2, 2, 2}));
    for (const fingroup::Elem &g : D4->elements()) assert(D4->pc_evaluate(pc.words[g.index()]) == g);

    const fingroup::GroupPtr C6 = fingroup::Group::cyclic(6);
    assert(C6->pc().presentation.ngens() == 2);

    // Klein four group from its pc presentation
    fingroup::PcPresentation klein;
    klein.rel_orders = {2, 2};
    klein.powers = {fingroup::Word{}, fingroup::Word{}};
    const fingroup::GroupPtr V4 = fingroup::Group::from_pc(klein);
    assert(V4->order() == 4);
    for (const fingroup::Elem &g : V4->elements()) assert((g * g).is_one());

    // C4 with g_1^2 = g_2 and g_2^2 = 1
    fingroup::PcPresentation c4;
    c4.rel_orders = {2, 2};
    c4.powers = {fingroup::Word{2}, fingroup::Word{}};
    const fingroup::GroupPtr C4 = fingroup::Group::from_pc(c4);
    assert(C4->order() == 4);
    assert(C4->element_order(C4->gen(0)) == 4);

    // C6 -> C2 has kernel C3
    const fingroup::GroupPtr C2 = fingroup::Group::cyclic(2);
    const fingroup::Hom h(C6, C2, std::vector<fingroup::Elem>{C2->gen(0)});
    assert(h.kernel().size() == 3);
    assert(h.is_surjective());
    assert(!h.is_injective());
    assert(h(h.preimage(C2->gen(0))) == C2->gen(0));

    bool threw = false;
    try {
        const fingroup::Hom two_images(C6, C2, std::vector<fingroup::Elem>{C2->one(), C2->one()});
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);

    const fingroup::Subgroup U = fingroup::Group::subgroup(S3, std::vector<fingroup::Elem>{S3->gen(0)});
    assert(U.group->order() == 2);
    assert(U.embedding.is_injective());
    const fingroup::Transversal T = fingroup::Group::right_transversal(U.embedding);
    assert(T.reps.size() == 3);
    std::set<size_t> cosets;
    for (const fingroup::Elem &g : S3->elements()) cosets.insert(T.index(g));
    assert(cosets.size() == 3);

    std::cout << "group: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_gmodule() {
    clock_t tStart = clock();

    const fingroup::GroupPtr C2 = fingroup::Group::cyclic(2);
    const coho::GModulePtr<Ab> sign = sign_module(C2, {-1});
    assert(sign->is_consistent());
    const abelian::AbElem one = sign->module()->gen(0);
    assert(sign->action(C2->gen(0), one) == -one);
    assert(sign->action(C2->one(), one) == one);

    // Doubling is not an automorphism
    const abelian::AbGroupPtr Z = sign->module();
    const coho::GModulePtr<Ab> bad = coho::GModule<Ab>::create(C2, Z,
            std::vector<abelian::AbHom>{Ab::hom(Z, Z, matrix::ZMatrix({{2}}, 1))});
    assert(!bad->is_consistent());

    bool threw = false;
    try {
        coho::GModule<Ab>::create(C2, Z, std::vector<abelian::AbHom>{Ab::hom(Z, Z, matrix::ZMatrix({{2}}, 1))}, checked());
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);

    // C4 rotating Z^2, g^2 acts as -1
    const fingroup::GroupPtr C4 = fingroup::Group::cyclic(4);
    const abelian::AbGroupPtr Z2 = Ab::create(std::vector<mpz_class>{0, 0});
    const coho::GModulePtr<Ab> rot = coho::GModule<Ab>::create(C4, Z2,
            std::vector<abelian::AbHom>{Ab::hom(Z2, Z2, matrix::ZMatrix({{0, 1}, {-1, 0}}, 2))}, checked());
    assert(rot->action(C4->elem(2)) == -Ab::identity(Z2));
    assert(rot->action(C4->elem(3)) == rot->inv_action()[0]);
    const std::vector<abelian::AbElem> v = rot->action(C4->elem(2), std::vector<abelian::AbElem>{Z2->gen(0), Z2->gen(1)});
    assert(v[0] == -Z2->gen(0) && v[1] == -Z2->gen(1));

    // The 3-cycle does not fix the transposition relators
    const fingroup::GroupPtr S3 = fingroup::Group::symmetric(3);
    const coho::GModulePtr<Ab> wrong = sign_module(S3, {1, -1}, coho::Config());
    assert(!wrong->is_consistent());
    assert(sign_module(S3, {-1, 1})->is_consistent());

    std::cout << "gmodule: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_cochain() {
    clock_t tStart = clock();

    const fingroup::GroupPtr C2 = fingroup::Group::cyclic(2);
    const coho::GModulePtr<Ab> sign = sign_module(C2, {-1});
    const abelian::AbGroupPtr &Z = sign->module();
    const fingroup::Elem g = C2->gen(0);

    // Any value on the generator is a crossed homomorphism for the sign action
    std::map<coho::CoChain<Ab>::Key, abelian::AbElem> values;
    values[coho::CoChain<Ab>::Key{g}] = Z->gen(0) * 5;
    const coho::CoChain<Ab> X(sign, 1, values);
    assert(X(C2->one()).is_zero());
    assert(X.is_cocycle());

    std::map<coho::CoChain<Ab>::Key, abelian::AbElem> m;
    m[coho::CoChain<Ab>::Key()] = Z->gen(0);
    const coho::CoChain<Ab> c0(sign, 0, m);
    assert(!c0.is_cocycle());
    const coho::CoChain<Ab> d0 = c0.coboundary();
    assert(d0(g) == Z->gen(0) * -2);
    assert(d0.is_cocycle());

    const coho::CoChain<Ab> d1 = X.coboundary();
    assert(d1.degree() == 2);
    assert(d1.is_cocycle());
    for (const fingroup::Elem &a : C2->elements()) {
        for (const fingroup::Elem &b : C2->elements()) assert(d1(a, b).is_zero());
    }

    // Trivial action on Z for C3: x(g^a) = a is not a homomorphism, its coboundary is not zero
    const fingroup::GroupPtr C3 = fingroup::Group::cyclic(3);
    const coho::GModulePtr<Ab> triv = coho::GModule<Ab>::trivial(C3, Z, checked());
    std::map<coho::CoChain<Ab>::Key, abelian::AbElem> w;
    w[coho::CoChain<Ab>::Key{C3->gen(0)}] = Z->gen(0);
    const coho::CoChain<Ab> Y(triv, 1, w);
    assert(Y(C3->elem(2)) == Z->gen(0) * 2);
    const coho::CoChain<Ab> dY = Y.coboundary();
    assert(dY(C3->gen(0), C3->elem(2)) == Z->gen(0) * 3);
    assert(dY.is_cocycle());

    bool threw = false;
    try {
        const coho::CoChain<Ab> c3(triv, 3);
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        dY(C2->gen(0), C2->gen(0));
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);

    std::cout << "cochain: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_cohomology() {
    clock_t tStart = clock();

    const abelian::AbGroupPtr Z = Ab::create(std::vector<mpz_class>{0});

    // C2 acting trivially on Z
    const fingroup::GroupPtr C2 = fingroup::Group::cyclic(2);
    const coho::GModulePtr<Ab> triv2 = coho::GModule<Ab>::trivial(C2, Z, checked());
    assert(coh(triv2, 0) == "Z");
    assert(coh(triv2, 1) == "0");
    assert(coh(triv2, 2) == "Z/2");
    assert(triv2->cohomology_group(0, true)->to_string() == "Z/2");

    // Sign action
    const coho::GModulePtr<Ab> sign = sign_module(C2, {-1});
    assert(coh(sign, 0) == "0");
    assert(coh(sign, 1) == "Z/2");
    assert(coh(sign, 2) == "0");
    assert(sign->h_zero_tate()->to_string() == "0");

    // The trivial group sees only M
    const abelian::AbGroupPtr A = Ab::create(std::vector<mpz_class>{2, 0});
    const coho::GModulePtr<Ab> one = coho::GModule<Ab>::trivial(fingroup::Group::trivial(), A, checked());
    assert(coh(one, 0) == "Z/2 + Z");
    assert(coh(one, 1) == "0");
    assert(coh(one, 2) == "0");

    // H^2(G, Z) is the dual of the abelianization
    const fingroup::GroupPtr C3 = fingroup::Group::cyclic(3);
    const coho::GModulePtr<Ab> triv3 = coho::GModule<Ab>::trivial(C3, Z, checked());
    assert(coh(triv3, 2) == "Z/3");

    const coho::GModulePtr<Ab> s3 = coho::GModule<Ab>::trivial(fingroup::Group::symmetric(3), Z, checked());
    assert(coh(s3, 0) == "Z");
    assert(coh(s3, 1) == "0");
    assert(coh(s3, 2) == "Z/2");
    assert(s3->h_zero_tate()->to_string() == "Z/6");
    assert(!s3->h_two()->uses_pc());

    const coho::GModulePtr<Ab> d3 = coho::GModule<Ab>::trivial(fingroup::Group::dihedral(3), Z, checked());
    assert(d3->h_two()->uses_pc());
    assert(d3->h_two()->to_string() == "Z/2");
    assert(!d3->h_two(true)->uses_pc());
    assert(d3->h_two(true)->to_string() == "Z/2");

    const coho::GModulePtr<Ab> d4 = coho::GModule<Ab>::trivial(fingroup::Group::dihedral(4), Z, checked());
    assert(coh(d4, 2) == "Z/2 + Z/2");
    assert(d4->h_two(true)->to_string() == "Z/2 + Z/2");

    fingroup::PcPresentation klein;
    klein.rel_orders = {2, 2};
    klein.powers = {fingroup::Word{}, fingroup::Word{}};
    const coho::GModulePtr<Ab> v4 = coho::GModule<Ab>::trivial(fingroup::Group::from_pc(klein), Z, checked());
    assert(coh(v4, 1) == "0");
    assert(coh(v4, 2) == "Z/2 + Z/2");

    // Cocycles of H^2(C3, Z) and back
    const std::shared_ptr<const coho::H2<Ab>> H = triv3->h_two();
    const abelian::AbHom iso = Ab::snf(H->group());
    const abelian::AbElem x = iso.image(0);
    const coho::CoChain<Ab> c = H->to_cochain(x);
    assert(c.is_cocycle());
    assert(H->from_cochain(c) == x);
    assert(H->from_cochain(H->tail_to_cochain(H->tail_from_cochain(c))) == x);
    assert(!H->is_coboundary(c).first);

    // A coboundary is trivial in H^2 and its witness bounds it
    std::map<coho::CoChain<Ab>::Key, abelian::AbElem> w;
    w[coho::CoChain<Ab>::Key{C3->gen(0)}] = Z->gen(0);
    const coho::CoChain<Ab> b = coho::CoChain<Ab>(triv3, 1, w).coboundary();
    const std::pair<bool, coho::CoChain<Ab>> cb = H->is_coboundary(b);
    assert(cb.first);
    assert(cb.second.coboundary() == b);
    assert(H->from_cochain(b).is_zero());

    // H^1 of the sign action is generated by X(g) = 1
    const std::shared_ptr<const coho::H1<Ab>> H1 = sign->h_one();
    const abelian::AbElem y = Ab::snf(H1->group()).image(0);
    const coho::CoChain<Ab> X = H1->to_cochain(y);
    assert(X.is_cocycle());
    assert(H1->from_cochain(X) == y);

    // H^0 elements are fixed
    const std::shared_ptr<const coho::H0<Ab>> H0 = triv2->h_zero();
    const coho::CoChain<Ab> m = H0->to_cochain(H0->group()->gen(0));
    assert(triv2->action(C2->gen(0), m()) == m());

    bool threw = false;
    try {
        triv2->cohomology_group(3);
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);

    // Results keep their module alive
    const std::shared_ptr<const coho::H2<Ab>> kept = coho::GModule<Ab>::trivial(C2, Z, checked())->h_two();
    const abelian::AbElem k = Ab::snf(kept->group()).image(0);
    const coho::CoChain<Ab> kc = kept->to_cochain(k);
    assert(kc.is_cocycle());
    assert(kept->from_cochain(kc) == k);

    const coho::CoChain<Ab> lone = [&C2]() {
        const std::shared_ptr<const coho::H1<Ab>> S = sign_module(C2, {-1})->h_one();
        return S->to_cochain(Ab::snf(S->group()).image(0));
    }();
    assert(lone.is_cocycle());
    assert(!lone.gmodule().h_one()->from_cochain(lone).is_zero());

    // Nontrivial actions
    std::mt19937 gen(20231);

    // D3 with s acting by -1 on Z
    check_h_two<Ab>(sign_module(fingroup::Group::dihedral(3), {1, -1}), "Z/3", gen);

    // D4 with s acting by -1 on Z/4
    const fingroup::GroupPtr D4 = fingroup::Group::dihedral(4);
    const abelian::AbGroupPtr Z4 = Ab::create(std::vector<mpz_class>{4});
    const coho::GModulePtr<Ab> d4s = coho::GModule<Ab>::create(D4, Z4, std::vector<abelian::AbHom>{
            Ab::identity(Z4), Ab::hom(Z4, Z4, matrix::ZMatrix({{-1}}, 1))}, checked());
    assert(coh(d4s, 0) == "Z/2");
    check_h_two<Ab>(d4s, "Z/2 + Z/2 + Z/4", gen);

    // Vector spaces
    const fpspace::FpSpacePtr F2 = Fp::create(2, 1);
    const coho::GModulePtr<Fp> f2 = coho::GModule<Fp>::trivial(C2, F2, checked());
    assert(coh(f2, 0) == "F_2");
    assert(coh(f2, 1) == "F_2");
    assert(coh(f2, 2) == "F_2");
    assert(f2->h_zero_tate()->to_string() == "F_2");

    // Coprime orders kill everything
    const fpspace::FpSpacePtr V = Fp::create(2, 2);
    std::vector<fpspace::FpHom> ac{Fp::hom(V, V, matrix::ZMatrix({{0, 1}, {1, 1}}, 2))};
    const coho::GModulePtr<Fp> f3 = coho::GModule<Fp>::create(C3, V, ac, checked());
    assert(coh(f3, 0) == "0");
    assert(coh(f3, 1) == "0");
    assert(coh(f3, 2) == "0");

    std::cout << "cohomology: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

// Element orders of a group of order 4 tell C4 from the Klein group
bool is_cyclic4(const fingroup::GroupPtr &Q) {
    assert(Q->order() == 4);
    for (const fingroup::Elem &q : Q->elements()) {
        if (Q->element_order(q) == 4) return true;
    }
    return false;
}

void test_extension() {
    clock_t tStart = clock();

    const fingroup::GroupPtr C2 = fingroup::Group::cyclic(2);
    const abelian::AbGroupPtr Z2 = Ab::create(std::vector<mpz_class>{2});
    const coho::GModulePtr<Ab> C = coho::GModule<Ab>::trivial(C2, Z2, checked());
    const std::shared_ptr<const coho::H2<Ab>> H = C->h_two();
    assert(H->to_string() == "Z/2");

    const abelian::AbElem x = Ab::snf(H->group()).image(0);
    const coho::CoChain<Ab> c = H->to_cochain(x);
    const coho::CoChain<Ab> zero = H->to_cochain(H->group()->zero());

    // The nontrivial class gives C4, the split one the Klein group
    const coho::PcExtension<Ab> E(c);
    assert(is_cyclic4(E.group()));
    assert(!is_cyclic4(coho::PcExtension<Ab>(zero).group()));

    const coho::Extension<Ab> F(c);
    assert(F.has_group());
    assert(is_cyclic4(F.group()));
    assert(F.presentation().ngens == 2);
    assert(!is_cyclic4(coho::Extension<Ab>(zero).group()));

    // Projection onto G with kernel the image of M
    assert(E.projection().is_surjective());
    assert(E.projection().kernel().size() == 2);
    for (const fingroup::Elem &g : C2->elements()) {
        for (const abelian::AbElem &m : std::vector<abelian::AbElem>{Z2->zero(), Z2->gen(0)}) {
            const fingroup::Elem q = E.element(g, m);
            assert(E.projection()(q) == g);
            assert(E.split(q) == std::make_pair(g, m));

            const fingroup::Elem r = F.element(g, m);
            assert(F.projection()(r) == g);
            assert(F.split(r) == std::make_pair(g, m));
        }
    }
    assert(E.projection()(E.inject(Z2->gen(0))).is_one());
    assert(!E.inject(Z2->gen(0)).is_one());

    // Multiplication follows (g, m) (h, n) = (g h, m^h + n + c(g, h))
    const coho::ExtensionLaw<Ab> law(c);
    const fingroup::Elem g = C2->gen(0);
    const coho::ExtensionLaw<Ab>::Pair p = law.mul(coho::ExtensionLaw<Ab>::Pair(g, Z2->zero()),
            coho::ExtensionLaw<Ab>::Pair(g, Z2->zero()));
    assert(p.first.is_one());
    assert(p.second == c(g, g));
    assert(law.mul(p, law.inv(p)) == law.one());
    assert(E.element(g, Z2->zero()) * E.element(g, Z2->zero()) == E.element(C2->one(), c(g, g)));

    // Z has no finite extension group, only a presentation
    const abelian::AbGroupPtr Z = Ab::create(std::vector<mpz_class>{0});
    const coho::GModulePtr<Ab> T = coho::GModule<Ab>::trivial(C2, Z, checked());
    const std::shared_ptr<const coho::H2<Ab>> HZ = T->h_two();
    const coho::Extension<Ab> G(HZ->to_cochain(Ab::snf(HZ->group()).image(0)));
    assert(!G.has_group());
    assert(G.presentation().ngens == 2);

    bool threw = false;
    try {
        G.group();
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);

    // S4 has no pc presentation, its extensions by Z/2 are enumerated from the pairs
    std::mt19937 gen(7);
    const coho::GModulePtr<Ab> s4 = coho::GModule<Ab>::trivial(fingroup::Group::symmetric(4), Z2, checked());
    assert(!s4->group()->has_pc());
    check_h_two<Ab>(s4, "Z/2 + Z/2", gen);

    // C2 by F_2 over vector spaces
    const fpspace::FpSpacePtr F2 = Fp::create(2, 1);
    const coho::GModulePtr<Fp> D = coho::GModule<Fp>::trivial(C2, F2, checked());
    const std::shared_ptr<const coho::H2<Fp>> HF = D->h_two();
    const coho::PcExtension<Fp> EF(HF->to_cochain(F2->gen(0)));
    assert(is_cyclic4(EF.group()));

    std::cout << "extension: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_multgrp() {
    clock_t tStart = clock();

    const multgrp::MultGrpPtr U = Mult::units(7);
    assert(U->to_string() == "F_7^*");
    assert(U->order() == 6);
    assert(U->root() == 3);
    assert(U->gen(0).value() == 3);
    assert(U->residue(1).is_zero());
    assert(U->residue(2) + U->residue(4) == U->zero());
    assert((U->residue(3) * 2).value() == 2);
    assert((-U->residue(3)).value() == 5);
    assert(U->residue(-1).value() == 6);

    bool threw = false;
    try {
        U->residue(14);
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);

    // Squaring has kernel {1, 6} and image the squares
    const multgrp::MultHom sq = Mult::power(U, 2);
    const multgrp::MultHom K = sq.kernel();
    assert(K.domain()->order() == 2);
    assert(K(K.domain()->gen(0)).value() == 6);
    const multgrp::MultGrpPtr S = sq.image().domain();
    assert(S->to_string() == "Z/3 < F_7^*");
    assert(S->residue(2).value() == 2);
    threw = false;
    try {
        S->residue(3);
    } catch (const std::invalid_argument &e) {
        threw = true;
    }
    assert(threw);
    const multgrp::MultGrpPtr Q = Mult::quo(sq).codomain();
    assert(!Q->has_residues());
    assert(Q->to_string() == "Z/2");

    // Trivial action of C2
    const fingroup::GroupPtr C2 = fingroup::Group::cyclic(2);
    const coho::GModulePtr<Mult> triv = coho::GModule<Mult>::trivial(C2, U, checked());
    assert(coh(triv, 0) == "F_7^*");
    assert(coh(triv, 1) == "Z/2");
    assert(coh(triv, 2) == "Z/2");
    assert(triv->h_zero_tate()->to_string() == "Z/2");

    std::mt19937 gen(13);
    check_h_two<Mult>(triv, "Z/2", gen);

    // The nontrivial extension is cyclic of order 12
    const std::shared_ptr<const coho::H2<Mult>> H = triv->h_two();
    const coho::PcExtension<Mult> E(H->to_cochain(Mult::snf(H->group()).image(0)));
    bool cyclic = false;
    for (const fingroup::Elem &q : E.group()->elements()) cyclic = cyclic || E.group()->element_order(q) == 12;
    assert(cyclic);

    // C2 acting by x -> x^-1 fixes only 1 and 6
    const coho::GModulePtr<Mult> inv = coho::GModule<Mult>::create(C2, U,
            std::vector<multgrp::MultHom>{Mult::power(U, -1)}, checked());
    assert(coh(inv, 0) == "Z/2 < F_7^*");
    assert(coh(inv, 1) == "Z/2");
    check_h_two<Mult>(inv, "Z/2", gen);
    const std::shared_ptr<const coho::H0<Mult>> H0 = inv->h_zero();
    assert(H0->to_cochain(H0->group()->gen(0))().value() == 6);

    // x -> x^5 on F_13^*
    const multgrp::MultGrpPtr V = Mult::units(13);
    const coho::GModulePtr<Mult> five = coho::GModule<Mult>::create(C2, V,
            std::vector<multgrp::MultHom>{Mult::power(V, 5)}, checked());
    assert(coh(five, 0) == "Z/4 < F_13^*");
    assert(coh(five, 1) == "Z/2");
    assert(coh(five, 2) == "Z/2");

    std::cout << "multgrp: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_combinators() {
    clock_t tStart = clock();

    const abelian::AbGroupPtr Z = Ab::create(std::vector<mpz_class>{0});
    const fingroup::GroupPtr C2 = fingroup::Group::cyclic(2);
    const coho::GModulePtr<Ab> triv = coho::GModule<Ab>::trivial(C2, Z, checked());
    const coho::GModulePtr<Ab> sign = sign_module(C2, {-1});

    // Cohomology is additive
    const coho::ModuleSum<Ab> sum = coho::GModule<Ab>::direct_product(std::vector<coho::GModulePtr<Ab>>{triv, sign});
    assert(sum.module->module()->to_string() == "Z + Z");
    assert(sum.projections.size() == 2 && sum.injections.size() == 2);
    assert(coh(sum.module, 0) == "Z");
    assert(coh(sum.module, 1) == "Z/2");
    assert(coh(sum.module, 2) == "Z/2");

    // Z[C2] induced from the trivial subgroup has no higher cohomology
    const fingroup::Subgroup U = fingroup::Group::subgroup(C2, std::vector<fingroup::Elem>());
    assert(U.group->order() == 1);
    const coho::GModulePtr<Ab> base = coho::GModule<Ab>::trivial(U.group, Z, checked());
    const coho::Induced<Ab> ind = base->induce(U.embedding);
    assert(ind.transversal.size() == 2);
    assert(ind.module->module()->to_string() == "Z + Z");
    assert(coh(ind.module, 0) == "Z");
    assert(coh(ind.module, 1) == "0");
    assert(coh(ind.module, 2) == "0");
    assert(ind.module->orbit(ind.module->module()->gen(0)).size() == 2);

    // The regular summand splits off completely
    const coho::ModuleMap<Ab> shrunk = ind.module->shrink();
    assert(shrunk.module->module()->to_string() == "0");
    const coho::ModuleMap<Ab> kept = sum.module->shrink();
    assert(kept.module->module()->to_string() == "Z + Z");

    // Induction with the map from the restriction of Z
    const coho::GModulePtr<Ab> res = triv->restrict(U.embedding);
    assert(coh(res, 0) == "Z");
    const coho::Induced<Ab> ind_map = res->induce(U.embedding, *triv, Ab::identity(Z));
    assert(ind_map.has_map);
    // 1 goes to the norm element
    const abelian::AbElem n = ind_map.map(Z->gen(0));
    assert(n == ind_map.injections[0](Z->gen(0)) + ind_map.injections[1](Z->gen(0)));

    // Inflation along C4 -> C2
    const fingroup::GroupPtr C4 = fingroup::Group::cyclic(4);
    const fingroup::Hom h(C4, C2, std::vector<fingroup::Elem>{C2->gen(0)});
    const coho::GModulePtr<Ab> inf = sign->inflate(h);
    assert(inf->group() == C4);
    assert(coh(inf, 0) == "0");
    assert(coh(inf, 1) == "Z/2");
    assert(coh(inf, 2) == "0");

    // Z / 2Z with trivial action
    const coho::ModuleMap<Ab> q = triv->quo(Ab::hom(Z, Z, matrix::ZMatrix({{2}}, 1)));
    assert(q.module->module()->to_string() == "Z/2");
    assert(coh(q.module, 0) == "Z/2");
    assert(coh(q.module, 2) == "Z/2");

    // Z^2 / <(2, 2)> on a Smith form presentation
    const abelian::AbGroupPtr B = Ab::create(2, matrix::ZMatrix({{2, 2}}, 2));
    const coho::GModulePtr<Ab> tb = coho::GModule<Ab>::trivial(C2, B, checked());
    const coho::ModuleMap<Ab> s = tb->simplify();
    assert(s.map.is_bijective());
    assert(s.module->module()->to_string() == "Z/2 + Z");
    assert(coh(s.module, 0) == coh(tb, 0));
    assert(coh(s.module, 1) == coh(tb, 1));

    std::cout << "combinators: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

void test_input() {
    clock_t tStart = clock();

    std::istringstream in(
        "# sign action\n"
        "group cyclic 2\n"
        "module 0\n"
        "act 1 -1\n"
        "coho 0\n"
        "coho 1\n"
        "\n"
        "coho 2\n"
        "tate\n"
        "coho 5\n"
        "coho 1x\n"
        "end\n"
        "coho 0\n");

    std::stringstream out, err;

    Input::Config config;
    config.pretty = false;
    Input::InputHandler<Ab> ih(in, out, err, config);
    ih.handle_input();

    std::vector<std::string> outputs;
    std::string output;
    while (std::getline(out, output)) outputs.push_back(output);

    std::vector<std::string> errors;
    std::string error;
    while (std::getline(err, error)) errors.push_back(error);

    assert(outputs == (std::vector<std::string>{"0", "Z/2", "0", "0"}));
    assert(errors.size() == 2);
    assert(errors[0].substr(0, 7) == " Error:");

    std::istringstream fin(
        "group cyclic 2\n"
        "module 2 1\n"
        "coho 2\n"
        "ext 1\n"
        "ext 2\n"
        "group perm 3 (1,2) (1,2,3)\n"
        "coho 1\n"
        "act 1 1 0\n");

    std::stringstream fout, ferr;
    Input::InputHandler<Fp> fh(fin, fout, ferr, config);
    fh.handle_input();

    outputs.clear();
    while (std::getline(fout, output)) outputs.push_back(output);
    errors.clear();
    while (std::getline(ferr, error)) errors.push_back(error);

    // H^1(S3, F_2) is the dual of the abelianization mod 2
    assert(outputs == (std::vector<std::string>{"F_2", "4", "F_2"}));
    assert(errors.size() == 2);

    // Units mod 7 with C2 acting by inversion
    std::istringstream min(
        "group cyclic 2\n"
        "module 7\n"
        "act 1 -1\n"
        "coho 0\n"
        "coho 2\n"
        "ext 1\n"
        "module 8\n");

    std::stringstream mout, merr;
    Input::InputHandler<Mult> mh(min, mout, merr, config);
    mh.handle_input();

    outputs.clear();
    while (std::getline(mout, output)) outputs.push_back(output);
    errors.clear();
    while (std::getline(merr, error)) errors.push_back(error);

    assert(outputs == (std::vector<std::string>{"Z/2 < F_7^*", "Z/2", "12"}));
    assert(errors.size() == 1);

    std::cout << "input: " << std::fixed << std::setprecision(3)
              << (double)(clock() - tStart) / CLOCKS_PER_SEC << "s"
              << std::endl;
}

int main() {
    test_matrix();
    test_abelian();
    test_rewriting();
    test_group();
    test_gmodule();
    test_cochain();
    test_cohomology();
    test_extension();
    test_multgrp();
    test_combinators();
    test_input();
}
