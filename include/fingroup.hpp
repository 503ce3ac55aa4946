// fingroup.hpp
#ifndef FINGROUP_HPP_
#define FINGROUP_HPP_

#include "rewriting.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fingroup {
    typedef rewriting::Word Word;

    class Group;
    class Hom;
    struct Subgroup;
    struct Transversal;

    typedef std::shared_ptr<const Group> GroupPtr;

    class Elem {
    private:
        const Group *parent_;
        size_t idx_;

    public:
        Elem();
        Elem(const Group *parent, const size_t idx);

        const Group* parent() const;
        size_t index() const;

        bool is_one() const;
        Elem inv() const;

        Elem operator*(const Elem &rhs) const;
        bool operator==(const Elem &rhs) const;
        bool operator!=(const Elem &rhs) const;
        bool operator<(const Elem &rhs) const;

        std::string to_string() const;
    };

    /*
     * Polycyclic presentation on g_1, ..., g_n with prime relative orders p_i:
     *   g_i^p_i     = powers[i - 1]        a word in g_{i+1}, ..., g_n
     *   g_j^(g_i)   = conjugates[{j, i}]   for j > i, a word in g_{i+1}, ..., g_n
     * Missing conjugates commute.
     */
    struct PcPresentation {
        std::vector<int> rel_orders;
        std::vector<Word> powers;
        std::map<std::pair<int, int>, Word> conjugates;

        size_t ngens() const;
        // Power rules, conjugation rules g_j g_i -> g_i g_j^(g_i), then g_i^-1 -> g_i^(p_i - 1)
        rewriting::System rws() const;
    };

    struct PcData {
        PcPresentation presentation;
        rewriting::System rws;
        std::vector<Elem> gens;
        std::vector<Word> words;    // collected word of every element
    };

    struct FpGroup {
        size_t ngens;
        std::vector<Word> relators;

        std::string to_string() const;
    };

    // Finite group given by its right regular action on itself.
    // Element 0 is the identity. Words are the shortlex least ones over the generators.
    class Group {
    private:
        size_t ngens_;
        std::vector<std::vector<size_t>> next_;   // next_[e][i] = e * g_i
        std::vector<std::vector<size_t>> prev_;   // prev_[e][i] = e * g_i^-1
        std::vector<size_t> bfs_;
        std::vector<Word> words_;
        std::vector<size_t> parent_;
        std::vector<int> letter_;
        std::vector<size_t> inverse_;
        std::vector<std::string> labels_;

        std::shared_ptr<const PcData> pc_;
        mutable std::shared_ptr<const rewriting::System> rws_;

        bool is_tree_edge(const size_t e, const size_t i) const;
        void set_pc(const std::vector<size_t> &gens, const std::vector<int> &rel_orders);

    public:
        Group(std::vector<std::vector<size_t>> next, std::vector<std::string> labels = std::vector<std::string>());

        // Permutations of 1..degree, images listed in order. Products apply the left factor first.
        static GroupPtr from_permutations(const size_t degree, const std::vector<std::vector<int>> &gens);
        static GroupPtr symmetric(const size_t n);
        // Order 2n, generated by a rotation r and a reflection s
        static GroupPtr dihedral(const size_t n);
        static GroupPtr cyclic(const size_t n);
        static GroupPtr trivial();
        static GroupPtr from_pc(const PcPresentation &pres);

        // Group generated by gens inside the monoid (T, mul, one)
        template<class T, class Hash>
        static GroupPtr closure(const std::vector<T> &gens, const T &one,
                const std::function<T(const T&, const T&)> &mul,
                const std::function<std::string(const T&)> &label,
                std::vector<T> *elements = nullptr, const size_t limit = 1000000);

        size_t order() const;
        size_t ngens() const;

        Elem one() const;
        Elem gen(const size_t i) const;
        std::vector<Elem> gens() const;
        Elem elem(const size_t idx) const;
        std::vector<Elem> elements() const;

        size_t mul(const size_t a, const size_t b) const;
        size_t inv(const size_t a) const;
        size_t next(const size_t e, const size_t i) const;

        // Value of a signed word in the generators
        Elem evaluate(const Word &w) const;
        // Value of a word in the pc generators
        Elem pc_evaluate(const Word &w) const;
        const Word& word(const Elem &g) const;
        const std::vector<Word>& words() const;
        const std::string& label(const size_t idx) const;
        size_t element_order(const Elem &g) const;

        // Confluent shortlex system: w a -> word(w a) for every reducible w a whose
        // proper suffix is irreducible, and a^-1 -> word(a^-1)
        const rewriting::System& rws() const;
        // Relators lhs * rhs^-1 of the rules on positive letters
        FpGroup presentation() const;

        bool has_pc() const;
        const PcData& pc() const;

        static Subgroup subgroup(const GroupPtr &G, const std::vector<Elem> &gens);
        static Transversal right_transversal(const Hom &emb);
    };

    class Hom {
    private:
        GroupPtr source_;
        GroupPtr target_;
        std::vector<Elem> images_;
        std::vector<size_t> table_;
        std::vector<long> preimage_;    // some preimage of every target element, -1 if none

    public:
        Hom();
        // Images of the generators of source; throws if they do not extend to a homomorphism
        Hom(const GroupPtr &source, const GroupPtr &target, const std::vector<Elem> &images);

        const GroupPtr& source() const;
        const GroupPtr& target() const;
        const std::vector<Elem>& images() const;

        Elem operator()(const Elem &g) const;
        bool has_preimage(const Elem &y, Elem &x) const;
        Elem preimage(const Elem &y) const;

        std::vector<Elem> kernel() const;
        bool is_injective() const;
        bool is_surjective() const;
    };

    struct Subgroup {
        GroupPtr group;
        Hom embedding;
    };

    // Right cosets U g
    struct Transversal {
        std::vector<Elem> reps;
        std::vector<size_t> coset;    // coset number of every element

        size_t index(const Elem &g) const;
    };
};

#endif
