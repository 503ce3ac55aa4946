// rewriting.hpp
#ifndef REWRITING_HPP_
#define REWRITING_HPP_

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rewriting {
    // Letters are nonzero: i stands for the i-th generator, -i for its inverse
    typedef std::vector<int> Word;

    struct Rule {
        Word lhs;
        Word rhs;
    };

    // Called before every substitution with the current word, the rule index
    // and the position of the left hand side
    typedef std::function<void(const Word&, const size_t, const size_t)> Visitor;

    // lhs(first)[-length:] == lhs(second)[:length]
    struct Overlap {
        size_t first;
        size_t second;
        size_t length;
    };

    class System {
    private:
        std::vector<Rule> rules_;
        std::unordered_map<int, size_t> single_;                       // one letter left hand sides
        std::map<std::pair<int, int>, std::vector<size_t>> prefix_;     // by first two letters
        size_t max_len_;

        void substitute(Word &w, const size_t rule, const size_t pos, const Visitor &visit) const;

    public:
        System();
        explicit System(std::vector<Rule> rules);

        size_t size() const;
        const std::vector<Rule>& rules() const;
        const Rule& rule(const size_t i) const;

        // Leftmost reduction. Single letter rules are tried first at each position,
        // then the longer rules sharing the next two letters in the order (lhs, rhs).
        Word reduce(Word w, const Visitor &visit = Visitor()) const;

        // All overlaps of length at most max_length, or of any length if it is 0
        std::vector<Overlap> overlaps(const size_t max_length = 0) const;

        // Every critical pair resolves
        bool is_confluent() const;

        // Rules contributing a tail to 2-cocycles: everything except single letter
        // left hand sides and free cancellations a a^-1 -> 1
        bool has_tail(const size_t i) const;

        std::string to_string() const;
    };

    Word inverse(const Word &w);
    Word concat(const Word &a, const Word &b);
    std::string to_string(const Word &w);
};

#endif
