// util.hpp
#ifndef UTIL_HPP_
#define UTIL_HPP_

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include <gmpxx.h>

uint64_t fast_hash(uint64_t conj, uint64_t n);

uint64_t hash_mpz(const mpz_class &z);

namespace util {
    // Prime factors in ascending order, with multiplicity
    std::vector<mpz_class> factor(mpz_class n);

    struct WordHash {
        size_t operator()(const std::vector<int> &w) const;
    };

    struct CoeffHash {
        size_t operator()(const std::vector<mpz_class> &v) const;
    };

    // (group element index, module coefficients), the pair model of an extension
    struct PairHash {
        size_t operator()(const std::pair<size_t, std::vector<mpz_class>> &p) const;
    };
};

#endif
