#include "../include/util.hpp"

uint64_t fast_hash(uint64_t conj, uint64_t n) {
    uint64_t x = n ^ conj;
    x = (x ^ (x >> 30)) * (0xbf58476d1ce4e5b9);
    x = (x ^ (x >> 27)) * (0x94d049bb133111eb);
    x = x ^ (x >> 31);
    return x ^ conj;
}

uint64_t hash_mpz(const mpz_class &z) {
    // Limbs of |z|, then the sign
    const size_t limbs = mpz_size(z.get_mpz_t());
    uint64_t h = 0x2545f4914f6cdd1d;
    for (size_t i = 0; i < limbs; i++) {
        h = fast_hash(h, (uint64_t) mpz_getlimbn(z.get_mpz_t(), i));
    }
    return fast_hash(h, (uint64_t) (sgn(z) + 1));
}

std::vector<mpz_class> util::factor(mpz_class n) {
    std::vector<mpz_class> res;
    for (mpz_class p = 2; p * p <= n; p++) {
        while (mpz_divisible_p(n.get_mpz_t(), p.get_mpz_t())) {
            res.push_back(p);
            n /= p;
        }
    }
    if (n > 1) res.push_back(n);
    return res;
}

size_t util::WordHash::operator()(const std::vector<int> &w) const {
    uint64_t h = 0x9e3779b97f4a7c15;
    for (const int l : w) h = fast_hash(h, (uint64_t) (int64_t) l);
    return h;
}

size_t util::CoeffHash::operator()(const std::vector<mpz_class> &v) const {
    uint64_t h = 0x94d049bb133111eb;
    for (const mpz_class &c : v) h = fast_hash(h, hash_mpz(c));
    return h;
}

size_t util::PairHash::operator()(const std::pair<size_t, std::vector<mpz_class>> &p) const {
    return fast_hash(CoeffHash()(p.second), (uint64_t) p.first);
}
