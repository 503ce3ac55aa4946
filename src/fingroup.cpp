#include "../include/fingroup.hpp"
#include "../include/util.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <gmpxx.h>

std::vector<size_t> prime_factors(size_t n) {
    std::vector<size_t> res;
    for (size_t p = 2; p * p <= n; p++) {
        while (n % p == 0) {
            res.push_back(p);
            n /= p;
        }
    }
    if (n > 1) res.push_back(n);
    return res;
}

// g1*g2^2*g3, or 1 for the empty word
std::string word_label(const fingroup::Word &w) {
    if (w.empty()) return "1";
    std::stringstream ss;
    for (size_t i = 0; i < w.size();) {
        size_t j = i;
        while (j < w.size() && w[j] == w[i]) j++;
        if (i) ss << "*";
        ss << "g" << std::abs(w[i]);
        if (w[i] < 0) ss << "^-" << (j - i);
        else if (j - i > 1) ss << "^" << (j - i);
        i = j;
    }
    return ss.str();
}

std::string cycle_label(const std::vector<int> &perm) {
    std::stringstream ss;
    std::vector<bool> done(perm.size(), false);
    for (size_t x = 0; x < perm.size(); x++) {
        if (done[x] || perm[x] == (int) x + 1) continue;
        ss << "(" << x + 1;
        done[x] = true;
        for (size_t y = perm[x] - 1; y != x; y = perm[y] - 1) {
            ss << "," << y + 1;
            done[y] = true;
        }
        ss << ")";
    }
    const std::string res = ss.str();
    return res.empty() ? "()" : res;
}

/*
 * Elem
 */

fingroup::Elem::Elem() : parent_(nullptr), idx_(0) {}

fingroup::Elem::Elem(const Group *parent, const size_t idx) : parent_(parent), idx_(idx) {}

const fingroup::Group* fingroup::Elem::parent() const { return parent_; }

size_t fingroup::Elem::index() const { return idx_; }

bool fingroup::Elem::is_one() const { return idx_ == 0; }

fingroup::Elem fingroup::Elem::inv() const {
    return Elem(parent_, parent_->inv(idx_));
}

fingroup::Elem fingroup::Elem::operator*(const Elem &rhs) const {
    if (parent_ != rhs.parent_) throw std::invalid_argument("Cannot multiply elements of different groups");
    return Elem(parent_, parent_->mul(idx_, rhs.idx_));
}

bool fingroup::Elem::operator==(const Elem &rhs) const {
    return parent_ == rhs.parent_ && idx_ == rhs.idx_;
}

bool fingroup::Elem::operator!=(const Elem &rhs) const {
    return !(*this == rhs);
}

bool fingroup::Elem::operator<(const Elem &rhs) const {
    return idx_ < rhs.idx_;
}

std::string fingroup::Elem::to_string() const {
    return parent_->label(idx_);
}

/*
 * Presentations
 */

size_t fingroup::PcPresentation::ngens() const {
    return rel_orders.size();
}

rewriting::System fingroup::PcPresentation::rws() const {
    const int n = (int) ngens();
    if (powers.size() != rel_orders.size()) throw std::invalid_argument("Need one power relation per pc generator");

    std::vector<rewriting::Rule> rules;
    for (int i = 1; i <= n; i++) {
        rules.push_back({Word(rel_orders[i - 1], i), powers[i - 1]});
        for (int j = i + 1; j <= n; j++) {
            Word rhs{i};
            auto it = conjugates.find(std::make_pair(j, i));
            if (it == conjugates.end()) rhs.push_back(j);
            else rhs.insert(rhs.end(), it->second.begin(), it->second.end());
            rules.push_back({Word{j, i}, rhs});
        }
    }
    for (int i = 1; i <= n; i++) {
        rules.push_back({Word{-i}, Word(rel_orders[i - 1] - 1, i)});
    }
    return rewriting::System(rules);
}

std::string fingroup::FpGroup::to_string() const {
    std::stringstream ss;
    ss << "<";
    for (size_t i = 0; i < ngens; i++) {
        if (i) ss << ", ";
        ss << "g" << i + 1;
    }
    ss << " | ";
    for (size_t k = 0; k < relators.size(); k++) {
        if (k) ss << ", ";
        ss << word_label(relators[k]);
    }
    ss << ">";
    return ss.str();
}

/*
 * Group
 */

fingroup::Group::Group(std::vector<std::vector<size_t>> next, std::vector<std::string> labels)
    : next_(std::move(next)), labels_(std::move(labels)) {
    const size_t n = next_.size();
    if (n == 0) throw std::invalid_argument("A group has at least one element");
    ngens_ = next_[0].size();

    const size_t none = n;
    prev_.assign(n, std::vector<size_t>(ngens_, none));
    for (size_t e = 0; e < n; e++) {
        if (next_[e].size() != ngens_) throw std::invalid_argument("Row " + std::to_string(e) + " of the multiplication table has the wrong length");
        for (size_t i = 0; i < ngens_; i++) {
            const size_t f = next_[e][i];
            if (f >= n) throw std::invalid_argument("Multiplication table entry " + std::to_string(f) + " out of range");
            if (prev_[f][i] != none) throw std::invalid_argument("Generator " + std::to_string(i + 1) + " does not act as a permutation");
            prev_[f][i] = e;
        }
    }

    // Breadth first search in generator order gives the shortlex least words
    words_.assign(n, Word());
    parent_.assign(n, none);
    letter_.assign(n, 0);
    std::vector<bool> seen(n, false);
    seen[0] = true;
    bfs_.push_back(0);
    for (size_t k = 0; k < bfs_.size(); k++) {
        const size_t e = bfs_[k];
        for (size_t i = 0; i < ngens_; i++) {
            const size_t f = next_[e][i];
            if (seen[f]) continue;
            seen[f] = true;
            parent_[f] = e;
            letter_[f] = (int) i + 1;
            words_[f] = words_[e];
            words_[f].push_back((int) i + 1);
            bfs_.push_back(f);
        }
    }
    if (bfs_.size() != n) throw std::invalid_argument("Generators reach " + std::to_string(bfs_.size())
            + " of " + std::to_string(n) + " elements");

    inverse_.assign(n, 0);
    for (size_t e = 0; e < n; e++) {
        size_t x = 0;
        for (auto it = words_[e].rbegin(); it != words_[e].rend(); ++it) x = prev_[x][*it - 1];
        inverse_[e] = x;
    }

    if (labels_.empty()) {
        for (size_t e = 0; e < n; e++) labels_.push_back(word_label(words_[e]));
    } else if (labels_.size() != n) {
        throw std::invalid_argument("Need one label per element");
    }
}

bool fingroup::Group::is_tree_edge(const size_t e, const size_t i) const {
    const size_t f = next_[e][i];
    return f != 0 && parent_[f] == e && letter_[f] == (int) i + 1;
}

void fingroup::Group::set_pc(const std::vector<size_t> &gens, const std::vector<int> &rel_orders) {
    const size_t k = gens.size();
    if (rel_orders.size() != k) throw std::invalid_argument("Need one relative order per pc generator");
    size_t count = 1;
    for (const int p : rel_orders) {
        if (p < 2) throw std::invalid_argument("Relative order " + std::to_string(p) + " is too small");
        count *= p;
        if (count > order()) throw std::invalid_argument("Relative orders exceed the group order");
    }
    if (count != order()) throw std::invalid_argument("Relative orders do not multiply to the group order");

    std::shared_ptr<PcData> data = std::make_shared<PcData>();
    for (const size_t g : gens) data->gens.push_back(elem(g));
    data->words.assign(order(), Word());

    // Every exponent vector below the relative orders, last coordinate fastest
    std::vector<bool> seen(order(), false);
    std::vector<int> e(k, 0);
    for (size_t c = 0; c < count; c++) {
        size_t x = 0;
        Word w;
        for (size_t i = 0; i < k; i++) {
            for (int r = 0; r < e[i]; r++) {
                x = mul(x, gens[i]);
                w.push_back((int) i + 1);
            }
        }
        if (seen[x]) throw std::invalid_argument("Pc generators do not give unique collected words");
        seen[x] = true;
        data->words[x] = w;
        for (size_t i = k; i-- > 0;) {
            if (++e[i] < rel_orders[i]) break;
            e[i] = 0;
        }
    }

    auto check_tail = [](const Word &w, const size_t i, const std::string &what) {
        for (const int l : w) {
            if (l <= (int) i + 1) throw std::invalid_argument(what + " of pc generator " + std::to_string(i + 1)
                    + " is not in the next term of the series");
        }
    };

    PcPresentation &pres = data->presentation;
    pres.rel_orders = rel_orders;
    for (size_t i = 0; i < k; i++) {
        size_t x = 0;
        for (int r = 0; r < rel_orders[i]; r++) x = mul(x, gens[i]);
        check_tail(data->words[x], i, "Power");
        pres.powers.push_back(data->words[x]);
    }
    for (size_t i = 0; i < k; i++) {
        for (size_t j = i + 1; j < k; j++) {
            const size_t x = mul(mul(inverse_[gens[i]], gens[j]), gens[i]);
            const Word &w = data->words[x];
            check_tail(w, i, "Conjugate");
            if (w != Word{(int) j + 1}) pres.conjugates[std::make_pair((int) j + 1, (int) i + 1)] = w;
        }
    }
    data->rws = pres.rws();
    pc_ = data;
}

fingroup::GroupPtr fingroup::Group::from_permutations(const size_t degree, const std::vector<std::vector<int>> &gens) {
    for (const std::vector<int> &p : gens) {
        if (p.size() != degree) throw std::invalid_argument("Permutation " + cycle_label(p) + " has the wrong degree");
        std::vector<bool> hit(degree, false);
        for (const int x : p) {
            if (x < 1 || x > (int) degree || hit[x - 1]) throw std::invalid_argument("Not a permutation of 1.." + std::to_string(degree));
            hit[x - 1] = true;
        }
    }

    std::vector<int> one(degree);
    for (size_t x = 0; x < degree; x++) one[x] = (int) x + 1;
    const std::function<std::vector<int>(const std::vector<int>&, const std::vector<int>&)> mul =
        [](const std::vector<int> &p, const std::vector<int> &q) {
            std::vector<int> r(p.size());
            for (size_t x = 0; x < p.size(); x++) r[x] = q[p[x] - 1];
            return r;
        };
    return closure<std::vector<int>, util::WordHash>(gens, one, mul, cycle_label);
}

fingroup::GroupPtr fingroup::Group::symmetric(const size_t n) {
    if (n == 0) throw std::invalid_argument("Symmetric group on no points");
    std::vector<std::vector<int>> gens;
    if (n >= 2) {
        std::vector<int> t(n), c(n);
        for (size_t x = 0; x < n; x++) {
            t[x] = (int) x + 1;
            c[x] = (int) ((x + 1) % n) + 1;
        }
        std::swap(t[0], t[1]);
        gens.push_back(t);
        if (n >= 3) gens.push_back(c);
    }
    return from_permutations(n, gens);
}

fingroup::GroupPtr fingroup::Group::dihedral(const size_t n) {
    if (n == 0) throw std::invalid_argument("Dihedral group of order 0");

    // r^a s^f is element a + n f
    std::vector<std::vector<size_t>> next(2 * n, std::vector<size_t>(2));
    std::vector<std::string> labels(2 * n);
    for (size_t f = 0; f < 2; f++) {
        for (size_t a = 0; a < n; a++) {
            const size_t e = a + n * f;
            next[e][0] = (f ? (a + n - 1) % n : (a + 1) % n) + n * f;
            next[e][1] = a + n * (1 - f);

            std::string l = a == 0 ? "" : a == 1 ? "r" : "r^" + std::to_string(a);
            if (f) l += l.empty() ? "s" : "*s";
            labels[e] = l.empty() ? "1" : l;
        }
    }
    std::shared_ptr<Group> G = std::make_shared<Group>(next, labels);

    std::vector<size_t> gens{n};
    std::vector<int> orders{2};
    size_t m = 1;
    for (const size_t q : prime_factors(n)) {
        gens.push_back(m);
        orders.push_back((int) q);
        m *= q;
    }
    G->set_pc(gens, orders);
    return G;
}

fingroup::GroupPtr fingroup::Group::cyclic(const size_t n) {
    if (n == 0) throw std::invalid_argument("Cyclic group of order 0");

    // g^e is element e
    std::vector<std::vector<size_t>> next(n, std::vector<size_t>(1));
    std::vector<std::string> labels(n);
    for (size_t e = 0; e < n; e++) {
        next[e][0] = (e + 1) % n;
        labels[e] = e == 0 ? "1" : e == 1 ? "g" : "g^" + std::to_string(e);
    }
    std::shared_ptr<Group> G = std::make_shared<Group>(next, labels);

    std::vector<size_t> gens;
    std::vector<int> orders;
    size_t m = 1;
    for (const size_t q : prime_factors(n)) {
        gens.push_back(m);
        orders.push_back((int) q);
        m *= q;
    }
    G->set_pc(gens, orders);
    return G;
}

fingroup::GroupPtr fingroup::Group::trivial() {
    std::shared_ptr<Group> G = std::make_shared<Group>(std::vector<std::vector<size_t>>{std::vector<size_t>()},
            std::vector<std::string>{"1"});
    G->set_pc(std::vector<size_t>(), std::vector<int>());
    return G;
}

fingroup::GroupPtr fingroup::Group::from_pc(const PcPresentation &pres) {
    const size_t n = pres.ngens();
    if (pres.powers.size() != n) throw std::invalid_argument("Need one power relation per pc generator");
    for (size_t i = 0; i < n; i++) {
        if (mpz_probab_prime_p(mpz_class(pres.rel_orders[i]).get_mpz_t(), 25) == 0) {
            throw std::invalid_argument("Relative order " + std::to_string(pres.rel_orders[i]) + " is not a prime");
        }
    }

    const rewriting::System rws = pres.rws();
    if (!rws.is_confluent()) throw std::invalid_argument("Polycyclic presentation is not consistent");

    std::vector<size_t> stride(n, 1);
    size_t count = 1;
    for (size_t i = n; i-- > 0;) {
        stride[i] = count;
        count *= pres.rel_orders[i];
        if (count > 10000000) throw std::invalid_argument("Polycyclic group is too large");
    }

    auto index_of = [&](const Word &w) {
        std::vector<int> e(n, 0);
        int last = 0;
        for (const int l : w) {
            if (l < last || l < 1 || l > (int) n) throw std::invalid_argument("Collection does not give a normal word: " + rewriting::to_string(w));
            last = l;
            if (++e[l - 1] >= pres.rel_orders[l - 1]) throw std::invalid_argument("Collection does not give a normal word: " + rewriting::to_string(w));
        }
        size_t idx = 0;
        for (size_t i = 0; i < n; i++) idx += e[i] * stride[i];
        return idx;
    };

    std::vector<std::vector<size_t>> next(count, std::vector<size_t>(n));
    std::vector<std::string> labels(count);
    for (size_t c = 0; c < count; c++) {
        Word w;
        for (size_t i = 0; i < n; i++) {
            const size_t e = (c / stride[i]) % pres.rel_orders[i];
            for (size_t r = 0; r < e; r++) w.push_back((int) i + 1);
        }
        labels[c] = word_label(w);
        for (size_t i = 0; i < n; i++) {
            Word v(w);
            v.push_back((int) i + 1);
            next[c][i] = index_of(rws.reduce(v));
        }
    }
    std::shared_ptr<Group> G = std::make_shared<Group>(next, labels);
    G->set_pc(std::vector<size_t>(stride.begin(), stride.end()), pres.rel_orders);
    return G;
}

template<class T, class Hash>
fingroup::GroupPtr fingroup::Group::closure(const std::vector<T> &gens, const T &one,
        const std::function<T(const T&, const T&)> &mul,
        const std::function<std::string(const T&)> &label,
        std::vector<T> *elements, const size_t limit) {
    std::vector<T> elems{one};
    std::unordered_map<T, size_t, Hash> index;
    index.emplace(one, 0);
    std::vector<std::vector<size_t>> next;

    for (size_t e = 0; e < elems.size(); e++) {
        std::vector<size_t> row(gens.size());
        for (size_t i = 0; i < gens.size(); i++) {
            T x = mul(elems[e], gens[i]);
            auto it = index.find(x);
            if (it == index.end()) {
                if (elems.size() >= limit) throw std::invalid_argument("Group has more than " + std::to_string(limit) + " elements");
                it = index.emplace(x, elems.size()).first;
                elems.push_back(std::move(x));
            }
            row[i] = it->second;
        }
        next.push_back(row);
    }

    std::vector<std::string> labels;
    for (const T &x : elems) labels.push_back(label(x));
    if (elements != nullptr) *elements = elems;
    return std::make_shared<Group>(std::move(next), std::move(labels));
}

size_t fingroup::Group::order() const { return next_.size(); }

size_t fingroup::Group::ngens() const { return ngens_; }

fingroup::Elem fingroup::Group::one() const { return Elem(this, 0); }

fingroup::Elem fingroup::Group::gen(const size_t i) const {
    if (i >= ngens_) throw std::invalid_argument("Generator index " + std::to_string(i) + " out of range");
    return Elem(this, next_[0][i]);
}

std::vector<fingroup::Elem> fingroup::Group::gens() const {
    std::vector<Elem> res;
    for (size_t i = 0; i < ngens_; i++) res.push_back(gen(i));
    return res;
}

fingroup::Elem fingroup::Group::elem(const size_t idx) const {
    if (idx >= order()) throw std::invalid_argument("Element index " + std::to_string(idx) + " out of range");
    return Elem(this, idx);
}

std::vector<fingroup::Elem> fingroup::Group::elements() const {
    std::vector<Elem> res;
    for (size_t e = 0; e < order(); e++) res.push_back(Elem(this, e));
    return res;
}

size_t fingroup::Group::mul(const size_t a, const size_t b) const {
    size_t x = a;
    for (const int l : words_[b]) x = next_[x][l - 1];
    return x;
}

size_t fingroup::Group::inv(const size_t a) const { return inverse_[a]; }

size_t fingroup::Group::next(const size_t e, const size_t i) const { return next_[e][i]; }

fingroup::Elem fingroup::Group::evaluate(const Word &w) const {
    size_t x = 0;
    for (const int l : w) {
        if (l == 0 || (size_t) std::abs(l) > ngens_) throw std::invalid_argument("Letter " + std::to_string(l) + " out of range");
        x = l > 0 ? next_[x][l - 1] : prev_[x][-l - 1];
    }
    return Elem(this, x);
}

fingroup::Elem fingroup::Group::pc_evaluate(const Word &w) const {
    const std::vector<Elem> &gens = pc().gens;
    Elem x = one();
    for (const int l : w) {
        if (l == 0 || (size_t) std::abs(l) > gens.size()) throw std::invalid_argument("Letter " + std::to_string(l) + " out of range");
        x = x * (l > 0 ? gens[l - 1] : gens[-l - 1].inv());
    }
    return x;
}

const fingroup::Word& fingroup::Group::word(const Elem &g) const {
    if (g.parent() != this) throw std::invalid_argument("Element " + g.to_string() + " is not in the group");
    return words_[g.index()];
}

const std::vector<fingroup::Word>& fingroup::Group::words() const { return words_; }

const std::string& fingroup::Group::label(const size_t idx) const { return labels_.at(idx); }

size_t fingroup::Group::element_order(const Elem &g) const {
    size_t k = 1;
    for (Elem x = g; !x.is_one(); x = x * g) k++;
    return k;
}

const rewriting::System& fingroup::Group::rws() const {
    if (rws_ == nullptr) {
        std::vector<rewriting::Rule> rules;
        for (const size_t e : bfs_) {
            const Word &w = words_[e];
            // A suffix of w is normal, so w a is a minimal reducible word iff w[1:] a is normal
            size_t s = 0;
            for (size_t k = 1; k < w.size(); k++) s = next_[s][w[k] - 1];
            for (size_t i = 0; i < ngens_; i++) {
                if (is_tree_edge(e, i)) continue;
                if (!w.empty() && !is_tree_edge(s, i)) continue;
                Word lhs(w);
                lhs.push_back((int) i + 1);
                rules.push_back({lhs, words_[next_[e][i]]});
            }
        }
        for (size_t i = 0; i < ngens_; i++) {
            rules.push_back({Word{-(int) i - 1}, words_[inverse_[next_[0][i]]]});
        }
        rws_ = std::make_shared<rewriting::System>(std::move(rules));
    }
    return *rws_;
}

fingroup::FpGroup fingroup::Group::presentation() const {
    FpGroup res;
    res.ngens = ngens_;
    for (const rewriting::Rule &r : rws().rules()) {
        if (r.lhs[0] < 0) continue;
        res.relators.push_back(rewriting::concat(r.lhs, rewriting::inverse(r.rhs)));
    }
    return res;
}

bool fingroup::Group::has_pc() const { return pc_ != nullptr; }

const fingroup::PcData& fingroup::Group::pc() const {
    if (pc_ == nullptr) throw std::invalid_argument("Group has no polycyclic presentation");
    return *pc_;
}

fingroup::Subgroup fingroup::Group::subgroup(const GroupPtr &G, const std::vector<Elem> &gens) {
    std::vector<size_t> idx;
    for (const Elem &g : gens) {
        if (g.parent() != G.get()) throw std::invalid_argument("Element " + g.to_string() + " is not in the group");
        idx.push_back(g.index());
    }
    const Group &H = *G;
    const GroupPtr U = closure<size_t, std::hash<size_t>>(idx, 0,
            [&H](const size_t &a, const size_t &b) { return H.mul(a, b); },
            [&H](const size_t &a) { return H.label(a); });
    return Subgroup{U, Hom(U, G, gens)};
}

fingroup::Transversal fingroup::Group::right_transversal(const Hom &emb) {
    const Group &G = *emb.target();
    const std::vector<Elem> U = emb.source()->elements();
    const size_t none = G.order();

    Transversal res;
    res.coset.assign(G.order(), none);
    for (size_t g = 0; g < G.order(); g++) {
        if (res.coset[g] != none) continue;
        const size_t k = res.reps.size();
        res.reps.push_back(G.elem(g));
        for (const Elem &u : U) res.coset[G.mul(emb(u).index(), g)] = k;
    }
    return res;
}

size_t fingroup::Transversal::index(const Elem &g) const {
    return coset.at(g.index());
}

/*
 * Hom
 */

fingroup::Hom::Hom() {}

fingroup::Hom::Hom(const GroupPtr &source, const GroupPtr &target, const std::vector<Elem> &images)
    : source_(source), target_(target), images_(images) {
    if (images_.size() != source_->ngens()) throw std::invalid_argument("Need " + std::to_string(source_->ngens())
            + " generator images, got " + std::to_string(images_.size()));
    for (const Elem &y : images_) {
        if (y.parent() != target_.get()) throw std::invalid_argument("Image " + y.to_string() + " is not in the target");
    }

    const size_t n = source_->order();
    table_.assign(n, 0);
    for (size_t e = 0; e < n; e++) {
        size_t x = 0;
        for (const int l : source_->words()[e]) x = target_->mul(x, images_[l - 1].index());
        table_[e] = x;
    }
    for (size_t e = 0; e < n; e++) {
        for (size_t i = 0; i < source_->ngens(); i++) {
            if (table_[source_->next(e, i)] != target_->mul(table_[e], images_[i].index())) {
                throw std::invalid_argument("Generator images do not define a homomorphism");
            }
        }
    }

    preimage_.assign(target_->order(), -1);
    for (size_t e = 0; e < n; e++) {
        if (preimage_[table_[e]] < 0) preimage_[table_[e]] = (long) e;
    }
}

const fingroup::GroupPtr& fingroup::Hom::source() const { return source_; }

const fingroup::GroupPtr& fingroup::Hom::target() const { return target_; }

const std::vector<fingroup::Elem>& fingroup::Hom::images() const { return images_; }

fingroup::Elem fingroup::Hom::operator()(const Elem &g) const {
    if (g.parent() != source_.get()) throw std::invalid_argument("Element " + g.to_string() + " is not in the source");
    return target_->elem(table_[g.index()]);
}

bool fingroup::Hom::has_preimage(const Elem &y, Elem &x) const {
    if (y.parent() != target_.get()) throw std::invalid_argument("Element " + y.to_string() + " is not in the target");
    const long e = preimage_[y.index()];
    if (e < 0) return false;
    x = source_->elem((size_t) e);
    return true;
}

fingroup::Elem fingroup::Hom::preimage(const Elem &y) const {
    Elem x;
    if (!has_preimage(y, x)) throw std::invalid_argument("Element " + y.to_string() + " has no preimage");
    return x;
}

std::vector<fingroup::Elem> fingroup::Hom::kernel() const {
    std::vector<Elem> res;
    for (size_t e = 0; e < table_.size(); e++) {
        if (table_[e] == 0) res.push_back(source_->elem(e));
    }
    return res;
}

bool fingroup::Hom::is_injective() const {
    return kernel().size() == 1;
}

bool fingroup::Hom::is_surjective() const {
    for (const long e : preimage_) {
        if (e < 0) return false;
    }
    return true;
}

template fingroup::GroupPtr fingroup::Group::closure<std::vector<int>, util::WordHash>(
        const std::vector<std::vector<int>>&, const std::vector<int>&,
        const std::function<std::vector<int>(const std::vector<int>&, const std::vector<int>&)>&,
        const std::function<std::string(const std::vector<int>&)>&,
        std::vector<std::vector<int>>*, const size_t);
template fingroup::GroupPtr fingroup::Group::closure<size_t, std::hash<size_t>>(
        const std::vector<size_t>&, const size_t&,
        const std::function<size_t(const size_t&, const size_t&)>&,
        const std::function<std::string(const size_t&)>&,
        std::vector<size_t>*, const size_t);
template fingroup::GroupPtr fingroup::Group::closure<std::pair<size_t, std::vector<mpz_class>>, util::PairHash>(
        const std::vector<std::pair<size_t, std::vector<mpz_class>>>&, const std::pair<size_t, std::vector<mpz_class>>&,
        const std::function<std::pair<size_t, std::vector<mpz_class>>(const std::pair<size_t, std::vector<mpz_class>>&,
            const std::pair<size_t, std::vector<mpz_class>>&)>&,
        const std::function<std::string(const std::pair<size_t, std::vector<mpz_class>>&)>&,
        std::vector<std::pair<size_t, std::vector<mpz_class>>>*, const size_t);
