#include "../include/rewriting.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

rewriting::System::System() : max_len_(0) {}

rewriting::System::System(std::vector<Rule> rules) : rules_(std::move(rules)), max_len_(0) {
    for (size_t i = 0; i < rules_.size(); i++) {
        const Rule &r = rules_[i];
        if (r.lhs.empty()) throw std::invalid_argument("Rule " + std::to_string(i) + " has an empty left hand side");
        for (const int l : r.lhs) {
            if (l == 0) throw std::invalid_argument("Letter 0 in rule " + std::to_string(i));
        }
        for (const int l : r.rhs) {
            if (l == 0) throw std::invalid_argument("Letter 0 in rule " + std::to_string(i));
        }
        max_len_ = std::max(max_len_, r.lhs.size());

        if (r.lhs.size() == 1) {
            if (!single_.emplace(r.lhs[0], i).second) {
                throw std::invalid_argument("Two rules rewrite the letter " + std::to_string(r.lhs[0]));
            }
        } else {
            prefix_[std::make_pair(r.lhs[0], r.lhs[1])].push_back(i);
        }
    }

    for (auto &entry : prefix_) {
        std::vector<size_t> &cands = entry.second;
        std::sort(cands.begin(), cands.end(), [this](const size_t a, const size_t b) {
            if (rules_[a].lhs != rules_[b].lhs) return rules_[a].lhs < rules_[b].lhs;
            return rules_[a].rhs < rules_[b].rhs;
        });
    }
}

size_t rewriting::System::size() const { return rules_.size(); }

const std::vector<rewriting::Rule>& rewriting::System::rules() const { return rules_; }

const rewriting::Rule& rewriting::System::rule(const size_t i) const { return rules_.at(i); }

void rewriting::System::substitute(Word &w, const size_t rule, const size_t pos, const Visitor &visit) const {
    const Rule &r = rules_[rule];
    if (visit) visit(w, rule, pos);
    w.erase(w.begin() + pos, w.begin() + pos + r.lhs.size());
    w.insert(w.begin() + pos, r.rhs.begin(), r.rhs.end());
}

rewriting::Word rewriting::System::reduce(Word w, const Visitor &visit) const {
    // No left hand side starts before pos, so after a substitution at p the
    // leftmost match starts at p - max_len + 1 or later
    size_t pos = 0;
    while (pos < w.size()) {
        size_t applied = rules_.size();

        auto single = single_.find(w[pos]);
        if (single != single_.end()) {
            applied = single->second;
        } else if (pos + 1 < w.size()) {
            auto cands = prefix_.find(std::make_pair(w[pos], w[pos + 1]));
            if (cands != prefix_.end()) {
                for (const size_t i : cands->second) {
                    const Word &lhs = rules_[i].lhs;
                    if (pos + lhs.size() > w.size()) continue;
                    if (!std::equal(lhs.begin(), lhs.end(), w.begin() + pos)) continue;
                    applied = i;
                    break;
                }
            }
        }

        if (applied == rules_.size()) {
            pos++;
            continue;
        }
        substitute(w, applied, pos, visit);
        pos = pos + 1 >= max_len_ ? pos + 1 - max_len_ : 0;
    }
    return w;
}

std::vector<rewriting::Overlap> rewriting::System::overlaps(const size_t max_length) const {
    std::vector<Overlap> res;
    for (size_t i = 0; i < rules_.size(); i++) {
        const Word &a = rules_[i].lhs;
        for (size_t j = 0; j < rules_.size(); j++) {
            const Word &b = rules_[j].lhs;
            size_t top = std::min(a.size(), b.size());
            if (max_length > 0) top = std::min(top, max_length);
            for (size_t l = 1; l <= top; l++) {
                if (std::equal(a.end() - l, a.end(), b.begin())) res.push_back({i, j, l});
            }
        }
    }
    return res;
}

bool rewriting::System::is_confluent() const {
    for (const Overlap &o : overlaps()) {
        const Rule &r = rules_[o.first];
        const Rule &s = rules_[o.second];
        // Whole rules coincide on the trivial self overlap
        if (o.first == o.second && o.length == r.lhs.size()) continue;

        const Word suffix(s.lhs.begin() + o.length, s.lhs.end());
        const Word prefix(r.lhs.begin(), r.lhs.end() - o.length);
        if (reduce(concat(r.rhs, suffix)) != reduce(concat(prefix, s.rhs))) return false;
    }

    // A left hand side strictly inside another one
    for (size_t i = 0; i < rules_.size(); i++) {
        const Word &a = rules_[i].lhs;
        for (size_t j = 0; j < rules_.size(); j++) {
            const Word &b = rules_[j].lhs;
            if (i == j || b.size() >= a.size()) continue;
            for (size_t p = 1; p + b.size() < a.size(); p++) {
                if (!std::equal(b.begin(), b.end(), a.begin() + p)) continue;
                Word w(a.begin(), a.begin() + p);
                w.insert(w.end(), rules_[j].rhs.begin(), rules_[j].rhs.end());
                w.insert(w.end(), a.begin() + p + b.size(), a.end());
                if (reduce(w) != reduce(rules_[i].rhs)) return false;
            }
        }
    }
    return true;
}

bool rewriting::System::has_tail(const size_t i) const {
    const Rule &r = rules_.at(i);
    if (r.lhs.size() == 1) return false;
    if (r.lhs.size() == 2 && r.rhs.empty() && r.lhs[0] == -r.lhs[1]) return false;
    return true;
}

std::string rewriting::System::to_string() const {
    std::stringstream ss;
    for (size_t i = 0; i < rules_.size(); i++) {
        ss << rewriting::to_string(rules_[i].lhs) << " -> " << rewriting::to_string(rules_[i].rhs) << "\n";
    }
    return ss.str();
}

rewriting::Word rewriting::inverse(const Word &w) {
    Word res;
    res.reserve(w.size());
    for (auto it = w.rbegin(); it != w.rend(); ++it) res.push_back(-*it);
    return res;
}

rewriting::Word rewriting::concat(const Word &a, const Word &b) {
    Word res(a);
    res.insert(res.end(), b.begin(), b.end());
    return res;
}

std::string rewriting::to_string(const Word &w) {
    std::stringstream ss;
    ss << "[";
    for (size_t i = 0; i < w.size(); i++) {
        if (i) ss << ", ";
        ss << w[i];
    }
    ss << "]";
    return ss.str();
}
