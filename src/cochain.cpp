#include "../include/cochain.hpp"
#include "../include/abelian.hpp"
#include "../include/fpspace.hpp"
#include "../include/multgrp.hpp"

#include <sstream>
#include <stdexcept>

template<class X>
coho::CoChain<X>::CoChain(const GModulePtr<X> &C, const int degree, const std::map<Key, MElem> &values)
    : C_(C), degree_(degree), values_(values) {
    if (C_ == nullptr) throw std::invalid_argument("Cochain without a module");
    if (degree_ < 0 || degree_ > 2) throw std::invalid_argument("Cochains of degree " + std::to_string(degree_)
            + " are not supported");
    for (const auto &entry : values_) {
        if (entry.first.size() != (size_t) degree_) throw std::invalid_argument("Cochain of degree "
                + std::to_string(degree_) + " given on a tuple of length " + std::to_string(entry.first.size()));
        for (const fingroup::Elem &g : entry.first) {
            if (g.parent() != C_->group().get()) throw std::invalid_argument("Element " + g.to_string() + " is not in the acting group");
        }
        if (*entry.second.parent() != *C_->module()) throw std::invalid_argument("Value " + entry.second.to_string()
                + " is not in the module");
    }
}

template<class X>
const coho::GModule<X>& coho::CoChain<X>::gmodule() const { return *C_; }

template<class X>
int coho::CoChain<X>::degree() const { return degree_; }

template<class X>
const std::map<typename coho::CoChain<X>::Key, typename coho::CoChain<X>::MElem>& coho::CoChain<X>::values() const {
    return values_;
}

template<class X>
const typename coho::CoChain<X>::MElem& coho::CoChain<X>::lookup(const Key &key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        std::string args;
        for (size_t i = 0; i < key.size(); i++) args += (i ? ", " : "") + key[i].to_string();
        throw std::invalid_argument("Cochain has no value at (" + args + ")");
    }
    return it->second;
}

template<class X>
typename coho::CoChain<X>::MElem coho::CoChain<X>::operator()() const {
    if (degree_ != 0) throw std::invalid_argument("Cochain of degree " + std::to_string(degree_) + " called without arguments");
    return lookup(Key());
}

template<class X>
typename coho::CoChain<X>::MElem coho::CoChain<X>::operator()(const fingroup::Elem &g) const {
    if (degree_ != 1) throw std::invalid_argument("Cochain of degree " + std::to_string(degree_) + " called with one argument");
    auto it = values_.find(Key{g});
    if (it != values_.end()) return it->second;
    if (g.parent() != C_->group().get()) throw std::invalid_argument("Element " + g.to_string() + " is not in the acting group");

    const fingroup::Group &G = *C_->group();
    MElem t = C_->module()->zero();
    for (const int l : G.word(g)) {
        const fingroup::Elem x = G.gen(l - 1);
        auto v = values_.find(Key{x});
        if (v == values_.end()) throw std::invalid_argument("1-cochain has no value on generator " + x.to_string());
        t = C_->action()[l - 1](t) + v->second;
    }
    values_.emplace(Key{g}, t);
    return t;
}

template<class X>
typename coho::CoChain<X>::MElem coho::CoChain<X>::operator()(const fingroup::Elem &g, const fingroup::Elem &h) const {
    if (degree_ != 2) throw std::invalid_argument("Cochain of degree " + std::to_string(degree_) + " called with two arguments");
    return lookup(Key{g, h});
}

template<class X>
bool coho::CoChain<X>::is_cocycle() const {
    const fingroup::Group &G = *C_->group();
    const std::vector<fingroup::Elem> elems = G.elements();
    std::vector<typename X::Hom> acts;
    for (const fingroup::Elem &g : elems) acts.push_back(C_->action(g));

    if (degree_ == 0) {
        const MElem m = (*this)();
        for (const typename X::Hom &a : C_->action()) {
            if (a(m) != m) return false;
        }
        return true;
    }
    if (degree_ == 1) {
        for (const fingroup::Elem &g : elems) {
            for (const fingroup::Elem &h : elems) {
                if ((*this)(g * h) != acts[h.index()]((*this)(g)) + (*this)(h)) return false;
            }
        }
        return true;
    }
    for (const fingroup::Elem &g : elems) {
        for (const fingroup::Elem &h : elems) {
            for (const fingroup::Elem &k : elems) {
                const MElem lhs = (*this)(g, h * k) + (*this)(h, k);
                const MElem rhs = acts[k.index()]((*this)(g, h)) + (*this)(g * h, k);
                if (lhs != rhs) return false;
            }
        }
    }
    return true;
}

template<class X>
coho::CoChain<X> coho::CoChain<X>::coboundary() const {
    const fingroup::Group &G = *C_->group();
    const std::vector<fingroup::Elem> elems = G.elements();
    std::map<Key, MElem> res;

    if (degree_ == 0) {
        const MElem m = (*this)();
        for (const fingroup::Elem &g : elems) res.emplace(Key{g}, C_->action(g, m) - m);
        return CoChain<X>(C_, 1, res);
    }
    if (degree_ == 1) {
        for (const fingroup::Elem &g : elems) {
            for (const fingroup::Elem &h : elems) {
                res.emplace(Key{g, h}, C_->action(h, (*this)(g)) + (*this)(h) - (*this)(g * h));
            }
        }
        return CoChain<X>(C_, 2, res);
    }
    throw std::invalid_argument("Coboundaries of 2-cochains are not supported");
}

template<class X>
bool coho::CoChain<X>::operator==(const CoChain<X> &rhs) const {
    if (C_.get() != rhs.C_.get() || degree_ != rhs.degree_) return false;
    const std::vector<fingroup::Elem> elems = C_->group()->elements();
    if (degree_ == 0) return (*this)() == rhs();
    if (degree_ == 1) {
        for (const fingroup::Elem &g : elems) {
            if ((*this)(g) != rhs(g)) return false;
        }
        return true;
    }
    for (const fingroup::Elem &g : elems) {
        for (const fingroup::Elem &h : elems) {
            if ((*this)(g, h) != rhs(g, h)) return false;
        }
    }
    return true;
}

template<class X>
bool coho::CoChain<X>::operator!=(const CoChain<X> &rhs) const {
    return !(*this == rhs);
}

template<class X>
std::string coho::CoChain<X>::to_string() const {
    std::stringstream ss;
    ss << degree_ << "-cochain";
    for (const auto &entry : values_) {
        ss << "\n  (";
        for (size_t i = 0; i < entry.first.size(); i++) ss << (i ? ", " : "") << entry.first[i].to_string();
        ss << ") -> " << entry.second.to_string();
    }
    return ss.str();
}

template class coho::CoChain<abelian::AbGroup>;
template class coho::CoChain<fpspace::FpSpace>;
template class coho::CoChain<multgrp::MultGrp>;
