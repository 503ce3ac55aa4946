#include "../include/abelian.hpp"
#include "../include/cohomology.hpp"
#include "../include/extension.hpp"
#include "../include/fpspace.hpp"
#include "../include/multgrp.hpp"
#include "../include/input.hpp"

#include <iostream>
#include <istream>
#include <string>
#include <vector>

template<class X>
Input::InputHandler<X>::InputHandler(std::istream &in, std::ostream &out, std::ostream &err, Config config) :
    in_(in), out_(out), err_(err), config_(config) {
    if (config.verbose < 0) throw std::invalid_argument("Invalid verbosity");
}

std::vector<std::string> tokenize(const std::string &input) {
    std::istringstream ss(input);
    std::vector<std::string> tokens;
    std::string token;
    while (ss >> token) tokens.push_back(token);
    return tokens;
}

size_t parse_size(const std::string &input) {
    int n = 0;
    size_t pos = 0;
    try {
        n = std::stoi(input, &pos);
    } catch (const std::exception &e) {
        throw std::invalid_argument("Unable to parse '" + input + "', expected a number.");
    }
    // stoi stops at the first character that is not a digit
    if (pos != input.size()) throw std::invalid_argument("Unable to parse '" + input + "', expected a number.");
    if (n < 0) throw std::invalid_argument("Expected a nonnegative number, got " + input);
    return (size_t) n;
}

// The single number after a command
size_t parse_count(const std::string &rest, const std::string &usage) {
    const std::vector<std::string> args = tokenize(rest);
    if (args.size() != 1) throw std::invalid_argument("Expected '" + usage + "'");
    return parse_size(args[0]);
}

mpz_class parse_coeff(const std::string &input) {
    try {
        if (!input.empty() && input[0] == '+') return mpz_class(input.substr(1));
        return mpz_class(input);
    } catch (const std::exception &e) {
        throw std::invalid_argument("Unable to parse '" + input + "', expected an integer.");
    }
}

// Product of cycles such as (1,2)(3,4,5) on 1..degree, as the list of images
std::vector<int> parse_cycles(const size_t degree, const std::string &input) {
    std::vector<int> perm(degree);
    for (size_t x = 0; x < degree; x++) perm[x] = (int) x + 1;

    size_t cur = 0;
    while (cur < input.size()) {
        if (input[cur] != '(') throw std::invalid_argument("Failed to parse permutation '" + input + "'. Expected '('.");
        size_t close = input.find(')', cur);
        if (close == std::string::npos) throw std::invalid_argument("Failed to parse permutation '" + input + "'. Missing ')'.");

        std::vector<int> cycle;
        std::string inner = input.substr(cur + 1, close - cur - 1);
        for (char &ch : inner) {
            if (ch == ',') ch = ' ';
        }
        for (const std::string &s : tokenize(inner)) {
            const size_t x = parse_size(s);
            if (x < 1 || x > degree) throw std::invalid_argument("Point " + s + " is not in 1.." + std::to_string(degree));
            cycle.push_back((int) x);
        }

        // Cycles are applied left to right
        std::vector<int> c(degree);
        for (size_t x = 0; x < degree; x++) c[x] = (int) x + 1;
        for (size_t i = 0; i < cycle.size(); i++) c[cycle[i] - 1] = cycle[(i + 1) % cycle.size()];
        for (size_t x = 0; x < degree; x++) perm[x] = c[perm[x] - 1];
        cur = close + 1;
    }
    return perm;
}

template<class X>
typename X::Ptr parse_module(const std::vector<std::string> &args);

// Invariants, 0 stands for Z
template<>
abelian::AbGroupPtr parse_module<abelian::AbGroup>(const std::vector<std::string> &args) {
    std::vector<mpz_class> orders;
    for (const std::string &s : args) orders.push_back(parse_coeff(s));
    return abelian::AbGroup::create(orders);
}

// Characteristic and dimension
template<>
fpspace::FpSpacePtr parse_module<fpspace::FpSpace>(const std::vector<std::string> &args) {
    if (args.size() != 2) throw std::invalid_argument("Expected 'module p dim'");
    return fpspace::FpSpace::create(parse_coeff(args[0]), parse_size(args[1]));
}

// Units mod a prime p, acted on through the logarithms: 'act 1 k' is x -> x^k
template<>
multgrp::MultGrpPtr parse_module<multgrp::MultGrp>(const std::vector<std::string> &args) {
    if (args.size() != 1) throw std::invalid_argument("Expected 'module p'");
    return multgrp::MultGrp::units(parse_coeff(args[0]));
}

template<class X>
void Input::InputHandler<X>::set_group(const std::string &rest) {
    const std::vector<std::string> args = tokenize(rest);
    if (args.empty()) throw std::invalid_argument("Expected a group");

    const std::string &kind = args[0];
    if (kind == "trivial") {
        G_ = fingroup::Group::trivial();
    } else if (kind == "cyclic" || kind == "sym" || kind == "dihedral") {
        if (args.size() != 2) throw std::invalid_argument("Expected 'group " + kind + " n'");
        const size_t n = parse_size(args[1]);
        if (kind == "cyclic") G_ = fingroup::Group::cyclic(n);
        else if (kind == "sym") G_ = fingroup::Group::symmetric(n);
        else G_ = fingroup::Group::dihedral(n);
    } else if (kind == "perm") {
        if (args.size() < 2) throw std::invalid_argument("Expected 'group perm degree cycles...'");
        const size_t degree = parse_size(args[1]);
        std::vector<std::vector<int>> gens;
        for (size_t i = 2; i < args.size(); i++) gens.push_back(parse_cycles(degree, args[i]));
        G_ = fingroup::Group::from_permutations(degree, gens);
    } else {
        throw std::invalid_argument("Unknown group '" + kind + "'");
    }

    actions_.clear();
    C_ = nullptr;
    if (config_.pretty) out_ << "Group of order " << G_->order() << " on " << G_->ngens() << " generators" << std::endl;
}

template<class X>
void Input::InputHandler<X>::set_module(const std::string &rest) {
    M_ = parse_module<X>(tokenize(rest));
    actions_.clear();
    C_ = nullptr;
    if (config_.pretty) out_ << "Module " << M_->to_string() << std::endl;
}

template<class X>
void Input::InputHandler<X>::set_action(const std::string &rest) {
    if (G_ == nullptr || M_ == nullptr) throw std::invalid_argument("Set the group and the module before the action");
    const std::vector<std::string> args = tokenize(rest);
    if (args.empty()) throw std::invalid_argument("Expected 'act gen entries...'");

    const size_t gen = parse_size(args[0]);
    if (gen < 1 || gen > G_->ngens()) throw std::invalid_argument("The group has no generator " + args[0]);
    const size_t n = M_->ngens();
    if (args.size() != 1 + n * n) throw std::invalid_argument("Expected " + std::to_string(n * n) + " matrix entries, got "
            + std::to_string(args.size() - 1));

    // Row i is the image of the i-th module generator
    matrix::ZMatrix mat(n, n);
    for (size_t i = 0; i < n; i++) {
        for (size_t j = 0; j < n; j++) mat(i, j) = parse_coeff(args[1 + i * n + j]);
    }
    typename X::Hom h = X::hom(M_, M_, mat, true);
    if (!h.is_bijective()) throw std::invalid_argument("Action of generator " + args[0] + " is not invertible");

    actions_[gen - 1] = h;
    C_ = nullptr;
}

template<class X>
const coho::GModule<X>& Input::InputHandler<X>::gmodule() {
    if (C_ != nullptr) return *C_;
    if (G_ == nullptr || M_ == nullptr) throw std::invalid_argument("Set the group and the module first");

    std::vector<typename X::Hom> ac;
    for (size_t i = 0; i < G_->ngens(); i++) {
        auto it = actions_.find(i);
        ac.push_back(it == actions_.end() ? X::identity(M_) : it->second);
    }

    coho::Config config;
    config.verbose = config_.verbose;
    config.assert_level = config_.assert_level;
    config.log = &err_;
    C_ = coho::GModule<X>::create(G_, M_, ac, config);
    if (config_.assert_level < 1 && !C_->is_consistent()) {
        C_ = nullptr;
        throw std::invalid_argument("Action does not define a module for the group");
    }
    return *C_;
}

template<class X>
void Input::InputHandler<X>::print(const std::string &label, const std::string &value) {
    if (config_.pretty) out_ << label << ": ";
    out_ << value << std::endl;
}

// Return true if end
template<class X>
bool Input::InputHandler<X>::eval(std::string &cmd, std::string &rest) {
    CMD_TYPE cmd_type;
    if (cmd == "group" || cmd == "g") cmd_type = CMD_TYPE::grp;
    else if (cmd == "module" || cmd == "m") cmd_type = CMD_TYPE::mod;
    else if (cmd == "act" || cmd == "a") cmd_type = CMD_TYPE::act;
    else if (cmd == "coho" || cmd == "h") cmd_type = CMD_TYPE::coh;
    else if (cmd == "tate" || cmd == "t") cmd_type = CMD_TYPE::tate;
    else if (cmd == "ext" || cmd == "x") cmd_type = CMD_TYPE::ext;
    else if (cmd == "end" || cmd == "e") cmd_type = CMD_TYPE::end;
    else throw std::invalid_argument("Invalid command " + cmd);

    switch (cmd_type) {
        case CMD_TYPE::grp: {
            set_group(rest);
            break;
        }
        case CMD_TYPE::mod: {
            set_module(rest);
            break;
        }
        case CMD_TYPE::act: {
            set_action(rest);
            break;
        }
        case CMD_TYPE::coh: {
            const int i = (int) parse_count(rest, "coho i");
            const coho::GModule<X> &C = gmodule();
            const std::string label = "H^" + std::to_string(i);
            if (i == 2) print(label, C.h_two(config_.force_rws)->to_string());
            else print(label, C.cohomology_group(i)->to_string());
            break;
        }
        case CMD_TYPE::tate: {
            print("H^0 (Tate)", gmodule().h_zero_tate()->to_string());
            break;
        }
        case CMD_TYPE::ext: {
            const size_t k = parse_count(rest, "ext k");
            const coho::GModule<X> &C = gmodule();
            const std::shared_ptr<const coho::H2<X>> H = C.h_two(config_.force_rws);
            const typename X::Hom iso = X::snf(H->group());
            if (k < 1 || k > iso.domain()->ngens()) throw std::invalid_argument("H^2 = " + H->to_string()
                    + " has no generator " + rest);
            const coho::CoChain<X> c = H->to_cochain(iso.image(k - 1));

            if (C.group()->has_pc() && C.module()->is_finite()) {
                const coho::PcExtension<X> E(c);
                print("Extension of order", std::to_string(E.group()->order()));
            } else {
                const coho::Extension<X> E(c);
                if (E.has_group()) print("Extension of order", std::to_string(E.group()->order()));
                else print("Extension", E.presentation().to_string());
            }
            break;
        }
        case CMD_TYPE::end: return true;
    }

    return false;
}

// Return true if end
template<class X>
bool Input::InputHandler<X>::handle_line(const std::string &input, int& line) {
    const size_t first = input.find_first_not_of(" \t\r");
    if (first == std::string::npos || input[first] == '#') return false;

    const size_t split = input.find_first_of(" \t", first);
    std::string cmd = input.substr(first, split == std::string::npos ? std::string::npos : split - first);
    std::string rest = split == std::string::npos ? "" : input.substr(split + 1);

    line++;
    try {
        return eval(cmd, rest);
    } catch (const std::exception &e) {
        line--;
        err_ << " Error: " << e.what() << std::endl;
    }
    return false;
}

template<class X>
void Input::InputHandler<X>::handle_input() {
    std::string input;
    int line = 0;
    while (std::getline(in_, input)) {
        if (handle_line(input, line)) break;
    }
    if (config_.pretty) out_ << "Handled " << line << " commands." << std::endl;
}

template class Input::InputHandler<abelian::AbGroup>;
template class Input::InputHandler<fpspace::FpSpace>;
template class Input::InputHandler<multgrp::MultGrp>;
