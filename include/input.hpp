#include "gmodule.hpp"
#include "fingroup.hpp"

#include <gmpxx.h>
#include <map>
#include <sstream>

namespace Input {
struct Config {
    bool pretty = true; // Pretty print?
    bool force_rws = false; // Use the shortlex rewriting system for H^2 even for pc groups?
    int verbose = 0; // 1 = phases, 2 = phases and timings
    int assert_level = 0; // 1 = consistency checks, 2 = also the cubic ones
};

enum CMD_TYPE {
    grp, // Set the group
    mod, // Set the module
    act, // Set the action of a generator
    coh, // Print a cohomology group
    tate, // Print the Tate cohomology group in degree 0
    ext, // Build the extension for a generator of H^2
    end,
};

template<class X>
class InputHandler {
private:
    std::istream &in_;
    std::ostream &out_;
    std::ostream &err_;

    const Config config_;

    fingroup::GroupPtr G_;
    typename X::Ptr M_;
    std::map<size_t, typename X::Hom> actions_; // Generators not listed act trivially
    coho::GModulePtr<X> C_; // Built on first use, dropped when the input changes

    void set_group(const std::string &rest);
    void set_module(const std::string &rest);
    void set_action(const std::string &rest);
    const coho::GModule<X>& gmodule();

    void print(const std::string &label, const std::string &value);

    // Return true if end
    bool eval(std::string &cmd, std::string &rest);

    // Return true if end
    bool handle_line(const std::string &input, int& line);

public:
    InputHandler(std::istream &in, std::ostream &out, std::ostream &err, Config config = Config());

    // Handles input until end or the end of the stream
    void handle_input();
};
};
