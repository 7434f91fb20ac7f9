#include <iostream>
#include <string>
#include <vector>

#include "argot/argot.hpp"

// app [--] SRC... DST
int main(int argc, char** argv) {
    std::vector<std::string> sources;
    std::string target;
    bool recursive = false;

    argot::CommandSpec spec("cp");
    spec.addOption(argot::OptionSpec::builder({"-r", "-R", "--recursive"}).bind(recursive));
    spec.addPositional(argot::PositionalSpec::builder().index("0").bind(target).paramLabel("DST"));
    spec.addPositional(argot::PositionalSpec::builder().index("1..*").bind(sources).paramLabel("SRC"));
    spec.collectErrors();

    argot::Interpreter interp(spec, argot::ProcessConfig::fromEnvironment());
    const auto result = interp.parse(argc, argv);
    if (!result.errors().empty()) {
        for (const auto& e : result.errors()) std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    for (const auto& src : sources) {
        std::cout << (recursive ? "copy -r " : "copy ") << src << " -> " << target << "\n";
    }
    return 0;
}
