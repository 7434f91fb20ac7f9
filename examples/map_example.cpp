#include <iostream>
#include <map>
#include <string>

#include "argot/argot.hpp"

static std::string render(const std::map<std::string, std::string>& m) {
    std::string out;
    for (const auto& [k, v] : m) {
        if (!out.empty()) out.push_back(',');
        out += k + "=" + v;
    }
    return out;
}

int main(int argc, char** argv) {
    std::map<std::string, std::string> labels;
    std::map<std::string, int> limits;

    argot::CommandSpec spec("app");
    spec.addOption(argot::OptionSpec::builder({"-l", "--label"}).bind(labels).splitRegex(",").description("Key/value labels"));
    spec.addOption(argot::OptionSpec::builder({"--limit"}).bind(limits).paramLabel("<name=n>"));

    argot::Interpreter interp(spec, argot::ProcessConfig::fromEnvironment());
    try {
        (void)interp.parse(argc, argv);
    } catch (const argot::ParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    std::cout << "labels=" << render(labels) << "\n";
    for (const auto& [name, n] : limits) std::cout << "limit " << name << " " << n << "\n";
    return 0;
}
