#include <iostream>
#include <string>
#include <vector>

#include "argot/argot.hpp"

// Try: app @options.txt extra   (and "@@literal" for an escaped at-sign)
int main(int argc, char** argv) {
    std::string name;
    std::vector<std::string> rest;

    argot::CommandSpec spec("app");
    spec.addOption(argot::OptionSpec::builder({"--name"}).bind(name));
    spec.addPositional(argot::PositionalSpec::builder().bind(rest).paramLabel("ARGS"));
    spec.atFileCommentChar('#').unmatchedArgumentsAllowed();

    const auto process = argot::ProcessConfig::fromEnvironment();
    argot::Interpreter interp(spec, process);
    const bool simplified = interp.config().useSimplifiedAtFiles;

    const auto usage = interp.atFileUsage();
    std::cout << "  " << usage.label << "  " << usage.description << "\n";
    std::cout << "mode: " << (simplified ? "simplified" : "classic") << "\n";

    try {
        const auto result = interp.parse(argc, argv);
        std::cout << "expanded:";
        for (const auto& arg : result.expandedArgs()) std::cout << " [" << arg << "]";
        std::cout << "\n";
        for (const auto& w : result.warnings()) std::cout << "warning: " << w << "\n";
        std::cout << "name=" << name << " args=" << rest.size() << "\n";
    } catch (const argot::ParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
