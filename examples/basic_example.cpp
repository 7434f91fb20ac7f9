#include <iostream>
#include <string>

#include "argot/argot.hpp"

int main(int argc, char** argv) {
    bool verbose = false;
    int count = 1;
    std::string message = "Hello, World!";

    argot::CommandSpec spec("app");
    spec.version("0.1.0").description("Prints a message a number of times");
    spec.addOption(argot::OptionSpec::builder({"-v", "--verbose"}).bind(verbose).negatable().description("Enable verbose output"));
    spec.addOption(argot::OptionSpec::builder({"-n", "--count"}).bind(count).defaultValue("1").description("Repetitions"));
    spec.addOption(argot::OptionSpec::builder({"-m", "--message"}).bind(message).description("Message to print"));
    spec.addOption(argot::OptionSpec::builder({"-h", "--help"}).usageHelp());

    argot::Interpreter interp(spec, argot::ProcessConfig::fromEnvironment());
    try {
        const auto result = interp.parse(argc, argv);
        if (result.isUsageHelpRequested()) {
            std::cout << "Usage: app [-v] [-n=<count>] [-m=<message>]\n";
            return 0;
        }
        if (verbose) std::cout << "printing " << count << " time(s)\n";
        for (int i = 0; i < count; ++i) std::cout << message << "\n";
    } catch (const argot::ParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
