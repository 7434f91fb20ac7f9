#include <iostream>
#include <string>
#include <vector>

#include "argot/argot.hpp"

int main(int argc, char** argv) {
    bool verbose = false;
    std::string message;
    bool all = false;
    std::string remoteName;
    std::string remoteUrl;

    argot::CommandSpec commit("commit");
    commit.addAlias("ci");
    commit.addOption(argot::OptionSpec::builder({"-m", "--message"}).bind(message).required());
    commit.addOption(argot::OptionSpec::builder({"-a", "--all"}).bind(all));

    argot::CommandSpec add("add");
    add.addPositional(argot::PositionalSpec::builder().index("0").bind(remoteName).paramLabel("NAME"));
    add.addPositional(argot::PositionalSpec::builder().index("1").bind(remoteUrl).paramLabel("URL"));
    argot::CommandSpec remote("remote");
    remote.addSubcommand(std::move(add));

    argot::CommandSpec git("git");
    git.addOption(argot::OptionSpec::builder({"-v", "--verbose"}).bind(verbose));
    git.addSubcommand(std::move(commit)).addSubcommand(std::move(remote));
    git.caseInsensitiveSubcommands();

    argot::Interpreter interp(git, argot::ProcessConfig::fromEnvironment());
    try {
        const auto result = interp.parse(argc, argv);
        std::string path;
        for (const auto* level : result.asCommandList()) {
            if (!path.empty()) path += " ";
            path += level->commandSpec().name();
        }
        std::cout << "command: " << path << (verbose ? " (verbose)" : "") << "\n";

        const auto chain = result.asCommandList();
        const auto& leaf = chain.back()->commandSpec().name();
        if (leaf == "commit") {
            std::cout << "commit" << (all ? " -a" : "") << ": " << message << "\n";
        } else if (leaf == "add") {
            std::cout << "remote " << remoteName << " -> " << remoteUrl << "\n";
        }
    } catch (const argot::ParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
