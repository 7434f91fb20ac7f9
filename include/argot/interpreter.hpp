#ifndef ARGOT_INTERPRETER_HPP
#define ARGOT_INTERPRETER_HPP

#include <any>
#include <deque>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "argfile.hpp"
#include "command.hpp"
#include "config.hpp"
#include "result.hpp"
#include "trace.hpp"

namespace argot {

// Walks an expanded token stream against a CommandSpec, binding typed values.
//
// Constructing an Interpreter seals the spec (and its subcommands) and reads the
// ProcessConfig once. Each subcommand gets its own child Interpreter. parse() may be
// called repeatedly; every bound target is reset to its original default first.
// Not safe for concurrent use.
class Interpreter {
    // Only an Interpreter can create the interpreters of its subcommands.
    struct ChildKey {
        explicit ChildKey() = default;
    };

public:
    explicit Interpreter(CommandSpec& spec, ProcessConfig process = {}, std::shared_ptr<const FileSystem> fs = nullptr);
    // Shares the parent's tracer, file system and process config.
    Interpreter(ChildKey, CommandSpec& spec, const Interpreter& parent);

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    [[nodiscard]] const CommandSpec& spec() const { return spec_; }
    [[nodiscard]] Tracer& tracer() { return *tracer_; }

    // Throws the first ParameterError unless the spec collects errors.
    ParseResult parse(const std::vector<std::string>& args);
    // argv[0] is the program name and is skipped.
    ParseResult parse(int argc, char** argv);

    struct AtFileUsage {
        std::string label;
        std::string description;
    };

    // The entry a help renderer shows for "@file" arguments.
    [[nodiscard]] AtFileUsage atFileUsage() const;

    // Per-spec parser settings with the process-wide overrides applied.
    [[nodiscard]] const ParserConfig& config() const { return config_; }

private:
    struct Context;
    struct Level;
    struct Taken;
    enum class LookBehind { Separate, Attached, AttachedWithSeparator };

    void prepare();
    void resetTree() const;
    void applyDefault(const ArgSpec& arg) const;

    void parseLevel(ParseResult& result, std::deque<std::string>& args, Context& ctx) const;
    void step(Level& lv, std::deque<std::string>& args) const;
    void finishLevel(Level& lv) const;
    void dispatch(Level& lv, const CommandSpec& sub, std::deque<std::string>& args) const;

    void processOption(Level& lv, const OptionSpec& option, bool negated, LookBehind lookBehind,
                       std::deque<std::string>& args) const;
    void processFlag(Level& lv, const OptionSpec& option, bool negated, LookBehind lookBehind,
                     std::deque<std::string>& args) const;
    void processCluster(Level& lv, const std::string& arg, std::deque<std::string>& args) const;
    void processPositionals(Level& lv, std::deque<std::string>& args) const;
    void addUnmatched(Level& lv, std::deque<std::string>& args, bool optionLike) const;

    Taken takeValues(const Level& lv, const ArgSpec& arg, const Range& arity, LookBehind lookBehind,
                     std::deque<std::string>& args) const;
    void store(Level& lv, const ArgSpec& arg, Taken taken) const;

    [[nodiscard]] std::vector<std::any> convertRaw(const ArgSpec& arg, const std::string& raw) const;
    [[nodiscard]] std::any convertOne(const ArgSpec& arg, std::size_t auxIndex, const std::string& text) const;
    [[nodiscard]] std::vector<std::string> split(const ArgSpec& arg, const std::string& value) const;

    [[nodiscard]] bool isClusterStart(const std::string& arg) const;
    [[nodiscard]] bool isKnownOptionToken(const std::string& arg) const;
    [[nodiscard]] bool resemblesOption(const std::string& arg) const;
    [[nodiscard]] bool isBoundary(const Level& lv, const std::string& arg, bool mandatory) const;

    void warn(Context& ctx, const std::string& msg) const;
    // Records `error` when collecting errors, throws it otherwise.
    template <typename E>
    void report(Context& ctx, const E& error) const;
    [[nodiscard]] UnmatchedArgumentError unmatchedError(const Level& lv) const;

    CommandSpec& spec_;
    ProcessConfig process_;
    ParserConfig config_;
    std::shared_ptr<Tracer> tracer_;
    std::shared_ptr<const FileSystem> fs_;

    std::vector<const PositionalSpec*> positionals_;
    std::vector<std::string> optionNames_;
    std::unordered_map<const ArgSpec*, std::regex> splitters_;
    std::unordered_map<const CommandSpec*, std::unique_ptr<Interpreter>> children_;
};

} // namespace argot

#endif // ARGOT_INTERPRETER_HPP
