#ifndef ARGOT_RESULT_HPP
#define ARGOT_RESULT_HPP

#include <any>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "arg.hpp"
#include "errors.hpp"

namespace argot {

class CommandSpec;
class Interpreter;

// Outcome of one parse at one command level, chained to the subcommand level (if any).
//
// The top-level result also carries the original and expanded token lists, plus the
// errors and warnings of the whole chain. Typed values of a map argument are stored
// as std::pair<std::any, std::any>.
class ParseResult {
public:
    // Results are created by the Interpreter only.
    class Key {
        friend class Interpreter;
        explicit Key() = default;
    };

    ParseResult(Key, const CommandSpec& spec) : spec_(&spec) {}
    ParseResult(ParseResult&&) = default;
    ParseResult& operator=(ParseResult&&) = default;

    [[nodiscard]] const CommandSpec& commandSpec() const { return *spec_; }

    [[nodiscard]] const std::vector<const OptionSpec*>& matchedOptions() const { return options_; }
    [[nodiscard]] const std::vector<const PositionalSpec*>& matchedPositionals() const { return positionals_; }
    // Options and positionals in the order they first matched.
    [[nodiscard]] const std::vector<const ArgSpec*>& matchedArgs() const { return args_; }

    [[nodiscard]] bool isMatched(const ArgSpec& arg) const;
    // Accepts a full name ("--verbose") or one without its prefix ("verbose").
    [[nodiscard]] bool hasMatchedOption(const std::string& name) const { return matchedOption(name) != nullptr; }
    [[nodiscard]] const OptionSpec* matchedOption(const std::string& name) const;
    // The matched positional whose index range contains `position`.
    [[nodiscard]] const PositionalSpec* matchedPositional(std::size_t position) const;

    template <typename T>
    [[nodiscard]] T matchedOptionValue(const std::string& name, T defaultValue) const {
        const auto* option = matchedOption(name);
        return option ? option->getValue<T>() : defaultValue;
    }

    template <typename T>
    [[nodiscard]] T matchedPositionalValue(std::size_t position, T defaultValue) const {
        const auto* positional = matchedPositional(position);
        return positional ? positional->getValue<T>() : defaultValue;
    }

    // Raw tokens consumed for `arg`, before quote trimming and splitting.
    [[nodiscard]] const std::vector<std::string>& originalStringValues(const ArgSpec& arg) const;
    [[nodiscard]] const std::vector<std::any>& typedValues(const ArgSpec& arg) const;

    [[nodiscard]] const std::vector<std::string>& unmatched() const { return unmatched_; }
    [[nodiscard]] const std::vector<std::string>& originalArgs() const { return originalArgs_; }
    [[nodiscard]] const std::vector<std::string>& expandedArgs() const { return expandedArgs_; }
    [[nodiscard]] const std::vector<ParameterError>& errors() const { return errors_; }
    [[nodiscard]] const std::vector<std::string>& warnings() const { return warnings_; }

    [[nodiscard]] bool isUsageHelpRequested() const { return usageHelpRequested_; }
    [[nodiscard]] bool isVersionHelpRequested() const { return versionHelpRequested_; }

    [[nodiscard]] bool hasSubcommand() const { return subcommand_ != nullptr; }
    [[nodiscard]] const ParseResult* subcommand() const { return subcommand_.get(); }
    // This result followed by each nested subcommand result.
    [[nodiscard]] std::vector<const ParseResult*> asCommandList() const;

private:
    friend class Interpreter;

    void addMatch(const ArgSpec& arg, std::vector<std::string> raw, std::vector<std::any> typed);
    void addPosition(const PositionalSpec& positional, std::size_t position) { positions_.emplace_back(position, &positional); }

    const CommandSpec* spec_;
    std::vector<const OptionSpec*> options_;
    std::vector<const PositionalSpec*> positionals_;
    std::vector<const ArgSpec*> args_;
    std::vector<std::pair<std::size_t, const PositionalSpec*>> positions_;
    std::unordered_map<const ArgSpec*, std::vector<std::string>> raw_;
    std::unordered_map<const ArgSpec*, std::vector<std::any>> typed_;

    std::vector<std::string> unmatched_;
    std::vector<std::string> originalArgs_;
    std::vector<std::string> expandedArgs_;
    std::vector<ParameterError> errors_;
    std::vector<std::string> warnings_;
    bool usageHelpRequested_{false};
    bool versionHelpRequested_{false};
    std::unique_ptr<ParseResult> subcommand_;
};

} // namespace argot

#endif // ARGOT_RESULT_HPP
