#ifndef ARGOT_COMMAND_HPP
#define ARGOT_COMMAND_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "arg.hpp"
#include "config.hpp"
#include "convert.hpp"

namespace argot {

// Named aggregate of options, positionals, mixins and subcommands.
//
// A spec is assembled with the fluent setters below and sealed when an Interpreter
// is constructed for it; after that every mutator throws InitializationError.
// Subcommands and mixins are owned children, so the tree has no back-references.
class CommandSpec {
public:
    explicit CommandSpec(std::string name = "<main class>");

    CommandSpec(CommandSpec&&) = default;
    CommandSpec& operator=(CommandSpec&&) = default;
    CommandSpec(const CommandSpec&) = delete;
    CommandSpec& operator=(const CommandSpec&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }

    // Mixin-mergeable attributes; empty (or "=" for the separator) means default.
    CommandSpec& version(std::string v);
    CommandSpec& description(std::string d);
    CommandSpec& header(std::string h);
    CommandSpec& footer(std::string f);
    CommandSpec& separator(std::string s);
    [[nodiscard]] const std::string& version() const { return version_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::string& header() const { return header_; }
    [[nodiscard]] const std::string& footer() const { return footer_; }
    [[nodiscard]] const std::string& separator() const { return parser_.separator; }

    CommandSpec& aliases(std::vector<std::string> a);
    CommandSpec& addAlias(std::string a);
    [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }

    CommandSpec& addOption(std::shared_ptr<OptionSpec> option);
    CommandSpec& addOption(const OptionSpec::Builder& builder) { return addOption(builder.build()); }
    CommandSpec& addPositional(std::shared_ptr<PositionalSpec> positional);
    CommandSpec& addPositional(const PositionalSpec::Builder& builder) { return addPositional(builder.build()); }

    // Merges the fragment's arguments (in declaration order), subcommands and any
    // attribute still at its default here, then keeps the fragment under `name`.
    CommandSpec& addMixin(std::string name, CommandSpec mixin);

    // Registered under the subcommand's own name plus its aliases.
    CommandSpec& addSubcommand(CommandSpec sub);

    // Registers with this command and every subcommand present at the time of the call.
    template <typename T, typename F>
    CommandSpec& registerConverter(F fn) {
        return registerConverter(std::type_index(typeid(T)), makeConverter<T>(std::move(fn)));
    }
    CommandSpec& registerConverter(std::type_index type, Converter converter);

    // Parser configuration. Setters apply to this command and to the subcommands
    // registered so far.
    [[nodiscard]] const ParserConfig& parser() const { return parser_; }
    CommandSpec& parser(ParserConfig cfg);
    CommandSpec& endOfOptionsDelimiter(std::string d);
    CommandSpec& expandAtFiles(bool v = true);
    CommandSpec& atFileCommentChar(std::optional<char> c);
    CommandSpec& useSimplifiedAtFiles(bool v = true);
    CommandSpec& trimQuotes(bool v = true);
    CommandSpec& posixClusteredShortOptionsAllowed(bool v = true);
    CommandSpec& unmatchedArgumentsAllowed(bool v = true);
    CommandSpec& unmatchedOptionsArePositionalParams(bool v = true);
    CommandSpec& unmatchedOptionsAllowedAsOptionParameters(bool v = true);
    CommandSpec& stopAtUnmatched(bool v = true);
    CommandSpec& stopAtPositional(bool v = true);
    CommandSpec& overwrittenOptionsAllowed(bool v = true);
    CommandSpec& toggleBooleanFlags(bool v = true);
    // Fails fast if two option names only differ by case.
    CommandSpec& caseInsensitiveOptions(bool v = true);
    CommandSpec& caseInsensitiveSubcommands(bool v = true);
    CommandSpec& aritySatisfiedByAttachedOptionParam(bool v = true);
    CommandSpec& collectErrors(bool v = true);

    [[nodiscard]] const std::vector<std::shared_ptr<OptionSpec>>& options() const { return options_; }
    [[nodiscard]] const std::vector<std::shared_ptr<PositionalSpec>>& positionals() const { return positionals_; }
    [[nodiscard]] const std::vector<std::unique_ptr<CommandSpec>>& subcommands() const { return subcommands_; }
    [[nodiscard]] const std::vector<std::pair<std::string, std::unique_ptr<CommandSpec>>>& mixins() const { return mixins_; }
    [[nodiscard]] const ConverterRegistry& converters() const { return converters_; }

    struct OptionMatch {
        OptionSpec* option{nullptr};
        bool negated{false};
    };

    // Looks up a full option name under the current case rule.
    [[nodiscard]] OptionMatch findOption(const std::string& name) const;
    [[nodiscard]] CommandSpec* findSubcommand(const std::string& name) const;
    [[nodiscard]] const CommandSpec* findMixin(const std::string& name) const;

    // All accepted option spellings, negated forms included.
    [[nodiscard]] std::vector<std::string> optionNames() const;

    // Validates index coverage and converter availability, then freezes the spec.
    void seal();
    [[nodiscard]] bool sealed() const { return sealed_; }

private:
    template <typename F>
    CommandSpec& applyRecursively(F fn) {
        checkMutable();
        fn(*this);
        for (auto& sub : subcommands_) sub->applyRecursively(fn);
        return *this;
    }

    void checkMutable() const;
    [[nodiscard]] std::string key(const std::string& name) const;
    [[nodiscard]] std::string subcommandKey(const std::string& name) const;
    void indexOption(const std::shared_ptr<OptionSpec>& option);
    void rebuildOptionIndex();
    void validatePositionals() const;
    void validateConverters() const;

    std::string name_;
    std::string version_;
    std::string description_;
    std::string header_;
    std::string footer_;
    std::vector<std::string> aliases_;
    ParserConfig parser_;
    ConverterRegistry converters_;

    std::vector<std::shared_ptr<OptionSpec>> options_;
    std::vector<std::shared_ptr<PositionalSpec>> positionals_;
    std::vector<std::unique_ptr<CommandSpec>> subcommands_;
    std::vector<std::pair<std::string, std::unique_ptr<CommandSpec>>> mixins_;

    std::unordered_map<std::string, OptionMatch> optionIndex_;
    bool sealed_{false};
};

} // namespace argot

#endif // ARGOT_COMMAND_HPP
