#include "argot/command.hpp"

#include <algorithm>

#include "argot/errors.hpp"
#include "argot/utils.hpp"

namespace argot {

CommandSpec::CommandSpec(std::string name) : name_(std::move(name)), converters_(ConverterRegistry::withBuiltins()) {
    if (name_.empty()) throw InitializationError("A command must have a name");
}

void CommandSpec::checkMutable() const {
    if (sealed_) throw InitializationError("Command '" + name_ + "' is in use by an interpreter and can no longer be changed");
}

std::string CommandSpec::key(const std::string& name) const {
    return parser_.caseInsensitiveOptions ? utils::toLowerAscii(name) : name;
}

std::string CommandSpec::subcommandKey(const std::string& name) const {
    return parser_.caseInsensitiveSubcommands ? utils::toLowerAscii(name) : name;
}

CommandSpec& CommandSpec::version(std::string v) {
    checkMutable();
    version_ = std::move(v);
    return *this;
}

CommandSpec& CommandSpec::description(std::string d) {
    checkMutable();
    description_ = std::move(d);
    return *this;
}

CommandSpec& CommandSpec::header(std::string h) {
    checkMutable();
    header_ = std::move(h);
    return *this;
}

CommandSpec& CommandSpec::footer(std::string f) {
    checkMutable();
    footer_ = std::move(f);
    return *this;
}

CommandSpec& CommandSpec::separator(std::string s) {
    checkMutable();
    if (s.empty()) throw InitializationError("Separator for command '" + name_ + "' must not be empty");
    parser_.separator = std::move(s);
    return *this;
}

CommandSpec& CommandSpec::aliases(std::vector<std::string> a) {
    checkMutable();
    aliases_ = std::move(a);
    return *this;
}

CommandSpec& CommandSpec::addAlias(std::string a) {
    checkMutable();
    aliases_.push_back(std::move(a));
    return *this;
}

void CommandSpec::indexOption(const std::shared_ptr<OptionSpec>& option) {
    auto claim = [&](const std::string& name, bool negated) {
        const auto k = key(name);
        const auto it = optionIndex_.find(k);
        if (it != optionIndex_.end()) {
            const std::string other = it->second.option->longestName();
            if (parser_.caseInsensitiveOptions && other != option->longestName()) {
                throw InitializationError("Option name '" + name + "' is not unique in command '" + name_ +
                                          "': it collides with '" + other + "' when case is ignored");
            }
            throw InitializationError("Option name '" + name + "' is used by both " + it->second.option->displayName() +
                                      " and " + option->displayName());
        }
        optionIndex_.emplace(k, OptionMatch{option.get(), negated});
    };
    for (const auto& n : option->names()) claim(n, false);
    for (const auto& n : option->negatedNames()) claim(n, true);
}

void CommandSpec::rebuildOptionIndex() {
    optionIndex_.clear();
    for (const auto& o : options_) indexOption(o);
}

CommandSpec& CommandSpec::addOption(std::shared_ptr<OptionSpec> option) {
    checkMutable();
    if (!option) throw InitializationError("Cannot add a null option to command '" + name_ + "'");
    indexOption(option);
    options_.push_back(std::move(option));
    return *this;
}

CommandSpec& CommandSpec::addPositional(std::shared_ptr<PositionalSpec> positional) {
    checkMutable();
    if (!positional) throw InitializationError("Cannot add a null positional parameter to command '" + name_ + "'");
    positionals_.push_back(std::move(positional));
    return *this;
}

CommandSpec& CommandSpec::addMixin(std::string name, CommandSpec mixin) {
    checkMutable();
    if (name.empty()) throw InitializationError("A mixin must have a name");
    if (findMixin(name)) throw InitializationError("Mixin '" + name + "' is already part of command '" + name_ + "'");

    for (const auto& o : mixin.options_) addOption(o);
    for (const auto& p : mixin.positionals_) addPositional(p);
    for (auto& sub : mixin.subcommands_) addSubcommand(std::move(*sub));
    mixin.subcommands_.clear();

    // The owner keeps anything it set itself; earlier mixins beat later ones.
    if (version_.empty()) version_ = mixin.version_;
    if (description_.empty()) description_ = mixin.description_;
    if (header_.empty()) header_ = mixin.header_;
    if (footer_.empty()) footer_ = mixin.footer_;
    if (parser_.separator == "=") parser_.separator = mixin.parser_.separator;

    mixins_.emplace_back(std::move(name), std::make_unique<CommandSpec>(std::move(mixin)));
    return *this;
}

CommandSpec& CommandSpec::addSubcommand(CommandSpec sub) {
    checkMutable();
    std::vector<std::string> names{sub.name_};
    names.insert(names.end(), sub.aliases_.begin(), sub.aliases_.end());
    for (const auto& n : names) {
        if (n.empty()) throw InitializationError("Subcommand names of '" + name_ + "' must not be empty");
        if (const auto* existing = findSubcommand(n)) {
            throw InitializationError("Another subcommand named '" + n + "' already exists for command '" + name_ +
                                      "' (" + existing->name_ + ")");
        }
    }
    subcommands_.push_back(std::make_unique<CommandSpec>(std::move(sub)));
    return *this;
}

CommandSpec& CommandSpec::registerConverter(std::type_index type, Converter converter) {
    if (!converter) throw InitializationError("Cannot register an empty converter");
    return applyRecursively([&](CommandSpec& c) { c.converters_.add(type, converter); });
}

CommandSpec& CommandSpec::parser(ParserConfig cfg) {
    checkMutable();
    if (cfg.separator.empty()) throw InitializationError("Separator for command '" + name_ + "' must not be empty");
    const bool wasInsensitive = parser_.caseInsensitiveOptions;
    parser_ = std::move(cfg);
    if (wasInsensitive != parser_.caseInsensitiveOptions) rebuildOptionIndex();
    return *this;
}

CommandSpec& CommandSpec::endOfOptionsDelimiter(std::string d) {
    if (d.empty()) throw InitializationError("End-of-options delimiter must not be empty");
    return applyRecursively([&](CommandSpec& c) { c.parser_.endOfOptionsDelimiter = d; });
}

CommandSpec& CommandSpec::expandAtFiles(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.expandAtFiles = v; });
}

CommandSpec& CommandSpec::atFileCommentChar(std::optional<char> ch) {
    return applyRecursively([ch](CommandSpec& c) { c.parser_.atFileCommentChar = ch; });
}

CommandSpec& CommandSpec::useSimplifiedAtFiles(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.useSimplifiedAtFiles = v; });
}

CommandSpec& CommandSpec::trimQuotes(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.trimQuotes = v; });
}

CommandSpec& CommandSpec::posixClusteredShortOptionsAllowed(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.posixClusteredShortOptionsAllowed = v; });
}

CommandSpec& CommandSpec::unmatchedArgumentsAllowed(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.unmatchedArgumentsAllowed = v; });
}

CommandSpec& CommandSpec::unmatchedOptionsArePositionalParams(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.unmatchedOptionsArePositionalParams = v; });
}

CommandSpec& CommandSpec::unmatchedOptionsAllowedAsOptionParameters(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.unmatchedOptionsAllowedAsOptionParameters = v; });
}

CommandSpec& CommandSpec::stopAtUnmatched(bool v) {
    return applyRecursively([v](CommandSpec& c) {
        c.parser_.stopAtUnmatched = v;
        if (v) c.parser_.unmatchedArgumentsAllowed = true;
    });
}

CommandSpec& CommandSpec::stopAtPositional(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.stopAtPositional = v; });
}

CommandSpec& CommandSpec::overwrittenOptionsAllowed(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.overwrittenOptionsAllowed = v; });
}

CommandSpec& CommandSpec::toggleBooleanFlags(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.toggleBooleanFlags = v; });
}

CommandSpec& CommandSpec::caseInsensitiveOptions(bool v) {
    return applyRecursively([v](CommandSpec& c) {
        const bool before = c.parser_.caseInsensitiveOptions;
        c.parser_.caseInsensitiveOptions = v;
        try {
            c.rebuildOptionIndex();
        } catch (const InitializationError&) {
            c.parser_.caseInsensitiveOptions = before;
            c.rebuildOptionIndex();
            throw;
        }
    });
}

CommandSpec& CommandSpec::caseInsensitiveSubcommands(bool v) {
    return applyRecursively([v](CommandSpec& c) {
        if (v) {
            std::unordered_map<std::string, std::string> seen;
            for (const auto& sub : c.subcommands_) {
                std::vector<std::string> names{sub->name_};
                names.insert(names.end(), sub->aliases_.begin(), sub->aliases_.end());
                for (const auto& n : names) {
                    const auto [it, inserted] = seen.emplace(utils::toLowerAscii(n), n);
                    if (!inserted && it->second != n) {
                        throw InitializationError("Subcommand name '" + n + "' collides with '" + it->second +
                                                  "' in command '" + c.name_ + "' when case is ignored");
                    }
                }
            }
        }
        c.parser_.caseInsensitiveSubcommands = v;
    });
}

CommandSpec& CommandSpec::aritySatisfiedByAttachedOptionParam(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.aritySatisfiedByAttachedOptionParam = v; });
}

CommandSpec& CommandSpec::collectErrors(bool v) {
    return applyRecursively([v](CommandSpec& c) { c.parser_.collectErrors = v; });
}

CommandSpec::OptionMatch CommandSpec::findOption(const std::string& name) const {
    const auto it = optionIndex_.find(key(name));
    return it == optionIndex_.end() ? OptionMatch{} : it->second;
}

CommandSpec* CommandSpec::findSubcommand(const std::string& name) const {
    const auto k = subcommandKey(name);
    for (const auto& sub : subcommands_) {
        if (subcommandKey(sub->name_) == k) return sub.get();
        for (const auto& a : sub->aliases_) {
            if (subcommandKey(a) == k) return sub.get();
        }
    }
    return nullptr;
}

const CommandSpec* CommandSpec::findMixin(const std::string& name) const {
    for (const auto& [n, m] : mixins_) {
        if (n == name) return m.get();
    }
    return nullptr;
}

std::vector<std::string> CommandSpec::optionNames() const {
    std::vector<std::string> out;
    for (const auto& o : options_) {
        out.insert(out.end(), o->names().begin(), o->names().end());
        const auto negated = o->negatedNames();
        out.insert(out.end(), negated.begin(), negated.end());
    }
    return out;
}

void CommandSpec::validatePositionals() const {
    std::vector<const PositionalSpec*> sorted;
    sorted.reserve(positionals_.size());
    for (const auto& p : positionals_) sorted.push_back(p.get());
    std::stable_sort(sorted.begin(), sorted.end(), [](const PositionalSpec* a, const PositionalSpec* b) {
        return a->index().min() < b->index().min();
    });

    std::size_t next = 0;
    for (const auto* p : sorted) {
        if (p->index().min() > next) {
            throw InitializationError("Command '" + name_ + "' has no positional parameter at index " + std::to_string(next) +
                                      "; nearest is " + p->displayName());
        }
        if (p->index().isUnbounded()) return;
        next = std::max(next, p->index().max() + 1);
    }
}

void CommandSpec::validateConverters() const {
    auto check = [this](const ArgSpec& arg) {
        const auto types = arg.auxiliaryTypes();
        for (std::size_t i = 0; i < types.size(); ++i) {
            const bool custom = i < arg.converters().size() && arg.converters()[i];
            if (!custom && converters_.find(types[i]) == nullptr) {
                throw InitializationError("No converter registered for type " + std::string(types[i].name()) + " used by " +
                                          arg.displayName() + " in command '" + name_ + "'");
            }
        }
    };
    for (const auto& o : options_) check(*o);
    for (const auto& p : positionals_) check(*p);
}

void CommandSpec::seal() {
    if (sealed_) return;
    validatePositionals();
    validateConverters();
    for (auto& sub : subcommands_) sub->seal();
    sealed_ = true;
}

} // namespace argot
