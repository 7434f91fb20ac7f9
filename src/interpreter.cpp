#include "argot/interpreter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>
#include <set>
#include <stdexcept>
#include <utility>

#include "argot/convert.hpp"
#include "argot/errors.hpp"
#include "argot/utils.hpp"

namespace argot {

struct Interpreter::Context {
    ParseResult& root;
    std::size_t total;
    bool helpRequested{false};
};

struct Interpreter::Level {
    Level(ParseResult& r, Context& c) : result(r), ctx(c) {}

    void satisfy(const ArgSpec* arg) { required.erase(std::remove(required.begin(), required.end(), arg), required.end()); }

    ParseResult& result;
    Context& ctx;
    std::set<const ArgSpec*> initialized;
    std::vector<const ArgSpec*> required;
    std::size_t position{0};
    std::size_t firstUnmatched{0};
    bool unmatchedAreOptions{true};
    bool endOfOptions{false};
    bool dispatched{false};
};

// Raw tokens taken for one match and the typed elements they converted to.
struct Interpreter::Taken {
    std::vector<std::string> raw;
    std::vector<std::any> typed;
};

template <typename E>
void Interpreter::report(Context& ctx, const E& error) const {
    if (!config_.collectErrors) throw error;
    tracer_->debug(std::string("Collected error: ") + error.what());
    ctx.root.errors_.push_back(error);
}

namespace {

bool looksNumeric(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;
    std::strtod(begin, &end);
    return end != begin && *end == '\0';
}

void applyValues(const ArgSpec& arg, const std::vector<std::any>& values, bool reset) {
    auto& slot = arg.slot();
    switch (arg.shape()) {
        case Shape::Scalar:
            if (!values.empty()) slot.assign(values.back());
            break;
        case Shape::Collection:
            if (reset) slot.clear();
            for (const auto& v : values) slot.add(v);
            break;
        case Shape::Map:
            if (reset) slot.clear();
            for (const auto& v : values) {
                const auto& entry = std::any_cast<const std::pair<std::any, std::any>&>(v);
                slot.put(entry.first, entry.second);
            }
            break;
    }
}

std::string requiredOptionLabel(const OptionSpec& option, const std::string& separator) {
    if (option.isBoolean() || option.arity().max() == 0) return option.longestName();
    return option.longestName() + separator + option.paramLabel();
}

} // namespace

Interpreter::Interpreter(CommandSpec& spec, ProcessConfig process, std::shared_ptr<const FileSystem> fs)
    : spec_(spec),
      process_(std::move(process)),
      tracer_(std::make_shared<Tracer>(process_.traceLevel)),
      fs_(fs ? std::move(fs) : std::shared_ptr<const FileSystem>(std::make_shared<LocalFileSystem>())) {
    spec_.seal();
    prepare();
}

Interpreter::Interpreter(ChildKey, CommandSpec& spec, const Interpreter& parent)
    : spec_(spec), process_(parent.process_), tracer_(parent.tracer_), fs_(parent.fs_) {
    prepare();
}

void Interpreter::prepare() {
    config_ = spec_.parser();
    if (process_.useSimplifiedAtFiles) config_.useSimplifiedAtFiles = *process_.useSimplifiedAtFiles;
    if (process_.trimQuotes) config_.trimQuotes = *process_.trimQuotes;

    for (const auto& p : spec_.positionals()) positionals_.push_back(p.get());
    std::stable_sort(positionals_.begin(), positionals_.end(), [](const PositionalSpec* a, const PositionalSpec* b) {
        return a->index() < b->index();
    });
    optionNames_ = spec_.optionNames();

    std::vector<const ArgSpec*> all;
    for (const auto& o : spec_.options()) all.push_back(o.get());
    all.insert(all.end(), positionals_.begin(), positionals_.end());
    for (const auto* arg : all) {
        if (arg->isMultiValue() && !arg->splitRegex().empty()) splitters_.emplace(arg, std::regex(arg->splitRegex()));
    }
    for (const auto* arg : all) {
        if (!arg->defaultValue()) continue;
        try {
            (void)convertRaw(*arg, *arg->defaultValue());
        } catch (const ParameterError& e) {
            throw InitializationError("Invalid default value for " + arg->displayName() + ": " + e.what());
        }
    }

    for (const auto& sub : spec_.subcommands()) {
        children_.emplace(sub.get(), std::make_unique<Interpreter>(ChildKey{}, *sub, *this));
    }
}

ParseResult Interpreter::parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse(args);
}

ParseResult Interpreter::parse(const std::vector<std::string>& args) {
    ParseResult result(ParseResult::Key{}, spec_);
    result.originalArgs_ = args;
    if (config_.expandAtFiles) {
        const ArgFileExpander expander(
            ArgFileOptions{config_.atFileCommentChar, config_.useSimplifiedAtFiles, config_.trimQuotes}, *fs_, *tracer_);
        result.expandedArgs_ = expander.expand(args, &result.warnings_);
    } else {
        result.expandedArgs_ = args;
    }

    resetTree();
    std::deque<std::string> queue(result.expandedArgs_.begin(), result.expandedArgs_.end());
    Context ctx{result, queue.size()};
    parseLevel(result, queue, ctx);
    return result;
}

Interpreter::AtFileUsage Interpreter::atFileUsage() const {
    return AtFileUsage{process_.atFileLabel.value_or("@<filename>..."),
                       process_.atFileDescription.value_or("One or more argument files containing options.")};
}

void Interpreter::resetTree() const {
    for (const auto& o : spec_.options()) {
        o->slot().restoreDefault();
        applyDefault(*o);
    }
    for (const auto* p : positionals_) {
        p->slot().restoreDefault();
        applyDefault(*p);
    }
    for (const auto& [sub, child] : children_) child->resetTree();
}

void Interpreter::applyDefault(const ArgSpec& arg) const {
    if (!arg.defaultValue()) return;
    applyValues(arg, convertRaw(arg, *arg.defaultValue()), true);
}

void Interpreter::parseLevel(ParseResult& result, std::deque<std::string>& args, Context& ctx) const {
    Level lv(result, ctx);
    for (const auto& o : spec_.options()) {
        if (o->required()) lv.required.push_back(o.get());
    }
    for (const auto* p : positionals_) {
        if (p->required() || p->arity().min() > 0) lv.required.push_back(p);
    }
    tracer_->debug("Parsing " + std::to_string(args.size()) + " argument(s) for command '" + spec_.name() + "'");

    while (!args.empty() && !lv.dispatched) {
        const auto before = args.size();
        try {
            step(lv, args);
        } catch (const ParameterError& e) {
            if (!config_.collectErrors) throw;
            report(ctx, e);
            // always make progress
            if (args.size() == before) args.pop_front();
        }
    }
    if (!lv.dispatched) finishLevel(lv);
}

void Interpreter::step(Level& lv, std::deque<std::string>& args) const {
    std::string arg = args.front();
    args.pop_front();
    tracer_->debug("Processing argument '" + arg + "'");

    if (!lv.endOfOptions && arg == config_.endOfOptionsDelimiter) {
        lv.endOfOptions = true;
        tracer_->debug("Found end-of-options delimiter '" + arg + "'; the rest are positional parameters");
        return;
    }

    if (!lv.endOfOptions) {
        if (const auto* sub = spec_.findSubcommand(arg)) {
            dispatch(lv, *sub, args);
            return;
        }

        const auto sep = arg.find(config_.separator);
        const auto exact = spec_.findOption(arg);
        if (exact.option) {
            if (sep != std::string::npos && sep > 0) {
                const auto shorter = spec_.findOption(arg.substr(0, sep));
                if (shorter.option && shorter.option != exact.option) {
                    warn(lv.ctx, "Both " + exact.option->displayName() + " and " + shorter.option->displayName() + " match '" +
                                     arg + "'; using " + exact.option->displayName());
                }
            }
            processOption(lv, *exact.option, exact.negated, LookBehind::Separate, args);
            return;
        }

        if (sep != std::string::npos && sep > 0) {
            const auto key = spec_.findOption(arg.substr(0, sep));
            if (key.option) {
                args.push_front(arg.substr(sep + config_.separator.size()));
                processOption(lv, *key.option, key.negated, LookBehind::AttachedWithSeparator, args);
                return;
            }
        }

        if (isClusterStart(arg)) {
            processCluster(lv, arg, args);
            return;
        }

        if (resemblesOption(arg)) {
            args.push_front(arg);
            addUnmatched(lv, args, true);
            return;
        }
    }

    args.push_front(std::move(arg));
    processPositionals(lv, args);
}

void Interpreter::dispatch(Level& lv, const CommandSpec& sub, std::deque<std::string>& args) const {
    finishLevel(lv);
    tracer_->debug("Found subcommand '" + sub.name() + "'");
    lv.result.subcommand_ = std::make_unique<ParseResult>(ParseResult::Key{}, sub);
    lv.dispatched = true;
    children_.at(&sub)->parseLevel(*lv.result.subcommand_, args, lv.ctx);
}

void Interpreter::processOption(Level& lv,
                                const OptionSpec& option,
                                bool negated,
                                LookBehind lookBehind,
                                std::deque<std::string>& args) const {
    if (option.usageHelp()) {
        lv.result.usageHelpRequested_ = true;
        lv.ctx.helpRequested = true;
    }
    if (option.versionHelp()) {
        lv.result.versionHelpRequested_ = true;
        lv.ctx.helpRequested = true;
    }
    if (option.isBoolean()) {
        processFlag(lv, option, negated, lookBehind, args);
        return;
    }

    Range arity = option.arity();
    if (lookBehind == LookBehind::AttachedWithSeparator) {
        arity = config_.aritySatisfiedByAttachedOptionParam ? Range::exactly(1)
                                                            : arity.withMin(std::max<std::size_t>(1, arity.min()));
    }
    Taken taken = takeValues(lv, option, arity, lookBehind, args);
    if (taken.raw.empty() && option.fallbackValue()) {
        taken.raw.push_back(*option.fallbackValue());
        taken.typed = convertRaw(option, *option.fallbackValue());
    }
    store(lv, option, std::move(taken));
}

void Interpreter::processFlag(Level& lv,
                              const OptionSpec& option,
                              bool negated,
                              LookBehind lookBehind,
                              std::deque<std::string>& args) const {
    auto toValue = [&](const std::any& typed) {
        const bool v = std::any_cast<bool>(typed);
        return negated ? !v : v;
    };
    Taken taken;
    bool value = true;

    if (lookBehind == LookBehind::AttachedWithSeparator ||
        (lookBehind == LookBehind::Separate && option.arity().min() > 0)) {
        const Range arity = lookBehind == LookBehind::Separate ? option.arity() : Range::exactly(1);
        taken = takeValues(lv, option, arity, lookBehind, args);
        value = toValue(taken.typed.back());
    } else if (!args.empty() && (lookBehind == LookBehind::Attached || option.arity().max() > 0) &&
               convert::isBooleanLiteral(config_.trimQuotes ? utils::unquote(args.front()) : args.front()) &&
               (lookBehind == LookBehind::Attached || !isBoundary(lv, args.front(), false))) {
        taken.raw.push_back(args.front());
        args.pop_front();
        value = toValue(convertRaw(option, taken.raw.back()).front());
    } else if (option.fallbackValue()) {
        taken.raw.push_back(*option.fallbackValue());
        value = toValue(convertRaw(option, taken.raw.back()).front());
    } else if (config_.toggleBooleanFlags) {
        value = !option.slot().booleanValue().value_or(false);
        taken.raw.push_back(value ? "true" : "false");
    } else {
        value = !negated;
        taken.raw.push_back(value ? "true" : "false");
    }
    taken.typed.assign(1, std::any(value));
    store(lv, option, std::move(taken));
}

void Interpreter::processCluster(Level& lv, const std::string& arg, std::deque<std::string>& args) const {
    const char prefix = arg[0];
    std::string cluster = arg.substr(1);

    while (true) {
        const OptionSpec* option = nullptr;
        if (!cluster.empty()) {
            const auto match = spec_.findOption(std::string{prefix, cluster[0]});
            if (!match.negated) option = match.option;
        }
        if (!option) {
            if (cluster.empty()) return;
            // what is left is neither an option nor a value the previous option took
            std::string rest = std::string(1, prefix) + cluster;
            tracer_->debug("'" + rest + "' from '" + arg + "' is not a known short option");
            const bool optionLike = resemblesOption(rest);
            args.push_front(std::move(rest));
            if (optionLike) {
                addUnmatched(lv, args, true);
            } else {
                processPositionals(lv, args);
            }
            return;
        }

        cluster.erase(0, 1);
        LookBehind lookBehind = cluster.empty() ? LookBehind::Separate : LookBehind::Attached;
        if (!cluster.empty() && utils::startsWith(cluster, config_.separator)) {
            cluster.erase(0, config_.separator.size());
            lookBehind = LookBehind::AttachedWithSeparator;
        }
        if (lookBehind != LookBehind::Separate) args.push_front(cluster);

        const auto before = args.size();
        processOption(lv, *option, false, lookBehind, args);
        if (lookBehind == LookBehind::Separate || args.empty() || args.size() < before) return;

        cluster = args.front();
        args.pop_front();
    }
}

void Interpreter::processPositionals(Level& lv, std::deque<std::string>& args) const {
    if (config_.stopAtPositional && !lv.endOfOptions) {
        lv.endOfOptions = true;
        tracer_->debug("Positional parameter found; the rest are positional parameters");
    }

    std::size_t consumed = 0;
    for (const auto* positional : positionals_) {
        if (!positional->index().contains(lv.position)) continue;
        if (!positional->isMultiValue() && lv.initialized.count(positional)) continue;

        std::deque<std::string> copy = args;
        Taken taken = takeValues(lv, *positional, positional->arity(), LookBehind::Separate, copy);
        const auto count = args.size() - copy.size();
        if (count == 0) continue;

        for (std::size_t i = 0; i < count; ++i) lv.result.addPosition(*positional, lv.position + i);
        store(lv, *positional, std::move(taken));
        consumed = std::max(consumed, count);
    }

    if (consumed == 0) {
        addUnmatched(lv, args, false);
        return;
    }
    args.erase(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(consumed));
    lv.position += consumed;
}

void Interpreter::addUnmatched(Level& lv, std::deque<std::string>& args, bool optionLike) const {
    if (lv.result.unmatched_.empty()) lv.firstUnmatched = lv.ctx.total - args.size();
    if (!optionLike) lv.unmatchedAreOptions = false;

    if (config_.stopAtUnmatched) {
        tracer_->debug("Unmatched argument '" + args.front() + "'; the remaining " + std::to_string(args.size()) +
                       " argument(s) are unmatched");
        lv.result.unmatched_.insert(lv.result.unmatched_.end(), args.begin(), args.end());
        args.clear();
        return;
    }
    lv.result.unmatched_.push_back(args.front());
    args.pop_front();
}

Interpreter::Taken Interpreter::takeValues(const Level& lv,
                                           const ArgSpec& arg,
                                           const Range& arity,
                                           LookBehind lookBehind,
                                           std::deque<std::string>& args) const {
    const auto display = arg.displayName();
    Taken taken;

    // Returns false when an optional value is declined.
    auto take = [&](bool mandatory) {
        const std::string& next = args.front();
        const bool attached = lookBehind != LookBehind::Separate && taken.raw.empty();
        if (!attached && isBoundary(lv, next, mandatory)) {
            if (!mandatory) return false;
            std::string msg;
            if (next != config_.endOfOptionsDelimiter && !isKnownOptionToken(next)) msg = "Unknown option: '" + next + "'; ";
            if (arity.min() > 1) {
                msg += "Expected parameter " + std::to_string(taken.raw.size() + 1) + " (of " + std::to_string(arity.min()) +
                       " mandatory parameters) for " + display + " but found '" + next + "'";
            } else {
                msg += "Expected parameter for " + display + " but found '" + next + "'";
            }
            throw MissingParameterError(msg, display, next);
        }

        std::vector<std::any> values;
        if (mandatory) {
            values = convertRaw(arg, next);
        } else {
            try {
                values = convertRaw(arg, next);
            } catch (const TypeConversionError& e) {
                tracer_->debug(display + " declines '" + next + "': " + e.cause());
                return false;
            }
        }
        taken.raw.push_back(next);
        taken.typed.insert(taken.typed.end(), std::make_move_iterator(values.begin()), std::make_move_iterator(values.end()));
        args.pop_front();
        return true;
    };

    while (taken.raw.size() < arity.min()) {
        if (args.empty()) {
            if (arity.min() == 1) {
                if (arg.isOption()) throw MissingParameterError("Missing required parameter for " + display, display);
                throw MissingParameterError("Missing required parameter: '" + arg.paramLabel() + "'", display);
            }
            throw MissingParameterError(display + " requires at least " + std::to_string(arity.min()) + " values, but only " +
                                            std::to_string(taken.raw.size()) + " were specified: [" +
                                            utils::join(taken.raw, ", ") + "]",
                                        display,
                                        utils::join(taken.raw, " "));
        }
        take(true);
    }
    while (taken.raw.size() < arity.max() && !args.empty()) {
        if (!take(false)) break;
    }
    return taken;
}

void Interpreter::store(Level& lv, const ArgSpec& arg, Taken taken) const {
    const auto display = arg.displayName();
    const bool first = lv.initialized.insert(&arg).second;

    if (arg.shape() == Shape::Scalar) {
        if (!first) {
            const std::string latest = taken.raw.empty() ? std::string() : taken.raw.back();
            if (!config_.overwrittenOptionsAllowed) {
                throw OverwrittenOptionError(display + " should be specified only once", display, latest);
            }
            const auto& previous = lv.result.originalStringValues(arg);
            warn(lv.ctx, "Overwriting " + display + " value '" + (previous.empty() ? std::string() : previous.back()) +
                             "' with '" + latest + "'");
        }
    } else if (arg.hasExplicitArity() && !arg.arity().isUnbounded() && taken.typed.size() > arg.arity().max()) {
        throw ParameterError(ParameterError::Kind::MaxValuesExceeded,
                             display + " max number of values (" + std::to_string(arg.arity().max()) + ") exceeded: " +
                                 std::to_string(taken.typed.size()) + " elements.",
                             display,
                             utils::join(taken.raw, " "));
    }

    applyValues(arg, taken.typed, first || arg.multiValuePolicy() == MultiValuePolicy::Replace);
    tracer_->debug("Matched " + display + " with [" + utils::join(taken.raw, ", ") + "]");
    lv.satisfy(&arg);
    lv.result.addMatch(arg, std::move(taken.raw), std::move(taken.typed));
}

void Interpreter::finishLevel(Level& lv) const {
    if (!lv.ctx.helpRequested && !lv.required.empty()) {
        std::vector<std::string> options;
        std::vector<std::string> params;
        std::string firstOption;
        std::string firstParam;
        for (const auto* arg : lv.required) {
            if (arg->isOption()) {
                if (options.empty()) firstOption = arg->displayName();
                options.push_back(requiredOptionLabel(static_cast<const OptionSpec&>(*arg), config_.separator));
            } else {
                if (params.empty()) firstParam = arg->displayName();
                params.push_back(arg->paramLabel());
            }
        }
        if (!options.empty()) {
            report(lv.ctx, MissingParameterError(std::string(options.size() > 1 ? "Missing required options: " : "Missing required option: ") +
                                                     utils::join(options, ", ", "'"),
                                                 firstOption));
        }
        if (!params.empty()) {
            report(lv.ctx, MissingParameterError(std::string(params.size() > 1 ? "Missing required parameters: " : "Missing required parameter: ") +
                                                     utils::join(params, ", ", "'"),
                                                 firstParam));
        }
    }

    const auto& unmatched = lv.result.unmatched_;
    if (unmatched.empty()) return;
    if (config_.unmatchedArgumentsAllowed) {
        tracer_->info("Unmatched arguments: " + utils::join(unmatched, ", ", "'"));
        return;
    }
    report(lv.ctx, unmatchedError(lv));
}

UnmatchedArgumentError Interpreter::unmatchedError(const Level& lv) const {
    const auto& tokens = lv.result.unmatched_;
    std::string msg;
    std::vector<std::string> suggestions;
    if (lv.unmatchedAreOptions) {
        msg = std::string(tokens.size() > 1 ? "Unknown options: " : "Unknown option: ") + utils::join(tokens, ", ", "'");
        suggestions = utils::suggest(tokens.front(), optionNames_);
    } else {
        if (tokens.size() > 1) {
            msg = "Unmatched arguments from index " + std::to_string(lv.firstUnmatched) + ": " + utils::join(tokens, ", ", "'");
        } else {
            msg = "Unmatched argument at index " + std::to_string(lv.firstUnmatched) + ": '" + tokens.front() + "'";
        }
        std::vector<std::string> names;
        for (const auto& sub : spec_.subcommands()) {
            names.push_back(sub->name());
            names.insert(names.end(), sub->aliases().begin(), sub->aliases().end());
        }
        suggestions = utils::suggest(tokens.front(), names);
    }
    if (!suggestions.empty()) {
        msg += "\n\nDid you mean this?\n";
        for (const auto& s : suggestions) msg += "  " + s + "\n";
    }
    return UnmatchedArgumentError(msg, tokens, suggestions);
}

std::vector<std::any> Interpreter::convertRaw(const ArgSpec& arg, const std::string& raw) const {
    const std::string value = config_.trimQuotes ? utils::unquote(raw) : raw;
    std::vector<std::any> out;
    for (const auto& element : split(arg, value)) {
        if (arg.shape() != Shape::Map) {
            out.push_back(convertOne(arg, 0, element));
            continue;
        }
        const auto eq = element.find('=');
        if (eq == std::string::npos) {
            throw ParameterError(ParameterError::Kind::MalformedMapEntry,
                                 "Value for " + arg.displayName() + " should be in KEY=VALUE format but was " + element,
                                 arg.displayName(),
                                 raw);
        }
        out.emplace_back(std::make_pair(convertOne(arg, 0, element.substr(0, eq)), convertOne(arg, 1, element.substr(eq + 1))));
    }
    return out;
}

std::any Interpreter::convertOne(const ArgSpec& arg, std::size_t auxIndex, const std::string& text) const {
    const Converter* converter = nullptr;
    if (auxIndex < arg.converters().size() && arg.converters()[auxIndex]) {
        converter = &arg.converters()[auxIndex];
    } else {
        converter = spec_.converters().find(arg.auxiliaryTypes().at(auxIndex));
    }
    if (!converter) throw InitializationError("No converter available for " + arg.displayName());

    std::string cause;
    try {
        return (*converter)(text);
    } catch (const ConversionFailure& e) {
        cause = e.what();
    } catch (const std::invalid_argument& e) {
        cause = "'" + text + "' could not be converted (" + e.what() + ")";
    } catch (const std::out_of_range& e) {
        cause = "'" + text + "' is out of range (" + e.what() + ")";
    }
    const auto display = arg.displayName();
    throw TypeConversionError("Invalid value for " + display + ": " + cause, display, text, cause);
}

std::vector<std::string> Interpreter::split(const ArgSpec& arg, const std::string& value) const {
    const auto it = splitters_.find(&arg);
    if (it == splitters_.end() || value.empty()) return {value};
    std::vector<std::string> out;
    std::sregex_token_iterator first(value.begin(), value.end(), it->second, -1);
    const std::sregex_token_iterator last;
    for (; first != last; ++first) out.push_back(first->str());
    // "1,2," splits into two elements, not three
    while (!out.empty() && out.back().empty()) out.pop_back();
    return out;
}

bool Interpreter::isClusterStart(const std::string& arg) const {
    if (!config_.posixClusteredShortOptionsAllowed || arg.size() <= 2) return false;
    if (std::isalnum(static_cast<unsigned char>(arg[0]))) return false;
    const auto match = spec_.findOption(arg.substr(0, 2));
    return match.option != nullptr && !match.negated;
}

bool Interpreter::isKnownOptionToken(const std::string& arg) const {
    if (spec_.findOption(arg).option) return true;
    const auto sep = arg.find(config_.separator);
    if (sep != std::string::npos && sep > 0 && spec_.findOption(arg.substr(0, sep)).option) return true;
    return isClusterStart(arg);
}

// At least one prefix character in common with nine out of ten option names.
bool Interpreter::resemblesOption(const std::string& arg) const {
    if (config_.unmatchedOptionsArePositionalParams) return false;
    if (arg.size() <= 1 || looksNumeric(arg)) return false;
    if (optionNames_.empty()) return arg[0] == '-';

    std::size_t count = 0;
    for (const auto& name : optionNames_) {
        for (std::size_t i = 0; i < arg.size() && i < name.size() && arg[i] == name[i]; ++i) ++count;
    }
    return count > 0 && count * 10 >= optionNames_.size() * 9;
}

bool Interpreter::isBoundary(const Level& lv, const std::string& arg, bool mandatory) const {
    if (lv.endOfOptions) return false;
    if (arg == config_.endOfOptionsDelimiter || isKnownOptionToken(arg)) return true;
    if (mandatory) return !config_.unmatchedOptionsAllowedAsOptionParameters && resemblesOption(arg);
    return spec_.findSubcommand(arg) != nullptr || resemblesOption(arg);
}

void Interpreter::warn(Context& ctx, const std::string& msg) const {
    tracer_->warn(msg);
    ctx.root.warnings_.push_back(msg);
}

} // namespace argot
