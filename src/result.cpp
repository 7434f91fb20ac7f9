#include "argot/result.hpp"

#include <algorithm>

#include "argot/command.hpp"

namespace argot {

namespace {

const std::vector<std::string> kNoStrings;
const std::vector<std::any> kNoValues;

} // namespace

bool ParseResult::isMatched(const ArgSpec& arg) const {
    return std::find(args_.begin(), args_.end(), &arg) != args_.end();
}

const OptionSpec* ParseResult::matchedOption(const std::string& name) const {
    for (const auto& candidate : {name, "-" + name, "--" + name}) {
        const auto match = spec_->findOption(candidate);
        if (match.option) {
            return std::find(options_.begin(), options_.end(), match.option) != options_.end() ? match.option : nullptr;
        }
    }
    return nullptr;
}

const PositionalSpec* ParseResult::matchedPositional(std::size_t position) const {
    for (const auto& [pos, positional] : positions_) {
        if (pos == position) return positional;
    }
    for (const auto* positional : positionals_) {
        if (positional->index().contains(position)) return positional;
    }
    return nullptr;
}

const std::vector<std::string>& ParseResult::originalStringValues(const ArgSpec& arg) const {
    const auto it = raw_.find(&arg);
    return it == raw_.end() ? kNoStrings : it->second;
}

const std::vector<std::any>& ParseResult::typedValues(const ArgSpec& arg) const {
    const auto it = typed_.find(&arg);
    return it == typed_.end() ? kNoValues : it->second;
}

std::vector<const ParseResult*> ParseResult::asCommandList() const {
    std::vector<const ParseResult*> out;
    for (const ParseResult* r = this; r != nullptr; r = r->subcommand_.get()) out.push_back(r);
    return out;
}

void ParseResult::addMatch(const ArgSpec& arg, std::vector<std::string> raw, std::vector<std::any> typed) {
    if (!isMatched(arg)) {
        args_.push_back(&arg);
        if (arg.isOption()) {
            options_.push_back(static_cast<const OptionSpec*>(&arg));
        } else {
            positionals_.push_back(static_cast<const PositionalSpec*>(&arg));
        }
    }
    auto& r = raw_[&arg];
    r.insert(r.end(), std::make_move_iterator(raw.begin()), std::make_move_iterator(raw.end()));
    auto& t = typed_[&arg];
    t.insert(t.end(), std::make_move_iterator(typed.begin()), std::make_move_iterator(typed.end()));
}

} // namespace argot
