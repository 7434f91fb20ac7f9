#include "argot/arg.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "argot/errors.hpp"
#include "argot/utils.hpp"

namespace {

using argot::InitializationError;
using argot::Range;

void checkSplitRegex(const std::string& regex, const std::string& owner) {
    if (regex.empty()) return;
    try {
        std::regex compiled(regex);
        (void)compiled;
    } catch (const std::regex_error& e) {
        throw InitializationError("Invalid split regex '" + regex + "' for " + owner + ": " + e.what());
    }
}

void checkConverters(const argot::detail::ArgSettings& s, const std::string& owner) {
    const auto aux = s.slot->auxiliaryTypes().size();
    if (s.converters.size() > aux) {
        throw InitializationError(owner + " declares " + std::to_string(s.converters.size()) + " converters but has only " +
                                  std::to_string(aux) + " auxiliary type(s)");
    }
}

Range resolveArity(const argot::detail::ArgSettings& s, Range derived, const std::string& owner) {
    const Range arity = s.arity ? Range::parse(*s.arity) : derived;
    if (s.slot->shape() == argot::Shape::Scalar && arity.max() > 1) {
        throw InitializationError(owner + " is single-valued but has arity " + arity.toString());
    }
    return arity;
}

std::string stripPrefix(const std::string& name) {
    std::size_t pos = 0;
    while (pos < name.size() && !std::isalnum(static_cast<unsigned char>(name[pos]))) ++pos;
    return pos < name.size() ? name.substr(pos) : name;
}

} // namespace

namespace argot {

std::shared_ptr<OptionSpec> OptionSpec::Builder::build() const {
    if (names_.empty()) throw InitializationError("An option must have at least one name");
    for (const auto& n : names_) {
        if (n.empty()) throw InitializationError("Option names must not be empty");
        for (const char ch : n) {
            if (std::isspace(static_cast<unsigned char>(ch))) {
                throw InitializationError("Option name '" + n + "' must not contain whitespace");
            }
        }
    }
    for (std::size_t i = 0; i < names_.size(); ++i) {
        if (std::find(names_.begin() + static_cast<std::ptrdiff_t>(i) + 1, names_.end(), names_[i]) != names_.end()) {
            throw InitializationError("Option name '" + names_[i] + "' is listed twice");
        }
    }

    detail::ArgSettings s = settings_;
    if (!s.slot) s.slot = std::make_shared<TypedSlot<bool>>(holder<bool>(false));

    const std::string owner = "option '" + names_.front() + "'";
    const Range derived = s.slot->isBoolean() ? Range::exactly(0) : Range::exactly(1);
    const Range arity = resolveArity(s, derived, owner);
    checkSplitRegex(s.splitRegex, owner);
    checkConverters(s, owner);
    if (negatable_ && !s.slot->isBoolean()) {
        throw InitializationError(owner + " is negatable but not boolean");
    }

    auto longest = *std::max_element(names_.begin(), names_.end(), [](const std::string& a, const std::string& b) {
        return a.size() < b.size();
    });
    if (s.paramLabel.empty()) s.paramLabel = "<" + stripPrefix(longest) + ">";

    auto spec = std::make_shared<OptionSpec>(Key{}, std::move(s), arity, names_);
    spec->usageHelp_ = usageHelp_;
    spec->versionHelp_ = versionHelp_;
    spec->negatable_ = negatable_;
    spec->fallbackValue_ = fallbackValue_;
    return spec;
}

const std::string& OptionSpec::longestName() const {
    return *std::max_element(names_.begin(), names_.end(), [](const std::string& a, const std::string& b) {
        return a.size() < b.size();
    });
}

const std::string& OptionSpec::shortestName() const {
    return *std::min_element(names_.begin(), names_.end(), [](const std::string& a, const std::string& b) {
        return a.size() < b.size();
    });
}

std::string OptionSpec::negate(const std::string& name) {
    if (utils::startsWith(name, "--no-")) return "--" + name.substr(5);
    if (utils::startsWith(name, "--")) return "--no-" + name.substr(2);
    if (name.size() == 2 && name[0] == '-') return "+" + name.substr(1);
    if (utils::startsWith(name, "-no-")) return "-" + name.substr(4);
    if (utils::startsWith(name, "-")) return "-no-" + name.substr(1);
    return "no-" + name;
}

std::vector<std::string> OptionSpec::negatedNames() const {
    std::vector<std::string> out;
    if (!negatable_) return out;
    out.reserve(names_.size());
    for (const auto& n : names_) out.push_back(negate(n));
    return out;
}

std::string OptionSpec::displayName() const {
    return "option '" + longestName() + "' (" + paramLabel() + ")";
}

std::shared_ptr<PositionalSpec> PositionalSpec::Builder::build() const {
    detail::ArgSettings s = settings_;
    if (!s.slot) s.slot = std::make_shared<TypedSlot<std::string>>(holder<std::string>());

    const Range index = index_ ? Range::parse(*index_) : Range::atLeast(0);
    const std::string owner = "positional parameter at index " + index.toString();
    // Multi-valued positionals take one value per position unless told otherwise.
    const Range derived = s.slot->shape() == Shape::Scalar ? Range::exactly(1) : Range(0, 1);
    const Range arity = resolveArity(s, derived, owner);
    checkSplitRegex(s.splitRegex, owner);
    checkConverters(s, owner);
    if (s.paramLabel.empty()) s.paramLabel = "<param" + std::to_string(index.min()) + ">";

    return std::make_shared<PositionalSpec>(Key{}, std::move(s), arity, index);
}

std::string PositionalSpec::displayName() const {
    return "positional parameter at index " + index_.toString() + " (" + paramLabel() + ")";
}

} // namespace argot
