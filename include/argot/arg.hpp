#ifndef ARGOT_ARG_HPP
#define ARGOT_ARG_HPP

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

#include "convert.hpp"
#include "range.hpp"
#include "value.hpp"

namespace argot {

// What happens to an already filled collection or map when the argument matches again.
enum class MultiValuePolicy {
    Append,
    Replace,
};

namespace detail {

struct ArgSettings {
    std::optional<std::string> arity;
    bool required{false};
    std::string splitRegex;
    std::optional<std::string> defaultValue;
    std::string description;
    std::string paramLabel;
    MultiValuePolicy multiValuePolicy{MultiValuePolicy::Append};
    std::vector<Converter> converters;
    std::shared_ptr<ValueSlot> slot;
};

} // namespace detail

// Immutable descriptor shared by options and positional parameters.
class ArgSpec {
public:
    virtual ~ArgSpec() = default;

    [[nodiscard]] virtual bool isOption() const = 0;
    [[nodiscard]] bool isPositional() const { return !isOption(); }

    [[nodiscard]] const Range& arity() const { return arity_; }
    // False when the arity was derived from the value type.
    [[nodiscard]] bool hasExplicitArity() const { return settings_.arity.has_value(); }
    [[nodiscard]] bool required() const { return settings_.required; }
    [[nodiscard]] const std::string& splitRegex() const { return settings_.splitRegex; }
    [[nodiscard]] const std::optional<std::string>& defaultValue() const { return settings_.defaultValue; }
    [[nodiscard]] const std::string& description() const { return settings_.description; }
    [[nodiscard]] const std::string& paramLabel() const { return settings_.paramLabel; }
    [[nodiscard]] MultiValuePolicy multiValuePolicy() const { return settings_.multiValuePolicy; }

    [[nodiscard]] Shape shape() const { return settings_.slot->shape(); }
    [[nodiscard]] bool isMultiValue() const { return shape() != Shape::Scalar; }
    [[nodiscard]] bool isBoolean() const { return settings_.slot->isBoolean(); }
    [[nodiscard]] std::vector<std::type_index> auxiliaryTypes() const { return settings_.slot->auxiliaryTypes(); }

    // Argument-specific converters by auxiliary-type index. A missing or empty entry
    // falls back to the command's ConverterRegistry.
    [[nodiscard]] const std::vector<Converter>& converters() const { return settings_.converters; }

    [[nodiscard]] ValueSlot& slot() const { return *settings_.slot; }

    template <typename T>
    [[nodiscard]] T getValue() const {
        return std::any_cast<T>(settings_.slot->value());
    }

    // Human readable name for messages: "option '-x' (<x>)" or
    // "positional parameter at index 0..* (<files>)".
    [[nodiscard]] virtual std::string displayName() const = 0;

protected:
    ArgSpec(detail::ArgSettings settings, Range arity) : settings_(std::move(settings)), arity_(arity) {}

    detail::ArgSettings settings_;
    Range arity_;
};

template <typename Self>
class ArgBuilder {
public:
    Self& arity(std::string range) {
        settings_.arity = std::move(range);
        return self();
    }

    Self& required(bool v = true) {
        settings_.required = v;
        return self();
    }

    // Each consumed value is split into elements with this regex. Ignored for single-valued targets.
    Self& splitRegex(std::string regex) {
        settings_.splitRegex = std::move(regex);
        return self();
    }

    // Converted and applied at the start of every parse.
    Self& defaultValue(std::string v) {
        settings_.defaultValue = std::move(v);
        return self();
    }

    Self& description(std::string d) {
        settings_.description = std::move(d);
        return self();
    }

    Self& paramLabel(std::string label) {
        settings_.paramLabel = std::move(label);
        return self();
    }

    Self& multiValuePolicy(MultiValuePolicy p) {
        settings_.multiValuePolicy = p;
        return self();
    }

    // Appends to the converter chain: element converter first, or key then value for maps.
    Self& converter(Converter c) {
        settings_.converters.push_back(std::move(c));
        return self();
    }

    template <typename T>
    Self& bind(T& target) {
        settings_.slot = std::make_shared<TypedSlot<T>>(bindTo(target));
        return self();
    }

    template <typename T>
    Self& binding(Binding<T> b) {
        settings_.slot = std::make_shared<TypedSlot<T>>(std::move(b));
        return self();
    }

    // Declares the type without an external target; the value lives in the spec.
    template <typename T>
    Self& type(T initial = T{}) {
        settings_.slot = std::make_shared<TypedSlot<T>>(holder<T>(std::move(initial)));
        return self();
    }

protected:
    Self& self() { return static_cast<Self&>(*this); }

    detail::ArgSettings settings_;
};

class OptionSpec final : public ArgSpec {
    struct Key {
        explicit Key() = default;
    };

public:
    class Builder : public ArgBuilder<Builder> {
    public:
        explicit Builder(std::vector<std::string> names) : names_(std::move(names)) {}

        // Matching this option suppresses required-argument validation.
        Builder& usageHelp(bool v = true) {
            usageHelp_ = v;
            return *this;
        }

        Builder& versionHelp(bool v = true) {
            versionHelp_ = v;
            return *this;
        }

        // Boolean options only: also accept --no-name (or +x for -x) to set false.
        Builder& negatable(bool v = true) {
            negatable_ = v;
            return *this;
        }

        // Value used when an option with optional parameter appears without one.
        Builder& fallbackValue(std::string v) {
            fallbackValue_ = std::move(v);
            return *this;
        }

        // Validates and derives defaults. Throws InitializationError.
        [[nodiscard]] std::shared_ptr<OptionSpec> build() const;

    private:
        std::vector<std::string> names_;
        bool usageHelp_{false};
        bool versionHelp_{false};
        bool negatable_{false};
        std::optional<std::string> fallbackValue_;
    };

    static Builder builder(std::vector<std::string> names) { return Builder(std::move(names)); }

    [[nodiscard]] bool isOption() const override { return true; }
    [[nodiscard]] const std::vector<std::string>& names() const { return names_; }
    [[nodiscard]] const std::string& longestName() const;
    [[nodiscard]] const std::string& shortestName() const;
    [[nodiscard]] bool usageHelp() const { return usageHelp_; }
    [[nodiscard]] bool versionHelp() const { return versionHelp_; }
    [[nodiscard]] bool negatable() const { return negatable_; }
    [[nodiscard]] const std::optional<std::string>& fallbackValue() const { return fallbackValue_; }

    // Negated spellings accepted when negatable(): "--no-verbose" for "--verbose".
    [[nodiscard]] std::vector<std::string> negatedNames() const;

    [[nodiscard]] std::string displayName() const override;

    // Negated form of one option name, e.g. "--no-x" <-> "--x", "-x" -> "+x".
    static std::string negate(const std::string& name);

    // Only Builder::build() can supply the key.
    OptionSpec(Key, detail::ArgSettings settings, Range arity, std::vector<std::string> names)
        : ArgSpec(std::move(settings), arity), names_(std::move(names)) {}

private:
    std::vector<std::string> names_;
    bool usageHelp_{false};
    bool versionHelp_{false};
    bool negatable_{false};
    std::optional<std::string> fallbackValue_;
};

class PositionalSpec final : public ArgSpec {
    struct Key {
        explicit Key() = default;
    };

public:
    class Builder : public ArgBuilder<Builder> {
    public:
        Builder() = default;

        // Index range such as "0", "1..2" or "2..*". Defaults to "*".
        Builder& index(std::string range) {
            index_ = std::move(range);
            return *this;
        }

        [[nodiscard]] std::shared_ptr<PositionalSpec> build() const;

    private:
        std::optional<std::string> index_;
    };

    static Builder builder() { return Builder(); }

    [[nodiscard]] bool isOption() const override { return false; }
    [[nodiscard]] const Range& index() const { return index_; }

    [[nodiscard]] std::string displayName() const override;

    PositionalSpec(Key, detail::ArgSettings settings, Range arity, Range index)
        : ArgSpec(std::move(settings), arity), index_(index) {}

private:
    Range index_;
};

} // namespace argot

#endif // ARGOT_ARG_HPP
