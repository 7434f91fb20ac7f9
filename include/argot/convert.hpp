#ifndef ARGOT_CONVERT_HPP
#define ARGOT_CONVERT_HPP

#include <any>
#include <functional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace argot {

// Turns one raw string into a typed value. Throws ConversionFailure (or
// std::invalid_argument) when the string is not acceptable.
using Converter = std::function<std::any(const std::string&)>;

template <typename T, typename F>
Converter makeConverter(F fn) {
    return [fn = std::move(fn)](const std::string& raw) -> std::any { return std::any(T(fn(raw))); };
}

// Type -> converter lookup. Each CommandSpec owns one, seeded with the built-ins.
class ConverterRegistry {
public:
    // bool, char, short, int, long, long long, unsigned, unsigned long, unsigned long long,
    // float, double, std::string, std::filesystem::path and std::chrono::milliseconds.
    static ConverterRegistry withBuiltins();

    ConverterRegistry& add(std::type_index type, Converter converter) {
        converters_[type] = std::move(converter);
        return *this;
    }

    template <typename T, typename F>
    ConverterRegistry& add(F fn) {
        return add(std::type_index(typeid(T)), makeConverter<T>(std::move(fn)));
    }

    [[nodiscard]] const Converter* find(std::type_index type) const {
        const auto it = converters_.find(type);
        return it == converters_.end() ? nullptr : &it->second;
    }

private:
    std::unordered_map<std::type_index, Converter> converters_;
};

namespace convert {

// Exactly "true" or "false", ignoring case. Used to decide whether a boolean flag
// consumes the following token.
bool isBooleanLiteral(std::string_view s);

bool toBool(const std::string& s);
int toInt(const std::string& s);
long long toLongLong(const std::string& s);
unsigned long long toUnsignedLongLong(const std::string& s);
double toDouble(const std::string& s);

} // namespace convert

} // namespace argot

#endif // ARGOT_CONVERT_HPP
