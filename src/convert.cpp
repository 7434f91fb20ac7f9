#include "argot/convert.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <type_traits>

#include "argot/errors.hpp"
#include "argot/utils.hpp"

namespace {

using argot::ConversionFailure;
using argot::utils::trimWs;

[[noreturn]] void fail(const std::string& raw, const char* what) {
    throw ConversionFailure("'" + raw + "' is not " + what);
}

int baseOf(std::string_view t) {
    std::size_t pos = 0;
    if (pos < t.size() && (t[pos] == '+' || t[pos] == '-')) ++pos;
    if (t.size() > pos + 2 && t[pos] == '0' && (t[pos + 1] == 'x' || t[pos + 1] == 'X')) return 16;
    return 10;
}

bool tryParseBool(std::string_view s, bool& out) {
    const auto t = trimWs(s);
    if (t.empty()) return false;
    if (argot::utils::equalsIgnoreCase(t, "true") || t == "1" || t == "on" || t == "yes") {
        out = true;
        return true;
    }
    if (argot::utils::equalsIgnoreCase(t, "false") || t == "0" || t == "off" || t == "no") {
        out = false;
        return true;
    }
    return false;
}

template <typename T>
bool tryParseSignedInt(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && std::numeric_limits<T>::is_signed, "signed integer required");
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(tmp.c_str(), &end, baseOf(t));
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v < static_cast<long long>(std::numeric_limits<T>::min()) || v > static_cast<long long>(std::numeric_limits<T>::max())) {
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

template <typename T>
bool tryParseUnsignedInt(std::string_view s, T& out) {
    static_assert(std::numeric_limits<T>::is_integer && !std::numeric_limits<T>::is_signed, "unsigned integer required");
    const auto t = trimWs(s);
    if (t.empty() || t.front() == '-') return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, baseOf(t));
    if (errno != 0) return false;
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
    if (v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) return false;
    out = static_cast<T>(v);
    return true;
}

template <typename T>
bool tryParseFloat(std::string_view s, T& out) {
    static_assert(std::is_floating_point_v<T>, "floating point required");
    const auto t = trimWs(s);
    if (t.empty()) return false;
    const std::string tmp(t);
    char* end = nullptr;
    errno = 0;
    if constexpr (std::is_same_v<T, float>) {
        const float v = std::strtof(tmp.c_str(), &end);
        if (errno != 0) return false;
        if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
        out = v;
    } else {
        const double v = std::strtod(tmp.c_str(), &end);
        if (errno != 0) return false;
        if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return false;
        out = static_cast<T>(v);
    }
    return true;
}

// Go-style durations: "300ms", "1.5h", "2h45m". A bare "0" is accepted.
bool tryParseDuration(std::string_view s, std::chrono::milliseconds& out) {
    const auto sv = trimWs(s);
    if (sv.empty()) return false;

    std::size_t pos = 0;
    int sign = 1;
    if (sv[pos] == '+' || sv[pos] == '-') {
        if (sv[pos] == '-') sign = -1;
        ++pos;
    }
    if (pos >= sv.size()) return false;

    if (sv.substr(pos) == "0") {
        out = std::chrono::milliseconds(0);
        return true;
    }

    double totalMs = 0.0;
    while (pos < sv.size()) {
        const std::size_t numStart = pos;
        bool seenDigit = false;
        bool seenDot = false;
        for (; pos < sv.size(); ++pos) {
            const char ch = sv[pos];
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                seenDigit = true;
                continue;
            }
            if (ch == '.' && !seenDot) {
                seenDot = true;
                continue;
            }
            break;
        }
        if (!seenDigit) return false;
        const std::size_t numEnd = pos;
        if (pos >= sv.size()) return false; // unit required

        const auto rest = sv.substr(pos);
        std::string_view unit;
        double multiplier = 0.0;
        if (rest.rfind("ns", 0) == 0) {
            unit = "ns";
            multiplier = 1e-6;
        } else if (rest.rfind("us", 0) == 0) {
            unit = "us";
            multiplier = 1e-3;
        } else if (rest.rfind("ms", 0) == 0) {
            unit = "ms";
            multiplier = 1.0;
        } else if (rest.rfind("s", 0) == 0) {
            unit = "s";
            multiplier = 1000.0;
        } else if (rest.rfind("m", 0) == 0) {
            unit = "m";
            multiplier = 60.0 * 1000.0;
        } else if (rest.rfind("h", 0) == 0) {
            unit = "h";
            multiplier = 60.0 * 60.0 * 1000.0;
        } else {
            return false;
        }

        double value = 0.0;
        if (!tryParseFloat<double>(sv.substr(numStart, numEnd - numStart), value)) return false;
        totalMs += value * multiplier;
        pos += unit.size();
    }

    totalMs *= static_cast<double>(sign);
    if (totalMs > static_cast<double>(std::numeric_limits<std::int64_t>::max())) return false;
    if (totalMs < static_cast<double>(std::numeric_limits<std::int64_t>::min())) return false;
    const auto asInt = static_cast<std::int64_t>(totalMs >= 0 ? (totalMs + 0.5) : (totalMs - 0.5));
    out = std::chrono::milliseconds(asInt);
    return true;
}

template <typename T>
T signedOrFail(const std::string& raw, const char* what) {
    T out{};
    if (!tryParseSignedInt<T>(raw, out)) fail(raw, what);
    return out;
}

template <typename T>
T unsignedOrFail(const std::string& raw, const char* what) {
    T out{};
    if (!tryParseUnsignedInt<T>(raw, out)) fail(raw, what);
    return out;
}

template <typename T>
T floatOrFail(const std::string& raw, const char* what) {
    T out{};
    if (!tryParseFloat<T>(raw, out)) fail(raw, what);
    return out;
}

} // namespace

namespace argot {

namespace convert {

bool isBooleanLiteral(std::string_view s) {
    return utils::equalsIgnoreCase(s, "true") || utils::equalsIgnoreCase(s, "false");
}

bool toBool(const std::string& s) {
    bool out = false;
    if (!tryParseBool(s, out)) fail(s, "a boolean");
    return out;
}

int toInt(const std::string& s) { return signedOrFail<int>(s, "an int"); }

long long toLongLong(const std::string& s) { return signedOrFail<long long>(s, "a long"); }

unsigned long long toUnsignedLongLong(const std::string& s) {
    return unsignedOrFail<unsigned long long>(s, "an unsigned long");
}

double toDouble(const std::string& s) { return floatOrFail<double>(s, "a double"); }

} // namespace convert

ConverterRegistry ConverterRegistry::withBuiltins() {
    ConverterRegistry r;
    r.add<bool>(convert::toBool);
    r.add<char>([](const std::string& s) {
        if (s.size() != 1) fail(s, "a single character");
        return s[0];
    });
    r.add<short>([](const std::string& s) { return signedOrFail<short>(s, "a short"); });
    r.add<int>(convert::toInt);
    r.add<long>([](const std::string& s) { return signedOrFail<long>(s, "a long"); });
    r.add<long long>(convert::toLongLong);
    r.add<unsigned int>([](const std::string& s) { return unsignedOrFail<unsigned int>(s, "an unsigned int"); });
    r.add<unsigned long>([](const std::string& s) { return unsignedOrFail<unsigned long>(s, "an unsigned long"); });
    r.add<unsigned long long>(convert::toUnsignedLongLong);
    r.add<float>([](const std::string& s) { return floatOrFail<float>(s, "a float"); });
    r.add<double>(convert::toDouble);
    r.add<std::string>([](const std::string& s) { return s; });
    r.add<std::filesystem::path>([](const std::string& s) { return std::filesystem::path(s); });
    r.add<std::chrono::milliseconds>([](const std::string& s) {
        std::chrono::milliseconds out{};
        if (!tryParseDuration(s, out)) fail(s, "a duration");
        return out;
    });
    return r;
}

} // namespace argot
