#include "argot/range.hpp"

#include <cerrno>
#include <cstdlib>

#include "argot/errors.hpp"
#include "argot/utils.hpp"

namespace {

bool tryParseBound(std::string_view s, std::size_t& out) {
    if (s.empty()) return false;
    for (const char ch : s) {
        if (ch < '0' || ch > '9') return false;
    }
    const std::string tmp(s);
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(tmp.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    if (v >= static_cast<unsigned long long>(argot::Range::kUnbounded)) return false;
    out = static_cast<std::size_t>(v);
    return true;
}

} // namespace

namespace argot {

Range Range::parse(std::string_view text) {
    const auto t = utils::trimWs(text);
    auto fail = [&]() -> Range {
        throw InitializationError("Invalid range '" + std::string(text) + "': expected N, N..M, N..* or *");
    };
    if (t.empty()) return fail();
    if (t == "*") return Range::atLeast(0);

    const auto dots = t.find("..");
    if (dots == std::string_view::npos) {
        std::size_t n = 0;
        if (!tryParseBound(t, n)) return fail();
        return Range::exactly(n);
    }

    std::size_t lo = 0;
    if (!tryParseBound(t.substr(0, dots), lo)) return fail();
    const auto upper = t.substr(dots + 2);
    if (upper == "*") return Range::atLeast(lo);
    std::size_t hi = 0;
    if (!tryParseBound(upper, hi)) return fail();
    if (hi < lo) {
        throw InitializationError("Invalid range '" + std::string(text) + "': max must not be less than min");
    }
    return Range(lo, hi);
}

std::string Range::toString() const {
    if (min_ == max_) return std::to_string(min_);
    return std::to_string(min_) + ".." + (isUnbounded() ? std::string("*") : std::to_string(max_));
}

} // namespace argot
