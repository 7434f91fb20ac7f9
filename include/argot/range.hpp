#ifndef ARGOT_RANGE_HPP
#define ARGOT_RANGE_HPP

#include <cstddef>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>

namespace argot {

// Arity or index range: {min, max} where max may be unbounded.
// Literal forms: "1", "0..1", "2..4", "*" (0..*), "1..*".
class Range {
public:
    static constexpr std::size_t kUnbounded = std::numeric_limits<std::size_t>::max();

    constexpr Range() = default;
    constexpr Range(std::size_t min, std::size_t max) : min_(min), max_(max) {}

    static constexpr Range exactly(std::size_t n) { return Range(n, n); }
    static constexpr Range atLeast(std::size_t n) { return Range(n, kUnbounded); }

    // Throws InitializationError on malformed input.
    static Range parse(std::string_view text);

    [[nodiscard]] constexpr std::size_t min() const { return min_; }
    [[nodiscard]] constexpr std::size_t max() const { return max_; }
    [[nodiscard]] constexpr bool isUnbounded() const { return max_ == kUnbounded; }
    [[nodiscard]] constexpr bool contains(std::size_t n) const { return n >= min_ && n <= max_; }

    // A copy whose min is replaced; max is raised so that it never drops below min.
    [[nodiscard]] Range withMin(std::size_t newMin) const { return Range(newMin, max_ < newMin ? newMin : max_); }

    [[nodiscard]] std::string toString() const;

    friend constexpr bool operator==(const Range& a, const Range& b) { return a.min_ == b.min_ && a.max_ == b.max_; }
    friend constexpr bool operator!=(const Range& a, const Range& b) { return !(a == b); }
    // Orders by min, then max; used to sort positionals by index.
    friend constexpr bool operator<(const Range& a, const Range& b) {
        return a.min_ != b.min_ ? a.min_ < b.min_ : a.max_ < b.max_;
    }

private:
    std::size_t min_{0};
    std::size_t max_{0};
};

inline std::ostream& operator<<(std::ostream& os, const Range& r) { return os << r.toString(); }

} // namespace argot

#endif // ARGOT_RANGE_HPP
