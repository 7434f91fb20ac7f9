#ifndef ARGOT_TRACE_HPP
#define ARGOT_TRACE_HPP

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace argot {

enum class TraceLevel {
    Off,
    Warn,
    Info,
    Debug,
};

std::string_view toString(TraceLevel level);
// Case-insensitive; accepts "off", "warn", "info", "debug".
std::optional<TraceLevel> parseTraceLevel(std::string_view text);

// Leveled diagnostics sink. The parser never writes output directly; everything it
// wants to say goes through here.
class Tracer {
public:
    using Sink = std::function<void(TraceLevel, const std::string&)>;

    Tracer();
    explicit Tracer(TraceLevel level);

    Tracer& setLevel(TraceLevel level) {
        level_ = level;
        return *this;
    }

    // Messages go to `os` as "[argot WARN] ..." lines.
    Tracer& setStream(std::ostream& os) {
        stream_ = &os;
        return *this;
    }

    // Replaces stream output entirely.
    Tracer& setSink(Sink sink) {
        sink_ = std::move(sink);
        return *this;
    }

    [[nodiscard]] TraceLevel level() const { return level_; }
    [[nodiscard]] bool isEnabled(TraceLevel level) const {
        return level != TraceLevel::Off && static_cast<int>(level) <= static_cast<int>(level_);
    }

    void warn(const std::string& msg) const { emit(TraceLevel::Warn, msg); }
    void info(const std::string& msg) const { emit(TraceLevel::Info, msg); }
    void debug(const std::string& msg) const { emit(TraceLevel::Debug, msg); }

    void emit(TraceLevel level, const std::string& msg) const;

private:
    TraceLevel level_{TraceLevel::Warn};
    std::ostream* stream_{nullptr};
    Sink sink_;
};

} // namespace argot

#endif // ARGOT_TRACE_HPP
