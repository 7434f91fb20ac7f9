#include "argot/trace.hpp"

#include <iostream>

#include "argot/utils.hpp"

namespace argot {

std::string_view toString(TraceLevel level) {
    switch (level) {
        case TraceLevel::Off: return "OFF";
        case TraceLevel::Warn: return "WARN";
        case TraceLevel::Info: return "INFO";
        case TraceLevel::Debug: return "DEBUG";
    }
    return "OFF";
}

std::optional<TraceLevel> parseTraceLevel(std::string_view text) {
    const auto t = utils::toLowerAscii(utils::trimWs(text));
    if (t == "off") return TraceLevel::Off;
    if (t == "warn") return TraceLevel::Warn;
    if (t == "info") return TraceLevel::Info;
    if (t == "debug") return TraceLevel::Debug;
    return std::nullopt;
}

Tracer::Tracer() : stream_(&std::cerr) {}

Tracer::Tracer(TraceLevel level) : level_(level), stream_(&std::cerr) {}

void Tracer::emit(TraceLevel level, const std::string& msg) const {
    if (!isEnabled(level)) return;
    if (sink_) {
        sink_(level, msg);
        return;
    }
    if (!stream_) return;
    *stream_ << "[argot " << toString(level) << "] " << msg;
    if (msg.empty() || msg.back() != '\n') *stream_ << "\n";
}

} // namespace argot
