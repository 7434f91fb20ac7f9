#ifndef ARGOT_CONFIG_HPP
#define ARGOT_CONFIG_HPP

#include <optional>
#include <string>

#include "trace.hpp"

namespace argot {

// Per-command parser knobs. Set through the fluent CommandSpec setters or directly.
struct ParserConfig {
    std::string separator{"="};
    std::string endOfOptionsDelimiter{"--"};

    bool expandAtFiles{true};
    std::optional<char> atFileCommentChar{'#'};
    bool useSimplifiedAtFiles{false};
    bool trimQuotes{false};

    bool posixClusteredShortOptionsAllowed{true}; // -abc
    bool unmatchedArgumentsAllowed{false};
    bool unmatchedOptionsArePositionalParams{false};
    bool unmatchedOptionsAllowedAsOptionParameters{true};
    bool stopAtUnmatched{false};
    bool stopAtPositional{false};
    bool overwrittenOptionsAllowed{false};
    bool toggleBooleanFlags{false};
    bool caseInsensitiveOptions{false};
    bool caseInsensitiveSubcommands{false};
    bool aritySatisfiedByAttachedOptionParam{false};
    bool collectErrors{false};
};

// Process-wide toggles, read once when an Interpreter is constructed.
struct ProcessConfig {
    std::optional<bool> useSimplifiedAtFiles;
    std::optional<bool> trimQuotes;
    TraceLevel traceLevel{TraceLevel::Warn};
    std::optional<std::string> atFileLabel;
    std::optional<std::string> atFileDescription;

    // Reads ARGOT_USE_SIMPLIFIED_AT_FILES, ARGOT_TRIM_QUOTES, ARGOT_TRACE,
    // ARGOT_AT_FILE_LABEL and ARGOT_AT_FILE_DESCRIPTION.
    // Meant for the program entry point; the library never calls it itself.
    static ProcessConfig fromEnvironment();
};

// Case-insensitive "true"/"false"; an empty string counts as true.
std::optional<bool> parseBooleanOverride(const char* value);

} // namespace argot

#endif // ARGOT_CONFIG_HPP
