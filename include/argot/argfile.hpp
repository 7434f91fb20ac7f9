#ifndef ARGOT_ARGFILE_HPP
#define ARGOT_ARGFILE_HPP

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "trace.hpp"

namespace argot {

// The file-system capability the at-file expander needs. Relative paths resolve
// against the process working directory.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // A stable identity for `path`, or nullopt if nothing exists there.
    [[nodiscard]] virtual std::optional<std::string> canonical(const std::string& path) const = 0;
    // Whole contents, or nullopt when the file cannot be read.
    [[nodiscard]] virtual std::optional<std::string> read(const std::string& path) const = 0;
};

class LocalFileSystem final : public FileSystem {
public:
    [[nodiscard]] std::optional<std::string> canonical(const std::string& path) const override;
    [[nodiscard]] std::optional<std::string> read(const std::string& path) const override;
};

struct ArgFileOptions {
    std::optional<char> commentChar{'#'};
    bool simplified{false};
    bool trimQuotes{false};
};

// Replaces "@file" tokens with the tokens read from the file, recursively.
//
// "@@x" always yields the literal "@x". A lone "@", a file that does not exist or
// cannot be read, and a file already open further up the same inclusion chain are
// all kept literally and reported through the Tracer.
class ArgFileExpander {
public:
    ArgFileExpander(ArgFileOptions options, const FileSystem& fs, const Tracer& tracer)
        : options_(options), fs_(fs), tracer_(tracer) {}

    // Diagnostics at warn level are also appended to `warnings` when given.
    [[nodiscard]] std::vector<std::string> expand(const std::vector<std::string>& args,
                                                  std::vector<std::string>* warnings = nullptr) const;

    [[nodiscard]] std::vector<std::string> tokenize(std::string_view content) const;

    // One token per trimmed, non-blank line that does not start with the comment char.
    static std::vector<std::string> tokenizeSimplified(std::string_view content, std::optional<char> commentChar, bool trimQuotes);

    // Whitespace separated words; double-quoted runs keep their whitespace.
    // Inside quotes "\\", "\"" and backslash-whitespace are escapes and "\n", "\t"
    // are translated; outside quotes a backslash is an ordinary character.
    static std::vector<std::string> tokenizeClassic(std::string_view content, std::optional<char> commentChar, bool trimQuotes);

private:
    void expandInto(const std::vector<std::string>& args,
                    std::set<std::string>& chain,
                    std::vector<std::string>& out,
                    std::vector<std::string>* warnings) const;

    ArgFileOptions options_;
    const FileSystem& fs_;
    const Tracer& tracer_;
};

} // namespace argot

#endif // ARGOT_ARGFILE_HPP
