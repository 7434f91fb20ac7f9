#include "argot/argfile.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "argot/utils.hpp"

namespace argot {

std::optional<std::string> LocalFileSystem::canonical(const std::string& path) const {
    std::error_code ec;
    const std::filesystem::path p(path);
    if (!std::filesystem::exists(p, ec) || ec) return std::nullopt;
    auto resolved = std::filesystem::weakly_canonical(p, ec);
    if (ec) {
        ec.clear();
        resolved = std::filesystem::absolute(p, ec);
        if (ec) return path;
    }
    return resolved.string();
}

std::optional<std::string> LocalFileSystem::read(const std::string& path) const {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) return std::nullopt;
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return std::nullopt;
    return ss.str();
}

std::vector<std::string> ArgFileExpander::tokenizeSimplified(std::string_view content,
                                                             std::optional<char> commentChar,
                                                             bool trimQuotes) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto eol = content.find('\n', pos);
        if (eol == std::string_view::npos) eol = content.size();
        const auto line = utils::trimWs(content.substr(pos, eol - pos));
        pos = eol + 1;
        if (line.empty()) continue;
        if (commentChar && line.front() == *commentChar) continue;
        out.push_back(trimQuotes ? utils::unquote(line) : std::string(line));
    }
    return out;
}

std::vector<std::string> ArgFileExpander::tokenizeClassic(std::string_view content,
                                                          std::optional<char> commentChar,
                                                          bool trimQuotes) {
    std::vector<std::string> out;
    std::string current;
    bool inToken = false;
    bool quoted = false;

    auto finish = [&]() {
        if (inToken) out.push_back(current);
        current.clear();
        inToken = false;
    };

    for (std::size_t i = 0; i < content.size(); ++i) {
        const char ch = content[i];
        const bool space = std::isspace(static_cast<unsigned char>(ch)) != 0;

        if (quoted) {
            if (ch == '\\' && i + 1 < content.size()) {
                const char next = content[i + 1];
                if (next == '\\' || next == '"' || std::isspace(static_cast<unsigned char>(next))) {
                    current.push_back(next);
                    ++i;
                    continue;
                }
                if (next == 'n' || next == 't') {
                    current.push_back(next == 'n' ? '\n' : '\t');
                    ++i;
                    continue;
                }
                current.push_back(ch);
                continue;
            }
            if (ch == '"') {
                quoted = false;
                if (!trimQuotes) current.push_back(ch);
                continue;
            }
            current.push_back(ch);
            continue;
        }

        if (space) {
            finish();
            continue;
        }
        if (!inToken && commentChar && ch == *commentChar) {
            while (i < content.size() && content[i] != '\n') ++i;
            continue;
        }
        inToken = true;
        if (ch == '"') {
            quoted = true;
            if (!trimQuotes) current.push_back(ch);
            continue;
        }
        current.push_back(ch);
    }
    finish();
    return out;
}

std::vector<std::string> ArgFileExpander::tokenize(std::string_view content) const {
    return options_.simplified ? tokenizeSimplified(content, options_.commentChar, options_.trimQuotes)
                               : tokenizeClassic(content, options_.commentChar, options_.trimQuotes);
}

std::vector<std::string> ArgFileExpander::expand(const std::vector<std::string>& args,
                                                 std::vector<std::string>* warnings) const {
    std::vector<std::string> out;
    out.reserve(args.size());
    std::set<std::string> chain;
    expandInto(args, chain, out, warnings);
    return out;
}

void ArgFileExpander::expandInto(const std::vector<std::string>& args,
                                 std::set<std::string>& chain,
                                 std::vector<std::string>& out,
                                 std::vector<std::string>* warnings) const {
    auto warn = [&](const std::string& msg) {
        tracer_.warn(msg);
        if (warnings) warnings->push_back(msg);
    };

    for (const auto& arg : args) {
        if (arg.size() < 2 || arg[0] != '@') {
            out.push_back(arg);
            continue;
        }
        if (arg[1] == '@') {
            out.push_back(arg.substr(1));
            continue;
        }

        const std::string path = arg.substr(1);
        const auto id = fs_.canonical(path);
        if (!id) {
            tracer_.info("File " + path + " does not exist; treating '" + arg + "' as a literal argument");
            out.push_back(arg);
            continue;
        }
        if (chain.count(*id)) {
            warn("Argument file " + path + " includes itself (via " + *id + "); treating '" + arg + "' literally");
            out.push_back(arg);
            continue;
        }
        const auto content = fs_.read(path);
        if (!content) {
            warn("Could not read argument file " + path + "; treating '" + arg + "' literally");
            out.push_back(arg);
            continue;
        }

        const auto tokens = tokenize(*content);
        tracer_.info("Expanding argument file " + path + " into " + std::to_string(tokens.size()) + " token(s)");
        chain.insert(*id);
        expandInto(tokens, chain, out, warnings);
        chain.erase(*id);
    }
}

} // namespace argot
