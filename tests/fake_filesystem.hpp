#ifndef ARGOT_TESTS_FAKE_FILESYSTEM_HPP
#define ARGOT_TESTS_FAKE_FILESYSTEM_HPP

#include <map>
#include <optional>
#include <set>
#include <string>

#include "argot/argfile.hpp"

namespace argot::testing {

// In-memory files keyed by path. Paths listed in `unreadable` exist but fail to read.
class FakeFileSystem final : public FileSystem {
public:
    FakeFileSystem& add(const std::string& path, std::string content) {
        files_[path] = std::move(content);
        return *this;
    }

    FakeFileSystem& addUnreadable(const std::string& path) {
        unreadable_.insert(path);
        return *this;
    }

    [[nodiscard]] std::optional<std::string> canonical(const std::string& path) const override {
        ++calls_;
        if (files_.count(path) || unreadable_.count(path)) return "/fake/" + path;
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string> read(const std::string& path) const override {
        ++calls_;
        ++reads_[path];
        const auto it = files_.find(path);
        if (it == files_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] int calls() const { return calls_; }
    [[nodiscard]] int reads(const std::string& path) const {
        const auto it = reads_.find(path);
        return it == reads_.end() ? 0 : it->second;
    }

private:
    std::map<std::string, std::string> files_;
    std::set<std::string> unreadable_;
    mutable int calls_{0};
    mutable std::map<std::string, int> reads_;
};

} // namespace argot::testing

#endif // ARGOT_TESTS_FAKE_FILESYSTEM_HPP
