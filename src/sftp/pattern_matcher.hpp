#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Selects remote files by literal, case-sensitive substring. There is no
// wildcard or regex interpretation: "*.csv" only matches names containing "*.csv".
class PatternMatcher {
public:
    explicit PatternMatcher(std::string pattern = "");

    // True iff pattern occurs in filename. An empty pattern matches everything.
    static bool matches(const std::string& filename, const std::string& pattern);
    bool matches(const std::string& filename) const;

    // Files (not directories) whose name matches, in listing order.
    std::vector<RemoteEntry> select_files(const std::vector<RemoteEntry>& entries) const;

    const std::string& pattern() const { return pattern_; }

private:
    std::string pattern_;
};
