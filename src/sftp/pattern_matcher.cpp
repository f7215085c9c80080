#include "pattern_matcher.hpp"

PatternMatcher::PatternMatcher(std::string pattern)
    : pattern_(std::move(pattern)) {
}

bool PatternMatcher::matches(const std::string& filename, const std::string& pattern) {
    return filename.find(pattern) != std::string::npos;
}

bool PatternMatcher::matches(const std::string& filename) const {
    return matches(filename, pattern_);
}

std::vector<RemoteEntry> PatternMatcher::select_files(const std::vector<RemoteEntry>& entries) const {
    std::vector<RemoteEntry> selected;
    for (const auto& entry : entries) {
        if (entry.is_directory) continue;
        if (matches(entry.name)) selected.push_back(entry);
    }
    return selected;
}
