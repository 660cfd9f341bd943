#include "path_filter.hpp"
#include <algorithm>
#include <utility>

ExclusionRuleSet ExclusionRuleSet::withDefaults(const std::vector<std::string>& extraDirectories,
                                                const std::vector<std::string>& extraSuffixes) {
    ExclusionRuleSet rules;
    rules.directoryNames = {".venv", "__pycache__", ".git", "node_modules"};
    rules.fileSuffixes = {".pyc", ".log", ".tmp"};
    for (const auto& dir : extraDirectories) {
        if (!dir.empty()) {
            rules.directoryNames.insert(dir);
        }
    }
    for (const auto& suffix : extraSuffixes) {
        if (!suffix.empty()) {
            rules.fileSuffixes.insert(suffix);
        }
    }
    return rules;
}

PathFilter::PathFilter(ExclusionRuleSet rules) : rules_(std::move(rules)) {}

bool PathFilter::shouldExclude(const std::filesystem::path& entryPath, bool isDirectory) const {
    const std::string name = entryPath.filename().string();
    if (isDirectory) {
        return rules_.directoryNames.contains(name);
    }
    return std::ranges::any_of(rules_.fileSuffixes, [&name](const std::string& suffix) {
        return name.ends_with(suffix);
    });
}
