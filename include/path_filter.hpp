/**
 * @file path_filter.hpp
 * @brief Exclusion rules deciding which entries of a source tree enter an archive.
 */

#ifndef PATH_FILTER_HPP
#define PATH_FILTER_HPP

#include <filesystem>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Directory names and file suffixes to leave out of an archive.
 *
 * Directory names match a single path segment exactly; suffixes match the end of a
 * file name. Both comparisons are case-sensitive.
 */
struct ExclusionRuleSet {
    std::set<std::string> directoryNames; ///< Excluded directory base names.
    std::set<std::string> fileSuffixes;   ///< Excluded file-name suffixes.

    /**
     * @brief Builds the default rules ({.venv, __pycache__, .git, node_modules} and
     * {.pyc, .log, .tmp}) extended with the given additions.
     */
    static ExclusionRuleSet withDefaults(const std::vector<std::string>& extraDirectories = {},
                                         const std::vector<std::string>& extraSuffixes = {});
};

/**
 * @brief Pure predicate over an entry's name and type.
 */
class PathFilter {
public:
    explicit PathFilter(ExclusionRuleSet rules);

    /**
     * @brief Tells whether an entry must be left out of the archive.
     *
     * An excluded directory also excludes its whole subtree; the caller must not
     * descend into it.
     *
     * @param entryPath Path of the entry; only its base name is inspected.
     * @param isDirectory True for directories.
     * @return bool True if the entry is excluded.
     */
    bool shouldExclude(const std::filesystem::path& entryPath, bool isDirectory) const;

    const ExclusionRuleSet& rules() const { return rules_; }

private:
    ExclusionRuleSet rules_;
};

#endif // PATH_FILTER_HPP
