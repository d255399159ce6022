/**
 * @file DocumentScanner.hpp
 * @brief Scanner for discovering LaTeX sources in a project tree.
 */

#pragma once
#include <string>
#include <vector>

namespace clara::infrastructure {

/**
 * @class DocumentScanner
 * @brief Finds documents under a root by include globs minus exclude globs.
 *
 * Include patterns match path components: "**" spans zero or more
 * directories, other components use shell wildcards. Exclude patterns are
 * matched against the whole relative path; "dir/**" excludes the whole tree.
 */
class DocumentScanner {
public:
    DocumentScanner(std::string rootPath, std::vector<std::string> include, std::vector<std::string> exclude);

    /**
     * @brief Scans the tree.
     * @return Root-relative paths with '/' separators, sorted.
     */
    std::vector<std::string> scan() const;

    static bool MatchesInclude(const std::string& pattern, const std::string& relPath);
    static bool IsExcluded(const std::string& relPath, const std::vector<std::string>& patterns);

private:
    std::string m_rootPath;
    std::vector<std::string> m_include;
    std::vector<std::string> m_exclude;
};

} // namespace clara::infrastructure
