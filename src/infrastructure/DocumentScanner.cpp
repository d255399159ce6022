/**
 * @file DocumentScanner.cpp
 * @brief Implementation of the DocumentScanner.
 */

#include "infrastructure/DocumentScanner.hpp"
#include <algorithm>
#include <filesystem>
#include <fnmatch.h>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace clara::infrastructure {

namespace {

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

bool MatchParts(const std::vector<std::string>& pattern, size_t pi,
                const std::vector<std::string>& path, size_t si) {
    if (pi == pattern.size()) return si == path.size();
    if (pattern[pi] == "**") {
        for (size_t k = si; k <= path.size(); ++k) {
            if (MatchParts(pattern, pi + 1, path, k)) return true;
        }
        return false;
    }
    if (si == path.size()) return false;
    if (fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0) return false;
    return MatchParts(pattern, pi + 1, path, si + 1);
}

} // namespace

DocumentScanner::DocumentScanner(std::string rootPath, std::vector<std::string> include, std::vector<std::string> exclude)
    : m_rootPath(std::move(rootPath)), m_include(std::move(include)), m_exclude(std::move(exclude)) {}

bool DocumentScanner::MatchesInclude(const std::string& pattern, const std::string& relPath) {
    return MatchParts(SplitPath(pattern), 0, SplitPath(relPath), 0);
}

bool DocumentScanner::IsExcluded(const std::string& relPath, const std::vector<std::string>& patterns) {
    for (const auto& pattern : patterns) {
        if (fnmatch(pattern.c_str(), relPath.c_str(), 0) == 0) return true;
        if (pattern.size() > 3 && pattern.compare(pattern.size() - 3, 3, "/**") == 0) {
            const std::string dir = pattern.substr(0, pattern.size() - 2); // keeps the trailing '/'
            if (relPath.compare(0, dir.size(), dir) == 0) return true;
        }
    }
    return false;
}

std::vector<std::string> DocumentScanner::scan() const {
    std::set<std::string> found;
    std::error_code ec;
    if (!fs::is_directory(m_rootPath, ec)) {
        return {};
    }

    fs::recursive_directory_iterator it(m_rootPath, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[DocumentScanner] Cannot scan " << m_rootPath << ": " << ec.message() << std::endl;
        return {};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[DocumentScanner] " << ec.message() << std::endl;
            break;
        }
        std::error_code typeEc;
        if (!it->is_regular_file(typeEc)) continue;

        std::string rel = fs::relative(it->path(), m_rootPath, typeEc).generic_string();
        if (typeEc || rel.empty()) continue;

        bool included = std::any_of(m_include.begin(), m_include.end(),
                                    [&](const std::string& pattern) { return MatchesInclude(pattern, rel); });
        if (included && !IsExcluded(rel, m_exclude)) {
            found.insert(rel);
        }
    }
    return std::vector<std::string>(found.begin(), found.end());
}

} // namespace clara::infrastructure
