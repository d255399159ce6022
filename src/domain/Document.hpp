/**
 * @file Document.hpp
 * @brief Domain entities for reviewed documents and their LLM review units.
 */

#pragma once
#include <string>
#include <vector>

namespace clara::domain {

/**
 * @class Document
 * @brief A source file under review: a stable path plus its raw content split into lines.
 */
class Document {
public:
    Document(std::string path, std::string content)
        : m_path(std::move(path)), m_content(std::move(content)), m_lines(SplitLines(m_content)) {}

    const std::string& getPath() const { return m_path; }
    const std::string& getContent() const { return m_content; }

    /** @brief Lines in order; index 0 is line 1. */
    const std::vector<std::string>& getLines() const { return m_lines; }

    int lineCount() const { return static_cast<int>(m_lines.size()); }

    /**
     * @brief Splits on '\n', dropping a trailing '\r' per line.
     * A final newline does not open an extra empty line.
     */
    static std::vector<std::string> SplitLines(const std::string& content) {
        std::vector<std::string> lines;
        size_t start = 0;
        while (start < content.size()) {
            size_t end = content.find('\n', start);
            if (end == std::string::npos) end = content.size();
            std::string line = content.substr(start, end - start);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
            start = end + 1;
        }
        return lines;
    }

private:
    std::string m_path;
    std::string m_content;
    std::vector<std::string> m_lines;
};

/**
 * @struct Segment
 * @brief A sentence-bounded span of plain text submitted to the LLM reviewer as one unit.
 */
struct Segment {
    std::string text;
    std::string file;
    int startLine = 0;
};

} // namespace clara::domain
