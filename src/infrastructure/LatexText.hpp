/**
 * @file LatexText.hpp
 * @brief LaTeX-to-prose helpers shared by the grammar checker and the segment extractor.
 */

#pragma once
#include <string>
#include <vector>

namespace clara::infrastructure {

/**
 * @class LatexText
 * @brief Line-preserving masking and plain-text conversion of LaTeX sources.
 *
 * Masking replaces characters with spaces but keeps every newline, so line
 * numbers computed on masked text are line numbers of the source.
 */
class LatexText {
public:
    /**
     * @brief Masks comments, the preamble, \\maketitle and everything after \\end{document}.
     */
    static std::string MaskPreambleAndComments(const std::string& content);

    /** @brief Replaces each unescaped '%' comment with spaces up to the line end. */
    static std::string MaskComments(const std::string& content);

    /**
     * @brief Converts one LaTeX line to prose.
     *
     * Inline math is dropped, text macros are unwrapped, reference-like macros
     * lose their argument, remaining control sequences and braces disappear and
     * whitespace is collapsed.
     */
    static std::string LineToPlainText(const std::string& line);

    /**
     * @brief Line-by-line plain text of masked content; display math environments become empty lines.
     *
     * The result has exactly as many lines as the input.
     */
    static std::vector<std::string> ToPlainLines(const std::string& masked);

    /** @brief Index of the first '%' not preceded by a backslash, or npos. */
    static size_t FindUnescapedPercent(const std::string& line);
};

} // namespace clara::infrastructure
