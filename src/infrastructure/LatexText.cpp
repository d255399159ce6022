/**
 * @file LatexText.cpp
 * @brief Implementation of LatexText.
 */

#include "infrastructure/LatexText.hpp"
#include "domain/Document.hpp"
#include <cctype>
#include <regex>
#include <set>

namespace clara::infrastructure {

namespace {

const std::string kBeginDocument = "\\begin{document}";
const std::string kEndDocument = "\\end{document}";
const std::string kMakeTitle = "\\maketitle";

// Macros whose arguments are not prose.
const std::set<std::string> kDropArguments = {
    "begin", "end", "label", "ref", "eqref", "pageref", "autoref", "cref", "Cref",
    "cite", "citep", "citet", "citealp", "parencite", "textcite",
    "includegraphics", "usepackage", "documentclass", "input", "include",
    "url", "bibliography", "bibliographystyle", "vspace", "hspace",
    "newcommand", "renewcommand", "setlength", "addbibresource"
};

const std::regex kBeginDisplayMath(R"(\\begin\{(equation|align|gather|multline|eqnarray|displaymath|math)\*?\})");
const std::regex kEndDisplayMath(R"(\\end\{(equation|align|gather|multline|eqnarray|displaymath|math)\*?\})");

void MaskRange(std::string& text, size_t from, size_t to) {
    for (size_t i = from; i < to && i < text.size(); ++i) {
        if (text[i] != '\n') text[i] = ' ';
    }
}

// Skips a balanced group starting at text[i] == open. Returns the index after it.
size_t SkipGroup(const std::string& text, size_t i, char open, char close) {
    int depth = 0;
    for (; i < text.size(); ++i) {
        if (text[i] == '\\') {
            ++i;
            continue;
        }
        if (text[i] == open) ++depth;
        else if (text[i] == close && --depth == 0) return i + 1;
    }
    return text.size();
}

std::string CollapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out.push_back(' ');
        pendingSpace = false;
        out.push_back(ch);
    }
    return out;
}

} // namespace

size_t LatexText::FindUnescapedPercent(const std::string& line) {
    size_t i = 0;
    while (true) {
        size_t idx = line.find('%', i);
        if (idx == std::string::npos) return std::string::npos;
        if (idx > 0 && line[idx - 1] == '\\') {
            i = idx + 1;
            continue;
        }
        return idx;
    }
}

std::string LatexText::MaskComments(const std::string& content) {
    std::string out = content;
    size_t start = 0;
    while (start < out.size()) {
        size_t end = out.find('\n', start);
        if (end == std::string::npos) end = out.size();
        std::string line = out.substr(start, end - start);
        size_t idx = FindUnescapedPercent(line);
        if (idx != std::string::npos) {
            MaskRange(out, start + idx, end);
        }
        start = end + 1;
    }
    return out;
}

std::string LatexText::MaskPreambleAndComments(const std::string& content) {
    std::string masked = MaskComments(content);

    size_t begin = masked.find(kBeginDocument);
    if (begin != std::string::npos) {
        MaskRange(masked, 0, begin);
    }

    size_t pos = 0;
    while ((pos = masked.find(kMakeTitle, pos)) != std::string::npos) {
        MaskRange(masked, pos, pos + kMakeTitle.size());
        pos += kMakeTitle.size();
    }

    size_t end = masked.find(kEndDocument);
    if (end != std::string::npos) {
        MaskRange(masked, end + kEndDocument.size(), masked.size());
    }
    return masked;
}

std::string LatexText::LineToPlainText(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    const size_t n = line.size();
    size_t i = 0;

    while (i < n) {
        char c = line[i];

        if (c == '$') {
            bool display = (i + 1 < n && line[i + 1] == '$');
            size_t close = display ? line.find("$$", i + 2) : line.find('$', i + 1);
            i = (close == std::string::npos) ? n : close + (display ? 2 : 1);
            out.push_back(' ');
            continue;
        }

        if (c == '\\') {
            if (i + 1 >= n) {
                ++i;
                continue;
            }
            char next = line[i + 1];
            if (next == '(' || next == '[') {
                size_t close = line.find(next == '(' ? "\\)" : "\\]", i + 2);
                i = (close == std::string::npos) ? n : close + 2;
                out.push_back(' ');
                continue;
            }
            if (std::isalpha(static_cast<unsigned char>(next))) {
                size_t j = i + 1;
                while (j < n && std::isalpha(static_cast<unsigned char>(line[j]))) ++j;
                std::string name = line.substr(i + 1, j - i - 1);
                if (j < n && line[j] == '*') ++j;
                if (kDropArguments.count(name)) {
                    while (j < n && (line[j] == '[' || line[j] == '{')) {
                        j = (line[j] == '[') ? SkipGroup(line, j, '[', ']') : SkipGroup(line, j, '{', '}');
                    }
                } else {
                    // Optional arguments of text macros are layout hints.
                    while (j < n && line[j] == '[') j = SkipGroup(line, j, '[', ']');
                }
                i = j;
                continue;
            }
            if (next == '\\' || next == ',' || next == ';' || next == ' ' || next == '!') {
                out.push_back(' ');
            } else {
                out.push_back(next);
            }
            i += 2;
            continue;
        }

        if (c == '{' || c == '}') {
            ++i;
            continue;
        }
        out.push_back(c == '~' ? ' ' : c);
        ++i;
    }
    return CollapseWhitespace(out);
}

std::vector<std::string> LatexText::ToPlainLines(const std::string& masked) {
    std::vector<std::string> result;
    bool inDisplayMath = false;
    bool inBracketMath = false;

    for (const auto& line : domain::Document::SplitLines(masked)) {
        if (inDisplayMath) {
            if (std::regex_search(line, kEndDisplayMath)) inDisplayMath = false;
            result.emplace_back();
            continue;
        }
        if (inBracketMath) {
            if (line.find("\\]") != std::string::npos) inBracketMath = false;
            result.emplace_back();
            continue;
        }
        if (std::regex_search(line, kBeginDisplayMath)) {
            inDisplayMath = !std::regex_search(line, kEndDisplayMath);
            result.emplace_back();
            continue;
        }
        size_t open = line.find("\\[");
        if (open != std::string::npos && line.find("\\]", open) == std::string::npos) {
            inBracketMath = true;
            result.push_back(LineToPlainText(line.substr(0, open)));
            continue;
        }
        result.push_back(LineToPlainText(line));
    }
    return result;
}

} // namespace clara::infrastructure
