/**
 * @file SegmentExtractor.cpp
 * @brief Implementation of SegmentExtractor.
 */

#include "infrastructure/SegmentExtractor.hpp"
#include "infrastructure/LatexText.hpp"
#include <algorithm>
#include <cctype>

namespace clara::infrastructure {

namespace {

std::string Strip(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

// Splits after every [.!?] that is followed by whitespace; the whitespace is dropped.
std::vector<std::string> SplitSentences(const std::string& buffer) {
    std::vector<std::string> parts;
    size_t partStart = 0;
    size_t i = 0;
    while (i < buffer.size()) {
        char c = buffer[i];
        bool terminal = (c == '.' || c == '!' || c == '?');
        if (terminal && i + 1 < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[i + 1]))) {
            parts.push_back(buffer.substr(partStart, i + 1 - partStart));
            size_t j = i + 1;
            while (j < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[j]))) ++j;
            partStart = j;
            i = j;
            continue;
        }
        ++i;
    }
    parts.push_back(buffer.substr(partStart));
    return parts;
}

} // namespace

SegmentExtractor::SegmentExtractor(size_t targetMaxChars, size_t overlapSentences)
    : m_targetMaxChars(targetMaxChars), m_overlapSentences(overlapSentences) {}

std::vector<domain::Segment> SegmentExtractor::extract(const domain::Document& document) const {
    std::vector<domain::Segment> segments;
    auto lines = ExtractLineTexts(document.getContent());
    if (lines.empty()) return segments;

    auto sentences = SentencesFromLines(lines);
    for (auto& [text, startLine] : chunkSentences(sentences)) {
        segments.push_back(domain::Segment{std::move(text), document.getPath(), startLine});
    }
    return segments;
}

std::vector<SegmentExtractor::Sentence> SegmentExtractor::ExtractLineTexts(const std::string& content) {
    std::vector<Sentence> results;
    auto plain = LatexText::ToPlainLines(LatexText::MaskPreambleAndComments(content));
    for (size_t i = 0; i < plain.size(); ++i) {
        if (!plain[i].empty()) {
            results.emplace_back(plain[i], static_cast<int>(i) + 1);
        }
    }
    return results;
}

std::vector<SegmentExtractor::Sentence> SegmentExtractor::SentencesFromLines(const std::vector<Sentence>& lines) {
    std::vector<Sentence> sentences;
    std::string buffer;
    int startLine = 0; // 0: no open sentence

    for (const auto& [text, lineNo] : lines) {
        if (text.empty()) continue;
        if (buffer.empty()) {
            startLine = lineNo;
            buffer = text;
        } else {
            buffer += " " + text;
        }

        auto parts = SplitSentences(buffer);
        if (parts.size() == 1) continue;

        for (size_t k = 0; k + 1 < parts.size(); ++k) {
            std::string sentence = Strip(parts[k]);
            if (!sentence.empty()) {
                sentences.emplace_back(sentence, startLine != 0 ? startLine : lineNo);
            }
            startLine = lineNo;
        }
        buffer = Strip(parts.back());
        if (buffer.empty()) startLine = 0;
    }

    if (!buffer.empty()) {
        sentences.emplace_back(buffer, startLine != 0 ? startLine : lines.back().second);
    }
    return sentences;
}

std::vector<SegmentExtractor::Sentence> SegmentExtractor::chunkSentences(const std::vector<Sentence>& sentences) const {
    std::vector<Sentence> chunks;
    std::vector<Sentence> current;
    size_t currentLen = 0;

    auto flush = [&]() {
        if (current.empty()) return;
        std::string text;
        for (const auto& s : current) {
            if (!text.empty()) text += " ";
            text += s.first;
        }
        text = Strip(text);
        if (!text.empty()) chunks.emplace_back(text, current.front().second);
        current.clear();
        currentLen = 0;
    };

    for (const auto& [sentence, lineNo] : sentences) {
        std::string s = Strip(sentence);
        if (s.empty()) continue;

        size_t addLen = s.size() + (current.empty() ? 0 : 1);
        if (!current.empty() && currentLen + addLen > m_targetMaxChars) {
            std::vector<Sentence> tail;
            if (m_overlapSentences > 0) {
                size_t keep = std::min(m_overlapSentences, current.size());
                tail.assign(current.end() - static_cast<std::ptrdiff_t>(keep), current.end());
            }
            flush();
            current = tail;
            for (const auto& t : current) currentLen += t.first.size();
            if (current.size() > 1) currentLen += current.size() - 1;
        }

        if (current.empty()) {
            current.emplace_back(s, lineNo);
            currentLen = s.size();
        } else {
            current.emplace_back(s, lineNo);
            currentLen += s.size() + 1;
        }
    }

    flush();
    return chunks;
}

} // namespace clara::infrastructure
