/**
 * @file SegmentExtractor.hpp
 * @brief Splits LaTeX documents into sentence-bounded review segments.
 */

#pragma once
#include <string>
#include <utility>
#include <vector>
#include "domain/ReviewTools.hpp"

namespace clara::infrastructure {

/**
 * @class SegmentExtractor
 * @brief SegmentSource for LaTeX: masks non-prose, splits sentences, chunks by a character limit.
 *
 * Character counts stand in for token limits. Consecutive chunks repeat the
 * last overlapSentences sentences of the previous chunk for context.
 */
class SegmentExtractor : public domain::SegmentSource {
public:
    using Sentence = std::pair<std::string, int>; ///< Text and 1-based start line.

    explicit SegmentExtractor(size_t targetMaxChars = 4000, size_t overlapSentences = 1);

    std::vector<domain::Segment> extract(const domain::Document& document) const override;

    /** @brief Non-empty plain-text lines with their source line numbers. */
    static std::vector<Sentence> ExtractLineTexts(const std::string& content);

    /** @brief Joins line texts and splits on '.', '!' or '?' followed by whitespace. */
    static std::vector<Sentence> SentencesFromLines(const std::vector<Sentence>& lines);

    std::vector<Sentence> chunkSentences(const std::vector<Sentence>& sentences) const;

private:
    size_t m_targetMaxChars;
    size_t m_overlapSentences;
};

} // namespace clara::infrastructure
