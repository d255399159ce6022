/**
 * @file ReviewTools.hpp
 * @brief Interfaces for the external checking tools, segment producer and LLM reviewer.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/Document.hpp"
#include "domain/Issue.hpp"

namespace clara::domain {

/**
 * @struct ToolRun
 * @brief Output of one tool invocation. A set failure means the issues are incomplete.
 */
struct ToolRun {
    std::string tool;
    std::vector<Issue> issues;
    std::optional<std::string> failure;

    bool succeeded() const { return !failure.has_value(); }
};

/**
 * @class LineChecker
 * @brief A line-oriented tool (linter, spell checker, grammar service) run over whole files.
 */
class LineChecker {
public:
    virtual ~LineChecker() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Checks the given files.
     * @param files Document paths as passed on the command line.
     * @return Issues positioned by file and 1-based line.
     */
    virtual ToolRun check(const std::vector<std::string>& files) = 0;
};

/**
 * @class SegmentSource
 * @brief Splits documents into review segments. Boundaries are recomputed every run.
 */
class SegmentSource {
public:
    virtual ~SegmentSource() = default;

    virtual std::vector<Segment> extract(const Document& document) const = 0;
};

/**
 * @class SegmentReviewer
 * @brief Language-model reviewer operating on one segment at a time.
 */
class SegmentReviewer {
public:
    virtual ~SegmentReviewer() = default;

    virtual std::string name() const = 0;

    /** @brief Reviews a segment; issues are reported at the segment's start line. */
    virtual ToolRun review(const Segment& segment) = 0;
};

} // namespace clara::domain
