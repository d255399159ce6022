/**
 * @file Issue.hpp
 * @brief Domain types for review findings.
 */

#pragma once
#include <string>
#include <optional>

namespace clara::domain {

/**
 * @enum Severity
 * @brief Closed set of severities a finding can carry.
 */
enum class Severity {
    Error,
    Warning,
    Note
};

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Note: return "note";
    }
    return "note";
}

/** @brief Unknown labels (vale's "suggestion", typos) read as Note. */
inline Severity SeverityFromString(const std::string& value) {
    if (value == "error") return Severity::Error;
    if (value == "warning") return Severity::Warning;
    return Severity::Note;
}

/**
 * @struct Adjudication
 * @brief Accept/reject decision attached to an issue by a reviewer.
 */
struct Adjudication {
    bool accept = true;
    std::optional<std::string> fix;
    std::optional<std::string> comment;

    bool operator==(const Adjudication& other) const {
        return accept == other.accept && fix == other.fix && comment == other.comment;
    }
};

struct Issue;

/**
 * @struct IssueRecord
 * @brief A finding without its position. File and line are supplied by the
 *        enclosing cache record.
 */
struct IssueRecord {
    std::string tool;
    std::string type = "generic";
    int col = 0;
    Severity severity = Severity::Note;
    std::string message;
    std::optional<std::string> code;
    std::optional<std::string> suggestion;
    std::optional<Adjudication> adjudication;

    /** @brief Reattaches a position to produce a full issue. */
    Issue attach(const std::string& file, int line) const;

    bool operator==(const IssueRecord& other) const {
        return tool == other.tool && type == other.type && col == other.col &&
               severity == other.severity && message == other.message &&
               code == other.code && suggestion == other.suggestion &&
               adjudication == other.adjudication;
    }
};

/**
 * @struct Issue
 * @brief A positioned finding as reported by a tool or emitted in the report.
 */
struct Issue {
    std::string tool;
    std::string type = "generic";
    std::string file; ///< Empty for run-level diagnostics (tool failures).
    int line = 0;     ///< 1-based; 0 when the finding has no line.
    int col = 0;
    Severity severity = Severity::Note;
    std::string message;
    std::optional<std::string> code;
    std::optional<std::string> suggestion;
    std::optional<Adjudication> adjudication;

    bool suppressed = false;
    std::string suppressionRule;

    /** @brief Drops file/line (and suppression state) for cache storage. */
    IssueRecord toRecord() const {
        IssueRecord record;
        record.tool = tool;
        record.type = type;
        record.col = col;
        record.severity = severity;
        record.message = message;
        record.code = code;
        record.suggestion = suggestion;
        record.adjudication = adjudication;
        return record;
    }

    /** @brief Builds a diagnostic describing a failed tool invocation. */
    static Issue ToolFailure(const std::string& tool, const std::string& message) {
        Issue issue;
        issue.tool = tool;
        issue.type = "tool_failure";
        issue.severity = Severity::Error;
        issue.message = message;
        return issue;
    }
};

inline Issue IssueRecord::attach(const std::string& file, int line) const {
    Issue issue;
    issue.tool = tool;
    issue.type = type;
    issue.file = file;
    issue.line = line;
    issue.col = col;
    issue.severity = severity;
    issue.message = message;
    issue.code = code;
    issue.suggestion = suggestion;
    issue.adjudication = adjudication;
    return issue;
}

} // namespace clara::domain
