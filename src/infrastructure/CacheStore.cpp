/**
 * @file CacheStore.cpp
 * @brief Implementation of CacheStore.
 */

#include "infrastructure/CacheStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/IssueJson.hpp"
#include <ctime>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace clara::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

json IssuesToJson(const std::vector<domain::IssueRecord>& issues) {
    json arr = json::array();
    for (const auto& issue : issues) {
        arr.push_back(IssueJson::FromRecord(issue));
    }
    return arr;
}

std::vector<domain::IssueRecord> IssuesFromJson(const json& j) {
    std::vector<domain::IssueRecord> issues;
    auto it = j.find("issues");
    if (it == j.end()) return issues;
    for (const auto& item : *it) {
        issues.push_back(IssueJson::ToRecord(item));
    }
    return issues;
}

int ParseLineNumber(const std::string& key) {
    size_t consumed = 0;
    int value = std::stoi(key, &consumed);
    if (consumed != key.size() || value <= 0) {
        throw std::invalid_argument("invalid line key '" + key + "'");
    }
    return value;
}

json DocumentToJson(const domain::DocumentSnapshot& doc) {
    json lines = json::object();
    for (const auto& [lineNo, record] : doc.lines) {
        lines[std::to_string(lineNo)] = {
            {"content_hash", record.contentHash},
            {"issues", IssuesToJson(record.issues)}
        };
    }
    json segments = json::object();
    for (const auto& [digest, record] : doc.segments) {
        segments[digest] = {
            {"segment_hash", record.segmentHash},
            {"start_line", record.startLine},
            {"issues", IssuesToJson(record.issues)}
        };
    }
    json j = {
        {"file_hash", doc.fileHash},
        {"line_count", doc.lineCount},
        {"lines", lines},
        {"segments", segments}
    };
    if (!doc.fileIssues.empty()) {
        j["file_issues"] = IssuesToJson(doc.fileIssues);
    }
    return j;
}

domain::DocumentSnapshot DocumentFromJson(const json& j) {
    domain::DocumentSnapshot doc;
    doc.fileHash = j.at("file_hash").get<std::string>();
    doc.lineCount = j.at("line_count").get<int>();

    auto lines = j.find("lines");
    if (lines != j.end()) {
        for (auto it = lines->begin(); it != lines->end(); ++it) {
            domain::LineRecord record;
            record.lineNumber = ParseLineNumber(it.key());
            record.contentHash = it.value().at("content_hash").get<std::string>();
            record.issues = IssuesFromJson(it.value());
            doc.lines[record.lineNumber] = std::move(record);
        }
    }

    auto segments = j.find("segments");
    if (segments != j.end()) {
        for (auto it = segments->begin(); it != segments->end(); ++it) {
            domain::SegmentRecord record;
            record.segmentHash = it.value().value("segment_hash", it.key());
            record.startLine = it.value().at("start_line").get<int>();
            record.issues = IssuesFromJson(it.value());
            doc.segments[it.key()] = std::move(record);
        }
    }

    auto fileIssues = j.find("file_issues");
    if (fileIssues != j.end() && fileIssues->is_array()) {
        for (const auto& item : *fileIssues) {
            doc.fileIssues.push_back(IssueJson::ToRecord(item));
        }
    }
    return doc;
}

} // namespace

CacheStore::CacheStore(fs::path cachePath) : m_cachePath(std::move(cachePath)) {}

std::string CacheStore::CurrentTimestamp() {
    std::tm tm = ToUtcTime(std::time(nullptr));
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

std::optional<domain::CacheSnapshot> CacheStore::load() const {
    std::error_code ec;
    if (!fs::exists(m_cachePath, ec)) {
        return std::nullopt;
    }

    std::ifstream f(m_cachePath);
    if (!f.is_open()) {
        std::cerr << "[CacheStore] Cannot open " << m_cachePath << ", starting without cache." << std::endl;
        return std::nullopt;
    }

    try {
        json j = json::parse(f);
        if (!j.is_object()) {
            std::cerr << "[CacheStore] Cache root is not an object, ignoring " << m_cachePath << std::endl;
            return std::nullopt;
        }

        auto version = j.find("version");
        if (version == j.end() || !version->is_string() ||
            version->get<std::string>() != domain::kCacheFormatVersion) {
            std::cerr << "[CacheStore] Cache format "
                      << (version != j.end() ? version->dump() : std::string("<none>"))
                      << " does not match " << domain::kCacheFormatVersion << ", ignoring it." << std::endl;
            return std::nullopt;
        }

        domain::CacheSnapshot snapshot;
        snapshot.version = version->get<std::string>();
        snapshot.timestamp = j.value("timestamp", std::string{});
        auto files = j.find("files");
        if (files != j.end()) {
            for (auto it = files->begin(); it != files->end(); ++it) {
                snapshot.files[it.key()] = DocumentFromJson(it.value());
            }
        }
        return snapshot;
    } catch (const json::exception& e) {
        std::cerr << "[CacheStore] Invalid cache file " << m_cachePath << ": " << e.what() << std::endl;
    } catch (const std::logic_error& e) {
        // std::stoi / ParseLineNumber on a malformed line key.
        std::cerr << "[CacheStore] Invalid cache file " << m_cachePath << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

bool CacheStore::save(domain::CacheSnapshot& snapshot) const {
    snapshot.timestamp = CurrentTimestamp();

    json files = json::object();
    for (const auto& [path, doc] : snapshot.files) {
        files[path] = DocumentToJson(doc);
    }
    json j = {
        {"version", snapshot.version},
        {"timestamp", snapshot.timestamp},
        {"files", files}
    };

    std::string payload;
    try {
        payload = j.dump(2);
    } catch (const json::type_error& e) {
        // Invalid UTF-8 in a message or path.
        std::cerr << "[CacheStore] Cannot serialize cache: " << e.what() << std::endl;
        return false;
    }
    return AtomicFileWriter::Write(m_cachePath, payload);
}

} // namespace clara::infrastructure
