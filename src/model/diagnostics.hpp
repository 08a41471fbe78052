/**
 * @file diagnostics.hpp
 * @brief Структуры данных для отчёта проверки коллекции
 */

#pragma once

#include "record.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace adrkit::model {

/// Уровни упорядочены: Info < Warning < Error
enum class Severity {
    Info,
    Warning,
    Error
};

/**
 * @brief Правило, породившее диагностику
 */
enum class CheckRule {
    DuplicateNumbers,
    FileNaming,
    MissingStatus,
    BrokenLinks,
    NumberingGaps,
    SupersededLinks,
    UnparseableFiles
};

struct Diagnostic {
    Severity severity = Severity::Info;
    CheckRule rule = CheckRule::NumberingGaps;
    std::string message;
    std::optional<std::filesystem::path> path;
    std::optional<RecordNumber> record_number;
};

struct DoctorSummary {
    Severity status = Severity::Info;
    size_t info = 0;
    size_t warning = 0;
    size_t error = 0;
};

struct DoctorMeta {
    std::string schema_version = "1.0.0";
    std::string app_version;
    std::string build_type;
    std::string timestamp;
    std::filesystem::path records_root;
    size_t records_checked = 0;
};

struct DoctorReport {
    DoctorMeta meta;
    std::vector<Diagnostic> diagnostics;   ///< По убыванию важности

    void add(Diagnostic diagnostic) {
        diagnostics.push_back(std::move(diagnostic));
    }

    [[nodiscard]] size_t countBySeverity(Severity severity) const noexcept {
        return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
            [severity](const Diagnostic& d) { return d.severity == severity; }));
    }

    [[nodiscard]] size_t countByRule(CheckRule rule) const noexcept {
        return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
            [rule](const Diagnostic& d) { return d.rule == rule; }));
    }

    [[nodiscard]] bool hasErrors() const noexcept { return countBySeverity(Severity::Error) > 0; }
    [[nodiscard]] bool hasWarnings() const noexcept { return countBySeverity(Severity::Warning) > 0; }
    [[nodiscard]] bool isHealthy() const noexcept { return !hasErrors() && !hasWarnings(); }

    [[nodiscard]] DoctorSummary summarize() const noexcept {
        DoctorSummary summary;
        for (const auto& d : diagnostics) {
            switch (d.severity) {
            case Severity::Info: summary.info++; break;
            case Severity::Warning: summary.warning++; break;
            case Severity::Error: summary.error++; break;
            }
        }
        if (summary.error > 0) {
            summary.status = Severity::Error;
        } else if (summary.warning > 0) {
            summary.status = Severity::Warning;
        } else {
            summary.status = Severity::Info;
        }
        return summary;
    }
};

[[nodiscard]] inline std::string_view severityToString(Severity severity) noexcept {
    switch (severity) {
    case Severity::Info: return "info";
    case Severity::Warning: return "warning";
    case Severity::Error: return "error";
    }
    return "unknown";
}

[[nodiscard]] inline std::string_view checkRuleToString(CheckRule rule) noexcept {
    switch (rule) {
    case CheckRule::DuplicateNumbers: return "duplicate-numbers";
    case CheckRule::FileNaming: return "file-naming";
    case CheckRule::MissingStatus: return "missing-status";
    case CheckRule::BrokenLinks: return "broken-links";
    case CheckRule::NumberingGaps: return "numbering-gaps";
    case CheckRule::SupersededLinks: return "superseded-links";
    case CheckRule::UnparseableFiles: return "unparseable-files";
    }
    return "unknown";
}

} // namespace adrkit::model
