#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace savewarden {

inline std::string toConfigErrorString(ConfigErrorKind kind)
{
    switch (kind) {
    case ConfigErrorKind::None:
        return "none";
    case ConfigErrorKind::NotFound:
        return "not_found";
    case ConfigErrorKind::Unreadable:
        return "unreadable";
    case ConfigErrorKind::ParseError:
        return "parse_error";
    case ConfigErrorKind::Malformed:
        return "malformed";
    }
    return "none";
}

inline std::string toStateErrorString(StateErrorKind kind)
{
    switch (kind) {
    case StateErrorKind::Unreadable:
        return "unreadable";
    case StateErrorKind::ParseError:
        return "parse_error";
    case StateErrorKind::Malformed:
        return "malformed";
    }
    return "malformed";
}

inline std::string toOutcomeString(RunOutcome outcome)
{
    switch (outcome) {
    case RunOutcome::Disabled:
        return "disabled";
    case RunOutcome::Succeeded:
        return "succeeded";
    case RunOutcome::NothingProcessed:
        return "nothing_processed";
    case RunOutcome::Failed:
        return "failed";
    }
    return "failed";
}

inline void to_json(nlohmann::json &j, const SourceDirectory &source)
{
    j = nlohmann::json{
        {"path", source.path},
        {"name", source.name}
    };
}

inline void to_json(nlohmann::json &j, const BackupConfig &config)
{
    j = nlohmann::json{
        {"backup_directory", config.backupDirectory},
        {"source_directories", config.sourceDirectories},
        {"save_extension", config.saveExtension}
    };
}

// State file layout: one object per source entry, plus any legacy flat
// records that have not been superseded yet, kept at top level.
inline void to_json(nlohmann::json &j, const BackupState &state)
{
    j = nlohmann::json::object();
    for (const auto &[fileName, mtime] : state.legacy()) {
        j[fileName] = mtime;
    }
    for (const auto &[entryName, files] : state.entries()) {
        nlohmann::json entry = nlohmann::json::object();
        for (const auto &[fileName, mtime] : files) {
            entry[fileName] = mtime;
        }
        j[entryName] = entry;
    }
}

inline void to_json(nlohmann::json &j, const BackupRunReport &report)
{
    j = nlohmann::json{
        {"outcome", toOutcomeString(report.outcome)},
        {"filesBackedUp", report.filesBackedUp},
        {"sourcesProcessed", report.sourcesProcessed},
        {"sourcesFailed", report.sourcesFailed}
    };
}

} // namespace savewarden
