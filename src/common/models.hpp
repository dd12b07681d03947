#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace savewarden {

inline constexpr const char *kDefaultSaveExtension = ".sl2";

struct SourceDirectory {
    // May contain $VAR, ${VAR} or %VAR% references, expanded at use time.
    std::string path;
    // Display label; its sanitized form names the backup subdirectory and
    // its raw form keys the entry's records in the state file.
    std::string name;

    bool operator==(const SourceDirectory &) const = default;
};

struct BackupConfig {
    std::string backupDirectory;
    std::vector<SourceDirectory> sourceDirectories;
    std::string saveExtension = kDefaultSaveExtension;

    bool operator==(const BackupConfig &) const = default;
};

struct ConfigLoadResult {
    std::optional<BackupConfig> config;
    ConfigErrorKind error = ConfigErrorKind::None;
    std::string message;

    bool ok() const { return config.has_value(); }
};

/**
 * BackupState remembers, per source entry, the modification time (seconds
 * since the epoch) at which each save file was last copied.
 *
 * Records read from a legacy flat state file have no entry and live in a
 * separate bucket. A keyed lookup that misses falls back to that bucket;
 * recording a file under any entry retires the legacy record for the same
 * filename.
 */
class BackupState
{
public:
    using FileTimes = std::map<std::string, double>;

    std::optional<double> lastModified(const std::string &entryName,
                                       const std::string &fileName) const
    {
        const auto entry = m_entries.find(entryName);
        if (entry != m_entries.end()) {
            const auto file = entry->second.find(fileName);
            if (file != entry->second.end()) {
                return file->second;
            }
        }
        const auto legacy = m_legacy.find(fileName);
        if (legacy != m_legacy.end()) {
            return legacy->second;
        }
        return std::nullopt;
    }

    void record(const std::string &entryName, const std::string &fileName, double mtime)
    {
        m_entries[entryName][fileName] = mtime;
        m_legacy.erase(fileName);
    }

    void recordLegacy(const std::string &fileName, double mtime)
    {
        m_legacy[fileName] = mtime;
    }

    bool empty() const { return m_entries.empty() && m_legacy.empty(); }

    const std::map<std::string, FileTimes> &entries() const { return m_entries; }
    const FileTimes &legacy() const { return m_legacy; }

    bool operator==(const BackupState &) const = default;

private:
    std::map<std::string, FileTimes> m_entries;
    FileTimes m_legacy;
};

struct BackupRunReport {
    RunOutcome outcome = RunOutcome::Disabled;
    int filesBackedUp = 0;
    int sourcesProcessed = 0;
    int sourcesFailed = 0;
};

} // namespace savewarden
