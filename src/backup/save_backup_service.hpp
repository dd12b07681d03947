#pragma once

#include <optional>
#include <string>

#include "backup/backup_engine.hpp"
#include "backup/notifier.hpp"
#include "backup/state_store.hpp"
#include "common/logging.hpp"
#include "common/models.hpp"

namespace savewarden {

struct ServiceOptions {
    std::string configPath = "config.json";
    std::string statePath = "backup_state.json";
};

/**
 * SaveBackupService runs one backup pass:
 * - construction loads the state file, then the configuration
 * - performBackup() hands every source entry to BackupEngine, isolating
 *   failures per entry, and saves state when at least one entry succeeded
 *
 * A configuration or state load failure disables the service; it is logged
 * and reported through the Notifier once, at construction.
 */
class SaveBackupService
{
public:
    SaveBackupService(ServiceOptions options,
                      logging::Logger &logger,
                      Notifier &notifier,
                      BackupEngine::Clock clock = {});

    BackupRunReport performBackup();

    bool loadFailed() const { return m_loadFailed; }
    bool backupFailed() const { return m_backupFailed; }

    const std::optional<BackupConfig> &config() const { return m_config; }
    const BackupState &state() const { return m_state; }

    static QString notificationTitle();

private:
    void initStateAndConfig();

    ServiceOptions m_options;
    logging::Logger &m_logger;
    Notifier &m_notifier;
    StateStore m_stateStore;
    BackupEngine m_engine;

    std::optional<BackupConfig> m_config;
    BackupState m_state;
    bool m_loadFailed = false;
    bool m_backupFailed = false;
};

} // namespace savewarden
