#include "backup/save_backup_service.hpp"

#include <exception>
#include <utility>

#include "backup/config_loader.hpp"
#include "common/json_utils.hpp"

namespace savewarden {

SaveBackupService::SaveBackupService(ServiceOptions options,
                                     logging::Logger &logger,
                                     Notifier &notifier,
                                     BackupEngine::Clock clock)
    : m_options(std::move(options))
    , m_logger(logger)
    , m_notifier(notifier)
    , m_stateStore(m_options.statePath)
    , m_engine(logger, std::move(clock))
{
    m_logger.info(QStringLiteral("Starting backup process"));
    initStateAndConfig();
}

QString SaveBackupService::notificationTitle()
{
    return QStringLiteral("Save Warden");
}

void SaveBackupService::initStateAndConfig()
{
    try {
        m_state = m_stateStore.load();
    } catch (const StateError &ex) {
        // Keep the broken file untouched; a later run must not overwrite it.
        const QString message = QString::fromUtf8(ex.what());
        SWLOG_ERROR(m_logger, message,
                    (nlohmann::json{{"kind", toStateErrorString(ex.kind())},
                                    {"path", m_options.statePath}}));
        m_notifier.notify(notificationTitle(), message);
        m_loadFailed = true;
        return;
    }

    const ConfigLoadResult result = ConfigLoader::load(m_options.configPath);
    if (!result.ok()) {
        const QString message = QString::fromStdString(result.message);
        SWLOG_ERROR(m_logger, message,
                    (nlohmann::json{{"kind", toConfigErrorString(result.error)},
                                    {"path", m_options.configPath}}));
        m_notifier.notify(notificationTitle(), message);
        m_loadFailed = true;
        return;
    }

    m_config = result.config;
    m_logger.info(QStringLiteral("Configuration loaded successfully"));
}

BackupRunReport SaveBackupService::performBackup()
{
    BackupRunReport report;
    if (m_loadFailed || !m_config) {
        report.outcome = RunOutcome::Disabled;
        return report;
    }

    try {
        for (const SourceDirectory &source : m_config->sourceDirectories) {
            try {
                report.filesBackedUp += m_engine.processSource(source, *m_config, m_state);
                ++report.sourcesProcessed;
            } catch (const std::exception &ex) {
                m_logger.error(QStringLiteral("Failed to process %1 with error %2")
                                   .arg(QString::fromStdString(source.name),
                                        QString::fromUtf8(ex.what())));
                ++report.sourcesFailed;
            }
        }

        if (report.sourcesProcessed > 0) {
            m_stateStore.save(m_state);
            report.outcome = RunOutcome::Succeeded;
            SWLOG_INFO(m_logger,
                       QStringLiteral("Process complete. %1 files backed up from %2 directories.")
                           .arg(report.filesBackedUp)
                           .arg(report.sourcesProcessed),
                       nlohmann::json(report));
        } else {
            report.outcome = RunOutcome::NothingProcessed;
            m_logger.warn(QStringLiteral("No source directory could be processed; state left unchanged"));
        }
    } catch (const std::exception &ex) {
        const QString message = QStringLiteral("Backup failed: %1").arg(QString::fromUtf8(ex.what()));
        m_logger.error(message);
        m_notifier.notify(notificationTitle(), message);
        m_backupFailed = true;
        report.outcome = RunOutcome::Failed;
    }

    return report;
}

} // namespace savewarden
