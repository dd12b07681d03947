#include <QCoreApplication>

#include <string>

#include <nlohmann/json.hpp>

#include "backup/notifier.hpp"
#include "backup/save_backup_service.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/savewarden_version.hpp"

namespace {

std::string envOr(const char *name, const char *fallback)
{
    const QString value = qEnvironmentVariable(name);
    return value.isEmpty() ? std::string(fallback) : value.toStdString();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("savewarden"));
    QCoreApplication::setApplicationVersion(QStringLiteral(SAVEWARDEN_VERSION));

    savewarden::logging::LoggerOptions logOptions;
    const QString logsDir = qEnvironmentVariable("SAVEWARDEN_LOG_DIR");
    if (!logsDir.isEmpty()) {
        logOptions.logsDir = logsDir;
    }
    logOptions.debugEnabled = qEnvironmentVariableIntValue("SAVEWARDEN_DEBUG") == 1;
    savewarden::logging::Logger logger(logOptions);

    savewarden::ServiceOptions options;
    options.configPath = envOr("SAVEWARDEN_CONFIG", "config.json");
    options.statePath = envOr("SAVEWARDEN_STATE", "backup_state.json");

    SWLOG_DEBUG(logger, QStringLiteral("savewarden %1").arg(QStringLiteral(SAVEWARDEN_VERSION)),
                (nlohmann::json{{"config", options.configPath}, {"state", options.statePath}}));

    // One pass per invocation; scheduling is left to cron or a systemd timer.
    savewarden::DesktopNotifier notifier(logger);
    savewarden::SaveBackupService service(options, logger, notifier);
    const savewarden::BackupRunReport report = service.performBackup();

    SWLOG_DEBUG(logger, QStringLiteral("run finished"), nlohmann::json(report));
    return report.outcome == savewarden::RunOutcome::Succeeded ? 0 : 1;
}
