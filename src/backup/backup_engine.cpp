#include "backup/backup_engine.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFile>

#include <algorithm>
#include <utility>

#include "common/filename_sanitizer.hpp"
#include "common/path_utils.hpp"

namespace savewarden {

BackupEngine::BackupEngine(logging::Logger &logger, Clock clock)
    : m_logger(logger)
    , m_clock(std::move(clock))
{
    if (!m_clock) {
        m_clock = [] { return QDateTime::currentDateTime(); };
    }
}

bool BackupEngine::isSaveSlotName(const QString &name)
{
    if (name.isEmpty()) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](QChar c) {
        return c >= QLatin1Char('0') && c <= QLatin1Char('9');
    });
}

QString BackupEngine::timestampDirectoryName(const QDateTime &when)
{
    return when.toString(QStringLiteral("yyyy_MM_dd__HHmmss"));
}

double BackupEngine::modificationSeconds(const QFileInfo &info)
{
    return static_cast<double>(info.lastModified().toMSecsSinceEpoch()) / 1000.0;
}

QStringList BackupEngine::findSaveSlotDirectories(const QString &root)
{
    QStringList slotDirs;
    QDirIterator it(root,
                    QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        if (isSaveSlotName(it.fileName())) {
            slotDirs.push_back(path);
        }
    }
    slotDirs.sort();
    return slotDirs;
}

int BackupEngine::processSource(const SourceDirectory &source,
                                const BackupConfig &config,
                                BackupState &state)
{
    int fileCount = 0;

    const QString displayName = QString::fromStdString(source.name);
    const QString sourcePath = resolveConfiguredPath(QString::fromStdString(source.path));
    const QString backupRoot =
        resolveConfiguredPath(QString::fromStdString(config.backupDirectory));
    const QString backupBase =
        QDir(backupRoot).filePath(QString::fromStdString(sanitizeFilename(source.name)));
    const QString extension = QString::fromStdString(config.saveExtension);

    if (!QFileInfo(sourcePath).isDir()) {
        m_logger.warn(QStringLiteral("%1| source directory %2 does not exist")
                          .arg(displayName, sourcePath));
        return 0;
    }

    m_logger.debug(QStringLiteral("%1| scanning %2").arg(displayName, sourcePath),
                   nlohmann::json{{"backupBase", backupBase.toStdString()}});

    for (const QString &slotDir : findSaveSlotDirectories(sourcePath)) {
        const QFileInfoList files =
            QDir(slotDir).entryInfoList(QDir::Files | QDir::Hidden, QDir::Name);

        for (const QFileInfo &info : files) {
            const QString fileName = info.fileName();
            if (!fileName.endsWith(extension)) {
                continue;
            }

            const double lastModified = modificationSeconds(info);
            const auto known = state.lastModified(source.name, fileName.toStdString());
            if (known && lastModified <= *known) {
                m_logger.info(QStringLiteral("Skipping %1 as it has not been modified")
                                  .arg(fileName));
                continue;
            }

            m_logger.info(QStringLiteral("%1| %2 is new or modified").arg(displayName, fileName));

            ensureDirectory(backupBase);
            const QString targetDir =
                freeTargetDirectory(backupBase, timestampDirectoryName(m_clock()), fileName);
            ensureDirectory(targetDir);

            m_logger.info(QStringLiteral("Copying %1 to %2").arg(fileName, targetDir));
            copyPreservingMetadata(info, QDir(targetDir).filePath(fileName));

            state.record(source.name, fileName.toStdString(), lastModified);
            ++fileCount;
        }
    }

    return fileCount;
}

void BackupEngine::ensureDirectory(const QString &path) const
{
    if (!QDir().mkpath(path)) {
        throw BackupError("Could not create backup directory " + path.toStdString());
    }
}

QString BackupEngine::freeTargetDirectory(const QString &backupBase,
                                          const QString &stamp,
                                          const QString &fileName)
{
    // Same-named saves from different slots copied within one second must
    // not share a directory; an existing copy is never replaced.
    const QDir base(backupBase);
    QString candidate = base.filePath(stamp);
    for (int suffix = 1; QFileInfo::exists(QDir(candidate).filePath(fileName)); ++suffix) {
        candidate = base.filePath(stamp + QStringLiteral("_%1").arg(suffix));
    }
    return candidate;
}

void BackupEngine::copyPreservingMetadata(const QFileInfo &source, const QString &target) const
{
    QFile input(source.absoluteFilePath());
    if (!input.copy(target)) {
        throw BackupError("Could not copy " + source.absoluteFilePath().toStdString() + " to "
                          + target.toStdString() + ": " + input.errorString().toStdString());
    }

    QFile copied(target);
    if (!copied.open(QIODevice::ReadOnly)
        || !copied.setFileTime(source.lastModified(), QFileDevice::FileModificationTime)) {
        throw BackupError("Could not preserve modification time of " + target.toStdString());
    }
}

} // namespace savewarden
