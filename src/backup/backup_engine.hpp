#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <QDateTime>
#include <QFileInfo>
#include <QString>
#include <QStringList>

#include "common/logging.hpp"
#include "common/models.hpp"

namespace savewarden {

class BackupError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * BackupEngine handles one configured source entry per call:
 * - walks the source tree for save-slot directories (all-digit names)
 * - compares each save file's modification time with BackupState
 * - copies new or newer files to
 *   <backup root>/<sanitized name>/<YYYY_MM_DD__HHMMSS>/<file>
 *   and records the copied timestamp in BackupState
 *   (a suffixed <YYYY_MM_DD__HHMMSS_N> directory is used when that file
 *   name is already present, so earlier copies are never replaced)
 *
 * Filesystem failures throw BackupError; files already copied in the same
 * call keep their updated records.
 */
class BackupEngine
{
public:
    using Clock = std::function<QDateTime()>;

    explicit BackupEngine(logging::Logger &logger, Clock clock = {});

    // Returns the number of files copied.
    int processSource(const SourceDirectory &source,
                      const BackupConfig &config,
                      BackupState &state);

    static bool isSaveSlotName(const QString &name);
    static QString timestampDirectoryName(const QDateTime &when);
    static double modificationSeconds(const QFileInfo &info);

    // Save-slot directories below root, in path order. The root itself is
    // never a candidate.
    static QStringList findSaveSlotDirectories(const QString &root);

    // <backupBase>/<stamp>, or <stamp>_1, _2, ... when fileName already
    // exists there.
    static QString freeTargetDirectory(const QString &backupBase,
                                       const QString &stamp,
                                       const QString &fileName);

private:
    void ensureDirectory(const QString &path) const;
    void copyPreservingMetadata(const QFileInfo &source, const QString &target) const;

    logging::Logger &m_logger;
    Clock m_clock;
};

} // namespace savewarden
