#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QDir>
#include <QFile>

#include <memory>

#include "backup/backup_engine.hpp"
#include "common/logging.hpp"

using savewarden::BackupConfig;
using savewarden::BackupEngine;
using savewarden::BackupError;
using savewarden::BackupState;
using savewarden::SourceDirectory;

class BackupEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testFreshStateCopiesOnce();
    void testNewerFileIsRecopied();
    void testEqualOrOlderFileIsSkipped();
    void testOnlySaveFilesInSlotDirectories();
    void testEachCopyGetsOwnTimestampDirectory();
    void testMissingSourceIsEmpty();
    void testEnvironmentVariablesExpanded();
    void testUnwritableBackupRootThrows();
    void testBackupDirectoryNameIsSanitized();
    void testSaveSlotNames();
    void testCustomSaveExtension();
    void testSameNameWithinOneSecondKeepsBothCopies();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::unique_ptr<savewarden::logging::Logger> m_logger;
    QDateTime m_now;

    QString sourceRoot() const { return m_tempDir->filePath(QStringLiteral("source")); }
    QString backupRoot() const { return m_tempDir->filePath(QStringLiteral("backup")); }

    BackupEngine makeEngine();
    BackupConfig makeConfig() const;
    QString writeSave(const QString &relativePath, const QByteArray &content,
                      const QDateTime &mtime) const;
    static bool setModified(const QString &path, const QDateTime &mtime);
};

namespace {

const QDateTime kSaveTime(QDate(2024, 5, 1), QTime(10, 0, 0));

} // namespace

void BackupEngineTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());

    savewarden::logging::LoggerOptions options;
    options.logsDir = m_tempDir->filePath(QStringLiteral("logs"));
    options.debugEnabled = true;
    m_logger = std::make_unique<savewarden::logging::Logger>(options);

    m_now = QDateTime(QDate(2026, 10, 18), QTime(12, 0, 0));
}

void BackupEngineTests::cleanup()
{
    m_logger.reset();
    m_tempDir.reset();
}

BackupEngine BackupEngineTests::makeEngine()
{
    // Every call advances one second so successive copies get distinct
    // timestamp directories.
    return BackupEngine(*m_logger, [this] {
        m_now = m_now.addSecs(1);
        return m_now;
    });
}

BackupConfig BackupEngineTests::makeConfig() const
{
    BackupConfig config;
    config.backupDirectory = backupRoot().toStdString();
    return config;
}

bool BackupEngineTests::setModified(const QString &path, const QDateTime &mtime)
{
    QFile file(path);
    if (!file.open(QIODevice::Append)) {
        return false;
    }
    return file.setFileTime(mtime, QFileDevice::FileModificationTime);
}

QString BackupEngineTests::writeSave(const QString &relativePath, const QByteArray &content,
                                     const QDateTime &mtime) const
{
    const QString path = QDir(sourceRoot()).filePath(relativePath);
    QDir().mkpath(QFileInfo(path).absolutePath());
    {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return {};
        }
        file.write(content);
    }
    if (!setModified(path, mtime)) {
        return {};
    }
    return path;
}

void BackupEngineTests::testFreshStateCopiesOnce()
{
    const QString save = writeSave(QStringLiteral("EldenRing/76561198000000001/ER0000.sl2"),
                                   "slot-data", kSaveTime);
    QVERIFY(!save.isEmpty());

    SourceDirectory source{sourceRoot().toStdString(), "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 1);

    const QString copy = QDir(backupRoot())
        .filePath(QStringLiteral("Elden Ring/2026_10_18__120001/ER0000.sl2"));
    QVERIFY(QFile::exists(copy));

    QFile copied(copy);
    QVERIFY(copied.open(QIODevice::ReadOnly));
    QCOMPARE(copied.readAll(), QByteArray("slot-data"));
    QCOMPARE(QFileInfo(copy).lastModified(), kSaveTime);

    const auto recorded = state.lastModified("Elden Ring", "ER0000.sl2");
    QVERIFY(recorded.has_value());
    QCOMPARE(*recorded, kSaveTime.toMSecsSinceEpoch() / 1000.0);

    QCOMPARE(engine.processSource(source, config, state), 0);
    QCOMPARE(QDir(QDir(backupRoot()).filePath(QStringLiteral("Elden Ring")))
                 .entryList(QDir::Dirs | QDir::NoDotAndDotDot)
                 .size(),
             1);
}

void BackupEngineTests::testNewerFileIsRecopied()
{
    const QString save = writeSave(QStringLiteral("12/ER0000.sl2"), "v1", kSaveTime);
    SourceDirectory source{sourceRoot().toStdString(), "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 1);

    const QDateTime later = kSaveTime.addSecs(90);
    QVERIFY(setModified(save, later));
    QCOMPARE(engine.processSource(source, config, state), 1);
    QCOMPARE(*state.lastModified("Elden Ring", "ER0000.sl2"),
             later.toMSecsSinceEpoch() / 1000.0);

    const QStringList stamps = QDir(QDir(backupRoot()).filePath(QStringLiteral("Elden Ring")))
        .entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    QCOMPARE(stamps, (QStringList{QStringLiteral("2026_10_18__120001"),
                                  QStringLiteral("2026_10_18__120002")}));
}

void BackupEngineTests::testEqualOrOlderFileIsSkipped()
{
    writeSave(QStringLiteral("12/ER0000.sl2"), "v1", kSaveTime);
    SourceDirectory source{sourceRoot().toStdString(), "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupEngine engine = makeEngine();

    const double mtime = kSaveTime.toMSecsSinceEpoch() / 1000.0;

    BackupState equal;
    equal.record("Elden Ring", "ER0000.sl2", mtime);
    QCOMPARE(engine.processSource(source, config, equal), 0);

    BackupState newer;
    newer.record("Elden Ring", "ER0000.sl2", mtime + 60.0);
    QCOMPARE(engine.processSource(source, config, newer), 0);
    QCOMPARE(*newer.lastModified("Elden Ring", "ER0000.sl2"), mtime + 60.0);

    QVERIFY(!QFileInfo::exists(backupRoot()));
}

void BackupEngineTests::testOnlySaveFilesInSlotDirectories()
{
    writeSave(QStringLiteral("ER0000.sl2"), "root", kSaveTime);
    writeSave(QStringLiteral("profile/ER0000.sl2"), "named", kSaveTime);
    writeSave(QStringLiteral("123a/ER0000.sl2"), "mixed", kSaveTime);
    writeSave(QStringLiteral("42/ER0000.sl2.bak"), "backup", kSaveTime);
    writeSave(QStringLiteral("42/steam_autocloud.vdf"), "cloud", kSaveTime);
    writeSave(QStringLiteral("42/nested/ER0001.sl2"), "deeper", kSaveTime);
    QDir().mkpath(QDir(sourceRoot()).filePath(QStringLiteral("42/folder.sl2")));

    SourceDirectory source{sourceRoot().toStdString(), "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 0);
    QVERIFY(state.empty());
}

void BackupEngineTests::testEachCopyGetsOwnTimestampDirectory()
{
    writeSave(QStringLiteral("100/ER0000.sl2"), "a", kSaveTime);
    writeSave(QStringLiteral("200/ER0001.sl2"), "b", kSaveTime);
    writeSave(QStringLiteral("deep/300/ER0002.sl2"), "c", kSaveTime);

    SourceDirectory source{sourceRoot().toStdString(), "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 3);

    const QDir base(QDir(backupRoot()).filePath(QStringLiteral("Elden Ring")));
    const QStringList stamps = base.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    QCOMPARE(stamps.size(), 3);
    for (const QString &stamp : stamps) {
        const QStringList inside = QDir(base.filePath(stamp))
            .entryList(QDir::AllEntries | QDir::NoDotAndDotDot);
        QCOMPARE(inside.size(), 1);
        QVERIFY(inside.first().endsWith(QStringLiteral(".sl2")));
    }
}

void BackupEngineTests::testMissingSourceIsEmpty()
{
    SourceDirectory source{m_tempDir->filePath(QStringLiteral("nowhere")).toStdString(),
                           "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 0);
    QVERIFY(!QFileInfo::exists(backupRoot()));
}

void BackupEngineTests::testEnvironmentVariablesExpanded()
{
    writeSave(QStringLiteral("7/ER0000.sl2"), "env", kSaveTime);
    qputenv("SW_ENGINE_TEST_ROOT", m_tempDir->path().toUtf8());

    SourceDirectory source{"$SW_ENGINE_TEST_ROOT/source", "Elden Ring"};
    BackupConfig config;
    config.backupDirectory = "${SW_ENGINE_TEST_ROOT}/backup";
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 1);
    QVERIFY(QFileInfo::exists(QDir(backupRoot())
                                  .filePath(QStringLiteral("Elden Ring/2026_10_18__120001/ER0000.sl2"))));
    qunsetenv("SW_ENGINE_TEST_ROOT");
}

void BackupEngineTests::testUnwritableBackupRootThrows()
{
    writeSave(QStringLiteral("7/ER0000.sl2"), "x", kSaveTime);
    writeSave(QStringLiteral("8/ER0001.sl2"), "y", kSaveTime);

    // A regular file occupies the place of the game's backup directory.
    QDir().mkpath(backupRoot());
    QFile blocker(QDir(backupRoot()).filePath(QStringLiteral("Elden Ring")));
    QVERIFY(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    SourceDirectory source{sourceRoot().toStdString(), "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupState state;
    BackupEngine engine = makeEngine();

    bool thrown = false;
    try {
        engine.processSource(source, config, state);
    } catch (const BackupError &) {
        thrown = true;
    }
    QVERIFY(thrown);
    QVERIFY(state.empty());
}

void BackupEngineTests::testBackupDirectoryNameIsSanitized()
{
    writeSave(QStringLiteral("1/DRAKS0005.sl2"), "ds", kSaveTime);

    SourceDirectory source{sourceRoot().toStdString(), "Dark Souls: Remastered?"};
    BackupConfig config = makeConfig();
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 1);
    QVERIFY(QFileInfo(QDir(backupRoot()).filePath(QStringLiteral("Dark Souls Remastered")))
                .isDir());
    // State keeps the configured name, not the directory name.
    QVERIFY(state.lastModified("Dark Souls: Remastered?", "DRAKS0005.sl2").has_value());
}

void BackupEngineTests::testSaveSlotNames()
{
    QVERIFY(BackupEngine::isSaveSlotName(QStringLiteral("0")));
    QVERIFY(BackupEngine::isSaveSlotName(QStringLiteral("76561198000000001")));
    QVERIFY(!BackupEngine::isSaveSlotName(QString()));
    QVERIFY(!BackupEngine::isSaveSlotName(QStringLiteral("12 ")));
    QVERIFY(!BackupEngine::isSaveSlotName(QStringLiteral("-1")));
    QVERIFY(!BackupEngine::isSaveSlotName(QStringLiteral("٣")));

    QCOMPARE(BackupEngine::timestampDirectoryName(QDateTime(QDate(2026, 1, 2), QTime(3, 4, 5))),
             QStringLiteral("2026_01_02__030405"));
}

void BackupEngineTests::testCustomSaveExtension()
{
    writeSave(QStringLiteral("5/slot.sav"), "sav", kSaveTime);
    writeSave(QStringLiteral("5/ER0000.sl2"), "sl2", kSaveTime);

    SourceDirectory source{sourceRoot().toStdString(), "Other"};
    BackupConfig config = makeConfig();
    config.saveExtension = ".sav";
    BackupState state;
    BackupEngine engine = makeEngine();

    QCOMPARE(engine.processSource(source, config, state), 1);
    QVERIFY(state.lastModified("Other", "slot.sav").has_value());
    QVERIFY(!state.lastModified("Other", "ER0000.sl2").has_value());
}

void BackupEngineTests::testSameNameWithinOneSecondKeepsBothCopies()
{
    // One save per Steam account, both copied under the same timestamp.
    writeSave(QStringLiteral("111/ER0000.sl2"), "account-one", kSaveTime);
    writeSave(QStringLiteral("222/ER0000.sl2"), "account-two", kSaveTime.addSecs(5));

    SourceDirectory source{sourceRoot().toStdString(), "Elden Ring"};
    BackupConfig config = makeConfig();
    BackupState state;
    const QDateTime fixed(QDate(2026, 10, 18), QTime(12, 0, 0));
    BackupEngine engine(*m_logger, [fixed] { return fixed; });

    QCOMPARE(engine.processSource(source, config, state), 2);

    const QDir base(QDir(backupRoot()).filePath(QStringLiteral("Elden Ring")));
    QCOMPARE(base.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name),
             (QStringList{QStringLiteral("2026_10_18__120000"),
                          QStringLiteral("2026_10_18__120000_1")}));

    QFile first(base.filePath(QStringLiteral("2026_10_18__120000/ER0000.sl2")));
    QVERIFY(first.open(QIODevice::ReadOnly));
    QCOMPARE(first.readAll(), QByteArray("account-one"));

    QFile second(base.filePath(QStringLiteral("2026_10_18__120000_1/ER0000.sl2")));
    QVERIFY(second.open(QIODevice::ReadOnly));
    QCOMPARE(second.readAll(), QByteArray("account-two"));
}

QTEST_MAIN(BackupEngineTests)
#include "test_backup_engine.moc"
