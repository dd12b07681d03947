#include "common/logging.hpp"

#include <QDir>
#include <QFile>

#include <cstdio>
#include <utility>

namespace savewarden::logging {

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARNING");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

Logger::Logger(LoggerOptions options)
    : m_options(std::move(options))
{
    if (m_options.logsDir.isEmpty()) {
        m_options.logsDir = QStringLiteral("logs");
    }
    if (m_options.filePrefix.isEmpty()) {
        m_options.filePrefix = QStringLiteral("backup");
    }
}

QString Logger::logFilePath(const QDateTime &when) const
{
    const QString fileName = m_options.filePrefix
        + QStringLiteral("_")
        + when.toString(QStringLiteral("yyyy_MM"))
        + QStringLiteral(".log");
    return QDir(m_options.logsDir).filePath(fileName);
}

QString Logger::formatLine(const QDateTime &when,
                           LogLevel level,
                           const QString &message,
                           const nlohmann::json &context)
{
    QString line = when.toString(QStringLiteral("yyyy-MM-dd HH:mm:ss,zzz"))
        + QStringLiteral(" - ")
        + levelToString(level)
        + QStringLiteral(" - ")
        + message;

    if (context.is_object() && !context.empty()) {
        line += QLatin1Char(' ');
        line += QString::fromStdString(context.dump());
    }
    return line;
}

void Logger::log(LogLevel level, const QString &message, const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !m_options.debugEnabled) {
        return;
    }

    const QDateTime now = QDateTime::currentDateTime();
    const QString line = formatLine(now, level, message, context);

    std::lock_guard<std::mutex> lock(m_mutex);
    writeLine(logFilePath(now), line);
}

void Logger::debug(const QString &message, const nlohmann::json &context)
{
    log(LogLevel::Debug, message, context);
}

void Logger::info(const QString &message, const nlohmann::json &context)
{
    log(LogLevel::Info, message, context);
}

void Logger::warn(const QString &message, const nlohmann::json &context)
{
    log(LogLevel::Warn, message, context);
}

void Logger::error(const QString &message, const nlohmann::json &context)
{
    log(LogLevel::Error, message, context);
}

void Logger::writeLine(const QString &path, const QString &line)
{
    if (!QDir().mkpath(m_options.logsDir)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
}

} // namespace savewarden::logging
