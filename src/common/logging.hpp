#pragma once

#include <mutex>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

namespace savewarden::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

QString levelToString(LogLevel level);

struct LoggerOptions {
    // Relative paths resolve against the working directory.
    QString logsDir = QStringLiteral("logs");
    QString filePrefix = QStringLiteral("backup");
    bool debugEnabled = false;
};

/**
 * Logger appends one line per event to a monthly log file:
 *
 *   <logsDir>/<filePrefix>_YYYY_MM.log
 *   2026-10-18 01:02:03,456 - INFO - message {"optional":"context"}
 *
 * It is constructed once in main() and handed by reference to the parts
 * of the program that log. Writing never throws; when the file cannot be
 * opened the line is printed to stderr instead.
 */
class Logger
{
public:
    explicit Logger(LoggerOptions options = {});

    void log(LogLevel level,
             const QString &message,
             const nlohmann::json &context = nlohmann::json::object());

    void debug(const QString &message,
               const nlohmann::json &context = nlohmann::json::object());
    void info(const QString &message,
              const nlohmann::json &context = nlohmann::json::object());
    void warn(const QString &message,
              const nlohmann::json &context = nlohmann::json::object());
    void error(const QString &message,
               const nlohmann::json &context = nlohmann::json::object());

    // Path of the file a line written at `when` ends up in.
    QString logFilePath(const QDateTime &when) const;

    // Single formatted line, without the trailing newline.
    static QString formatLine(const QDateTime &when,
                              LogLevel level,
                              const QString &message,
                              const nlohmann::json &context);

private:
    void writeLine(const QString &path, const QString &line);

    LoggerOptions m_options;
    std::mutex m_mutex;
};

} // namespace savewarden::logging

#define SWLOG_DEBUG(logger, message, ctxJson) \
    (logger).log(::savewarden::logging::LogLevel::Debug, (message), (ctxJson))

#define SWLOG_INFO(logger, message, ctxJson) \
    (logger).log(::savewarden::logging::LogLevel::Info, (message), (ctxJson))

#define SWLOG_WARN(logger, message, ctxJson) \
    (logger).log(::savewarden::logging::LogLevel::Warn, (message), (ctxJson))

#define SWLOG_ERROR(logger, message, ctxJson) \
    (logger).log(::savewarden::logging::LogLevel::Error, (message), (ctxJson))
