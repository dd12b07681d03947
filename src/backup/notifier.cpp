#include "backup/notifier.hpp"

#include <QProcess>
#include <QStringList>

#include <exception>
#include <utility>

namespace savewarden {

namespace {

constexpr int kNotificationTimeoutMs = 5000;

} // namespace

DesktopNotifier::DesktopNotifier(logging::Logger &logger, QString program)
    : m_logger(logger)
    , m_program(std::move(program))
{
}

void DesktopNotifier::notify(const QString &title, const QString &message) noexcept
{
    try {
        const QStringList args = {
            QStringLiteral("--app-name=savewarden"),
            QStringLiteral("--expire-time=%1").arg(kNotificationTimeoutMs),
            title,
            message,
        };
        if (!QProcess::startDetached(m_program, args)) {
            m_logger.error(QStringLiteral("Failed to send notification: could not start %1")
                               .arg(m_program));
        }
    } catch (const std::exception &ex) {
        m_logger.error(QStringLiteral("Failed to send notification: %1")
                           .arg(QString::fromUtf8(ex.what())));
    }
}

} // namespace savewarden
