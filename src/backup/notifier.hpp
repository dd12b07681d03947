#pragma once

#include <QString>

#include "common/logging.hpp"

namespace savewarden {

// User-facing alert channel. Delivery is best-effort and must not throw.
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notify(const QString &title, const QString &message) noexcept = 0;
};

// Desktop notification through notify-send, launched detached.
class DesktopNotifier : public Notifier
{
public:
    explicit DesktopNotifier(logging::Logger &logger,
                             QString program = QStringLiteral("notify-send"));

    void notify(const QString &title, const QString &message) noexcept override;

private:
    logging::Logger &m_logger;
    QString m_program;
};

} // namespace savewarden
