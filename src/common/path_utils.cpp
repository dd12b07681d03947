#include "common/path_utils.hpp"

#include <QDir>

namespace savewarden {

namespace {

// Variable names are ASCII [A-Za-z0-9_].
bool isNameChar(QChar c)
{
    const char16_t u = c.unicode();
    return (u >= u'A' && u <= u'Z') || (u >= u'a' && u <= u'z')
        || (u >= u'0' && u <= u'9') || u == u'_';
}

// Appends the variable's value when set, otherwise the original reference.
void appendVariable(QString &out, const QString &name, QStringView original)
{
    const QByteArray key = name.toLocal8Bit();
    if (!name.isEmpty() && qEnvironmentVariableIsSet(key.constData())) {
        out += qEnvironmentVariable(key.constData());
    } else {
        out += original;
    }
}

} // namespace

QString expandEnvironment(const QString &path)
{
    QString out;
    out.reserve(path.size());

    qsizetype i = 0;
    const qsizetype size = path.size();
    while (i < size) {
        const QChar c = path.at(i);

        if (c == QLatin1Char('$') && i + 1 < size && path.at(i + 1) == QLatin1Char('{')) {
            const qsizetype close = path.indexOf(QLatin1Char('}'), i + 2);
            if (close < 0) {
                out += QStringView(path).mid(i);
                break;
            }
            appendVariable(out, path.mid(i + 2, close - i - 2),
                           QStringView(path).mid(i, close - i + 1));
            i = close + 1;
            continue;
        }

        if (c == QLatin1Char('$')) {
            qsizetype end = i + 1;
            while (end < size && isNameChar(path.at(end))) {
                ++end;
            }
            if (end == i + 1) {
                out += c;
                ++i;
                continue;
            }
            appendVariable(out, path.mid(i + 1, end - i - 1),
                           QStringView(path).mid(i, end - i));
            i = end;
            continue;
        }

        if (c == QLatin1Char('%')) {
            const qsizetype close = path.indexOf(QLatin1Char('%'), i + 1);
            if (close < 0 || close == i + 1) {
                out += c;
                ++i;
                continue;
            }
            appendVariable(out, path.mid(i + 1, close - i - 1),
                           QStringView(path).mid(i, close - i + 1));
            i = close + 1;
            continue;
        }

        out += c;
        ++i;
    }

    return out;
}

QString resolveConfiguredPath(const QString &path)
{
    return QDir::cleanPath(QDir::fromNativeSeparators(expandEnvironment(path)));
}

} // namespace savewarden
