#include "backup/state_store.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <utility>

#include "common/json_utils.hpp"

namespace savewarden {

StateStore::StateStore(std::string path)
    : m_path(std::move(path))
{
}

BackupState StateStore::load() const
{
    const QString qpath = QString::fromStdString(m_path);
    if (!QFileInfo::exists(qpath)) {
        return {};
    }

    QFile file(qpath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw StateError(StateErrorKind::Unreadable,
                         "Could not read state file: " + m_path + " ("
                             + file.errorString().toStdString() + ")");
    }
    const QByteArray raw = file.readAll();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(raw.constData(), raw.constData() + raw.size());
    } catch (const nlohmann::json::parse_error &ex) {
        throw StateError(StateErrorKind::ParseError,
                         "Could not parse state file: " + m_path + " (" + ex.what() + ")");
    }

    return fromJson(document);
}

BackupState StateStore::fromJson(const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw StateError(StateErrorKind::Malformed,
                         "Malformed state file: top level must be an object");
    }

    BackupState state;
    for (const auto &[key, value] : document.items()) {
        if (value.is_number()) {
            // Flat layout written before records were keyed by source entry.
            state.recordLegacy(key, value.get<double>());
            continue;
        }
        if (!value.is_object()) {
            throw StateError(StateErrorKind::Malformed,
                             "Malformed state file: unexpected value for '" + key + "'");
        }
        for (const auto &[fileName, mtime] : value.items()) {
            if (!mtime.is_number()) {
                throw StateError(StateErrorKind::Malformed,
                                 "Malformed state file: modification time of '" + key + "/"
                                     + fileName + "' is not a number");
            }
        }
    }

    // Keyed records are applied after all legacy ones so they retire any
    // legacy record with the same filename regardless of key order.
    for (const auto &[key, value] : document.items()) {
        if (!value.is_object()) {
            continue;
        }
        for (const auto &[fileName, mtime] : value.items()) {
            state.record(key, fileName, mtime.get<double>());
        }
    }
    return state;
}

void StateStore::save(const BackupState &state) const
{
    const QString qpath = QString::fromStdString(m_path);
    const QString parent = QFileInfo(qpath).absolutePath();
    if (!QDir().mkpath(parent)) {
        throw std::runtime_error("Could not create directory for state file: "
                                 + parent.toStdString());
    }

    const nlohmann::json document = state;
    const QByteArray payload = QByteArray::fromStdString(document.dump(2) + "\n");

    QSaveFile file(qpath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("Could not open state file for writing: " + m_path + " ("
                                 + file.errorString().toStdString() + ")");
    }
    if (file.write(payload) != payload.size()) {
        file.cancelWriting();
        throw std::runtime_error("Could not write state file: " + m_path);
    }
    if (!file.commit()) {
        throw std::runtime_error("Could not commit state file: " + m_path + " ("
                                 + file.errorString().toStdString() + ")");
    }
}

} // namespace savewarden
