#include "backup/config_loader.hpp"

#include <QFile>
#include <QFileInfo>

#include <utility>

namespace savewarden {

namespace {

ConfigLoadResult failure(ConfigErrorKind kind, std::string message)
{
    ConfigLoadResult result;
    result.error = kind;
    result.message = std::move(message);
    return result;
}

bool isNonEmptyString(const nlohmann::json &object, const char *key)
{
    const auto it = object.find(key);
    return it != object.end() && it->is_string() && !it->get<std::string>().empty();
}

} // namespace

ConfigLoadResult ConfigLoader::load(const std::string &path)
{
    const QString qpath = QString::fromStdString(path);
    if (!QFileInfo::exists(qpath)) {
        return failure(ConfigErrorKind::NotFound, "Could not find config file: " + path);
    }

    QFile file(qpath);
    if (!file.open(QIODevice::ReadOnly)) {
        return failure(ConfigErrorKind::Unreadable,
                       "Could not read config file: " + path + " ("
                           + file.errorString().toStdString() + ")");
    }
    const QByteArray raw = file.readAll();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(raw.constData(), raw.constData() + raw.size());
    } catch (const nlohmann::json::parse_error &) {
        return failure(ConfigErrorKind::ParseError, "Could not parse config file: " + path);
    }

    return fromJson(document);
}

ConfigLoadResult ConfigLoader::fromJson(const nlohmann::json &document)
{
    const std::string topLevelMessage =
        "Malformed config file: must contain a list of source directories and a backup directory";

    if (!document.is_object()) {
        return failure(ConfigErrorKind::Malformed, topLevelMessage);
    }

    const auto sources = document.find("source_directories");
    if (sources == document.end() || !sources->is_array()
        || !isNonEmptyString(document, "backup_directory")) {
        return failure(ConfigErrorKind::Malformed, topLevelMessage);
    }

    BackupConfig config;
    config.backupDirectory = document.at("backup_directory").get<std::string>();

    if (document.contains("save_extension")) {
        if (!isNonEmptyString(document, "save_extension")) {
            return failure(ConfigErrorKind::Malformed,
                           "Malformed config file: save_extension must be a non-empty string");
        }
        config.saveExtension = document.at("save_extension").get<std::string>();
    }

    for (const auto &entry : *sources) {
        if (!entry.is_object() || !isNonEmptyString(entry, "path")
            || !isNonEmptyString(entry, "name")) {
            return failure(ConfigErrorKind::Malformed,
                           "Malformed config file: source directories must contain a path and name");
        }
        SourceDirectory source;
        source.path = entry.at("path").get<std::string>();
        source.name = entry.at("name").get<std::string>();
        config.sourceDirectories.push_back(std::move(source));
    }

    ConfigLoadResult result;
    result.config = std::move(config);
    return result;
}

} // namespace savewarden
