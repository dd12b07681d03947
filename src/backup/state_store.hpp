#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace savewarden {

class StateError : public std::runtime_error
{
public:
    StateError(StateErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    StateErrorKind kind() const { return m_kind; }

private:
    StateErrorKind m_kind;
};

// StateStore reads and writes the JSON record of already-copied save files.
class StateStore
{
public:
    explicit StateStore(std::string path);

    // An absent file yields an empty state. Unreadable, unparseable or
    // wrongly shaped content throws StateError.
    BackupState load() const;

    // Rewrites the whole file atomically; throws std::runtime_error on failure.
    void save(const BackupState &state) const;

    static BackupState fromJson(const nlohmann::json &document);

private:
    std::string m_path;
};

} // namespace savewarden
