#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace savewarden {

/**
 * Reads and validates the backup configuration:
 *
 *   {
 *     "backup_directory": "%USERPROFILE%/SaveBackups",
 *     "source_directories": [
 *       { "path": "$HOME/.steam/.../EldenRing", "name": "Elden Ring" }
 *     ],
 *     "save_extension": ".sl2"            (optional)
 *   }
 *
 * Validation stops at the first problem; a configuration is either
 * accepted whole or rejected.
 */
class ConfigLoader
{
public:
    static ConfigLoadResult load(const std::string &path);

    // Validation half of load(), for documents already parsed.
    static ConfigLoadResult fromJson(const nlohmann::json &document);
};

} // namespace savewarden
