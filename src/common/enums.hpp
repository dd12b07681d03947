#pragma once

namespace savewarden {

enum class ConfigErrorKind {
    None,
    NotFound,
    Unreadable,
    ParseError,
    Malformed
};

enum class StateErrorKind {
    Unreadable,
    ParseError,
    Malformed
};

enum class RunOutcome {
    // Configuration or state failed to load; nothing was attempted.
    Disabled,
    Succeeded,
    // Every source entry raised; state was left as it was.
    NothingProcessed,
    Failed
};

} // namespace savewarden
