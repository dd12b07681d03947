#pragma once

#include <QString>

namespace savewarden {

// Replace $NAME, ${NAME} and %NAME% with the value of the named environment
// variable. A bare $NAME ends at the first character outside ASCII
// [A-Za-z0-9_]. References to unset variables are kept verbatim, as are a
// lone '$' or '%' and an unterminated ${ or %.
QString expandEnvironment(const QString &path);

// Expand and normalise a configured path for filesystem use.
QString resolveConfiguredPath(const QString &path);

} // namespace savewarden
