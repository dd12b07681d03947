#pragma once

#include <cstddef>
#include <string>

namespace savewarden {

inline constexpr std::size_t kMaxFilenameLength = 255;
inline constexpr const char *kEmptyFilenamePlaceholder = "_empty_";

/**
 * Turn an arbitrary label into a name usable as a single path component on
 * Windows and POSIX alike. Applied in order:
 *
 * 1. drop < > : " / \ | ? *
 * 2. drop every byte outside printable ASCII (0x20..0x7E)
 * 3. trim leading and trailing spaces and periods
 * 4. prefix '_' when the text before the first '.' is a reserved device
 *    name (CON, PRN, AUX, NUL, COM1-9, LPT1-9), compared case-insensitively
 * 5. substitute kEmptyFilenamePlaceholder for an empty result
 * 6. cut to kMaxFilenameLength characters
 */
std::string sanitizeFilename(const std::string &name);

bool isReservedDeviceName(const std::string &stem);

} // namespace savewarden
