#include "common/filename_sanitizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace savewarden {

namespace {

constexpr std::string_view kForbiddenChars = "<>:\"/\\|?*";

constexpr std::array<std::string_view, 22> kReservedNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

bool isPrintableAscii(char c)
{
    const auto value = static_cast<unsigned char>(c);
    return value >= 0x20 && value <= 0x7E;
}

bool isTrimmed(char c)
{
    return c == ' ' || c == '.';
}

} // namespace

bool isReservedDeviceName(const std::string &stem)
{
    std::string upper = stem;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return std::find(kReservedNames.begin(), kReservedNames.end(), upper)
        != kReservedNames.end();
}

std::string sanitizeFilename(const std::string &name)
{
    std::string safe;
    safe.reserve(name.size());
    for (const char c : name) {
        if (kForbiddenChars.find(c) != std::string_view::npos) {
            continue;
        }
        if (!isPrintableAscii(c)) {
            continue;
        }
        safe.push_back(c);
    }

    const auto first = std::find_if_not(safe.begin(), safe.end(), isTrimmed);
    const auto last = std::find_if_not(safe.rbegin(), safe.rend(), isTrimmed).base();
    safe = first < last ? std::string(first, last) : std::string();

    const std::string stem = safe.substr(0, safe.find('.'));
    if (isReservedDeviceName(stem)) {
        safe.insert(safe.begin(), '_');
    }

    if (safe.empty()) {
        safe = kEmptyFilenamePlaceholder;
    }

    if (safe.size() > kMaxFilenameLength) {
        safe.resize(kMaxFilenameLength);
    }
    return safe;
}

} // namespace savewarden
