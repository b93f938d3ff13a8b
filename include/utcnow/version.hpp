#pragma once

#define UTCNOW_VERSION_MAJOR 0
#define UTCNOW_VERSION_MINOR 3
#define UTCNOW_VERSION_PATCH 6
#define UTCNOW_VERSION_STRING "0.3.6"

namespace utcnow {

constexpr int VERSION_MAJOR = UTCNOW_VERSION_MAJOR;
constexpr int VERSION_MINOR = UTCNOW_VERSION_MINOR;
constexpr int VERSION_PATCH = UTCNOW_VERSION_PATCH;

/// Library version, "MAJOR.MINOR.PATCH"
constexpr const char* version() noexcept {
    return UTCNOW_VERSION_STRING;
}

} // namespace utcnow
