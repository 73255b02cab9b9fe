#ifndef BUILD_INFO_H
#define BUILD_INFO_H

#include <string>

// --- FIRMWARE VERSION ---
#define GPIOLIVE_VERSION_MAJOR 1
#define GPIOLIVE_VERSION_MINOR 2
#define GPIOLIVE_VERSION_PATCH 0
#define GPIOLIVE_VERSION_LABEL "" // e.g. "rc1", appended as "-rc1"

namespace BuildInfo {

// "1.2.0", or "1.2.0-rc1" with a label
std::string firmwareVersion();

// Date and time this image was compiled
const char *buildStamp();

} // namespace BuildInfo

#endif
