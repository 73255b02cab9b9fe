#include "BuildInfo.h"

#include <stdio.h>

namespace BuildInfo {

std::string firmwareVersion() {
  char buf[32];
  const char *label = GPIOLIVE_VERSION_LABEL;
  snprintf(buf, sizeof(buf), "%d.%d.%d%s%s", GPIOLIVE_VERSION_MAJOR,
           GPIOLIVE_VERSION_MINOR, GPIOLIVE_VERSION_PATCH,
           label[0] != '\0' ? "-" : "", label);
  return buf;
}

const char *buildStamp() { return __DATE__ " " __TIME__; }

} // namespace BuildInfo
