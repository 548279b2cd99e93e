#pragma once

// Set by the build from the project version; it tracks the published
// OpenCode Config Manager release line.
#ifndef OCCM_VERSION
#define OCCM_VERSION "1.0.1"
#endif

namespace occm {

constexpr const char* kAppVersion = OCCM_VERSION;

}
