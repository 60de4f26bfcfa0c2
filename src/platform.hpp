#pragma once

// Platform detection
#if defined(__APPLE__)
#define HWIDENT_PLATFORM_MACOS 1
#elif defined(_WIN32) || defined(_WIN64)
#define HWIDENT_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define HWIDENT_PLATFORM_LINUX 1
#endif
