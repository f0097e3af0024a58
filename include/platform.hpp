/*******************************************************************************
 * @file include/platform.hpp
 * @brief Platform detection macros for the EL-Workbench core.
 ******************************************************************************/
#pragma once

// Prefer the build-system provided macros (PLATFORM_WIN64, PLATFORM_APPLE, PLATFORM_LINUX).
// If they are not defined by the build system, fall back to compiler predefined macros.

#if defined(PLATFORM_WIN64)
#define ELWORKBENCH_PLATFORM_WIN64 1
#elif defined(PLATFORM_APPLE)
#define ELWORKBENCH_PLATFORM_APPLE 1
#elif defined(PLATFORM_LINUX)
#define ELWORKBENCH_PLATFORM_LINUX 1
#else
#if defined(_WIN64)
#define ELWORKBENCH_PLATFORM_WIN64 1
#elif defined(__APPLE__) && defined(__MACH__)
#define ELWORKBENCH_PLATFORM_APPLE 1
#elif defined(__linux__)
#define ELWORKBENCH_PLATFORM_LINUX 1
#else
#define ELWORKBENCH_PLATFORM_UNKNOWN 1
#endif
#endif

#if defined(ELWORKBENCH_PLATFORM_WIN64)
#define ELWORKBENCH_IS_WINDOWS 1
#define ELWORKBENCH_IS_POSIX 0
#elif defined(ELWORKBENCH_PLATFORM_APPLE) || defined(ELWORKBENCH_PLATFORM_LINUX)
#define ELWORKBENCH_IS_WINDOWS 0
#define ELWORKBENCH_IS_POSIX 1
#else
#define ELWORKBENCH_IS_WINDOWS 0
#define ELWORKBENCH_IS_POSIX 0
#endif

// --- Require C++20 or later --------------------------------------------------
// The code base uses __VA_OPT__, std::erase and designated initializers.
#if defined(_MSC_VER)
#if !defined(_MSVC_LANG) || (_MSVC_LANG < 202002L)
#error "This project requires C++20 or later. Please compile with /std:c++20 or newer (MSVC)."
#endif
#else
#if __cplusplus < 202002L
#error "This project requires C++20 or later. Please compile with -std=c++20 or newer."
#endif
#endif
