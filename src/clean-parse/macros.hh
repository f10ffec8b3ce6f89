#pragma once

// =========================================================================================================
// Build configuration
// =========================================================================================================
//
// The build sets one of CP_DEBUG, CP_RELWITHDEBINFO, CP_RELEASE (see CMakeLists.txt).
// CP_ASSERT_ENABLED is 1 unless the build is CP_RELEASE without CP_ENABLE_ASSERT_IN_RELEASE.
// Bounds checks of the views use CP_ASSERT_ALWAYS and do not depend on it.

#if defined(CP_RELEASE) && !defined(CP_ENABLE_ASSERT_IN_RELEASE)
#define CP_ASSERT_ENABLED 0
#else
#define CP_ASSERT_ENABLED 1
#endif

// =========================================================================================================
// Attributes
// =========================================================================================================

// CP_COLD_FUNC - the assertion failure path
// CP_BUILTIN_UNREACHABLE - after a switch that covers every enumerator
#if defined(_MSC_VER)
#define CP_COLD_FUNC
#define CP_BUILTIN_UNREACHABLE __assume(0)
#else
#define CP_COLD_FUNC __attribute__((cold))
#define CP_BUILTIN_UNREACHABLE __builtin_unreachable()
#endif

// CP_UNUSED(expr) - type-checks expr without evaluating it
#define CP_UNUSED(expr) (void)(sizeof((expr)))
