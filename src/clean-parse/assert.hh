#pragma once

// Lean header: included by every view and container in clean-parse.
#include <clean-parse/macros.hh>
#include <clean-parse/source_location.hh>

// =========================================================================================================
// CP_ASSERT - Runtime precondition check with string literal message
//
// In clean-parse, assertions guard PROGRAMMER ERRORS only:
//   - slicing a view past its end (take, take_from, take_split)
//   - splitting a text view inside a multi-byte UTF-8 sequence
//   - negative counts, sizes, or bounds
//   - reading the value of an empty optional or an erroring result
//
// Everything a parser is expected to run into (mismatch, missing data, structural errors)
// is returned as data (see cp::result, cp::parse_failure) and never asserts.
//
// On failure the current assertion handler is invoked (see assert-handler.hh),
// then the debugger is signalled (if attached) and the program aborts.
//
// Active in CP_DEBUG and CP_RELWITHDEBINFO builds.
// In CP_RELEASE builds, assertions are disabled unless CP_ENABLE_ASSERT_IN_RELEASE is defined.
// Slicing past the end of a view or inside a UTF-8 sequence uses CP_ASSERT_ALWAYS instead.
//
// Usage:
//   CP_ASSERT(n <= size(), "cannot take past the end of the view");
//
#define CP_ASSERT(cond, msg) CP_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// CP_ASSERT_ALWAYS - Always-active assertion
//
// Like CP_ASSERT but remains active in all build configurations, including release builds.
//
#define CP_ASSERT_ALWAYS(cond, msg) CP_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// CP_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define CP_DEBUG_BREAK() CP_IMPL_DEBUG_BREAK()

// =========================================================================================================
// CP_BREAK_AND_ABORT - Debug break followed by program termination
//
#define CP_BREAK_AND_ABORT() (CP_DEBUG_BREAK(), ::cp::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace cp::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints to stderr)
// Note: does not abort, caller must follow with CP_BREAK_AND_ABORT()
CP_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, cp::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace cp::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef _MSC_VER

#define CP_IMPL_DEBUG_BREAK() (::cp::impl::is_debugger_connected() ? __debugbreak() : void(0))

#else

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// NOTE: declared here to avoid pulling <csignal> into every header
extern "C" int raise(int) noexcept;
#define CP_IMPL_DEBUG_BREAK() (::cp::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#endif

#define CP_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::cp::impl::handle_assert_failure(#cond, msg, ::cp::source_location::current()); \
            CP_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if CP_ASSERT_ENABLED

#define CP_IMPL_ASSERT(cond, msg) CP_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the expression and message still have to compile
#define CP_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        CP_UNUSED(cond);          \
        CP_UNUSED(msg);           \
    } while (false)

#endif
