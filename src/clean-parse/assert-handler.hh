#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/source_location.hh>

#include <functional>

namespace cp::impl
{
/// What a failed CP_ASSERT / CP_ASSERT_ALWAYS reports.
/// expression and message are string literals, a handler may keep the pointers.
struct assertion_info
{
    char const* expression;
    char const* message;
    cp::source_location location;
};

/// Routes assertion failures to 'handler' while this object lives.
///
/// Handlers nest: the innermost live one is called, the stderr report is used when none is live.
/// A handler may throw to unwind out of the failing view operation. If it returns, the program aborts.
/// Installing and removing handlers is not synchronized.
///
/// Usage:
///   auto handler = cp::impl::scoped_assertion_handler([](cp::impl::assertion_info const& info) {
///       throw precondition_error{info.message};
///   });
///   auto prefix = input.take(n); // throws instead of aborting if n > input.size()
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    // registered by address
    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;

private:
    friend void handle_assert_failure(char const* expression, char const* message, cp::source_location location);

    std::move_only_function<void(assertion_info const&)> _handler;
    scoped_assertion_handler* _previous;
};
} // namespace cp::impl
