#include <clean-parse/assert-handler.hh>
#include <clean-parse/assert.hh>
#include <clean-parse/byte_view.hh>
#include <clean-parse/text_view.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

TEST("assertions - failing assertion reports expression, message and location")
{
    std::optional<cp::impl::assertion_info> captured;
    int const test_line = __LINE__ + 11; // line of CP_ASSERT_ALWAYS

    {
        auto handler = cp::impl::scoped_assertion_handler(
            [&](cp::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // must throw, the macro aborts otherwise
            });
        try
        {
            CP_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(std::string(captured->expression).find("1 + 1 == 3") != std::string::npos);
    CHECK(std::string(captured->message) == "arithmetic is broken");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
}

TEST("assertions - passing assertion does not call the handler")
{
    bool handler_called = false;
    {
        auto handler = cp::impl::scoped_assertion_handler([&](cp::impl::assertion_info const&) { handler_called = true; });
        CP_ASSERT_ALWAYS(2 > 1, "never reported");
    }
    CHECK(!handler_called);
}

TEST("assertions - handlers form a stack")
{
    std::vector<int> events;

    auto outer = cp::impl::scoped_assertion_handler(
        [&](cp::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto inner = cp::impl::scoped_assertion_handler(
            [&](cp::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });

        try
        {
            CP_ASSERT_ALWAYS(false, "hits inner");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        CP_ASSERT_ALWAYS(false, "hits outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - view preconditions report through the handler")
{
    std::vector<std::string> messages;
    auto handler = cp::impl::scoped_assertion_handler(
        [&](cp::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw 0;
        });

    auto const bytes = cp::byte_view::from_chars("abc");
    auto const text = cp::text_view("€");

    try
    {
        (void)bytes.take(10);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)text.take_from(1);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == "cannot take past the end of the view");
    CHECK(messages[1] == "cannot split inside a UTF-8 sequence");
}

#if CP_ASSERT_ENABLED
TEST("assertions - debug checks report through the handler")
{
    std::vector<std::string> messages;
    auto handler = cp::impl::scoped_assertion_handler(
        [&](cp::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw 0;
        });

    try
    {
        (void)cp::needed::size(0);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(messages.size() == 1);
    CHECK(messages[0] == "a known deficit must be positive");
}
#endif

TEST("assertions - handler is removed with its scope")
{
    int outer_calls = 0;
    auto outer = cp::impl::scoped_assertion_handler(
        [&](cp::impl::assertion_info const&)
        {
            ++outer_calls;
            throw 0;
        });

    {
        auto inner = cp::impl::scoped_assertion_handler([](cp::impl::assertion_info const&) { throw 1; });
    }

    try
    {
        CP_ASSERT_ALWAYS(false, "reaches outer once inner is gone");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_calls == 1);
}
