#include <clean-parse/count_range.hh>

#include <nexus/test.hh>

#include <limits>
#include <vector>

static_assert(std::is_trivially_copyable_v<cp::count_range>);
static_assert(cp::count_range::half_open(5, 3).is_inverted());
static_assert(!cp::count_range::half_open(3, 5).is_inverted());

namespace
{
std::vector<cp::isize> collect(cp::count_range::sequence seq)
{
    std::vector<cp::isize> res;
    for (auto i : seq)
        res.push_back(i);
    return res;
}
} // namespace

TEST("count_range - inversion")
{
    CHECK(cp::count_range::half_open(5, 3).is_inverted());
    CHECK(cp::count_range::half_open(3, 3).is_inverted());
    CHECK(!cp::count_range::half_open(3, 5).is_inverted());
    CHECK(cp::count_range::half_open(0, 0).is_inverted());

    CHECK(cp::count_range::closed(5, 3).is_inverted());
    CHECK(!cp::count_range::closed(3, 3).is_inverted());

    CHECK(!cp::count_range::exactly(0).is_inverted());
    CHECK(!cp::count_range::exactly(4).is_inverted());
    CHECK(!cp::count_range::at_least(7).is_inverted());
    CHECK(!cp::count_range::below(0).is_inverted());
    CHECK(!cp::count_range::at_most(0).is_inverted());
    CHECK(!cp::count_range::unbounded().is_inverted());
}

TEST("count_range - contains")
{
    SECTION("half open")
    {
        auto const r = cp::count_range::half_open(2, 5);
        CHECK(!r.contains(1));
        CHECK(r.contains(2));
        CHECK(r.contains(4));
        CHECK(!r.contains(5));
    }

    SECTION("closed")
    {
        auto const r = cp::count_range::closed(2, 5);
        CHECK(!r.contains(1));
        CHECK(r.contains(2));
        CHECK(r.contains(5));
        CHECK(!r.contains(6));
    }

    SECTION("exactly")
    {
        auto const r = cp::count_range::exactly(3);
        CHECK(!r.contains(2));
        CHECK(r.contains(3));
        CHECK(!r.contains(4));
    }

    SECTION("one-sided")
    {
        CHECK(cp::count_range::at_least(2).contains(1000000));
        CHECK(!cp::count_range::at_least(2).contains(1));
        CHECK(cp::count_range::below(3).contains(0));
        CHECK(!cp::count_range::below(3).contains(3));
        CHECK(cp::count_range::at_most(3).contains(3));
        CHECK(!cp::count_range::at_most(3).contains(4));
    }

    SECTION("unbounded")
    {
        CHECK(cp::count_range::unbounded().contains(0));
        CHECK(cp::count_range::unbounded().contains(std::numeric_limits<cp::isize>::max()));
    }

    SECTION("inverted ranges contain nothing")
    {
        auto const r = cp::count_range::half_open(5, 3);
        for (cp::isize i = 0; i < 10; ++i)
            CHECK(!r.contains(i));
    }
}

TEST("count_range - bounds")
{
    auto const r = cp::count_range::half_open(1, 4);
    CHECK(r.lower() == cp::bound::included(1));
    CHECK(r.upper() == cp::bound::excluded(4));
    CHECK(r.upper().kind() == cp::bound_kind::excluded);
    CHECK(r.upper().value() == 4);

    CHECK(cp::count_range::at_least(2).upper().is_unbounded());
    CHECK(cp::count_range::at_most(2).lower().is_unbounded());
    CHECK(cp::count_range::exactly(3) == cp::count_range::closed(3, 3));
}

TEST("count_range - counting iterators")
{
    SECTION("half open stops before the bound")
    {
        CHECK(collect(cp::count_range::half_open(0, 5).bounded_iterator()) == std::vector<cp::isize>{0, 1, 2, 3, 4});
        CHECK(collect(cp::count_range::half_open(0, 5).saturating_iterator()) == std::vector<cp::isize>{0, 1, 2, 3, 4});
    }

    SECTION("closed includes the bound")
    {
        CHECK(collect(cp::count_range::closed(0, 5).saturating_iterator()) == std::vector<cp::isize>{0, 1, 2, 3, 4, 5});
        CHECK(collect(cp::count_range::closed(0, 5).bounded_iterator()) == std::vector<cp::isize>{0, 1, 2, 3, 4, 5});
    }

    SECTION("counting always starts at zero")
    {
        CHECK(collect(cp::count_range::half_open(3, 5).bounded_iterator()) == std::vector<cp::isize>{0, 1, 2, 3, 4});
        CHECK(collect(cp::count_range::exactly(2).bounded_iterator()) == std::vector<cp::isize>{0, 1, 2});
        CHECK(collect(cp::count_range::at_most(1).bounded_iterator()) == std::vector<cp::isize>{0, 1});
    }

    SECTION("an excluded upper edge of zero yields nothing")
    {
        CHECK(collect(cp::count_range::below(0).saturating_iterator()).empty());
        CHECK(collect(cp::count_range::half_open(0, 0).bounded_iterator()).empty());
        CHECK(cp::count_range::below(0).bounded_iterator().is_empty());
    }

    SECTION("an included upper edge of zero yields the single count zero")
    {
        CHECK(!cp::count_range::exactly(0).bounded_iterator().is_empty());
        CHECK(collect(cp::count_range::exactly(0).bounded_iterator()) == std::vector<cp::isize>{0});
        CHECK(collect(cp::count_range::exactly(0).saturating_iterator()) == std::vector<cp::isize>{0});
        CHECK(collect(cp::count_range::at_most(0).bounded_iterator()) == std::vector<cp::isize>{0});
        CHECK(collect(cp::count_range::closed(0, 0).saturating_iterator()) == std::vector<cp::isize>{0});
    }

    SECTION("saturating iterator over an unbounded edge never ends on its own")
    {
        auto const seq = cp::count_range::at_least(1).saturating_iterator();
        CHECK(!seq.is_empty());

        cp::isize n = 0;
        for (auto i : seq)
        {
            CHECK(i == n);
            if (++n == 1000)
                break;
        }
        CHECK(n == 1000);
    }

    SECTION("saturating iterator stays at the maximum")
    {
        auto it = cp::count_range::unbounded().saturating_iterator().begin();
        it.current = std::numeric_limits<cp::isize>::max() - 1;
        ++it;
        CHECK(*it == std::numeric_limits<cp::isize>::max());
        ++it;
        CHECK(*it == std::numeric_limits<cp::isize>::max());
        CHECK(it != cp::sentinel{});
    }

    SECTION("bounded iterator over an unbounded edge terminates")
    {
        auto it = cp::count_range::unbounded().bounded_iterator().begin();
        CHECK(it != cp::sentinel{});
        it.current = std::numeric_limits<cp::isize>::max() - 1;
        CHECK(it != cp::sentinel{});
        ++it;
        CHECK(!(it != cp::sentinel{}));
    }

    SECTION("closed range up to the maximum terminates")
    {
        auto it = cp::count_range::at_most(std::numeric_limits<cp::isize>::max()).saturating_iterator().begin();
        it.current = std::numeric_limits<cp::isize>::max();
        CHECK(it != cp::sentinel{});
        ++it;
        CHECK(!(it != cp::sentinel{}));
    }
}
