#include <assoc-core/sorted_array_map.hh>

#include <nexus/test.hh>

#include "test-utils.hh"

#include <string>
#include <vector>

using int_map = ac::sorted_array_map<int, int>;

static_assert(ac::associative_map<int_map>);

namespace
{
struct descending
{
    bool operator()(int a, int b) const { return a > b; }
};

struct case_insensitive
{
    static char lower(char c) { return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c; }

    bool operator()(std::string const& a, std::string const& b) const
    {
        for (std::size_t i = 0; i < a.size() && i < b.size(); ++i)
            if (lower(a[i]) != lower(b[i]))
                return lower(a[i]) < lower(b[i]);
        return a.size() < b.size();
    }
};

struct unordered_key
{
    int v;
};

// ascending with no duplicates
template <class Map>
bool is_strictly_sorted(Map const& m)
{
    auto const keys = test::collect(m.keys());
    for (std::size_t i = 1; i < keys.size(); ++i)
        if (!(keys[i - 1] < keys[i]))
            return false;
    return true;
}

int_map make_map(std::vector<int> const& keys)
{
    auto m = int_map();
    for (auto k : keys)
        m.put(k, k * 10);
    return m;
}
} // namespace

static_assert(ac::ordering_for<descending, int>);
static_assert(!ac::ordering_for<ac::less, unordered_key>);

TEST("sorted_array_map - construction")
{
    auto const m = int_map();
    CHECK(m.empty());
    CHECK(m.capacity() == 4);
    CHECK(int_map(7).capacity() == 7);

    CHECK(test::triggers_assertion([] { auto bad = int_map(0); }));
    CHECK(test::triggers_assertion([] { auto bad = int_map(-1); }));
}

TEST("sorted_array_map - put keeps keys sorted")
{
    auto m = int_map(4);
    CHECK(m.put(5, 50));
    CHECK(m.put(2, 20));
    CHECK(m.put(8, 80));
    CHECK(m.put(1, 10));

    CHECK(test::collect(m.keys()) == test::ints(1, 2, 5, 8));
    CHECK(test::collect(m.values()) == test::ints(10, 20, 50, 80));
    CHECK(m.capacity() == 4);

    SECTION("order queries")
    {
        CHECK(m.floor(3) == 2);
        CHECK(m.ceil(3) == 5);
        CHECK(m.rank(5) == 2);
        CHECK(m.select(2).value() == 5);
        CHECK(m.min().value() == 1);
        CHECK(m.max().value() == 8);
    }

    SECTION("overwrite keeps size and order")
    {
        CHECK(!m.put(5, 55));
        CHECK(m.size() == 4);
        CHECK(m.get(5).value() == 55);
        CHECK(test::collect(m.keys()) == test::ints(1, 2, 5, 8));
    }

    SECTION("fifth key doubles the capacity")
    {
        m.put(3, 30);
        CHECK(m.capacity() == 8);
        CHECK(test::collect(m.keys()) == test::ints(1, 2, 3, 5, 8));
    }
}

TEST("sorted_array_map - sorted after any sequence of puts and removes")
{
    auto m = int_map();
    int x = 17;
    for (int step = 0; step < 500; ++step)
    {
        x = (x * 37 + 11) % 101;
        if (x % 3 == 0)
            m.remove(x / 2);
        else
            m.put(x, step);

        if (!is_strictly_sorted(m))
            break;
    }

    CHECK(is_strictly_sorted(m));
    CHECK(m.size() <= m.capacity());
}

TEST("sorted_array_map - get")
{
    auto m = make_map({1, 2, 3});

    CHECK(m.get(2).value() == 20);
    CHECK(m.get(4).error() == ac::map_error::not_found);
    CHECK(m.get(4, -1) == -1);
    CHECK(m.contains(3));
    CHECK(!m.contains(0));
}

TEST("sorted_array_map - floor and ceil")
{
    auto const m = make_map({10, 20, 30});

    CHECK(m.floor(20) == 20);
    CHECK(m.floor(25) == 20);
    CHECK(m.floor(99) == 30);
    CHECK(m.floor(5) == ac::nullopt);

    CHECK(m.ceil(20) == 20);
    CHECK(m.ceil(25) == 30);
    CHECK(m.ceil(5) == 10);
    CHECK(m.ceil(31) == ac::nullopt);

    auto const empty = int_map();
    CHECK(empty.floor(1) == ac::nullopt);
    CHECK(empty.ceil(1) == ac::nullopt);
}

TEST("sorted_array_map - rank and select")
{
    auto const m = make_map({4, 8, 15, 16, 23, 42});

    SECTION("rank counts strictly smaller keys")
    {
        CHECK(m.rank(4) == 0);
        CHECK(m.rank(3) == 0);
        CHECK(m.rank(9) == 2);
        CHECK(m.rank(42) == 5);
        CHECK(m.rank(100) == 6);
    }

    SECTION("rank(select(r)) == r")
    {
        for (ac::isize r = 0; r < m.size(); ++r)
            CHECK(m.rank(m.select(r).value()) == r);
    }

    SECTION("select(rank(k)) == k for present keys")
    {
        for (auto const& k : m.keys())
            CHECK(m.select(m.rank(k)).value() == k);
    }

    SECTION("select out of range")
    {
        CHECK(m.select(-1).error() == ac::map_error::index_out_of_range);
        CHECK(m.select(6).error() == ac::map_error::index_out_of_range);
    }
}

TEST("sorted_array_map - min, max and their removal")
{
    auto m = make_map({3, 1, 2});

    auto const lo = m.remove_min();
    REQUIRE(lo.is_ok());
    CHECK(lo.value().key() == 1);
    CHECK(lo.value().value() == 10);

    auto const hi = m.remove_max();
    REQUIRE(hi.is_ok());
    CHECK(hi.value().key() == 3);

    CHECK(m.size() == 1);
    CHECK(m.min().value() == 2);
    CHECK(m.max().value() == 2);

    m.remove(2);

    SECTION("empty map underflows")
    {
        CHECK(m.min().error() == ac::map_error::underflow);
        CHECK(m.max().error() == ac::map_error::underflow);
        CHECK(m.remove_min().error() == ac::map_error::underflow);
        CHECK(m.remove_max().error() == ac::map_error::underflow);
        CHECK(m.empty());
    }
}

TEST("sorted_array_map - remove")
{
    auto m = make_map({1, 2, 3, 4, 5});
    CHECK(m.capacity() == 8);

    CHECK(m.remove(3));
    CHECK(!m.remove(3));
    CHECK(!m.contains(3));
    CHECK(test::collect(m.keys()) == test::ints(1, 2, 4, 5));

    CHECK(m.remove(1));
    CHECK(m.capacity() == 8);
    CHECK(m.remove(5)); // size 2 == 8 / 4
    CHECK(m.capacity() == 4);
    CHECK(test::collect(m.keys()) == test::ints(2, 4));

    SECTION("remove_min shrinks like remove")
    {
        (void)m.remove_min(); // size 1 == 4 / 4
        CHECK(m.capacity() == 2);
        CHECK(test::collect(m.keys()) == test::ints(4));
    }
}

TEST("sorted_array_map - ranged views")
{
    auto const m = make_map({10, 20, 30, 40, 50});

    CHECK(test::collect(m.keys(15, 45)) == test::ints(20, 30, 40));
    CHECK(test::collect(m.keys(20, 40)) == test::ints(20, 30, 40));
    CHECK(test::collect(m.values(20, 30)) == test::ints(200, 300));
    CHECK(test::collect(m.keys(0, 100)) == test::ints(10, 20, 30, 40, 50));

    SECTION("empty spans")
    {
        CHECK(m.keys(21, 29).empty());
        CHECK(m.keys(40, 20).empty());
        CHECK(m.keys(60, 70).empty());
        CHECK(m.keys(0, 5).empty());
        CHECK(int_map().keys(0, 5).empty());
    }

    SECTION("entries")
    {
        auto const es = m.entries(25, 45);
        CHECK(es.size() == 2);

        std::vector<int> keys;
        for (auto const& e : es)
        {
            keys.push_back(e.key());
            CHECK(e.value() == e.key() * 10);
        }
        CHECK(keys == test::ints(30, 40));
    }
}

TEST("sorted_array_map - injected comparator")
{
    SECTION("descending")
    {
        auto m = ac::sorted_array_map<int, int, descending>();
        for (int k : {3, 7, 1})
            m.put(k, k);

        CHECK(test::collect(m.keys()) == test::ints(7, 3, 1));
        CHECK(m.min().value() == 7);
        CHECK(m.rank(3) == 1);
    }

    SECTION("equivalent keys under the comparator are the same key")
    {
        auto m = ac::sorted_array_map<std::string, int, case_insensitive>();
        m.put("Apple", 1);
        CHECK(!m.put("APPLE", 2));
        m.put("banana", 3);

        CHECK(m.size() == 2);
        CHECK(m.get("apple").value() == 2);
        CHECK(m.contains("BANANA"));
    }

    SECTION("stateful comparator")
    {
        auto const cmp = [](int a, int b) { return (a % 10) < (b % 10); };
        auto m = ac::sorted_array_map<int, int, decltype(cmp)>(cmp);
        m.put(19, 0);
        m.put(21, 0);
        m.put(35, 0);
        CHECK(test::collect(m.keys()) == test::ints(21, 35, 19));
        CHECK(m.contains(45)); // same last digit as 35
    }
}

TEST("sorted_array_map - copy and deepcopy")
{
    auto m = make_map({1, 2, 3});

    auto c = m.copy();
    CHECK(c.capacity() == 6);
    CHECK(c == m);
    c.put(4, 40);
    CHECK(!m.contains(4));

    auto d = m.deepcopy([](int const& k) { return -k; }, [](int const& v) { return v + 1; });
    CHECK(test::collect(d.keys()) == test::ints(-3, -2, -1));
    CHECK(d.get(-1).value() == 11);
    CHECK(m.get(1).value() == 10);

    auto collapsed = m.deepcopy([](int const&) { return 0; }, [](int const& v) { return v; });
    CHECK(collapsed.size() == 1);
    CHECK(collapsed.get(0).value() == 30);
}

TEST("sorted_array_map - clear")
{
    auto m = make_map({1, 2, 3, 4, 5, 6, 7, 8, 9});
    CHECK(m.capacity() == 16);

    m.clear();
    CHECK(m.empty());
    CHECK(m.capacity() == 4);
    CHECK(m.min().error() == ac::map_error::underflow);

    m.put(1, 1);
    CHECK(m.get(1).value() == 1);
}

TEST("sorted_array_map - to_string")
{
    auto m = ac::sorted_array_map<std::string, int>();
    CHECK(m.to_string() == "[0]{ }");

    m.put("b", 2);
    m.put("a", 1);
    CHECK(m.to_string() == "[2]{ \"a\": 1, \"b\": 2 }");
}

TEST("sorted_array_map - vector keys and values")
{
    auto m = ac::sorted_array_map<std::vector<int>, std::vector<std::string>>();
    for (int i = 0; i < 20; ++i)
        CHECK(m.put(test::array_key(i), test::array_value(i)));
    CHECK(m.size() == 20);
    CHECK(m.capacity() == 32);

    // lookups use freshly built vectors, never the stored ones
    auto all_found = true;
    for (int i = 0; i < 20; ++i)
        all_found = all_found && m.contains(test::array_key(i)) && m.get(test::array_key(i)).value() == test::array_value(i);
    CHECK(all_found);

    auto near_miss = test::array_key(3);
    near_miss.push_back(0);
    CHECK(!m.contains(near_miss));

    CHECK(!m.put(test::array_key(7), test::array_value(70)));
    CHECK(m.get(test::array_key(7)).value() == test::array_value(70));

    for (int i = 0; i < 16; ++i)
        CHECK(m.remove(test::array_key(i)));
    CHECK(m.size() == 4);
    CHECK(m.capacity() == 8);
    CHECK(test::collect(m.keys()).front() == test::array_key(16));

    auto rest_found = true;
    for (int i = 16; i < 20; ++i)
        rest_found = rest_found && m.get(test::array_key(i)).value() == test::array_value(i);
    CHECK(rest_found);
    CHECK(!m.contains(test::array_key(7)));
}
