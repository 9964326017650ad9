#include <assoc-core/chaining_hash_map.hh>

#include <nexus/test.hh>

#include "test-utils.hh"

#include <memory>
#include <string>
#include <vector>

namespace
{
// bucket of key k is k % capacity for k >= 0
struct identity_hash
{
    ac::u64 operator()(int k) const { return ac::u64(k); }
};

struct constant_hash
{
    ac::u64 operator()(int) const { return 7; }
};

using int_map = ac::chaining_hash_map<int, int, identity_hash>;
using colliding_map = ac::chaining_hash_map<int, int, constant_hash>;
} // namespace

static_assert(ac::associative_map<int_map>);
static_assert(ac::associative_map<ac::chaining_hash_map<std::string, int>>);

TEST("chaining_hash_map - construction")
{
    auto const m = ac::chaining_hash_map<std::string, int>();
    CHECK(m.empty());
    CHECK(m.capacity() == 4);
    CHECK(m.bucket_count_in_use() == 0);

    CHECK(test::triggers_assertion([] { auto bad = int_map(0); }));
}

TEST("chaining_hash_map - put, get and remove")
{
    auto m = ac::chaining_hash_map<std::string, int>();

    CHECK(m.put("one", 1));
    CHECK(m.put("two", 2));
    CHECK(!m.put("one", 11));

    CHECK(m.size() == 2);
    CHECK(m.get("one").value() == 11);
    CHECK(m.get("three").error() == ac::map_error::not_found);
    CHECK(m.get("three", 3) == 3);
    CHECK(m.find("three") == nullptr);

    auto* v = m.find("two");
    REQUIRE(v != nullptr);
    *v = 22;
    CHECK(m.get("two").value() == 22);

    CHECK(m.remove("two"));
    CHECK(!m.remove("two"));
    CHECK(!m.contains("two"));
    CHECK(m.size() == 1);
}

TEST("chaining_hash_map - many keys stay reachable")
{
    auto m = ac::chaining_hash_map<int, std::string>();
    for (int i = 0; i < 100; ++i)
        m.put(i * 7919, ac::to_string(i));

    CHECK(m.size() == 100);
    CHECK(m.capacity() == 128);

    auto all_found = true;
    for (int i = 0; i < 100; ++i)
        all_found = all_found && m.get(i * 7919, "") == ac::to_string(i);
    CHECK(all_found);

    for (int i = 0; i < 100; i += 2)
        m.remove(i * 7919);

    CHECK(m.size() == 50);
    CHECK(!m.contains(0));
    CHECK(m.contains(7919));
}

TEST("chaining_hash_map - grows when size reaches capacity")
{
    auto m = int_map();
    for (int k = 0; k < 4; ++k)
        m.put(k, k);
    CHECK(m.capacity() == 4);
    CHECK(m.bucket_count_in_use() == 4);

    m.put(4, 4);
    CHECK(m.capacity() == 8);
    CHECK(m.size() == 5);
    CHECK(test::collect(m.keys()) == test::ints(0, 1, 2, 3, 4));

    SECTION("overwrite at full size still rehashes first")
    {
        auto full = int_map();
        for (int k = 0; k < 4; ++k)
            full.put(k, k);
        CHECK(!full.put(0, 100));
        CHECK(full.capacity() == 8);
        CHECK(full.size() == 4);
        CHECK(full.get(0).value() == 100);
    }
}

TEST("chaining_hash_map - shrinks before removal")
{
    auto m = int_map();
    for (int k = 0; k < 5; ++k)
        m.put(k, k);
    CHECK(m.capacity() == 8);

    m.remove(0);
    m.remove(1);
    m.remove(2);
    CHECK(m.capacity() == 8);
    CHECK(m.size() == 2);

    SECTION("removing a present key")
    {
        CHECK(m.remove(3)); // size 2 == 8 / 4
        CHECK(m.capacity() == 4);

        // size 1 == 4 / 4, but 4 buckets is where the map started
        CHECK(m.remove(4));
        CHECK(m.capacity() == 4);
        CHECK(m.empty());

        CHECK(!m.remove(9));
        CHECK(m.capacity() == 4);

        m.put(10, 10);
        m.put(11, 11);
        CHECK(m.capacity() == 4);
        CHECK(m.get(10).value() == 10);
        CHECK(m.get(11).value() == 11);
    }

    SECTION("the check runs even when the key is absent")
    {
        CHECK(!m.remove(99));
        CHECK(m.capacity() == 4);
        CHECK(m.size() == 2);
        CHECK(m.contains(3));
        CHECK(m.contains(4));
    }
}

TEST("chaining_hash_map - never shrinks below the initial capacity")
{
    SECTION("large initial capacity")
    {
        auto m = int_map(16);
        for (int k = 0; k < 4; ++k)
            m.put(k, k);

        // size 4 == 16 / 4 on every removal, nothing to shrink to
        for (int k = 0; k < 4; ++k)
            CHECK(m.remove(k));
        CHECK(m.capacity() == 16);
        CHECK(!m.remove(99));
        CHECK(m.capacity() == 16);
    }

    SECTION("small initial capacity")
    {
        auto m = int_map(2);
        for (int k = 0; k < 3; ++k)
            m.put(k, k);
        CHECK(m.capacity() == 4);

        for (int k = 0; k < 3; ++k)
            m.remove(k);
        CHECK(m.empty());
        CHECK(m.capacity() == 2);
        CHECK(!m.remove(99));
        CHECK(m.capacity() == 2);
    }

    SECTION("after clear the floor is the default capacity")
    {
        auto m = int_map(16);
        m.clear();
        CHECK(m.capacity() == 4);

        for (int k = 0; k < 5; ++k)
            m.put(k, k);
        CHECK(m.capacity() == 8);

        for (int k = 0; k < 5; ++k)
            m.remove(k);
        CHECK(m.capacity() == 4);
    }

    SECTION("copies keep the floor")
    {
        auto m = int_map(8);
        for (int k = 0; k < 9; ++k)
            m.put(k, k);
        CHECK(m.capacity() == 16);

        auto c = m.copy();
        for (int k = 0; k < 9; ++k)
            c.remove(k);
        CHECK(c.capacity() == 8);
    }
}

TEST("chaining_hash_map - rehash moves entries")
{
    auto m = ac::chaining_hash_map<int, std::unique_ptr<int>>();
    for (int k = 0; k < 40; ++k)
        CHECK(m.put(k, std::make_unique<int>(k * 10)));
    CHECK(m.capacity() == 64);

    for (int k = 0; k < 40; ++k)
    {
        auto const* v = m.find(k);
        REQUIRE(v != nullptr);
        CHECK(**v == k * 10);
    }

    // shrinks at size 16 and 8
    for (int k = 0; k < 36; ++k)
        CHECK(m.remove(k));
    CHECK(m.capacity() == 16);
    CHECK(**m.find(39) == 390);
}

TEST("chaining_hash_map - buckets")
{
    auto m = int_map(8);
    m.put(1, 1);
    m.put(9, 9);   // same bucket as 1
    m.put(17, 17); // same bucket as 1
    m.put(2, 2);

    CHECK(m.size() == 4);
    CHECK(m.bucket_count_in_use() == 2);

    SECTION("a bucket keeps insertion order")
    {
        CHECK(test::collect(m.keys()) == test::ints(1, 9, 17, 2));
    }

    SECTION("empty buckets are dropped")
    {
        m.remove(2);
        CHECK(m.bucket_count_in_use() == 1);

        m.remove(9);
        CHECK(m.bucket_count_in_use() == 1);
        CHECK(test::collect(m.keys()) == test::ints(1, 17));
    }

    SECTION("negative hashes are masked")
    {
        auto n = int_map();
        n.put(-1, 1);
        n.put(-2, 2);
        CHECK(n.get(-1).value() == 1);
        CHECK(n.get(-2).value() == 2);
        CHECK(n.remove(-1));
        CHECK(!n.contains(-1));
    }
}

TEST("chaining_hash_map - every key in one bucket")
{
    auto m = colliding_map();
    for (int k : {5, 3, 8, 1, 9})
        m.put(k, k * 2);

    CHECK(m.size() == 5);
    CHECK(m.bucket_count_in_use() == 1);
    CHECK(test::collect(m.keys()) == test::ints(5, 3, 8, 1, 9));
    CHECK(m.get(8).value() == 16);

    m.remove(8);
    CHECK(test::collect(m.keys()) == test::ints(5, 3, 1, 9));

    m.remove(5);
    m.remove(3);
    m.remove(1);
    m.remove(9);
    CHECK(m.empty());
    CHECK(m.bucket_count_in_use() == 0);
}

TEST("chaining_hash_map - clear")
{
    auto m = int_map();
    for (int k = 0; k < 20; ++k)
        m.put(k, k);

    m.clear();
    CHECK(m.empty());
    CHECK(m.capacity() == 4);
    CHECK(m.bucket_count_in_use() == 0);
    CHECK(test::collect(m.keys()).empty());
}

TEST("chaining_hash_map - copy and deepcopy")
{
    auto m = int_map(8);
    for (int k : {12, 4, 9, 1})
        m.put(k, k);

    SECTION("copy keeps capacity and iteration order")
    {
        auto c = m.copy();
        CHECK(c.capacity() == 8);
        CHECK(test::collect(c.keys()) == test::collect(m.keys()));
        CHECK(c == m);

        c.remove(12);
        CHECK(m.contains(12));
    }

    SECTION("deepcopy")
    {
        auto d = m.deepcopy([](int const& k) { return k + 100; }, [](int const& v) { return -v; });
        CHECK(d.capacity() == 8);
        CHECK(d.size() == 4);
        CHECK(d.get(112).value() == -12);
        CHECK(!d.contains(12));
    }

    SECTION("deepcopy rejects invalid copy functions")
    {
        auto const copy_key = [](int const& k) { return k; };
        CHECK(test::triggers_assertion(
            [&]
            {
                auto d = m.deepcopy(copy_key, {});
            }));
    }
}

TEST("chaining_hash_map - to_string and hash")
{
    auto m = ac::chaining_hash_map<int, std::string, identity_hash>();
    CHECK(m.to_string() == "[0]{ }");

    m.put(2, "b");
    m.put(1, "a");
    CHECK(m.to_string() == "[2]{ 1: \"a\", 2: \"b\" }");

    auto bigger = ac::chaining_hash_map<int, std::string, identity_hash>(64);
    bigger.put(1, "a");
    bigger.put(2, "b");
    CHECK(bigger == m);
    CHECK(bigger.hash() == m.hash());

    bigger.put(2, "c");
    CHECK(!(bigger == m));
}

TEST("chaining_hash_map - vector keys and values")
{
    auto m = ac::chaining_hash_map<std::vector<int>, std::vector<std::string>>();
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
    CHECK(m.capacity() == 16);

    auto rest_found = true;
    for (int i = 16; i < 20; ++i)
        rest_found = rest_found && m.get(test::array_key(i)).value() == test::array_value(i);
    CHECK(rest_found);
    CHECK(!m.contains(test::array_key(7)));
}
