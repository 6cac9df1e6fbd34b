#include "ordmap/ordered_map.hpp"
#include "ordmap/ordered_map_format.hpp"

#include <doctest.h>

#include <fmt/format.h>

#include <array>
#include <string>
#include <utility>
#include <vector>

using namespace ordmap;

namespace {
template <typename K, typename V>
std::vector<K>
keys_of(const OrderedMap<K, V>& map) {
    std::vector<K> keys;
    for (const auto& [key, value] : map) {
        keys.push_back(key);
    }
    return keys;
}

// Key type with equality only, no hashing and no ordering.
struct Point {
    int x;
    int y;

    bool
    operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }
};
}  // namespace

TEST_CASE("ordered_map") {
    SUBCASE("empty") {
        OrderedMap<std::string, int> map;
        REQUIRE(map.empty());
        REQUIRE(map.size() == 0);
        REQUIRE(map.begin() == map.end());
        REQUIRE_FALSE(map.get("anything").has_value());
    }

    SUBCASE("with_capacity") {
        auto map = OrderedMap<std::string, int>::with_capacity(16);
        REQUIRE(map.empty());
        REQUIRE(map.capacity() >= 16);

        map.insert("a", 1);
        REQUIRE(map.size() == 1);
        REQUIRE(map.get("a")->get() == 1);
    }

    SUBCASE("insert") {
        std::string key1 = "key1";
        std::string key2 = "key2";
        OrderedMap<std::string, int> map;

        map.insert(key2, 20);
        REQUIRE_FALSE(map.get(key1).has_value());
        REQUIRE(map.get(key2)->get() == 20);

        map.insert(key1, 10);
        REQUIRE(map.get(key1)->get() == 10);
        REQUIRE(map.get(key2)->get() == 20);
        REQUIRE(map.size() == 2);
        REQUIRE_FALSE(map.empty());
    }

    SUBCASE("iter") {
        OrderedMap<std::string, int> map;
        map.insert("key2", 20);
        map.insert("key1", 10);

        auto it = map.begin();
        REQUIRE(it->key == "key2");
        REQUIRE(it->value == 20);
        ++it;
        REQUIRE(it->key == "key1");
        REQUIRE(it->value == 10);
        ++it;
        REQUIRE(it == map.end());

        // Iteration can be restarted.
        REQUIRE(keys_of(map) == std::vector<std::string>{"key2", "key1"});
        REQUIRE(keys_of(map) == std::vector<std::string>{"key2", "key1"});
    }

    SUBCASE("update keeps position") {
        OrderedMap<std::string, int> map;
        map.insert("a", 1);
        map.insert("b", 2);
        map.insert("c", 3);

        map.insert("b", 20);
        map.insert("a", 10);

        REQUIRE(map.size() == 3);
        REQUIRE(keys_of(map) == std::vector<std::string>{"a", "b", "c"});
        REQUIRE(map.get("a")->get() == 10);
        REQUIRE(map.get("b")->get() == 20);
        REQUIRE(map.get("c")->get() == 3);
    }

    SUBCASE("keys stay unique") {
        OrderedMap<int, int> map;
        for (int i = 0; i < 100; i++) {
            map.insert(i % 7, i);
        }
        REQUIRE(map.size() == 7);
        REQUIRE(keys_of(map) == std::vector<int>{0, 1, 2, 3, 4, 5, 6});
        for (int k = 0; k < 7; k++) {
            int count = 0;
            for (const auto& [key, value] : map) {
                if (key == k) {
                    count++;
                }
            }
            REQUIRE(count == 1);
        }
        // Last write wins
        REQUIRE(map.get(0)->get() == 98);
        REQUIRE(map.get(1)->get() == 99);
        REQUIRE(map.get(2)->get() == 93);
    }

    SUBCASE("insertion order") {
        OrderedMap<std::string, int> map;
        std::vector<std::string> keys = {"zeta", "alpha", "mu", "beta", "omega", "delta"};
        int n = 0;
        for (auto& key : keys) {
            map.insert(key, n++);
        }
        REQUIRE(keys_of(map) == keys);

        n = 0;
        for (const auto& [key, value] : map) {
            REQUIRE(value == n++);
        }
    }

    SUBCASE("miss is absence, not a default value") {
        OrderedMap<std::string, int> map;
        map.insert("zero", 0);
        REQUIRE(map.get("zero").has_value());
        REQUIRE(map.get("zero")->get() == 0);
        REQUIRE_FALSE(map.get("one").has_value());
        REQUIRE(map.contains("zero"));
        REQUIRE_FALSE(map.contains("one"));
        REQUIRE(map.size() == 1);
    }

    SUBCASE("mutable get") {
        OrderedMap<std::string, std::vector<int>> map;
        map.insert("list", {1, 2});
        map.get("list")->get().push_back(3);
        REQUIRE(map.get("list")->get() == std::vector<int>{1, 2, 3});
    }

    SUBCASE("equality only keys") {
        OrderedMap<Point, std::string> map;
        map.insert(Point{1, 2}, "first");
        map.insert(Point{0, 0}, "origin");
        map.insert(Point{1, 2}, "again");

        REQUIRE(map.size() == 2);
        REQUIRE(map.get(Point{1, 2})->get() == "again");
        REQUIRE(map.begin()->key == Point{1, 2});
        REQUIRE_FALSE(map.get(Point{2, 1}).has_value());
    }

    SUBCASE("for_each") {
        OrderedMap<std::string, int> map{{"key2", 20}, {"key1", 10}};
        std::string visited;
        map.for_each([&](const std::string& key, const int& value) { visited += fmt::format("{}={};", key, value); });
        REQUIRE(visited == "key2=20;key1=10;");
    }

    SUBCASE("copies are independent") {
        OrderedMap<std::string, int> original{{"a", 1}, {"b", 2}};
        auto copy = original;
        REQUIRE(copy == original);

        copy.insert("a", 100);
        copy.insert("c", 3);
        REQUIRE(original.get("a")->get() == 1);
        REQUIRE_FALSE(original.contains("c"));
        REQUIRE(original.size() == 2);
        REQUIRE(copy.size() == 3);
        REQUIRE_FALSE(copy == original);
    }

    SUBCASE("equality is order sensitive") {
        OrderedMap<std::string, int> a{{"x", 1}, {"y", 2}};
        OrderedMap<std::string, int> b{{"y", 2}, {"x", 1}};
        OrderedMap<std::string, int> c{{"x", 1}, {"y", 2}};
        REQUIRE(a == c);
        REQUIRE_FALSE(a == b);
    }
}

TEST_CASE("ordered_map construction from pairs") {
    SUBCASE("initializer list") {
        OrderedMap<std::string, int> map{{"key2", 20}, {"key1", 10}};
        auto it = map.begin();
        REQUIRE(it->key == "key2");
        REQUIRE(it->value == 20);
        ++it;
        REQUIRE(it->key == "key1");
        REQUIRE(it->value == 10);
    }

    SUBCASE("fixed array") {
        const std::array<std::pair<const char*, int>, 2> pairs = {{{"key2", 20}, {"key1", 10}}};
        auto map = OrderedMap<const char*, int>::from_pairs(pairs);

        OrderedMap<const char*, int> expected;
        expected.insert(pairs[0].first, 20);
        expected.insert(pairs[1].first, 10);

        REQUIRE(map.size() == 2);
        REQUIRE(map == expected);
        REQUIRE(map.begin()->value == 20);
    }

    SUBCASE("duplicates keep first position and last value") {
        OrderedMap<std::string, int> map{{"a", 1}, {"b", 2}, {"a", 3}};
        REQUIRE(map.size() == 2);
        REQUIRE(keys_of(map) == std::vector<std::string>{"a", "b"});
        REQUIRE(map.get("a")->get() == 3);

        const std::pair<std::string, int> pairs[] = {{"k", 1}, {"j", 2}, {"k", 5}, {"j", 6}};
        auto from_array = OrderedMap<std::string, int>::from_pairs(pairs);
        REQUIRE(keys_of(from_array) == std::vector<std::string>{"k", "j"});
        REQUIRE(from_array.get("k")->get() == 5);
        REQUIRE(from_array.get("j")->get() == 6);
    }
}

TEST_CASE("ordered_map debug format") {
    SUBCASE("string keys") {
        OrderedMap<std::string, int> map;
        map.insert("key2", 20);
        map.insert("key1", 10);

        const std::string expected = R"foo([Entry { key: "key2", val: 20 }, Entry { key: "key1", val: 10 }])foo";
        REQUIRE(repr(map) == expected);
        REQUIRE(fmt::format("{}", map) == expected);
    }

    SUBCASE("empty") {
        OrderedMap<int, int> map;
        REQUIRE(fmt::format("{}", map) == "[]");
    }

    SUBCASE("nested and escaped") {
        OrderedMap<int, OrderedMap<char, std::string>> map;
        map.insert(1, OrderedMap<char, std::string>{{'a', "line\nbreak"}});
        REQUIRE(fmt::format("{}", map) == R"foo([Entry { key: 1, val: [Entry { key: 'a', val: "line\nbreak" }] }])foo");
    }
}
