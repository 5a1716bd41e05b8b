/**
 * @file TestOctreeInsert.cpp
 * @brief Insertion, merge, split and lookup behaviour of octree::Octree.
 */

#include <catch2/catch_test_macros.hpp>

#include "svo/octree/Octree.hpp"

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <tuple>
#include <vector>

namespace svo::octree {

using math::Coord;

namespace {

template <typename Tree>
std::optional<typename Tree::value_type> at(const Tree &tree, Coord pos)
{
    auto result = tree.get(pos);
    REQUIRE(result.has_value());
    return *result;
}

template <typename Tree>
void put(Tree &tree, Coord pos, typename Tree::value_type value)
{
    REQUIRE(tree.insert(pos, std::move(value)).has_value());
}

} // namespace

TEST_CASE("Octree starts empty", "[octree][insert]")
{
    Octree<std::string, 16> tree;

    REQUIRE(tree.nodeCount() == 1);
    REQUIRE(tree.leafCount() == 0);
    REQUIRE_FALSE(at(tree, Coord{0, 0, 0}).has_value());
    REQUIRE_FALSE(at(tree, Coord{31, 31, 31}).has_value());
}

TEST_CASE("Octree get returns the inserted value", "[octree][insert]")
{
    Octree<std::string, 16> tree;
    put(tree, Coord{3, 17, 30}, "Hello");

    REQUIRE(at(tree, Coord{3, 17, 30}) == "Hello");
    REQUIRE_FALSE(at(tree, Coord{3, 17, 31}).has_value());
    REQUIRE_FALSE(at(tree, Coord{2, 17, 30}).has_value());

    // root + one Mixed node per level below it + the leaf
    REQUIRE(tree.nodeCount() == 5);
    REQUIRE(tree.leafCount() == 1);
}

TEST_CASE("Octree insert is idempotent", "[octree][insert]")
{
    Octree<std::string, 16> tree;
    put(tree, Coord{1, 2, 3}, "a");
    put(tree, Coord{9, 2, 3}, "b");

    const std::string before = tree.toString();
    const auto nodes = tree.nodeCount();
    const auto leaves = tree.leafCount();

    put(tree, Coord{9, 2, 3}, "b");

    REQUIRE(tree.toString() == before);
    REQUIRE(tree.nodeCount() == nodes);
    REQUIRE(tree.leafCount() == leaves);
}

TEST_CASE("Octree edits a leaf in place instead of adding one", "[octree][insert][merge]")
{
    Octree<std::string, 16> tree;
    put(tree, Coord{0, 0, 0}, "Hello");
    put(tree, Coord{0, 1, 0}, "Hello");
    put(tree, Coord{0, 0, 1}, "Hello");
    REQUIRE(tree.leafCount() == 3);

    put(tree, Coord{0, 1, 0}, "Moin");
    REQUIRE(tree.leafCount() == 3);
    REQUIRE(at(tree, Coord{0, 1, 0}) == "Moin");

    put(tree, Coord{0, 0, 1}, "Hello");
    REQUIRE(tree.leafCount() == 3);

    put(tree, Coord{0, 1, 0}, "Hello");
    REQUIRE(tree.leafCount() == 3);
    REQUIRE(at(tree, Coord{0, 1, 0}) == "Hello");
}

TEST_CASE("Octree collapses a uniform unit cube and splits it again", "[octree][insert][merge][split]")
{
    Octree<std::string, 16> tree;
    put(tree, Coord{0, 0, 0}, "Hello");
    put(tree, Coord{0, 1, 0}, "Hello");
    put(tree, Coord{0, 0, 1}, "Hello");
    put(tree, Coord{0, 1, 1}, "Hello");
    put(tree, Coord{1, 0, 0}, "Hello");
    put(tree, Coord{1, 1, 0}, "Hello");
    put(tree, Coord{1, 0, 1}, "Hello");
    REQUIRE(tree.leafCount() == 7);
    const auto nodes = tree.nodeCount();

    put(tree, Coord{1, 1, 1}, "Hello");
    REQUIRE(tree.leafCount() == 1);
    REQUIRE(tree.nodeCount() == nodes);

    for (core::u8 x = 0; x < 2; ++x)
        for (core::u8 y = 0; y < 2; ++y)
            for (core::u8 z = 0; z < 2; ++z)
                REQUIRE(at(tree, Coord{x, y, z}) == "Hello");
    REQUIRE_FALSE(at(tree, Coord{2, 0, 0}).has_value());

    put(tree, Coord{1, 1, 1}, "lol");
    REQUIRE(tree.leafCount() == 8);
    REQUIRE(at(tree, Coord{1, 1, 1}) == "lol");

    int hello = 0;
    for (core::u8 x = 0; x < 2; ++x)
        for (core::u8 y = 0; y < 2; ++y)
            for (core::u8 z = 0; z < 2; ++z)
                hello += at(tree, Coord{x, y, z}) == "Hello" ? 1 : 0;
    REQUIRE(hello == 7);
}

TEST_CASE("Octree stores a uniform 8x8x8 block as one leaf and splits it locally", "[octree][insert][split]")
{
    Octree<std::string, 16> tree;

    for (core::u8 x = 8; x < 16; ++x)
        for (core::u8 y = 0; y < 8; ++y)
            for (core::u8 z = 8; z < 16; ++z)
                put(tree, Coord{x, y, z}, "Hello");

    REQUIRE(tree.leafCount() == 1);
    REQUIRE(tree.nodeCount() == 3);

    put(tree, Coord{13, 5, 9}, "Ok");

    // 7 full siblings on each of the three levels below the block, plus the
    // split unit cube's own leaf
    REQUIRE(tree.leafCount() == 7 + 7 + 7 + 1);
    REQUIRE(tree.nodeCount() == 3 + 8 + 8);

    REQUIRE(at(tree, Coord{13, 5, 9}) == "Ok");
    REQUIRE(at(tree, Coord{8, 5, 9}) == "Hello");
    REQUIRE_FALSE(at(tree, Coord{0, 1, 2}).has_value());

    int unchanged = 0;
    for (core::u8 x = 8; x < 16; ++x)
        for (core::u8 y = 0; y < 8; ++y)
            for (core::u8 z = 8; z < 16; ++z)
                if (Coord{x, y, z} != Coord{13, 5, 9} && at(tree, Coord{x, y, z}) == "Hello")
                    ++unchanged;
    REQUIRE(unchanged == 511);
}

TEST_CASE("Octree collapses the whole volume regardless of fill order", "[octree][insert][merge]")
{
    Octree<core::u32, 4> tree;

    std::vector<Coord> cells;
    for (core::u8 x = 0; x < 8; ++x)
        for (core::u8 y = 0; y < 8; ++y)
            for (core::u8 z = 0; z < 8; ++z)
                cells.push_back(Coord{x, y, z});

    std::mt19937 rng{1234};
    std::shuffle(cells.begin(), cells.end(), rng);

    SECTION("single value")
    {
        for (const Coord &c : cells)
            put(tree, c, 7u);
    }

    SECTION("overwriting a noisy volume")
    {
        std::uniform_int_distribution<core::u32> noise{0, 3};
        for (const Coord &c : cells)
            put(tree, c, noise(rng));
        std::shuffle(cells.begin(), cells.end(), rng);
        for (const Coord &c : cells)
            put(tree, c, 7u);
    }

    REQUIRE(tree.leafCount() == 1);
    REQUIRE(tree.nodeCount() == 1);
    REQUIRE(at(tree, Coord{5, 2, 6}) == 7u);
}

TEST_CASE("Octree matches a reference map under random inserts", "[octree][insert][property]")
{
    Octree<core::u32, 2> tree;
    std::map<std::tuple<int, int, int>, core::u32> reference;

    std::mt19937 rng{42};
    std::uniform_int_distribution<int> axis{0, 3};
    std::uniform_int_distribution<core::u32> value{0, 2};

    for (int step = 0; step < 400; ++step) {
        const Coord pos{static_cast<core::u8>(axis(rng)), static_cast<core::u8>(axis(rng)),
                        static_cast<core::u8>(axis(rng))};
        const core::u32 v = value(rng);
        put(tree, pos, v);
        reference[{pos.x, pos.y, pos.z}] = v;

        for (core::u8 x = 0; x < 4; ++x)
            for (core::u8 y = 0; y < 4; ++y)
                for (core::u8 z = 0; z < 4; ++z) {
                    const auto it = reference.find({x, y, z});
                    const auto stored = at(tree, Coord{x, y, z});
                    if (it == reference.end())
                        REQUIRE_FALSE(stored.has_value());
                    else
                        REQUIRE(stored == it->second);
                }
        REQUIRE(tree.leafCount() <= reference.size());
    }
}

TEST_CASE("Octree get after insert holds over the full domain", "[octree][insert][property]")
{
    Octree<core::u32, 16> tree;

    std::mt19937 rng{7};
    std::uniform_int_distribution<int> axis{0, 31};
    std::uniform_int_distribution<core::u32> value;

    for (int step = 0; step < 200; ++step) {
        const Coord pos{static_cast<core::u8>(axis(rng)), static_cast<core::u8>(axis(rng)),
                        static_cast<core::u8>(axis(rng))};
        const core::u32 v = value(rng);
        put(tree, pos, v);
        REQUIRE(at(tree, pos) == v);
    }
}

TEST_CASE("Octree rejects positions outside its domain", "[octree][insert][error]")
{
    Octree<std::string, 16> tree;
    put(tree, Coord{0, 0, 0}, "kept");
    const std::string before = tree.toString();

    auto inserted = tree.insert(Coord{32, 0, 0}, "nope");
    REQUIRE_FALSE(inserted.has_value());
    REQUIRE(inserted.error().code() == core::ErrorCode::kInvalidPosition);

    auto read = tree.get(Coord{0, 0, 40});
    REQUIRE_FALSE(read.has_value());
    REQUIRE(read.error().code() == core::ErrorCode::kInvalidPosition);

    REQUIRE(tree.toString() == before);
}

TEST_CASE("Octree with the largest half-width accepts every u8 position", "[octree][insert]")
{
    Octree<int, 128> tree;
    put(tree, Coord{255, 255, 255}, 1);
    put(tree, Coord{0, 0, 0}, 2);

    REQUIRE(at(tree, Coord{255, 255, 255}) == 1);
    REQUIRE(at(tree, Coord{0, 0, 0}) == 2);
    REQUIRE(tree.nodeCount() == 1 + 7 + 7);
}

TEST_CASE("Octree getMut is reported as unsupported", "[octree][error]")
{
    Octree<int, 2> tree;
    put(tree, Coord{1, 1, 1}, 3);

    auto mut = tree.getMut(Coord{1, 1, 1});
    REQUIRE_FALSE(mut.has_value());
    REQUIRE(mut.error().code() == core::ErrorCode::kNotSupported);

    auto outside = tree.getMut(Coord{4, 0, 0});
    REQUIRE_FALSE(outside.has_value());
    REQUIRE(outside.error().code() == core::ErrorCode::kInvalidPosition);
}

TEST_CASE("Octree copies are independent", "[octree][insert]")
{
    Octree<int, 2> tree;
    put(tree, Coord{0, 0, 0}, 1);

    Octree<int, 2> copy = tree;
    put(copy, Coord{0, 0, 0}, 2);
    put(copy, Coord{3, 3, 3}, 5);

    REQUIRE(at(tree, Coord{0, 0, 0}) == 1);
    REQUIRE_FALSE(at(tree, Coord{3, 3, 3}).has_value());
    REQUIRE(at(copy, Coord{0, 0, 0}) == 2);
    REQUIRE(at(copy, Coord{3, 3, 3}) == 5);
}

} // namespace svo::octree
