// tests/test_union_find.cpp
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"
#include "algo/DisjointSet.hpp"

#include <stdexcept>

static const UnionFindStrategy kStrategies[] = {UnionFindStrategy::ArrayBased,
                                                UnionFindStrategy::MapBased};

TEST_CASE("unite merges sets and reports redundant unions") {
    for (auto s : kStrategies) {
        for (bool pc : {true, false}) {
            for (bool rank : {true, false}) {
                CAPTURE(toString(s));
                CAPTURE(pc);
                CAPTURE(rank);
                auto ds = makeDisjointSet(s, 6, pc, rank);
                CHECK(ds->strategy() == s);
                CHECK(ds->setCount() == 6);

                CHECK(ds->unite(0, 1));
                CHECK(ds->unite(2, 3));
                CHECK(ds->unite(1, 3));
                CHECK_FALSE(ds->unite(0, 2));                  // already joined
                CHECK(ds->setCount() == 3);

                CHECK(ds->connected(0, 3));
                CHECK_FALSE(ds->connected(0, 4));
                CHECK(ds->find(0) == ds->find(2));
                CHECK(ds->find(4) == 4);
                CHECK(ds->unionOperations() == 3);
            }
        }
    }
}

TEST_CASE("find returns the real root without path compression") {
    // A long chain built without ranks: every union hangs the old root
    // under the next element.
    for (auto s : kStrategies) {
        auto ds = makeDisjointSet(s, 5, false, false);
        ds->unite(0, 1);
        ds->unite(1, 2);
        ds->unite(2, 3);
        ds->unite(3, 4);
        const auto root = ds->find(4);
        for (std::size_t v = 0; v < 5; ++v) CHECK(ds->find(v) == root);
    }
}

TEST_CASE("Path compression shortens later finds") {
    auto plain = makeDisjointSet(UnionFindStrategy::ArrayBased, 64, false, false);
    auto compressed = makeDisjointSet(UnionFindStrategy::ArrayBased, 64, true, false);
    for (std::size_t v = 0; v + 1 < 64; ++v) {
        plain->unite(v, v + 1);
        compressed->unite(v, v + 1);
    }
    const auto plainBefore = plain->operations();
    const auto compressedBefore = compressed->operations();
    for (int i = 0; i < 10; ++i) {
        plain->find(0);
        compressed->find(0);
    }
    CHECK(compressed->operations() - compressedBefore < plain->operations() - plainBefore);
}

TEST_CASE("Union by rank keeps the larger tree's root") {
    auto ds = makeDisjointSet(UnionFindStrategy::ArrayBased, 4, false, true);
    ds->unite(0, 1);                                           // root 0, rank 1
    ds->unite(2, 0);                                           // 2 has rank 0 -> goes under 0
    CHECK(ds->find(2) == 0);
    CHECK(ds->find(1) == 0);
}

TEST_CASE("Out-of-range elements are rejected") {
    for (auto s : kStrategies) {
        auto ds = makeDisjointSet(s, 3, true, true);
        CHECK_THROWS_AS(ds->find(3), std::out_of_range);
        CHECK_THROWS_AS(ds->unite(0, 7), std::out_of_range);
        CHECK(ds->size() == 3);
    }
}

TEST_CASE("Map storage grows only for touched elements") {
    auto map = makeDisjointSet(UnionFindStrategy::MapBased, 100000, true, true);
    const auto before = map->bytesReserved();
    map->unite(1, 2);
    CHECK(map->bytesReserved() >= before);
    CHECK(map->setCount() == 99999);

    auto arr = makeDisjointSet(UnionFindStrategy::ArrayBased, 100000, true, true);
    CHECK(arr->bytesReserved() > map->bytesReserved());
}

TEST_CASE("Union-find strategy names") {
    CHECK(toString(UnionFindStrategy::ArrayBased) == "ARRAY_BASED");
    CHECK(toString(UnionFindStrategy::MapBased) == "MAP_BASED");
    CHECK(parseUnionFindStrategy("Map") == UnionFindStrategy::MapBased);
    CHECK(parseUnionFindStrategy("ARRAY_BASED") == UnionFindStrategy::ArrayBased);
    CHECK_THROWS_AS(parseUnionFindStrategy("tree"), std::invalid_argument);
}
