/**
 * @file test_batch.cpp
 * @brief Unit tests for batch array operations.
 */

#include <catch2/catch.hpp>
#include <wordpack/typed_array.hpp>

#include <cstdint>
#include <vector>

using namespace wordpack;

TEST_CASE("get_batch", "[batch]") {
    SparseStore<256> store;
    UInt16Array<> array(store, "batch/get");
    array.push_batch({10, 20, 30, 40});

    SECTION("results follow index order, duplicates allowed") {
        std::vector<std::uint16_t> out;
        REQUIRE(array.get_batch({3, 0, 3, 1}, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint16_t>{40, 10, 40, 20});
    }

    SECTION("empty index list") {
        std::vector<std::uint16_t> out{1, 2};
        REQUIRE(array.get_batch({}, out) == Error::Ok);
        REQUIRE(out.empty());
    }

    SECTION("checked form rejects an index past the length") {
        std::vector<std::uint16_t> out{99};
        REQUIRE(array.get_batch({0, 4}, out) == Error::IndexOutOfRange);
        REQUIRE(out == std::vector<std::uint16_t>{99});
    }

    SECTION("unchecked form reads whatever the slot holds") {
        std::vector<std::uint16_t> out;
        array.get_batch(unchecked, {2, 5}, out);
        REQUIRE(out == std::vector<std::uint16_t>{30, 0});
    }
}

TEST_CASE("set_batch", "[batch]") {
    SparseStore<256> store;
    UInt16Array<> array(store, "batch/set");
    array.push_batch({1, 2, 3});

    SECTION("mismatched lists are rejected before any write") {
        REQUIRE(array.set_batch({0, 1, 2}, {10, 20}) == Error::LengthMismatch);
        REQUIRE(array.set_batch(unchecked, {0, 1, 2}, {10, 20}) == Error::LengthMismatch);

        std::vector<std::uint16_t> out;
        REQUIRE(array.get_batch({0, 1, 2}, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint16_t>{1, 2, 3});
    }

    SECTION("checked form writes nothing if any index is out of range") {
        REQUIRE(array.set_batch({0, 3}, {100, 200}) == Error::IndexOutOfRange);
        std::uint16_t value = 0;
        REQUIRE(array.get(0, value) == Error::Ok);
        REQUIRE(value == 1);
    }

    SECTION("writes apply in order and the last duplicate wins") {
        REQUIRE(array.set_batch({2, 0, 2}, {7, 8, 9}) == Error::Ok);
        std::vector<std::uint16_t> out;
        REQUIRE(array.get_batch({0, 1, 2}, out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint16_t>{8, 2, 9});
    }

    SECTION("unchecked form writes past the length") {
        REQUIRE(array.set_batch(unchecked, {3}, {55}) == Error::Ok);
        REQUIRE(array.length() == 3U);
        REQUIRE(array.get(unchecked, 3) == 55);
    }
}

TEST_CASE("push_batch and pop_batch", "[batch]") {
    SparseStore<256> store;
    UInt8Array<> array(store, "batch/stack");

    SECTION("push_batch appends in order") {
        array.push_batch({5, 6, 7});
        array.push_batch({});
        array.push_batch({8});
        REQUIRE(array.length() == 4U);
        REQUIRE(array.get(unchecked, 0) == 5);
        REQUIRE(array.get(unchecked, 3) == 8);
    }

    SECTION("pop_batch removes from the end") {
        array.push_batch({5, 6, 7, 8});
        REQUIRE(array.pop_batch(3) == Error::Ok);
        REQUIRE(array.length() == 1U);
        REQUIRE(array.get(unchecked, 0) == 5);
        REQUIRE(array.pop_batch(0) == Error::Ok);
        REQUIRE(array.length() == 1U);
    }

    SECTION("pop_batch past empty keeps the pops already made") {
        array.push_batch({1, 2});
        REQUIRE(array.pop_batch(5) == Error::EmptyArray);
        REQUIRE(array.length() == 0U);
        REQUIRE(store.resident_words() == 0);
    }
}
