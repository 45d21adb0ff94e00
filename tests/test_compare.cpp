/**
 * @file test_compare.cpp
 * @brief Tests for the randomized reference comparison harness.
 */

#include <catch2/catch.hpp>
#include <wordpack/compare.hpp>
#include <wordpack/metered_store.hpp>
#include <wordpack/typed_array.hpp>

#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

using namespace wordpack;

TEST_CASE("run_comparison keeps array and reference in lockstep", "[compare]") {
    SparseStore<256> backend;
    MeteredStore<256, Slot> store(backend);
    UInt16Array<> array(store, "compare/u16");
    std::vector<std::uint16_t> reference;
    std::mt19937_64 gen(1234);

    CompareReport report;
    REQUIRE(run_comparison(array, reference, store, 500, gen, OpWeights{}, report) == Error::Ok);

    REQUIRE(report.equivalent);
    REQUIRE(report.executed + report.skipped == 500);
    REQUIRE(report.costs.size() == report.executed);
    REQUIRE(std::accumulate(report.costs.begin(), report.costs.end(), std::int64_t(0)) ==
            report.total_cost);
    REQUIRE(report.total_cost <= store.cost());
    REQUIRE(array.length() == reference.size());
}

TEST_CASE("run_comparison push-only scenario", "[compare]") {
    SparseStore<256> backend;
    MeteredStore<256, Slot> store(backend);
    UInt32Array<> array(store, "compare/push");
    std::vector<std::uint32_t> reference;
    std::mt19937_64 gen(7);

    CompareReport report;
    REQUIRE(run_comparison(array, reference, store, 64, gen, OpWeights{1, 0, 0, 0}, report) ==
            Error::Ok);

    REQUIRE(report.equivalent);
    REQUIRE(report.executed == 64);
    REQUIRE(report.skipped == 0);
    REQUIRE(reference.size() == 64);
    // Every push pays for two reads and two writes
    for (std::int64_t cost : report.costs) {
        REQUIRE(cost >= 2 * store.schedule().read + 2 * store.schedule().write_noop);
    }
    REQUIRE(report.average_cost() > 0.0);
}

TEST_CASE("run_comparison skips draws that need elements", "[compare]") {
    SparseStore<256> backend;
    MeteredStore<256, Slot> store(backend);
    UInt8Array<> array(store, "compare/skip");
    std::vector<std::uint8_t> reference;
    std::mt19937_64 gen(99);

    SECTION("pop and set on an empty array") {
        CompareReport report;
        REQUIRE(run_comparison(array, reference, store, 20, gen, OpWeights{0, 1, 1, 0}, report) ==
                Error::Ok);
        REQUIRE(report.skipped == 20);
        REQUIRE(report.executed == 0);
        REQUIRE(report.average_cost() == 0.0);
        REQUIRE(report.equivalent);
    }

    SECTION("swap needs two elements") {
        array.push(5);
        reference.push_back(5);
        CompareReport report;
        REQUIRE(run_comparison(array, reference, store, 10, gen, OpWeights{0, 0, 0, 1}, report) ==
                Error::Ok);
        REQUIRE(report.skipped == 10);
    }

    SECTION("all-zero weights") {
        CompareReport report;
        REQUIRE(run_comparison(array, reference, store, 15, gen, OpWeights{0, 0, 0, 0}, report) ==
                Error::Ok);
        REQUIRE(report.skipped == 15);
        REQUIRE(report.costs.empty());
    }
}

TEST_CASE("run_comparison over wide values", "[compare]") {
    SparseStore<256> backend;
    MeteredStore<256, Slot> store(backend);
    UInt128Array<> array(store, "compare/u128");
    std::vector<Word<128>> reference;
    std::mt19937_64 gen(5);

    CompareReport report;
    REQUIRE(run_comparison(array, reference, store, 300, gen, OpWeights{3, 1, 1, 1}, report) ==
            Error::Ok);
    REQUIRE(report.equivalent);
}

TEST_CASE("contents_equal", "[compare]") {
    SparseStore<256> store;
    UInt16Array<> array(store, "compare/equal");
    std::vector<std::uint16_t> reference{1, 2, 3};
    array.push_batch(reference);

    std::uint64_t mismatch = 0;
    REQUIRE(contents_equal(array, reference, &mismatch));

    SECTION("differing element") {
        array.set(unchecked, 1, 9);
        REQUIRE_FALSE(contents_equal(array, reference, &mismatch));
        REQUIRE(mismatch == 1U);
    }

    SECTION("differing length") {
        REQUIRE(array.pop() == Error::Ok);
        REQUIRE_FALSE(contents_equal(array, reference, &mismatch));
        REQUIRE(mismatch == 2U);
    }
}

TEST_CASE("random_value respects the width", "[compare]") {
    std::mt19937_64 gen(3);

    for (int i = 0; i < 200; ++i) {
        REQUIRE(random_value<std::uint8_t>(gen, 5) < 32);
        Word<128> wide = random_value<Word<128>>(gen, 100);
        REQUIRE(wide.extract(100, 28).is_zero());
    }
}
