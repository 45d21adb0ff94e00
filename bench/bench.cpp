/**
 * @file bench.cpp
 * @brief Throughput benchmarks for wordpack arrays.
 *
 * Measures push/get/swap/pop rates over an in-memory ArenaStore for
 * regression testing during development. Numbers depend heavily on the
 * backend; use for relative comparisons only.
 *
 * Usage:
 *   ./build/wordpack_bench          # Run with default 100000 elements
 *   ./build/wordpack_bench 1000000  # Run with custom element count
 */

#include <wordpack/wordpack.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <random>
#include <vector>

using namespace wordpack;

static constexpr std::size_t DEFAULT_ELEMENTS = 100000;
static constexpr std::size_t WORD_BITS = DEFAULT_WORD_BITS;

using Clock = std::chrono::high_resolution_clock;

static double mops(std::size_t count, Clock::time_point start, Clock::time_point end) {
    double seconds = std::chrono::duration<double>(end - start).count();
    return seconds > 0.0 ? static_cast<double>(count) / seconds / 1e6 : 0.0;
}

static bool bench_width(std::size_t bit_width, std::size_t elements) {
    using Array = PackedArray<WORD_BITS, ArenaScheme>;

    ArenaStore<WORD_BITS> store;
    std::optional<Array> array;
    Error status = Array::open(store, store.allocate(), bit_width, array);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot open %zu-bit array: %s\n", bit_width,
                     error_string(status));
        return false;
    }

    std::mt19937_64 gen(42);
    std::vector<Word<WORD_BITS>> values(elements);
    for (auto& value : values) {
        value = Word<WORD_BITS>(gen());
    }

    auto start = Clock::now();
    for (const auto& value : values) {
        array->push(value);
    }
    auto pushed = Clock::now();

    // Accumulate so the reads are not optimized away
    std::uint64_t checksum = 0;
    for (std::size_t i = 0; i < elements; ++i) {
        checksum ^= array->get(unchecked, i).to_uint64();
    }
    auto read = Clock::now();

    std::uniform_int_distribution<std::uint64_t> index_distr(0, elements - 1);
    for (std::size_t i = 0; i < elements; ++i) {
        array->swap(unchecked, index_distr(gen), index_distr(gen));
    }
    auto swapped = Clock::now();

    status = array->pop_batch(elements);
    auto popped = Clock::now();
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: pop_batch failed: %s\n", error_string(status));
        return false;
    }

    std::printf("%-4zu bits  push %7.2f  get %7.2f  swap %7.2f  pop %7.2f Mops/s  "
                "words left %zu  (checksum %016llx)\n",
                bit_width, mops(elements, start, pushed), mops(elements, pushed, read),
                mops(elements, read, swapped), mops(elements, swapped, popped),
                store.resident_words(), static_cast<unsigned long long>(checksum));
    return true;
}

int main(int argc, char* argv[]) {
    std::size_t elements = DEFAULT_ELEMENTS;
    if (argc > 1) {
        long parsed = std::atol(argv[1]);
        if (parsed <= 0) {
            std::fprintf(stderr, "Error: element count must be positive\n");
            return 1;
        }
        elements = static_cast<std::size_t>(parsed);
    }

    std::printf("wordpack benchmark (%zu elements, %zu-bit words)\n", elements, WORD_BITS);
    std::printf("==================================================\n");

    bool ok = true;
    for (std::size_t bit_width : {1, 4, 8, 13, 16, 32, 64, 100, 128, 256}) {
        ok = bench_width(bit_width, elements) && ok;
    }
    return ok ? 0 : 1;
}
