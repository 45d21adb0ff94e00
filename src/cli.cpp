/**
 * @file cli.cpp
 * @brief wordpack command line interface.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Runs the randomized comparison harness for the typed array family and
 * prints where an element of a hashed array lives.
 */

#include <wordpack/wordpack.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace wordpack;

static constexpr std::size_t DEFAULT_STEPS = 100;

static void print_version() {
    std::printf("wordpack %s (word width %zu bits)\n", version(), DEFAULT_WORD_BITS);
}

static void print_help(const char* prog_name) {
    std::printf("\nwordpack %s: bit-packed arrays over a word store\n", version());
    std::printf("=================================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s compare [steps] [seed]\n", prog_name);
    std::printf("  %s locate <key> <bits> <index>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("compare:\n");
    std::printf("  Drives uint8/16/32/64/128 arrays and a reference vector through\n");
    std::printf("  the same random push/set/swap/pop sequence and reports the\n");
    std::printf("  average metered cost per operation.\n");
    std::printf("  steps          Random draws per run (default %zu)\n", DEFAULT_STEPS);
    std::printf("  seed           Random seed (default: random device)\n\n");
    std::printf("locate:\n");
    std::printf("  key            Array key (hashed to its length slot)\n");
    std::printf("  bits           Element width, 1-%zu\n", DEFAULT_WORD_BITS);
    std::printf("  index          Element index\n\n");
    std::printf("Examples:\n");
    std::printf("  %s compare 1000 7\n", prog_name);
    std::printf("  %s locate prices 16 99\n\n", prog_name);
}

static bool parse_u64(const char* text, std::uint64_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    char* end = nullptr;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<std::uint64_t>(value);
    return true;
}

template <std::size_t Bits>
static bool compare_width(SparseStore<DEFAULT_WORD_BITS>& backend, const char* scenario,
                          const OpWeights& weights, std::size_t steps, std::uint64_t seed) {
    using Array = UIntArray<Bits>;

    backend.clear();
    MeteredStore<DEFAULT_WORD_BITS, Slot> metered(backend);

    std::optional<Array> list;
    std::string key = std::string("compare/") + scenario + "/uint" + std::to_string(Bits);
    Error status = Array::open(metered, key, list);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: Cannot open %s: %s\n", key.c_str(), error_string(status));
        return false;
    }

    std::vector<typename Array::value_type> reference;
    std::mt19937_64 gen(seed);
    CompareReport report;
    status = run_comparison(*list, reference, metered, steps, gen, weights, report);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: %s failed: %s\n", key.c_str(), error_string(status));
        return false;
    }

    std::printf("%-6s uint%-4zu ops=%-6zu skipped=%-6zu length=%-6zu words=%-6zu avg_cost=%10.1f  %s\n",
                scenario, Bits, report.executed, report.skipped, reference.size(),
                backend.resident_words(), report.average_cost(),
                report.equivalent ? "OK" : "MISMATCH");
    if (!report.equivalent) {
        std::fprintf(stderr, "Error: %s differs from reference at index %llu\n", key.c_str(),
                     static_cast<unsigned long long>(report.first_mismatch));
    }
    return report.equivalent;
}

static int do_compare(std::size_t steps, std::uint64_t seed) {
    SparseStore<DEFAULT_WORD_BITS> backend;

    struct Scenario {
        const char* name;
        OpWeights weights;
    };
    const Scenario scenarios[] = {{"push", OpWeights{1, 0, 0, 0}}, {"mixed", OpWeights{}}};

    bool ok = true;
    for (const Scenario& s : scenarios) {
        ok = compare_width<8>(backend, s.name, s.weights, steps, seed) && ok;
        ok = compare_width<16>(backend, s.name, s.weights, steps, seed) && ok;
        ok = compare_width<32>(backend, s.name, s.weights, steps, seed) && ok;
        ok = compare_width<64>(backend, s.name, s.weights, steps, seed) && ok;
        ok = compare_width<128>(backend, s.name, s.weights, steps, seed) && ok;
    }

    std::printf("Seed:        %llu\n", static_cast<unsigned long long>(seed));
    return ok ? 0 : 1;
}

static int do_locate(const std::string& key, std::size_t bits, std::uint64_t index) {
    Location<Slot> location;
    Error status = locate<DEFAULT_WORD_BITS, HashedScheme>(key, bits, index, location);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(status));
        return 1;
    }

    Layout<Slot> layout;
    status = HashedScheme::derive(key, layout);
    if (status != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(status));
        return 1;
    }

    std::printf("Key:         %s\n", key.c_str());
    std::printf("Length slot: %s\n", layout.length_address.to_hex().c_str());
    std::printf("Data base:   %s\n", layout.data_base.to_hex().c_str());
    std::printf("Word slot:   %s\n", location.word_address.to_hex().c_str());
    std::printf("Bit offset:  %zu\n", location.bit_start);
    std::printf("Slots/word:  %llu\n",
                static_cast<unsigned long long>(slots_per_word<DEFAULT_WORD_BITS>(bits)));
    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "compare") == 0) {
        if (argc > 4) {
            std::fprintf(stderr, "Error: compare takes at most 2 arguments\n");
            std::fprintf(stderr, "Usage: %s compare [steps] [seed]\n", argv[0]);
            return 1;
        }

        std::uint64_t steps = DEFAULT_STEPS;
        if (argc > 2 && !parse_u64(argv[2], steps)) {
            std::fprintf(stderr, "Error: steps must be a non-negative integer\n");
            return 1;
        }

        std::uint64_t seed = std::random_device{}();
        if (argc > 3 && !parse_u64(argv[3], seed)) {
            std::fprintf(stderr, "Error: seed must be a non-negative integer\n");
            return 1;
        }

        return do_compare(static_cast<std::size_t>(steps), seed);
    }

    if (std::strcmp(argv[1], "locate") == 0) {
        if (argc != 5) {
            std::fprintf(stderr, "Error: locate requires 3 arguments\n");
            std::fprintf(stderr, "Usage: %s locate <key> <bits> <index>\n", argv[0]);
            return 1;
        }

        std::uint64_t bits = 0;
        std::uint64_t index = 0;
        if (!parse_u64(argv[3], bits) || bits == 0 || bits > DEFAULT_WORD_BITS) {
            std::fprintf(stderr, "Error: bits must be 1-%zu\n", DEFAULT_WORD_BITS);
            return 1;
        }
        if (!parse_u64(argv[4], index)) {
            std::fprintf(stderr, "Error: index must be a non-negative integer\n");
            return 1;
        }

        return do_locate(argv[2], static_cast<std::size_t>(bits), index);
    }

    std::fprintf(stderr, "Error: Unknown command: %s\n", argv[1]);
    print_help(argv[0]);
    return 1;
}
