/**
 * @file compare.hpp
 * @brief Randomized equivalence and cost harness for typed arrays.
 *
 * Drives a UIntArray and a std::vector through the same random sequence of
 * push/set/swap/pop, records the metered cost of every executed operation,
 * and checks that both end with the same contents.
 */

#ifndef WORDPACK_COMPARE_HPP
#define WORDPACK_COMPARE_HPP

#include <random>
#include <type_traits>
#include <utility>
#include <vector>

#include "error.hpp"
#include "packed_array.hpp"
#include "word.hpp"

namespace wordpack {

/**
 * @brief Relative frequency of each operation.
 */
struct OpWeights {
    unsigned push = 1;
    unsigned pop = 1;
    unsigned set = 1;
    unsigned swap = 1;
};

/**
 * @brief Outcome of one harness run.
 */
struct CompareReport {
    std::size_t executed = 0;         ///< Operations applied to both sides
    std::size_t skipped = 0;          ///< Draws that needed a longer array
    std::int64_t total_cost = 0;      ///< Sum of per-operation costs
    std::vector<std::int64_t> costs;  ///< Cost of each executed operation
    bool equivalent = false;          ///< Contents matched after the run
    std::uint64_t first_mismatch = 0; ///< First differing index if not equivalent

    [[nodiscard]] double average_cost() const noexcept {
        return executed == 0 ? 0.0
                             : static_cast<double>(total_cost) / static_cast<double>(executed);
    }
};

/**
 * @brief Uniform random value of the given width.
 *
 * @tparam V Integral type or Word
 * @param gen Random engine
 * @param bits Value width in bits
 */
template <typename V, class Rng> V random_value(Rng& gen, std::size_t bits) {
    if constexpr (std::is_integral_v<V>) {
        std::uint64_t max = (bits >= 64) ? ~std::uint64_t(0) : ((std::uint64_t(1) << bits) - 1U);
        std::uniform_int_distribution<std::uint64_t> distr(0, max);
        return static_cast<V>(distr(gen));
    } else {
        std::uniform_int_distribution<limb_t> distr;
        V value;
        for (std::size_t i = 0; i < V::NUM_LIMBS; ++i) {
            value.data()[i] = distr(gen);
        }
        value.and_with(V::low_mask(bits));
        return value;
    }
}

/**
 * @brief Compare an array's live contents with a reference.
 *
 * @param array Array under test
 * @param reference Expected contents
 * @param[out] mismatch If non-null, receives the first differing index
 *             (or the shorter length when the lengths differ)
 * @return true if lengths and every element match
 */
template <class Array>
bool contents_equal(const Array& array, const std::vector<typename Array::value_type>& reference,
                    std::uint64_t* mismatch = nullptr) {
    std::uint64_t n = array.length();
    if (n != reference.size()) {
        if (mismatch != nullptr) {
            *mismatch = (n < reference.size()) ? n : reference.size();
        }
        return false;
    }
    for (std::uint64_t i = 0; i < n; ++i) {
        if (array.get(unchecked, i) != reference[i]) {
            if (mismatch != nullptr) {
                *mismatch = i;
            }
            return false;
        }
    }
    return true;
}

/**
 * @brief Run a random operation sequence against an array and a reference.
 *
 * Set and swap use the unchecked path with indices drawn inside the
 * current length, so their cost excludes a length read.
 *
 * @param array Array under test
 * @param[in,out] reference Reference contents, kept in lockstep
 * @param meter Anything with a cost() member reporting accumulated cost
 *        of the store behind @p array
 * @param steps Number of draws
 * @param gen Random engine
 * @param weights Operation frequencies
 * @param[out] report Run summary
 * @return Error::Ok, or the first error an operation returned
 */
template <class Array, class Meter, class Rng>
Error run_comparison(Array& array, std::vector<typename Array::value_type>& reference,
                     const Meter& meter, std::size_t steps, Rng& gen, const OpWeights& weights,
                     CompareReport& report) {
    using value_type = typename Array::value_type;
    enum Op { Push = 0, Pop = 1, Set = 2, Swap = 3 };

    report = CompareReport{};
    if (weights.push + weights.pop + weights.set + weights.swap == 0) {
        report.skipped = steps;
        report.equivalent = contents_equal(array, reference, &report.first_mismatch);
        return Error::Ok;
    }

    std::discrete_distribution<int> op_distr(
        {static_cast<double>(weights.push), static_cast<double>(weights.pop),
         static_cast<double>(weights.set), static_cast<double>(weights.swap)});

    for (std::size_t step = 0; step < steps; ++step) {
        const std::uint64_t length = reference.size();
        const int op = op_distr(gen);

        if ((op == Pop || op == Set) && length < 1) {
            ++report.skipped;
            continue;
        }
        if (op == Swap && length < 2) {
            ++report.skipped;
            continue;
        }

        std::int64_t before = meter.cost();
        switch (op) {
        case Push: {
            value_type value = random_value<value_type>(gen, Array::BIT_WIDTH);
            array.push(value);
            reference.push_back(value);
            break;
        }
        case Pop: {
            Error status = array.pop();
            if (status != Error::Ok) {
                return status;
            }
            reference.pop_back();
            break;
        }
        case Set: {
            std::uniform_int_distribution<std::uint64_t> index_distr(0, length - 1);
            std::uint64_t i = index_distr(gen);
            value_type value = random_value<value_type>(gen, Array::BIT_WIDTH);
            array.set(unchecked, i, value);
            reference[i] = value;
            break;
        }
        default: {
            std::uniform_int_distribution<std::uint64_t> index_distr(0, length - 1);
            std::uint64_t i = index_distr(gen);
            std::uint64_t j = index_distr(gen);
            array.swap(unchecked, i, j);
            std::swap(reference[i], reference[j]);
            break;
        }
        }
        std::int64_t cost = meter.cost() - before;
        report.costs.push_back(cost);
        report.total_cost += cost;
        ++report.executed;
    }

    report.equivalent = contents_equal(array, reference, &report.first_mismatch);
    return Error::Ok;
}

} // namespace wordpack

#endif // WORDPACK_COMPARE_HPP
