/**
 * @file metered_store.hpp
 * @brief Store decorator that counts word accesses and prices them.
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
 * Persistent word stores typically charge per access, more for turning a
 * zero word into a non-zero one, and hand back credit when a word is zeroed
 * again. MeteredStore replays that pricing over any backend so the cost of
 * an access pattern can be measured.
 *
 * @par Write Classification
 * Each write is compared with the word it replaces:
 * - noop:   new == old
 * - fresh:  old == 0, new != 0
 * - clear:  old != 0, new == 0
 * - update: any other change
 *
 * Classification reads the old word from the backend directly; that read is
 * not counted.
 */

#ifndef WORDPACK_METERED_STORE_HPP
#define WORDPACK_METERED_STORE_HPP

#include "store.hpp"

namespace wordpack {

/**
 * @brief Price list for word accesses.
 */
struct CostSchedule {
    std::int64_t read = 800;           ///< Any read
    std::int64_t write_noop = 800;     ///< Write of an unchanged word
    std::int64_t write_fresh = 20000;  ///< Zero to non-zero
    std::int64_t write_update = 5000;  ///< Non-zero to different non-zero, or to zero
    std::int64_t clear_refund = 15000; ///< Credited back when a word becomes zero
};

/**
 * @brief Access counters.
 */
struct Meter {
    std::uint64_t reads = 0;
    std::uint64_t noops = 0;
    std::uint64_t fresh = 0;
    std::uint64_t updates = 0;
    std::uint64_t clears = 0;

    /**
     * @brief Total writes of any class.
     */
    [[nodiscard]] std::uint64_t writes() const noexcept {
        return noops + fresh + updates + clears;
    }

    /**
     * @brief Net cost of the counted accesses.
     *
     * Clears are charged as updates and then refunded.
     *
     * @param schedule Price list
     * @return Signed total; negative if refunds dominate
     */
    [[nodiscard]] std::int64_t cost(const CostSchedule& schedule) const noexcept {
        auto n = [](std::uint64_t count) { return static_cast<std::int64_t>(count); };
        return n(reads) * schedule.read + n(noops) * schedule.write_noop +
               n(fresh) * schedule.write_fresh + n(updates) * schedule.write_update +
               n(clears) * (schedule.write_update - schedule.clear_refund);
    }
};

/**
 * @brief Counting wrapper around another word store.
 *
 * @tparam W Word width in bits
 * @tparam Address Address type
 */
template <std::size_t W, typename Address> class MeteredStore : public WordStore<W, Address> {
public:
    using word_type = Word<W>;
    using inner_type = WordStore<W, Address>;

    /**
     * @brief Wrap a backend.
     *
     * @param inner Backend; must outlive this wrapper
     * @param schedule Price list
     */
    explicit MeteredStore(inner_type& inner, const CostSchedule& schedule = CostSchedule{}) noexcept
        : inner_(&inner), schedule_(schedule) {}

    word_type read_word(const Address& address) const override {
        ++meter_.reads;
        return inner_->read_word(address);
    }

    void write_word(const Address& address, const word_type& word) override {
        word_type previous = inner_->read_word(address);
        if (previous == word) {
            ++meter_.noops;
        } else if (previous.is_zero()) {
            ++meter_.fresh;
        } else if (word.is_zero()) {
            ++meter_.clears;
        } else {
            ++meter_.updates;
        }
        inner_->write_word(address, word);
    }

    /**
     * @brief Counters accumulated since construction or the last reset().
     */
    [[nodiscard]] const Meter& meter() const noexcept {
        return meter_;
    }

    /**
     * @brief Net cost accumulated since construction or the last reset().
     */
    [[nodiscard]] std::int64_t cost() const noexcept {
        return meter_.cost(schedule_);
    }

    [[nodiscard]] const CostSchedule& schedule() const noexcept {
        return schedule_;
    }

    /**
     * @brief Zero all counters.
     */
    void reset() noexcept {
        meter_ = Meter{};
    }

private:
    inner_type* inner_;
    CostSchedule schedule_;
    mutable Meter meter_;
};

} // namespace wordpack

#endif // WORDPACK_METERED_STORE_HPP
