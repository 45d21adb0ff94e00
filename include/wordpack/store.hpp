/**
 * @file store.hpp
 * @brief Word store interface and in-memory backends.
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
 * A word store maps addresses to W-bit words. Every address that was never
 * written reads as zero, and writing zero is how a word is given back: both
 * backends here drop zero words from memory.
 *
 * Stores are not synchronized. Callers that share one across threads must
 * serialize writes themselves.
 */

#ifndef WORDPACK_STORE_HPP
#define WORDPACK_STORE_HPP

#include <unordered_map>
#include <vector>

#include "address.hpp"
#include "config.hpp"
#include "word.hpp"

namespace wordpack {

/**
 * @brief Abstract word-addressed store.
 *
 * @tparam W Word width in bits
 * @tparam Address Address type
 */
template <std::size_t W, typename Address> class WordStore {
public:
    using word_type = Word<W>;
    using address_type = Address;

    virtual ~WordStore() = default;

    /**
     * @brief Read one word.
     * @param address Word address
     * @return Stored word, or zero if never written
     */
    virtual word_type read_word(const address_type& address) const = 0;

    /**
     * @brief Write one word.
     * @param address Word address
     * @param word New contents
     */
    virtual void write_word(const address_type& address, const word_type& word) = 0;
};

/**
 * @brief In-memory store of contiguous regions, addressed by ArenaScheme.
 *
 * Each region is a growable vector of words. Writing a zero word at the
 * end of a region trims trailing zero words.
 *
 * @tparam W Word width in bits
 */
template <std::size_t W> class ArenaStore : public WordStore<W, ArenaAddress> {
public:
    using word_type = Word<W>;
    using base_type = ArenaScheme::base_type;

    /**
     * @brief Reserve a fresh, empty region.
     * @return Base id for ArenaScheme
     */
    base_type allocate() {
        regions_.emplace_back();
        return static_cast<base_type>(regions_.size() - 1);
    }

    word_type read_word(const ArenaAddress& address) const override {
        if (address.region >= regions_.size()) {
            return word_type{};
        }
        const auto& region = regions_[address.region];
        if (address.offset >= region.size()) {
            return word_type{};
        }
        return region[address.offset];
    }

    void write_word(const ArenaAddress& address, const word_type& word) override {
        if (word.is_zero()) {
            if (address.region >= regions_.size()) {
                return;
            }
            auto& region = regions_[address.region];
            if (address.offset >= region.size()) {
                return;
            }
            region[address.offset] = word;
            while (!region.empty() && region.back().is_zero()) {
                region.pop_back();
            }
            return;
        }

        if (address.region >= regions_.size()) {
            regions_.resize(static_cast<std::size_t>(address.region) + 1);
        }
        auto& region = regions_[address.region];
        if (address.offset >= region.size()) {
            region.resize(static_cast<std::size_t>(address.offset) + 1);
        }
        region[address.offset] = word;
    }

    /**
     * @brief Number of regions handed out or written.
     */
    [[nodiscard]] std::size_t region_count() const noexcept {
        return regions_.size();
    }

    /**
     * @brief Number of words currently held in memory.
     */
    [[nodiscard]] std::size_t resident_words() const noexcept {
        std::size_t total = 0;
        for (const auto& region : regions_) {
            total += region.size();
        }
        return total;
    }

private:
    std::vector<std::vector<word_type>> regions_;
};

/**
 * @brief In-memory sparse store over 256-bit slots, addressed by HashedScheme.
 *
 * Only non-zero words occupy memory.
 *
 * @tparam W Word width in bits
 */
template <std::size_t W> class SparseStore : public WordStore<W, Slot> {
public:
    using word_type = Word<W>;

    word_type read_word(const Slot& address) const override {
        auto it = slots_.find(address);
        return (it == slots_.end()) ? word_type{} : it->second;
    }

    void write_word(const Slot& address, const word_type& word) override {
        if (word.is_zero()) {
            slots_.erase(address);
        } else {
            slots_[address] = word;
        }
    }

    /**
     * @brief Number of non-zero slots.
     */
    [[nodiscard]] std::size_t resident_words() const noexcept {
        return slots_.size();
    }

    /**
     * @brief Drop every slot.
     */
    void clear() noexcept {
        slots_.clear();
    }

private:
    std::unordered_map<Slot, word_type, WordHash> slots_;
};

} // namespace wordpack

#endif // WORDPACK_STORE_HPP
