/**
 * @file typed_array.hpp
 * @brief Fixed-width array types over the generic engine.
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
 * UIntArray<Bits> fixes the element width at compile time and trades the
 * engine's Word<W> values for the smallest natural type that holds Bits
 * bits. All logic stays in PackedArray.
 */

#ifndef WORDPACK_TYPED_ARRAY_HPP
#define WORDPACK_TYPED_ARRAY_HPP

#include <optional>
#include <type_traits>
#include <vector>

#include "packed_array.hpp"

namespace wordpack {

/**
 * @brief Natural value type for a Bits-bit element.
 *
 * std::uintN_t up to 64 bits, otherwise a Word rounded up to whole limbs.
 */
template <std::size_t Bits>
using uint_value_t = std::conditional_t<
    (Bits <= 8), std::uint8_t,
    std::conditional_t<
        (Bits <= 16), std::uint16_t,
        std::conditional_t<(Bits <= 32), std::uint32_t,
                           std::conditional_t<(Bits <= 64), std::uint64_t,
                                              Word<(Bits + BITS_PER_LIMB - 1) / BITS_PER_LIMB *
                                                   BITS_PER_LIMB>>>>>;

/**
 * @brief Convert a natural value to a store word.
 */
template <std::size_t W, typename V> Word<W> to_word(const V& value) noexcept {
    if constexpr (std::is_integral_v<V>) {
        return Word<W>(static_cast<std::uint64_t>(value));
    } else {
        return value.template resized<W>();
    }
}

/**
 * @brief Convert a store word to a natural value (truncating).
 */
template <typename V, std::size_t W> V from_word(const Word<W>& word) noexcept {
    if constexpr (std::is_integral_v<V>) {
        return static_cast<V>(word.to_uint64());
    } else {
        return word.template resized<V::BITS>();
    }
}

/**
 * @brief Array of Bits-bit unsigned integers.
 *
 * @tparam Bits Element width, in [1, W]
 * @tparam W Store word width
 * @tparam Scheme Address scheme
 */
template <std::size_t Bits, std::size_t W = DEFAULT_WORD_BITS, class Scheme = HashedScheme>
class UIntArray {
public:
    static_assert(Bits >= 1 && Bits <= W, "Element width must be in [1, W]");

    using engine_type = PackedArray<W, Scheme>;
    using value_type = uint_value_t<Bits>;
    using base_type = typename engine_type::base_type;
    using store_type = typename engine_type::store_type;

    static constexpr std::size_t BIT_WIDTH = Bits;

    /**
     * @brief Open without throwing.
     *
     * @param store Backing store; must outlive the array
     * @param base Base id
     * @param[out] out Engaged with the array on success
     * @return Error::Ok or a derivation error
     */
    static Error open(store_type& store, const base_type& base,
                      std::optional<UIntArray>& out) noexcept {
        std::optional<engine_type> engine;
        Error status = engine_type::open(store, base, Bits, engine);
        if (status != Error::Ok) {
            return status;
        }
        out.emplace(UIntArray(*engine));
        return Error::Ok;
    }

#if !WORDPACK_NO_EXCEPTIONS
    /**
     * @brief Open, throwing on failure.
     *
     * @param store Backing store; must outlive the array
     * @param base Base id
     * @throws AddressDerivationException if the base id cannot be hashed
     */
    UIntArray(store_type& store, const base_type& base) : engine_(store, base, Bits) {}
#endif

    [[nodiscard]] std::uint64_t length() const {
        return engine_.length();
    }

    [[nodiscard]] bool empty() const {
        return engine_.empty();
    }

    [[nodiscard]] value_type get(unchecked_t, std::uint64_t index) const {
        return from_word<value_type>(engine_.get(unchecked, index));
    }

    Error get(std::uint64_t index, value_type& out) const {
        Word<W> word;
        Error status = engine_.get(index, word);
        if (status == Error::Ok) {
            out = from_word<value_type>(word);
        }
        return status;
    }

    void set(unchecked_t, std::uint64_t index, const value_type& value) {
        engine_.set(unchecked, index, to_word<W>(value));
    }

    Error set(std::uint64_t index, const value_type& value) {
        return engine_.set(index, to_word<W>(value));
    }

    void push(const value_type& value) {
        engine_.push(to_word<W>(value));
    }

    Error pop(value_type* popped = nullptr) {
        if (popped == nullptr) {
            return engine_.pop();
        }
        Word<W> word;
        Error status = engine_.pop(&word);
        if (status == Error::Ok) {
            *popped = from_word<value_type>(word);
        }
        return status;
    }

    void swap(unchecked_t, std::uint64_t i, std::uint64_t j) {
        engine_.swap(unchecked, i, j);
    }

    Error swap(std::uint64_t i, std::uint64_t j) {
        return engine_.swap(i, j);
    }

    void get_batch(unchecked_t, const std::vector<std::uint64_t>& indices,
                   std::vector<value_type>& out) const {
        std::vector<Word<W>> words;
        engine_.get_batch(unchecked, indices, words);
        narrow(words, out);
    }

    Error get_batch(const std::vector<std::uint64_t>& indices, std::vector<value_type>& out) const {
        std::vector<Word<W>> words;
        Error status = engine_.get_batch(indices, words);
        if (status == Error::Ok) {
            narrow(words, out);
        }
        return status;
    }

    Error set_batch(unchecked_t, const std::vector<std::uint64_t>& indices,
                    const std::vector<value_type>& values) {
        return engine_.set_batch(unchecked, indices, widen(values));
    }

    Error set_batch(const std::vector<std::uint64_t>& indices,
                    const std::vector<value_type>& values) {
        return engine_.set_batch(indices, widen(values));
    }

    void push_batch(const std::vector<value_type>& values) {
        engine_.push_batch(widen(values));
    }

    Error pop_batch(std::uint64_t count) {
        return engine_.pop_batch(count);
    }

    /**
     * @brief Underlying generic engine.
     */
    [[nodiscard]] const engine_type& engine() const noexcept {
        return engine_;
    }

private:
    explicit UIntArray(const engine_type& engine) noexcept : engine_(engine) {}

    static std::vector<Word<W>> widen(const std::vector<value_type>& values) {
        std::vector<Word<W>> words;
        words.reserve(values.size());
        for (const auto& value : values) {
            words.push_back(to_word<W>(value));
        }
        return words;
    }

    static void narrow(const std::vector<Word<W>>& words, std::vector<value_type>& out) {
        out.clear();
        out.reserve(words.size());
        for (const auto& word : words) {
            out.push_back(from_word<value_type>(word));
        }
    }

    engine_type engine_;
};

/**
 * @defgroup typed_arrays Typed Array Aliases
 * @{
 */
template <std::size_t W = DEFAULT_WORD_BITS, class Scheme = HashedScheme>
using UInt8Array = UIntArray<8, W, Scheme>;

template <std::size_t W = DEFAULT_WORD_BITS, class Scheme = HashedScheme>
using UInt16Array = UIntArray<16, W, Scheme>;

template <std::size_t W = DEFAULT_WORD_BITS, class Scheme = HashedScheme>
using UInt32Array = UIntArray<32, W, Scheme>;

template <std::size_t W = DEFAULT_WORD_BITS, class Scheme = HashedScheme>
using UInt64Array = UIntArray<64, W, Scheme>;

template <std::size_t W = DEFAULT_WORD_BITS, class Scheme = HashedScheme>
using UInt128Array = UIntArray<128, W, Scheme>;

template <std::size_t W = DEFAULT_WORD_BITS, class Scheme = HashedScheme>
using UInt256Array = UIntArray<256, W, Scheme>;
/** @} */

} // namespace wordpack

#endif // WORDPACK_TYPED_ARRAY_HPP
