/**
 * @file word.hpp
 * @brief Fixed-width unsigned store word with static allocation.
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
 * A Word is the unit a word store reads and writes: a W-bit unsigned
 * integer held in 32-bit limbs. The packed array engine uses it both for
 * storage words and for element values, so element widths up to W bits are
 * representable.
 *
 * @par Bit Numbering Convention
 * - Bit 0 = LSB
 * - Bit W-1 = MSB
 *
 * @par Limb Packing (Big-Endian)
 * - Limb 0 holds bits W-1 .. W-32 (most significant)
 * - Limb NUM_LIMBS-1 holds bits 31 .. 0
 */

#ifndef WORDPACK_WORD_HPP
#define WORDPACK_WORD_HPP

#include <array>
#include <string>

#include "config.hpp"

namespace wordpack {

/**
 * @brief Fixed-width unsigned word with compile-time size.
 *
 * @tparam W Number of bits in the word (multiple of 32)
 */
template <std::size_t W> class Word {
public:
    static_assert(W > 0 && W % BITS_PER_LIMB == 0, "Word width must be a positive multiple of 32");

    /// Number of bits
    static constexpr std::size_t BITS = W;

    /// Number of 32-bit limbs
    static constexpr std::size_t NUM_LIMBS = W / BITS_PER_LIMB;

    /// Number of bytes
    static constexpr std::size_t NUM_BYTES = W / 8;

    /**
     * @brief Default constructor - initializes all bits to zero.
     */
    constexpr Word() noexcept : data_{} {}

    /**
     * @brief Construct from a 64-bit value.
     *
     * High bits that do not fit in W are dropped.
     *
     * @param value Initial value
     */
    explicit constexpr Word(std::uint64_t value) noexcept : data_{} {
        data_[NUM_LIMBS - 1] = static_cast<limb_t>(value);
        if constexpr (NUM_LIMBS > 1) {
            data_[NUM_LIMBS - 2] = static_cast<limb_t>(value >> 32);
        }
    }

    /**
     * @brief Word with the low @p width bits set.
     *
     * @param width Number of low bits to set (clamped to W)
     * @return Mask word
     */
    [[nodiscard]] static Word low_mask(std::size_t width) noexcept {
        Word mask;
        for (std::size_t i = 0; i < NUM_LIMBS; ++i) {
            std::size_t limb_lsb = (NUM_LIMBS - 1 - i) * BITS_PER_LIMB;
            if (width >= limb_lsb + BITS_PER_LIMB) {
                mask.data_[i] = ~limb_t(0);
            } else if (width > limb_lsb) {
                mask.data_[i] = (limb_t(1) << (width - limb_lsb)) - 1U;
            }
        }
        return mask;
    }

    /**
     * @brief Low 64 bits as an integer.
     * @return Value truncated to 64 bits
     */
    [[nodiscard]] constexpr std::uint64_t to_uint64() const noexcept {
        std::uint64_t value = data_[NUM_LIMBS - 1];
        if constexpr (NUM_LIMBS > 1) {
            value |= static_cast<std::uint64_t>(data_[NUM_LIMBS - 2]) << 32;
        }
        return value;
    }

    /**
     * @brief Set all bits to zero.
     */
    void zero() noexcept {
        data_.fill(0);
    }

    /**
     * @brief Check whether every bit is zero.
     * @return true if the word is zero
     */
    [[nodiscard]] bool is_zero() const noexcept {
        for (std::size_t i = 0; i < NUM_LIMBS; ++i) {
            if (data_[i] != 0) {
                return false;
            }
        }
        return true;
    }

    /**
     * @brief Compute a >> n.
     *
     * @param a Operand
     * @param n Shift amount in bits (>= W gives zero)
     */
    void shift_right_of(const Word& a, std::size_t n) noexcept {
        std::array<limb_t, NUM_LIMBS> result{};
        if (n < W) {
            std::size_t limb_shift = n / BITS_PER_LIMB;
            std::size_t bit_shift = n % BITS_PER_LIMB;
            for (std::size_t i = limb_shift; i < NUM_LIMBS; ++i) {
                std::size_t j = i - limb_shift;
                limb_t hi = a.data_[j];
                if (bit_shift == 0) {
                    result[i] = hi;
                } else {
                    limb_t carry = (j > 0) ? (a.data_[j - 1] << (BITS_PER_LIMB - bit_shift)) : 0U;
                    result[i] = (hi >> bit_shift) | carry;
                }
            }
        }
        data_ = result;
    }

    /**
     * @brief Compute a << n.
     *
     * Bits shifted past the MSB are dropped.
     *
     * @param a Operand
     * @param n Shift amount in bits (>= W gives zero)
     */
    void shift_left_of(const Word& a, std::size_t n) noexcept {
        std::array<limb_t, NUM_LIMBS> result{};
        if (n < W) {
            std::size_t limb_shift = n / BITS_PER_LIMB;
            std::size_t bit_shift = n % BITS_PER_LIMB;
            for (std::size_t i = 0; i + limb_shift < NUM_LIMBS; ++i) {
                std::size_t j = i + limb_shift;
                limb_t lo = a.data_[j];
                if (bit_shift == 0) {
                    result[i] = lo;
                } else {
                    limb_t carry =
                        (j + 1 < NUM_LIMBS) ? (a.data_[j + 1] >> (BITS_PER_LIMB - bit_shift)) : 0U;
                    result[i] = (lo << bit_shift) | carry;
                }
            }
        }
        data_ = result;
    }

    /**
     * @brief Right shift in-place.
     * @param n Shift amount in bits
     */
    void shift_right(std::size_t n) noexcept {
        shift_right_of(*this, n);
    }

    /**
     * @brief Left shift in-place.
     * @param n Shift amount in bits
     */
    void shift_left(std::size_t n) noexcept {
        shift_left_of(*this, n);
    }

    /**
     * @brief AND in-place with another word.
     * @param other Operand
     */
    void and_with(const Word& other) noexcept {
        for (std::size_t i = 0; i < NUM_LIMBS; ++i) {
            data_[i] &= other.data_[i];
        }
    }

    /**
     * @brief OR in-place with another word.
     * @param other Operand
     */
    void or_with(const Word& other) noexcept {
        for (std::size_t i = 0; i < NUM_LIMBS; ++i) {
            data_[i] |= other.data_[i];
        }
    }

    /**
     * @brief Invert all bits in-place.
     */
    void invert() noexcept {
        for (std::size_t i = 0; i < NUM_LIMBS; ++i) {
            data_[i] = ~data_[i];
        }
    }

    /**
     * @brief Read a bit field.
     *
     * @param lsb Position of the field's least significant bit
     * @param width Field width in bits
     * @return Field value, right-justified
     */
    [[nodiscard]] Word extract(std::size_t lsb, std::size_t width) const noexcept {
        Word field;
        field.shift_right_of(*this, lsb);
        field.and_with(low_mask(width));
        return field;
    }

    /**
     * @brief Overwrite a bit field, leaving the other bits unchanged.
     *
     * @p value is masked to @p width bits first, so oversized values are
     * silently truncated.
     *
     * @param lsb Position of the field's least significant bit
     * @param width Field width in bits
     * @param value New field value (right-justified)
     */
    void deposit(std::size_t lsb, std::size_t width, const Word& value) noexcept {
        Word window = low_mask(width);
        Word field = value;
        field.and_with(window);
        field.shift_left(lsb);
        window.shift_left(lsb);
        window.invert();
        and_with(window);
        or_with(field);
    }

    /**
     * @brief Add a 64-bit value in-place, modulo 2^W.
     * @param value Addend
     */
    void add(std::uint64_t value) noexcept {
        std::uint64_t carry = value;
        for (std::size_t i = NUM_LIMBS; i-- > 0 && carry != 0;) {
            std::uint64_t sum = static_cast<std::uint64_t>(data_[i]) + (carry & 0xFFFFFFFFULL);
            data_[i] = static_cast<limb_t>(sum);
            carry = (carry >> 32) + (sum >> 32);
        }
    }

    /**
     * @brief Convert to a word of a different width.
     *
     * Keeps the low min(W, M) bits and zero-extends.
     *
     * @tparam M Target width
     * @return Converted word
     */
    template <std::size_t M> [[nodiscard]] Word<M> resized() const noexcept {
        Word<M> result;
        constexpr std::size_t common = (NUM_LIMBS < Word<M>::NUM_LIMBS) ? NUM_LIMBS : Word<M>::NUM_LIMBS;
        for (std::size_t k = 0; k < common; ++k) {
            result.data()[Word<M>::NUM_LIMBS - 1 - k] = data_[NUM_LIMBS - 1 - k];
        }
        return result;
    }

    /**
     * @brief Compare for equality.
     * @param other Other word
     * @return true if equal
     */
    [[nodiscard]] bool operator==(const Word& other) const noexcept {
        return data_ == other.data_;
    }

    /**
     * @brief Compare for inequality.
     * @param other Other word
     * @return true if not equal
     */
    [[nodiscard]] bool operator!=(const Word& other) const noexcept {
        return data_ != other.data_;
    }

    /**
     * @brief Load from byte array (big-endian, right-aligned).
     *
     * The last byte becomes the least significant. At most NUM_BYTES are
     * read; extra leading bytes are ignored.
     *
     * @param bytes Source byte array
     * @param num_bytes Number of bytes to load
     */
    void from_bytes(const std::uint8_t* bytes, std::size_t num_bytes) noexcept {
        zero();
        std::size_t skip = (num_bytes > NUM_BYTES) ? num_bytes - NUM_BYTES : 0;
        for (std::size_t i = skip; i < num_bytes; ++i) {
            std::size_t from_lsb = num_bytes - 1 - i;
            std::size_t limb = NUM_LIMBS - 1 - from_lsb / 4;
            data_[limb] |= static_cast<limb_t>(bytes[i]) << ((from_lsb % 4) * 8);
        }
    }

    /**
     * @brief Store to byte array (big-endian, NUM_BYTES bytes).
     *
     * @param bytes Destination array of at least NUM_BYTES bytes
     */
    void to_bytes(std::uint8_t* bytes) const noexcept {
        for (std::size_t i = 0; i < NUM_LIMBS; ++i) {
            limb_t limb = data_[i];
            for (std::size_t j = 0; j < 4; ++j) {
                bytes[i * 4 + j] = static_cast<std::uint8_t>(limb >> ((3 - j) * 8));
            }
        }
    }

    /**
     * @brief Format as fixed-width hexadecimal.
     * @return "0x" followed by 2 * NUM_BYTES lowercase digits
     */
    [[nodiscard]] std::string to_hex() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out = "0x";
        out.reserve(2 + NUM_LIMBS * 8);
        for (std::size_t i = 0; i < NUM_LIMBS; ++i) {
            for (int shift = 28; shift >= 0; shift -= 4) {
                out.push_back(digits[(data_[i] >> shift) & 0xFU]);
            }
        }
        return out;
    }

    /**
     * @brief Get raw limb pointer (for advanced use).
     * @return Pointer to limb array, most significant first
     */
    [[nodiscard]] limb_t* data() noexcept {
        return data_.data();
    }

    /**
     * @brief Get raw limb pointer (const version).
     * @return Pointer to limb array, most significant first
     */
    [[nodiscard]] const limb_t* data() const noexcept {
        return data_.data();
    }

private:
    std::array<limb_t, NUM_LIMBS> data_;
};

/**
 * @brief Hash functor so words can key unordered containers.
 */
struct WordHash {
    template <std::size_t W> std::size_t operator()(const Word<W>& word) const noexcept {
        // FNV-1a over the limbs
        std::uint64_t h = 0xcbf29ce484222325ULL;
        for (std::size_t i = 0; i < Word<W>::NUM_LIMBS; ++i) {
            h ^= word.data()[i];
            h *= 0x100000001b3ULL;
        }
        return static_cast<std::size_t>(h);
    }
};

} // namespace wordpack

#endif // WORDPACK_WORD_HPP
