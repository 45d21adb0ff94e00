/**
 * @file address.hpp
 * @brief Address schemes and the element address calculator.
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
 * An array is identified by a base id. An address scheme turns the base id
 * into two addresses: the word holding the array length, and the first data
 * word. Element i then lives in word data_base + i / slots_per_word.
 *
 * @par Slot Packing (MSB-first)
 * With s = W / bit_width slots per word, element i occupies slot
 * k = i mod s, whose lowest bit is at (s - 1 - k) * bit_width. Slot 0 holds
 * the most significant bits of the word that are used. When bit_width does
 * not divide W, the top W mod bit_width bits are never used.
 */

#ifndef WORDPACK_ADDRESS_HPP
#define WORDPACK_ADDRESS_HPP

#include <string>

#include "config.hpp"
#include "error.hpp"
#include "word.hpp"

namespace wordpack {

/// 256-bit hashed store address
using Slot = Word<SLOT_BITS>;

/**
 * @brief Address within an ArenaStore: region and word offset.
 */
struct ArenaAddress {
    std::uint32_t region = 0;
    std::uint64_t offset = 0;

    [[nodiscard]] bool operator==(const ArenaAddress& other) const noexcept {
        return region == other.region && offset == other.offset;
    }

    [[nodiscard]] bool operator!=(const ArenaAddress& other) const noexcept {
        return !(*this == other);
    }
};

/**
 * @brief Addresses derived from a base id.
 */
template <typename Address> struct Layout {
    Address length_address{}; ///< Word holding the element count
    Address data_base{};      ///< Word holding elements [0, slots_per_word)
};

/**
 * @brief Physical position of one element.
 */
template <typename Address> struct Location {
    Address word_address{}; ///< Word containing the element
    std::size_t bit_start = 0; ///< LSB position of the element within the word
};

/**
 * @brief Arena addressing: one region per array.
 *
 * The length lives at offset 0 of the region and data starts at offset 1.
 * Regions never overlap, so distinct base ids cannot collide.
 */
struct ArenaScheme {
    using base_type = std::uint32_t;
    using address_type = ArenaAddress;

    static Error derive(const base_type& base, Layout<address_type>& out) noexcept {
        out.length_address = ArenaAddress{base, 0};
        out.data_base = ArenaAddress{base, 1};
        return Error::Ok;
    }

    static address_type advance(const address_type& address, std::uint64_t words) noexcept {
        return ArenaAddress{address.region, address.offset + words};
    }
};

/**
 * @brief Hashed addressing over a flat 2^256 slot space.
 *
 * - length_address = SHA-256(key)
 * - data_base = SHA-256(length_address as 32 big-endian bytes)
 *
 * Data words follow data_base consecutively (mod 2^256). Collisions
 * between arrays, or with another array's length slot, require a SHA-256
 * collision.
 */
struct HashedScheme {
    using base_type = std::string;
    using address_type = Slot;

    static Error derive(const base_type& key, Layout<address_type>& out) noexcept;

    static address_type advance(const address_type& address, std::uint64_t words) noexcept {
        Slot next = address;
        next.add(words);
        return next;
    }
};

/**
 * @brief SHA-256 digest of a byte string, as a slot.
 *
 * @param bytes Input bytes
 * @param num_bytes Input length
 * @param[out] out Digest interpreted as a big-endian 256-bit integer
 * @return Error::Ok, or Error::AddressDerivation if the digest backend fails
 */
Error digest_slot(const std::uint8_t* bytes, std::size_t num_bytes, Slot& out) noexcept;

/**
 * @brief Number of elements that share one word.
 *
 * @tparam W Word width
 * @param bit_width Element width, in [1, W]
 */
template <std::size_t W> constexpr std::uint64_t slots_per_word(std::size_t bit_width) noexcept {
    return W / bit_width;
}

/**
 * @brief Check an element width against the word width.
 *
 * @tparam W Word width
 * @param bit_width Element width
 * @return Error::Ok if 1 <= bit_width <= W, otherwise Error::InvalidWidth
 */
template <std::size_t W> constexpr Error check_width(std::size_t bit_width) noexcept {
    return (bit_width >= 1 && bit_width <= W) ? Error::Ok : Error::InvalidWidth;
}

/**
 * @brief Locate an element from a precomputed data base.
 *
 * Pure arithmetic. bit_width is not validated here.
 *
 * @tparam W Word width
 * @tparam Scheme Address scheme
 * @param data_base First data word of the array
 * @param bit_width Element width, in [1, W]
 * @param index Logical element index
 * @return Word address and bit offset of the element
 */
template <std::size_t W, class Scheme>
Location<typename Scheme::address_type> locate(const typename Scheme::address_type& data_base,
                                               std::size_t bit_width,
                                               std::uint64_t index) noexcept {
    const std::uint64_t slots = slots_per_word<W>(bit_width);
    const std::uint64_t slot = index % slots;
    Location<typename Scheme::address_type> location;
    location.word_address = Scheme::advance(data_base, index / slots);
    location.bit_start = static_cast<std::size_t>((slots - 1 - slot) * bit_width);
    return location;
}

/**
 * @brief Locate an element from its array's base id.
 *
 * @tparam W Word width
 * @tparam Scheme Address scheme
 * @param base Base id of the array
 * @param bit_width Element width
 * @param index Logical element index
 * @param[out] out Word address and bit offset of the element
 * @return Error::Ok, Error::InvalidWidth, or a derivation error
 */
template <std::size_t W, class Scheme>
Error locate(const typename Scheme::base_type& base, std::size_t bit_width, std::uint64_t index,
             Location<typename Scheme::address_type>& out) noexcept {
    Error status = check_width<W>(bit_width);
    if (status != Error::Ok) {
        return status;
    }
    Layout<typename Scheme::address_type> layout;
    status = Scheme::derive(base, layout);
    if (status != Error::Ok) {
        return status;
    }
    out = locate<W, Scheme>(layout.data_base, bit_width, index);
    return Error::Ok;
}

} // namespace wordpack

#endif // WORDPACK_ADDRESS_HPP
