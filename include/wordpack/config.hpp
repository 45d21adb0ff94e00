/**
 * @file config.hpp
 * @brief wordpack compile-time configuration.
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
 * Bit-packed dynamic arrays of fixed-width unsigned integers over a
 * word-addressed store.
 */

#ifndef WORDPACK_CONFIG_HPP
#define WORDPACK_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace wordpack {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Native store word width in bits (must be a multiple of 32)
#ifndef WORDPACK_WORD_BITS
#define WORDPACK_WORD_BITS 256U
#endif

inline constexpr std::size_t DEFAULT_WORD_BITS = WORDPACK_WORD_BITS;

/// 32-bit limb type for word storage
using limb_t = std::uint32_t;
inline constexpr std::size_t BITS_PER_LIMB = 32U;

/// Width of a hashed store address (SHA-256 digest)
inline constexpr std::size_t SLOT_BITS = 256U;

static_assert(DEFAULT_WORD_BITS > 0 && DEFAULT_WORD_BITS % BITS_PER_LIMB == 0,
              "WORDPACK_WORD_BITS must be a positive multiple of 32");

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define WORDPACK_NO_EXCEPTIONS=1 to drop the exception types and the
 * throwing constructors. Every operation still reports through Error codes.
 * @{
 */
#ifndef WORDPACK_NO_EXCEPTIONS
#define WORDPACK_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace wordpack

#endif // WORDPACK_CONFIG_HPP
