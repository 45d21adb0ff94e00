/**
 * @file wordpack.hpp
 * @brief Umbrella header for the wordpack library.
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
 * @par Typical Use
 * @code
 * wordpack::SparseStore<256> store;
 * wordpack::UInt16Array<> list(store, "prices");
 * list.push(42);
 * std::uint16_t v = list.get(wordpack::unchecked, 0);
 * @endcode
 */

#ifndef WORDPACK_HPP
#define WORDPACK_HPP

#include "address.hpp"
#include "compare.hpp"
#include "config.hpp"
#include "error.hpp"
#include "metered_store.hpp"
#include "packed_array.hpp"
#include "store.hpp"
#include "typed_array.hpp"
#include "word.hpp"

namespace wordpack {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace wordpack

#endif // WORDPACK_HPP
