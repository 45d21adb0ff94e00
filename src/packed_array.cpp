/**
 * @file packed_array.cpp
 * @brief PackedArray and store compilation unit.
 *
 * Explicit instantiations for the default word width with both address
 * schemes. Other widths are instantiated on use from the headers.
 */

#include <wordpack/metered_store.hpp>
#include <wordpack/packed_array.hpp>
#include <wordpack/store.hpp>

namespace wordpack {

template class ArenaStore<DEFAULT_WORD_BITS>;
template class SparseStore<DEFAULT_WORD_BITS>;
template class MeteredStore<DEFAULT_WORD_BITS, ArenaAddress>;
template class MeteredStore<DEFAULT_WORD_BITS, Slot>;

template class PackedArray<DEFAULT_WORD_BITS, ArenaScheme>;
template class PackedArray<DEFAULT_WORD_BITS, HashedScheme>;

} // namespace wordpack
