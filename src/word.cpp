/**
 * @file word.cpp
 * @brief Word compilation unit.
 *
 * Word is a class template and lives in the header. The widths the library
 * itself uses are instantiated here so every member is compiled with the
 * library, not only the ones a client happens to call.
 */

#include <wordpack/word.hpp>

namespace wordpack {

template class Word<64>;
template class Word<128>;
template class Word<256>;

} // namespace wordpack
