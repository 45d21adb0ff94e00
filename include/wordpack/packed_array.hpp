/**
 * @file packed_array.hpp
 * @brief Generic bit-packed dynamic array over a word store.
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
 * PackedArray is a handle onto an array that lives entirely in a word
 * store: the length word and the data words. The handle itself caches only
 * the derived addresses and the element width, and re-reads the length on
 * every call, so any number of handles may point at the same array.
 *
 * @par Length Convention
 * The length word is the only record of which elements are live. Slots at
 * or past the length may hold stale bits from popped elements and must not
 * be read as data.
 *
 * @par Reclamation
 * pop() zeroes a data word once the element it removes was the only one
 * left in that word. Otherwise the stale bits stay in place.
 *
 * @par Checked and Unchecked Access
 * get(), set() and swap() read the length and return
 * Error::IndexOutOfRange for indices past it. The overloads taking the
 * wordpack::unchecked tag skip that read: an index past the length accesses
 * whatever bits occupy the computed slot, and set() beyond the length
 * silently writes storage that push() will later overwrite.
 *
 * @warning Nothing here is atomic across words. Push writes a data word and
 * the length word; a host store that needs all-or-nothing semantics must
 * wrap each call (or batch) in its own transaction. One writer per array.
 */

#ifndef WORDPACK_PACKED_ARRAY_HPP
#define WORDPACK_PACKED_ARRAY_HPP

#include <optional>
#include <vector>

#include "address.hpp"
#include "config.hpp"
#include "error.hpp"
#include "store.hpp"
#include "word.hpp"

namespace wordpack {

/**
 * @brief Tag type selecting the no-bounds-check overloads.
 */
struct unchecked_t {
    explicit unchecked_t() = default;
};

/// Pass as the first argument to opt into unchecked access
inline constexpr unchecked_t unchecked{};

/**
 * @brief Bit-packed array of bit_width-bit unsigned integers.
 *
 * @tparam W Store word width in bits (at least 64, so the length word
 *           holds any 64-bit count)
 * @tparam Scheme Address scheme (ArenaScheme or HashedScheme)
 */
template <std::size_t W, class Scheme> class PackedArray {
public:
    static_assert(W >= 64, "Store words must hold a 64-bit length");

    using word_type = Word<W>;
    using value_type = Word<W>;
    using address_type = typename Scheme::address_type;
    using base_type = typename Scheme::base_type;
    using store_type = WordStore<W, address_type>;
    using layout_type = Layout<address_type>;
    using location_type = Location<address_type>;

    /**
     * @brief Open a handle without throwing.
     *
     * @param store Backing store; must outlive the handle
     * @param base Base id selecting the array's region
     * @param bit_width Element width, in [1, W]
     * @param[out] out Engaged with the handle on success
     * @return Error::Ok, Error::InvalidWidth, or a derivation error
     */
    static Error open(store_type& store, const base_type& base, std::size_t bit_width,
                      std::optional<PackedArray>& out) noexcept {
        Error status = check_width<W>(bit_width);
        if (status != Error::Ok) {
            return status;
        }
        layout_type layout;
        status = Scheme::derive(base, layout);
        if (status != Error::Ok) {
            return status;
        }
        out.emplace(PackedArray(store, layout, bit_width));
        return Error::Ok;
    }

#if !WORDPACK_NO_EXCEPTIONS
    /**
     * @brief Open a handle, throwing on failure.
     *
     * @param store Backing store; must outlive the handle
     * @param base Base id selecting the array's region
     * @param bit_width Element width, in [1, W]
     * @throws InvalidWidthException if bit_width is outside [1, W]
     * @throws AddressDerivationException if the base id cannot be hashed
     */
    PackedArray(store_type& store, const base_type& base, std::size_t bit_width)
        : store_(&store), bit_width_(bit_width) {
        throw_on_error(check_width<W>(bit_width), "PackedArray bit width " + std::to_string(bit_width));
        throw_on_error(Scheme::derive(base, layout_), "PackedArray base id");
        slots_ = wordpack::slots_per_word<W>(bit_width);
    }
#endif

    /**
     * @brief Element width in bits.
     */
    [[nodiscard]] std::size_t bit_width() const noexcept {
        return bit_width_;
    }

    /**
     * @brief Elements sharing one store word.
     */
    [[nodiscard]] std::uint64_t slots_per_word() const noexcept {
        return slots_;
    }

    /**
     * @brief Derived length and data addresses.
     */
    [[nodiscard]] const layout_type& layout() const noexcept {
        return layout_;
    }

    /**
     * @brief Physical position of an element.
     * @param index Logical index (not checked)
     */
    [[nodiscard]] location_type locate(std::uint64_t index) const noexcept {
        return wordpack::locate<W, Scheme>(layout_.data_base, bit_width_, index);
    }

    /**
     * @brief Current number of elements (one store read).
     */
    [[nodiscard]] std::uint64_t length() const {
        return store_->read_word(layout_.length_address).to_uint64();
    }

    /**
     * @brief True if the array has no elements.
     */
    [[nodiscard]] bool empty() const {
        return length() == 0;
    }

    // ========================================================================
    // Primitives
    // ========================================================================

    /**
     * @brief Read an element without bounds checking.
     *
     * @warning index >= length() returns unspecified bits.
     * @param index Logical index
     * @return Element value
     */
    [[nodiscard]] value_type get(unchecked_t, std::uint64_t index) const {
        location_type at = locate(index);
        return store_->read_word(at.word_address).extract(at.bit_start, bit_width_);
    }

    /**
     * @brief Read an element.
     *
     * @param index Logical index
     * @param[out] out Element value (untouched on error)
     * @return Error::Ok or Error::IndexOutOfRange
     */
    Error get(std::uint64_t index, value_type& out) const {
        if (index >= length()) {
            return Error::IndexOutOfRange;
        }
        out = get(unchecked, index);
        return Error::Ok;
    }

    /**
     * @brief Write an element without bounds checking.
     *
     * One read and one write of the containing word. The value is masked
     * to bit_width() bits.
     *
     * @warning index >= length() writes a slot that is not live.
     * @param index Logical index
     * @param value New value
     */
    void set(unchecked_t, std::uint64_t index, const value_type& value) {
        location_type at = locate(index);
        word_type word = store_->read_word(at.word_address);
        word.deposit(at.bit_start, bit_width_, value);
        store_->write_word(at.word_address, word);
    }

    /**
     * @brief Write an element.
     *
     * @param index Logical index
     * @param value New value (masked to bit_width() bits)
     * @return Error::Ok or Error::IndexOutOfRange
     */
    Error set(std::uint64_t index, const value_type& value) {
        if (index >= length()) {
            return Error::IndexOutOfRange;
        }
        set(unchecked, index, value);
        return Error::Ok;
    }

    /**
     * @brief Append an element.
     *
     * @param value New value (masked to bit_width() bits)
     */
    void push(const value_type& value) {
        std::uint64_t n = length();
        set(unchecked, n, value);
        write_length(n + 1);
    }

    /**
     * @brief Remove the last element.
     *
     * Zeroes the data word if the removed element was its only occupant.
     *
     * @param[out] popped If non-null, receives the removed value
     * @return Error::Ok or Error::EmptyArray
     */
    Error pop(value_type* popped = nullptr) {
        std::uint64_t n = length();
        if (n == 0) {
            return Error::EmptyArray;
        }
        std::uint64_t last = n - 1;
        location_type at = locate(last);
        if (popped != nullptr) {
            *popped = store_->read_word(at.word_address).extract(at.bit_start, bit_width_);
        }
        if (last % slots_ == 0) {
            store_->write_word(at.word_address, word_type{});
        }
        write_length(last);
        return Error::Ok;
    }

    /**
     * @brief Exchange two elements without bounds checking.
     *
     * Elements in the same word cost one read and one write; otherwise two
     * of each.
     *
     * @param i First index
     * @param j Second index
     */
    void swap(unchecked_t, std::uint64_t i, std::uint64_t j) {
        location_type a = locate(i);
        location_type b = locate(j);
        if (a.word_address == b.word_address) {
            word_type word = store_->read_word(a.word_address);
            value_type vi = word.extract(a.bit_start, bit_width_);
            value_type vj = word.extract(b.bit_start, bit_width_);
            word.deposit(a.bit_start, bit_width_, vj);
            word.deposit(b.bit_start, bit_width_, vi);
            store_->write_word(a.word_address, word);
            return;
        }
        word_type wa = store_->read_word(a.word_address);
        word_type wb = store_->read_word(b.word_address);
        value_type vi = wa.extract(a.bit_start, bit_width_);
        value_type vj = wb.extract(b.bit_start, bit_width_);
        wa.deposit(a.bit_start, bit_width_, vj);
        wb.deposit(b.bit_start, bit_width_, vi);
        store_->write_word(a.word_address, wa);
        store_->write_word(b.word_address, wb);
    }

    /**
     * @brief Exchange two elements.
     *
     * @param i First index
     * @param j Second index
     * @return Error::Ok or Error::IndexOutOfRange
     */
    Error swap(std::uint64_t i, std::uint64_t j) {
        std::uint64_t n = length();
        if (i >= n || j >= n) {
            return Error::IndexOutOfRange;
        }
        swap(unchecked, i, j);
        return Error::Ok;
    }

    // ========================================================================
    // Batch operations
    // ========================================================================

    /**
     * @brief Read several elements without bounds checking.
     *
     * @param indices Logical indices
     * @param[out] out One value per index, in order
     */
    void get_batch(unchecked_t, const std::vector<std::uint64_t>& indices,
                   std::vector<value_type>& out) const {
        out.clear();
        out.reserve(indices.size());
        for (std::uint64_t index : indices) {
            out.push_back(get(unchecked, index));
        }
    }

    /**
     * @brief Read several elements.
     *
     * All indices are checked against a single length read before any
     * element is read.
     *
     * @param indices Logical indices
     * @param[out] out One value per index (untouched on error)
     * @return Error::Ok or Error::IndexOutOfRange
     */
    Error get_batch(const std::vector<std::uint64_t>& indices, std::vector<value_type>& out) const {
        Error status = check_indices(indices);
        if (status != Error::Ok) {
            return status;
        }
        get_batch(unchecked, indices, out);
        return Error::Ok;
    }

    /**
     * @brief Write several elements without bounds checking.
     *
     * Writes happen in list order; a repeated index keeps its last value.
     *
     * @param indices Logical indices
     * @param values One value per index
     * @return Error::Ok, or Error::LengthMismatch with nothing written
     */
    Error set_batch(unchecked_t, const std::vector<std::uint64_t>& indices,
                    const std::vector<value_type>& values) {
        if (indices.size() != values.size()) {
            return Error::LengthMismatch;
        }
        for (std::size_t k = 0; k < indices.size(); ++k) {
            set(unchecked, indices[k], values[k]);
        }
        return Error::Ok;
    }

    /**
     * @brief Write several elements.
     *
     * Sizes and indices are all validated before the first write.
     *
     * @param indices Logical indices
     * @param values One value per index
     * @return Error::Ok, Error::LengthMismatch or Error::IndexOutOfRange
     */
    Error set_batch(const std::vector<std::uint64_t>& indices,
                    const std::vector<value_type>& values) {
        if (indices.size() != values.size()) {
            return Error::LengthMismatch;
        }
        Error status = check_indices(indices);
        if (status != Error::Ok) {
            return status;
        }
        return set_batch(unchecked, indices, values);
    }

    /**
     * @brief Append several elements in order.
     * @param values Values to append
     */
    void push_batch(const std::vector<value_type>& values) {
        for (const auto& value : values) {
            push(value);
        }
    }

    /**
     * @brief Remove the last @p count elements.
     *
     * Pops one at a time. If the array runs out, the pops already made
     * stay made.
     *
     * @param count Number of elements to remove
     * @return Error::Ok, or Error::EmptyArray from the first failing pop
     */
    Error pop_batch(std::uint64_t count) {
        for (std::uint64_t k = 0; k < count; ++k) {
            Error status = pop();
            if (status != Error::Ok) {
                return status;
            }
        }
        return Error::Ok;
    }

private:
    PackedArray(store_type& store, const layout_type& layout, std::size_t bit_width) noexcept
        : store_(&store), layout_(layout), bit_width_(bit_width),
          slots_(wordpack::slots_per_word<W>(bit_width)) {}

    void write_length(std::uint64_t n) {
        store_->write_word(layout_.length_address, word_type(n));
    }

    Error check_indices(const std::vector<std::uint64_t>& indices) const {
        if (indices.empty()) {
            return Error::Ok;
        }
        std::uint64_t n = length();
        for (std::uint64_t index : indices) {
            if (index >= n) {
                return Error::IndexOutOfRange;
            }
        }
        return Error::Ok;
    }

    store_type* store_;
    layout_type layout_{};
    std::size_t bit_width_;
    std::uint64_t slots_ = 1;
};

} // namespace wordpack

#endif // WORDPACK_PACKED_ARRAY_HPP
