/**
 * @file jagged_row_index.hpp
 * @brief Defines jagged::RowIndex, the row-start offset table used by
 * jagged::Grid. Small tables live inline, larger ones spill to the heap.
 *
 * @version 1.0
 * @date 2025-10-19
 * @copyright Copyright (C) 2025 Lloyal AI - MIT License
 */

#pragma once

#include <algorithm> // For std::copy_n, std::equal, std::max
#include <array>
#include <cassert>
#include <cstddef>
#include <iterator>  // For std::distance
#include <memory>    // For std::allocator, std::allocator_traits
#include <stdexcept> // For std::out_of_range
#include <type_traits>
#include <utility>   // For std::swap, std::move
#include <variant>   // For std::variant, std::get_if, std::holds_alternative
#include <vector>    // For std::vector (heap storage backend)

// [[no_unique_address]] requires C++20
#if __cplusplus >= 202002L
#define JAGGED_NO_UNIQUE_ADDRESS [[no_unique_address]]
#else
#define JAGGED_NO_UNIQUE_ADDRESS
#endif


namespace jagged {

/**
 * @brief Ordered table of row-start offsets into a flat element buffer.
 *
 * Entry `i` is the index in the flat buffer where row `i` begins. The table
 * stores up to `N` offsets inline and moves to a `std::vector<std::size_t,
 * Alloc>` once it grows beyond that, so grids with a handful of rows never
 * allocate for their index.
 *
 * The table does not enforce ordering itself. Its owner keeps the entries
 * non-decreasing and uses shift_after() for every structural edit, which is
 * the single place where a change in one row's length is cascaded to all
 * rows behind it.
 *
 * @tparam N Number of offsets stored inline. Must be greater than 0.
 * @tparam Alloc Allocator for the heap representation. Its value_type must be
 * `std::size_t`.
 *
 * @note Iterator Invalidation: all pointers and iterators are invalidated when
 * the table transitions between inline and heap storage (push_back past `N`,
 * reserve(), shrink_to_fit()).
 */
template<std::size_t N, typename Alloc = std::allocator<std::size_t>>
class RowIndex {
public:
    // --- Compile-Time Constraints ---
    static_assert(N > 0, "RowIndex requires an inline capacity N > 0");
    static_assert(std::is_same_v<typename std::allocator_traits<Alloc>::value_type, std::size_t>,
                  "RowIndex requires an allocator of std::size_t");

    // --- Public Member Types ---
    using value_type = std::size_t;
    using allocator_type = Alloc;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference = value_type&;
    using const_reference = const value_type&;
    using pointer = value_type*;
    using const_pointer = const value_type*;
    using iterator = value_type*;
    using const_iterator = const value_type*;

    /** @brief The number of offsets that can be stored without heap allocation. */
    static constexpr size_type inline_capacity = N;

private:
    using AllocTraits = std::allocator_traits<Alloc>;
    using HeapVec = std::vector<value_type, Alloc>;

    // Offsets are trivially copyable, so the inline buffer is a plain array
    // plus a fill count. Moving between representations cannot throw, and
    // the variant never becomes valueless.
    struct InlineBuf {
        std::array<value_type, N> buf{};
        size_type size = 0;

        pointer ptr() noexcept { return buf.data(); }
        const_pointer ptr() const noexcept { return buf.data(); }
    };

    using Storage = std::variant<InlineBuf, HeapVec>;
    Storage storage_;
    JAGGED_NO_UNIQUE_ADDRESS allocator_type alloc_;

    /** @brief Grows a full inline buffer to the heap, using the same growth rule as push_back. */
    HeapVec spill_(const InlineBuf& buf, size_type min_cap) {
        const size_type old_size = buf.size;
        const size_type new_cap = std::max<size_type>({N * 2, old_size + (old_size >> 1) + 1, min_cap});
        HeapVec vec(alloc_);
        vec.reserve(new_cap);
        vec.assign(buf.ptr(), buf.ptr() + old_size);
        return vec;
    }

public:
    // ========================================================================
    // Constructors and Assignment
    // ========================================================================

    /** @brief Constructs an empty table using the specified allocator. */
    explicit RowIndex(const Alloc& alloc = Alloc{}) noexcept
        : storage_(std::in_place_type<InlineBuf>), alloc_(alloc) {}

    /** @brief Copy constructor. Selects the allocator according to allocator traits. */
    RowIndex(const RowIndex& other)
        : storage_(std::in_place_type<InlineBuf>),
          alloc_(AllocTraits::select_on_container_copy_construction(other.alloc_))
    {
        const size_type n = other.size();
        if (n <= N) {
            auto& buf = std::get<InlineBuf>(storage_);
            std::copy_n(other.data(), n, buf.ptr());
            buf.size = n;
        } else {
            storage_ = HeapVec(other.begin(), other.end(), alloc_);
        }
    }

    /** @brief Move constructor. The source is left empty and inline. */
    RowIndex(RowIndex&& other) noexcept
        : storage_(std::move(other.storage_)), alloc_(std::move(other.alloc_))
    {
        other.storage_.template emplace<InlineBuf>();
    }

    /** @brief Copy assignment. Propagates the allocator if the traits ask for it. */
    RowIndex& operator=(const RowIndex& other) {
        if (this == &other) return *this;
        if constexpr (AllocTraits::propagate_on_container_copy_assignment::value) {
            alloc_ = other.alloc_;
        }
        const size_type n = other.size();
        if (n <= N) {
            InlineBuf buf;
            std::copy_n(other.data(), n, buf.ptr());
            buf.size = n;
            storage_ = buf;
        } else {
            storage_ = HeapVec(other.begin(), other.end(), alloc_);
        }
        return *this;
    }

    /** @brief Move assignment. Steals heap storage when the allocators allow it. */
    RowIndex& operator=(RowIndex&& other) noexcept(
        AllocTraits::propagate_on_container_move_assignment::value || AllocTraits::is_always_equal::value)
    {
        if (this == &other) return *this;
        if constexpr (AllocTraits::propagate_on_container_move_assignment::value) {
            alloc_ = std::move(other.alloc_);
            storage_ = std::move(other.storage_);
        } else if constexpr (AllocTraits::is_always_equal::value) {
            storage_ = std::move(other.storage_);
        } else {
            if (alloc_ == other.alloc_ || other.is_inline()) {
                storage_ = std::move(other.storage_);
            } else {
                storage_ = HeapVec(other.begin(), other.end(), alloc_);
            }
        }
        other.storage_.template emplace<InlineBuf>();
        return *this;
    }

    /** @brief Returns the associated allocator. */
    allocator_type get_allocator() const noexcept { return alloc_; }

    // ========================================================================
    // Element Access
    // ========================================================================
    /** @brief Offset of row `pos`, with bounds checking. */
    const_reference at(size_type pos) const { if (pos >= size()) throw std::out_of_range("RowIndex::at"); return data()[pos]; }
    /** @brief Offset of row `pos`. @warning No bounds checking. */
    const_reference operator[](size_type pos) const noexcept { assert(pos < size()); return data()[pos]; }
    /** @brief Offset of the last row. @warning Undefined behavior if empty. */
    const_reference back() const noexcept { assert(!empty()); return data()[size() - 1]; }

    /** @brief Pointer to the first offset. */
    pointer data() noexcept {
        if (auto* buf = std::get_if<InlineBuf>(&storage_)) return buf->ptr();
        return std::get<HeapVec>(storage_).data();
    }
    /** @brief Pointer to the first offset. */
    const_pointer data() const noexcept {
        if (const auto* buf = std::get_if<InlineBuf>(&storage_)) return buf->ptr();
        return std::get<HeapVec>(storage_).data();
    }

    // Offsets are only exposed read-only: rewriting one by hand would break the
    // owner's ordering invariant. Edits go through the modifiers below.
    const_iterator begin() const noexcept { return data(); }
    const_iterator cbegin() const noexcept { return data(); }
    const_iterator end() const noexcept { return data() + size(); }
    const_iterator cend() const noexcept { return data() + size(); }

    // ========================================================================
    // Capacity
    // ========================================================================
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] size_type size() const noexcept {
        if (const auto* buf = std::get_if<InlineBuf>(&storage_)) return buf->size;
        return std::get<HeapVec>(storage_).size();
    }
    [[nodiscard]] size_type capacity() const noexcept {
        if (std::holds_alternative<InlineBuf>(storage_)) return N;
        return std::get<HeapVec>(storage_).capacity();
    }
    [[nodiscard]] size_type max_size() const noexcept { return AllocTraits::max_size(alloc_); }
    /** @brief True while the offsets live in the inline buffer. */
    [[nodiscard]] bool is_inline() const noexcept { return std::holds_alternative<InlineBuf>(storage_); }

    /** @brief Increase capacity. Moves to the heap if `new_cap` exceeds `N`. */
    void reserve(size_type new_cap) {
        if (new_cap <= capacity()) return;
        if (auto* buf = std::get_if<InlineBuf>(&storage_)) {
            storage_ = spill_(*buf, new_cap);
        } else {
            std::get<HeapVec>(storage_).reserve(new_cap);
        }
    }

    /** @brief Reduce capacity to fit size. Returns to inline storage if size() <= N. */
    void shrink_to_fit() {
        if (is_inline()) return;
        auto& vec = std::get<HeapVec>(storage_);
        if (vec.size() <= N) {
            InlineBuf buf;
            std::copy_n(vec.data(), vec.size(), buf.ptr());
            buf.size = vec.size();
            storage_ = buf;
        } else {
            vec.shrink_to_fit();
        }
    }

    // ========================================================================
    // Modifiers
    // ========================================================================

    /** @brief Removes every offset. Heap capacity is retained. */
    void clear() noexcept {
        if (auto* buf = std::get_if<InlineBuf>(&storage_)) buf->size = 0;
        else std::get<HeapVec>(storage_).clear();
    }

    /** @brief Appends the start offset of a new last row. May spill to the heap. */
    void push_back(value_type offset) {
        if (auto* buf = std::get_if<InlineBuf>(&storage_)) {
            if (buf->size < N) {
                buf->ptr()[buf->size++] = offset;
                return;
            }
            HeapVec vec = spill_(*buf, 0);
            vec.push_back(offset);
            storage_ = std::move(vec);
        } else {
            std::get<HeapVec>(storage_).push_back(offset);
        }
    }

    /** @brief Removes the last offset. @warning Undefined behavior if empty. */
    void pop_back() noexcept {
        assert(!empty());
        if (auto* buf = std::get_if<InlineBuf>(&storage_)) --buf->size;
        else std::get<HeapVec>(storage_).pop_back();
    }

    /** @brief Removes the offset at `pos`; later entries move down one slot. Values are not adjusted. */
    void erase(size_type pos) noexcept {
        assert(pos < size());
        if (auto* buf = std::get_if<InlineBuf>(&storage_)) {
            pointer p = buf->ptr();
            std::copy(p + pos + 1, p + buf->size, p + pos);
            --buf->size;
        } else {
            auto& vec = std::get<HeapVec>(storage_);
            vec.erase(vec.begin() + static_cast<difference_type>(pos));
        }
    }

    /**
     * @brief Adds `delta` to every offset at an index strictly greater than `row`.
     *
     * This is the cascade step of every structural edit: when row `row` gains
     * or loses elements, all rows stored behind it in the flat buffer move by
     * the same amount. Entries at or before `row` are left untouched.
     *
     * @warning The caller must ensure no entry goes negative.
     */
    void shift_after(size_type row, difference_type delta) noexcept {
        pointer p = data();
        const size_type n = size();
        for (size_type i = row + 1; i < n; ++i) {
            assert(delta >= 0 || p[i] >= static_cast<value_type>(-delta));
            p[i] = static_cast<value_type>(static_cast<difference_type>(p[i]) + delta);
        }
    }

    /** @brief Swaps contents with another table. Allocators are swapped only if they propagate on swap. */
    void swap(RowIndex& other) noexcept {
        if constexpr (AllocTraits::propagate_on_container_swap::value) {
            using std::swap;
            swap(alloc_, other.alloc_);
        } else {
            assert(alloc_ == other.alloc_ && "Cannot swap RowIndex tables with unequal non-propagating allocators");
        }
        storage_.swap(other.storage_);
    }

    friend bool operator==(const RowIndex& lhs, const RowIndex& rhs) noexcept {
        return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin());
    }
    friend bool operator!=(const RowIndex& lhs, const RowIndex& rhs) noexcept { return !(lhs == rhs); }
};

/** @brief Non-member swap for RowIndex. */
template<std::size_t N, typename Alloc>
void swap(RowIndex<N, Alloc>& lhs, RowIndex<N, Alloc>& rhs) noexcept
{
    lhs.swap(rhs);
}

} // namespace jagged
