/**
 * @file jagged_grid.hpp
 * @brief Defines jagged::Grid, a row-major 2D container whose rows have
 * independent lengths, stored in one contiguous buffer with full allocator
 * support.
 *
 * @version 1.0
 * @date 2025-10-19
 * @copyright Copyright (C) 2025 Lloyal AI - MIT License
 */

#pragma once

#include <algorithm> // For std::upper_bound, std::equal
#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <iterator>  // For std::begin, std::end, std::size
#include <memory>    // For std::allocator, std::allocator_traits
#include <optional>  // For std::optional (absent query results)
#include <ostream>
#include <sstream>
#include <stdexcept> // For std::out_of_range
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>   // For std::swap, std::move, std::forward
#include <vector>    // For std::vector (flat element buffer)

#include "jagged_row_index.hpp"


namespace jagged {

/** @brief A cell coordinate: row index, then column index within that row. */
struct Position {
    std::size_t row = 0;
    std::size_t col = 0;

    friend bool operator==(const Position& lhs, const Position& rhs) noexcept {
        return lhs.row == rhs.row && lhs.col == rhs.col;
    }
    friend bool operator!=(const Position& lhs, const Position& rhs) noexcept { return !(lhs == rhs); }
};

/**
 * @brief Thrown when a caller passes a coordinate that violates an operation's
 * documented precondition (e.g. Grid::insert, Grid::swap, Grid::row).
 *
 * Out-of-range lookups through Grid::get / Grid::row_size are *not* reported
 * this way; those return an empty result instead.
 *
 * The valid range for the offending index is `[0, limit())`.
 */
class bounds_error : public std::out_of_range {
public:
    enum class axis { row, column };

    bounds_error(const char* where, axis which, std::size_t index, std::size_t limit)
        : std::out_of_range(describe_(where, which, index, limit)),
          where_(where), axis_(which), index_(index), limit_(limit) {}

    /** @brief Name of the operation that rejected the index. */
    const char* where() const noexcept { return where_; }
    axis which() const noexcept { return axis_; }
    std::size_t index() const noexcept { return index_; }
    /** @brief Exclusive upper bound of the valid range. */
    std::size_t limit() const noexcept { return limit_; }

private:
    static std::string describe_(const char* where, axis which, std::size_t index, std::size_t limit) {
        std::string msg(where);
        msg += which == axis::row ? ": row index " : ": column index ";
        msg += std::to_string(index);
        msg += " out of range [0, ";
        msg += std::to_string(limit);
        msg += ")";
        return msg;
    }

    const char* where_;
    axis axis_;
    std::size_t index_;
    std::size_t limit_;
};

/**
 * @brief Non-owning view of one row of a Grid.
 *
 * `U` is `T` for a mutable row and `const T` for a read-only one. The view is
 * invalidated by any structural edit of the grid it came from.
 */
template<typename U>
class RowView {
public:
    using value_type = std::remove_const_t<U>;
    using size_type = std::size_t;
    using reference = U&;
    using pointer = U*;
    using iterator = U*;

    RowView() noexcept = default;
    RowView(U* first, size_type count) noexcept : first_(first), count_(count) {}

    iterator begin() const noexcept { return first_; }
    iterator end() const noexcept { return first_ + count_; }
    [[nodiscard]] size_type size() const noexcept { return count_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
    pointer data() const noexcept { return first_; }
    /** @brief Element `col` of the row. @warning No bounds checking. */
    reference operator[](size_type col) const noexcept { assert(col < count_); return first_[col]; }

    /** @brief Read-only view of the same row. */
    template<typename V = U, std::enable_if_t<!std::is_const_v<V>, int> = 0>
    operator RowView<const U>() const noexcept { return RowView<const U>(first_, count_); }

private:
    U* first_ = nullptr;
    size_type count_ = 0;
};

/**
 * @brief A jagged (ragged) 2D grid stored row-major in a single flat buffer.
 *
 * Every element of every row lives in one `std::vector<T, Alloc>`, rows
 * concatenated in order. A separate row-start table (jagged::RowIndex) records
 * where each row begins, so the size of row `i` is the distance to the next
 * row's start, or to the end of the buffer for the last row. Rows may be
 * empty.
 *
 * Invariants (hold after every public member returns, normally or by exception):
 * - row starts are non-decreasing;
 * - the first row starts at 0;
 * - no row start exceeds the buffer length;
 * - every element belongs to exactly one row.
 *
 * Changing the length of one row moves every row behind it in the buffer.
 * All such edits go through RowIndex::shift_after, which adjusts every later
 * row start, not only the next one.
 *
 * @tparam T Element type. Must be a non-cv object type and MoveConstructible.
 * Copying operations (fill construction, copy-push, copying the grid)
 * additionally require CopyConstructible; mid-buffer insertion requires
 * MoveAssignable, as for `std::vector::insert`.
 * @tparam InlineRows Number of row starts kept inline before the row table
 * allocates. Must be greater than 0.
 * @tparam Alloc Element allocator. The row table uses it rebound to
 * `std::size_t`.
 *
 * @note Error Reporting: queries whose contract allows an out-of-range
 * coordinate (row_size, row_offset, get) report absence with an empty
 * optional or a null pointer. Operations that require a valid coordinate
 * throw jagged::bounds_error before touching any state.
 *
 * @note Exception Safety: push, push_new_row and add_row provide the strong
 * guarantee. insert and remove_row provide the basic guarantee: if a move of
 * `T` throws midway, the invariants above still hold and every row other than
 * the target keeps its length, but element values behind the edit point are
 * unspecified. With a nothrow move the buffer edit is all-or-nothing, as in
 * `std::vector`.
 *
 * @note Iterator Invalidation: follows `std::vector` for the element buffer.
 * RowView objects are invalidated by every structural edit.
 */
template<typename T, std::size_t InlineRows = 8, typename Alloc = std::allocator<T>>
class Grid {
public:
    // --- Compile-Time Constraints ---
    static_assert(std::is_object_v<T> && !std::is_const_v<T> && !std::is_volatile_v<T>,
                  "Grid requires T to be a non-cv object type");
    static_assert(std::is_move_constructible_v<T>, "Grid requires T to be MoveConstructible");
    static_assert(!std::is_same_v<T, bool>, "Grid<bool> is not supported: std::vector<bool> has no contiguous storage");

    // --- Public Member Types ---
    using value_type = T;
    using allocator_type = Alloc;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using reference = T&;
    using const_reference = const T&;
    using pointer = T*;
    using const_pointer = const T*;
    using iterator = T*;
    using const_iterator = const T*;
    using row_view = RowView<T>;
    using const_row_view = RowView<const T>;

private:
    using AllocTraits = std::allocator_traits<Alloc>;
    using ElementVec = std::vector<T, Alloc>;
    using IndexAlloc = typename AllocTraits::template rebind_alloc<std::size_t>;

public:
    using row_index_type = RowIndex<InlineRows, IndexAlloc>;

private:
    // --- Core State ---
    ElementVec elements_;       // every row, concatenated row-major
    row_index_type row_start_;  // row_start_[i] = index in elements_ where row i begins

    // ========================================================================
    // Internal helpers. Callers have already validated `row` (and `col`).
    // ========================================================================

    size_type row_size_unchecked_(size_type row) const noexcept {
        assert(row < row_start_.size());
        const size_type end = row + 1 < row_start_.size() ? row_start_[row + 1] : elements_.size();
        return end - row_start_[row];
    }

    /** @brief Index in the flat buffer of cell (row, col). */
    size_type flat_index_(size_type row, size_type col) const noexcept { return row_start_[row] + col; }

    /** @brief The row owning flat index `flat`: the last row whose start is <= flat. */
    size_type row_of_(size_type flat) const noexcept {
        assert(flat < elements_.size());
        auto it = std::upper_bound(row_start_.begin(), row_start_.end(), flat);
        return static_cast<size_type>(it - row_start_.begin()) - 1;
    }

    void check_row_(const char* where, size_type row) const {
        if (row >= row_count()) throw bounds_error(where, bounds_error::axis::row, row, row_count());
    }

    void check_cell_(const char* where, size_type row, size_type col) const {
        check_row_(where, row);
        const size_type cols = row_size_unchecked_(row);
        if (col >= cols) throw bounds_error(where, bounds_error::axis::column, col, cols);
    }

    iterator elem_it_(size_type flat) noexcept { return elements_.data() + flat; }

    template<typename U>
    Position push_(U&& value) {
        if (row_start_.empty()) throw bounds_error("jagged::Grid::push", bounds_error::axis::row, 0, 0);
        elements_.push_back(std::forward<U>(value));
        const size_type last = row_count() - 1;
        return {last, row_size_unchecked_(last) - 1};
    }

    template<typename U>
    Position push_new_row_(U&& value) {
        row_start_.push_back(elements_.size());
        try {
            elements_.push_back(std::forward<U>(value));
        } catch (...) {
            row_start_.pop_back();
            throw;
        }
        return {row_count() - 1, 0};
    }

    template<typename U>
    iterator insert_(const char* where, size_type row, size_type col, U&& value) {
        check_row_(where, row);
        const size_type cols = row_size_unchecked_(row);
        if (col > cols) throw bounds_error(where, bounds_error::axis::column, col, cols + 1);

        const size_type flat = flat_index_(row, col);
        const size_type old_size = elements_.size();
        try {
            elements_.insert(elements_.begin() + static_cast<difference_type>(flat), std::forward<U>(value));
        } catch (...) {
            // A throwing move-assignment can leave the buffer one slot longer.
            // The slot is charged to `row` so every other row keeps its length.
            if (elements_.size() != old_size) row_start_.shift_after(row, 1);
            throw;
        }
        row_start_.shift_after(row, 1);
        return elem_it_(flat);
    }

public:
    // ========================================================================
    // Constructors
    // ========================================================================

    /** @brief Constructs an empty grid: no rows, no elements. */
    Grid() noexcept(noexcept(Alloc())) : Grid(Alloc()) {}

    /** @brief Constructs an empty grid using the specified allocator. */
    explicit Grid(const Alloc& alloc) noexcept
        : elements_(alloc), row_start_(IndexAlloc(alloc)) {}

    /**
     * @brief Constructs `rows` rows of `cols` copies of `value` each.
     *
     * Row `i` starts at `i * cols`. With `cols == 0` this yields `rows` empty rows.
     */
    Grid(size_type rows, size_type cols, const T& value, const Alloc& alloc = Alloc{})
        : elements_(rows * cols, value, alloc), row_start_(IndexAlloc(alloc))
    {
        row_start_.reserve(rows);
        for (size_type i = 0; i < rows; ++i) row_start_.push_back(i * cols);
    }

    /** @brief Constructs from nested initializer lists, one inner list per row. */
    Grid(std::initializer_list<std::initializer_list<T>> rows, const Alloc& alloc = Alloc{})
        : Grid(alloc)
    {
        append_rows_(rows);
    }

    /**
     * @brief Builds a grid from any range of ranges (e.g. `std::vector<std::vector<T>>`).
     *
     * Rows are flattened in order; row `i` starts at the total length of rows
     * `0..i-1`. Rows may have different lengths, including zero.
     */
    template<typename Rows>
    static Grid from_rows(const Rows& rows, const Alloc& alloc = Alloc{}) {
        Grid g(alloc);
        g.append_rows_(rows);
        return g;
    }

    Grid(const Grid&) = default;
    Grid(Grid&&) noexcept = default;
    Grid& operator=(const Grid&) = default;
    Grid& operator=(Grid&&) = default;
    ~Grid() = default;

    /** @brief Returns the associated allocator. */
    allocator_type get_allocator() const noexcept { return elements_.get_allocator(); }

private:
    template<typename Rows>
    void append_rows_(const Rows& rows) {
        size_type total = 0;
        size_type count = 0;
        for (const auto& r : rows) { total += static_cast<size_type>(std::size(r)); ++count; }
        elements_.reserve(elements_.size() + total);
        row_start_.reserve(row_start_.size() + count);
        for (const auto& r : rows) {
            row_start_.push_back(elements_.size());
            elements_.insert(elements_.end(), std::begin(r), std::end(r));
        }
    }

public:
    // ========================================================================
    // Queries
    // ========================================================================

    /** @brief Number of rows. */
    [[nodiscard]] size_type row_count() const noexcept { return row_start_.size(); }
    /** @brief Total number of elements across all rows. */
    [[nodiscard]] size_type size() const noexcept { return elements_.size(); }
    /** @brief True if the grid holds no elements. It may still have (empty) rows. */
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    /** @brief Length of row `row`, or empty if the row does not exist. */
    [[nodiscard]] std::optional<size_type> row_size(size_type row) const noexcept {
        if (row >= row_count()) return std::nullopt;
        return row_size_unchecked_(row);
    }

    /** @brief Index in the flat buffer where row `row` begins, or empty if the row does not exist. */
    [[nodiscard]] std::optional<size_type> row_offset(size_type row) const noexcept {
        if (row >= row_count()) return std::nullopt;
        return row_start_[row];
    }

    /** @brief Read-only access to the row-start table. */
    const row_index_type& row_index() const noexcept { return row_start_; }

    // ========================================================================
    // Element Access
    // ========================================================================

    /** @brief Pointer to cell (row, col), or nullptr if it is outside the grid. */
    [[nodiscard]] pointer get(size_type row, size_type col) noexcept {
        if (row >= row_count() || col >= row_size_unchecked_(row)) return nullptr;
        return std::addressof(get_unchecked(row, col));
    }
    /** @brief Pointer to cell (row, col), or nullptr if it is outside the grid. */
    [[nodiscard]] const_pointer get(size_type row, size_type col) const noexcept {
        if (row >= row_count() || col >= row_size_unchecked_(row)) return nullptr;
        return std::addressof(get_unchecked(row, col));
    }

    /** @brief Access cell (row, col) with bounds checking. Throws bounds_error. */
    reference at(size_type row, size_type col) { check_cell_("jagged::Grid::at", row, col); return get_unchecked(row, col); }
    /** @brief Access cell (row, col) with bounds checking. Throws bounds_error. */
    const_reference at(size_type row, size_type col) const { check_cell_("jagged::Grid::at", row, col); return get_unchecked(row, col); }

    /**
     * @brief Access cell (row, col) without bounds checking.
     * @warning Undefined behavior unless `row < row_count()` and
     * `col < *row_size(row)`. Prefer get() or at().
     */
    reference get_unchecked(size_type row, size_type col) noexcept {
        assert(row < row_count() && col < row_size_unchecked_(row));
        return elements_[flat_index_(row, col)];
    }
    /** @copydoc get_unchecked(size_type, size_type) */
    const_reference get_unchecked(size_type row, size_type col) const noexcept {
        assert(row < row_count() && col < row_size_unchecked_(row));
        return elements_[flat_index_(row, col)];
    }

    // ========================================================================
    // Iterators
    // ========================================================================
    // Whole-grid iteration visits every element in row-major order. Mutable
    // iterators expose element values only; the row layout is not reachable
    // through them.
    iterator begin() noexcept { return elements_.data(); }
    const_iterator begin() const noexcept { return elements_.data(); }
    const_iterator cbegin() const noexcept { return elements_.data(); }
    iterator end() noexcept { return elements_.data() + elements_.size(); }
    const_iterator end() const noexcept { return elements_.data() + elements_.size(); }
    const_iterator cend() const noexcept { return elements_.data() + elements_.size(); }

    /** @brief The elements of row `row` in column order. Throws bounds_error if the row does not exist. */
    row_view row(size_type row) {
        check_row_("jagged::Grid::row", row);
        return row_view(elements_.data() + row_start_[row], row_size_unchecked_(row));
    }
    /** @brief The elements of row `row` in column order. Throws bounds_error if the row does not exist. */
    const_row_view row(size_type row) const {
        check_row_("jagged::Grid::row", row);
        return const_row_view(elements_.data() + row_start_[row], row_size_unchecked_(row));
    }

    // ========================================================================
    // Modifiers
    // ========================================================================

    /**
     * @brief Appends `value` to the end of the last row.
     * @return Position of the new element.
     * @throws bounds_error if the grid has no rows; use push_new_row() first.
     */
    Position push(const T& value) { return push_(value); }
    /** @copydoc push(const T&) */
    Position push(T&& value) { return push_(std::move(value)); }

    /** @brief Starts a new last row holding only `value`. @return Position of the new element. */
    Position push_new_row(const T& value) { return push_new_row_(value); }
    /** @copydoc push_new_row(const T&) */
    Position push_new_row(T&& value) { return push_new_row_(std::move(value)); }

    /** @brief Appends an empty row. @return Index of the new row. */
    size_type add_row() {
        row_start_.push_back(elements_.size());
        return row_count() - 1;
    }

    /**
     * @brief Appends `value` to the end of row `row`, which need not be the last.
     * @throws bounds_error if `row >= row_count()`.
     */
    Position push_at_row(size_type row, const T& value) {
        check_row_("jagged::Grid::push_at_row", row);
        const Position pos{row, row_size_unchecked_(row)};
        insert_("jagged::Grid::push_at_row", pos.row, pos.col, value);
        return pos;
    }
    /** @copydoc push_at_row(size_type, const T&) */
    Position push_at_row(size_type row, T&& value) {
        check_row_("jagged::Grid::push_at_row", row);
        const Position pos{row, row_size_unchecked_(row)};
        insert_("jagged::Grid::push_at_row", pos.row, pos.col, std::move(value));
        return pos;
    }

    /**
     * @brief Inserts `value` at column `col` of row `row`.
     *
     * Elements of the row from `col` on move one column right, and every row
     * after `row` starts one slot later in the flat buffer. `col == row
     * size` appends to the row.
     *
     * @return Iterator to the inserted element.
     * @throws bounds_error if `row >= row_count()` or `col > row size`.
     */
    iterator insert(size_type row, size_type col, const T& value) { return insert_("jagged::Grid::insert", row, col, value); }
    /** @copydoc insert(size_type, size_type, const T&) */
    iterator insert(size_type row, size_type col, T&& value) { return insert_("jagged::Grid::insert", row, col, std::move(value)); }

    /**
     * @brief Exchanges the elements at `a` and `b`. Row sizes are unchanged.
     * @throws bounds_error if either position is outside the grid.
     */
    void swap(Position a, Position b) {
        check_cell_("jagged::Grid::swap", a.row, a.col);
        check_cell_("jagged::Grid::swap", b.row, b.col);
        using std::swap;
        swap(elements_[flat_index_(a.row, a.col)], elements_[flat_index_(b.row, b.col)]);
    }

    /**
     * @brief Removes the last element in row-major order.
     *
     * That is the last element of the last non-empty row. The row is kept
     * even if it becomes empty; only remove_row() deletes rows. Trailing
     * empty rows keep starting at the end of the buffer. No-op if the grid
     * holds no elements.
     */
    void remove() noexcept {
        if (elements_.empty()) return;
        const size_type owner = row_of_(elements_.size() - 1);
        elements_.pop_back();
        row_start_.shift_after(owner, -1);
    }

    /**
     * @brief Deletes row `row` and all of its elements.
     *
     * Rows after it move up one index and start earlier in the flat buffer by
     * the removed row's length.
     *
     * @throws bounds_error if `row >= row_count()`.
     */
    void remove_row(size_type row) {
        check_row_("jagged::Grid::remove_row", row);
        const size_type first = row_start_[row];
        const size_type count = row_size_unchecked_(row);
        elements_.erase(elements_.begin() + static_cast<difference_type>(first),
                        elements_.begin() + static_cast<difference_type>(first + count));
        row_start_.shift_after(row, -static_cast<difference_type>(count));
        row_start_.erase(row);
    }

    /** @brief Removes all rows and elements. Capacity is retained. */
    void clear() noexcept {
        elements_.clear();
        row_start_.clear();
    }

    /** @brief Pre-allocates room for `elements` elements and `rows` rows. */
    void reserve(size_type elements, size_type rows = 0) {
        elements_.reserve(elements);
        row_start_.reserve(rows);
    }

    /** @brief Releases unused capacity of both buffers. */
    void shrink_to_fit() {
        elements_.shrink_to_fit();
        row_start_.shrink_to_fit();
    }

    /** @brief Swaps contents with another grid. */
    void swap(Grid& other) noexcept {
        elements_.swap(other.elements_);
        row_start_.swap(other.row_start_);
    }

    // ========================================================================
    // Comparison operators
    // ========================================================================
    /** @brief Equal if both grids have the same row lengths and the same elements. */
    friend bool operator==(const Grid& lhs, const Grid& rhs) {
        return lhs.row_start_ == rhs.row_start_ && lhs.elements_ == rhs.elements_;
    }
    friend bool operator!=(const Grid& lhs, const Grid& rhs) { return !(lhs == rhs); }
};

/** @brief Non-member swap for Grid. */
template<typename T, std::size_t InlineRows, typename Alloc>
void swap(Grid<T, InlineRows, Alloc>& lhs, Grid<T, InlineRows, Alloc>& rhs) noexcept
{
    lhs.swap(rhs);
}

// ============================================================================
// Formatting
// ============================================================================

/**
 * @brief Writes one line per row, elements separated by `delimiter`, each
 * line terminated by '\n'. Empty rows produce an empty line.
 */
template<typename T, std::size_t InlineRows, typename Alloc>
std::ostream& write_rows(std::ostream& os, const Grid<T, InlineRows, Alloc>& grid, std::string_view delimiter = ",")
{
    for (std::size_t r = 0; r < grid.row_count(); ++r) {
        bool first = true;
        for (const T& value : grid.row(r)) {
            if (!first) os << delimiter;
            os << value;
            first = false;
        }
        os << '\n';
    }
    return os;
}

template<typename T, std::size_t InlineRows, typename Alloc>
std::ostream& operator<<(std::ostream& os, const Grid<T, InlineRows, Alloc>& grid)
{
    return write_rows(os, grid);
}

/** @brief Renders `grid` as text; see write_rows(). */
template<typename T, std::size_t InlineRows, typename Alloc>
std::string to_string(const Grid<T, InlineRows, Alloc>& grid, std::string_view delimiter = ",")
{
    std::ostringstream os;
    write_rows(os, grid, delimiter);
    return os.str();
}

} // namespace jagged
