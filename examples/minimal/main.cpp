/**
 * @file main.cpp
 * @brief Minimal example demonstrating jagged::Grid usage
 */

#include <cassert>
#include <iostream>
#include <string>
#include <vector>
#include "jagged_grid.hpp"

// ============================================================================
// Example 1: Building a Grid Row by Row
// ============================================================================
void example_build() {
    std::cout << "=== Example 1: Building a Grid ===\n";

    jagged::Grid<int> grid;

    // A grid needs a row before push() has somewhere to append
    grid.push_new_row(10);
    grid.push(5);
    grid.push(4);
    grid.push_new_row(3);
    grid.push(9);
    grid.push_new_row(1);
    grid.push_new_row(7);
    grid.push(6);
    grid.push(2);
    jagged::Position last = grid.push(8);

    std::cout << "Rows: " << grid.row_count() << ", Elements: " << grid.size() << "\n";
    std::cout << "Last push landed at (" << last.row << ", " << last.col << ")\n";
    assert(grid.row_count() == 4);
    assert(last == (jagged::Position{3, 3}));

    std::cout << grid << "\n";
}

// ============================================================================
// Example 2: Lookups - Absent Results vs. Bounds Errors
// ============================================================================
void example_lookups() {
    std::cout << "=== Example 2: Lookups ===\n";

    jagged::Grid<int> grid{{10, 5, 4}, {3, 9}, {1}, {7, 6, 2, 8}};

    // get() returns nullptr outside the grid, it never throws
    if (const int* v = grid.get(1, 1)) std::cout << "get(1, 1) = " << *v << "\n";
    if (!grid.get(2, 1)) std::cout << "get(2, 1) is absent (row 2 has one element)\n";

    if (auto n = grid.row_size(3)) std::cout << "row 3 has " << *n << " elements\n";
    if (!grid.row_size(9)) std::cout << "row 9 does not exist\n";

    // Operations that require a valid coordinate throw instead
    try {
        grid.insert(2, 5, 0);
    } catch (const jagged::bounds_error& e) {
        std::cout << "Caught: " << e.what() << "\n";
    }
    std::cout << "\n";
}

// ============================================================================
// Example 3: Editing in the Middle
// ============================================================================
void example_edits() {
    std::cout << "=== Example 3: Editing in the Middle ===\n";

    jagged::Grid<int> grid{{10, 5, 4}, {3, 9}, {1}, {7, 6, 2, 8}};

    std::cout << "Row 3 starts at flat index " << *grid.row_offset(3) << "\n";
    grid.insert(2, 1, 99);
    std::cout << "After insert(2, 1, 99), row 3 starts at " << *grid.row_offset(3) << "\n";
    assert(grid.at(3, 0) == 7);

    grid.swap({0, 1}, {3, 2});
    grid.remove_row(1);
    grid.remove();

    std::cout << jagged::to_string(grid, " ") << "\n";
}

// ============================================================================
// Example 4: Iteration
// ============================================================================
void example_iteration() {
    std::cout << "=== Example 4: Iteration ===\n";

    jagged::Grid<std::string> names = jagged::Grid<std::string>::from_rows(
        std::vector<std::vector<std::string>>{{"ada", "alan"}, {}, {"grace"}});

    std::cout << "All: ";
    for (const auto& name : names) std::cout << name << " ";
    std::cout << "\n";

    for (std::size_t r = 0; r < names.row_count(); ++r) {
        std::cout << "Row " << r << " (" << names.row(r).size() << "):";
        for (auto& name : names.row(r)) {
            name[0] = static_cast<char>(name[0] - 'a' + 'A');
            std::cout << " " << name;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

// ============================================================================
// Main
// ============================================================================
int main() {
    std::cout << "jagged::Grid Examples\n";
    std::cout << "=====================\n\n";

    try {
        example_build();
        example_lookups();
        example_edits();
        example_iteration();

        std::cout << "✓ All examples completed successfully!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
