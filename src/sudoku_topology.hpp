#pragma once

#include <array>

// Cell geometry of a 9x9 board: the 27 units and each cell's 20 peers.
// Depends only on board shape, so it is built once and shared read-only.
class SudokuTopology {
public:
    static constexpr int N = 9;
    static constexpr int CELL_COUNT = 81;
    static constexpr int UNIT_COUNT = 27;
    static constexpr int PEER_COUNT = 20;

    using Unit = std::array<int, N>;
    using PeerList = std::array<int, PEER_COUNT>;

    static const SudokuTopology& instance();

    // Rows 0-8, then columns 0-8, then boxes 0-8 (each in ascending cell order).
    const std::array<Unit, UNIT_COUNT>& units() const { return unit_table; }
    // Ascending cell order.
    const PeerList& peers(int idx) const { return peer_table[idx]; }

    static constexpr int rowOf(int idx) { return idx / N; }
    static constexpr int colOf(int idx) { return idx % N; }
    static constexpr int boxOf(int idx) { return (rowOf(idx) / 3) * 3 + colOf(idx) / 3; }

    SudokuTopology(const SudokuTopology&) = delete;
    SudokuTopology& operator=(const SudokuTopology&) = delete;

private:
    SudokuTopology();

    std::array<Unit, UNIT_COUNT> unit_table;
    std::array<PeerList, CELL_COUNT> peer_table;
};
