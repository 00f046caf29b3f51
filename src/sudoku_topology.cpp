#include "sudoku_topology.hpp"

const SudokuTopology& SudokuTopology::instance() {
    static const SudokuTopology topology;
    return topology;
}

SudokuTopology::SudokuTopology() {
    for (int r = 0; r < N; ++r)
        for (int c = 0; c < N; ++c)
            unit_table[r][c] = r * N + c;

    for (int c = 0; c < N; ++c)
        for (int r = 0; r < N; ++r)
            unit_table[N + c][r] = r * N + c;

    for (int b = 0; b < N; ++b) {
        int top = (b / 3) * 3;
        int left = (b % 3) * 3;
        for (int k = 0; k < N; ++k)
            unit_table[2 * N + b][k] = (top + k / 3) * N + left + k % 3;
    }

    // Scanning cells in index order keeps every peer list sorted
    for (int i = 0; i < CELL_COUNT; ++i) {
        int count = 0;
        for (int j = 0; j < CELL_COUNT; ++j) {
            if (j == i) continue;
            if (rowOf(j) == rowOf(i) || colOf(j) == colOf(i) || boxOf(j) == boxOf(i)) {
                peer_table[i][count++] = j;
            }
        }
    }
}
