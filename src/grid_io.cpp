#include "grid_io.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

Grid parseGrid(const std::string& text) {
    std::string digits;
    digits.reserve(SudokuTopology::CELL_COUNT);
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) digits.push_back(ch);
    }

    if (digits.size() != SudokuTopology::CELL_COUNT) {
        throw std::invalid_argument("Text file must contain exactly 81 digits (0-9).");
    }

    Grid grid{};
    for (int i = 0; i < SudokuTopology::CELL_COUNT; ++i) {
        char ch = digits[i];
        if (ch == '.') continue;
        if (ch < '0' || ch > '9') throw std::invalid_argument("Only digits 0-9 allowed.");
        grid[i] = ch - '0';
    }
    return grid;
}

Grid loadGridFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Could not read puzzle file: " + path);

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseGrid(buffer.str());
}

std::string toString81(const Grid& grid) {
    std::string out;
    out.reserve(grid.size());
    for (int v : grid) out.push_back(static_cast<char>('0' + v));
    return out;
}

void printGrid(const Grid& g, std::ostream& out) {
    const int N = SudokuTopology::N;
    for (int r = 0; r < N; ++r) {
        if (r > 0 && r % 3 == 0) out << "------+-------+------\n";
        for (int c = 0; c < N; ++c) {
            if (c > 0 && c % 3 == 0) out << "| ";
            int v = g[r * N + c];
            out << (v == 0 ? '.' : (char)('0' + v)) << " ";
        }
        out << "\n";
    }
}

std::optional<Grid> gridFromRows(const std::vector<std::vector<int>>& rows) {
    const int N = SudokuTopology::N;
    if (rows.size() != N) return std::nullopt;
    for (const auto& row : rows) if (row.size() != N) return std::nullopt;

    Grid grid{};
    for (int r = 0; r < N; ++r)
        for (int c = 0; c < N; ++c)
            grid[r * N + c] = rows[r][c];
    return grid;
}
