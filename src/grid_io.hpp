#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sudoku_validator.hpp"

// 81 cells in row order, whitespace ignored; '0' or '.' is an empty cell.
// Throws std::invalid_argument on anything else.
Grid parseGrid(const std::string& text);

// Throws std::runtime_error when the file cannot be read.
Grid loadGridFile(const std::string& path);

std::string toString81(const Grid& grid);

void printGrid(const Grid& grid, std::ostream& out = std::cout);

std::optional<Grid> gridFromRows(const std::vector<std::vector<int>>& rows);
