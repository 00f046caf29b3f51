#pragma once

#include <array>
#include <opencv2/core.hpp>

#include "sudoku_topology.hpp"

struct CellExtractionConfig {
    int boardSize = 512;      // the board is resized to boardSize x boardSize first
    double inkRatio = 0.1;    // share of ink pixels in a cell centre that marks it as filled
    int cellMargin = 10;      // pixels added around each cell before looking for its digit
    int cropPadding = 3;      // pixels kept around the digit in the final crop
};

// Row-major, one entry per cell; an empty cv::Mat means the cell is blank.
using CellImages = std::array<cv::Mat, SudokuTopology::CELL_COUNT>;

CellImages extractCells(const cv::Mat& board, const CellExtractionConfig& config = {});

// Square region of side max(w, h) + 2 * pad centred on `region`, kept inside `bounds`.
cv::Rect squareAround(const cv::Rect& region, const cv::Size& bounds, int pad);
