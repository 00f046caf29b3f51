#include "grid_extraction.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <vector>
#include <opencv2/imgproc.hpp>

namespace {

/**
 * Checks whether a cell holds a digit by measuring the share of ink pixels in
 * its central third, away from the grid lines.
 */
bool cellHasInk(const cv::Mat& cell_binary, double min_ratio) {
    int margin = std::min(cell_binary.rows, cell_binary.cols) / 3;
    cv::Rect centre(margin, margin, cell_binary.cols - 2 * margin, cell_binary.rows - 2 * margin);
    if (centre.empty()) return false;

    cv::Mat area = cell_binary(centre);
    double ratio = static_cast<double>(cv::countNonZero(area)) / static_cast<double>(area.total());
    return ratio > min_ratio;
}

// Grid lines touch the crop border; flood them away so only the digit is left
void clearEdgeBlobs(cv::Mat& binary) {
    CV_Assert(binary.type() == CV_8UC1);

    cv::Mat mask(binary.rows + 2, binary.cols + 2, CV_8U, cv::Scalar(0));
    auto clearFrom = [&](int x, int y) {
        if (binary.at<uchar>(y, x) == 255) cv::floodFill(binary, mask, {x, y}, 0);
    };

    for (int x = 0; x < binary.cols; ++x) {
        clearFrom(x, 0);
        clearFrom(x, binary.rows - 1);
    }
    for (int y = 0; y < binary.rows; ++y) {
        clearFrom(0, y);
        clearFrom(binary.cols - 1, y);
    }
}

// Bounding box (board coordinates) of the blob whose centroid is nearest the cell centre
cv::Rect digitBoundingBox(const cv::Mat& board_binary, const cv::Rect& cell_rect) {
    cv::Rect bounded = cell_rect & cv::Rect(0, 0, board_binary.cols, board_binary.rows);
    if (bounded.empty()) return cv::Rect();

    cv::Mat cell = board_binary(bounded).clone();
    clearEdgeBlobs(cell);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(cell, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    cv::Point2f centre((cell.cols - 1) / 2.0f, (cell.rows - 1) / 2.0f);
    int best = -1;
    double best_dist = std::numeric_limits<double>::max();
    for (int i = 0; i < static_cast<int>(contours.size()); ++i) {
        cv::Moments m = cv::moments(contours[i]);
        if (m.m00 == 0) continue;
        cv::Point2f centroid(static_cast<float>(m.m10 / m.m00), static_cast<float>(m.m01 / m.m00));
        double d = cv::norm(centroid - centre);
        if (d < best_dist) {
            best_dist = d;
            best = i;
        }
    }
    if (best == -1) return cv::Rect();

    cv::Rect r = cv::boundingRect(contours[best]);
    return cv::Rect(r.x + bounded.x, r.y + bounded.y, r.width, r.height) &
           cv::Rect(0, 0, board_binary.cols, board_binary.rows);
}

} // namespace

cv::Rect squareAround(const cv::Rect& region, const cv::Size& bounds, int pad) {
    if (region.empty()) return cv::Rect();

    int side = std::max(region.width, region.height) + 2 * pad;
    side = std::min(side, std::min(bounds.width, bounds.height));

    int x = region.x + region.width / 2 - side / 2;
    int y = region.y + region.height / 2 - side / 2;
    x = std::clamp(x, 0, bounds.width - side);
    y = std::clamp(y, 0, bounds.height - side);

    return cv::Rect(x, y, side, side);
}

CellImages extractCells(const cv::Mat& board, const CellExtractionConfig& config) {
    CellImages cells;
    if (board.empty() || board.channels() != 3) {
        std::cerr << "ERROR: extractCells() expects a non-empty BGR image" << std::endl;
        return cells;
    }

    cv::Mat colour;
    cv::resize(board, colour, cv::Size(config.boardSize, config.boardSize));

    cv::Mat gray, binary;
    cv::cvtColor(colour, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, gray, cv::Size(9, 9), 0);
    cv::adaptiveThreshold(gray, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, 17, 4);

    const int N = SudokuTopology::N;
    double step_x = static_cast<double>(binary.cols) / N;
    double step_y = static_cast<double>(binary.rows) / N;

    for (int idx = 0; idx < SudokuTopology::CELL_COUNT; ++idx) {
        int x = std::max(0, static_cast<int>(SudokuTopology::colOf(idx) * step_x) - config.cellMargin);
        int y = std::max(0, static_cast<int>(SudokuTopology::rowOf(idx) * step_y) - config.cellMargin);
        int w = std::min(static_cast<int>(step_x) + 2 * config.cellMargin, binary.cols - x);
        int h = std::min(static_cast<int>(step_y) + 2 * config.cellMargin, binary.rows - y);
        cv::Rect cell_rect(x, y, w, h);

        if (!cellHasInk(binary(cell_rect), config.inkRatio)) continue;

        cv::Rect digit = digitBoundingBox(binary, cell_rect);
        if (digit.area() > 0) {
            cells[idx] = colour(squareAround(digit, colour.size(), config.cropPadding)).clone();
        }
    }
    return cells;
}
