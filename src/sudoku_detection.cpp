#include "sudoku_detection.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace {

// Outlines smaller than this are print noise, not a board
constexpr double MIN_BOARD_AREA = 1000.0;

cv::Mat warpToRectangle(const cv::Mat& photo, const std::vector<cv::Point2f>& corners) {
    float top = static_cast<float>(cv::norm(corners[1] - corners[0]));
    float bottom = static_cast<float>(cv::norm(corners[2] - corners[3]));
    float left = static_cast<float>(cv::norm(corners[3] - corners[0]));
    float right = static_cast<float>(cv::norm(corners[2] - corners[1]));

    int width = static_cast<int>(std::max(top, bottom));
    int height = static_cast<int>(std::max(left, right));

    std::vector<cv::Point2f> target = {
        {0.0f, 0.0f},
        {static_cast<float>(width - 1), 0.0f},
        {static_cast<float>(width - 1), static_cast<float>(height - 1)},
        {0.0f, static_cast<float>(height - 1)}
    };

    cv::Mat transform = cv::getPerspectiveTransform(corners, target);
    cv::Mat board;
    cv::warpPerspective(photo, board, transform, cv::Size(width, height));
    return board;
}

} // namespace

std::vector<cv::Point2f> orderCorners(const std::vector<cv::Point>& quad) {
    std::vector<cv::Point2f> pts;
    for (const auto& p : quad) pts.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));

    // The two highest points form the top edge, then split each edge by x
    std::sort(pts.begin(), pts.end(), [](const cv::Point2f& a, const cv::Point2f& b) { return a.y < b.y; });
    auto byX = [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; };
    std::sort(pts.begin(), pts.begin() + 2, byX);
    std::sort(pts.begin() + 2, pts.end(), byX);

    return {pts[0], pts[1], pts[3], pts[2]};
}

std::optional<cv::Mat> locateBoard(const cv::Mat& photo) {
    if (photo.empty()) return std::nullopt;

    cv::Mat gray, blurred, binary;
    cv::cvtColor(photo, gray, cv::COLOR_BGR2GRAY);
    cv::GaussianBlur(gray, blurred, cv::Size(9, 9), 0);
    // Adaptive threshold copes with uneven lighting across the page
    cv::adaptiveThreshold(blurred, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, 11, 2);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<std::pair<double, size_t>> by_area;
    for (size_t i = 0; i < contours.size(); ++i) by_area.emplace_back(cv::contourArea(contours[i]), i);
    std::sort(by_area.begin(), by_area.end(), [](const auto& a, const auto& b) { return a.first > b.first; });

    for (const auto& [area, i] : by_area) {
        if (area < MIN_BOARD_AREA) break;

        std::vector<cv::Point> quad;
        cv::approxPolyDP(contours[i], quad, 0.02 * cv::arcLength(contours[i], true), true);
        if (quad.size() == 4 && cv::isContourConvex(quad)) {
            return warpToRectangle(photo, orderCorners(quad));
        }
    }
    return std::nullopt;
}
