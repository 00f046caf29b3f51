#pragma once

#include <optional>
#include <vector>
#include <opencv2/core.hpp>

// Corners ordered top-left, top-right, bottom-right, bottom-left.
std::vector<cv::Point2f> orderCorners(const std::vector<cv::Point>& quad);

// Largest convex quadrilateral in the photo, warped to a top-down crop.
// std::nullopt when the photo contains no board-like outline.
std::optional<cv::Mat> locateBoard(const cv::Mat& photo);
