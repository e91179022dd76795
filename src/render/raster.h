#pragma once

#include <string>
#include <vector>

#include <Eigen/Dense>
#include <opencv2/opencv.hpp>

#include <view/drawable.h>
#include <view/viewport.h>

namespace floorscan {

// Paint drawables in order over a near-black background.
// Returns CV_8UC3 BGR image of canvas size. Drawables with
// non-finite points are skipped.
cv::Mat rasterize(const std::vector<Drawable>& drawables, const CanvasSize& canvas);

// Split a polyline into the "on" runs of a dash pattern
// (alternating on/off lengths in px). An empty or unusable pattern
// returns the whole polyline.
std::vector<std::vector<Eigen::Vector2f>> splitDashes(
	const std::vector<Eigen::Vector2f>& points, const std::vector<float>& dash);

// Throws std::runtime_error when the image can't be written.
void writePng(const cv::Mat& image, const std::string& path);

}  // namespace
