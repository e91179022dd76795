#include "raster.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <logging.h>

namespace floorscan {

namespace {

const cv::Scalar background(20, 20, 20);

// Sub-pixel precision passed to OpenCV drawing functions.
const int shift_bits = 4;
const float shift_scale = 1 << shift_bits;

cv::Scalar toBGR(const Color& color) {
	return cv::Scalar(color.b * 255, color.g * 255, color.r * 255);
}

int toThickness(float width) {
	return std::max(1, static_cast<int>(std::round(width)));
}

// Fixed-point points relative to origin.
std::vector<cv::Point> toFixed(const std::vector<Eigen::Vector2f>& points, const cv::Point& origin) {
	std::vector<cv::Point> fixed;
	for(const auto& p : points) {
		fixed.emplace_back(
			cvRound((p.x() - origin.x) * shift_scale),
			cvRound((p.y() - origin.y) * shift_scale));
	}
	return fixed;
}

cv::Rect boundsOf(const Drawable& drawable) {
	Eigen::Vector2f vmin = drawable.points.front();
	Eigen::Vector2f vmax = vmin;
	for(const auto& p : drawable.points) {
		vmin = vmin.cwiseMin(p);
		vmax = vmax.cwiseMax(p);
	}
	const float margin = drawable.radius + drawable.style.stroke_width + 2;
	const int x0 = std::floor(vmin.x() - margin);
	const int y0 = std::floor(vmin.y() - margin);
	const int x1 = std::ceil(vmax.x() + margin);
	const int y1 = std::ceil(vmax.y() + margin);
	return cv::Rect(x0, y0, x1 - x0, y1 - y0);
}

// Run painter on the region of image covered by bounds, blending the
// result with given alpha. painter receives the region and its origin.
template<typename Painter>
void paintBlended(cv::Mat& image, const cv::Rect& bounds, float alpha, Painter painter) {
	const cv::Rect roi = bounds & cv::Rect(0, 0, image.cols, image.rows);
	if(roi.area() <= 0 || !(alpha > 0)) {
		return;
	}
	cv::Mat target = image(roi);
	if(alpha >= 1) {
		painter(target, roi.tl());
		return;
	}
	cv::Mat layer = target.clone();
	painter(layer, roi.tl());
	cv::addWeighted(layer, alpha, target, 1 - alpha, 0, target);
}

void paintDrawable(cv::Mat& image, const Drawable& drawable) {
	const cv::Rect bounds = boundsOf(drawable);
	const Style& style = drawable.style;

	if(style.fill) {
		const cv::Scalar color = toBGR(*style.fill);
		paintBlended(image, bounds, style.fill->a, [&](cv::Mat& target, const cv::Point& origin) {
			if(drawable.kind == DrawableKind::Circle) {
				const auto center = toFixed({drawable.points[0]}, origin)[0];
				cv::circle(target, center, cvRound(drawable.radius * shift_scale),
					color, -1, cv::LINE_AA, shift_bits);
			} else if(drawable.kind == DrawableKind::Polygon) {
				const std::vector<std::vector<cv::Point>> polys = {toFixed(drawable.points, origin)};
				cv::fillPoly(target, polys, color, cv::LINE_AA, shift_bits);
			}
		});
	}
	if(style.stroke) {
		const cv::Scalar color = toBGR(*style.stroke);
		const int thickness = toThickness(style.stroke_width);
		paintBlended(image, bounds, style.stroke->a, [&](cv::Mat& target, const cv::Point& origin) {
			if(drawable.kind == DrawableKind::Circle) {
				const auto center = toFixed({drawable.points[0]}, origin)[0];
				cv::circle(target, center, cvRound(drawable.radius * shift_scale),
					color, thickness, cv::LINE_AA, shift_bits);
				return;
			}
			const bool closed = drawable.kind == DrawableKind::Polygon;
			std::vector<Eigen::Vector2f> path = drawable.points;
			if(closed) {
				path.push_back(path.front());
			}
			std::vector<std::vector<cv::Point>> runs;
			for(const auto& run : splitDashes(path, style.dash)) {
				runs.push_back(toFixed(run, origin));
			}
			cv::polylines(target, runs, false, color, thickness, cv::LINE_AA, shift_bits);
		});
	}
}

bool isDrawable(const Drawable& drawable) {
	if(drawable.points.empty() || !std::isfinite(drawable.radius)) {
		return false;
	}
	for(const auto& p : drawable.points) {
		if(!p.allFinite()) {
			return false;
		}
	}
	return true;
}

}  // namespace

cv::Mat rasterize(const std::vector<Drawable>& drawables, const CanvasSize& canvas) {
	cv::Mat image(canvas.height, canvas.width, CV_8UC3, background);
	int skipped = 0;
	for(const auto& drawable : drawables) {
		if(!isDrawable(drawable)) {
			skipped++;
			continue;
		}
		paintDrawable(image, drawable);
	}
	if(skipped > 0) {
		WARN("Skipped drawables with non-finite geometry", skipped);
	}
	return image;
}

std::vector<std::vector<Eigen::Vector2f>> splitDashes(
		const std::vector<Eigen::Vector2f>& points, const std::vector<float>& dash) {
	float period = 0;
	bool usable = true;
	for(const float len : dash) {
		usable &= std::isfinite(len) && len >= 0;
		period += len;
	}
	if(dash.empty() || !usable || !(period > 0) || points.size() < 2) {
		return {points};
	}

	std::vector<std::vector<Eigen::Vector2f>> runs;
	std::vector<Eigen::Vector2f> current = {points.front()};
	int index = 0;
	float remaining = dash[0];
	bool on = true;
	for(size_t i = 1; i < points.size(); i++) {
		Eigen::Vector2f p = points[i - 1];
		const Eigen::Vector2f& q = points[i];
		float length = (q - p).norm();
		if(length <= 0) {
			continue;
		}
		const Eigen::Vector2f dir = (q - p) / length;
		while(length > remaining) {
			p += dir * remaining;
			length -= remaining;
			current.push_back(p);
			if(on) {
				runs.push_back(current);
			}
			current = {p};
			on = !on;
			index = (index + 1) % dash.size();
			remaining = dash[index];
		}
		remaining -= length;
		current.push_back(q);
	}
	if(on && current.size() >= 2) {
		runs.push_back(current);
	}
	return runs;
}

void writePng(const cv::Mat& image, const std::string& path) {
	bool written = false;
	try {
		written = cv::imwrite(path, image);
	} catch(const cv::Exception& e) {
		ERROR("imwrite failed", path, e.what());
	}
	if(!written) {
		throw std::runtime_error("Couldn't write image " + path);
	}
}

}  // namespace
