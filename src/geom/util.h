#pragma once

#include <Eigen/Dense>

namespace floorscan {

// Axis-aligned box on the horizontal (X-Z) plane.
// Coordinates are (x, z) of the 3D scene.
class AABB2f {
public:
	AABB2f(const Eigen::Vector2f& vmin, const Eigen::Vector2f& vmax);

	// Degenerate box containing exactly p.
	static AABB2f fromPoint(const Eigen::Vector2f& p);

	Eigen::Vector2f getMin() const;
	Eigen::Vector2f getMax() const;
	Eigen::Vector2f getCenter() const;
	Eigen::Vector2f getSize() const;
	bool contains(const Eigen::Vector2f& query) const;

	// Return box grown by margin on every side.
	AABB2f padded(float margin) const;

	// Return smallest box containing this and p.
	AABB2f extended(const Eigen::Vector2f& p) const;
private:
	Eigen::Vector2f vmin;
	Eigen::Vector2f vmax;
};

AABB2f operator|(AABB2f lhs, const AABB2f& rhs);


class AABB3f {
public:
	AABB3f(const Eigen::Vector3f& vmin, const Eigen::Vector3f& vmax);

	// Box of given full size around center.
	static AABB3f fromCenterSize(const Eigen::Vector3f& center, const Eigen::Vector3f& size);

	Eigen::Vector3f getMin() const;
	Eigen::Vector3f getMax() const;
	Eigen::Vector3f getCenter() const;
	Eigen::Vector3f getSize() const;
	bool contains(const Eigen::Vector3f& query) const;
private:
	Eigen::Vector3f vmin;
	Eigen::Vector3f vmax;
};

AABB3f operator|(AABB3f lhs, const AABB3f& rhs);

}  // namespace
