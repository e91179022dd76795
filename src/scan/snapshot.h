#pragma once

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include <scan/rigid_transform.h>

namespace floorscan {

enum class SurfaceKind {
	Wall,
	Door,
	Window
};

// A planar element detected by the capture session.
// dimensions: (width, height, thickness). width runs along the
// transform's right vector.
struct SurfaceElement {
	SurfaceElement(SurfaceKind kind, const std::string& id,
		const RigidTransform& transform, const Eigen::Vector3f& dimensions);

	SurfaceKind kind;
	std::string id;
	RigidTransform transform;
	Eigen::Vector3f dimensions;
};

// A furniture-like box. dimensions: (width, height, depth).
struct ObjectElement {
	ObjectElement(const std::string& id,
		const RigidTransform& transform, const Eigen::Vector3f& dimensions,
		const std::string& category, const std::string& confidence);

	std::string id;
	RigidTransform transform;
	Eigen::Vector3f dimensions;
	std::string category;
	std::string confidence;
};

struct ElementCounts {
	int walls;
	int doors;
	int windows;
	int objects;
};

// Complete, immutable geometry at one capture update.
// A newer Snapshot replaces an older one as a whole.
class Snapshot {
public:
	// Surfaces are sorted into walls / doors / windows by kind,
	// keeping their relative order.
	Snapshot(const std::vector<SurfaceElement>& surfaces,
		const std::vector<ObjectElement>& objects);

	const std::vector<SurfaceElement>& getWalls() const;
	const std::vector<SurfaceElement>& getDoors() const;
	const std::vector<SurfaceElement>& getWindows() const;
	const std::vector<ObjectElement>& getObjects() const;

	ElementCounts getCounts() const;
	bool isEmpty() const;
private:
	std::vector<SurfaceElement> walls;
	std::vector<SurfaceElement> doors;
	std::vector<SurfaceElement> windows;
	std::vector<ObjectElement> objects;
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

}  // namespace
