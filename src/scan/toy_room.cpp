#include "toy_room.h"

#include <algorithm>
#include <memory>
#include <vector>

#include <logging.h>
#include <math_util.h>

namespace floorscan {

namespace {

const float wall_height = 2.5;
const float wall_thickness = 0.1;

std::vector<SurfaceElement> createToyWalls() {
	// [-3, 3] x [-2, 2] on the floor plane.
	const float half_w = 3;
	const float half_d = 2;
	const float cy = wall_height / 2;
	std::vector<SurfaceElement> walls;
	walls.emplace_back(SurfaceKind::Wall, "wall-north",
		RigidTransform::fromYaw(Eigen::Vector3f(0, cy, -half_d), 0),
		Eigen::Vector3f(half_w * 2, wall_height, wall_thickness));
	walls.emplace_back(SurfaceKind::Wall, "wall-south",
		RigidTransform::fromYaw(Eigen::Vector3f(0, cy, half_d), pi),
		Eigen::Vector3f(half_w * 2, wall_height, wall_thickness));
	walls.emplace_back(SurfaceKind::Wall, "wall-west",
		RigidTransform::fromYaw(Eigen::Vector3f(-half_w, cy, 0), pi / 2),
		Eigen::Vector3f(half_d * 2, wall_height, wall_thickness));
	walls.emplace_back(SurfaceKind::Wall, "wall-east",
		RigidTransform::fromYaw(Eigen::Vector3f(half_w, cy, 0), -pi / 2),
		Eigen::Vector3f(half_d * 2, wall_height, wall_thickness));
	return walls;
}

}  // namespace

SnapshotPtr createToyRoom() {
	INFO("Creating toy room");
	std::vector<SurfaceElement> surfaces = createToyWalls();
	surfaces.emplace_back(SurfaceKind::Door, "door-south",
		RigidTransform::fromYaw(Eigen::Vector3f(1, 1, 2), pi),
		Eigen::Vector3f(0.9, 2.0, wall_thickness));
	surfaces.emplace_back(SurfaceKind::Window, "window-north",
		RigidTransform::fromYaw(Eigen::Vector3f(-1, 1.5, -2), 0),
		Eigen::Vector3f(1.2, 1.0, wall_thickness));

	std::vector<ObjectElement> objects;
	objects.emplace_back("table-0",
		RigidTransform::fromYaw(Eigen::Vector3f(0, 0.375, 0), 0.3),
		Eigen::Vector3f(1.2, 0.75, 0.8), "table", "high");
	objects.emplace_back("sofa-0",
		RigidTransform::fromYaw(Eigen::Vector3f(-2, 0.4, 1), pi / 2),
		Eigen::Vector3f(2.0, 0.8, 0.9), "sofa", "medium");
	return std::make_shared<Snapshot>(surfaces, objects);
}

SnapshotPtr createPartialToyRoom(int num_walls) {
	std::vector<SurfaceElement> walls = createToyWalls();
	const int n = std::max(0, std::min<int>(num_walls, walls.size()));
	walls.resize(n, walls.front());
	return std::make_shared<Snapshot>(walls, std::vector<ObjectElement>());
}

}  // namespace
