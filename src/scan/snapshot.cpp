#include "snapshot.h"

namespace floorscan {

SurfaceElement::SurfaceElement(SurfaceKind kind, const std::string& id,
		const RigidTransform& transform, const Eigen::Vector3f& dimensions) :
		kind(kind), id(id), transform(transform), dimensions(dimensions) {
}

ObjectElement::ObjectElement(const std::string& id,
		const RigidTransform& transform, const Eigen::Vector3f& dimensions,
		const std::string& category, const std::string& confidence) :
		id(id), transform(transform), dimensions(dimensions),
		category(category), confidence(confidence) {
}

Snapshot::Snapshot(const std::vector<SurfaceElement>& surfaces,
		const std::vector<ObjectElement>& objects) :
		objects(objects) {
	for(const auto& surface : surfaces) {
		switch(surface.kind) {
		case SurfaceKind::Wall:
			walls.push_back(surface);
			break;
		case SurfaceKind::Door:
			doors.push_back(surface);
			break;
		case SurfaceKind::Window:
			windows.push_back(surface);
			break;
		}
	}
}

const std::vector<SurfaceElement>& Snapshot::getWalls() const {
	return walls;
}

const std::vector<SurfaceElement>& Snapshot::getDoors() const {
	return doors;
}

const std::vector<SurfaceElement>& Snapshot::getWindows() const {
	return windows;
}

const std::vector<ObjectElement>& Snapshot::getObjects() const {
	return objects;
}

ElementCounts Snapshot::getCounts() const {
	ElementCounts counts;
	counts.walls = walls.size();
	counts.doors = doors.size();
	counts.windows = windows.size();
	counts.objects = objects.size();
	return counts;
}

bool Snapshot::isEmpty() const {
	return walls.empty() && doors.empty() && windows.empty() && objects.empty();
}

}  // namespace
