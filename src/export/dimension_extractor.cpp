#include "dimension_extractor.h"

#include <fstream>
#include <stdexcept>

#include <logging.h>
#include <scan/snapshot_codec.h>

namespace floorscan {

namespace {

// Doors and windows: position only.
Json::Value encodeOpenings(const std::vector<SurfaceElement>& openings) {
	Json::Value list(Json::arrayValue);
	for(const auto& opening : openings) {
		Json::Value element;
		element["id"] = opening.id;
		element["dimensions"] = encodeDimensions(opening.dimensions, "depth");
		element["transform"]["position"] = encodePosition(opening.transform.getPosition());
		list.append(element);
	}
	return list;
}

}  // namespace

boost::optional<AABB3f> computeWallBounds(const Snapshot& snapshot) {
	boost::optional<AABB3f> bounds;
	for(const auto& wall : snapshot.getWalls()) {
		const AABB3f extent = AABB3f::fromCenterSize(wall.transform.getPosition(), wall.dimensions);
		bounds = bounds ? (*bounds | extent) : extent;
	}
	return bounds;
}

RoomDimensions computeRoomDimensions(const Snapshot* snapshot) {
	if(snapshot == nullptr) {
		return RoomDimensions{0, 0, 0};
	}
	const auto bounds = computeWallBounds(*snapshot);
	if(!bounds) {
		return RoomDimensions{0, 0, 0};
	}
	const Eigen::Vector3f size = bounds->getSize();
	return RoomDimensions{size.x(), size.y(), size.z()};
}

Json::Value buildExportDocument(const Snapshot* snapshot) {
	const RoomDimensions dims = computeRoomDimensions(snapshot);
	Json::Value doc;
	doc["dimensions"]["width"] = dims.width;
	doc["dimensions"]["height"] = dims.height;
	doc["dimensions"]["length"] = dims.length;
	doc["walls"] = Json::arrayValue;
	doc["doors"] = Json::arrayValue;
	doc["windows"] = Json::arrayValue;
	doc["objects"] = Json::arrayValue;
	if(snapshot == nullptr) {
		return doc;
	}

	for(const auto& wall : snapshot->getWalls()) {
		Json::Value element;
		element["id"] = wall.id;
		element["dimensions"] = encodeDimensions(wall.dimensions, "thickness");
		element["transform"]["position"] = encodePosition(wall.transform.getPosition());
		element["transform"]["matrix"] = encodeMatrix(wall.transform);
		doc["walls"].append(element);
	}
	doc["doors"] = encodeOpenings(snapshot->getDoors());
	doc["windows"] = encodeOpenings(snapshot->getWindows());
	for(const auto& object : snapshot->getObjects()) {
		Json::Value element;
		element["id"] = object.id;
		element["category"] = object.category;
		element["confidence"] = object.confidence;
		element["dimensions"] = encodeDimensions(object.dimensions, "depth");
		element["transform"]["position"] = encodePosition(object.transform.getPosition());
		doc["objects"].append(element);
	}
	return doc;
}

void writeExportDocument(const Json::Value& doc, const std::string& path) {
	std::ofstream f_output(path);
	if(!f_output.is_open()) {
		ERROR("Couldn't open export destination", path);
		throw std::runtime_error("Couldn't open " + path);
	}
	f_output << Json::StyledWriter().write(doc);
	f_output.close();
	if(f_output.fail()) {
		ERROR("Failed to write export document", path);
		throw std::runtime_error("Failed to write " + path);
	}
	INFO("Exported room", path,
		static_cast<int>(doc["walls"].size()),
		static_cast<int>(doc["doors"].size()),
		static_cast<int>(doc["windows"].size()),
		static_cast<int>(doc["objects"].size()));
}

}  // namespace
