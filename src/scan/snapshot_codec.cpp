#include "snapshot_codec.h"

#include <fstream>
#include <stdexcept>

#include <boost/range/irange.hpp>

#include <logging.h>

namespace floorscan {

namespace {

float requireNumber(const Json::Value& json, const std::string& key, const std::string& context) {
	if(!json.isMember(key) || !json[key].isNumeric()) {
		throw std::runtime_error(context + ": '" + key + "' must be a number");
	}
	return json[key].asFloat();
}

std::string requireId(const Json::Value& element, const std::string& context) {
	if(!element.isObject()) {
		throw std::runtime_error(context + ": element must be an object");
	}
	if(!element["id"].isString() || element["id"].asString().empty()) {
		throw std::runtime_error(context + ": element without id");
	}
	return element["id"].asString();
}

RigidTransform decodeElementTransform(const Json::Value& element, const std::string& context) {
	const Json::Value& transform = element["transform"];
	if(!transform.isObject()) {
		throw std::runtime_error(context + ": element without transform");
	}
	if(transform.isMember("matrix")) {
		return decodeMatrix(transform["matrix"]);
	}
	if(transform.isMember("position")) {
		return RigidTransform::fromPosition(decodePosition(transform["position"]));
	}
	throw std::runtime_error(context + ": transform needs matrix or position");
}

// The third dimension is "thickness" for walls and "depth" elsewhere.
Eigen::Vector3f decodeDimensions(const Json::Value& element,
		const std::string& third_key, const std::string& context) {
	const Json::Value& dims = element["dimensions"];
	if(!dims.isObject()) {
		throw std::runtime_error(context + ": element without dimensions");
	}
	return Eigen::Vector3f(
		requireNumber(dims, "width", context),
		requireNumber(dims, "height", context),
		requireNumber(dims, third_key, context));
}

void decodeSurfaces(const Json::Value& json, const std::string& key,
		SurfaceKind kind, std::vector<SurfaceElement>& surfaces) {
	if(!json.isMember(key)) {
		return;
	}
	if(!json[key].isArray()) {
		throw std::runtime_error("'" + key + "' must be an array");
	}
	const std::string third_key = (kind == SurfaceKind::Wall) ? "thickness" : "depth";
	for(const auto& element : json[key]) {
		const std::string id = requireId(element, key);
		const std::string context = key + "/" + id;
		surfaces.emplace_back(kind, id,
			decodeElementTransform(element, context),
			decodeDimensions(element, third_key, context));
	}
}

std::string optionalString(const Json::Value& element, const std::string& key) {
	return element[key].isString() ? element[key].asString() : "";
}

}  // namespace

Json::Value encodeDimensions(const Eigen::Vector3f& dims, const std::string& third_key) {
	Json::Value json;
	json["width"] = dims.x();
	json["height"] = dims.y();
	json[third_key] = dims.z();
	return json;
}

Json::Value encodeMatrix(const RigidTransform& transform) {
	const Eigen::Matrix4f m = transform.getMatrix();
	Json::Value json(Json::arrayValue);
	for(const int col : boost::irange(0, 4)) {
		Json::Value column(Json::arrayValue);
		for(const int row : boost::irange(0, 4)) {
			column.append(m(row, col));
		}
		json.append(column);
	}
	return json;
}

RigidTransform decodeMatrix(const Json::Value& json) {
	if(!json.isArray() || json.size() != 4) {
		throw std::runtime_error("Invalid transform matrix (#columns != 4)");
	}
	Eigen::Matrix4f m;
	for(const int col : boost::irange(0, 4)) {
		const Json::Value& column = json[col];
		if(!column.isArray() || column.size() != 4) {
			throw std::runtime_error("Invalid transform matrix (#rows != 4)");
		}
		for(const int row : boost::irange(0, 4)) {
			if(!column[row].isNumeric()) {
				throw std::runtime_error("Invalid transform matrix (non-numeric entry)");
			}
			m(row, col) = column[row].asFloat();
		}
	}
	return RigidTransform(m);
}

Json::Value encodePosition(const Eigen::Vector3f& position) {
	Json::Value json;
	json["x"] = position.x();
	json["y"] = position.y();
	json["z"] = position.z();
	return json;
}

Eigen::Vector3f decodePosition(const Json::Value& json) {
	if(!json.isObject()) {
		throw std::runtime_error("Invalid position (not an object)");
	}
	return Eigen::Vector3f(
		requireNumber(json, "x", "position"),
		requireNumber(json, "y", "position"),
		requireNumber(json, "z", "position"));
}

SnapshotPtr decodeSnapshot(const Json::Value& json) {
	if(!json.isObject()) {
		throw std::runtime_error("Snapshot root must be an object");
	}
	std::vector<SurfaceElement> surfaces;
	decodeSurfaces(json, "walls", SurfaceKind::Wall, surfaces);
	decodeSurfaces(json, "doors", SurfaceKind::Door, surfaces);
	decodeSurfaces(json, "windows", SurfaceKind::Window, surfaces);

	std::vector<ObjectElement> objects;
	if(json.isMember("objects")) {
		if(!json["objects"].isArray()) {
			throw std::runtime_error("'objects' must be an array");
		}
		for(const auto& element : json["objects"]) {
			const std::string id = requireId(element, "objects");
			const std::string context = "objects/" + id;
			objects.emplace_back(id,
				decodeElementTransform(element, context),
				decodeDimensions(element, "depth", context),
				optionalString(element, "category"),
				optionalString(element, "confidence"));
		}
	}
	SnapshotPtr snapshot = std::make_shared<Snapshot>(surfaces, objects);
	const auto counts = snapshot->getCounts();
	DEBUG("Decoded snapshot", counts.walls, counts.doors, counts.windows, counts.objects);
	return snapshot;
}

Json::Value encodeSnapshot(const Snapshot& snapshot) {
	Json::Value json;
	auto encodeSurfaces = [](const std::vector<SurfaceElement>& surfaces) {
		Json::Value list(Json::arrayValue);
		for(const auto& surface : surfaces) {
			Json::Value element;
			element["id"] = surface.id;
			element["dimensions"] = encodeDimensions(surface.dimensions,
				(surface.kind == SurfaceKind::Wall) ? "thickness" : "depth");
			element["transform"]["matrix"] = encodeMatrix(surface.transform);
			list.append(element);
		}
		return list;
	};
	json["walls"] = encodeSurfaces(snapshot.getWalls());
	json["doors"] = encodeSurfaces(snapshot.getDoors());
	json["windows"] = encodeSurfaces(snapshot.getWindows());
	json["objects"] = Json::arrayValue;
	for(const auto& object : snapshot.getObjects()) {
		Json::Value element;
		element["id"] = object.id;
		element["category"] = object.category;
		element["confidence"] = object.confidence;
		element["dimensions"] = encodeDimensions(object.dimensions, "depth");
		element["transform"]["matrix"] = encodeMatrix(object.transform);
		json["objects"].append(element);
	}
	return json;
}

Json::Value loadJsonFile(const std::string& path) {
	std::ifstream f_input(path);
	if(!f_input.is_open()) {
		throw std::runtime_error("Couldn't open " + path);
	}
	Json::Value json;
	Json::Reader reader;
	if(!reader.parse(f_input, json, false)) {
		WARN("couldn't parse json file", path);
		throw std::runtime_error(reader.getFormattedErrorMessages());
	}
	return json;
}

}  // namespace
