#pragma once

#include <string>

#include <boost/optional.hpp>
#include <jsoncpp/json/json.h>

#include <geom/util.h>
#include <scan/snapshot.h>

namespace floorscan {

// Overall room size in meters: X span, Y span, Z span.
struct RoomDimensions {
	float width;
	float height;
	float length;
};

// Tightest axis-aligned box containing every wall's extent,
// taken as position +/- dimensions / 2 per axis.
// none when there's no wall.
boost::optional<AABB3f> computeWallBounds(const Snapshot& snapshot);

// (0, 0, 0) when snapshot is null or has no wall.
RoomDimensions computeRoomDimensions(const Snapshot* snapshot);

// Export document:
// {"dimensions": {width, height, length}, "walls", "doors", "windows", "objects"}
// Walls carry position and full matrix; doors, windows and objects
// carry position only (objects add category and confidence).
// A null snapshot gives zero dimensions and empty lists.
Json::Value buildExportDocument(const Snapshot* snapshot);

// Write doc as indented json.
// Throws std::runtime_error when the file can't be written.
void writeExportDocument(const Json::Value& doc, const std::string& path);

}  // namespace
