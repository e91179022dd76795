#pragma once

#include <string>

#include <jsoncpp/json/json.h>

#include <scan/rigid_transform.h>
#include <scan/snapshot.h>

namespace floorscan {

// Matrix encoding shared by the capture feed and the export document:
// 4 arrays of 4 numbers, one per column (right, up, forward, position),
// each including its homogeneous w.
Json::Value encodeMatrix(const RigidTransform& transform);

// Throws std::runtime_error unless json is 4 arrays of 4 numbers.
RigidTransform decodeMatrix(const Json::Value& json);

Json::Value encodePosition(const Eigen::Vector3f& position);

// {width, height, <third_key>}; third_key is "thickness" for walls
// and "depth" for every other element.
Json::Value encodeDimensions(const Eigen::Vector3f& dims, const std::string& third_key);

// Throws std::runtime_error when x, y or z is missing or non-numeric.
Eigen::Vector3f decodePosition(const Json::Value& json);

// Decode {walls, doors, windows, objects} into a Snapshot.
// Every list is optional. An element's transform is taken from
// "transform.matrix" when present, otherwise from "transform.position"
// with an identity basis. This accepts both capture-feed snapshots and
// export documents.
// Throws std::runtime_error for malformed elements.
SnapshotPtr decodeSnapshot(const Json::Value& json);

// Full-fidelity capture-feed encoding (every element keeps its matrix).
Json::Value encodeSnapshot(const Snapshot& snapshot);

// Parse a json file.
// Throws std::runtime_error when unreadable or not valid json.
Json::Value loadJsonFile(const std::string& path);

}  // namespace
