#pragma once

#include <string>

#include <jsoncpp/json/json.h>

namespace floorscan {

// Tunable constants of the floor plan pipeline.
// Distances are in meters unless suffixed with _px.
struct PlanConfig {
	// Trail history.
	int trail_capacity = 200;
	int trail_interval_ms = 200;

	// Basis vectors shorter than this (on the horizontal plane)
	// are treated as degenerate. Also the minimum fitted extent.
	float epsilon = 1e-3f;

	// Viewport fitting.
	float padding = 0.5f;
	float margin_factor = 0.85f;
	float preview_margin_factor = 0.9f;
	float fallback_scale = 20.0f;  // px/m
	int canvas_width = 800;
	int canvas_height = 600;

	// Projection.
	float grid_min_spacing_px = 8.0f;
	float fov_half_angle_deg = 30.0f;
	float fov_length_px = 40.0f;
	float device_glyph_size_px = 12.0f;

	std::string log_level = "INFO";
};

// Overlay keys present in json on top of defaults.
// Throws std::runtime_error for wrongly typed or out-of-range values.
PlanConfig decodePlanConfig(const Json::Value& json);

// Load config json file.
// Throws std::runtime_error when the file is missing or malformed.
PlanConfig loadPlanConfig(const std::string& path);

Json::Value encodePlanConfig(const PlanConfig& config);

}  // namespace
