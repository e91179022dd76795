#include "config.h"

#include <cmath>
#include <fstream>
#include <stdexcept>

#include <logging.h>

namespace floorscan {

namespace {

void readFloat(const Json::Value& json, const std::string& key, float& out) {
	if(!json.isMember(key)) {
		return;
	}
	if(!json[key].isNumeric()) {
		throw std::runtime_error("Config key '" + key + "' must be a number");
	}
	out = json[key].asFloat();
	if(!std::isfinite(out)) {
		throw std::runtime_error("Config key '" + key + "' must be finite");
	}
}

void readInt(const Json::Value& json, const std::string& key, int& out) {
	if(!json.isMember(key)) {
		return;
	}
	if(!json[key].isInt()) {
		throw std::runtime_error("Config key '" + key + "' must be an integer");
	}
	out = json[key].asInt();
}

void requirePositive(float value, const std::string& key) {
	if(!(value > 0)) {
		throw std::runtime_error("Config key '" + key + "' must be positive");
	}
}

}  // namespace

PlanConfig decodePlanConfig(const Json::Value& json) {
	PlanConfig config;
	if(json.isNull()) {
		return config;
	}
	if(!json.isObject()) {
		throw std::runtime_error("Config root must be an object");
	}
	readInt(json, "trail_capacity", config.trail_capacity);
	readInt(json, "trail_interval_ms", config.trail_interval_ms);
	readFloat(json, "epsilon", config.epsilon);
	readFloat(json, "padding", config.padding);
	readFloat(json, "margin_factor", config.margin_factor);
	readFloat(json, "preview_margin_factor", config.preview_margin_factor);
	readFloat(json, "fallback_scale", config.fallback_scale);
	readInt(json, "canvas_width", config.canvas_width);
	readInt(json, "canvas_height", config.canvas_height);
	readFloat(json, "grid_min_spacing_px", config.grid_min_spacing_px);
	readFloat(json, "fov_half_angle_deg", config.fov_half_angle_deg);
	readFloat(json, "fov_length_px", config.fov_length_px);
	readFloat(json, "device_glyph_size_px", config.device_glyph_size_px);
	if(json.isMember("log_level")) {
		if(!json["log_level"].isString()) {
			throw std::runtime_error("Config key 'log_level' must be a string");
		}
		config.log_level = json["log_level"].asString();
	}

	if(config.trail_capacity <= 0) {
		throw std::runtime_error("Config key 'trail_capacity' must be positive");
	}
	if(config.trail_interval_ms < 0) {
		throw std::runtime_error("Config key 'trail_interval_ms' must not be negative");
	}
	if(config.padding < 0) {
		throw std::runtime_error("Config key 'padding' must not be negative");
	}
	if(!(config.margin_factor > 0 && config.margin_factor <= 1)) {
		throw std::runtime_error("Config key 'margin_factor' must be in (0, 1]");
	}
	if(!(config.preview_margin_factor > 0 && config.preview_margin_factor <= 1)) {
		throw std::runtime_error("Config key 'preview_margin_factor' must be in (0, 1]");
	}
	if(config.canvas_width <= 0 || config.canvas_height <= 0) {
		throw std::runtime_error("Canvas size must be positive");
	}
	requirePositive(config.epsilon, "epsilon");
	requirePositive(config.fallback_scale, "fallback_scale");
	requirePositive(config.grid_min_spacing_px, "grid_min_spacing_px");
	requirePositive(config.fov_length_px, "fov_length_px");
	requirePositive(config.device_glyph_size_px, "device_glyph_size_px");
	if(!(config.fov_half_angle_deg > 0 && config.fov_half_angle_deg < 90)) {
		throw std::runtime_error("Config key 'fov_half_angle_deg' must be in (0, 90)");
	}
	return config;
}

PlanConfig loadPlanConfig(const std::string& path) {
	std::ifstream f_input(path);
	if(!f_input.is_open()) {
		WARN("Couldn't open config file", path);
		throw std::runtime_error("Couldn't open config file " + path);
	}
	Json::Value json;
	Json::Reader reader;
	if(!reader.parse(f_input, json, false)) {
		WARN("couldn't parse config json file", path);
		throw std::runtime_error(reader.getFormattedErrorMessages());
	}
	return decodePlanConfig(json);
}

Json::Value encodePlanConfig(const PlanConfig& config) {
	Json::Value json;
	json["trail_capacity"] = config.trail_capacity;
	json["trail_interval_ms"] = config.trail_interval_ms;
	json["epsilon"] = config.epsilon;
	json["padding"] = config.padding;
	json["margin_factor"] = config.margin_factor;
	json["preview_margin_factor"] = config.preview_margin_factor;
	json["fallback_scale"] = config.fallback_scale;
	json["canvas_width"] = config.canvas_width;
	json["canvas_height"] = config.canvas_height;
	json["grid_min_spacing_px"] = config.grid_min_spacing_px;
	json["fov_half_angle_deg"] = config.fov_half_angle_deg;
	json["fov_length_px"] = config.fov_length_px;
	json["device_glyph_size_px"] = config.device_glyph_size_px;
	json["log_level"] = config.log_level;
	return json;
}

}  // namespace
