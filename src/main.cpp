#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <config.h>
#include <export/dimension_extractor.h>
#include <logging.h>
#include <math_util.h>
#include <render/raster.h>
#include <session/capture_inbox.h>
#include <session/floor_plan_session.h>
#include <session/snapshot_source.h>

namespace fs = boost::filesystem;

namespace {

const int toy_frames = 20;
const int toy_interval_ms = 250;

floorscan::Frame render(const floorscan::FloorPlanSession& session, bool preview) {
	return preview ? session.renderPreview() : session.renderFrame();
}

std::string frameFileName(int index) {
	std::ostringstream name;
	name << "frame_" << std::setw(4) << std::setfill('0') << index << ".png";
	return name.str();
}

void logSummary(const floorscan::FloorPlanSession& session) {
	const auto snapshot = session.getSnapshot();
	if(!snapshot) {
		WARN("No snapshot was captured");
		return;
	}
	const auto counts = snapshot->getCounts();
	const auto dims = floorscan::computeRoomDimensions(snapshot.get());
	INFO("Room summary (walls, doors, windows, objects)",
		counts.walls, counts.doors, counts.windows, counts.objects);
	INFO("Room dimensions (width, height, length)", dims.width, dims.height, dims.length);
	INFO("Trail samples", static_cast<int>(session.getTrail().size()));
	const auto heading = session.getHeading();
	if(heading) {
		INFO("Heading", *heading, floorscan::compassDirection(*heading));
	}
}

}  // namespace

int main(int argc, char** argv) {
	using boost::program_options::notify;
	using boost::program_options::options_description;
	using boost::program_options::parse_command_line;
	using boost::program_options::store;
	using boost::program_options::value;
	using boost::program_options::variables_map;

	options_description desc("Build a live 2D floor plan from room scan snapshots.");
	desc.add_options()
		("help", "show this message")
		("debug", "verbose logging")
		("toy", "Replay a synthetic scan of a toy room")
		("replay", value<std::string>(), "Replay a recorded capture (json path)")
		("config", value<std::string>(), "Plan config (json path)")
		("frames-dir", value<std::string>(), "Write every rendered frame as png into this directory")
		("render", value<std::string>(), "Write the final frame as png")
		("export", value<std::string>(), "Write the room export document (json path)")
		("preview", "Render the static preview instead of the live map");

	variables_map vars;
	try {
		store(parse_command_line(argc, argv, desc), vars);
		notify(vars);
	} catch(const boost::program_options::error& e) {
		std::cerr << e.what() << std::endl;
		std::cerr << desc << std::endl;
		return -1;
	}

	if(vars.count("help") > 0) {
		std::cout << desc << std::endl;
		return 0;
	}
	// Argument sanity check.
	if(vars.count("toy") == 0 && vars.count("replay") == 0) {
		std::cerr << "--toy or --replay is required" << std::endl;
		std::cerr << desc << std::endl;
		return -1;
	}
	if(vars.count("toy") > 0 && vars.count("replay") > 0) {
		std::cerr << "--toy and --replay are exclusive" << std::endl;
		return -1;
	}

	try {
		const floorscan::PlanConfig config = (vars.count("config") > 0) ?
			floorscan::loadPlanConfig(vars["config"].as<std::string>()) :
			floorscan::PlanConfig();
		floorscan::setLogLevel(vars.count("debug") > 0 ? "DEBUG" : config.log_level);
		DEBUG("Config", floorscan::encodePlanConfig(config));

		std::unique_ptr<floorscan::SnapshotSourceInterface> source;
		if(vars.count("toy") > 0) {
			source.reset(new floorscan::ToyScanSource(toy_frames, toy_interval_ms));
		} else {
			source.reset(new floorscan::ReplaySnapshotSource(
				floorscan::ReplaySnapshotSource::fromFile(vars["replay"].as<std::string>())));
		}

		const bool preview = vars.count("preview") > 0;
		fs::path frames_dir;
		if(vars.count("frames-dir") > 0) {
			frames_dir = vars["frames-dir"].as<std::string>();
			if(!fs::exists(frames_dir)) {
				fs::create_directories(frames_dir);
			}
		}

		// Capture feed -> inbox -> session, one frame at a time.
		floorscan::FloorPlanSession session(config);
		floorscan::CaptureInbox inbox;
		const auto t0 = floorscan::Clock::now();
		int index = 0;
		while(const auto frame = source->next()) {
			inbox.postHeading(frame->heading);
			inbox.postSnapshot(frame->snapshot);
			inbox.drainInto(session, t0 + frame->t);
			if(!frames_dir.empty()) {
				const auto rendered = render(session, preview);
				floorscan::writePng(
					floorscan::rasterize(rendered.drawables, session.getCanvas()),
					(frames_dir / frameFileName(index)).string());
			}
			index++;
		}
		INFO("Processed capture frames", index);
		logSummary(session);

		if(vars.count("render") > 0) {
			const auto rendered = render(session, preview);
			const std::string path = vars["render"].as<std::string>();
			floorscan::writePng(floorscan::rasterize(rendered.drawables, session.getCanvas()), path);
			INFO("Rendered", path, static_cast<int>(rendered.drawables.size()));
		}
		if(vars.count("export") > 0) {
			floorscan::writeExportDocument(session.exportDocument(), vars["export"].as<std::string>());
		}
	} catch(const std::exception& e) {
		ERROR("Failed", e.what());
		std::cerr << e.what() << std::endl;
		return 1;
	}
	return 0;
}
