#include "logging.h"

#include <cstdint>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>

namespace floorscan {

namespace {

const std::map<std::string, int>& levelRanks() {
	static const std::map<std::string, int> ranks = {
		{"DEBUG", 0},
		{"INFO", 1},
		{"WARN", 2},
		{"ERROR", 3},
	};
	return ranks;
}

int min_rank = 0;
std::ostream* log_stream = nullptr;

const std::string& sessionId() {
	static std::string session_id = "";
	if(session_id == "") {
		std::random_device rd;
		using SessionId = uint64_t;
		const SessionId v = std::uniform_int_distribution<SessionId>(0, std::numeric_limits<SessionId>::max())(rd);
		session_id = std::to_string(v);
	}
	return session_id;
}

}  // namespace

void setLogLevel(const std::string& level) {
	const auto it = levelRanks().find(level);
	if(it == levelRanks().end()) {
		throw std::invalid_argument("Unknown log level: " + level);
	}
	min_rank = it->second;
}

void setLogStream(std::ostream* stream) {
	log_stream = stream;
}

bool isLogLevelEnabled(const std::string& level) {
	const auto it = levelRanks().find(level);
	// Unknown levels are never filtered.
	return it == levelRanks().end() || it->second >= min_rank;
}

void logJsonRaw(const std::string& level, const std::string& path, int line, const Json::Value& msg) {
	Json::Value entry;
	entry["session_id"] = sessionId();
	entry["msg"] = msg;
	entry["date"] = boost::posix_time::to_iso_extended_string(boost::posix_time::microsec_clock::universal_time());
	entry["level"] = level;
	entry["loc"]["path"] = path;
	entry["loc"]["line"] = line;
	std::ostream& os = (log_stream != nullptr) ? *log_stream : std::cout;
	os << Json::FastWriter().write(entry);
}

Json::Value packMessageReversed() {
	return Json::arrayValue;
}

}  // namespace
