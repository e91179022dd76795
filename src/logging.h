#pragma once

#include <iostream>
#include <string>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <jsoncpp/json/json.h>

// Structured logging. Each call emits one JSON object per line:
// {"session_id", "date", "level", "loc": {"path", "line"}, "msg"}
// msg is the single argument, or an array when multiple are given.
#define INFO(...) floorscan::logJson("INFO", __FILE__, __LINE__, __VA_ARGS__)
#define DEBUG(...) floorscan::logJson("DEBUG", __FILE__, __LINE__, __VA_ARGS__)
#define WARN(...) floorscan::logJson("WARN", __FILE__, __LINE__, __VA_ARGS__)
#define ERROR(...) floorscan::logJson("ERROR", __FILE__, __LINE__, __VA_ARGS__)

namespace floorscan {

// Drop messages below given level ("DEBUG", "INFO", "WARN", "ERROR").
// Throws std::invalid_argument for unknown names.
void setLogLevel(const std::string& level);

// Redirect log lines. nullptr restores std::cout.
void setLogStream(std::ostream* stream);

bool isLogLevelEnabled(const std::string& level);

void logJsonRaw(const std::string& level, const std::string& path, int line, const Json::Value& msg);

Json::Value packMessageReversed();

template<typename MessageType0, typename... MessageTypes>
Json::Value packMessageReversed(MessageType0 msg_head, MessageTypes... msg_tail) {
	Json::Value rest = packMessageReversed(msg_tail...);
	rest.append(msg_head);
	return rest;
}


template<typename... MessageType>
void logJson(const std::string& level, const std::string& path, int line, MessageType... msgs) {
	if(!isLogLevelEnabled(level)) {
		return;
	}
	Json::Value message_rev = packMessageReversed(msgs...);
	if(message_rev.size() == 1) {
		logJsonRaw(level, path, line, message_rev[0]);
	} else {
		Json::Value array(Json::arrayValue);
		for(int i = message_rev.size() - 1; i >= 0; i--) {
			array.append(message_rev[i]);
		}
		logJsonRaw(level, path, line, array);
	}
}

}  // namespace
