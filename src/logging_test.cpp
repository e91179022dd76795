#include "logging.h"

#include <sstream>

#include <gtest/gtest.h>

namespace {

Json::Value parseLine(const std::string& line) {
	Json::Value v;
	EXPECT_TRUE(Json::Reader().parse(line, v));
	return v;
}

}  // namespace

class LoggingTest : public ::testing::Test {
protected:
	void SetUp() override {
		floorscan::setLogStream(&captured);
		floorscan::setLogLevel("DEBUG");
	}

	void TearDown() override {
		floorscan::setLogStream(nullptr);
		floorscan::setLogLevel("INFO");
	}

	std::ostringstream captured;
};

TEST_F(LoggingTest, SingleArgumentIsBareMessage) {
	INFO("hello");
	const auto entry = parseLine(captured.str());
	EXPECT_EQ("INFO", entry["level"].asString());
	EXPECT_EQ("hello", entry["msg"].asString());
	EXPECT_TRUE(entry["loc"]["line"].isInt());
	EXPECT_FALSE(entry["session_id"].asString().empty());
	EXPECT_FALSE(entry["date"].asString().empty());
}

TEST_F(LoggingTest, MultipleArgumentsKeepOrder) {
	WARN("walls", 4, 1.5);
	const auto entry = parseLine(captured.str());
	ASSERT_TRUE(entry["msg"].isArray());
	ASSERT_EQ(3, entry["msg"].size());
	EXPECT_EQ("walls", entry["msg"][0].asString());
	EXPECT_EQ(4, entry["msg"][1].asInt());
	EXPECT_DOUBLE_EQ(1.5, entry["msg"][2].asDouble());
}

TEST_F(LoggingTest, LevelFilterDropsLowerLevels) {
	floorscan::setLogLevel("WARN");
	INFO("dropped");
	DEBUG("dropped");
	EXPECT_TRUE(captured.str().empty());
	ERROR("kept");
	EXPECT_FALSE(captured.str().empty());
}

TEST_F(LoggingTest, UnknownLevelIsRejected) {
	EXPECT_THROW(floorscan::setLogLevel("VERBOSE"), std::invalid_argument);
}
