#include "rctx/util/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace rctx::util;

namespace {

// Points the process logger at a scratch file and puts it back afterwards.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "rctx_logger_test.log";
        std::remove(path_.c_str());
        logger().setFile(path_);
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
    }

    void TearDown() override {
        logger().setFile("");
        logger().setLevel(LogLevel::Info);
        logger().setFormatJson(false);
        std::remove(path_.c_str());
    }

    std::string contents() {
        logger().setFile("");   // closes the file
        std::ifstream in(path_);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
};

} // namespace

TEST_F(LoggerTest, TextLineCarriesLevelMessageAndFields) {
    logger().log(LogLevel::Info, "pool.rejected", {{"reason", "shutdown"}});
    const auto out = contents();
    EXPECT_NE(out.find("INFO"), std::string::npos);
    EXPECT_NE(out.find("pool.rejected reason=shutdown"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST_F(LoggerTest, LinesBelowLevelAreDropped) {
    logger().setLevel(LogLevel::Warn);
    logger().log(LogLevel::Info, "hidden");
    logger().log(LogLevel::Error, "shown");
    const auto out = contents();
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("shown"), std::string::npos);
    EXPECT_FALSE(logger().enabled(LogLevel::Debug));
}

TEST_F(LoggerTest, JsonFormat) {
    logger().setFormatJson(true);
    logger().log(LogLevel::Warn, "json-line", {{"k", "v \"quoted\""}});
    const auto out = contents();
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front(), '{');
    EXPECT_NE(out.find("\"lvl\":\"WARN\""), std::string::npos);
    EXPECT_NE(out.find("\"msg\":\"json-line\""), std::string::npos);
    EXPECT_NE(out.find("\"k\":\"v \\\"quoted\\\"\""), std::string::npos);
}

TEST_F(LoggerTest, ScopedFieldsNestAndUnwind) {
    {
        Logger::Scoped outer(std::vector<Field>{{"attempt", "1"}});
        logger().log(LogLevel::Info, "first");
        {
            Logger::Scoped inner({{"attempt", "2"}, {"pool", "user"}});
            logger().log(LogLevel::Info, "second");
        }
        logger().log(LogLevel::Info, "third");
    }
    logger().log(LogLevel::Info, "fourth");

    std::istringstream lines(contents());
    std::string first, second, third, fourth;
    std::getline(lines, first);
    std::getline(lines, second);
    std::getline(lines, third);
    std::getline(lines, fourth);

    EXPECT_NE(first.find("first attempt=1"), std::string::npos);
    EXPECT_NE(second.find("second attempt=2 pool=user"), std::string::npos);
    EXPECT_EQ(second.find("attempt=1"), std::string::npos);
    EXPECT_NE(third.find("third attempt=1"), std::string::npos);
    EXPECT_EQ(third.find("pool="), std::string::npos);
    EXPECT_EQ(fourth.find("attempt="), std::string::npos);
}

TEST(LoggerLevelTest, ParseAndName) {
    EXPECT_EQ(parseLevel("TRACE"), LogLevel::Trace);
    EXPECT_EQ(parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLevel("Warn"), LogLevel::Warn);
    EXPECT_EQ(parseLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLevel("bogus"), LogLevel::Info);
    EXPECT_STREQ(levelName(LogLevel::Error), "ERROR");
    EXPECT_STREQ(levelName(LogLevel::Trace), "TRACE");
}
