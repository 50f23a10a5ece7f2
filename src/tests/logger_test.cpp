#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace pous::logger;

class LoggerTest : public ::testing::Test {
protected:
    TempDir dir{"logger_test"};
    std::string log_file;

    void SetUp() override {
        log_file = (dir.path() / "logs" / "pous.log").string();
        init_logging(log_file, severity_level::trace);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        init_console_logging(severity_level::warning);
    }

    std::string read_log() {
        boost::log::core::get()->flush();
        std::ifstream file(log_file);
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }
};

TEST_F(LoggerTest, WritesToFileSink) {
    BOOST_LOG_TRIVIAL(info) << "LoggerTest: hello from the file sink";
    std::string content = read_log();
    EXPECT_NE(content.find("hello from the file sink"), std::string::npos);
    EXPECT_NE(content.find("[info]"), std::string::npos);
}

TEST_F(LoggerTest, AllSeverityLevels) {
    BOOST_LOG_TRIVIAL(trace) << "trace message";
    BOOST_LOG_TRIVIAL(debug) << "debug message";
    BOOST_LOG_TRIVIAL(warning) << "warning message";
    BOOST_LOG_TRIVIAL(error) << "error message";
    BOOST_LOG_TRIVIAL(fatal) << "fatal message";

    std::string content = read_log();
    for (const char* text : {"trace message", "debug message", "warning message", "error message", "fatal message"}) {
        EXPECT_NE(content.find(text), std::string::npos) << text;
    }
}

TEST_F(LoggerTest, FiltersBelowLevel) {
    set_log_level(severity_level::warning);
    BOOST_LOG_TRIVIAL(info) << "filtered info";
    BOOST_LOG_TRIVIAL(error) << "kept error";

    std::string content = read_log();
    EXPECT_EQ(content.find("filtered info"), std::string::npos);
    EXPECT_NE(content.find("kept error"), std::string::npos);
}

TEST_F(LoggerTest, DisableAndEnable) {
    disable_logging();
    BOOST_LOG_TRIVIAL(error) << "while disabled";
    enable_logging();
    BOOST_LOG_TRIVIAL(error) << "after enable";

    std::string content = read_log();
    EXPECT_EQ(content.find("while disabled"), std::string::npos);
    EXPECT_NE(content.find("after enable"), std::string::npos);
}

TEST(SeverityTest, ParsesNamesAndRejectsUnknown) {
    EXPECT_EQ(parse_severity("debug"), severity_level::debug);
    EXPECT_EQ(parse_severity("warn"), severity_level::warning);
    EXPECT_STREQ(pous::logger::to_string(severity_level::error), "ERROR");
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}
