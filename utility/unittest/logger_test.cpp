// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "utility/logger.h"
#include "utility/helpers.h"
#include "utility/common.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <sstream>
#include <thread>

using namespace wasmir;

int g_TestsFailed = 0;

void TestFailed(const char* szExpr, uint32_t nLine)
{
	printf("Test failed! Line=%u, Expression: %s\n", nLine, szExpr);
	g_TestsFailed++;
	fflush(stdout);
}

#define verify_test(x) \
	do { \
		if (!(x)) \
			TestFailed(#x, __LINE__); \
	} while (false)

#define fail_test(msg) TestFailed(msg, __LINE__)

struct XXX {
    int z = 333;
};

std::ostream& operator<<(std::ostream& os, const XXX& xxx) {
    os<< "XXX={" << xxx.z << "}";
    return os;
}

static size_t custom_header_formatter(char* buf, size_t maxSize, const char* timestampFormatted, const LogMessageHeader& header) {
    return snprintf(buf, maxSize, "%c %s ", loglevel_tag(header.level), timestampFormatted);
}

static std::string read_text(const std::string& path) {
    std::ifstream fs(path);
    std::stringstream ss;
    ss << fs.rdbuf();
    return ss.str();
}

void test_logger_1() {
    auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_DEBUG, LOG_SINK_DISABLED);
    logger->set_header_formatter(custom_header_formatter);
    logger->set_time_format("%T", false);

    verify_test(Logger::will_log(LOG_LEVEL_INFO));
    verify_test(!Logger::will_log(LOG_LEVEL_VERBOSE));
    verify_test(logger->get_current_file_name().empty());

    LOG_CRITICAL() << "Let's die";
    LOG_ERROR() << "Not so bad at all, here is " << format_timestamp("%y-%m-%d.%T", local_timestamp_msec());
    LOG_WARNING() << "Don't be afraid: " << 223322223;
    XXX xxx;
    LOG_INFO() << xxx;
    LOG_DEBUG() << "YYY";
    LOG_VERBOSE() << "ZZZ";
}

void test_file_sink() {
    auto dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("wasmir-log-%%%%-%%%%");
    std::string fileName;
    {
        auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_ERROR, LOG_LEVEL_INFO, "test_", dir.string());
        logger->set_header_formatter(custom_header_formatter);

        fileName = logger->get_current_file_name();
        verify_test(!fileName.empty());
        verify_test(boost::filesystem::exists(dir));

        LOG_WARNING() << "file sink " << 42;
        LOG_INFO() << XXX();
        LOG_VERBOSE() << "never";
    }

    verify_test(!Logger::will_log(LOG_LEVEL_CRITICAL)); // destroyed

    auto text = read_text(fileName);
    verify_test(text.find("W ") != std::string::npos);
    verify_test(text.find("file sink 42") != std::string::npos);
    verify_test(text.find("XXX={333}") != std::string::npos);
    verify_test(text.find("never") == std::string::npos);

    boost::system::error_code ec;
    boost::filesystem::remove_all(dir, ec);
}

void test_logger_twice() {
    auto logger = Logger::create();
    try {
        Logger::create();
        fail_test("second logger created");
    }
    catch (const std::runtime_error&) {
    }
}

void test_threads() {
    auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_INFO);
    std::thread t([]() {
        for (int i = 0; i < 10; i++)
            LOG_INFO() << "worker " << i;
    });

    for (int i = 0; i < 10; i++)
        LOG_INFO() << "main " << i;

    t.join();
}

int main() {
    test_logger_1();
    test_file_sink();
    test_logger_twice();
    test_threads();

    return g_TestsFailed ? -1 : 0;
}
