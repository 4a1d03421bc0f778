/*
 * LoggerTest.cpp
 *
 *  Created on: 2019年4月14日
 *      Author: peter
 */

#define BOOST_TEST_MODULE LoggerTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <iostream>
#include <sstream>

#include "logger.hpp"

namespace
{
	/**
	 * @brief 在作用域内截获 std::cout
	 */
	struct cout_capture
	{
			std::ostringstream captured;
			std::streambuf * old_buf;

			cout_capture() :
					old_buf(std::cout.rdbuf(captured.rdbuf()))
			{
			}

			~cout_capture()
			{
				std::cout.rdbuf(old_buf);
			}
	};
}

BOOST_AUTO_TEST_CASE(line_carries_worker_and_job)
{
	std::ostringstream log_fp;
	lboard::log::set_console_echo(log_fp, false);
	LOG_INFO(3, 17, log_fp, "claimed ", 2, " jobs");

	const std::string line = log_fp.str();
	BOOST_CHECK(line.find(" INFO worker:3 job:17 ") != std::string::npos);
	BOOST_CHECK(line.find("claimed 2 jobs\n") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(console_echo_is_per_stream)
{
	std::ostringstream quiet_log;
	std::ostringstream loud_log;
	lboard::log::set_console_echo(quiet_log, false);

	BOOST_CHECK(!lboard::log::console_echo(quiet_log));
	BOOST_CHECK(lboard::log::console_echo(loud_log));

	cout_capture capture;
	LOG_WARNING(1, 0, quiet_log, "quiet message");
	LOG_WARNING(2, 0, loud_log, "loud message");

	const std::string console = capture.captured.str();
	BOOST_CHECK(console.find("quiet message") == std::string::npos);
	BOOST_CHECK(console.find("loud message") != std::string::npos);
	BOOST_CHECK(quiet_log.str().find("quiet message") != std::string::npos);
	BOOST_CHECK(loud_log.str().find("loud message") != std::string::npos);
}
