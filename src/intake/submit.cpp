/*
 * submit.cpp
 *
 *  Created on: 2019年4月12日
 *      Author: peter
 */

#include "MysqlJobStore.hpp"
#include "SubmissionIntake.hpp"
#include "logger.hpp"
#include "settings.hpp"

#include <kerbal/utility/costream.hpp>

#include <fstream>
#include <iostream>

#include <cmdline.h>

#include <boost/filesystem.hpp>

/**
 * @brief 校验并登记一份提交, 成功时把任务号打印到标准输出
 */
int submit_main(int argc, char * argv[], std::ofstream & log_fp)
{
	cmdline::parser parser;
	parser.add<std::string>("conf", 'c', "Specify configure description file path.", false, "/etc/lboard/lboard.json");
	parser.add<std::string>("name", 'n', "Name shown on the leaderboard.", true, "");
	parser.footer("archive.zip");

	parser.parse_check(argc, argv);

	using namespace kerbal::utility::costream;
	const auto & ccerr = costream<std::cerr>(LIGHT_RED);

	if (parser.rest().size() != 1) {
		ccerr << "exactly one archive is required" << std::endl;
		std::cerr << parser.usage();
		return 1;
	}

	lboard::Settings settings;
	try {
		settings.parse(boost::filesystem::path(parser.get<std::string>("conf")));
		boost::filesystem::create_directories(settings.runtime.log_dir);
	} catch (const std::exception & e) {
		ccerr << "configure file parse failed: " << e.what() << std::endl;
		return 1;
	}

	log_fp.open((settings.runtime.log_dir / "intake.log").string(), std::ios::app);
	if (!log_fp) {
		ccerr << "log file open failed!" << std::endl;
		return 1;
	}
	lboard::log::set_console_echo(log_fp, false);

	lboard::MysqlJobStore store(settings, log_fp);
	store.connect();
	store.ensure_schema();

	lboard::SubmissionIntake intake(store, settings, log_fp);
	try {
		lboard::job_id_type job_id = intake.submit(parser.get<std::string>("name"), parser.rest().front());
		std::cout << job_id << std::endl;
	} catch (const lboard::submission_rejected_exception & e) {
		LOG_WARNING(0, 0, log_fp, "Submission rejected: ", e.what());
		ccerr << e.what() << std::endl;
		return 2;
	}
	return 0;
}

int main(int argc, char * argv[])
{
	std::ofstream log_fp;
	try {
		return submit_main(argc, argv, log_fp);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(0, 0, log_fp, "An uncaught exception caught by main.", e);
		throw;
	} catch (...) {
		UNKNOWN_EXCEPT_FATAL(0, 0, log_fp, "An uncaught exception caught by main.");
		throw;
	}
}
