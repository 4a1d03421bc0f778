/*
 * show.cpp
 *
 *  Created on: 2019年4月13日
 *      Author: peter
 */

#include "LeaderboardView.hpp"
#include "MysqlJobStore.hpp"
#include "logger.hpp"
#include "settings.hpp"

#include <kerbal/utility/costream.hpp>

#include <fstream>
#include <iostream>

#include <cmdline.h>

#include <boost/filesystem.hpp>

/**
 * @brief 把排行榜以文本形式打印到标准输出
 */
int show_main(int argc, char * argv[], std::ofstream & log_fp)
{
	cmdline::parser parser;
	parser.add<std::string>("conf", 'c', "Specify configure description file path.", false, "/etc/lboard/lboard.json");

	parser.parse_check(argc, argv);

	using namespace kerbal::utility::costream;
	const auto & ccerr = costream<std::cerr>(LIGHT_RED);

	lboard::Settings settings;
	try {
		settings.parse(boost::filesystem::path(parser.get<std::string>("conf")));
		boost::filesystem::create_directories(settings.runtime.log_dir);
	} catch (const std::exception & e) {
		ccerr << "configure file parse failed: " << e.what() << std::endl;
		return 1;
	}

	log_fp.open((settings.runtime.log_dir / "show.log").string(), std::ios::app);
	if (!log_fp) {
		ccerr << "log file open failed!" << std::endl;
		return 1;
	}
	lboard::log::set_console_echo(log_fp, false);

	lboard::MysqlJobStore store(settings, log_fp);
	store.connect();
	store.ensure_schema();

	lboard::LeaderboardView view(store);
	std::cout << lboard::LeaderboardView::render_text(view.rows());
	return 0;
}

int main(int argc, char * argv[])
{
	std::ofstream log_fp;
	try {
		return show_main(argc, argv, log_fp);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(0, 0, log_fp, "An uncaught exception caught by main.", e);
		throw;
	} catch (...) {
		UNKNOWN_EXCEPT_FATAL(0, 0, log_fp, "An uncaught exception caught by main.");
		throw;
	}
}
