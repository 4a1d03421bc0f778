/*
 * runner.cpp
 *
 *  Created on: 2019年4月11日
 *      Author: peter
 */

#include "MysqlJobStore.hpp"
#include "WorkerPool.hpp"
#include "logger.hpp"
#include "settings.hpp"

#include <kerbal/compatibility/chrono_suffix.hpp>
#include <kerbal/utility/costream.hpp>

#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>

#include <cmdline.h>

#include <boost/filesystem.hpp>

namespace
{
	volatile std::sig_atomic_t stop_requested = 0;
}

/**
 * @brief SIGTERM 与 SIGINT 的处理函数. 只设置标志, 由主线程通知线程池在完成当前任务后退出
 * @throw 该函数保证不抛出任何异常
 */
void regist_stop_handler(int signum) noexcept
{
	if (signum == SIGTERM || signum == SIGINT) {
		stop_requested = 1;
	}
}

/**
 * @brief 加载配置并打开 runner.log
 */
void load_config(lboard::Settings & settings, const boost::filesystem::path & config_file, std::ofstream & log_fp)
{
	using namespace kerbal::utility::costream;
	const auto & ccerr = costream<std::cerr>(LIGHT_RED);

	try {
		settings.parse(config_file);
	} catch (const std::exception & e) {
		ccerr << "configure file parse failed: " << e.what() << std::endl;
		exit(-1);
	}

	try {
		boost::filesystem::create_directories(settings.runtime.log_dir);
	} catch (const std::exception & e) {
		ccerr << "make log dir failed: " << e.what() << std::endl;
		exit(-1);
	}

	log_fp.open((settings.runtime.log_dir / "runner.log").string(), std::ios::app);
	if (!log_fp) {
		ccerr << "log file open failed!" << std::endl;
		exit(-1);
	}
	lboard::log::set_console_echo(log_fp, settings.runtime.echo_to_console);
}

int runner_main(int argc, char * argv[], std::ofstream & log_fp)
{
	using namespace kerbal::compatibility::chrono_suffix;

	cmdline::parser parser;
	parser.add<std::string>("conf", 'c', "Specify configure description file path.", false, "/etc/lboard/lboard.json");
	parser.add<int>("workers", 'w', "Number of worker threads, overrides runner.workers.", false, 0);
	parser.add<std::string>("backend", 'b', "LLM client used by the harness, overrides backend.name.", false, "",
							cmdline::oneof<std::string>("", "ollama", "openai"));
	parser.add("version", 'v', "Display the version information.");

	parser.parse_check(argc, argv);

	if (parser.exist("version")) {
		std::cout << "Compiled at: " __DATE__ " " __TIME__ << std::endl;
		return 0;
	}

	lboard::Settings settings;
	load_config(settings, parser.get<std::string>("conf"), log_fp); // 此函数运行结束以后才可以使用 log 系列宏

	if (parser.get<int>("workers") > 0) {
		settings.runner.workers = parser.get<int>("workers");
	}
	if (!parser.get<std::string>("backend").empty()) {
		settings.backend.name = lboard::parse_llm_backend(parser.get<std::string>("backend"));
	}
	LOG_INFO(0, 0, log_fp, "Configuration load finished! workers: ", settings.runner.workers, ", backend: ", lboard::get_llm_backend_name(settings.backend.name));

	try {
		boost::filesystem::create_directories(settings.runner.workspace_dir);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(0, 0, log_fp, "Make workspace dir failed.", e);
		exit(-1);
	}

	lboard::MysqlJobStore store(settings, log_fp);
	try {
		store.connect();
		store.ensure_schema();
	} catch (const std::exception & e) {
		EXCEPT_FATAL(0, 0, log_fp, "Job store initialize failed.", e);
		exit(-1);
	}

	if (settings.runner.fail_orphaned_on_start) {
		int orphaned = store.fail_orphaned_jobs("internal error: runner restarted while job was running");
		if (orphaned != 0) {
			LOG_WARNING(0, 0, log_fp, orphaned, " orphaned running job(s) marked as failed.");
		}
	}

	signal(SIGTERM, regist_stop_handler);
	signal(SIGINT, regist_stop_handler);

	lboard::WorkerPool pool(store, settings, log_fp);
	LOG_INFO(0, 0, log_fp, "Runner starting...");
	pool.start();

	while (!stop_requested) {
		std::this_thread::sleep_for(200_ms);
	}

	LOG_WARNING(0, 0, log_fp, "Runner has received a stop signal and will exit soon after the running jobs are all finished!");
	pool.stop();

	LOG_INFO(0, 0, log_fp, "Runner exit.");
	return 0;
}

int main(int argc, char * argv[])
{
	std::ofstream log_fp;
	try {
		return runner_main(argc, argv, log_fp);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(0, 0, log_fp, "An uncaught exception caught by main.", e);
		throw;
	} catch (...) {
		UNKNOWN_EXCEPT_FATAL(0, 0, log_fp, "An uncaught exception caught by main.");
		throw;
	}
}
