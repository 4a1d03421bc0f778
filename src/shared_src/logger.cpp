/*
 * logger.cpp
 *
 *  Created on: 2019年4月2日
 *      Author: peter
 */

#include <time.h>

#include "logger.hpp"

const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_FATAL>::outstream(costream_ns::LIGHT_RED);
const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_INFO>::outstream(costream_ns::LAKE_BLUE);
const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_WARNING>::outstream(costream_ns::LIGHT_YELLOW);
const costream_ns::costream<std::cout> Log_level_traits<LogLevel::LEVEL_DEBUG>::outstream(costream_ns::LIGHT_PURPLE);

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept
{
	// worker 线程并发调用, 不能使用 localtime 的静态缓冲区
	char datetime[100];
	struct tm local;
	localtime_r(&time, &local);

	strftime(datetime, sizeof(datetime) - 1, "%Y-%m-%d %H:%M:%S", &local);

	return datetime;
}

namespace lboard
{
	namespace log
	{
		namespace
		{
			// iword 初值为 0, 因此这里记录的是 "不回显"
			int console_mute_index() noexcept
			{
				static const int index = std::ios_base::xalloc();
				return index;
			}
		}

		void set_console_echo(std::ios_base & log_file, bool echo) noexcept
		{
			log_file.iword(console_mute_index()) = echo ? 0 : 1;
		}

		bool console_echo(std::ios_base & log_file) noexcept
		{
			return log_file.iword(console_mute_index()) == 0;
		}

		std::mutex & write_mutex() noexcept
		{
			static std::mutex mtx;
			return mtx;
		}

	} /* namespace log */

} /* namespace lboard */
