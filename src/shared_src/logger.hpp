/*
 * logger.hpp
 *
 *  Created on: 2019年4月2日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_LOGGER_HPP_
#define SRC_SHARED_SRC_LOGGER_HPP_

#include <iostream>
#include <sstream>
#include <fstream>
#include <mutex>
#include <typeinfo>
#include <boost/format.hpp>
#include <kerbal/utility/costream.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "lboard_typedef.hpp"

namespace costream_ns = kerbal::utility::costream;

/**
 * @addtogroup log_level
 * @{
 */
enum class LogLevel
{
	LEVEL_FATAL = 0, LEVEL_WARNING = 1, LEVEL_INFO = 2, LEVEL_DEBUG = 3
};

/**
 * 日志告警级别萃取器
 * @tparam level 日志告警级别
 */
template <LogLevel level>
struct Log_level_traits;

template <>
struct Log_level_traits<LogLevel::LEVEL_FATAL>
{
		static constexpr const char * str = "FATAL";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_INFO>
{
		static constexpr const char * str = "INFO";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_WARNING>
{
		static constexpr const char * str = "WARNING";
		static const costream_ns::costream<std::cout> outstream;
};

template <>
struct Log_level_traits<LogLevel::LEVEL_DEBUG>
{
		static constexpr const char * str = "DEBUG";
		static const costream_ns::costream<std::cout> outstream;
};

/**
 * @}
 */

std::string get_ymd_hms_in_local_time_zone(time_t time) noexcept;

namespace lboard
{
	namespace log
	{
		/**
		 * @brief 设置写入 log_file 的日志是否同时回显到控制台. 该选项保存在流对象自身上, 默认回显
		 */
		void set_console_echo(std::ios_base & log_file, bool echo) noexcept;

		bool console_echo(std::ios_base & log_file) noexcept;

		/**
		 * @brief 所有 worker 线程共享同一个控制台, 写日志时需互斥
		 */
		std::mutex & write_mutex() noexcept;

		template <typename Tp>
		void multi_args_write(std::ostream & log_fp, Tp && arg0)
		{
			log_fp << arg0;
		}

		template <typename Tp, typename ...Up>
		void multi_args_write(std::ostream & log_fp, Tp && arg0, Up&& ...args)
		{
			log_fp << arg0;
			multi_args_write(log_fp, std::forward<Up>(args)...);
		}

		template <LogLevel level, typename ...T>
		void __log_write(int worker_id, job_id_type::integer_type job_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
		{
			try {
				if (!log_file) {
					std::cerr << "log file is not open!" << std::endl;
					return;
				}

				const time_t now = time(NULL);
				const std::string datetime = get_ymd_hms_in_local_time_zone(now);

				std::ostringstream buffer;

				boost::format templ("[%s] %s worker:%d job:%d [%s:%d] ");
				/*                  datetime logLevelStr worker id srcFileName line */

				multi_args_write(buffer, templ % datetime % (const char *) Log_level_traits<level>::str % worker_id % job_id % source_filename % line, std::forward<T>(args)...);

				std::lock_guard<std::mutex> lck(write_mutex());
				if (console_echo(log_file)) {
					Log_level_traits<level>::outstream << buffer.str() << std::endl;
				}
				log_file << buffer.str() << std::endl;

				if (log_file.fail()) {
					std::cerr << "write error!" << std::endl;
					log_file.clear();
					return;
				}
			} catch (const std::exception & e) {
				std::cerr << "log write failed: " << e.what() << std::endl;
			}
		}

	} /* namespace log */

} /* namespace lboard */

template <LogLevel level, typename ...T>
void log_write(int worker_id, lboard::job_id_type job_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
{
	lboard::log::__log_write<level>(worker_id, job_id.to_literal(), source_filename, line, log_file, std::forward<T>(args)...);
}

template <LogLevel level, typename ...T>
void log_write(int worker_id, int job_id, const char source_filename[], int line, std::ostream & log_file, T&& ... args) noexcept
{
	lboard::log::__log_write<level>(worker_id, job_id, source_filename, line, log_file, std::forward<T>(args)...);
}

#define UNKNOWN_EXCEPTION_WHAT (const char*)("unknown exception")

#ifdef LOG_DEBUG
#	undef LOG_DEBUG
#endif
#ifdef DEBUG
#	define LOG_DEBUG(worker_id, job_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_DEBUG>(worker_id, job_id, __FILE__, __LINE__, log_fp, ##x)
#else
#	define LOG_DEBUG(worker_id, job_id, log_fp, x...)
#endif

#ifdef LOG_INFO
#	undef LOG_INFO
#endif
#define LOG_INFO(worker_id, job_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_INFO>(worker_id, job_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_WARNING
#	undef LOG_WARNING
#endif
#define LOG_WARNING(worker_id, job_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_WARNING>(worker_id, job_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef LOG_FATAL
#	undef LOG_FATAL
#endif
#define LOG_FATAL(worker_id, job_id, log_fp, x...) \
	log_write<LogLevel::LEVEL_FATAL>(worker_id, job_id, __FILE__, __LINE__, log_fp, ##x)

#ifdef EXCEPT_WARNING
#	undef EXCEPT_WARNING
#endif
#define EXCEPT_WARNING(worker_id, job_id, log_fp, events, exception, x...)	LOG_WARNING(worker_id, job_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)

#ifdef EXCEPT_FATAL
#	undef EXCEPT_FATAL
#endif
#define EXCEPT_FATAL(worker_id, job_id, log_fp, events, exception, x...)	LOG_FATAL(worker_id, job_id, log_fp, events, \
																		" Error information: ", exception.what(), "  Exception type: ", typeid(exception).name(), ##x)

#ifdef UNKNOWN_EXCEPT_FATAL
#	undef UNKNOWN_EXCEPT_FATAL
#endif
#define UNKNOWN_EXCEPT_FATAL(worker_id, job_id, log_fp, events, x...)	LOG_FATAL(worker_id, job_id, log_fp, events, \
																		" Error information: ", UNKNOWN_EXCEPTION_WHAT, ##x)

#endif /* SRC_SHARED_SRC_LOGGER_HPP_ */
