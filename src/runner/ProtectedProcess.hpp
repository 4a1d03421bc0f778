/*
 * ProtectedProcess.hpp
 *
 *  Created on: 2018年12月7日
 *      Author: peter
 */

#ifndef SRC_RUNNER_PROTECTEDPROCESS_HPP_
#define SRC_RUNNER_PROTECTEDPROCESS_HPP_

#include <chrono>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>

#include <boost/filesystem/path.hpp>
#include <kerbal/data_struct/optional/optional.hpp>
#include <kerbal/utility/storage.hpp>

#include "ExecuteArgs.hpp"

namespace lboard
{

	class ProtectedProcessConfig
	{
		public:

			template <typename Type>
			using optional = kerbal::data_struct::optional<Type>;

			boost::filesystem::path working_dir; ///< 子进程的工作目录, 只在子进程中切换
			boost::filesystem::path input_path;
			boost::filesystem::path output_path;
			boost::filesystem::path error_path;

			using raw_max_real_time_type = std::chrono::milliseconds;
			using max_real_time_type = optional<raw_max_real_time_type>;
			max_real_time_type max_real_time; ///< 最大墙上时间, 超时后整个进程组被杀死

			using raw_max_memory_type = kerbal::utility::Byte;
			using max_memory_type = optional<raw_max_memory_type>;
			max_memory_type max_memory; ///< 地址空间的最大字节长度

			using raw_max_process_number_type = int;
			using max_process_number_type = optional<raw_max_process_number_type>;
			max_process_number_type max_process_number; ///< 程序最大子进程数

			using raw_max_output_size_type = kerbal::utility::Byte;
			using max_output_size_type = optional<raw_max_output_size_type>;
			max_output_size_type max_output_size; ///< 可创建的文件的最大字节长度

			bool use_seccomp = false; ///< 是否加载系统调用黑名单

			ProtectedProcessConfig(const boost::filesystem::path & working_dir, const boost::filesystem::path & output_path, const boost::filesystem::path & error_path) :
					working_dir(working_dir), input_path("/dev/null"), output_path(output_path), error_path(error_path)
			{
			}

			/// set max real time
			ProtectedProcessConfig& set_max_real_time(const raw_max_real_time_type & max_real_time)
			{
				this->max_real_time = max_real_time;
				return *this;
			}

			/// set max memory
			ProtectedProcessConfig& set_max_memory(const raw_max_memory_type & max_memory)
			{
				this->max_memory = max_memory;
				return *this;
			}

			/// set max process number
			ProtectedProcessConfig& set_max_process_number(const raw_max_process_number_type & max_process_number)
			{
				this->max_process_number = max_process_number;
				return *this;
			}

			/// set max output size
			ProtectedProcessConfig& set_max_output_size(const raw_max_output_size_type & max_output_size)
			{
				this->max_output_size = max_output_size;
				return *this;
			}

			ProtectedProcessConfig& set_use_seccomp(bool use_seccomp)
			{
				this->use_seccomp = use_seccomp;
				return *this;
			}

	};

	enum class ProtectedProcessResult
	{
		EXITED_NORMALLY = 0, ///< 退出码为 0
		NON_ZERO_EXIT = 1, ///< 退出码非 0
		KILLED_BY_SIGNAL = 2, ///< 被信号杀死
		REAL_TIME_LIMIT_EXCEEDED = 3, ///< 墙上时间超时
		SYSTEM_ERROR = 4, ///< 子进程在 execve 之前的准备工作失败
	};

	std::ostream& operator<<(std::ostream& out, ProtectedProcessResult result);

	class ProtectedProcessDetails:
			public std::tuple<
			ProtectedProcessResult,
			std::chrono::milliseconds,
			std::chrono::milliseconds,
			kerbal::utility::KB,
			int>
	{
		private:
			using supper_t = std::tuple<
					ProtectedProcessResult,
					std::chrono::milliseconds,
					std::chrono::milliseconds,
					kerbal::utility::KB,
					int>;
		public:
			using supper_t::supper_t;

			const auto& running_result() const
			{
				return std::get<0>(*this);
			}

			const auto& real_time() const
			{
				return std::get<1>(*this);
			}

			const auto& cpu_time() const
			{
				return std::get<2>(*this);
			}

			const auto& memory() const
			{
				return std::get<3>(*this);
			}

			/**
			 * @brief 正常退出时为退出码; 被信号杀死时为信号编号的相反数
			 */
			const auto& exit_code() const
			{
				return std::get<4>(*this);
			}
	};

	/**
	 * @brief 在受保护的子进程中运行程序. 子进程自成进程组, 切换工作目录, 设置资源限制,
	 * 重定向标准输入输出, 可选地加载系统调用黑名单, 然后用 execve 替换自身.
	 * 调用者进程的工作目录与文件描述符不受影响.
	 * @param execute_args 第一个参数须为可执行文件的路径
	 * @param env "KEY=VALUE" 形式的环境变量表
	 * @throw std::runtime_error fork 或 wait 失败
	 * @throw ThreadFailedException 无法创建超时监视线程
	 */
	ProtectedProcessDetails
	protected_process(const ExecuteArgs & execute_args, const ProtectedProcessConfig & config, const ExecuteArgs & env);

	class ThreadFailedException: public std::runtime_error
	{
		public:
			ThreadFailedException() :
					std::runtime_error("thread failed")
			{
			}
	};

} /* namespace lboard */

#endif /* SRC_RUNNER_PROTECTEDPROCESS_HPP_ */
