/*
 * SandboxedExecutor.hpp
 *
 *  Created on: 2019年4月9日
 *      Author: peter
 */

#ifndef SRC_RUNNER_SANDBOXEDEXECUTOR_HPP_
#define SRC_RUNNER_SANDBOXEDEXECUTOR_HPP_

#include <chrono>
#include <ostream>
#include <string>

#include <boost/filesystem/path.hpp>

#include "ExecuteArgs.hpp"
#include "lboard_typedef.hpp"
#include "settings.hpp"

namespace lboard
{

	/**
	 * @brief 评测程序一次正常结束的运行的输出
	 */
	struct HarnessOutput
	{
			std::string stdout_text;
			std::string stderr_text;
			std::chrono::milliseconds real_time;
	};

	/**
	 * @brief 在任务目录中以受限子进程运行外部评测程序 (scorer_tool.py)
	 */
	class SandboxedExecutor
	{
		private:
			const Settings & settings;
			int worker_id;
			std::ostream & log_fp;

		public:
			SandboxedExecutor(const Settings & settings, int worker_id, std::ostream & log_fp);

			/**
			 * @brief 评测程序复制到任务目录后的文件名
			 */
			std::string harness_name() const;

			/**
			 * @brief 把评测用例目录复制为 <job_dir>/local_benchmarks, 把评测程序复制到任务目录
			 * @throw InternalErrorException
			 */
			void prepare_assets(job_id_type job_id, const boost::filesystem::path & job_dir) const;

			/**
			 * @brief 复制当前环境变量, 按所选后端注入凭据, 若安装过依赖则把安装目录加入 PYTHONPATH
			 * @throw InternalErrorException 凭据文件缺失或无法读取
			 */
			ExecuteArgs build_environment(job_id_type job_id, const boost::filesystem::path & job_dir) const;

			/**
			 * @brief 运行评测程序: <interpreter> <harness> --LLM-client <backend> --trials <N>
			 * @throw ExecutionFaultException 超时, 非零退出, 被信号杀死
			 * @throw InternalErrorException 子进程无法启动
			 */
			HarnessOutput run_harness(job_id_type job_id, const boost::filesystem::path & job_dir, const ExecuteArgs & env) const;

			/**
			 * @brief prepare_assets, build_environment, run_harness 三步
			 */
			HarnessOutput execute(job_id_type job_id, const boost::filesystem::path & job_dir) const;
	};

} /* namespace lboard */

#endif /* SRC_RUNNER_SANDBOXEDEXECUTOR_HPP_ */
