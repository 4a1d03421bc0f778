/*
 * BenchmarkJob.hpp
 *
 *  Created on: 2019年4月10日
 *      Author: peter
 */

#ifndef SRC_RUNNER_BENCHMARKJOB_HPP_
#define SRC_RUNNER_BENCHMARKJOB_HPP_

#include <ostream>
#include <string>

#include <boost/filesystem/path.hpp>

#include "JobStore.hpp"
#include "ScoreReport.hpp"
#include "lboard_typedef.hpp"
#include "settings.hpp"

namespace lboard
{

	/**
	 * @brief 一个已被领取的任务的完整处理流程:
	 * 分配私有目录, 解压与校验, 准备评测资源, 运行评测程序, 解析结果, 提交结果, 清理目录
	 */
	class BenchmarkJob
	{
		private:
			JobStore & store;
			const Settings & settings;
			int worker_id;
			std::ostream & log_fp;
			ClaimedJob job;

			boost::filesystem::path job_dir; ///< 尚未分配时为空

		public:
			BenchmarkJob(JobStore & store, const Settings & settings, int worker_id, std::ostream & log_fp, ClaimedJob job);

			/**
			 * @brief 处理任务并提交一个终态结果
			 * @return 提交的结果类型
			 * @throw store_exception 提交结果时数据库访问失败
			 * @throw job_state_exception 任务已不处于 RUNNING 状态
			 */
			run_outcome handle();

			job_id_type id() const
			{
				return job.id;
			}

			/**
			 * @brief 任务的私有工作目录, 失败时保留以便排查
			 */
			const boost::filesystem::path & get_job_dir() const
			{
				return job_dir;
			}

		private:
			/**
			 * @throw JobHandleException 及其他 std::exception
			 */
			ScoreReport run_pipeline();

			/**
			 * @brief 成功时删除工作目录, 失败时保留
			 */
			void finalize_workspace(run_outcome outcome) noexcept;
	};

} /* namespace lboard */

#endif /* SRC_RUNNER_BENCHMARKJOB_HPP_ */
