/*
 * JobStore.hpp
 *
 *  Created on: 2019年4月6日
 *      Author: peter
 */

#ifndef SRC_STORE_JOBSTORE_HPP_
#define SRC_STORE_JOBSTORE_HPP_

#include <stdexcept>
#include <string>
#include <vector>

#include "lboard_typedef.hpp"
#include "ScoreReport.hpp"

namespace lboard
{

	/**
	 * @brief 被某个 worker 领取的任务
	 */
	struct ClaimedJob
	{
			job_id_type id;
			std::string name; ///< 提交者名字
			std::string archive_path; ///< 压缩包位置
			std::string submitted_at;
	};

	/**
	 * @brief 已完成的一次运行. 只追加, 不修改
	 */
	struct CompletedRun
	{
			job_id_type job_id;
			std::string name;
			run_outcome outcome = run_outcome::ERROR;
			optional<double> latency_reduction {nullopt};
			optional<double> score {nullopt};
			std::string per_problem_json; ///< 各问题结果的 json 文本, 没有时为空串
			std::string error_message;
			std::string completed_at;
	};

	/**
	 * @brief 仍在队列中 (未完成) 的任务
	 */
	struct ActiveJob
	{
			job_id_type id;
			std::string name;
			job_status status = job_status::PENDING;
			std::string submitted_at;
	};

	/**
	 * @brief 某一时刻排行榜数据的一致快照
	 */
	struct LeaderboardSnapshot
	{
			std::vector<CompletedRun> completed; ///< 按 score 降序, latency_reduction 降序, 完成时间升序
			std::vector<ActiveJob> active; ///< 按 id 升序
	};

	/**
	 * @brief 数据库访问失败
	 */
	class store_exception: public std::runtime_error
	{
		public:
			const int errnum;

			store_exception(const std::string & what, int errnum) :
					std::runtime_error(what), errnum(errnum)
			{
			}
	};

	/**
	 * @brief 违反任务状态机的调用, 例如对同一任务第二次提交运行结果
	 */
	class job_state_exception: public std::logic_error
	{
		public:
			explicit job_state_exception(const std::string & what) :
					std::logic_error(what)
			{
			}
	};

	/**
	 * @brief 持久化的任务队列与运行结果. 所有状态迁移都是原子的.
	 * 可被多个 worker 线程与提交工具并发调用
	 */
	class JobStore
	{
		public:
			virtual ~JobStore() = default;

			/**
			 * @brief 建表. 可重复调用
			 */
			virtual void ensure_schema() = 0;

			/**
			 * @brief 新建一个 REGISTERING 状态的任务并分配 id
			 * @param name 提交者名字
			 * @param archive_ref 压缩包位置, 此时通常尚未确定, 可为空
			 */
			virtual job_id_type enqueue(const std::string & name, const std::string & archive_ref) = 0;

			/**
			 * @brief REGISTERING -> PENDING, 并记录压缩包的最终位置
			 * @throw job_state_exception 任务不存在或不处于 REGISTERING 状态
			 */
			virtual void activate(job_id_type job_id, const std::string & archive_ref) = 0;

			/**
			 * @brief 原子地领取 id 最小的 PENDING 任务并置为 RUNNING.
			 * 并发调用者绝不会领取到同一个任务
			 * @return 没有可领取的任务时返回 nullopt, 且没有任何副作用
			 */
			virtual optional<ClaimedJob> claim_next() = 0;

			/**
			 * @brief 原子地写入成功结果并删除任务
			 * @throw job_state_exception 任务不存在或不处于 RUNNING 状态 (例如重复提交结果)
			 */
			virtual void complete_success(job_id_type job_id, const std::string & name, const ScoreReport & report) = 0;

			/**
			 * @brief 原子地写入失败结果并删除任务
			 * @throw job_state_exception 任务不存在或不处于 RUNNING 状态 (例如重复提交结果)
			 */
			virtual void complete_error(job_id_type job_id, const std::string & name, const std::string & message) = 0;

			/**
			 * @brief 读取排行榜数据的一致快照, 不与领取任务互斥
			 */
			virtual LeaderboardSnapshot snapshot() = 0;

			/**
			 * @brief 将上一次运行遗留的 RUNNING 任务全部判为失败. 只应在 worker 启动前调用
			 * @return 被判失败的任务数
			 */
			virtual int fail_orphaned_jobs(const std::string & message) = 0;
	};

} /* namespace lboard */

#endif /* SRC_STORE_JOBSTORE_HPP_ */
