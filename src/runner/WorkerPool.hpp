/*
 * WorkerPool.hpp
 *
 *  Created on: 2019年4月10日
 *      Author: peter
 */

#ifndef SRC_RUNNER_WORKERPOOL_HPP_
#define SRC_RUNNER_WORKERPOOL_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

#include <kerbal/utility/noncopyable.hpp>

#include "JobStore.hpp"
#include "settings.hpp"

namespace lboard
{

	/**
	 * @brief 固定数量的对称 worker 线程, 彼此之间只共享 JobStore.
	 * 每个 worker 循环领取任务并同步地处理, 队列为空时按轮询间隔等待
	 */
	class WorkerPool: kerbal::utility::noncopyable
	{
		private:
			JobStore & store;
			const Settings & settings;
			std::ostream & main_log;

			std::vector<std::thread> threads;
			std::atomic<bool> running;
			std::mutex wait_mutex;
			std::condition_variable wait_cond;

		public:
			static constexpr const char * ARCHIVE_MISSING_MESSAGE = "archive not found on disk";

			/**
			 * @param main_log 线程池自身的日志, 各 worker 另外写 runner-<id>.log
			 */
			WorkerPool(JobStore & store, const Settings & settings, std::ostream & main_log);

			~WorkerPool() noexcept;

			/**
			 * @brief 启动 settings.runner.workers 个 worker 线程
			 * @throw std::system_error 线程创建失败
			 */
			void start();

			/**
			 * @brief 通知所有 worker 在完成当前任务后退出, 不等待. 可在信号处理之外的任意线程调用
			 */
			void request_stop() noexcept;

			/**
			 * @brief 等待所有 worker 退出
			 */
			void join() noexcept;

			void stop() noexcept
			{
				this->request_stop();
				this->join();
			}

			bool is_running() const noexcept
			{
				return running;
			}

			/**
			 * @brief 领取并处理至多一个任务. 领取之后出现的任何错误都会被转换为一个失败的运行结果
			 * @return 是否领取到了任务
			 * @throw std::exception 领取任务时出现的错误 (此时没有任务被领取)
			 */
			bool process_one(int worker_id, std::ostream & log_fp);

			/**
			 * @brief worker 的日志文件名
			 */
			static std::string worker_log_file_name(int worker_id);

		private:
			void worker_loop(int worker_id) noexcept;

			/**
			 * @brief 等待给定时长, 收到停止通知时提前返回
			 */
			void wait_for(std::chrono::milliseconds duration);

			/**
			 * @brief 将任务判为失败. 提交失败时只记录日志, 任务将在下次启动时被判为遗留任务
			 */
			void commit_error_noexcept(int worker_id, const ClaimedJob & job, const std::string & message, std::ostream & log_fp) noexcept;
	};

} /* namespace lboard */

#endif /* SRC_RUNNER_WORKERPOOL_HPP_ */
