/*
 * WorkerPool.cpp
 *
 *  Created on: 2019年4月10日
 *      Author: peter
 */

#include "WorkerPool.hpp"
#include "BenchmarkJob.hpp"
#include "logger.hpp"

#include <fstream>

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace lboard
{

	WorkerPool::WorkerPool(JobStore & store, const Settings & settings, std::ostream & main_log) :
			store(store), settings(settings), main_log(main_log), running(false)
	{
	}

	WorkerPool::~WorkerPool() noexcept
	{
		this->stop();
	}

	std::string WorkerPool::worker_log_file_name(int worker_id)
	{
		return "runner-" + std::to_string(worker_id) + ".log";
	}

	void WorkerPool::start()
	{
		running = true;
		threads.reserve(settings.runner.workers);
		for (int worker_id = 1; worker_id <= settings.runner.workers; ++worker_id) {
			threads.emplace_back(&WorkerPool::worker_loop, this, worker_id);
		}
		LOG_INFO(0, 0, main_log, "Worker pool started with ", threads.size(), " workers.");
	}

	void WorkerPool::request_stop() noexcept
	{
		{
			std::lock_guard<std::mutex> lock(wait_mutex);
			running = false;
		}
		wait_cond.notify_all();
	}

	void WorkerPool::join() noexcept
	{
		for (std::thread & t : threads) {
			if (t.joinable()) {
				t.join();
			}
		}
		if (!threads.empty()) {
			LOG_INFO(0, 0, main_log, "All workers exited.");
		}
		threads.clear();
	}

	void WorkerPool::wait_for(std::chrono::milliseconds duration)
	{
		std::unique_lock<std::mutex> lock(wait_mutex);
		wait_cond.wait_for(lock, duration, [this]() {
			return !running;
		});
	}

	void WorkerPool::commit_error_noexcept(int worker_id, const ClaimedJob & job, const std::string & message, std::ostream & log_fp) noexcept
	{
		try {
			store.complete_error(job.id, job.name, message);
			LOG_INFO(worker_id, job.id, log_fp, "Job finished with error: ", message);
		} catch (const job_state_exception & e) {
			EXCEPT_WARNING(worker_id, job.id, log_fp, "Result of job has already been committed.", e);
		} catch (const std::exception & e) {
			EXCEPT_FATAL(worker_id, job.id, log_fp, "Failed to commit error result.", e, " message: ", message);
		}
	}

	bool WorkerPool::process_one(int worker_id, std::ostream & log_fp)
	{
		optional<ClaimedJob> claimed = store.claim_next();
		if (claimed == nullopt) {
			return false;
		}

		const ClaimedJob job = *claimed;
		LOG_INFO(worker_id, job.id, log_fp, "<<<<<<<<<<<<<<<<<<<<<<<<<<<<<<");
		LOG_INFO(worker_id, job.id, log_fp, "Claimed job. name: ", job.name);

		try {
			if (job.archive_path.empty() || !fs::exists(job.archive_path)) {
				LOG_WARNING(worker_id, job.id, log_fp, "Archive not found: ", job.archive_path);
				this->commit_error_noexcept(worker_id, job, ARCHIVE_MISSING_MESSAGE, log_fp);
			} else {
				BenchmarkJob benchmark_job(store, settings, worker_id, log_fp, job);
				benchmark_job.handle();
			}
		} catch (const job_state_exception & e) {
			EXCEPT_WARNING(worker_id, job.id, log_fp, "Result of job has already been committed.", e);
		} catch (const std::exception & e) {
			EXCEPT_FATAL(worker_id, job.id, log_fp, "Fail to handle job.", e);
			this->commit_error_noexcept(worker_id, job, std::string("internal error: ") + e.what(), log_fp);
		} catch (...) {
			UNKNOWN_EXCEPT_FATAL(worker_id, job.id, log_fp, "Fail to handle job.");
			this->commit_error_noexcept(worker_id, job, std::string("internal error: ") + UNKNOWN_EXCEPTION_WHAT, log_fp);
		}

		LOG_INFO(worker_id, job.id, log_fp, ">>>>>>>>>>>>>>>>>>>>>>>>>>>>>>");
		return true;
	}

	void WorkerPool::worker_loop(int worker_id) noexcept
	{
		const fs::path log_path = settings.runtime.log_dir / worker_log_file_name(worker_id);
		std::ofstream worker_log(log_path.string(), std::ios::app);
		lboard::log::set_console_echo(worker_log, settings.runtime.echo_to_console);
		std::ostream * log_fp = &worker_log;
		if (!worker_log) {
			LOG_FATAL(worker_id, 0, main_log, "Worker log file open failed: ", log_path, ", fall back to main log.");
			log_fp = &main_log;
		}

		LOG_INFO(worker_id, 0, *log_fp, "Worker started.");
		while (running) {
			try {
				if (!this->process_one(worker_id, *log_fp)) {
					this->wait_for(settings.runner.poll_interval);
				}
			} catch (const std::exception & e) {
				EXCEPT_FATAL(worker_id, 0, *log_fp, "Fail to claim job.", e);
				this->wait_for(settings.runner.poll_interval);
			} catch (...) {
				UNKNOWN_EXCEPT_FATAL(worker_id, 0, *log_fp, "Fail to claim job.");
				this->wait_for(settings.runner.poll_interval);
			}
		}
		LOG_INFO(worker_id, 0, *log_fp, "Worker exited.");
	}

} /* namespace lboard */
