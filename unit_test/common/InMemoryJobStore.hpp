/*
 * InMemoryJobStore.hpp
 *
 *  Created on: 2019年4月14日
 *      Author: peter
 */

#ifndef UNIT_TEST_COMMON_INMEMORYJOBSTORE_HPP_
#define UNIT_TEST_COMMON_INMEMORYJOBSTORE_HPP_

#include <algorithm>
#include <map>
#include <mutex>

#include "JobStore.hpp"

namespace lboard
{

	/**
	 * @brief 进程内的 JobStore, 用于不依赖数据库的测试. 语义与 MysqlJobStore 一致
	 */
	class InMemoryJobStore: public JobStore
	{
		private:
			struct Entry
			{
					std::string name;
					std::string archive_path;
					job_status status;
			};

			mutable std::mutex mtx;
			job_id_type::integer_type next_job_id = 1;
			std::map<job_id_type::integer_type, Entry> jobs;
			std::vector<CompletedRun> results;

			void check_running(job_id_type job_id)
			{
				auto it = jobs.find(job_id.to_literal());
				if (it == jobs.end() || it->second.status != job_status::RUNNING) {
					throw job_state_exception("job " + std::to_string(job_id) + " is not running");
				}
			}

		public:
			virtual void ensure_schema() override
			{
			}

			virtual job_id_type enqueue(const std::string & name, const std::string & archive_ref) override
			{
				std::lock_guard<std::mutex> lock(mtx);
				job_id_type::integer_type id = next_job_id++;
				jobs[id] = Entry {name, archive_ref, job_status::REGISTERING};
				return job_id_type(id);
			}

			virtual void activate(job_id_type job_id, const std::string & archive_ref) override
			{
				std::lock_guard<std::mutex> lock(mtx);
				auto it = jobs.find(job_id.to_literal());
				if (it == jobs.end() || it->second.status != job_status::REGISTERING) {
					throw job_state_exception("job " + std::to_string(job_id) + " is not registering");
				}
				it->second.archive_path = archive_ref;
				it->second.status = job_status::PENDING;
			}

			/**
			 * @brief 直接登记一个 PENDING 任务
			 */
			job_id_type add_pending(const std::string & name, const std::string & archive_ref)
			{
				job_id_type job_id = this->enqueue(name, "");
				this->activate(job_id, archive_ref);
				return job_id;
			}

			virtual optional<ClaimedJob> claim_next() override
			{
				std::lock_guard<std::mutex> lock(mtx);
				for (auto & p : jobs) {
					if (p.second.status == job_status::PENDING) {
						p.second.status = job_status::RUNNING;
						ClaimedJob job;
						job.id = job_id_type(p.first);
						job.name = p.second.name;
						job.archive_path = p.second.archive_path;
						return job;
					}
				}
				return nullopt;
			}

			virtual void complete_success(job_id_type job_id, const std::string & name, const ScoreReport & report) override
			{
				std::lock_guard<std::mutex> lock(mtx);
				this->check_running(job_id);
				CompletedRun run;
				run.job_id = job_id;
				run.name = name;
				run.outcome = run_outcome::SUCCESS;
				run.latency_reduction = report.latency_reduction;
				run.score = report.score;
				run.per_problem_json = problems_to_json(report.problems);
				results.push_back(std::move(run));
				jobs.erase(job_id.to_literal());
			}

			virtual void complete_error(job_id_type job_id, const std::string & name, const std::string & message) override
			{
				std::lock_guard<std::mutex> lock(mtx);
				this->check_running(job_id);
				CompletedRun run;
				run.job_id = job_id;
				run.name = name;
				run.outcome = run_outcome::ERROR;
				run.error_message = message;
				results.push_back(std::move(run));
				jobs.erase(job_id.to_literal());
			}

			virtual LeaderboardSnapshot snapshot() override
			{
				std::lock_guard<std::mutex> lock(mtx);
				LeaderboardSnapshot snap;
				snap.completed = results;
				std::stable_sort(snap.completed.begin(), snap.completed.end(), [](const CompletedRun & a, const CompletedRun & b) {
					if (a.score.has_value() != b.score.has_value()) {
						return a.score.has_value();
					}
					if (a.score.has_value() && a.score.value() != b.score.value()) {
						return a.score.value() > b.score.value();
					}
					if (a.latency_reduction.has_value() != b.latency_reduction.has_value()) {
						return a.latency_reduction.has_value();
					}
					if (a.latency_reduction.has_value() && a.latency_reduction.value() != b.latency_reduction.value()) {
						return a.latency_reduction.value() > b.latency_reduction.value();
					}
					return false;
				});
				for (const auto & p : jobs) {
					ActiveJob job;
					job.id = job_id_type(p.first);
					job.name = p.second.name;
					job.status = p.second.status;
					snap.active.push_back(std::move(job));
				}
				return snap;
			}

			virtual int fail_orphaned_jobs(const std::string & message) override
			{
				std::vector<job_id_type> running;
				{
					std::lock_guard<std::mutex> lock(mtx);
					for (const auto & p : jobs) {
						if (p.second.status == job_status::RUNNING) {
							running.push_back(job_id_type(p.first));
						}
					}
				}
				for (job_id_type job_id : running) {
					std::string name;
					{
						std::lock_guard<std::mutex> lock(mtx);
						name = jobs.at(job_id.to_literal()).name;
					}
					this->complete_error(job_id, name, message);
				}
				return static_cast<int>(running.size());
			}

			std::vector<CompletedRun> get_results() const
			{
				std::lock_guard<std::mutex> lock(mtx);
				return results;
			}

			size_t active_count() const
			{
				std::lock_guard<std::mutex> lock(mtx);
				return jobs.size();
			}
	};

} /* namespace lboard */

#endif /* UNIT_TEST_COMMON_INMEMORYJOBSTORE_HPP_ */
