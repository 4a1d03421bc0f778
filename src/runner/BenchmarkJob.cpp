/*
 * BenchmarkJob.cpp
 *
 *  Created on: 2019年4月10日
 *      Author: peter
 */

#include "BenchmarkJob.hpp"
#include "ArchiveStager.hpp"
#include "JobHandleException.hpp"
#include "SandboxedExecutor.hpp"
#include "ScoreReportParser.hpp"
#include "logger.hpp"

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace lboard
{

	BenchmarkJob::BenchmarkJob(JobStore & store, const Settings & settings, int worker_id, std::ostream & log_fp, ClaimedJob job) :
			store(store), settings(settings), worker_id(worker_id), log_fp(log_fp), job(std::move(job))
	{
	}

	ScoreReport BenchmarkJob::run_pipeline()
	{
		ArchiveStager stager(settings, worker_id, log_fp);
		SandboxedExecutor executor(settings, worker_id, log_fp);

		job_dir = stager.allocate_job_dir(job.id);
		LOG_INFO(worker_id, job.id, log_fp, "Job dir: ", job_dir);

		// Step 1: 解压并校验提交的压缩包, 安装依赖
		stager.stage(job.id, fs::path(job.archive_path), job_dir);

		// Step 2: 准备评测资源并运行评测程序
		HarnessOutput output = executor.execute(job.id, job_dir);
		LOG_DEBUG(worker_id, job.id, log_fp, "stdout of ", executor.harness_name(), ":\n", output.stdout_text);

		// Step 3: 解析评测程序的输出
		return ScoreReportParser::parse(output.stdout_text, executor.harness_name());
	}

	run_outcome BenchmarkJob::handle()
	{
		LOG_INFO(worker_id, job.id, log_fp, "Start job. name: ", job.name, ", archive: ", job.archive_path);

		run_outcome outcome = run_outcome::ERROR;
		ScoreReport report;
		std::string error_message;

		try {
			report = this->run_pipeline();
			outcome = run_outcome::SUCCESS;
		} catch (const JobHandleException & e) {
			LOG_WARNING(worker_id, job.id, log_fp, "Job failed. kind: ", get_kind_name(e.kind()), ", reason: ", e.what());
			error_message = e.what();
		} catch (const std::exception & e) {
			EXCEPT_FATAL(worker_id, job.id, log_fp, "Job failed with an unexpected exception.", e);
			error_message = std::string("internal error: ") + e.what();
		}

		if (outcome == run_outcome::SUCCESS) {
			store.complete_success(job.id, job.name, report);
			LOG_INFO(worker_id, job.id, log_fp, "Job finished successfully. score: ", report.score, ", latency reduction: ", report.latency_reduction, "%");
		} else {
			store.complete_error(job.id, job.name, error_message);
			LOG_INFO(worker_id, job.id, log_fp, "Job finished with error: ", error_message);
		}

		this->finalize_workspace(outcome);
		return outcome;
	}

	void BenchmarkJob::finalize_workspace(run_outcome outcome) noexcept
	{
		if (job_dir.empty()) {
			return;
		}
		if (outcome != run_outcome::SUCCESS) {
			LOG_INFO(worker_id, job.id, log_fp, "Job dir retained for inspection: ", job_dir);
			return;
		}
		boost::system::error_code ec;
		fs::remove_all(job_dir, ec);
		if (ec) {
			LOG_WARNING(worker_id, job.id, log_fp, "Failed to remove job dir: ", job_dir, ", reason: ", ec.message());
		} else {
			LOG_DEBUG(worker_id, job.id, log_fp, "Job dir removed: ", job_dir);
		}
	}

} /* namespace lboard */
