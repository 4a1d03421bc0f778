/*
 * SandboxedExecutor.cpp
 *
 *  Created on: 2019年4月9日
 *      Author: peter
 */

#include "SandboxedExecutor.hpp"
#include "ArchiveStager.hpp"
#include "JobHandleException.hpp"
#include "ProtectedProcess.hpp"
#include "logger.hpp"
#include "text_util.hpp"

#include <cstdlib>

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace lboard
{

	namespace
	{
		void copy_tree(const fs::path & from, const fs::path & to)
		{
			fs::create_directories(to);
			for (const fs::directory_entry & entry : fs::directory_iterator(from)) {
				const fs::path dst = to / entry.path().filename();
				if (fs::is_directory(entry.status())) {
					copy_tree(entry.path(), dst);
				} else {
					fs::copy_file(entry.path(), dst, fs::copy_option::overwrite_if_exists);
				}
			}
		}

		std::string read_or_empty(const fs::path & p)
		{
			return fs::exists(p) ? read_whole_file(p) : std::string();
		}

	} /* namespace */

	SandboxedExecutor::SandboxedExecutor(const Settings & settings, int worker_id, std::ostream & log_fp) :
			settings(settings), worker_id(worker_id), log_fp(log_fp)
	{
	}

	std::string SandboxedExecutor::harness_name() const
	{
		return settings.benchmark.harness_path.filename().string();
	}

	void SandboxedExecutor::prepare_assets(job_id_type job_id, const fs::path & job_dir) const
	{
		const fs::path & benchmarks_src = settings.benchmark.benchmarks_dir;
		const fs::path & harness_src = settings.benchmark.harness_path;

		if (!fs::is_directory(benchmarks_src)) {
			throw InternalErrorException("benchmark dir not found at " + benchmarks_src.string());
		}
		if (!fs::is_regular_file(harness_src)) {
			throw InternalErrorException(harness_name() + " not found at " + harness_src.string());
		}

		try {
			copy_tree(benchmarks_src, job_dir / "local_benchmarks");
		} catch (const fs::filesystem_error & e) {
			throw InternalErrorException(std::string("failed to copy benchmark dir: ") + e.what());
		}

		try {
			fs::copy_file(harness_src, job_dir / harness_name(), fs::copy_option::overwrite_if_exists);
		} catch (const fs::filesystem_error & e) {
			throw InternalErrorException("failed to copy " + harness_name() + ": " + e.what());
		}
		LOG_DEBUG(worker_id, job_id, log_fp, "Assets prepared in ", job_dir);
	}

	ExecuteArgs SandboxedExecutor::build_environment(job_id_type job_id, const fs::path & job_dir) const
	{
		ExecuteArgs env = ExecuteArgs::current_environment();

		if (settings.backend.name == llm_backend::OPENAI) {
			const fs::path & token_path = settings.backend.openai_token_path;
			if (!fs::exists(token_path)) {
				throw InternalErrorException("OpenAI token file not found at " + token_path.string());
			}
			std::string token;
			try {
				token = trim(read_whole_file(token_path));
			} catch (const std::runtime_error & e) {
				throw InternalErrorException(std::string("failed to read OpenAI token file: ") + e.what());
			}
			env.set_env(settings.backend.token_env, token);
		}

		const fs::path site_dir = job_dir / ArchiveStager::SITE_PACKAGES_DIR_NAME;
		if (fs::is_directory(site_dir)) {
			std::string python_path = site_dir.string();
			const char * old_python_path = std::getenv("PYTHONPATH");
			if (old_python_path != nullptr && *old_python_path != '\0') {
				python_path += ":";
				python_path += old_python_path;
			}
			env.set_env("PYTHONPATH", python_path);
		}

		// 只记录凭据是否存在, 不记录凭据本身
		LOG_INFO(worker_id, job_id, log_fp, "env has ", settings.backend.token_env, "=", env.has_env(settings.backend.token_env) ? "True" : "False");
		return env;
	}

	HarnessOutput SandboxedExecutor::run_harness(job_id_type job_id, const fs::path & job_dir, const ExecuteArgs & env) const
	{
		std::string interpreter;
		try {
			interpreter = resolve_executable(settings.benchmark.interpreter);
		} catch (const std::runtime_error & e) {
			throw InternalErrorException(e.what());
		}

		const std::string backend = get_llm_backend_name(settings.backend.name);
		ExecuteArgs harness_args = {interpreter, harness_name(), "--LLM-client", backend, "--trials", std::to_string(settings.benchmark.trials)};

		const fs::path stdout_path = job_dir / "scorer.stdout";
		const fs::path stderr_path = job_dir / "scorer.stderr";

		ProtectedProcessConfig config(job_dir, stdout_path, stderr_path);
		config.set_max_real_time(std::chrono::duration_cast<std::chrono::milliseconds>(settings.benchmark.timeout));
		config.set_use_seccomp(settings.sandbox.seccomp);
		if (settings.sandbox.max_memory_mb > 0) {
			config.set_max_memory(kerbal::utility::storage_cast<kerbal::utility::Byte>(kerbal::utility::MB(settings.sandbox.max_memory_mb)));
		}
		if (settings.sandbox.max_process_number > 0) {
			config.set_max_process_number(settings.sandbox.max_process_number);
		}
		if (settings.sandbox.max_output_size_mb > 0) {
			config.set_max_output_size(kerbal::utility::storage_cast<kerbal::utility::Byte>(kerbal::utility::MB(settings.sandbox.max_output_size_mb)));
		}

		LOG_INFO(worker_id, job_id, log_fp, "Invoking ", harness_name(), " with ", backend, " client; cmd: ", harness_args.join(), "; cwd: ", job_dir);

		ProtectedProcessDetails details = protected_process(harness_args, config, env);

		LOG_INFO(worker_id, job_id, log_fp, harness_name(), " finished. result: ", details.running_result(),
				" exit code: ", details.exit_code(), " real time: ", details.real_time().count(), " ms");

		switch (details.running_result()) {
			case ProtectedProcessResult::EXITED_NORMALLY:
				break;
			case ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED:
				throw ExecutionFaultException("timeout after " + std::to_string(settings.benchmark.timeout.count())
						+ "s running " + harness_name() + " (job-level timeout)");
			case ProtectedProcessResult::SYSTEM_ERROR:
				throw InternalErrorException("failed to start " + harness_name() + " with " + interpreter);
			case ProtectedProcessResult::NON_ZERO_EXIT:
			case ProtectedProcessResult::KILLED_BY_SIGNAL:
				throw ExecutionFaultException(compose_failure_message(
						harness_name() + " failed, rc " + std::to_string(details.exit_code()),
						read_or_empty(stdout_path), read_or_empty(stderr_path),
						settings.staging.tail_lines, true));
		}

		HarnessOutput output;
		output.stdout_text = read_or_empty(stdout_path);
		output.stderr_text = read_or_empty(stderr_path);
		output.real_time = details.real_time();
		return output;
	}

	HarnessOutput SandboxedExecutor::execute(job_id_type job_id, const fs::path & job_dir) const
	{
		this->prepare_assets(job_id, job_dir);
		ExecuteArgs env = this->build_environment(job_id, job_dir);
		return this->run_harness(job_id, job_dir, env);
	}

} /* namespace lboard */
