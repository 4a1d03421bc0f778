/*
 * settings.cpp
 *
 *  Created on: 2019年4月3日
 *      Author: peter
 */

#include "settings.hpp"

#include <fstream>
#include <stdexcept>

namespace lboard
{

	void Settings::parse(const nlohmann::json & json_obj)
	{
		{
			const auto & runtime_node = json_obj.at("runtime");
			runtime.log_dir = runtime_node.at("log_dir").get<std::string>();
			runtime.echo_to_console = runtime_node.value("echo_to_console", runtime.echo_to_console);
		}

		{
			const auto & mysql_node = json_obj.at("mysql");
			mysql.hostname = mysql_node.at("hostname").get<std::string>();
			mysql.port = mysql_node.value("port", mysql.port);
			mysql.username = mysql_node.at("username").get<std::string>();
			mysql.password = mysql_node.at("password").get<std::string>();
			mysql.database = mysql_node.at("database").get<std::string>();
			mysql.max_connections = mysql_node.value("max_connections", mysql.max_connections);
		}

		{
			const auto & runner_node = json_obj.at("runner");
			runner.workers = runner_node.value("workers", runner.workers);
			runner.poll_interval = std::chrono::milliseconds(runner_node.value("poll_interval_ms", runner.poll_interval.count()));
			runner.schema_retry_interval = std::chrono::milliseconds(runner_node.value("schema_retry_ms", runner.schema_retry_interval.count()));
			runner.workspace_dir = runner_node.at("workspace_dir").get<std::string>();
			runner.fail_orphaned_on_start = runner_node.value("fail_orphaned_on_start", runner.fail_orphaned_on_start);
		}

		if (json_obj.contains("staging")) {
			const auto & staging_node = json_obj.at("staging");
			staging.extract_dir_name = staging_node.value("extract_dir_name", staging.extract_dir_name);
			staging.entry_point = staging_node.value("entry_point", staging.entry_point);
			staging.requirements_file = staging_node.value("requirements_file", staging.requirements_file);
			staging.install_timeout = std::chrono::seconds(staging_node.value("install_timeout_s", staging.install_timeout.count()));
			staging.tail_lines = staging_node.value("tail_lines", staging.tail_lines);
		}

		{
			const auto & benchmark_node = json_obj.at("benchmark");
			benchmark.benchmarks_dir = benchmark_node.at("benchmarks_dir").get<std::string>();
			benchmark.harness_path = benchmark_node.at("harness_path").get<std::string>();
			benchmark.default_client_dir = benchmark_node.at("default_client_dir").get<std::string>();
			benchmark.interpreter = benchmark_node.value("interpreter", benchmark.interpreter);
			benchmark.trials = benchmark_node.value("trials", benchmark.trials);
			benchmark.timeout = std::chrono::seconds(benchmark_node.value("timeout_s", benchmark.timeout.count()));
		}

		if (json_obj.contains("backend")) {
			const auto & backend_node = json_obj.at("backend");
			backend.name = parse_llm_backend(backend_node.value("name", std::string(get_llm_backend_name(backend.name))));
			backend.openai_token_path = backend_node.value("openai_token_path", std::string());
			backend.token_env = backend_node.value("token_env", backend.token_env);
		}

		if (json_obj.contains("sandbox")) {
			const auto & sandbox_node = json_obj.at("sandbox");
			sandbox.seccomp = sandbox_node.value("seccomp", sandbox.seccomp);
			sandbox.max_memory_mb = sandbox_node.value("max_memory_mb", sandbox.max_memory_mb);
			sandbox.max_process_number = sandbox_node.value("max_process_number", sandbox.max_process_number);
			sandbox.max_output_size_mb = sandbox_node.value("max_output_size_mb", sandbox.max_output_size_mb);
		}

		{
			const auto & intake_node = json_obj.at("intake");
			intake.upload_dir = intake_node.at("upload_dir").get<std::string>();
			if (intake_node.contains("allowed_extensions")) {
				intake.allowed_extensions = intake_node.at("allowed_extensions").get<std::vector<std::string>>();
			}
		}

		if (mysql.max_connections <= 0) {
			throw std::invalid_argument("mysql.max_connections must be positive");
		}
		if (runner.workers <= 0) {
			throw std::invalid_argument("runner.workers must be positive");
		}
		if (benchmark.trials <= 0) {
			throw std::invalid_argument("benchmark.trials must be positive");
		}
	}

	void Settings::parse(const boost::filesystem::path & config_file)
	{
		nlohmann::json json_obj;
		{
			std::ifstream config_file_stream {config_file.string()};
			if (!config_file_stream) {
				throw std::runtime_error("open configure file failed: " + config_file.string());
			}
			config_file_stream >> json_obj;
		}
		this->parse(json_obj);
	}

} /* namespace lboard */
