/*
 * SandboxedExecutorTest.cpp
 *
 *  Created on: 2019年4月15日
 *      Author: peter
 */

#define BOOST_TEST_MODULE SandboxedExecutorTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <fstream>

#include "SandboxedExecutor.hpp"
#include "JobHandleException.hpp"

#include "../common/test_helper.hpp"

using namespace lboard;
using namespace lboard_test;

namespace
{
	std::ofstream & log_fp = lboard_test::null_log();

	struct executor_fixture
	{
			temp_dir tmp;
			Settings settings;
			fs::path job_dir;

			executor_fixture() :
					settings(make_test_settings(tmp.path(), passing_harness_script())),
					job_dir(tmp.path() / "job")
			{
				fs::create_directories(job_dir);
			}

			void set_harness(const std::string & script)
			{
				write_file(settings.benchmark.harness_path, script);
			}

			HarnessOutput run()
			{
				SandboxedExecutor executor(settings, 1, log_fp);
				return executor.execute(job_id_type(1), job_dir);
			}

			std::string failure_of_run()
			{
				try {
					this->run();
				} catch (const JobHandleException & e) {
					return e.what();
				}
				BOOST_FAIL("execute should have thrown");
				return "";
			}
	};
}

BOOST_FIXTURE_TEST_SUITE(execute, executor_fixture)

BOOST_AUTO_TEST_CASE(harness_runs_in_job_dir_with_assets)
{
	set_harness("echo \"args: $*\"\n"
				"test -f local_benchmarks/problem-1/starter.py && echo 'benchmarks present'\n"
				"echo 'TOTAL SCORE: 7.5'\n");
	HarnessOutput output = this->run();

	BOOST_CHECK(output.stdout_text.find("args: --LLM-client ollama --trials 3") != std::string::npos);
	BOOST_CHECK(output.stdout_text.find("benchmarks present") != std::string::npos);
	BOOST_CHECK(fs::is_regular_file(job_dir / "scorer_tool.py"));
	BOOST_CHECK(fs::is_regular_file(job_dir / "local_benchmarks" / "problem-1" / "starter.py"));
	BOOST_CHECK(fs::is_regular_file(job_dir / "scorer.stdout"));
}

BOOST_AUTO_TEST_CASE(timeout_is_distinct_from_non_zero_exit)
{
	settings.benchmark.timeout = std::chrono::seconds(1);
	set_harness("sleep 30\n");
	const std::string timeout_msg = this->failure_of_run();
	BOOST_CHECK_EQUAL(timeout_msg, "timeout after 1s running scorer_tool.py (job-level timeout)");

	set_harness("echo partial\necho trace 1>&2\nexit 2\n");
	const std::string exit_msg = this->failure_of_run();
	BOOST_CHECK_EQUAL(exit_msg, "scorer_tool.py failed, rc 2; tail of stdout: partial; tail of stderr: trace");
	BOOST_CHECK(exit_msg.find("timeout") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(empty_stdout_is_marked)
{
	set_harness("exit 4\n");
	BOOST_CHECK_EQUAL(this->failure_of_run(), "scorer_tool.py failed, rc 4; (no stdout)");
}

BOOST_AUTO_TEST_CASE(only_last_lines_are_kept)
{
	set_harness("for i in 1 2 3 4 5 6 7 8; do echo line$i; done\nexit 1\n");
	BOOST_CHECK_EQUAL(this->failure_of_run(), "scorer_tool.py failed, rc 1; tail of stdout: line4\nline5\nline6\nline7\nline8");
}

BOOST_AUTO_TEST_CASE(missing_openai_token_is_internal_error)
{
	settings.backend.name = llm_backend::OPENAI;
	settings.backend.openai_token_path = tmp.path() / "absent_token.txt";
	BOOST_CHECK_EQUAL(this->failure_of_run(),
					  "internal error: OpenAI token file not found at " + settings.backend.openai_token_path.string());
}

BOOST_AUTO_TEST_CASE(openai_token_is_exported)
{
	settings.backend.name = llm_backend::OPENAI;
	settings.backend.openai_token_path = tmp.path() / "token.txt";
	write_file(settings.backend.openai_token_path, "sk-test\n");
	set_harness("echo \"token=$ECE30861_OPENAI_TOKEN client=$2\"\necho 'TOTAL SCORE: 1'\n");

	HarnessOutput output = this->run();
	BOOST_CHECK(output.stdout_text.find("token=sk-test client=openai") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(installed_dependencies_are_on_python_path)
{
	fs::create_directories(job_dir / "site-packages");
	set_harness("echo \"path=$PYTHONPATH\"\necho 'TOTAL SCORE: 1'\n");

	HarnessOutput output = this->run();
	BOOST_CHECK(output.stdout_text.find("path=" + (job_dir / "site-packages").string()) != std::string::npos);
}

BOOST_AUTO_TEST_CASE(missing_assets_are_internal_errors)
{
	fs::remove_all(settings.benchmark.benchmarks_dir);
	BOOST_CHECK_EQUAL(this->failure_of_run(),
					  "internal error: benchmark dir not found at " + settings.benchmark.benchmarks_dir.string());
}

BOOST_AUTO_TEST_SUITE_END()
