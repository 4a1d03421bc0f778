/*
 * BenchmarkJobTest.cpp
 *
 *  Created on: 2019年4月16日
 *      Author: peter
 */

#define BOOST_TEST_MODULE BenchmarkJobTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <fstream>

#include "BenchmarkJob.hpp"

#include "../common/InMemoryJobStore.hpp"
#include "../common/test_helper.hpp"

using namespace lboard;
using namespace lboard_test;

namespace
{
	std::ofstream & log_fp = lboard_test::null_log();

	struct job_fixture
	{
			temp_dir tmp;
			Settings settings;
			InMemoryJobStore store;

			job_fixture() :
					settings(make_test_settings(tmp.path(), passing_harness_script()))
			{
			}

			ClaimedJob claim(const std::vector<std::pair<std::string, std::string>> & entries)
			{
				const fs::path zip_path = tmp.path() / "upload.zip";
				make_zip(zip_path, entries);
				store.add_pending("alice", zip_path.string());
				optional<ClaimedJob> job = store.claim_next();
				BOOST_REQUIRE(job.has_value());
				return job.value();
			}
	};
}

BOOST_FIXTURE_TEST_SUITE(handle, job_fixture)

BOOST_AUTO_TEST_CASE(successful_run_is_committed_and_workspace_removed)
{
	ClaimedJob job = this->claim({{"student_agent/my-agent.py", "print('agent')\n"}});
	BenchmarkJob benchmark_job(store, settings, 1, log_fp, job);

	BOOST_CHECK(benchmark_job.handle() == run_outcome::SUCCESS);

	std::vector<CompletedRun> results = store.get_results();
	BOOST_REQUIRE_EQUAL(results.size(), 1u);
	BOOST_CHECK(results[0].outcome == run_outcome::SUCCESS);
	BOOST_CHECK_EQUAL(results[0].name, "alice");
	BOOST_CHECK_CLOSE(results[0].score.value(), 7.5, 1e-9);
	BOOST_CHECK_CLOSE(results[0].latency_reduction.value(), 20.0, 1e-9);
	BOOST_CHECK(results[0].per_problem_json.find("\"p1\"") != std::string::npos);
	BOOST_CHECK_EQUAL(store.active_count(), 0u);

	BOOST_CHECK(!benchmark_job.get_job_dir().empty());
	BOOST_CHECK(!fs::exists(benchmark_job.get_job_dir()));
}

BOOST_AUTO_TEST_CASE(missing_entry_point_keeps_workspace)
{
	ClaimedJob job = this->claim({{"student_agent/agent.py", "print('agent')\n"}});
	BenchmarkJob benchmark_job(store, settings, 1, log_fp, job);

	BOOST_CHECK(benchmark_job.handle() == run_outcome::ERROR);

	std::vector<CompletedRun> results = store.get_results();
	BOOST_REQUIRE_EQUAL(results.size(), 1u);
	BOOST_CHECK(results[0].outcome == run_outcome::ERROR);
	BOOST_CHECK(results[0].error_message.find("missing") != std::string::npos);
	BOOST_CHECK(results[0].error_message.find("my-agent.py") != std::string::npos);
	BOOST_CHECK(!results[0].score.has_value());

	BOOST_CHECK(fs::is_regular_file(benchmark_job.get_job_dir() / "student_agent" / "agent.py"));
}

BOOST_AUTO_TEST_CASE(unparseable_report_is_error)
{
	write_file(settings.benchmark.harness_path, "echo 'no score today'\n");
	ClaimedJob job = this->claim({{"my-agent.py", "print('agent')\n"}});
	BenchmarkJob benchmark_job(store, settings, 1, log_fp, job);

	BOOST_CHECK(benchmark_job.handle() == run_outcome::ERROR);
	BOOST_CHECK_EQUAL(store.get_results().at(0).error_message, "could not parse total score from scorer_tool.py output");
}

BOOST_AUTO_TEST_CASE(second_completion_is_rejected)
{
	ClaimedJob job = this->claim({{"my-agent.py", "print('agent')\n"}});
	BenchmarkJob benchmark_job(store, settings, 1, log_fp, job);
	benchmark_job.handle();

	BOOST_CHECK_THROW(store.complete_error(job.id, job.name, "again"), job_state_exception);
	BOOST_CHECK_EQUAL(store.get_results().size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
