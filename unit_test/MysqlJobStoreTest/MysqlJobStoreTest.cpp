/*
 * MysqlJobStoreTest.cpp
 *
 *  Created on: 2019年4月18日
 *      Author: peter
 */

#define BOOST_TEST_MODULE MysqlJobStoreTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <future>
#include <mutex>
#include <set>
#include <thread>

#include "MysqlJobStore.hpp"
#include "logger.hpp"

using namespace lboard;

/*
 * 需要一个可随意清空的数据库, 通过环境变量指定:
 * LBOARD_TEST_MYSQL_HOST (必需), LBOARD_TEST_MYSQL_PORT, LBOARD_TEST_MYSQL_USER,
 * LBOARD_TEST_MYSQL_PASSWORD, LBOARD_TEST_MYSQL_DATABASE
 * 未指定时全部用例被跳过
 */

namespace
{
	std::ofstream log_fp = []() {
		std::ofstream fout("/dev/null");
		lboard::log::set_console_echo(fout, false);
		return fout;
	}();

	std::string env_or(const char * key, const std::string & default_value)
	{
		const char * val = std::getenv(key);
		return val == nullptr ? default_value : std::string(val);
	}

	boost::test_tools::assertion_result mysql_configured(boost::unit_test::test_unit_id)
	{
		boost::test_tools::assertion_result res(std::getenv("LBOARD_TEST_MYSQL_HOST") != nullptr);
		res.message() << "LBOARD_TEST_MYSQL_HOST is not set";
		return res;
	}

	struct store_fixture
	{
			Settings settings;
			std::unique_ptr<MysqlJobStore> store;

			store_fixture()
			{
				settings.mysql.hostname = env_or("LBOARD_TEST_MYSQL_HOST", "localhost");
				settings.mysql.port = std::stoi(env_or("LBOARD_TEST_MYSQL_PORT", "3306"));
				settings.mysql.username = env_or("LBOARD_TEST_MYSQL_USER", "root");
				settings.mysql.password = env_or("LBOARD_TEST_MYSQL_PASSWORD", "");
				settings.mysql.database = env_or("LBOARD_TEST_MYSQL_DATABASE", "lboard_test");
				settings.mysql.max_connections = 10;
				settings.runner.schema_retry_interval = std::chrono::milliseconds(50);

				store.reset(new MysqlJobStore(settings, log_fp));
				store->connect();
				store->drop_schema();
				store->ensure_schema();
			}

			job_id_type add_pending(const std::string & name)
			{
				job_id_type job_id = store->enqueue(name, "");
				store->activate(job_id, "/tmp/" + name + ".zip");
				return job_id;
			}
	};
}

BOOST_AUTO_TEST_SUITE(mysql_job_store, * boost::unit_test::precondition(mysql_configured))

BOOST_FIXTURE_TEST_CASE(registering_job_is_not_claimable, store_fixture)
{
	job_id_type job_id = store->enqueue("alice", "");
	BOOST_CHECK(store->claim_next() == nullopt);

	store->activate(job_id, "/tmp/alice.zip");
	optional<ClaimedJob> job = store->claim_next();
	BOOST_REQUIRE(job.has_value());
	BOOST_CHECK(job.value().id == job_id);
	BOOST_CHECK_EQUAL(job.value().name, "alice");
	BOOST_CHECK_EQUAL(job.value().archive_path, "/tmp/alice.zip");
	BOOST_CHECK(store->claim_next() == nullopt);
}

BOOST_FIXTURE_TEST_CASE(activate_requires_registering, store_fixture)
{
	job_id_type job_id = this->add_pending("alice");
	BOOST_CHECK_THROW(store->activate(job_id, "/tmp/other.zip"), job_state_exception);
	BOOST_CHECK_THROW(store->activate(job_id_type(9999), "/tmp/other.zip"), job_state_exception);
}

BOOST_FIXTURE_TEST_CASE(concurrent_claims_are_exclusive, store_fixture)
{
	std::set<job_id_literal> submitted;
	for (int i = 0; i < 20; ++i) {
		submitted.insert(this->add_pending("user" + std::to_string(i)).to_literal());
	}

	std::mutex mtx;
	std::vector<job_id_literal> claimed;
	bool ordered = true;
	std::vector<std::thread> threads;
	for (int t = 0; t < 8; ++t) {
		threads.emplace_back([&]() {
			job_id_literal last = 0;
			while (true) {
				optional<ClaimedJob> job = store->claim_next();
				if (job == nullopt) {
					break;
				}
				const job_id_literal id = job.value().id.to_literal();
				std::lock_guard<std::mutex> lock(mtx);
				if (id <= last) {
					ordered = false;
				}
				last = id;
				claimed.push_back(id);
			}
		});
	}
	for (std::thread & t : threads) {
		t.join();
	}

	BOOST_CHECK_EQUAL(claimed.size(), submitted.size());
	BOOST_CHECK(std::set<job_id_literal>(claimed.begin(), claimed.end()) == submitted);
	BOOST_CHECK(ordered);
}

BOOST_FIXTURE_TEST_CASE(second_completion_is_rejected, store_fixture)
{
	this->add_pending("alice");
	ClaimedJob job = store->claim_next().value();

	ScoreReport report;
	report.score = 7.5;
	report.latency_reduction = 20.0;
	store->complete_success(job.id, job.name, report);

	BOOST_CHECK_THROW(store->complete_error(job.id, job.name, "late failure"), job_state_exception);
	BOOST_CHECK_THROW(store->complete_success(job.id, job.name, report), job_state_exception);

	LeaderboardSnapshot snap = store->snapshot();
	BOOST_CHECK_EQUAL(snap.completed.size(), 1u);
	BOOST_CHECK(snap.active.empty());
}

BOOST_FIXTURE_TEST_CASE(completion_requires_running, store_fixture)
{
	job_id_type job_id = this->add_pending("alice");
	BOOST_CHECK_THROW(store->complete_error(job_id, "alice", "not claimed"), job_state_exception);
	BOOST_CHECK(store->snapshot().completed.empty());
}

BOOST_FIXTURE_TEST_CASE(ids_are_never_reused, store_fixture)
{
	job_id_type first = this->add_pending("alice");
	ClaimedJob job = store->claim_next().value();
	store->complete_error(job.id, job.name, "boom");

	job_id_type second = store->enqueue("bob", "");
	BOOST_CHECK(first < second);
}

BOOST_FIXTURE_TEST_CASE(snapshot_is_ranked, store_fixture)
{
	ScoreReport low;
	low.score = 2.0;
	low.latency_reduction = 30.0;
	ScoreReport high;
	high.score = 7.5;
	high.latency_reduction = 20.0;
	ProblemScore p1;
	p1.problem = "p1";
	p1.correct = true;
	p1.score = 1.02;
	high.problems.push_back(p1);

	this->add_pending("low");
	this->add_pending("high");
	this->add_pending("broken");
	ClaimedJob a = store->claim_next().value();
	ClaimedJob b = store->claim_next().value();
	ClaimedJob c = store->claim_next().value();
	store->complete_success(a.id, a.name, low);
	store->complete_success(b.id, b.name, high);
	store->complete_error(c.id, c.name, "missing my-agent.py");
	this->add_pending("waiting");

	LeaderboardSnapshot snap = store->snapshot();
	BOOST_REQUIRE_EQUAL(snap.completed.size(), 3u);
	BOOST_CHECK_EQUAL(snap.completed[0].name, "high");
	BOOST_CHECK_EQUAL(snap.completed[1].name, "low");
	BOOST_CHECK_EQUAL(snap.completed[2].name, "broken");
	BOOST_CHECK(snap.completed[2].outcome == run_outcome::ERROR);
	BOOST_CHECK_EQUAL(snap.completed[2].error_message, "missing my-agent.py");
	BOOST_CHECK(!snap.completed[2].score.has_value());

	std::vector<ProblemScore> problems = problems_from_json(snap.completed[0].per_problem_json);
	BOOST_REQUIRE_EQUAL(problems.size(), 1u);
	BOOST_CHECK_EQUAL(problems[0].problem, "p1");

	BOOST_REQUIRE_EQUAL(snap.active.size(), 1u);
	BOOST_CHECK_EQUAL(snap.active[0].name, "waiting");
	BOOST_CHECK(snap.active[0].status == job_status::PENDING);
}

BOOST_FIXTURE_TEST_CASE(orphaned_jobs_are_failed, store_fixture)
{
	this->add_pending("alice");
	this->add_pending("bob");
	store->claim_next();

	BOOST_CHECK_EQUAL(store->fail_orphaned_jobs("internal error: runner restarted"), 1);

	LeaderboardSnapshot snap = store->snapshot();
	BOOST_REQUIRE_EQUAL(snap.completed.size(), 1u);
	BOOST_CHECK_EQUAL(snap.completed[0].name, "alice");
	BOOST_CHECK_EQUAL(snap.completed[0].error_message, "internal error: runner restarted");
	BOOST_REQUIRE_EQUAL(snap.active.size(), 1u);
	BOOST_CHECK(snap.active[0].status == job_status::PENDING);
}

BOOST_FIXTURE_TEST_CASE(claim_waits_for_schema, store_fixture)
{
	store->drop_schema();

	std::future<optional<ClaimedJob>> claimer = std::async(std::launch::async, [this]() {
		// 建表与登记任务之间可能领取到空队列, 因此循环直到拿到任务
		for (int i = 0; i < 100; ++i) {
			optional<ClaimedJob> job = store->claim_next();
			if (job != nullopt) {
				return job;
			}
			std::this_thread::sleep_for(std::chrono::milliseconds(50));
		}
		return optional<ClaimedJob>();
	});

	std::this_thread::sleep_for(std::chrono::milliseconds(200));
	BOOST_CHECK(claimer.wait_for(std::chrono::seconds(0)) == std::future_status::timeout);

	store->ensure_schema();
	job_id_type job_id = this->add_pending("alice");

	optional<ClaimedJob> job;
	BOOST_REQUIRE_NO_THROW(job = claimer.get());
	BOOST_REQUIRE(job.has_value());
	BOOST_CHECK(job.value().id == job_id);
}

BOOST_AUTO_TEST_SUITE_END()
