/*
 * LeaderboardViewTest.cpp
 *
 *  Created on: 2019年4月17日
 *      Author: peter
 */

#define BOOST_TEST_MODULE LeaderboardViewTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "LeaderboardView.hpp"

#include "../common/InMemoryJobStore.hpp"

using namespace lboard;

namespace
{
	ScoreReport make_report(double score, double latency)
	{
		ScoreReport report;
		report.score = score;
		report.latency_reduction = latency;
		ProblemScore p1;
		p1.problem = "p1";
		p1.correct = true;
		p1.score = 1.02;
		ProblemScore p2;
		p2.problem = "p2";
		p2.correct = false;
		p2.score = 0.0;
		ProblemScore p3;
		p3.problem = "p3";
		report.problems = {p1, p2, p3};
		return report;
	}

	void finish_success(InMemoryJobStore & store, const std::string & name, double score, double latency)
	{
		store.add_pending(name, "/tmp/" + name + ".zip");
		ClaimedJob job = store.claim_next().value();
		store.complete_success(job.id, job.name, make_report(score, latency));
	}
}

BOOST_AUTO_TEST_CASE(empty_board)
{
	InMemoryJobStore store;
	LeaderboardView view(store);
	BOOST_CHECK(view.rows().empty());
	BOOST_CHECK_EQUAL(LeaderboardView::render_text(view.rows()), "No runs submitted yet.\n");
}

BOOST_AUTO_TEST_CASE(rows_are_ranked_then_queued)
{
	InMemoryJobStore store;
	finish_success(store, "low", 2.0, 10.0);
	finish_success(store, "high", 7.5, 20.0);

	store.add_pending("failing", "/tmp/failing.zip");
	ClaimedJob failing = store.claim_next().value();
	store.complete_error(failing.id, failing.name, "missing my-agent.py");

	job_id_type running_id = store.add_pending("runner", "/tmp/r.zip");
	BOOST_REQUIRE(store.claim_next().value().id == running_id);
	store.add_pending("first", "/tmp/a.zip");
	store.enqueue("registering", "");
	store.add_pending("second", "/tmp/b.zip");

	LeaderboardView view(store);
	std::vector<LeaderboardRow> rows = view.rows();
	BOOST_REQUIRE_EQUAL(rows.size(), 7u);

	BOOST_CHECK_EQUAL(rows[0].name, "high");
	BOOST_CHECK_EQUAL(LeaderboardView::score_cell(rows[0]), "7.500");
	BOOST_CHECK_EQUAL(LeaderboardView::latency_cell(rows[0]), "20.00%");
	BOOST_CHECK_EQUAL(rows[1].name, "low");
	BOOST_CHECK_EQUAL(rows[2].name, "failing");
	BOOST_CHECK_EQUAL(LeaderboardView::score_cell(rows[2]), "ERROR: missing my-agent.py");
	BOOST_CHECK_EQUAL(LeaderboardView::latency_cell(rows[2]), "—");

	BOOST_CHECK_EQUAL(rows[3].name, "runner");
	BOOST_CHECK_EQUAL(LeaderboardView::score_cell(rows[3]), "RUNNING NOW");
	BOOST_CHECK(!rows[3].queue_ahead.has_value());

	BOOST_CHECK_EQUAL(rows[4].name, "first");
	BOOST_CHECK_EQUAL(LeaderboardView::score_cell(rows[4]), "pending, 0 in queue");
	BOOST_CHECK_EQUAL(rows[5].name, "registering");
	BOOST_CHECK_EQUAL(LeaderboardView::score_cell(rows[5]), "registering");
	BOOST_CHECK(!rows[5].queue_ahead.has_value());
	BOOST_CHECK_EQUAL(rows[6].name, "second");
	BOOST_CHECK_EQUAL(LeaderboardView::score_cell(rows[6]), "pending, 1 in queue");
}

BOOST_AUTO_TEST_CASE(per_problem_detail)
{
	InMemoryJobStore store;
	finish_success(store, "alice", 7.5, 20.0);
	LeaderboardView view(store);
	std::vector<LeaderboardRow> rows = view.rows();
	BOOST_REQUIRE_EQUAL(rows.size(), 1u);

	std::vector<std::string> lines = LeaderboardView::per_problem_lines(rows[0]);
	BOOST_REQUIRE_EQUAL(lines.size(), 3u);
	BOOST_CHECK_EQUAL(lines[0], "p1: 1.020");
	BOOST_CHECK_EQUAL(lines[1], "p2: 0.000 (FAIL)");
	BOOST_CHECK_EQUAL(lines[2], "p3: ?");

	const std::string text = LeaderboardView::render_text(rows);
	BOOST_CHECK(text.find("alice") != std::string::npos);
	BOOST_CHECK(text.find("p2: 0.000 (FAIL)") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(malformed_detail_renders_nothing)
{
	LeaderboardRow row;
	row.completed = true;
	row.outcome = run_outcome::SUCCESS;
	row.score = 1.0;
	row.per_problem_json = "{not json";
	BOOST_CHECK(LeaderboardView::per_problem_lines(row).empty());

	row.per_problem_json = "{\"problem\": \"p1\"}";
	BOOST_CHECK(LeaderboardView::per_problem_lines(row).empty());
	BOOST_CHECK_EQUAL(LeaderboardView::score_cell(row), "1.000");
}
