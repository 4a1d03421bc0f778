/*
 * ScoreReportParserTest.cpp
 *
 *  Created on: 2019年4月14日
 *      Author: peter
 */

#define BOOST_TEST_MODULE ScoreReportParserTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "ScoreReportParser.hpp"
#include "JobHandleException.hpp"

using namespace lboard;

BOOST_AUTO_TEST_CASE(single_problem_report)
{
	const std::string out =
			"Running benchmarks...\n"
			"p1: starter_time=100.00ms, optimized_time=80.00ms, improvement=20.00ms, correct=True\n"
			"TOTAL SCORE: 7.5\n";

	ScoreReport report = ScoreReportParser::parse(out);
	BOOST_CHECK_CLOSE(report.score, 7.5, 1e-9);
	BOOST_CHECK_CLOSE(report.latency_reduction, 20.0, 1e-9);
	BOOST_REQUIRE_EQUAL(report.problems.size(), 1u);

	const ProblemScore & p = report.problems[0];
	BOOST_CHECK_EQUAL(p.problem, "p1");
	BOOST_CHECK_CLOSE(p.starter_time_ms, 100.0, 1e-9);
	BOOST_CHECK_CLOSE(p.optimized_time_ms, 80.0, 1e-9);
	BOOST_CHECK_CLOSE(p.improvement_ms, 20.0, 1e-9);
	BOOST_REQUIRE(p.correct.has_value());
	BOOST_CHECK(p.correct.value());
	BOOST_REQUIRE(p.score.has_value());
	BOOST_CHECK_CLOSE(p.score.value(), 1.02, 1e-9);
}

BOOST_AUTO_TEST_CASE(zero_starter_time_gives_zero_latency_reduction)
{
	const std::string out =
			"p1: starter_time=0.00ms, optimized_time=0.00ms, improvement=0.00ms, correct=True\n"
			"TOTAL SCORE: 1.0\n";

	ScoreReport report = ScoreReportParser::parse(out);
	BOOST_CHECK_EQUAL(report.latency_reduction, 0.0);
	BOOST_CHECK_EQUAL(ScoreReportParser::latency_reduction(0.0, 5.0), 0.0);
}

BOOST_AUTO_TEST_CASE(incorrect_problem_scores_zero)
{
	optional<ProblemScore> p = ScoreReportParser::parse_problem_line(
			"p2: starter_time=50.0ms, optimized_time=10.0ms, improvement=40.0ms, correct=False");
	BOOST_REQUIRE(p.has_value());
	BOOST_REQUIRE(p.value().correct.has_value());
	BOOST_CHECK(!p.value().correct.value());
	BOOST_REQUIRE(p.value().score.has_value());
	BOOST_CHECK_EQUAL(p.value().score.value(), 0.0);
}

BOOST_AUTO_TEST_CASE(unrecognized_correctness_is_unknown)
{
	optional<ProblemScore> p = ScoreReportParser::parse_problem_line(
			"p3: starter_time=50.0ms, optimized_time=10.0ms, improvement=40.0ms, correct=maybe");
	BOOST_REQUIRE(p.has_value());
	BOOST_CHECK(!p.value().correct.has_value());
	BOOST_CHECK(!p.value().score.has_value());
}

BOOST_AUTO_TEST_CASE(missing_improvement_is_derived)
{
	optional<ProblemScore> p = ScoreReportParser::parse_problem_line(
			"p4: starter_time=300ms, optimized_time=100ms, correct=true");
	BOOST_REQUIRE(p.has_value());
	BOOST_CHECK_CLOSE(p.value().improvement_ms, 200.0, 1e-9);
	BOOST_CHECK_CLOSE(p.value().score.value(), 1.2, 1e-9);
}

BOOST_AUTO_TEST_CASE(malformed_lines_are_skipped)
{
	const std::string out =
			"p1: starter_time=abcms, optimized_time=80.00ms, improvement=20.00ms, correct=True\n"
			"just some chatter: nothing to see\n"
			"p2: starter_time=200.00ms, optimized_time=100.00ms, improvement=100.00ms, correct=True\n"
			"TOTAL SCORE: not-a-number\n"
			"TOTAL SCORE: 3.14159\n";

	ScoreReport report = ScoreReportParser::parse(out);
	BOOST_CHECK_CLOSE(report.score, 3.142, 1e-9);
	BOOST_REQUIRE_EQUAL(report.problems.size(), 1u);
	BOOST_CHECK_EQUAL(report.problems[0].problem, "p2");
	BOOST_CHECK_CLOSE(report.latency_reduction, 50.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(last_total_line_wins)
{
	ScoreReport report = ScoreReportParser::parse("TOTAL SCORE: 1.0\nTOTAL SCORE: 2.0\n");
	BOOST_CHECK_CLOSE(report.score, 2.0, 1e-9);
	BOOST_CHECK(report.problems.empty());
}

BOOST_AUTO_TEST_CASE(problems_keep_output_order)
{
	const std::string out =
			"p9: starter_time=10ms, optimized_time=10ms, improvement=0ms, correct=True\n"
			"p1: starter_time=10ms, optimized_time=10ms, improvement=0ms, correct=True\n"
			"TOTAL SCORE: 2\n";
	ScoreReport report = ScoreReportParser::parse(out);
	BOOST_REQUIRE_EQUAL(report.problems.size(), 2u);
	BOOST_CHECK_EQUAL(report.problems[0].problem, "p9");
	BOOST_CHECK_EQUAL(report.problems[1].problem, "p1");
}

BOOST_AUTO_TEST_CASE(missing_total_is_execution_fault)
{
	const std::string out = "p1: starter_time=100.00ms, optimized_time=80.00ms, improvement=20.00ms, correct=True\n";
	try {
		ScoreReportParser::parse(out);
		BOOST_FAIL("parse should have thrown");
	} catch (const ExecutionFaultException & e) {
		BOOST_CHECK_EQUAL(std::string(e.what()), "could not parse total score from scorer_tool.py output");
		BOOST_CHECK(e.kind() == JobHandleException::Kind::EXECUTION_FAULT);
	}
}

BOOST_AUTO_TEST_CASE(per_problem_json_uses_null_for_unknown)
{
	ProblemScore known;
	known.problem = "p1";
	known.correct = true;
	known.score = 1.02;
	ProblemScore unknown;
	unknown.problem = "p2";

	std::vector<ProblemScore> restored = problems_from_json(problems_to_json({known, unknown}));
	BOOST_REQUIRE_EQUAL(restored.size(), 2u);
	BOOST_CHECK_EQUAL(restored[0].problem, "p1");
	BOOST_CHECK(restored[0].score.has_value());
	BOOST_CHECK(!restored[1].correct.has_value());
	BOOST_CHECK(!restored[1].score.has_value());
	BOOST_CHECK(problems_to_json({unknown}).find("\"score\":null") != std::string::npos);
}
