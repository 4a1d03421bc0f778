/*
 * ScoreReportParser.cpp
 *
 *  Created on: 2019年4月9日
 *      Author: peter
 */

#include "ScoreReportParser.hpp"
#include "JobHandleException.hpp"
#include "text_util.hpp"

#include <cmath>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>

namespace lboard
{

	namespace
	{
		constexpr const char TOTAL_SCORE_PREFIX[] = "TOTAL SCORE:";

		/**
		 * @brief 取出 key 之后, 终止符 (不含) 之前的数值
		 * @return key 不存在或数值不合法时返回 nullopt
		 */
		optional<double> value_after(const std::string & rest, const std::string & key, const std::string & terminator)
		{
			size_t begin = rest.find(key);
			if (begin == std::string::npos) {
				return nullopt;
			}
			begin += key.size();
			size_t end = rest.find(terminator, begin);
			const std::string text = trim(rest.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
			try {
				double val = boost::lexical_cast<double>(text);
				if (!std::isfinite(val)) {
					return nullopt;
				}
				return val;
			} catch (const boost::bad_lexical_cast & e) {
				return nullopt;
			}
		}

	} /* namespace */

	optional<double> ScoreReportParser::parse_total_line(const std::string & raw_line)
	{
		const std::string line = trim(raw_line);
		if (line.compare(0, sizeof(TOTAL_SCORE_PREFIX) - 1, TOTAL_SCORE_PREFIX) != 0) {
			return nullopt;
		}
		try {
			double val = boost::lexical_cast<double>(trim(line.substr(sizeof(TOTAL_SCORE_PREFIX) - 1)));
			if (!std::isfinite(val)) {
				return nullopt;
			}
			return val;
		} catch (const boost::bad_lexical_cast & e) {
			return nullopt;
		}
	}

	optional<ProblemScore> ScoreReportParser::parse_problem_line(const std::string & raw_line)
	{
		const std::string line = trim(raw_line);
		if (line.find("starter_time=") == std::string::npos || line.find("optimized_time=") == std::string::npos) {
			return nullopt;
		}

		size_t colon = line.find(':');
		if (colon == std::string::npos) {
			return nullopt;
		}

		ProblemScore p;
		p.problem = trim(line.substr(0, colon));
		const std::string rest = line.substr(colon + 1);

		optional<double> starter = value_after(rest, "starter_time=", "ms");
		optional<double> optimized = value_after(rest, "optimized_time=", "ms");
		if (starter == nullopt || optimized == nullopt) {
			return nullopt;
		}
		p.starter_time_ms = *starter;
		p.optimized_time_ms = *optimized;

		if (rest.find("improvement=") != std::string::npos) {
			optional<double> improvement = value_after(rest, "improvement=", "ms");
			if (improvement == nullopt) {
				return nullopt;
			}
			p.improvement_ms = *improvement;
		} else {
			p.improvement_ms = p.starter_time_ms - p.optimized_time_ms;
		}

		size_t correct_pos = rest.find("correct=");
		if (correct_pos != std::string::npos) {
			correct_pos += sizeof("correct=") - 1;
			size_t end = rest.find(',', correct_pos);
			const std::string flag = boost::algorithm::to_lower_copy(trim(rest.substr(correct_pos, end == std::string::npos ? std::string::npos : end - correct_pos)));
			if (flag == "true") {
				p.correct = true;
			} else if (flag == "false") {
				p.correct = false;
			}
		}

		if (p.correct != nullopt) {
			p.score = *p.correct ? 1.0 + p.improvement_ms / 1000.0 : 0.0;
		}
		return p;
	}

	double ScoreReportParser::latency_reduction(double total_starter_ms, double total_optimized_ms)
	{
		if (total_starter_ms > 0.0) {
			return (total_starter_ms - total_optimized_ms) / total_starter_ms * 100.0;
		}
		return 0.0;
	}

	double ScoreReportParser::round_score(double score)
	{
		return std::round(score * 1000.0) / 1000.0;
	}

	ScoreReport ScoreReportParser::parse(const std::string & stdout_text, const std::string & harness_name)
	{
		optional<double> total_score(nullopt);
		double total_starter = 0.0;
		double total_optimized = 0.0;

		ScoreReport report;

		std::istringstream in(stdout_text);
		std::string line;
		while (std::getline(in, line)) {
			optional<double> total = parse_total_line(line);
			if (total != nullopt) {
				total_score = total;
				continue;
			}
			optional<ProblemScore> problem = parse_problem_line(line);
			if (problem != nullopt) {
				const ProblemScore & ps = *problem;
				total_starter += ps.starter_time_ms;
				total_optimized += ps.optimized_time_ms;
				report.problems.push_back(std::move(*problem));
			}
		}

		if (total_score == nullopt) {
			throw ExecutionFaultException("could not parse total score from " + harness_name + " output");
		}

		report.score = round_score(*total_score);
		report.latency_reduction = latency_reduction(total_starter, total_optimized);
		return report;
	}

} /* namespace lboard */
