/*
 * ScoreReport.cpp
 *
 *  Created on: 2019年4月6日
 *      Author: peter
 */

#include "ScoreReport.hpp"

#include <nlohmann/json.hpp>

namespace lboard
{

	std::string problems_to_json(const std::vector<ProblemScore> & problems)
	{
		nlohmann::json arr = nlohmann::json::array();
		for (const ProblemScore & p : problems) {
			nlohmann::json item;
			item["problem"] = p.problem;
			item["starter_time_ms"] = p.starter_time_ms;
			item["optimized_time_ms"] = p.optimized_time_ms;
			item["improvement_ms"] = p.improvement_ms;
			if (p.correct.has_value()) {
				item["correct"] = p.correct.value();
			} else {
				item["correct"] = nullptr;
			}
			if (p.score.has_value()) {
				item["score"] = p.score.value();
			} else {
				item["score"] = nullptr;
			}
			arr.push_back(std::move(item));
		}
		return arr.dump();
	}

	std::vector<ProblemScore> problems_from_json(const std::string & text)
	{
		const nlohmann::json arr = nlohmann::json::parse(text);
		std::vector<ProblemScore> problems;
		for (const nlohmann::json & item : arr) {
			ProblemScore p;
			p.problem = item.at("problem").get<std::string>();
			p.starter_time_ms = item.value("starter_time_ms", 0.0);
			p.optimized_time_ms = item.value("optimized_time_ms", 0.0);
			p.improvement_ms = item.value("improvement_ms", 0.0);

			auto correct_it = item.find("correct");
			if (correct_it != item.end() && correct_it->is_boolean()) {
				p.correct = correct_it->get<bool>();
			}
			auto score_it = item.find("score");
			if (score_it != item.end() && score_it->is_number()) {
				p.score = score_it->get<double>();
			}
			problems.push_back(std::move(p));
		}
		return problems;
	}

} /* namespace lboard */
