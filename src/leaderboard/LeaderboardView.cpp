/*
 * LeaderboardView.cpp
 *
 *  Created on: 2019年4月13日
 *      Author: peter
 */

#include "LeaderboardView.hpp"

#include <sstream>

#include <boost/format.hpp>
#include <nlohmann/json.hpp>

namespace lboard
{

	LeaderboardView::LeaderboardView(JobStore & store) :
			store(store)
	{
	}

	std::vector<LeaderboardRow> LeaderboardView::rows() const
	{
		return build_rows(store.snapshot());
	}

	std::vector<LeaderboardRow> LeaderboardView::build_rows(const LeaderboardSnapshot & snapshot)
	{
		std::vector<LeaderboardRow> res;
		res.reserve(snapshot.completed.size() + snapshot.active.size());

		for (const CompletedRun & run : snapshot.completed) {
			LeaderboardRow row;
			row.job_id = run.job_id;
			row.name = run.name;
			row.completed = true;
			row.outcome = run.outcome;
			row.latency_reduction = run.latency_reduction;
			row.score = run.score;
			row.per_problem_json = run.per_problem_json;
			row.error_message = run.error_message;
			res.push_back(std::move(row));
		}

		// active 已按 id 升序
		int pending_before = 0;
		for (const ActiveJob & job : snapshot.active) {
			LeaderboardRow row;
			row.job_id = job.id;
			row.name = job.name;
			row.status = job.status;
			if (job.status == job_status::PENDING) {
				row.queue_ahead = pending_before;
				++pending_before;
			}
			res.push_back(std::move(row));
		}
		return res;
	}

	std::string LeaderboardView::latency_cell(const LeaderboardRow & row)
	{
		if (!row.completed || row.outcome != run_outcome::SUCCESS || row.latency_reduction == nullopt) {
			return NO_VALUE_TEXT;
		}
		return (boost::format("%.2f%%") % *row.latency_reduction).str();
	}

	std::string LeaderboardView::score_cell(const LeaderboardRow & row)
	{
		if (!row.completed) {
			switch (row.status) {
				case job_status::PENDING:
					return (boost::format("pending, %d in queue") % (row.queue_ahead == nullopt ? 0 : *row.queue_ahead)).str();
				case job_status::RUNNING:
					return "RUNNING NOW";
				case job_status::REGISTERING:
					return "registering";
			}
		}
		if (row.outcome == run_outcome::ERROR) {
			return "ERROR: " + row.error_message;
		}
		if (row.score == nullopt) {
			return NO_VALUE_TEXT;
		}
		return (boost::format("%.3f") % *row.score).str();
	}

	std::vector<std::string> LeaderboardView::per_problem_lines(const LeaderboardRow & row)
	{
		std::vector<std::string> lines;
		if (!row.completed || row.outcome != run_outcome::SUCCESS || row.per_problem_json.empty()) {
			return lines;
		}

		try {
			const nlohmann::json arr = nlohmann::json::parse(row.per_problem_json);
			if (!arr.is_array()) {
				return {};
			}
			for (const nlohmann::json & item : arr) {
				if (!item.is_object()) {
					return {};
				}
				auto problem_it = item.find("problem");
				const std::string problem = problem_it != item.end() && problem_it->is_string() ? problem_it->get<std::string>() : "?";

				auto score_it = item.find("score");
				if (score_it == item.end() || !score_it->is_number()) {
					lines.push_back(problem + ": ?");
					continue;
				}
				auto correct_it = item.find("correct");
				bool correct = correct_it != item.end() && correct_it->is_boolean() && correct_it->get<bool>();
				std::string line = (boost::format("%s: %.3f") % problem % score_it->get<double>()).str();
				if (!correct) {
					line += " (FAIL)";
				}
				lines.push_back(std::move(line));
			}
		} catch (const nlohmann::json::exception & e) {
			return {};
		}
		return lines;
	}

	std::string LeaderboardView::render_text(const std::vector<LeaderboardRow> & rows)
	{
		if (rows.empty()) {
			return std::string(EMPTY_BOARD_TEXT) + "\n";
		}

		std::ostringstream out;
		out << boost::format("%-4s %-24s %-10s %s\n") % "#" % "Name" % "Latency" % "Score";
		int rank = 0;
		for (const LeaderboardRow & row : rows) {
			std::string rank_text = row.completed ? std::to_string(++rank) : "";
			out << boost::format("%-4s %-24s %-10s %s\n") % rank_text % row.name % latency_cell(row) % score_cell(row);
			for (const std::string & line : per_problem_lines(row)) {
				out << "          " << line << "\n";
			}
		}
		return out.str();
	}

} /* namespace lboard */
