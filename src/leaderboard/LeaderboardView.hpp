/*
 * LeaderboardView.hpp
 *
 *  Created on: 2019年4月13日
 *      Author: peter
 */

#ifndef SRC_LEADERBOARD_LEADERBOARDVIEW_HPP_
#define SRC_LEADERBOARD_LEADERBOARDVIEW_HPP_

#include <string>
#include <vector>

#include "JobStore.hpp"
#include "lboard_typedef.hpp"

namespace lboard
{

	/**
	 * @brief 排行榜的一行, 对应一个已完成的运行或一个仍在队列中的任务
	 */
	struct LeaderboardRow
	{
			job_id_type job_id;
			std::string name;
			bool completed = false;
			run_outcome outcome = run_outcome::ERROR; ///< completed 为 true 时有效
			job_status status = job_status::PENDING; ///< completed 为 false 时有效

			optional<double> latency_reduction {nullopt};
			optional<double> score {nullopt};
			std::string per_problem_json;
			std::string error_message;

			optional<int> queue_ahead {nullopt}; ///< 只有 PENDING 行有: id 更小的 PENDING 任务数
	};

	/**
	 * @brief 排行榜的只读视图及其文本化
	 */
	class LeaderboardView
	{
		private:
			JobStore & store;

		public:
			static constexpr const char * EMPTY_BOARD_TEXT = "No runs submitted yet.";
			static constexpr const char * NO_VALUE_TEXT = "—";

			explicit LeaderboardView(JobStore & store);

			/**
			 * @brief 已完成的运行按排名在前, 仍在队列中的任务按 id 在后
			 */
			std::vector<LeaderboardRow> rows() const;

			static std::vector<LeaderboardRow> build_rows(const LeaderboardSnapshot & snapshot);

			/**
			 * @brief "12.34%", 没有数值时为 "—"
			 */
			static std::string latency_cell(const LeaderboardRow & row);

			/**
			 * @brief "7.500", "pending, N in queue", "RUNNING NOW", "registering" 或 "ERROR: <message>"
			 */
			static std::string score_cell(const LeaderboardRow & row);

			/**
			 * @brief 各问题得分: "p1: 1.020", "p1: 0.000 (FAIL)", 得分未知时 "p1: ?".
			 * json 不合法时返回空
			 */
			static std::vector<std::string> per_problem_lines(const LeaderboardRow & row);

			static std::string render_text(const std::vector<LeaderboardRow> & rows);
	};

} /* namespace lboard */

#endif /* SRC_LEADERBOARD_LEADERBOARDVIEW_HPP_ */
