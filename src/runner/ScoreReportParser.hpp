/*
 * ScoreReportParser.hpp
 *
 *  Created on: 2019年4月9日
 *      Author: peter
 */

#ifndef SRC_RUNNER_SCOREREPORTPARSER_HPP_
#define SRC_RUNNER_SCOREREPORTPARSER_HPP_

#include <string>

#include "ScoreReport.hpp"

namespace lboard
{

	/**
	 * @brief 解析评测程序的标准输出.
	 *
	 * 识别两种行:
	 * - "TOTAL SCORE: <float>" 给出总分, 出现多次时以最后一个合法的为准
	 * - "<problem>: starter_time=<f>ms, optimized_time=<f>ms, improvement=<f>ms, correct=<bool>" 给出单个问题的结果
	 *
	 * 其余的行以及格式不合法的问题行一律跳过
	 */
	class ScoreReportParser
	{
		public:
			/**
			 * @throw ExecutionFaultException 输出中没有合法的总分行
			 */
			static ScoreReport parse(const std::string & stdout_text, const std::string & harness_name = "scorer_tool.py");

			/**
			 * @brief 解析总分行
			 * @return 不是总分行或数值不合法时返回 nullopt
			 */
			static optional<double> parse_total_line(const std::string & line);

			/**
			 * @brief 解析问题行. improvement 缺失时取 starter - optimized;
			 * correct 既不是 true 也不是 false (不区分大小写) 时视为未知, 得分置空
			 * @return 不是问题行或格式不合法时返回 nullopt
			 */
			static optional<ProblemScore> parse_problem_line(const std::string & line);

			/**
			 * @brief 总体延迟降低百分比, 基准总时间为 0 时为 0
			 */
			static double latency_reduction(double total_starter_ms, double total_optimized_ms);

			/**
			 * @brief 四舍五入到三位小数
			 */
			static double round_score(double score);
	};

} /* namespace lboard */

#endif /* SRC_RUNNER_SCOREREPORTPARSER_HPP_ */
