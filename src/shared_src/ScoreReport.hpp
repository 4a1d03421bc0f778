/*
 * ScoreReport.hpp
 *
 *  Created on: 2019年4月6日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_SCOREREPORT_HPP_
#define SRC_SHARED_SRC_SCOREREPORT_HPP_

#include <string>
#include <vector>

#include <kerbal/data_struct/optional/optional.hpp>

namespace lboard
{

	template <typename Type>
	using optional = kerbal::data_struct::optional<Type>;

	using kerbal::data_struct::nullopt;

	/**
	 * @brief 单个评测问题的结果
	 */
	struct ProblemScore
	{
			std::string problem; ///< 问题名
			double starter_time_ms = 0.0; ///< 基准程序用时
			double optimized_time_ms = 0.0; ///< 优化后程序用时
			double improvement_ms = 0.0; ///< 节省的时间
			optional<bool> correct {nullopt}; ///< 正确性, 无法解析时为空
			optional<double> score {nullopt}; ///< 该问题得分, 正确性未知时为空
	};

	/**
	 * @brief 一次成功运行的评分报告
	 */
	struct ScoreReport
	{
			double score = 0.0; ///< 总分, 保留三位小数
			double latency_reduction = 0.0; ///< 总体延迟降低百分比
			std::vector<ProblemScore> problems; ///< 各问题结果, 保持评测程序的输出顺序
	};

	/**
	 * @brief 将各问题结果序列化为 json 数组文本. correct 与 score 未知时写为 null
	 */
	std::string problems_to_json(const std::vector<ProblemScore> & problems);

	/**
	 * @brief 从 json 数组文本还原各问题结果
	 * @throw nlohmann::json::exception 文本不是合法的 json 或字段类型不符
	 */
	std::vector<ProblemScore> problems_from_json(const std::string & text);

} /* namespace lboard */

#endif /* SRC_SHARED_SRC_SCOREREPORT_HPP_ */
