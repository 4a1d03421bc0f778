/*
 * lboard_typedef.hpp
 *
 *  Created on: 2019年4月2日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_LBOARD_TYPEDEF_HPP_
#define SRC_SHARED_SRC_LBOARD_TYPEDEF_HPP_

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <type_traits>

#ifndef MYSQLPP_MYSQL_HEADERS_BURIED
#	define MYSQLPP_MYSQL_HEADERS_BURIED
#endif

#include <mysql++/stadapter.h>

namespace lboard
{

	/**
	 * @brief 强类型 id 的基类. 不同含义的 id 之间不能互相赋值, 避免传参时把参数顺序写反
	 */
	template <typename IntegerType, typename IDType>
	class id_type_base
	{
		public:
			using integer_type = IntegerType;

		protected:
			integer_type val;
			using supper_t = id_type_base<IntegerType, IDType>;

		public:
			constexpr explicit id_type_base() : val(0)
			{
			}

			constexpr explicit id_type_base(integer_type val) : val(val)
			{
			}

			id_type_base(const mysqlpp::String & s) : val(s)
			{
			}

			constexpr explicit operator integer_type() const
			{
				return val;
			}

			operator mysqlpp::SQLTypeAdapter() const
			{
				return mysqlpp::SQLTypeAdapter(static_cast<long long>(val));
			}

			constexpr integer_type to_literal() const
			{
				return val;
			}

			friend std::ostream& operator<<(std::ostream & out, const id_type_base & src)
			{
				out << src.val;
				return out;
			}

			friend bool operator==(const IDType & lhs, const IDType & rhs)
			{
				return lhs.val == rhs.val;
			}

			friend bool operator!=(const IDType & lhs, const IDType & rhs)
			{
				return lhs.val != rhs.val;
			}

			friend bool operator<(const IDType & lhs, const IDType & rhs)
			{
				return lhs.val < rhs.val;
			}

			struct hash : std::hash<integer_type>
			{
					using argument_type = IDType;

					auto operator()(const argument_type & val) const
					{
						return std::hash<integer_type>::operator()(val.val);
					}
			};
	};

	/**
	 * @brief 提交任务的 id. 创建时分配, 单调递增, 永不复用
	 */
	using job_id_literal = std::int64_t;
	struct job_id_type : id_type_base<job_id_literal, job_id_type>
	{
			using supper_t::supper_t;
	};

	/**
	 * @brief 任务在队列中的生命周期状态
	 * REGISTERING -> PENDING -> RUNNING -> (删除, 由运行结果替代), 不存在回退
	 */
	enum class job_status
	{
		REGISTERING = 0, ///< 已分配 id, 压缩包尚未落盘
		PENDING = 1, ///< 排队等待 worker 领取
		RUNNING = 2, ///< 已被某一 worker 领取
	};

	/*
	 * 对于枚举中未定义的量不在 switch 的 default 分支处理, 而在函数末尾处理,
	 * 这样新增枚举值却忘了加上描述时编译器会给出警告
	 */
	inline const char * get_job_status_name(job_status status)
	{
		switch (status) {
			case job_status::REGISTERING:
				return "REGISTERING";
			case job_status::PENDING:
				return "PENDING";
			case job_status::RUNNING:
				return "RUNNING";
		}
		return "UNKNOWN";
	}

	/**
	 * @brief 将数据库中存储的状态名解析为枚举值
	 * @throw std::invalid_argument 不认识的状态名
	 */
	job_status parse_job_status(const std::string & name);

	inline std::ostream& operator<<(std::ostream & out, job_status status)
	{
		return out << get_job_status_name(status);
	}

	/**
	 * @brief 一次运行的最终结局
	 */
	enum class run_outcome
	{
		SUCCESS = 0, ERROR = 1
	};

	inline const char * get_run_outcome_name(run_outcome outcome)
	{
		switch (outcome) {
			case run_outcome::SUCCESS:
				return "success";
			case run_outcome::ERROR:
				return "error";
		}
		return "unknown";
	}

	/**
	 * @throw std::invalid_argument 不认识的结局名
	 */
	run_outcome parse_run_outcome(const std::string & name);

	inline std::ostream& operator<<(std::ostream & out, run_outcome outcome)
	{
		return out << get_run_outcome_name(outcome);
	}

	/**
	 * @brief 评测所使用的大模型客户端后端
	 */
	enum class llm_backend
	{
		OLLAMA = 0, OPENAI = 1
	};

	inline const char * get_llm_backend_name(llm_backend backend)
	{
		switch (backend) {
			case llm_backend::OLLAMA:
				return "ollama";
			case llm_backend::OPENAI:
				return "openai";
		}
		return "unknown";
	}

	/**
	 * @throw std::invalid_argument 不认识的后端名
	 */
	llm_backend parse_llm_backend(const std::string & name);

} /* namespace lboard */

namespace std
{
	inline std::string to_string(const lboard::job_id_type & id)
	{
		return std::to_string(id.to_literal());
	}
}

#endif /* SRC_SHARED_SRC_LBOARD_TYPEDEF_HPP_ */
