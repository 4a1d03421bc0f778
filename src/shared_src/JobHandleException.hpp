/*
 * JobHandleException.hpp
 *
 *  Created on: 2019年4月5日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_JOBHANDLEEXCEPTION_HPP_
#define SRC_SHARED_SRC_JOBHANDLEEXCEPTION_HPP_

#include <stdexcept>
#include <string>

namespace lboard
{

	/**
	 * @brief 处理一个任务时出现的错误. what() 即为最终写入运行结果的错误信息
	 */
	class JobHandleException: public std::runtime_error
	{
		public:
			enum class Kind
			{
				SUBMISSION_INVALID, ///< 提交本身有问题: 压缩包损坏, 缺少入口文件, 依赖安装失败
				EXECUTION_FAULT, ///< 评测程序非零退出, 超时, 输出无法解析
				INTERNAL, ///< 服务端自身的问题: 评测资源缺失, 凭据缺失, 文件系统错误
			};

		protected:
			Kind kind_;

			JobHandleException(Kind kind, const std::string & reason) :
					std::runtime_error(reason), kind_(kind)
			{
			}

		public:
			Kind kind() const noexcept
			{
				return kind_;
			}
	};

	inline const char * get_kind_name(JobHandleException::Kind kind)
	{
		switch (kind) {
			case JobHandleException::Kind::SUBMISSION_INVALID:
				return "SUBMISSION_INVALID";
			case JobHandleException::Kind::EXECUTION_FAULT:
				return "EXECUTION_FAULT";
			case JobHandleException::Kind::INTERNAL:
				return "INTERNAL";
		}
		return "UNKNOWN";
	}

	class SubmissionInvalidException: public JobHandleException
	{
		public:
			explicit SubmissionInvalidException(const std::string & reason) :
					JobHandleException(Kind::SUBMISSION_INVALID, reason)
			{
			}
	};

	class ExecutionFaultException: public JobHandleException
	{
		public:
			explicit ExecutionFaultException(const std::string & reason) :
					JobHandleException(Kind::EXECUTION_FAULT, reason)
			{
			}
	};

	/**
	 * @brief 服务端内部错误, 错误信息统一带有 "internal error: " 前缀
	 */
	class InternalErrorException: public JobHandleException
	{
		public:
			explicit InternalErrorException(const std::string & reason) :
					JobHandleException(Kind::INTERNAL, "internal error: " + reason)
			{
			}
	};

} /* namespace lboard */

#endif /* SRC_SHARED_SRC_JOBHANDLEEXCEPTION_HPP_ */
