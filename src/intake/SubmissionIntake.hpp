/*
 * SubmissionIntake.hpp
 *
 *  Created on: 2019年4月12日
 *      Author: peter
 */

#ifndef SRC_INTAKE_SUBMISSIONINTAKE_HPP_
#define SRC_INTAKE_SUBMISSIONINTAKE_HPP_

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "JobStore.hpp"
#include "lboard_typedef.hpp"
#include "settings.hpp"

namespace lboard
{

	/**
	 * @brief 提交被拒绝. what() 为返回给提交者的提示, 此时没有任何副作用
	 */
	class submission_rejected_exception: public std::runtime_error
	{
		public:
			explicit submission_rejected_exception(const std::string & reason) :
					std::runtime_error(reason)
			{
			}
	};

	/**
	 * @brief 接收一次提交: 校验, 在队列中登记, 保存压缩包, 转为 PENDING
	 */
	class SubmissionIntake
	{
		private:
			JobStore & store;
			const Settings & settings;
			std::ostream & log_fp;

		public:
			SubmissionIntake(JobStore & store, const Settings & settings, std::ostream & log_fp);

			/**
			 * @brief 校验提交
			 * @return 去除首尾空白后的提交者名字
			 * @throw submission_rejected_exception
			 */
			static std::string validate(const std::string & name, const boost::filesystem::path & archive,
										const std::vector<std::string> & allowed_extensions);

			/**
			 * @brief 文件名中只保留字母, 数字, '.', '_', '-', 空白替换为 '_', 去掉开头的 '.'
			 */
			static std::string sanitize_filename(const std::string & filename);

			/**
			 * @brief 登记一次提交, 压缩包复制为 intake.upload_dir/<id>_<文件名>
			 * @return 分配的任务 id
			 * @throw submission_rejected_exception 校验失败
			 * @throw std::runtime_error 保存压缩包失败, 此时任务停留在 REGISTERING 状态, 永远不会被领取
			 */
			job_id_type submit(const std::string & name, const boost::filesystem::path & archive);
	};

} /* namespace lboard */

#endif /* SRC_INTAKE_SUBMISSIONINTAKE_HPP_ */
