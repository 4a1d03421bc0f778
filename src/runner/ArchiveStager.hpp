/*
 * ArchiveStager.hpp
 *
 *  Created on: 2019年4月8日
 *      Author: peter
 */

#ifndef SRC_RUNNER_ARCHIVESTAGER_HPP_
#define SRC_RUNNER_ARCHIVESTAGER_HPP_

#include <ostream>

#include <boost/filesystem/path.hpp>

#include "lboard_typedef.hpp"
#include "settings.hpp"

namespace lboard
{

	/**
	 * @brief 把提交的压缩包变成可以运行的目录:
	 * 解压, 规整目录结构, 检查入口文件, 补齐默认客户端, 安装依赖.
	 * 失败时抛出 JobHandleException 的子类, what() 即为写入运行结果的错误信息
	 */
	class ArchiveStager
	{
		private:
			const Settings & settings;
			int worker_id;
			std::ostream & log_fp;

		public:
			/**
			 * @brief 规整目录结构时最多展开的嵌套层数
			 */
			static constexpr int MAX_FLATTEN_DEPTH = 8;

			/**
			 * @brief 依赖安装目录相对于任务目录的名字
			 */
			static constexpr const char * SITE_PACKAGES_DIR_NAME = "site-packages";

			ArchiveStager(const Settings & settings, int worker_id, std::ostream & log_fp);

			/**
			 * @brief 在 workspace_dir 下创建本任务私有的唯一目录 job-<id>-XXXXXX
			 * @throw InternalErrorException
			 */
			boost::filesystem::path allocate_job_dir(job_id_type job_id) const;

			/**
			 * @brief 完整的准备流程
			 * @return 解压后的代码目录 (<job_dir>/student_agent)
			 */
			boost::filesystem::path stage(job_id_type job_id, const boost::filesystem::path & archive, const boost::filesystem::path & job_dir) const;

			/**
			 * @brief 将 zip 解压到 dest. 拒绝绝对路径, 含 ".." 的路径与符号链接
			 * @throw SubmissionInvalidException 压缩包损坏或含有非法条目
			 */
			static void extract_archive(const boost::filesystem::path & archive, const boost::filesystem::path & dest);

			/**
			 * @brief 忽略 __MACOSX, .DS_Store 及隐藏文件后, 若目录下只有一个子目录而没有文件,
			 * 则把该子目录的内容上移一层, 重复直到不再满足条件
			 * @return 展开的层数
			 */
			static int flatten_single_directory(const boost::filesystem::path & root);

			/**
			 * @brief 检查入口文件
			 * @throw SubmissionInvalidException
			 */
			void verify_entry_point(const boost::filesystem::path & agent_dir) const;

			/**
			 * @brief 所选后端的客户端文件缺失时, 复制一份默认的
			 * @throw InternalErrorException 默认客户端也不存在
			 */
			void ensure_client(job_id_type job_id, const boost::filesystem::path & agent_dir) const;

			/**
			 * @brief 若存在 requirements.txt 则安装到 <job_dir>/site-packages
			 * @return 是否执行了安装
			 * @throw SubmissionInvalidException 安装失败
			 */
			bool install_requirements(job_id_type job_id, const boost::filesystem::path & agent_dir, const boost::filesystem::path & job_dir) const;
	};

} /* namespace lboard */

#endif /* SRC_RUNNER_ARCHIVESTAGER_HPP_ */
