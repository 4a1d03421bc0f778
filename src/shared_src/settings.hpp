/*
 * settings.hpp
 *
 *  Created on: 2019年4月3日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_SETTINGS_HPP_
#define SRC_SHARED_SRC_SETTINGS_HPP_

#include <chrono>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <kerbal/utility/storage.hpp>
#include <nlohmann/json.hpp>

#include "lboard_typedef.hpp"

namespace lboard
{

	/**
	 * @brief 全部组件的配置. 由 main 解析一次后以 const 引用显式传给各组件, 不存在全局可变配置
	 */
	class Settings
	{
		public:

			struct
			{
					boost::filesystem::path log_dir; ///< 日志目录, runner.log 与 runner-<id>.log 写在此处
					bool echo_to_console = true; ///< runner 的日志是否同时回显到控制台
			} runtime;

			struct
			{
					std::string hostname;
					int port = 3306;
					std::string username;
					std::string password;
					std::string database;
					int max_connections = 10;
			} mysql;

			struct
			{
					int workers = 8; ///< worker 线程数
					std::chrono::milliseconds poll_interval {1000}; ///< 队列为空时的轮询间隔
					std::chrono::milliseconds schema_retry_interval {500}; ///< 数据表尚未建立时的重试间隔
					boost::filesystem::path workspace_dir; ///< 每个任务的私有工作目录创建于此
					bool fail_orphaned_on_start = true; ///< 启动时将上次遗留的 RUNNING 任务判为失败
			} runner;

			struct
			{
					std::string extract_dir_name = "student_agent";
					std::string entry_point = "my-agent.py";
					std::string requirements_file = "requirements.txt";
					std::chrono::seconds install_timeout {600};
					int tail_lines = 5; ///< 错误信息中保留的输出尾部行数
			} staging;

			struct
			{
					boost::filesystem::path benchmarks_dir;
					boost::filesystem::path harness_path; ///< 外部评测程序 scorer_tool.py
					boost::filesystem::path default_client_dir; ///< 默认的 <backend>-client.py 所在目录
					std::string interpreter = "python3";
					int trials = 11;
					std::chrono::seconds timeout {180};
			} benchmark;

			struct
			{
					llm_backend name = llm_backend::OLLAMA;
					boost::filesystem::path openai_token_path;
					std::string token_env = "ECE30861_OPENAI_TOKEN";
			} backend;

			struct
			{
					bool seccomp = false;
					int max_memory_mb = 0; ///< 0 表示不限制
					int max_process_number = 0;
					int max_output_size_mb = 0;
			} sandbox;

			struct
			{
					boost::filesystem::path upload_dir;
					std::vector<std::string> allowed_extensions {"zip"};
			} intake;

			/**
			 * @brief 从 json 对象中读取配置, 必填项缺失时抛出 nlohmann::json 的异常
			 */
			void parse(const nlohmann::json & json_obj);

			/**
			 * @brief 读取 json 配置文件
			 * @throw std::runtime_error 文件无法打开
			 */
			void parse(const boost::filesystem::path & config_file);
	};

} /* namespace lboard */

#endif /* SRC_SHARED_SRC_SETTINGS_HPP_ */
