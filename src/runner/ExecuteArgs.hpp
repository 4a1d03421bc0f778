/*
 * ExecuteArgs.hpp
 *
 *  Created on: 2018年7月1日
 *      Author: peter
 */

#ifndef SRC_RUNNER_EXECUTEARGS_HPP_
#define SRC_RUNNER_EXECUTEARGS_HPP_

#include <vector>
#include <string>
#include <memory>
#include <initializer_list>

namespace lboard
{

	/**
	 * @brief 执行 exec 族的命令行参数或环境变量表. 在原本的 Unix 要求中, exec 族函数的参数末尾必须以一个空指针结尾,
	 * 这显然十分丑陋不够优雅, 也晦涩难读. 基于此目的, 本处使用了一个类将它封装了起来.
	 */
	class ExecuteArgs
	{
		private:
			std::vector<std::string> args;

		public:
			ExecuteArgs();

			ExecuteArgs(std::initializer_list<std::string> list);

			/**
			 * @brief 追加一个参数
			 */
			ExecuteArgs& push_back(const std::string & arg);

			const std::vector<std::string> & get() const
			{
				return args;
			}

			bool empty() const
			{
				return args.empty();
			}

			/**
			 * @brief 以空格连接全部参数, 仅用于写日志
			 */
			std::string join() const;

			/**
			 * @brief 返回命令行参数列表
			 * @return 指向 char * 数组的指针, 符合 Unix 的 exec 族函数的参数规范. 其生命期不能长于本对象
			 */
			std::unique_ptr<char*[]> getArgs() const;

			/**
			 * @brief 复制当前进程的全部环境变量, 得到 "KEY=VALUE" 形式的环境变量表
			 */
			static ExecuteArgs current_environment();

			/**
			 * @brief 设置环境变量表中的一项, 已存在则覆盖
			 */
			ExecuteArgs& set_env(const std::string & key, const std::string & value);

			/**
			 * @brief 环境变量表中是否存在某一项
			 */
			bool has_env(const std::string & key) const;
	};

	/**
	 * @brief 按照 PATH 查找可执行文件. 含有 '/' 的路径原样返回
	 * @throw std::runtime_error 找不到
	 */
	std::string resolve_executable(const std::string & name);

} /* namespace lboard */

#endif /* SRC_RUNNER_EXECUTEARGS_HPP_ */
