/*
 * seccomp_rules.hpp
 *
 *  Created on: 2019年4月8日
 *      Author: peter
 */

#ifndef SRC_RUNNER_SECCOMP_RULES_HPP_
#define SRC_RUNNER_SECCOMP_RULES_HPP_

#include <vector>

#include <linux/filter.h>

namespace lboard
{

	/**
	 * @brief 评测程序的系统调用黑名单. 评测程序本身需要创建子进程与网络连接 (调用大模型),
	 * 因此只禁止与沙箱逃逸和破坏宿主相关的调用.
	 *
	 * 规则在父进程中经 libseccomp 编译为 BPF 程序, fork 出的子进程只需用 prctl 安装,
	 * 不再调用会分配内存的库函数
	 */
	class harness_seccomp_filter
	{
		private:
			std::vector<sock_filter> program;

		public:
			/**
			 * @throw std::runtime_error libseccomp 编译或导出规则失败
			 */
			static harness_seccomp_filter compile();

			bool empty() const noexcept
			{
				return program.empty();
			}

			/**
			 * @brief 在子进程中安装过滤器, execve 之前调用. 只使用系统调用
			 * @return 成功返回 true
			 */
			bool install() const noexcept;
	};

} /* namespace lboard */

#endif /* SRC_RUNNER_SECCOMP_RULES_HPP_ */
