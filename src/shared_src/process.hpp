/*
 * process.hpp
 *
 *  Created on: 2018年6月15日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_PROCESS_HPP_
#define SRC_SHARED_SRC_PROCESS_HPP_

#include <utility>
#include <system_error>
#include <cerrno>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>

#include <kerbal/utility/noncopyable.hpp>

namespace lboard
{

	/**
	 * @brief 对 fork 的封装. 子进程执行完 func 后直接 _exit, 不会回到调用者的栈上.
	 * 子进程自成一个进程组 (组号即其 pid), 因此可以连同它派生的子孙进程一起终止.
	 */
	class process : kerbal::utility::noncopyable, kerbal::utility::nonassignable
	{
		public:
			typedef pid_t pid_type;

		protected:
			pid_type father_id;
			pid_type child_id;

			enum
			{
				none, joined
			} status;

		public:
			process() noexcept :
					father_id(0), child_id(0), status(none)
			{
			}

			/**
			 * @throw std::system_error fork 失败
			 */
			template <typename Callable, typename ... Args>
			explicit process(Callable && func, Args && ... args) :
					father_id(getpid()), child_id(-1), status(joined)
			{
				child_id = fork();
				if (child_id == -1) {
					status = none;
					throw std::system_error(errno, std::generic_category(), "fork failed");
				} else if (child_id == 0) {
					setpgid(0, 0);
					func(std::forward<Args>(args)...);
					_exit(0);
				}
				// 父子进程都设置一次, 避免父进程在子进程 setpgid 之前就对进程组发信号
				setpgid(child_id, child_id);
			}

			~process() noexcept
			{
				if (getpid() == father_id && status == joined) {
					::kill(-child_id, SIGKILL);
					::waitpid(child_id, nullptr, 0);
				}
			}

			process(process && src) noexcept :
					father_id(src.father_id), child_id(src.child_id), status(src.status)
			{
				src.father_id = 0;
				src.child_id = 0;
				src.status = none;
			}

			void swap(process & with) noexcept
			{
				std::swap(this->father_id, with.father_id);
				std::swap(this->child_id, with.child_id);
				std::swap(this->status, with.status);
			}

			process& operator=(process && src) noexcept
			{
				process tmp(std::move(src));
				this->swap(tmp);
				return *this;
			}

			pid_type get_child_id() const noexcept
			{
				return this->child_id;
			}

			bool joinable() const noexcept
			{
				return status == joined;
			}

			/**
			 * @brief 阻塞直到子进程退出, 但不回收它. 子进程保持僵死状态, pid 与进程组号不会被复用,
			 * 此时仍可安全地向整个进程组发送信号
			 * @return 成功返回 0, 出错返回 -1
			 */
			int wait_exited_nowait() noexcept
			{
				if (status != joined) {
					return 0;
				}
				siginfo_t info;
				int res;
				do {
					res = ::waitid(P_PID, static_cast<id_t>(child_id), &info, WEXITED | WNOWAIT);
				} while (res == -1 && errno == EINTR);
				return res;
			}

			/**
			 * @brief Wait for the process to exit. Put the status in *status_loc
			 * @param status_loc The location where the process status will be put.
			 * @param options If the WUNTRACED bit is set in OPTIONS, return status for stopped children; otherwise don't.
			 * @param usage If not nil, store information about the child's resource usage there.
			 * @return For errors return (pid_type) (-1); otherwise return the process ID.
			 */
			pid_type join(int * status_loc, int options, struct rusage * usage) noexcept
			{
				if (status != joined) {
					return 0;
				}
				pid_type res;
				do {
					res = ::wait4(child_id, status_loc, options, usage);
				} while (res == -1 && errno == EINTR);
				if (res == child_id) {
					status = none;
				}
				return res;
			}

			/**
			 * @brief Send signal SIG to the whole process group of the child.
			 * @return If success return 0, For errors, return other value.
			 */
			int kill_group(int sig) noexcept
			{
				if (status != joined) {
					return 0;
				}
				return ::kill(-child_id, sig);
			}

	};

} /* namespace lboard */

#endif /* SRC_SHARED_SRC_PROCESS_HPP_ */
