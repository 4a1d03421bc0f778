/*
 * ProtectedProcess.cpp
 *
 *  Created on: 2018年12月7日
 *      Author: peter
 */

#include "ProtectedProcess.hpp"
#include "seccomp_rules.hpp"
#include "process.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/syscall.h>

namespace lboard
{

	std::ostream& operator<<(std::ostream& out, ProtectedProcessResult result)
	{
		switch (result) {
			case ProtectedProcessResult::EXITED_NORMALLY:
				return out << "EXITED_NORMALLY";
			case ProtectedProcessResult::NON_ZERO_EXIT:
				return out << "NON_ZERO_EXIT";
			case ProtectedProcessResult::KILLED_BY_SIGNAL:
				return out << "KILLED_BY_SIGNAL";
			case ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED:
				return out << "REAL_TIME_LIMIT_EXCEEDED";
			case ProtectedProcessResult::SYSTEM_ERROR:
				return out << "SYSTEM_ERROR";
		}
		return out;
	}

	namespace
	{
		/*
		 * fork 之后的子进程中只有调用 fork 的线程存在, 其他线程持有的锁永远不会被释放,
		 * 因此子进程中用到的全部数据都在 fork 之前准备好, 子进程只做系统调用
		 */
		struct child_plan
		{
				std::unique_ptr<char*[]> argv;
				std::unique_ptr<char*[]> envp;
				std::string working_dir;
				std::string input_path;
				std::string output_path;
				std::string error_path;
				std::vector<std::pair<int, rlim_t> > rlimits;
				bool use_seccomp;
				harness_seccomp_filter seccomp_filter;
		};

		bool __dup(const char * file_path, int flags, int target_fd) noexcept
		{
			int fd = ::open(file_path, flags, 0644);
			if (fd == -1) {
				return false;
			}
			// On success, these system calls return the new descriptor.
			// On error, -1 is returned, and errno is set appropriately.
			if (::dup2(fd, target_fd) == -1) {
				::close(fd);
				return false;
			}
			::close(fd);
			return true;
		}

		bool __set_rlimit(const child_plan & plan) noexcept
		{
			for (const auto & [resource, value] : plan.rlimits) {
				struct rlimit limit;
				limit.rlim_cur = value;
				limit.rlim_max = value;
				if (setrlimit(resource, &limit) != 0) {
					return false;
				}
			}
			return true;
		}

		/*
		 * 关闭 0, 1, 2 以外继承自 runner 的全部描述符: 各 worker 的日志文件, 数据库连接,
		 * 其他 worker 正在读写的压缩包与文件
		 */
		bool __close_inherited_fds() noexcept
		{
#ifdef SYS_close_range
			if (::syscall(SYS_close_range, 3U, ~0U, 0U) == 0) {
				return true;
			}
#endif
			struct rlimit limit;
			if (getrlimit(RLIMIT_NOFILE, &limit) != 0) {
				return false;
			}
			const rlim_t max_fd = limit.rlim_cur == RLIM_INFINITY ? 65536 : limit.rlim_cur;
			for (rlim_t fd = 3; fd < max_fd; ++fd) {
				::close(static_cast<int>(fd));
			}
			return true;
		}

		[[noreturn]] void child_main(const child_plan & plan) noexcept
		{
			// 父进程中可能屏蔽了部分信号, 这里恢复为默认状态, 保证 SIGUSR1 能够终止自身
			sigset_t empty_set;
			sigemptyset(&empty_set);
			sigprocmask(SIG_SETMASK, &empty_set, nullptr);
			signal(SIGUSR1, SIG_DFL);

			if (::chdir(plan.working_dir.c_str()) != 0) {
				raise(SIGUSR1);
				_exit(1);
			}
			if (!__set_rlimit(plan)) {
				raise(SIGUSR1);
				_exit(1);
			}
			// redirect file -> stdin, stdout, stderr
			if (!__dup(plan.input_path.c_str(), O_RDONLY, STDIN_FILENO)
					|| !__dup(plan.output_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, STDOUT_FILENO)
					|| !__dup(plan.error_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, STDERR_FILENO)) {
				raise(SIGUSR1);
				_exit(1);
			}
			if (!__close_inherited_fds()) {
				raise(SIGUSR1);
				_exit(1);
			}
			if (plan.use_seccomp && !plan.seccomp_filter.install()) {
				raise(SIGUSR1);
				_exit(1);
			}
			execve(plan.argv[0], plan.argv.get(), plan.envp.get());
			raise(SIGUSR1);
			_exit(1);
		}

		child_plan make_plan(const ExecuteArgs & execute_args, const ProtectedProcessConfig & config, const ExecuteArgs & env)
		{
			using namespace kerbal::utility;

			child_plan plan;
			plan.argv = execute_args.getArgs();
			plan.envp = env.getArgs();
			plan.working_dir = config.working_dir.string();
			plan.input_path = config.input_path.string();
			plan.output_path = config.output_path.string();
			plan.error_path = config.error_path.string();
			plan.use_seccomp = config.use_seccomp;
			if (plan.use_seccomp) {
				plan.seccomp_filter = harness_seccomp_filter::compile();
			}

			// set memory limit
			if (config.max_memory.has_value()) {
				plan.rlimits.emplace_back(RLIMIT_AS, static_cast<rlim_t>(storage_cast<Byte>(config.max_memory.value()).count()));
			}
			// set max process number limit
			if (config.max_process_number.has_value()) {
				plan.rlimits.emplace_back(RLIMIT_NPROC, static_cast<rlim_t>(config.max_process_number.value()));
			}
			// set max output size limit
			if (config.max_output_size.has_value()) {
				plan.rlimits.emplace_back(RLIMIT_FSIZE, static_cast<rlim_t>(storage_cast<Byte>(config.max_output_size.value()).count()));
			}
			return plan;
		}

	} /* namespace */

	ProtectedProcessDetails
	protected_process(const ExecuteArgs & execute_args, const ProtectedProcessConfig & config, const ExecuteArgs & env)
	{
		if (execute_args.empty()) {
			throw std::invalid_argument("protected_process: empty execute args");
		}

		const child_plan plan = make_plan(execute_args, config, env);

		using namespace std::chrono;

		// record current time
		auto process_start_time_point = steady_clock::now();

		process child_process;
		// 此处创建了一个运行子进程, 该进程内先加载保护策略, 然后使用 execve 函数用 execute_args 替换自身
		try {
			child_process = process([&plan]() noexcept {
				child_main(plan);
			});
		} catch (const std::system_error & e) {
			throw std::runtime_error(std::string("fork failed! ") + e.what());
		}

		std::mutex watch_mtx;
		std::condition_variable watch_cv;
		bool finished = false;
		bool timed_out = false;

		std::thread timeout_killer_thread;
		if (config.max_real_time.has_value()) {
			try {
				timeout_killer_thread = std::thread([&](milliseconds timeout) {
					std::unique_lock<std::mutex> lck(watch_mtx);
					if (!watch_cv.wait_for(lck, timeout, [&finished]() { return finished; })) {
						timed_out = true;
						child_process.kill_group(SIGKILL);
					}
				}, config.max_real_time.value());
			} catch (const std::system_error & e) {
				child_process.kill_group(SIGKILL);
				throw ThreadFailedException();
			}
		}

		// 等待子进程退出但暂不回收, 保证监视线程杀死进程组时组号仍然有效
		int wait_res = child_process.wait_exited_nowait();
		{
			std::lock_guard<std::mutex> lck(watch_mtx);
			finished = true;
		}
		watch_cv.notify_all();
		if (timeout_killer_thread.joinable()) {
			timeout_killer_thread.join();
		}

		// 清理评测程序遗留的子孙进程
		child_process.kill_group(SIGKILL);

		if (wait_res == -1) {
			throw std::runtime_error("wait failed!");
		}

		int status = 0;
		struct rusage resource_usage;
		if (child_process.join(&status, 0, &resource_usage) == -1) {
			throw std::runtime_error("wait failed!");
		}

		const milliseconds real_time = duration_cast<milliseconds>(steady_clock::now() - process_start_time_point);

		constexpr auto timevalToChrono = [](const timeval & val) -> std::chrono::milliseconds
		{
			using namespace std::chrono;
			return duration_cast<milliseconds>(seconds(val.tv_sec) + microseconds(val.tv_usec));
		};

		const milliseconds cpu_time = timevalToChrono(resource_usage.ru_utime) + timevalToChrono(resource_usage.ru_stime);
		const kerbal::utility::KB memory(resource_usage.ru_maxrss);

		if (timed_out) {
			return ProtectedProcessDetails(ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED, real_time, cpu_time, memory, -SIGKILL);
		}

		// if signaled
		if (WIFSIGNALED(status)) {
			const int sig = WTERMSIG(status);
			if (sig == SIGUSR1) {
				return ProtectedProcessDetails(ProtectedProcessResult::SYSTEM_ERROR, real_time, cpu_time, memory, -sig);
			}
			return ProtectedProcessDetails(ProtectedProcessResult::KILLED_BY_SIGNAL, real_time, cpu_time, memory, -sig);
		}

		const int exit_code = WEXITSTATUS(status);
		if (exit_code != 0) {
			return ProtectedProcessDetails(ProtectedProcessResult::NON_ZERO_EXIT, real_time, cpu_time, memory, exit_code);
		}
		return ProtectedProcessDetails(ProtectedProcessResult::EXITED_NORMALLY, real_time, cpu_time, memory, exit_code);
	}

} /* namespace lboard */
