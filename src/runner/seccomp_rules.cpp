/*
 * seccomp_rules.cpp
 *
 *  Created on: 2019年4月8日
 *      Author: peter
 */

#include <seccomp.h>

#include "seccomp_rules.hpp"

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace lboard
{

	harness_seccomp_filter harness_seccomp_filter::compile()
	{
		int syscalls_blacklist[] = {
			SCMP_SYS(ptrace), SCMP_SYS(process_vm_readv), SCMP_SYS(process_vm_writev),
			SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
			SCMP_SYS(reboot), SCMP_SYS(kexec_load), SCMP_SYS(init_module), SCMP_SYS(finit_module), SCMP_SYS(delete_module),
			SCMP_SYS(swapon), SCMP_SYS(swapoff), SCMP_SYS(setns), SCMP_SYS(unshare),
			SCMP_SYS(settimeofday), SCMP_SYS(clock_settime), SCMP_SYS(sethostname), SCMP_SYS(setdomainname),
		};
		int syscalls_blacklist_length = sizeof(syscalls_blacklist) / sizeof(int);

		std::unique_ptr<void, decltype(&seccomp_release)> ctx(seccomp_init(SCMP_ACT_ALLOW), &seccomp_release);
		if (!ctx) {
			throw std::runtime_error("seccomp_init failed");
		}
		for (int i = 0; i < syscalls_blacklist_length; i++) {
			if (seccomp_rule_add(ctx.get(), SCMP_ACT_KILL, syscalls_blacklist[i], 0) != 0) {
				throw std::runtime_error("seccomp_rule_add failed, syscall: " + std::to_string(syscalls_blacklist[i]));
			}
		}

		// seccomp_export_bpf 只能写入文件描述符, 借助临时文件读回
		std::unique_ptr<FILE, decltype(&std::fclose)> tmp(std::tmpfile(), &std::fclose);
		if (!tmp) {
			throw std::runtime_error("create temporary file for seccomp filter failed");
		}
		const int fd = ::fileno(tmp.get());
		if (seccomp_export_bpf(ctx.get(), fd) != 0) {
			throw std::runtime_error("seccomp_export_bpf failed");
		}

		struct stat st;
		if (::fstat(fd, &st) != 0 || st.st_size <= 0 || st.st_size % sizeof(sock_filter) != 0) {
			throw std::runtime_error("exported seccomp filter is malformed");
		}

		harness_seccomp_filter filter;
		filter.program.resize(st.st_size / sizeof(sock_filter));
		if (::pread(fd, filter.program.data(), st.st_size, 0) != st.st_size) {
			throw std::runtime_error("read back seccomp filter failed");
		}
		return filter;
	}

	bool harness_seccomp_filter::install() const noexcept
	{
		if (program.empty()) {
			return false;
		}
		struct sock_fprog prog;
		prog.len = static_cast<unsigned short>(program.size());
		prog.filter = const_cast<sock_filter *>(program.data());

		// 非特权进程安装过滤器前必须设置 no_new_privs, 与 seccomp_load 的默认行为一致
		if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
			return false;
		}
		return ::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog) == 0;
	}

} /* namespace lboard */
