/*
 * ArchiveStager.cpp
 *
 *  Created on: 2019年4月8日
 *      Author: peter
 */

#include "ArchiveStager.hpp"
#include "JobHandleException.hpp"
#include "ProtectedProcess.hpp"
#include "logger.hpp"
#include "text_util.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <vector>

#include <stdlib.h>
#include <sys/stat.h>

#include <zip.h>

#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace lboard
{

	namespace
	{
		struct zip_archive_deleter
		{
				void operator()(zip_t * za) const noexcept
				{
					zip_discard(za);
				}
		};

		struct zip_file_deleter
		{
				void operator()(zip_file_t * zf) const noexcept
				{
					zip_fclose(zf);
				}
		};

		/**
		 * @brief 条目名是否会逃逸出解压目录
		 */
		bool is_unsafe_entry_name(const std::string & name)
		{
			if (name.empty() || name[0] == '/') {
				return true;
			}
			size_t begin = 0;
			while (begin <= name.size()) {
				size_t end = name.find('/', begin);
				if (end == std::string::npos) {
					end = name.size();
				}
				if (name.compare(begin, end - begin, "..") == 0) {
					return true;
				}
				begin = end + 1;
			}
			return false;
		}

		bool is_hidden_entry(const std::string & name)
		{
			return name == "__MACOSX" || name == ".DS_Store" || (!name.empty() && name[0] == '.');
		}

		/*
		 * 同名的文件条目与目录条目 (如 a 与 a/b) 只可能来自构造异常的压缩包,
		 * 此时 create_directories 的失败归咎于提交者
		 */
		void make_entry_dirs(const fs::path & dir, const std::string & entry_name)
		{
			try {
				fs::create_directories(dir);
			} catch (const fs::filesystem_error & e) {
				if (e.code() == boost::system::errc::file_exists || e.code() == boost::system::errc::not_a_directory) {
					throw SubmissionInvalidException("invalid zip (conflicting entry: " + entry_name + ")");
				}
				throw InternalErrorException(std::string("failed to create extracted dir: ") + e.what());
			}
		}

	} /* namespace */

	ArchiveStager::ArchiveStager(const Settings & settings, int worker_id, std::ostream & log_fp) :
			settings(settings), worker_id(worker_id), log_fp(log_fp)
	{
	}

	fs::path ArchiveStager::allocate_job_dir(job_id_type job_id) const
	{
		try {
			fs::create_directories(settings.runner.workspace_dir);
		} catch (const fs::filesystem_error & e) {
			throw InternalErrorException(std::string("failed to create workspace dir: ") + e.what());
		}

		std::string templ = (settings.runner.workspace_dir / ("job-" + std::to_string(job_id) + "-XXXXXX")).string();
		std::vector<char> buf(templ.begin(), templ.end());
		buf.push_back('\0');
		if (::mkdtemp(buf.data()) == nullptr) {
			throw InternalErrorException(std::string("failed to create job dir: ") + std::strerror(errno));
		}
		return fs::path(buf.data());
	}

	void ArchiveStager::extract_archive(const fs::path & archive, const fs::path & dest)
	{
		int errorp = 0;
		std::unique_ptr<zip_t, zip_archive_deleter> za(zip_open(archive.c_str(), ZIP_RDONLY, &errorp));
		if (za == nullptr) {
			zip_error_t error;
			zip_error_init_with_code(&error, errorp);
			std::string reason = zip_error_strerror(&error);
			zip_error_fini(&error);
			throw SubmissionInvalidException("invalid zip (" + reason + ")");
		}

		fs::create_directories(dest);

		const zip_int64_t num_entries = zip_get_num_entries(za.get(), 0);
		if (num_entries < 0) {
			throw SubmissionInvalidException(std::string("invalid zip (") + zip_strerror(za.get()) + ")");
		}

		std::vector<char> buffer(64 * 1024);
		for (zip_int64_t i = 0; i < num_entries; ++i) {
			const zip_uint64_t index = static_cast<zip_uint64_t>(i);

			zip_stat_t st;
			zip_stat_init(&st);
			if (zip_stat_index(za.get(), index, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME)) {
				throw SubmissionInvalidException(std::string("invalid zip (") + zip_strerror(za.get()) + ")");
			}
			const std::string name = st.name;

			if (is_unsafe_entry_name(name)) {
				throw SubmissionInvalidException("invalid zip (entry escapes extraction dir: " + name + ")");
			}

			zip_uint8_t opsys = 0;
			zip_uint32_t attributes = 0;
			mode_t mode = 0;
			if (zip_file_get_external_attributes(za.get(), index, 0, &opsys, &attributes) == 0 && opsys == ZIP_OPSYS_UNIX) {
				mode = static_cast<mode_t>((attributes >> 16) & 0xFFFF);
				if (S_ISLNK(mode)) {
					throw SubmissionInvalidException("invalid zip (symbolic link entry: " + name + ")");
				}
			}

			const fs::path target = dest / name;
			if (name.back() == '/') {
				make_entry_dirs(target, name);
				continue;
			}
			make_entry_dirs(target.parent_path(), name);
			if (fs::is_directory(fs::symlink_status(target))) {
				throw SubmissionInvalidException("invalid zip (conflicting entry: " + name + ")");
			}

			std::unique_ptr<zip_file_t, zip_file_deleter> zf(zip_fopen_index(za.get(), index, 0));
			if (zf == nullptr) {
				throw SubmissionInvalidException(std::string("invalid zip (") + zip_strerror(za.get()) + ")");
			}

			std::ofstream fout(target.string(), std::ios::out | std::ios::binary | std::ios::trunc);
			if (!fout) {
				throw InternalErrorException("failed to create extracted file " + target.string());
			}
			while (true) {
				zip_int64_t n = zip_fread(zf.get(), buffer.data(), buffer.size());
				if (n < 0) {
					throw SubmissionInvalidException(std::string("invalid zip (") + zip_file_strerror(zf.get()) + ")");
				}
				if (n == 0) {
					break;
				}
				fout.write(buffer.data(), n);
			}
			fout.close();
			if (!fout) {
				throw InternalErrorException("failed to write extracted file " + target.string());
			}

			// 恢复压缩包中记录的权限位, 但总保证属主可读写
			if ((mode & 0777) != 0 && ::chmod(target.c_str(), (mode & 0777) | S_IRUSR | S_IWUSR) != 0) {
				throw InternalErrorException("failed to restore permission of " + target.string() + ": " + std::strerror(errno));
			}
		}
	}

	int ArchiveStager::flatten_single_directory(const fs::path & root)
	{
		int depth = 0;
		for (; depth < MAX_FLATTEN_DEPTH; ++depth) {
			std::vector<fs::path> visible;
			for (const fs::directory_entry & entry : fs::directory_iterator(root)) {
				if (!is_hidden_entry(entry.path().filename().string())) {
					visible.push_back(entry.path());
				}
			}
			if (visible.size() != 1 || !fs::is_directory(fs::symlink_status(visible[0]))) {
				break;
			}

			// 先改名, 防止子目录中存在与其同名的条目
			const fs::path nested = root / (".lboard-flatten-" + std::to_string(depth));
			fs::rename(visible[0], nested);
			std::vector<fs::path> children;
			for (const fs::directory_entry & entry : fs::directory_iterator(nested)) {
				children.push_back(entry.path());
			}
			for (const fs::path & child : children) {
				const fs::path dst = root / child.filename();
				if (fs::exists(fs::symlink_status(dst))) {
					// 只可能是被忽略的隐藏条目
					fs::remove_all(dst);
				}
				fs::rename(child, dst);
			}
			fs::remove(nested);
		}
		return depth;
	}

	void ArchiveStager::verify_entry_point(const fs::path & agent_dir) const
	{
		if (!fs::is_regular_file(agent_dir / settings.staging.entry_point)) {
			throw SubmissionInvalidException("missing " + settings.staging.entry_point);
		}
	}

	void ArchiveStager::ensure_client(job_id_type job_id, const fs::path & agent_dir) const
	{
		const std::string client_filename = std::string(get_llm_backend_name(settings.backend.name)) + "-client.py";
		const fs::path client_dst = agent_dir / client_filename;
		if (fs::exists(client_dst)) {
			return;
		}
		const fs::path client_src = settings.benchmark.default_client_dir / client_filename;
		if (!fs::exists(client_src)) {
			throw InternalErrorException(client_filename + " not found in " + settings.staging.extract_dir_name
					+ " and default not found at " + client_src.string());
		}
		try {
			fs::copy_file(client_src, client_dst);
		} catch (const fs::filesystem_error & e) {
			throw InternalErrorException("failed to copy default " + client_filename + ": " + e.what());
		}
		LOG_INFO(worker_id, job_id, log_fp, "Copied default ", client_filename, " into ", agent_dir);
	}

	bool ArchiveStager::install_requirements(job_id_type job_id, const fs::path & agent_dir, const fs::path & job_dir) const
	{
		const fs::path req_path = agent_dir / settings.staging.requirements_file;
		if (!fs::exists(req_path)) {
			return false;
		}

		std::string interpreter;
		try {
			interpreter = resolve_executable(settings.benchmark.interpreter);
		} catch (const std::runtime_error & e) {
			throw InternalErrorException(e.what());
		}

		const fs::path site_dir = job_dir / SITE_PACKAGES_DIR_NAME;
		ExecuteArgs pip_args = {interpreter, "-m", "pip", "install", "--disable-pip-version-check",
								"--target", site_dir.string(), "-r", req_path.string()};

		const fs::path stdout_path = job_dir / "pip.stdout";
		const fs::path stderr_path = job_dir / "pip.stderr";
		ProtectedProcessConfig config(agent_dir, stdout_path, stderr_path);
		config.set_max_real_time(std::chrono::duration_cast<std::chrono::milliseconds>(settings.staging.install_timeout));

		LOG_INFO(worker_id, job_id, log_fp, "Installing requirements. cmd: ", pip_args.join(), " cwd: ", agent_dir);

		ProtectedProcessDetails details = protected_process(pip_args, config, ExecuteArgs::current_environment());

		auto read_or_empty = [](const fs::path & p) {
			return fs::exists(p) ? read_whole_file(p) : std::string();
		};

		switch (details.running_result()) {
			case ProtectedProcessResult::EXITED_NORMALLY:
				LOG_INFO(worker_id, job_id, log_fp, "Requirements installed. real time: ", details.real_time().count(), " ms");
				return true;
			case ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED:
				throw SubmissionInvalidException("pip install timed out after "
						+ std::to_string(settings.staging.install_timeout.count()) + "s");
			case ProtectedProcessResult::SYSTEM_ERROR:
				throw InternalErrorException("failed to start pip install with " + interpreter);
			case ProtectedProcessResult::NON_ZERO_EXIT:
			case ProtectedProcessResult::KILLED_BY_SIGNAL:
				break;
		}

		const std::string msg = compose_failure_message(
				"pip install failed, rc " + std::to_string(details.exit_code()),
				read_or_empty(stdout_path), read_or_empty(stderr_path),
				settings.staging.tail_lines, false);
		LOG_WARNING(worker_id, job_id, log_fp, msg);
		throw SubmissionInvalidException(msg);
	}

	fs::path ArchiveStager::stage(job_id_type job_id, const fs::path & archive, const fs::path & job_dir) const
	{
		const fs::path agent_dir = job_dir / settings.staging.extract_dir_name;

		LOG_INFO(worker_id, job_id, log_fp, "Extracting ", archive, " into ", agent_dir);
		extract_archive(archive, agent_dir);

		int depth = flatten_single_directory(agent_dir);
		if (depth != 0) {
			LOG_INFO(worker_id, job_id, log_fp, "Flattened ", depth, " nested level(s) of ", agent_dir);
		}

		this->verify_entry_point(agent_dir);
		this->ensure_client(job_id, agent_dir);
		this->install_requirements(job_id, agent_dir, job_dir);

		return agent_dir;
	}

} /* namespace lboard */
