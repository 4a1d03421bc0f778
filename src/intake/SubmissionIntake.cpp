/*
 * SubmissionIntake.cpp
 *
 *  Created on: 2019年4月12日
 *      Author: peter
 */

#include "SubmissionIntake.hpp"
#include "logger.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;

namespace lboard
{

	SubmissionIntake::SubmissionIntake(JobStore & store, const Settings & settings, std::ostream & log_fp) :
			store(store), settings(settings), log_fp(log_fp)
	{
	}

	std::string SubmissionIntake::validate(const std::string & raw_name, const fs::path & archive,
											const std::vector<std::string> & allowed_extensions)
	{
		const std::string name = trim(raw_name);
		if (name.empty()) {
			throw submission_rejected_exception("Name is required");
		}

		if (archive.empty() || !fs::exists(archive)) {
			throw submission_rejected_exception("No file part");
		}

		const std::string filename = archive.filename().string();
		if (filename.empty() || filename == "." || fs::is_directory(archive)) {
			throw submission_rejected_exception("No selected file");
		}

		size_t dot = filename.rfind('.');
		const std::string ext = dot == std::string::npos ? std::string() : boost::algorithm::to_lower_copy(filename.substr(dot + 1));
		if (dot == std::string::npos || std::find(allowed_extensions.begin(), allowed_extensions.end(), ext) == allowed_extensions.end()) {
			throw submission_rejected_exception("Invalid file type; only .zip allowed");
		}
		return name;
	}

	std::string SubmissionIntake::sanitize_filename(const std::string & filename)
	{
		std::string res;
		res.reserve(filename.size());
		for (char c : filename) {
			unsigned char uc = static_cast<unsigned char>(c);
			if (std::isalnum(uc) || c == '.' || c == '_' || c == '-') {
				res.push_back(c);
			} else if (std::isspace(uc)) {
				res.push_back('_');
			}
		}
		size_t begin = res.find_first_not_of('.');
		return begin == std::string::npos ? std::string() : res.substr(begin);
	}

	job_id_type SubmissionIntake::submit(const std::string & raw_name, const fs::path & archive)
	{
		const std::string name = validate(raw_name, archive, settings.intake.allowed_extensions);
		const std::string orig_filename = archive.filename().string();
		LOG_INFO(0, 0, log_fp, "Received submission from '", name, "' with file '", orig_filename, "'");

		std::string filename = sanitize_filename(orig_filename);
		if (filename.empty()) {
			filename = "submission.zip";
		}

		// Step 1: 以空的压缩包位置登记, 取得唯一的 id
		job_id_type job_id = store.enqueue(name, "");

		// Step 2: 以 id 为前缀保存压缩包
		const fs::path save_path = settings.intake.upload_dir / (std::to_string(job_id) + "_" + filename);
		try {
			fs::create_directories(settings.intake.upload_dir);
			fs::copy_file(archive, save_path, fs::copy_option::overwrite_if_exists);
		} catch (const fs::filesystem_error & e) {
			EXCEPT_FATAL(0, job_id, log_fp, "Save archive failed.", e, " save path: ", save_path);
			throw std::runtime_error(std::string("failed to save archive: ") + e.what());
		}

		// Step 3: 记录压缩包的最终位置并转为 PENDING
		store.activate(job_id, fs::absolute(save_path).string());
		LOG_INFO(0, job_id, log_fp, "Submission registered. archive: ", save_path);
		return job_id;
	}

} /* namespace lboard */
