/*
 * text_util.cpp
 *
 *  Created on: 2019年4月5日
 *      Author: peter
 */

#include "text_util.hpp"

#include <deque>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/algorithm/string/trim.hpp>

namespace lboard
{

	std::string trim(const std::string & s)
	{
		return boost::algorithm::trim_copy(s);
	}

	std::string tail_lines(const std::string & text, int n)
	{
		const std::string stripped = trim(text);
		if (stripped.empty() || n <= 0) {
			return "";
		}

		std::deque<std::string> window;
		std::istringstream in(stripped);
		std::string line;
		while (std::getline(in, line)) {
			if (!line.empty() && line.back() == '\r') {
				line.pop_back();
			}
			window.push_back(std::move(line));
			if (window.size() > static_cast<size_t>(n)) {
				window.pop_front();
			}
		}

		std::string res;
		for (size_t i = 0; i < window.size(); ++i) {
			if (i != 0) {
				res += '\n';
			}
			res += window[i];
		}
		return res;
	}

	std::string read_whole_file(const boost::filesystem::path & file_path)
	{
		std::ifstream fin(file_path.string(), std::ios::in | std::ios::binary);
		if (!fin) {
			throw std::runtime_error("open file failed: " + file_path.string());
		}
		std::ostringstream buffer;
		buffer << fin.rdbuf();
		return buffer.str();
	}

	std::string compose_failure_message(const std::string & head, const std::string & stdout_text, const std::string & stderr_text,
								int tail_line_num, bool no_stdout_marker)
	{
		std::string msg = head;

		const std::string stdout_tail = tail_lines(stdout_text, tail_line_num);
		if (!stdout_tail.empty()) {
			msg += "; tail of stdout: " + stdout_tail;
		} else if (no_stdout_marker) {
			msg += "; (no stdout)";
		}

		const std::string stderr_tail = tail_lines(stderr_text, tail_line_num);
		if (!stderr_tail.empty()) {
			msg += "; tail of stderr: " + stderr_tail;
		}
		return msg;
	}

} /* namespace lboard */
