/*
 * ExecuteArgs.cpp
 *
 *  Created on: 2018年7月1日
 *      Author: peter
 */

#include "ExecuteArgs.hpp"

#include <cstdlib>
#include <stdexcept>

#include <unistd.h>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/filesystem.hpp>

extern char ** environ;

namespace lboard
{

	ExecuteArgs::ExecuteArgs()
	{
	}

	ExecuteArgs::ExecuteArgs(std::initializer_list<std::string> list) :
			args(list.begin(), list.end())
	{
	}

	ExecuteArgs& ExecuteArgs::push_back(const std::string & arg)
	{
		args.push_back(arg);
		return *this;
	}

	std::string ExecuteArgs::join() const
	{
		std::string res;
		for (size_t i = 0; i < args.size(); ++i) {
			if (i != 0) {
				res += ' ';
			}
			res += args[i];
		}
		return res;
	}

	std::unique_ptr<char*[]> ExecuteArgs::getArgs() const
	{
		typedef char * pointer_to_char;
		std::unique_ptr<pointer_to_char[]> res(new char*[args.size() + 1]);
		size_t i = 0;
		for (i = 0; i < args.size(); ++i) {
			res.get()[i] = const_cast<char*>(args[i].c_str());
		}
		res.get()[i] = NULL;
		return res;
	}

	ExecuteArgs ExecuteArgs::current_environment()
	{
		ExecuteArgs env;
		for (char ** p = environ; p != nullptr && *p != nullptr; ++p) {
			env.args.emplace_back(*p);
		}
		return env;
	}

	ExecuteArgs& ExecuteArgs::set_env(const std::string & key, const std::string & value)
	{
		const std::string prefix = key + "=";
		for (std::string & item : args) {
			if (item.compare(0, prefix.size(), prefix) == 0) {
				item = prefix + value;
				return *this;
			}
		}
		args.push_back(prefix + value);
		return *this;
	}

	bool ExecuteArgs::has_env(const std::string & key) const
	{
		const std::string prefix = key + "=";
		for (const std::string & item : args) {
			if (item.compare(0, prefix.size(), prefix) == 0) {
				return true;
			}
		}
		return false;
	}

	std::string resolve_executable(const std::string & name)
	{
		if (name.find('/') != std::string::npos) {
			return name;
		}
		const char * path_env = std::getenv("PATH");
		if (path_env == nullptr) {
			path_env = "/usr/local/bin:/usr/bin:/bin";
		}
		std::vector<std::string> dirs;
		boost::algorithm::split(dirs, path_env, boost::algorithm::is_any_of(":"));
		for (const std::string & dir : dirs) {
			if (dir.empty()) {
				continue;
			}
			boost::filesystem::path candidate = boost::filesystem::path(dir) / name;
			if (::access(candidate.c_str(), X_OK) == 0) {
				return candidate.string();
			}
		}
		throw std::runtime_error("executable not found in PATH: " + name);
	}

} /* namespace lboard */
