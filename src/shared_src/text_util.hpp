/*
 * text_util.hpp
 *
 *  Created on: 2019年4月5日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_TEXT_UTIL_HPP_
#define SRC_SHARED_SRC_TEXT_UTIL_HPP_

#include <string>
#include <boost/filesystem/path.hpp>

namespace lboard
{

	/**
	 * @brief 去掉首尾空白字符
	 */
	std::string trim(const std::string & s);

	/**
	 * @brief 取文本去掉首尾空白后的最后 n 行, 以 '\n' 连接. 文本为空时返回空串
	 */
	std::string tail_lines(const std::string & text, int n);

	/**
	 * @brief 读取整个文件的内容
	 * @throw std::runtime_error 文件无法打开
	 */
	std::string read_whole_file(const boost::filesystem::path & file_path);

	/**
	 * @brief 组装子进程失败时的错误信息, 形如
	 * "<head>; tail of stdout: ...; tail of stderr: ...". 输出为空的部分省略,
	 * 若 no_stdout_marker 为 true, 则标准输出为空时写 "(no stdout)"
	 */
	std::string compose_failure_message(const std::string & head, const std::string & stdout_text, const std::string & stderr_text,
								int tail_line_num, bool no_stdout_marker);

} /* namespace lboard */

#endif /* SRC_SHARED_SRC_TEXT_UTIL_HPP_ */
