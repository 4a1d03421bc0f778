/*
 * TextUtilTest.cpp
 *
 *  Created on: 2019年4月14日
 *      Author: peter
 */

#define BOOST_TEST_MODULE TextUtilTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "text_util.hpp"

using namespace lboard;

BOOST_AUTO_TEST_CASE(tail_keeps_last_lines)
{
	BOOST_CHECK_EQUAL(tail_lines("a\nb\nc\nd\ne\nf\ng\n\n", 5), "c\nd\ne\nf\ng");
	BOOST_CHECK_EQUAL(tail_lines("  only\n", 5), "only");
	BOOST_CHECK_EQUAL(tail_lines("   \n\n", 5), "");
	BOOST_CHECK_EQUAL(tail_lines("x\ny", 0), "");
}

BOOST_AUTO_TEST_CASE(failure_message_omits_empty_parts)
{
	BOOST_CHECK_EQUAL(compose_failure_message("pip install failed, rc 1", "", "boom\n", 5, false),
					  "pip install failed, rc 1; tail of stderr: boom");
	BOOST_CHECK_EQUAL(compose_failure_message("pip install failed, rc 1", "", "", 5, false),
					  "pip install failed, rc 1");
}

BOOST_AUTO_TEST_CASE(failure_message_marks_missing_stdout)
{
	BOOST_CHECK_EQUAL(compose_failure_message("scorer_tool.py failed, rc 2", "", "Traceback\nValueError", 5, true),
					  "scorer_tool.py failed, rc 2; (no stdout); tail of stderr: Traceback\nValueError");
	BOOST_CHECK_EQUAL(compose_failure_message("scorer_tool.py failed, rc 2", "out\n", "", 5, true),
					  "scorer_tool.py failed, rc 2; tail of stdout: out");
}
