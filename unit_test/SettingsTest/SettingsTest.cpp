/*
 * SettingsTest.cpp
 *
 *  Created on: 2019年4月14日
 *      Author: peter
 */

#define BOOST_TEST_MODULE SettingsTest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "settings.hpp"

using namespace lboard;

namespace
{
	nlohmann::json minimal_config()
	{
		return nlohmann::json::parse(R"({
			"runtime": {"log_dir": "/tmp/lboard/log"},
			"mysql": {"hostname": "localhost", "username": "u", "password": "p", "database": "lboard"},
			"runner": {"workspace_dir": "/tmp/lboard/work"},
			"benchmark": {
				"benchmarks_dir": "/opt/assets/benchmarks",
				"harness_path": "/opt/assets/scorer_tool.py",
				"default_client_dir": "/opt/assets/student_agent"
			},
			"intake": {"upload_dir": "/tmp/lboard/submissions"}
		})");
	}
}

BOOST_AUTO_TEST_CASE(defaults_are_applied)
{
	Settings settings;
	settings.parse(minimal_config());

	BOOST_CHECK_EQUAL(settings.mysql.port, 3306);
	BOOST_CHECK_EQUAL(settings.runner.workers, 8);
	BOOST_CHECK_EQUAL(settings.runner.poll_interval.count(), 1000);
	BOOST_CHECK_EQUAL(settings.staging.entry_point, "my-agent.py");
	BOOST_CHECK_EQUAL(settings.staging.tail_lines, 5);
	BOOST_CHECK_EQUAL(settings.benchmark.trials, 11);
	BOOST_CHECK_EQUAL(settings.benchmark.timeout.count(), 180);
	BOOST_CHECK(settings.backend.name == llm_backend::OLLAMA);
	BOOST_CHECK_EQUAL(settings.backend.token_env, "ECE30861_OPENAI_TOKEN");
	BOOST_CHECK(!settings.sandbox.seccomp);
	BOOST_CHECK(settings.runtime.echo_to_console);
	BOOST_REQUIRE_EQUAL(settings.intake.allowed_extensions.size(), 1u);
	BOOST_CHECK_EQUAL(settings.intake.allowed_extensions[0], "zip");
}

BOOST_AUTO_TEST_CASE(optional_sections_override_defaults)
{
	nlohmann::json conf = minimal_config();
	conf["runner"]["workers"] = 3;
	conf["runner"]["poll_interval_ms"] = 250;
	conf["runtime"]["echo_to_console"] = false;
	conf["benchmark"]["timeout_s"] = 60;
	conf["backend"] = {{"name", "openai"}, {"openai_token_path", "/opt/token.txt"}};
	conf["sandbox"] = {{"seccomp", true}, {"max_memory_mb", 2048}};

	Settings settings;
	settings.parse(conf);

	BOOST_CHECK_EQUAL(settings.runner.workers, 3);
	BOOST_CHECK_EQUAL(settings.runner.poll_interval.count(), 250);
	BOOST_CHECK(!settings.runtime.echo_to_console);
	BOOST_CHECK_EQUAL(settings.benchmark.timeout.count(), 60);
	BOOST_CHECK(settings.backend.name == llm_backend::OPENAI);
	BOOST_CHECK_EQUAL(settings.backend.openai_token_path.string(), "/opt/token.txt");
	BOOST_CHECK(settings.sandbox.seccomp);
	BOOST_CHECK_EQUAL(settings.sandbox.max_memory_mb, 2048);
}

BOOST_AUTO_TEST_CASE(missing_required_key_throws)
{
	nlohmann::json conf = minimal_config();
	conf["benchmark"].erase("harness_path");

	Settings settings;
	BOOST_CHECK_THROW(settings.parse(conf), nlohmann::json::exception);
}

BOOST_AUTO_TEST_CASE(invalid_values_are_rejected)
{
	nlohmann::json conf = minimal_config();
	conf["runner"]["workers"] = 0;
	Settings settings;
	BOOST_CHECK_THROW(settings.parse(conf), std::invalid_argument);

	for (int max_connections : {0, -1}) {
		nlohmann::json no_pool = minimal_config();
		no_pool["mysql"]["max_connections"] = max_connections;
		Settings pool_settings;
		BOOST_CHECK_THROW(pool_settings.parse(no_pool), std::invalid_argument);
	}

	nlohmann::json bad_backend = minimal_config();
	bad_backend["backend"] = {{"name", "claude"}};
	Settings other;
	BOOST_CHECK_THROW(other.parse(bad_backend), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(unreadable_file_throws)
{
	Settings settings;
	BOOST_CHECK_THROW(settings.parse(boost::filesystem::path("/nonexistent/lboard.json")), std::runtime_error);
}
