/*
 * mysql_conn_factory.cpp
 *
 *  Created on: 2018年12月3日
 *      Author: peter
 */

#include "mysql_conn_factory.hpp"

#include <stdexcept>

namespace lboard
{

	mysql_conn_factory::mysql_conn_factory(const mysql_settings_type & conf) :
			conf(conf)
	{
	}

	std::unique_ptr<mysqlpp::Connection> mysql_conn_factory::make_conn() const
	{
		std::unique_ptr<mysqlpp::Connection> mysql_conn(new mysqlpp::Connection(false));
		mysql_conn->set_option(new mysqlpp::SetCharsetNameOption("utf8mb4"));
		if (!mysql_conn->connect(
				conf.database.c_str(),
				conf.hostname.c_str(),
				conf.username.c_str(),
				conf.password.c_str(),
				static_cast<unsigned int>(conf.port)
			)) {
			throw std::runtime_error("failed connect to mysql server " + conf.hostname + ":" + std::to_string(conf.port)
					+ " MySQL errnum: " + std::to_string(mysql_conn->errnum())
					+ " MySQL error: " + mysql_conn->error());
		}
		return mysql_conn;
	}

	void mysql_conn_factory::fill()
	{
		for (int i = 0; i < conf.max_connections; ++i) {
			mysql_conn_pool.add(make_conn());
		}
	}

	mysql_conn_factory::handle_type mysql_conn_factory::sync_fetch_mysql_conn()
	{
		handle_type mysql_conn_handle = mysql_conn_pool.sync_fetch();
		if (!mysql_conn_handle->ping()) {
			mysql_conn_handle.abandon();
			mysql_conn_pool.add(make_conn());
			mysql_conn_handle = mysql_conn_pool.sync_fetch();
		}
		return mysql_conn_handle;
	}

} /* namespace lboard */
