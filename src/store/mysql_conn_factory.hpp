/*
 * mysql_conn_factory.hpp
 *
 *  Created on: 2018年12月3日
 *      Author: peter
 */

#ifndef SRC_STORE_MYSQL_CONN_FACTORY_HPP_
#define SRC_STORE_MYSQL_CONN_FACTORY_HPP_

#ifndef MYSQLPP_MYSQL_HEADERS_BURIED
#	define MYSQLPP_MYSQL_HEADERS_BURIED
#endif
#include <mysql++/connection.h>

#include "settings.hpp"
#include "sync_nonsingle_instance_pool.hpp"

namespace lboard
{

	/**
	 * @brief 数据库连接池, 共 max_connections 个连接.
	 * 取出的连接若已断开则丢弃并重建
	 */
	class mysql_conn_factory
	{
		public:
			typedef sync_nonsingle_instance_pool<mysqlpp::Connection> mysql_conn_pool_type;
			typedef mysql_conn_pool_type::auto_revert_handle handle_type;
			typedef decltype(Settings::mysql) mysql_settings_type;

		private:
			mysql_settings_type conf;
			mysql_conn_pool_type mysql_conn_pool;

			/**
			 * @throw std::runtime_error 连接失败
			 */
			std::unique_ptr<mysqlpp::Connection> make_conn() const;

		public:
			explicit mysql_conn_factory(const mysql_settings_type & conf);

			/**
			 * @brief 预先建立 max_connections 个连接
			 * @throw std::runtime_error 任何一个连接失败
			 */
			void fill();

			/**
			 * @brief 取一个可用连接, 池空时等待其他线程归还
			 * @throw std::runtime_error 重建断开的连接失败
			 */
			handle_type sync_fetch_mysql_conn();
	};

} /* namespace lboard */

#endif /* SRC_STORE_MYSQL_CONN_FACTORY_HPP_ */
