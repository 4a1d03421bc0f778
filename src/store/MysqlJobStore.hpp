/*
 * MysqlJobStore.hpp
 *
 *  Created on: 2019年4月6日
 *      Author: peter
 */

#ifndef SRC_STORE_MYSQLJOBSTORE_HPP_
#define SRC_STORE_MYSQLJOBSTORE_HPP_

#include <chrono>
#include <ostream>

#include "JobStore.hpp"
#include "mysql_conn_factory.hpp"

namespace lboard
{

	/**
	 * @brief 基于 MySQL (InnoDB) 的任务队列.
	 *
	 * 所有会改变任务状态的事务都先对 queue_state 表中唯一的一行加排他锁 (select ... for update),
	 * 因此领取、提交结果、新建任务在数据库层面完全串行化, 不存在先查询后更新的竞争.
	 * queue_state 同时保存下一个任务 id, 保证 id 单调递增且永不复用.
	 * 读取排行榜使用一致性快照读, 不参与加锁.
	 */
	class MysqlJobStore: public JobStore
	{
		private:
			mysql_conn_factory conn_factory;
			std::chrono::milliseconds schema_retry_interval;
			std::ostream & log_fp;

			optional<ClaimedJob> claim_next_once(mysqlpp::Connection & conn);

			void complete(mysqlpp::Connection & conn, job_id_type job_id, const std::string & name, const ScoreReport * report, const std::string & message);

		public:
			/**
			 * @brief 当数据表尚不存在时 MySQL 返回的错误号 (ER_NO_SUCH_TABLE)
			 */
			static constexpr int ER_NO_SUCH_TABLE = 1146;

			MysqlJobStore(const Settings & settings, std::ostream & log_fp);

			/**
			 * @brief 预先建立全部数据库连接
			 */
			void connect();

			virtual void ensure_schema() override;

			virtual job_id_type enqueue(const std::string & name, const std::string & archive_ref) override;

			virtual void activate(job_id_type job_id, const std::string & archive_ref) override;

			/**
			 * @brief 数据表尚未建立时不抛出异常, 而是等待 schema_retry_interval 后重试
			 */
			virtual optional<ClaimedJob> claim_next() override;

			virtual void complete_success(job_id_type job_id, const std::string & name, const ScoreReport & report) override;

			virtual void complete_error(job_id_type job_id, const std::string & name, const std::string & message) override;

			virtual LeaderboardSnapshot snapshot() override;

			virtual int fail_orphaned_jobs(const std::string & message) override;

			/**
			 * @brief 删除全部数据表. 仅供测试使用
			 */
			void drop_schema();
	};

} /* namespace lboard */

#endif /* SRC_STORE_MYSQLJOBSTORE_HPP_ */
