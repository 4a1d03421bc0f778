/*
 * MysqlJobStore.cpp
 *
 *  Created on: 2019年4月6日
 *      Author: peter
 */

#include "MysqlJobStore.hpp"
#include "logger.hpp"

#include <thread>

#ifndef MYSQLPP_MYSQL_HEADERS_BURIED
#	define MYSQLPP_MYSQL_HEADERS_BURIED
#endif

#include <mysql++/query.h>
#include <mysql++/transaction.h>

using namespace std::string_literals;

namespace lboard
{

	namespace
	{
		[[noreturn]] void throw_store_error(mysqlpp::Connection & mysql_conn, const std::string & events)
		{
			throw store_exception(events
					+ " MySQL errnum: " + std::to_string(mysql_conn.errnum())
					+ " MySQL error: " + mysql_conn.error(), mysql_conn.errnum());
		}

		std::string to_std_string(const mysqlpp::String & s)
		{
			return std::string(s.data(), s.length());
		}

		/**
		 * @brief 对 queue_state 中唯一的一行加排他锁, 必须在事务中调用
		 * @return 下一个待分配的任务 id
		 */
		job_id_type lock_queue(mysqlpp::Connection & mysql_conn)
		{
			mysqlpp::Query query = mysql_conn.query("select next_job_id from queue_state where id = 1 for update");
			mysqlpp::StoreQueryResult res = query.store();
			if (!res) {
				throw_store_error(mysql_conn, "Lock queue state failed!");
			}
			if (res.empty()) {
				throw store_exception("Lock queue state failed! queue_state is not initialized", 0);
			}
			return job_id_type(res[0]["next_job_id"]);
		}

		/**
		 * @brief 查询并锁定任务的当前状态
		 * @return 任务不存在时返回 nullopt
		 */
		optional<job_status> locked_job_status(mysqlpp::Connection & mysql_conn, job_id_type job_id)
		{
			mysqlpp::Query query = mysql_conn.query("select status from pending_job where id = %0 for update");
			query.parse();
			mysqlpp::StoreQueryResult res = query.store(job_id);
			if (!res) {
				throw_store_error(mysql_conn, "Query job status failed! job_id: "s + std::to_string(job_id));
			}
			if (res.empty()) {
				return nullopt;
			}
			return parse_job_status(to_std_string(res[0]["status"]));
		}

		constexpr const char * schema_sqls[] = {
			"create table if not exists queue_state ("
			"	id tinyint unsigned not null primary key,"
			"	next_job_id bigint not null"
			") engine = InnoDB",

			"insert ignore into queue_state (id, next_job_id) values (1, 1)",

			"create table if not exists pending_job ("
			"	id bigint not null primary key,"
			"	name text not null,"
			"	archive_path varchar(4096) not null default '',"
			"	status enum('REGISTERING', 'PENDING', 'RUNNING') not null,"
			"	submitted_at timestamp(3) not null default current_timestamp(3),"
			"	key idx_status_id (status, id)"
			") engine = InnoDB default charset = utf8mb4",

			"create table if not exists completed_run ("
			"	id bigint not null auto_increment primary key,"
			"	job_id bigint not null,"
			"	name text not null,"
			"	latency_reduction double null,"
			"	score double null,"
			"	per_problem_scores mediumtext null,"
			"	status enum('success', 'error') not null,"
			"	error_message text null,"
			"	completed_at timestamp(3) not null default current_timestamp(3),"
			"	unique key uk_job_id (job_id),"
			"	key idx_rank (score, latency_reduction, completed_at)"
			") engine = InnoDB default charset = utf8mb4",
		};

	} /* namespace */

	MysqlJobStore::MysqlJobStore(const Settings & settings, std::ostream & log_fp) :
			conn_factory(settings.mysql), schema_retry_interval(settings.runner.schema_retry_interval), log_fp(log_fp)
	{
	}

	void MysqlJobStore::connect()
	{
		conn_factory.fill();
	}

	void MysqlJobStore::ensure_schema()
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		mysqlpp::Connection & mysql_conn = *mysql_conn_handle;

		for (const char * sql : schema_sqls) {
			if (!mysql_conn.query(sql).execute()) {
				throw_store_error(mysql_conn, "Create schema failed! sql: "s + sql);
			}
		}
		LOG_INFO(0, 0, log_fp, "Schema ensured.");
	}

	void MysqlJobStore::drop_schema()
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		mysqlpp::Connection & mysql_conn = *mysql_conn_handle;

		for (const char * table : {"completed_run", "pending_job", "queue_state"}) {
			if (!mysql_conn.query("drop table if exists "s + table).execute()) {
				throw_store_error(mysql_conn, "Drop table failed! table: "s + table);
			}
		}
	}

	job_id_type MysqlJobStore::enqueue(const std::string & name, const std::string & archive_ref)
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		mysqlpp::Connection & mysql_conn = *mysql_conn_handle;

		mysqlpp::Transaction trans(mysql_conn);
		const job_id_type job_id = lock_queue(mysql_conn);

		mysqlpp::Query insert = mysql_conn.query(
				"insert into pending_job (id, name, archive_path, status) "
				"values (%0, %1q, %2q, 'REGISTERING')"
		);
		insert.parse();
		if (!insert.execute(job_id, name, archive_ref)) {
			throw_store_error(mysql_conn, "Insert job failed! job_id: "s + std::to_string(job_id));
		}

		mysqlpp::Query advance = mysql_conn.query("update queue_state set next_job_id = %0 where id = 1");
		advance.parse();
		if (!advance.execute(static_cast<long long>(job_id.to_literal() + 1))) {
			throw_store_error(mysql_conn, "Advance job id sequence failed! job_id: "s + std::to_string(job_id));
		}

		trans.commit();
		LOG_INFO(0, job_id, log_fp, "Job registered. name: ", name);
		return job_id;
	}

	void MysqlJobStore::activate(job_id_type job_id, const std::string & archive_ref)
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		mysqlpp::Connection & mysql_conn = *mysql_conn_handle;

		mysqlpp::Transaction trans(mysql_conn);
		lock_queue(mysql_conn);

		optional<job_status> status = locked_job_status(mysql_conn, job_id);
		if (status == nullopt) {
			throw job_state_exception("activate: job " + std::to_string(job_id) + " does not exist");
		}
		if (*status != job_status::REGISTERING) {
			throw job_state_exception("activate: job " + std::to_string(job_id) + " is " + get_job_status_name(*status) + ", expected REGISTERING");
		}

		mysqlpp::Query update = mysql_conn.query(
				"update pending_job set archive_path = %1q, status = 'PENDING' "
				"where id = %0"
		);
		update.parse();
		if (!update.execute(job_id, archive_ref)) {
			throw_store_error(mysql_conn, "Activate job failed! job_id: "s + std::to_string(job_id));
		}

		trans.commit();
		LOG_INFO(0, job_id, log_fp, "Job is pending. archive: ", archive_ref);
	}

	optional<ClaimedJob> MysqlJobStore::claim_next_once(mysqlpp::Connection & mysql_conn)
	{
		mysqlpp::Transaction trans(mysql_conn);
		lock_queue(mysql_conn);

		mysqlpp::Query query = mysql_conn.query(
				"select id, name, archive_path, submitted_at from pending_job "
				"where status = 'PENDING' "
				"order by id limit 1"
		);
		mysqlpp::StoreQueryResult res = query.store();
		if (!res) {
			throw_store_error(mysql_conn, "Query pending job failed!");
		}
		if (res.empty()) {
			trans.commit();
			return nullopt;
		}

		ClaimedJob job;
		job.id = job_id_type(res[0]["id"]);
		job.name = to_std_string(res[0]["name"]);
		job.archive_path = to_std_string(res[0]["archive_path"]);
		job.submitted_at = to_std_string(res[0]["submitted_at"]);

		mysqlpp::Query update = mysql_conn.query(
				"update pending_job set status = 'RUNNING' "
				"where id = %0 and status = 'PENDING'"
		);
		update.parse();
		mysqlpp::SimpleResult update_res = update.execute(job.id);
		if (!update_res) {
			throw_store_error(mysql_conn, "Claim job failed! job_id: "s + std::to_string(job.id));
		}
		if (update_res.rows() != 1) {
			throw store_exception("Claim job failed! job_id: " + std::to_string(job.id) + " status changed concurrently", 0);
		}

		trans.commit();
		return job;
	}

	optional<ClaimedJob> MysqlJobStore::claim_next()
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		mysqlpp::Connection & mysql_conn = *mysql_conn_handle;

		while (true) {
			try {
				return this->claim_next_once(mysql_conn);
			} catch (const store_exception & e) {
				if (e.errnum != ER_NO_SUCH_TABLE) {
					throw;
				}
				EXCEPT_WARNING(0, 0, log_fp, "Schema is not ready, retry later.", e);
			}
			std::this_thread::sleep_for(schema_retry_interval);
		}
	}

	void MysqlJobStore::complete(mysqlpp::Connection & mysql_conn, job_id_type job_id, const std::string & name, const ScoreReport * report, const std::string & message)
	{
		mysqlpp::Transaction trans(mysql_conn);
		lock_queue(mysql_conn);

		optional<job_status> status = locked_job_status(mysql_conn, job_id);
		if (status == nullopt) {
			throw job_state_exception("complete: job " + std::to_string(job_id) + " has no active record, its result may have been committed already");
		}
		if (*status != job_status::RUNNING) {
			throw job_state_exception("complete: job " + std::to_string(job_id) + " is " + get_job_status_name(*status) + ", expected RUNNING");
		}

		if (report != nullptr) {
			mysqlpp::Query insert = mysql_conn.query(
					"insert into completed_run "
					"(job_id, name, latency_reduction, score, per_problem_scores, status) "
					"values (%0, %1q, %2, %3, %4q, 'success')"
			);
			insert.parse();
			if (!insert.execute(job_id, name, report->latency_reduction, report->score, problems_to_json(report->problems))) {
				throw_store_error(mysql_conn, "Insert success result failed! job_id: "s + std::to_string(job_id));
			}
		} else {
			mysqlpp::Query insert = mysql_conn.query(
					"insert into completed_run "
					"(job_id, name, status, error_message) "
					"values (%0, %1q, 'error', %2q)"
			);
			insert.parse();
			if (!insert.execute(job_id, name, message)) {
				throw_store_error(mysql_conn, "Insert error result failed! job_id: "s + std::to_string(job_id));
			}
		}

		mysqlpp::Query del = mysql_conn.query("delete from pending_job where id = %0");
		del.parse();
		if (!del.execute(job_id)) {
			throw_store_error(mysql_conn, "Delete finished job failed! job_id: "s + std::to_string(job_id));
		}

		trans.commit();
	}

	void MysqlJobStore::complete_success(job_id_type job_id, const std::string & name, const ScoreReport & report)
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		this->complete(*mysql_conn_handle, job_id, name, &report, "");
	}

	void MysqlJobStore::complete_error(job_id_type job_id, const std::string & name, const std::string & message)
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		this->complete(*mysql_conn_handle, job_id, name, nullptr, message);
	}

	LeaderboardSnapshot MysqlJobStore::snapshot()
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		mysqlpp::Connection & mysql_conn = *mysql_conn_handle;

		LeaderboardSnapshot snap;

		// 两次查询读到的是同一时刻的数据
		mysqlpp::Transaction trans(mysql_conn, true);
		{
			mysqlpp::Query query = mysql_conn.query(
					"select job_id, name, latency_reduction, score, per_problem_scores, "
					"status, error_message, completed_at from completed_run "
					"order by score is null, score desc, "
					"latency_reduction is null, latency_reduction desc, "
					"completed_at asc, id asc"
			);
			mysqlpp::StoreQueryResult res = query.store();
			if (!res) {
				throw_store_error(mysql_conn, "Query completed runs failed!");
			}
			for (const mysqlpp::Row & row : res) {
				CompletedRun run;
				run.job_id = job_id_type(row["job_id"]);
				run.name = to_std_string(row["name"]);
				run.outcome = parse_run_outcome(to_std_string(row["status"]));
				if (!row["latency_reduction"].is_null()) {
					run.latency_reduction = double(row["latency_reduction"]);
				}
				if (!row["score"].is_null()) {
					run.score = double(row["score"]);
				}
				if (!row["per_problem_scores"].is_null()) {
					run.per_problem_json = to_std_string(row["per_problem_scores"]);
				}
				if (!row["error_message"].is_null()) {
					run.error_message = to_std_string(row["error_message"]);
				}
				run.completed_at = to_std_string(row["completed_at"]);
				snap.completed.push_back(std::move(run));
			}
		}

		{
			mysqlpp::Query query = mysql_conn.query(
					"select id, name, status, submitted_at from pending_job "
					"order by id"
			);
			mysqlpp::StoreQueryResult res = query.store();
			if (!res) {
				throw_store_error(mysql_conn, "Query active jobs failed!");
			}
			for (const mysqlpp::Row & row : res) {
				ActiveJob job;
				job.id = job_id_type(row["id"]);
				job.name = to_std_string(row["name"]);
				job.status = parse_job_status(to_std_string(row["status"]));
				job.submitted_at = to_std_string(row["submitted_at"]);
				snap.active.push_back(std::move(job));
			}
		}
		trans.commit();

		return snap;
	}

	int MysqlJobStore::fail_orphaned_jobs(const std::string & message)
	{
		auto mysql_conn_handle = conn_factory.sync_fetch_mysql_conn();
		mysqlpp::Connection & mysql_conn = *mysql_conn_handle;

		std::vector<std::pair<job_id_type, std::string> > orphans;
		{
			mysqlpp::Transaction trans(mysql_conn);
			lock_queue(mysql_conn);
			mysqlpp::Query query = mysql_conn.query("select id, name from pending_job where status = 'RUNNING' order by id");
			mysqlpp::StoreQueryResult res = query.store();
			if (!res) {
				throw_store_error(mysql_conn, "Query orphaned jobs failed!");
			}
			for (const mysqlpp::Row & row : res) {
				orphans.emplace_back(job_id_type(row["id"]), to_std_string(row["name"]));
			}
			trans.commit();
		}

		for (const auto & [job_id, name] : orphans) {
			this->complete(mysql_conn, job_id, name, nullptr, message);
			LOG_WARNING(0, job_id, log_fp, "Orphaned running job failed. name: ", name);
		}
		return static_cast<int>(orphans.size());
	}

} /* namespace lboard */
