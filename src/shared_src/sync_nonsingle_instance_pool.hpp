/*
 * sync_nonsingle_instance_pool.hpp
 *
 *  Created on: 2018年12月29日
 *      Author: peter
 */

#ifndef SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_
#define SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <kerbal/utility/noncopyable.hpp>

namespace lboard
{

	class resource_exhausted_exception : public std::runtime_error
	{
		public:
			resource_exhausted_exception() :
						std::runtime_error("resource exhausted in instance pool")
			{
			}
	};

	/**
	 * @brief 线程安全的实例池. 取出的实例由 auto_revert_handle 持有, 句柄析构时自动归还.
	 * 对于已损坏的实例 (如断开的数据库连接) 可调用 abandon 将其丢弃而不归还
	 */
	template <typename InstanceType>
	class sync_nonsingle_instance_pool : kerbal::utility::noncopyable, kerbal::utility::nonassignable
	{
		private:
			std::deque<std::unique_ptr<InstanceType> > instance_pool;
			mutable std::mutex pool_vis_mtx;

			void revert(std::unique_ptr<InstanceType> p)
			{
				std::lock_guard<std::mutex> lck(pool_vis_mtx);
				instance_pool.push_back(std::move(p));
			}

		public:
			class auto_revert_handle: kerbal::utility::noncopyable, kerbal::utility::nonassignable
			{
				private:
					std::unique_ptr<InstanceType> instance;
					sync_nonsingle_instance_pool * ptr_to_pool;

					friend class sync_nonsingle_instance_pool;

					auto_revert_handle(std::unique_ptr<InstanceType> instance, sync_nonsingle_instance_pool * ptr_to_pool) :
							instance(std::move(instance)), ptr_to_pool(ptr_to_pool)
					{
					}

				public:
					auto_revert_handle(auto_revert_handle && src) noexcept :
							instance(std::move(src.instance)), ptr_to_pool(src.ptr_to_pool)
					{
					}

					~auto_revert_handle()
					{
						if (this->instance == nullptr) {
							return;
						}
						try {
							ptr_to_pool->revert(std::move(this->instance));
						} catch (const std::exception &) {
							// 归还失败时实例随 unique_ptr 一并释放
						}
					}

					auto_revert_handle& operator=(auto_revert_handle && src)
					{
						if (this->instance != nullptr) {
							ptr_to_pool->revert(std::move(this->instance));
						}
						this->instance = std::move(src.instance);
						this->ptr_to_pool = src.ptr_to_pool;
						return *this;
					}

					bool empty() const
					{
						return this->instance == nullptr;
					}

					InstanceType& operator*() const
					{
						return *instance;
					}

					InstanceType* operator->() const
					{
						return instance.get();
					}

					/**
					 * @brief 丢弃持有的实例, 不归还给池
					 */
					void abandon()
					{
						this->instance.reset();
					}
			};

			typedef typename std::deque<std::unique_ptr<InstanceType> >::size_type size_type;

			void add(std::unique_ptr<InstanceType> p)
			{
				std::lock_guard<std::mutex> lck(pool_vis_mtx);
				instance_pool.push_back(std::move(p));
			}

			template <typename ... Args>
			void emplace(Args&& ... args)
			{
				this->add(std::unique_ptr<InstanceType>(new InstanceType(std::forward<Args>(args)...)));
			}

			size_type size() const
			{
				std::lock_guard<std::mutex> lck(pool_vis_mtx);
				return instance_pool.size();
			}

			auto_revert_handle fetch()
			{
				std::lock_guard<std::mutex> lck(pool_vis_mtx);
				while (!instance_pool.empty()) {
					std::unique_ptr<InstanceType> p = std::move(instance_pool.front());
					instance_pool.pop_front();
					if (p != nullptr) {
						return auto_revert_handle(std::move(p), this);
					}
				}
				throw resource_exhausted_exception();
			}

			auto_revert_handle sync_fetch(std::chrono::milliseconds next_try_interval = std::chrono::milliseconds(5))
			{
				while (true) {
					{
						std::lock_guard<std::mutex> lck(pool_vis_mtx);
						while (!instance_pool.empty()) {
							std::unique_ptr<InstanceType> p = std::move(instance_pool.front());
							instance_pool.pop_front();
							if (p != nullptr) {
								return auto_revert_handle(std::move(p), this);
							}
						}
					}
					std::this_thread::sleep_for(next_try_interval);
				}
			}
	};

} /* namespace lboard */

#endif /* SRC_SHARED_SRC_SYNC_NONSINGLE_INSTANCE_POOL_HPP_ */
