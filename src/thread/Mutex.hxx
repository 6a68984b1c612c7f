// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#ifndef THREAD_MUTEX_HXX
#define THREAD_MUTEX_HXX

#include <mutex>

using Mutex = std::mutex;

/**
 * Within the scope of an instance, this class will keep a #Mutex
 * unlocked.  Used to call out to listeners and devices without
 * holding a lock that they might need.
 */
class ScopeUnlock {
	std::unique_lock<Mutex> &lock;

public:
	explicit ScopeUnlock(std::unique_lock<Mutex> &_lock) noexcept
		:lock(_lock) {
		lock.unlock();
	}

	~ScopeUnlock() noexcept {
		lock.lock();
	}

	ScopeUnlock(const ScopeUnlock &other) = delete;
	ScopeUnlock &operator=(const ScopeUnlock &other) = delete;
};

#endif
