// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <memory>
#include <mailbridge/thread_scope.hpp>
#include <mailbridge/util.hpp>

namespace mailbridge {

namespace {

struct thread_session {
	thread_session() = default;
	~thread_session() { reset(); }
	NOMOVE(thread_session);
	void reset();

	std::weak_ptr<store_client> store;
	unsigned int refs = 0;
};

}

static thread_local thread_session g_session;

void thread_session::reset()
{
	if (refs == 0)
		return;
	auto s = store.lock();
	if (s != nullptr)
		s->thread_fini();
	store.reset();
	refs = 0;
}

ec_error_t store_thread_acquire(const std::shared_ptr<store_client> &store)
{
	if (store == nullptr)
		return ecNullObject;
	auto &ses = g_session;
	if (ses.refs > 0) {
		auto cur = ses.store.lock();
		if (cur == store) {
			++ses.refs;
			return ecSuccess;
		}
		ses.reset();
	}
	auto ret = store->thread_init();
	if (ret != ecSuccess) {
		mlog(LV_ERR, "E-1301: store thread initialization failed: %s",
		        mapi_strerror(ret));
		return ret;
	}
	ses.store = store;
	ses.refs = 1;
	return ecSuccess;
}

void store_thread_release()
{
	g_session.reset();
}

unsigned int store_thread_refs()
{
	return g_session.refs;
}

}
