#pragma once
#include <memory>
#include <mailbridge/defs.h>
#include <mailbridge/store.hpp>

namespace mailbridge {

/**
 * Make sure the calling thread has an initialized session on @store.
 * The first call on a thread runs store_client::thread_init(); later
 * calls only bump the reference count. The session is finalized exactly
 * once: at thread exit, by store_thread_release(), or when the thread
 * switches to a different store. A store that has already been
 * destroyed by then is not touched.
 */
extern MB_EXPORT ec_error_t store_thread_acquire(const std::shared_ptr<store_client> &store);
extern MB_EXPORT void store_thread_release();
/* Number of acquisitions on the current thread's session (0 if none). */
extern MB_EXPORT unsigned int store_thread_refs();

}
