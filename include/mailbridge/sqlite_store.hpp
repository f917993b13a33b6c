#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <sqlite3.h>
#include <mailbridge/defs.h>
#include <mailbridge/store.hpp>

namespace mailbridge {

/* Recurrence patterns understood by the SQLite store. */
enum {
	RECUR_DAILY = 1,
	RECUR_WEEKLY = 2,
};

struct recurrence_rule {
	uint32_t pattern = RECUR_DAILY, interval = 1;
	/* 0 = unlimited */
	uint32_t occurrences = 0;
	/* NT time; 0 = no end date */
	uint64_t end_time = 0;
};

struct attachment_content {
	TPROPVAL_ARRAY props;
	std::string data;
};

/**
 * Mailbox store kept in one SQLite database. Every thread works through
 * its own connection, opened by thread_init().
 */
class MB_EXPORT sqlite_store final : public store_client {
	public:
	sqlite_store(const char *path, unsigned int recurrence_limit = 1000);
	~sqlite_store();
	NOMOVE(sqlite_store);

	/* Create the schema and the default folders in @path. */
	static bool create(const char *path, bool force);

	ec_error_t thread_init() override;
	void thread_fini() override;
	ec_error_t get_named_propids(bool create, const std::vector<PROPERTY_NAME> &, std::vector<uint16_t> &) override;
	ec_error_t open_folder(const char *name, std::unique_ptr<folder_object> &) override;
	ec_error_t open_message(const std::string &entryid, std::unique_ptr<message_object> &) override;
	ec_error_t list_folders(TARRAY_SET &) override;

	ec_error_t insert_message(const char *folder, const TPROPVAL_ARRAY &props,
	        const std::string &mime, const std::vector<attachment_content> &,
	        const recurrence_rule *, std::string &entryid_out);

	/* The calling thread's connection; nullptr without thread_init(). */
	sqlite3 *db() const;
	unsigned int recurrence_limit() const { return m_recur_limit; }

	private:
	std::string m_path;
	unsigned int m_recur_limit = 1000;
	mutable std::mutex m_lock;
	std::unordered_map<std::thread::id, sqlite3 *> m_conns;
};

/* Storage conversion between PT_* values and SQLite columns */
extern MB_EXPORT propval_t sql_column_to_propval(uint32_t proptag, sqlite3_stmt *, int col);
extern MB_EXPORT int sql_bind_propval(sqlite3_stmt *, int col, const TAGGED_PROPVAL &);

}
