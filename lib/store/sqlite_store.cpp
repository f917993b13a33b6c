// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include <fmt/core.h>
#include <sqlite3.h>
#include <mailbridge/database.h>
#include <mailbridge/mapidefs.h>
#include <mailbridge/sqlite_store.hpp>
#include <mailbridge/util.hpp>

using namespace std::string_literals;

namespace mailbridge {

static constexpr char tbl_schema[] =
"CREATE TABLE folders ("
"  folder_id INTEGER PRIMARY KEY,"
"  parent_id INTEGER REFERENCES folders(folder_id),"
"  display_name TEXT NOT NULL COLLATE NOCASE,"
"  entryid BLOB UNIQUE NOT NULL);"
"CREATE TABLE messages ("
"  message_id INTEGER PRIMARY KEY,"
"  folder_id INTEGER NOT NULL REFERENCES folders(folder_id),"
"  entryid BLOB UNIQUE NOT NULL,"
"  mime BLOB DEFAULT NULL);"
"CREATE INDEX messages_folder ON messages(folder_id);"
"CREATE TABLE message_properties ("
"  message_id INTEGER NOT NULL REFERENCES messages(message_id) ON DELETE CASCADE,"
"  proptag INTEGER NOT NULL,"
"  propval NOT NULL,"
"  PRIMARY KEY (message_id, proptag));"
"CREATE TABLE attachments ("
"  attachment_id INTEGER PRIMARY KEY,"
"  message_id INTEGER NOT NULL REFERENCES messages(message_id) ON DELETE CASCADE,"
"  data BLOB DEFAULT NULL);"
"CREATE TABLE attachment_properties ("
"  attachment_id INTEGER NOT NULL REFERENCES attachments(attachment_id) ON DELETE CASCADE,"
"  proptag INTEGER NOT NULL,"
"  propval NOT NULL,"
"  PRIMARY KEY (attachment_id, proptag));"
"CREATE TABLE named_properties ("
"  propid INTEGER PRIMARY KEY,"
"  name_string TEXT UNIQUE NOT NULL COLLATE NOCASE);"
"CREATE TABLE recurrences ("
"  message_id INTEGER PRIMARY KEY REFERENCES messages(message_id) ON DELETE CASCADE,"
"  pattern INTEGER NOT NULL,"
"  interval INTEGER NOT NULL,"
"  occurrences INTEGER NOT NULL DEFAULT 0,"
"  end_time INTEGER NOT NULL DEFAULT 0);";

static constexpr const char *default_folders[] = {
	"Inbox", "Calendar", "Tasks", "Sent Items", "Deleted Items",
};

static constexpr uint16_t NAMEDPROP_FIRST = 0x8001, NAMEDPROP_LAST = 0xFFFE;
static constexpr uint64_t NT_PER_SECOND = 10000000;

static std::string make_entryid()
{
	static std::mutex lk;
	static std::mt19937_64 rng(std::random_device{}());
	std::unique_lock hold(lk);
	std::string eid(16, '\0');
	for (size_t i = 0; i < eid.size(); i += 8) {
		auto v = rng();
		memcpy(&eid[i], &v, 8);
	}
	return eid;
}

static std::string namedprop_key(const PROPERTY_NAME &n)
{
	if (n.kind == MNID_ID)
		return fmt::format("GUID={},LID={}", n.guid, n.lid);
	return fmt::format("GUID={},NAME={}", n.guid, n.name);
}

propval_t sql_column_to_propval(uint32_t proptag, sqlite3_stmt *stm, int col)
{
	if (sqlite3_column_type(stm, col) == SQLITE_NULL)
		return {};
	switch (PROP_TYPE(proptag)) {
	case PT_BOOLEAN:
		return static_cast<uint8_t>(sqlite3_column_int64(stm, col) != 0);
	case PT_LONG:
	case PT_ERROR:
		return static_cast<uint32_t>(sqlite3_column_int64(stm, col));
	case PT_I8:
	case PT_SYSTIME:
		return static_cast<uint64_t>(sqlite3_column_int64(stm, col));
	case PT_DOUBLE:
		return sqlite3_column_double(stm, col);
	case PT_UNICODE: {
		auto s = reinterpret_cast<const char *>(sqlite3_column_text(stm, col));
		return std::string(znul(s));
	}
	case PT_BINARY: {
		auto p = sqlite3_column_blob(stm, col);
		auto z = sqlite3_column_bytes(stm, col);
		BINARY b;
		if (p != nullptr && z > 0)
			b.pv.assign(static_cast<const char *>(p), z);
		return b;
	}
	default:
		return {};
	}
}

int sql_bind_propval(sqlite3_stmt *stm, int col, const TAGGED_PROPVAL &pv)
{
	const auto &v = pv.value;
	if (auto x = std::get_if<uint8_t>(&v))
		return sqlite3_bind_int64(stm, col, *x);
	if (auto x = std::get_if<uint32_t>(&v))
		return sqlite3_bind_int64(stm, col, *x);
	if (auto x = std::get_if<uint64_t>(&v))
		return sqlite3_bind_int64(stm, col, static_cast<sqlite3_int64>(*x));
	if (auto x = std::get_if<double>(&v))
		return sqlite3_bind_double(stm, col, *x);
	if (auto x = std::get_if<std::string>(&v))
		return sqlite3_bind_text(stm, col, x->c_str(), x->size(), SQLITE_TRANSIENT);
	if (auto x = std::get_if<BINARY>(&v))
		return sqlite3_bind_blob64(stm, col, x->pv.data(), x->pv.size(), SQLITE_TRANSIENT);
	return sqlite3_bind_null(stm, col);
}

namespace {

struct sql_row {
	uint64_t message_id = 0;
	TPROPVAL_ARRAY props;
};

class sql_table final : public content_table {
	public:
	sql_table(sqlite_store *s, uint64_t fid) : m_store(s), m_folder_id(fid) {}
	ec_error_t restrict(const RESTRICTION &) override;
	ec_error_t include_recurrences(bool) override;
	ec_error_t sort(const SORTORDER_SET &) override;
	ec_error_t set_columns(const PROPTAG_ARRAY &) override;
	ec_error_t query_rows(uint32_t max, TARRAY_SET &) override;
	ec_error_t get_row_count(uint32_t &) override;

	private:
	ec_error_t load();
	ec_error_t expand(sqlite3 *, std::vector<sql_row> &);

	sqlite_store *m_store = nullptr;
	uint64_t m_folder_id = 0;
	std::vector<RESTRICTION> m_res;
	/* index into m_res from which restrictions bound the expansion */
	size_t m_expand_from = 0;
	bool m_expand = false, m_loaded = false;
	SORTORDER_SET m_sort;
	PROPTAG_ARRAY m_columns;
	std::vector<sql_row> m_rows;
	size_t m_cursor = 0;
};

class sql_folder final : public folder_object {
	public:
	sql_folder(sqlite_store *s, uint64_t fid, std::string &&name, std::string &&eid) :
		m_store(s), m_folder_id(fid), m_name(std::move(name)), m_eid(std::move(eid)) {}
	ec_error_t get_properties(const PROPTAG_ARRAY &, TPROPVAL_ARRAY &) override;
	ec_error_t load_content_table(std::unique_ptr<content_table> &) override;

	private:
	sqlite_store *m_store = nullptr;
	uint64_t m_folder_id = 0;
	std::string m_name, m_eid;
};

class sql_message final : public message_object {
	public:
	sql_message(sqlite_store *s, uint64_t mid, std::string &&eid) :
		m_store(s), m_message_id(mid), m_eid(std::move(eid)) {}
	ec_error_t get_properties(const PROPTAG_ARRAY &, TPROPVAL_ARRAY &) override;
	ec_error_t query_attachments(const PROPTAG_ARRAY &, TARRAY_SET &) override;
	ec_error_t read_attachment(uint32_t attach_num, std::string &data) override;
	ec_error_t save_as(const char *path) override;

	private:
	sqlite_store *m_store = nullptr;
	uint64_t m_message_id = 0;
	std::string m_eid;
};

}

sqlite_store::sqlite_store(const char *path, unsigned int recurrence_limit) :
	m_path(znul(path)), m_recur_limit(recurrence_limit)
{}

sqlite_store::~sqlite_store()
{
	std::unique_lock hold(m_lock);
	for (auto &[tid, db] : m_conns)
		sqlite3_close_v2(db);
	m_conns.clear();
}

bool sqlite_store::create(const char *path, bool force)
{
	if (access(path, F_OK) == 0) {
		if (!force) {
			mlog(LV_ERR, "mkstore: %s already exists; use -f to overwrite", path);
			return false;
		}
		if (unlink(path) != 0) {
			mlog(LV_ERR, "mkstore: unlink %s: %s", path, strerror(errno));
			return false;
		}
	}
	sqlite3 *db = nullptr;
	auto ret = sqlite3_open_v2(path, &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
	std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)> dbh(db, sqlite3_close_v2);
	if (ret != SQLITE_OK) {
		mlog(LV_ERR, "mkstore: sqlite3_open %s: %s", path, sqlite3_errstr(ret));
		return false;
	}
	auto xact = gx_sql_begin_trans(db);
	if (!xact)
		return false;
	if (gx_sql_exec(db, tbl_schema) != SQLITE_OK)
		return false;
	auto stm = gx_sql_prep(db, "INSERT INTO folders (parent_id, display_name, entryid) VALUES (?, ?, ?)");
	if (stm == nullptr)
		return false;
	auto top_eid = make_entryid();
	stm.bind_null(1);
	stm.bind_text(2, "Top of Information Store");
	stm.bind_blob(3, top_eid.data(), top_eid.size());
	if (stm.step() != SQLITE_DONE)
		return false;
	auto top_id = sqlite3_last_insert_rowid(db);
	for (auto name : default_folders) {
		auto eid = make_entryid();
		stm.reset();
		stm.bind_int64(1, top_id);
		stm.bind_text(2, name);
		stm.bind_blob(3, eid.data(), eid.size());
		if (stm.step() != SQLITE_DONE)
			return false;
	}
	stm.finalize();
	return xact.commit() == SQLITE_OK;
}

sqlite3 *sqlite_store::db() const
{
	std::unique_lock hold(m_lock);
	auto i = m_conns.find(std::this_thread::get_id());
	return i != m_conns.end() ? i->second : nullptr;
}

ec_error_t sqlite_store::thread_init()
{
	if (db() != nullptr)
		return ecSuccess;
	sqlite3 *conn = nullptr;
	auto ret = sqlite3_open_v2(m_path.c_str(), &conn, SQLITE_OPEN_READWRITE, nullptr);
	if (ret != SQLITE_OK) {
		mlog(LV_ERR, "E-1310: sqlite3_open %s: %s", m_path.c_str(), sqlite3_errstr(ret));
		sqlite3_close_v2(conn);
		return ecRpcFailed;
	}
	sqlite3_busy_timeout(conn, 60000);
	gx_sql_exec(conn, "PRAGMA foreign_keys=ON");
	std::unique_lock hold(m_lock);
	m_conns.emplace(std::this_thread::get_id(), conn);
	return ecSuccess;
}

void sqlite_store::thread_fini()
{
	std::unique_lock hold(m_lock);
	auto i = m_conns.find(std::this_thread::get_id());
	if (i == m_conns.end())
		return;
	sqlite3_close_v2(i->second);
	m_conns.erase(i);
}

ec_error_t sqlite_store::get_named_propids(bool create,
    const std::vector<PROPERTY_NAME> &names, std::vector<uint16_t> &ids)
{
	auto db = this->db();
	if (db == nullptr)
		return ecRpcFailed;
	ids.clear();
	auto sel = gx_sql_prep(db, "SELECT propid FROM named_properties WHERE name_string=?");
	if (sel == nullptr)
		return ecError;
	xstmt ins;
	for (const auto &n : names) {
		auto key = namedprop_key(n);
		sel.reset();
		sel.bind_text(1, key);
		if (sel.step() == SQLITE_ROW) {
			ids.push_back(sel.col_uint64(0));
			continue;
		}
		if (!create) {
			ids.push_back(0);
			continue;
		}
		if (ins == nullptr) {
			ins = gx_sql_prep(db, "INSERT INTO named_properties (propid, name_string) "
			      "SELECT MAX(IFNULL(MAX(propid)+1, 0), ?), ? FROM named_properties");
			if (ins == nullptr)
				return ecError;
		}
		ins.reset();
		ins.bind_int64(1, NAMEDPROP_FIRST);
		ins.bind_text(2, key);
		if (ins.step() != SQLITE_DONE)
			return ecError;
		auto id = sqlite3_last_insert_rowid(db);
		if (id > NAMEDPROP_LAST) {
			mlog(LV_ERR, "E-1311: named property space exhausted");
			return ecTooComplex;
		}
		ids.push_back(id);
	}
	return ecSuccess;
}

ec_error_t sqlite_store::open_folder(const char *name, std::unique_ptr<folder_object> &out)
{
	auto db = this->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT folder_id, display_name, entryid FROM folders "
	           "WHERE display_name=? ORDER BY folder_id LIMIT 1");
	if (stm == nullptr)
		return ecError;
	stm.bind_text(1, znul(name));
	if (stm.step() != SQLITE_ROW)
		return ecNotFound;
	out = std::make_unique<sql_folder>(this, stm.col_uint64(0),
	      std::string(znul(stm.col_text(1))), stm.col_blob(2));
	return ecSuccess;
}

ec_error_t sqlite_store::open_message(const std::string &eid, std::unique_ptr<message_object> &out)
{
	auto db = this->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT message_id FROM messages WHERE entryid=?");
	if (stm == nullptr)
		return ecError;
	stm.bind_blob(1, eid.data(), eid.size());
	if (stm.step() != SQLITE_ROW)
		return ecNotFound;
	out = std::make_unique<sql_message>(this, stm.col_uint64(0), std::string(eid));
	return ecSuccess;
}

ec_error_t sqlite_store::list_folders(TARRAY_SET &rows)
{
	auto db = this->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT f.folder_id, f.parent_id, f.display_name, f.entryid, "
	           "(SELECT COUNT(*) FROM messages m WHERE m.folder_id=f.folder_id) "
	           "FROM folders f ORDER BY f.folder_id");
	if (stm == nullptr)
		return ecError;
	struct node {
		uint64_t parent = 0;
		std::string name, eid;
		uint32_t count = 0;
	};
	std::map<uint64_t, node> nodes;
	std::multimap<uint64_t, uint64_t> children;
	while (stm.step() == SQLITE_ROW) {
		auto fid = stm.col_uint64(0);
		node n;
		n.parent = stm.col_type(1) == SQLITE_NULL ? 0 : stm.col_uint64(1);
		n.name = znul(stm.col_text(2));
		n.eid = stm.col_blob(3);
		n.count = stm.col_uint64(4);
		children.emplace(n.parent, fid);
		nodes.emplace(fid, std::move(n));
	}
	rows.clear();
	std::vector<std::pair<uint64_t, uint32_t>> stack;
	auto push_children = [&](uint64_t parent, uint32_t depth) {
		auto range = children.equal_range(parent);
		std::vector<uint64_t> ids;
		for (auto i = range.first; i != range.second; ++i)
			ids.push_back(i->second);
		/* reverse so that the lowest id is visited first */
		for (auto i = ids.rbegin(); i != ids.rend(); ++i)
			stack.emplace_back(*i, depth);
	};
	push_children(0, 0);
	while (!stack.empty()) {
		auto [fid, depth] = stack.back();
		stack.pop_back();
		const auto &n = nodes[fid];
		TPROPVAL_ARRAY row;
		row.set(PR_DISPLAY_NAME, n.name);
		row.set(PR_ENTRYID, BINARY{n.eid});
		if (n.parent != 0)
			row.set(PR_PARENT_ENTRYID, BINARY{nodes[n.parent].eid});
		row.set(PR_CONTENT_COUNT, n.count);
		row.set(PR_DEPTH, depth);
		rows.push_back(std::move(row));
		push_children(fid, depth + 1);
	}
	return ecSuccess;
}

ec_error_t sqlite_store::insert_message(const char *folder,
    const TPROPVAL_ARRAY &props, const std::string &mime,
    const std::vector<attachment_content> &atx, const recurrence_rule *recur,
    std::string &eid)
{
	auto db = this->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT folder_id FROM folders WHERE display_name=? "
	           "ORDER BY folder_id LIMIT 1");
	if (stm == nullptr)
		return ecError;
	stm.bind_text(1, znul(folder));
	if (stm.step() != SQLITE_ROW)
		return ecNotFound;
	auto fid = stm.col_uint64(0);
	stm.finalize();

	auto xact = gx_sql_begin_trans(db);
	if (!xact)
		return ecError;
	eid = make_entryid();
	stm = gx_sql_prep(db, "INSERT INTO messages (folder_id, entryid, mime) VALUES (?, ?, ?)");
	if (stm == nullptr)
		return ecError;
	stm.bind_int64(1, fid);
	stm.bind_blob(2, eid.data(), eid.size());
	if (mime.empty())
		stm.bind_null(3);
	else
		stm.bind_blob(3, mime.data(), mime.size());
	if (stm.step() != SQLITE_DONE)
		return ecError;
	auto mid = sqlite3_last_insert_rowid(db);

	stm = gx_sql_prep(db, "INSERT INTO message_properties (message_id, proptag, propval) VALUES (?, ?, ?)");
	if (stm == nullptr)
		return ecError;
	for (const auto &pv : props.ppropval) {
		if (pv.proptag == PR_ENTRYID ||
		    std::holds_alternative<std::monostate>(pv.value))
			continue;
		stm.reset();
		stm.bind_int64(1, mid);
		stm.bind_int64(2, pv.proptag);
		sql_bind_propval(stm, 3, pv);
		if (stm.step() != SQLITE_DONE)
			return ecError;
	}

	auto ins_atx = gx_sql_prep(db, "INSERT INTO attachments (message_id, data) VALUES (?, ?)");
	auto ins_aprop = gx_sql_prep(db, "INSERT INTO attachment_properties (attachment_id, proptag, propval) VALUES (?, ?, ?)");
	if (ins_atx == nullptr || ins_aprop == nullptr)
		return ecError;
	for (const auto &at : atx) {
		ins_atx.reset();
		ins_atx.bind_int64(1, mid);
		ins_atx.bind_blob(2, at.data.data(), at.data.size());
		if (ins_atx.step() != SQLITE_DONE)
			return ecError;
		auto aid = sqlite3_last_insert_rowid(db);
		for (const auto &pv : at.props.ppropval) {
			ins_aprop.reset();
			ins_aprop.bind_int64(1, aid);
			ins_aprop.bind_int64(2, pv.proptag);
			sql_bind_propval(ins_aprop, 3, pv);
			if (ins_aprop.step() != SQLITE_DONE)
				return ecError;
		}
	}

	if (recur != nullptr) {
		stm = gx_sql_prep(db, "INSERT INTO recurrences (message_id, pattern, interval, occurrences, end_time) VALUES (?, ?, ?, ?, ?)");
		if (stm == nullptr)
			return ecError;
		stm.bind_int64(1, mid);
		stm.bind_int64(2, recur->pattern);
		stm.bind_int64(3, recur->interval);
		stm.bind_int64(4, recur->occurrences);
		stm.bind_int64(5, recur->end_time);
		if (stm.step() != SQLITE_DONE)
			return ecError;
	}
	stm.finalize();
	ins_atx.finalize();
	ins_aprop.finalize();
	return xact.commit() == SQLITE_OK ? ecSuccess : ecError;
}

ec_error_t sql_folder::get_properties(const PROPTAG_ARRAY &tags, TPROPVAL_ARRAY &out)
{
	auto db = m_store->db();
	if (db == nullptr)
		return ecRpcFailed;
	out.ppropval.clear();
	for (auto tag : tags) {
		switch (tag) {
		case PR_DISPLAY_NAME:
			out.set(tag, m_name);
			break;
		case PR_ENTRYID:
			out.set(tag, BINARY{m_eid});
			break;
		case PR_CONTENT_COUNT: {
			auto stm = gx_sql_prep(db, "SELECT COUNT(*) FROM messages WHERE folder_id=?");
			if (stm == nullptr)
				return ecError;
			stm.bind_int64(1, m_folder_id);
			if (stm.step() != SQLITE_ROW)
				return ecError;
			out.set(tag, static_cast<uint32_t>(stm.col_uint64(0)));
			break;
		}
		default:
			break;
		}
	}
	return ecSuccess;
}

ec_error_t sql_folder::load_content_table(std::unique_ptr<content_table> &out)
{
	if (m_store->db() == nullptr)
		return ecRpcFailed;
	out = std::make_unique<sql_table>(m_store, m_folder_id);
	return ecSuccess;
}

ec_error_t sql_table::restrict(const RESTRICTION &res)
{
	m_res.push_back(res);
	m_loaded = false;
	return ecSuccess;
}

ec_error_t sql_table::include_recurrences(bool b)
{
	m_expand = b;
	m_expand_from = m_res.size();
	m_loaded = false;
	return ecSuccess;
}

ec_error_t sql_table::sort(const SORTORDER_SET &so)
{
	m_sort = so;
	m_loaded = false;
	return ecSuccess;
}

ec_error_t sql_table::set_columns(const PROPTAG_ARRAY &tags)
{
	m_columns = tags;
	return ecSuccess;
}

/**
 * Replace recurring masters in @rows by their occurrences. Generation
 * starts at the first occurrence that can still end at or after the
 * lower bound on the end property, and stops at the series end, the
 * occurrence count, the upper bound on the start property, or the
 * recurrence limit, whichever comes first.
 */
ec_error_t sql_table::expand(sqlite3 *db, std::vector<sql_row> &rows)
{
	std::vector<uint16_t> ids;
	auto ret = m_store->get_named_propids(false, {
		{MNID_ID, PSETID_Appointment, PidLidAppointmentStartWhole},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentEndWhole},
		{MNID_ID, PSETID_Appointment, PidLidRecurring},
	}, ids);
	if (ret != ecSuccess)
		return ret;
	if (ids.size() != 3 || ids[0] == 0 || ids[1] == 0)
		return ecSuccess;
	auto tag_start = PROP_TAG(PT_SYSTIME, ids[0]);
	auto tag_end   = PROP_TAG(PT_SYSTIME, ids[1]);
	auto tag_recur = ids[2] != 0 ? PROP_TAG(PT_BOOLEAN, ids[2]) : 0;

	uint64_t upper = UINT64_MAX, lower = 0;
	for (size_t i = m_expand_from; i < m_res.size(); ++i) {
		uint64_t b;
		if (restriction_upper_bound(m_res[i], tag_start, b))
			upper = std::min(upper, b);
		if (restriction_lower_bound(m_res[i], {tag_end, tag_start}, b))
			lower = std::max(lower, b);
	}

	auto stm = gx_sql_prep(db, "SELECT pattern, interval, occurrences, end_time "
	           "FROM recurrences WHERE message_id=?");
	if (stm == nullptr)
		return ecError;
	std::vector<sql_row> out;
	for (auto &row : rows) {
		stm.reset();
		stm.bind_int64(1, row.message_id);
		auto start = row.props.get<uint64_t>(tag_start);
		if (stm.step() != SQLITE_ROW || start == nullptr) {
			out.push_back(std::move(row));
			continue;
		}
		auto pattern  = stm.col_uint64(0);
		uint64_t ival = std::max<uint64_t>(stm.col_uint64(1), 1);
		auto count    = stm.col_uint64(2);
		auto end_time = stm.col_uint64(3);
		uint64_t period = ival * 86400 * NT_PER_SECOND;
		if (pattern == RECUR_WEEKLY)
			period *= 7;
		else if (pattern != RECUR_DAILY) {
			mlog(LV_DEBUG, "sqlite_store: message %llu: unsupported recurrence pattern %llu",
			        static_cast<unsigned long long>(row.message_id),
			        static_cast<unsigned long long>(pattern));
			out.push_back(std::move(row));
			continue;
		}
		auto end = row.props.get<uint64_t>(tag_end);
		uint64_t duration = end != nullptr && *end > *start ? *end - *start : 0;
		uint64_t k = 0;
		if (lower > *start + duration)
			k = (lower - *start - duration + period - 1) / period;
		for (unsigned int made = 0; ; ++k, ++made) {
			if (count != 0 && k >= count)
				break;
			uint64_t ostart = *start + k * period;
			if (end_time != 0 && ostart > end_time)
				break;
			if (ostart > upper)
				break;
			if (made >= m_store->recurrence_limit()) {
				mlog(LV_NOTICE, "sqlite_store: message %llu: recurrence expansion capped at %u occurrences",
				        static_cast<unsigned long long>(row.message_id),
				        m_store->recurrence_limit());
				break;
			}
			sql_row occ;
			occ.message_id = row.message_id;
			occ.props = row.props;
			occ.props.set(tag_start, ostart);
			if (end != nullptr)
				occ.props.set(tag_end, ostart + duration);
			if (tag_recur != 0)
				occ.props.set(tag_recur, static_cast<uint8_t>(1));
			out.push_back(std::move(occ));
		}
	}
	rows = std::move(out);
	return ecSuccess;
}

ec_error_t sql_table::load()
{
	if (m_loaded)
		return ecSuccess;
	auto db = m_store->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT m.message_id, m.entryid, p.proptag, p.propval "
	           "FROM messages AS m LEFT JOIN message_properties AS p "
	           "ON m.message_id=p.message_id WHERE m.folder_id=? ORDER BY m.message_id");
	if (stm == nullptr)
		return ecError;
	stm.bind_int64(1, m_folder_id);
	std::vector<sql_row> rows;
	int ret;
	while ((ret = stm.step()) == SQLITE_ROW) {
		auto mid = stm.col_uint64(0);
		if (rows.empty() || rows.back().message_id != mid) {
			rows.emplace_back();
			rows.back().message_id = mid;
			rows.back().props.set(PR_ENTRYID, BINARY{stm.col_blob(1)});
		}
		if (stm.col_type(2) == SQLITE_NULL)
			continue;
		uint32_t tag = stm.col_uint64(2);
		rows.back().props.ppropval.emplace_back(tag, sql_column_to_propval(tag, stm, 3));
	}
	if (ret != SQLITE_DONE)
		return ecRpcFailed;
	stm.finalize();
	if (m_expand) {
		auto err = expand(db, rows);
		if (err != ecSuccess)
			return err;
	}
	rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const sql_row &r) {
		return !std::all_of(m_res.begin(), m_res.end(),
		       [&](const RESTRICTION &res) { return res.eval(r.props); });
	}), rows.end());
	if (!m_sort.empty()) {
		static const propval_t none;
		std::stable_sort(rows.begin(), rows.end(), [&](const sql_row &a, const sql_row &b) {
			for (const auto &so : m_sort) {
				auto va = a.props.find(so.proptag);
				auto vb = b.props.find(so.proptag);
				auto c = propval_compare(va != nullptr ? va->value : none,
				         vb != nullptr ? vb->value : none);
				if (c != 0)
					return so.table_sort == TABLE_SORT_DESCEND ? c > 0 : c < 0;
			}
			return false;
		});
	}
	m_rows = std::move(rows);
	m_cursor = 0;
	m_loaded = true;
	return ecSuccess;
}

ec_error_t sql_table::query_rows(uint32_t max, TARRAY_SET &out)
{
	out.clear();
	auto ret = load();
	if (ret != ecSuccess)
		return ret;
	for (; m_cursor < m_rows.size() && out.size() < max; ++m_cursor) {
		const auto &src = m_rows[m_cursor].props;
		TPROPVAL_ARRAY row;
		for (auto tag : m_columns) {
			auto v = src.find(tag);
			if (v != nullptr)
				row.ppropval.push_back(*v);
		}
		out.push_back(std::move(row));
	}
	return ecSuccess;
}

ec_error_t sql_table::get_row_count(uint32_t &count)
{
	auto ret = load();
	if (ret != ecSuccess)
		return ret;
	count = m_rows.size();
	return ecSuccess;
}

ec_error_t sql_message::get_properties(const PROPTAG_ARRAY &tags, TPROPVAL_ARRAY &out)
{
	auto db = m_store->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT proptag, propval FROM message_properties WHERE message_id=?");
	if (stm == nullptr)
		return ecError;
	stm.bind_int64(1, m_message_id);
	TPROPVAL_ARRAY all;
	all.set(PR_ENTRYID, BINARY{m_eid});
	int ret;
	while ((ret = stm.step()) == SQLITE_ROW) {
		uint32_t tag = stm.col_uint64(0);
		all.ppropval.emplace_back(tag, sql_column_to_propval(tag, stm, 1));
	}
	if (ret != SQLITE_DONE)
		return ecRpcFailed;
	out.ppropval.clear();
	for (auto tag : tags) {
		auto v = all.find(tag);
		if (v != nullptr)
			out.ppropval.push_back(*v);
	}
	return ecSuccess;
}

ec_error_t sql_message::query_attachments(const PROPTAG_ARRAY &tags, TARRAY_SET &out)
{
	auto db = m_store->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT attachment_id, LENGTH(data) FROM attachments "
	           "WHERE message_id=? ORDER BY attachment_id");
	auto pstm = gx_sql_prep(db, "SELECT proptag, propval FROM attachment_properties WHERE attachment_id=?");
	if (stm == nullptr || pstm == nullptr)
		return ecError;
	stm.bind_int64(1, m_message_id);
	out.clear();
	uint32_t num = 0;
	while (stm.step() == SQLITE_ROW) {
		TPROPVAL_ARRAY all;
		all.set(PR_ATTACH_NUM, num++);
		all.set(PR_ATTACH_SIZE, static_cast<uint32_t>(stm.col_uint64(1)));
		pstm.reset();
		pstm.bind_int64(1, stm.col_uint64(0));
		while (pstm.step() == SQLITE_ROW) {
			uint32_t tag = pstm.col_uint64(0);
			all.set(tag, sql_column_to_propval(tag, pstm, 1));
		}
		TPROPVAL_ARRAY row;
		row.set(PR_ATTACH_NUM, num - 1);
		for (auto tag : tags) {
			auto v = all.find(tag);
			if (v != nullptr && tag != PR_ATTACH_NUM)
				row.ppropval.push_back(*v);
		}
		out.push_back(std::move(row));
	}
	return ecSuccess;
}

ec_error_t sql_message::read_attachment(uint32_t num, std::string &data)
{
	auto db = m_store->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT data FROM attachments WHERE message_id=? "
	           "ORDER BY attachment_id LIMIT 1 OFFSET ?");
	if (stm == nullptr)
		return ecError;
	stm.bind_int64(1, m_message_id);
	stm.bind_int64(2, num);
	if (stm.step() != SQLITE_ROW)
		return ecNotFound;
	data = stm.col_blob(0);
	return ecSuccess;
}

ec_error_t sql_message::save_as(const char *path)
{
	auto db = m_store->db();
	if (db == nullptr)
		return ecRpcFailed;
	auto stm = gx_sql_prep(db, "SELECT mime FROM messages WHERE message_id=?");
	if (stm == nullptr)
		return ecError;
	stm.bind_int64(1, m_message_id);
	if (stm.step() != SQLITE_ROW || stm.col_type(0) == SQLITE_NULL)
		return ecNotFound;
	auto mime = stm.col_blob(0);
	if (mime.empty())
		return ecNotFound;
	auto err = write_file_by_name(path, mime);
	if (err != 0) {
		mlog(LV_ERR, "E-1312: write %s: %s", path, strerror(err));
		return ecError;
	}
	return ecSuccess;
}

}
