#pragma once
/*
 * In-memory store_client for the unit tests. Records the sequence of
 * table operations, counts round-trips, and emulates recurrence
 * expansion the way a real store does: an endless series is only
 * expanded up to the bound placed on the start time by restrictions
 * added after include_recurrences().
 */
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <mailbridge/mapidefs.h>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/store.hpp>
#include <mailbridge/util.hpp>

namespace fake {

using namespace mailbridge;

struct item {
	TPROPVAL_ARRAY props;
	/* RFC 5322 text for save_as; empty means export fails with ecNotFound */
	std::string mime;
	/* daily recurrence with no end, expanded from the start/end props */
	bool endless_daily = false;
	/* returned by the message's get_properties */
	ec_error_t props_result = ecSuccess;
	std::vector<std::pair<std::string, std::string>> attachments;
};

struct folder {
	std::string name;
	std::vector<item> items;
};

class store;

class table final : public content_table {
	public:
	table(store &s, folder &f) : m_store(s), m_folder(f) {}
	ec_error_t restrict(const RESTRICTION &) override;
	ec_error_t include_recurrences(bool) override;
	ec_error_t sort(const SORTORDER_SET &) override;
	ec_error_t set_columns(const PROPTAG_ARRAY &) override;
	ec_error_t query_rows(uint32_t, TARRAY_SET &) override;
	ec_error_t get_row_count(uint32_t &) override;

	private:
	ec_error_t load();
	ec_error_t expand(const item &, std::vector<TPROPVAL_ARRAY> &);

	store &m_store;
	folder &m_folder;
	std::vector<RESTRICTION> m_res;
	size_t m_expand_from = 0;
	bool m_expand = false, m_loaded = false;
	SORTORDER_SET m_sort;
	PROPTAG_ARRAY m_cols;
	std::vector<TPROPVAL_ARRAY> m_rows;
	size_t m_cursor = 0;
};

class fake_folder final : public folder_object {
	public:
	fake_folder(store &s, folder &f) : m_store(s), m_folder(f) {}
	ec_error_t get_properties(const PROPTAG_ARRAY &tags, TPROPVAL_ARRAY &out) override
	{
		out = {};
		for (auto t : tags)
			if (t == PR_DISPLAY_NAME)
				out.set(t, m_folder.name);
		return ecSuccess;
	}
	ec_error_t load_content_table(std::unique_ptr<content_table> &t) override
	{
		t = std::make_unique<table>(m_store, m_folder);
		return ecSuccess;
	}

	private:
	store &m_store;
	folder &m_folder;
};

class message final : public message_object {
	public:
	message(store &s, const item &i) : m_store(s), m_item(i) {}
	ec_error_t get_properties(const PROPTAG_ARRAY &, TPROPVAL_ARRAY &) override;
	ec_error_t query_attachments(const PROPTAG_ARRAY &, TARRAY_SET &) override;
	ec_error_t read_attachment(uint32_t, std::string &) override;
	ec_error_t save_as(const char *) override;

	private:
	store &m_store;
	const item &m_item;
};

class store final : public store_client {
	public:
	ec_error_t thread_init() override
	{
		++inits;
		return init_result;
	}
	void thread_fini() override { ++finis; }

	ec_error_t get_named_propids(bool create,
	    const std::vector<PROPERTY_NAME> &names, std::vector<uint16_t> &ids) override
	{
		std::lock_guard hold(m_lock);
		ids.clear();
		for (const auto &n : names) {
			auto key = n.guid + ":" + std::to_string(n.lid) + ":" + n.name;
			auto i = m_names.find(key);
			if (i != m_names.end()) {
				ids.push_back(i->second);
			} else if (create) {
				uint16_t id = 0x8000 + m_names.size();
				m_names.emplace(key, id);
				ids.push_back(id);
			} else {
				ids.push_back(0);
			}
		}
		return ecSuccess;
	}

	ec_error_t open_folder(const char *name, std::unique_ptr<folder_object> &f) override
	{
		log(std::string("open_folder:") + name);
		for (auto &fld : folders)
			if (str_icase_equal(fld.name, name)) {
				f = std::make_unique<fake_folder>(*this, fld);
				return ecSuccess;
			}
		return ecNotFound;
	}

	ec_error_t open_message(const std::string &eid, std::unique_ptr<message_object> &m) override
	{
		for (const auto &fld : folders)
			for (const auto &it : fld.items) {
				auto v = it.props.get<BINARY>(PR_ENTRYID);
				if (v != nullptr && v->pv == eid) {
					m = std::make_unique<message>(*this, it);
					return ecSuccess;
				}
			}
		return ecNotFound;
	}

	ec_error_t list_folders(TARRAY_SET &out) override
	{
		out.clear();
		TPROPVAL_ARRAY top;
		top.set(PR_DISPLAY_NAME, std::string("Top of Information Store"));
		top.set(PR_ENTRYID, BINARY{"fld-top"});
		top.set(PR_CONTENT_COUNT, uint32_t(0));
		top.set(PR_DEPTH, uint32_t(0));
		out.push_back(std::move(top));
		for (const auto &fld : folders) {
			TPROPVAL_ARRAY row;
			row.set(PR_DISPLAY_NAME, std::string(fld.name));
			row.set(PR_ENTRYID, BINARY{"fld-" + fld.name});
			row.set(PR_PARENT_ENTRYID, BINARY{"fld-top"});
			row.set(PR_CONTENT_COUNT, static_cast<uint32_t>(fld.items.size()));
			row.set(PR_DEPTH, uint32_t(1));
			out.push_back(std::move(row));
		}
		return ecSuccess;
	}

	folder &add_folder(const std::string &name)
	{
		folders.push_back({name, {}});
		return folders.back();
	}

	/* Tag of a named property, registering it if needed */
	uint32_t named_tag(uint16_t type, uint32_t lid, const char *guid = PSETID_Appointment)
	{
		std::vector<uint16_t> ids;
		get_named_propids(true, {{MNID_ID, guid, lid}}, ids);
		return PROP_TAG(type, ids[0]);
	}

	void log(std::string &&s)
	{
		std::lock_guard hold(m_lock);
		oplog.push_back(std::move(s));
	}

	/* Deque keeps references stable across add_folder calls */
	std::deque<folder> folders;
	std::vector<std::string> oplog;
	unsigned int round_trips = 0;
	/* emulate a store whose filters are broken and admit everything */
	bool ignore_filters = false;
	/* set if an expansion without upper bound was attempted */
	bool bomb = false;
	ec_error_t init_result = ecSuccess;
	std::atomic<unsigned int> inits{0}, finis{0};
	std::string last_export;

	private:
	std::mutex m_lock;
	std::map<std::string, uint16_t> m_names;
};

/* Copy the columns @tags from @src, carrying faults along */
inline TPROPVAL_ARRAY project(const TPROPVAL_ARRAY &src, const PROPTAG_ARRAY &tags)
{
	TPROPVAL_ARRAY out;
	for (auto t : tags) {
		auto v = src.find(t);
		if (v != nullptr) {
			out.set(t, propval_t(v->value));
			continue;
		}
		auto etag = CHANGE_PROP_TYPE(t, PT_ERROR);
		v = src.find(etag);
		if (v != nullptr)
			out.set(etag, propval_t(v->value));
	}
	return out;
}

inline ec_error_t table::restrict(const RESTRICTION &r)
{
	m_store.log("restrict");
	m_res.push_back(r);
	m_loaded = false;
	return ecSuccess;
}

inline ec_error_t table::include_recurrences(bool b)
{
	m_store.log("include_recurrences");
	m_expand = b;
	m_expand_from = m_res.size();
	m_loaded = false;
	return ecSuccess;
}

inline ec_error_t table::sort(const SORTORDER_SET &s)
{
	m_store.log("sort");
	m_sort = s;
	m_loaded = false;
	return ecSuccess;
}

inline ec_error_t table::set_columns(const PROPTAG_ARRAY &c)
{
	m_store.log("set_columns");
	m_cols = c;
	return ecSuccess;
}

inline ec_error_t table::expand(const item &it, std::vector<TPROPVAL_ARRAY> &rows)
{
	auto start_tag = m_store.named_tag(PT_SYSTIME, PidLidAppointmentStartWhole);
	auto end_tag   = m_store.named_tag(PT_SYSTIME, PidLidAppointmentEndWhole);
	bool bounded = false;
	uint64_t upper = 0, lower = 0;
	for (size_t i = m_expand_from; i < m_res.size(); ++i) {
		uint64_t b = 0;
		if (restriction_upper_bound(m_res[i], start_tag, b)) {
			upper = bounded ? std::min(upper, b) : b;
			bounded = true;
		}
		if (restriction_lower_bound(m_res[i], {end_tag, start_tag}, b))
			lower = std::max(lower, b);
	}
	if (!bounded) {
		m_store.bomb = true;
		return ecTooComplex;
	}
	auto s = it.props.get<uint64_t>(start_tag);
	auto e = it.props.get<uint64_t>(end_tag);
	if (s == nullptr || e == nullptr)
		return ecSuccess;
	static constexpr uint64_t day = 86400ULL * 10000000ULL;
	uint64_t dur = *e - *s, occ = *s;
	if (lower > occ + dur)
		occ += (lower - occ - dur) / day * day;
	for (; occ <= upper; occ += day) {
		auto row = it.props;
		row.set(start_tag, uint64_t(occ));
		row.set(end_tag, uint64_t(occ + dur));
		rows.push_back(std::move(row));
	}
	return ecSuccess;
}

inline ec_error_t table::load()
{
	m_rows.clear();
	m_cursor = 0;
	for (const auto &it : m_folder.items) {
		if (m_expand && it.endless_daily) {
			auto ret = expand(it, m_rows);
			if (ret != ecSuccess)
				return ret;
			continue;
		}
		m_rows.push_back(it.props);
	}
	if (!m_store.ignore_filters)
		for (const auto &r : m_res)
			m_rows.erase(std::remove_if(m_rows.begin(), m_rows.end(),
				[&](const TPROPVAL_ARRAY &row) { return !r.eval(row); }),
				m_rows.end());
	std::stable_sort(m_rows.begin(), m_rows.end(),
		[&](const TPROPVAL_ARRAY &a, const TPROPVAL_ARRAY &b) {
			for (const auto &so : m_sort) {
				auto va = a.find(so.proptag), vb = b.find(so.proptag);
				int c = propval_compare(va != nullptr ? va->value : propval_t{},
				        vb != nullptr ? vb->value : propval_t{});
				if (c != 0)
					return so.table_sort == TABLE_SORT_DESCEND ? c > 0 : c < 0;
			}
			return false;
		});
	m_loaded = true;
	return ecSuccess;
}

inline ec_error_t table::query_rows(uint32_t max, TARRAY_SET &out)
{
	m_store.log("query_rows:" + std::to_string(max));
	++m_store.round_trips;
	out.clear();
	if (!m_loaded) {
		auto ret = load();
		if (ret != ecSuccess)
			return ret;
	}
	for (; m_cursor < m_rows.size() && out.size() < max; ++m_cursor)
		out.push_back(project(m_rows[m_cursor], m_cols));
	return ecSuccess;
}

inline ec_error_t table::get_row_count(uint32_t &n)
{
	m_store.log("get_row_count");
	if (!m_loaded) {
		auto ret = load();
		if (ret != ecSuccess)
			return ret;
	}
	n = m_rows.size();
	return ecSuccess;
}

inline ec_error_t message::get_properties(const PROPTAG_ARRAY &tags, TPROPVAL_ARRAY &out)
{
	if (m_item.props_result != ecSuccess)
		return m_item.props_result;
	out = project(m_item.props, tags);
	return ecSuccess;
}

inline ec_error_t message::query_attachments(const PROPTAG_ARRAY &tags, TARRAY_SET &out)
{
	out.clear();
	uint32_t num = 0;
	for (const auto &a : m_item.attachments) {
		TPROPVAL_ARRAY full, row;
		full.set(PR_ATTACH_LONG_FILENAME, std::string(a.first));
		full.set(PR_ATTACH_SIZE, static_cast<uint32_t>(a.second.size()));
		row = project(full, tags);
		row.set(PR_ATTACH_NUM, uint32_t(num++));
		out.push_back(std::move(row));
	}
	return ecSuccess;
}

inline ec_error_t message::read_attachment(uint32_t num, std::string &data)
{
	if (num >= m_item.attachments.size())
		return ecNotFound;
	data = m_item.attachments[num].second;
	return ecSuccess;
}

inline ec_error_t message::save_as(const char *path)
{
	m_store.last_export = path;
	if (m_item.mime.empty())
		return ecNotFound;
	return write_file_by_name(path, m_item.mime) == 0 ? ecSuccess : ecError;
}

/* Convenience builders */

inline BINARY eid(const std::string &s) { return BINARY{s}; }

inline item mail(const std::string &id, const std::string &subject,
    time_t delivered, uint32_t flags = MSGFLAG_READ)
{
	item it;
	it.props.set(PR_ENTRYID, eid(id));
	it.props.set(PR_MESSAGE_CLASS, std::string("IPM.Note"));
	it.props.set(PR_SUBJECT, std::string(subject));
	it.props.set(PR_SENDER_NAME, std::string("Alice Example"));
	it.props.set(PR_SENDER_EMAIL_ADDRESS, std::string("alice@example.com"));
	it.props.set(PR_MESSAGE_DELIVERY_TIME, rop_util_unix_to_nttime(delivered));
	it.props.set(PR_MESSAGE_FLAGS, uint32_t(flags));
	it.props.set(PR_HASATTACH, uint8_t(0));
	return it;
}

inline item appointment(store &s, const std::string &id, const std::string &subject,
    time_t start, time_t end)
{
	item it;
	it.props.set(PR_ENTRYID, eid(id));
	it.props.set(PR_MESSAGE_CLASS, std::string("IPM.Appointment"));
	it.props.set(PR_SUBJECT, std::string(subject));
	it.props.set(s.named_tag(PT_SYSTIME, PidLidAppointmentStartWhole), rop_util_unix_to_nttime(start));
	it.props.set(s.named_tag(PT_SYSTIME, PidLidAppointmentEndWhole), rop_util_unix_to_nttime(end));
	return it;
}

}
