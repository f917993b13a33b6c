// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>
#include <strings.h>
#include <libHX/io.h>
#include <sys/stat.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/calendar.hpp>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/thread_scope.hpp>
#include <mailbridge/util.hpp>

using namespace std::string_literals;

namespace mailbridge {

const cfg_directive mailbridge_cfg_defaults[] = {
	{"calendar_days", "7", CFG_SIZE, "1", "3660"},
	{"calendar_folder", "Calendar"},
	{"inbox_folder", "Inbox"},
	{"json_indent", "2", CFG_SIZE, "0", "8"},
	{"list_batch_size", "50", CFG_SIZE, "1", "50"},
	{"list_default_limit", "10", CFG_SIZE},
	{"log_file", "-"},
	{"log_level", "4" /* LV_NOTICE */},
	{"recurrence_limit", "1000", CFG_SIZE, "1"},
	{"search_default_limit", "100", CFG_SIZE},
	{"sqlite_debug", "0"},
	{"store_path", "/var/lib/mailbridge/store.sqlite3"},
	{"tasks_folder", "Tasks"},
	{"tmpdir", "/tmp"},
	{"warmup_attempts", "5", CFG_SIZE, "1"},
	{"warmup_interval", "500ms", CFG_TIME_NS},
	{"worker_threads", "4", CFG_SIZE, "1", "64"},
	CFG_TABLE_END,
};

bridge_config::bridge_config(const config_file &cfg) :
	batch_size(cfg.get_ll("list_batch_size")),
	list_limit(cfg.get_ll("list_default_limit")),
	search_limit(cfg.get_ll("search_default_limit")),
	calendar_days(cfg.get_ll("calendar_days")),
	inbox(znul(cfg.get_value("inbox_folder"))),
	calendar(znul(cfg.get_value("calendar_folder"))),
	tasks(znul(cfg.get_value("tasks_folder"))),
	tmpdir(znul(cfg.get_value("tmpdir"))),
	warmup_attempts(cfg.get_ll("warmup_attempts")),
	warmup_interval(cfg.get_ll("warmup_interval"))
{}

bool search_restriction(const search_criteria &c, RESTRICTION &res)
{
	static constexpr uint32_t fuzzy = FL_SUBSTRING | FL_IGNORECASE;
	std::vector<RESTRICTION> terms;
	if (c.subject.has_value())
		terms.push_back(RESTRICTION::make_content(fuzzy, PR_SUBJECT, std::string(*c.subject)));
	if (c.body.has_value())
		terms.push_back(RESTRICTION::make_content(fuzzy, PR_BODY, std::string(*c.body)));
	if (c.sender.has_value())
		terms.push_back(RESTRICTION::make_or({
			RESTRICTION::make_content(fuzzy, PR_SENDER_NAME, std::string(*c.sender)),
			RESTRICTION::make_content(fuzzy, PR_SENDER_EMAIL_ADDRESS, std::string(*c.sender)),
		}));
	if (c.unread.has_value())
		terms.push_back(RESTRICTION::make_bitmask(*c.unread ? BMR_EQZ : BMR_NEZ,
		                PR_MESSAGE_FLAGS, MSGFLAG_READ));
	if (c.has_attachments.has_value())
		terms.push_back(RESTRICTION::make_prop(RELOP_EQ, PR_HASATTACH,
		                static_cast<uint8_t>(*c.has_attachments)));
	if (terms.empty())
		return false;
	res = terms.size() == 1 ? std::move(terms[0]) : RESTRICTION::make_and(std::move(terms));
	return true;
}

/*
 * Column layout of task rows:
 * entryid, subject, body, due date, status, importance, complete, percent
 */
enum {
	TC_DUE = 3, TC_STATUS, TC_IMPORTANCE, TC_COMPLETE, TC_PERCENT, TC_MAX,
};

bool task_from_row(const TPROPVAL_ARRAY &row, const PROPTAG_ARRAY &tags,
    task_item &task)
{
	if (tags.size() < TC_MAX)
		return false;
	for (auto tag : tags) {
		if (!row.fault(tag))
			continue;
		mlog(LV_DEBUG, "tasks: skipping item, column %xh: %s", tag,
		        mapi_strerror(row.error_of(tag)));
		return false;
	}
	task.entry_id = eid_encode(row);
	if (task.entry_id.empty())
		return false;
	auto subj = row.get<std::string>(PR_SUBJECT);
	task.subject = subj != nullptr ? *subj : "(No Subject)";
	task.body = row.get_or<std::string>(PR_BODY, "");
	auto due = row.get<uint64_t>(tags[TC_DUE]);
	if (due != nullptr)
		task.due_date = localtime_str(rop_util_nttime_to_unix(*due), "%Y-%m-%d");
	else
		task.due_date.reset();
	auto st = row.get<uint32_t>(tags[TC_STATUS]);
	if (st != nullptr)
		task.status = *st;
	else
		task.status.reset();
	auto imp = row.get<uint32_t>(tags[TC_IMPORTANCE]);
	if (imp != nullptr)
		task.priority = *imp;
	else
		task.priority.reset();
	task.complete = row.get_or<uint8_t>(tags[TC_COMPLETE], 0) != 0;
	task.percent_complete = row.get_or<double>(tags[TC_PERCENT], 0);
	return true;
}

bridge::bridge(std::shared_ptr<store_client> s, const bridge_config &c) :
	m_store(std::move(s)), m_cfg(c)
{}

ec_error_t bridge::attach()
{
	return store_thread_acquire(m_store);
}

ec_error_t bridge::warmup()
{
	ec_error_t ret = ecError;
	for (unsigned int i = 1; i <= m_cfg.warmup_attempts; ++i) {
		if (i > 1)
			std::this_thread::sleep_for(m_cfg.warmup_interval);
		ret = attach();
		std::unique_ptr<folder_object> folder;
		if (ret == ecSuccess)
			ret = m_store->open_folder(m_cfg.inbox.c_str(), folder);
		std::unique_ptr<content_table> table;
		if (ret == ecSuccess)
			ret = folder->load_content_table(table);
		uint32_t count = 0;
		if (ret == ecSuccess)
			ret = table->get_row_count(count);
		if (ret == ecSuccess) {
			mlog(LV_INFO, "warmup: %s holds %u items", m_cfg.inbox.c_str(), count);
			return ecSuccess;
		}
		mlog(LV_WARN, "warmup: attempt %u/%u: %s", i, m_cfg.warmup_attempts,
		        mapi_strerror(ret));
	}
	mlog(LV_ERR, "E-1420: store not reachable after %u attempts", m_cfg.warmup_attempts);
	return ret;
}

std::unique_ptr<folder_object> bridge::open_folder(const char *name,
    bool inbox_fallback)
{
	std::unique_ptr<folder_object> folder;
	if (attach() != ecSuccess)
		return nullptr;
	if (name == nullptr || *name == '\0')
		name = m_cfg.inbox.c_str();
	auto ret = m_store->open_folder(name, folder);
	if (ret == ecSuccess)
		return folder;
	if (ret == ecNotFound && inbox_fallback &&
	    strcasecmp(name, m_cfg.inbox.c_str()) != 0) {
		mlog(LV_WARN, "Folder \"%s\" not found, using %s", name, m_cfg.inbox.c_str());
		ret = m_store->open_folder(m_cfg.inbox.c_str(), folder);
		if (ret == ecSuccess)
			return folder;
	}
	mlog(LV_ERR, "open_folder %s: %s", name, mapi_strerror(ret));
	return nullptr;
}

std::unique_ptr<message_object> bridge::open_message(const std::string &id)
{
	std::string eid;
	if (!eid_decode(id, eid) || attach() != ecSuccess)
		return nullptr;
	std::unique_ptr<message_object> msg;
	auto ret = m_store->open_message(eid, msg);
	if (ret == ecNotFound)
		return nullptr;
	if (ret != ecSuccess) {
		mlog(LV_ERR, "open_message %s: %s", id.c_str(), mapi_strerror(ret));
		return nullptr;
	}
	return msg;
}

std::vector<message_summary> bridge::list_emails(const char *name, int limit)
{
	auto folder = open_folder(name, true);
	if (folder == nullptr)
		return {};
	return list_messages(*folder, limit, m_cfg.batch_size);
}

std::vector<message_summary> bridge::search_emails(const search_criteria &crit,
    const char *name, int limit)
{
	auto folder = open_folder(name, true);
	if (folder == nullptr)
		return {};
	RESTRICTION res;
	if (!search_restriction(crit, res))
		return list_messages(*folder, limit, m_cfg.batch_size);
	mlog(LV_DEBUG, "search: %s", res.repr().c_str());
	return list_messages(*folder, limit, m_cfg.batch_size, &res);
}

std::optional<message_detail> bridge::get_email(const std::string &id) try
{
	auto msg = open_message(id);
	if (msg == nullptr)
		return std::nullopt;
	auto tags = summary_columns();
	tags.push_back(PR_BODY);
	tags.push_back(PR_HTML);
	TPROPVAL_ARRAY props;
	auto ret = msg->get_properties(tags, props);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "get_email %s: %s", id.c_str(), mapi_strerror(ret));
		return std::nullopt;
	}
	message_detail d;
	if (!summary_from_row(props, d))
		return std::nullopt;
	d.body = props.get_or<std::string>(PR_BODY, "");
	auto html = props.get<BINARY>(PR_HTML);
	if (html != nullptr)
		d.html_body = html->pv;
	return d;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1421: ENOMEM");
	return std::nullopt;
}

std::optional<parsed_message> bridge::get_email_parsed(const std::string &id,
    dedup_tier tier, bool strip_html)
{
	if (attach() != ecSuccess)
		return std::nullopt;
	parse_options opts;
	opts.tmpdir = m_cfg.tmpdir;
	opts.inbox  = m_cfg.inbox;
	return parse_message(*m_store, opts, id, tier, strip_html);
}

std::vector<calendar_event> bridge::list_calendar(int days, bool all)
{
	auto now = time(nullptr);
	if (days < 0)
		days = 0;
	return list_calendar(now, now + static_cast<time_t>(days) * 86400, all);
}

std::vector<calendar_event> bridge::list_calendar(time_t start, time_t end, bool all)
{
	auto folder = open_folder(m_cfg.calendar.c_str(), false);
	if (folder == nullptr)
		return {};
	return mailbridge::list_calendar(*m_store, *folder, start, end, all,
	       m_cfg.batch_size);
}

std::optional<appointment_detail> bridge::get_appointment(const std::string &id) try
{
	auto msg = open_message(id);
	if (msg == nullptr)
		return std::nullopt;
	calendar_tags ctags;
	auto ret = ctags.resolve(*m_store);
	if (ret != ecSuccess || !ctags.ok()) {
		mlog(LV_ERR, "get_appointment: cannot resolve appointment properties: %s",
		        mapi_strerror(ret != ecSuccess ? ret : ecNotFound));
		return std::nullopt;
	}
	auto tags = ctags.columns();
	tags.push_back(PR_BODY);
	TPROPVAL_ARRAY props;
	ret = msg->get_properties(tags, props);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "get_appointment %s: %s", id.c_str(), mapi_strerror(ret));
		return std::nullopt;
	}
	appointment_detail a;
	if (!event_from_row(ctags, props, a))
		return std::nullopt;
	a.body = props.get_or<std::string>(PR_BODY, "");
	return a;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1422: ENOMEM");
	return std::nullopt;
}

ec_error_t bridge::task_columns(PROPTAG_ARRAY &tags)
{
	static const std::vector<PROPERTY_NAME> propname_buff = {
		{MNID_ID, PSETID_Task, PidLidTaskDueDate},
		{MNID_ID, PSETID_Task, PidLidTaskStatus},
		{MNID_ID, PSETID_Task, PidLidTaskComplete},
		{MNID_ID, PSETID_Task, PidLidPercentComplete},
	};
	std::vector<uint16_t> ids;
	auto ret = m_store->get_named_propids(false, propname_buff, ids);
	if (ret != ecSuccess)
		return ret;
	if (ids.size() != propname_buff.size())
		return ecError;
	tags = {PR_ENTRYID, PR_SUBJECT, PR_BODY,
	       PROP_TAG(PT_SYSTIME, ids[0]), PROP_TAG(PT_LONG, ids[1]),
	       PR_IMPORTANCE, PROP_TAG(PT_BOOLEAN, ids[2]),
	       PROP_TAG(PT_DOUBLE, ids[3])};
	return ecSuccess;
}

std::vector<task_item> bridge::list_tasks(bool include_completed) try
{
	std::vector<task_item> out;
	auto folder = open_folder(m_cfg.tasks.c_str(), false);
	if (folder == nullptr)
		return out;
	PROPTAG_ARRAY tags;
	auto ret = task_columns(tags);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "tasks: cannot resolve task properties: %s", mapi_strerror(ret));
		return out;
	}
	std::unique_ptr<content_table> table;
	ret = folder->load_content_table(table);
	if (ret == ecSuccess && !include_completed)
		/* items without the flag count as incomplete */
		ret = table->restrict(RESTRICTION::make_not(RESTRICTION::make_prop(RELOP_EQ,
		      tags[TC_COMPLETE], static_cast<uint8_t>(1))));
	if (ret == ecSuccess)
		ret = table->set_columns(tags);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "tasks: table setup: %s", mapi_strerror(ret));
		return out;
	}
	for (;;) {
		TARRAY_SET rows;
		ret = table->query_rows(m_cfg.batch_size, rows);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "tasks: query_rows: %s", mapi_strerror(ret));
			break;
		}
		if (rows.empty())
			break;
		for (const auto &row : rows) {
			task_item t;
			if (!task_from_row(row, tags, t))
				continue;
			if (!include_completed && t.complete)
				continue;
			out.push_back(std::move(t));
		}
	}
	return out;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1423: ENOMEM");
	return {};
}

std::optional<task_item> bridge::get_task(const std::string &id) try
{
	auto msg = open_message(id);
	if (msg == nullptr)
		return std::nullopt;
	PROPTAG_ARRAY tags;
	auto ret = task_columns(tags);
	TPROPVAL_ARRAY props;
	if (ret == ecSuccess)
		ret = msg->get_properties(tags, props);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "get_task %s: %s", id.c_str(), mapi_strerror(ret));
		return std::nullopt;
	}
	task_item t;
	if (!task_from_row(props, tags, t))
		return std::nullopt;
	return t;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1424: ENOMEM");
	return std::nullopt;
}

std::vector<folder_info> bridge::list_folders() try
{
	std::vector<folder_info> out;
	if (attach() != ecSuccess)
		return out;
	TARRAY_SET rows;
	auto ret = m_store->list_folders(rows);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "list_folders: %s", mapi_strerror(ret));
		return out;
	}
	/* rows come parent-first, so every parent is known before its children */
	std::unordered_map<std::string, size_t> by_eid;
	for (const auto &row : rows) {
		if (row.fault(PR_DISPLAY_NAME) || row.fault(PR_ENTRYID))
			continue;
		folder_info fi;
		fi.entry_id = eid_encode(row);
		if (fi.entry_id.empty())
			continue;
		fi.name = row.get_or<std::string>(PR_DISPLAY_NAME, "");
		fi.number_of_items = row.get_or<uint32_t>(PR_CONTENT_COUNT, 0);
		fi.depth = row.get_or<uint32_t>(PR_DEPTH, 0);
		std::string parent_path;
		if (row.has(PR_PARENT_ENTRYID)) {
			fi.parent_id = eid_encode(row, PR_PARENT_ENTRYID);
			auto p = by_eid.find(*fi.parent_id);
			if (p != by_eid.end()) {
				fi.parent_name = out[p->second].name;
				parent_path = out[p->second].path;
			}
		}
		fi.path = (parent_path.empty() ? "\\"s : parent_path) + "\\" + fi.name;
		by_eid.emplace(fi.entry_id, out.size());
		out.push_back(std::move(fi));
	}
	return out;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1425: ENOMEM");
	return {};
}

std::optional<std::vector<std::string>>
bridge::extract_attachments(const std::string &id, const char *dir) try
{
	auto msg = open_message(id);
	if (msg == nullptr)
		return std::nullopt;
	std::vector<std::string> written;
	TARRAY_SET atx;
	auto ret = msg->query_attachments({PR_ATTACH_LONG_FILENAME}, atx);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "attachments %s: %s", id.c_str(), mapi_strerror(ret));
		return written;
	}
	if (atx.empty())
		return written;
	auto mret = HX_mkdir(dir, S_IRWXU | S_IRWXG | S_IRWXO);
	if (mret < 0) {
		mlog(LV_ERR, "E-1426: mkdir %s: %s", dir, strerror(-mret));
		return written;
	}
	unsigned int index = 0;
	for (const auto &row : atx) {
		++index;
		auto num = row.get<uint32_t>(PR_ATTACH_NUM);
		if (num == nullptr)
			continue;
		auto name = safe_basename(row.get_or<std::string>(PR_ATTACH_LONG_FILENAME, ""), index);
		std::string data;
		ret = msg->read_attachment(*num, data);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "attachments %s #%u: %s", id.c_str(), index, mapi_strerror(ret));
			continue;
		}
		auto path = dir + "/"s + name;
		auto err = write_file_by_name(path.c_str(), data);
		if (err != 0) {
			mlog(LV_ERR, "E-1427: write %s: %s", path.c_str(), strerror(err));
			continue;
		}
		written.push_back(std::move(path));
	}
	return written;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1428: ENOMEM");
	return std::nullopt;
}

}
