// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <istream>
#include <optional>
#include <streambuf>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <json/reader.h>
#include <json/value.h>
#include <json/writer.h>
#include <mailbridge/json.hpp>

namespace mailbridge {

namespace {

struct iomembuf : public std::streambuf {
	iomembuf(const char *p, size_t z) {
		auto q = const_cast<char *>(p);
		setg(q, q, q + z);
	}
};

struct imemstream : public virtual iomembuf, public std::istream {
	imemstream(const char *p, size_t z) :
		iomembuf(p, z),
		std::istream(static_cast<std::streambuf *>(this))
	{}
};

}

bool json_from_str(std::string_view sv, Json::Value &jv)
{
	imemstream strm(sv.data(), sv.size());
	return Json::parseFromStream(Json::CharReaderBuilder(),
	       strm, &jv, nullptr);
}

std::string json_to_str(const Json::Value &jv, unsigned int indent)
{
	Json::StreamWriterBuilder swb;
	swb["indentation"] = std::string(indent, ' ');
	swb["emitUTF8"] = true;
	return Json::writeString(swb, jv);
}

static Json::Value opt_str(const std::optional<std::string> &s)
{
	return s.has_value() ? Json::Value(*s) : Json::Value(Json::nullValue);
}

static Json::Value addr_list(const std::vector<address_pair> &v)
{
	Json::Value a(Json::arrayValue);
	for (const auto &[name, addr] : v) {
		Json::Value p(Json::arrayValue);
		p.append(name);
		p.append(addr);
		a.append(std::move(p));
	}
	return a;
}

static Json::Value str_list(const std::vector<std::string> &v)
{
	Json::Value a(Json::arrayValue);
	for (const auto &s : v)
		a.append(s);
	return a;
}

Json::Value to_json(const std::string &s)
{
	return Json::Value(s);
}

Json::Value to_json(const message_summary &m)
{
	Json::Value j(Json::objectValue);
	j["entry_id"]        = m.entry_id;
	j["subject"]         = m.subject;
	j["sender"]          = m.sender;
	j["sender_name"]     = m.sender_name;
	j["received_time"]   = opt_str(m.received_time);
	j["unread"]          = m.unread;
	j["has_attachments"] = m.has_attachments;
	return j;
}

Json::Value to_json(const message_detail &m)
{
	auto j = to_json(static_cast<const message_summary &>(m));
	j["body"]      = m.body;
	j["html_body"] = m.html_body;
	return j;
}

Json::Value to_json(const calendar_event &e)
{
	Json::Value j(Json::objectValue);
	j["entry_id"]           = e.entry_id;
	j["subject"]            = e.subject;
	j["start"]              = e.start;
	j["end"]                = opt_str(e.end);
	j["location"]           = e.location;
	j["organizer"]          = opt_str(e.organizer);
	j["all_day"]            = e.all_day;
	j["required_attendees"] = e.required_attendees;
	j["optional_attendees"] = e.optional_attendees;
	j["response_status"]    = e.response_status;
	j["meeting_status"]     = e.meeting_status;
	j["response_requested"] = e.response_requested;
	return j;
}

Json::Value to_json(const appointment_detail &a)
{
	auto j = to_json(static_cast<const calendar_event &>(a));
	j["body"] = a.body;
	return j;
}

Json::Value to_json(const task_item &t)
{
	Json::Value j(Json::objectValue);
	j["entry_id"] = t.entry_id;
	j["subject"]  = t.subject;
	j["body"]     = t.body;
	j["due_date"] = opt_str(t.due_date);
	j["status"]   = t.status.has_value() ? Json::Value(*t.status) : Json::Value(Json::nullValue);
	j["priority"] = t.priority.has_value() ? Json::Value(*t.priority) : Json::Value(Json::nullValue);
	j["complete"] = t.complete;
	j["percent_complete"] = t.percent_complete;
	return j;
}

Json::Value to_json(const folder_info &f)
{
	Json::Value j(Json::objectValue);
	j["name"]            = f.name;
	j["entry_id"]        = f.entry_id;
	j["parent_name"]     = opt_str(f.parent_name);
	j["parent_id"]       = opt_str(f.parent_id);
	j["number_of_items"] = f.number_of_items;
	j["path"]            = f.path;
	j["depth"]           = f.depth;
	return j;
}

Json::Value to_json(const parsed_message &m)
{
	Json::Value j(Json::objectValue);
	j["entry_id"]   = m.entry_id;
	j["subject"]    = m.subject;
	j["from"]       = addr_list(m.from);
	j["to"]         = addr_list(m.to);
	j["cc"]         = addr_list(m.cc);
	j["bcc"]        = addr_list(m.bcc);
	j["date"]       = opt_str(m.date);
	j["message_id"] = m.message_id;
	auto &hdr = j["headers"] = Json::Value(Json::objectValue);
	for (const auto &[k, v] : m.headers)
		hdr[k] = v;
	j["text_plain"] = str_list(m.text_plain);
	j["text_html"]  = str_list(m.text_html);
	j["body"]       = m.body;
	auto &atx = j["attachments"] = Json::Value(Json::arrayValue);
	for (const auto &a : m.attachments) {
		Json::Value e(Json::objectValue);
		e["filename"]     = a.filename;
		e["size"]         = Json::Value(static_cast<Json::UInt64>(a.size));
		e["content_id"]   = opt_str(a.content_id);
		e["content_type"] = a.content_type;
		atx.append(std::move(e));
	}
	auto &rcv = j["received"] = Json::Value(Json::arrayValue);
	for (const auto &h : m.received) {
		Json::Value e(Json::objectValue);
		e["from"] = h.from;
		e["by"]   = h.by;
		e["with"] = h.with;
		e["id"]   = h.id;
		e["for"]  = h.for_;
		e["date"] = h.date;
		rcv.append(std::move(e));
	}
	j["latest_reply"] = opt_str(m.latest_reply);
	j["deduplication_tier"] = dedup_tier_name(m.deduplication_tier);
	if (m.deduplication_tier != dedup_tier::none && m.parent_found.has_value())
		j["parent_found"] = *m.parent_found;
	return j;
}

}
