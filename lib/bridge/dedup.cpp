// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cerrno>
#include <cstring>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <strings.h>
#include <mailbridge/dedup.hpp>
#include <mailbridge/fileio.h>
#include <mailbridge/html.hpp>
#include <mailbridge/mime_parse.hpp>
#include <mailbridge/reply.hpp>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/util.hpp>

using namespace std::string_literals;

namespace mailbridge {

const char *dedup_tier_name(dedup_tier t)
{
	switch (t) {
	case dedup_tier::low: return "low";
	case dedup_tier::medium: return "medium";
	case dedup_tier::high: return "high";
	default: return "none";
	}
}

bool dedup_tier_parse(const char *s, dedup_tier &t)
{
	if (strcasecmp(s, "none") == 0)
		t = dedup_tier::none;
	else if (strcasecmp(s, "low") == 0)
		t = dedup_tier::low;
	else if (strcasecmp(s, "medium") == 0)
		t = dedup_tier::medium;
	else if (strcasecmp(s, "high") == 0)
		t = dedup_tier::high;
	else
		return false;
	return true;
}

bool folder_parent_locator::exists(const RESTRICTION &res)
{
	std::unique_ptr<folder_object> folder;
	auto ret = m_store.open_folder(m_folder.c_str(), folder);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "dedup: open_folder %s: %s", m_folder.c_str(), mapi_strerror(ret));
		return false;
	}
	std::unique_ptr<content_table> table;
	ret = folder->load_content_table(table);
	if (ret == ecSuccess)
		ret = table->restrict(res);
	uint32_t count = 0;
	if (ret == ecSuccess)
		ret = table->get_row_count(count);
	if (ret != ecSuccess) {
		mlog(LV_ERR, "dedup: parent lookup %s: %s", res.repr().c_str(), mapi_strerror(ret));
		return false;
	}
	return count > 0;
}

/* stored ids keep their angle brackets; accept either form */
static RESTRICTION mid_match(const std::string &id)
{
	return RESTRICTION::make_or({
		RESTRICTION::make_prop(RELOP_EQ, PR_INTERNET_MESSAGE_ID, std::string(id)),
		RESTRICTION::make_prop(RELOP_EQ, PR_INTERNET_MESSAGE_ID, "<" + id + ">"),
	});
}

bool folder_parent_locator::by_message_id(const std::string &id)
{
	return exists(mid_match(id));
}

bool folder_parent_locator::by_subject(const std::string &subject,
    const std::string &self_id)
{
	auto res = RESTRICTION::make_prop(RELOP_EQ, PR_SUBJECT, std::string(subject));
	if (self_id.empty())
		return exists(res);
	return exists(RESTRICTION::make_and({
		std::move(res),
		RESTRICTION::make_not(mid_match(self_id)),
	}));
}

tier_outcome evaluate_tier(dedup_tier tier, const reply_evidence &ev,
    parent_locator &loc, const std::string &body)
{
	tier_outcome r;
	r.body = body;
	if (tier == dedup_tier::none)
		return r;
	r.latest_reply = latest_reply(body);
	bool found = false;
	auto mid = clean_message_id(ev.in_reply_to);
	if (!mid.empty())
		found = loc.by_message_id(mid);
	/* high has no stronger evidence source than medium */
	if (!found && (tier == dedup_tier::medium || tier == dedup_tier::high)) {
		auto subj = normalize_subject(ev.subject);
		if (!subj.empty())
			found = loc.by_subject(subj, clean_message_id(ev.message_id));
	}
	r.parent_found = found;
	if (found && r.latest_reply.has_value())
		r.body = *r.latest_reply;
	return r;
}

primary_attempt primary_parse(message_object &msg, const char *tmpdir)
{
	primary_attempt a;
	tmpfile tf;
	auto fd = tf.open(tmpdir, ".eml");
	if (fd < 0) {
		a.reason = "tmpfile in "s + tmpdir + ": " + strerror(-fd);
		return a;
	}
	auto ret = msg.save_as(tf.path().c_str());
	if (ret != ecSuccess) {
		a.reason = "export: "s + mapi_strerror(ret);
		return a;
	}
	std::string raw;
	auto err = read_file_by_name(tf.path().c_str(), raw);
	if (err != 0) {
		a.reason = "read "s + tf.path() + ": " + strerror(err);
		return a;
	}
	a.ok = mime_parse(raw, a.msg, a.reason);
	return a;
}

static void fb_split_display(const std::string *s, std::vector<address_pair> &out)
{
	out.clear();
	if (s == nullptr)
		return;
	for (const auto &name : gx_split(*s, ';')) {
		auto t = strtrim(name);
		if (!t.empty())
			out.emplace_back(std::string(t), "");
	}
}

/* Unfold an RFC 5322 header block into (name, value) pairs */
static void fb_headers(const std::string &block,
    std::vector<std::pair<std::string, std::string>> &out)
{
	out.clear();
	for (const auto &line : gx_split(block, '\n')) {
		std::string_view l = line;
		if (!l.empty() && l.back() == '\r')
			l.remove_suffix(1);
		if (l.empty())
			break;
		if ((l[0] == ' ' || l[0] == '\t') && !out.empty()) {
			out.back().second += ' ';
			out.back().second += strtrim(l);
			continue;
		}
		auto colon = l.find(':');
		if (colon == l.npos)
			continue;
		out.emplace_back(std::string(strtrim(l.substr(0, colon))),
			std::string(strtrim(l.substr(colon + 1))));
	}
}

static std::string fb_local_iso8601(uint64_t nttime)
{
	auto t = rop_util_nttime_to_unix(nttime);
	struct tm tm{};
	localtime_r(&t, &tm);
	return iso8601_str(t, tm.tm_gmtoff / 60);
}

/* Messages without a Date: header are dated by their delivery */
static void fill_delivery_date(message_object &msg, parsed_message &pm)
{
	TPROPVAL_ARRAY props;
	auto ret = msg.get_properties({PR_MESSAGE_DELIVERY_TIME}, props);
	if (ret != ecSuccess) {
		mlog(LV_NOTICE, "dedup: delivery time unavailable: %s", mapi_strerror(ret));
		return;
	}
	auto dt = props.get<uint64_t>(PR_MESSAGE_DELIVERY_TIME);
	if (dt != nullptr)
		pm.date = fb_local_iso8601(*dt);
}

ec_error_t fallback_parse(message_object &msg, parsed_message &out) try
{
	static const PROPTAG_ARRAY tags = {
		PR_ENTRYID, PR_SUBJECT, PR_SENDER_NAME, PR_SENDER_EMAIL_ADDRESS,
		PR_DISPLAY_TO, PR_DISPLAY_CC, PR_DISPLAY_BCC, PR_BODY, PR_HTML,
		PR_MESSAGE_DELIVERY_TIME, PR_TRANSPORT_MESSAGE_HEADERS,
		PR_INTERNET_MESSAGE_ID, PR_IN_REPLY_TO_ID,
	};
	TPROPVAL_ARRAY props;
	auto ret = msg.get_properties(tags, props);
	if (ret != ecSuccess)
		return ret;
	out.subject = props.get_or<std::string>(PR_SUBJECT, "");
	out.from.clear();
	out.from.emplace_back(props.get_or<std::string>(PR_SENDER_NAME, ""),
		props.get_or<std::string>(PR_SENDER_EMAIL_ADDRESS, ""));
	fb_split_display(props.get<std::string>(PR_DISPLAY_TO), out.to);
	fb_split_display(props.get<std::string>(PR_DISPLAY_CC), out.cc);
	fb_split_display(props.get<std::string>(PR_DISPLAY_BCC), out.bcc);
	out.text_plain = {props.get_or<std::string>(PR_BODY, "")};
	out.text_html.clear();
	auto html = props.get<BINARY>(PR_HTML);
	if (html != nullptr)
		out.text_html.push_back(html->pv);
	auto dt = props.get<uint64_t>(PR_MESSAGE_DELIVERY_TIME);
	if (dt != nullptr)
		out.date = fb_local_iso8601(*dt);
	else
		out.date.reset();
	auto hdrs = props.get<std::string>(PR_TRANSPORT_MESSAGE_HEADERS);
	if (hdrs != nullptr)
		fb_headers(*hdrs, out.headers);
	else
		out.headers.clear();
	out.message_id  = props.get_or<std::string>(PR_INTERNET_MESSAGE_ID, "");
	out.in_reply_to = props.get_or<std::string>(PR_IN_REPLY_TO_ID, "");
	out.received.clear();

	out.attachments.clear();
	TARRAY_SET atx;
	ret = msg.query_attachments({PR_ATTACH_LONG_FILENAME, PR_ATTACH_SIZE,
	      PR_ATTACH_CONTENT_ID, PR_ATTACH_MIME_TAG}, atx);
	if (ret != ecSuccess) {
		mlog(LV_NOTICE, "dedup: attachment table unavailable: %s", mapi_strerror(ret));
		return ecSuccess;
	}
	for (const auto &row : atx) {
		attachment_info ai;
		ai.filename = row.get_or<std::string>(PR_ATTACH_LONG_FILENAME, "");
		ai.size = row.get_or<uint32_t>(PR_ATTACH_SIZE, 0);
		ai.content_type = row.get_or<std::string>(PR_ATTACH_MIME_TAG, "");
		auto cid = row.get<std::string>(PR_ATTACH_CONTENT_ID);
		if (cid != nullptr)
			ai.content_id = *cid;
		out.attachments.push_back(std::move(ai));
	}
	return ecSuccess;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1403: ENOMEM");
	return ecServerOOM;
}

void normalize_html_body(parsed_message &pm, bool strip_html)
{
	if (!strip_html)
		return;
	bool html_body = looks_like_html(pm.body);
	if (html_body || (pm.body.empty() && !pm.text_html.empty())) {
		std::string plain;
		if (html_to_plain(html_body ? pm.body : pm.text_html[0], plain) == 0 &&
		    !plain.empty())
			pm.body = std::move(plain);
	}
	pm.text_html.clear();
}

std::optional<parsed_message> parse_message(store_client &store,
    const parse_options &opts, const std::string &entry_id, dedup_tier tier,
    bool strip_html) try
{
	std::string eid;
	if (!eid_decode(entry_id, eid))
		return std::nullopt;
	std::unique_ptr<message_object> msg;
	auto ret = store.open_message(eid, msg);
	if (ret == ecNotFound)
		return std::nullopt;
	if (ret != ecSuccess) {
		mlog(LV_ERR, "dedup: open_message %s: %s", entry_id.c_str(), mapi_strerror(ret));
		return std::nullopt;
	}

	parsed_message pm;
	auto attempt = primary_parse(*msg, opts.tmpdir.c_str());
	if (attempt.ok) {
		pm = std::move(attempt.msg);
		if (!pm.date.has_value())
			fill_delivery_date(*msg, pm);
	} else {
		mlog(LV_NOTICE, "dedup: %s: rich parse unavailable (%s), using store properties",
		        entry_id.c_str(), attempt.reason.c_str());
		ret = fallback_parse(*msg, pm);
		if (ret != ecSuccess) {
			mlog(LV_ERR, "dedup: %s: fallback: %s; returning an empty record",
			        entry_id.c_str(), mapi_strerror(ret));
			pm = parsed_message{};
		}
	}
	pm.entry_id = bin2hex(eid);
	pm.body = pm.text_plain.empty() ? std::string() : pm.text_plain[0];

	folder_parent_locator loc(store, opts.inbox.c_str());
	auto outcome = evaluate_tier(tier, {pm.in_reply_to, pm.subject, pm.message_id},
	               loc, pm.body);
	pm.body = std::move(outcome.body);
	pm.latest_reply = std::move(outcome.latest_reply);
	pm.parent_found = outcome.parent_found;
	pm.deduplication_tier = tier;
	normalize_html_body(pm, strip_html);
	return pm;
} catch (const std::bad_alloc &) {
	mlog(LV_ERR, "E-1404: ENOMEM");
	return std::nullopt;
}

}
