// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <vector>
#include <unistd.h>
#include <mailbridge/dedup.hpp>
#include "fakestore.hpp"
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace mailbridge;

static constexpr char reply_body[] =
	"Sounds good.\n"
	"\n"
	"On Sun, Dec 31, 2023 at 9:00 AM Alice wrote:\n"
	"> What about the budget?\n";

static constexpr char reply_mime[] =
	"From: Bob <bob@example.com>\n"
	"To: Alice <alice@example.com>\n"
	"Subject: Re: Budget\n"
	"Message-ID: <r1@example.com>\n"
	"In-Reply-To: <p1@example.com>\n"
	"Date: Mon, 01 Jan 2024 10:00:00 +0000\n"
	"MIME-Version: 1.0\n"
	"Content-Type: text/plain; charset=utf-8\n"
	"\n"
	"Sounds good.\n"
	"\n"
	"On Sun, Dec 31, 2023 at 9:00 AM Alice wrote:\n"
	"> What about the budget?\n";

namespace {

struct recording_locator final : public parent_locator {
	bool by_message_id(const std::string &id) override
	{
		calls.push_back("id:" + id);
		return id == known_id;
	}
	bool by_subject(const std::string &s, const std::string &self_id) override
	{
		calls.push_back("subject:" + s);
		last_self = self_id;
		return s == known_subject;
	}
	std::string known_id, known_subject, last_self;
	std::vector<std::string> calls;
};

}

static int t_tiers()
{
	recording_locator loc;
	loc.known_id = "p1@example.com";
	auto r = evaluate_tier(dedup_tier::none, {"<p1@example.com>", "Re: Budget"}, loc, reply_body);
	assert(r.body == reply_body);
	assert(!r.latest_reply.has_value());
	assert(!r.parent_found.has_value());
	assert(loc.calls.empty());

	r = evaluate_tier(dedup_tier::low, {"<p1@example.com>", "Re: Budget"}, loc, reply_body);
	assert(r.parent_found == true);
	assert(r.latest_reply == std::string("Sounds good."));
	assert(r.body == "Sounds good.");
	assert(loc.calls.size() == 1 && loc.calls[0] == "id:p1@example.com");

	/* parent absent: body kept, reply still reported */
	loc.calls.clear();
	loc.known_id.clear();
	loc.known_subject = "Budget";
	r = evaluate_tier(dedup_tier::low, {"<p1@example.com>", "Re: Budget"}, loc, reply_body);
	assert(r.parent_found == false);
	assert(r.body == reply_body);
	assert(r.latest_reply == std::string("Sounds good."));
	assert(loc.calls.size() == 1);

	/* medium falls back to the subject */
	loc.calls.clear();
	r = evaluate_tier(dedup_tier::medium, {"<p1@example.com>", "RE: Fwd: Budget"}, loc, reply_body);
	assert(r.parent_found == true);
	assert(r.body == "Sounds good.");
	assert(loc.calls.size() == 2 && loc.calls[1] == "subject:Budget");
	assert(loc.last_self.empty());
	r = evaluate_tier(dedup_tier::medium, {"", "Budget", "<r9@example.com>"}, loc, reply_body);
	assert(loc.last_self == "r9@example.com");

	/* no In-Reply-To at all */
	loc.calls.clear();
	r = evaluate_tier(dedup_tier::low, {"", "Re: Budget"}, loc, reply_body);
	assert(r.parent_found == false);
	assert(loc.calls.empty());

	/* nothing but quotes: no latest reply, body kept even with a parent */
	loc.known_subject = "Budget";
	r = evaluate_tier(dedup_tier::high, {"", "Budget"}, loc, "> only quoted\n> text\n");
	assert(r.parent_found == true);
	assert(!r.latest_reply.has_value());
	assert(r.body == "> only quoted\n> text\n");
	return EXIT_SUCCESS;
}

static void setup(fake::store &st)
{
	auto &inbox = st.add_folder("Inbox");
	auto parent = fake::mail("p1", "Budget", 1704013200);
	parent.props.set(PR_INTERNET_MESSAGE_ID, std::string("<p1@example.com>"));
	inbox.items.push_back(std::move(parent));

	auto r1 = fake::mail("r1", "Re: Budget", 1704103200);
	r1.mime = reply_mime;
	inbox.items.push_back(std::move(r1));

	auto r2 = fake::mail("r2", "Re: Budget", 1704103200);
	r2.props.set(PR_SENDER_NAME, std::string("Bob"));
	r2.props.set(PR_SENDER_EMAIL_ADDRESS, std::string("bob@example.com"));
	r2.props.set(PR_DISPLAY_TO, std::string("Alice; Carol"));
	r2.props.set(PR_BODY, std::string(reply_body));
	r2.props.set(PR_IN_REPLY_TO_ID, std::string("<p1@example.com>"));
	r2.props.set(PR_INTERNET_MESSAGE_ID, std::string("<r2@example.com>"));
	r2.props.set(PR_TRANSPORT_MESSAGE_HEADERS, std::string(
		"Subject: Re: Budget\r\nX-Long: first\r\n second\r\n\r\n"));
	r2.attachments.emplace_back("plan.txt", "step one");
	inbox.items.push_back(std::move(r2));

	auto r3 = fake::mail("r3", "Re: Unknown thread", 1704103200);
	r3.props.set(PR_BODY, std::string(reply_body));
	r3.props.set(PR_IN_REPLY_TO_ID, std::string("<missing@example.com>"));
	inbox.items.push_back(std::move(r3));

	auto h = fake::mail("h1", "Newsletter", 1704103200);
	h.props.set(PR_HTML, BINARY{"<html><body><p>Hello <b>there</b></p></body></html>"});
	inbox.items.push_back(std::move(h));
}

static int t_fallback()
{
	char dir[] = "/tmp/mbdedupXXXXXX";
	assert(mkdtemp(dir) != nullptr);
	fake::store st;
	setup(st);
	parse_options opts;
	opts.tmpdir = dir;

	auto pm = parse_message(st, opts, bin2hex("r2"), dedup_tier::low, true);
	assert(pm.has_value());
	assert(pm->entry_id == bin2hex("r2"));
	assert(pm->subject == "Re: Budget");
	assert(pm->from.size() == 1 && pm->from[0].second == "bob@example.com");
	assert(pm->to.size() == 2 && pm->to[1].first == "Carol");
	assert(pm->in_reply_to == "<p1@example.com>");
	assert(pm->parent_found == true);
	assert(pm->body == "Sounds good.");
	assert(pm->deduplication_tier == dedup_tier::low);
	assert(pm->headers.size() == 2);
	assert(pm->headers[1].first == "X-Long" && pm->headers[1].second == "first second");
	assert(pm->attachments.size() == 1 && pm->attachments[0].filename == "plan.txt");
	assert(pm->attachments[0].size == 8);
	assert(pm->date.has_value());

	/* the scratch file is gone and nothing else was left behind */
	assert(!st.last_export.empty());
	assert(access(st.last_export.c_str(), F_OK) != 0 && errno == ENOENT);
	assert(rmdir(dir) == 0);
	return EXIT_SUCCESS;
}

static int t_primary()
{
	char dir[] = "/tmp/mbdedupXXXXXX";
	assert(mkdtemp(dir) != nullptr);
	fake::store st;
	setup(st);
	parse_options opts;
	opts.tmpdir = dir;

	auto pm = parse_message(st, opts, bin2hex("r1"), dedup_tier::medium, true);
	assert(pm.has_value());
	assert(pm->subject == "Re: Budget");
	assert(pm->from.size() == 1);
	assert(pm->from[0].first == "Bob" && pm->from[0].second == "bob@example.com");
	assert(pm->message_id == "<r1@example.com>");
	assert(pm->parent_found == true);
	assert(pm->latest_reply == std::string("Sounds good."));
	assert(pm->body == "Sounds good.");
	assert(pm->text_html.empty());

	pm = parse_message(st, opts, bin2hex("r1"), dedup_tier::none, true);
	assert(pm.has_value());
	assert(!pm->parent_found.has_value());
	assert(pm->body.find("What about the budget?") != pm->body.npos);
	assert(rmdir(dir) == 0);
	return EXIT_SUCCESS;
}

static int t_absent_parent()
{
	fake::store st;
	setup(st);
	parse_options opts;
	auto pm = parse_message(st, opts, bin2hex("r3"), dedup_tier::medium, true);
	assert(pm.has_value());
	assert(pm->parent_found == false);
	assert(pm->latest_reply == std::string("Sounds good."));
	assert(pm->body == reply_body);
	return EXIT_SUCCESS;
}

static int t_html()
{
	fake::store st;
	setup(st);
	parse_options opts;
	auto pm = parse_message(st, opts, bin2hex("h1"), dedup_tier::none, true);
	assert(pm.has_value());
	assert(pm->text_html.empty());
	assert(pm->body.find('<') == pm->body.npos);
	assert(pm->body.find("Hello there") != pm->body.npos);

	pm = parse_message(st, opts, bin2hex("h1"), dedup_tier::none, false);
	assert(pm.has_value());
	assert(pm->text_html.size() == 1);
	assert(pm->body.empty());

	parsed_message m;
	m.body = "<div>Plain <i>enough</i></div>";
	normalize_html_body(m, true);
	assert(m.body.find("Plain enough") != m.body.npos);
	m.body = "x < y and y > z";
	normalize_html_body(m, true);
	assert(m.body == "x < y and y > z");
	return EXIT_SUCCESS;
}

static const char nodate_mime[] =
	"From: Bob <bob@example.com>\n"
	"Subject: Undated\n"
	"MIME-Version: 1.0\n"
	"Content-Type: text/plain\n"
	"\n"
	"no date here\n";

static int t_unreadable()
{
	fake::store st;
	setup(st);
	auto bad = fake::mail("bad", "Re: Budget", 1704103200);
	bad.props.set(PR_IN_REPLY_TO_ID, std::string("<p1@example.com>"));
	bad.props_result = ecRpcFailed;
	st.folders.front().items.push_back(std::move(bad));
	parse_options opts;
	auto pm = parse_message(st, opts, bin2hex("bad"), dedup_tier::medium, true);
	assert(pm.has_value());
	assert(pm->entry_id == bin2hex("bad"));
	assert(pm->body.empty() && pm->subject.empty());
	assert(pm->from.empty() && pm->to.empty() && pm->attachments.empty());
	assert(pm->headers.empty() && !pm->date.has_value());
	assert(pm->deduplication_tier == dedup_tier::medium);
	assert(pm->parent_found == false);
	assert(!pm->latest_reply.has_value());
	return EXIT_SUCCESS;
}

static int t_self_subject()
{
	fake::store st;
	auto &inbox = st.add_folder("Inbox");
	auto m = fake::mail("solo", "Budget", 1704103200);
	m.props.set(PR_BODY, std::string(reply_body));
	m.props.set(PR_INTERNET_MESSAGE_ID, std::string("<solo@example.com>"));
	inbox.items.push_back(std::move(m));
	parse_options opts;
	/* the only message with that subject is the message itself */
	auto pm = parse_message(st, opts, bin2hex("solo"), dedup_tier::medium, true);
	assert(pm.has_value());
	assert(pm->parent_found == false);
	assert(pm->body == reply_body);

	auto other = fake::mail("other", "Budget", 1704013200);
	other.props.set(PR_INTERNET_MESSAGE_ID, std::string("<other@example.com>"));
	inbox.items.push_back(std::move(other));
	pm = parse_message(st, opts, bin2hex("solo"), dedup_tier::medium, true);
	assert(pm.has_value());
	assert(pm->parent_found == true);
	assert(pm->body == "Sounds good.");
	return EXIT_SUCCESS;
}

static int t_delivery_date()
{
	char dir[] = "/tmp/mbdedupXXXXXX";
	assert(mkdtemp(dir) != nullptr);
	fake::store st;
	auto &inbox = st.add_folder("Inbox");
	auto m = fake::mail("nd", "Undated", 1704103200);
	m.mime = nodate_mime;
	inbox.items.push_back(std::move(m));
	parse_options opts;
	opts.tmpdir = dir;
	auto pm = parse_message(st, opts, bin2hex("nd"), dedup_tier::none, true);
	assert(pm.has_value());
	assert(pm->subject == "Undated");
	assert(pm->date == std::string("2024-01-01T10:00:00+00:00"));
	assert(rmdir(dir) == 0);
	return EXIT_SUCCESS;
}

static int t_notfound()
{
	fake::store st;
	setup(st);
	parse_options opts;
	assert(!parse_message(st, opts, bin2hex("nope"), dedup_tier::low, true).has_value());
	assert(!parse_message(st, opts, "", dedup_tier::low, true).has_value());

	dedup_tier t;
	assert(dedup_tier_parse("Medium", t) && t == dedup_tier::medium);
	assert(!dedup_tier_parse("extreme", t));
	assert(strcmp(dedup_tier_name(dedup_tier::high), "high") == 0);
	return EXIT_SUCCESS;
}

int main()
{
	setenv("TZ", "UTC", 1);
	tzset();
	using fpt = decltype(&t_tiers);
	fpt fct[] = {t_tiers, t_fallback, t_primary, t_absent_parent, t_html,
		t_unreadable, t_self_subject, t_delivery_date, t_notfound};
	for (auto f : fct)
		if (f() != EXIT_SUCCESS)
			return EXIT_FAILURE;
	return EXIT_SUCCESS;
}
