// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <string>
#include <mailbridge/bridge.hpp>
#include <mailbridge/listing.hpp>
#include "fakestore.hpp"
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace mailbridge;

static constexpr time_t base_time = 1700000000;

static void fill(fake::folder &f, unsigned int n)
{
	char id[32], subj[32];
	for (unsigned int i = 0; i < n; ++i) {
		snprintf(id, sizeof(id), "msg-%04u", i);
		snprintf(subj, sizeof(subj), "Message %u", i);
		f.items.push_back(fake::mail(id, subj, base_time + 60 * i));
	}
}

static int t_cap()
{
	fake::store st;
	fill(st.add_folder("Inbox"), 120);
	std::unique_ptr<folder_object> f;
	assert(st.open_folder("inbox", f) == ecSuccess);
	auto v = list_messages(*f, 10, 50);
	assert(v.size() == 10);
	/* one fetch of exactly 10 rows; nothing beyond the cap */
	assert(st.round_trips == 1);
	assert(st.oplog.back() == "query_rows:10");

	st.round_trips = 0;
	v = list_messages(*f, 120, 50);
	assert(v.size() == 120);
	assert(st.round_trips == 3);

	st.round_trips = 0;
	v = list_messages(*f, 500, 50);
	assert(v.size() == 120);
	assert(st.round_trips == 4);

	st.round_trips = 0;
	v = list_messages(*f, 0, 50);
	assert(v.empty());
	v = list_messages(*f, -3, 50);
	assert(v.empty());
	assert(st.round_trips == 0);

	/* batch size is clamped */
	st.round_trips = 0;
	v = list_messages(*f, 120, 1000);
	assert(v.size() == 120);
	assert(st.round_trips == 3);
	return EXIT_SUCCESS;
}

static int t_order()
{
	fake::store st;
	fill(st.add_folder("Inbox"), 30);
	std::unique_ptr<folder_object> f;
	assert(st.open_folder("Inbox", f) == ecSuccess);
	auto v = list_messages(*f, 5, 2);
	assert(v.size() == 5);
	assert(v[0].subject == "Message 29");
	assert(v[4].subject == "Message 25");
	for (size_t i = 1; i < v.size(); ++i)
		assert(*v[i-1].received_time >= *v[i].received_time);
	assert(v[0].entry_id == bin2hex("msg-0029"));
	assert(v[0].received_time == localtime_str(base_time + 60 * 29));
	assert(v[0].sender == "alice@example.com");
	assert(v[0].sender_name == "Alice Example");
	assert(!v[0].unread);
	assert(!v[0].has_attachments);
	return EXIT_SUCCESS;
}

static int t_rows()
{
	fake::store st;
	auto &fld = st.add_folder("Inbox");
	fld.items.push_back(fake::mail("good-1", "first", base_time + 10, 0));
	auto bad = fake::mail("bad", "faulted", base_time + 9);
	bad.props.erase(PR_SUBJECT);
	bad.props.set(CHANGE_PROP_TYPE(PR_SUBJECT, PT_ERROR), static_cast<uint32_t>(ecError));
	fld.items.push_back(std::move(bad));
	auto anon = fake::mail("x", "no identity", base_time + 8);
	anon.props.erase(PR_ENTRYID);
	fld.items.push_back(std::move(anon));
	auto nodate = fake::mail("good-2", "undated", base_time);
	nodate.props.erase(PR_MESSAGE_DELIVERY_TIME);
	nodate.props.set(PR_HASATTACH, uint8_t(1));
	fld.items.push_back(std::move(nodate));

	std::unique_ptr<folder_object> f;
	assert(st.open_folder("Inbox", f) == ecSuccess);
	auto v = list_messages(*f, 10, 50);
	assert(v.size() == 2);
	assert(v[0].subject == "first");
	assert(v[0].unread);
	assert(v[1].subject == "undated");
	assert(!v[1].received_time.has_value());
	assert(v[1].has_attachments);
	return EXIT_SUCCESS;
}

static int t_search()
{
	fake::store st;
	auto &fld = st.add_folder("Inbox");
	fld.items.push_back(fake::mail("a", "Quarterly Report", base_time + 3, 0));
	fld.items.push_back(fake::mail("b", "lunch", base_time + 2, MSGFLAG_READ));
	fld.items.push_back(fake::mail("c", "report draft", base_time + 1, MSGFLAG_READ));

	search_criteria c;
	RESTRICTION res;
	assert(!search_restriction(c, res));
	c.subject = "REPORT";
	assert(search_restriction(c, res));
	std::unique_ptr<folder_object> f;
	assert(st.open_folder("Inbox", f) == ecSuccess);
	auto v = list_messages(*f, 10, 50, &res);
	assert(v.size() == 2);
	assert(v[0].entry_id == bin2hex("a"));
	assert(st.oplog[1] == "restrict");

	c.unread = true;
	assert(search_restriction(c, res));
	v = list_messages(*f, 10, 50, &res);
	assert(v.size() == 1 && v[0].subject == "Quarterly Report");

	search_criteria s;
	s.sender = "ALICE";
	assert(search_restriction(s, res));
	v = list_messages(*f, 10, 50, &res);
	assert(v.size() == 3);
	return EXIT_SUCCESS;
}

int main()
{
	setenv("TZ", "UTC", 1);
	tzset();
	using fpt = decltype(&t_cap);
	fpt fct[] = {t_cap, t_order, t_rows, t_search};
	for (auto f : fct)
		if (f() != EXIT_SUCCESS)
			return EXIT_FAILURE;
	return EXIT_SUCCESS;
}
