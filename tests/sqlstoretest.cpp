// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/calendar.hpp>
#include <mailbridge/dedup.hpp>
#include <mailbridge/listing.hpp>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/scope.hpp>
#include <mailbridge/sqlite_store.hpp>
#include <mailbridge/thread_scope.hpp>
#include <mailbridge/util.hpp>
#undef assert
#define assert(x) do { if (!(x)) { printf("%s failed\n", #x); return EXIT_FAILURE; } } while (false)
using namespace mailbridge;

/* 2024-01-01 00:00:00 UTC */
static constexpr time_t day0 = 1704067200;
static constexpr time_t hour = 3600, day = 86400;
static std::string g_dir, g_path;

static constexpr char sample_mime[] =
	"From: Carol <carol@example.com>\r\n"
	"To: Alice <alice@example.com>\r\n"
	"Subject: Exported\r\n"
	"Message-ID: <x1@example.com>\r\n"
	"Date: Tue, 02 Jan 2024 08:00:00 +0000\r\n"
	"MIME-Version: 1.0\r\n"
	"Content-Type: text/plain; charset=us-ascii\r\n"
	"\r\n"
	"Exported body\r\n";

static ec_error_t add_mail(sqlite_store &st, const char *folder, unsigned int i,
    std::string &eid, const std::string &mime = {})
{
	TPROPVAL_ARRAY p;
	p.set(PR_MESSAGE_CLASS, std::string("IPM.Note"));
	p.set(PR_SUBJECT, "Mail " + std::to_string(i));
	p.set(PR_SENDER_NAME, std::string("Bob"));
	p.set(PR_SENDER_EMAIL_ADDRESS, std::string("bob@example.com"));
	p.set(PR_MESSAGE_DELIVERY_TIME, rop_util_unix_to_nttime(day0 + i * 60));
	p.set(PR_MESSAGE_FLAGS, uint32_t(i % 2 == 0 ? MSGFLAG_READ : 0));
	p.set(PR_HASATTACH, uint8_t(0));
	p.set(PR_BODY, "Body " + std::to_string(i));
	return st.insert_message(folder, p, mime, {}, nullptr, eid);
}

static int t_create()
{
	assert(sqlite_store::create(g_path.c_str(), false));
	assert(!sqlite_store::create(g_path.c_str(), false));
	assert(sqlite_store::create(g_path.c_str(), true));
	return EXIT_SUCCESS;
}

static int t_listing(const std::shared_ptr<sqlite_store> &st)
{
	std::string eid;
	for (unsigned int i = 0; i < 60; ++i)
		assert(add_mail(*st, "inbox", i, eid) == ecSuccess);
	assert(add_mail(*st, "No Such Folder", 0, eid) == ecNotFound);

	std::unique_ptr<folder_object> f;
	assert(st->open_folder("INBOX", f) == ecSuccess);
	auto v = list_messages(*f, 10, 4);
	assert(v.size() == 10);
	assert(v[0].subject == "Mail 59");
	assert(v[9].subject == "Mail 50");
	assert(v[0].unread && !v[1].unread);
	assert(v[0].received_time == std::string("2024-01-01 00:59:00"));

	v = list_messages(*f, 100, 50);
	assert(v.size() == 60);

	RESTRICTION res;
	search_criteria c;
	c.subject = "mail 1";
	assert(search_restriction(c, res));
	v = list_messages(*f, 100, 50, &res);
	/* Mail 1 and Mail 10 to 19 */
	assert(v.size() == 11);
	return EXIT_SUCCESS;
}

static int t_calendar(const std::shared_ptr<sqlite_store> &st)
{
	std::vector<uint16_t> ids;
	assert(st->get_named_propids(true, {
		{MNID_ID, PSETID_Appointment, PidLidAppointmentStartWhole},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentEndWhole},
		{MNID_ID, PSETID_Appointment, PidLidRecurring},
	}, ids) == ecSuccess);
	assert(ids.size() == 3 && ids[0] != 0 && ids[1] != 0 && ids[0] != ids[1]);
	std::vector<uint16_t> again;
	assert(st->get_named_propids(false, {
		{MNID_ID, PSETID_Appointment, PidLidAppointmentEndWhole},
		{MNID_ID, PSETID_Task, PidLidTaskDueDate},
	}, again) == ecSuccess);
	assert(again.size() == 2 && again[0] == ids[1] && again[1] == 0);

	auto tstart = PROP_TAG(PT_SYSTIME, ids[0]), tend = PROP_TAG(PT_SYSTIME, ids[1]);
	TPROPVAL_ARRAY p;
	p.set(PR_MESSAGE_CLASS, std::string("IPM.Appointment"));
	p.set(PR_SUBJECT, std::string("Standup"));
	p.set(tstart, rop_util_unix_to_nttime(day0 - 30 * day + 9 * hour));
	p.set(tend, rop_util_unix_to_nttime(day0 - 30 * day + 9 * hour + 900));
	recurrence_rule rule;
	std::string eid;
	assert(st->insert_message("Calendar", p, {}, {}, &rule, eid) == ecSuccess);

	TPROPVAL_ARRAY q;
	q.set(PR_MESSAGE_CLASS, std::string("IPM.Appointment"));
	q.set(PR_SUBJECT, std::string("Dentist"));
	q.set(tstart, rop_util_unix_to_nttime(day0 + 2 * day + 14 * hour));
	q.set(tend, rop_util_unix_to_nttime(day0 + 2 * day + 15 * hour));
	assert(st->insert_message("Calendar", q, {}, {}, nullptr, eid) == ecSuccess);

	std::unique_ptr<folder_object> f;
	assert(st->open_folder("Calendar", f) == ecSuccess);
	auto v = list_calendar(*st, *f, day0, day0 + 7 * day, false, 3);
	assert(v.size() == 8);
	assert(v[0].start == "2024-01-01 09:00:00");
	assert(v[3].subject == "Dentist");
	assert(v[7].start == "2024-01-07 09:00:00");
	for (size_t i = 1; i < v.size(); ++i)
		assert(v[i-1].nt_start <= v[i].nt_start);

	auto all = list_calendar(*st, *f, 0, 0, true);
	assert(all.size() == 2);
	assert(all[0].subject == "Standup");

	/* the expansion cap also holds when the window is huge */
	auto capped = std::make_shared<sqlite_store>(g_path.c_str(), 5);
	assert(store_thread_acquire(capped) == ecSuccess);
	assert(capped->open_folder("Calendar", f) == ecSuccess);
	v = list_calendar(*capped, *f, day0 - 60 * day, day0 + 3650 * day, false);
	assert(v.size() == 6);
	assert(store_thread_acquire(st) == ecSuccess);
	return EXIT_SUCCESS;
}

static int t_parse(const std::shared_ptr<sqlite_store> &st)
{
	std::string eid;
	assert(add_mail(*st, "Inbox", 1000, eid, sample_mime) == ecSuccess);
	parse_options opts;
	opts.tmpdir = g_dir;
	auto pm = parse_message(*st, opts, bin2hex(eid), dedup_tier::low, true);
	assert(pm.has_value());
	assert(pm->subject == "Exported");
	assert(pm->from.size() == 1 && pm->from[0].second == "carol@example.com");
	assert(pm->body.find("Exported body") == 0);
	assert(pm->parent_found == false);

	/* no export: the store properties are used */
	assert(add_mail(*st, "Inbox", 1001, eid) == ecSuccess);
	pm = parse_message(*st, opts, bin2hex(eid), dedup_tier::none, true);
	assert(pm.has_value());
	assert(pm->subject == "Mail 1001");
	assert(pm->body == "Body 1001");
	return EXIT_SUCCESS;
}

static int t_bridge(const std::shared_ptr<sqlite_store> &st)
{
	bridge_config cfg;
	cfg.tmpdir = g_dir;
	bridge br(st, cfg);
	assert(br.warmup() == ecSuccess);

	auto folders = br.list_folders();
	assert(folders.size() == 6);
	assert(folders[0].name == "Top of Information Store" && folders[0].depth == 0);
	assert(!folders[0].parent_id.has_value());
	assert(folders[1].parent_name == std::string("Top of Information Store"));
	assert(folders[1].path == folders[0].path + "\\" + folders[1].name);
	assert(folders[1].name == "Inbox" && folders[1].number_of_items == 62);

	/* unknown folder falls back to the Inbox */
	auto v = br.list_emails("Nonexistent", 3);
	assert(v.size() == 3);
	auto d = br.get_email(v[0].entry_id);
	assert(d.has_value() && d->body.find("Body") == 0);
	assert(!br.get_email("00112233").has_value());

	std::vector<uint16_t> ids;
	assert(st->get_named_propids(true, {
		{MNID_ID, PSETID_Task, PidLidTaskDueDate},
		{MNID_ID, PSETID_Task, PidLidTaskStatus},
		{MNID_ID, PSETID_Task, PidLidTaskComplete},
		{MNID_ID, PSETID_Task, PidLidPercentComplete},
	}, ids) == ecSuccess);
	std::string eid;
	for (unsigned int i = 0; i < 3; ++i) {
		TPROPVAL_ARRAY p;
		p.set(PR_MESSAGE_CLASS, std::string("IPM.Task"));
		p.set(PR_SUBJECT, "Task " + std::to_string(i));
		p.set(PROP_TAG(PT_SYSTIME, ids[0]), rop_util_unix_to_nttime(day0 + i * day + 12 * hour));
		p.set(PROP_TAG(PT_LONG, ids[1]), uint32_t(i == 2 ? 2 : 0));
		p.set(PROP_TAG(PT_BOOLEAN, ids[2]), uint8_t(i == 2));
		p.set(PROP_TAG(PT_DOUBLE, ids[3]), i == 2 ? 1.0 : 0.0);
		assert(st->insert_message("Tasks", p, {}, {}, nullptr, eid) == ecSuccess);
	}
	auto tasks = br.list_tasks(false);
	assert(tasks.size() == 2);
	tasks = br.list_tasks(true);
	assert(tasks.size() == 3);
	auto t = br.get_task(bin2hex(eid));
	assert(t.has_value() && t->complete && t->percent_complete == 1.0);
	assert(t->due_date == std::string("2024-01-03"));

	/* attachments */
	std::vector<attachment_content> atx(2);
	atx[0].props.set(PR_ATTACH_LONG_FILENAME, std::string("../../escape.txt"));
	atx[0].data = "first";
	atx[1].data = "second";
	TPROPVAL_ARRAY p;
	p.set(PR_SUBJECT, std::string("with files"));
	p.set(PR_HASATTACH, uint8_t(1));
	assert(st->insert_message("Inbox", p, {}, atx, nullptr, eid) == ecSuccess);
	auto outdir = g_dir + "/out";
	auto files = br.extract_attachments(bin2hex(eid), outdir.c_str());
	assert(files.has_value() && files->size() == 2);
	assert((*files)[0] == outdir + "/escape.txt");
	assert((*files)[1] == outdir + "/attachment_2");
	std::string data;
	assert(read_file_by_name((*files)[0].c_str(), data) == 0 && data == "first");
	for (const auto &f : *files)
		unlink(f.c_str());
	rmdir(outdir.c_str());
	assert(!br.extract_attachments("0badc0de", outdir.c_str()).has_value());
	return EXIT_SUCCESS;
}

int main()
{
	setenv("TZ", "UTC", 1);
	tzset();
	char dir[] = "/tmp/mbstoreXXXXXX";
	if (mkdtemp(dir) == nullptr) {
		perror("mkdtemp");
		return EXIT_FAILURE;
	}
	g_dir = dir;
	g_path = g_dir + "/store.sqlite3";
	auto cl_0 = make_scope_exit([]() {
		store_thread_release();
		unlink(g_path.c_str());
		rmdir(g_dir.c_str());
	});
	if (t_create() != EXIT_SUCCESS)
		return EXIT_FAILURE;
	auto st = std::make_shared<sqlite_store>(g_path.c_str(), 100);
	if (store_thread_acquire(st) != ecSuccess)
		return EXIT_FAILURE;
	using fpt = decltype(&t_listing);
	fpt fct[] = {t_listing, t_calendar, t_parse, t_bridge};
	for (auto f : fct)
		if (f(st) != EXIT_SUCCESS)
			return EXIT_FAILURE;
	return EXIT_SUCCESS;
}
