// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
/*
 * Creates and populates SQLite mailbox stores
 */
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <string>
#include <vector>
#include <strings.h>
#include <libHX/option.h>
#include <mailbridge/config_file.hpp>
#include <mailbridge/database.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/mapidefs.h>
#include <mailbridge/mime_parse.hpp>
#include <mailbridge/rop_util.hpp>
#include <mailbridge/scope.hpp>
#include <mailbridge/sqlite_store.hpp>
#include <mailbridge/thread_scope.hpp>
#include <mailbridge/util.hpp>

using namespace mailbridge;

static constexpr int EXIT_PARAM = 2;

namespace global {

static char *g_config_file, *g_store_path;
static unsigned int g_force;

static constexpr HXoption g_options_table[] = {
	{nullptr, 'c', HXTYPE_STRING, &g_config_file, nullptr, nullptr, 0, "Config file to read", "FILE"},
	{nullptr, 's', HXTYPE_STRING, &g_store_path, nullptr, nullptr, 0, "Store database (overrides store_path)", "FILE"},
	{nullptr, 'f', HXTYPE_NONE, &g_force, nullptr, nullptr, 0, "Allow overwriting an existing store (init)"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int help()
{
	fprintf(stderr, "Usage: mailbridge-mkstore [-c config] [-s store] [-f] command [options]\n");
	fprintf(stderr, "Commands:\n\tinit\n\timport-eml [-F folder] [-r] FILE...\n"
	        "\tadd-appointment --subject=S --start=T [--end=T] [--recur=daily|weekly] ...\n"
	        "\tadd-task --subject=S [--due=DATE] [--complete] ...\n");
	return EXIT_PARAM;
}

}

static std::string join_display(const std::vector<address_pair> &v)
{
	std::string s;
	for (const auto &[name, addr] : v) {
		if (!s.empty())
			s += "; ";
		s += name.empty() ? addr : name;
	}
	return s;
}

/* Inverse of iso8601_str */
static bool iso8601_parse(const char *s, time_t &out)
{
	struct tm tm{};
	auto end = strptime(s, "%Y-%m-%dT%H:%M:%S%z", &tm);
	if (end == nullptr || *end != '\0')
		return false;
	auto off = tm.tm_gmtoff;
	out = timegm(&tm) - off;
	return true;
}

static bool time_arg(const char *opt, const char *s, uint64_t &nt)
{
	time_t t;
	if (parse_localtime(s, &t) != 0) {
		fprintf(stderr, "%s: cannot parse \"%s\" (want YYYY-MM-DD[ HH:MM:SS])\n", opt, s);
		return false;
	}
	nt = rop_util_unix_to_nttime(t);
	return true;
}

static void print_eid(const std::string &eid)
{
	printf("%s\n", bin2hex(eid).c_str());
}

namespace import_eml {

static char *g_folder;
static unsigned int g_read;

static constexpr HXoption g_options_table[] = {
	{nullptr, 'F', HXTYPE_STRING, &g_folder, nullptr, nullptr, 0, "Target folder (default: Inbox)", "NAME"},
	{nullptr, 'r', HXTYPE_NONE, &g_read, nullptr, nullptr, 0, "Mark imported messages as read"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int import_one(sqlite_store &store, const char *folder, const char *file)
{
	std::string raw;
	auto err = read_file_by_name(file, raw);
	if (err != 0) {
		fprintf(stderr, "%s: %s\n", file, strerror(err));
		return EXIT_FAILURE;
	}
	parsed_message pm;
	std::string reason;
	std::vector<std::string> payloads;
	if (!mime_parse(raw, pm, reason, &payloads)) {
		fprintf(stderr, "%s: %s\n", file, reason.c_str());
		return EXIT_FAILURE;
	}
	TPROPVAL_ARRAY props;
	props.set(PR_MESSAGE_CLASS, std::string("IPM.Note"));
	props.set(PR_SUBJECT, std::string(pm.subject));
	if (!pm.from.empty()) {
		props.set(PR_SENDER_NAME, std::string(pm.from[0].first));
		props.set(PR_SENDER_EMAIL_ADDRESS, std::string(pm.from[0].second));
		props.set(PR_SENT_REPRESENTING_NAME, std::string(pm.from[0].first));
	}
	props.set(PR_DISPLAY_TO, join_display(pm.to));
	props.set(PR_DISPLAY_CC, join_display(pm.cc));
	props.set(PR_DISPLAY_BCC, join_display(pm.bcc));
	time_t when = time(nullptr);
	if (pm.date.has_value() && !iso8601_parse(pm.date->c_str(), when))
		when = time(nullptr);
	props.set(PR_CLIENT_SUBMIT_TIME, rop_util_unix_to_nttime(when));
	props.set(PR_MESSAGE_DELIVERY_TIME, rop_util_unix_to_nttime(when));
	props.set(PR_MESSAGE_FLAGS, static_cast<uint32_t>(g_read ? MSGFLAG_READ : 0));
	props.set(PR_MESSAGE_SIZE, static_cast<uint32_t>(raw.size()));
	props.set(PR_HASATTACH, static_cast<uint8_t>(!pm.attachments.empty()));
	if (!pm.text_plain.empty())
		props.set(PR_BODY, std::string(pm.text_plain[0]));
	if (!pm.text_html.empty())
		props.set(PR_HTML, BINARY{pm.text_html[0]});
	if (!pm.message_id.empty())
		props.set(PR_INTERNET_MESSAGE_ID, std::string(pm.message_id));
	if (!pm.in_reply_to.empty())
		props.set(PR_IN_REPLY_TO_ID, std::string(pm.in_reply_to));
	props.set(PR_TRANSPORT_MESSAGE_HEADERS, mime_header_block(raw));

	std::vector<attachment_content> atx;
	for (size_t i = 0; i < pm.attachments.size() && i < payloads.size(); ++i) {
		const auto &ai = pm.attachments[i];
		attachment_content ac;
		ac.props.set(PR_ATTACH_LONG_FILENAME, std::string(ai.filename));
		ac.props.set(PR_ATTACH_MIME_TAG, std::string(ai.content_type));
		if (ai.content_id.has_value())
			ac.props.set(PR_ATTACH_CONTENT_ID, std::string(*ai.content_id));
		ac.data = std::move(payloads[i]);
		atx.push_back(std::move(ac));
	}
	std::string eid;
	auto ret = store.insert_message(folder, props, raw, atx, nullptr, eid);
	if (ret != ecSuccess) {
		fprintf(stderr, "%s: insert into %s: %s\n", file, folder, mapi_strerror(ret));
		return EXIT_FAILURE;
	}
	print_eid(eid);
	return EXIT_SUCCESS;
}

static int main(int argc, char **argv, sqlite_store &store)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	if (argc < 2) {
		fprintf(stderr, "import-eml: no files given\n");
		return EXIT_PARAM;
	}
	auto folder = g_folder != nullptr ? g_folder : "Inbox";
	int ret = EXIT_SUCCESS;
	while (*++argv != nullptr)
		if (import_one(store, folder, *argv) != EXIT_SUCCESS)
			ret = EXIT_FAILURE;
	return ret;
}

}

namespace add_appointment {

static char *g_folder, *g_subject, *g_start, *g_end, *g_location, *g_organizer;
static char *g_recur, *g_until, *g_required, *g_optional;
static unsigned int g_allday, g_meeting, g_canceled, g_interval = 1, g_count;
static unsigned int g_respstatus;

static constexpr HXoption g_options_table[] = {
	{nullptr, 'F', HXTYPE_STRING, &g_folder, nullptr, nullptr, 0, "Target folder (default: Calendar)", "NAME"},
	{"subject", 0, HXTYPE_STRING, &g_subject, nullptr, nullptr, 0, "Subject"},
	{"start", 0, HXTYPE_STRING, &g_start, nullptr, nullptr, 0, "Start (local time)", "TIME"},
	{"end", 0, HXTYPE_STRING, &g_end, nullptr, nullptr, 0, "End (local time)", "TIME"},
	{"location", 0, HXTYPE_STRING, &g_location, nullptr, nullptr, 0, "Location"},
	{"organizer", 0, HXTYPE_STRING, &g_organizer, nullptr, nullptr, 0, "Organizer display name"},
	{"required", 0, HXTYPE_STRING, &g_required, nullptr, nullptr, 0, "Required attendees"},
	{"optional", 0, HXTYPE_STRING, &g_optional, nullptr, nullptr, 0, "Optional attendees"},
	{"all-day", 0, HXTYPE_NONE, &g_allday, nullptr, nullptr, 0, "All-day event"},
	{"meeting", 0, HXTYPE_NONE, &g_meeting, nullptr, nullptr, 0, "Mark as meeting"},
	{"canceled", 0, HXTYPE_NONE, &g_canceled, nullptr, nullptr, 0, "Mark as canceled"},
	{"response-status", 0, HXTYPE_UINT, &g_respstatus, nullptr, nullptr, 0, "Response status code (0..5)", "N"},
	{"recur", 0, HXTYPE_STRING, &g_recur, nullptr, nullptr, 0, "Recurrence pattern: daily or weekly"},
	{"interval", 0, HXTYPE_UINT, &g_interval, nullptr, nullptr, 0, "Recurrence interval (default: 1)", "N"},
	{"count", 0, HXTYPE_UINT, &g_count, nullptr, nullptr, 0, "Number of occurrences (default: endless)", "N"},
	{"until", 0, HXTYPE_STRING, &g_until, nullptr, nullptr, 0, "Last possible occurrence start", "TIME"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, sqlite_store &store)
{
	if (HX_getopt5(g_options_table, argv, nullptr, nullptr,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	if (g_start == nullptr) {
		fprintf(stderr, "add-appointment: --start is required\n");
		return EXIT_PARAM;
	}
	uint64_t nt_start = 0, nt_end = 0;
	if (!time_arg("--start", g_start, nt_start))
		return EXIT_PARAM;
	if (g_end == nullptr)
		nt_end = nt_start + (g_allday ? 86400ULL : 1800ULL) * 10000000ULL;
	else if (!time_arg("--end", g_end, nt_end))
		return EXIT_PARAM;
	recurrence_rule rule;
	if (g_recur != nullptr) {
		if (strcasecmp(g_recur, "daily") == 0)
			rule.pattern = RECUR_DAILY;
		else if (strcasecmp(g_recur, "weekly") == 0)
			rule.pattern = RECUR_WEEKLY;
		else {
			fprintf(stderr, "add-appointment: unknown pattern \"%s\"\n", g_recur);
			return EXIT_PARAM;
		}
		rule.interval = g_interval > 0 ? g_interval : 1;
		rule.occurrences = g_count;
		if (g_until != nullptr && !time_arg("--until", g_until, rule.end_time))
			return EXIT_PARAM;
	}

	static const std::vector<PROPERTY_NAME> propname_buff = {
		{MNID_ID, PSETID_Appointment, PidLidAppointmentStartWhole},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentEndWhole},
		{MNID_ID, PSETID_Appointment, PidLidLocation},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentSubType},
		{MNID_ID, PSETID_Appointment, PidLidAppointmentStateFlags},
		{MNID_ID, PSETID_Appointment, PidLidResponseStatus},
		{MNID_ID, PSETID_Appointment, PidLidToAttendeesString},
		{MNID_ID, PSETID_Appointment, PidLidCcAttendeesString},
		{MNID_ID, PSETID_Appointment, PidLidRecurring},
	};
	std::vector<uint16_t> ids;
	auto ret = store.get_named_propids(true, propname_buff, ids);
	if (ret != ecSuccess || ids.size() != propname_buff.size()) {
		fprintf(stderr, "add-appointment: get_named_propids: %s\n", mapi_strerror(ret));
		return EXIT_FAILURE;
	}
	uint32_t flags = (g_meeting ? asfMeeting : 0) | (g_canceled ? asfCanceled : 0);
	TPROPVAL_ARRAY props;
	props.set(PR_MESSAGE_CLASS, std::string("IPM.Appointment"));
	props.set(PR_SUBJECT, std::string(znul(g_subject)));
	props.set(PROP_TAG(PT_SYSTIME, ids[0]), nt_start);
	props.set(PROP_TAG(PT_SYSTIME, ids[1]), nt_end);
	props.set(PROP_TAG(PT_UNICODE, ids[2]), std::string(znul(g_location)));
	props.set(PROP_TAG(PT_BOOLEAN, ids[3]), static_cast<uint8_t>(g_allday != 0));
	props.set(PROP_TAG(PT_LONG, ids[4]), flags);
	props.set(PROP_TAG(PT_LONG, ids[5]), static_cast<uint32_t>(g_respstatus));
	props.set(PROP_TAG(PT_UNICODE, ids[6]), std::string(znul(g_required)));
	props.set(PROP_TAG(PT_UNICODE, ids[7]), std::string(znul(g_optional)));
	props.set(PROP_TAG(PT_BOOLEAN, ids[8]), static_cast<uint8_t>(g_recur != nullptr));
	if (g_organizer != nullptr)
		props.set(PR_SENT_REPRESENTING_NAME, std::string(g_organizer));
	props.set(PR_MESSAGE_DELIVERY_TIME, rop_util_current_nttime());
	props.set(PR_MESSAGE_FLAGS, static_cast<uint32_t>(MSGFLAG_READ));

	std::string eid;
	ret = store.insert_message(g_folder != nullptr ? g_folder : "Calendar", props, {}, {},
	      g_recur != nullptr ? &rule : nullptr, eid);
	if (ret != ecSuccess) {
		fprintf(stderr, "add-appointment: %s\n", mapi_strerror(ret));
		return EXIT_FAILURE;
	}
	print_eid(eid);
	return EXIT_SUCCESS;
}

}

namespace add_task {

static char *g_folder, *g_subject, *g_body, *g_due;
static unsigned int g_importance = 1, g_complete;

static constexpr HXoption g_options_table[] = {
	{nullptr, 'F', HXTYPE_STRING, &g_folder, nullptr, nullptr, 0, "Target folder (default: Tasks)", "NAME"},
	{"subject", 0, HXTYPE_STRING, &g_subject, nullptr, nullptr, 0, "Subject"},
	{"body", 0, HXTYPE_STRING, &g_body, nullptr, nullptr, 0, "Description"},
	{"due", 0, HXTYPE_STRING, &g_due, nullptr, nullptr, 0, "Due date", "YYYY-MM-DD"},
	{"importance", 0, HXTYPE_UINT, &g_importance, nullptr, nullptr, 0, "0=low 1=normal 2=high", "N"},
	{"complete", 0, HXTYPE_NONE, &g_complete, nullptr, nullptr, 0, "Mark as completed"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, sqlite_store &store)
{
	if (HX_getopt5(g_options_table, argv, nullptr, nullptr,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	uint64_t nt_due = 0;
	if (g_due != nullptr) {
		/* noon keeps the date stable across time zones */
		auto noon = std::string(g_due) + " 12:00:00";
		if (!time_arg("--due", noon.c_str(), nt_due))
			return EXIT_PARAM;
	}
	static const std::vector<PROPERTY_NAME> propname_buff = {
		{MNID_ID, PSETID_Task, PidLidTaskDueDate},
		{MNID_ID, PSETID_Task, PidLidTaskStatus},
		{MNID_ID, PSETID_Task, PidLidTaskComplete},
		{MNID_ID, PSETID_Task, PidLidPercentComplete},
	};
	std::vector<uint16_t> ids;
	auto ret = store.get_named_propids(true, propname_buff, ids);
	if (ret != ecSuccess || ids.size() != propname_buff.size()) {
		fprintf(stderr, "add-task: get_named_propids: %s\n", mapi_strerror(ret));
		return EXIT_FAILURE;
	}
	TPROPVAL_ARRAY props;
	props.set(PR_MESSAGE_CLASS, std::string("IPM.Task"));
	props.set(PR_SUBJECT, std::string(znul(g_subject)));
	props.set(PR_BODY, std::string(znul(g_body)));
	props.set(PR_IMPORTANCE, static_cast<uint32_t>(g_importance));
	if (g_due != nullptr)
		props.set(PROP_TAG(PT_SYSTIME, ids[0]), nt_due);
	/* olTaskNotStarted=0, olTaskComplete=2 */
	props.set(PROP_TAG(PT_LONG, ids[1]), static_cast<uint32_t>(g_complete ? 2 : 0));
	props.set(PROP_TAG(PT_BOOLEAN, ids[2]), static_cast<uint8_t>(g_complete != 0));
	props.set(PROP_TAG(PT_DOUBLE, ids[3]), g_complete ? 1.0 : 0.0);
	props.set(PR_MESSAGE_DELIVERY_TIME, rop_util_current_nttime());

	std::string eid;
	ret = store.insert_message(g_folder != nullptr ? g_folder : "Tasks", props,
	      {}, {}, nullptr, eid);
	if (ret != ecSuccess) {
		fprintf(stderr, "add-task: %s\n", mapi_strerror(ret));
		return EXIT_FAILURE;
	}
	print_eid(eid);
	return EXIT_SUCCESS;
}

}

int main(int argc, char **argv)
{
	setvbuf(stdout, nullptr, _IOLBF, 0);
	if (HX_getopt5(global::g_options_table, argv, &argc, &argv,
	    HXOPT_RQ_ORDER | HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	--argc;
	++argv;
	if (argc == 0)
		return global::help();
	auto cfg = config_file_prg(global::g_config_file, "mailbridge.cfg",
	           mailbridge_cfg_defaults);
	if (cfg == nullptr)
		return EXIT_FAILURE;
	mlog_init(cfg->get_value("log_file"), cfg->get_ll("log_level"));
	gx_sqlite_debug = cfg->get_ll("sqlite_debug");
	auto path = global::g_store_path != nullptr ? global::g_store_path :
	            cfg->get_value("store_path");
	if (strcmp(argv[0], "init") == 0)
		return sqlite_store::create(path, global::g_force) ? EXIT_SUCCESS : EXIT_FAILURE;

	auto store = std::make_shared<sqlite_store>(path, cfg->get_ll("recurrence_limit"));
	auto ret = store_thread_acquire(store);
	if (ret != ecSuccess) {
		fprintf(stderr, "Cannot open store %s: %s\n", path, mapi_strerror(ret));
		return EXIT_FAILURE;
	}
	auto cl_1 = make_scope_exit([]() { store_thread_release(); });
	if (strcmp(argv[0], "import-eml") == 0)
		return import_eml::main(argc, argv, *store);
	else if (strcmp(argv[0], "add-appointment") == 0)
		return add_appointment::main(argc, argv, *store);
	else if (strcmp(argv[0], "add-task") == 0)
		return add_task::main(argc, argv, *store);
	fprintf(stderr, "Unrecognized command \"%s\"\n", argv[0]);
	return global::help();
}
