// SPDX-License-Identifier: AGPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 mailbridge authors
// This file is part of mailbridge.
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <libHX/option.h>
#include <json/value.h>
#include <mailbridge/bridge.hpp>
#include <mailbridge/config_file.hpp>
#include <mailbridge/database.h>
#include <mailbridge/json.hpp>
#include <mailbridge/scope.hpp>
#include <mailbridge/sqlite_store.hpp>
#include <mailbridge/util.hpp>

using namespace mailbridge;

static constexpr int EXIT_PARAM = 2;

namespace global {

static char *g_config_file, *g_store_path;
static unsigned int g_indent = 2;

static constexpr HXoption g_options_table[] = {
	{nullptr, 'c', HXTYPE_STRING, &g_config_file, nullptr, nullptr, 0, "Config file to read", "FILE"},
	{nullptr, 's', HXTYPE_STRING, &g_store_path, nullptr, nullptr, 0, "Store database (overrides store_path)", "FILE"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int help()
{
	fprintf(stderr, "Usage: mailbridge [-c config] [-s store] command [options]\n");
	fprintf(stderr, "Commands:\n\temails calendar email parsed-email search\n"
	        "\tfolders tasks task appointment attachments\n");
	return EXIT_PARAM;
}

static int emit(const Json::Value &v)
{
	auto s = json_to_str(v, g_indent);
	if (fwrite(s.data(), s.size(), 1, stdout) != 1 && !s.empty())
		return EXIT_FAILURE;
	return fputc('\n', stdout) == EOF ? EXIT_FAILURE : EXIT_SUCCESS;
}

static bool need_id(const char *id)
{
	if (id != nullptr && *id != '\0')
		return true;
	fprintf(stderr, "--id is required\n");
	return false;
}

}

using global::emit;
using global::need_id;

namespace emails {

static char *g_folder;
static int g_limit = -1;

static constexpr HXoption g_options_table[] = {
	{"limit", 0, HXTYPE_INT, &g_limit, nullptr, nullptr, 0, "Number of messages (default: list_default_limit)", "N"},
	{"folder", 0, HXTYPE_STRING, &g_folder, nullptr, nullptr, 0, "Folder name (default: Inbox)", "NAME"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	auto limit = g_limit >= 0 ? g_limit : static_cast<int>(br.config().list_limit);
	return emit(to_json(br.list_emails(g_folder, limit)));
}

}

namespace calendar {

static int g_days = -1;
static unsigned int g_all;

static constexpr HXoption g_options_table[] = {
	{"days", 0, HXTYPE_INT, &g_days, nullptr, nullptr, 0, "Window length in days (default: calendar_days)", "N"},
	{"all", 0, HXTYPE_NONE, &g_all, nullptr, nullptr, 0, "List all appointments regardless of date"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	auto days = g_days >= 0 ? g_days : static_cast<int>(br.config().calendar_days);
	return emit(to_json(br.list_calendar(days, g_all)));
}

}

/* email, task and appointment take nothing but the identity */
namespace by_id {

static char *g_id;

static constexpr HXoption g_options_table[] = {
	{"id", 0, HXTYPE_STRING, &g_id, nullptr, nullptr, 0, "Entry ID of the item", "ID"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	if (!need_id(g_id))
		return EXIT_PARAM;
	if (strcmp(argv[0], "email") == 0)
		return emit(to_json(br.get_email(g_id)));
	else if (strcmp(argv[0], "task") == 0)
		return emit(to_json(br.get_task(g_id)));
	return emit(to_json(br.get_appointment(g_id)));
}

}

namespace parsed_email {

static char *g_id, *g_tier;
static unsigned int g_remove_quoted, g_no_strip;

static constexpr HXoption g_options_table[] = {
	{"id", 0, HXTYPE_STRING, &g_id, nullptr, nullptr, 0, "Entry ID of the message", "ID"},
	{"tier", 0, HXTYPE_STRING, &g_tier, nullptr, nullptr, 0, "Quote stripping: none, low, medium, high", "TIER"},
	{"remove-quoted", 0, HXTYPE_NONE, &g_remove_quoted, nullptr, nullptr, 0, "Same as --tier=low"},
	{"no-strip-html", 0, HXTYPE_NONE, &g_no_strip, nullptr, nullptr, 0, "Keep HTML parts and bodies"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	if (!need_id(g_id))
		return EXIT_PARAM;
	auto tier = dedup_tier::none;
	if (g_tier != nullptr && !dedup_tier_parse(g_tier, tier)) {
		fprintf(stderr, "Unknown tier \"%s\"\n", g_tier);
		return EXIT_PARAM;
	}
	if (g_remove_quoted && tier == dedup_tier::none)
		tier = dedup_tier::low;
	return emit(to_json(br.get_email_parsed(g_id, tier, !g_no_strip)));
}

}

namespace search {

static char *g_subject, *g_sender, *g_body, *g_folder;
static unsigned int g_unread, g_read, g_hasatx;
static int g_limit = -1;

static constexpr HXoption g_options_table[] = {
	{"subject", 0, HXTYPE_STRING, &g_subject, nullptr, nullptr, 0, "Subject substring", "TEXT"},
	{"sender", 0, HXTYPE_STRING, &g_sender, nullptr, nullptr, 0, "Sender name or address substring", "TEXT"},
	{"body", 0, HXTYPE_STRING, &g_body, nullptr, nullptr, 0, "Body substring", "TEXT"},
	{"unread", 0, HXTYPE_NONE, &g_unread, nullptr, nullptr, 0, "Only unread messages"},
	{"read", 0, HXTYPE_NONE, &g_read, nullptr, nullptr, 0, "Only read messages"},
	{"has-attachments", 0, HXTYPE_NONE, &g_hasatx, nullptr, nullptr, 0, "Only messages with attachments"},
	{"limit", 0, HXTYPE_INT, &g_limit, nullptr, nullptr, 0, "Number of messages (default: search_default_limit)", "N"},
	{"folder", 0, HXTYPE_STRING, &g_folder, nullptr, nullptr, 0, "Folder name (default: Inbox)", "NAME"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	if (g_unread && g_read) {
		fprintf(stderr, "--unread and --read are mutually exclusive\n");
		return EXIT_PARAM;
	}
	search_criteria c;
	if (g_subject != nullptr)
		c.subject = g_subject;
	if (g_sender != nullptr)
		c.sender = g_sender;
	if (g_body != nullptr)
		c.body = g_body;
	if (g_unread || g_read)
		c.unread = g_unread != 0;
	if (g_hasatx)
		c.has_attachments = true;
	auto limit = g_limit >= 0 ? g_limit : static_cast<int>(br.config().search_limit);
	return emit(to_json(br.search_emails(c, g_folder, limit)));
}

}

namespace folders {

static constexpr HXoption g_options_table[] = {
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, nullptr, nullptr,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	return emit(to_json(br.list_folders()));
}

}

namespace tasks {

static unsigned int g_all;

static constexpr HXoption g_options_table[] = {
	{"all", 0, HXTYPE_NONE, &g_all, nullptr, nullptr, 0, "Include completed tasks"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, nullptr, nullptr,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	return emit(to_json(br.list_tasks(g_all)));
}

}

namespace attachments {

static char *g_id, *g_dir;

static constexpr HXoption g_options_table[] = {
	{"id", 0, HXTYPE_STRING, &g_id, nullptr, nullptr, 0, "Entry ID of the message", "ID"},
	{"dir", 0, HXTYPE_STRING, &g_dir, nullptr, nullptr, 0, "Target directory (default: attachments)", "DIR"},
	HXOPT_AUTOHELP,
	HXOPT_TABLEEND,
};

static int main(int argc, char **argv, bridge &br)
{
	if (HX_getopt5(g_options_table, argv, &argc, &argv,
	    HXOPT_USAGEONERR) != HXOPT_ERR_SUCCESS)
		return EXIT_PARAM;
	auto cl_0 = make_scope_exit([=]() { HX_zvecfree(argv); });
	if (!need_id(g_id))
		return EXIT_PARAM;
	return emit(to_json(br.extract_attachments(g_id, g_dir != nullptr ? g_dir : "attachments")));
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
	global::g_indent = cfg->get_ll("json_indent");
	auto path = global::g_store_path != nullptr ? global::g_store_path :
	            cfg->get_value("store_path");
	auto store = std::make_shared<sqlite_store>(path, cfg->get_ll("recurrence_limit"));
	bridge br(store, bridge_config(*cfg));
	auto ret = br.attach();
	if (ret != ecSuccess) {
		fprintf(stderr, "Cannot open store %s: %s\n", path, mapi_strerror(ret));
		return EXIT_FAILURE;
	}

	if (strcmp(argv[0], "emails") == 0)
		return emails::main(argc, argv, br);
	else if (strcmp(argv[0], "calendar") == 0)
		return calendar::main(argc, argv, br);
	else if (strcmp(argv[0], "email") == 0 || strcmp(argv[0], "task") == 0 ||
	    strcmp(argv[0], "appointment") == 0)
		return by_id::main(argc, argv, br);
	else if (strcmp(argv[0], "parsed-email") == 0)
		return parsed_email::main(argc, argv, br);
	else if (strcmp(argv[0], "search") == 0)
		return search::main(argc, argv, br);
	else if (strcmp(argv[0], "folders") == 0)
		return folders::main(argc, argv, br);
	else if (strcmp(argv[0], "tasks") == 0)
		return tasks::main(argc, argv, br);
	else if (strcmp(argv[0], "attachments") == 0)
		return attachments::main(argc, argv, br);
	fprintf(stderr, "Unrecognized command \"%s\"\n", argv[0]);
	return global::help();
}
